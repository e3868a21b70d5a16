#pragma once
#include "scan_rule.h"
#include <functional>
#include <memory>
#include <vector>

// Owns the scan rules and dispatches transactions to them in registration
// order. A rule that throws is reported and contributes no alerts; the
// remaining rules still run.

class RuleRegistry {
public:
    RuleRegistry() = default;
    RuleRegistry(RuleRegistry&&) = default;
    RuleRegistry& operator=(RuleRegistry&&) = default;

    /**
     * @brief Build a registry holding every built-in rule
     */
    static RuleRegistry with_default_rules();

    /**
     * @brief Register a passive rule
     * @throws std::invalid_argument if a rule with the same id is already registered
     */
    void add_passive(std::unique_ptr<PassiveScanRule> rule);

    /**
     * @brief Register an active rule
     * @throws std::invalid_argument if a rule with the same id is already registered
     */
    void add_active(std::unique_ptr<ActiveScanRule> rule);

    const std::vector<std::unique_ptr<PassiveScanRule>>& passive_rules() const { return passive_; }
    const std::vector<std::unique_ptr<ActiveScanRule>>& active_rules() const { return active_; }

    /**
     * @brief Look up a rule by id
     * @return The rule, or nullptr if none is registered under that id
     */
    const ScanRule* find(int id) const;

    /**
     * @brief Run every passive rule over the request side of a transaction
     */
    std::vector<Alert> run_passive_request(const Transaction& msg) const;

    /**
     * @brief Run every passive rule over the response side of a transaction
     */
    std::vector<Alert> run_passive_response(const Transaction& msg) const;

    /**
     * @brief Run every applicable active rule against a base transaction
     * @param base Transaction to derive attacks from
     * @param ctx Transport and knobs shared by all rules
     * @param techs Technologies of the target
     */
    std::vector<Alert> run_active(const Transaction& base, ScanContext& ctx, const TechSet& techs) const;

    /**
     * @brief Invoke one rule, containing any exception it throws
     * @param rule Rule being invoked, used for the error report
     * @param call Invocation producing the rule's alerts
     * @return The rule's alerts, or nothing if it threw
     */
    static std::vector<Alert> guarded(const ScanRule& rule, const std::function<std::vector<Alert>()>& call);

private:
    std::vector<std::unique_ptr<PassiveScanRule>> passive_;
    std::vector<std::unique_ptr<ActiveScanRule>> active_;

    void check_unique(int id) const;
};
