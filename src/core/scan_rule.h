#pragma once
#include "rule_metadata.h"
#include <schema/alert.h>
#include <schema/transaction.h>
#include <atomic>
#include <functional>
#include <string>
#include <vector>

// Contracts implemented by every scan rule.
// Passive rules only read the transaction they are given. Active rules may
// synthesize follow-up transactions and send them through a ScanContext.

using AlertSink = std::function<void(const Alert&)>;

// Network access offered to active rules by the host
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Send the request side of a transaction and fill in its response
     * @param msg Transaction whose request is sent; response fields are overwritten
     * @param follow_redirects Whether 3xx responses should be followed
     * @return true on success, false on transport failure (msg.error is set)
     */
    virtual bool send(Transaction& msg, bool follow_redirects) = 0;
};

// Per-scan state handed to an active rule: transport, knobs and the stop flag.
class ScanContext {
public:
    ScanContext(Transport& transport,
                AttackStrength strength = AttackStrength::MEDIUM,
                AlertThreshold threshold = AlertThreshold::MEDIUM,
                const std::atomic<bool>* stop_flag = nullptr)
        : transport_(transport), strength_(strength), threshold_(threshold), stop_flag_(stop_flag) {}

    AttackStrength strength() const { return strength_; }
    AlertThreshold threshold() const { return threshold_; }

    /**
     * @brief Check whether the host asked the scan to stop
     */
    bool is_stopped() const { return stop_flag_ && stop_flag_->load(); }

    /**
     * @brief Send a follow-up request unless the scan was stopped
     * @param msg Transaction to send; its response is filled in
     * @param follow_redirects Whether redirects should be followed
     * @return false if stopped before sending or the transport failed
     */
    bool send(Transaction& msg, bool follow_redirects);

    int messages_sent() const { return messages_sent_; }

private:
    Transport& transport_;
    AttackStrength strength_;
    AlertThreshold threshold_;
    const std::atomic<bool>* stop_flag_;
    int messages_sent_ = 0;
};

class ScanRule {
public:
    virtual ~ScanRule() = default;

    virtual const RuleMetadata& metadata() const = 0;

    /**
     * @brief Representative alerts used for documentation and rule listings
     */
    virtual std::vector<Alert> example_alerts() const = 0;

    int id() const { return metadata().id; }
    const std::string& name() const { return metadata().name; }
};

class PassiveScanRule : public ScanRule {
public:
    /**
     * @brief Inspect an outgoing request
     * @param msg Transaction with at least the request side filled in
     * @return Alerts raised, possibly empty
     */
    virtual std::vector<Alert> inspect_request(const Transaction& msg) const;

    /**
     * @brief Inspect a received response
     * @param msg Transaction with both sides filled in
     * @return Alerts raised, possibly empty
     */
    virtual std::vector<Alert> inspect_response(const Transaction& msg) const;
};

class ActiveScanRule : public ScanRule {
public:
    /**
     * @brief Decide whether this rule is worth running against a target
     * @param techs Technologies declared for the target
     * @return true if the rule declares no technologies or any of them is included
     */
    virtual bool applicable(const TechSet& techs) const;

    /**
     * @brief Attack one base transaction
     * @param base The original transaction to derive attacks from
     * @param ctx Transport, strength, threshold and stop flag for this scan
     * @return Alerts raised, possibly empty
     */
    virtual std::vector<Alert> scan(const Transaction& base, ScanContext& ctx) const = 0;
};
