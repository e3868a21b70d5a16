#pragma once
#include "core/rule_metadata.h"
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace config {

// Scan settings read from a JSON or YAML policy file.
// Knobs apply to every rule unless a per-rule entry overrides them; a rule
// whose threshold is "off" is not run at all.

struct RuleOverride {
    std::optional<AttackStrength> strength;
    std::optional<AlertThreshold> threshold;
};

struct DiagnosticsSettings {
    bool enabled = false;
    std::string username;
    std::string password;
};

struct ScanPolicy {
    AttackStrength attack_strength = AttackStrength::MEDIUM;
    AlertThreshold alert_threshold = AlertThreshold::MEDIUM;
    TechSet technologies = TechSet::all();
    std::map<int, RuleOverride> rules;
    DiagnosticsSettings diagnostics;
    int worker_threads = 4;

    /**
     * @brief Load a policy from a JSON file, or flat/indented YAML if it is not JSON
     * @param policy_path Path to policy file
     * @return Loaded policy; defaults (with a warning) if the file cannot be read
     */
    static ScanPolicy load(const std::string& policy_path);

    /**
     * @brief Build a policy from parsed JSON
     * @throws std::invalid_argument on unknown strength or threshold names
     */
    static ScanPolicy from_json(const nlohmann::json& j);

    /**
     * @brief Build a policy from YAML text
     *
     * Understands "key: value" lines, nested sections by indentation, dotted
     * keys ("diagnostics.enabled: true") and "- item" lists.
     *
     * @throws std::invalid_argument on unknown strength or threshold names
     */
    static ScanPolicy from_yaml(const std::string& yaml);

    static ScanPolicy get_default() { return ScanPolicy{}; }

    AttackStrength strength_for(int rule_id) const;
    AlertThreshold threshold_for(int rule_id) const;

    /**
     * @brief Check whether a rule runs under this policy
     * @return false if the effective threshold is OFF
     */
    bool is_enabled(int rule_id) const { return threshold_for(rule_id) != AlertThreshold::OFF; }
};

} // namespace config
