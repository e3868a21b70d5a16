#pragma once
#include <schema/alert.h>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <string>
#include <vector>

// Static descriptors and scan knobs shared by every scan rule.

enum class RuleCategory {
    INFO_GATHER,
    BROWSER,
    SERVER,
    MISC,
    INJECTION
};

// How many probe variants an active rule may try
enum class AttackStrength {
    LOW,
    MEDIUM,
    HIGH,
    INSANE
};

// How much evidence a rule needs before alerting. OFF disables the rule.
enum class AlertThreshold {
    OFF,
    LOW,
    MEDIUM,
    HIGH
};

std::string to_string(RuleCategory category);
std::string to_string(AttackStrength strength);
std::string to_string(AlertThreshold threshold);

/**
 * @brief Parse a lowercase strength name ("low", "medium", "high", "insane")
 * @return Parsed value, or nullopt for unknown names
 */
std::optional<AttackStrength> parse_attack_strength(const std::string& s);

/**
 * @brief Parse a lowercase threshold name ("off", "low", "medium", "high")
 * @return Parsed value, or nullopt for unknown names
 */
std::optional<AlertThreshold> parse_alert_threshold(const std::string& s);

/**
 * Technologies declared for a scan target, named like "Language.PHP".
 * A parent name ("Language") includes all of its children.
 */
class TechSet {
public:
    TechSet() = default;
    explicit TechSet(std::set<std::string> techs) : techs_(std::move(techs)) {}

    /**
     * @brief A set that includes every technology
     */
    static TechSet all();

    void add(const std::string& tech) { techs_.insert(tech); }

    /**
     * @brief Check whether a technology is part of this set
     * @param tech Technology name, e.g. "Language.PHP"
     * @return true if the set is all(), names the tech, or names one of its parents
     */
    bool includes(const std::string& tech) const;

    bool is_all() const { return all_; }
    const std::set<std::string>& names() const { return techs_; }

private:
    bool all_ = false;
    std::set<std::string> techs_;
};

struct RuleMetadata {
    int id = 0;
    std::string name;
    RuleCategory category = RuleCategory::MISC;
    Risk risk = Risk::INFO;
    Confidence confidence = Confidence::MEDIUM;
    std::string description;
    std::string solution;
    std::string references;
    int cwe_id = 0;
    int wasc_id = 0;
    std::map<std::string, std::string> tags;
    std::vector<std::string> technologies;  // Empty means any target
};
