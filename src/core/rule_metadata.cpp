// Rule metadata helpers and alert builder

#include "rule_metadata.h"
#include "alert_builder.h"

std::string to_string(RuleCategory category) {
    switch (category) {
        case RuleCategory::INFO_GATHER: return "info_gather";
        case RuleCategory::BROWSER:     return "browser";
        case RuleCategory::SERVER:      return "server";
        case RuleCategory::MISC:        return "misc";
        case RuleCategory::INJECTION:   return "injection";
    }
    return "unknown";
}

std::string to_string(AttackStrength strength) {
    switch (strength) {
        case AttackStrength::LOW:    return "low";
        case AttackStrength::MEDIUM: return "medium";
        case AttackStrength::HIGH:   return "high";
        case AttackStrength::INSANE: return "insane";
    }
    return "unknown";
}

std::string to_string(AlertThreshold threshold) {
    switch (threshold) {
        case AlertThreshold::OFF:    return "off";
        case AlertThreshold::LOW:    return "low";
        case AlertThreshold::MEDIUM: return "medium";
        case AlertThreshold::HIGH:   return "high";
    }
    return "unknown";
}

std::optional<AttackStrength> parse_attack_strength(const std::string& s) {
    if (s == "low") return AttackStrength::LOW;
    if (s == "medium") return AttackStrength::MEDIUM;
    if (s == "high") return AttackStrength::HIGH;
    if (s == "insane") return AttackStrength::INSANE;
    return std::nullopt;
}

std::optional<AlertThreshold> parse_alert_threshold(const std::string& s) {
    if (s == "off") return AlertThreshold::OFF;
    if (s == "low") return AlertThreshold::LOW;
    if (s == "medium") return AlertThreshold::MEDIUM;
    if (s == "high") return AlertThreshold::HIGH;
    return std::nullopt;
}

TechSet TechSet::all() {
    TechSet t;
    t.all_ = true;
    return t;
}

bool TechSet::includes(const std::string& tech) const {
    if (all_) return true;
    if (techs_.count(tech)) return true;

    // "Language" includes "Language.PHP"
    for (size_t dot = tech.find('.'); dot != std::string::npos; dot = tech.find('.', dot + 1)) {
        if (techs_.count(tech.substr(0, dot))) return true;
    }
    return false;
}

AlertBuilder::AlertBuilder(const RuleMetadata& meta) {
    alert_.rule_id = meta.id;
    alert_.name = meta.name;
    alert_.risk = meta.risk;
    alert_.confidence = meta.confidence;
    alert_.description = meta.description;
    alert_.solution = meta.solution;
    alert_.references = meta.references;
    alert_.cwe_id = meta.cwe_id;
    alert_.wasc_id = meta.wasc_id;
    alert_.tags = meta.tags;
}
