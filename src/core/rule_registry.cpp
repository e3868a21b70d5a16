// Rule registration and isolated dispatch

#include "rule_registry.h"
#include "rules/cross_domain_misconfiguration.h"
#include "rules/java_serialized_object.h"
#include "rules/modern_app_detection.h"
#include "rules/relative_path_confusion.h"
#include "rules/source_code_disclosure_cve_2012_1823.h"
#include <iostream>
#include <stdexcept>

RuleRegistry RuleRegistry::with_default_rules() {
    RuleRegistry registry;
    registry.add_passive(std::make_unique<CrossDomainMisconfigurationRule>());
    registry.add_passive(std::make_unique<JavaSerializedObjectRule>());
    registry.add_passive(std::make_unique<ModernAppDetectionRule>());
    registry.add_active(std::make_unique<RelativePathConfusionRule>());
    registry.add_active(std::make_unique<SourceCodeDisclosureCve20121823Rule>());
    return registry;
}

void RuleRegistry::check_unique(int id) const {
    if (find(id) != nullptr) {
        throw std::invalid_argument("Duplicate scan rule id: " + std::to_string(id));
    }
}

void RuleRegistry::add_passive(std::unique_ptr<PassiveScanRule> rule) {
    if (!rule) throw std::invalid_argument("Null passive scan rule");
    check_unique(rule->id());
    passive_.push_back(std::move(rule));
}

void RuleRegistry::add_active(std::unique_ptr<ActiveScanRule> rule) {
    if (!rule) throw std::invalid_argument("Null active scan rule");
    check_unique(rule->id());
    active_.push_back(std::move(rule));
}

const ScanRule* RuleRegistry::find(int id) const {
    for (const auto& rule : passive_) {
        if (rule->id() == id) return rule.get();
    }
    for (const auto& rule : active_) {
        if (rule->id() == id) return rule.get();
    }
    return nullptr;
}

std::vector<Alert> RuleRegistry::guarded(const ScanRule& rule, const std::function<std::vector<Alert>()>& call) {
    try {
        return call();
    } catch (const std::exception& e) {
        std::cerr << "Error: scan rule " << rule.id() << " (" << rule.name() << ") failed: " << e.what() << "\n";
    } catch (...) {
        std::cerr << "Error: scan rule " << rule.id() << " (" << rule.name() << ") failed with a non-standard exception\n";
    }
    return {};
}

std::vector<Alert> RuleRegistry::run_passive_request(const Transaction& msg) const {
    std::vector<Alert> alerts;
    for (const auto& rule : passive_) {
        auto found = guarded(*rule, [&]() { return rule->inspect_request(msg); });
        alerts.insert(alerts.end(), found.begin(), found.end());
    }
    return alerts;
}

std::vector<Alert> RuleRegistry::run_passive_response(const Transaction& msg) const {
    std::vector<Alert> alerts;
    for (const auto& rule : passive_) {
        auto found = guarded(*rule, [&]() { return rule->inspect_response(msg); });
        alerts.insert(alerts.end(), found.begin(), found.end());
    }
    return alerts;
}

std::vector<Alert> RuleRegistry::run_active(const Transaction& base, ScanContext& ctx, const TechSet& techs) const {
    std::vector<Alert> alerts;
    for (const auto& rule : active_) {
        if (ctx.is_stopped()) break;
        if (!rule->applicable(techs)) continue;
        auto found = guarded(*rule, [&]() { return rule->scan(base, ctx); });
        alerts.insert(alerts.end(), found.begin(), found.end());
    }
    return alerts;
}
