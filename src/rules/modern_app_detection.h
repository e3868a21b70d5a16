#pragma once
#include "core/scan_rule.h"

// Informational: the page looks like a single page application, which
// traditional spidering will not explore well.

class ModernAppDetectionRule : public PassiveScanRule {
public:
    ModernAppDetectionRule();

    const RuleMetadata& metadata() const override { return meta_; }
    std::vector<Alert> example_alerts() const override;

    std::vector<Alert> inspect_response(const Transaction& msg) const override;

private:
    RuleMetadata meta_;

    Alert build_alert(const std::string& evidence, const std::string& uri) const;
};
