#pragma once
#include "core/scan_rule.h"

// Flags responses that allow any origin to read them through CORS
// (Access-Control-Allow-Origin: *).

class CrossDomainMisconfigurationRule : public PassiveScanRule {
public:
    CrossDomainMisconfigurationRule();

    const RuleMetadata& metadata() const override { return meta_; }
    std::vector<Alert> example_alerts() const override;

    /**
     * @brief Check the response for a wildcard Access-Control-Allow-Origin
     * @param msg Transaction with the response filled in
     * @return One MEDIUM alert if the header value is exactly "*", otherwise nothing
     */
    std::vector<Alert> inspect_response(const Transaction& msg) const override;

private:
    RuleMetadata meta_;

    Alert build_alert(const std::string& evidence, const std::string& uri) const;
};
