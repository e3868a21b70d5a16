#pragma once
#include "core/scan_rule.h"

// PHP-CGI query string handling bug (CVE-2012-1823): requesting "?-s" makes
// vulnerable servers return the highlighted PHP source of the script.

class SourceCodeDisclosureCve20121823Rule : public ActiveScanRule {
public:
    SourceCodeDisclosureCve20121823Rule();

    const RuleMetadata& metadata() const override { return meta_; }
    std::vector<Alert> example_alerts() const override;

    std::vector<Alert> scan(const Transaction& base, ScanContext& ctx) const override;

    /**
     * @brief Find the first PHP source block in a body
     * @param body Response body, HTML-escaped or not
     * @return The source block, or an empty string if none
     */
    static std::string find_php_source(const std::string& body);

private:
    RuleMetadata meta_;

    Alert build_alert(const std::string& source, const std::string& uri) const;
};
