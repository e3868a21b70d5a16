#pragma once
#include "core/scan_rule.h"
#include "html/html_document.h"
#include <optional>

// Active check for Relative Path Confusion: appends extra path segments to a
// URL that names a file and looks for a response that still loads resources
// through relative references, with nothing that pins the content type.

class RelativePathConfusionRule : public ActiveScanRule {
public:
    /**
     * @brief Create the rule, drawing the random attack path once
     */
    RelativePathConfusionRule();

    const RuleMetadata& metadata() const override { return meta_; }
    std::vector<Alert> example_alerts() const override;

    std::vector<Alert> scan(const Transaction& base, ScanContext& ctx) const override;

    /**
     * @brief Extra path appended to the base URL, e.g. "/abc12/xyz34"
     */
    const std::string& attack_path() const { return attack_path_; }

    /**
     * @brief Build the ambiguous URL for a base URI
     * @param uri Base request URI
     * @param host_header Host header of the base request, used when the URI is origin-form
     * @return Mutated URL, or nullopt if the last path segment has no file extension
     */
    std::optional<std::string> mutate_uri(const std::string& uri, const std::string& host_header = "") const;

    /**
     * @brief Find a CSS declaration that loads through a relative url(), e.g. "background: url(bg.png)"
     *
     * url() targets starting with "/", "#" or an http(s) scheme do not count.
     * Quotes around the target are allowed.
     *
     * @param css Stylesheet text or a style attribute value
     * @return The declaration exactly as it appears in css, or nullopt
     */
    static std::optional<std::string> find_css_url_reference(const std::string& css);

private:
    struct RelativeReference {
        std::string evidence;
    };

    RuleMetadata meta_;
    std::string attack_path_;

    static std::optional<RelativeReference> find_relative_reference(const html::Document& doc);
    Alert build_alert(const std::string& attack, const std::string& other_info,
                      const std::string& evidence, const std::string& uri) const;
};
