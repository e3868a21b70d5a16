/**
 * @file modern_app_detection.cpp
 * @brief Passive detection of script-driven web applications
 */

#include "modern_app_detection.h"
#include "core/alert_builder.h"
#include "core/alert_tags.h"
#include "core/http_message.h"
#include "html/html_document.h"

ModernAppDetectionRule::ModernAppDetectionRule() {
    meta_.id = 10109;
    meta_.name = "Modern Web Application";
    meta_.category = RuleCategory::INFO_GATHER;
    meta_.risk = Risk::INFO;
    meta_.confidence = Confidence::MEDIUM;
    meta_.description =
        "The application appears to be a modern web application. If you need to explore it automatically "
        "then the Ajax Spider may well be more effective than the standard one.";
    meta_.solution = "This is an informational alert and so no changes are required.";
    meta_.tags = alert_tags::to_map({alert_tags::PENTEST, alert_tags::DEV_STD, alert_tags::QA_STD});
}

Alert ModernAppDetectionRule::build_alert(const std::string& evidence, const std::string& uri) const {
    return AlertBuilder(meta_)
        .other_info(
            "Links have been found that do not have traditional href attributes, which is an indication "
            "that this is a modern web application.")
        .evidence(evidence)
        .uri(uri)
        .build();
}

std::vector<Alert> ModernAppDetectionRule::inspect_response(const Transaction& msg) const {
    if (!http::is_html_response(msg)) {
        return {};
    }

    html::Document doc = html::Document::parse(msg.response_body);
    auto links = doc.elements("a");
    std::string evidence;

    if (links.empty()) {
        // No links but scripts: everything is rendered client side
        auto scripts = doc.elements("script");
        if (!scripts.empty()) {
            evidence = doc.outer_source(scripts.front());
        }
    } else {
        for (int link : links) {
            auto href = doc.attr(link, "href");
            auto target = doc.attr(link, "target");
            if (!href || href->empty() || *href == "#" || (target && *target == "_self")) {
                evidence = doc.outer_source(link);
                break;
            }
        }
    }

    if (evidence.empty()) {
        auto noscripts = doc.elements("noscript");
        if (!noscripts.empty()) {
            evidence = doc.outer_source(noscripts.front());
        }
    }

    if (evidence.empty()) {
        return {};
    }
    return {build_alert(evidence, msg.uri)};
}

std::vector<Alert> ModernAppDetectionRule::example_alerts() const {
    return {build_alert("<a href=\"#\">Link</a>", "")};
}
