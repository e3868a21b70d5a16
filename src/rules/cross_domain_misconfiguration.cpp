/**
 * @file cross_domain_misconfiguration.cpp
 * @brief Passive CORS wildcard detection
 */

#include "cross_domain_misconfiguration.h"
#include "core/alert_builder.h"
#include "core/alert_tags.h"
#include "core/http_message.h"

static const char* ALLOW_ORIGIN = "Access-Control-Allow-Origin";

CrossDomainMisconfigurationRule::CrossDomainMisconfigurationRule() {
    meta_.id = 10098;
    meta_.name = "Cross-Domain Misconfiguration";
    meta_.category = RuleCategory::SERVER;
    meta_.risk = Risk::MEDIUM;
    meta_.confidence = Confidence::MEDIUM;
    meta_.description =
        "Web browser data loading may be possible, due to a Cross Origin Resource Sharing (CORS) "
        "misconfiguration on the web server.";
    meta_.solution =
        "Ensure that sensitive data is not available in an unauthenticated manner (using IP address "
        "white-listing, for instance).\nConfigure the \"Access-Control-Allow-Origin\" HTTP header to a "
        "more restrictive set of domains, or remove all CORS headers entirely, to allow the web browser "
        "to enforce the Same Origin Policy (SOP) in a more restrictive manner.";
    meta_.references =
        "https://vulncat.fortify.com/en/detail?category=HTML5&subcategory=Overly%20Permissive%20CORS%20Policy";
    meta_.cwe_id = 264;
    meta_.wasc_id = 14;
    meta_.tags = alert_tags::to_map({alert_tags::OWASP_2021_A01_BROKEN_AC,
                                     alert_tags::OWASP_2017_A05_BROKEN_AC,
                                     alert_tags::PENTEST,
                                     alert_tags::QA_STD});
}

Alert CrossDomainMisconfigurationRule::build_alert(const std::string& evidence, const std::string& uri) const {
    return AlertBuilder(meta_)
        .other_info(
            "The CORS misconfiguration on the web server permits cross-domain read requests from "
            "arbitrary third party domains, using unauthenticated APIs on this domain. Web browser "
            "implementations do not permit arbitrary third parties to read the response from "
            "authenticated APIs, however. This reduces the risk somewhat. This misconfiguration could "
            "be used by an attacker to access data that is available in an unauthenticated manner, but "
            "which uses some other form of security, such as IP address white-listing.")
        .evidence(evidence)
        .uri(uri)
        .build();
}

// Header line from the rendered block, starting at the header name and ending before CR.
// Only a name at the start of a line counts, not one quoted in another header's value.
static std::string extract_evidence(const std::string& block, const std::string& header_name) {
    size_t line = http::to_lower(block).find("\r\n" + http::to_lower(header_name) + ":");
    if (line == std::string::npos) return "";
    size_t start = line + 2;
    size_t end = block.find('\r', start);
    return end == std::string::npos ? block.substr(start) : block.substr(start, end - start);
}

std::vector<Alert> CrossDomainMisconfigurationRule::inspect_response(const Transaction& msg) const {
    auto allow_origin = http::header_value(msg.response_headers, ALLOW_ORIGIN);
    if (!allow_origin || *allow_origin != "*") {
        return {};
    }
    // Fixed MEDIUM: browsers refuse credentialed reads of a wildcard response
    return {build_alert(extract_evidence(http::response_header_block(msg), ALLOW_ORIGIN), msg.uri)};
}

std::vector<Alert> CrossDomainMisconfigurationRule::example_alerts() const {
    return {build_alert("access-control-allow-origin: *", "")};
}
