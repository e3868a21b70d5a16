/**
 * @file source_code_disclosure_cve_2012_1823.cpp
 * @brief Active check for PHP source disclosure through "?-s"
 */

#include "source_code_disclosure_cve_2012_1823.h"
#include "codec/encoding.h"
#include "core/alert_builder.h"
#include "core/alert_tags.h"
#include "core/http_message.h"
#include <cctype>
#include <iostream>

static const char* CVE_ID = "CVE-2012-1823";

SourceCodeDisclosureCve20121823Rule::SourceCodeDisclosureCve20121823Rule() {
    meta_.id = 20017;
    meta_.name = "Source Code Disclosure - CVE-2012-1823";
    meta_.category = RuleCategory::INFO_GATHER;
    meta_.risk = Risk::HIGH;
    meta_.confidence = Confidence::MEDIUM;
    meta_.description =
        "Some PHP versions, when configured to run using CGI, do not correctly handle query strings that "
        "lack an unescaped \"=\" character, enabling PHP source code disclosure, and arbitrary code "
        "execution. In this case, the contents of the PHP file were served directly to the web browser. "
        "This output will typically contain PHP, although it may also contain straight HTML.";
    meta_.solution =
        "Upgrade to the latest stable version of PHP, or use the Apache web server and the mod_rewrite "
        "module to filter out malicious requests using the \"RewriteCond\" and \"RewriteRule\" directives.";
    meta_.references =
        "https://www.cve.org/CVERecord?id=CVE-2012-1823\n"
        "https://www.kb.cert.org/vuls/id/520827";
    meta_.cwe_id = 20;
    meta_.wasc_id = 20;
    meta_.tags = alert_tags::to_map({alert_tags::OWASP_2021_A06_VULN_COMP,
                                     alert_tags::OWASP_2017_A09_VULN_COMP,
                                     alert_tags::QA_FULL,
                                     alert_tags::PENTEST});
    meta_.tags[CVE_ID] = "https://www.cve.org/CVERecord?id=CVE-2012-1823";
    meta_.technologies = {"Language.PHP"};
}

// "<?php ... ; ?>" where at least one character separates "<?php" and the ';'
static std::string find_php_block(const std::string& text) {
    size_t open = text.find("<?php");
    if (open == std::string::npos) return "";
    size_t earliest_semicolon = open + 6;

    for (size_t close = text.find("?>", earliest_semicolon); close != std::string::npos;
         close = text.find("?>", close + 1)) {
        size_t k = close;
        while (k > earliest_semicolon && std::isspace(static_cast<unsigned char>(text[k - 1]))) k--;
        if (k > earliest_semicolon && text[k - 1] == ';') {
            return text.substr(open, close + 2 - open);
        }
    }
    return "";
}

// "<?= ... ?>" with a non-empty body
static std::string find_echo_block(const std::string& text) {
    size_t open = text.find("<?=");
    if (open == std::string::npos) return "";
    size_t close = text.find("?>", open + 4);
    if (close == std::string::npos) return "";
    return text.substr(open, close + 2 - open);
}

std::string SourceCodeDisclosureCve20121823Rule::find_php_source(const std::string& body) {
    std::string unescaped = codec::html_unescape(body);
    std::string source = find_php_block(unescaped);
    if (source.empty()) source = find_echo_block(unescaped);
    return source;
}

static bool is_text_content(const std::string& content_type) {
    if (content_type.empty()) return true;
    for (const char* marker : {"text", "html", "json", "xml", "javascript"}) {
        if (content_type.find(marker) != std::string::npos) return true;
    }
    return false;
}

static bool is_javascript(const std::string& content_type) {
    return content_type.find("javascript") != std::string::npos ||
           content_type.find("ecmascript") != std::string::npos;
}

std::vector<Alert> SourceCodeDisclosureCve20121823Rule::scan(const Transaction& base, ScanContext& ctx) const {
    if (!is_text_content(http::response_content_type(base)) || codec::looks_binary(base.response_body)) {
        return {};
    }
    if (base.response_status == 404 &&
        ctx.strength() != AttackStrength::HIGH && ctx.strength() != AttackStrength::INSANE) {
        return {};
    }
    // Pages that already show PHP code (tutorials, for one) would always match
    if (!find_php_source(base.response_body).empty()) {
        return {};
    }

    auto url = http::parse_url(base.uri);
    if (!url) return {};
    std::string origin = http::origin_of(*url);
    if (origin.empty()) {
        auto host = http::header_value(base.request_headers, "Host");
        if (!host) return {};
        origin = "http://" + *host;
    }

    Transaction attack;
    attack.method = "GET";
    attack.uri = origin + (url->path.empty() ? "/" : url->path) + "?-s";
    attack.http_version = base.http_version;
    for (const auto& cookie : http::header_values(base.request_headers, "Cookie")) {
        attack.request_headers.emplace_back("Cookie", cookie);
    }

    if (!ctx.send(attack, false)) {
        if (!attack.error.empty()) {
            std::cerr << "Source disclosure request to " << attack.uri << " failed: " << attack.error << "\n";
        }
        return {};
    }
    if (ctx.is_stopped() || attack.response_status != 200) {
        return {};
    }

    // Scripts legitimately embed "<?" sequences, only report them when asked for everything
    if (is_javascript(http::response_content_type(attack)) && ctx.threshold() != AlertThreshold::LOW) {
        return {};
    }

    std::string source = find_php_source(attack.response_body);
    if (source.empty()) {
        return {};
    }
    return {build_alert(source, base.uri)};
}

Alert SourceCodeDisclosureCve20121823Rule::build_alert(const std::string& source, const std::string& uri) const {
    return AlertBuilder(meta_)
        .other_info(source)
        .uri(uri)
        .build();
}

std::vector<Alert> SourceCodeDisclosureCve20121823Rule::example_alerts() const {
    return {build_alert("<?php $x=0; echo '<h1>Welcome!</h1>'; ?>", "")};
}
