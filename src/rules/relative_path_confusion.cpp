/**
 * @file relative_path_confusion.cpp
 * @brief Relative Path Confusion detection
 */

#include "relative_path_confusion.h"
#include "core/alert_builder.h"
#include "core/alert_tags.h"
#include "core/http_message.h"
#include <openssl/rand.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <random>

static const char ATTACK_ALPHABET[] = "abcdefghijklmnopqrstuvwxyz0123456789";
static constexpr size_t ATTACK_ALPHABET_SIZE = sizeof(ATTACK_ALPHABET) - 1;

// Attribute -> tags that load a resource through it. An empty tag means any
// tag; an empty attribute means the element body (<style>).
static const std::vector<std::pair<std::string, std::vector<std::string>>> LOADING_ATTRIBUTE_TO_TAGS = {
    {"href", {"link", "a", "area"}},
    {"src", {"img", "iframe", "frame", "embed", "script", "input", "audio", "video", "source"}},
    {"lowersrc", {"img", "iframe", "frame", "embed", "script", "input", "audio", "video", "source"}},
    {"dynsrc", {"img", "iframe", "frame", "embed", "script", "input", "audio", "video", "source"}},
    {"action", {"form"}},
    {"data", {"object"}},
    {"codebase", {"applet", "object"}},
    {"cite", {"blockquote", "del", "ins", "q"}},
    {"background", {"body"}},
    {"longdesc", {"frame", "iframe", "img"}},
    {"profile", {"head"}},
    {"usemap", {"img", "input", "object"}},
    {"classid", {"object"}},
    {"formaction", {"button"}},
    {"icon", {"command", "input"}},
    {"manifest", {"html"}},
    {"poster", {"video"}},
    {"archive", {"object", "applet"}},
    {"style", {""}},
    {"", {"style"}},
};

// Legacy doctypes that put browsers into quirks mode
static const std::vector<std::string> QUIRKS_MODE_PUBLIC_IDS = {
    "-//W3C//DTD HTML 3.2 Final//EN",
    "-//W3C//DTD HTML 4.01//EN",
    "-//W3C//DTD HTML 4.0 Transitional//EN",
    "-//W3C//DTD HTML 4.01 Transitional//EN",
    "-//W3C//DTD XHTML 1.0 Transitional//EN",
    "-//W3C//DTD XHTML 1.1//EN",
    "-//W3C//DTD XHTML Basic 1.0//EN",
    "-//W3C//DTD XHTML 1.0 Strict//EN",
    "ISO/IEC 15445:2000//DTD HTML//EN",
    "ISO/IEC 15445:2000//DTD HyperText Markup Language//EN",
    "ISO/IEC 15445:1999//DTD HTML//EN",
    "ISO/IEC 15445:1999//DTD HyperText Markup Language//EN",
};

static const char* MSG_NO_BASE_TAG =
    "There is no <base> tag to specify the base location for all relative URLs.";
static const char* MSG_MORE_THAN_ONE_BASE_TAG =
    "More than one <base> tag was specified in the HTML <head> tag to define the location for relative "
    "URLs, which is not valid.";
static const char* MSG_NO_CONTENT_TYPE =
    "No Content-Type was specified, so Quirks Mode is not required to exploit the vulnerability in the "
    "web browser.";
static const char* MSG_QUIRKS_NO_DOCTYPE =
    "Quirks Mode is implicitly enabled via the absence of a DOCTYPE, which allows the specified "
    "Content-Type to be bypassed.";
static const char* MSG_FRAMING_ALLOWED =
    "The response is not protected against 'ClickJacking' attacks, and so it may be possible to frame it "
    "in a page that enables Quirks Mode, allowing the specified Content-Type to be bypassed.";

static std::string content_type_message(const std::string& content_type) {
    return "A Content-Type of " + content_type + " was specified. If the web browser is employing strict "
           "parsing rules, this will prevent cross-content attacks from succeeding. Quirks Mode in the web "
           "browser would disable strict parsing.";
}

static std::string quirks_explicit_message(const std::string& http_equiv) {
    return "Quirks Mode is explicitly enabled via <meta http-equiv=\"" + http_equiv + "\">, which allows "
           "the specified Content-Type to be bypassed.";
}

static std::string quirks_doctype_message(const std::string& public_id) {
    return "Quirks Mode is implicitly enabled via the use of old DOCTYPE with PUBLIC id " + public_id +
           ", which allows the specified Content-Type to be bypassed.";
}

static std::string generate_attack_path() {
    unsigned char bytes[10];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        std::cerr << "Warning: RAND_bytes failed, using std::random_device for the attack path\n";
        std::random_device rd;
        for (auto& b : bytes) b = static_cast<unsigned char>(rd() & 0xFF);
    }
    std::string path;
    for (size_t i = 0; i < sizeof(bytes); i++) {
        if (i % 5 == 0) path += '/';
        path += ATTACK_ALPHABET[bytes[i] % ATTACK_ALPHABET_SIZE];
    }
    return path;
}

RelativePathConfusionRule::RelativePathConfusionRule() : attack_path_(generate_attack_path()) {
    meta_.id = 10051;
    meta_.name = "Relative Path Confusion";
    meta_.category = RuleCategory::SERVER;
    meta_.risk = Risk::MEDIUM;
    meta_.confidence = Confidence::MEDIUM;
    meta_.description =
        "The web server is configured to serve responses to ambiguous URLs in a manner that is likely to "
        "lead to confusion about the correct \"relative path\" for the URL. Resources (CSS, images, etc.) "
        "are also specified in the page response using relative, rather than absolute URLs. In an attack, "
        "if the web browser parses the \"cross-content\" response in a permissive manner, or can be tricked "
        "into permissively parsing the \"cross-content\" response, using techniques such as framing, then "
        "the web browser may be fooled into interpreting HTML as CSS (or other content types), leading to "
        "an XSS vulnerability.";
    meta_.solution =
        "Web servers and frameworks should be updated to be configured to not serve responses to ambiguous "
        "URLs in such a way that the relative path of such URLs could be confused by components on the "
        "client side.\nWithin the HTML response, a \"<base>\" tag should be specified to unambiguously "
        "specify the base URL for all relative URLs in the document.\nUse the \"Content-Type\" HTTP "
        "response header to make it harder for the attacker to force the web browser to mis-interpret the "
        "content type of the response.\nUse the \"X-Content-Type-Options: nosniff\" HTTP response header "
        "to prevent the web browser from \"sniffing\" the content type of the response.\nUse a modern "
        "DOCTYPE such as \"<!doctype html>\" to prevent the page from being rendered in the web browser "
        "using \"Quirks Mode\", since this results in the content type being ignored by the web browser.\n"
        "Specify the \"X-Frame-Options\" HTTP response header to prevent Quirks Mode from being enabled in "
        "the web browser using framing attacks.";
    meta_.references =
        "https://arxiv.org/abs/1811.00917\n"
        "https://hsivonen.fi/doctype/\n"
        "https://www.w3schools.com/tags/tag_base.asp";
    meta_.cwe_id = 20;
    meta_.wasc_id = 20;
    meta_.tags = alert_tags::to_map({alert_tags::OWASP_2021_A05_SEC_MISCONFIG,
                                     alert_tags::OWASP_2017_A06_SEC_MISCONFIG,
                                     alert_tags::QA_FULL,
                                     alert_tags::PENTEST});
}

std::optional<std::string> RelativePathConfusionRule::mutate_uri(const std::string& uri,
                                                                 const std::string& host_header) const {
    auto url = http::parse_url(uri);
    if (!url) return std::nullopt;

    // Only URLs naming a file with an extension are ambiguous
    std::string filename = url->path.substr(url->path.rfind('/') == std::string::npos ? 0 : url->path.rfind('/') + 1);
    size_t dot = filename.rfind('.');
    if (dot == std::string::npos || dot + 1 >= filename.size()) return std::nullopt;

    std::string origin = http::origin_of(*url);
    if (origin.empty()) {
        if (host_header.empty()) return std::nullopt;
        origin = "http://" + host_header;
    }

    std::string mutated = origin + url->path + attack_path_;
    if (!url->query.empty()) {
        mutated += "?" + url->query;
    }
    return mutated;
}

static bool is_css_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static bool is_css_name_char(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

std::optional<std::string> RelativePathConfusionRule::find_css_url_reference(const std::string& css) {
    std::string lower = http::to_lower(css);
    for (size_t u = lower.find("url"); u != std::string::npos; u = lower.find("url", u + 3)) {
        size_t open = u + 3;
        while (open < css.size() && is_css_space(css[open])) open++;
        if (open >= css.size() || css[open] != '(') continue;

        size_t close = css.find(')', open + 1);
        if (close == std::string::npos) {
            // Nothing after this point can be closed either
            return std::nullopt;
        }

        size_t first = open + 1;
        while (first < close && is_css_space(css[first])) first++;
        if (first < close && (css[first] == '"' || css[first] == '\'')) first++;
        if (first >= close) continue;

        char c = css[first];
        if (c == '/' || c == '#' || c == '"' || c == '\'') continue;
        std::string target = lower.substr(first, std::min<size_t>(close - first, 6));
        if (http::starts_with(target, "http:") || http::starts_with(target, "https:")) continue;

        // Needs a "property:" in front of the url(
        size_t begin = u;
        while (begin > 0 && is_css_space(css[begin - 1])) begin--;
        if (begin == 0 || css[begin - 1] != ':') continue;
        begin--;
        while (begin > 0 && is_css_space(css[begin - 1])) begin--;
        while (begin > 0 && is_css_name_char(css[begin - 1])) begin--;

        return css.substr(begin, close + 1 - begin);
    }
    return std::nullopt;
}

static bool is_relative(const std::string& value) {
    std::string upper = http::to_upper(http::trim(value));
    return !http::starts_with(upper, "HTTP://") && !http::starts_with(upper, "HTTPS://") &&
           !http::starts_with(upper, "/") && !http::starts_with(upper, "#");
}

std::optional<RelativePathConfusionRule::RelativeReference>
RelativePathConfusionRule::find_relative_reference(const html::Document& doc) {
    for (const auto& [attribute, tags] : LOADING_ATTRIBUTE_TO_TAGS) {
        for (const auto& tag : tags) {
            for (int el : doc.elements(tag)) {
                if (attribute.empty()) {
                    // <style> bodies, searched in the markup so the match is literal page text
                    if (auto matched = find_css_url_reference(doc.outer_source(el))) {
                        return RelativeReference{*matched};
                    }
                    continue;
                }

                auto value = doc.attr(el, attribute);
                if (!value) continue;

                if (attribute == "style") {
                    if (find_css_url_reference(*value)) {
                        // The parsed value has its character references decoded
                        auto raw = doc.raw_attr(el, "style");
                        return RelativeReference{raw ? *raw : doc.outer_source(el)};
                    }
                } else if (is_relative(*value)) {
                    return RelativeReference{doc.outer_source(el)};
                }
            }
        }
    }
    return std::nullopt;
}

std::vector<Alert> RelativePathConfusionRule::scan(const Transaction& base, ScanContext& ctx) const {
    auto mutated = mutate_uri(base.uri, http::header_value(base.request_headers, "Host").value_or(""));
    if (!mutated) {
        return {};
    }

    Transaction attack;
    attack.method = "GET";
    attack.uri = *mutated;
    attack.http_version = base.http_version;
    for (const auto& cookie : http::header_values(base.request_headers, "Cookie")) {
        attack.request_headers.emplace_back("Cookie", cookie);
    }

    if (!ctx.send(attack, true)) {
        if (!attack.error.empty()) {
            std::cerr << "Relative path confusion request to " << attack.uri << " failed: " << attack.error << "\n";
        }
        return {};
    }
    // Stopped while the probe was in flight
    if (ctx.is_stopped()) {
        return {};
    }

    html::Document doc = html::Document::parse(attack.response_body);
    std::vector<std::string> info;

    // A single <base href> removes any ambiguity
    int base_tags = 0;
    for (int el : doc.elements("base")) {
        if (doc.attr(el, "href") && doc.has_ancestors(el, {"html", "head"})) base_tags++;
    }
    if (base_tags == 1) {
        return {};
    }
    info.push_back(base_tags > 1 ? MSG_MORE_THAN_ONE_BASE_TAG : MSG_NO_BASE_TAG);

    auto reference = find_relative_reference(doc);
    if (!reference) {
        return {};
    }

    auto content_type = http::header_value(attack.response_headers, "Content-Type");
    if (content_type) {
        info.push_back(content_type_message(*content_type));

        bool quirks_mode = false;
        for (int el : doc.elements("meta")) {
            auto http_equiv = doc.attr(el, "http-equiv");
            if (!http_equiv || !doc.has_ancestors(el, {"html", "head"})) continue;
            std::string content = doc.attr(el, "content").value_or("");
            if (http::to_upper(http::trim(*http_equiv)) == "X-UA-COMPATIBLE" &&
                http::to_upper(http::trim(content)) != "IE=EDGE") {
                quirks_mode = true;
                info.push_back(quirks_explicit_message(*http_equiv));
            }
        }

        if (!quirks_mode) {
            const html::Doctype& doctype = doc.doctype();
            if (!doctype.present) {
                quirks_mode = true;
                info.push_back(MSG_QUIRKS_NO_DOCTYPE);
            } else {
                for (const auto& public_id : QUIRKS_MODE_PUBLIC_IDS) {
                    if (http::iequals(doctype.public_id, public_id)) {
                        quirks_mode = true;
                        info.push_back(quirks_doctype_message(doctype.public_id));
                        break;
                    }
                }
            }
        }

        bool framing_possible = false;
        if (!quirks_mode) {
            // Any X-Frame-Options value rules framing out, an absent one lets it in
            if (!http::header_value(attack.response_headers, "X-Frame-Options")) {
                framing_possible = true;
                info.push_back(MSG_FRAMING_ALLOWED);
            }
        }

        if (!quirks_mode && !framing_possible) {
            return {};
        }
    } else {
        info.push_back(MSG_NO_CONTENT_TYPE);
    }

    std::string other_info;
    for (size_t i = 0; i < info.size(); i++) {
        if (i > 0) other_info += "\n";
        other_info += info[i];
    }
    return {build_alert(*mutated, other_info, reference->evidence, base.uri)};
}

Alert RelativePathConfusionRule::build_alert(const std::string& attack, const std::string& other_info,
                                             const std::string& evidence, const std::string& uri) const {
    return AlertBuilder(meta_)
        .attack(attack)
        .other_info(other_info)
        .evidence(evidence)
        .uri(uri)
        .build();
}

std::vector<Alert> RelativePathConfusionRule::example_alerts() const {
    return {build_alert("https://example.com/profile.php" + attack_path_,
                        std::string(MSG_NO_BASE_TAG) + "\n" + MSG_NO_CONTENT_TYPE,
                        "<img src=\"logo.png\">",
                        "https://example.com/profile.php")};
}
