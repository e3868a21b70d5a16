/**
 * @file java_serialized_object.cpp
 * @brief Passive detection of Java serialization streams in traffic
 */

#include "java_serialized_object.h"
#include "codec/encoding.h"
#include "core/alert_builder.h"
#include "core/alert_tags.h"
#include "core/http_message.h"
#include <algorithm>

// Stream magic followed by stream version 5
static const std::string JSO_MAGIC("\xAC\xED\x00\x05", 4);

static constexpr size_t MAX_BODY_EVIDENCE = 64;

JavaSerializedObjectRule::JavaSerializedObjectRule() {
    meta_.id = 90002;
    meta_.name = "Java Serialization Object";
    meta_.category = RuleCategory::INFO_GATHER;
    meta_.risk = Risk::MEDIUM;
    meta_.confidence = Confidence::HIGH;
    meta_.description =
        "Java Serialization seems to be in use. If not correctly validated, an attacker can send a "
        "specially crafted object. This can lead to a dangerous \"Remote Code Execution\". A magic "
        "sequence identifying JSO has been detected (Base64: rO0AB, Raw: 0xac, 0xed, 0x00, 0x05).";
    meta_.solution = "Deserialization of untrusted data is inherently dangerous and should be avoided.";
    meta_.references = "https://www.oracle.com/java/technologies/javase/seccodeguide.html#8";
    meta_.cwe_id = 502;
    meta_.wasc_id = 20;
    meta_.tags = alert_tags::to_map({alert_tags::OWASP_2021_A04_INSECURE_DESIGN,
                                     alert_tags::OWASP_2017_A08_INSECURE_DESERIAL,
                                     alert_tags::PENTEST});
}

static bool has_magic(const std::string& bytes) {
    return http::starts_with(bytes, JSO_MAGIC);
}

bool JavaSerializedObjectRule::carries_serialized_object(const std::string& candidate) {
    if (has_magic(candidate)) return true;

    if (auto decoded = codec::base64_decode_lenient(candidate); decoded && has_magic(*decoded)) {
        return true;
    }

    // Browsers percent-encode each byte as its UTF-8 form, so AC ED arrives as %C2%AC%C3%AD
    if (auto decoded = codec::percent_decode(candidate)) {
        if (has_magic(*decoded)) return true;
        if (auto latin1 = codec::utf8_to_latin1(*decoded); latin1 && has_magic(*latin1)) {
            return true;
        }
    }
    return false;
}

// Leading token of an encoded body, short enough to be readable in a report
static std::string body_evidence(const std::string& body) {
    if (has_magic(body)) return "";
    size_t start = body.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = body.find_first_of(" \t\r\n", start);
    size_t len = (end == std::string::npos ? body.size() : end) - start;
    return body.substr(start, std::min(len, MAX_BODY_EVIDENCE));
}

static std::optional<std::pair<std::string, std::string>> find_in_headers(const HeaderList& headers) {
    for (const auto& [name, value] : headers) {
        if (http::iequals(name, "Cookie") || http::iequals(name, "Set-Cookie")) continue;
        if (JavaSerializedObjectRule::carries_serialized_object(value)) {
            return std::make_pair(name, value);
        }
    }
    return std::nullopt;
}

std::optional<JavaSerializedObjectRule::Match> JavaSerializedObjectRule::find_in_request(const Transaction& msg) const {
    if (auto hit = find_in_headers(msg.request_headers)) {
        return Match{hit->first, hit->second};
    }

    for (const auto& cookie : http::request_cookies(msg)) {
        if (carries_serialized_object(cookie.value)) {
            return Match{cookie.name, cookie.value};
        }
    }

    std::vector<std::pair<std::string, std::string>> params;
    if (auto url = http::parse_url(msg.uri); url && !url->query.empty()) {
        params = http::parse_query(url->query);
    }
    if (http::request_content_type(msg).find("application/x-www-form-urlencoded") != std::string::npos) {
        auto form = http::parse_query(msg.request_body);
        params.insert(params.end(), form.begin(), form.end());
    }
    for (const auto& [name, value] : params) {
        if (!value.empty() && carries_serialized_object(value)) {
            return Match{name, value};
        }
    }

    if (!msg.request_body.empty() && carries_serialized_object(msg.request_body)) {
        return Match{"", body_evidence(msg.request_body)};
    }
    return std::nullopt;
}

std::optional<JavaSerializedObjectRule::Match> JavaSerializedObjectRule::find_in_response(const Transaction& msg) const {
    if (auto hit = find_in_headers(msg.response_headers)) {
        return Match{hit->first, hit->second};
    }

    for (const auto& cookie : http::response_cookies(msg)) {
        if (carries_serialized_object(cookie.value)) {
            return Match{cookie.name, cookie.value};
        }
    }

    if (!msg.response_body.empty() && carries_serialized_object(msg.response_body)) {
        return Match{"", body_evidence(msg.response_body)};
    }
    return std::nullopt;
}

Alert JavaSerializedObjectRule::build_alert(const Match& match, const std::string& uri) const {
    return AlertBuilder(meta_)
        .param(match.param)
        .evidence(match.evidence)
        .uri(uri)
        .build();
}

std::vector<Alert> JavaSerializedObjectRule::inspect_request(const Transaction& msg) const {
    if (auto match = find_in_request(msg)) {
        return {build_alert(*match, msg.uri)};
    }
    return {};
}

std::vector<Alert> JavaSerializedObjectRule::inspect_response(const Transaction& msg) const {
    if (auto match = find_in_response(msg)) {
        return {build_alert(*match, msg.uri)};
    }
    return {};
}

std::vector<Alert> JavaSerializedObjectRule::example_alerts() const {
    return {build_alert(Match{"", ""}, "")};
}
