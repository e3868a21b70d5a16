/**
 * @file auth_diagnostic_collector.cpp
 * @brief Redacted transcripts of authentication traffic
 */

#include "auth_diagnostic_collector.h"
#include "auth_relevance.h"
#include "codec/encoding.h"
#include "core/http_message.h"

namespace diagnostics {

using json = nlohmann::json;

static const char* FAKE_USERNAME = "FakeUserName@example.com";
static const char* FAKE_PASSWORD = "F4keP4ssw0rd";

void AuthDiagnosticCollector::set_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_ = enabled;
    if (!enabled) {
        username_.reset();
        password_.reset();
        host_map_.clear();
        token_map_.clear();
        host_id_ = 0;
        token_id_ = 0;
    }
}

bool AuthDiagnosticCollector::is_enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_;
}

void AuthDiagnosticCollector::set_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void AuthDiagnosticCollector::set_username(const std::string& username) {
    std::lock_guard<std::mutex> lock(mutex_);
    username_ = username;
}

void AuthDiagnosticCollector::set_password(const std::string& password) {
    std::lock_guard<std::mutex> lock(mutex_);
    password_ = password;
}

void AuthDiagnosticCollector::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    host_map_.clear();
    token_map_.clear();
    host_id_ = 0;
    token_id_ = 0;
}

std::string AuthDiagnosticCollector::sanitized_host(const std::string& host) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = host_map_.find(host);
    if (it != host_map_.end()) return it->second;
    std::string pseudonym = "https://example" + std::to_string(host_id_++) + "/";
    host_map_.emplace(host, pseudonym);
    return pseudonym;
}

std::string AuthDiagnosticCollector::sanitized_token(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (username_ && token == *username_) return FAKE_USERNAME;
    if (password_ && token == *password_) return FAKE_PASSWORD;

    auto it = token_map_.find(token);
    if (it != token_map_.end()) return it->second;
    std::string pseudonym = "sanitizedtoken" + std::to_string(token_id_++);
    token_map_.emplace(token, pseudonym);
    return pseudonym;
}

json AuthDiagnosticCollector::sanitize_json(const json& value) {
    if (value.is_string()) {
        return sanitized_token(value.get<std::string>());
    }
    if (value.is_object()) {
        json out = json::object();
        for (auto& [key, item] : value.items()) {
            out[key] = sanitize_json(item);
        }
        return out;
    }
    if (value.is_array()) {
        json out = json::array();
        for (const auto& item : value) {
            out.push_back(sanitize_json(item));
        }
        return out;
    }
    return value;
}

// Lowercase host, plus the port when it is not the scheme default
std::string AuthDiagnosticCollector::host_key(const Transaction& tx) const {
    auto url = http::parse_url(tx.uri);
    if (url && !url->host.empty()) {
        bool default_port = url->port == -1 ||
                            (url->scheme == "http" && url->port == 80) ||
                            (url->scheme == "https" && url->port == 443);
        return default_port ? url->host : url->host + ":" + std::to_string(url->port);
    }
    return http::to_lower(http::header_value(tx.request_headers, "Host").value_or(""));
}

static std::string last_path_segment(const std::string& uri) {
    auto url = http::parse_url(uri);
    if (!url) return "";
    size_t slash = url->path.rfind('/');
    return slash == std::string::npos ? url->path : url->path.substr(slash + 1);
}

static void append_exact_headers(const HeaderList& headers, const std::string& name, std::string& out) {
    for (const auto& value : http::header_values(headers, name)) {
        out += name + ": " + value + "\n";
    }
}

void AuthDiagnosticCollector::append_authorization(const HeaderList& headers, std::string& out) {
    for (const auto& value : http::header_values(headers, "Authorization")) {
        out += "Authorization: ";
        // Keep the bearer scheme readable, redact only the credential after it
        if (http::starts_with(http::to_lower(value), "bearer")) {
            size_t offset = value.find(' ');
            if (offset == std::string::npos) offset = value.find(':');
            if (offset == std::string::npos) {
                out += sanitized_token(value);
            } else {
                out += value.substr(0, offset) + " " + sanitized_token(value.substr(offset + 1));
            }
        } else {
            out += sanitized_token(value);
        }
        out += "\n";
    }
}

void AuthDiagnosticCollector::append_cookies(const Transaction& tx, bool request, std::string& out) {
    if (request) {
        for (const auto& cookie : http::request_cookies(tx)) {
            out += "Cookie: " + cookie.name + "=" + sanitized_token(cookie.value) + "\n";
        }
        return;
    }
    for (const auto& cookie : http::response_cookies(tx)) {
        out += "Set-Cookie: " + cookie.name + "=" + sanitized_token(cookie.value);
        for (const auto& [key, value] : cookie.attributes) {
            if (http::iequals(key, "Domain") && !http::trim(value).empty()) {
                out += "; " + key + "=" + sanitized_host(value);
            } else if (value.empty()) {
                out += "; " + key;
            } else {
                out += "; " + key + "=" + value;
            }
        }
        out += "\n";
    }
}

void AuthDiagnosticCollector::append_body(const Transaction& tx, bool request, std::string& out) {
    std::string content_type = request ? http::request_content_type(tx) : http::response_content_type(tx);
    const std::string& body = request ? tx.request_body : tx.response_body;

    if (content_type.find("json") != std::string::npos) {
        json parsed = json::parse(body, nullptr, false);
        if (parsed.is_discarded() || !(parsed.is_object() || parsed.is_array())) {
            out += "\n<<Failed to parse JSON>>\n";
        } else {
            out += "\n" + sanitize_json(parsed).dump() + "\n";
        }
        return;
    }

    if (request && tx.method == "POST") {
        auto params = http::parse_query(body);
        if (params.empty()) return;
        out += "\n";
        for (const auto& [name, raw] : params) {
            std::string value = codec::percent_decode(raw).value_or(raw);
            out += name + "=" + sanitized_token(value) + "&";
        }
        out += "\n";
    }
}

std::string AuthDiagnosticCollector::render(const Transaction& tx) {
    // Built in one go so concurrent transcripts never interleave
    std::string out = ">>>>>\n";
    out += tx.method + " " + sanitized_host(host_key(tx)) + last_path_segment(tx.uri) + "\n";

    append_exact_headers(tx.request_headers, "Content-Type", out);
    append_authorization(tx.request_headers, out);
    append_cookies(tx, true, out);
    append_body(tx, true, out);

    out += "<<<\n";
    out += tx.response_version + " " + std::to_string(tx.response_status) + " " + tx.response_reason + "\n";
    append_exact_headers(tx.response_headers, "Content-Type", out);
    append_authorization(tx.response_headers, out);
    append_cookies(tx, false, out);
    append_body(tx, false, out);
    return out;
}

void AuthDiagnosticCollector::on_response_received(const Transaction& tx, Initiator initiator) {
    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!enabled_ || !sink_) return;
        sink = sink_;
    }
    if (initiator != Initiator::PROXY || !is_relevant_to_auth_diagnostics(tx)) {
        return;
    }
    sink(render(tx));
}

} // namespace diagnostics
