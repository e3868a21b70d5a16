/**
 * @file http_message.cpp
 * @brief Header, cookie and URL helpers for Transaction values
 */

#include "http_message.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace http {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::optional<std::string> Cookie::attribute(const std::string& name) const {
    for (const auto& [key, value] : attributes) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<Url> parse_url(const std::string& url) {
    Url out;
    std::string rest = trim(url);
    if (rest.empty()) return std::nullopt;

    // Fragment and query first, they may contain "://" or '/'
    size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        out.fragment = rest.substr(hash + 1);
        rest.erase(hash);
    }
    size_t qmark = rest.find('?');
    if (qmark != std::string::npos) {
        out.query = rest.substr(qmark + 1);
        rest.erase(qmark);
    }

    size_t scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        out.scheme = to_lower(rest.substr(0, scheme_end));
        rest.erase(0, scheme_end + 3);

        size_t path_start = rest.find('/');
        std::string authority = path_start == std::string::npos ? rest : rest.substr(0, path_start);
        out.path = path_start == std::string::npos ? "" : rest.substr(path_start);

        size_t at = authority.rfind('@');
        if (at != std::string::npos) {
            authority.erase(0, at + 1);
        }
        out.authority = authority;
        if (authority.empty()) return std::nullopt;

        std::string host_port = authority;
        size_t colon = std::string::npos;
        if (host_port[0] == '[') {
            size_t close = host_port.find(']');
            if (close == std::string::npos) return std::nullopt;
            out.host = to_lower(host_port.substr(0, close + 1));
            if (close + 1 < host_port.size() && host_port[close + 1] == ':') colon = close + 1;
        } else {
            colon = host_port.rfind(':');
            out.host = to_lower(colon == std::string::npos ? host_port : host_port.substr(0, colon));
        }
        if (colon != std::string::npos && colon + 1 < host_port.size()) {
            try {
                out.port = std::stoi(host_port.substr(colon + 1));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    } else {
        if (rest.empty() || rest[0] != '/') return std::nullopt;
        out.path = rest;
    }
    return out;
}

std::string origin_of(const Url& url) {
    if (url.scheme.empty()) return "";
    return url.scheme + "://" + url.authority;
}

std::vector<std::pair<std::string, std::string>> parse_query(const std::string& query) {
    std::vector<std::pair<std::string, std::string>> params;
    size_t start = 0;
    while (start <= query.size()) {
        size_t amp = query.find('&', start);
        std::string pair = amp == std::string::npos ? query.substr(start) : query.substr(start, amp - start);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            if (eq == std::string::npos) {
                params.emplace_back(pair, "");
            } else {
                params.emplace_back(pair.substr(0, eq), pair.substr(eq + 1));
            }
        }
        if (amp == std::string::npos) break;
        start = amp + 1;
    }
    return params;
}

std::optional<std::string> header_value(const HeaderList& headers, const std::string& name) {
    for (const auto& [header, value] : headers) {
        if (iequals(header, name)) {
            return value;
        }
    }
    return std::nullopt;
}

std::vector<std::string> header_values(const HeaderList& headers, const std::string& name) {
    std::vector<std::string> values;
    for (const auto& [header, value] : headers) {
        if (iequals(header, name)) {
            values.push_back(value);
        }
    }
    return values;
}

static void append_headers(const HeaderList& headers, std::ostringstream& out) {
    for (const auto& [name, value] : headers) {
        out << name << ": " << value << "\r\n";
    }
    out << "\r\n";
}

std::string request_header_block(const Transaction& tx) {
    std::ostringstream out;
    out << tx.method << ' ' << tx.uri << ' ' << tx.http_version << "\r\n";
    append_headers(tx.request_headers, out);
    return out.str();
}

std::string response_header_block(const Transaction& tx) {
    std::ostringstream out;
    out << tx.response_version << ' ' << tx.response_status;
    if (!tx.response_reason.empty()) out << ' ' << tx.response_reason;
    out << "\r\n";
    append_headers(tx.response_headers, out);
    return out.str();
}

std::vector<Cookie> request_cookies(const Transaction& tx) {
    std::vector<Cookie> cookies;
    for (const auto& header : header_values(tx.request_headers, "Cookie")) {
        size_t start = 0;
        while (start < header.size()) {
            size_t semi = header.find(';', start);
            std::string pair = trim(semi == std::string::npos ? header.substr(start) : header.substr(start, semi - start));
            size_t eq = pair.find('=');
            if (eq != std::string::npos && eq > 0) {
                Cookie c;
                c.name = trim(pair.substr(0, eq));
                c.value = trim(pair.substr(eq + 1));
                cookies.push_back(std::move(c));
            }
            if (semi == std::string::npos) break;
            start = semi + 1;
        }
    }
    return cookies;
}

std::optional<Cookie> parse_set_cookie(const std::string& value) {
    Cookie cookie;
    bool first = true;
    size_t start = 0;
    while (start <= value.size()) {
        size_t semi = value.find(';', start);
        std::string token = trim(semi == std::string::npos ? value.substr(start) : value.substr(start, semi - start));
        size_t eq = token.find('=');
        if (first) {
            if (eq == std::string::npos || eq == 0) return std::nullopt;
            cookie.name = trim(token.substr(0, eq));
            cookie.value = trim(token.substr(eq + 1));
            first = false;
        } else if (!token.empty()) {
            if (eq == std::string::npos) {
                cookie.attributes.emplace_back(token, "");
            } else {
                cookie.attributes.emplace_back(trim(token.substr(0, eq)), trim(token.substr(eq + 1)));
            }
        }
        if (semi == std::string::npos) break;
        start = semi + 1;
    }
    return cookie;
}

std::vector<Cookie> response_cookies(const Transaction& tx) {
    std::vector<Cookie> cookies;
    for (const auto& header : header_values(tx.response_headers, "Set-Cookie")) {
        if (auto cookie = parse_set_cookie(header)) {
            cookies.push_back(std::move(*cookie));
        }
    }
    return cookies;
}

std::string response_content_type(const Transaction& tx) {
    auto ct = header_value(tx.response_headers, "Content-Type");
    return ct ? to_lower(trim(*ct)) : "";
}

std::string request_content_type(const Transaction& tx) {
    auto ct = header_value(tx.request_headers, "Content-Type");
    return ct ? to_lower(trim(*ct)) : "";
}

bool is_html_response(const Transaction& tx) {
    return response_content_type(tx).find("html") != std::string::npos;
}

// Split raw message text into start line, headers and body
static bool split_message(const std::string& raw, std::string& start_line, HeaderList& headers, std::string& body) {
    size_t pos = 0;
    bool have_start = false;
    while (pos < raw.size()) {
        size_t eol = raw.find('\n', pos);
        std::string line = eol == std::string::npos ? raw.substr(pos) : raw.substr(pos, eol - pos);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        pos = eol == std::string::npos ? raw.size() : eol + 1;

        if (line.empty()) {
            if (!have_start) continue;
            body = raw.substr(pos);
            return true;
        }
        if (!have_start) {
            start_line = line;
            have_start = true;
            continue;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        headers.emplace_back(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
    }
    return have_start;
}

bool parse_request(const std::string& raw, Transaction& tx) {
    std::string start_line;
    HeaderList headers;
    std::string body;
    if (!split_message(raw, start_line, headers, body)) return false;

    std::istringstream iss(start_line);
    std::string method, uri, version;
    iss >> method >> uri >> version;
    if (method.empty() || uri.empty()) return false;

    tx.method = method;
    tx.uri = uri;
    if (!version.empty()) tx.http_version = version;
    tx.request_headers = std::move(headers);
    tx.request_body = std::move(body);
    return true;
}

bool parse_response(const std::string& raw, Transaction& tx) {
    std::string start_line;
    HeaderList headers;
    std::string body;
    if (!split_message(raw, start_line, headers, body)) return false;

    std::istringstream iss(start_line);
    std::string version;
    long status = 0;
    iss >> version >> status;
    if (version.empty() || status == 0) return false;
    std::string reason;
    std::getline(iss, reason);

    tx.response_version = version;
    tx.response_status = status;
    tx.response_reason = trim(reason);
    tx.response_headers = std::move(headers);
    tx.response_body = std::move(body);
    return true;
}

} // namespace http
