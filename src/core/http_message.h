#pragma once
#include <schema/transaction.h>
#include <optional>
#include <string>
#include <vector>

// Helpers for reading and rendering Transaction values.
// Header names are matched case-insensitively, header order is preserved,
// and nothing here performs network I/O.

namespace http {

struct Url {
    std::string scheme;
    std::string authority;   // host[:port] as written, userinfo removed
    std::string host;        // lowercase
    int port = -1;           // -1 when not given explicitly
    std::string path;
    std::string query;       // without the leading '?'
    std::string fragment;
};

struct Cookie {
    std::string name;
    std::string value;
    std::vector<std::pair<std::string, std::string>> attributes;  // Set-Cookie only, in order

    /**
     * @brief Get a Set-Cookie attribute by case-insensitive name
     * @param name Attribute name (e.g., "Domain")
     * @return Attribute value, or nullopt if absent
     */
    std::optional<std::string> attribute(const std::string& name) const;
};

/**
 * @brief Parse an absolute or origin-form URL
 * @param url URL text
 * @return Parsed URL, or nullopt if it has no usable scheme/authority and no path
 */
std::optional<Url> parse_url(const std::string& url);

/**
 * @brief Rebuild "scheme://authority" for a parsed URL
 */
std::string origin_of(const Url& url);

/**
 * @brief Split a query or urlencoded form body into raw (still encoded) pairs
 * @param query Text like "a=1&b=&c"
 * @return Name/value pairs in order of appearance
 */
std::vector<std::pair<std::string, std::string>> parse_query(const std::string& query);

/**
 * @brief Get the first value of a header, matching the name case-insensitively
 * @param headers Header list
 * @param name Header name
 * @return Value, or nullopt if the header is absent
 */
std::optional<std::string> header_value(const HeaderList& headers, const std::string& name);

/**
 * @brief Get every value of a header, matching the name case-insensitively
 */
std::vector<std::string> header_values(const HeaderList& headers, const std::string& name);

/**
 * @brief Render "METHOD URI VERSION" plus the request headers, CRLF terminated
 */
std::string request_header_block(const Transaction& tx);

/**
 * @brief Render the status line plus the response headers, CRLF terminated
 */
std::string response_header_block(const Transaction& tx);

/**
 * @brief Parse the name=value pairs of every Cookie request header
 */
std::vector<Cookie> request_cookies(const Transaction& tx);

/**
 * @brief Parse every Set-Cookie response header, including attributes
 */
std::vector<Cookie> response_cookies(const Transaction& tx);

/**
 * @brief Parse a single Set-Cookie header value
 * @return Cookie, or nullopt if there is no name=value pair
 */
std::optional<Cookie> parse_set_cookie(const std::string& value);

/**
 * @brief Response Content-Type, lowercased, or empty string if absent
 */
std::string response_content_type(const Transaction& tx);

/**
 * @brief Request Content-Type, lowercased, or empty string if absent
 */
std::string request_content_type(const Transaction& tx);

/**
 * @brief Check whether the response declares an HTML content type
 */
bool is_html_response(const Transaction& tx);

/**
 * @brief Fill the request side of a transaction from raw HTTP text
 * @param raw Request line, headers, blank line, body ("\r\n" or "\n" line ends)
 * @param tx Transaction to populate
 * @return true if a request line was found
 */
bool parse_request(const std::string& raw, Transaction& tx);

/**
 * @brief Fill the response side of a transaction from raw HTTP text
 * @param raw Status line, headers, blank line, body
 * @param tx Transaction to populate
 * @return true if a status line was found
 */
bool parse_response(const std::string& raw, Transaction& tx);

std::string to_lower(std::string s);
std::string to_upper(std::string s);
std::string trim(const std::string& s);
bool iequals(const std::string& a, const std::string& b);
bool starts_with(const std::string& s, const std::string& prefix);

} // namespace http
