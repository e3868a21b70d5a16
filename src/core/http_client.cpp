/**
 * @file http_client.cpp
 * @brief Lightweight HTTP transport using libcurl
 */

#include "http_client.h"
#include "http_message.h"
#include <curl/curl.h>
#include <stdexcept>
#include <string_view>

/// Callback invoked by libcurl to write the received body data.
static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* s = static_cast<std::string*>(userdata);
    s->append(ptr, size * nmemb);
    return size * nmemb;
}

struct ResponseHead {
    std::string version;
    std::string reason;
    HeaderList headers;
};

/// Callback invoked once per header line. A new status line (after a
/// redirect or a 100 Continue) starts the header list over.
static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    std::string_view hv(buffer, total);
    auto* head = static_cast<ResponseHead*>(userdata);

    size_t end = hv.size();
    while (end > 0 && (hv[end - 1] == '\r' || hv[end - 1] == '\n')) end--;
    std::string line(hv.substr(0, end));
    if (line.empty()) return total;

    if (http::starts_with(line, "HTTP/")) {
        head->headers.clear();
        size_t sp1 = line.find(' ');
        head->version = line.substr(0, sp1);
        size_t sp2 = sp1 == std::string::npos ? std::string::npos : line.find(' ', sp1 + 1);
        head->reason = sp2 == std::string::npos ? "" : line.substr(sp2 + 1);
        return total;
    }

    auto pos = line.find(':');
    if (pos != std::string::npos) {
        head->headers.emplace_back(line.substr(0, pos), http::trim(line.substr(pos + 1)));
    }
    return total;
}

/// Initialize global libcurl state.
HttpClient::HttpClient(const Options& opts) : opts_(opts) {
    CURLcode c = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (c != CURLE_OK) {
        throw std::runtime_error("curl_global_init failed");
    }
}

/// Clean up global libcurl state.
HttpClient::~HttpClient() {
    curl_global_cleanup();
}

bool HttpClient::send(Transaction& msg, bool follow_redirects) {
    msg.error.clear();
    msg.response_status = 0;
    msg.response_reason.clear();
    msg.response_headers.clear();
    msg.response_body.clear();

    CURL* curl = curl_easy_init();
    if (!curl) {
        msg.error = "curl_easy_init failed";
        return false;
    }

    std::string body;
    ResponseHead head;

    // Basic configuration
    curl_easy_setopt(curl, CURLOPT_URL, msg.uri.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, opts_.connect_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, opts_.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, opts_.max_redirects);
    if (!opts_.verify_tls) {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }
    if (msg.http_version == "HTTP/1.0") {
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_0);
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
    }

    // Response and header callbacks
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &head);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, opts_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_VERBOSE, 0L);

    // Request headers, Host is derived from the URL
    struct curl_slist* curl_headers = nullptr;
    for (const auto& [name, value] : msg.request_headers) {
        if (http::iequals(name, "Host") || http::iequals(name, "Content-Length")) continue;
        std::string line = name + ": " + value;
        curl_headers = curl_slist_append(curl_headers, line.c_str());
    }
    if (curl_headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, curl_headers);

    // HTTP method and body
    if (!msg.request_body.empty() || msg.method == "POST" || msg.method == "PUT" || msg.method == "PATCH") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, msg.method.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, msg.request_body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(msg.request_body.size()));
    } else if (msg.method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else if (msg.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, msg.method.c_str());
    }

    // Error buffer setup
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        msg.error = errbuf[0] ? std::string(errbuf) : curl_easy_strerror(rc);
    } else {
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        msg.response_status = status;
        if (!head.version.empty()) msg.response_version = head.version;
        msg.response_reason = head.reason;
        msg.response_headers = std::move(head.headers);
        msg.response_body = std::move(body);
    }

    if (curl_headers) curl_slist_free_all(curl_headers);
    curl_easy_cleanup(curl);
    return rc == CURLE_OK;
}
