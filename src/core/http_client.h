#pragma once
#include "scan_rule.h"
#include <string>

// HTTP transport built on libcurl.
// Sends the request side of a Transaction and fills in its response side,
// with configurable timeouts and per-call redirect handling.

class HttpClient : public Transport {
public:
    struct Options {
        long timeout_seconds;
        long connect_timeout_seconds;
        long max_redirects;
        std::string user_agent;
        bool verify_tls;

        Options()
            : timeout_seconds(15),
              connect_timeout_seconds(5),
              max_redirects(5),
              user_agent("lookout/0.1"),
              verify_tls(true)
        {}
    };

    /**
     * @brief Create an HTTP client with the given options
     * @param opts Client configuration (timeouts, redirects, etc.)
     * @throws std::runtime_error if libcurl cannot be initialized
     */
    explicit HttpClient(const Options& opts = Options());

    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @brief Send a request and fill in the response
     * @param msg Transaction whose method, uri, headers and body are sent
     * @param follow_redirects Whether 3xx responses are followed
     * @return true if a response was received, false on error (msg.error is set)
     */
    bool send(Transaction& msg, bool follow_redirects) override;

private:
    Options opts_;
};
