#pragma once
#include <string>
#include <vector>
#include <utility>

/**
 * @file transaction.h
 * @brief Data structure representing one HTTP request/response pair
 * 
 * This is the normalized shape every scan rule reads. Headers keep the order
 * and case they arrived with; lookups through http_message.h ignore case.
 */

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * A captured or synthesized HTTP exchange
 */
struct Transaction {
    std::string method = "GET";
    std::string uri;
    std::string http_version = "HTTP/1.1";
    HeaderList request_headers;
    std::string request_body;

    long response_status = 0;
    std::string response_reason;
    std::string response_version = "HTTP/1.1";
    HeaderList response_headers;
    std::string response_body;

    // Set by the transport when the exchange failed
    std::string error;
};
