/**
 * @file har_reader.cpp
 * @brief HAR 1.2 import
 */

#include "har_reader.h"
#include "codec/encoding.h"
#include "core/http_message.h"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace har {

using json = nlohmann::json;

static HeaderList read_headers(const json& message) {
    HeaderList headers;
    if (!message.contains("headers") || !message["headers"].is_array()) return headers;
    for (const auto& h : message["headers"]) {
        std::string name = h.value("name", "");
        // HTTP/2 pseudo headers are not real header lines
        if (name.empty() || name[0] == ':') continue;
        headers.emplace_back(name, h.value("value", ""));
    }
    return headers;
}

static std::string normalize_version(const std::string& version) {
    if (version.empty()) return "HTTP/1.1";
    std::string upper = http::to_upper(version);
    if (upper == "H2" || upper == "HTTP/2.0") return "HTTP/2";
    return upper;
}

Transaction entry_to_transaction(const json& entry) {
    if (!entry.contains("request") || !entry["request"].is_object()) {
        throw std::invalid_argument("entry has no request");
    }
    const json& req = entry["request"];
    std::string url = req.value("url", "");
    if (url.empty()) {
        throw std::invalid_argument("entry has no request URL");
    }

    Transaction tx;
    tx.method = http::to_upper(req.value("method", "GET"));
    tx.uri = url;
    tx.http_version = normalize_version(req.value("httpVersion", ""));
    tx.request_headers = read_headers(req);
    if (req.contains("postData") && req["postData"].is_object()) {
        tx.request_body = req["postData"].value("text", "");
    }

    if (entry.contains("response") && entry["response"].is_object()) {
        const json& resp = entry["response"];
        tx.response_status = resp.value("status", 0L);
        tx.response_reason = resp.value("statusText", "");
        tx.response_version = normalize_version(resp.value("httpVersion", ""));
        tx.response_headers = read_headers(resp);
        if (resp.contains("content") && resp["content"].is_object()) {
            const json& content = resp["content"];
            std::string text = content.value("text", "");
            if (content.value("encoding", "") == "base64") {
                auto decoded = codec::base64_decode_lenient(text);
                tx.response_body = decoded ? *decoded : "";
            } else {
                tx.response_body = text;
            }
        }
    }
    return tx;
}

std::vector<Transaction> from_json(const json& doc) {
    if (!doc.contains("log") || !doc["log"].contains("entries") || !doc["log"]["entries"].is_array()) {
        throw std::runtime_error("HAR document has no log.entries array");
    }

    std::vector<Transaction> out;
    size_t index = 0;
    for (const auto& entry : doc["log"]["entries"]) {
        try {
            out.push_back(entry_to_transaction(entry));
        } catch (const std::exception& e) {
            std::cerr << "Warning: skipping HAR entry " << index << ": " << e.what() << "\n";
        }
        index++;
    }
    return out;
}

std::vector<Transaction> load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Could not open HAR file: " + path);
    }
    json doc = json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        throw std::runtime_error("HAR file is not valid JSON: " + path);
    }
    return from_json(doc);
}

} // namespace har
