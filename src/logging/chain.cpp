/**
 * @file chain.cpp
 * @brief Hash-chained JSONL journal of scan events
 */

#include "chain.h"
#include <openssl/sha.h>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace logging {

using json = nlohmann::json;

static const char* kGenesis = "sha256:genesis";

json LogEntry::to_json() const {
    json j;
    j["event_type"] = event_type;
    j["run_id"] = run_id;
    j["timestamp"] = timestamp;
    j["prev_hash"] = prev_hash;
    j["entry_hash"] = entry_hash;
    j["payload"] = payload;
    return j;
}

LogEntry LogEntry::from_json(const json& j) {
    LogEntry entry;
    entry.event_type = j.value("event_type", "");
    entry.run_id = j.value("run_id", "");
    entry.timestamp = j.value("timestamp", "");
    entry.prev_hash = j.value("prev_hash", "");
    entry.entry_hash = j.value("entry_hash", "");
    entry.payload = j.value("payload", json::object());
    return entry;
}

ChainLogger::ChainLogger(const std::string& log_path, const std::string& run_id)
    : log_path_(log_path), run_id_(run_id) {
    auto entries = load(log_path);
    if (!entries.empty()) {
        last_hash_ = entries.back().entry_hash;
    }
    log_stream_.open(log_path_, std::ios::app);
    if (!log_stream_.is_open()) {
        std::cerr << "Warning: could not open journal " << log_path_ << "\n";
    }
}

std::string ChainLogger::get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm;
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string ChainLogger::compute_hash(const LogEntry& entry) {
    // nlohmann orders object keys, so dump() is canonical
    std::string data = entry.prev_hash + entry.timestamp + entry.event_type + entry.run_id
        + entry.payload.dump(-1, ' ', false, json::error_handler_t::replace);

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

    std::ostringstream hex;
    hex << "sha256:";
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return hex.str();
}

bool ChainLogger::append(const std::string& event_type, const json& payload) {
    if (!log_stream_.is_open()) {
        return false;
    }

    LogEntry entry;
    entry.event_type = event_type;
    entry.run_id = run_id_;
    entry.timestamp = get_timestamp();
    entry.prev_hash = last_hash_.empty() ? kGenesis : last_hash_;
    entry.payload = payload;
    entry.entry_hash = compute_hash(entry);

    log_stream_ << entry.to_json().dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    log_stream_.flush();
    if (!log_stream_) {
        return false;
    }

    last_hash_ = entry.entry_hash;
    return true;
}

bool ChainLogger::record_scan_start(const std::string& mode, size_t transactions) {
    return append("scan_start", {{"mode", mode}, {"transactions", transactions}});
}

bool ChainLogger::record_alert(const Alert& alert) {
    return append("alert_raised", alert.to_json());
}

bool ChainLogger::record_scan_complete(size_t alerts, size_t requests_sent) {
    return append("scan_complete", {{"alerts", alerts}, {"requests_sent", requests_sent}});
}

std::vector<LogEntry> ChainLogger::load(const std::string& log_path) {
    std::vector<LogEntry> entries;
    std::ifstream in(log_path);
    if (!in.is_open()) {
        return entries;
    }

    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        json j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            std::cerr << "Warning: skipping unparsable journal line\n";
            continue;
        }
        entries.push_back(LogEntry::from_json(j));
    }
    return entries;
}

VerifyResult ChainLogger::verify(const std::string& log_path) {
    VerifyResult result;
    auto entries = load(log_path);
    result.entries = entries.size();

    for (size_t i = 0; i < entries.size(); i++) {
        const LogEntry& entry = entries[i];
        std::string expected_prev = i == 0 ? kGenesis : entries[i - 1].entry_hash;
        if (entry.prev_hash != expected_prev) {
            result.intact = false;
            result.bad_entry = i;
            result.problem = "chain break: prev_hash " + entry.prev_hash + " does not match " + expected_prev;
            return result;
        }
        std::string computed = compute_hash(entry);
        if (computed != entry.entry_hash) {
            result.intact = false;
            result.bad_entry = i;
            result.problem = "hash mismatch for " + entry.event_type + " entry: computed " + computed;
            return result;
        }
    }
    return result;
}

} // namespace logging
