#pragma once
#include <schema/alert.h>
#include <fstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace logging {

// Hash-chained JSONL journal of scan events.
// Every line carries the hash of the line before it, so edited, reordered
// or deleted entries break the chain and show up in verify().

struct LogEntry {
    std::string event_type;   // scan_start, alert_raised, scan_complete
    std::string run_id;
    nlohmann::json payload;
    std::string prev_hash;
    std::string entry_hash;
    std::string timestamp;

    nlohmann::json to_json() const;
    static LogEntry from_json(const nlohmann::json& j);
};

struct VerifyResult {
    bool intact = true;
    size_t entries = 0;
    size_t bad_entry = 0;     // index of the first broken entry when !intact
    std::string problem;
};

class ChainLogger {
public:
    /**
     * @brief Open a journal for appending
     * @param log_path JSONL file, created if missing; an existing chain is continued
     * @param run_id Identifier stamped on every entry of this run
     */
    ChainLogger(const std::string& log_path, const std::string& run_id);

    bool is_open() const { return log_stream_.is_open(); }

    /**
     * @brief Append one chained entry
     * @param event_type Event name
     * @param payload Event data
     * @return false if the journal could not be written
     */
    bool append(const std::string& event_type, const nlohmann::json& payload);

    bool record_scan_start(const std::string& mode, size_t transactions);
    bool record_alert(const Alert& alert);
    bool record_scan_complete(size_t alerts, size_t requests_sent);

    std::string last_hash() const { return last_hash_; }

    /**
     * @brief Check that every entry hash matches and the links are unbroken
     * @param log_path Journal to check
     * @return Verification result; an empty or missing journal is intact
     */
    static VerifyResult verify(const std::string& log_path);

    /**
     * @brief Read all entries, skipping lines that are not JSON
     */
    static std::vector<LogEntry> load(const std::string& log_path);

    static std::string compute_hash(const LogEntry& entry);

private:
    std::string log_path_;
    std::string run_id_;
    std::string last_hash_;
    std::ofstream log_stream_;

    static std::string get_timestamp();
};

} // namespace logging
