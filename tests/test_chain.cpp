/**
 * @file test_chain.cpp
 * @brief Unit tests for the hash-chained alert journal
 *
 * Checks that alerts are journaled in full, that the chain continues across
 * logger instances, and that edits to any entry are detected.
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "logging/chain.h"
#include <filesystem>
#include <fstream>

using namespace logging;
namespace fs = std::filesystem;

static Alert sample_alert() {
    Alert a;
    a.rule_id = 10098;
    a.name = "Cross-Domain Misconfiguration";
    a.risk = Risk::MEDIUM;
    a.confidence = Confidence::MEDIUM;
    a.evidence = "Access-Control-Allow-Origin: *";
    a.uri = "https://api.example.com/";
    a.cwe_id = 264;
    a.wasc_id = 14;
    a.tags["PENTEST"] = "";
    return a;
}

static std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

static void write_lines(const std::string& path, const std::vector<std::string>& lines) {
    std::ofstream out(path);
    for (const auto& l : lines) {
        out << l << "\n";
    }
}

TEST_CASE("Journal records a scan", "[chain]") {
    std::string test_log = (fs::temp_directory_path() / "lookout_journal_test.jsonl").string();
    if (fs::exists(test_log)) {
        fs::remove(test_log);
    }

    SECTION("Scan events in order") {
        {
            ChainLogger logger(test_log, "run_1");
            REQUIRE(logger.is_open());
            REQUIRE(logger.record_scan_start("passive", 12));
            REQUIRE(logger.record_alert(sample_alert()));
            REQUIRE(logger.record_scan_complete(1, 0));
            REQUIRE(!logger.last_hash().empty());
        }

        auto result = ChainLogger::verify(test_log);
        REQUIRE(result.intact);
        REQUIRE(result.entries == 3);

        auto entries = ChainLogger::load(test_log);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].event_type == "scan_start");
        REQUIRE(entries[0].payload["mode"] == "passive");
        REQUIRE(entries[0].payload["transactions"] == 12);
        REQUIRE(entries[0].prev_hash == "sha256:genesis");
        REQUIRE(entries[1].event_type == "alert_raised");
        REQUIRE(entries[1].prev_hash == entries[0].entry_hash);
        REQUIRE(entries[2].event_type == "scan_complete");
        REQUIRE(entries[2].payload["alerts"] == 1);

        Alert restored = Alert::from_json(entries[1].payload);
        REQUIRE(restored.rule_id == 10098);
        REQUIRE(restored.evidence == "Access-Control-Allow-Origin: *");
        REQUIRE(restored.risk == Risk::MEDIUM);
        REQUIRE(restored.tags.count("PENTEST") == 1);
    }

    SECTION("Chain continuation") {
        {
            ChainLogger logger1(test_log, "run1");
            logger1.record_scan_start("active", 1);
        }
        std::string last_hash1 = ChainLogger::load(test_log).back().entry_hash;

        {
            ChainLogger logger2(test_log, "run2");
            REQUIRE(logger2.last_hash() == last_hash1);
            logger2.record_scan_start("active", 1);
        }

        REQUIRE(ChainLogger::verify(test_log).intact);
        auto entries = ChainLogger::load(test_log);
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[1].prev_hash == last_hash1);
        REQUIRE(entries[1].run_id == "run2");
    }

    SECTION("Tampered payload") {
        {
            ChainLogger logger(test_log, "run");
            logger.record_alert(sample_alert());
            logger.record_alert(sample_alert());
        }
        REQUIRE(ChainLogger::verify(test_log).intact);

        auto lines = read_lines(test_log);
        REQUIRE(lines.size() == 2);
        auto j = nlohmann::json::parse(lines[1]);
        j["payload"]["risk"] = "Informational";
        lines[1] = j.dump();
        write_lines(test_log, lines);

        auto result = ChainLogger::verify(test_log);
        REQUIRE_FALSE(result.intact);
        REQUIRE(result.bad_entry == 1);
    }

    SECTION("Deleted entry") {
        {
            ChainLogger logger(test_log, "run");
            logger.record_scan_start("passive", 2);
            logger.record_alert(sample_alert());
            logger.record_scan_complete(1, 0);
        }
        auto lines = read_lines(test_log);
        lines.erase(lines.begin() + 1);
        write_lines(test_log, lines);

        auto result = ChainLogger::verify(test_log);
        REQUIRE_FALSE(result.intact);
        REQUIRE(result.bad_entry == 1);
        REQUIRE(result.problem.find("chain break") != std::string::npos);
    }

    SECTION("Missing journal is trivially intact") {
        auto result = ChainLogger::verify(test_log);
        REQUIRE(result.intact);
        REQUIRE(result.entries == 0);
    }

    if (fs::exists(test_log)) {
        fs::remove(test_log);
    }
}

TEST_CASE("LogEntry JSON serialization", "[chain]") {
    LogEntry entry;
    entry.event_type = "alert_raised";
    entry.run_id = "run123";
    entry.timestamp = "2025-01-01T00:00:00.000Z";
    entry.prev_hash = "sha256:prev";
    entry.payload = sample_alert().to_json();
    entry.entry_hash = ChainLogger::compute_hash(entry);

    auto restored = LogEntry::from_json(entry.to_json());
    REQUIRE(restored.event_type == entry.event_type);
    REQUIRE(restored.run_id == entry.run_id);
    REQUIRE(restored.timestamp == entry.timestamp);
    REQUIRE(restored.prev_hash == entry.prev_hash);
    REQUIRE(restored.payload == entry.payload);
    REQUIRE(ChainLogger::compute_hash(restored) == entry.entry_hash);
    REQUIRE(entry.entry_hash.rfind("sha256:", 0) == 0);
    REQUIRE(entry.entry_hash.size() == 7 + 64);
}
