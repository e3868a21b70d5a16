/**
 * @file test_scan_policy.cpp
 * @brief Unit tests for scan policy loading
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "config/scan_policy.h"
#include <filesystem>
#include <fstream>

using config::ScanPolicy;
namespace fs = std::filesystem;

static std::string write_temp(const std::string& name, const std::string& content) {
    fs::path path = fs::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

TEST_CASE("Defaults", "[policy]") {
    ScanPolicy p = ScanPolicy::get_default();
    REQUIRE(p.attack_strength == AttackStrength::MEDIUM);
    REQUIRE(p.alert_threshold == AlertThreshold::MEDIUM);
    REQUIRE(p.technologies.is_all());
    REQUIRE(p.worker_threads == 4);
    REQUIRE_FALSE(p.diagnostics.enabled);
    REQUIRE(p.is_enabled(10051));
}

TEST_CASE("JSON policy", "[policy]") {
    auto j = nlohmann::json::parse(R"({
        "attack_strength": "HIGH",
        "alert_threshold": "low",
        "technologies": ["Language.PHP", "OS.Linux"],
        "worker_threads": 2,
        "rules": {
            "10051": {"threshold": "off"},
            "20017": {"strength": "insane", "alert_threshold": "high"}
        },
        "diagnostics": {"enabled": true, "username": "alice", "password": "pw"}
    })");

    ScanPolicy p = ScanPolicy::from_json(j);
    REQUIRE(p.attack_strength == AttackStrength::HIGH);
    REQUIRE(p.alert_threshold == AlertThreshold::LOW);
    REQUIRE(p.worker_threads == 2);
    REQUIRE_FALSE(p.technologies.is_all());
    REQUIRE(p.technologies.includes("Language.PHP"));
    REQUIRE_FALSE(p.technologies.includes("Language.Java"));

    REQUIRE_FALSE(p.is_enabled(10051));
    REQUIRE(p.strength_for(10051) == AttackStrength::HIGH);
    REQUIRE(p.strength_for(20017) == AttackStrength::INSANE);
    REQUIRE(p.threshold_for(20017) == AlertThreshold::HIGH);
    REQUIRE(p.threshold_for(10098) == AlertThreshold::LOW);

    REQUIRE(p.diagnostics.enabled);
    REQUIRE(p.diagnostics.username == "alice");
    REQUIRE(p.diagnostics.password == "pw");
}

TEST_CASE("Invalid JSON values are rejected", "[policy]") {
    REQUIRE_THROWS_AS(ScanPolicy::from_json(nlohmann::json::parse(R"({"attack_strength": "extreme"})")),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(ScanPolicy::from_json(nlohmann::json::parse(R"({"rules": {"abc": {"threshold": "off"}}})")),
                      std::invalid_argument);
}

TEST_CASE("YAML policy", "[policy]") {
    ScanPolicy p = ScanPolicy::from_yaml(
        "# scan settings\n"
        "attack_strength: low\n"
        "alert_threshold: \"high\"\n"
        "worker_threads: 8\n"
        "technologies:\n"
        "  - Language.PHP\n"
        "  - 'Db.MySQL'\n"
        "rules:\n"
        "  10051:\n"
        "    threshold: off   # too noisy here\n"
        "  20017:\n"
        "    strength: high\n"
        "diagnostics:\n"
        "  enabled: yes\n"
        "  username: bob@example.com\n");

    REQUIRE(p.attack_strength == AttackStrength::LOW);
    REQUIRE(p.alert_threshold == AlertThreshold::HIGH);
    REQUIRE(p.worker_threads == 8);
    REQUIRE(p.technologies.includes("Language.PHP"));
    REQUIRE(p.technologies.includes("Db.MySQL"));
    REQUIRE_FALSE(p.technologies.includes("Language.ASP"));
    REQUIRE_FALSE(p.is_enabled(10051));
    REQUIRE(p.strength_for(20017) == AttackStrength::HIGH);
    REQUIRE(p.diagnostics.enabled);
    REQUIRE(p.diagnostics.username == "bob@example.com");
    REQUIRE(p.diagnostics.password.empty());
}

TEST_CASE("YAML inline technology list", "[policy]") {
    ScanPolicy p = ScanPolicy::from_yaml("technologies: [Language, \"OS.Linux\"]\n");
    REQUIRE(p.technologies.includes("Language.PHP"));
    REQUIRE(p.technologies.includes("OS.Linux"));
    REQUIRE_FALSE(p.technologies.includes("Db"));

    REQUIRE(ScanPolicy::from_yaml("technologies: [all]\n").technologies.is_all());
}

TEST_CASE("Loading from disk", "[policy]") {
    SECTION("JSON file") {
        std::string path = write_temp("lookout_policy.json", R"({"attack_strength": "insane"})");
        REQUIRE(ScanPolicy::load(path).attack_strength == AttackStrength::INSANE);
        fs::remove(path);
    }

    SECTION("YAML file") {
        std::string path = write_temp("lookout_policy.yml", "alert_threshold: low\n");
        REQUIRE(ScanPolicy::load(path).alert_threshold == AlertThreshold::LOW);
        fs::remove(path);
    }

    SECTION("Missing file falls back to defaults") {
        ScanPolicy p = ScanPolicy::load("/nonexistent/lookout/policy.yml");
        REQUIRE(p.attack_strength == AttackStrength::MEDIUM);
        REQUIRE(p.technologies.is_all());
    }
}
