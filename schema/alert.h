#pragma once
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @file alert.h
 * @brief Data structure representing a security finding raised by a scan rule
 * 
 * An alert is built once per confirmed finding and is not modified after it
 * has been handed to the alert sink.
 */

enum class Risk {
    INFO,
    LOW,
    MEDIUM,
    HIGH
};

enum class Confidence {
    LOW,
    MEDIUM,
    HIGH,
    CONFIRMED
};

/**
 * A finding with its remediation metadata and auditable evidence
 */
struct Alert {
    int rule_id = 0;
    std::string name;
    Risk risk = Risk::INFO;
    Confidence confidence = Confidence::MEDIUM;
    std::string description;
    std::string solution;
    std::string references;
    std::string evidence;       // Literal substring of the inspected header block or body
    std::string other_info;
    std::string attack;         // Payload or URL sent by an active rule
    std::string param;
    std::string uri;
    int cwe_id = 0;
    int wasc_id = 0;
    std::map<std::string, std::string> tags;

    nlohmann::json to_json() const;
    static Alert from_json(const nlohmann::json& j);
};

std::string to_string(Risk risk);
std::string to_string(Confidence confidence);

/**
 * @brief Render alerts as an indented JSON array for export
 *
 * Evidence is copied from responses and need not be UTF-8; invalid bytes are
 * written as U+FFFD instead of failing the whole export.
 */
std::string alerts_to_json_text(const std::vector<Alert>& alerts);
