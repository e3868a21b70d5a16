#pragma once
#include "rule_metadata.h"
#include <schema/alert.h>
#include <string>

// Fluent builder that pre-populates an Alert from a rule's static metadata.
// Rules override only the fields they compute per finding.

class AlertBuilder {
public:
    explicit AlertBuilder(const RuleMetadata& meta);

    AlertBuilder& risk(Risk r) { alert_.risk = r; return *this; }
    AlertBuilder& confidence(Confidence c) { alert_.confidence = c; return *this; }
    AlertBuilder& description(const std::string& s) { alert_.description = s; return *this; }
    AlertBuilder& solution(const std::string& s) { alert_.solution = s; return *this; }
    AlertBuilder& references(const std::string& s) { alert_.references = s; return *this; }
    AlertBuilder& evidence(const std::string& s) { alert_.evidence = s; return *this; }
    AlertBuilder& other_info(const std::string& s) { alert_.other_info = s; return *this; }
    AlertBuilder& attack(const std::string& s) { alert_.attack = s; return *this; }
    AlertBuilder& param(const std::string& s) { alert_.param = s; return *this; }
    AlertBuilder& uri(const std::string& s) { alert_.uri = s; return *this; }
    AlertBuilder& cwe_id(int id) { alert_.cwe_id = id; return *this; }
    AlertBuilder& wasc_id(int id) { alert_.wasc_id = id; return *this; }
    AlertBuilder& tag(const std::string& key, const std::string& value) { alert_.tags[key] = value; return *this; }

    /**
     * @brief Produce the finished alert
     * @return A copy of the accumulated alert
     */
    Alert build() const { return alert_; }

private:
    Alert alert_;
};
