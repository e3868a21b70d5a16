/**
 * @file alert.cpp
 * @brief JSON conversion for Alert records
 */

#include <schema/alert.h>
#include <stdexcept>

using json = nlohmann::json;

std::string to_string(Risk risk) {
    switch (risk) {
        case Risk::INFO:   return "informational";
        case Risk::LOW:    return "low";
        case Risk::MEDIUM: return "medium";
        case Risk::HIGH:   return "high";
    }
    return "unknown";
}

std::string to_string(Confidence confidence) {
    switch (confidence) {
        case Confidence::LOW:       return "low";
        case Confidence::MEDIUM:    return "medium";
        case Confidence::HIGH:      return "high";
        case Confidence::CONFIRMED: return "confirmed";
    }
    return "unknown";
}

static Risk risk_from_string(const std::string& s) {
    if (s == "informational") return Risk::INFO;
    if (s == "low") return Risk::LOW;
    if (s == "medium") return Risk::MEDIUM;
    if (s == "high") return Risk::HIGH;
    throw std::invalid_argument("unknown risk: " + s);
}

static Confidence confidence_from_string(const std::string& s) {
    if (s == "low") return Confidence::LOW;
    if (s == "medium") return Confidence::MEDIUM;
    if (s == "high") return Confidence::HIGH;
    if (s == "confirmed") return Confidence::CONFIRMED;
    throw std::invalid_argument("unknown confidence: " + s);
}

json Alert::to_json() const {
    json j;
    j["rule_id"] = rule_id;
    j["name"] = name;
    j["risk"] = to_string(risk);
    j["confidence"] = to_string(confidence);
    j["description"] = description;
    j["solution"] = solution;
    j["references"] = references;
    j["evidence"] = evidence;
    j["other_info"] = other_info;
    j["attack"] = attack;
    j["param"] = param;
    j["uri"] = uri;
    j["cwe_id"] = cwe_id;
    j["wasc_id"] = wasc_id;
    j["tags"] = tags;
    return j;
}

Alert Alert::from_json(const json& j) {
    Alert a;
    a.rule_id = j.value("rule_id", 0);
    a.name = j.value("name", "");
    a.risk = risk_from_string(j.value("risk", "informational"));
    a.confidence = confidence_from_string(j.value("confidence", "medium"));
    a.description = j.value("description", "");
    a.solution = j.value("solution", "");
    a.references = j.value("references", "");
    a.evidence = j.value("evidence", "");
    a.other_info = j.value("other_info", "");
    a.attack = j.value("attack", "");
    a.param = j.value("param", "");
    a.uri = j.value("uri", "");
    a.cwe_id = j.value("cwe_id", 0);
    a.wasc_id = j.value("wasc_id", 0);
    if (j.contains("tags") && j["tags"].is_object()) {
        a.tags = j["tags"].get<std::map<std::string, std::string>>();
    }
    return a;
}

std::string alerts_to_json_text(const std::vector<Alert>& alerts) {
    json out = json::array();
    for (const auto& a : alerts) {
        out.push_back(a.to_json());
    }
    return out.dump(2, ' ', false, json::error_handler_t::replace);
}
