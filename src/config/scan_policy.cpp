// Policy loading from JSON or YAML

#include "scan_policy.h"
#include "core/http_message.h"
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace config {

using json = nlohmann::json;

static AttackStrength strength_from(const std::string& value) {
    auto parsed = parse_attack_strength(http::to_lower(http::trim(value)));
    if (!parsed) throw std::invalid_argument("Unknown attack strength: " + value);
    return *parsed;
}

static AlertThreshold threshold_from(const std::string& value) {
    auto parsed = parse_alert_threshold(http::to_lower(http::trim(value)));
    if (!parsed) throw std::invalid_argument("Unknown alert threshold: " + value);
    return *parsed;
}

static int rule_id_from(const std::string& key) {
    if (key.empty() || key.size() > 9 || key.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("Rule ids must be numeric: " + key);
    }
    return std::stoi(key);
}

static TechSet techs_from(const std::vector<std::string>& names) {
    TechSet techs;
    for (const auto& name : names) {
        if (http::iequals(name, "all")) return TechSet::all();
        if (!name.empty()) techs.add(name);
    }
    return techs;
}

ScanPolicy ScanPolicy::from_json(const json& j) {
    ScanPolicy p;
    if (j.contains("attack_strength")) p.attack_strength = strength_from(j["attack_strength"].get<std::string>());
    if (j.contains("alert_threshold")) p.alert_threshold = threshold_from(j["alert_threshold"].get<std::string>());
    p.worker_threads = j.value("worker_threads", p.worker_threads);

    if (j.contains("technologies")) {
        const auto& t = j["technologies"];
        if (t.is_string()) {
            p.technologies = techs_from({t.get<std::string>()});
        } else {
            p.technologies = techs_from(t.get<std::vector<std::string>>());
        }
    }

    if (j.contains("rules")) {
        for (auto& [key, value] : j["rules"].items()) {
            RuleOverride o;
            if (value.contains("attack_strength")) o.strength = strength_from(value["attack_strength"].get<std::string>());
            if (value.contains("strength")) o.strength = strength_from(value["strength"].get<std::string>());
            if (value.contains("threshold")) o.threshold = threshold_from(value["threshold"].get<std::string>());
            if (value.contains("alert_threshold")) o.threshold = threshold_from(value["alert_threshold"].get<std::string>());
            p.rules[rule_id_from(key)] = o;
        }
    }

    if (j.contains("diagnostics")) {
        const auto& d = j["diagnostics"];
        p.diagnostics.enabled = d.value("enabled", false);
        p.diagnostics.username = d.value("username", "");
        p.diagnostics.password = d.value("password", "");
    }
    return p;
}

static std::string unquote(std::string value) {
    value = http::trim(value);
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

static bool parse_bool(const std::string& value) {
    std::string v = http::to_lower(value);
    return v == "true" || v == "yes" || v == "on" || v == "1";
}

// Split an inline list like "[a, b]" or "a, b"
static std::vector<std::string> split_list(std::string value) {
    value = http::trim(value);
    if (!value.empty() && value.front() == '[' && value.back() == ']') {
        value = value.substr(1, value.size() - 2);
    }
    std::vector<std::string> items;
    std::istringstream iss(value);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = unquote(item);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

static void apply_yaml_value(ScanPolicy& p, const std::string& key, const std::string& value,
                             std::vector<std::string>& tech_names) {
    if (key == "attack_strength") {
        p.attack_strength = strength_from(value);
    } else if (key == "alert_threshold") {
        p.alert_threshold = threshold_from(value);
    } else if (key == "worker_threads") {
        try {
            p.worker_threads = std::stoi(value);
        } catch (const std::exception&) {
            std::cerr << "Warning: invalid worker_threads value: " << value << "\n";
        }
    } else if (key == "technologies") {
        auto items = split_list(value);
        tech_names.insert(tech_names.end(), items.begin(), items.end());
    } else if (key == "diagnostics.enabled") {
        p.diagnostics.enabled = parse_bool(value);
    } else if (key == "diagnostics.username") {
        p.diagnostics.username = value;
    } else if (key == "diagnostics.password") {
        p.diagnostics.password = value;
    } else if (http::starts_with(key, "rules.")) {
        // rules.<id>.<field>
        std::string rest = key.substr(6);
        size_t dot = rest.find('.');
        if (dot == std::string::npos) return;
        int id = rule_id_from(rest.substr(0, dot));
        std::string field = rest.substr(dot + 1);
        if (field == "threshold" || field == "alert_threshold") {
            p.rules[id].threshold = threshold_from(value);
        } else if (field == "strength" || field == "attack_strength") {
            p.rules[id].strength = strength_from(value);
        }
    }
}

ScanPolicy ScanPolicy::from_yaml(const std::string& yaml) {
    ScanPolicy p;
    std::vector<std::string> tech_names;
    bool saw_technologies = false;

    // (indent, key) of the enclosing sections
    std::vector<std::pair<size_t, std::string>> sections;

    std::istringstream in(yaml);
    std::string line;
    while (std::getline(in, line)) {
        size_t comment = line.find(" #");
        if (!line.empty() && line[0] == '#') comment = 0;
        if (comment != std::string::npos) line = line.substr(0, comment);
        if (http::trim(line).empty()) continue;

        size_t indent = line.find_first_not_of(' ');
        std::string content = http::trim(line);
        while (!sections.empty() && sections.back().first >= indent) {
            sections.pop_back();
        }
        std::string prefix;
        for (const auto& s : sections) prefix += s.second + ".";

        if (content[0] == '-') {
            // List item under the current section
            if (prefix == "technologies.") {
                tech_names.push_back(unquote(content.substr(1)));
            }
            continue;
        }

        size_t colon = content.find(':');
        if (colon == std::string::npos) continue;
        std::string key = prefix + unquote(content.substr(0, colon));
        std::string value = unquote(content.substr(colon + 1));

        if (key == "technologies") saw_technologies = true;
        if (value.empty()) {
            sections.emplace_back(indent, unquote(content.substr(0, colon)));
            continue;
        }
        apply_yaml_value(p, key, value, tech_names);
    }

    if (saw_technologies) {
        p.technologies = techs_from(tech_names);
    }
    return p;
}

ScanPolicy ScanPolicy::load(const std::string& policy_path) {
    std::ifstream in(policy_path);
    if (!in.is_open()) {
        std::cerr << "Warning: Could not open policy file " << policy_path << ", using defaults\n";
        return get_default();
    }

    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());

    // Try parsing as JSON first
    json j = json::parse(content, nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
        return from_json(j);
    }
    return from_yaml(content);
}

AttackStrength ScanPolicy::strength_for(int rule_id) const {
    auto it = rules.find(rule_id);
    if (it != rules.end() && it->second.strength) return *it->second.strength;
    return attack_strength;
}

AlertThreshold ScanPolicy::threshold_for(int rule_id) const {
    auto it = rules.find(rule_id);
    if (it != rules.end() && it->second.threshold) return *it->second.threshold;
    return alert_threshold;
}

} // namespace config
