#include "core/http_client.h"
#include "core/rule_registry.h"
#include "core/scanner.h"
#include "config/scan_policy.h"
#include "diagnostics/auth_diagnostic_collector.h"
#include "har/har_reader.h"
#include "logging/chain.h"
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>

/**
 * @brief Generates a unique identifier for a program run based on current UTC datetime
 * @return A string representing the run identifier
 */
std::string generate_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::ostringstream oss;
    oss << "run_" << std::put_time(std::gmtime(&time_t), "%Y%m%d_%H%M%S");
    return oss.str();
}

struct ScanArgs {
    std::string har_path;
    std::string policy_path;
    std::string out_path;
    std::string journal_path;
};

/**
 * @brief Parse the flags shared by the passive and active commands
 * @return false if an unknown flag was given or --har is missing
 */
static bool parse_scan_args(int argc, char** argv, ScanArgs& args) {
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--har" && i + 1 < argc) {
            args.har_path = argv[++i];
        } else if (arg == "--policy" && i + 1 < argc) {
            args.policy_path = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            args.out_path = argv[++i];
        } else if (arg == "--journal" && i + 1 < argc) {
            args.journal_path = argv[++i];
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return !args.har_path.empty();
}

static bool write_alerts(const std::string& path, const std::vector<Alert>& alerts) {
    std::ofstream f(path);
    if (!f.is_open()) {
        std::cerr << "Error: could not write " << path << "\n";
        return false;
    }
    f << alerts_to_json_text(alerts) << "\n";
    return static_cast<bool>(f);
}

static void print_alert(const Alert& a) {
    std::cout << "[" << to_string(a.risk) << "] " << a.rule_id << " " << a.name << ": " << a.uri;
    if (!a.param.empty()) std::cout << " (" << a.param << ")";
    std::cout << "\n";
}

/**
 * @brief Run the passive or active rules over the transactions of a HAR file
 * @param active true to send probes through libcurl, false to only inspect
 * @return Exit code (0 on success, 1 on failure, 2 for usage errors)
 */
int run_scan(int argc, char** argv, bool active) {
    const char* command = active ? "active" : "passive";
    ScanArgs args;
    if (!parse_scan_args(argc, argv, args)) {
        std::cerr << "Usage: lookout " << command
                  << " --har FILE [--policy FILE] [--out alerts.json] [--journal FILE]\n";
        return 2;
    }

    try {
        config::ScanPolicy policy = args.policy_path.empty()
            ? config::ScanPolicy::get_default()
            : config::ScanPolicy::load(args.policy_path);
        std::vector<Transaction> transactions = har::load_file(args.har_path);
        std::cout << "Loaded " << transactions.size() << " transactions from " << args.har_path << "\n";

        std::unique_ptr<logging::ChainLogger> journal;
        if (!args.journal_path.empty()) {
            journal = std::make_unique<logging::ChainLogger>(args.journal_path, generate_run_id());
            if (!journal->is_open()) {
                return 1;
            }
            if (!journal->record_scan_start(command, transactions.size())) {
                std::cerr << "Error: could not write journal " << args.journal_path << "\n";
                return 1;
            }
        }

        RuleRegistry registry = RuleRegistry::with_default_rules();
        Scanner scanner(registry, policy);

        // The scanner serializes sink calls
        std::vector<Alert> alerts;
        scanner.set_sink([&](const Alert& a) {
            print_alert(a);
            alerts.push_back(a);
            if (journal && !journal->record_alert(a)) {
                std::cerr << "Warning: failed to journal alert " << a.rule_id << "\n";
            }
        });

        if (active) {
            HttpClient client;
            scanner.scan_active(transactions, client);
        } else {
            scanner.scan_passive(transactions);
        }

        std::cout << "Raised " << alerts.size() << " alerts";
        if (active) std::cout << " (" << scanner.messages_sent() << " requests sent)";
        std::cout << "\n";

        if (journal && !journal->record_scan_complete(alerts.size(), static_cast<size_t>(scanner.messages_sent()))) {
            std::cerr << "Warning: failed to journal scan completion\n";
        }
        if (!args.out_path.empty() && !write_alerts(args.out_path, alerts)) {
            return 1;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

/**
 * @brief Write redacted transcripts of the authentication traffic in a HAR file
 * @return Exit code (0 on success, 1 on failure, 2 for usage errors)
 */
int cmd_diagnose(int argc, char** argv) {
    std::string har_path;
    std::string policy_path;
    std::string out_path;
    std::optional<std::string> username;
    std::optional<std::string> password;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--har" && i + 1 < argc) {
            har_path = argv[++i];
        } else if (arg == "--policy" && i + 1 < argc) {
            policy_path = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            out_path = argv[++i];
        } else if (arg == "--username" && i + 1 < argc) {
            username = argv[++i];
        } else if (arg == "--password" && i + 1 < argc) {
            password = argv[++i];
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            har_path.clear();
            break;
        }
    }

    if (har_path.empty()) {
        std::cerr << "Usage: lookout diagnose --har FILE [--policy FILE] [--out FILE]"
                     " [--username U] [--password P]\n";
        return 2;
    }

    try {
        config::ScanPolicy policy = policy_path.empty()
            ? config::ScanPolicy::get_default()
            : config::ScanPolicy::load(policy_path);
        std::vector<Transaction> transactions = har::load_file(har_path);

        diagnostics::AuthDiagnosticCollector collector;
        collector.set_enabled(true);
        std::string user = username.value_or(policy.diagnostics.username);
        std::string pass = password.value_or(policy.diagnostics.password);
        if (!user.empty()) collector.set_username(user);
        if (!pass.empty()) collector.set_password(pass);

        std::string transcript;
        size_t recorded = 0;
        collector.set_sink([&](const std::string& text) {
            transcript += text;
            recorded++;
        });

        // Captured browser traffic is what the proxy would have seen
        for (const auto& tx : transactions) {
            collector.on_response_received(tx, diagnostics::Initiator::PROXY);
        }

        if (out_path.empty()) {
            std::cout << transcript;
        } else {
            std::ofstream out(out_path);
            if (!out.is_open()) {
                std::cerr << "Error: could not write " << out_path << "\n";
                return 1;
            }
            out << transcript;
            std::cout << "Recorded " << recorded << " of " << transactions.size()
                      << " transactions to " << out_path << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

/**
 * @brief Verifies the hash chain of an alert journal
 * @return Exit code (0 if intact, 1 if tampered, 2 for usage errors)
 */
int cmd_verify(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: lookout verify <journal.jsonl>\n";
        return 2;
    }

    std::string log_path = argv[2];
    std::cout << "Verifying journal: " << log_path << "\n";

    logging::VerifyResult result = logging::ChainLogger::verify(log_path);
    if (result.intact) {
        std::cout << "Journal verified: " << result.entries << " entries, chain intact\n";
        return 0;
    }
    std::cerr << "Verification failed at entry " << result.bad_entry << ": " << result.problem << "\n";
    return 1;
}

/**
 * @brief Lists the registered scan rules
 */
int cmd_rules() {
    RuleRegistry registry = RuleRegistry::with_default_rules();
    for (const auto& rule : registry.passive_rules()) {
        std::cout << std::setw(6) << rule->id() << "  passive  " << rule->name() << "\n";
    }
    for (const auto& rule : registry.active_rules()) {
        std::cout << std::setw(6) << rule->id() << "  active   " << rule->name() << "\n";
    }
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage:\n";
        std::cerr << "  lookout passive --har FILE [--policy FILE] [--out FILE] [--journal FILE]\n";
        std::cerr << "  lookout active --har FILE [--policy FILE] [--out FILE] [--journal FILE]\n";
        std::cerr << "  lookout diagnose --har FILE [--policy FILE] [--out FILE] [--username U] [--password P]\n";
        std::cerr << "  lookout verify <journal.jsonl>\n";
        std::cerr << "  lookout rules\n";
        return 2;
    }

    std::string command = argv[1];

    if (command == "passive") {
        return run_scan(argc, argv, false);
    } else if (command == "active") {
        return run_scan(argc, argv, true);
    } else if (command == "diagnose") {
        return cmd_diagnose(argc, argv);
    } else if (command == "verify") {
        return cmd_verify(argc, argv);
    } else if (command == "rules") {
        return cmd_rules();
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        return 2;
    }
}
