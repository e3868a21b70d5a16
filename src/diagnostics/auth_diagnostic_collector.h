#pragma once
#include <schema/transaction.h>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace diagnostics {

// Who caused a transaction to be sent. Only traffic passing through the
// proxy (i.e. driven by a real browser) is transcribed.
enum class Initiator {
    PROXY,
    ACTIVE_SCANNER,
    SPIDER,
    MANUAL_REQUEST,
    OTHER
};

using LogSink = std::function<void(const std::string&)>;

// Renders redacted transcripts of authentication traffic.
//
// Hosts become "https://exampleN/" and every other literal (tokens, cookie
// values, body strings) becomes "sanitizedtokenN", numbered in first-seen
// order and stable until reset(). The registered username and password map
// to fixed fake values so a leaked secret is easy to spot.
//
// All pseudonym state lives behind one mutex, so responses may be reported
// from several threads at once.
class AuthDiagnosticCollector {
public:
    AuthDiagnosticCollector() = default;

    /**
     * @brief Transcribe one received response if diagnostics apply to it
     * @param tx Completed transaction
     * @param initiator Origin of the transaction; only PROXY is transcribed
     */
    void on_response_received(const Transaction& tx, Initiator initiator);

    /**
     * @brief Build the redacted transcript of a transaction
     * @param tx Completed transaction
     * @return Transcript block starting with ">>>>>"
     */
    std::string render(const Transaction& tx);

    /**
     * @brief Enable or disable collection; disabling also forgets the credentials and every pseudonym
     */
    void set_enabled(bool enabled);
    bool is_enabled() const;

    void set_sink(LogSink sink);
    void set_username(const std::string& username);
    void set_password(const std::string& password);

    /**
     * @brief Forget every pseudonym and restart both counters at 0
     */
    void reset();

    /**
     * @brief Stable pseudonym for a host, e.g. "https://example0/"
     */
    std::string sanitized_host(const std::string& host);

    /**
     * @brief Stable pseudonym for a token, or the fake credential for the registered username/password
     */
    std::string sanitized_token(const std::string& token);

    /**
     * @brief Replace every string leaf of a JSON value with its token pseudonym
     */
    nlohmann::json sanitize_json(const nlohmann::json& value);

private:
    mutable std::mutex mutex_;
    bool enabled_ = false;
    LogSink sink_;

    std::optional<std::string> username_;
    std::optional<std::string> password_;

    std::map<std::string, std::string> host_map_;
    int host_id_ = 0;
    std::map<std::string, std::string> token_map_;
    int token_id_ = 0;

    std::string host_key(const Transaction& tx) const;
    void append_authorization(const HeaderList& headers, std::string& out);
    void append_cookies(const Transaction& tx, bool request, std::string& out);
    void append_body(const Transaction& tx, bool request, std::string& out);
};

} // namespace diagnostics
