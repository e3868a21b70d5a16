#pragma once
#include "core/scan_rule.h"
#include <optional>

// Detects Java serialized objects (magic bytes AC ED 00 05) carried in
// headers, cookies, parameters or bodies, raw or base64/URL encoded.

class JavaSerializedObjectRule : public PassiveScanRule {
public:
    JavaSerializedObjectRule();

    const RuleMetadata& metadata() const override { return meta_; }
    std::vector<Alert> example_alerts() const override;

    std::vector<Alert> inspect_request(const Transaction& msg) const override;
    std::vector<Alert> inspect_response(const Transaction& msg) const override;

    /**
     * @brief Check whether a candidate carries the serialization magic
     *
     * Tries the candidate raw, base64 decoded, percent decoded, and percent
     * decoded then transcoded from UTF-8 to ISO-8859-1.
     *
     * @param candidate Text or bytes taken from the message
     * @return true if any decoding starts with AC ED 00 05
     */
    static bool carries_serialized_object(const std::string& candidate);

private:
    struct Match {
        std::string param;
        std::string evidence;
    };

    RuleMetadata meta_;

    std::optional<Match> find_in_request(const Transaction& msg) const;
    std::optional<Match> find_in_response(const Transaction& msg) const;
    Alert build_alert(const Match& match, const std::string& uri) const;
};
