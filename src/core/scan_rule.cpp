// Default behaviour shared by scan rules

#include "scan_rule.h"

bool ScanContext::send(Transaction& msg, bool follow_redirects) {
    if (is_stopped()) {
        return false;
    }
    messages_sent_++;
    return transport_.send(msg, follow_redirects);
}

std::vector<Alert> PassiveScanRule::inspect_request(const Transaction&) const {
    return {};
}

std::vector<Alert> PassiveScanRule::inspect_response(const Transaction&) const {
    return {};
}

bool ActiveScanRule::applicable(const TechSet& techs) const {
    const auto& declared = metadata().technologies;
    if (declared.empty()) return true;
    for (const auto& tech : declared) {
        if (techs.includes(tech)) return true;
    }
    return false;
}
