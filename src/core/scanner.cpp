/**
 * @file scanner.cpp
 * @brief Worker pool for passive rules and sequential driver for active rules
 */

#include "scanner.h"
#include <algorithm>
#include <thread>

Scanner::Scanner(const RuleRegistry& registry, const config::ScanPolicy& policy)
    : registry_(registry), policy_(policy) {}

size_t Scanner::emit(const std::vector<Alert>& alerts) {
    if (alerts.empty()) return 0;
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (sink_) {
        for (const auto& alert : alerts) {
            sink_(alert);
        }
    }
    return alerts.size();
}

size_t Scanner::inspect(const Transaction& msg) {
    size_t raised = 0;
    for (const auto& rule : registry_.passive_rules()) {
        if (!policy_.is_enabled(rule->id())) continue;

        raised += emit(RuleRegistry::guarded(*rule, [&]() { return rule->inspect_request(msg); }));
        if (msg.response_status != 0) {
            raised += emit(RuleRegistry::guarded(*rule, [&]() { return rule->inspect_response(msg); }));
        }
    }
    return raised;
}

size_t Scanner::scan_passive(const std::vector<Transaction>& batch) {
    if (batch.empty()) return 0;

    size_t workers = static_cast<size_t>(std::max(1, policy_.worker_threads));
    workers = std::min(workers, batch.size());

    std::atomic<size_t> next{0};
    std::atomic<size_t> raised{0};
    auto work = [&]() {
        for (size_t i = next++; i < batch.size() && !stop_; i = next++) {
            raised += inspect(batch[i]);
        }
    };

    if (workers == 1) {
        work();
        return raised;
    }

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (size_t i = 0; i < workers; i++) {
        pool.emplace_back(work);
    }
    for (auto& t : pool) {
        t.join();
    }
    return raised;
}

size_t Scanner::scan_active(const std::vector<Transaction>& bases, Transport& transport) {
    size_t raised = 0;
    for (const auto& base : bases) {
        if (stop_) break;
        for (const auto& rule : registry_.active_rules()) {
            if (stop_) break;
            if (!policy_.is_enabled(rule->id()) || !rule->applicable(policy_.technologies)) continue;

            ScanContext ctx(transport, policy_.strength_for(rule->id()), policy_.threshold_for(rule->id()), &stop_);
            raised += emit(RuleRegistry::guarded(*rule, [&]() { return rule->scan(base, ctx); }));
            messages_sent_ += ctx.messages_sent();
        }
    }
    return raised;
}
