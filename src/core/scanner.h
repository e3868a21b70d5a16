#pragma once
#include "rule_registry.h"
#include "config/scan_policy.h"
#include <atomic>
#include <mutex>
#include <vector>

// Drives the registered rules over a batch of transactions.
// Passive rules run on a pool of worker threads; active rules run one base
// transaction at a time and honour a shared stop flag. Alerts are delivered
// to the sink one at a time.

class Scanner {
public:
    /**
     * @brief Create a scanner over a registry
     * @param registry Rules to run; must outlive the scanner
     * @param policy Strength, threshold, technologies and worker count
     */
    Scanner(const RuleRegistry& registry, const config::ScanPolicy& policy);

    /**
     * @brief Set where alerts are delivered; calls are serialized
     */
    void set_sink(AlertSink sink) { sink_ = std::move(sink); }

    /**
     * @brief Run passive rules over both sides of every transaction
     * @param batch Captured transactions
     * @return Number of alerts raised
     */
    size_t scan_passive(const std::vector<Transaction>& batch);

    /**
     * @brief Run active rules against every base transaction
     * @param bases Transactions to derive attacks from
     * @param transport Network access for the attacks
     * @return Number of alerts raised
     */
    size_t scan_active(const std::vector<Transaction>& bases, Transport& transport);

    /**
     * @brief Ask running scans to stop at the next send or transaction boundary
     */
    void stop() { stop_ = true; }
    bool is_stopped() const { return stop_.load(); }

    int messages_sent() const { return messages_sent_.load(); }

private:
    const RuleRegistry& registry_;
    config::ScanPolicy policy_;
    AlertSink sink_;
    std::mutex sink_mutex_;
    std::atomic<bool> stop_{false};
    std::atomic<int> messages_sent_{0};

    size_t emit(const std::vector<Alert>& alerts);
    size_t inspect(const Transaction& msg);
};
