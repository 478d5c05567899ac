#pragma once

#include "fwdproxy/monitor/MetricsRecord.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace fwdproxy {
namespace monitor {

// Process-wide counters. Plain counters are lock-free; per-host aggregates
// sit behind one mutex and are bounded (overflow goes to "OTHER").
class Stats {
public:
    static Stats& Instance();

    struct HostAggregate {
        unsigned long long requests{0};
        long long bytesSent{0};
        long long bytesReceived{0};
        double totalDurationSec{0.0};
        double totalTtfbSec{0.0};
        unsigned long long ttfbSamples{0};
    };

    static constexpr size_t kMaxHostKeys = 1024;

    // Client-facing byte totals, added once per finished session.
    void AddBytesIn(long long n) { bytesIn_.fetch_add(n, std::memory_order_relaxed); }
    void AddBytesOut(long long n) { bytesOut_.fetch_add(n, std::memory_order_relaxed); }
    long long GetBytesIn() const { return bytesIn_.load(std::memory_order_relaxed); }
    long long GetBytesOut() const { return bytesOut_.load(std::memory_order_relaxed); }

    void AddConnectionRejected() { connectionsRejected_.fetch_add(1, std::memory_order_relaxed); }
    long GetConnectionsRejected() const { return connectionsRejected_.load(std::memory_order_relaxed); }

    void IncActiveSessions() {
        totalSessions_.fetch_add(1, std::memory_order_relaxed);
        activeSessions_.fetch_add(1, std::memory_order_relaxed);
    }
    void DecActiveSessions() { activeSessions_.fetch_sub(1, std::memory_order_relaxed); }
    long GetActiveSessions() const { return activeSessions_.load(std::memory_order_relaxed); }
    long GetTotalSessions() const { return totalSessions_.load(std::memory_order_relaxed); }

    void IncUpstreamConnects() { upstreamConnects_.fetch_add(1, std::memory_order_relaxed); }
    long GetUpstreamConnects() const { return upstreamConnects_.load(std::memory_order_relaxed); }

    // Counts the outcome by terminal state and error, and folds the record
    // into its target host's aggregate.
    void RecordRequest(const MetricsRecord& record);
    void RecordBlocked(const BlockedEvent& event);

    long GetOutcomeCount(const std::string& terminalState) const;
    long GetErrorCount(const std::string& error) const;
    std::optional<HostAggregate> GetHost(const std::string& host) const;

    std::string ToJson() const;

private:
    Stats();

    std::atomic<long long> bytesIn_{0};
    std::atomic<long long> bytesOut_{0};
    std::atomic<long> connectionsRejected_{0};
    std::atomic<long> totalSessions_{0};
    std::atomic<long> activeSessions_{0};
    std::atomic<long> upstreamConnects_{0};
    std::chrono::system_clock::time_point startTime_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, long> outcomes_;
    std::unordered_map<std::string, long> errors_;
    std::unordered_map<std::string, HostAggregate> hosts_;
    std::unordered_map<std::string, unsigned long long> blockedHosts_;
};

} // namespace monitor
} // namespace fwdproxy
