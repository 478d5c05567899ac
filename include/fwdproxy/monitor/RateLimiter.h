#pragma once

#include "fwdproxy/monitor/AccessDecision.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fwdproxy {
namespace monitor {

// Thread-safe fixed window limiter keyed by client IP. At most maxRequests
// admits per window; a window restarts once now - start >= window. Keys are
// spread over independently locked shards so unrelated clients never
// contend on one mutex.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    struct Config {
        int maxRequests{100};
        double windowSec{10.0};
        size_t shards{16};
        int staleWindows{6};        // idle this many windows -> reclaimable
        size_t maxEntries{100000};  // hard cap across all shards
        size_t sweepEvery{256};     // sweep a shard every N admits on it
    };

    explicit RateLimiter(Config cfg);

    AccessDecision Admit(const std::string& ip);
    AccessDecision Admit(const std::string& ip, Clock::time_point now);

    // Drops stale entries from every shard. Returns how many were removed.
    size_t Sweep(Clock::time_point now);

    // For tests/observability.
    size_t Size() const;
    const Config& config() const { return cfg_; }

private:
    struct Window {
        Clock::time_point start;
        Clock::time_point lastSeen;
        int count{0};
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, Window> map;
        size_t calls{0};
    };

    Shard& ShardFor(const std::string& ip);
    size_t SweepLocked(Shard& shard, Clock::time_point now);
    void EnforceCapLocked(Shard& shard);

    Config cfg_;
    Clock::duration window_;
    Clock::duration staleAfter_;
    size_t perShardCap_;
    std::string reason_;
    std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace monitor
} // namespace fwdproxy
