#include "fwdproxy/monitor/RateLimiter.h"
#include "fwdproxy/common/Logger.h"

#include <algorithm>
#include <functional>
#include <sstream>

namespace fwdproxy {
namespace monitor {

RateLimiter::RateLimiter(Config cfg) : cfg_(cfg) {
    if (cfg_.maxRequests < 1) cfg_.maxRequests = 1;
    if (cfg_.windowSec <= 0.0) cfg_.windowSec = 10.0;
    if (cfg_.shards == 0) cfg_.shards = 1;
    if (cfg_.staleWindows < 1) cfg_.staleWindows = 1;
    if (cfg_.maxEntries == 0) cfg_.maxEntries = 1;
    if (cfg_.sweepEvery == 0) cfg_.sweepEvery = 1;

    window_ = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(cfg_.windowSec));
    staleAfter_ = window_ * cfg_.staleWindows;
    perShardCap_ = std::max<size_t>(1, cfg_.maxEntries / cfg_.shards);

    std::ostringstream os;
    os << cfg_.maxRequests << " requests per " << cfg_.windowSec << "s";
    reason_ = os.str();

    shards_.reserve(cfg_.shards);
    for (size_t i = 0; i < cfg_.shards; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

RateLimiter::Shard& RateLimiter::ShardFor(const std::string& ip) {
    return *shards_[std::hash<std::string>()(ip) % shards_.size()];
}

AccessDecision RateLimiter::Admit(const std::string& ip) {
    return Admit(ip, Clock::now());
}

AccessDecision RateLimiter::Admit(const std::string& ip, Clock::time_point now) {
    Shard& shard = ShardFor(ip);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.calls++;

    bool ok = true;
    auto it = shard.map.find(ip);
    if (it == shard.map.end() || now - it->second.start >= window_) {
        Window& w = shard.map[ip];
        w.start = now;
        w.lastSeen = now;
        w.count = 1;
    } else {
        Window& w = it->second;
        w.lastSeen = now;
        // Saturate just past the limit; the window is already exhausted.
        if (w.count <= cfg_.maxRequests) w.count++;
        ok = w.count <= cfg_.maxRequests;
    }

    if ((shard.calls % cfg_.sweepEvery) == 0) {
        SweepLocked(shard, now);
        EnforceCapLocked(shard);
    } else if (shard.map.size() > perShardCap_) {
        SweepLocked(shard, now);
        EnforceCapLocked(shard);
    }

    return ok ? AccessDecision::Allowed() : AccessDecision::RateLimited(reason_);
}

size_t RateLimiter::SweepLocked(Shard& shard, Clock::time_point now) {
    size_t removed = 0;
    for (auto it = shard.map.begin(); it != shard.map.end();) {
        if (now - it->second.lastSeen >= staleAfter_) {
            it = shard.map.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void RateLimiter::EnforceCapLocked(Shard& shard) {
    size_t evicted = 0;
    while (shard.map.size() > perShardCap_) {
        auto oldest = std::min_element(shard.map.begin(), shard.map.end(), [](const auto& a, const auto& b) {
            return a.second.lastSeen < b.second.lastSeen;
        });
        shard.map.erase(oldest);
        ++evicted;
    }
    if (evicted > 0) {
        LOG_DEBUG << "RateLimiter evicted " << evicted << " entries over shard cap " << perShardCap_;
    }
}

size_t RateLimiter::Sweep(Clock::time_point now) {
    size_t removed = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        removed += SweepLocked(*shard, now);
    }
    return removed;
}

size_t RateLimiter::Size() const {
    size_t n = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        n += shard->map.size();
    }
    return n;
}

} // namespace monitor
} // namespace fwdproxy
