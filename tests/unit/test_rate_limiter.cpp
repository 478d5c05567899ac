#include "fwdproxy/monitor/RateLimiter.h"
#include "fwdproxy/common/Logger.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using fwdproxy::monitor::AccessDecision;
using fwdproxy::monitor::RateLimiter;

int main() {
    fwdproxy::common::Logger::Instance().SetLevel(fwdproxy::common::LogLevel::ERROR);
    const auto t0 = RateLimiter::Clock::now();
    const auto sec = [t0](double s) {
        return t0 + std::chrono::duration_cast<RateLimiter::Clock::duration>(std::chrono::duration<double>(s));
    };

    // N per window, then denied until the window restarts.
    {
        RateLimiter::Config cfg;
        cfg.maxRequests = 3;
        cfg.windowSec = 10.0;
        RateLimiter lim(cfg);

        assert(lim.Admit("10.0.0.1", sec(0)).allowed());
        assert(lim.Admit("10.0.0.1", sec(1)).allowed());
        assert(lim.Admit("10.0.0.1", sec(2)).allowed());
        AccessDecision d = lim.Admit("10.0.0.1", sec(3));
        assert(d.kind == AccessDecision::Kind::kRateLimited);
        assert(d.reason == "3 requests per 10s");
        assert(!lim.Admit("10.0.0.1", sec(9.9)).allowed());

        // Other clients are independent.
        assert(lim.Admit("10.0.0.2", sec(3)).allowed());

        // now - start >= W starts a new window.
        assert(lim.Admit("10.0.0.1", sec(10)).allowed());
        assert(lim.Admit("10.0.0.1", sec(11)).allowed());
    }

    // Default reason text.
    {
        RateLimiter lim(RateLimiter::Config{});
        for (int i = 0; i < 100; ++i) assert(lim.Admit("192.0.2.1", sec(0)).allowed());
        assert(lim.Admit("192.0.2.1", sec(0)).reason == "100 requests per 10s");
    }

    // Stale entries are swept.
    {
        RateLimiter::Config cfg;
        cfg.maxRequests = 5;
        cfg.windowSec = 1.0;
        cfg.staleWindows = 2;
        RateLimiter lim(cfg);
        lim.Admit("a", sec(0));
        lim.Admit("b", sec(0));
        lim.Admit("c", sec(1.5));
        assert(lim.Size() == 3);
        assert(lim.Sweep(sec(2.5)) == 2);
        assert(lim.Size() == 1);
    }

    // Hard cap on tracked keys.
    {
        RateLimiter::Config cfg;
        cfg.maxRequests = 10;
        cfg.shards = 1;
        cfg.maxEntries = 2;
        RateLimiter lim(cfg);
        assert(lim.Admit("A", sec(0)).allowed());
        assert(lim.Admit("B", sec(1)).allowed());
        assert(lim.Admit("C", sec(2)).allowed());
        assert(lim.Size() <= 2);
    }

    // Concurrent admits on one key never exceed the limit.
    {
        RateLimiter::Config cfg;
        cfg.maxRequests = 50;
        cfg.windowSec = 3600.0;
        RateLimiter lim(cfg);
        std::atomic<int> allowed{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&]() {
                for (int i = 0; i < 100; ++i) {
                    if (lim.Admit("198.51.100.7").allowed()) allowed.fetch_add(1);
                }
            });
        }
        for (auto& th : threads) th.join();
        assert(allowed.load() == 50);
    }

    return 0;
}
