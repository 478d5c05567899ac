#pragma once

#include "fwdproxy/monitor/RateLimiter.h"

#include <cstdint>
#include <string>
#include <vector>

namespace fwdproxy {

namespace common {
class Config;
}

// Static configuration snapshot consumed at startup.
struct ProxyOptions {
    uint16_t listenPort{8080};   // 0 picks an ephemeral port
    bool loopbackOnly{false};
    int threads{4};
    bool reusePort{false};
    std::string logLevel{"INFO"};

    std::vector<std::string> blockPatterns{"*.youtube.com", "*.ytimg.com", "*.googlevideo.com"};
    std::string blocklistFile;

    monitor::RateLimiter::Config rateLimit;

    double connectTimeoutSec{5.0};
    double headerReadTimeoutSec{10.0};
    double tunnelIdleSec{60.0};
    double responseIdleSec{30.0};
    double lingerSec{5.0};
    size_t maxHeaderBytes{16384};
    size_t relayHighWaterMark{1024 * 1024};

    int maxConnections{0};
    int maxConnectionsPerIp{0};

    bool metricsLog{true};
    std::string metricsJsonlPath;
    double statsLogIntervalSec{0.0};

    bool tlsEnable{false};
    std::string tlsCertPath;
    std::string tlsKeyPath;

    // Reads the [global], [blocklist], [rate_limit], [timeouts], [limits],
    // [connection_limit], [metrics], [stats] and [tls] sections.
    // Unparsable numbers keep the default, out-of-range ones are clamped.
    // Patterns from blocklist.file are appended to blocklist.patterns.
    static ProxyOptions FromConfig(common::Config& conf);
};

} // namespace fwdproxy
