#include "fwdproxy/ProxyOptions.h"
#include "fwdproxy/common/Config.h"
#include "fwdproxy/common/Logger.h"
#include "fwdproxy/monitor/AccessPolicy.h"

#include <algorithm>

namespace fwdproxy {

namespace {

template <typename T>
T ClampWarn(const char* key, T value, T lo, T hi) {
    if (value < lo || value > hi) {
        const T clamped = std::min(std::max(value, lo), hi);
        LOG_WARN << "config " << key << "=" << value << " out of range, using " << clamped;
        return clamped;
    }
    return value;
}

double PositiveOr(const char* key, double value, double fallback) {
    if (value > 0.0) return value;
    LOG_WARN << "config " << key << "=" << value << " must be positive, using " << fallback;
    return fallback;
}

} // namespace

ProxyOptions ProxyOptions::FromConfig(common::Config& conf) {
    ProxyOptions o;

    o.listenPort = static_cast<uint16_t>(
        ClampWarn("global.listen_port", conf.GetInt("global", "listen_port", o.listenPort), 1, 65535));
    o.threads = ClampWarn("global.threads", conf.GetInt("global", "threads", o.threads), 0, 256);
    o.reusePort = conf.GetInt("global", "reuse_port", 0) != 0;
    o.logLevel = conf.GetString("global", "log_level", o.logLevel);

    if (conf.HasKey("blocklist", "patterns")) {
        o.blockPatterns = conf.GetList("blocklist", "patterns");
    }
    o.blocklistFile = conf.GetString("blocklist", "file", "");
    if (!o.blocklistFile.empty()) {
        std::vector<std::string> fromFile;
        if (monitor::AccessPolicy::LoadPatternFile(o.blocklistFile, &fromFile)) {
            o.blockPatterns.insert(o.blockPatterns.end(), fromFile.begin(), fromFile.end());
            LOG_INFO << "Loaded " << fromFile.size() << " block patterns from " << o.blocklistFile;
        }
    }

    monitor::RateLimiter::Config& rl = o.rateLimit;
    rl.maxRequests = ClampWarn("rate_limit.max_requests", conf.GetInt("rate_limit", "max_requests", rl.maxRequests),
                               1, 1000000000);
    rl.windowSec = PositiveOr("rate_limit.window_sec", conf.GetDouble("rate_limit", "window_sec", rl.windowSec), 10.0);
    rl.shards = static_cast<size_t>(
        ClampWarn("rate_limit.shards", conf.GetInt("rate_limit", "shards", static_cast<int>(rl.shards)), 1, 4096));
    rl.staleWindows = ClampWarn("rate_limit.stale_windows",
                                conf.GetInt("rate_limit", "stale_windows", rl.staleWindows), 1, 1000000);
    rl.maxEntries = static_cast<size_t>(ClampWarn(
        "rate_limit.max_entries", conf.GetInt("rate_limit", "max_entries", static_cast<int>(rl.maxEntries)),
        1, 100000000));

    o.connectTimeoutSec = PositiveOr("timeouts.connect_sec",
                                     conf.GetDouble("timeouts", "connect_sec", o.connectTimeoutSec), 5.0);
    o.headerReadTimeoutSec = PositiveOr("timeouts.header_read_sec",
                                        conf.GetDouble("timeouts", "header_read_sec", o.headerReadTimeoutSec), 10.0);
    o.tunnelIdleSec = PositiveOr("timeouts.tunnel_idle_sec",
                                 conf.GetDouble("timeouts", "tunnel_idle_sec", o.tunnelIdleSec), 60.0);
    o.responseIdleSec = PositiveOr("timeouts.response_idle_sec",
                                   conf.GetDouble("timeouts", "response_idle_sec", o.responseIdleSec), 30.0);
    o.lingerSec = PositiveOr("timeouts.linger_sec", conf.GetDouble("timeouts", "linger_sec", o.lingerSec), 5.0);

    o.maxHeaderBytes = static_cast<size_t>(ClampWarn(
        "limits.max_header_bytes", conf.GetInt("limits", "max_header_bytes", static_cast<int>(o.maxHeaderBytes)),
        256, 1024 * 1024));

    o.maxConnections = ClampWarn("connection_limit.max_total",
                                 conf.GetInt("connection_limit", "max_total", 0), 0, 10000000);
    o.maxConnectionsPerIp = ClampWarn("connection_limit.max_per_ip",
                                      conf.GetInt("connection_limit", "max_per_ip", 0), 0, 10000000);

    o.metricsLog = conf.GetInt("metrics", "log", 1) != 0;
    o.metricsJsonlPath = conf.GetString("metrics", "jsonl_path", "");
    o.statsLogIntervalSec = std::max(0.0, conf.GetDouble("stats", "log_interval_sec", 0.0));

    o.tlsEnable = conf.GetInt("tls", "enable", 0) != 0;
    o.tlsCertPath = conf.GetString("tls", "cert_path", "");
    o.tlsKeyPath = conf.GetString("tls", "key_path", "");
    return o;
}

} // namespace fwdproxy
