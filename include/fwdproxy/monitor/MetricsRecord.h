#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace fwdproxy {
namespace monitor {

// One per terminal session outcome other than a blocked host.
struct MetricsRecord {
    std::chrono::system_clock::time_point timestamp;
    std::string clientIp;
    uint16_t clientPort{0};
    std::string targetHost;
    uint16_t targetPort{0};
    std::string method;
    bool tunnel{false};
    std::string rawHeader;
    // Plain HTTP only: the rewritten head sent upstream and the first
    // 64 KiB of what came back.
    std::string upstreamHeader;
    std::string responsePreview;
    // Status line sent by the proxy, or relayed from upstream.
    std::string outcome;
    std::string terminalState;
    std::string error;
    long long bytesSent{0};          // to client
    long long bytesReceived{0};      // from client
    long long upstreamBytesSent{0};
    long long upstreamBytesReceived{0};
    double durationSec{0.0};
    double ttfbSec{-1.0};            // negative when no first byte was seen
};

struct BlockedEvent {
    std::chrono::system_clock::time_point timestamp;
    std::string blockedHost;
    std::string clientIp;
    std::string pattern;
};

// RFC 8259 string escaping, without the surrounding quotes.
std::string JsonEscape(const std::string& s);

// ISO-8601 local time with milliseconds.
std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

} // namespace monitor
} // namespace fwdproxy
