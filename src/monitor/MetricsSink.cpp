#include "fwdproxy/monitor/MetricsSink.h"
#include "fwdproxy/monitor/AuditLogger.h"
#include "fwdproxy/common/Logger.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace fwdproxy {
namespace monitor {

std::string JsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out.push_back(hex[(c >> 4) & 0xF]);
                    out.push_back(hex[c & 0xF]);
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::tm tmv{};
    ::localtime_r(&t, &tmv);
    std::ostringstream os;
    os << std::put_time(&tmv, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms;
    return os.str();
}

namespace {

// Request line only; full heads go to the JSON sink.
std::string FirstLine(const std::string& head) {
    const size_t eol = head.find_first_of("\r\n");
    return eol == std::string::npos ? head : head.substr(0, eol);
}

} // namespace

void LogMetricsSink::OnRequest(const MetricsRecord& r) {
    std::ostringstream os;
    os << "request client=" << r.clientIp << ":" << r.clientPort
       << " target=" << r.targetHost << ":" << r.targetPort
       << " line=\"" << FirstLine(r.rawHeader) << "\""
       << " outcome=\"" << r.outcome << "\""
       << " state=" << r.terminalState;
    if (!r.error.empty()) os << " error=" << r.error;
    os << " sent=" << r.bytesSent << " received=" << r.bytesReceived
       << " up_sent=" << r.upstreamBytesSent << " up_received=" << r.upstreamBytesReceived
       << std::fixed << std::setprecision(3)
       << " duration=" << r.durationSec << "s";
    if (r.ttfbSec >= 0.0) os << " ttfb=" << r.ttfbSec << "s";
    LOG_INFO << os.str();
}

void LogMetricsSink::OnBlocked(const BlockedEvent& e) {
    LOG_INFO << "blocked host=" << e.blockedHost << " client=" << e.clientIp << " pattern=" << e.pattern;
}

JsonLinesMetricsSink::JsonLinesMetricsSink(const std::string& path)
    : out_(new AuditLogger(path)) {}

JsonLinesMetricsSink::~JsonLinesMetricsSink() = default;

bool JsonLinesMetricsSink::ok() const { return out_->ok(); }

std::string JsonLinesMetricsSink::ToJsonLine(const MetricsRecord& r) {
    std::ostringstream os;
    os << "{\"type\":\"request\""
       << ",\"timestamp\":\"" << FormatTimestamp(r.timestamp) << "\""
       << ",\"client_ip\":\"" << JsonEscape(r.clientIp) << "\""
       << ",\"client_port\":" << r.clientPort
       << ",\"target_host\":\"" << JsonEscape(r.targetHost) << "\""
       << ",\"target_port\":" << r.targetPort
       << ",\"method\":\"" << JsonEscape(r.method) << "\""
       << ",\"tunnel\":" << (r.tunnel ? "true" : "false")
       << ",\"raw_header\":\"" << JsonEscape(r.rawHeader) << "\""
       << ",\"upstream_header\":\"" << JsonEscape(r.upstreamHeader) << "\""
       << ",\"response_preview\":\"" << JsonEscape(r.responsePreview) << "\""
       << ",\"outcome\":\"" << JsonEscape(r.outcome) << "\""
       << ",\"state\":\"" << r.terminalState << "\""
       << ",\"error\":\"" << r.error << "\""
       << ",\"bytes_sent\":" << r.bytesSent
       << ",\"bytes_received\":" << r.bytesReceived
       << ",\"upstream_bytes_sent\":" << r.upstreamBytesSent
       << ",\"upstream_bytes_received\":" << r.upstreamBytesReceived
       << std::fixed << std::setprecision(6)
       << ",\"duration_sec\":" << r.durationSec;
    if (r.ttfbSec >= 0.0) {
        os << ",\"ttfb_sec\":" << r.ttfbSec;
    } else {
        os << ",\"ttfb_sec\":null";
    }
    os << "}";
    return os.str();
}

std::string JsonLinesMetricsSink::ToJsonLine(const BlockedEvent& e) {
    std::ostringstream os;
    os << "{\"type\":\"blocked\""
       << ",\"timestamp\":\"" << FormatTimestamp(e.timestamp) << "\""
       << ",\"blocked_host\":\"" << JsonEscape(e.blockedHost) << "\""
       << ",\"client_ip\":\"" << JsonEscape(e.clientIp) << "\""
       << ",\"pattern\":\"" << JsonEscape(e.pattern) << "\""
       << "}";
    return os.str();
}

void JsonLinesMetricsSink::OnRequest(const MetricsRecord& record) {
    out_->AppendLine(ToJsonLine(record));
}

void JsonLinesMetricsSink::OnBlocked(const BlockedEvent& event) {
    out_->AppendLine(ToJsonLine(event));
}

void FanoutMetricsSink::Add(MetricsSinkPtr sink) {
    if (sink) sinks_.push_back(std::move(sink));
}

void FanoutMetricsSink::OnRequest(const MetricsRecord& record) {
    for (auto& s : sinks_) s->OnRequest(record);
}

void FanoutMetricsSink::OnBlocked(const BlockedEvent& event) {
    for (auto& s : sinks_) s->OnBlocked(event);
}

} // namespace monitor
} // namespace fwdproxy
