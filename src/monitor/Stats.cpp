#include "fwdproxy/monitor/Stats.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

namespace fwdproxy {
namespace monitor {

Stats& Stats::Instance() {
    static Stats instance;
    return instance;
}

Stats::Stats() {
    startTime_ = std::chrono::system_clock::now();
}

namespace {

template <typename Map>
typename Map::mapped_type& BoundedSlot(Map& m, const std::string& key, size_t maxKeys) {
    auto it = m.find(key);
    if (it != m.end()) return it->second;
    if (m.size() >= maxKeys) return m["OTHER"];
    return m[key];
}

} // namespace

void Stats::RecordRequest(const MetricsRecord& r) {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_[r.terminalState] += 1;
    if (!r.error.empty()) errors_[r.error] += 1;

    if (r.targetHost.empty()) return;
    HostAggregate& h = BoundedSlot(hosts_, r.targetHost, kMaxHostKeys);
    h.requests += 1;
    h.bytesSent += r.bytesSent;
    h.bytesReceived += r.bytesReceived;
    h.totalDurationSec += r.durationSec;
    if (r.ttfbSec >= 0.0) {
        h.totalTtfbSec += r.ttfbSec;
        h.ttfbSamples += 1;
    }
}

void Stats::RecordBlocked(const BlockedEvent& e) {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_["BLOCKED"] += 1;
    BoundedSlot(blockedHosts_, e.blockedHost, kMaxHostKeys) += 1;
}

long Stats::GetOutcomeCount(const std::string& terminalState) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = outcomes_.find(terminalState);
    return it == outcomes_.end() ? 0 : it->second;
}

long Stats::GetErrorCount(const std::string& error) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = errors_.find(error);
    return it == errors_.end() ? 0 : it->second;
}

std::optional<Stats::HostAggregate> Stats::GetHost(const std::string& host) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = hosts_.find(host);
    if (it == hosts_.end()) return std::nullopt;
    return it->second;
}

std::string Stats::ToJson() const {
    auto now = std::chrono::system_clock::now();
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - startTime_).count();

    std::vector<std::pair<std::string, long>> outcomes;
    std::vector<std::pair<std::string, long>> errors;
    std::vector<std::pair<std::string, HostAggregate>> hosts;
    std::vector<std::pair<std::string, unsigned long long>> blocked;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outcomes.assign(outcomes_.begin(), outcomes_.end());
        errors.assign(errors_.begin(), errors_.end());
        hosts.assign(hosts_.begin(), hosts_.end());
        blocked.assign(blockedHosts_.begin(), blockedHosts_.end());
    }
    std::sort(outcomes.begin(), outcomes.end());
    std::sort(errors.begin(), errors.end());
    std::sort(hosts.begin(), hosts.end(), [](const auto& a, const auto& b) {
        if (a.second.requests != b.second.requests) return a.second.requests > b.second.requests;
        return a.first < b.first;
    });
    std::sort(blocked.begin(), blocked.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    });

    std::stringstream ss;
    ss << "{\n";
    ss << "  \"uptime_sec\": " << uptime << ",\n";
    ss << "  \"total_sessions\": " << totalSessions_.load() << ",\n";
    ss << "  \"active_sessions\": " << activeSessions_.load() << ",\n";
    ss << "  \"connections_rejected\": " << connectionsRejected_.load() << ",\n";
    ss << "  \"upstream_connects\": " << upstreamConnects_.load() << ",\n";
    ss << "  \"bytes_in\": " << bytesIn_.load() << ",\n";
    ss << "  \"bytes_out\": " << bytesOut_.load() << ",\n";

    auto dumpCounts = [&](const char* name, const std::vector<std::pair<std::string, long>>& v) {
        ss << "  \"" << name << "\": {";
        for (size_t i = 0; i < v.size(); ++i) {
            ss << (i == 0 ? "" : ", ") << "\"" << JsonEscape(v[i].first) << "\": " << v[i].second;
        }
        ss << "},\n";
    };
    dumpCounts("outcomes", outcomes);
    dumpCounts("errors", errors);

    ss << "  \"hosts\": [\n";
    for (size_t i = 0; i < hosts.size(); ++i) {
        const HostAggregate& h = hosts[i].second;
        const double avgDuration = h.requests > 0 ? h.totalDurationSec / static_cast<double>(h.requests) : 0.0;
        const double avgTtfb = h.ttfbSamples > 0 ? h.totalTtfbSec / static_cast<double>(h.ttfbSamples) : 0.0;
        ss << "    {\"host\": \"" << JsonEscape(hosts[i].first) << "\""
           << ", \"requests\": " << h.requests
           << ", \"bytes_sent\": " << h.bytesSent
           << ", \"bytes_received\": " << h.bytesReceived
           << ", \"avg_duration_sec\": " << std::fixed << std::setprecision(6) << avgDuration
           << ", \"avg_ttfb_sec\": " << avgTtfb << "}"
           << (i + 1 < hosts.size() ? "," : "") << "\n";
    }
    ss << "  ],\n";

    ss << "  \"blocked_hosts\": [\n";
    for (size_t i = 0; i < blocked.size(); ++i) {
        ss << "    {\"host\": \"" << JsonEscape(blocked[i].first) << "\", \"count\": " << blocked[i].second << "}"
           << (i + 1 < blocked.size() ? "," : "") << "\n";
    }
    ss << "  ]\n";
    ss << "}\n";
    return ss.str();
}

} // namespace monitor
} // namespace fwdproxy
