#pragma once

#include "fwdproxy/monitor/MetricsRecord.h"

#include <memory>
#include <string>
#include <vector>

namespace fwdproxy {
namespace monitor {

class AuditLogger;

// Receives exactly one event per finished session. Called concurrently
// from every I/O loop; implementations must be thread-safe and must not
// block for long.
class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    virtual void OnRequest(const MetricsRecord& record) = 0;
    virtual void OnBlocked(const BlockedEvent& event) = 0;
};

using MetricsSinkPtr = std::shared_ptr<MetricsSink>;

// One logger line per event.
class LogMetricsSink : public MetricsSink {
public:
    void OnRequest(const MetricsRecord& record) override;
    void OnBlocked(const BlockedEvent& event) override;
};

// One JSON object per line, appended to a file.
class JsonLinesMetricsSink : public MetricsSink {
public:
    explicit JsonLinesMetricsSink(const std::string& path);
    ~JsonLinesMetricsSink() override;

    bool ok() const;

    void OnRequest(const MetricsRecord& record) override;
    void OnBlocked(const BlockedEvent& event) override;

    static std::string ToJsonLine(const MetricsRecord& record);
    static std::string ToJsonLine(const BlockedEvent& event);

private:
    std::unique_ptr<AuditLogger> out_;
};

class FanoutMetricsSink : public MetricsSink {
public:
    void Add(MetricsSinkPtr sink);
    size_t size() const { return sinks_.size(); }

    void OnRequest(const MetricsRecord& record) override;
    void OnBlocked(const BlockedEvent& event) override;

private:
    std::vector<MetricsSinkPtr> sinks_;
};

} // namespace monitor
} // namespace fwdproxy
