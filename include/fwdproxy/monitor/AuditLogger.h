#pragma once

#include "fwdproxy/common/noncopyable.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace fwdproxy {
namespace monitor {

// Append-only line file shared by every I/O thread. Each line goes out in a
// single write(2) on an O_APPEND descriptor, so lines never interleave.
class AuditLogger : fwdproxy::common::noncopyable {
public:
    explicit AuditLogger(const std::string& path);
    ~AuditLogger();

    bool ok() const { return fd_ >= 0; }
    const std::string& path() const { return path_; }

    // line excludes the trailing newline.
    void AppendLine(const std::string& line);

    uint64_t linesWritten() const { return written_.load(std::memory_order_relaxed); }
    uint64_t linesDropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    const std::string path_;
    int fd_;
    std::mutex mutex_;
    std::string scratch_;
    std::atomic<uint64_t> written_;
    std::atomic<uint64_t> dropped_;
};

} // namespace monitor
} // namespace fwdproxy
