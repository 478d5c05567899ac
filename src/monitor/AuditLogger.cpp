#include "fwdproxy/monitor/AuditLogger.h"
#include "fwdproxy/common/Logger.h"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <cstring>

namespace fwdproxy {
namespace monitor {

AuditLogger::AuditLogger(const std::string& path)
    : path_(path), fd_(-1), written_(0), dropped_(0) {
    if (path_.empty()) return;
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        LOG_ERROR << "AuditLogger cannot open " << path_ << ": " << std::strerror(errno);
    }
}

AuditLogger::~AuditLogger() {
    if (fd_ >= 0) ::close(fd_);
}

void AuditLogger::AppendLine(const std::string& line) {
    if (fd_ < 0) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    scratch_.assign(line);
    scratch_.push_back('\n');

    const char* p = scratch_.data();
    size_t left = scratch_.size();
    while (left > 0) {
        const ssize_t n = ::write(fd_, p, left);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            // Warn once; later failures are only counted.
            if (dropped_.fetch_add(1, std::memory_order_relaxed) == 0) {
                LOG_WARN << "AuditLogger write to " << path_ << " failed: " << std::strerror(errno);
            }
            return;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    written_.fetch_add(1, std::memory_order_relaxed);
}

} // namespace monitor
} // namespace fwdproxy
