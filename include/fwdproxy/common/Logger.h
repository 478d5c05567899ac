#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace fwdproxy {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

// Line-oriented logger to stdout:
//   [time] [LEVEL] [tid] [file:line] message
// Colored when stdout is a terminal.
class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }
    LogLevel GetLevel() const { return level_.load(std::memory_order_relaxed); }
    // Case-insensitive; unknown names give INFO.
    LogLevel ParseLevel(const std::string& levelStr);

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_;
    const bool color_;
    std::mutex mutex_;
};

// Collects one message and emits it on destruction.
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}
    ~LogStream() { Logger::Instance().Log(level_, file_, line_, buf_.str()); }

    template <typename T>
    LogStream& operator<<(const T& val) {
        buf_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::ostringstream buf_;
};

} // namespace common
} // namespace fwdproxy

// The empty if-branch keeps a trailing else from binding to the macro.
#define FWDPROXY_LOG(lvl) \
    if (fwdproxy::common::LogLevel::lvl < fwdproxy::common::Logger::Instance().GetLevel()) { \
    } else \
        fwdproxy::common::LogStream(fwdproxy::common::LogLevel::lvl, __FILE__, __LINE__)

#define LOG_DEBUG FWDPROXY_LOG(DEBUG)
#define LOG_INFO  FWDPROXY_LOG(INFO)
#define LOG_WARN  FWDPROXY_LOG(WARN)
#define LOG_ERROR FWDPROXY_LOG(ERROR)
#define LOG_FATAL FWDPROXY_LOG(FATAL)
