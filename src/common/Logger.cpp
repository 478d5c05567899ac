#include "fwdproxy/common/Logger.h"

#include <sys/syscall.h>
#include <unistd.h>

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace fwdproxy {
namespace common {

namespace {

thread_local long t_tid = 0;

long CurrentTid() {
    if (t_tid == 0) t_tid = static_cast<long>(::syscall(SYS_gettid));
    return t_tid;
}

struct LevelStyle {
    const char* tag;
    const char* color;
};

LevelStyle StyleOf(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return {"DEBUG", "\033[36m"};
        case LogLevel::INFO:  return {"INFO ", "\033[32m"};
        case LogLevel::WARN:  return {"WARN ", "\033[33m"};
        case LogLevel::ERROR: return {"ERROR", "\033[31m"};
        case LogLevel::FATAL: return {"FATAL", "\033[35m"};
    }
    return {"?????", ""};
}

// __FILE__ carries the build path; the basename is enough to find the line.
const char* BaseName(const char* path) {
    const char* base = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') base = p + 1;
    }
    return base;
}

} // namespace

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : level_(LogLevel::INFO), color_(::isatty(STDOUT_FILENO) == 1) {}

LogLevel Logger::ParseLevel(const std::string& levelStr) {
    std::string upper;
    for (unsigned char c : levelStr) upper.push_back(static_cast<char>(std::toupper(c)));
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "FATAL") return LogLevel::FATAL;
    return LogLevel::INFO;
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const int millis = static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);
    std::tm tmv{};
    ::localtime_r(&secs, &tmv);
    char stamp[32];
    std::strftime(stamp, sizeof stamp, "%Y-%m-%d %H:%M:%S", &tmv);

    const LevelStyle style = StyleOf(level);
    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(stdout, "%s[%s.%03d] [%s] [%ld] [%s:%d] %s%s\n",
                 color_ ? style.color : "", stamp, millis, style.tag, CurrentTid(),
                 BaseName(file), line, msg.c_str(), color_ ? "\033[0m" : "");
    std::fflush(stdout);
}

} // namespace common
} // namespace fwdproxy
