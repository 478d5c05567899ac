#include "fwdproxy/network/Timer.h"
#include "fwdproxy/network/Channel.h"
#include "fwdproxy/network/EventLoop.h"
#include "fwdproxy/common/Logger.h"

#include <sys/timerfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace fwdproxy {
namespace network {

Timer::Timer(EventLoop* loop)
    : loop_(loop),
      fd_(::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC)),
      channel_(nullptr),
      liveness_(std::make_shared<Liveness>()),
      armed_(false) {
    liveness_->owner = this;
    if (fd_ < 0) {
        LOG_ERROR << "Timer: timerfd_create failed errno=" << errno;
        return;
    }
    channel_ = new Channel(loop_, fd_);
    std::shared_ptr<Liveness> alive = liveness_;
    channel_->SetReadCallback([alive](std::chrono::system_clock::time_point) {
        if (alive->owner) alive->owner->HandleRead();
    });
    channel_->EnableReading();
}

Timer::~Timer() {
    liveness_->owner = nullptr;
    if (!channel_) return;
    channel_->DisableAll();
    channel_->Remove();
    // Deleting the channel here could free it while it is dispatching.
    Channel* ch = channel_;
    int fd = fd_;
    channel_ = nullptr;
    fd_ = -1;
    loop_->QueueInLoop([ch, fd]() {
        delete ch;
        ::close(fd);
    });
}

void Timer::Start(double seconds, Callback cb) {
    cb_ = std::move(cb);
    if (fd_ < 0) {
        // No timerfd: fall back to the next loop iteration.
        std::shared_ptr<Liveness> alive = liveness_;
        armed_ = true;
        loop_->QueueInLoop([alive]() {
            if (alive->owner && alive->owner->armed_) alive->owner->HandleRead();
        });
        return;
    }

    struct itimerspec howlong;
    std::memset(&howlong, 0, sizeof howlong);
    long long ns = static_cast<long long>(seconds * 1e9);
    if (ns < 1000) ns = 1000;
    howlong.it_value.tv_sec = static_cast<time_t>(ns / 1000000000LL);
    howlong.it_value.tv_nsec = static_cast<long>(ns % 1000000000LL);
    if (::timerfd_settime(fd_, 0, &howlong, nullptr) != 0) {
        LOG_ERROR << "Timer: timerfd_settime failed errno=" << errno;
        return;
    }
    armed_ = true;
}

void Timer::Cancel() {
    armed_ = false;
    cb_ = nullptr;
    if (fd_ < 0) return;
    struct itimerspec zero;
    std::memset(&zero, 0, sizeof zero);
    ::timerfd_settime(fd_, 0, &zero, nullptr);
}

void Timer::HandleRead() {
    if (fd_ >= 0) {
        uint64_t expirations = 0;
        ssize_t n = ::read(fd_, &expirations, sizeof expirations);
        (void)n;
    }
    if (!armed_) return;
    armed_ = false;
    // The callback may destroy this Timer.
    Callback cb = std::move(cb_);
    cb_ = nullptr;
    if (cb) cb();
}

} // namespace network
} // namespace fwdproxy
