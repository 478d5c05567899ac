#include "fwdproxy/network/EventLoop.h"
#include "fwdproxy/network/Channel.h"
#include "fwdproxy/network/EpollPoller.h"
#include "fwdproxy/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <sys/eventfd.h>
#include <unistd.h>

namespace fwdproxy {
namespace network {

namespace {

thread_local EventLoop* t_loop = nullptr;

// Upper bound on one epoll_wait; timers and wake-ups end it earlier.
const int kPollTimeoutMs = 10000;

int CreateWakeupFd() {
    const int fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (fd < 0) {
        LOG_FATAL << "eventfd failed: " << std::strerror(errno);
    }
    return fd;
}

} // namespace

EventLoop* EventLoop::GetEventLoopOfCurrentThread() {
    return t_loop;
}

EventLoop::EventLoop()
    : threadId_(std::this_thread::get_id()),
      looping_(false),
      quit_(false),
      runningTasks_(false),
      poller_(new EpollPoller()),
      wakeupFd_(CreateWakeupFd()),
      wakeupChannel_(new Channel(this, wakeupFd_)) {
    if (t_loop) {
        LOG_FATAL << "thread " << threadId_ << " already runs EventLoop " << t_loop;
    } else {
        t_loop = this;
    }
    wakeupChannel_->SetReadCallback([this](std::chrono::system_clock::time_point) { DrainWakeup(); });
    wakeupChannel_->EnableReading();
}

EventLoop::~EventLoop() {
    wakeupChannel_->DisableAll();
    wakeupChannel_->Remove();
    ::close(wakeupFd_);
    if (t_loop == this) t_loop = nullptr;
}

void EventLoop::Loop() {
    if (!AssertInLoopThread("Loop")) return;
    looping_ = true;

    while (!quit_) {
        active_.clear();
        const auto receiveTime = poller_->Poll(kPollTimeoutMs, &active_);
        for (Channel* channel : active_) {
            channel->HandleEvent(receiveTime);
        }
        RunPendingTasks();
    }
    // Deferred teardown queued during the last iteration.
    RunPendingTasks();

    looping_ = false;
    quit_ = false;
}

void EventLoop::Quit() {
    quit_ = true;
    if (!IsInLoopThread()) WakeUp();
}

void EventLoop::RunInLoop(Functor cb) {
    if (IsInLoopThread()) {
        cb();
        return;
    }
    QueueInLoop(std::move(cb));
}

void EventLoop::QueueInLoop(Functor cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back(std::move(cb));
    }
    // From the loop thread a wake-up is only needed while tasks are
    // running: the new task would otherwise wait for the next event.
    if (!IsInLoopThread() || runningTasks_) WakeUp();
}

size_t EventLoop::QueueSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool EventLoop::AssertInLoopThread(const char* what) const {
    if (IsInLoopThread()) return true;
    LOG_ERROR << "EventLoop " << this << ": " << what << " called from thread "
              << std::this_thread::get_id() << ", owner is " << threadId_;
    return false;
}

void EventLoop::WakeUp() {
    const uint64_t one = 1;
    const ssize_t n = ::write(wakeupFd_, &one, sizeof(one));
    if (n != static_cast<ssize_t>(sizeof(one))) {
        LOG_ERROR << "EventLoop wake-up write returned " << n;
    }
}

void EventLoop::DrainWakeup() {
    uint64_t count = 0;
    const ssize_t n = ::read(wakeupFd_, &count, sizeof(count));
    if (n != static_cast<ssize_t>(sizeof(count))) {
        LOG_ERROR << "EventLoop wake-up read returned " << n;
    }
}

void EventLoop::UpdateChannel(Channel* channel) {
    poller_->UpdateChannel(channel);
}

void EventLoop::RemoveChannel(Channel* channel) {
    poller_->RemoveChannel(channel);
}

bool EventLoop::HasChannel(Channel* channel) const {
    return poller_->HasChannel(channel);
}

void EventLoop::RunPendingTasks() {
    std::vector<Functor> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks.swap(pending_);
    }
    runningTasks_ = true;
    for (const Functor& task : tasks) {
        task();
    }
    runningTasks_ = false;
}

} // namespace network
} // namespace fwdproxy
