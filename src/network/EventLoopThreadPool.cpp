#include "fwdproxy/network/EventLoopThreadPool.h"
#include "fwdproxy/network/EventLoopThread.h"
#include "fwdproxy/network/EventLoop.h"
#include "fwdproxy/common/Logger.h"

namespace fwdproxy {
namespace network {

EventLoopThreadPool::EventLoopThreadPool(EventLoop* baseLoop, const std::string& name)
    : baseLoop_(baseLoop),
      name_(name),
      numThreads_(0),
      started_(false),
      next_(0) {
}

// Joins every I/O thread; their loops run queued teardown first.
EventLoopThreadPool::~EventLoopThreadPool() = default;

void EventLoopThreadPool::Start() {
    if (started_) return;
    started_ = true;
    threads_.reserve(static_cast<size_t>(numThreads_));
    for (int i = 0; i < numThreads_; ++i) {
        threads_.emplace_back(new EventLoopThread(name_ + "-io" + std::to_string(i)));
        loops_.push_back(threads_.back()->StartLoop());
    }
    LOG_DEBUG << "EventLoopThreadPool " << name_ << " started " << loops_.size() << " I/O loops";
}

EventLoop* EventLoopThreadPool::GetNextLoop() {
    if (loops_.empty()) return baseLoop_;
    EventLoop* loop = loops_[next_];
    next_ = (next_ + 1) % loops_.size();
    return loop;
}

} // namespace network
} // namespace fwdproxy
