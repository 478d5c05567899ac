#include "fwdproxy/network/EventLoopThread.h"
#include "fwdproxy/network/EventLoop.h"
#include "fwdproxy/common/Logger.h"

#include <pthread.h>

namespace fwdproxy {
namespace network {

EventLoopThread::EventLoopThread(const std::string& name)
    : name_(name),
      loop_(nullptr) {
}

EventLoopThread::~EventLoopThread() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (loop_) loop_->Quit();
    }
    if (thread_.joinable()) thread_.join();
}

EventLoop* EventLoopThread::StartLoop() {
    thread_ = std::thread([this]() { Run(); });
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait(lock, [this]() { return loop_ != nullptr; });
    return loop_;
}

void EventLoopThread::Run() {
    if (!name_.empty()) {
        ::pthread_setname_np(::pthread_self(), name_.substr(0, 15).c_str());
    }
    EventLoop loop;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop_ = &loop;
    }
    ready_.notify_one();
    LOG_DEBUG << "I/O thread " << name_ << " running";

    loop.Loop();

    std::lock_guard<std::mutex> lock(mutex_);
    loop_ = nullptr;
}

} // namespace network
} // namespace fwdproxy
