#pragma once

#include "fwdproxy/common/noncopyable.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace fwdproxy {
namespace network {

class Channel;
class EpollPoller;

// One reactor per thread. A session, its timers and its upstream
// connections all live on one loop, so their callbacks never race.
// Other threads hand work over with RunInLoop/QueueInLoop.
class EventLoop : fwdproxy::common::noncopyable {
public:
    using Functor = std::function<void()>;

    EventLoop();
    ~EventLoop();

    // Runs until Quit(). Must be called on the constructing thread.
    void Loop();
    // Thread safe. Tasks already queued still run before Loop() returns.
    void Quit();

    // Runs cb now when called on the loop thread, otherwise queues it.
    void RunInLoop(Functor cb);
    // Always defers cb to the end of the current iteration.
    void QueueInLoop(Functor cb);
    size_t QueueSize() const;

    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel) const;

    bool IsInLoopThread() const { return threadId_ == std::this_thread::get_id(); }
    // Logs and returns false when called from a foreign thread.
    bool AssertInLoopThread(const char* what) const;

    static EventLoop* GetEventLoopOfCurrentThread();

private:
    void WakeUp();
    void DrainWakeup();
    void RunPendingTasks();

    const std::thread::id threadId_;
    std::atomic<bool> looping_;
    std::atomic<bool> quit_;
    std::atomic<bool> runningTasks_;

    std::unique_ptr<EpollPoller> poller_;
    std::vector<Channel*> active_;

    int wakeupFd_;
    std::unique_ptr<Channel> wakeupChannel_;

    mutable std::mutex mutex_;
    std::vector<Functor> pending_;
};

} // namespace network
} // namespace fwdproxy
