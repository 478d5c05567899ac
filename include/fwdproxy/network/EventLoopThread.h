#pragma once

#include "fwdproxy/common/noncopyable.h"

#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace fwdproxy {
namespace network {

class EventLoop;

// A thread that owns and runs one EventLoop. The destructor quits the
// loop and joins.
class EventLoopThread : fwdproxy::common::noncopyable {
public:
    // name becomes the OS thread name (truncated to 15 characters).
    explicit EventLoopThread(const std::string& name);
    ~EventLoopThread();

    // Blocks until the loop exists and returns it.
    EventLoop* StartLoop();

    const std::string& name() const { return name_; }

private:
    void Run();

    const std::string name_;
    std::mutex mutex_;
    std::condition_variable ready_;
    EventLoop* loop_;
    std::thread thread_;
};

} // namespace network
} // namespace fwdproxy
