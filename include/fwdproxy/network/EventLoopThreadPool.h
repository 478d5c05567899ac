#pragma once

#include "fwdproxy/common/noncopyable.h"

#include <memory>
#include <string>
#include <vector>

namespace fwdproxy {
namespace network {

class EventLoop;
class EventLoopThread;

// I/O loops for accepted connections, handed out round-robin. With zero
// threads every connection stays on the base loop. Base loop thread only.
class EventLoopThreadPool : fwdproxy::common::noncopyable {
public:
    EventLoopThreadPool(EventLoop* baseLoop, const std::string& name);
    ~EventLoopThreadPool();

    void SetThreadNum(int numThreads) { numThreads_ = numThreads < 0 ? 0 : numThreads; }
    void Start();

    EventLoop* GetNextLoop();
    size_t size() const { return loops_.size(); }
    bool started() const { return started_; }

private:
    EventLoop* baseLoop_;
    const std::string name_;
    int numThreads_;
    bool started_;
    size_t next_;
    std::vector<std::unique_ptr<EventLoopThread>> threads_;
    std::vector<EventLoop*> loops_;
};

} // namespace network
} // namespace fwdproxy
