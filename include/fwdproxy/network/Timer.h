#pragma once

#include "fwdproxy/common/noncopyable.h"

#include <functional>
#include <memory>

namespace fwdproxy {
namespace network {

class Channel;
class EventLoop;

// One-shot timerfd timer on an EventLoop. Loop thread only. The callback
// may destroy the Timer; the channel and fd are released on a later loop
// iteration.
class Timer : fwdproxy::common::noncopyable {
public:
    using Callback = std::function<void()>;

    explicit Timer(EventLoop* loop);
    ~Timer();

    // (Re)arms the timer; seconds <= 0 fires on the next loop iteration.
    void Start(double seconds, Callback cb);
    void Cancel();
    bool armed() const { return armed_; }

private:
    struct Liveness {
        Timer* owner;
    };

    void HandleRead();

    EventLoop* loop_;
    int fd_;
    Channel* channel_;
    std::shared_ptr<Liveness> liveness_;
    Callback cb_;
    bool armed_;
};

} // namespace network
} // namespace fwdproxy
