#pragma once

#include "fwdproxy/common/noncopyable.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace fwdproxy {
namespace network {

class EventLoop;

// Binds one fd to its EventLoop: the epoll interest set plus the callbacks
// for whatever epoll reports. Never owns or closes the fd.
class Channel : fwdproxy::common::noncopyable {
public:
    using EventCallback = std::function<void()>;
    using ReadEventCallback = std::function<void(std::chrono::system_clock::time_point)>;

    enum Registration { kUnregistered, kParked, kInEpoll };

    Channel(EventLoop* loop, int fd);
    ~Channel();

    // Order: hang-up, error, read, write.
    void HandleEvent(std::chrono::system_clock::time_point receiveTime);

    void SetReadCallback(ReadEventCallback cb) { readCallback_ = std::move(cb); }
    void SetWriteCallback(EventCallback cb) { writeCallback_ = std::move(cb); }
    void SetCloseCallback(EventCallback cb) { closeCallback_ = std::move(cb); }
    void SetErrorCallback(EventCallback cb) { errorCallback_ = std::move(cb); }

    // Events are dropped once obj is gone, and obj outlives the callbacks
    // of the event being handled.
    void Tie(const std::shared_ptr<void>& obj);

    int fd() const { return fd_; }
    uint32_t events() const { return interest_; }
    void set_revents(uint32_t revents) { revents_ = revents; }
    bool IsNoneEvent() const { return interest_ == 0; }

    void EnableReading() { SetInterest(interest_ | kReadable); }
    void DisableReading() { SetInterest(interest_ & ~kReadable); }
    void EnableWriting() { SetInterest(interest_ | kWritable); }
    void DisableWriting() { SetInterest(interest_ & ~kWritable); }
    void DisableAll() { SetInterest(0); }

    bool IsReading() const { return (interest_ & kReadable) != 0; }
    bool IsWriting() const { return (interest_ & kWritable) != 0; }

    Registration registration() const { return registration_; }
    void set_registration(Registration r) { registration_ = r; }

    // Must be called before the fd is closed.
    void Remove();

    static std::string EventsToString(uint32_t ev);

private:
    static const uint32_t kReadable;
    static const uint32_t kWritable;

    void SetInterest(uint32_t interest);
    void Dispatch(std::chrono::system_clock::time_point receiveTime);

    EventLoop* loop_;
    const int fd_;
    uint32_t interest_;
    uint32_t revents_;
    Registration registration_;
    bool inLoop_;

    std::weak_ptr<void> tie_;
    bool tied_;

    ReadEventCallback readCallback_;
    EventCallback writeCallback_;
    EventCallback closeCallback_;
    EventCallback errorCallback_;
};

} // namespace network
} // namespace fwdproxy
