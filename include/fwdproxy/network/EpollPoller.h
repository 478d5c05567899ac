#pragma once

#include "fwdproxy/common/noncopyable.h"

#include <chrono>
#include <sys/epoll.h>
#include <unordered_map>
#include <vector>

namespace fwdproxy {
namespace network {

class Channel;

// Level-triggered epoll set owned by one EventLoop. A channel stays known
// to the poller while it has an empty interest set so that re-enabling it
// is a cheap EPOLL_CTL_ADD; Remove() forgets it entirely.
class EpollPoller : fwdproxy::common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    EpollPoller();
    ~EpollPoller();

    // Appends ready channels with their revents set. Returns the wake-up time.
    std::chrono::system_clock::time_point Poll(int timeoutMs, ChannelList* active);

    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel) const;

    size_t size() const { return channels_.size(); }

private:
    void Control(int op, Channel* channel);

    int epollfd_;
    std::vector<epoll_event> events_;
    std::unordered_map<int, Channel*> channels_;
};

} // namespace network
} // namespace fwdproxy
