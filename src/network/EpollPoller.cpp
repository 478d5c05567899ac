#include "fwdproxy/network/EpollPoller.h"
#include "fwdproxy/network/Channel.h"
#include "fwdproxy/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace fwdproxy {
namespace network {

namespace {
const size_t kInitialEvents = 64;
const size_t kMaxEvents = 4096;
}

EpollPoller::EpollPoller()
    : epollfd_(::epoll_create1(EPOLL_CLOEXEC)),
      events_(kInitialEvents) {
    if (epollfd_ < 0) {
        LOG_FATAL << "epoll_create1 failed: " << std::strerror(errno);
    }
}

EpollPoller::~EpollPoller() {
    if (epollfd_ >= 0) ::close(epollfd_);
}

std::chrono::system_clock::time_point EpollPoller::Poll(int timeoutMs, ChannelList* active) {
    const int n = ::epoll_wait(epollfd_, events_.data(), static_cast<int>(events_.size()), timeoutMs);
    const int savedErrno = errno;
    const auto now = std::chrono::system_clock::now();

    if (n < 0) {
        if (savedErrno != EINTR) LOG_ERROR << "epoll_wait failed: " << std::strerror(savedErrno);
        return now;
    }
    for (int i = 0; i < n; ++i) {
        Channel* channel = static_cast<Channel*>(events_[i].data.ptr);
        channel->set_revents(events_[i].events);
        active->push_back(channel);
    }
    // A full batch means more may be waiting; take more next round.
    if (static_cast<size_t>(n) == events_.size() && events_.size() < kMaxEvents) {
        events_.resize(events_.size() * 2);
    }
    return now;
}

void EpollPoller::UpdateChannel(Channel* channel) {
    switch (channel->registration()) {
        case Channel::kUnregistered:
            channels_[channel->fd()] = channel;
            // fall through
        case Channel::kParked:
            if (channel->IsNoneEvent()) {
                channel->set_registration(Channel::kParked);
                return;
            }
            Control(EPOLL_CTL_ADD, channel);
            channel->set_registration(Channel::kInEpoll);
            return;
        case Channel::kInEpoll:
            if (channel->IsNoneEvent()) {
                Control(EPOLL_CTL_DEL, channel);
                channel->set_registration(Channel::kParked);
            } else {
                Control(EPOLL_CTL_MOD, channel);
            }
            return;
    }
}

void EpollPoller::RemoveChannel(Channel* channel) {
    if (channel->registration() == Channel::kInEpoll) {
        Control(EPOLL_CTL_DEL, channel);
    }
    channels_.erase(channel->fd());
    channel->set_registration(Channel::kUnregistered);
}

bool EpollPoller::HasChannel(Channel* channel) const {
    auto it = channels_.find(channel->fd());
    return it != channels_.end() && it->second == channel;
}

void EpollPoller::Control(int op, Channel* channel) {
    epoll_event ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.events = channel->events();
    ev.data.ptr = channel;
    if (::epoll_ctl(epollfd_, op, channel->fd(), &ev) == 0) return;

    const int savedErrno = errno;
    if (op == EPOLL_CTL_DEL) {
        // The fd may already be closed by its owner.
        LOG_DEBUG << "epoll_ctl DEL fd=" << channel->fd() << ": " << std::strerror(savedErrno);
    } else {
        LOG_ERROR << "epoll_ctl " << (op == EPOLL_CTL_ADD ? "ADD" : "MOD") << " fd=" << channel->fd()
                  << ": " << std::strerror(savedErrno);
    }
}

} // namespace network
} // namespace fwdproxy
