#include "fwdproxy/network/Channel.h"
#include "fwdproxy/network/EventLoop.h"
#include "fwdproxy/common/Logger.h"

#include <sys/epoll.h>

namespace fwdproxy {
namespace network {

const uint32_t Channel::kReadable = EPOLLIN | EPOLLPRI | EPOLLRDHUP;
const uint32_t Channel::kWritable = EPOLLOUT;

Channel::Channel(EventLoop* loop, int fd)
    : loop_(loop),
      fd_(fd),
      interest_(0),
      revents_(0),
      registration_(kUnregistered),
      inLoop_(false),
      tied_(false) {}

Channel::~Channel() {
    if (inLoop_) {
        LOG_ERROR << "Channel fd=" << fd_ << " destroyed without Remove()";
    }
}

void Channel::Tie(const std::shared_ptr<void>& obj) {
    tie_ = obj;
    tied_ = true;
}

void Channel::SetInterest(uint32_t interest) {
    interest_ = interest;
    inLoop_ = true;
    loop_->UpdateChannel(this);
}

void Channel::Remove() {
    inLoop_ = false;
    loop_->RemoveChannel(this);
}

void Channel::HandleEvent(std::chrono::system_clock::time_point receiveTime) {
    if (!tied_) {
        Dispatch(receiveTime);
        return;
    }
    std::shared_ptr<void> owner = tie_.lock();
    if (owner) Dispatch(receiveTime);
}

void Channel::Dispatch(std::chrono::system_clock::time_point receiveTime) {
    LOG_DEBUG << "Channel fd=" << fd_ << " revents " << EventsToString(revents_);

    // The error callback records SO_ERROR before any close runs. With
    // EPOLLIN still set the read path sees EOF itself.
    if ((revents_ & EPOLLERR) && errorCallback_) errorCallback_();
    if ((revents_ & EPOLLHUP) && !(revents_ & EPOLLIN) && closeCallback_) closeCallback_();
    if ((revents_ & kReadable) && readCallback_) readCallback_(receiveTime);
    if ((revents_ & kWritable) && writeCallback_) writeCallback_();
}

std::string Channel::EventsToString(uint32_t ev) {
    static const struct {
        uint32_t bit;
        const char* name;
    } kNames[] = {
        {EPOLLIN, "IN"}, {EPOLLPRI, "PRI"}, {EPOLLOUT, "OUT"}, {EPOLLRDHUP, "RDHUP"},
        {EPOLLERR, "ERR"}, {EPOLLHUP, "HUP"},
    };
    std::string out;
    for (const auto& n : kNames) {
        if (!(ev & n.bit)) continue;
        if (!out.empty()) out += '|';
        out += n.name;
    }
    return out.empty() ? "NONE" : out;
}

} // namespace network
} // namespace fwdproxy
