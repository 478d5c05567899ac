#pragma once

#include "fwdproxy/common/noncopyable.h"
#include "fwdproxy/network/Channel.h"
#include "fwdproxy/network/Socket.h"

#include <cstdint>
#include <functional>

namespace fwdproxy {
namespace network {

class EventLoop;
class InetAddress;

// Listening socket on the base loop. Accepts in a batch per readiness
// event and hands each fd to the callback, which takes ownership.
class Acceptor : fwdproxy::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport);
    ~Acceptor();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) { newConnectionCallback_ = cb; }

    // False when the address could not be bound or listened on.
    bool Listen();
    bool listening() const { return listening_; }

    // Bound port; differs from the requested one when that was 0.
    uint16_t ListenPort() const;

private:
    void HandleRead();
    // Out of descriptors: accept with the spare fd and close at once, so
    // the client sees a reset instead of hanging in the backlog.
    void ShedOneConnection();

    EventLoop* loop_;
    Socket socket_;
    Channel channel_;
    NewConnectionCallback newConnectionCallback_;
    bool bound_;
    bool listening_;
    int spareFd_;
};

} // namespace network
} // namespace fwdproxy
