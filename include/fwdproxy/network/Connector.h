#pragma once

#include "fwdproxy/common/noncopyable.h"
#include "fwdproxy/network/InetAddress.h"

#include <functional>
#include <memory>

namespace fwdproxy {
namespace network {

class Channel;
class EventLoop;
class Timer;

// One non-blocking connect attempt to a single address, bounded by a
// timeout. Exactly one of the callbacks runs unless Stop() comes first.
// Loop thread only.
class Connector : public std::enable_shared_from_this<Connector>,
                  fwdproxy::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd)>;
    // errno of the failure; ETIMEDOUT when the timeout fired.
    using ErrorCallback = std::function<void(int savedErrno)>;

    Connector(EventLoop* loop, const InetAddress& serverAddr, double timeoutSec);
    ~Connector();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) { newConnectionCallback_ = cb; }
    void SetErrorCallback(const ErrorCallback& cb) { errorCallback_ = cb; }

    void Start();
    // Abandons an attempt in progress; no callback runs afterwards.
    void Stop();

    const InetAddress& serverAddress() const { return serverAddr_; }

private:
    enum States { kDisconnected, kConnecting, kConnected };

    void SetState(States s) { state_ = s; }
    void Connecting(int sockfd);
    // Writable or error event, or the deadline: the attempt is over.
    void Finish(int err);
    void Fail(int sockfd, int savedErrno);
    int RemoveAndResetChannel();

    EventLoop* loop_;
    InetAddress serverAddr_;
    double timeoutSec_;
    States state_;
    bool stopped_;
    std::unique_ptr<Channel> channel_;
    std::unique_ptr<Timer> timer_;
    NewConnectionCallback newConnectionCallback_;
    ErrorCallback errorCallback_;
};

using ConnectorPtr = std::shared_ptr<Connector>;

} // namespace network
} // namespace fwdproxy
