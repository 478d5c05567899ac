#include "fwdproxy/network/Connector.h"
#include "fwdproxy/network/Channel.h"
#include "fwdproxy/network/EventLoop.h"
#include "fwdproxy/network/Socket.h"
#include "fwdproxy/network/Timer.h"
#include "fwdproxy/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/socket.h>

namespace fwdproxy {
namespace network {

Connector::Connector(EventLoop* loop, const InetAddress& serverAddr, double timeoutSec)
    : loop_(loop),
      serverAddr_(serverAddr),
      timeoutSec_(timeoutSec),
      state_(kDisconnected),
      stopped_(false),
      timer_(new Timer(loop)) {}

Connector::~Connector() {
    if (channel_) ::close(RemoveAndResetChannel());
}

void Connector::Start() {
    stopped_ = false;
    const int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        const int err = errno;
        LOG_ERROR << "Connector socket(): " << std::strerror(err);
        if (errorCallback_) errorCallback_(err);
        return;
    }

    const int err = ::connect(sockfd, serverAddr_.getSockAddr(), sizeof(struct sockaddr_in)) == 0 ? 0 : errno;
    if (err == 0 || err == EINPROGRESS || err == EINTR || err == EISCONN) {
        Connecting(sockfd);
        return;
    }
    LOG_DEBUG << "Connector " << serverAddr_.toIpPort() << " connect(): " << std::strerror(err);
    Fail(sockfd, err);
}

void Connector::Stop() {
    stopped_ = true;
    timer_->Cancel();
    if (state_ != kConnecting) return;
    SetState(kDisconnected);
    ::close(RemoveAndResetChannel());
}

void Connector::Connecting(int sockfd) {
    SetState(kConnecting);
    channel_.reset(new Channel(loop_, sockfd));
    channel_->SetWriteCallback([this]() { Finish(0); });
    channel_->SetErrorCallback([this]() { Finish(ECONNREFUSED); });
    channel_->Tie(shared_from_this());
    channel_->EnableWriting();

    std::weak_ptr<Connector> weakSelf(shared_from_this());
    timer_->Start(timeoutSec_, [weakSelf]() {
        if (auto self = weakSelf.lock()) self->Finish(ETIMEDOUT);
    });
}

// The channel is deleted on the next loop turn: this may run inside its
// own event handler.
int Connector::RemoveAndResetChannel() {
    channel_->DisableAll();
    channel_->Remove();
    const int sockfd = channel_->fd();
    Channel* ch = channel_.release();
    loop_->QueueInLoop([ch]() { delete ch; });
    return sockfd;
}

// err is the fallback when the socket itself carries no SO_ERROR.
void Connector::Finish(int err) {
    if (state_ != kConnecting) return;
    timer_->Cancel();
    const int sockfd = RemoveAndResetChannel();

    if (err != ETIMEDOUT) {
        const int soError = Socket::GetSocketError(sockfd);
        if (soError != 0) err = soError;
    }
    // A connect to a free local port can succeed against itself.
    if (err == 0 && Socket::GetLocalAddr(sockfd) == Socket::GetPeerAddr(sockfd)) {
        LOG_WARN << "Connector " << serverAddr_.toIpPort() << " connected to itself";
        err = ECONNREFUSED;
    }
    if (err != 0) {
        LOG_DEBUG << "Connector " << serverAddr_.toIpPort() << " failed: " << std::strerror(err);
        Fail(sockfd, err);
        return;
    }

    SetState(kConnected);
    if (stopped_ || !newConnectionCallback_) {
        ::close(sockfd);
        return;
    }
    newConnectionCallback_(sockfd);
}

void Connector::Fail(int sockfd, int savedErrno) {
    ::close(sockfd);
    SetState(kDisconnected);
    if (!stopped_ && errorCallback_) errorCallback_(savedErrno);
}

} // namespace network
} // namespace fwdproxy
