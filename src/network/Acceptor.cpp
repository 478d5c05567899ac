#include "fwdproxy/network/Acceptor.h"
#include "fwdproxy/network/InetAddress.h"
#include "fwdproxy/network/EventLoop.h"
#include "fwdproxy/common/Logger.h"
#include "fwdproxy/monitor/Stats.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace fwdproxy {
namespace network {

namespace {

// Bounds the work done per readiness event so one busy listener cannot
// starve the rest of the base loop.
const int kMaxAcceptsPerEvent = 64;

int CreateListenSocket() {
    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (fd < 0) {
        LOG_FATAL << "listen socket: " << std::strerror(errno);
    }
    return fd;
}

int OpenSpareFd() {
    return ::open("/dev/null", O_RDONLY | O_CLOEXEC);
}

} // namespace

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport)
    : loop_(loop),
      socket_(CreateListenSocket()),
      channel_(loop, socket_.fd()),
      bound_(false),
      listening_(false),
      spareFd_(OpenSpareFd()) {
    socket_.SetReuseAddr(true);
    socket_.SetReusePort(reuseport);
    bound_ = socket_.BindAddress(listenAddr);
    channel_.SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
}

Acceptor::~Acceptor() {
    if (listening_) {
        channel_.DisableAll();
        channel_.Remove();
    }
    if (spareFd_ >= 0) ::close(spareFd_);
}

bool Acceptor::Listen() {
    if (!bound_ || !socket_.Listen()) return false;
    listening_ = true;
    channel_.EnableReading();
    return true;
}

uint16_t Acceptor::ListenPort() const {
    return Socket::GetLocalAddr(socket_.fd()).toPort();
}

void Acceptor::HandleRead() {
    for (int i = 0; i < kMaxAcceptsPerEvent; ++i) {
        InetAddress peer;
        const int connfd = socket_.Accept(&peer);
        if (connfd >= 0) {
            if (newConnectionCallback_) {
                newConnectionCallback_(connfd, peer);
            } else {
                ::close(connfd);
            }
            continue;
        }

        const int err = errno;
        if (err == EAGAIN || err == EWOULDBLOCK) return;
        if (err == EINTR || err == ECONNABORTED || err == EPROTO) continue;
        if (err == EMFILE || err == ENFILE) {
            LOG_ERROR << "accept: out of file descriptors, shedding a client";
            ShedOneConnection();
            return;
        }
        LOG_ERROR << "accept failed: " << std::strerror(err);
        return;
    }
}

void Acceptor::ShedOneConnection() {
    if (spareFd_ < 0) return;
    ::close(spareFd_);
    const int fd = ::accept4(socket_.fd(), nullptr, nullptr, SOCK_CLOEXEC);
    if (fd >= 0) {
        ::close(fd);
        fwdproxy::monitor::Stats::Instance().AddConnectionRejected();
    }
    spareFd_ = OpenSpareFd();
}

} // namespace network
} // namespace fwdproxy
