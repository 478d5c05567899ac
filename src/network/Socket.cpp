#include "fwdproxy/network/Socket.h"
#include "fwdproxy/network/InetAddress.h"
#include "fwdproxy/common/Logger.h"

#include <unistd.h>
#include <sys/socket.h>
#include <netinet/tcp.h>
#include <cerrno>
#include <cstring>

namespace fwdproxy {
namespace network {

namespace {

void SetFlag(int fd, int level, int option, bool on, const char* what) {
    const int value = on ? 1 : 0;
    if (::setsockopt(fd, level, option, &value, sizeof value) < 0) {
        LOG_WARN << "setsockopt " << what << " fd=" << fd << ": " << std::strerror(errno);
    }
}

using NameFn = int (*)(int, struct sockaddr*, socklen_t*);

InetAddress QueryName(int fd, NameFn fn, const char* what) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    socklen_t len = sizeof addr;
    if (fn(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        LOG_ERROR << what << " fd=" << fd << ": " << std::strerror(errno);
    }
    return InetAddress(addr);
}

} // namespace

Socket::~Socket() {
    if (::close(sockfd_) < 0) {
        LOG_DEBUG << "close fd=" << sockfd_ << ": " << std::strerror(errno);
    }
}

bool Socket::BindAddress(const InetAddress& localaddr) {
    if (::bind(sockfd_, localaddr.getSockAddr(), sizeof(struct sockaddr_in)) == 0) return true;
    LOG_ERROR << "bind " << localaddr.toIpPort() << ": " << std::strerror(errno);
    return false;
}

bool Socket::Listen() {
    if (::listen(sockfd_, SOMAXCONN) == 0) return true;
    LOG_ERROR << "listen fd=" << sockfd_ << ": " << std::strerror(errno);
    return false;
}

// Accepted sockets are non-blocking and close-on-exec. -1 leaves errno set.
int Socket::Accept(InetAddress* peeraddr) {
    struct sockaddr_in addr;
    socklen_t len = sizeof addr;
    const int connfd = ::accept4(sockfd_, reinterpret_cast<struct sockaddr*>(&addr), &len,
                                 SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (connfd >= 0) peeraddr->setSockAddr(addr);
    return connfd;
}

void Socket::ShutdownWrite() {
    // ENOTCONN: the peer already reset the connection.
    if (::shutdown(sockfd_, SHUT_WR) < 0 && errno != ENOTCONN) {
        LOG_WARN << "shutdown(SHUT_WR) fd=" << sockfd_ << ": " << std::strerror(errno);
    }
}

void Socket::SetTcpNoDelay(bool on) { SetFlag(sockfd_, IPPROTO_TCP, TCP_NODELAY, on, "TCP_NODELAY"); }
void Socket::SetReuseAddr(bool on) { SetFlag(sockfd_, SOL_SOCKET, SO_REUSEADDR, on, "SO_REUSEADDR"); }
void Socket::SetReusePort(bool on) { SetFlag(sockfd_, SOL_SOCKET, SO_REUSEPORT, on, "SO_REUSEPORT"); }
void Socket::SetKeepAlive(bool on) { SetFlag(sockfd_, SOL_SOCKET, SO_KEEPALIVE, on, "SO_KEEPALIVE"); }

int Socket::GetSocketError(int sockfd) {
    int err = 0;
    socklen_t len = sizeof err;
    return ::getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &err, &len) < 0 ? errno : err;
}

InetAddress Socket::GetLocalAddr(int sockfd) {
    return QueryName(sockfd, ::getsockname, "getsockname");
}

InetAddress Socket::GetPeerAddr(int sockfd) {
    return QueryName(sockfd, ::getpeername, "getpeername");
}

} // namespace network
} // namespace fwdproxy
