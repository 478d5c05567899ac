#pragma once

#include "fwdproxy/common/noncopyable.h"

namespace fwdproxy {
namespace network {

class InetAddress;

// Owns a socket fd; closes it on destruction.
class Socket : fwdproxy::common::noncopyable {
public:
    explicit Socket(int sockfd)
        : sockfd_(sockfd) {}
    ~Socket();

    int fd() const { return sockfd_; }

    bool BindAddress(const InetAddress& localaddr);
    bool Listen();
    int Accept(InetAddress* peeraddr);

    void ShutdownWrite();

    void SetTcpNoDelay(bool on);
    void SetReuseAddr(bool on);
    void SetReusePort(bool on);
    void SetKeepAlive(bool on);

    // Pending SO_ERROR (0 when none).
    static int GetSocketError(int sockfd);
    static InetAddress GetLocalAddr(int sockfd);
    static InetAddress GetPeerAddr(int sockfd);

private:
    const int sockfd_;
};

} // namespace network
} // namespace fwdproxy
