#pragma once

#include <netinet/in.h>
#include <optional>
#include <string>

namespace fwdproxy {
namespace network {

// IPv4 endpoint. Upstream names are resolved elsewhere; this class never
// does a lookup.
class InetAddress {
public:
    // INADDR_ANY, or 127.0.0.1 with loopbackOnly.
    explicit InetAddress(uint16_t port = 0, bool loopbackOnly = false);
    explicit InetAddress(const struct sockaddr_in& addr)
        : addr_(addr) {}

    // Dotted quad only.
    static std::optional<InetAddress> FromIpPort(const std::string& ip, uint16_t port);

    sa_family_t family() const { return addr_.sin_family; }
    std::string toIp() const;
    std::string toIpPort() const;
    uint16_t toPort() const;

    const struct sockaddr* getSockAddr() const { return reinterpret_cast<const struct sockaddr*>(&addr_); }
    void setSockAddr(const struct sockaddr_in& addr) { addr_ = addr; }

    bool operator==(const InetAddress& other) const {
        return addr_.sin_port == other.addr_.sin_port &&
               addr_.sin_addr.s_addr == other.addr_.sin_addr.s_addr;
    }
    bool operator!=(const InetAddress& other) const { return !(*this == other); }

private:
    struct sockaddr_in addr_;
};

} // namespace network
} // namespace fwdproxy
