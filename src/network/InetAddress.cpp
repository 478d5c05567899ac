#include "fwdproxy/network/InetAddress.h"

#include <arpa/inet.h>
#include <cstring>

namespace fwdproxy {
namespace network {

namespace {

sockaddr_in MakeAddr(in_addr_t hostOrderIp, uint16_t port) {
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(hostOrderIp);
    return addr;
}

} // namespace

InetAddress::InetAddress(uint16_t port, bool loopbackOnly)
    : addr_(MakeAddr(loopbackOnly ? INADDR_LOOPBACK : INADDR_ANY, port)) {}

std::optional<InetAddress> InetAddress::FromIpPort(const std::string& ip, uint16_t port) {
    sockaddr_in addr = MakeAddr(INADDR_ANY, port);
    if (::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) return std::nullopt;
    return InetAddress(addr);
}

std::string InetAddress::toIp() const {
    char text[INET_ADDRSTRLEN] = "";
    if (!::inet_ntop(AF_INET, &addr_.sin_addr, text, sizeof text)) return "?";
    return text;
}

std::string InetAddress::toIpPort() const {
    return toIp() + ":" + std::to_string(toPort());
}

uint16_t InetAddress::toPort() const {
    return ntohs(addr_.sin_port);
}

} // namespace network
} // namespace fwdproxy
