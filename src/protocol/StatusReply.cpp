#include "fwdproxy/protocol/StatusReply.h"

namespace fwdproxy {
namespace protocol {

namespace {

const char* ReasonPhrase(int code) {
    switch (code) {
        case 200: return "Connection Established";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 429: return "Too Many Requests";
        case 502: return "Bad Gateway";
    }
    return "Error";
}

} // namespace

std::string StatusLine(int code) {
    return "HTTP/1.1 " + std::to_string(code) + " " + ReasonPhrase(code);
}

std::string StatusReply(int code) {
    std::string reply = StatusLine(code);
    reply += "\r\n";
    if (code == 200) {
        // No Content-Length on a CONNECT 2xx: the tunnel starts right after.
        reply += "Connection: close\r\n\r\n";
        return reply;
    }
    reply += "Content-Length: 0\r\nConnection: close\r\n\r\n";
    return reply;
}

} // namespace protocol
} // namespace fwdproxy
