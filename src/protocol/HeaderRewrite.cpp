#include "fwdproxy/protocol/HeaderRewrite.h"

#include <set>
#include <sstream>

namespace fwdproxy {
namespace protocol {

namespace {

const char* const kHopByHop[] = {
    "connection",
    "proxy-connection",
    "proxy-authorization",
    "keep-alive",
    "te",
    "upgrade",
};

// Lower-cased tokens listed in every Connection header.
std::set<std::string> ConnectionTokens(const ParsedRequest& req) {
    std::set<std::string> tokens;
    for (const auto& h : req.headers) {
        if (!IEquals(h.name, "Connection")) continue;
        std::istringstream in(h.value);
        std::string item;
        while (std::getline(in, item, ',')) {
            size_t b = item.find_first_not_of(" \t");
            size_t e = item.find_last_not_of(" \t");
            if (b == std::string::npos) continue;
            tokens.insert(ToLowerCopy(item.substr(b, e - b + 1)));
        }
    }
    return tokens;
}

} // namespace

bool IsHopByHopHeader(const std::string& name) {
    const std::string lower = ToLowerCopy(name);
    for (const char* h : kHopByHop) {
        if (lower == h) return true;
    }
    return false;
}

std::string HostHeaderValue(const ParsedRequest& req) {
    std::string value = (req.host.find(':') != std::string::npos) ? "[" + req.host + "]" : req.host;
    const uint16_t defaultPort = (req.scheme == "https") ? 443 : 80;
    if (req.port != defaultPort) {
        value += ":" + std::to_string(req.port);
    }
    return value;
}

std::string RewriteForUpstream(const ParsedRequest& req) {
    const std::set<std::string> named = ConnectionTokens(req);

    std::string out;
    out.reserve(req.rawHeader.size() + 32);
    out += req.method;
    out += ' ';
    out += req.path.empty() ? "/" : req.path;
    out += ' ';
    out += req.version;
    out += "\r\n";

    // Host comes first; the absolute-URI authority wins over a client Host.
    out += "Host: ";
    out += HostHeaderValue(req);
    out += "\r\n";

    for (const auto& h : req.headers) {
        if (IEquals(h.name, "Host")) continue;
        if (IsHopByHopHeader(h.name)) continue;
        if (named.count(ToLowerCopy(h.name))) continue;
        out += h.name;
        out += ": ";
        out += h.value;
        out += "\r\n";
    }
    out += "Connection: close\r\n\r\n";
    return out;
}

} // namespace protocol
} // namespace fwdproxy
