#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fwdproxy {
namespace protocol {

enum class ParseError {
    kMalformedRequest,
    kIncompleteRequest,
    kTimeout,
};

const char* ParseErrorName(ParseError e);

struct HttpHeader {
    std::string name;
    std::string value;
};

// A classified client request head. Only produced for well-formed input:
// host is non-empty and lower-cased, port is 1..65535.
struct ParsedRequest {
    std::string method;   // upper-cased token
    std::string target;   // request-target exactly as received
    std::string version;  // "HTTP/1.1"
    std::string scheme;   // "http" / "https" for absolute-URI targets, else empty
    std::string host;
    uint16_t port{0};
    bool tunnel{false};   // CONNECT
    std::string path;     // origin-form path and query; empty for CONNECT
    std::string rawHeader;  // request line and header lines, through the blank line
    std::vector<HttpHeader> headers;  // in arrival order, duplicates kept
    std::string pending;  // bytes that followed the blank line

    // Case-insensitive; first occurrence. nullptr when absent.
    const std::string* FindHeader(const std::string& name) const;
    std::string GetHeader(const std::string& name) const;
};

bool IEquals(const std::string& a, const std::string& b);
std::string ToLowerCopy(const std::string& s);

} // namespace protocol
} // namespace fwdproxy
