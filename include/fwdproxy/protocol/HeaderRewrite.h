#pragma once

#include "fwdproxy/protocol/ParsedRequest.h"

#include <string>

namespace fwdproxy {
namespace protocol {

// Upstream request head for a plain HTTP request: origin-form request
// line, a Host header, no hop-by-hop or proxy-only headers, and
// "Connection: close". Ends with the blank line.
std::string RewriteForUpstream(const ParsedRequest& req);

// Host header value for the request's target (port omitted when default).
std::string HostHeaderValue(const ParsedRequest& req);

// Whether the header is dropped before forwarding (case-insensitive).
bool IsHopByHopHeader(const std::string& name);

} // namespace protocol
} // namespace fwdproxy
