#pragma once

#include <string>

namespace fwdproxy {
namespace protocol {

// "HTTP/1.1 403 Forbidden"
std::string StatusLine(int code);

// Complete client-facing response: status line, "Connection: close",
// empty body. 200 is the CONNECT tunnel acknowledgement.
std::string StatusReply(int code);

} // namespace protocol
} // namespace fwdproxy
