#pragma once

#include "fwdproxy/protocol/ParsedRequest.h"

#include <cstddef>
#include <optional>
#include <string>

namespace fwdproxy {
namespace network {
class Buffer;
}

namespace protocol {

// Incremental request-head parser for one client connection.
//
// Feed() consumes bytes from the connection's input buffer until the blank
// line that ends the head. Everything after the blank line stays with the
// request as ParsedRequest::pending.
class RequestParser {
public:
    enum Status {
        kNeedMore,
        kComplete,
        kError,
    };

    static const size_t kDefaultMaxHeaderBytes = 16 * 1024;

    explicit RequestParser(size_t maxHeaderBytes = kDefaultMaxHeaderBytes)
        : maxHeaderBytes_(maxHeaderBytes) {}

    Status Feed(network::Buffer* buf);
    // The client closed before the head was complete.
    Status OnClosed();
    // The header read window elapsed.
    Status OnTimeout();

    Status status() const { return status_; }
    ParseError error() const { return error_; }
    const ParsedRequest& request() const { return request_; }
    ParsedRequest& request() { return request_; }
    // Client bytes taken out of the connection buffer so far.
    size_t bytesConsumed() const { return bytesConsumed_; }

    // Parses one complete head (request line through blank line).
    static std::optional<ParsedRequest> Parse(const std::string& head, ParseError* err = nullptr);

private:
    Status Fail(ParseError e);

    size_t maxHeaderBytes_;
    size_t scanned_{0};
    size_t bytesConsumed_{0};
    Status status_{kNeedMore};
    ParseError error_{ParseError::kIncompleteRequest};
    ParsedRequest request_;
};

} // namespace protocol
} // namespace fwdproxy
