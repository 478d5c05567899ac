#include "fwdproxy/protocol/StatusReply.h"

#include <cassert>
#include <string>

using fwdproxy::protocol::StatusLine;
using fwdproxy::protocol::StatusReply;

int main() {
    assert(StatusLine(400) == "HTTP/1.1 400 Bad Request");
    assert(StatusLine(403) == "HTTP/1.1 403 Forbidden");
    assert(StatusLine(429) == "HTTP/1.1 429 Too Many Requests");
    assert(StatusLine(502) == "HTTP/1.1 502 Bad Gateway");
    assert(StatusLine(200) == "HTTP/1.1 200 Connection Established");

    assert(StatusReply(403) == "HTTP/1.1 403 Forbidden\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
    assert(StatusReply(200) == "HTTP/1.1 200 Connection Established\r\nConnection: close\r\n\r\n");
    return 0;
}
