#include "fwdproxy/network/Buffer.h"
#include "fwdproxy/common/Logger.h"

#include <unistd.h>

#include <cassert>
#include <cerrno>
#include <cstring>
#include <string>

using fwdproxy::network::Buffer;

int main() {
    fwdproxy::common::Logger::Instance().SetLevel(fwdproxy::common::LogLevel::ERROR);

    // Append, partial retrieve, then compaction keeps the unread tail.
    {
        Buffer buf(16);
        buf.Append("GET / HTTP/1.1\r\n");
        assert(buf.ReadableBytes() == 16);
        buf.Retrieve(4);
        assert(std::string(buf.Peek(), 3) == "/ H");
        buf.Append("Host: a\r\n\r\n");
        assert(buf.RetrieveAllAsString() == "/ HTTP/1.1\r\nHost: a\r\n\r\n");
        assert(buf.ReadableBytes() == 0);
    }

    // FindEOL scans from an offset inside the readable region.
    {
        Buffer buf;
        buf.Append("a\nbc\n");
        const char* first = buf.FindEOL(buf.Peek());
        assert(first == buf.Peek() + 1);
        const char* second = buf.FindEOL(first + 1);
        assert(second == buf.Peek() + 4);
        assert(buf.FindEOL(second + 1) == nullptr);
    }

    // Over-retrieving clamps instead of running past the data.
    {
        Buffer buf(0);
        buf.Append("xyz");
        assert(buf.RetrieveAsString(10) == "xyz");
        buf.Retrieve(5);
        assert(buf.ReadableBytes() == 0);
    }

    // ReadFd spills past the free tail into the stack buffer.
    {
        int fds[2];
        assert(::pipe(fds) == 0);
        const std::string payload(20000, 'p');
        assert(::write(fds[1], payload.data(), payload.size()) == static_cast<ssize_t>(payload.size()));
        ::close(fds[1]);

        Buffer buf(128);
        int err = 0;
        for (;;) {
            const ssize_t n = buf.ReadFd(fds[0], &err);
            assert(n >= 0);
            if (n == 0) break;
        }
        assert(buf.RetrieveAllAsString() == payload);
        ::close(fds[0]);

        err = 0;
        assert(buf.ReadFd(-1, &err) < 0);
        assert(err == EBADF);
    }

    return 0;
}
