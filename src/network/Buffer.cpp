#include "fwdproxy/network/Buffer.h"

#include <errno.h>
#include <sys/uio.h>

namespace fwdproxy {
namespace network {

void Buffer::Reserve(size_t len) {
    if (storage_.size() - write_ >= len) return;

    const size_t readable = ReadableBytes();
    if (read_ > 0) {
        std::memmove(storage_.data(), storage_.data() + read_, readable);
        read_ = 0;
        write_ = readable;
    }
    if (storage_.size() - write_ < len) {
        size_t cap = storage_.empty() ? kInitialSize : storage_.size() * 2;
        while (cap < write_ + len) cap *= 2;
        storage_.resize(cap);
    }
}

ssize_t Buffer::ReadFd(int fd, int* savedErrno) {
    char spill[64 * 1024];
    const size_t room = storage_.size() - write_;

    struct iovec vec[2];
    vec[0].iov_base = storage_.data() + write_;
    vec[0].iov_len = room;
    vec[1].iov_base = spill;
    vec[1].iov_len = sizeof spill;

    const ssize_t n = ::readv(fd, vec, room < sizeof spill ? 2 : 1);
    if (n < 0) {
        *savedErrno = errno;
        return n;
    }
    const size_t got = static_cast<size_t>(n);
    if (got <= room) {
        write_ += got;
    } else {
        write_ = storage_.size();
        Append(spill, got - room);
    }
    return n;
}

} // namespace network
} // namespace fwdproxy
