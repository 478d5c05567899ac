#pragma once

#include <cstring>
#include <string>
#include <sys/types.h>
#include <vector>

namespace fwdproxy {
namespace network {

// Byte queue for one direction of a connection.
//
//   [0, read_)       consumed, reclaimed by compaction
//   [read_, write_)  readable
//   [write_, size)   writable
class Buffer {
public:
    static const size_t kInitialSize = 4096;

    explicit Buffer(size_t initialSize = kInitialSize)
        : storage_(initialSize), read_(0), write_(0) {}

    size_t ReadableBytes() const { return write_ - read_; }
    const char* Peek() const { return storage_.data() + read_; }
    const char* BeginWrite() const { return storage_.data() + write_; }

    // Next '\n' at or after start, or nullptr.
    const char* FindEOL(const char* start) const {
        return static_cast<const char*>(std::memchr(start, '\n', static_cast<size_t>(BeginWrite() - start)));
    }

    void Retrieve(size_t len) {
        if (len >= ReadableBytes()) {
            RetrieveAll();
        } else {
            read_ += len;
        }
    }
    void RetrieveAll() { read_ = write_ = 0; }

    std::string RetrieveAsString(size_t len) {
        if (len > ReadableBytes()) len = ReadableBytes();
        std::string out(Peek(), len);
        Retrieve(len);
        return out;
    }
    std::string RetrieveAllAsString() { return RetrieveAsString(ReadableBytes()); }

    void Append(const std::string& str) { Append(str.data(), str.size()); }
    void Append(const char* data, size_t len) {
        Reserve(len);
        std::memcpy(storage_.data() + write_, data, len);
        write_ += len;
    }

    // One readv(2): fills the free tail, spilling into a stack buffer.
    // Returns what readv returned; *savedErrno is set on -1.
    ssize_t ReadFd(int fd, int* savedErrno);

private:
    // Guarantees len writable bytes, compacting before growing.
    void Reserve(size_t len);

    std::vector<char> storage_;
    size_t read_;
    size_t write_;
};

} // namespace network
} // namespace fwdproxy
