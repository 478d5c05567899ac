#pragma once

#include "fwdproxy/common/noncopyable.h"

#include <string>
#include <sys/types.h>

struct ssl_ctx_st;
struct ssl_st;

namespace fwdproxy {
namespace network {

// Server side TLS over one accepted, non-blocking socket. The first byte the
// client sends decides the mode: a handshake record switches to TLS, anything
// else leaves the connection in plaintext. Read and Write follow the
// TcpConnection convention: -2 means retry on the next readiness event.
class TlsStream : fwdproxy::common::noncopyable {
public:
    enum Phase { kUndecided, kPlain, kHandshaking, kEstablished, kFailed };

    TlsStream(ssl_ctx_st* ctx, int fd, const std::string& owner);
    ~TlsStream();

    Phase phase() const { return phase_; }
    bool established() const { return phase_ == kEstablished; }
    // OpenSSL is blocked on socket writability, not readability.
    bool wantsWrite() const { return wantWrite_; }

    // Peeks without consuming. Stays kUndecided until a byte is available.
    Phase Sniff();
    Phase Handshake();

    // > 0 bytes, 0 on close_notify, -1 with *savedErrno set, -2 retry.
    ssize_t Read(char* buf, size_t cap, int* savedErrno);
    ssize_t Write(const void* data, size_t len, int* savedErrno);

    // Sends close_notify once; the caller still shuts the socket down.
    void Shutdown();

private:
    static constexpr unsigned char kHandshakeRecord = 0x16;

    ssize_t Failed(int ret, int* savedErrno);
    void LogFailure(const char* what);

    ssl_ctx_st* ctx_;
    const int fd_;
    const std::string owner_;
    ssl_st* ssl_;
    Phase phase_;
    bool wantWrite_;
    bool shutdownSent_;
};

} // namespace network
} // namespace fwdproxy
