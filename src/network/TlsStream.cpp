#include "fwdproxy/network/TlsStream.h"
#include "fwdproxy/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <errno.h>
#include <sys/socket.h>

namespace fwdproxy {
namespace network {

TlsStream::TlsStream(ssl_ctx_st* ctx, int fd, const std::string& owner)
    : ctx_(ctx),
      fd_(fd),
      owner_(owner),
      ssl_(nullptr),
      phase_(kUndecided),
      wantWrite_(false),
      shutdownSent_(false) {}

TlsStream::~TlsStream() {
    if (ssl_) SSL_free(ssl_);
}

TlsStream::Phase TlsStream::Sniff() {
    if (phase_ != kUndecided) return phase_;

    unsigned char first = 0;
    if (::recv(fd_, &first, 1, MSG_PEEK) != 1) return phase_;
    if (first != kHandshakeRecord) {
        phase_ = kPlain;
        return phase_;
    }

    ssl_ = SSL_new(ctx_);
    if (!ssl_ || SSL_set_fd(ssl_, fd_) != 1) {
        LogFailure("session setup");
        phase_ = kFailed;
        return phase_;
    }
    SSL_set_accept_state(ssl_);
    phase_ = kHandshaking;
    return phase_;
}

TlsStream::Phase TlsStream::Handshake() {
    if (phase_ != kHandshaking) return phase_;

    const int r = SSL_do_handshake(ssl_);
    if (r == 1) {
        wantWrite_ = false;
        phase_ = kEstablished;
        LOG_DEBUG << "TLS established [" << owner_ << "] " << SSL_get_version(ssl_);
        return phase_;
    }
    switch (SSL_get_error(ssl_, r)) {
        case SSL_ERROR_WANT_READ:
            wantWrite_ = false;
            break;
        case SSL_ERROR_WANT_WRITE:
            wantWrite_ = true;
            break;
        default:
            LogFailure("handshake");
            phase_ = kFailed;
            break;
    }
    return phase_;
}

ssize_t TlsStream::Read(char* buf, size_t cap, int* savedErrno) {
    if (cap == 0) return 0;
    const int r = SSL_read(ssl_, buf, static_cast<int>(cap));
    if (r > 0) {
        wantWrite_ = false;
        return r;
    }
    return Failed(r, savedErrno);
}

// Partial writes are enabled on the context, so r may be less than len.
ssize_t TlsStream::Write(const void* data, size_t len, int* savedErrno) {
    if (len == 0) return 0;
    const int r = SSL_write(ssl_, data, static_cast<int>(len));
    if (r > 0) return r;
    return Failed(r, savedErrno);
}

void TlsStream::Shutdown() {
    if (phase_ != kEstablished || shutdownSent_) return;
    shutdownSent_ = true;
    // 0 means close_notify went out and the peer's is still pending.
    if (SSL_shutdown(ssl_) < 0) ERR_clear_error();
}

ssize_t TlsStream::Failed(int ret, int* savedErrno) {
    const int e = SSL_get_error(ssl_, ret);
    if (e == SSL_ERROR_WANT_READ || e == SSL_ERROR_WANT_WRITE) {
        wantWrite_ = (e == SSL_ERROR_WANT_WRITE);
        return -2;
    }
    if (e == SSL_ERROR_ZERO_RETURN) return 0;
    if (e == SSL_ERROR_SYSCALL && errno != 0) {
        *savedErrno = errno;
    } else {
        *savedErrno = EIO;
    }
    ERR_clear_error();
    return -1;
}

void TlsStream::LogFailure(const char* what) {
    char detail[256] = "no error queued";
    const unsigned long code = ERR_get_error();
    if (code != 0) ERR_error_string_n(code, detail, sizeof(detail));
    ERR_clear_error();
    LOG_WARN << "TLS " << what << " failed [" << owner_ << "]: " << detail;
}

} // namespace network
} // namespace fwdproxy
