#pragma once

#include "fwdproxy/common/noncopyable.h"

#include <string>

struct ssl_ctx_st;

namespace fwdproxy {
namespace network {

// Server-side SSL_CTX for the client-facing listener: TLS 1.2 or later,
// ALPN pinned to http/1.1.
class TlsContext : fwdproxy::common::noncopyable {
public:
    TlsContext();
    ~TlsContext();

    // Loads a PEM certificate chain and its private key. Replaces any
    // previous context.
    bool InitServer(const std::string& certPemPath, const std::string& keyPemPath);
    ssl_ctx_st* ctx() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    ssl_ctx_st* ctx_{nullptr};
};

} // namespace network
} // namespace fwdproxy
