#include "fwdproxy/network/TlsContext.h"
#include "fwdproxy/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <mutex>

namespace fwdproxy {
namespace network {

namespace {

std::string LastSslError() {
    unsigned long e = ERR_get_error();
    if (e == 0) return "unknown";
    char buf[256];
    ERR_error_string_n(e, buf, sizeof(buf));
    return buf;
}

// The proxy speaks HTTP/1.1 only; a client offering h2 must fall back.
int SelectHttp11(SSL*, const unsigned char** out, unsigned char* outlen,
                 const unsigned char* in, unsigned int inlen, void*) {
    static const unsigned char kHttp11[] = {8, 'h', 't', 't', 'p', '/', '1', '.', '1'};
    unsigned char* selected = nullptr;
    if (SSL_select_next_proto(&selected, outlen, kHttp11, sizeof(kHttp11), in, inlen) != OPENSSL_NPN_NEGOTIATED) {
        return SSL_TLSEXT_ERR_NOACK;
    }
    *out = selected;
    return SSL_TLSEXT_ERR_OK;
}

} // namespace

TlsContext::TlsContext() {
    static std::once_flag once;
    std::call_once(once, []() {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    });
}

TlsContext::~TlsContext() {
    if (ctx_) {
        SSL_CTX_free(reinterpret_cast<SSL_CTX*>(ctx_));
        ctx_ = nullptr;
    }
}

bool TlsContext::InitServer(const std::string& certPemPath, const std::string& keyPemPath) {
    if (certPemPath.empty() || keyPemPath.empty()) {
        LOG_ERROR << "TLS: [tls] cert_path and key_path are both required";
        return false;
    }
    if (ctx_) {
        SSL_CTX_free(reinterpret_cast<SSL_CTX*>(ctx_));
        ctx_ = nullptr;
    }

    SSL_CTX* c = SSL_CTX_new(TLS_server_method());
    if (!c) {
        LOG_ERROR << "TLS: SSL_CTX_new failed: " << LastSslError();
        return false;
    }

    SSL_CTX_set_min_proto_version(c, TLS1_2_VERSION);
    SSL_CTX_set_options(c, SSL_OP_NO_COMPRESSION);
    SSL_CTX_set_mode(c, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
    SSL_CTX_set_alpn_select_cb(c, SelectHttp11, nullptr);

    if (SSL_CTX_use_certificate_chain_file(c, certPemPath.c_str()) != 1) {
        LOG_ERROR << "TLS: load cert failed: " << certPemPath << " (" << LastSslError() << ")";
        SSL_CTX_free(c);
        return false;
    }
    if (SSL_CTX_use_PrivateKey_file(c, keyPemPath.c_str(), SSL_FILETYPE_PEM) != 1) {
        LOG_ERROR << "TLS: load key failed: " << keyPemPath << " (" << LastSslError() << ")";
        SSL_CTX_free(c);
        return false;
    }
    if (SSL_CTX_check_private_key(c) != 1) {
        LOG_ERROR << "TLS: key does not match cert";
        SSL_CTX_free(c);
        return false;
    }

    ctx_ = reinterpret_cast<ssl_ctx_st*>(c);
    return true;
}

} // namespace network
} // namespace fwdproxy
