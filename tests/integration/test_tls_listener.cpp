#include "fwdproxy/ProxyServer.h"
#include "fwdproxy/common/Logger.h"
#include "fwdproxy/network/EventLoop.h"
#include "ProxyTestUtil.h"

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <signal.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cassert>
#include <cstdio>
#include <string>
#include <thread>

using fwdproxy::network::EventLoop;
using namespace testutil;

namespace {

// Throwaway RSA key and self-signed certificate for CN=localhost.
static bool writeSelfSignedPair(const char* certPath, const char* keyPath) {
    EVP_PKEY* pkey = nullptr;
    EVP_PKEY_CTX* kctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
    bool ok = kctx && EVP_PKEY_keygen_init(kctx) == 1 &&
              EVP_PKEY_CTX_set_rsa_keygen_bits(kctx, 2048) == 1 &&
              EVP_PKEY_keygen(kctx, &pkey) == 1;
    EVP_PKEY_CTX_free(kctx);
    if (!ok) {
        EVP_PKEY_free(pkey);
        return false;
    }

    X509* cert = X509_new();
    X509_set_version(cert, 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert), 3600);
    X509_set_pubkey(cert, pkey);
    X509_NAME* name = X509_get_subject_name(cert);
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
    X509_set_issuer_name(cert, name);
    ok = X509_sign(cert, pkey, EVP_sha256()) > 0;

    std::FILE* cf = std::fopen(certPath, "w");
    std::FILE* kf = std::fopen(keyPath, "w");
    ok = ok && cf && kf && PEM_write_X509(cf, cert) == 1 &&
         PEM_write_PrivateKey(kf, pkey, nullptr, nullptr, 0, nullptr, nullptr) == 1;
    if (cf) std::fclose(cf);
    if (kf) std::fclose(kf);
    X509_free(cert);
    EVP_PKEY_free(pkey);
    return ok;
}

static bool sslWriteAll(SSL* ssl, const std::string& s) {
    size_t off = 0;
    while (off < s.size()) {
        const int n = SSL_write(ssl, s.data() + off, static_cast<int>(s.size() - off));
        if (n <= 0) return false;
        off += static_cast<size_t>(n);
    }
    return true;
}

static std::string sslReadExactly(SSL* ssl, size_t want) {
    std::string out;
    char buf[4096];
    while (out.size() < want) {
        const int n = SSL_read(ssl, buf, static_cast<int>(std::min(sizeof(buf), want - out.size())));
        if (n <= 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

static std::string recvExactly(int fd, size_t want, int timeoutMs) {
    std::string out;
    char buf[4096];
    while (out.size() < want && pollReadable(fd, timeoutMs)) {
        const ssize_t n = ::recv(fd, buf, std::min(sizeof(buf), want - out.size()), 0);
        if (n <= 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

}  // namespace

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    fwdproxy::common::Logger::Instance().SetLevel(fwdproxy::common::LogLevel::ERROR);

    const char* certPath = "tls_listener_test_cert.pem";
    const char* keyPath = "tls_listener_test_key.pem";
    assert(writeSelfSignedPair(certPath, keyPath));

    int bfd = -1;
    const auto backendPortOpt = bindEphemeralTcpPort(&bfd);
    assert(backendPortOpt.has_value());
    const uint16_t backendPort = *backendPortOpt;
    std::atomic<bool> stop{false};
    std::thread bt([&]() { echoBackendServer(bfd, &stop); });

    EventLoop loop;
    fwdproxy::ProxyOptions opts;
    opts.listenPort = 0;
    opts.loopbackOnly = true;
    opts.threads = 1;
    opts.tlsEnable = true;
    opts.tlsCertPath = certPath;
    opts.tlsKeyPath = keyPath;
    fwdproxy::ProxyServer server(&loop, opts);
    auto sink = std::make_shared<CaptureSink>();
    server.SetMetricsSink(sink);
    assert(server.Start());
    const uint16_t proxyPort = server.ListenPort();

    // Missing key material refuses to start.
    {
        fwdproxy::ProxyOptions broken = opts;
        broken.tlsKeyPath = "does-not-exist.pem";
        fwdproxy::ProxyServer refused(&loop, broken, "refused");
        assert(!refused.Start());
    }

    const std::string established = "HTTP/1.1 200 Connection Established\r\nConnection: close\r\n\r\n";
    const std::string head = "CONNECT 127.0.0.1:" + std::to_string(backendPort) + " HTTP/1.1\r\n"
                             "Host: 127.0.0.1:" + std::to_string(backendPort) + "\r\n\r\n";

    std::thread client([&]() {
        // CONNECT inside TLS to the proxy; the tunnel itself is plain bytes.
        {
            SSL_CTX* cctx = SSL_CTX_new(TLS_client_method());
            assert(cctx);
            SSL_CTX_set_verify(cctx, SSL_VERIFY_NONE, nullptr);

            const int fd = connectTo(proxyPort);
            assert(fd >= 0);
            timeval tv{3, 0};
            ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

            SSL* ssl = SSL_new(cctx);
            assert(ssl);
            SSL_set_fd(ssl, fd);
            assert(SSL_connect(ssl) == 1);

            assert(sslWriteAll(ssl, head));
            assert(sslReadExactly(ssl, established.size()) == established);
            assert(sslWriteAll(ssl, "secret-ping"));
            assert(sslReadExactly(ssl, 11) == "secret-ping");

            // close_notify ends the client direction; wait for the proxy's.
            SSL_shutdown(ssl);
            char c;
            assert(SSL_read(ssl, &c, 1) <= 0);

            SSL_free(ssl);
            ::close(fd);
            SSL_CTX_free(cctx);
        }
        assert(sink->WaitForRequests(1, 3000));
        {
            const MetricsRecord r = sink->Request(0);
            assert(r.terminalState == "COMPLETED");
            assert(r.tunnel);
            assert(r.targetPort == backendPort);
            assert(r.rawHeader == head);
            assert(r.upstreamBytesSent == 11);
            assert(r.upstreamBytesReceived == 11);
        }

        // A plaintext client on the same listener.
        {
            const int fd = connectTo(proxyPort);
            assert(fd >= 0);
            sendAll(fd, head + "plain");
            assert(recvExactly(fd, established.size() + 5, 3000) == established + "plain");
            assert(::shutdown(fd, SHUT_WR) == 0);
            assert(readToEof(fd, 3000).empty());
            ::close(fd);
        }
        assert(sink->WaitForRequests(2, 3000));
        {
            const MetricsRecord r = sink->Request(1);
            assert(r.terminalState == "COMPLETED");
            assert(r.upstreamBytesSent == 5);
        }

        // A handshake record that is not TLS at all.
        {
            const int fd = connectTo(proxyPort);
            assert(fd >= 0);
            sendAll(fd, std::string("\x16\x03\x01\x00\x05hello", 10));
            readToEof(fd, 3000);
            ::close(fd);
        }
        assert(sink->WaitForRequests(3, 3000));
        assert(sink->Request(2).terminalState == "MALFORMED");

        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    stop.store(true);
    bt.join();
    std::remove(certPath);
    std::remove(keyPath);
    return 0;
}
