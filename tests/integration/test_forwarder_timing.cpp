#include "fwdproxy/common/Logger.h"
#include "fwdproxy/network/EventLoop.h"
#include "fwdproxy/network/InetAddress.h"
#include "fwdproxy/network/TcpConnection.h"
#include "fwdproxy/protocol/ParsedRequest.h"
#include "fwdproxy/relay/HttpForwarder.h"
#include "ProxyTestUtil.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using fwdproxy::network::EventLoop;
using fwdproxy::network::InetAddress;
using fwdproxy::network::TcpConnection;
using fwdproxy::network::TcpConnectionPtr;
using fwdproxy::relay::ForwardResult;
using fwdproxy::relay::HttpForwarder;
using namespace testutil;

namespace {

// Proxy end non-blocking, test end blocking.
static void makePair(int* proxyEnd, int* testEnd) {
    int sv[2];
    assert(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0);
    assert(::fcntl(sv[0], F_SETFL, ::fcntl(sv[0], F_GETFL) | O_NONBLOCK) == 0);
    *proxyEnd = sv[0];
    *testEnd = sv[1];
}

static TcpConnectionPtr wrap(EventLoop* loop, const std::string& name, int fd) {
    auto conn = std::make_shared<TcpConnection>(loop, name, fd, InetAddress(), InetAddress());
    conn->SetCloseCallback([loop](const TcpConnectionPtr& c) {
        loop->QueueInLoop([c]() { c->ConnectDestroyed(); });
    });
    return conn;
}

// Starts reading only after a delay, so the proxy's first write of the
// request cannot complete right away.
static void slowOrigin(int fd, int delayMs, const std::string& response, size_t* received) {
    std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
    std::string in;
    char buf[65536];
    size_t want = std::string::npos;
    while (in.size() < want && pollReadable(fd, 3000)) {
        const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        in.append(buf, static_cast<size_t>(n));
        const size_t headEnd = in.find("\r\n\r\n");
        const size_t cl = in.find("Content-Length: ");
        if (want == std::string::npos && headEnd != std::string::npos && cl != std::string::npos) {
            want = headEnd + 4 + std::stoul(in.substr(cl + 16));
        }
    }
    *received = in.size();
    sendAll(fd, response);
    // The proxy closes first once the body is relayed.
    readToEof(fd, 3000);
    ::close(fd);
}

}  // namespace

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    fwdproxy::common::Logger::Instance().SetLevel(fwdproxy::common::LogLevel::ERROR);

    const std::string body(4 * 1024 * 1024, 'b');
    const std::string response = "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok";

    fwdproxy::protocol::ParsedRequest req;
    req.method = "POST";
    req.target = "http://origin.test/upload";
    req.version = "HTTP/1.1";
    req.scheme = "http";
    req.host = "origin.test";
    req.port = 80;
    req.path = "/upload";
    req.rawHeader = "POST http://origin.test/upload HTTP/1.1\r\nHost: origin.test\r\n"
                    "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
    req.headers.push_back({"Host", "origin.test"});
    req.headers.push_back({"Content-Length", std::to_string(body.size())});
    req.pending = body;

    int clientFd = -1;
    int clientPeer = -1;
    int upstreamFd = -1;
    int originPeer = -1;
    makePair(&clientFd, &clientPeer);
    makePair(&upstreamFd, &originPeer);

    size_t originReceived = 0;
    std::thread origin([&]() { slowOrigin(originPeer, 400, response, &originReceived); });
    std::string clientGot;
    std::thread client([&]() {
        clientGot = readToEof(clientPeer, 5000);
        ::close(clientPeer);
    });

    EventLoop loop;
    TcpConnectionPtr clientConn = wrap(&loop, "client", clientFd);
    TcpConnectionPtr upstreamConn = wrap(&loop, "upstream", upstreamFd);

    HttpForwarder::Options o;
    o.responseIdleSec = 5.0;
    o.lingerSec = 2.0;
    auto forwarder = std::make_shared<HttpForwarder>(&loop, clientConn, upstreamConn, o);
    std::weak_ptr<HttpForwarder> weak(forwarder);
    clientConn->SetMessageCallback([weak](const TcpConnectionPtr&, fwdproxy::network::Buffer* buf,
                                          std::chrono::system_clock::time_point) {
        if (auto f = weak.lock()) f->OnClientData(buf);
    });
    clientConn->SetWriteCompleteCallback([weak](const TcpConnectionPtr&) {
        if (auto f = weak.lock()) f->OnClientWriteComplete();
    });
    clientConn->SetConnectionCallback([weak](const TcpConnectionPtr& c) {
        if (c->connected()) return;
        if (auto f = weak.lock()) f->OnClientClosed();
    });
    clientConn->SetEofCallback([weak](const TcpConnectionPtr&) {
        if (auto f = weak.lock()) f->OnClientEof();
    });
    clientConn->ConnectEstablished();

    std::optional<ForwardResult> result;
    forwarder->Start(req, [&](const ForwardResult& r) {
        result = r;
        loop.QueueInLoop([&]() { loop.Quit(); });
    });
    loop.Loop();
    client.join();
    origin.join();

    assert(result.has_value());
    assert(result->error == fwdproxy::relay::RelayError::kNone);
    assert(result->statusLine == "HTTP/1.1 200 OK");
    assert(clientGot == response);
    assert(result->responsePreview == response);
    assert(result->bytesToUpstream == static_cast<long long>(result->upstreamHead.size() + body.size()));
    assert(originReceived == result->upstreamHead.size() + body.size());

    // The origin stalled before reading; that wait belongs to the request
    // write, not to the time to first byte.
    assert(result->durationSec >= 0.39);
    assert(result->ttfbSec >= 0.0);
    assert(result->ttfbSec < 0.3);
    return 0;
}
