#include "fwdproxy/ProxyServer.h"
#include "fwdproxy/common/Logger.h"
#include "fwdproxy/network/EventLoop.h"
#include "ProxyTestUtil.h"

#include <arpa/inet.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstring>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using fwdproxy::network::EventLoop;
using namespace testutil;

namespace {

// Reads one request head plus a Content-Length body.
static std::string readRequest(int fd, int timeoutMs) {
    std::string in;
    char buf[4096];
    size_t headEnd = std::string::npos;
    while (headEnd == std::string::npos && pollReadable(fd, timeoutMs)) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return in;
        in.append(buf, static_cast<size_t>(n));
        headEnd = in.find("\r\n\r\n");
    }
    if (headEnd == std::string::npos) return in;
    size_t bodyLen = 0;
    const size_t cl = in.find("Content-Length: ");
    if (cl != std::string::npos && cl < headEnd) bodyLen = std::stoul(in.substr(cl + 16));
    while (in.size() < headEnd + 4 + bodyLen && pollReadable(fd, timeoutMs)) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        in.append(buf, static_cast<size_t>(n));
    }
    return in;
}

struct OriginExchange {
    std::string response;
    bool closeAfterResponse;  // false: wait for the proxy to close first
    std::string received;
    bool sawProxyClose{false};
};

static void originServer(int lfd, std::vector<OriginExchange>* exchanges) {
    for (auto& ex : *exchanges) {
        if (!pollReadable(lfd, 5000)) break;
        int cfd = ::accept(lfd, nullptr, nullptr);
        if (cfd < 0) break;
        ex.received = readRequest(cfd, 2000);
        sendAll(cfd, ex.response);
        if (!ex.closeAfterResponse) {
            char c;
            ex.sawProxyClose = pollReadable(cfd, 3000) && ::recv(cfd, &c, 1, 0) == 0;
        }
        ::close(cfd);
    }
    ::close(lfd);
}

}  // namespace

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    fwdproxy::common::Logger::Instance().SetLevel(fwdproxy::common::LogLevel::ERROR);

    int ofd = -1;
    const auto originPortOpt = bindEphemeralTcpPort(&ofd);
    assert(originPortOpt.has_value());
    const uint16_t originPort = *originPortOpt;
    const std::string authority = "127.0.0.1:" + std::to_string(originPort);

    const std::string resp1 = "HTTP/1.1 200 OK\r\nContent-Length: 5\r\nX-Origin: yes\r\n\r\nhello";
    const std::string resp2 = "HTTP/1.1 201 Created\r\nContent-Type: text/plain\r\n\r\nstored until close";
    const std::string resp3 = "HTTP/1.1 200 OK\r\nContent-Length: 9\r\n\r\nafter fin";
    std::vector<OriginExchange> exchanges;
    exchanges.push_back(OriginExchange{resp1, false, std::string()});
    exchanges.push_back(OriginExchange{resp2, true, std::string()});
    exchanges.push_back(OriginExchange{resp3, true, std::string()});
    std::thread origin([&]() { originServer(ofd, &exchanges); });

    EventLoop loop;
    fwdproxy::ProxyOptions opts;
    opts.listenPort = 0;
    opts.loopbackOnly = true;
    opts.threads = 1;
    fwdproxy::ProxyServer server(&loop, opts);
    auto sink = std::make_shared<CaptureSink>();
    server.SetMetricsSink(sink);
    assert(server.Start());
    const uint16_t proxyPort = server.ListenPort();
    assert(proxyPort != 0);

    const std::string req1 = "GET http://" + authority + "/path?x=1 HTTP/1.1\r\n"
                             "Host: " + authority + "\r\n"
                             "Proxy-Connection: keep-alive\r\n"
                             "Accept: */*\r\n\r\n";
    const std::string req2 = "POST http://" + authority + "/upload HTTP/1.1\r\n"
                             "Host: " + authority + "\r\n"
                             "Content-Length: 4\r\n\r\nping";
    const std::string req3 = "GET http://" + authority + "/ HTTP/1.1\r\n"
                             "Host: " + authority + "\r\n\r\n";

    std::thread client([&]() {
        // Fixed-length response; the proxy closes both sides after the body.
        {
            int fd = connectTo(proxyPort);
            assert(fd >= 0);
            sendAll(fd, req1);
            const std::string got = readToEof(fd, 3000);
            ::close(fd);
            assert(got == resp1);
        }
        assert(sink->WaitForRequests(1, 3000));
        {
            const MetricsRecord r = sink->Request(0);
            assert(r.terminalState == "COMPLETED");
            assert(r.error.empty());
            assert(r.outcome == "HTTP/1.1 200 OK");
            assert(r.method == "GET");
            assert(!r.tunnel);
            assert(r.targetHost == "127.0.0.1");
            assert(r.targetPort == originPort);
            assert(r.clientIp == "127.0.0.1");
            assert(r.rawHeader == req1);
            assert(r.bytesSent == static_cast<long long>(resp1.size()));
            assert(r.bytesReceived == static_cast<long long>(req1.size()));
            assert(r.upstreamBytesReceived == static_cast<long long>(resp1.size()));
            assert(r.upstreamBytesSent > 0);
            assert(r.ttfbSec >= 0.0);
            assert(r.durationSec >= r.ttfbSec);
            assert(r.upstreamHeader.find("GET /path?x=1 HTTP/1.1\r\n") == 0);
            assert(r.upstreamHeader.find("Connection: close\r\n\r\n") != std::string::npos);
            assert(r.upstreamBytesSent == static_cast<long long>(r.upstreamHeader.size()));
            assert(r.responsePreview == resp1);
        }

        // Request body, response delimited by close.
        {
            int fd = connectTo(proxyPort);
            assert(fd >= 0);
            sendAll(fd, req2);
            const std::string got = readToEof(fd, 3000);
            ::close(fd);
            assert(got == resp2);
        }
        assert(sink->WaitForRequests(2, 3000));
        {
            const MetricsRecord r = sink->Request(1);
            assert(r.terminalState == "COMPLETED");
            assert(r.outcome == "HTTP/1.1 201 Created");
            assert(r.method == "POST");
            assert(r.bytesReceived == static_cast<long long>(req2.size()));
            assert(r.bytesSent == static_cast<long long>(resp2.size()));
        }

        // The client half-closes right after the head and still gets the answer.
        {
            int fd = connectTo(proxyPort);
            assert(fd >= 0);
            sendAll(fd, req3);
            assert(::shutdown(fd, SHUT_WR) == 0);
            const std::string got = readToEof(fd, 3000);
            ::close(fd);
            assert(got == resp3);
        }
        assert(sink->WaitForRequests(3, 3000));
        {
            const MetricsRecord r = sink->Request(2);
            assert(r.terminalState == "COMPLETED");
            assert(r.error.empty());
            assert(r.outcome == "HTTP/1.1 200 OK");
            assert(r.bytesSent == static_cast<long long>(resp3.size()));
        }

        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    origin.join();

    // What the origin saw: origin-form, Host first, proxy headers gone.
    const std::string& up1 = exchanges[0].received;
    assert(up1.find("GET /path?x=1 HTTP/1.1\r\nHost: " + authority + "\r\n") == 0);
    assert(up1.find("Accept: */*\r\n") != std::string::npos);
    assert(up1.find("Connection: close\r\n\r\n") != std::string::npos);
    assert(up1.find("Proxy-Connection") == std::string::npos);
    assert(exchanges[0].sawProxyClose);

    const std::string& up2 = exchanges[1].received;
    assert(up2.find("POST /upload HTTP/1.1\r\n") == 0);
    assert(up2.size() >= 4 && up2.compare(up2.size() - 4, 4, "ping") == 0);
    return 0;
}
