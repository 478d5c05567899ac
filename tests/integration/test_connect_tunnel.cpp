#include "fwdproxy/ProxyServer.h"
#include "fwdproxy/common/Logger.h"
#include "fwdproxy/monitor/Stats.h"
#include "fwdproxy/network/EventLoop.h"
#include "ProxyTestUtil.h"

#include <arpa/inet.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
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

static std::string recvExactly(int fd, size_t want, int timeoutMs) {
    std::string out;
    char buf[8192];
    while (out.size() < want && pollReadable(fd, timeoutMs)) {
        ssize_t n = ::recv(fd, buf, std::min(sizeof(buf), want - out.size()), 0);
        if (n <= 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

static void echoBackendServer(int lfd, std::atomic<bool>* stop, std::atomic<bool>* sawClose) {
    while (!stop->load()) {
        if (!pollReadable(lfd, 200)) continue;
        int cfd = ::accept(lfd, nullptr, nullptr);
        if (cfd < 0) continue;
        while (!stop->load()) {
            if (!pollReadable(cfd, 200)) continue;
            char buf[8192];
            ssize_t n = ::recv(cfd, buf, sizeof(buf), 0);
            if (n <= 0) {
                if (n == 0) sawClose->store(true);
                break;
            }
            const std::string chunk(buf, static_cast<size_t>(n));
            // "BYE" makes the backend end the connection first.
            if (chunk == "BYE") break;
            sendAll(cfd, chunk);
        }
        ::close(cfd);
    }
    ::close(lfd);
}

// One connection: reads until the client's FIN, then answers with the
// byte count and closes.
static void replyAfterEofServer(int lfd) {
    if (pollReadable(lfd, 5000)) {
        int cfd = ::accept(lfd, nullptr, nullptr);
        if (cfd >= 0) {
            const std::string got = readToEof(cfd, 3000);
            sendAll(cfd, "RESPONSE-" + std::to_string(got.size()));
            ::close(cfd);
        }
    }
    ::close(lfd);
}

}  // namespace

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    fwdproxy::common::Logger::Instance().SetLevel(fwdproxy::common::LogLevel::ERROR);

    int bfd = -1;
    const auto backendPortOpt = bindEphemeralTcpPort(&bfd);
    assert(backendPortOpt.has_value());
    const uint16_t backendPort = *backendPortOpt;
    std::atomic<bool> stop{false};
    std::atomic<bool> backendSawClose{false};
    std::thread bt([&]() { echoBackendServer(bfd, &stop, &backendSawClose); });

    int rfd = -1;
    const auto replyPortOpt = bindEphemeralTcpPort(&rfd);
    assert(replyPortOpt.has_value());
    const uint16_t replyPort = *replyPortOpt;
    std::thread rt([&]() { replyAfterEofServer(rfd); });

    EventLoop loop;
    fwdproxy::ProxyOptions opts;
    opts.listenPort = 0;
    opts.loopbackOnly = true;
    opts.threads = 2;
    fwdproxy::ProxyServer server(&loop, opts);
    auto sink = std::make_shared<CaptureSink>();
    server.SetMetricsSink(sink);
    assert(server.Start());
    const uint16_t proxyPort = server.ListenPort();

    const std::string established = "HTTP/1.1 200 Connection Established\r\nConnection: close\r\n\r\n";
    const std::string head = "CONNECT 127.0.0.1:" + std::to_string(backendPort) + " HTTP/1.1\r\n"
                             "Host: 127.0.0.1:" + std::to_string(backendPort) + "\r\n\r\n";

    std::string binary;
    binary.reserve(64 * 1024);
    for (size_t i = 0; i < 64 * 1024; ++i) binary.push_back(static_cast<char>(i * 31 % 256));

    std::thread client([&]() {
        int fd = connectTo(proxyPort);
        assert(fd >= 0);

        // Bytes that follow the head in the same segment go through the tunnel.
        sendAll(fd, head + "EARLY");
        const std::string first = recvExactly(fd, established.size() + 5, 3000);
        assert(first == established + "EARLY");

        sendAll(fd, "PING-1");
        assert(recvExactly(fd, 6, 3000) == "PING-1");

        sendAll(fd, binary);
        assert(recvExactly(fd, binary.size(), 5000) == binary);

        ::close(fd);
        assert(sink->WaitForRequests(1, 3000));

        const MetricsRecord r = sink->Request(0);
        const long long payload = static_cast<long long>(5 + 6 + binary.size());
        assert(r.terminalState == "COMPLETED");
        assert(r.tunnel);
        assert(r.method == "CONNECT");
        assert(r.targetHost == "127.0.0.1");
        assert(r.targetPort == backendPort);
        assert(r.outcome == "HTTP/1.1 200 Connection Established");
        assert(r.rawHeader == head);
        assert(r.upstreamBytesSent == payload);
        assert(r.upstreamBytesReceived == payload);
        assert(r.bytesSent == static_cast<long long>(established.size()) + payload);
        assert(r.bytesReceived == static_cast<long long>(head.size()) + payload);
        assert(r.ttfbSec >= 0.0);

        // A second tunnel that the upstream ends first.
        {
            int fd2 = connectTo(proxyPort);
            assert(fd2 >= 0);
            sendAll(fd2, head);
            assert(recvExactly(fd2, established.size(), 3000) == established);
            sendAll(fd2, "BYE");
            const std::string rest = readToEof(fd2, 3000);
            assert(rest.empty());
            ::close(fd2);
        }
        assert(sink->WaitForRequests(2, 3000));
        const MetricsRecord r2 = sink->Request(1);
        assert(r2.terminalState == "COMPLETED");
        assert(r2.upstreamBytesSent == 3);
        assert(r2.upstreamBytesReceived == 0);
        assert(r2.bytesSent == static_cast<long long>(established.size()));
        assert(r2.ttfbSec >= 0.0);

        // The client half-closes; the upstream's answer still comes back.
        {
            const std::string replyHead = "CONNECT 127.0.0.1:" + std::to_string(replyPort) + " HTTP/1.1\r\n"
                                          "Host: 127.0.0.1:" + std::to_string(replyPort) + "\r\n\r\n";
            int fd3 = connectTo(proxyPort);
            assert(fd3 >= 0);
            sendAll(fd3, replyHead);
            assert(recvExactly(fd3, established.size(), 3000) == established);
            sendAll(fd3, "hello");
            assert(::shutdown(fd3, SHUT_WR) == 0);
            assert(readToEof(fd3, 3000) == "RESPONSE-5");
            ::close(fd3);
        }
        assert(sink->WaitForRequests(3, 3000));
        const MetricsRecord r3 = sink->Request(2);
        assert(r3.terminalState == "COMPLETED");
        assert(r3.error.empty());
        assert(r3.targetPort == replyPort);
        assert(r3.upstreamBytesSent == 5);
        assert(r3.upstreamBytesReceived == 10);
        assert(r3.bytesSent == static_cast<long long>(established.size()) + 10);

        // Process byte totals count each session's client-facing bytes once.
        long long totalIn = 0;
        long long totalOut = 0;
        for (size_t i = 0; i < sink->RequestCount(); ++i) {
            const MetricsRecord ri = sink->Request(i);
            totalIn += ri.bytesReceived;
            totalOut += ri.bytesSent;
        }
        const auto& stats = fwdproxy::monitor::Stats::Instance();
        assert(stats.GetBytesIn() == totalIn);
        assert(stats.GetBytesOut() == totalOut);

        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    stop.store(true);
    bt.join();
    rt.join();
    assert(backendSawClose.load());
    return 0;
}
