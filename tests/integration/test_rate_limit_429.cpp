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

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    fwdproxy::common::Logger::Instance().SetLevel(fwdproxy::common::LogLevel::ERROR);

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
    opts.rateLimit.maxRequests = 2;
    opts.rateLimit.windowSec = 60.0;
    fwdproxy::ProxyServer server(&loop, opts);
    auto sink = std::make_shared<CaptureSink>();
    server.SetMetricsSink(sink);
    assert(server.Start());
    const uint16_t proxyPort = server.ListenPort();

    const std::string head = "CONNECT 127.0.0.1:" + std::to_string(backendPort) + " HTTP/1.1\r\n\r\n";
    const std::string established = "HTTP/1.1 200 Connection Established\r\nConnection: close\r\n\r\n";
    const std::string tooMany = "HTTP/1.1 429 Too Many Requests\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";

    std::thread client([&]() {
        for (int i = 0; i < 2; ++i) {
            int fd = connectTo(proxyPort);
            assert(fd >= 0);
            sendAll(fd, head + "hi");
            std::string got;
            char buf[256];
            while (got.size() < established.size() + 2 && pollReadable(fd, 3000)) {
                ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
                if (n <= 0) break;
                got.append(buf, static_cast<size_t>(n));
            }
            assert(got == established + "hi");
            ::close(fd);
            assert(sink->WaitForRequests(static_cast<size_t>(i) + 1, 3000));
        }

        // Third and fourth requests in the same window.
        assert(roundTrip(proxyPort, head) == tooMany);
        assert(sink->WaitForRequests(3, 3000));
        assert(roundTrip(proxyPort, "GET http://127.0.0.1:1/ HTTP/1.1\r\n\r\n") == tooMany);
        assert(sink->WaitForRequests(4, 3000));

        for (size_t i = 0; i < 2; ++i) {
            assert(sink->Request(i).terminalState == "COMPLETED");
        }
        const MetricsRecord limited = sink->Request(2);
        assert(limited.terminalState == "RATE_LIMITED");
        assert(limited.outcome == "HTTP/1.1 429 Too Many Requests");
        assert(limited.error == "RateLimited");
        assert(limited.targetPort == backendPort);
        assert(limited.bytesSent == static_cast<long long>(tooMany.size()));
        assert(limited.bytesReceived == static_cast<long long>(head.size()));
        assert(limited.ttfbSec < 0.0);
        assert(sink->Request(3).terminalState == "RATE_LIMITED");
        assert(sink->Request(3).method == "GET");

        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    stop.store(true);
    bt.join();
    return 0;
}
