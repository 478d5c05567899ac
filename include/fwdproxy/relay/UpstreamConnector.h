#pragma once

#include "fwdproxy/common/noncopyable.h"
#include "fwdproxy/network/Callbacks.h"
#include "fwdproxy/network/Connector.h"
#include "fwdproxy/network/InetAddress.h"
#include "fwdproxy/relay/RelayError.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fwdproxy {
namespace network {
class EventLoop;
class Timer;
}

namespace relay {

struct ConnectResult {
    ConnectError error{ConnectError::kNone};
    // Registered with nothing yet: install callbacks, then call
    // ConnectEstablished() on it.
    network::TcpConnectionPtr conn;
    int sysErrno{0};
    network::InetAddress peer;
    double elapsedSec{0.0};

    bool ok() const { return error == ConnectError::kNone && conn != nullptr; }
};

class UpstreamConnector;
using UpstreamConnectorPtr = std::shared_ptr<UpstreamConnector>;

// Resolves host (IPv4) and connects to each address in turn until one
// accepts. Name lookup runs on a worker thread; everything else, the
// callback included, runs on the owning loop. The whole attempt is bounded
// by timeoutSec.
class UpstreamConnector : fwdproxy::common::noncopyable,
                          public std::enable_shared_from_this<UpstreamConnector> {
public:
    using Callback = std::function<void(ConnectResult&)>;

    // Loop thread only. The callback runs exactly once unless Cancel()
    // comes first; it may run before Connect returns.
    static UpstreamConnectorPtr Connect(network::EventLoop* loop,
                                        const std::string& host,
                                        uint16_t port,
                                        double timeoutSec,
                                        Callback cb);

    UpstreamConnector(network::EventLoop* loop, const std::string& host, uint16_t port, double timeoutSec);
    ~UpstreamConnector();

    // Drops a pending attempt and closes any socket in flight.
    void Cancel();

    // Blocking getaddrinfo. Returns the gai error code, 0 on success.
    static int Resolve(const std::string& host, uint16_t port, std::vector<network::InetAddress>* out);

private:
    // Shared with the resolver thread. The mutex keeps the loop alive
    // while the thread posts back to it.
    struct ResolveTicket {
        std::mutex mutex;
        network::EventLoop* loop;
        bool cancelled{false};
    };

    void Start(Callback cb);
    void StartResolve();
    void OnResolved(const std::vector<network::InetAddress>& addrs, int gaiError);
    void TryNext();
    void OnConnected(int sockfd);
    void OnConnectError(int savedErrno);
    void OnDeadline();
    void Finish(ConnectResult& result);
    double RemainingSec() const;
    double ElapsedSec() const;

    network::EventLoop* loop_;
    const std::string host_;
    const uint16_t port_;
    const double timeoutSec_;
    std::chrono::steady_clock::time_point startedAt_;
    Callback cb_;
    bool done_;

    std::shared_ptr<ResolveTicket> ticket_;
    std::unique_ptr<network::Timer> deadline_;
    std::vector<network::InetAddress> addrs_;
    size_t nextAddr_;
    network::ConnectorPtr connector_;
    int lastErrno_;
};

} // namespace relay
} // namespace fwdproxy
