#pragma once

#include "fwdproxy/ProxyOptions.h"
#include "fwdproxy/SessionHandler.h"
#include "fwdproxy/common/noncopyable.h"
#include "fwdproxy/network/TcpServer.h"
#include "fwdproxy/monitor/AccessPolicy.h"
#include "fwdproxy/monitor/MetricsSink.h"
#include "fwdproxy/monitor/RateLimiter.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace fwdproxy {

namespace network {
class EventLoop;
}

// Forward proxy front end: accepts clients on the base loop and runs one
// SessionHandler per connection on the I/O loops.
class ProxyServer : fwdproxy::common::noncopyable {
public:
    ProxyServer(network::EventLoop* loop,
                const ProxyOptions& opts,
                const std::string& name = "fwdproxy");
    ~ProxyServer();

    // Binds and starts the I/O threads. Base loop thread only.
    bool Start();
    uint16_t ListenPort() const { return server_.ListenPort(); }
    // Base loop thread only.
    size_t OpenConnections() const { return server_.ConnectionCount(); }

    // Replaces the block list for sessions accepted from now on.
    // Sessions already past the policy check keep their decision.
    void UpdateBlocklist(const std::vector<std::string>& patterns);
    monitor::AccessPolicyPtr policy() const;

    void SetMetricsSink(monitor::MetricsSinkPtr sink);

    const ProxyOptions& options() const { return *opts_; }

private:
    void OnConnection(const network::TcpConnectionPtr& conn);
    void OnMessage(const network::TcpConnectionPtr& conn,
                   network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);
    void OnWriteComplete(const network::TcpConnectionPtr& conn);
    void OnPeerShutdown(const network::TcpConnectionPtr& conn);

    static SessionHandlerPtr SessionOf(const network::TcpConnectionPtr& conn);

    network::EventLoop* loop_;
    std::shared_ptr<const ProxyOptions> opts_;
    std::shared_ptr<monitor::RateLimiter> limiter_;
    // Read by every I/O loop; swapped with atomic_load/atomic_store.
    monitor::AccessPolicyPtr policy_;
    monitor::MetricsSinkPtr sink_;
    network::TcpServer server_;
};

} // namespace fwdproxy
