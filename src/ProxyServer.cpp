#include "fwdproxy/ProxyServer.h"
#include "fwdproxy/network/Buffer.h"
#include "fwdproxy/network/EventLoop.h"
#include "fwdproxy/network/InetAddress.h"
#include "fwdproxy/network/TcpConnection.h"
#include "fwdproxy/common/Logger.h"

#include <any>
#include <atomic>
#include <functional>

namespace fwdproxy {

ProxyServer::ProxyServer(network::EventLoop* loop, const ProxyOptions& opts, const std::string& name)
    : loop_(loop),
      opts_(std::make_shared<const ProxyOptions>(opts)),
      limiter_(std::make_shared<monitor::RateLimiter>(opts.rateLimit)),
      policy_(std::make_shared<const monitor::AccessPolicy>(opts.blockPatterns)),
      server_(loop,
              network::InetAddress(opts.listenPort, opts.loopbackOnly),
              name,
              opts.reusePort ? network::TcpServer::kReusePort : network::TcpServer::kNoReusePort) {
    server_.SetThreadNum(opts.threads);
    server_.SetMaxConnections(opts.maxConnections);
    server_.SetMaxConnectionsPerIp(opts.maxConnectionsPerIp);

    server_.SetConnectionCallback(
        std::bind(&ProxyServer::OnConnection, this, std::placeholders::_1));
    server_.SetMessageCallback(
        std::bind(&ProxyServer::OnMessage, this, std::placeholders::_1, std::placeholders::_2, std::placeholders::_3));
    server_.SetWriteCompleteCallback(
        std::bind(&ProxyServer::OnWriteComplete, this, std::placeholders::_1));
    server_.SetEofCallback(
        std::bind(&ProxyServer::OnPeerShutdown, this, std::placeholders::_1));
}

ProxyServer::~ProxyServer() {
    LOG_DEBUG << "ProxyServer::~ProxyServer";
}

bool ProxyServer::Start() {
    if (opts_->tlsEnable) {
        if (!server_.EnableTls(opts_->tlsCertPath, opts_->tlsKeyPath)) {
            LOG_ERROR << "TLS listener requested but cert/key could not be loaded: "
                      << opts_->tlsCertPath << " " << opts_->tlsKeyPath;
            return false;
        }
        LOG_INFO << "TLS enabled on listener";
    }
    LOG_INFO << "ProxyServer starts listening on " << server_.hostport()
             << " block_patterns=" << policy()->size()
             << " rate_limit=" << opts_->rateLimit.maxRequests << "/" << opts_->rateLimit.windowSec << "s";
    return server_.Start();
}

void ProxyServer::UpdateBlocklist(const std::vector<std::string>& patterns) {
    monitor::AccessPolicyPtr next = std::make_shared<const monitor::AccessPolicy>(patterns);
    LOG_INFO << "Block list updated: " << next->size() << " patterns";
    std::atomic_store(&policy_, next);
}

monitor::AccessPolicyPtr ProxyServer::policy() const {
    return std::atomic_load(&policy_);
}

void ProxyServer::SetMetricsSink(monitor::MetricsSinkPtr sink) {
    std::atomic_store(&sink_, sink);
}

SessionHandlerPtr ProxyServer::SessionOf(const network::TcpConnectionPtr& conn) {
    auto* session = std::any_cast<SessionHandlerPtr>(conn->GetMutableContext());
    return session ? *session : SessionHandlerPtr();
}

void ProxyServer::OnConnection(const network::TcpConnectionPtr& conn) {
    if (conn->connected()) {
        LOG_DEBUG << "New connection from " << conn->peerAddress().toIpPort();
        auto session = std::make_shared<SessionHandler>(
            conn, opts_, policy(), limiter_, std::atomic_load(&sink_));
        conn->SetContext(session);
        session->Start();
        return;
    }

    LOG_DEBUG << "Connection closed: " << conn->name();
    SessionHandlerPtr session = SessionOf(conn);
    if (session) session->OnDisconnected();
}

void ProxyServer::OnMessage(const network::TcpConnectionPtr& conn,
                            network::Buffer* buf,
                            std::chrono::system_clock::time_point) {
    SessionHandlerPtr session = SessionOf(conn);
    if (!session) {
        buf->RetrieveAll();
        return;
    }
    session->OnMessage(buf);
}

void ProxyServer::OnWriteComplete(const network::TcpConnectionPtr& conn) {
    SessionHandlerPtr session = SessionOf(conn);
    if (session) session->OnWriteComplete();
}

void ProxyServer::OnPeerShutdown(const network::TcpConnectionPtr& conn) {
    SessionHandlerPtr session = SessionOf(conn);
    if (session) {
        session->OnClientEof();
    } else {
        conn->ForceClose();
    }
}

} // namespace fwdproxy
