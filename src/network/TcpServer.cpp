#include "fwdproxy/network/TcpServer.h"
#include "fwdproxy/network/EventLoop.h"
#include "fwdproxy/network/Acceptor.h"
#include "fwdproxy/network/Socket.h"
#include "fwdproxy/common/Logger.h"
#include "fwdproxy/monitor/Stats.h"

#include <unistd.h>

namespace fwdproxy {
namespace network {

TcpServer::TcpServer(EventLoop* loop,
                     const InetAddress& listenAddr,
                     const std::string& name,
                     Option option)
    : loop_(loop),
      hostport_(listenAddr.toIpPort()),
      name_(name),
      acceptor_(new Acceptor(loop, listenAddr, option == kReusePort)),
      threadPool_(new EventLoopThreadPool(loop, name)),
      started_(false),
      nextConnId_(1),
      maxConnections_(0),
      maxConnectionsPerIp_(0) {
    acceptor_->SetNewConnectionCallback(
        [this](int sockfd, const InetAddress& peerAddr) { NewConnection(sockfd, peerAddr); });
}

TcpServer::~TcpServer() {
    LOG_DEBUG << "TcpServer [" << name_ << "] closing " << connections_.size() << " connections";
    for (auto& item : connections_) {
        TcpConnectionPtr conn = std::move(item.second);
        conn->getLoop()->RunInLoop([conn]() { conn->ConnectDestroyed(); });
    }
    connections_.clear();
}

void TcpServer::SetThreadNum(int numThreads) {
    threadPool_->SetThreadNum(numThreads);
}

uint16_t TcpServer::ListenPort() const {
    return acceptor_->ListenPort();
}

bool TcpServer::EnableTls(const std::string& certPemPath, const std::string& keyPemPath) {
    auto ctx = std::make_shared<TlsContext>();
    if (!ctx->InitServer(certPemPath, keyPemPath)) return false;
    tlsCtx_ = std::move(ctx);
    return true;
}

bool TcpServer::Start() {
    if (!loop_->AssertInLoopThread("TcpServer::Start")) return false;
    if (started_.exchange(true)) return true;
    if (!acceptor_->Listen()) {
        LOG_ERROR << "TcpServer [" << name_ << "] cannot listen on " << hostport_;
        started_ = false;
        return false;
    }
    threadPool_->Start();
    LOG_INFO << "TcpServer [" << name_ << "] listening on port " << ListenPort() << " with "
             << threadPool_->size() << " I/O threads" << (tlsCtx_ ? " (TLS enabled)" : "");
    return true;
}

bool TcpServer::Admit(const InetAddress& peerAddr) const {
    if (maxConnections_ > 0 && static_cast<int>(connections_.size()) >= maxConnections_) {
        LOG_WARN << "TcpServer [" << name_ << "] rejecting " << peerAddr.toIpPort()
                 << ": " << connections_.size() << " connections open, limit " << maxConnections_;
        return false;
    }
    if (maxConnectionsPerIp_ > 0) {
        auto it = perIpCounts_.find(peerAddr.toIp());
        if (it != perIpCounts_.end() && it->second >= maxConnectionsPerIp_) {
            LOG_WARN << "TcpServer [" << name_ << "] rejecting " << peerAddr.toIpPort()
                     << ": " << it->second << " connections from this address, limit " << maxConnectionsPerIp_;
            return false;
        }
    }
    return true;
}

void TcpServer::NewConnection(int sockfd, const InetAddress& peerAddr) {
    if (!Admit(peerAddr)) {
        ::close(sockfd);
        fwdproxy::monitor::Stats::Instance().AddConnectionRejected();
        return;
    }

    const std::string connName = name_ + "-c" + std::to_string(nextConnId_++);
    EventLoop* ioLoop = threadPool_->GetNextLoop();
    LOG_DEBUG << "TcpServer [" << name_ << "] " << connName << " from " << peerAddr.toIpPort();

    TcpConnectionPtr conn = std::make_shared<TcpConnection>(ioLoop,
                                                            connName,
                                                            sockfd,
                                                            Socket::GetLocalAddr(sockfd),
                                                            peerAddr,
                                                            tlsCtx_ ? tlsCtx_->ctx() : nullptr);
    connections_[connName] = conn;
    perIpCounts_[peerAddr.toIp()] += 1;
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetWriteCompleteCallback(writeCompleteCallback_);
    conn->SetEofCallback(eofCallback_);
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) { RemoveConnection(c); });

    ioLoop->RunInLoop([conn]() { conn->ConnectEstablished(); });
}

void TcpServer::RemoveConnection(const TcpConnectionPtr& conn) {
    // Runs on the I/O loop inside the connection's own close handling.
    loop_->QueueInLoop([this, conn]() { RemoveConnectionInLoop(conn); });
}

void TcpServer::RemoveConnectionInLoop(const TcpConnectionPtr& conn) {
    connections_.erase(conn->name());

    auto it = perIpCounts_.find(conn->peerAddress().toIp());
    if (it != perIpCounts_.end() && --it->second <= 0) {
        perIpCounts_.erase(it);
    }

    conn->getLoop()->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
}

} // namespace network
} // namespace fwdproxy
