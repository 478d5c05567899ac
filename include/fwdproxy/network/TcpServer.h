#pragma once

#include "fwdproxy/common/noncopyable.h"
#include "fwdproxy/network/Callbacks.h"
#include "fwdproxy/network/EventLoopThreadPool.h"
#include "fwdproxy/network/InetAddress.h"
#include "fwdproxy/network/TcpConnection.h"
#include "fwdproxy/network/TlsContext.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace fwdproxy {
namespace network {

class Acceptor;
class EventLoop;

// Accepts on the base loop and pins each connection to one I/O loop for
// its whole life. Connection bookkeeping (the registry and the per-IP
// counts) is only touched on the base loop.
class TcpServer : fwdproxy::common::noncopyable {
public:
    enum Option {
        kNoReusePort,
        kReusePort,
    };

    TcpServer(EventLoop* loop,
              const InetAddress& listenAddr,
              const std::string& name,
              Option option = kNoReusePort);
    ~TcpServer();

    const std::string& name() const { return name_; }
    const std::string& hostport() const { return hostport_; }
    EventLoop* getLoop() const { return loop_; }
    uint16_t ListenPort() const;

    // Before Start(). 0 keeps all I/O on the base loop.
    void SetThreadNum(int numThreads);

    // Optional TLS on the listener. The first byte of each connection
    // decides: 0x16 starts a handshake, anything else stays plaintext.
    bool EnableTls(const std::string& certPemPath, const std::string& keyPemPath);

    // Accept-time admission; 0 means unlimited. Over-limit connections are
    // closed before any callback runs.
    void SetMaxConnections(int maxConnections) { maxConnections_ = maxConnections; }
    void SetMaxConnectionsPerIp(int maxConnectionsPerIp) { maxConnectionsPerIp_ = maxConnectionsPerIp; }

    // Base loop thread only.
    bool Start();
    size_t ConnectionCount() const { return connections_.size(); }

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetEofCallback(const EofCallback& cb) { eofCallback_ = cb; }

private:
    bool Admit(const InetAddress& peerAddr) const;
    void NewConnection(int sockfd, const InetAddress& peerAddr);
    void RemoveConnection(const TcpConnectionPtr& conn);
    void RemoveConnectionInLoop(const TcpConnectionPtr& conn);

    EventLoop* loop_;
    const std::string hostport_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;
    std::unique_ptr<EventLoopThreadPool> threadPool_;
    std::shared_ptr<TlsContext> tlsCtx_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    EofCallback eofCallback_;

    std::atomic<bool> started_;
    uint64_t nextConnId_;
    std::unordered_map<std::string, TcpConnectionPtr> connections_;

    int maxConnections_;
    int maxConnectionsPerIp_;
    std::unordered_map<std::string, int> perIpCounts_;
};

} // namespace network
} // namespace fwdproxy
