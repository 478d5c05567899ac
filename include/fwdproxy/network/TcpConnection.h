#pragma once

#include "fwdproxy/common/noncopyable.h"
#include "fwdproxy/network/InetAddress.h"
#include "fwdproxy/network/Callbacks.h"
#include "fwdproxy/network/Buffer.h"

#include <memory>
#include <string>
#include <atomic>
#include <chrono>
#include <any>
#include <cstdint>

struct ssl_ctx_st;

namespace fwdproxy {
namespace network {

class Channel;
class EventLoop;
class Socket;
class TlsStream;

// A connected TCP socket bound to one EventLoop. Accepted connections are
// created by TcpServer; outbound ones by UpstreamConnector.
class TcpConnection : fwdproxy::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    TcpConnection(EventLoop* loop,
                  const std::string& name,
                  int sockfd,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr,
                  ssl_ctx_st* tlsCtx = nullptr);
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& localAddress() const { return localAddr_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == kConnected; }
    bool disconnected() const { return state_ == kDisconnected; }

    void SetContext(const std::any& context) { context_ = context; }
    const std::any& GetContext() const { return context_; }
    std::any* GetMutableContext() { return &context_; }

    // Thread safe
    void Send(const std::string& message);
    void Send(const void* data, size_t len);
    // Flushes queued output, half-closes, then waits for the peer's FIN.
    // Inbound bytes are discarded from here on. Callers bound the wait
    // with ForceClose.
    void GracefulClose();
    // Sends FIN once queued output is flushed; reading goes on. The
    // connection closes when the peer's FIN has been seen as well.
    void ShutdownWrite();
    void ForceClose();
    void StartRead();
    void StopRead();

    size_t OutputBytes() const { return outputBuffer_.ReadableBytes(); }
    bool peerShutdown() const { return readEof_; }
    int LastErrno() const { return lastErrno_; }

    // Time of the last read or write. Relays derive idle timeouts from it.
    std::chrono::steady_clock::time_point LastActiveTime() const;

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetCloseCallback(const CloseCallback& cb) { closeCallback_ = cb; }
    // Without an EOF callback the peer's FIN closes the connection. With
    // one, reading stops and the write side stays open.
    void SetEofCallback(const EofCallback& cb) { eofCallback_ = cb; }

    // Called once the owner has registered the connection.
    void ConnectEstablished();
    // Called when the owner has dropped the connection.
    void ConnectDestroyed();

private:
    enum StateE { kDisconnected, kConnecting, kConnected, kDisconnecting };

    void HandleRead(std::chrono::system_clock::time_point receiveTime);
    void HandleWrite();
    void HandleClose();
    void HandleError();

    void SendInLoop(const void* message, size_t len);
    void ShutdownInLoop();
    void ShutdownWriteInLoop();
    void GracefulCloseInLoop();
    void ForceCloseInLoop();
    void StartReadInLoop();
    void StopReadInLoop();
    void Touch();
    void NotifyWriteComplete();
    // false while a TLS handshake is still running or after it failed.
    bool AdvanceTls();
    ssize_t ReadOnce(int* savedErrno);
    ssize_t WriteOnce(const void* data, size_t len, int* savedErrno);

    void SetState(StateE s) { state_ = s; }
    static const char* StateName(StateE s);

    EventLoop* loop_;
    const std::string name_;
    std::atomic<StateE> state_;
    bool reading_;
    bool draining_;
    bool writeShut_;
    bool shutdownPending_;
    bool readEof_;
    bool closeHandled_;
    int lastErrno_;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;

    const InetAddress localAddr_;
    const InetAddress peerAddr_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    CloseCallback closeCallback_;
    EofCallback eofCallback_;

    Buffer inputBuffer_;
    Buffer outputBuffer_;

    std::any context_;

    std::atomic<std::int64_t> lastActiveNs_;

    // Only for accepted connections on a TLS-enabled listener.
    std::unique_ptr<TlsStream> tls_;
};

} // namespace network
} // namespace fwdproxy
