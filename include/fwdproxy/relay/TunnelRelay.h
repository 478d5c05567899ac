#pragma once

#include "fwdproxy/common/noncopyable.h"
#include "fwdproxy/network/Callbacks.h"
#include "fwdproxy/relay/RelayError.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace fwdproxy {
namespace network {
class Buffer;
class EventLoop;
class Timer;
}

namespace relay {

struct TunnelResult {
    RelayError error{RelayError::kNone};
    // Bytes actually handed to the destination socket in each direction.
    long long bytesClientToUpstream{0};
    long long bytesUpstreamToClient{0};
    double ttfbSec{-1.0};   // from Start to the first relayed byte
    double durationSec{0.0};
};

// Opaque byte pump between a client and an upstream after CONNECT. Each
// direction runs to its own end-of-stream, which is passed on as a FIN
// once the bytes before it are written. The relay ends when both
// directions have finished, on the first I/O error, or on idle timeout:
// queued output is flushed (bounded by lingerSec), both connections are
// closed, and only then does the completion callback run. Loop thread only.
class TunnelRelay : fwdproxy::common::noncopyable,
                    public std::enable_shared_from_this<TunnelRelay> {
public:
    struct Options {
        double idleSec{60.0};
        double lingerSec{5.0};
        size_t highWaterMark{1024 * 1024};
    };

    using CompletionCallback = std::function<void(const TunnelResult&)>;

    TunnelRelay(network::EventLoop* loop,
                const network::TcpConnectionPtr& client,
                const network::TcpConnectionPtr& upstream,
                const Options& opts);
    ~TunnelRelay();

    // Call right after the 200 reply went out. pending holds client bytes
    // that arrived together with the CONNECT head.
    void Start(const std::string& pending, CompletionCallback cb);

    // Routed here by the owner of the client connection.
    void OnClientData(network::Buffer* buf);
    void OnClientWriteComplete();
    void OnClientEof();
    void OnClientClosed();

    bool ended() const { return ended_; }
    const TunnelResult& result() const { return result_; }

private:
    void OnUpstreamData(network::Buffer* buf);
    void OnUpstreamWriteComplete();
    void OnUpstreamEof();
    void OnUpstreamClosed();
    void NoteFirstByte();
    void ArmIdleTimer(double seconds);
    void OnIdleTimer();
    void End(RelayError error);
    void MaybeFinish();

    network::EventLoop* loop_;
    network::TcpConnectionPtr client_;
    network::TcpConnectionPtr upstream_;
    const Options opts_;
    CompletionCallback cb_;

    std::chrono::steady_clock::time_point startedAt_;
    std::unique_ptr<network::Timer> idleTimer_;
    std::unique_ptr<network::Timer> lingerTimer_;

    bool ended_;
    bool finished_;
    bool clientEof_;       // client -> upstream finished
    bool upstreamEof_;     // upstream -> client finished
    bool clientClosed_;
    bool upstreamClosed_;
    bool clientPaused_;    // not reading the client until upstream drains
    bool upstreamPaused_;  // not reading upstream until the client drains
    TunnelResult result_;
};

using TunnelRelayPtr = std::shared_ptr<TunnelRelay>;

} // namespace relay
} // namespace fwdproxy
