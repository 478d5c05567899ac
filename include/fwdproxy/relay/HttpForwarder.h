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
namespace protocol {
struct ParsedRequest;
}

namespace relay {

struct ForwardResult {
    RelayError error{RelayError::kNone};
    std::string statusLine;          // from upstream, or the 502 we sent
    long long bytesToUpstream{0};    // rewritten head + body
    long long bytesFromUpstream{0};
    long long bytesFromClient{0};    // body bytes, pending prefix included
    long long bytesToClient{0};
    double ttfbSec{-1.0};            // from the request being fully written
    double durationSec{0.0};
    bool headersSentToClient{false};
    std::string upstreamHead;        // rewritten head as sent upstream
    std::string responsePreview;     // leading bytes of the upstream response
};

// Sends one rewritten request upstream and relays the response to the
// client byte for byte. The response ends at upstream close or once the
// declared Content-Length has been relayed. Both connections are closed
// before the completion callback runs. Loop thread only.
class HttpForwarder : fwdproxy::common::noncopyable,
                      public std::enable_shared_from_this<HttpForwarder> {
public:
    struct Options {
        double responseIdleSec{30.0};
        double lingerSec{5.0};
        size_t maxResponseHead{64 * 1024};
        size_t maxResponsePreview{64 * 1024};
        size_t highWaterMark{1024 * 1024};
    };

    using CompletionCallback = std::function<void(const ForwardResult&)>;

    HttpForwarder(network::EventLoop* loop,
                  const network::TcpConnectionPtr& client,
                  const network::TcpConnectionPtr& upstream,
                  const Options& opts);
    ~HttpForwarder();

    // upstream must come straight from UpstreamConnector (not yet
    // established).
    void Start(const protocol::ParsedRequest& req, CompletionCallback cb);

    // Routed here by the owner of the client connection.
    void OnClientData(network::Buffer* buf);
    void OnClientWriteComplete();
    // No more request bytes; the response is still relayed.
    void OnClientEof();
    void OnClientClosed();

    const ForwardResult& result() const { return result_; }

private:
    void OnUpstreamData(network::Buffer* buf);
    void OnUpstreamWriteComplete();
    void OnUpstreamClosed();
    void ScanResponseHead(const char* data, size_t len);
    void CheckBodyComplete();
    void ArmIdleTimer(double seconds);
    void OnIdleTimer();
    void Complete(RelayError error);
    void MaybeFinish();

    network::EventLoop* loop_;
    network::TcpConnectionPtr client_;
    network::TcpConnectionPtr upstream_;
    const Options opts_;
    CompletionCallback cb_;

    bool headRequest_;
    bool requestSent_;
    std::chrono::steady_clock::time_point startedAt_;
    std::chrono::steady_clock::time_point sentAt_;
    std::unique_ptr<network::Timer> idleTimer_;
    std::unique_ptr<network::Timer> lingerTimer_;

    // Response framing.
    std::string head_;
    bool headDone_;
    bool headTooLarge_;
    long long bodyExpected_;   // -1: until upstream closes
    long long bodySeen_;

    bool completed_;
    bool finished_;
    bool clientEof_;
    bool clientClosed_;
    bool upstreamClosed_;
    bool clientPaused_;
    bool upstreamPaused_;
    ForwardResult result_;
};

using HttpForwarderPtr = std::shared_ptr<HttpForwarder>;

} // namespace relay
} // namespace fwdproxy
