#pragma once

#include "fwdproxy/ProxyOptions.h"
#include "fwdproxy/common/noncopyable.h"
#include "fwdproxy/network/Callbacks.h"
#include "fwdproxy/monitor/AccessPolicy.h"
#include "fwdproxy/monitor/MetricsSink.h"
#include "fwdproxy/monitor/RateLimiter.h"
#include "fwdproxy/protocol/RequestParser.h"
#include "fwdproxy/relay/HttpForwarder.h"
#include "fwdproxy/relay/TunnelRelay.h"
#include "fwdproxy/relay/UpstreamConnector.h"

#include <chrono>
#include <memory>
#include <string>

namespace fwdproxy {

namespace network {
class Buffer;
class EventLoop;
class Timer;
}

//   ACCEPTED -> PARSING -> MALFORMED | CLASSIFIED
//   CLASSIFIED -> POLICY_CHECK -> BLOCKED | RATE_LIMITED | AUTHORIZED
//   AUTHORIZED -> CONNECTING -> CONNECT_FAILED | CONNECTED
//   CONNECTED -> FORWARDING | TUNNELING -> COMPLETED | FAILED
enum class SessionState {
    kAccepted,
    kParsing,
    kMalformed,
    kClassified,
    kPolicyCheck,
    kBlocked,
    kRateLimited,
    kAuthorized,
    kConnecting,
    kConnectFailed,
    kConnected,
    kForwarding,
    kTunneling,
    kCompleted,
    kFailed,
};

const char* SessionStateName(SessionState s);
bool IsTerminal(SessionState s);

// Drives one client connection from accept to the single metrics event.
// Lives on the client connection's loop; keeps itself alive from Start()
// until every socket it touched is closed and the event is emitted.
class SessionHandler : fwdproxy::common::noncopyable,
                       public std::enable_shared_from_this<SessionHandler> {
public:
    SessionHandler(const network::TcpConnectionPtr& client,
                   std::shared_ptr<const ProxyOptions> opts,
                   monitor::AccessPolicyPtr policy,
                   std::shared_ptr<monitor::RateLimiter> limiter,
                   monitor::MetricsSinkPtr sink);
    ~SessionHandler();

    void Start();

    // Client connection events, routed by the server.
    void OnMessage(network::Buffer* buf);
    void OnWriteComplete();
    // The client finished sending but still reads.
    void OnClientEof();
    void OnDisconnected();

    SessionState state() const { return state_; }
    bool finished() const { return finished_; }
    const protocol::ParsedRequest& request() const { return parser_.request(); }

private:
    void SetState(SessionState s);
    void OnHeaderTimeout();
    void OnParseFailed(protocol::ParseError err);
    void HoldEarlyBytes(const std::string& bytes);
    void ResumeClient();
    void CheckPolicy();
    void ConnectUpstream();
    void OnUpstreamResult(relay::ConnectResult& result);
    void StartForwarding(const network::TcpConnectionPtr& upstream);
    void StartTunnel(const network::TcpConnectionPtr& upstream);
    void OnForwardDone(const relay::ForwardResult& result);
    void OnTunnelDone(const relay::TunnelResult& result);
    void Reply(int code);
    void Finish();
    void EmitEvent();

    network::TcpConnectionPtr client_;
    network::EventLoop* loop_;
    std::shared_ptr<const ProxyOptions> opts_;
    monitor::AccessPolicyPtr policy_;
    std::shared_ptr<monitor::RateLimiter> limiter_;
    monitor::MetricsSinkPtr sink_;
    std::shared_ptr<SessionHandler> self_;

    SessionState state_;
    bool finished_;
    bool clientClosed_;
    bool clientEof_;       // request side finished; the reply still goes out
    bool clientPaused_;    // early bytes over the high-water mark
    std::chrono::system_clock::time_point acceptedWall_;
    std::chrono::steady_clock::time_point acceptedAt_;

    protocol::RequestParser parser_;
    size_t headBytes_;          // request head as the client sent it
    long long clientBytesIn_;   // everything read before handing over
    std::unique_ptr<network::Timer> headerTimer_;
    std::unique_ptr<network::Timer> lingerTimer_;

    std::string replyStatus_;
    long long replyBytes_;
    std::string blockedPattern_;
    std::string error_;

    relay::UpstreamConnectorPtr connector_;
    relay::HttpForwarderPtr forwarder_;
    relay::TunnelRelayPtr tunnel_;
    relay::ForwardResult forwardResult_;
    relay::TunnelResult tunnelResult_;
};

using SessionHandlerPtr = std::shared_ptr<SessionHandler>;

} // namespace fwdproxy
