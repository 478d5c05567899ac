#include "fwdproxy/SessionHandler.h"
#include "fwdproxy/network/Buffer.h"
#include "fwdproxy/network/EventLoop.h"
#include "fwdproxy/network/TcpConnection.h"
#include "fwdproxy/network/Timer.h"
#include "fwdproxy/protocol/StatusReply.h"
#include "fwdproxy/monitor/Stats.h"
#include "fwdproxy/common/Logger.h"

#include <algorithm>

namespace fwdproxy {

using network::TcpConnectionPtr;

const char* SessionStateName(SessionState s) {
    switch (s) {
        case SessionState::kAccepted: return "ACCEPTED";
        case SessionState::kParsing: return "PARSING";
        case SessionState::kMalformed: return "MALFORMED";
        case SessionState::kClassified: return "CLASSIFIED";
        case SessionState::kPolicyCheck: return "POLICY_CHECK";
        case SessionState::kBlocked: return "BLOCKED";
        case SessionState::kRateLimited: return "RATE_LIMITED";
        case SessionState::kAuthorized: return "AUTHORIZED";
        case SessionState::kConnecting: return "CONNECTING";
        case SessionState::kConnectFailed: return "CONNECT_FAILED";
        case SessionState::kConnected: return "CONNECTED";
        case SessionState::kForwarding: return "FORWARDING";
        case SessionState::kTunneling: return "TUNNELING";
        case SessionState::kCompleted: return "COMPLETED";
        case SessionState::kFailed: return "FAILED";
    }
    return "UNKNOWN";
}

bool IsTerminal(SessionState s) {
    switch (s) {
        case SessionState::kMalformed:
        case SessionState::kBlocked:
        case SessionState::kRateLimited:
        case SessionState::kConnectFailed:
        case SessionState::kCompleted:
        case SessionState::kFailed:
            return true;
        default:
            return false;
    }
}

namespace {

double SecondsSince(std::chrono::steady_clock::time_point t) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t).count();
}

} // namespace

SessionHandler::SessionHandler(const TcpConnectionPtr& client,
                               std::shared_ptr<const ProxyOptions> opts,
                               monitor::AccessPolicyPtr policy,
                               std::shared_ptr<monitor::RateLimiter> limiter,
                               monitor::MetricsSinkPtr sink)
    : client_(client),
      loop_(client->getLoop()),
      opts_(std::move(opts)),
      policy_(std::move(policy)),
      limiter_(std::move(limiter)),
      sink_(std::move(sink)),
      state_(SessionState::kAccepted),
      finished_(false),
      clientClosed_(false),
      clientEof_(false),
      clientPaused_(false),
      acceptedWall_(std::chrono::system_clock::now()),
      acceptedAt_(std::chrono::steady_clock::now()),
      parser_(opts_->maxHeaderBytes),
      headBytes_(0),
      clientBytesIn_(0),
      headerTimer_(new network::Timer(loop_)),
      lingerTimer_(new network::Timer(loop_)),
      replyBytes_(0) {
}

SessionHandler::~SessionHandler() {
    if (!finished_) client_->ForceClose();
}

void SessionHandler::SetState(SessionState s) {
    LOG_DEBUG << "session " << client_->name() << " " << SessionStateName(state_) << " -> " << SessionStateName(s);
    state_ = s;
}

void SessionHandler::Start() {
    self_ = shared_from_this();
    fwdproxy::monitor::Stats::Instance().IncActiveSessions();
    SetState(SessionState::kParsing);

    std::weak_ptr<SessionHandler> weakSelf(self_);
    headerTimer_->Start(opts_->headerReadTimeoutSec, [weakSelf]() {
        if (auto self = weakSelf.lock()) self->OnHeaderTimeout();
    });
}

void SessionHandler::OnMessage(network::Buffer* buf) {
    auto guard = shared_from_this();
    switch (state_) {
        case SessionState::kParsing: {
            const protocol::RequestParser::Status st = parser_.Feed(buf);
            clientBytesIn_ = static_cast<long long>(parser_.bytesConsumed());
            if (st == protocol::RequestParser::kNeedMore) return;
            if (st == protocol::RequestParser::kError) {
                clientBytesIn_ += static_cast<long long>(buf->ReadableBytes());
                buf->RetrieveAll();
                OnParseFailed(parser_.error());
                return;
            }
            headerTimer_->Cancel();
            headBytes_ = parser_.bytesConsumed() - parser_.request().pending.size();
            SetState(SessionState::kClassified);
            HoldEarlyBytes(std::string());
            CheckPolicy();
            return;
        }
        case SessionState::kClassified:
        case SessionState::kPolicyCheck:
        case SessionState::kAuthorized:
        case SessionState::kConnecting:
        case SessionState::kConnected: {
            // Early body or tunnel payload; goes upstream once connected.
            const std::string early = buf->RetrieveAllAsString();
            clientBytesIn_ += static_cast<long long>(early.size());
            HoldEarlyBytes(early);
            return;
        }
        case SessionState::kForwarding:
            forwarder_->OnClientData(buf);
            return;
        case SessionState::kTunneling:
            tunnel_->OnClientData(buf);
            return;
        default:
            clientBytesIn_ += static_cast<long long>(buf->ReadableBytes());
            buf->RetrieveAll();
            return;
    }
}

void SessionHandler::OnWriteComplete() {
    if (state_ == SessionState::kForwarding && forwarder_) {
        forwarder_->OnClientWriteComplete();
    } else if (state_ == SessionState::kTunneling && tunnel_) {
        tunnel_->OnClientWriteComplete();
    }
}

void SessionHandler::HoldEarlyBytes(const std::string& bytes) {
    std::string& pending = parser_.request().pending;
    pending += bytes;
    if (!clientPaused_ && pending.size() > opts_->relayHighWaterMark) {
        LOG_DEBUG << "session " << client_->name() << " holding " << pending.size()
                  << " early bytes, pausing client";
        clientPaused_ = true;
        client_->StopRead();
    }
}

void SessionHandler::ResumeClient() {
    if (!clientPaused_) return;
    clientPaused_ = false;
    client_->StartRead();
}

void SessionHandler::OnClientEof() {
    auto guard = shared_from_this();
    switch (state_) {
        case SessionState::kClassified:
        case SessionState::kPolicyCheck:
        case SessionState::kAuthorized:
        case SessionState::kConnecting:
        case SessionState::kConnected:
            // The head is complete; EOF only ends the request side.
            LOG_DEBUG << "session " << client_->name() << " client finished sending in "
                      << SessionStateName(state_);
            clientEof_ = true;
            return;
        case SessionState::kForwarding:
            forwarder_->OnClientEof();
            return;
        case SessionState::kTunneling:
            tunnel_->OnClientEof();
            return;
        default:
            // Nothing complete to answer.
            client_->ForceClose();
            return;
    }
}

void SessionHandler::OnDisconnected() {
    if (clientClosed_) return;
    auto guard = shared_from_this();
    clientClosed_ = true;

    switch (state_) {
        case SessionState::kAccepted:
        case SessionState::kParsing:
            parser_.OnClosed();
            OnParseFailed(parser_.error());
            return;
        case SessionState::kClassified:
        case SessionState::kPolicyCheck:
        case SessionState::kAuthorized:
        case SessionState::kConnecting:
        case SessionState::kConnected:
            // Cancellation: the client gave up before the upstream answered.
            if (connector_) connector_->Cancel();
            error_ = relay::RelayErrorName(relay::RelayError::kClientClosed);
            SetState(SessionState::kFailed);
            Finish();
            return;
        case SessionState::kForwarding:
            forwarder_->OnClientClosed();
            return;
        case SessionState::kTunneling:
            tunnel_->OnClientClosed();
            return;
        default:
            replyBytes_ = std::max(0LL, replyBytes_ - static_cast<long long>(client_->OutputBytes()));
            Finish();
            return;
    }
}

void SessionHandler::OnHeaderTimeout() {
    if (state_ != SessionState::kParsing) return;
    parser_.OnTimeout();
    OnParseFailed(parser_.error());
}

void SessionHandler::OnParseFailed(protocol::ParseError err) {
    headerTimer_->Cancel();
    error_ = protocol::ParseErrorName(err);
    LOG_DEBUG << "session " << client_->name() << " parse failed: " << error_;
    SetState(SessionState::kMalformed);
    Reply(400);
}

void SessionHandler::CheckPolicy() {
    SetState(SessionState::kPolicyCheck);
    const protocol::ParsedRequest& req = parser_.request();

    if (policy_) {
        const monitor::AccessDecision d = policy_->Evaluate(req.host);
        if (d.kind == monitor::AccessDecision::Kind::kBlocked) {
            blockedPattern_ = d.reason;
            SetState(SessionState::kBlocked);
            Reply(403);
            return;
        }
    }
    if (limiter_) {
        const monitor::AccessDecision d = limiter_->Admit(client_->peerAddress().toIp());
        if (d.kind == monitor::AccessDecision::Kind::kRateLimited) {
            error_ = monitor::AccessDecisionName(d.kind);
            LOG_DEBUG << "session " << client_->name() << " over limit: " << d.reason;
            SetState(SessionState::kRateLimited);
            Reply(429);
            return;
        }
    }
    SetState(SessionState::kAuthorized);
    ConnectUpstream();
}

void SessionHandler::ConnectUpstream() {
    SetState(SessionState::kConnecting);
    const protocol::ParsedRequest& req = parser_.request();
    std::weak_ptr<SessionHandler> weakSelf(shared_from_this());
    connector_ = relay::UpstreamConnector::Connect(
        loop_, req.host, req.port, opts_->connectTimeoutSec,
        [weakSelf](relay::ConnectResult& result) {
            if (auto self = weakSelf.lock()) self->OnUpstreamResult(result);
        });
}

void SessionHandler::OnUpstreamResult(relay::ConnectResult& result) {
    if (state_ != SessionState::kConnecting) return;
    const protocol::ParsedRequest& req = parser_.request();
    if (!result.ok()) {
        error_ = relay::ConnectErrorName(result.error);
        LOG_WARN << "session " << client_->name() << " upstream " << req.host << ":" << req.port
                 << " " << error_ << " after " << result.elapsedSec << "s";
        SetState(SessionState::kConnectFailed);
        Reply(502);
        return;
    }
    SetState(SessionState::kConnected);
    if (req.tunnel) {
        StartTunnel(result.conn);
    } else {
        StartForwarding(result.conn);
    }
}

void SessionHandler::StartForwarding(const TcpConnectionPtr& upstream) {
    SetState(SessionState::kForwarding);
    relay::HttpForwarder::Options o;
    o.responseIdleSec = opts_->responseIdleSec;
    o.lingerSec = opts_->lingerSec;
    o.highWaterMark = opts_->relayHighWaterMark;
    forwarder_ = std::make_shared<relay::HttpForwarder>(loop_, client_, upstream, o);

    std::weak_ptr<SessionHandler> weakSelf(shared_from_this());
    forwarder_->Start(parser_.request(), [weakSelf](const relay::ForwardResult& r) {
        if (auto self = weakSelf.lock()) self->OnForwardDone(r);
    });
    if (clientEof_) {
        forwarder_->OnClientEof();
    } else {
        ResumeClient();
    }
}

void SessionHandler::StartTunnel(const TcpConnectionPtr& upstream) {
    const std::string reply = protocol::StatusReply(200);
    replyStatus_ = protocol::StatusLine(200);
    client_->Send(reply);
    replyBytes_ = static_cast<long long>(reply.size());

    SetState(SessionState::kTunneling);
    relay::TunnelRelay::Options o;
    o.idleSec = opts_->tunnelIdleSec;
    o.lingerSec = opts_->lingerSec;
    o.highWaterMark = opts_->relayHighWaterMark;
    tunnel_ = std::make_shared<relay::TunnelRelay>(loop_, client_, upstream, o);

    std::weak_ptr<SessionHandler> weakSelf(shared_from_this());
    tunnel_->Start(parser_.request().pending, [weakSelf](const relay::TunnelResult& r) {
        if (auto self = weakSelf.lock()) self->OnTunnelDone(r);
    });
    if (clientEof_) {
        tunnel_->OnClientEof();
    } else {
        ResumeClient();
    }
}

void SessionHandler::OnForwardDone(const relay::ForwardResult& result) {
    forwardResult_ = result;
    if (result.error != relay::RelayError::kNone) error_ = relay::RelayErrorName(result.error);
    SetState(result.error == relay::RelayError::kNone ? SessionState::kCompleted : SessionState::kFailed);
    Finish();
}

void SessionHandler::OnTunnelDone(const relay::TunnelResult& result) {
    tunnelResult_ = result;
    if (result.error != relay::RelayError::kNone) error_ = relay::RelayErrorName(result.error);
    SetState(result.error == relay::RelayError::kNone ? SessionState::kCompleted : SessionState::kFailed);
    Finish();
}

void SessionHandler::Reply(int code) {
    if (clientClosed_) {
        Finish();
        return;
    }
    replyStatus_ = protocol::StatusLine(code);
    const std::string reply = protocol::StatusReply(code);
    client_->Send(reply);
    replyBytes_ += static_cast<long long>(reply.size());
    client_->GracefulClose();
    TcpConnectionPtr client = client_;
    lingerTimer_->Start(opts_->lingerSec, [client]() { client->ForceClose(); });
}

void SessionHandler::Finish() {
    if (finished_) return;
    auto guard = shared_from_this();
    finished_ = true;
    headerTimer_->Cancel();
    lingerTimer_->Cancel();
    if (connector_) connector_->Cancel();

    EmitEvent();
    fwdproxy::monitor::Stats::Instance().DecActiveSessions();

    client_->SetContext(std::any());
    // The relays may still be on the call stack.
    relay::HttpForwarderPtr forwarder = std::move(forwarder_);
    relay::TunnelRelayPtr tunnel = std::move(tunnel_);
    relay::UpstreamConnectorPtr connector = std::move(connector_);
    loop_->QueueInLoop([forwarder, tunnel, connector]() {});
    self_.reset();
}

void SessionHandler::EmitEvent() {
    const protocol::ParsedRequest& req = parser_.request();
    const std::string clientIp = client_->peerAddress().toIp();

    if (state_ == SessionState::kBlocked) {
        monitor::BlockedEvent e;
        e.timestamp = acceptedWall_;
        e.blockedHost = req.host;
        e.clientIp = clientIp;
        e.pattern = blockedPattern_;
        LOG_WARN << "session " << client_->name() << " BLOCKED " << req.host << " (" << blockedPattern_
                 << ") client=" << clientIp;
        fwdproxy::monitor::Stats::Instance().AddBytesIn(clientBytesIn_);
        fwdproxy::monitor::Stats::Instance().AddBytesOut(replyBytes_);
        fwdproxy::monitor::Stats::Instance().RecordBlocked(e);
        if (sink_) sink_->OnBlocked(e);
        return;
    }

    monitor::MetricsRecord r;
    r.timestamp = acceptedWall_;
    r.clientIp = clientIp;
    r.clientPort = client_->peerAddress().toPort();
    r.targetHost = req.host;
    r.targetPort = req.port;
    r.method = req.method;
    r.tunnel = req.tunnel;
    r.rawHeader = req.rawHeader;
    r.terminalState = SessionStateName(state_);
    r.error = error_;
    r.outcome = replyStatus_;
    r.bytesSent = replyBytes_;
    r.bytesReceived = clientBytesIn_;
    r.durationSec = SecondsSince(acceptedAt_);

    if (forwarder_) {
        const relay::ForwardResult& f = forwardResult_;
        r.outcome = f.statusLine;
        r.bytesSent = f.bytesToClient;
        r.bytesReceived = static_cast<long long>(headBytes_) + f.bytesFromClient;
        r.upstreamBytesSent = f.bytesToUpstream;
        r.upstreamBytesReceived = f.bytesFromUpstream;
        r.durationSec = f.durationSec;
        r.ttfbSec = f.ttfbSec;
        r.upstreamHeader = f.upstreamHead;
        r.responsePreview = f.responsePreview;
    } else if (tunnel_) {
        const relay::TunnelResult& t = tunnelResult_;
        r.bytesSent = replyBytes_ + t.bytesUpstreamToClient;
        r.bytesReceived = static_cast<long long>(headBytes_) + t.bytesClientToUpstream;
        r.upstreamBytesSent = t.bytesClientToUpstream;
        r.upstreamBytesReceived = t.bytesUpstreamToClient;
        r.durationSec = t.durationSec;
        r.ttfbSec = t.ttfbSec;
    }

    if (state_ == SessionState::kCompleted) {
        LOG_INFO << "session " << client_->name() << " " << r.terminalState << " " << r.method << " "
                 << r.targetHost << ":" << r.targetPort << " \"" << r.outcome << "\"";
    } else {
        LOG_WARN << "session " << client_->name() << " " << r.terminalState << " " << r.method << " "
                 << r.targetHost << ":" << r.targetPort << " \"" << r.outcome << "\""
                 << (r.error.empty() ? "" : " error=") << r.error;
    }
    fwdproxy::monitor::Stats::Instance().AddBytesIn(r.bytesReceived);
    fwdproxy::monitor::Stats::Instance().AddBytesOut(r.bytesSent);
    fwdproxy::monitor::Stats::Instance().RecordRequest(r);
    if (sink_) sink_->OnRequest(r);
}

} // namespace fwdproxy
