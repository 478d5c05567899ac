#include "fwdproxy/relay/TunnelRelay.h"
#include "fwdproxy/network/Buffer.h"
#include "fwdproxy/network/EventLoop.h"
#include "fwdproxy/network/TcpConnection.h"
#include "fwdproxy/network/Timer.h"
#include "fwdproxy/common/Logger.h"

#include <algorithm>
#include <cstring>

namespace fwdproxy {
namespace relay {

using network::TcpConnectionPtr;

namespace {

double SecondsSince(std::chrono::steady_clock::time_point t) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t).count();
}

} // namespace

TunnelRelay::TunnelRelay(network::EventLoop* loop,
                         const TcpConnectionPtr& client,
                         const TcpConnectionPtr& upstream,
                         const Options& opts)
    : loop_(loop),
      client_(client),
      upstream_(upstream),
      opts_(opts),
      idleTimer_(new network::Timer(loop)),
      lingerTimer_(new network::Timer(loop)),
      ended_(false),
      finished_(false),
      clientEof_(false),
      upstreamEof_(false),
      clientClosed_(false),
      upstreamClosed_(false),
      clientPaused_(false),
      upstreamPaused_(false) {
}

TunnelRelay::~TunnelRelay() {
    if (!finished_) {
        client_->ForceClose();
        upstream_->ForceClose();
    }
}

void TunnelRelay::Start(const std::string& pending, CompletionCallback cb) {
    cb_ = std::move(cb);
    startedAt_ = std::chrono::steady_clock::now();

    std::weak_ptr<TunnelRelay> weakSelf(shared_from_this());
    upstream_->SetMessageCallback([weakSelf](const TcpConnectionPtr&, network::Buffer* buf,
                                             std::chrono::system_clock::time_point) {
        if (auto self = weakSelf.lock()) {
            self->OnUpstreamData(buf);
        } else {
            buf->RetrieveAll();
        }
    });
    upstream_->SetWriteCompleteCallback([weakSelf](const TcpConnectionPtr&) {
        if (auto self = weakSelf.lock()) self->OnUpstreamWriteComplete();
    });
    upstream_->SetEofCallback([weakSelf](const TcpConnectionPtr&) {
        if (auto self = weakSelf.lock()) self->OnUpstreamEof();
    });
    upstream_->SetConnectionCallback([weakSelf](const TcpConnectionPtr& conn) {
        if (conn->connected()) return;
        if (auto self = weakSelf.lock()) self->OnUpstreamClosed();
    });
    upstream_->ConnectEstablished();

    if (!pending.empty()) {
        NoteFirstByte();
        upstream_->Send(pending);
        result_.bytesClientToUpstream += static_cast<long long>(pending.size());
    }
    LOG_DEBUG << "TunnelRelay " << client_->name() << " <-> " << upstream_->name() << " started";
    ArmIdleTimer(opts_.idleSec);
}

void TunnelRelay::NoteFirstByte() {
    if (result_.ttfbSec < 0.0) result_.ttfbSec = SecondsSince(startedAt_);
}

void TunnelRelay::ArmIdleTimer(double seconds) {
    std::weak_ptr<TunnelRelay> weakSelf(shared_from_this());
    idleTimer_->Start(seconds, [weakSelf]() {
        if (auto self = weakSelf.lock()) self->OnIdleTimer();
    });
}

void TunnelRelay::OnIdleTimer() {
    if (ended_) return;
    const auto last = std::max(client_->LastActiveTime(), upstream_->LastActiveTime());
    const double idle = SecondsSince(last);
    if (idle < opts_.idleSec) {
        ArmIdleTimer(opts_.idleSec - idle);
        return;
    }
    LOG_DEBUG << "TunnelRelay " << client_->name() << " idle for " << idle << "s";
    End(RelayError::kIdleTimeout);
}

void TunnelRelay::OnClientData(network::Buffer* buf) {
    const size_t n = buf->ReadableBytes();
    if (ended_ || n == 0) {
        buf->RetrieveAll();
        return;
    }
    NoteFirstByte();
    upstream_->Send(buf->Peek(), n);
    buf->RetrieveAll();
    result_.bytesClientToUpstream += static_cast<long long>(n);
    if (!clientPaused_ && upstream_->OutputBytes() > opts_.highWaterMark) {
        clientPaused_ = true;
        client_->StopRead();
    }
}

void TunnelRelay::OnUpstreamData(network::Buffer* buf) {
    const size_t n = buf->ReadableBytes();
    if (ended_ || n == 0) {
        buf->RetrieveAll();
        return;
    }
    NoteFirstByte();
    client_->Send(buf->Peek(), n);
    buf->RetrieveAll();
    result_.bytesUpstreamToClient += static_cast<long long>(n);
    if (!upstreamPaused_ && client_->OutputBytes() > opts_.highWaterMark) {
        upstreamPaused_ = true;
        upstream_->StopRead();
    }
}

void TunnelRelay::OnClientWriteComplete() {
    if (upstreamPaused_ && !upstreamClosed_) {
        upstreamPaused_ = false;
        upstream_->StartRead();
    }
}

void TunnelRelay::OnUpstreamWriteComplete() {
    if (clientPaused_ && !clientClosed_) {
        clientPaused_ = false;
        client_->StartRead();
    }
}

void TunnelRelay::OnClientEof() {
    if (ended_ || clientEof_) return;
    auto guard = shared_from_this();
    clientEof_ = true;
    LOG_DEBUG << "TunnelRelay client " << client_->name() << " finished after "
              << result_.bytesClientToUpstream << " bytes";
    upstream_->ShutdownWrite();
    if (upstreamEof_) End(RelayError::kNone);
}

void TunnelRelay::OnUpstreamEof() {
    if (ended_ || upstreamEof_) return;
    auto guard = shared_from_this();
    upstreamEof_ = true;
    LOG_DEBUG << "TunnelRelay upstream " << upstream_->name() << " finished after "
              << result_.bytesUpstreamToClient << " bytes";
    client_->ShutdownWrite();
    if (clientEof_) End(RelayError::kNone);
}

void TunnelRelay::OnClientClosed() {
    if (clientClosed_) return;
    auto guard = shared_from_this();
    clientClosed_ = true;
    // Anything still queued for the client never reached it.
    result_.bytesUpstreamToClient =
        std::max(0LL, result_.bytesUpstreamToClient - static_cast<long long>(client_->OutputBytes()));
    if (!ended_) {
        const int err = client_->LastErrno();
        if (err != 0) LOG_DEBUG << "TunnelRelay client " << client_->name() << " error: " << std::strerror(err);
        End(err != 0 ? RelayError::kIoError : RelayError::kNone);
    }
    MaybeFinish();
}

void TunnelRelay::OnUpstreamClosed() {
    if (upstreamClosed_) return;
    auto guard = shared_from_this();
    upstreamClosed_ = true;
    result_.bytesClientToUpstream =
        std::max(0LL, result_.bytesClientToUpstream - static_cast<long long>(upstream_->OutputBytes()));
    if (!ended_) {
        const int err = upstream_->LastErrno();
        if (err != 0) LOG_DEBUG << "TunnelRelay upstream " << upstream_->name() << " error: " << std::strerror(err);
        End(err != 0 ? RelayError::kIoError : RelayError::kNone);
    }
    MaybeFinish();
}

void TunnelRelay::End(RelayError error) {
    if (ended_) return;
    ended_ = true;
    idleTimer_->Cancel();
    result_.error = error;
    result_.durationSec = SecondsSince(startedAt_);

    client_->GracefulClose();
    upstream_->GracefulClose();
    if (!(clientClosed_ && upstreamClosed_)) {
        TcpConnectionPtr client = client_;
        TcpConnectionPtr upstream = upstream_;
        lingerTimer_->Start(opts_.lingerSec, [client, upstream]() {
            client->ForceClose();
            upstream->ForceClose();
        });
    }
}

void TunnelRelay::MaybeFinish() {
    if (finished_ || !ended_ || !clientClosed_ || !upstreamClosed_) return;
    finished_ = true;
    lingerTimer_->Cancel();
    LOG_DEBUG << "TunnelRelay " << client_->name() << " done c->u=" << result_.bytesClientToUpstream
              << " u->c=" << result_.bytesUpstreamToClient;
    CompletionCallback cb = std::move(cb_);
    cb_ = nullptr;
    if (cb) cb(result_);
}

} // namespace relay
} // namespace fwdproxy
