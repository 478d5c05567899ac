#include "fwdproxy/relay/HttpForwarder.h"
#include "fwdproxy/network/Buffer.h"
#include "fwdproxy/network/EventLoop.h"
#include "fwdproxy/network/TcpConnection.h"
#include "fwdproxy/network/Timer.h"
#include "fwdproxy/protocol/HeaderRewrite.h"
#include "fwdproxy/protocol/ParsedRequest.h"
#include "fwdproxy/protocol/StatusReply.h"
#include "fwdproxy/common/Logger.h"

#include <algorithm>
#include <cctype>

namespace fwdproxy {
namespace relay {

using network::TcpConnectionPtr;

namespace {

double SecondsSince(std::chrono::steady_clock::time_point t) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t).count();
}

std::string FirstLine(const std::string& head) {
    const size_t eol = head.find_first_of("\r\n");
    return eol == std::string::npos ? head : head.substr(0, eol);
}

int StatusCode(const std::string& statusLine) {
    const size_t sp = statusLine.find(' ');
    if (sp == std::string::npos || sp + 4 > statusLine.size()) return 0;
    int code = 0;
    for (size_t i = sp + 1; i < sp + 4; ++i) {
        const unsigned char c = static_cast<unsigned char>(statusLine[i]);
        if (!std::isdigit(c)) return 0;
        code = code * 10 + (c - '0');
    }
    return code;
}

// Declared body length, or -1 when the response runs until close.
long long DeclaredLength(const std::string& head) {
    long long length = -1;
    size_t pos = head.find('\n');
    while (pos != std::string::npos && pos + 1 < head.size()) {
        const size_t start = pos + 1;
        size_t eol = head.find('\n', start);
        std::string line = head.substr(start, eol == std::string::npos ? std::string::npos : eol - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        pos = eol;
        const size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        const std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t") + 1);
        if (protocol::IEquals(name, "Transfer-Encoding")) return -1;
        if (!protocol::IEquals(name, "Content-Length")) continue;
        if (value.empty() || value.size() > 18 ||
            !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return -1;
        }
        const long long v = std::stoll(value);
        if (length >= 0 && length != v) return -1;
        length = v;
    }
    return length;
}

} // namespace

HttpForwarder::HttpForwarder(network::EventLoop* loop,
                             const TcpConnectionPtr& client,
                             const TcpConnectionPtr& upstream,
                             const Options& opts)
    : loop_(loop),
      client_(client),
      upstream_(upstream),
      opts_(opts),
      headRequest_(false),
      requestSent_(false),
      idleTimer_(new network::Timer(loop)),
      lingerTimer_(new network::Timer(loop)),
      headDone_(false),
      headTooLarge_(false),
      bodyExpected_(-1),
      bodySeen_(0),
      completed_(false),
      finished_(false),
      clientEof_(false),
      clientClosed_(false),
      upstreamClosed_(false),
      clientPaused_(false),
      upstreamPaused_(false) {
}

HttpForwarder::~HttpForwarder() {
    if (!finished_) {
        client_->ForceClose();
        upstream_->ForceClose();
    }
}

void HttpForwarder::Start(const protocol::ParsedRequest& req, CompletionCallback cb) {
    cb_ = std::move(cb);
    headRequest_ = (req.method == "HEAD");
    startedAt_ = std::chrono::steady_clock::now();

    std::weak_ptr<HttpForwarder> weakSelf(shared_from_this());
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
    upstream_->SetConnectionCallback([weakSelf](const TcpConnectionPtr& conn) {
        if (conn->connected()) return;
        if (auto self = weakSelf.lock()) self->OnUpstreamClosed();
    });
    upstream_->ConnectEstablished();

    result_.upstreamHead = protocol::RewriteForUpstream(req);
    const std::string& head = result_.upstreamHead;
    upstream_->Send(head + req.pending);
    result_.bytesToUpstream = static_cast<long long>(head.size() + req.pending.size());
    result_.bytesFromClient = static_cast<long long>(req.pending.size());

    LOG_DEBUG << "HttpForwarder " << client_->name() << " -> " << upstream_->name() << " "
              << FirstLine(head);
    ArmIdleTimer(opts_.responseIdleSec);
}

void HttpForwarder::ArmIdleTimer(double seconds) {
    std::weak_ptr<HttpForwarder> weakSelf(shared_from_this());
    idleTimer_->Start(seconds, [weakSelf]() {
        if (auto self = weakSelf.lock()) self->OnIdleTimer();
    });
}

void HttpForwarder::OnIdleTimer() {
    if (completed_) return;
    const auto last = std::max(client_->LastActiveTime(), upstream_->LastActiveTime());
    const double idle = SecondsSince(last);
    if (idle < opts_.responseIdleSec) {
        ArmIdleTimer(opts_.responseIdleSec - idle);
        return;
    }
    LOG_DEBUG << "HttpForwarder " << upstream_->name() << " idle for " << idle << "s";
    Complete(RelayError::kIdleTimeout);
}

void HttpForwarder::OnUpstreamData(network::Buffer* buf) {
    const size_t n = buf->ReadableBytes();
    if (n == 0) return;
    if (completed_) {
        buf->RetrieveAll();
        return;
    }
    // An early response can beat the end of the request write.
    if (result_.ttfbSec < 0.0) result_.ttfbSec = SecondsSince(requestSent_ ? sentAt_ : startedAt_);
    if (result_.responsePreview.size() < opts_.maxResponsePreview) {
        result_.responsePreview.append(
            buf->Peek(), std::min(n, opts_.maxResponsePreview - result_.responsePreview.size()));
    }

    client_->Send(buf->Peek(), n);
    result_.bytesFromUpstream += static_cast<long long>(n);
    result_.bytesToClient += static_cast<long long>(n);
    result_.headersSentToClient = true;

    if (!headDone_ && !headTooLarge_) {
        ScanResponseHead(buf->Peek(), n);
    } else {
        bodySeen_ += static_cast<long long>(n);
    }
    buf->RetrieveAll();

    if (!upstreamPaused_ && client_->OutputBytes() > opts_.highWaterMark) {
        upstreamPaused_ = true;
        upstream_->StopRead();
    }
    CheckBodyComplete();
}

void HttpForwarder::ScanResponseHead(const char* data, size_t len) {
    while (len > 0) {
        const size_t old = head_.size();
        const size_t room = opts_.maxResponseHead > old ? opts_.maxResponseHead - old : 0;
        const size_t take = std::min(len, room);
        head_.append(data, take);

        const size_t from = old >= 3 ? old - 3 : 0;
        size_t end = std::string::npos;
        const size_t crlf = head_.find("\r\n\r\n", from);
        if (crlf != std::string::npos) end = crlf + 4;
        const size_t lf = head_.find("\n\n", from);
        if (lf != std::string::npos && (end == std::string::npos || lf + 2 < end)) end = lf + 2;

        if (end == std::string::npos) {
            if (head_.size() >= opts_.maxResponseHead) {
                LOG_WARN << "HttpForwarder " << upstream_->name() << " response head exceeds "
                         << opts_.maxResponseHead << " bytes, relaying until close";
                headTooLarge_ = true;
                result_.statusLine = FirstLine(head_);
                bodyExpected_ = -1;
                bodySeen_ += static_cast<long long>(len - take);
            }
            return;
        }

        const size_t used = end - old;
        head_.resize(end);
        data += used;
        len -= used;

        result_.statusLine = FirstLine(head_);
        const int code = StatusCode(result_.statusLine);
        if (code >= 100 && code < 200 && code != 101) {
            // Interim response; the final one follows.
            head_.clear();
            continue;
        }

        headDone_ = true;
        if (headRequest_ || code == 204 || code == 304) {
            bodyExpected_ = 0;
        } else if (code == 101) {
            bodyExpected_ = -1;
        } else {
            bodyExpected_ = DeclaredLength(head_);
        }
        bodySeen_ += static_cast<long long>(len);
        return;
    }
}

void HttpForwarder::CheckBodyComplete() {
    if (completed_ || !headDone_ || bodyExpected_ < 0) return;
    if (bodySeen_ >= bodyExpected_) Complete(RelayError::kNone);
}

void HttpForwarder::OnClientData(network::Buffer* buf) {
    const size_t n = buf->ReadableBytes();
    if (completed_) {
        buf->RetrieveAll();
        return;
    }
    // Request body (or anything else the client sends) goes upstream as is.
    upstream_->Send(buf->Peek(), n);
    buf->RetrieveAll();
    result_.bytesFromClient += static_cast<long long>(n);
    result_.bytesToUpstream += static_cast<long long>(n);
    if (!clientPaused_ && upstream_->OutputBytes() > opts_.highWaterMark) {
        clientPaused_ = true;
        client_->StopRead();
    }
}

void HttpForwarder::OnClientWriteComplete() {
    if (upstreamPaused_ && !upstreamClosed_) {
        upstreamPaused_ = false;
        upstream_->StartRead();
    }
}

void HttpForwarder::OnClientEof() {
    if (completed_ || clientEof_) return;
    clientEof_ = true;
    LOG_DEBUG << "HttpForwarder " << client_->name() << " request side finished after "
              << result_.bytesFromClient << " body bytes";
}

void HttpForwarder::OnUpstreamWriteComplete() {
    if (!requestSent_ && upstream_->OutputBytes() == 0) {
        requestSent_ = true;
        sentAt_ = std::chrono::steady_clock::now();
    }
    if (clientPaused_ && !clientClosed_) {
        clientPaused_ = false;
        client_->StartRead();
    }
}

void HttpForwarder::OnClientClosed() {
    if (clientClosed_) return;
    auto guard = shared_from_this();
    clientClosed_ = true;
    // Queued but never written.
    result_.bytesToClient = std::max(0LL, result_.bytesToClient - static_cast<long long>(client_->OutputBytes()));
    if (!completed_) Complete(RelayError::kClientClosed);
    MaybeFinish();
}

void HttpForwarder::OnUpstreamClosed() {
    if (upstreamClosed_) return;
    auto guard = shared_from_this();
    upstreamClosed_ = true;
    result_.bytesToUpstream = std::max(0LL, result_.bytesToUpstream - static_cast<long long>(upstream_->OutputBytes()));
    if (!completed_) {
        const bool untilClose = (headDone_ || headTooLarge_) && bodyExpected_ < 0;
        if (untilClose && upstream_->LastErrno() == 0) {
            Complete(RelayError::kNone);
        } else {
            Complete(RelayError::kUpstreamClosed);
        }
    }
    MaybeFinish();
}

void HttpForwarder::Complete(RelayError error) {
    if (completed_) return;
    completed_ = true;
    idleTimer_->Cancel();
    result_.error = error;
    result_.durationSec = SecondsSince(startedAt_);

    if (error != RelayError::kNone && error != RelayError::kClientClosed &&
        !result_.headersSentToClient && client_->connected()) {
        const std::string reply = protocol::StatusReply(502);
        client_->Send(reply);
        result_.bytesToClient += static_cast<long long>(reply.size());
        result_.statusLine = protocol::StatusLine(502);
    }
    if (error != RelayError::kNone) {
        LOG_DEBUG << "HttpForwarder " << upstream_->name() << " ended with " << RelayErrorName(error)
                  << " after " << result_.bytesFromUpstream << " bytes";
    }

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

void HttpForwarder::MaybeFinish() {
    if (finished_ || !completed_ || !clientClosed_ || !upstreamClosed_) return;
    finished_ = true;
    lingerTimer_->Cancel();
    CompletionCallback cb = std::move(cb_);
    cb_ = nullptr;
    if (cb) cb(result_);
}

} // namespace relay
} // namespace fwdproxy
