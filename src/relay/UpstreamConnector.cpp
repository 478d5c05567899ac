#include "fwdproxy/relay/UpstreamConnector.h"
#include "fwdproxy/network/EventLoop.h"
#include "fwdproxy/network/Socket.h"
#include "fwdproxy/network/TcpConnection.h"
#include "fwdproxy/network/Timer.h"
#include "fwdproxy/common/Logger.h"
#include "fwdproxy/monitor/Stats.h"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace fwdproxy {
namespace relay {

using network::InetAddress;
using network::TcpConnection;
using network::TcpConnectionPtr;

namespace {
std::atomic<unsigned long> g_upstreamSeq{0};
}

UpstreamConnectorPtr UpstreamConnector::Connect(network::EventLoop* loop,
                                                const std::string& host,
                                                uint16_t port,
                                                double timeoutSec,
                                                Callback cb) {
    auto c = std::make_shared<UpstreamConnector>(loop, host, port, timeoutSec);
    c->Start(std::move(cb));
    return c;
}

UpstreamConnector::UpstreamConnector(network::EventLoop* loop, const std::string& host, uint16_t port, double timeoutSec)
    : loop_(loop),
      host_(host),
      port_(port),
      timeoutSec_(timeoutSec > 0.0 ? timeoutSec : 5.0),
      done_(false),
      deadline_(new network::Timer(loop)),
      nextAddr_(0),
      lastErrno_(0) {
}

UpstreamConnector::~UpstreamConnector() {
    if (ticket_) {
        std::lock_guard<std::mutex> lock(ticket_->mutex);
        ticket_->cancelled = true;
    }
    if (connector_) connector_->Stop();
}

int UpstreamConnector::Resolve(const std::string& host, uint16_t port, std::vector<InetAddress>* out) {
    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    const int gai = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (gai != 0) return gai;
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        if (ai->ai_family != AF_INET || ai->ai_addrlen < sizeof(sockaddr_in)) continue;
        const InetAddress addr(*reinterpret_cast<const sockaddr_in*>(ai->ai_addr));
        bool dup = false;
        for (const auto& a : *out) {
            if (a.toIpPort() == addr.toIpPort()) dup = true;
        }
        if (!dup) out->push_back(addr);
    }
    ::freeaddrinfo(res);
    return out->empty() ? EAI_NONAME : 0;
}

double UpstreamConnector::ElapsedSec() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - startedAt_).count();
}

double UpstreamConnector::RemainingSec() const {
    return timeoutSec_ - ElapsedSec();
}

void UpstreamConnector::Start(Callback cb) {
    cb_ = std::move(cb);
    startedAt_ = std::chrono::steady_clock::now();

    std::weak_ptr<UpstreamConnector> weakSelf(shared_from_this());
    deadline_->Start(timeoutSec_, [weakSelf]() {
        if (auto self = weakSelf.lock()) self->OnDeadline();
    });

    auto numeric = InetAddress::FromIpPort(host_, port_);
    if (numeric) {
        addrs_.push_back(*numeric);
        TryNext();
        return;
    }
    StartResolve();
}

void UpstreamConnector::StartResolve() {
    ticket_ = std::make_shared<ResolveTicket>();
    ticket_->loop = loop_;

    std::weak_ptr<UpstreamConnector> weakSelf(shared_from_this());
    auto ticket = ticket_;
    const std::string host = host_;
    const uint16_t port = port_;
    try {
        std::thread([ticket, weakSelf, host, port]() {
            std::vector<InetAddress> addrs;
            const int gai = Resolve(host, port, &addrs);
            std::lock_guard<std::mutex> lock(ticket->mutex);
            if (ticket->cancelled) return;
            ticket->loop->QueueInLoop([weakSelf, addrs, gai]() {
                if (auto self = weakSelf.lock()) self->OnResolved(addrs, gai);
            });
        }).detach();
    } catch (const std::system_error& e) {
        LOG_ERROR << "UpstreamConnector cannot start resolver for " << host_ << ": " << e.what();
        ConnectResult result;
        result.error = ConnectError::kDnsFailure;
        result.sysErrno = EAGAIN;
        Finish(result);
    }
}

void UpstreamConnector::OnResolved(const std::vector<InetAddress>& addrs, int gaiError) {
    if (done_) return;
    if (gaiError != 0 || addrs.empty()) {
        LOG_DEBUG << "UpstreamConnector resolve " << host_ << " failed: " << ::gai_strerror(gaiError);
        ConnectResult result;
        result.error = ConnectError::kDnsFailure;
        result.sysErrno = gaiError;
        Finish(result);
        return;
    }
    addrs_ = addrs;
    TryNext();
}

void UpstreamConnector::TryNext() {
    if (done_) return;
    const double remaining = RemainingSec();
    if (nextAddr_ >= addrs_.size() || remaining <= 0.0) {
        ConnectResult result;
        result.error = (lastErrno_ == ETIMEDOUT || remaining <= 0.0) ? ConnectError::kConnectTimeout
                                                                      : ConnectError::kConnectionRefused;
        result.sysErrno = lastErrno_ != 0 ? lastErrno_ : ETIMEDOUT;
        if (!addrs_.empty()) result.peer = addrs_[addrs_.size() - 1];
        Finish(result);
        return;
    }

    const InetAddress addr = addrs_[nextAddr_++];
    std::weak_ptr<UpstreamConnector> weakSelf(shared_from_this());
    connector_ = std::make_shared<network::Connector>(loop_, addr, remaining);
    connector_->SetNewConnectionCallback([weakSelf](int sockfd) {
        if (auto self = weakSelf.lock()) {
            self->OnConnected(sockfd);
        } else {
            ::close(sockfd);
        }
    });
    connector_->SetErrorCallback([weakSelf](int savedErrno) {
        if (auto self = weakSelf.lock()) self->OnConnectError(savedErrno);
    });
    connector_->Start();
}

void UpstreamConnector::OnConnected(int sockfd) {
    // The connector is still on the stack; release it later.
    network::ConnectorPtr finished = std::move(connector_);
    loop_->QueueInLoop([finished]() {});
    if (done_) {
        ::close(sockfd);
        return;
    }

    const InetAddress peer = finished->serverAddress();
    const std::string name = "upstream-" + host_ + ":" + std::to_string(port_) + "#" +
                             std::to_string(g_upstreamSeq.fetch_add(1, std::memory_order_relaxed) + 1);
    TcpConnectionPtr conn = std::make_shared<TcpConnection>(loop_, name, sockfd,
                                                            network::Socket::GetLocalAddr(sockfd), peer);
    network::EventLoop* loop = loop_;
    conn->SetCloseCallback([loop](const TcpConnectionPtr& c) {
        loop->QueueInLoop([c]() { c->ConnectDestroyed(); });
    });
    fwdproxy::monitor::Stats::Instance().IncUpstreamConnects();

    ConnectResult result;
    result.conn = std::move(conn);
    result.peer = peer;
    Finish(result);
}

void UpstreamConnector::OnConnectError(int savedErrno) {
    network::ConnectorPtr failed = std::move(connector_);
    loop_->QueueInLoop([failed]() {});
    if (done_) return;
    lastErrno_ = savedErrno;
    if (failed) {
        LOG_DEBUG << "UpstreamConnector " << host_ << " via " << failed->serverAddress().toIpPort()
                  << " failed: " << std::strerror(savedErrno);
    }
    if (savedErrno == ETIMEDOUT) {
        ConnectResult result;
        result.error = ConnectError::kConnectTimeout;
        result.sysErrno = ETIMEDOUT;
        if (failed) result.peer = failed->serverAddress();
        Finish(result);
        return;
    }
    TryNext();
}

void UpstreamConnector::OnDeadline() {
    if (done_) return;
    ConnectResult result;
    result.sysErrno = ETIMEDOUT;
    // Still waiting on the resolver.
    result.error = addrs_.empty() ? ConnectError::kDnsFailure : ConnectError::kConnectTimeout;
    if (connector_) result.peer = connector_->serverAddress();
    Finish(result);
}

void UpstreamConnector::Finish(ConnectResult& result) {
    done_ = true;
    deadline_->Cancel();
    if (ticket_) {
        std::lock_guard<std::mutex> lock(ticket_->mutex);
        ticket_->cancelled = true;
    }
    if (connector_) {
        connector_->Stop();
        network::ConnectorPtr stopped = std::move(connector_);
        loop_->QueueInLoop([stopped]() {});
    }
    result.elapsedSec = ElapsedSec();
    if (result.error != ConnectError::kNone) {
        LOG_DEBUG << "UpstreamConnector " << host_ << ":" << port_ << " " << ConnectErrorName(result.error)
                  << " after " << result.elapsedSec << "s";
    }

    // Always delivered from the loop, never from inside Connect().
    std::weak_ptr<UpstreamConnector> weakSelf(shared_from_this());
    ConnectResult delivered = result;
    loop_->QueueInLoop([weakSelf, delivered]() mutable {
        auto self = weakSelf.lock();
        if (!self || !self->cb_) return;
        Callback cb = std::move(self->cb_);
        self->cb_ = nullptr;
        cb(delivered);
    });
}

void UpstreamConnector::Cancel() {
    cb_ = nullptr;
    if (done_) return;
    done_ = true;
    deadline_->Cancel();
    if (ticket_) {
        std::lock_guard<std::mutex> lock(ticket_->mutex);
        ticket_->cancelled = true;
    }
    if (connector_) {
        connector_->Stop();
        network::ConnectorPtr stopped = std::move(connector_);
        loop_->QueueInLoop([stopped]() {});
    }
}

} // namespace relay
} // namespace fwdproxy
