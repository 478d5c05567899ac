#include "fwdproxy/network/TcpConnection.h"
#include "fwdproxy/network/Socket.h"
#include "fwdproxy/network/Channel.h"
#include "fwdproxy/network/EventLoop.h"
#include "fwdproxy/network/TlsStream.h"
#include "fwdproxy/common/Logger.h"

#include <errno.h>
#include <cstring>
#include <sys/socket.h>

namespace fwdproxy {
namespace network {

namespace {

std::int64_t NowSteadyNs() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

bool WouldBlock(int err) {
    return err == EAGAIN || err == EWOULDBLOCK || err == EINTR;
}

} // namespace

TcpConnection::TcpConnection(EventLoop* loop,
                             const std::string& name,
                             int sockfd,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr,
                             ssl_ctx_st* tlsCtx)
    : loop_(loop),
      name_(name),
      state_(kConnecting),
      reading_(true),
      draining_(false),
      writeShut_(false),
      shutdownPending_(false),
      readEof_(false),
      closeHandled_(false),
      lastErrno_(0),
      socket_(new Socket(sockfd)),
      channel_(new Channel(loop, sockfd)),
      localAddr_(localAddr),
      peerAddr_(peerAddr),
      lastActiveNs_(NowSteadyNs()),
      tls_(tlsCtx ? new TlsStream(tlsCtx, sockfd, name) : nullptr) {
    channel_->SetReadCallback(
        [this](std::chrono::system_clock::time_point t) { HandleRead(t); });
    channel_->SetWriteCallback([this]() { HandleWrite(); });
    channel_->SetCloseCallback([this]() { HandleClose(); });
    channel_->SetErrorCallback([this]() { HandleError(); });

    socket_->SetKeepAlive(true);
    socket_->SetTcpNoDelay(true);
    LOG_DEBUG << "TcpConnection [" << name_ << "] fd=" << sockfd << " " << localAddr_.toIpPort()
              << " <-> " << peerAddr_.toIpPort();
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "TcpConnection [" << name_ << "] destroyed in " << StateName(state_);
}

const char* TcpConnection::StateName(StateE s) {
    switch (s) {
        case kDisconnected: return "disconnected";
        case kConnecting: return "connecting";
        case kConnected: return "connected";
        case kDisconnecting: return "disconnecting";
    }
    return "?";
}

void TcpConnection::ConnectEstablished() {
    SetState(kConnected);
    Touch();
    channel_->Tie(shared_from_this());
    channel_->EnableReading();
    if (connectionCallback_) connectionCallback_(shared_from_this());
}

void TcpConnection::ConnectDestroyed() {
    const StateE s = state_;
    if (s == kConnected || s == kDisconnecting) {
        SetState(kDisconnected);
        closeHandled_ = true;
        channel_->DisableAll();
        if (connectionCallback_) connectionCallback_(shared_from_this());
    }
    channel_->Remove();
}

bool TcpConnection::AdvanceTls() {
    if (!tls_) return true;

    if (tls_->phase() == TlsStream::kUndecided) tls_->Sniff();
    if (tls_->phase() == TlsStream::kHandshaking &&
        tls_->Handshake() == TlsStream::kEstablished &&
        outputBuffer_.ReadableBytes() > 0 && !channel_->IsWriting()) {
        channel_->EnableWriting();
    }

    switch (tls_->phase()) {
        case TlsStream::kFailed:
            lastErrno_ = EPROTO;
            HandleClose();
            return false;
        case TlsStream::kHandshaking:
            if (tls_->wantsWrite() && !channel_->IsWriting()) channel_->EnableWriting();
            return false;
        default:
            // kUndecided only survives when nothing is readable yet (or EOF);
            // the plain path below reports that.
            return true;
    }
}

ssize_t TcpConnection::ReadOnce(int* savedErrno) {
    if (!tls_ || !tls_->established()) {
        return inputBuffer_.ReadFd(channel_->fd(), savedErrno);
    }
    // One TLS record carries at most 16 KiB of plaintext.
    char record[16 * 1024];
    const ssize_t n = tls_->Read(record, sizeof(record), savedErrno);
    if (n > 0) inputBuffer_.Append(record, static_cast<size_t>(n));
    return n;
}

// -2: retry on the next writable event.
ssize_t TcpConnection::WriteOnce(const void* data, size_t len, int* savedErrno) {
    if (tls_ && tls_->established()) return tls_->Write(data, len, savedErrno);

    const ssize_t n = ::send(channel_->fd(), data, len, MSG_NOSIGNAL);
    if (n >= 0) return n;
    if (WouldBlock(errno)) return -2;
    *savedErrno = errno;
    return -1;
}

void TcpConnection::HandleRead(std::chrono::system_clock::time_point receiveTime) {
    if (closeHandled_ || !AdvanceTls()) return;

    int savedErrno = 0;
    const ssize_t n = ReadOnce(&savedErrno);
    if (n > 0) {
        Touch();
        if (draining_) {
            inputBuffer_.RetrieveAll();
        } else if (messageCallback_) {
            messageCallback_(shared_from_this(), &inputBuffer_, receiveTime);
        }
        return;
    }
    if (n == 0) {
        if (draining_ || readEof_ || !eofCallback_) {
            HandleClose();
            return;
        }
        readEof_ = true;
        reading_ = false;
        channel_->DisableReading();
        LOG_DEBUG << "TcpConnection [" << name_ << "] peer shut down its write side";
        TcpConnectionPtr guard(shared_from_this());
        eofCallback_(guard);
        // Our FIN already went out: both directions are done.
        if (writeShut_) HandleClose();
        return;
    }
    if (n == -2) {
        if (tls_->wantsWrite() && !channel_->IsWriting()) channel_->EnableWriting();
        return;
    }
    if (WouldBlock(savedErrno)) return;

    lastErrno_ = savedErrno;
    LOG_DEBUG << "TcpConnection [" << name_ << "] read failed: " << std::strerror(savedErrno);
    HandleClose();
}

void TcpConnection::HandleWrite() {
    if (tls_ && tls_->phase() == TlsStream::kHandshaking && !AdvanceTls()) {
        if (!closeHandled_ && !tls_->wantsWrite()) channel_->DisableWriting();
        return;
    }
    if (!channel_->IsWriting()) return;

    if (outputBuffer_.ReadableBytes() > 0) {
        int savedErrno = 0;
        const ssize_t n = WriteOnce(outputBuffer_.Peek(), outputBuffer_.ReadableBytes(), &savedErrno);
        if (n == -2) return;
        if (n <= 0) {
            lastErrno_ = savedErrno != 0 ? savedErrno : EPIPE;
            LOG_DEBUG << "TcpConnection [" << name_ << "] write failed: " << std::strerror(lastErrno_);
            HandleClose();
            return;
        }
        Touch();
        outputBuffer_.Retrieve(static_cast<size_t>(n));
        if (outputBuffer_.ReadableBytes() > 0) return;
        NotifyWriteComplete();
    }

    channel_->DisableWriting();
    if (shutdownPending_) ShutdownInLoop();
}

void TcpConnection::HandleClose() {
    if (closeHandled_) return;
    closeHandled_ = true;
    LOG_DEBUG << "TcpConnection [" << name_ << "] closing from " << StateName(state_)
              << " errno=" << lastErrno_;
    SetState(kDisconnected);
    channel_->DisableAll();

    TcpConnectionPtr guard(shared_from_this());
    if (connectionCallback_) connectionCallback_(guard);
    // Must be last: the owner may drop its reference here.
    if (closeCallback_) closeCallback_(guard);
}

void TcpConnection::HandleError() {
    const int err = Socket::GetSocketError(channel_->fd());
    if (err != 0) lastErrno_ = err;
    LOG_DEBUG << "TcpConnection [" << name_ << "] socket error " << err;
}

void TcpConnection::NotifyWriteComplete() {
    if (!writeCompleteCallback_) return;
    loop_->QueueInLoop([cb = writeCompleteCallback_, self = shared_from_this()]() { cb(self); });
}

void TcpConnection::Send(const std::string& message) {
    Send(message.data(), message.size());
}

void TcpConnection::Send(const void* data, size_t len) {
    if (state_ != kConnected || len == 0) return;
    if (loop_->IsInLoopThread()) {
        SendInLoop(data, len);
        return;
    }
    loop_->RunInLoop([self = shared_from_this(),
                      copy = std::string(static_cast<const char*>(data), len)]() {
        self->SendInLoop(copy.data(), copy.size());
    });
}

void TcpConnection::SendInLoop(const void* data, size_t len) {
    if (state_ == kDisconnected || writeShut_) {
        LOG_DEBUG << "TcpConnection [" << name_ << "] dropping " << len << " bytes after close";
        return;
    }

    const char* p = static_cast<const char*>(data);
    size_t left = len;
    const bool tlsPending = tls_ && (tls_->phase() == TlsStream::kHandshaking ||
                                     tls_->phase() == TlsStream::kFailed);

    // Bytes may only go out directly when nothing is queued ahead of them.
    if (!tlsPending && !channel_->IsWriting() && outputBuffer_.ReadableBytes() == 0) {
        int savedErrno = 0;
        const ssize_t n = WriteOnce(p, left, &savedErrno);
        if (n > 0) {
            Touch();
            p += n;
            left -= static_cast<size_t>(n);
            if (left == 0) NotifyWriteComplete();
        } else if (n != -2) {
            lastErrno_ = savedErrno != 0 ? savedErrno : EPIPE;
            LOG_DEBUG << "TcpConnection [" << name_ << "] send failed: " << std::strerror(lastErrno_);
            loop_->QueueInLoop([self = shared_from_this()]() { self->ForceCloseInLoop(); });
            return;
        }
    }

    if (left == 0) return;
    outputBuffer_.Append(p, left);
    if (!tlsPending && !channel_->IsWriting()) channel_->EnableWriting();
}

void TcpConnection::ShutdownInLoop() {
    // Deferred until HandleWrite drains the output buffer.
    if (channel_->IsWriting() || outputBuffer_.ReadableBytes() > 0) return;
    if (!writeShut_) {
        writeShut_ = true;
        if (tls_) tls_->Shutdown();
        socket_->ShutdownWrite();
    }
    if (readEof_) {
        loop_->QueueInLoop([self = shared_from_this()]() { self->ForceCloseInLoop(); });
    }
}

void TcpConnection::ShutdownWrite() {
    if (state_ != kConnected) return;
    loop_->RunInLoop([self = shared_from_this()]() { self->ShutdownWriteInLoop(); });
}

void TcpConnection::ShutdownWriteInLoop() {
    if (closeHandled_ || shutdownPending_) return;
    shutdownPending_ = true;
    ShutdownInLoop();
}

void TcpConnection::GracefulClose() {
    const StateE s = state_;
    if (s != kConnected && s != kDisconnecting) return;
    SetState(kDisconnecting);
    loop_->RunInLoop([self = shared_from_this()]() { self->GracefulCloseInLoop(); });
}

void TcpConnection::GracefulCloseInLoop() {
    if (closeHandled_) return;
    draining_ = true;
    shutdownPending_ = true;
    inputBuffer_.RetrieveAll();
    // The peer's FIN is only seen while reading.
    StartReadInLoop();
    ShutdownInLoop();
}

void TcpConnection::ForceClose() {
    if (state_ == kDisconnected) return;
    loop_->RunInLoop([self = shared_from_this()]() { self->ForceCloseInLoop(); });
}

void TcpConnection::ForceCloseInLoop() {
    if (state_ != kDisconnected) HandleClose();
}

void TcpConnection::StartRead() {
    loop_->RunInLoop([self = shared_from_this()]() { self->StartReadInLoop(); });
}

void TcpConnection::StopRead() {
    loop_->RunInLoop([self = shared_from_this()]() { self->StopReadInLoop(); });
}

void TcpConnection::StartReadInLoop() {
    if (closeHandled_ || readEof_) return;
    if (reading_ && channel_->IsReading()) return;
    reading_ = true;
    channel_->EnableReading();
}

void TcpConnection::StopReadInLoop() {
    if (closeHandled_ || draining_ || !reading_) return;
    reading_ = false;
    channel_->DisableReading();
}

void TcpConnection::Touch() {
    lastActiveNs_.store(NowSteadyNs(), std::memory_order_relaxed);
}

std::chrono::steady_clock::time_point TcpConnection::LastActiveTime() const {
    return std::chrono::steady_clock::time_point(
        std::chrono::nanoseconds(lastActiveNs_.load(std::memory_order_relaxed)));
}

} // namespace network
} // namespace fwdproxy
