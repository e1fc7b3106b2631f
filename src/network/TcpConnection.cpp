#include "fwdgate/network/TcpConnection.h"
#include "fwdgate/network/Socket.h"
#include "fwdgate/network/Channel.h"
#include "fwdgate/network/EventLoop.h"
#include "fwdgate/network/TlsContext.h"
#include "fwdgate/common/Logger.h"

#include <openssl/ssl.h>

#include <unistd.h>
#include <errno.h>
#include <cstring>
#include <sys/socket.h>

namespace fwdgate {
namespace network {

namespace {

const int kTlsPlain = 0;
const int kTlsHandshake = 1;
const int kTlsEstablished = 2;
const int kTlsFailed = 3;

// TLS record type 0x16 = handshake.
const unsigned char kTlsHandshakeRecord = 0x16;

std::int64_t ToSteadyNs(std::chrono::steady_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

std::chrono::steady_clock::time_point FromSteadyNs(std::int64_t ns) {
    return std::chrono::steady_clock::time_point(std::chrono::nanoseconds(ns));
}

} // namespace

TcpConnection::TcpConnection(EventLoop* loop,
                             const std::string& nameArg,
                             int sockfd,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr,
                             std::shared_ptr<const TlsContext> tls)
    : loop_(loop),
      name_(nameArg),
      state_(kConnecting),
      reading_(true),
      socket_(new Socket(sockfd)),
      channel_(new Channel(loop, sockfd)),
      localAddr_(localAddr),
      peerAddr_(peerAddr),
      deadlineNs_(0),
      secure_(false),
      tls_(std::move(tls)) {
    channel_->SetReadCallback(
        std::bind(&TcpConnection::HandleRead, this, std::placeholders::_1));
    channel_->SetWriteCallback(
        std::bind(&TcpConnection::HandleWrite, this));
    channel_->SetCloseCallback(
        std::bind(&TcpConnection::HandleClose, this));
    channel_->SetErrorCallback(
        std::bind(&TcpConnection::HandleError, this));

    LOG_DEBUG << "TcpConnection::ctor[" << name_ << "] at " << this << " fd=" << sockfd;
    socket_->SetKeepAlive(true);
    socket_->SetTcpNoDelay(true);
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "TcpConnection::dtor[" << name_ << "] fd=" << channel_->fd()
              << " state=" << StateToString(state_);
    if (ssl_) {
        SSL_free(reinterpret_cast<SSL*>(ssl_));
        ssl_ = nullptr;
    }
}

const char* TcpConnection::StateToString(StateE s) {
    switch (s) {
        case kDisconnected: return "disconnected";
        case kConnecting: return "connecting";
        case kConnected: return "connected";
        case kDisconnecting: return "disconnecting";
    }
    return "unknown";
}

void TcpConnection::ConnectEstablished() {
    SetState(kConnected);
    channel_->Tie(shared_from_this());
    channel_->EnableReading();

    if (connectionCallback_) {
        connectionCallback_(shared_from_this());
    }
}

void TcpConnection::ConnectDestroyed() {
    if (state_ == kConnected || state_ == kDisconnecting) {
        SetState(kDisconnected);
        channel_->DisableAll();
        if (connectionCallback_) {
            connectionCallback_(shared_from_this());
        }
    }
    channel_->Remove();
}

bool TcpConnection::tlsTryInitFromPeek() {
    if (!tlsEnabled() || tlsState_ != kTlsPlain) return false;

    unsigned char b = 0;
    const ssize_t n = ::recv(channel_->fd(), &b, 1, MSG_PEEK);
    if (n <= 0) return false;

    // Anything but a handshake record is plaintext HTTP; stop sniffing.
    if (b != kTlsHandshakeRecord) {
        tls_.reset();
        return false;
    }

    ssl_ = tls_->NewSession(channel_->fd());
    if (!ssl_) {
        LOG_WARN << "TLS: no session for " << name_;
        tls_.reset();
        tlsState_ = kTlsFailed;
        return false;
    }
    tlsState_ = kTlsHandshake;
    tlsWantWrite_ = false;
    return true;
}

void TcpConnection::tlsDoHandshake() {
    if (!ssl_ || tlsState_ != kTlsHandshake) return;
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_accept(s);
    if (r == 1) {
        tlsState_ = kTlsEstablished;
        tlsWantWrite_ = false;
        secure_ = true;
        if (channel_->IsWriting() && outputBuffer_.ReadableBytes() == 0) {
            channel_->DisableWriting();
        }
        return;
    }
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_READ) {
        tlsWantWrite_ = false;
        return;
    }
    if (e == SSL_ERROR_WANT_WRITE) {
        tlsWantWrite_ = true;
        if (!channel_->IsWriting()) channel_->EnableWriting();
        return;
    }
    LOG_WARN << "TLS handshake failed [" << name_ << "] error=" << e << ": " << TlsContext::LastError();
    tlsState_ = kTlsFailed;
}

ssize_t TcpConnection::tlsReadOnce(char* buf, size_t cap, int* savedErrno) {
    if (!ssl_ || cap == 0) return 0;
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_read(s, buf, static_cast<int>(cap));
    if (r > 0) return r;
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_READ) return -2;
    if (e == SSL_ERROR_WANT_WRITE) {
        tlsWantWrite_ = true;
        if (!channel_->IsWriting()) channel_->EnableWriting();
        return -2;
    }
    if (e == SSL_ERROR_ZERO_RETURN) return 0;
    if (savedErrno) *savedErrno = EIO;
    return -1;
}

ssize_t TcpConnection::tlsWriteOnce(const void* data, size_t len, int* savedErrno) {
    if (!ssl_ || len == 0) return 0;
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_write(s, data, static_cast<int>(len));
    if (r > 0) return r;
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_WRITE || e == SSL_ERROR_WANT_READ) return -2;
    if (savedErrno) *savedErrno = EIO;
    return -1;
}

// Returns bytes written, -2 when the socket would block, -1 on a hard error.
ssize_t TcpConnection::writeOnce(const void* data, size_t len, int* savedErrno) {
    if (ssl_ && tlsState_ == kTlsEstablished) {
        return tlsWriteOnce(data, len, savedErrno);
    }
    ssize_t n = ::write(channel_->fd(), data, len);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return -2;
        if (savedErrno) *savedErrno = errno;
        return -1;
    }
    return n;
}

void TcpConnection::HandleRead(std::chrono::system_clock::time_point receiveTime) {
    if (tlsEnabled() && tlsState_ == kTlsPlain) {
        tlsTryInitFromPeek();
    }
    if (ssl_ && tlsState_ == kTlsHandshake) {
        tlsDoHandshake();
    }
    if (tlsState_ == kTlsFailed) {
        ForceCloseInLoop();
        return;
    }
    if (ssl_ && tlsState_ != kTlsEstablished) {
        return;
    }

    int savedErrno = 0;
    ssize_t n = 0;
    if (ssl_) {
        // Drain every decrypted byte: epoll will not report data already buffered inside SSL.
        char tmp[16 * 1024];
        ssize_t total = 0;
        do {
            n = tlsReadOnce(tmp, sizeof(tmp), &savedErrno);
            if (n > 0) {
                inputBuffer_.Append(tmp, static_cast<size_t>(n));
                total += n;
            }
        } while (n > 0 && SSL_pending(reinterpret_cast<SSL*>(ssl_)) > 0);
        if (total > 0) {
            n = total;
        } else if (n == -2) {
            return;
        }
    } else {
        n = inputBuffer_.ReadFd(channel_->fd(), &savedErrno);
    }

    if (n > 0) {
        if (messageCallback_) {
            messageCallback_(shared_from_this(), &inputBuffer_, receiveTime);
        }
    } else if (n == 0) {
        HandleClose();
    } else {
        LOG_WARN << "TcpConnection::HandleRead [" << name_ << "] " << std::strerror(savedErrno);
        HandleError();
        HandleClose();
    }
}

void TcpConnection::HandleWrite() {
    if (ssl_ && tlsState_ == kTlsHandshake && tlsWantWrite_) {
        tlsDoHandshake();
        if (tlsState_ == kTlsFailed) {
            ForceCloseInLoop();
            return;
        }
        if (tlsState_ != kTlsEstablished) return;
    }

    if (!channel_->IsWriting()) {
        LOG_DEBUG << "Connection fd = " << channel_->fd() << " is down, no more writing";
        return;
    }
    if (outputBuffer_.ReadableBytes() == 0) {
        channel_->DisableWriting();
        return;
    }

    int savedErrno = 0;
    ssize_t n = writeOnce(outputBuffer_.Peek(), outputBuffer_.ReadableBytes(), &savedErrno);
    if (n == -2) {
        return;
    }
    if (n < 0) {
        LOG_WARN << "TcpConnection::HandleWrite [" << name_ << "] " << std::strerror(savedErrno);
        ForceCloseInLoop();
        return;
    }
    outputBuffer_.Retrieve(static_cast<size_t>(n));
    if (outputBuffer_.ReadableBytes() == 0) {
        channel_->DisableWriting();
        if (state_ == kDisconnecting) {
            ShutdownInLoop();
        }
    }
}

void TcpConnection::HandleClose() {
    if (state_ == kDisconnected) {
        return;
    }
    LOG_DEBUG << "TcpConnection::HandleClose [" << name_ << "] state=" << StateToString(state_);
    SetState(kDisconnected);
    channel_->DisableAll();
    // Ends the TCP session even while a queued task still holds this object.
    socket_->ShutdownBoth();

    TcpConnectionPtr guardThis(shared_from_this());
    if (connectionCallback_) {
        connectionCallback_(guardThis);
    }
    if (closeCallback_) {
        closeCallback_(guardThis);
    }
}

void TcpConnection::HandleError() {
    int err = 0;
    int optval = 0;
    socklen_t optlen = static_cast<socklen_t>(sizeof optval);
    if (::getsockopt(channel_->fd(), SOL_SOCKET, SO_ERROR, &optval, &optlen) < 0) {
        err = errno;
    } else {
        err = optval;
    }
    if (err != 0) {
        LOG_WARN << "TcpConnection::HandleError [" << name_ << "] SO_ERROR=" << err << " " << std::strerror(err);
    }
}

void TcpConnection::Send(const std::string& message) {
    Send(message.data(), message.size());
}

void TcpConnection::Send(const void* data, size_t len) {
    if (state_ != kConnected) {
        return;
    }
    if (loop_->IsInLoopThread()) {
        SendInLoop(data, len);
    } else {
        std::string msg(static_cast<const char*>(data), len);
        loop_->QueueInLoop([ptr = shared_from_this(), msg = std::move(msg)]() {
            ptr->SendInLoop(msg.data(), msg.size());
        });
    }
}

void TcpConnection::SendInLoop(const void* data, size_t len) {
    if (state_ == kDisconnected) {
        LOG_DEBUG << "[" << name_ << "] disconnected, give up writing";
        return;
    }

    ssize_t nwrote = 0;
    size_t remaining = len;

    // Handshake still pending: queue everything until it completes.
    const bool canWriteNow = !ssl_ || tlsState_ == kTlsEstablished;

    if (canWriteNow && !channel_->IsWriting() && outputBuffer_.ReadableBytes() == 0) {
        int savedErrno = 0;
        nwrote = writeOnce(data, len, &savedErrno);
        if (nwrote == -1) {
            LOG_WARN << "TcpConnection::SendInLoop [" << name_ << "] " << std::strerror(savedErrno);
            ForceCloseInLoop();
            return;
        }
        if (nwrote == -2) {
            nwrote = 0;
        }
        remaining = len - static_cast<size_t>(nwrote);
    }

    if (remaining > 0) {
        outputBuffer_.Append(static_cast<const char*>(data) + nwrote, remaining);
        if (!channel_->IsWriting()) {
            channel_->EnableWriting();
        }
    }
}

void TcpConnection::Shutdown() {
    StateE expected = kConnected;
    if (state_.compare_exchange_strong(expected, kDisconnecting)) {
        loop_->RunInLoop([self = shared_from_this()]() { self->ShutdownInLoop(); });
    }
}

void TcpConnection::ShutdownInLoop() {
    if (channel_->IsWriting()) {
        return; // HandleWrite finishes the job once the output buffer drains
    }
    if (ssl_ && tlsState_ == kTlsEstablished) {
        SSL_shutdown(reinterpret_cast<SSL*>(ssl_));
    }
    socket_->ShutdownWrite();
}

void TcpConnection::ForceClose() {
    if (state_ != kDisconnected) {
        loop_->QueueInLoop([conn = shared_from_this()]() {
            conn->ForceCloseInLoop();
        });
    }
}

void TcpConnection::ForceCloseInLoop() {
    if (state_ != kDisconnected) {
        HandleClose();
    }
}

void TcpConnection::StartRead() {
    loop_->RunInLoop([self = shared_from_this()]() { self->StartReadInLoop(); });
}

void TcpConnection::StopRead() {
    loop_->RunInLoop([self = shared_from_this()]() { self->StopReadInLoop(); });
}

void TcpConnection::StartReadInLoop() {
    if (!reading_ && state_ != kDisconnected) {
        reading_ = true;
        channel_->EnableReading();
    }
}

void TcpConnection::StopReadInLoop() {
    if (reading_) {
        reading_ = false;
        channel_->DisableReading();
    }
}

void TcpConnection::SetDeadline(std::chrono::steady_clock::time_point deadline) {
    deadlineNs_.store(ToSteadyNs(deadline), std::memory_order_relaxed);
}

void TcpConnection::ClearDeadline() {
    deadlineNs_.store(0, std::memory_order_relaxed);
}

std::chrono::steady_clock::time_point TcpConnection::Deadline() const {
    return FromSteadyNs(deadlineNs_.load(std::memory_order_relaxed));
}

bool TcpConnection::HasDeadline() const {
    return deadlineNs_.load(std::memory_order_relaxed) != 0;
}

} // namespace network
} // namespace fwdgate
