#include "fwdgate/network/Acceptor.h"
#include "fwdgate/network/EventLoop.h"
#include "fwdgate/common/Logger.h"

#include <sys/socket.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace fwdgate {
namespace network {

static int CreateNonblocking() {
    int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        throw std::system_error(errno, std::generic_category(), "socket");
    }
    return sockfd;
}

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport)
    : loop_(loop),
      accept_socket_(CreateNonblocking()),
      accept_channel_(loop, accept_socket_.fd()),
      local_addr_(listenAddr),
      reuseport_(reuseport),
      idle_fd_(::open("/dev/null", O_RDONLY | O_CLOEXEC)),
      state_(State::kUnbound) {
    accept_channel_.SetReadCallback(std::bind(&Acceptor::HandleRead, this));
}

Acceptor::~Acceptor() {
    Close();
    if (idle_fd_ >= 0) {
        ::close(idle_fd_);
    }
}

const char* Acceptor::StateToString(State s) {
    switch (s) {
        case State::kUnbound: return "unbound";
        case State::kBound: return "bound";
        case State::kAccepting: return "accepting";
        case State::kClosed: return "closed";
    }
    return "unknown";
}

bool Acceptor::Bind(std::string* err) {
    if (state_ != State::kUnbound) {
        if (err) *err = std::string("cannot bind in state ") + StateToString(state_);
        return false;
    }
    accept_socket_.SetReuseAddr(true);
    if (reuseport_) {
        accept_socket_.SetReusePort(true);
    }
    if (!accept_socket_.BindAddress(local_addr_)) {
        int saved = errno;
        if (err) *err = std::strerror(saved);
        LOG_ERROR << "bind " << local_addr_.toIpPort() << " failed: " << std::strerror(saved);
        return false;
    }
    InetAddress actual;
    if (InetAddress::FromLocalSocket(accept_socket_.fd(), &actual)) {
        local_addr_ = actual;
    }
    state_ = State::kBound;
    return true;
}

bool Acceptor::Listen(std::string* err) {
    if (state_ != State::kBound) {
        if (err) *err = std::string("cannot listen in state ") + StateToString(state_);
        return false;
    }
    if (!accept_socket_.Listen()) {
        int saved = errno;
        if (err) *err = std::strerror(saved);
        LOG_ERROR << "listen " << local_addr_.toIpPort() << " failed: " << std::strerror(saved);
        return false;
    }
    accept_channel_.EnableReading();
    state_ = State::kAccepting;
    return true;
}

void Acceptor::Close() {
    if (state_ == State::kClosed) {
        return;
    }
    if (state_ == State::kAccepting) {
        accept_channel_.DisableAll();
        accept_channel_.Remove();
    }
    accept_socket_.Close();
    state_ = State::kClosed;
    LOG_DEBUG << "Acceptor " << local_addr_.toIpPort() << " closed";
}

void Acceptor::HandleRead() {
    if (state_ != State::kAccepting) {
        return;
    }
    InetAddress peerAddr;
    int connfd = accept_socket_.Accept(&peerAddr);
    if (connfd >= 0) {
        if (new_connection_callback_) {
            new_connection_callback_(connfd, peerAddr);
        } else {
            ::close(connfd);
        }
        return;
    }

    int saved = errno;
    if (saved == EAGAIN || saved == EINTR || saved == ECONNABORTED) {
        return;
    }
    LOG_ERROR << "Acceptor::HandleRead accept failed: " << std::strerror(saved);
    // Out of descriptors: the pending connection would keep the fd readable forever,
    // so accept it on the reserved fd and drop it.
    if (saved == EMFILE && idle_fd_ >= 0) {
        ::close(idle_fd_);
        idle_fd_ = ::accept(accept_socket_.fd(), nullptr, nullptr);
        if (idle_fd_ >= 0) {
            ::close(idle_fd_);
        }
        idle_fd_ = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    }
}

} // namespace network
} // namespace fwdgate
