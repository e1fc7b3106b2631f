#include "fwdgate/network/Socket.h"
#include "fwdgate/network/InetAddress.h"
#include "fwdgate/common/Logger.h"

#include <unistd.h>
#include <sys/socket.h>
#include <netinet/tcp.h>
#include <cerrno>
#include <cstring>

namespace fwdgate {
namespace network {

Socket::~Socket() {
    Close();
}

bool Socket::BindAddress(const InetAddress& localaddr) {
    return ::bind(sockfd_, localaddr.getSockAddr(), sizeof(struct sockaddr_in)) == 0;
}

bool Socket::Listen() {
    return ::listen(sockfd_, SOMAXCONN) == 0;
}

int Socket::Accept(InetAddress* peeraddr) {
    struct sockaddr_in addr;
    socklen_t len = sizeof addr;
    std::memset(&addr, 0, sizeof addr);
    int connfd = ::accept4(sockfd_, reinterpret_cast<struct sockaddr*>(&addr), &len, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (connfd >= 0) {
        peeraddr->setSockAddr(addr);
    }
    return connfd;
}

void Socket::Close() {
    if (sockfd_ >= 0) {
        ::close(sockfd_);
        sockfd_ = -1;
    }
}

void Socket::ShutdownWrite() {
    if (::shutdown(sockfd_, SHUT_WR) < 0 && errno != ENOTCONN) {
        LOG_WARN << "Socket::ShutdownWrite fd=" << sockfd_ << " " << std::strerror(errno);
    }
}

void Socket::ShutdownBoth() {
    if (::shutdown(sockfd_, SHUT_RDWR) < 0 && errno != ENOTCONN) {
        LOG_WARN << "Socket::ShutdownBoth fd=" << sockfd_ << " " << std::strerror(errno);
    }
}

void Socket::SetTcpNoDelay(bool on) {
    int optval = on ? 1 : 0;
    ::setsockopt(sockfd_, IPPROTO_TCP, TCP_NODELAY, &optval, sizeof optval);
}

void Socket::SetReuseAddr(bool on) {
    int optval = on ? 1 : 0;
    ::setsockopt(sockfd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof optval);
}

void Socket::SetReusePort(bool on) {
    int optval = on ? 1 : 0;
    if (::setsockopt(sockfd_, SOL_SOCKET, SO_REUSEPORT, &optval, sizeof optval) < 0 && on) {
        LOG_WARN << "SO_REUSEPORT failed: " << std::strerror(errno);
    }
}

void Socket::SetKeepAlive(bool on) {
    int optval = on ? 1 : 0;
    ::setsockopt(sockfd_, SOL_SOCKET, SO_KEEPALIVE, &optval, sizeof optval);
}

} // namespace network
} // namespace fwdgate
