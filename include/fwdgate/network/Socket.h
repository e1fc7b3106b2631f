#pragma once

#include "fwdgate/common/noncopyable.h"
#include <string>

namespace fwdgate {
namespace network {

class InetAddress;

// Owns a socket fd. Failing calls return false and leave errno set.
class Socket : fwdgate::common::noncopyable {
public:
    explicit Socket(int sockfd)
        : sockfd_(sockfd) {}
    ~Socket();

    int fd() const { return sockfd_; }

    bool BindAddress(const InetAddress& localaddr);
    bool Listen();
    int Accept(InetAddress* peeraddr);
    void Close();

    void ShutdownWrite();
    // Ends both directions now; the fd itself stays owned until destruction.
    void ShutdownBoth();

    void SetTcpNoDelay(bool on);
    void SetReuseAddr(bool on);
    void SetReusePort(bool on);
    void SetKeepAlive(bool on);

private:
    int sockfd_;
};

} // namespace network
} // namespace fwdgate
