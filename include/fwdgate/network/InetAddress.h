#pragma once

#include <netinet/in.h>
#include <string>

namespace fwdgate {
namespace network {

// IPv4 socket address.
class InetAddress {
public:
    explicit InetAddress(uint16_t port = 0, bool loopbackOnly = false);
    explicit InetAddress(const struct sockaddr_in& addr)
        : addr_(addr) {}

    // Parses a dotted-quad literal. Returns false and leaves *out untouched on failure.
    static bool Parse(const std::string& ip, uint16_t port, InetAddress* out);
    // The address a bound socket is actually using (resolves port 0).
    static bool FromLocalSocket(int sockfd, InetAddress* out);

    sa_family_t family() const { return addr_.sin_family; }
    std::string toIp() const;
    std::string toIpPort() const;
    uint16_t toPort() const;

    const struct sockaddr* getSockAddr() const { return reinterpret_cast<const struct sockaddr*>(&addr_); }
    void setSockAddr(const struct sockaddr_in& addr) { addr_ = addr; }

private:
    struct sockaddr_in addr_;
};

} // namespace network
} // namespace fwdgate
