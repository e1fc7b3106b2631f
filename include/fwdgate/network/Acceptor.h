#pragma once

#include "fwdgate/common/noncopyable.h"
#include "fwdgate/network/Socket.h"
#include "fwdgate/network/Channel.h"
#include "fwdgate/network/InetAddress.h"

#include <functional>
#include <string>

namespace fwdgate {
namespace network {

class EventLoop;

// Listening socket. Moves strictly forward through
//   kUnbound -> kBound -> kAccepting -> kClosed
// and may jump to kClosed from any state. A failed Bind() leaves it kUnbound.
class Acceptor : fwdgate::common::noncopyable {
public:
    enum class State { kUnbound, kBound, kAccepting, kClosed };

    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    // Throws std::system_error if no socket can be created.
    Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport);
    ~Acceptor();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        new_connection_callback_ = cb;
    }

    // On failure *err (if given) receives a readable reason such as "Address already in use".
    bool Bind(std::string* err = nullptr);
    // Must run in the loop thread.
    bool Listen(std::string* err = nullptr);
    // Stops accepting and releases the port. Must run in the loop thread.
    void Close();

    State state() const { return state_; }
    bool Listening() const { return state_ == State::kAccepting; }
    // The bound address; the real port once Bind() succeeded with port 0.
    const InetAddress& localAddress() const { return local_addr_; }

    static const char* StateToString(State s);

private:
    void HandleRead();

    EventLoop* loop_;
    Socket accept_socket_;
    Channel accept_channel_;
    InetAddress local_addr_;
    bool reuseport_;
    int idle_fd_;
    NewConnectionCallback new_connection_callback_;
    State state_;
};

} // namespace network
} // namespace fwdgate
