#pragma once

#include "fwdgate/common/noncopyable.h"
#include "fwdgate/network/InetAddress.h"
#include "fwdgate/network/Callbacks.h"
#include "fwdgate/network/TcpConnection.h"
#include "fwdgate/network/EventLoopThreadPool.h"
#include "fwdgate/network/TlsContext.h"
#include "fwdgate/network/Acceptor.h"

#include <map>
#include <string>
#include <atomic>
#include <memory>
#include <functional>

namespace fwdgate {
namespace network {

class EventLoop;
class Timer;

// Accepts on the base loop and spreads connections over the I/O loops.
// Every method except the setters must run on the base loop thread.
class TcpServer : fwdgate::common::noncopyable {
public:
    enum Option {
        kNoReusePort,
        kReusePort,
    };

    TcpServer(EventLoop* loop,
              const InetAddress& listenAddr,
              const std::string& nameArg,
              Option option = kNoReusePort);
    ~TcpServer();

    const std::string& hostport() const { return hostport_; }
    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }

    void SetThreadNum(int numThreads);

    // TLS termination (optional). The listener then serves HTTPS and plain HTTP by sniffing
    // the first byte: 0x16 (TLS handshake) switches the connection to TLS.
    bool EnableTls(const std::string& certPemPath, const std::string& keyPemPath, std::string* err = nullptr);

    // How often connection deadlines are checked. Default 0.25s.
    void SetDeadlineCheckInterval(double sec) { deadlineCheckSec_ = sec; }

    // Binds, starts the I/O threads and begins accepting. On failure the listener stays
    // unbound or closed and *err holds the reason.
    bool Start(std::string* err = nullptr);
    // Closes every connection and joins the I/O threads. Idempotent.
    void Stop();

    // Bound port, valid after a successful Start() (resolves port 0).
    uint16_t port() const { return acceptor_->localAddress().toPort(); }
    Acceptor::State listenerState() const { return acceptor_->state(); }

    void StopAccepting();
    // Stops accepting and calls drainedCb on the base loop once the last connection is gone.
    void BeginDrain(std::function<void()> drainedCb);
    bool draining() const { return draining_; }
    void ForceCloseAll();
    void ForEachConnection(const std::function<void(const TcpConnectionPtr&)>& cb) const;
    size_t connectionCount() const { return connections_.size(); }

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }

private:
    void NewConnection(int sockfd, const InetAddress& peerAddr);
    void RemoveConnection(const TcpConnectionPtr& conn);
    void RemoveConnectionInLoop(const TcpConnectionPtr& conn);
    void CheckDeadlines();
    void MaybeFinishDrain();

    using ConnectionMap = std::map<std::string, TcpConnectionPtr>;

    EventLoop* loop_;
    const std::string hostport_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;

    std::unique_ptr<EventLoopThreadPool> threadPool_;
    std::shared_ptr<TlsContext> tlsCtx_;
    std::unique_ptr<Timer> deadlineTimer_;
    double deadlineCheckSec_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;

    bool started_;
    bool stopped_;
    bool draining_;
    std::function<void()> drainedCallback_;
    int next_conn_id_;
    ConnectionMap connections_;
};

} // namespace network
} // namespace fwdgate
