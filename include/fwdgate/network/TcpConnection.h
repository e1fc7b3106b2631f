#pragma once

#include "fwdgate/common/noncopyable.h"
#include "fwdgate/network/InetAddress.h"
#include "fwdgate/network/Callbacks.h"
#include "fwdgate/network/Buffer.h"

#include <memory>
#include <string>
#include <atomic>
#include <chrono>
#include <any>
#include <cstdint>

struct ssl_st;

namespace fwdgate {
namespace network {

class Channel;
class EventLoop;
class Socket;
class TlsContext;

class TcpConnection : fwdgate::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    TcpConnection(EventLoop* loop,
                  const std::string& name,
                  int sockfd,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr,
                  std::shared_ptr<const TlsContext> tls = nullptr);
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& localAddress() const { return localAddr_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == kConnected; }
    bool disconnected() const { return state_ == kDisconnected; }
    // True once a TLS handshake completed on this connection.
    bool secure() const { return secure_; }

    // Loop thread only.
    void SetContext(const std::any& context) { context_ = context; }
    const std::any& GetContext() const { return context_; }
    std::any* GetMutableContext() { return &context_; }
    Buffer* inputBuffer() { return &inputBuffer_; }

    // Thread safe
    void Send(const std::string& message);
    void Send(const void* data, size_t len);
    void Shutdown();
    void ForceClose();
    void StartRead();
    void StopRead();

    // Absolute time after which the owning server force-closes the connection.
    // A default-constructed time_point means no deadline. Thread safe.
    void SetDeadline(std::chrono::steady_clock::time_point deadline);
    void ClearDeadline();
    std::chrono::steady_clock::time_point Deadline() const;
    bool HasDeadline() const;

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetCloseCallback(const CloseCallback& cb) { closeCallback_ = cb; }

    // Called when TcpServer accepts a new connection
    void ConnectEstablished();
    // Called when TcpServer has removed me from its map
    void ConnectDestroyed();

private:
    enum StateE { kDisconnected, kConnecting, kConnected, kDisconnecting };

    void HandleRead(std::chrono::system_clock::time_point receiveTime);
    void HandleWrite();
    void HandleClose();
    void HandleError();

    void SendInLoop(const void* message, size_t len);
    void ShutdownInLoop();
    void ForceCloseInLoop();
    void StartReadInLoop();
    void StopReadInLoop();

    bool tlsEnabled() const { return tls_ != nullptr; }
    // 0 plaintext or undecided, 1 handshake in progress, 2 established, 3 failed
    bool tlsTryInitFromPeek();
    void tlsDoHandshake();
    ssize_t tlsReadOnce(char* buf, size_t cap, int* savedErrno);
    ssize_t tlsWriteOnce(const void* data, size_t len, int* savedErrno);
    ssize_t writeOnce(const void* data, size_t len, int* savedErrno);

    void SetState(StateE s) { state_ = s; }
    static const char* StateToString(StateE s);

    EventLoop* loop_;
    const std::string name_;
    std::atomic<StateE> state_;
    bool reading_;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;

    const InetAddress localAddr_;
    const InetAddress peerAddr_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    CloseCallback closeCallback_;

    Buffer inputBuffer_;
    Buffer outputBuffer_;

    std::any context_;

    std::atomic<std::int64_t> deadlineNs_;
    std::atomic_bool secure_;

    // Dropped once the first byte shows plaintext.
    std::shared_ptr<const TlsContext> tls_;
    ssl_st* ssl_{nullptr};
    int tlsState_{0};
    bool tlsWantWrite_{false};
};

} // namespace network
} // namespace fwdgate
