#pragma once

#include "fwdgate/network/TcpServer.h"
#include "fwdgate/common/noncopyable.h"

#include <atomic>
#include <functional>
#include <string>

namespace fwdgate {
namespace common {
class WorkerPool;
}

namespace protocol {

class HttpRequest;
class HttpResponse;

// HTTP/1.x on top of TcpServer. Requests on one connection are served strictly one
// at a time: reading pauses while a request is in flight.
class HttpServer : fwdgate::common::noncopyable {
public:
    // Copied from the connection when a request is dispatched. Handlers never see the
    // connection itself, so a slow handler does not keep it alive.
    struct ConnectionSnapshot {
        std::string name;
        fwdgate::network::InetAddress peerAddress;
        fwdgate::network::InetAddress localAddress;
        bool secure = false;
    };

    // Runs on a worker thread when a pool is set, otherwise on the connection's I/O loop.
    using HttpCallback = std::function<void(const ConnectionSnapshot&,
                                            const HttpRequest&,
                                            HttpResponse*)>;

    struct Limits {
        double requestTimeoutSec = 30.0;
        double keepAliveTimeoutSec = 5.0;
        size_t maxRequestBytes = 1024 * 1024;
    };

    HttpServer(fwdgate::network::EventLoop* loop,
               const fwdgate::network::InetAddress& listenAddr,
               const std::string& name,
               fwdgate::network::TcpServer::Option option = fwdgate::network::TcpServer::kNoReusePort);

    fwdgate::network::EventLoop* getLoop() const { return server_.getLoop(); }

    void setHttpCallback(const HttpCallback& cb) { httpCallback_ = cb; }
    void setThreadNum(int numThreads) { server_.SetThreadNum(numThreads); }
    // nullptr runs handlers inline on the I/O loop. The pool must outlive the server's connections.
    void setWorkerPool(fwdgate::common::WorkerPool* pool) { workers_ = pool; }
    void setLimits(const Limits& limits) { limits_ = limits; }
    const Limits& limits() const { return limits_; }

    bool enableTls(const std::string& certPemPath, const std::string& keyPemPath, std::string* err) {
        return server_.EnableTls(certPemPath, keyPemPath, err);
    }

    bool start(std::string* err = nullptr);
    void stop();
    uint16_t port() const { return server_.port(); }
    fwdgate::network::TcpServer& tcpServer() { return server_; }

    // Closes idle connections, marks in-flight ones to close after their response and
    // calls drainedCb on the base loop when no connection is left. Base loop only.
    void beginDrain(std::function<void()> drainedCb);
    bool draining() const { return draining_; }
    void forceCloseAll() { server_.ForceCloseAll(); }

private:
    struct ConnectionState;

    void onConnection(const fwdgate::network::TcpConnectionPtr& conn);
    void onMessage(const fwdgate::network::TcpConnectionPtr& conn,
                   fwdgate::network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);
    void processInput(const fwdgate::network::TcpConnectionPtr& conn);
    void dispatch(const fwdgate::network::TcpConnectionPtr& conn, HttpRequest&& req, bool close);
    void finishRequest(const fwdgate::network::TcpConnectionPtr& conn,
                       HttpResponse& response,
                       bool headRequest);
    void sendErrorAndClose(const fwdgate::network::TcpConnectionPtr& conn, int status);
    void closeIfIdle(const fwdgate::network::TcpConnectionPtr& conn);

    fwdgate::network::TcpServer server_;
    HttpCallback httpCallback_;
    fwdgate::common::WorkerPool* workers_;
    Limits limits_;
    std::atomic_bool draining_;
};

} // namespace protocol
} // namespace fwdgate
