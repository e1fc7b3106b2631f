#pragma once

#include "fwdgate/ServerOptions.h"
#include "fwdgate/common/noncopyable.h"
#include "fwdgate/common/WorkerPool.h"
#include "fwdgate/network/Acceptor.h"
#include "fwdgate/network/Callbacks.h"
#include "fwdgate/protocol/HttpServer.h"
#include "fwdgate/trust/HeaderTrustResolver.h"
#include "fwdgate/trust/RequestContext.h"

#include <functional>
#include <memory>
#include <string>

namespace fwdgate {

namespace network {
class EventLoop;
class Timer;
}

namespace protocol {
class HttpRequest;
class HttpResponse;
}

// The application layer. May run concurrently for different connections; may throw,
// which turns into a 500 on that request only.
using RequestHandler = std::function<void(const trust::RequestContext&, protocol::HttpResponse*)>;

// Listening front end: binds, accepts, resolves each request through the
// HeaderTrustResolver and hands the result to the RequestHandler.
// All methods run on the base loop thread.
class FrontEnd : common::noncopyable {
public:
    FrontEnd(network::EventLoop* loop, const ServerOptions& options, RequestHandler handler);
    ~FrontEnd();

    // Binds listenAddress:port and starts accepting. False on bind/TLS/thread failure,
    // with *err set; nothing is listening afterwards.
    bool Start(std::string* err = nullptr);

    uint16_t port() const;
    network::Acceptor::State listenerState() const;

    // Stops accepting, lets in-flight requests finish for up to gracePeriodSec and then
    // force-closes what is left. doneCb runs on the base loop once no connection remains.
    void Shutdown(double gracePeriodSec, std::function<void()> doneCb);
    bool shuttingDown() const { return shuttingDown_; }

    // Joins handler threads and I/O threads. Blocks while a handler is still running.
    void Stop();
    // Handlers executing right now.
    size_t busyHandlers() const { return workers_.busy(); }
    bool WaitHandlersIdle(double sec);

    const trust::HeaderTrustResolver& resolver() const { return resolver_; }
    const ServerOptions& options() const { return options_; }

private:
    void OnRequest(const protocol::HttpServer::ConnectionSnapshot& conn,
                   const protocol::HttpRequest& req,
                   protocol::HttpResponse* resp);
    void LogAccess(const trust::RequestContext& ctx, int status) const;
    void FinishShutdown();

    network::EventLoop* loop_;
    const ServerOptions options_;
    const trust::HeaderTrustResolver resolver_;
    RequestHandler handler_;
    common::WorkerPool workers_;
    std::unique_ptr<protocol::HttpServer> http_;
    std::unique_ptr<network::Timer> graceTimer_;
    std::function<void()> shutdownDone_;
    bool shuttingDown_;
    bool stopped_;
};

} // namespace fwdgate
