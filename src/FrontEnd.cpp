#include "fwdgate/FrontEnd.h"
#include "fwdgate/network/EventLoop.h"
#include "fwdgate/network/InetAddress.h"
#include "fwdgate/network/Timer.h"
#include "fwdgate/protocol/HttpRequest.h"
#include "fwdgate/protocol/HttpResponse.h"
#include "fwdgate/protocol/HttpServer.h"
#include "fwdgate/common/Logger.h"

#include <exception>

namespace fwdgate {

namespace {

network::InetAddress ListenAddressOf(const ServerOptions& options) {
    network::InetAddress addr(options.port);
    // ValidateServerOptions already rejected unparsable addresses; keep 0.0.0.0 otherwise.
    network::InetAddress::Parse(options.listenAddress, options.port, &addr);
    return addr;
}

} // namespace

FrontEnd::FrontEnd(network::EventLoop* loop, const ServerOptions& options, RequestHandler handler)
    : loop_(loop),
      options_(options),
      resolver_(options.trust),
      handler_(std::move(handler)),
      workers_("handler"),
      http_(new protocol::HttpServer(loop,
                                     ListenAddressOf(options),
                                     "fwdgate",
                                     options.reusePort ? network::TcpServer::kReusePort
                                                       : network::TcpServer::kNoReusePort)),
      shuttingDown_(false),
      stopped_(false) {
    protocol::HttpServer::Limits limits;
    limits.requestTimeoutSec = options_.requestTimeoutSec;
    limits.keepAliveTimeoutSec = options_.keepAliveTimeoutSec;
    limits.maxRequestBytes = options_.maxRequestBytes;
    http_->setLimits(limits);
    http_->setThreadNum(options_.ioThreads);
    http_->setHttpCallback(std::bind(&FrontEnd::OnRequest, this,
                                     std::placeholders::_1, std::placeholders::_2, std::placeholders::_3));
    workers_.SetThreadNum(options_.workerThreads);
}

FrontEnd::~FrontEnd() {
    Stop();
}

bool FrontEnd::Start(std::string* err) {
    if (options_.tlsEnabled && !http_->enableTls(options_.tlsCertPath, options_.tlsKeyPath, err)) {
        return false;
    }
    if (options_.workerThreads > 0) {
        workers_.Start();
        http_->setWorkerPool(&workers_);
    }
    if (!http_->start(err)) {
        workers_.Stop();
        return false;
    }

    const trust::TrustConfig& t = options_.trust;
    LOG_INFO << "fwdgate listening on " << options_.listenAddress << ":" << port()
             << " (io threads " << options_.ioThreads << ", handler threads " << options_.workerThreads << ")";
    if (t.enabled) {
        LOG_INFO << "proxy headers trusted from " << (t.trustAllPeers ? "any peer" : "configured proxies")
                 << ": for=" << (t.forwardedForHeader.empty() ? "-" : t.forwardedForHeader)
                 << " proto=" << (t.forwardedProtoHeader.empty() ? "-" : t.forwardedProtoHeader)
                 << " host=" << (t.forwardedHostHeader.empty() ? "-" : t.forwardedHostHeader)
                 << " pick=" << trust::AddressPickToString(t.addressPick);
    } else {
        LOG_INFO << "proxy headers ignored";
    }
    return true;
}

uint16_t FrontEnd::port() const {
    return http_->port();
}

network::Acceptor::State FrontEnd::listenerState() const {
    return http_->tcpServer().listenerState();
}

void FrontEnd::OnRequest(const protocol::HttpServer::ConnectionSnapshot& conn,
                         const protocol::HttpRequest& req,
                         protocol::HttpResponse* resp) {
    trust::ConnectionInfo info;
    info.remoteAddress = conn.peerAddress.toIp();
    info.remotePort = conn.peerAddress.toPort();
    info.transportScheme = conn.secure ? trust::Scheme::kHttps : trust::Scheme::kHttp;
    info.name = conn.name;

    const trust::RequestContext ctx = resolver_.Resolve(info, req);

    if (!handler_) {
        resp->setStatusCode(protocol::HttpResponse::k404NotFound);
        LogAccess(ctx, resp->statusCode());
        return;
    }
    try {
        handler_(ctx, resp);
    } catch (...) {
        LogAccess(ctx, protocol::HttpResponse::k500InternalServerError);
        throw; // HttpServer answers 500
    }
    LogAccess(ctx, resp->statusCode());
}

void FrontEnd::LogAccess(const trust::RequestContext& ctx, int status) const {
    if (!options_.accessLog) {
        return;
    }
    std::string client = ctx.clientAddress();
    if (ctx.clientPort() != 0) {
        client += ":" + std::to_string(ctx.clientPort());
    }
    LOG_INFO << client << " - \"" << ctx.method() << " " << ctx.path() << ctx.query() << " "
             << ctx.httpVersion() << "\" " << status;
}

void FrontEnd::Shutdown(double gracePeriodSec, std::function<void()> doneCb) {
    if (shuttingDown_) {
        return;
    }
    shuttingDown_ = true;
    shutdownDone_ = std::move(doneCb);

    LOG_INFO << "shutting down: " << http_->tcpServer().connectionCount()
             << " connection(s) open, grace period " << gracePeriodSec << "s";

    graceTimer_.reset(new network::Timer(loop_, [this]() {
        LOG_WARN << "grace period elapsed, closing " << http_->tcpServer().connectionCount()
                 << " remaining connection(s)";
        http_->forceCloseAll();
    }));
    graceTimer_->Start(gracePeriodSec);

    http_->beginDrain(std::bind(&FrontEnd::FinishShutdown, this));
}

void FrontEnd::FinishShutdown() {
    if (graceTimer_) {
        graceTimer_->Stop();
    }
    LOG_INFO << "all connections closed";
    std::function<void()> cb;
    cb.swap(shutdownDone_);
    if (cb) {
        cb();
    }
}

bool FrontEnd::WaitHandlersIdle(double sec) {
    const auto timeout = std::chrono::milliseconds(static_cast<long long>(sec * 1000));
    return workers_.WaitIdle(timeout);
}

void FrontEnd::Stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    graceTimer_.reset();
    workers_.Stop();
    http_->stop();
}

} // namespace fwdgate
