#include "fwdgate/protocol/HttpServer.h"
#include "fwdgate/protocol/HttpContext.h"
#include "fwdgate/protocol/HttpRequest.h"
#include "fwdgate/protocol/HttpResponse.h"
#include "fwdgate/network/EventLoop.h"
#include "fwdgate/common/WorkerPool.h"
#include "fwdgate/common/Logger.h"

#include <exception>
#include <memory>

namespace fwdgate {
namespace protocol {

using fwdgate::network::TcpConnectionPtr;

// Lives in the connection's std::any context; touched only on its I/O loop.
struct HttpServer::ConnectionState {
    HttpContext parser;
    bool inFlight = false;
    bool closing = false;

    explicit ConnectionState(size_t maxRequestBytes) : parser(maxRequestBytes) {}
};

namespace {

std::chrono::steady_clock::time_point After(double sec) {
    return std::chrono::steady_clock::now() +
           std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::duration<double>(sec));
}

bool WantsClose(const HttpRequest& req) {
    const std::string connection = req.getHeader("Connection");
    if (req.getVersion() == HttpRequest::kHttp10) {
        return !HttpRequest::iequals(connection, "keep-alive");
    }
    return HttpRequest::iequals(connection, "close");
}

} // namespace

HttpServer::HttpServer(fwdgate::network::EventLoop* loop,
                       const fwdgate::network::InetAddress& listenAddr,
                       const std::string& name,
                       fwdgate::network::TcpServer::Option option)
    : server_(loop, listenAddr, name, option),
      workers_(nullptr),
      draining_(false) {
    server_.SetConnectionCallback(
        std::bind(&HttpServer::onConnection, this, std::placeholders::_1));
    server_.SetMessageCallback(
        std::bind(&HttpServer::onMessage, this, std::placeholders::_1, std::placeholders::_2, std::placeholders::_3));
}

bool HttpServer::start(std::string* err) {
    if (!server_.Start(err)) {
        return false;
    }
    LOG_INFO << "HttpServer[" << server_.name() << "] accepting on port " << server_.port();
    return true;
}

void HttpServer::stop() {
    server_.Stop();
}

void HttpServer::onConnection(const TcpConnectionPtr& conn) {
    if (conn->connected()) {
        conn->SetContext(ConnectionState(limits_.maxRequestBytes));
        conn->SetDeadline(After(limits_.requestTimeoutSec));
    } else {
        LOG_DEBUG << "HttpServer connection " << conn->name() << " closed";
    }
}

void HttpServer::onMessage(const TcpConnectionPtr& conn,
                           fwdgate::network::Buffer* buf,
                           std::chrono::system_clock::time_point receiveTime) {
    (void)buf;
    (void)receiveTime;
    processInput(conn);
}

void HttpServer::processInput(const TcpConnectionPtr& conn) {
    if (conn->disconnected()) {
        return;
    }
    ConnectionState* state = std::any_cast<ConnectionState>(conn->GetMutableContext());
    if (state == nullptr || state->inFlight) {
        return;
    }
    fwdgate::network::Buffer* buf = conn->inputBuffer();
    if (state->closing) {
        buf->RetrieveAll();
        return;
    }
    if (buf->ReadableBytes() == 0) {
        return;
    }

    // First bytes of a new request: the request timeout starts now.
    if (!state->parser.inProgress()) {
        conn->SetDeadline(After(limits_.requestTimeoutSec));
    }

    if (!state->parser.parseRequest(buf, std::chrono::system_clock::now())) {
        const bool tooLarge = state->parser.error() == HttpContext::kTooLarge;
        LOG_DEBUG << "HttpServer " << conn->name() << (tooLarge ? " request too large" : " bad request");
        sendErrorAndClose(conn, tooLarge ? HttpResponse::k413PayloadTooLarge : HttpResponse::k400BadRequest);
        return;
    }
    if (!state->parser.gotAll()) {
        return;
    }

    HttpRequest req;
    req.swap(state->parser.request());
    state->parser.reset();
    state->inFlight = true;
    conn->StopRead();

    const bool close = WantsClose(req) || draining_;
    dispatch(conn, std::move(req), close);
}

void HttpServer::dispatch(const TcpConnectionPtr& conn, HttpRequest&& req, bool close) {
    ConnectionSnapshot snapshot;
    snapshot.name = conn->name();
    snapshot.peerAddress = conn->peerAddress();
    snapshot.localAddress = conn->localAddress();
    snapshot.secure = conn->secure();

    fwdgate::network::EventLoop* ioLoop = conn->getLoop();
    std::weak_ptr<fwdgate::network::TcpConnection> weakConn(conn);
    auto task = [this, ioLoop, weakConn, snapshot = std::move(snapshot), req = std::move(req), close]() {
        HttpResponse response(close);
        try {
            if (httpCallback_) {
                httpCallback_(snapshot, req, &response);
            } else {
                response.setStatusCode(HttpResponse::k404NotFound);
            }
        } catch (const std::exception& e) {
            LOG_ERROR << "handler failed for " << req.methodString() << " " << req.path()
                      << " on " << snapshot.name << ": " << e.what();
            response = HttpResponse(close);
            response.setStatusCode(HttpResponse::k500InternalServerError);
            response.setContentType("text/plain");
            response.setBody("Internal Server Error\n");
        } catch (...) {
            LOG_ERROR << "handler failed for " << req.methodString() << " " << req.path()
                      << " on " << snapshot.name << ": unknown exception";
            response = HttpResponse(close);
            response.setStatusCode(HttpResponse::k500InternalServerError);
            response.setContentType("text/plain");
            response.setBody("Internal Server Error\n");
        }
        const bool head = req.getMethod() == HttpRequest::kHead;
        ioLoop->RunInLoop([this, weakConn, response, head]() mutable {
            TcpConnectionPtr conn = weakConn.lock();
            if (!conn) {
                LOG_DEBUG << "HttpServer dropping response for a destroyed connection";
                return;
            }
            finishRequest(conn, response, head);
        });
    };

    if (workers_ == nullptr) {
        task();
        return;
    }
    if (!workers_->Submit(std::move(task))) {
        LOG_WARN << "HttpServer worker pool not running, rejecting request on " << conn->name();
        HttpResponse response(true);
        response.setStatusCode(HttpResponse::k503ServiceUnavailable);
        finishRequest(conn, response, false);
    }
}

void HttpServer::finishRequest(const TcpConnectionPtr& conn, HttpResponse& response, bool headRequest) {
    if (conn->disconnected()) {
        LOG_DEBUG << "HttpServer dropping response for closed connection " << conn->name();
        return;
    }
    ConnectionState* state = std::any_cast<ConnectionState>(conn->GetMutableContext());
    if (state == nullptr) {
        return;
    }
    state->inFlight = false;
    if (draining_) {
        response.setCloseConnection(true);
    }

    fwdgate::network::Buffer out;
    response.appendToBuffer(&out, headRequest);
    conn->Send(out.RetrieveAllAsString());

    if (response.closeConnection()) {
        state->closing = true;
        conn->Shutdown();
        // Keep reading so the peer's FIN is noticed; anything else it sends is discarded.
        conn->SetDeadline(After(limits_.keepAliveTimeoutSec));
        conn->StartRead();
        return;
    }

    conn->SetDeadline(After(limits_.keepAliveTimeoutSec));
    conn->StartRead();
    if (conn->inputBuffer()->ReadableBytes() > 0) {
        // Pipelined input: next loop iteration, so inline handlers never nest.
        conn->getLoop()->QueueInLoop([this, conn]() { processInput(conn); });
    }
}

void HttpServer::sendErrorAndClose(const TcpConnectionPtr& conn, int status) {
    ConnectionState* state = std::any_cast<ConnectionState>(conn->GetMutableContext());
    if (state != nullptr) {
        state->closing = true;
    }
    HttpResponse response(true);
    response.setStatusCode(static_cast<HttpResponse::HttpStatusCode>(status));
    response.setContentType("text/plain");
    response.setBody(std::string(HttpResponse::ReasonPhrase(response.statusCode())) + "\n");

    fwdgate::network::Buffer out;
    response.appendToBuffer(&out);
    conn->Send(out.RetrieveAllAsString());
    conn->Shutdown();
    conn->inputBuffer()->RetrieveAll();
    conn->SetDeadline(After(limits_.keepAliveTimeoutSec));
}

void HttpServer::beginDrain(std::function<void()> drainedCb) {
    draining_ = true;
    server_.ForEachConnection([this](const TcpConnectionPtr& conn) {
        conn->getLoop()->RunInLoop([this, conn]() { closeIfIdle(conn); });
    });
    server_.BeginDrain(std::move(drainedCb));
}

void HttpServer::closeIfIdle(const TcpConnectionPtr& conn) {
    if (conn->disconnected()) {
        return;
    }
    ConnectionState* state = std::any_cast<ConnectionState>(conn->GetMutableContext());
    if (state == nullptr) {
        conn->ForceClose();
        return;
    }
    if (state->inFlight || state->closing || state->parser.inProgress() ||
        conn->inputBuffer()->ReadableBytes() > 0) {
        return;
    }
    // Idle keep-alive: half-close after any unsent output, the peer's FIN completes it.
    LOG_DEBUG << "HttpServer closing idle connection " << conn->name();
    state->closing = true;
    conn->Shutdown();
    conn->SetDeadline(After(limits_.keepAliveTimeoutSec));
}

} // namespace protocol
} // namespace fwdgate
