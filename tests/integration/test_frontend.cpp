#include "fwdgate/FrontEnd.h"
#include "fwdgate/network/EventLoop.h"
#include "fwdgate/protocol/HttpResponse.h"
#include "fwdgate/common/Logger.h"

#include "HttpTestClient.h"

#include <cassert>
#include <stdexcept>
#include <string>
#include <thread>

using namespace fwdgate;
using fwdgate::network::Acceptor;
using fwdgate::network::EventLoop;
using fwdgate::protocol::HttpResponse;
using namespace fwdgate::common;

static void EchoContext(const trust::RequestContext& ctx, HttpResponse* resp) {
    if (ctx.path() == "/boom") {
        throw std::runtime_error("handler exploded");
    }
    resp->setStatusCode(HttpResponse::k200Ok);
    resp->setContentType("text/plain");
    resp->setBody("client=" + ctx.clientAddress() +
                  " scheme=" + trust::SchemeToString(ctx.scheme()) +
                  " host=" + ctx.host() +
                  " path=" + ctx.path() + ctx.query() +
                  " body=" + ctx.body());
}

static void runClientChecks(uint16_t port) {
    // No forwarding headers: the transport peer.
    {
        HttpTestClient c(port);
        assert(c.connected());
        c.Send(HttpTestClient::Get("/plain"));
        std::string resp = c.ReadResponse();
        assert(HttpTestClient::Status(resp) == 200);
        assert(HttpTestClient::HasHeader(resp, "Connection: keep-alive"));
        assert(HttpTestClient::Body(resp) == "client=127.0.0.1 scheme=http host=test.local path=/plain body=");
    }

    // Forwarding headers from a trusted peer, two requests on one connection.
    {
        HttpTestClient c(port);
        c.Send(HttpTestClient::Get("/a?x=1",
                                   "X-Forwarded-For: 203.0.113.7, 10.0.0.1\r\n"
                                   "X-Forwarded-Proto: https\r\n"
                                   "X-Forwarded-Host: www.example.com\r\n"));
        std::string resp = c.ReadResponse();
        assert(HttpTestClient::Body(resp) ==
               "client=203.0.113.7 scheme=https host=www.example.com path=/a?x=1 body=");

        c.Send(HttpTestClient::Get("/b", "X-Forwarded-For: not-an-address\r\n"));
        resp = c.ReadResponse();
        assert(HttpTestClient::Status(resp) == 200);
        assert(HttpTestClient::Body(resp) == "client=127.0.0.1 scheme=http host=test.local path=/b body=");
    }

    // Pipelined requests are answered in order.
    {
        HttpTestClient c(port);
        c.Send(HttpTestClient::Get("/one") +
               "POST /two HTTP/1.1\r\nHost: test.local\r\nContent-Length: 4\r\n\r\ndata" +
               HttpTestClient::Get("/three", "Connection: close\r\n"));
        std::string r1 = c.ReadResponse();
        std::string r2 = c.ReadResponse();
        std::string r3 = c.ReadResponse();
        assert(HttpTestClient::Body(r1).find("path=/one ") != std::string::npos);
        assert(HttpTestClient::Body(r2).find("path=/two body=data") != std::string::npos);
        assert(HttpTestClient::Body(r3).find("path=/three ") != std::string::npos);
        assert(HttpTestClient::HasHeader(r3, "Connection: close"));
        assert(c.WaitClosed());
    }

    // HEAD carries headers only.
    {
        HttpTestClient c(port);
        c.Send("HEAD /h HTTP/1.1\r\nHost: test.local\r\nConnection: close\r\n\r\n");
        std::string head = c.ReadUntilClosed();
        assert(head.find("HTTP/1.1 200 OK\r\n") == 0);
        assert(head.find("Content-Length: 0\r\n") == std::string::npos);
        assert(head.compare(head.size() - 4, 4, "\r\n\r\n") == 0);
    }

    // Handler exception: 500 on that request, the server keeps going.
    {
        HttpTestClient c(port);
        c.Send(HttpTestClient::Get("/boom"));
        std::string resp = c.ReadResponse();
        assert(HttpTestClient::Status(resp) == 500);
        assert(HttpTestClient::Body(resp) == "Internal Server Error\n");

        c.Send(HttpTestClient::Get("/fine"));
        resp = c.ReadResponse();
        assert(HttpTestClient::Status(resp) == 200);
    }

    // Garbage: 400 and closed.
    {
        HttpTestClient c(port);
        c.Send("BREW /pot HTCPCP/1.0\r\n\r\n");
        std::string resp = c.ReadResponse();
        assert(HttpTestClient::Status(resp) == 400);
        assert(HttpTestClient::HasHeader(resp, "Connection: close"));
        assert(c.WaitClosed());
    }

    // Over the size limit: 413 and closed.
    {
        HttpTestClient c(port);
        c.Send("POST /big HTTP/1.1\r\nHost: test.local\r\nContent-Length: 100000\r\n\r\n");
        std::string resp = c.ReadResponse();
        assert(HttpTestClient::Status(resp) == 413);
        assert(c.WaitClosed());
    }

    // HTTP/1.0 closes by default.
    {
        HttpTestClient c(port);
        c.Send("GET /old HTTP/1.0\r\n\r\n");
        std::string resp = c.ReadResponse();
        assert(HttpTestClient::Status(resp) == 200);
        assert(HttpTestClient::HasHeader(resp, "Connection: close"));
        assert(c.WaitClosed());
    }
}

int main() {
    Logger::Instance().SetLevel(LogLevel::DEBUG);

    ServerOptions options;
    options.listenAddress = "127.0.0.1";
    options.port = 0;
    options.ioThreads = 2;
    options.workerThreads = 4;
    options.maxRequestBytes = 4096;

    EventLoop loop;
    FrontEnd frontEnd(&loop, options, EchoContext);
    assert(frontEnd.listenerState() == Acceptor::State::kUnbound);
    std::string err;
    bool started = frontEnd.Start(&err);
    assert(started);
    assert(frontEnd.listenerState() == Acceptor::State::kAccepting);
    const uint16_t port = frontEnd.port();
    assert(port != 0);

    bool drained = false;
    std::thread client([&]() {
        runClientChecks(port);
        loop.RunInLoop([&]() {
            frontEnd.Shutdown(2.0, [&]() {
                drained = true;
                loop.Quit();
            });
        });
    });

    loop.Loop();
    client.join();
    assert(drained);
    assert(frontEnd.listenerState() == Acceptor::State::kClosed);
    frontEnd.Stop();

    // Refused once closed.
    HttpTestClient late(port);
    assert(!late.connected());

    LOG_INFO << "FrontEnd test finished";
    return 0;
}
