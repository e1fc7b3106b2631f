#include "fwdgate/Lifecycle.h"
#include "fwdgate/protocol/HttpResponse.h"
#include "fwdgate/common/Logger.h"

#include "HttpTestClient.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace fwdgate;
using fwdgate::protocol::HttpResponse;
using namespace fwdgate::common;

static const int kClients = 32;
static const int kRequestsPerClient = 3;

// Slow enough that serial handling would be obvious.
static void SlowEcho(const trust::RequestContext& ctx, HttpResponse* resp) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    resp->setStatusCode(HttpResponse::k200Ok);
    resp->setBody(ctx.clientAddress() + " " + ctx.header("X-Request-Id") + " " + ctx.host());
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);

    ServerOptions options;
    options.listenAddress = "127.0.0.1";
    options.port = 0;
    options.ioThreads = 4;
    options.workerThreads = 16;
    options.accessLog = false;

    Lifecycle lifecycle(options, SlowEcho);
    int rc = -1;
    std::thread server([&]() { rc = lifecycle.Run(); });
    for (int i = 0; i < 500 && lifecycle.port() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    const uint16_t port = lifecycle.port();
    assert(port != 0);

    std::atomic<int> ok{0};
    std::atomic<int> mismatched{0};
    const auto start = std::chrono::steady_clock::now();

    std::vector<std::thread> clients;
    for (int i = 0; i < kClients; ++i) {
        clients.emplace_back([i, port, &ok, &mismatched]() {
            HttpTestClient c(port);
            assert(c.connected());
            const std::string ip = "10.0." + std::to_string(i) + ".1";
            for (int r = 0; r < kRequestsPerClient; ++r) {
                const std::string id = std::to_string(i) + "-" + std::to_string(r);
                c.Send("GET /whoami HTTP/1.1\r\n"
                       "Host: client" + std::to_string(i) + ".example\r\n"
                       "X-Forwarded-For: " + ip + "\r\n"
                       "X-Request-Id: " + id + "\r\n\r\n");
                std::string resp = c.ReadResponse(5000);
                if (HttpTestClient::Status(resp) != 200) {
                    ++mismatched;
                    continue;
                }
                const std::string expected = ip + " " + id + " client" + std::to_string(i) + ".example";
                if (HttpTestClient::Body(resp) == expected) {
                    ++ok;
                } else {
                    LOG_ERROR << "client " << i << " got \"" << HttpTestClient::Body(resp)
                              << "\", expected \"" << expected << "\"";
                    ++mismatched;
                }
            }
        });
    }
    for (auto& t : clients) {
        t.join();
    }
    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    LOG_INFO << ok.load() << " responses matched, " << mismatched.load() << " mismatched, " << elapsedMs << "ms";
    assert(mismatched.load() == 0);
    assert(ok.load() == kClients * kRequestsPerClient);
    // 96 requests of 100ms each; serial handling would take 9.6s.
    assert(elapsedMs < 5000);

    lifecycle.RequestShutdown();
    server.join();
    assert(rc == 0);

    LOG_INFO << "Concurrent requests test finished";
    return 0;
}
