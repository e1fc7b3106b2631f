#include "fwdgate/Lifecycle.h"
#include "fwdgate/protocol/HttpResponse.h"
#include "fwdgate/common/Logger.h"

#include "HttpTestClient.h"

#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <string>
#include <thread>

using namespace fwdgate;
using fwdgate::protocol::HttpResponse;
using namespace fwdgate::common;

static std::atomic<int> g_slowMs{1500};

static void Handler(const trust::RequestContext& ctx, HttpResponse* resp) {
    if (ctx.path() == "/slow") {
        std::this_thread::sleep_for(std::chrono::milliseconds(g_slowMs.load()));
    }
    resp->setStatusCode(HttpResponse::k200Ok);
    resp->setBody("done " + ctx.path());
}

static uint16_t waitForPort(const Lifecycle& lifecycle) {
    for (int i = 0; i < 500 && lifecycle.port() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return lifecycle.port();
}

static ServerOptions testOptions(double graceSec) {
    ServerOptions options;
    options.listenAddress = "127.0.0.1";
    options.port = 0;
    options.ioThreads = 2;
    options.workerThreads = 4;
    options.gracePeriodSec = graceSec;
    return options;
}

// SIGTERM while a slow request is in flight: it completes, idle connections close, exit 0.
void testSignalDrainsInFlight() {
    g_slowMs = 1500;
    Lifecycle lifecycle(testOptions(10.0), Handler);
    int rc = -1;
    std::thread server([&]() { rc = lifecycle.Run(); });
    const uint16_t port = waitForPort(lifecycle);
    assert(port != 0);

    HttpTestClient idle(port);
    idle.Send(HttpTestClient::Get("/quick"));
    assert(HttpTestClient::Status(idle.ReadResponse()) == 200);

    HttpTestClient slow(port);
    slow.Send(HttpTestClient::Get("/slow"));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    const auto signalled = std::chrono::steady_clock::now();
    assert(::kill(::getpid(), SIGTERM) == 0);

    // The idle keep-alive connection is closed right away.
    assert(idle.WaitClosed(2000));
    idle.Close();

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    HttpTestClient refused(port);
    assert(!refused.connected());

    std::string resp = slow.ReadResponse(5000);
    assert(HttpTestClient::Status(resp) == 200);
    assert(HttpTestClient::Body(resp) == "done /slow");
    assert(HttpTestClient::HasHeader(resp, "Connection: close"));
    assert(slow.WaitClosed(2000));
    slow.Close();

    server.join();
    assert(rc == 0);
    const auto took = std::chrono::steady_clock::now() - signalled;
    assert(took < std::chrono::seconds(5));
    LOG_INFO << "Signal drain PASS";
}

// A request outliving the grace period is cut off; the process still exits 0.
void testGracePeriodExpires() {
    g_slowMs = 800;
    Lifecycle lifecycle(testOptions(0.3), Handler);
    int rc = -1;
    std::thread server([&]() { rc = lifecycle.Run(); });
    const uint16_t port = waitForPort(lifecycle);
    assert(port != 0);

    HttpTestClient slow(port);
    slow.Send(HttpTestClient::Get("/slow"));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    const auto requested = std::chrono::steady_clock::now();
    lifecycle.RequestShutdown();
    std::string all = slow.ReadUntilClosed(3000);
    const auto closedAfter = std::chrono::steady_clock::now() - requested;
    assert(all.empty());
    assert(closedAfter < std::chrono::milliseconds(700));

    server.join();
    assert(rc == 0);
    LOG_INFO << "Grace period expiry PASS";
}

// Shutdown requested before Run() starts serving.
void testEarlyShutdownRequest() {
    Lifecycle lifecycle(testOptions(1.0), Handler);
    lifecycle.RequestShutdown();
    assert(lifecycle.Run() == 0);
    LOG_INFO << "Early shutdown request PASS";
}

int main() {
    // Must precede every thread, the logger's included.
    const bool blocked = Lifecycle::BlockTerminationSignals();
    assert(blocked);
    Logger::Instance().SetLevel(LogLevel::DEBUG);

    testSignalDrainsInFlight();
    testGracePeriodExpires();
    testEarlyShutdownRequest();

    LOG_INFO << "Graceful shutdown test finished";
    return 0;
}
