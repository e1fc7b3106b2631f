#pragma once

#include "fwdgate/FrontEnd.h"
#include "fwdgate/ServerOptions.h"
#include "fwdgate/common/noncopyable.h"

#include <atomic>
#include <mutex>

namespace fwdgate {

namespace network {
class EventLoop;
}

// Runs the front end as the single long-lived process activity and turns a
// termination signal into a graceful shutdown.
class Lifecycle : common::noncopyable {
public:
    Lifecycle(const ServerOptions& options, RequestHandler handler);
    ~Lifecycle();

    // Blocks until shutdown completes. Returns 0 after a graceful shutdown,
    // 1 when startup fails (bind, TLS, resources).
    int Run();

    // Same as receiving SIGTERM. Callable from any thread, also before Run().
    void RequestShutdown();

    // Port actually bound; 0 until Run() has started the front end.
    uint16_t port() const { return port_; }

    // SIGTERM and SIGINT must be blocked before any thread starts so that only the
    // signalfd sees them. main() calls this first.
    static bool BlockTerminationSignals();

private:
    void BeginShutdown(const char* reason);

    const ServerOptions options_;
    RequestHandler handler_;
    std::atomic<uint16_t> port_;
    std::atomic_bool shutdownRequested_;

    std::mutex mutex_;
    network::EventLoop* loop_; // guarded by mutex_ while Run() is active
    FrontEnd* frontEnd_;
};

} // namespace fwdgate
