#include "fwdgate/Lifecycle.h"
#include "fwdgate/network/EventLoop.h"
#include "fwdgate/network/SignalWatcher.h"
#include "fwdgate/common/Logger.h"

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <vector>

namespace fwdgate {

namespace {

const std::vector<int>& TerminationSignals() {
    static const std::vector<int> kSignals = {SIGTERM, SIGINT};
    return kSignals;
}

// Time a handler gets to return after its connection is gone.
const double kHandlerSettleSec = 1.0;

} // namespace

Lifecycle::Lifecycle(const ServerOptions& options, RequestHandler handler)
    : options_(options),
      handler_(std::move(handler)),
      port_(0),
      shutdownRequested_(false),
      loop_(nullptr),
      frontEnd_(nullptr) {
}

Lifecycle::~Lifecycle() = default;

bool Lifecycle::BlockTerminationSignals() {
    return network::SignalWatcher::BlockSignals(TerminationSignals());
}

int Lifecycle::Run() {
    try {
        network::EventLoop loop;
        FrontEnd frontEnd(&loop, options_, handler_);

        std::string err;
        if (!frontEnd.Start(&err)) {
            LOG_ERROR << "cannot serve on " << options_.listenAddress << ":" << options_.port << ": " << err;
            return 1;
        }
        port_ = frontEnd.port();

        network::SignalWatcher signals(&loop, TerminationSignals(), [this](int signo) {
            BeginShutdown(::strsignal(signo));
        });

        {
            std::lock_guard<std::mutex> lock(mutex_);
            loop_ = &loop;
            frontEnd_ = &frontEnd;
        }
        if (shutdownRequested_) {
            BeginShutdown("shutdown requested");
        }

        loop.Loop();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            loop_ = nullptr;
            frontEnd_ = nullptr;
        }

        // A handler still in application code after the grace period would block the join forever.
        if (!frontEnd.WaitHandlersIdle(kHandlerSettleSec)) {
            LOG_WARN << frontEnd.busyHandlers() << " handler(s) still running after the grace period, exiting";
            std::quick_exit(0);
        }
        frontEnd.Stop();
        LOG_INFO << "shutdown complete";
        return 0;
    } catch (const std::exception& e) {
        LOG_ERROR << "fatal: " << e.what();
        return 1;
    }
}

void Lifecycle::RequestShutdown() {
    shutdownRequested_ = true;
    std::lock_guard<std::mutex> lock(mutex_);
    if (loop_ != nullptr) {
        loop_->RunInLoop([this]() { BeginShutdown("shutdown requested"); });
    }
}

// Base loop only.
void Lifecycle::BeginShutdown(const char* reason) {
    network::EventLoop* loop = nullptr;
    FrontEnd* frontEnd = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop = loop_;
        frontEnd = frontEnd_;
    }
    if (loop == nullptr || frontEnd == nullptr || frontEnd->shuttingDown()) {
        return;
    }
    LOG_INFO << "received " << reason << ", stopping";
    frontEnd->Shutdown(options_.gracePeriodSec, [loop]() { loop->Quit(); });
}

} // namespace fwdgate
