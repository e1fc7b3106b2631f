#include "fwdgate/network/SignalWatcher.h"
#include "fwdgate/network/Channel.h"
#include "fwdgate/network/EventLoop.h"
#include "fwdgate/common/Logger.h"

#include <sys/signalfd.h>
#include <csignal>
#include <unistd.h>
#include <pthread.h>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace fwdgate {
namespace network {

namespace {

sigset_t MakeSet(const std::vector<int>& signals) {
    sigset_t mask;
    sigemptyset(&mask);
    for (int s : signals) {
        sigaddset(&mask, s);
    }
    return mask;
}

} // namespace

bool SignalWatcher::BlockSignals(const std::vector<int>& signals) {
    sigset_t mask = MakeSet(signals);
    int rc = ::pthread_sigmask(SIG_BLOCK, &mask, nullptr);
    if (rc != 0) {
        LOG_ERROR << "pthread_sigmask failed: " << std::strerror(rc);
        return false;
    }
    return true;
}

SignalWatcher::SignalWatcher(EventLoop* loop, const std::vector<int>& signals, Callback cb)
    : loop_(loop),
      signalfd_(-1),
      callback_(std::move(cb)) {
    sigset_t mask = MakeSet(signals);
    signalfd_ = ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signalfd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "signalfd");
    }
    channel_.reset(new Channel(loop_, signalfd_));
    channel_->SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
    channel_->EnableReading();
}

SignalWatcher::~SignalWatcher() {
    channel_->DisableAll();
    channel_->Remove();
    ::close(signalfd_);
}

void SignalWatcher::HandleRead() {
    struct signalfd_siginfo info;
    for (;;) {
        ssize_t n = ::read(signalfd_, &info, sizeof info);
        if (n != sizeof info) {
            break;
        }
        LOG_DEBUG << "SignalWatcher received signal " << info.ssi_signo;
        if (callback_) {
            callback_(static_cast<int>(info.ssi_signo));
        }
    }
}

} // namespace network
} // namespace fwdgate
