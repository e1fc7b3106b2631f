#include "fwdgate/network/Timer.h"
#include "fwdgate/network/Channel.h"
#include "fwdgate/network/EventLoop.h"
#include "fwdgate/common/Logger.h"

#include <sys/timerfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace fwdgate {
namespace network {

namespace {

struct timespec ToTimespec(double sec) {
    struct timespec ts;
    if (sec <= 0.0) {
        ts.tv_sec = 0;
        ts.tv_nsec = 0;
        return ts;
    }
    ts.tv_sec = static_cast<time_t>(sec);
    ts.tv_nsec = static_cast<long>((sec - static_cast<double>(ts.tv_sec)) * 1e9);
    if (ts.tv_sec == 0 && ts.tv_nsec < 1000000) {
        ts.tv_nsec = 1000000; // at least 1ms
    }
    return ts;
}

} // namespace

Timer::Timer(EventLoop* loop, Callback cb)
    : loop_(loop),
      timerfd_(::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC)),
      callback_(std::move(cb)),
      armed_(false),
      periodic_(false) {
    if (timerfd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "timerfd_create");
    }
    channel_.reset(new Channel(loop_, timerfd_));
    channel_->SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
    channel_->EnableReading();
}

Timer::~Timer() {
    channel_->DisableAll();
    channel_->Remove();
    ::close(timerfd_);
}

void Timer::Start(double afterSec, double intervalSec) {
    struct itimerspec howlong;
    std::memset(&howlong, 0, sizeof howlong);
    howlong.it_value = ToTimespec(afterSec > 0.0 ? afterSec : 0.001);
    howlong.it_interval = ToTimespec(intervalSec);
    if (::timerfd_settime(timerfd_, 0, &howlong, nullptr) != 0) {
        LOG_ERROR << "Timer timerfd_settime failed: " << std::strerror(errno);
        return;
    }
    armed_ = true;
    periodic_ = intervalSec > 0.0;
}

void Timer::Stop() {
    struct itimerspec off;
    std::memset(&off, 0, sizeof off);
    ::timerfd_settime(timerfd_, 0, &off, nullptr);
    armed_ = false;
}

void Timer::HandleRead() {
    uint64_t expirations = 0;
    ssize_t n = ::read(timerfd_, &expirations, sizeof expirations);
    if (n != sizeof expirations) {
        return; // disarmed between wakeup and read
    }
    if (!periodic_) {
        armed_ = false;
    }
    if (callback_) {
        callback_();
    }
}

} // namespace network
} // namespace fwdgate
