#pragma once

#include "fwdgate/common/noncopyable.h"

#include <functional>
#include <memory>

namespace fwdgate {
namespace network {

class Channel;
class EventLoop;

// timerfd-backed timer whose callback runs on the owning loop.
// Start/Stop must be called from the loop thread.
class Timer : fwdgate::common::noncopyable {
public:
    using Callback = std::function<void()>;

    // Throws std::system_error if timerfd_create fails.
    Timer(EventLoop* loop, Callback cb);
    ~Timer();

    // Fires after afterSec, then every intervalSec (0 = once). Restarts a running timer.
    void Start(double afterSec, double intervalSec = 0.0);
    void Stop();
    bool armed() const { return armed_; }

private:
    void HandleRead();

    EventLoop* loop_;
    int timerfd_;
    std::unique_ptr<Channel> channel_;
    Callback callback_;
    bool armed_;
    bool periodic_;
};

} // namespace network
} // namespace fwdgate
