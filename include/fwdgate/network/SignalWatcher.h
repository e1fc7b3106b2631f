#pragma once

#include "fwdgate/common/noncopyable.h"

#include <functional>
#include <memory>
#include <vector>

namespace fwdgate {
namespace network {

class Channel;
class EventLoop;

// Delivers signals through a signalfd on the owning loop. The signals must already be
// blocked in every thread of the process, otherwise the default disposition wins.
class SignalWatcher : fwdgate::common::noncopyable {
public:
    using Callback = std::function<void(int signo)>;

    // Throws std::system_error if signalfd fails.
    SignalWatcher(EventLoop* loop, const std::vector<int>& signals, Callback cb);
    ~SignalWatcher();

    // Blocks the signals for the calling thread; threads created afterwards inherit the mask.
    static bool BlockSignals(const std::vector<int>& signals);

private:
    void HandleRead();

    EventLoop* loop_;
    int signalfd_;
    std::unique_ptr<Channel> channel_;
    Callback callback_;
};

} // namespace network
} // namespace fwdgate
