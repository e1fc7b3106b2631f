#pragma once

#include <vector>
#include <atomic>
#include <functional>
#include <memory>
#include <thread>
#include <mutex>

#include "fwdgate/common/noncopyable.h"
#include "fwdgate/network/Channel.h"
#include "fwdgate/network/Poller.h"

namespace fwdgate {
namespace network {

// One loop per thread. Everything touching a channel runs on the loop's own thread;
// other threads hand work over with RunInLoop/QueueInLoop.
class EventLoop : fwdgate::common::noncopyable {
public:
    using Functor = std::function<void()>;

    // Throws std::system_error if the poller or the wakeup eventfd cannot be created,
    // and std::logic_error if the calling thread already owns a loop.
    EventLoop();
    ~EventLoop();

    void Loop();
    void Quit();
    bool IsLooping() const { return looping_; }

    void RunInLoop(Functor cb);
    void QueueInLoop(Functor cb);

    void WakeUp();
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel);

    bool IsInLoopThread() const { return thread_id_ == std::this_thread::get_id(); }

    static EventLoop* GetEventLoopOfCurrentThread();

private:
    void HandleRead(); // wakeup fd
    void DoPendingFunctors();

    using ChannelList = std::vector<Channel*>;

    std::atomic_bool looping_;
    std::atomic_bool quit_;
    std::atomic_bool calling_pending_functors_;

    const std::thread::id thread_id_;
    std::unique_ptr<Poller> poller_;

    int wakeup_fd_;
    std::unique_ptr<Channel> wakeup_channel_;

    ChannelList active_channels_;

    std::mutex mutex_;
    std::vector<Functor> pending_functors_;
};

} // namespace network
} // namespace fwdgate
