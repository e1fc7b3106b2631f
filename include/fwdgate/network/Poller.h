#pragma once

#include "fwdgate/common/noncopyable.h"

#include <sys/epoll.h>

#include <chrono>
#include <unordered_map>
#include <vector>

namespace fwdgate {
namespace network {

class Channel;
class EventLoop;

// epoll demultiplexer owned by one EventLoop; used only from the loop thread.
// A channel is known from its first Update until Remove. While it has no interest
// it stays known but is kept out of the epoll set.
class Poller : fwdgate::common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    // Throws std::system_error when epoll_create1 fails.
    explicit Poller(EventLoop* loop);
    ~Poller();

    // Waits up to timeoutMs and appends the ready channels. Returns the wakeup time.
    std::chrono::system_clock::time_point Poll(int timeoutMs, ChannelList* activeChannels);

    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel) const;

    size_t channelCount() const { return channels_.size(); }

private:
    static const size_t kInitEventListSize = 16;
    static const size_t kMaxEventListSize = 4096;

    bool Control(int operation, Channel* channel);

    EventLoop* ownerLoop_;
    int epollfd_;
    std::vector<struct epoll_event> events_;
    std::unordered_map<int, Channel*> channels_;
};

} // namespace network
} // namespace fwdgate
