#include "fwdgate/network/Poller.h"
#include "fwdgate/network/Channel.h"
#include "fwdgate/common/Logger.h"

#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace fwdgate {
namespace network {

Poller::Poller(EventLoop* loop)
    : ownerLoop_(loop),
      epollfd_(::epoll_create1(EPOLL_CLOEXEC)),
      events_(kInitEventListSize) {
    if (epollfd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "epoll_create1");
    }
}

Poller::~Poller() {
    ::close(epollfd_);
}

std::chrono::system_clock::time_point Poller::Poll(int timeoutMs, ChannelList* activeChannels) {
    const int n = ::epoll_wait(epollfd_, events_.data(), static_cast<int>(events_.size()), timeoutMs);
    const int savedErrno = errno;
    const auto now = std::chrono::system_clock::now();

    if (n < 0) {
        if (savedErrno != EINTR) {
            LOG_ERROR << "epoll_wait on loop " << ownerLoop_ << ": " << std::strerror(savedErrno);
        }
        return now;
    }
    for (int i = 0; i < n; ++i) {
        Channel* channel = static_cast<Channel*>(events_[i].data.ptr);
        channel->set_revents(static_cast<int>(events_[i].events));
        activeChannels->push_back(channel);
    }
    // A full batch means more may be pending; take bigger bites next time.
    if (static_cast<size_t>(n) == events_.size() && events_.size() < kMaxEventListSize) {
        events_.resize(events_.size() * 2);
    }
    return now;
}

void Poller::UpdateChannel(Channel* channel) {
    switch (channel->poll_state()) {
        case Channel::PollState::kNew:
            channels_[channel->fd()] = channel;
            // fall through
        case Channel::PollState::kDetached:
            if (channel->IsNoneEvent()) {
                channel->set_poll_state(Channel::PollState::kDetached);
                return;
            }
            if (Control(EPOLL_CTL_ADD, channel)) {
                channel->set_poll_state(Channel::PollState::kAdded);
            }
            return;
        case Channel::PollState::kAdded:
            if (channel->IsNoneEvent()) {
                Control(EPOLL_CTL_DEL, channel);
                channel->set_poll_state(Channel::PollState::kDetached);
            } else {
                Control(EPOLL_CTL_MOD, channel);
            }
            return;
    }
}

void Poller::RemoveChannel(Channel* channel) {
    channels_.erase(channel->fd());
    if (channel->poll_state() == Channel::PollState::kAdded) {
        Control(EPOLL_CTL_DEL, channel);
    }
    channel->set_poll_state(Channel::PollState::kNew);
}

bool Poller::HasChannel(Channel* channel) const {
    auto it = channels_.find(channel->fd());
    return it != channels_.end() && it->second == channel;
}

bool Poller::Control(int operation, Channel* channel) {
    struct epoll_event event;
    std::memset(&event, 0, sizeof(event));
    event.events = static_cast<uint32_t>(channel->events());
    event.data.ptr = channel;
    if (::epoll_ctl(epollfd_, operation, channel->fd(), &event) == 0) {
        return true;
    }
    const int err = errno;
    const char* op = operation == EPOLL_CTL_ADD ? "ADD" : (operation == EPOLL_CTL_MOD ? "MOD" : "DEL");
    // DEL of an fd the kernel already dropped (closed elsewhere) is harmless.
    if (operation == EPOLL_CTL_DEL) {
        LOG_DEBUG << "epoll_ctl " << op << " fd=" << channel->fd() << ": " << std::strerror(err);
    } else {
        LOG_ERROR << "epoll_ctl " << op << " fd=" << channel->fd() << ": " << std::strerror(err);
    }
    return false;
}

} // namespace network
} // namespace fwdgate
