#include "fwdgate/network/EventLoopThreadPool.h"
#include "fwdgate/network/EventLoopThread.h"
#include "fwdgate/network/EventLoop.h"

namespace fwdgate {
namespace network {

EventLoopThreadPool::EventLoopThreadPool(EventLoop* baseLoop, const std::string& nameArg)
    : baseLoop_(baseLoop),
      name_(nameArg),
      started_(false),
      numThreads_(0),
      next_(0) {
}

EventLoopThreadPool::~EventLoopThreadPool() {
    Stop();
}

bool EventLoopThreadPool::Start() {
    started_ = true;

    for (int i = 0; i < numThreads_; ++i) {
        std::unique_ptr<EventLoopThread> t(new EventLoopThread(name_ + std::to_string(i)));
        EventLoop* loop = t->StartLoop();
        threads_.push_back(std::move(t));
        if (loop == nullptr) {
            return false;
        }
        loops_.push_back(loop);
    }
    return true;
}

void EventLoopThreadPool::Stop() {
    for (auto& t : threads_) {
        t->Stop();
    }
    threads_.clear();
    loops_.clear();
}

EventLoop* EventLoopThreadPool::GetNextLoop() {
    EventLoop* loop = baseLoop_;

    if (!loops_.empty()) {
        loop = loops_[next_];
        ++next_;
        if (next_ >= loops_.size()) {
            next_ = 0;
        }
    }
    return loop;
}

std::vector<EventLoop*> EventLoopThreadPool::GetAllLoops() const {
    if (loops_.empty()) {
        return std::vector<EventLoop*>(1, baseLoop_);
    }
    return loops_;
}

} // namespace network
} // namespace fwdgate
