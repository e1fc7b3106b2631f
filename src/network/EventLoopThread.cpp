#include "fwdgate/network/EventLoopThread.h"
#include "fwdgate/network/EventLoop.h"
#include "fwdgate/common/Logger.h"

#include <exception>

namespace fwdgate {
namespace network {

EventLoopThread::EventLoopThread(const std::string& name)
    : loop_(nullptr),
      ready_(false),
      name_(name) {
}

EventLoopThread::~EventLoopThread() {
    Stop();
}

EventLoop* EventLoopThread::StartLoop() {
    thread_ = std::thread(std::bind(&EventLoopThread::ThreadFunc, this));

    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait(lock, [this] { return ready_; });
    return loop_;
}

void EventLoopThread::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (loop_ != nullptr) {
            loop_->Quit();
        }
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

void EventLoopThread::ThreadFunc() {
    std::unique_ptr<EventLoop> loop;
    try {
        loop.reset(new EventLoop());
    } catch (const std::exception& e) {
        LOG_ERROR << "EventLoopThread " << name_ << " failed to create loop: " << e.what();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop_ = loop.get();
        ready_ = true;
        cond_.notify_one();
    }

    if (!loop) {
        return;
    }
    loop->Loop();

    std::lock_guard<std::mutex> lock(mutex_);
    loop_ = nullptr;
}

} // namespace network
} // namespace fwdgate
