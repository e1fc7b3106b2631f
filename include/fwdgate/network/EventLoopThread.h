#pragma once

#include "fwdgate/common/noncopyable.h"
#include <mutex>
#include <condition_variable>
#include <thread>
#include <string>

namespace fwdgate {
namespace network {

class EventLoop;

// Runs one EventLoop on a dedicated thread.
class EventLoopThread : fwdgate::common::noncopyable {
public:
    explicit EventLoopThread(const std::string& name = std::string());
    ~EventLoopThread();

    // Blocks until the loop exists; returns nullptr if the loop could not be created.
    EventLoop* StartLoop();
    // Quits the loop and joins. Safe to call more than once.
    void Stop();

    const std::string& name() const { return name_; }

private:
    void ThreadFunc();

    EventLoop* loop_;
    bool ready_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cond_;
    std::string name_;
};

} // namespace network
} // namespace fwdgate
