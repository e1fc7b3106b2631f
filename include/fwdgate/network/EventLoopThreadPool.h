#pragma once

#include "fwdgate/common/noncopyable.h"
#include <string>
#include <vector>
#include <memory>

namespace fwdgate {
namespace network {

class EventLoop;
class EventLoopThread;

class EventLoopThreadPool : fwdgate::common::noncopyable {
public:
    EventLoopThreadPool(EventLoop* baseLoop, const std::string& nameArg);
    ~EventLoopThreadPool();

    void SetThreadNum(int numThreads) { numThreads_ = numThreads; }
    // Returns false if any loop thread failed to come up.
    bool Start();
    void Stop();

    // Round Robin. Falls back to the base loop when the pool has no threads.
    EventLoop* GetNextLoop();
    std::vector<EventLoop*> GetAllLoops() const;

    bool started() const { return started_; }
    const std::string& name() const { return name_; }

private:
    EventLoop* baseLoop_;
    std::string name_;
    bool started_;
    int numThreads_;
    size_t next_;
    std::vector<std::unique_ptr<EventLoopThread>> threads_;
    std::vector<EventLoop*> loops_;
};

} // namespace network
} // namespace fwdgate
