#pragma once

#include "fwdgate/common/noncopyable.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fwdgate {
namespace common {

// Fixed set of threads running blocking work off the event loops.
// Results go back to a loop with EventLoop::RunInLoop.
class WorkerPool : noncopyable {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(const std::string& name = "worker");
    ~WorkerPool();

    void SetThreadNum(int numThreads) { numThreads_ = numThreads; }
    void Start();

    // Drops queued tasks, wakes idle threads and joins all threads.
    // Blocks until tasks that are already running return.
    void Stop();

    // Returns false when the pool is not running; the task is not queued then.
    bool Submit(Task task);

    bool started() const { return started_; }
    int threadNum() const { return numThreads_; }
    // Number of tasks executing right now.
    size_t busy() const;
    size_t queued() const;
    // Waits until no task is executing. Returns false on timeout.
    bool WaitIdle(std::chrono::milliseconds timeout);

private:
    void ThreadFunc(int index);

    std::string name_;
    int numThreads_{0};
    bool started_{false};
    bool stopping_{false};
    size_t busy_{0};

    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::condition_variable idleCond_;
    std::deque<Task> tasks_;
    std::vector<std::thread> threads_;
};

} // namespace common
} // namespace fwdgate
