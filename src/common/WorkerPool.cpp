#include "fwdgate/common/WorkerPool.h"
#include "fwdgate/common/Logger.h"

namespace fwdgate {
namespace common {

WorkerPool::WorkerPool(const std::string& name)
    : name_(name) {
}

WorkerPool::~WorkerPool() {
    Stop();
}

void WorkerPool::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) return;
    started_ = true;
    stopping_ = false;
    threads_.reserve(static_cast<size_t>(numThreads_));
    for (int i = 0; i < numThreads_; ++i) {
        threads_.emplace_back(&WorkerPool::ThreadFunc, this, i);
    }
    LOG_DEBUG << "WorkerPool[" << name_ << "] started " << numThreads_ << " threads";
}

void WorkerPool::Stop() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_) return;
        started_ = false;
        stopping_ = true;
        if (!tasks_.empty()) {
            LOG_WARN << "WorkerPool[" << name_ << "] dropping " << tasks_.size() << " queued tasks";
            tasks_.clear();
        }
        threads.swap(threads_);
    }
    cond_.notify_all();

    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
    LOG_DEBUG << "WorkerPool[" << name_ << "] stopped";
}

bool WorkerPool::Submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_ || stopping_) return false;
        tasks_.push_back(std::move(task));
    }
    cond_.notify_one();
    return true;
}

size_t WorkerPool::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return busy_;
}

size_t WorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

bool WorkerPool::WaitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idleCond_.wait_for(lock, timeout, [this] { return busy_ == 0; });
}

void WorkerPool::ThreadFunc(int index) {
    (void)index;
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            while (!stopping_ && tasks_.empty()) {
                cond_.wait(lock);
            }
            if (stopping_) return;
            task = std::move(tasks_.front());
            tasks_.pop_front();
            ++busy_;
        }

        task();

        std::lock_guard<std::mutex> lock(mutex_);
        if (--busy_ == 0) {
            idleCond_.notify_all();
        }
    }
}

} // namespace common
} // namespace fwdgate
