#include "fwdgate/common/WorkerPool.h"
#include "fwdgate/common/Logger.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <thread>

using namespace fwdgate::common;

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);

    // Not started: nothing is queued.
    {
        WorkerPool pool("idle");
        pool.SetThreadNum(2);
        assert(!pool.Submit([] {}));
        assert(pool.WaitIdle(std::chrono::milliseconds(0)));
    }

    // Runs every task, several at a time.
    {
        WorkerPool pool("count");
        pool.SetThreadNum(4);
        pool.Start();
        assert(pool.started());

        std::atomic<int> done{0};
        std::atomic<int> running{0};
        std::atomic<int> peak{0};
        for (int i = 0; i < 16; ++i) {
            bool ok = pool.Submit([&] {
                int now = ++running;
                int prev = peak.load();
                while (now > prev && !peak.compare_exchange_weak(prev, now)) {
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                --running;
                ++done;
            });
            assert(ok);
        }
        for (int i = 0; i < 200 && done.load() < 16; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        assert(done.load() == 16);
        assert(peak.load() > 1);
        assert(pool.WaitIdle(std::chrono::milliseconds(1000)));
        assert(pool.busy() == 0);
        LOG_INFO << "WorkerPool ran 16 tasks, peak concurrency " << peak.load();
    }

    // WaitIdle times out while a task is blocked, succeeds once it returns.
    {
        WorkerPool pool("wait");
        pool.SetThreadNum(1);
        pool.Start();
        std::atomic_bool release{false};
        std::atomic_bool entered{false};
        assert(pool.Submit([&] {
            entered = true;
            while (!release) std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }));
        while (!entered) std::this_thread::sleep_for(std::chrono::milliseconds(5));
        assert(pool.busy() == 1);
        assert(!pool.WaitIdle(std::chrono::milliseconds(50)));
        release = true;
        assert(pool.WaitIdle(std::chrono::milliseconds(2000)));

        pool.Stop();
        assert(!pool.Submit([] {}));
        pool.Stop();
    }

    LOG_INFO << "WorkerPool test passed";
    return 0;
}
