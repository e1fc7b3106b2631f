#include "fwdgate/network/EventLoop.h"
#include "fwdgate/network/EventLoopThreadPool.h"
#include "fwdgate/network/SignalWatcher.h"
#include "fwdgate/network/Timer.h"
#include "fwdgate/common/Logger.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <csignal>
#include <set>
#include <stdexcept>
#include <thread>

using namespace fwdgate::network;
using namespace fwdgate::common;

void testQuitFromOtherThread() {
    EventLoop loop;
    std::atomic_bool ran{false};

    std::thread t([&loop, &ran]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        loop.RunInLoop([&loop, &ran]() {
            assert(loop.IsInLoopThread());
            ran = true;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        LOG_INFO << "Quitting main loop from thread";
        loop.Quit();
    });

    loop.Loop();
    t.join();
    assert(ran);
    assert(!loop.IsLooping());
    LOG_INFO << "Cross-thread quit PASS";
}

void testOneLoopPerThread() {
    EventLoop loop;
    assert(EventLoop::GetEventLoopOfCurrentThread() == &loop);
    bool threw = false;
    try {
        EventLoop second;
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    LOG_INFO << "One loop per thread PASS";
}

void testTimer() {
    EventLoop loop;
    int ticks = 0;
    bool onceFired = false;

    Timer once(&loop, [&onceFired]() { onceFired = true; });
    Timer periodic(&loop, [&]() {
        if (++ticks == 3) {
            loop.Quit();
        }
    });
    Timer cancelled(&loop, []() { assert(false && "stopped timer fired"); });
    Timer watchdog(&loop, [&loop]() {
        LOG_ERROR << "timer test timed out";
        loop.Quit();
    });

    once.Start(0.05);
    periodic.Start(0.05, 0.05);
    cancelled.Start(0.05);
    cancelled.Stop();
    assert(!cancelled.armed());
    watchdog.Start(5.0);

    loop.Loop();
    assert(onceFired);
    assert(!once.armed());
    assert(ticks == 3);
    assert(periodic.armed());
    periodic.Stop();
    LOG_INFO << "Timer PASS";
}

void testThreadPool() {
    EventLoop base;
    EventLoopThreadPool pool(&base, "io");
    assert(pool.GetNextLoop() == &base);

    pool.SetThreadNum(3);
    assert(pool.Start());
    std::vector<EventLoop*> loops = pool.GetAllLoops();
    assert(loops.size() == 3);

    std::set<EventLoop*> seen;
    for (int i = 0; i < 6; ++i) {
        seen.insert(pool.GetNextLoop());
    }
    assert(seen.size() == 3);
    assert(seen.count(&base) == 0);

    std::atomic<int> ran{0};
    for (EventLoop* loop : loops) {
        loop->RunInLoop([loop, &ran]() {
            assert(loop->IsInLoopThread());
            ++ran;
        });
    }
    for (int i = 0; i < 100 && ran.load() < 3; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(ran.load() == 3);

    pool.Stop();
    pool.Stop();
    LOG_INFO << "EventLoopThreadPool PASS";
}

void testSignalWatcher() {
    assert(SignalWatcher::BlockSignals({SIGUSR1}));
    EventLoop loop;
    int received = 0;
    SignalWatcher watcher(&loop, {SIGUSR1}, [&](int signo) {
        received = signo;
        loop.Quit();
    });
    Timer watchdog(&loop, [&loop]() { loop.Quit(); });
    watchdog.Start(5.0);

    loop.RunInLoop([]() { ::raise(SIGUSR1); });
    loop.Loop();
    assert(received == SIGUSR1);
    LOG_INFO << "SignalWatcher PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::DEBUG);
    LOG_INFO << "Starting EventLoop test";

    testQuitFromOtherThread();
    testOneLoopPerThread();
    testTimer();
    testThreadPool();
    testSignalWatcher();

    LOG_INFO << "EventLoop tests passed";
    return 0;
}
