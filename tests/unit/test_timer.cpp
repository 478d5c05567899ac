#include "fwdproxy/network/EventLoop.h"
#include "fwdproxy/network/Timer.h"
#include "fwdproxy/common/Logger.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <memory>
#include <thread>

using fwdproxy::network::EventLoop;
using fwdproxy::network::Timer;

int main() {
    fwdproxy::common::Logger::Instance().SetLevel(fwdproxy::common::LogLevel::ERROR);

    EventLoop loop;
    int fired = 0;
    bool cancelledFired = false;
    bool selfDestroyed = false;

    Timer cancelled(&loop);
    cancelled.Start(0.05, [&]() { cancelledFired = true; });
    cancelled.Cancel();
    assert(!cancelled.armed());

    // Re-arming replaces the pending callback.
    Timer rearmed(&loop);
    rearmed.Start(0.02, [&]() { fired += 100; });
    rearmed.Start(0.03, [&]() { ++fired; });

    // The callback may delete its own timer.
    Timer* owned = new Timer(&loop);
    owned->Start(0.01, [&]() {
        delete owned;
        owned = nullptr;
        selfDestroyed = true;
    });

    Timer stop(&loop);
    stop.Start(0.2, [&]() { loop.Quit(); });

    // Safety net if the loop never stops on its own.
    std::atomic<bool> done{false};
    std::thread guard([&loop, &done]() {
        for (int i = 0; i < 500 && !done.load(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        loop.Quit();
    });

    const auto start = std::chrono::steady_clock::now();
    loop.Loop();
    done = true;
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    guard.join();

    assert(fired == 1);
    assert(!cancelledFired);
    assert(selfDestroyed);
    assert(owned == nullptr);
    assert(elapsed >= 0.19);
    return 0;
}
