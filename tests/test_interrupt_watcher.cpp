#include "../imgpress_cli/src/utils/interrupt_watcher.hpp"
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <mutex>
#include <thread>

using namespace std::chrono_literals;

namespace {

// polls @p flag for up to two seconds
bool eventually(const std::atomic<bool>& flag) {
    for (int i = 0; i < 400 && !flag.load(); ++i) {
        std::this_thread::sleep_for(5ms);
    }
    return flag.load();
}

} // namespace

TEST(InterruptWatcher, SignalReachesCallbackOnAnotherThread) {
    std::atomic<int> received{0};
    std::atomic<bool> called{false};
    std::thread::id callback_thread;

    InterruptWatcher watcher([&](const int sig) {
        callback_thread = std::this_thread::get_id();
        received = sig;
        called = true;
    }, 5ms);
    EXPECT_FALSE(watcher.triggered());

    std::raise(SIGINT);
    ASSERT_TRUE(eventually(called));
    EXPECT_EQ(received.load(), SIGINT);
    EXPECT_TRUE(watcher.triggered());
    EXPECT_NE(callback_thread, std::this_thread::get_id());
}

TEST(InterruptWatcher, CallbackMayTakeLockHeldWhenSignalArrived) {
    // stands in for the pool lock held by the main thread inside enqueue
    std::mutex queue_lock;
    std::atomic<bool> stopped{false};

    InterruptWatcher watcher([&](int) {
        std::lock_guard lock(queue_lock);
        stopped = true;
    }, 5ms);

    {
        std::lock_guard lock(queue_lock);
        std::raise(SIGTERM);
        std::this_thread::sleep_for(20ms);
        EXPECT_FALSE(stopped.load());
    }
    EXPECT_TRUE(eventually(stopped));
}
