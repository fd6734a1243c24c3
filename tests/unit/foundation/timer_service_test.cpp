#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "ctc/foundation/timer_service.hpp"

using namespace ctc::foundation;
using namespace std::chrono_literals;

namespace {

/// Poll until @p pred holds or @p timeout elapses.
template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // anonymous namespace
TEST(ThreadTimerServiceTest, NotReadyBeforeStart) {
    ThreadTimerService timers;
    EXPECT_FALSE(timers.isReady());

    auto result = timers.schedulePeriodic(10ms, [] {});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::TimerServiceNotReady);
}

TEST(ThreadTimerServiceTest, StartTwiceFails) {
    ThreadTimerService timers;
    EXPECT_TRUE(timers.start());
    EXPECT_FALSE(timers.start());
    EXPECT_TRUE(timers.isReady());
    timers.stop();
    EXPECT_FALSE(timers.isReady());
}

TEST(ThreadTimerServiceTest, RejectsInvalidArguments) {
    ThreadTimerService timers;
    ASSERT_TRUE(timers.start());

    auto zero = timers.schedulePeriodic(0ms, [] {});
    ASSERT_TRUE(zero.hasError());
    EXPECT_EQ(zero.error().code(), ErrorCode::InvalidArgument);

    auto empty = timers.schedulePeriodic(10ms, TimerCallback{});
    ASSERT_TRUE(empty.hasError());
    EXPECT_EQ(empty.error().code(), ErrorCode::InvalidArgument);
}

TEST(ThreadTimerServiceTest, PeriodicCallbackFires) {
    ThreadTimerService timers;
    ASSERT_TRUE(timers.start());

    std::atomic<int> fired{0};
    auto handle = timers.schedulePeriodic(10ms, [&] { fired.fetch_add(1); });
    ASSERT_TRUE(handle.hasValue());
    EXPECT_EQ(timers.timerCount(), 1u);

    EXPECT_TRUE(waitFor([&] { return fired.load() >= 3; }));
    EXPECT_GE(timers.firedCount(), 3u);
}

TEST(ThreadTimerServiceTest, CancelStopsCallback) {
    ThreadTimerService timers;
    ASSERT_TRUE(timers.start());

    std::atomic<int> fired{0};
    auto handle = timers.schedulePeriodic(5ms, [&] { fired.fetch_add(1); });
    ASSERT_TRUE(handle.hasValue());
    ASSERT_TRUE(waitFor([&] { return fired.load() >= 1; }));

    ASSERT_TRUE(timers.cancel(handle.value()).hasValue());
    int after = fired.load();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(fired.load(), after);
    EXPECT_EQ(timers.timerCount(), 0u);
}

TEST(ThreadTimerServiceTest, CancelUnknownHandle) {
    ThreadTimerService timers;
    auto result = timers.cancel(42);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::TimerNotFound);
}

TEST(ThreadTimerServiceTest, ThrowingCallbackKeepsFiring) {
    ThreadTimerService timers;
    ASSERT_TRUE(timers.start());

    std::atomic<int> fired{0};
    auto handle = timers.schedulePeriodic(5ms, [&] {
        fired.fetch_add(1);
        throw std::runtime_error("boom");
    });
    ASSERT_TRUE(handle.hasValue());
    EXPECT_TRUE(waitFor([&] { return fired.load() >= 2; }));
}

TEST(ThreadTimerServiceTest, CallbackMayCancelItself) {
    ThreadTimerService timers;
    ASSERT_TRUE(timers.start());

    std::atomic<int> fired{0};
    std::atomic<TimerHandle> self{0};
    auto handle = timers.schedulePeriodic(5ms, [&] {
        fired.fetch_add(1);
        auto id = self.load();
        if (id != 0) {
            (void)timers.cancel(id);
        }
    });
    ASSERT_TRUE(handle.hasValue());
    self.store(handle.value());

    EXPECT_TRUE(waitFor([&] { return timers.timerCount() == 0; }));
}
