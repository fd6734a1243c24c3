#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "ctc/foundation/error_code.hpp"
#include "ctc/foundation/job_scheduler.hpp"

using namespace ctc::foundation;
using namespace std::chrono_literals;

TEST(ThreadErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::ThreadError), "Thread");
    EXPECT_EQ(errorSubsystem(ErrorCode::JobScheduleFailed), "Thread");
    EXPECT_EQ(errorSubsystem(ErrorCode::JobNotFound), "Thread");
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

TEST(JobSchedulerTest, MoveConstruction) {
    JobScheduler a(1);
    JobScheduler b(std::move(a));
    auto result = b.schedule([] {});
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(b.wait(result.value()).hasValue());
}

// ---------------------------------------------------------------------------
// Scheduling
// ---------------------------------------------------------------------------

TEST(JobSchedulerTest, ScheduleAndWait) {
    JobScheduler scheduler(1);
    std::atomic<bool> executed{false};

    auto result = scheduler.schedule([&] { executed.store(true); }, JobPriority::Low);
    ASSERT_TRUE(result.hasValue());

    EXPECT_TRUE(scheduler.wait(result.value()).hasValue());
    EXPECT_TRUE(executed.load());
}

TEST(JobSchedulerTest, JobsRunInOrderOnSingleWorker) {
    JobScheduler scheduler(1);
    std::atomic<int> counter{0};
    int firstSeen = -1;
    int secondSeen = -1;

    auto first = scheduler.schedule([&] { firstSeen = counter.fetch_add(1); });
    auto second = scheduler.schedule([&] { secondSeen = counter.fetch_add(1); });
    ASSERT_TRUE(first.hasValue());
    ASSERT_TRUE(second.hasValue());

    EXPECT_TRUE(scheduler.wait(first.value()).hasValue());
    EXPECT_TRUE(scheduler.wait(second.value()).hasValue());
    EXPECT_EQ(counter.load(), 2);
    EXPECT_LT(firstSeen, secondSeen);
}

TEST(JobSchedulerTest, WaitUnknownJob) {
    JobScheduler scheduler(1);
    auto result = scheduler.wait(9999);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::JobNotFound);
}

TEST(JobSchedulerTest, ThrowingJobReportsThreadError) {
    JobScheduler scheduler(1);
    auto id = scheduler.schedule([] { throw std::runtime_error("disk full"); });
    ASSERT_TRUE(id.hasValue());

    auto result = scheduler.wait(id.value());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ThreadError);
}

TEST(JobSchedulerTest, WaitForgetsJob) {
    JobScheduler scheduler(1);
    auto id = scheduler.schedule([] {});
    ASSERT_TRUE(id.hasValue());
    EXPECT_TRUE(scheduler.wait(id.value()).hasValue());
    EXPECT_EQ(scheduler.pendingCount(), 0u);
    EXPECT_TRUE(scheduler.wait(id.value()).hasError());
}

TEST(JobSchedulerTest, CancelUnknownJob) {
    JobScheduler scheduler(1);
    auto result = scheduler.cancel(12345);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::JobNotFound);
}

TEST(JobSchedulerTest, ScheduleAfterShutdownFails) {
    JobScheduler scheduler(1);
    scheduler.shutdown();
    auto result = scheduler.schedule([] {});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::JobScheduleFailed);
}
