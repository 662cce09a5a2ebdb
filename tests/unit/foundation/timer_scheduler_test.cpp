#include <gtest/gtest.h>

#include <chrono>
#include <vector>

#include "tbc/foundation/timer_scheduler.hpp"

using namespace tbc::foundation;
using namespace std::chrono_literals;

TEST(TimerSchedulerTest, FiresOnlyWhenDue) {
    TimerScheduler timers;
    int fired = 0;
    ASSERT_TRUE(timers.scheduleAfter(1500ms, [&] { ++fired; }).hasValue());

    EXPECT_EQ(timers.advance(1000ms), 0u);
    EXPECT_EQ(fired, 0);
    EXPECT_EQ(timers.advance(500ms), 1u);
    EXPECT_EQ(fired, 1);
    EXPECT_EQ(timers.now(), 1500ms);
    EXPECT_EQ(timers.pendingCount(), 0u);
}

TEST(TimerSchedulerTest, SameDueTimeKeepsSchedulingOrder) {
    TimerScheduler timers;
    std::vector<int> order;
    ASSERT_TRUE(timers.scheduleAfter(100ms, [&] { order.push_back(1); }).hasValue());
    ASSERT_TRUE(timers.scheduleAfter(100ms, [&] { order.push_back(2); }).hasValue());
    ASSERT_TRUE(timers.scheduleAfter(50ms, [&] { order.push_back(0); }).hasValue());

    timers.advance(100ms);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
}

TEST(TimerSchedulerTest, CallbackScheduledInsideWindowFiresSameAdvance) {
    TimerScheduler timers;
    int chained = 0;
    ASSERT_TRUE(timers.scheduleAfter(10ms, [&] {
        auto next = timers.scheduleAfter(10ms, [&] { ++chained; });
        EXPECT_TRUE(next.hasValue());
    }).hasValue());

    EXPECT_EQ(timers.advance(25ms), 2u);
    EXPECT_EQ(chained, 1);
}

TEST(TimerSchedulerTest, CancelPreventsFiring) {
    TimerScheduler timers;
    int fired = 0;
    auto id = timers.scheduleAfter(10ms, [&] { ++fired; });
    ASSERT_TRUE(id.hasValue());
    EXPECT_TRUE(timers.isPending(id.value()));

    EXPECT_TRUE(timers.cancel(id.value()).hasValue());
    EXPECT_FALSE(timers.isPending(id.value()));
    timers.advance(20ms);
    EXPECT_EQ(fired, 0);

    auto again = timers.cancel(id.value());
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::TimerNotFound);
}

TEST(TimerSchedulerTest, RejectsNegativeDelayAndEmptyCallback) {
    TimerScheduler timers;
    auto negative = timers.scheduleAfter(-1ms, [] {});
    ASSERT_TRUE(negative.hasError());
    EXPECT_EQ(negative.error().code(), ErrorCode::InvalidDelay);

    auto empty = timers.scheduleAfter(1ms, TimerScheduler::Callback{});
    ASSERT_TRUE(empty.hasError());
    EXPECT_EQ(empty.error().code(), ErrorCode::InvalidArgument);
}

TEST(TimerSchedulerTest, RunUntilIdleStopsAtLimit) {
    TimerScheduler timers;
    int fired = 0;
    ASSERT_TRUE(timers.scheduleAfter(100ms, [&] { ++fired; }).hasValue());
    ASSERT_TRUE(timers.scheduleAfter(5000ms, [&] { ++fired; }).hasValue());

    EXPECT_EQ(timers.runUntilIdle(1000ms), 1u);
    EXPECT_EQ(fired, 1);
    EXPECT_EQ(timers.now(), 1000ms);
    EXPECT_EQ(timers.pendingCount(), 1u);
}

TEST(TimerSchedulerTest, ClearDropsEverything) {
    TimerScheduler timers;
    ASSERT_TRUE(timers.scheduleAfter(1ms, [] {}).hasValue());
    ASSERT_TRUE(timers.scheduleAfter(2ms, [] {}).hasValue());
    timers.clear();
    EXPECT_EQ(timers.pendingCount(), 0u);
    EXPECT_EQ(timers.advance(10ms), 0u);
}
