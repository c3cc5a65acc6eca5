/**
 * @file test_scheduling.cpp
 * @brief Tests for the heartbeat schedule, lifetime and failure policy
 * @author Tether Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Tether Project. All rights reserved.
 */

#include <Tether/Portal/FailurePolicy.hpp>
#include <Tether/Portal/HeartbeatSchedule.hpp>
#include <Tether/Portal/Lifetime.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <thread>

using namespace Tether;
using namespace Tether::Portal;
using namespace Tether::Testing;

// ============================================================================
// HeartbeatSchedule
// ============================================================================

TEST(HeartbeatScheduleTest, StartsDisabled) {
    HeartbeatSchedule schedule;
    EXPECT_FALSE(schedule.isArmed());
    EXPECT_FALSE(schedule.isDue(Clock::now() + Seconds{3600}));
    EXPECT_FALSE(schedule.interval().has_value());
    EXPECT_FALSE(schedule.deadline().has_value());
}

TEST(HeartbeatScheduleTest, ArmSetsDeadline) {
    HeartbeatSchedule schedule;
    TimePoint now = Clock::now();

    schedule.arm(Seconds{30}, now);

    EXPECT_TRUE(schedule.isArmed());
    ASSERT_TRUE(schedule.interval().has_value());
    EXPECT_EQ(*schedule.interval(), Seconds{30});
    ASSERT_TRUE(schedule.deadline().has_value());
    EXPECT_TRUE(*schedule.deadline() == now + Seconds{30});

    EXPECT_FALSE(schedule.isDue(now + Seconds{29}));
    EXPECT_TRUE(schedule.isDue(now + Seconds{30}));
    EXPECT_TRUE(schedule.isDue(now + Seconds{31}));
}

TEST(HeartbeatScheduleTest, ArmReplacesInterval) {
    HeartbeatSchedule schedule;
    TimePoint now = Clock::now();

    schedule.arm(Seconds{30}, now);
    schedule.arm(Seconds{45}, now + Seconds{30});

    EXPECT_EQ(*schedule.interval(), Seconds{45});
    EXPECT_TRUE(*schedule.deadline() == now + Seconds{75});
}

TEST(HeartbeatScheduleTest, NonPositiveIntervalDisables) {
    HeartbeatSchedule schedule;
    schedule.arm(Seconds{30}, Clock::now());

    schedule.arm(Seconds{0}, Clock::now());
    EXPECT_FALSE(schedule.isArmed());

    schedule.arm(Seconds{-5}, Clock::now());
    EXPECT_FALSE(schedule.isArmed());
}

// Test that a failed beat keeps the old interval
TEST(HeartbeatScheduleTest, RearmKeepsInterval) {
    HeartbeatSchedule schedule;
    TimePoint now = Clock::now();
    schedule.arm(Seconds{20}, now);

    TimePoint later = now + Seconds{20};
    EXPECT_TRUE(schedule.rearm(later));
    EXPECT_EQ(*schedule.interval(), Seconds{20});
    EXPECT_TRUE(*schedule.deadline() == later + Seconds{20});
}

// Test that a huge interval holds the deadline at the end of the clock
TEST(HeartbeatScheduleTest, HugeIntervalSaturates) {
    HeartbeatSchedule schedule;
    TimePoint now = Clock::now();

    schedule.arm(Seconds{10000000000}, now);
    EXPECT_TRUE(schedule.isArmed());
    EXPECT_EQ(*schedule.interval(), Seconds{10000000000});
    EXPECT_TRUE(*schedule.deadline() == TimePoint::max());
    EXPECT_FALSE(schedule.isDue(now));
    EXPECT_FALSE(schedule.isDue(now + Seconds{86400}));

    EXPECT_TRUE(schedule.rearm(now + Seconds{60}));
    EXPECT_TRUE(*schedule.deadline() == TimePoint::max());
    EXPECT_FALSE(schedule.isDue(now + Seconds{60}));

    schedule.arm(Seconds{std::numeric_limits<int64_t>::max()}, now);
    EXPECT_FALSE(schedule.isDue(now));
}

TEST(HeartbeatScheduleTest, RearmWhileDisabled) {
    HeartbeatSchedule schedule;
    EXPECT_FALSE(schedule.rearm(Clock::now()));
    EXPECT_FALSE(schedule.isArmed());
}

TEST(HeartbeatScheduleTest, DisableStopsFiring) {
    HeartbeatSchedule schedule;
    TimePoint now = Clock::now();
    schedule.arm(Seconds{1}, now);

    schedule.disable();
    EXPECT_FALSE(schedule.isArmed());
    EXPECT_FALSE(schedule.isDue(now + Seconds{10}));

    // disable is idempotent
    schedule.disable();
    EXPECT_FALSE(schedule.isArmed());
}

// ============================================================================
// Lifetime
// ============================================================================

TEST(LifetimeTest, WaitTimesOut) {
    Lifetime lifetime;
    TimePoint start = Clock::now();

    EXPECT_FALSE(lifetime.waitUntil(start + Milliseconds{20}));
    EXPECT_GE(Clock::now() - start, Milliseconds{20});
    EXPECT_FALSE(lifetime.isCancelled());
}

TEST(LifetimeTest, PastDeadlineReturnsImmediately) {
    Lifetime lifetime;
    EXPECT_FALSE(lifetime.waitUntil(Clock::now() - Seconds{1}));
}

TEST(LifetimeTest, CancelWakesWaiter) {
    Lifetime lifetime;
    TimePoint start = Clock::now();

    std::thread canceller([&lifetime]() {
        std::this_thread::sleep_for(Milliseconds{20});
        lifetime.cancel();
    });

    EXPECT_TRUE(lifetime.waitUntil(start + Seconds{30}));
    canceller.join();

    EXPECT_LT(Clock::now() - start, Seconds{10});
    EXPECT_TRUE(lifetime.isCancelled());
}

TEST(LifetimeTest, CancelIsSticky) {
    Lifetime lifetime;
    lifetime.cancel();
    lifetime.cancel();

    EXPECT_TRUE(lifetime.isCancelled());
    EXPECT_TRUE(lifetime.waitUntil(Clock::now() + Seconds{30}));
}

// ============================================================================
// FailurePolicy
// ============================================================================

TEST(FailurePolicyTest, PolicyTable) {
    static_assert(policyFor(Operation::Construct) == FailurePolicy::Fatal);

    EXPECT_EQ(policyFor(Operation::Construct), FailurePolicy::Fatal);
    EXPECT_EQ(policyFor(Operation::Probe), FailurePolicy::LogAndRetryNextTick);
    EXPECT_EQ(policyFor(Operation::Authenticate), FailurePolicy::LogAndContinue);
    EXPECT_EQ(policyFor(Operation::Heartbeat), FailurePolicy::LogAndRetryNextTick);
    EXPECT_EQ(policyFor(Operation::Logout), FailurePolicy::LogAndContinue);
}

TEST(FailurePolicyTest, Names) {
    EXPECT_EQ(operationName(Operation::Probe), "probe");
    EXPECT_EQ(operationName(Operation::Heartbeat), "heartbeat");
    EXPECT_EQ(operationName(Operation::Logout), "logout");
    EXPECT_EQ(policyName(FailurePolicy::Fatal), "fatal");
    EXPECT_EQ(policyName(FailurePolicy::LogAndContinue), "log-and-continue");
    EXPECT_EQ(policyName(FailurePolicy::LogAndRetryNextTick), "log-and-retry-next-tick");
}
