#include <gtest/gtest.h>
#include "application/ExponentialBackoff.hpp"

using namespace trader;
using namespace trader::application;
using namespace std::chrono_literals;

TEST(ExponentialBackoffTest, DelayDoublesUpToCap) {
    ExponentialBackoff backoff(settings::BackoffSettings(10, 60s, 100ms, 700ms, false));

    EXPECT_EQ(backoff.delayFor(1), 100ms);
    EXPECT_EQ(backoff.delayFor(2), 200ms);
    EXPECT_EQ(backoff.delayFor(3), 400ms);
    EXPECT_EQ(backoff.delayFor(4), 700ms);
    EXPECT_EQ(backoff.delayFor(40), 700ms);
}

TEST(ExponentialBackoffTest, JitterStaysWithinDelay) {
    ExponentialBackoff backoff(settings::BackoffSettings(10, 60s, 100ms, 1000ms, true));

    for (int i = 0; i < 100; ++i) {
        auto delay = backoff.delayFor(3);
        EXPECT_GE(delay, 0ms);
        EXPECT_LE(delay, 400ms);
    }
}

TEST(ExponentialBackoffTest, CanRetry_BoundedByAttemptsAndTime) {
    ExponentialBackoff backoff(settings::BackoffSettings(3, 10s, 100ms, 1s, false));

    EXPECT_TRUE(backoff.canRetry(1, 0ms));
    EXPECT_TRUE(backoff.canRetry(2, 9s));
    EXPECT_FALSE(backoff.canRetry(3, 0ms));
    EXPECT_FALSE(backoff.canRetry(1, 10s));
}

TEST(ExponentialBackoffTest, ClampToBudget_NeverExceedsRemainingTime) {
    ExponentialBackoff backoff(settings::BackoffSettings(10, 1000ms, 100ms, 5s, false));

    EXPECT_EQ(backoff.clampToBudget(800ms, 500ms), 500ms);
    EXPECT_EQ(backoff.clampToBudget(200ms, 500ms), 200ms);
    EXPECT_EQ(backoff.clampToBudget(200ms, 1500ms), 0ms);
}
