#include <gtest/gtest.h>
#include <chrono>
#include "docflow/backoff_policy.hpp"
#include "docflow/config.hpp"

using namespace std::chrono_literals;

TEST(BackoffPolicyTest, DoublesUntilCapped) {
    docflow::BackoffPolicy policy(1000ms, 30000ms, 10, 0.0);

    EXPECT_EQ(policy.capped_delay(1), 1000ms);
    EXPECT_EQ(policy.capped_delay(2), 2000ms);
    EXPECT_EQ(policy.capped_delay(3), 4000ms);
    EXPECT_EQ(policy.capped_delay(5), 16000ms);
    EXPECT_EQ(policy.capped_delay(6), 30000ms);
    EXPECT_EQ(policy.capped_delay(40), 30000ms);
}

TEST(BackoffPolicyTest, DelaysAreNonDecreasing) {
    docflow::BackoffPolicy policy(100ms, 5000ms, 20, 0.3, []() { return 0.999; });

    for (uint32_t attempt = 1; attempt < 20; ++attempt) {
        EXPECT_LE(policy.capped_delay(attempt), policy.capped_delay(attempt + 1));
        EXPECT_LE(policy.capped_delay(attempt + 1), policy.max_delay());
    }

    auto jittered = policy.delay(3);
    EXPECT_GE(jittered, policy.capped_delay(3));
    EXPECT_LT(jittered, policy.capped_delay(3) + policy.capped_delay(3) * 3 / 10 + 1ms);
}

TEST(BackoffPolicyTest, JitterStaysWithinRatio) {
    docflow::BackoffPolicy policy(1000ms, 30000ms, 5, 0.3);
    for (int i = 0; i < 100; ++i) {
        auto delay = policy.delay(2);
        EXPECT_GE(delay, 2000ms);
        EXPECT_LE(delay, 2600ms);
    }
}

TEST(BackoffPolicyTest, ShouldRetryStopsAtMaxRetries) {
    docflow::BackoffPolicy policy(10ms, 100ms, 3, 0.0);
    EXPECT_TRUE(policy.should_retry(0));
    EXPECT_TRUE(policy.should_retry(2));
    EXPECT_FALSE(policy.should_retry(3));
    EXPECT_FALSE(policy.should_retry(4));
}

TEST(BackoffPolicyTest, FromConfig) {
    docflow::ChannelConfig config = docflow::default_config().channel;
    config.initial_retry_delay_ms = 200;
    config.max_retry_delay_ms = 800;
    config.max_retries = 7;

    auto policy = docflow::BackoffPolicy::from_config(config, []() { return 0.0; });
    EXPECT_EQ(policy.max_retries(), 7u);
    EXPECT_EQ(policy.delay(1), 200ms);
    EXPECT_EQ(policy.delay(4), 800ms);
}
