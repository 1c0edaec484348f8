#include <offsync-cpp/backoff.hpp>

#include <gtest/gtest.h>

#include <limits>

using namespace offsync_cpp;
using namespace std::chrono_literals;

TEST(Backoff, zero_failures_means_no_delay) {
    auto policy = BackoffPolicy{{.base = 100ms, .max = 1000ms, .jitter = 50ms}};
    EXPECT_EQ(policy.delay(0), 0ms);
}

TEST(Backoff, doubles_from_base) {
    auto policy = BackoffPolicy{{.base = 100ms, .max = 10'000ms, .jitter = 0ms}};
    EXPECT_EQ(policy.delay(1), 100ms);
    EXPECT_EQ(policy.delay(2), 200ms);
    EXPECT_EQ(policy.delay(3), 400ms);
    EXPECT_EQ(policy.delay(4), 800ms);
}

TEST(Backoff, caps_at_max) {
    auto policy = BackoffPolicy{{.base = 100ms, .max = 1000ms, .jitter = 0ms}};
    EXPECT_EQ(policy.delay(5), 1000ms);
    EXPECT_EQ(policy.delay(9), 1000ms);
}

TEST(Backoff, huge_failure_count_does_not_overflow) {
    auto policy = BackoffPolicy{{.base = 500ms, .max = 60'000ms, .jitter = 0ms}};
    EXPECT_EQ(policy.delay(std::numeric_limits<std::uint32_t>::max()), 60'000ms);
}

TEST(Backoff, jitter_stays_within_bound) {
    auto policy = BackoffPolicy{{.base = 100ms, .max = 1000ms, .jitter = 50ms}, 7};
    for (std::uint32_t failures = 1; failures < 50; ++failures) {
        const auto d = policy.delay(failures);
        const auto base = policy.base_delay(failures);
        EXPECT_GE(d, base);
        EXPECT_LE(d, base + 50ms);
    }
}

TEST(Backoff, same_seed_gives_same_delays) {
    const auto config = BackoffConfig{.base = 100ms, .max = 1000ms, .jitter = 250ms};
    auto a = BackoffPolicy{config, 42};
    auto b = BackoffPolicy{config, 42};
    for (std::uint32_t failures = 1; failures < 10; ++failures) {
        EXPECT_EQ(a.delay(failures), b.delay(failures));
    }
}

TEST(Backoff, defaults) {
    const auto policy = BackoffPolicy{};
    EXPECT_EQ(policy.config().base, 500ms);
    EXPECT_EQ(policy.config().max, 60'000ms);
    EXPECT_EQ(policy.config().jitter, 250ms);
    EXPECT_EQ(policy.base_delay(2), 1000ms);
}
