#include <offsync-cpp/backoff.hpp>

#include <algorithm>

namespace offsync_cpp {

BackoffPolicy::BackoffPolicy(BackoffConfig config)
    : config_{config}, rng_{std::random_device{}()} {}

BackoffPolicy::BackoffPolicy(BackoffConfig config, std::uint64_t seed)
    : config_{config}, rng_{seed} {}

auto BackoffPolicy::base_delay(std::uint32_t consecutive_failures) const
    -> std::chrono::milliseconds {
    if (consecutive_failures == 0) return std::chrono::milliseconds{0};

    const auto base = std::max<std::int64_t>(config_.base.count(), 0);
    const auto cap = std::max<std::int64_t>(config_.max.count(), 0);

    // Double until the cap is reached; stops before the shift can overflow.
    auto delay = base;
    for (std::uint32_t i = 1; i < consecutive_failures && delay < cap; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds{std::min(delay, cap)};
}

auto BackoffPolicy::delay(std::uint32_t consecutive_failures) -> std::chrono::milliseconds {
    auto result = base_delay(consecutive_failures);
    if (consecutive_failures == 0 || config_.jitter.count() <= 0) return result;
    auto jitter = std::uniform_int_distribution<std::int64_t>{0, config_.jitter.count()};
    return result + std::chrono::milliseconds{jitter(rng_)};
}

}  // namespace offsync_cpp
