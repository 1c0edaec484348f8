/// @file backoff.hpp
/// @brief Exponential backoff with jitter for the ErrorBackoff phase.

#pragma once

#include <chrono>
#include <cstdint>
#include <random>

namespace offsync_cpp {

/// Backoff settings; see load_config().
struct BackoffConfig {
    std::chrono::milliseconds base{500};      ///< Delay after the first failure.
    std::chrono::milliseconds max{60'000};    ///< Cap before jitter.
    std::chrono::milliseconds jitter{250};    ///< Upper bound of the uniform jitter.
};

/// Computes retry delays: `min(base * 2^(failures - 1), max)` plus a
/// uniform jitter in `[0, jitter]`.
///
/// A plain value type, independent of any clock or I/O; seed it for
/// reproducible delays in tests.
///
/// @code
/// auto policy = BackoffPolicy{{.base = 100ms, .max = 1s, .jitter = 0ms}};
/// policy.delay(1);  // 100ms
/// policy.delay(3);  // 400ms
/// policy.delay(9);  // 1s
/// @endcode
class BackoffPolicy {
public:
    explicit BackoffPolicy(BackoffConfig config = {});
    BackoffPolicy(BackoffConfig config, std::uint64_t seed);

    /// Delay before retrying after `consecutive_failures` failures in a row.
    /// Zero failures means no delay.
    auto delay(std::uint32_t consecutive_failures) -> std::chrono::milliseconds;

    /// The deterministic part of delay(), without jitter.
    auto base_delay(std::uint32_t consecutive_failures) const -> std::chrono::milliseconds;

    auto config() const -> const BackoffConfig& { return config_; }

private:
    BackoffConfig config_;
    std::mt19937_64 rng_;
};

}  // namespace offsync_cpp
