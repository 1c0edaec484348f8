/// @file config.hpp
/// @brief Engine configuration and its JSON form.

#pragma once

#include <offsync-cpp/backoff.hpp>
#include <offsync-cpp/conflict_resolver.hpp>
#include <offsync-cpp/log.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace offsync_cpp {

/// Conflict handling settings.
struct ConflictConfig {
    ConflictStrategy strategy{ConflictStrategy::last_write_wins};
    std::vector<std::string> union_fields;  ///< Fields unioned by field_merge.
    bool flag_for_review{false};            ///< Mark records whose local changes lost as conflicted.
};

/// Everything a Repository needs to run.
///
/// An empty `data_dir` keeps all state in memory.
struct SyncConfig {
    std::filesystem::path data_dir;
    std::size_t push_batch_size{32};
    std::size_t pull_page_size{100};
    std::uint32_t max_attempts{5};
    BackoffConfig backoff{};
    std::chrono::milliseconds poll_interval{30'000};   ///< 0 disables the periodic tick.
    std::chrono::milliseconds remote_timeout{10'000};
    ConflictConfig conflict{};
    LogConfig log{};
};

/// Build a SyncConfig from a JSON object. Missing keys keep their defaults,
/// unknown keys are ignored.
///
/// @code
/// {
///   "data_dir": "/var/lib/notes/sync",
///   "push_batch_size": 32,
///   "backoff": {"base_ms": 500, "max_ms": 60000, "jitter_ms": 250},
///   "conflict": {"strategy": "field_merge", "union_fields": ["tagIds"]},
///   "log": {"level": "debug"}
/// }
/// @endcode
///
/// @throws std::invalid_argument on a value of the wrong type or range.
auto parse_config(const nlohmann::json& j) -> SyncConfig;

/// Read and parse a JSON configuration file.
/// @throws std::runtime_error if the file cannot be read or is not JSON.
/// @throws std::invalid_argument on an invalid value.
auto load_config(const std::filesystem::path& path) -> SyncConfig;

/// The JSON form of `config`, accepted by parse_config().
auto config_to_json(const SyncConfig& config) -> nlohmann::json;

}  // namespace offsync_cpp
