/// @file log.hpp
/// @brief Library logging through a named spdlog logger.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace offsync_cpp {

/// Logging settings; see load_config().
struct LogConfig {
    std::string level = "info";  ///< trace, debug, info, warn, error, off.
    std::string file;            ///< Rotating log file; empty = console only.
    std::size_t max_file_size = 5 * 1024 * 1024;
    std::size_t max_files = 3;
};

namespace log {

/// Name under which the library's logger is registered with spdlog.
inline constexpr auto logger_name = "offsync";

/// The library logger. If the host registered a logger named "offsync"
/// beforehand, that one is used; otherwise a colour console logger is
/// created on first use.
auto logger() -> std::shared_ptr<spdlog::logger>;

/// Replace the library logger's sinks and level.
/// @throws std::invalid_argument on an unknown level name.
void configure(const LogConfig& config);

/// Parse a level name ("warn", "debug", ...).
/// @throws std::invalid_argument on an unknown level name.
auto parse_level(const std::string& name) -> spdlog::level::level_enum;

}  // namespace log
}  // namespace offsync_cpp
