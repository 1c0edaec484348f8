#include <offsync-cpp/log.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace offsync_cpp::log {

namespace {

std::mutex g_logger_mutex;

auto make_console_sink() -> spdlog::sink_ptr {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v");
    return sink;
}

}  // namespace

auto logger() -> std::shared_ptr<spdlog::logger> {
    if (auto existing = spdlog::get(logger_name)) return existing;

    auto lock = std::scoped_lock{g_logger_mutex};
    if (auto existing = spdlog::get(logger_name)) return existing;

    auto created = std::make_shared<spdlog::logger>(logger_name, make_console_sink());
    created->set_level(spdlog::level::info);
    spdlog::register_logger(created);
    return created;
}

auto parse_level(const std::string& name) -> spdlog::level::level_enum {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info")  return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")   return spdlog::level::off;
    throw std::invalid_argument{"unknown log level: " + name};
}

void configure(const LogConfig& config) {
    const auto level = parse_level(config.level);

    auto sinks = std::vector<spdlog::sink_ptr>{make_console_sink()};
    if (!config.file.empty()) {
        const auto path = std::filesystem::path{config.file};
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file, config.max_file_size, config.max_files);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [%t] %v");
        sinks.push_back(std::move(file_sink));
    }

    auto lock = std::scoped_lock{g_logger_mutex};
    auto replacement = std::make_shared<spdlog::logger>(logger_name, sinks.begin(), sinks.end());
    replacement->set_level(level);
    spdlog::drop(logger_name);
    spdlog::register_logger(replacement);
}

}  // namespace offsync_cpp::log
