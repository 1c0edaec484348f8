#include <offsync-cpp/log.hpp>

#include "temp_dir.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace offsync_cpp;

TEST(Log, parse_level_names) {
    EXPECT_EQ(offsync_cpp::log::parse_level("trace"), spdlog::level::trace);
    EXPECT_EQ(offsync_cpp::log::parse_level("debug"), spdlog::level::debug);
    EXPECT_EQ(offsync_cpp::log::parse_level("warn"), spdlog::level::warn);
    EXPECT_EQ(offsync_cpp::log::parse_level("warning"), spdlog::level::warn);
    EXPECT_EQ(offsync_cpp::log::parse_level("error"), spdlog::level::err);
    EXPECT_EQ(offsync_cpp::log::parse_level("off"), spdlog::level::off);
    EXPECT_THROW(offsync_cpp::log::parse_level("verbose"), std::invalid_argument);
}

TEST(Log, logger_is_registered_under_its_name) {
    auto logger = offsync_cpp::log::logger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), offsync_cpp::log::logger_name);
    EXPECT_EQ(spdlog::get(offsync_cpp::log::logger_name), logger);
}

TEST(Log, configure_adds_a_rotating_file) {
    auto dir = test_support::TempDir{};
    const auto file = dir.path() / "logs" / "offsync.log";

    offsync_cpp::log::configure(LogConfig{.level = "debug", .file = file.string()});
    auto logger = offsync_cpp::log::logger();
    EXPECT_EQ(logger->level(), spdlog::level::debug);
    logger->info("written to the file sink");
    logger->flush();
    EXPECT_TRUE(std::filesystem::exists(file));

    // Back to console only so later tests do not write into the removed directory.
    offsync_cpp::log::configure(LogConfig{});
    EXPECT_EQ(offsync_cpp::log::logger()->level(), spdlog::level::info);
}

TEST(Log, configure_rejects_unknown_level) {
    EXPECT_THROW(offsync_cpp::log::configure(LogConfig{.level = "chatty"}), std::invalid_argument);
}
