#include <offsync-cpp/config.hpp>

#include "temp_dir.hpp"

#include <gtest/gtest.h>

#include <fstream>

using namespace offsync_cpp;
using namespace std::chrono_literals;

// -- Defaults -----------------------------------------------------------------

TEST(Config, empty_object_gives_defaults) {
    const auto config = parse_config(nlohmann::json::object());
    EXPECT_TRUE(config.data_dir.empty());
    EXPECT_EQ(config.push_batch_size, 32u);
    EXPECT_EQ(config.pull_page_size, 100u);
    EXPECT_EQ(config.max_attempts, 5u);
    EXPECT_EQ(config.poll_interval, 30'000ms);
    EXPECT_EQ(config.remote_timeout, 10'000ms);
    EXPECT_EQ(config.backoff.base, 500ms);
    EXPECT_EQ(config.conflict.strategy, ConflictStrategy::last_write_wins);
    EXPECT_FALSE(config.conflict.flag_for_review);
    EXPECT_EQ(config.log.level, "info");
}

// -- Parsing ------------------------------------------------------------------

TEST(Config, reads_every_section) {
    const auto j = nlohmann::json::parse(R"({
        "data_dir": "/tmp/notes",
        "push_batch_size": 8,
        "pull_page_size": 50,
        "max_attempts": 3,
        "poll_interval_ms": 0,
        "remote_timeout_ms": 2500,
        "backoff": {"base_ms": 100, "max_ms": 2000, "jitter_ms": 0},
        "conflict": {"strategy": "field_merge", "union_fields": ["tagIds"], "flag_for_review": true},
        "log": {"level": "debug", "file": "/tmp/notes/sync.log", "max_files": 2},
        "unknown_key": 1
    })");
    const auto config = parse_config(j);
    EXPECT_EQ(config.data_dir, std::filesystem::path{"/tmp/notes"});
    EXPECT_EQ(config.push_batch_size, 8u);
    EXPECT_EQ(config.pull_page_size, 50u);
    EXPECT_EQ(config.max_attempts, 3u);
    EXPECT_EQ(config.poll_interval, 0ms);
    EXPECT_EQ(config.remote_timeout, 2500ms);
    EXPECT_EQ(config.backoff.base, 100ms);
    EXPECT_EQ(config.backoff.max, 2000ms);
    EXPECT_EQ(config.backoff.jitter, 0ms);
    EXPECT_EQ(config.conflict.strategy, ConflictStrategy::field_merge);
    EXPECT_EQ(config.conflict.union_fields, (std::vector<std::string>{"tagIds"}));
    EXPECT_TRUE(config.conflict.flag_for_review);
    EXPECT_EQ(config.log.level, "debug");
    EXPECT_EQ(config.log.file, "/tmp/notes/sync.log");
    EXPECT_EQ(config.log.max_files, 2u);
}

TEST(Config, rejects_wrong_types) {
    EXPECT_THROW(parse_config(nlohmann::json::array()), std::invalid_argument);
    EXPECT_THROW(parse_config({{"push_batch_size", "32"}}), std::invalid_argument);
    EXPECT_THROW(parse_config({{"max_attempts", -1}}), std::invalid_argument);
    EXPECT_THROW(parse_config({{"backoff", 5}}), std::invalid_argument);
    EXPECT_THROW(parse_config({{"conflict", {{"union_fields", "tagIds"}}}}), std::invalid_argument);
    EXPECT_THROW(parse_config({{"conflict", {{"flag_for_review", 1}}}}), std::invalid_argument);
}

TEST(Config, rejects_out_of_range_values) {
    EXPECT_THROW(parse_config({{"push_batch_size", 0}}), std::invalid_argument);
    EXPECT_THROW(parse_config({{"pull_page_size", 0}}), std::invalid_argument);
    EXPECT_THROW(parse_config({{"remote_timeout_ms", 0}}), std::invalid_argument);
}

TEST(Config, rejects_unknown_strategy_and_level) {
    EXPECT_THROW(parse_config({{"conflict", {{"strategy", "newest_wins"}}}}),
                 std::invalid_argument);
    EXPECT_THROW(parse_config({{"log", {{"level", "loud"}}}}), std::invalid_argument);
}

TEST(Config, json_form_parses_back) {
    auto config = SyncConfig{};
    config.data_dir = "/var/lib/app";
    config.push_batch_size = 4;
    config.backoff.jitter = 0ms;
    config.conflict.strategy = ConflictStrategy::field_merge;
    config.conflict.union_fields = {"tagIds", "labels"};
    config.log.level = "warn";

    const auto parsed = parse_config(config_to_json(config));
    EXPECT_EQ(parsed.data_dir, config.data_dir);
    EXPECT_EQ(parsed.push_batch_size, 4u);
    EXPECT_EQ(parsed.backoff.jitter, 0ms);
    EXPECT_EQ(parsed.conflict.strategy, ConflictStrategy::field_merge);
    EXPECT_EQ(parsed.conflict.union_fields, config.conflict.union_fields);
    EXPECT_EQ(parsed.log.level, "warn");
    EXPECT_EQ(config_to_json(parsed), config_to_json(config));
}

// -- Files --------------------------------------------------------------------

TEST(Config, load_config_reads_a_file) {
    auto dir = test_support::TempDir{};
    const auto path = dir.path() / "sync.json";
    {
        auto out = std::ofstream{path};
        out << R"({"max_attempts": 9, "conflict": {"strategy": "field_merge"}})";
    }
    const auto config = load_config(path);
    EXPECT_EQ(config.max_attempts, 9u);
    EXPECT_EQ(config.conflict.strategy, ConflictStrategy::field_merge);
}

TEST(Config, load_config_reports_missing_and_malformed_files) {
    auto dir = test_support::TempDir{};
    EXPECT_THROW(load_config(dir.path() / "absent.json"), std::runtime_error);

    const auto path = dir.path() / "broken.json";
    {
        auto out = std::ofstream{path};
        out << "{ not json";
    }
    EXPECT_THROW(load_config(path), std::runtime_error);
}
