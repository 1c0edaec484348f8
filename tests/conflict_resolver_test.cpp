#include <offsync-cpp/conflict_resolver.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace offsync_cpp;

namespace {

auto record(std::uint64_t version, std::int64_t at, nlohmann::json fields) -> Record {
    return Record{.id = "x", .version = version, .updated_at = Timestamp{at},
                  .fields = std::move(fields)};
}

}  // namespace

// -- LastWriteWins ------------------------------------------------------------

TEST(LastWriteWins, later_remote_wins_entirely) {
    const auto local = record(1, 100, {{"title", "local"}});
    const auto remote = record(2, 200, {{"title", "remote"}});
    const auto resolved = LastWriteWins{}.resolve(local, remote);
    EXPECT_EQ(resolved, remote);
}

TEST(LastWriteWins, later_local_wins_with_max_version) {
    const auto local = record(1, 300, {{"title", "local"}});
    const auto remote = record(2, 200, {{"title", "remote"}});
    const auto resolved = LastWriteWins{}.resolve(local, remote);
    EXPECT_EQ(resolved.fields["title"], "local");
    EXPECT_EQ(resolved.version, 2u);
    EXPECT_EQ(resolved.updated_at, Timestamp{300});
}

TEST(LastWriteWins, tie_goes_to_remote) {
    const auto local = record(1, 200, {{"title", "local"}});
    const auto remote = record(1, 200, {{"title", "remote"}});
    EXPECT_EQ(LastWriteWins{}.resolve(local, remote).fields["title"], "remote");
}

TEST(LastWriteWins, later_delete_beats_update) {
    const auto local = record(3, 500, {{"title", "local"}}).tombstone(Timestamp{500});
    const auto remote = record(4, 400, {{"title", "remote"}});
    const auto resolved = LastWriteWins{}.resolve(local, remote);
    EXPECT_TRUE(resolved.deleted);
    EXPECT_EQ(resolved.version, 4u);
}

TEST(LastWriteWins, later_update_beats_delete) {
    const auto local = record(3, 300, {{"title", "local"}}).tombstone(Timestamp{300});
    const auto remote = record(4, 400, {{"title", "remote"}});
    EXPECT_FALSE(LastWriteWins{}.resolve(local, remote).deleted);
}

TEST(LastWriteWins, is_deterministic) {
    const auto local = record(1, 250, {{"a", 1}});
    const auto remote = record(2, 250, {{"b", 2}});
    const auto resolver = LastWriteWins{};
    EXPECT_EQ(resolver.resolve(local, remote), resolver.resolve(local, remote));
}

// -- FieldMerge ---------------------------------------------------------------

TEST(FieldMerge, unions_configured_array_fields) {
    const auto local = record(1, 100, {{"title", "local"}, {"tagIds", {"a", "b"}}});
    const auto remote = record(2, 200, {{"title", "remote"}, {"tagIds", {"c", "a"}}});
    const auto resolved = FieldMerge{{"tagIds"}}.resolve(local, remote);

    EXPECT_EQ(resolved.fields["title"], "remote");
    EXPECT_EQ(resolved.fields["tagIds"], (nlohmann::json{"a", "b", "c"}));
    EXPECT_EQ(resolved.version, 2u);
}

TEST(FieldMerge, same_result_from_either_side) {
    const auto a = record(2, 100, {{"tagIds", {"x", "y"}}});
    const auto b = record(2, 200, {{"tagIds", {"z"}}});
    const auto merge = FieldMerge{{"tagIds"}};
    EXPECT_EQ(merge.resolve(a, b).fields["tagIds"], merge.resolve(b, a).fields["tagIds"]);
}

TEST(FieldMerge, unconfigured_fields_follow_last_write) {
    const auto local = record(1, 300, {{"tagIds", {"a"}}, {"other", {"l"}}});
    const auto remote = record(1, 200, {{"tagIds", {"b"}}, {"other", {"r"}}});
    const auto resolved = FieldMerge{{"tagIds"}}.resolve(local, remote);
    EXPECT_EQ(resolved.fields["other"], (nlohmann::json{"l"}));
    EXPECT_EQ(resolved.fields["tagIds"], (nlohmann::json{"a", "b"}));
}

TEST(FieldMerge, non_array_values_are_not_merged) {
    const auto local = record(1, 100, {{"tagIds", "a"}});
    const auto remote = record(1, 200, {{"tagIds", {"b"}}});
    EXPECT_EQ(FieldMerge{{"tagIds"}}.resolve(local, remote).fields["tagIds"],
              (nlohmann::json{"b"}));
}

TEST(FieldMerge, tombstone_falls_back_to_last_write_wins) {
    const auto local = record(1, 100, {{"tagIds", {"a"}}});
    const auto remote = record(2, 200, {{"tagIds", {"b"}}}).tombstone(Timestamp{200});
    const auto resolved = FieldMerge{{"tagIds"}}.resolve(local, remote);
    EXPECT_TRUE(resolved.deleted);
    EXPECT_EQ(resolved.fields["tagIds"], (nlohmann::json{"b"}));
}

// -- Factory ------------------------------------------------------------------

TEST(ConflictStrategy, parse_names) {
    EXPECT_EQ(parse_conflict_strategy("last_write_wins"), ConflictStrategy::last_write_wins);
    EXPECT_EQ(parse_conflict_strategy("field_merge"), ConflictStrategy::field_merge);
    EXPECT_FALSE(parse_conflict_strategy("newest").has_value());
    EXPECT_EQ(to_string_view(ConflictStrategy::field_merge), "field_merge");
}

TEST(ConflictStrategy, make_resolver_builds_the_configured_type) {
    auto lww = make_resolver(ConflictStrategy::last_write_wins);
    EXPECT_NE(dynamic_cast<LastWriteWins*>(lww.get()), nullptr);

    auto merge = make_resolver(ConflictStrategy::field_merge, {"tagIds"});
    auto* field_merge = dynamic_cast<FieldMerge*>(merge.get());
    ASSERT_NE(field_merge, nullptr);
    EXPECT_EQ(field_merge->union_fields(), (std::vector<std::string>{"tagIds"}));
}
