#include <offsync-cpp/types.hpp>
#include <offsync-cpp/operation.hpp>

#include <gtest/gtest.h>

#include <set>
#include <unordered_set>

using namespace offsync_cpp;

namespace {

auto make_replica(std::uint8_t fill) -> ReplicaId {
    auto id = ReplicaId{};
    id.bytes.fill(std::byte{fill});
    return id;
}

}  // namespace

// -- ReplicaId ----------------------------------------------------------------

TEST(ReplicaId, default_is_zero) {
    EXPECT_TRUE(ReplicaId{}.is_zero());
}

TEST(ReplicaId, random_is_never_zero_and_differs) {
    auto seen = std::set<ReplicaId>{};
    for (int i = 0; i < 32; ++i) {
        auto id = ReplicaId::random();
        EXPECT_FALSE(id.is_zero());
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 32u);
}

TEST(ReplicaId, hex_round_trip) {
    const std::uint8_t raw[16] = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07,
                                  0x08, 0x09, 0x0a, 0x0b, 0x0c, 0x0d, 0xfe, 0xff};
    const auto id = ReplicaId{raw};
    EXPECT_EQ(id.to_hex(), "000102030405060708090a0b0c0dfeff");
    EXPECT_EQ(ReplicaId::from_hex(id.to_hex()), id);
}

TEST(ReplicaId, from_hex_accepts_upper_case) {
    auto id = ReplicaId::from_hex("FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, make_replica(0xFF));
}

TEST(ReplicaId, from_hex_rejects_bad_input) {
    EXPECT_FALSE(ReplicaId::from_hex("").has_value());
    EXPECT_FALSE(ReplicaId::from_hex("abc").has_value());
    EXPECT_FALSE(ReplicaId::from_hex("zz0102030405060708090a0b0c0d0e0f").has_value());
}

TEST(ReplicaId, ordering_is_lexicographic) {
    EXPECT_LT(make_replica(0x01), make_replica(0x02));
}

// -- OperationId --------------------------------------------------------------

TEST(OperationId, to_string_and_parse) {
    const auto id = OperationId{42, make_replica(0xAB)};
    EXPECT_EQ(id.to_string(), "42@abababababababababababababababab");
    EXPECT_EQ(OperationId::parse(id.to_string()), id);
}

TEST(OperationId, parse_rejects_malformed) {
    EXPECT_FALSE(OperationId::parse("").has_value());
    EXPECT_FALSE(OperationId::parse("42").has_value());
    EXPECT_FALSE(OperationId::parse("@abababababababababababababababab").has_value());
    EXPECT_FALSE(OperationId::parse("4x@abababababababababababababababab").has_value());
    EXPECT_FALSE(OperationId::parse("42@abab").has_value());
    EXPECT_FALSE(OperationId::parse("-1@abababababababababababababababab").has_value());
}

TEST(OperationId, ordered_by_counter_then_replica) {
    EXPECT_LT((OperationId{1, make_replica(0xFF)}), (OperationId{2, make_replica(0x00)}));
    EXPECT_LT((OperationId{1, make_replica(0x01)}), (OperationId{1, make_replica(0x02)}));
}

TEST(OperationId, hashable) {
    auto ids = std::unordered_set<OperationId>{};
    ids.insert(OperationId{1, make_replica(1)});
    ids.insert(OperationId{1, make_replica(1)});
    ids.insert(OperationId{2, make_replica(1)});
    EXPECT_EQ(ids.size(), 2u);
}

// -- Timestamp ----------------------------------------------------------------

TEST(Timestamp, now_is_after_2020) {
    EXPECT_GT(Timestamp::now().millis_since_epoch, 1'577'836'800'000);
}

TEST(Timestamp, ordering) {
    EXPECT_LT(Timestamp{100}, Timestamp{200});
    EXPECT_EQ(Timestamp{7}, Timestamp{7});
}

// -- Operation ordering -------------------------------------------------------

TEST(OperationOrder, enqueued_at_then_id) {
    auto a = Operation{.id = OperationId{2, make_replica(1)}, .enqueued_at = Timestamp{10}};
    auto b = Operation{.id = OperationId{1, make_replica(1)}, .enqueued_at = Timestamp{20}};
    auto c = Operation{.id = OperationId{3, make_replica(1)}, .enqueued_at = Timestamp{10}};
    EXPECT_TRUE(OperationOrder{}(a, b));
    EXPECT_TRUE(OperationOrder{}(a, c));
    EXPECT_FALSE(OperationOrder{}(b, a));
}

TEST(OperationKind, names_and_pending_states) {
    EXPECT_EQ(to_string_view(OperationKind::create), "create");
    EXPECT_EQ(to_string_view(OperationKind::erase), "delete");
    EXPECT_EQ(pending_state_for(OperationKind::create), SyncState::pending_create);
    EXPECT_EQ(pending_state_for(OperationKind::update), SyncState::pending_update);
    EXPECT_EQ(pending_state_for(OperationKind::erase), SyncState::pending_delete);
}
