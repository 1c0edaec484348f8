#include <offsync-cpp/record_store.hpp>
#include <offsync-cpp/error.hpp>

#include "temp_dir.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace offsync_cpp;

namespace {

auto note(std::string id, std::string title, std::uint64_t version = 0) -> Record {
    return Record{.id = std::move(id), .version = version, .updated_at = Timestamp{100},
                  .fields = {{"title", std::move(title)}}};
}

auto ids_of(const RecordRange& range) -> std::vector<std::string> {
    auto ids = std::vector<std::string>{};
    for (const auto& r : range) ids.push_back(r.id);
    return ids;
}

}  // namespace

// -- Basic reads and writes ---------------------------------------------------

TEST(RecordStore, put_then_get) {
    auto store = RecordStore{};
    store.put(note("note-1", "A"), SyncState::pending_create);

    auto record = store.get("note-1");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->fields["title"], "A");

    auto entry = store.get_entry("note-1");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->state, SyncState::pending_create);
    EXPECT_TRUE(store.contains("note-1"));
    EXPECT_EQ(store.size(), 1u);
}

TEST(RecordStore, missing_record_is_nullopt) {
    auto store = RecordStore{};
    EXPECT_FALSE(store.get("nope").has_value());
    EXPECT_FALSE(store.get_entry("nope").has_value());
    EXPECT_FALSE(store.contains("nope"));
}

TEST(RecordStore, erase_reports_presence) {
    auto store = RecordStore{};
    store.put(note("a", "A"), SyncState::clean);
    EXPECT_TRUE(store.erase("a"));
    EXPECT_FALSE(store.erase("a"));
    EXPECT_EQ(store.size(), 0u);
}

TEST(RecordStore, version_never_decreases) {
    auto store = RecordStore{};
    store.put(note("a", "A", 5), SyncState::clean);
    store.put(note("a", "B", 3), SyncState::pending_update);

    auto entry = store.get_entry("a");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->record.version, 5u);
    EXPECT_EQ(entry->record.fields["title"], "B");
    EXPECT_EQ(entry->state, SyncState::pending_update);
}

// -- Scan ---------------------------------------------------------------------

TEST(RecordStore, scan_is_ordered_by_id) {
    auto store = RecordStore{};
    store.put(note("c", "C"), SyncState::clean);
    store.put(note("a", "A"), SyncState::clean);
    store.put(note("b", "B"), SyncState::clean);
    EXPECT_EQ(ids_of(store.scan()), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(RecordStore, scan_applies_predicate) {
    auto store = RecordStore{};
    store.put(note("a", "keep"), SyncState::clean);
    store.put(note("b", "drop"), SyncState::clean);
    auto range = store.scan([](const Record& r) { return r.fields["title"] == "keep"; });
    EXPECT_EQ(ids_of(range), (std::vector<std::string>{"a"}));
}

TEST(RecordStore, scan_is_a_restartable_snapshot) {
    auto store = RecordStore{};
    store.put(note("a", "A"), SyncState::clean);
    auto range = store.scan();
    store.put(note("b", "B"), SyncState::clean);

    EXPECT_EQ(ids_of(range), (std::vector<std::string>{"a"}));
    EXPECT_EQ(ids_of(range), (std::vector<std::string>{"a"}));
    EXPECT_EQ(range.to_vector().size(), 1u);
}

TEST(RecordStore, scan_includes_tombstones) {
    auto store = RecordStore{};
    store.put(note("a", "A").tombstone(Timestamp{200}), SyncState::pending_delete);
    EXPECT_EQ(ids_of(store.scan()).size(), 1u);
}

TEST(RecordStore, scan_entries_filters_on_state) {
    auto store = RecordStore{};
    store.put(note("a", "A"), SyncState::clean);
    store.put(note("b", "B"), SyncState::conflicted);
    auto conflicted = store.scan_entries(
        [](const StoredRecord& e) { return e.state == SyncState::conflicted; });
    ASSERT_EQ(conflicted.size(), 1u);
    EXPECT_EQ(conflicted[0].record.id, "b");
}

// -- Batches and conditional writes ------------------------------------------

TEST(RecordStore, apply_batch_counts_effective_writes) {
    auto store = RecordStore{};
    store.put(note("a", "A"), SyncState::clean);
    const auto writes = std::vector<RecordWrite>{
        RecordWrite::put(note("b", "B"), SyncState::clean),
        RecordWrite::erase("a"),
        RecordWrite::erase("missing"),
    };
    EXPECT_EQ(store.apply_batch(writes), 2u);
    EXPECT_FALSE(store.contains("a"));
    EXPECT_TRUE(store.contains("b"));
}

TEST(RecordStore, conditional_write_skipped_when_entry_changed) {
    auto store = RecordStore{};
    store.put(note("a", "A"), SyncState::clean);
    const auto seen = store.get_entry("a");

    store.put(note("a", "local edit"), SyncState::pending_update);

    const auto writes = std::vector<RecordWrite>{
        RecordWrite::put_if(note("a", "remote", 2), SyncState::clean, seen)};
    EXPECT_EQ(store.apply_batch(writes), 0u);
    EXPECT_EQ(store.get("a")->fields["title"], "local edit");
}

TEST(RecordStore, conditional_write_applies_when_unchanged) {
    auto store = RecordStore{};
    store.put(note("a", "A"), SyncState::clean);
    const auto seen = store.get_entry("a");
    const auto writes = std::vector<RecordWrite>{
        RecordWrite::put_if(note("a", "remote", 2), SyncState::clean, seen)};
    EXPECT_EQ(store.apply_batch(writes), 1u);
    EXPECT_EQ(store.get("a")->version, 2u);
}

TEST(RecordStore, conditional_insert_requires_absence) {
    auto store = RecordStore{};
    auto writes = std::vector<RecordWrite>{
        RecordWrite::put_if(note("a", "first"), SyncState::clean, std::nullopt),
        RecordWrite::put_if(note("a", "second"), SyncState::clean, std::nullopt),
    };
    EXPECT_EQ(store.apply_batch(writes), 1u);
    EXPECT_EQ(store.get("a")->fields["title"], "first");
}

TEST(RecordStore, conditional_erase) {
    auto store = RecordStore{};
    store.put(note("a", "A"), SyncState::clean);
    const auto stale = StoredRecord{note("a", "old"), SyncState::clean};
    const auto fresh = store.get_entry("a");

    EXPECT_EQ(store.apply_batch(std::vector{RecordWrite::erase_if("a", stale)}), 0u);
    EXPECT_EQ(store.apply_batch(std::vector{RecordWrite::erase_if("a", fresh)}), 1u);
    EXPECT_FALSE(store.contains("a"));
}

// -- Watch --------------------------------------------------------------------

TEST(RecordStore, watch_receives_kinds_in_sequence_order) {
    auto store = RecordStore{};
    auto events = std::vector<RecordChange>{};
    auto sub = store.watch(nullptr, [&](const ChangeBatch& batch) {
        events.insert(events.end(), batch.begin(), batch.end());
    });

    store.put(note("a", "A"), SyncState::pending_create);
    store.put(note("a", "B"), SyncState::pending_update);
    store.put(note("a", "B").tombstone(Timestamp{300}), SyncState::pending_delete);
    store.erase("a");

    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].kind, ChangeKind::created);
    EXPECT_EQ(events[1].kind, ChangeKind::updated);
    EXPECT_EQ(events[2].kind, ChangeKind::deleted);
    EXPECT_EQ(events[3].kind, ChangeKind::deleted);
    for (std::size_t i = 1; i < events.size(); ++i) {
        EXPECT_GT(events[i].sequence, events[i - 1].sequence);
    }
}

TEST(RecordStore, batch_is_delivered_once) {
    auto store = RecordStore{};
    auto deliveries = 0;
    auto sizes = std::vector<std::size_t>{};
    auto sub = store.watch(nullptr, [&](const ChangeBatch& batch) {
        ++deliveries;
        sizes.push_back(batch.size());
    });
    store.apply_batch(std::vector{RecordWrite::put(note("a", "A"), SyncState::clean),
                                  RecordWrite::put(note("b", "B"), SyncState::clean)});
    EXPECT_EQ(deliveries, 1);
    EXPECT_EQ(sizes, (std::vector<std::size_t>{2}));
}

TEST(RecordStore, watch_predicate_filters_changes) {
    auto store = RecordStore{};
    auto seen = std::vector<std::string>{};
    auto sub = store.watch([](const Record& r) { return r.id.starts_with("note-"); },
                           [&](const ChangeBatch& batch) {
                               for (const auto& c : batch) seen.push_back(c.record.id);
                           });
    store.put(note("note-1", "A"), SyncState::clean);
    store.put(note("todo-1", "B"), SyncState::clean);
    EXPECT_EQ(seen, (std::vector<std::string>{"note-1"}));
}

TEST(RecordStore, cancelled_subscription_stops_delivery) {
    auto store = RecordStore{};
    auto count = 0;
    auto sub = store.watch(nullptr, [&](const ChangeBatch&) { ++count; });
    store.put(note("a", "A"), SyncState::clean);
    sub.reset();
    store.put(note("b", "B"), SyncState::clean);
    EXPECT_EQ(count, 1);
    EXPECT_FALSE(sub.active());
}

TEST(RecordStore, callback_may_write_to_the_store) {
    auto store = RecordStore{};
    auto order = std::vector<std::string>{};
    auto sub = store.watch(nullptr, [&](const ChangeBatch& batch) {
        for (const auto& c : batch) {
            order.push_back(c.record.id);
            if (c.record.id == "a") store.put(note("derived", "D"), SyncState::clean);
        }
    });
    store.put(note("a", "A"), SyncState::clean);
    EXPECT_EQ(order, (std::vector<std::string>{"a", "derived"}));
    EXPECT_TRUE(store.contains("derived"));
}

TEST(RecordStore, throwing_watcher_does_not_block_others) {
    auto store = RecordStore{};
    auto count = 0;
    auto bad = store.watch(nullptr, [](const ChangeBatch&) { throw std::runtime_error{"boom"}; });
    auto good = store.watch(nullptr, [&](const ChangeBatch&) { ++count; });
    EXPECT_NO_THROW(store.put(note("a", "A"), SyncState::clean));
    EXPECT_EQ(count, 1);
}

// -- Stats --------------------------------------------------------------------

TEST(RecordStore, stats_count_states_and_tombstones) {
    auto store = RecordStore{};
    store.put(note("a", "A"), SyncState::clean);
    store.put(note("b", "B"), SyncState::pending_update);
    store.put(note("c", "C").tombstone(Timestamp{1}), SyncState::pending_delete);
    auto stats = store.stats();
    EXPECT_EQ(stats.records, 3u);
    EXPECT_EQ(stats.tombstones, 1u);
    EXPECT_EQ(stats.count(SyncState::clean), 1u);
    EXPECT_EQ(stats.count(SyncState::pending_update), 1u);
    EXPECT_EQ(stats.count(SyncState::pending_delete), 1u);
    EXPECT_EQ(stats.last_sequence, 3u);
    EXPECT_EQ(stats.journal_chunks, 0u);
}

// -- Durability ---------------------------------------------------------------

TEST(RecordStoreDurable, survives_reopen) {
    auto dir = test_support::TempDir{};
    {
        auto store = RecordStore{dir.path()};
        EXPECT_TRUE(store.is_durable());
        store.put(note("a", "A", 3), SyncState::clean);
        store.put(note("b", "B"), SyncState::pending_create);
        store.put(note("c", "C"), SyncState::clean);
        store.erase("c");
        store.apply_batch(std::vector{RecordWrite::put(note("d", "D"), SyncState::conflicted),
                                      RecordWrite::erase("b")});
    }
    auto store = RecordStore{dir.path()};
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.get_entry("a"), (StoredRecord{note("a", "A", 3), SyncState::clean}));
    EXPECT_EQ(store.get_entry("d")->state, SyncState::conflicted);
    EXPECT_FALSE(store.contains("b"));
    EXPECT_FALSE(store.contains("c"));
}

TEST(RecordStoreDurable, fields_of_every_json_type_survive) {
    auto dir = test_support::TempDir{};
    auto record = Record{.id = "x", .version = 1, .updated_at = Timestamp{-5}};
    record.fields = {{"s", "text"}, {"i", -42}, {"u", 18446744073709551615ULL},
                     {"d", 2.5}, {"b", true}, {"n", nullptr},
                     {"arr", {1, "two", false}}, {"obj", {{"k", "v"}}}};
    {
        auto store = RecordStore{dir.path()};
        store.put(record, SyncState::clean);
    }
    auto store = RecordStore{dir.path()};
    EXPECT_EQ(store.get("x"), record);
}

TEST(RecordStoreDurable, compact_keeps_contents) {
    auto dir = test_support::TempDir{};
    {
        auto store = RecordStore{dir.path()};
        for (int i = 0; i < 200; ++i) {
            store.put(note("r" + std::to_string(i % 20), "v" + std::to_string(i)),
                      SyncState::clean);
        }
        store.compact();
        EXPECT_EQ(store.stats().journal_chunks, 1u);
    }
    auto store = RecordStore{dir.path()};
    EXPECT_EQ(store.size(), 20u);
    EXPECT_EQ(store.get("r0")->fields["title"], "v180");
}

TEST(RecordStoreDurable, large_snapshot_is_compressed_and_restored) {
    auto dir = test_support::TempDir{};
    {
        auto store = RecordStore{dir.path()};
        for (int i = 0; i < 500; ++i) {
            store.put(note("note-" + std::to_string(i), std::string(40, 'x')), SyncState::clean);
        }
        store.compact();
    }
    EXPECT_LT(std::filesystem::file_size(dir.path() / "records.journal"), 500u * 40u);
    auto store = RecordStore{dir.path()};
    EXPECT_EQ(store.size(), 500u);
}

TEST(RecordStoreDurable, torn_tail_loses_only_the_last_write) {
    auto dir = test_support::TempDir{};
    const auto path = dir.path() / "records.journal";
    {
        auto store = RecordStore{dir.path()};
        store.put(note("a", "A"), SyncState::clean);
        store.put(note("b", "B"), SyncState::clean);
    }
    std::filesystem::resize_file(path, std::filesystem::file_size(path) - 3);

    auto store = RecordStore{dir.path()};
    EXPECT_TRUE(store.contains("a"));
    EXPECT_FALSE(store.contains("b"));
}

TEST(RecordStoreDurable, corrupt_journal_throws_corrupt) {
    auto dir = test_support::TempDir{};
    {
        auto out = std::ofstream{dir.path() / "records.journal", std::ios::binary};
        out << "garbage that is long enough to parse";
    }
    try {
        auto store = RecordStore{dir.path()};
        FAIL() << "expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.kind(), StorageErrorKind::corrupt);
    }
}
