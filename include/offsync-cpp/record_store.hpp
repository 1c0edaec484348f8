/// @file record_store.hpp
/// @brief Durable local storage of records plus their sync metadata.

#pragma once

#include <offsync-cpp/record.hpp>
#include <offsync-cpp/subscription.hpp>
#include <offsync-cpp/types.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace offsync_cpp {

namespace storage {
class Journal;
}  // namespace storage

/// Selects records for scan() and watch().
using RecordPredicate = std::function<bool(const Record&)>;

/// Receives change batches from watch().
using ChangeCallback = std::function<void(const ChangeBatch&)>;

/// One element of an atomic batch: a put (entry set) or an erase.
///
/// A conditional write only applies if the stored entry still equals
/// `expected` (nullopt = absent) when the batch commits; otherwise it is
/// skipped without error.
struct RecordWrite {
    RecordId id;
    std::optional<StoredRecord> entry;  ///< nullopt = erase.
    bool conditional{false};
    std::optional<StoredRecord> expected;

    static auto put(Record record, SyncState state) -> RecordWrite {
        auto id = record.id;
        return RecordWrite{std::move(id), StoredRecord{std::move(record), state}};
    }
    static auto erase(RecordId id) -> RecordWrite {
        return RecordWrite{std::move(id), std::nullopt};
    }
    static auto put_if(Record record, SyncState state, std::optional<StoredRecord> expected)
        -> RecordWrite {
        auto write = put(std::move(record), state);
        write.conditional = true;
        write.expected = std::move(expected);
        return write;
    }
    static auto erase_if(RecordId id, std::optional<StoredRecord> expected) -> RecordWrite {
        auto write = erase(std::move(id));
        write.conditional = true;
        write.expected = std::move(expected);
        return write;
    }
};

/// A lazy, finite, restartable sequence of records.
///
/// Iterates a point-in-time snapshot taken by RecordStore::scan(); the
/// predicate runs during iteration, and iterating again restarts from the
/// first record.
class RecordRange {
public:
    using EntryPredicate = std::function<bool(const StoredRecord&)>;

    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Record;
        using difference_type = std::ptrdiff_t;
        using pointer = const Record*;
        using reference = const Record&;

        iterator() = default;

        auto operator*() const -> reference { return pos_->record; }
        auto operator->() const -> pointer { return &pos_->record; }

        auto operator++() -> iterator& {
            ++pos_;
            skip();
            return *this;
        }
        auto operator++(int) -> iterator {
            auto copy = *this;
            ++*this;
            return copy;
        }

        auto operator==(const iterator& other) const -> bool { return pos_ == other.pos_; }

    private:
        friend class RecordRange;
        using base = std::vector<StoredRecord>::const_iterator;

        iterator(base pos, base end, const EntryPredicate* pred)
            : pos_{pos}, end_{end}, pred_{pred} { skip(); }

        void skip() {
            while (pos_ != end_ && *pred_ && !(*pred_)(*pos_)) ++pos_;
        }

        base pos_{};
        base end_{};
        const EntryPredicate* pred_{nullptr};
    };

    RecordRange(std::shared_ptr<const std::vector<StoredRecord>> snapshot, EntryPredicate pred)
        : snapshot_{std::move(snapshot)}, pred_{std::move(pred)} {}

    auto begin() const -> iterator { return {snapshot_->begin(), snapshot_->end(), &pred_}; }
    auto end() const -> iterator { return {snapshot_->end(), snapshot_->end(), &pred_}; }

    /// Materialize the matching records.
    auto to_vector() const -> std::vector<Record> { return {begin(), end()}; }

private:
    std::shared_ptr<const std::vector<StoredRecord>> snapshot_;
    EntryPredicate pred_;
};

/// Counters reported by RecordStore::stats().
struct StoreStats {
    std::size_t records{0};         ///< Entries including tombstones.
    std::size_t tombstones{0};
    std::size_t journal_chunks{0};  ///< 0 for a memory-only store.
    std::uint64_t last_sequence{0};
    std::array<std::size_t, 5> by_state{};  ///< Indexed by SyncState.

    auto count(SyncState state) const -> std::size_t {
        return by_state[static_cast<std::size_t>(state)];
    }
};

/// Key/value storage of records keyed by id, each with its SyncState.
///
/// Writes are atomic with respect to their SyncState and are published to
/// watchers in one global order. A store constructed with a directory is
/// durable: every write is appended to `records.journal` before it becomes
/// visible, and the journal is replayed on construction. The
/// default-constructed store keeps everything in memory.
///
/// Thread-safe. Watch callbacks run on the writing thread after the store
/// lock is released; they may write to the store themselves.
///
/// @code
/// auto store = RecordStore{"/var/lib/app/sync"};
/// store.put(Record{.id = "note-1", .fields = {{"title", "A"}}}, SyncState::clean);
/// auto sub = store.watch(nullptr, [](const ChangeBatch& batch) { ... });
/// @endcode
class RecordStore {
public:
    /// Memory-only store.
    RecordStore();

    /// Durable store under `dir`.
    /// @throws StorageError on I/O failure or a corrupt journal.
    explicit RecordStore(const std::filesystem::path& dir);

    ~RecordStore();

    RecordStore(const RecordStore&) = delete;
    auto operator=(const RecordStore&) -> RecordStore& = delete;

    // -- Reading --------------------------------------------------------------

    auto get(std::string_view id) const -> std::optional<Record>;
    auto get_entry(std::string_view id) const -> std::optional<StoredRecord>;
    auto contains(std::string_view id) const -> bool;
    auto size() const -> std::size_t;

    /// Records matching `pred` (nullptr = all), tombstones included.
    auto scan(RecordPredicate pred = nullptr) const -> RecordRange;

    /// Entries (record + state) matching `pred`, materialized.
    auto scan_entries(const std::function<bool(const StoredRecord&)>& pred = nullptr) const
        -> std::vector<StoredRecord>;

    // -- Writing --------------------------------------------------------------

    /// Insert or replace a record with its state. A stored version higher
    /// than `record.version` is kept.
    /// @throws StorageError if the journal append fails; nothing changes then.
    void put(Record record, SyncState state);

    /// Remove a record. Returns false if it was absent.
    auto erase(std::string_view id) -> bool;

    /// Apply several writes atomically, published as one batch.
    /// Returns how many writes took effect (skipped conditional writes and
    /// erases of absent records excluded).
    auto apply_batch(std::span<const RecordWrite> writes) -> std::size_t;

    // -- Change stream --------------------------------------------------------

    /// Register for change batches touching records matching `pred`
    /// (nullptr = all). Batches with no matching change are not delivered.
    auto watch(RecordPredicate pred, ChangeCallback callback) -> Subscription;

    // -- Maintenance ----------------------------------------------------------

    auto stats() const -> StoreStats;

    /// Rewrite the journal as a single snapshot. No-op when memory-only.
    void compact();

    auto is_durable() const -> bool { return journal_ != nullptr; }

private:
    struct Watcher;

    void replay();
    auto apply_locked(std::span<const RecordWrite> writes) -> ChangeBatch;
    void write_snapshot_locked();
    void maybe_compact_locked();
    void enqueue_notification_locked(ChangeBatch batch);
    void deliver_notifications();

    std::unordered_map<RecordId, StoredRecord> entries_;
    std::unique_ptr<storage::Journal> journal_;
    std::uint64_t sequence_{0};
    mutable std::shared_mutex mutex_;

    // Notification delivery, ordered by sequence.
    std::mutex publish_mutex_;
    std::deque<ChangeBatch> outbox_;
    bool publishing_{false};

    std::mutex watchers_mutex_;
    std::map<std::uint64_t, std::shared_ptr<Watcher>> watchers_;
    std::uint64_t next_watcher_id_{1};
};

}  // namespace offsync_cpp
