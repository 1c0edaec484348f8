/// @file operation_log.hpp
/// @brief Durable FIFO queue of local mutations awaiting the remote.

#pragma once

#include <offsync-cpp/error.hpp>
#include <offsync-cpp/operation.hpp>
#include <offsync-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace offsync_cpp {

namespace storage {
class Journal;
}  // namespace storage

/// What enqueue() did with a mutation.
enum class EnqueueOutcome : std::uint8_t {
    appended,   ///< A new entry was added to the tail.
    coalesced,  ///< Merged into an older entry for the same record.
    cancelled,  ///< Create followed by Delete: both are gone.
};

constexpr auto to_string_view(EnqueueOutcome outcome) noexcept -> std::string_view {
    switch (outcome) {
        case EnqueueOutcome::appended:  return "appended";
        case EnqueueOutcome::coalesced: return "coalesced";
        case EnqueueOutcome::cancelled: return "cancelled";
    }
    return "unknown";
}

/// Result of OperationLog::enqueue().
struct EnqueueResult {
    EnqueueOutcome outcome{EnqueueOutcome::appended};
    std::optional<Operation> operation;  ///< The resulting entry; nullopt if cancelled.
};

/// Result of OperationLog::fail().
enum class FailOutcome : std::uint8_t {
    retained,       ///< Still queued; retried on a later drain.
    dead_lettered,  ///< Exceeded the ceiling; moved to the dead-letter view.
    not_found,      ///< No such entry (already acked or discarded).
};

constexpr auto to_string_view(FailOutcome outcome) noexcept -> std::string_view {
    switch (outcome) {
        case FailOutcome::retained:      return "retained";
        case FailOutcome::dead_lettered: return "dead_lettered";
        case FailOutcome::not_found:     return "not_found";
    }
    return "unknown";
}

/// Ordered, durable queue of pending mutations.
///
/// Entries are kept in FIFO order (enqueued_at, then operation id). A
/// mutation enqueued while an older entry for the same record is still
/// waiting is coalesced into it, so each record has at most one entry the
/// remote has not yet seen. Once an entry has been dispatched to the remote
/// its idempotency key may already be recorded there, so it is never
/// rewritten: later mutations are appended behind it instead.
///
/// A log constructed with a directory persists to `operations.journal`,
/// including the replica id and operation counter. Thread-safe.
///
/// @code
/// auto log = OperationLog{dir, 5};
/// log.enqueue("note-1", OperationKind::update, record);
/// for (const auto& op : log.peek_batch(32)) { ... }
/// @endcode
class OperationLog {
public:
    static constexpr std::uint32_t default_max_attempts = 5;

    /// Memory-only log with a fresh random replica id.
    explicit OperationLog(std::uint32_t max_attempts = default_max_attempts);

    /// Durable log under `dir`.
    /// @throws StorageError on I/O failure or a corrupt journal.
    OperationLog(const std::filesystem::path& dir, std::uint32_t max_attempts);

    ~OperationLog();

    OperationLog(const OperationLog&) = delete;
    auto operator=(const OperationLog&) -> OperationLog& = delete;

    /// The replica that mints this log's operation ids.
    auto replica_id() const -> const ReplicaId& { return replica_; }

    auto max_attempts() const -> std::uint32_t { return max_attempts_; }

    // -- Producing ------------------------------------------------------------

    /// Queue a mutation, coalescing with an undispatched entry for the
    /// same record when there is one.
    /// @throws StorageError if the journal append fails; nothing changes then.
    auto enqueue(RecordId record_id, OperationKind kind, Record payload) -> EnqueueResult;

    /// The kind the record's newest entry would have after enqueue() of
    /// `kind`; nullopt if the two would cancel out.
    auto preview(std::string_view record_id, OperationKind kind) const
        -> std::optional<OperationKind>;

    // -- Draining -------------------------------------------------------------

    /// Up to `max_n` entries in FIFO order, at most one per record. Dead
    /// letters, and entries queued behind a dead letter of the same
    /// record, are not returned.
    auto peek_batch(std::size_t max_n) const -> std::vector<Operation>;

    /// Mark an entry as handed to the remote and return its current state.
    /// Returns nullopt if the entry no longer exists.
    auto dispatch(const OperationId& id) -> std::optional<Operation>;

    /// Remove a confirmed entry. Returns false if it was absent.
    auto ack(const OperationId& id) -> bool;

    /// Record a failed attempt.
    auto fail(const OperationId& id, RemoteErrorKind kind, std::string_view message)
        -> FailOutcome;

    /// Stamp `remote_version` as the base version of every queued entry for
    /// `record_id` that is based on an older version.
    void rebase(std::string_view record_id, std::uint64_t remote_version);

    /// Remove every live (not dead-lettered) entry for `record_id`.
    /// Returns how many were removed.
    auto supersede(std::string_view record_id) -> std::size_t;

    // -- Inspection -----------------------------------------------------------

    auto get(const OperationId& id) const -> std::optional<Operation>;

    /// The newest entry for `record_id`, dead letters included.
    auto latest_for(std::string_view record_id) const -> std::optional<Operation>;

    /// True if any entry for `record_id` exists, dead letters included.
    auto has_pending(std::string_view record_id) const -> bool;

    /// Entries awaiting the remote, dead letters excluded.
    auto pending_count() const -> std::size_t;

    /// Entries that exceeded the retry ceiling, in FIFO order.
    auto dead_lettered() const -> std::vector<Operation>;

    // -- Dead-letter handling -------------------------------------------------

    /// Drop a dead-lettered entry. Returns it, or nullopt if `id` is not a
    /// dead letter.
    auto discard(const OperationId& id) -> std::optional<Operation>;

    /// Put a dead-lettered entry back in the queue with its attempt count
    /// reset. Returns false if `id` is not a dead letter.
    auto resubmit(const OperationId& id) -> bool;

    /// Rewrite the journal with only the live entries. No-op when memory-only.
    void compact();

private:
    struct Entry {
        Operation op;
        bool dead_lettered{false};
        bool dispatched{false};
    };

    void replay();
    auto coalesce_target_locked(std::string_view record_id) -> std::vector<Entry>::iterator;
    auto coalesce_target_locked(std::string_view record_id) const
        -> std::vector<Entry>::const_iterator;
    auto find_locked(const OperationId& id) -> std::vector<Entry>::iterator;
    auto find_locked(const OperationId& id) const -> std::vector<Entry>::const_iterator;
    auto next_id_locked() -> OperationId;
    auto next_timestamp_locked() -> Timestamp;
    void persist_upsert_locked(const Entry& entry);
    void persist_remove_locked(const OperationId& id);
    void write_snapshot_locked();
    void maybe_compact_locked();

    std::uint32_t max_attempts_;
    ReplicaId replica_;
    std::uint64_t next_counter_{1};
    Timestamp last_enqueued_at_{};
    std::vector<Entry> queue_;  // FIFO order
    std::unique_ptr<storage::Journal> journal_;
    mutable std::mutex mutex_;
};

}  // namespace offsync_cpp
