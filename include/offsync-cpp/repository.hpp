/// @file repository.hpp
/// @brief The application-facing entry point of the sync engine.

#pragma once

#include <offsync-cpp/config.hpp>
#include <offsync-cpp/connectivity.hpp>
#include <offsync-cpp/operation_log.hpp>
#include <offsync-cpp/record_store.hpp>
#include <offsync-cpp/remote_gateway.hpp>
#include <offsync-cpp/subscription.hpp>
#include <offsync-cpp/sync_orchestrator.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace offsync_cpp {

/// Source of `updated_at` stamps for local mutations.
using Clock = std::function<Timestamp()>;

/// Reads and writes records locally and keeps them in sync in the background.
///
/// Every mutation writes the Record Store and enqueues to the Operation Log
/// as one unit (both happen or neither is visible) and returns without
/// touching the network. Queries and watches read only the local store.
/// Sync failures never surface as exceptions here; they show up in
/// sync_status(), pending_operation_count() and dead_lettered_operations().
///
/// @code
/// auto connectivity = std::make_shared<ManualConnectivityMonitor>(false);
/// auto repo = Repository{config, remote, connectivity};
/// repo.start();
/// repo.create(Record{.id = "note-1", .fields = {{"title", "A"}}});
/// for (const auto& note : repo.query()) { ... }
/// connectivity->set_connected(true);  // pushes in the background
/// @endcode
class Repository {
public:
    /// Open (or create) the stores under `config.data_dir`, or in memory
    /// when it is empty. Local writes that were stored but never queued
    /// (a crash in between) are queued again.
    /// @throws StorageError if persisted state cannot be read.
    Repository(SyncConfig config, std::shared_ptr<RemoteGateway> remote,
               std::shared_ptr<ConnectivityMonitor> connectivity, Clock clock = Timestamp::now);

    ~Repository();

    Repository(const Repository&) = delete;
    auto operator=(const Repository&) -> Repository& = delete;

    // -- Mutations ------------------------------------------------------------

    /// Insert a new record. Its version and updated_at are assigned here.
    /// @throws std::invalid_argument if a live record with this id exists.
    /// @throws StorageError if the write fails; nothing changes then.
    auto create(Record record) -> Record;

    /// Replace the fields of an existing record.
    /// @throws std::invalid_argument if no live record with this id exists.
    /// @throws StorageError if the write fails; nothing changes then.
    auto update(Record record) -> Record;

    /// Delete a record.
    /// @throws std::invalid_argument if no live record with this id exists.
    /// @throws StorageError if the write fails; nothing changes then.
    void erase(std::string_view id);

    // -- Reads ----------------------------------------------------------------

    /// A live record (tombstones are not returned).
    auto get(std::string_view id) const -> std::optional<Record>;

    /// Live records matching `pred` (nullptr = all), ordered by id.
    auto query(RecordPredicate pred = nullptr) const -> RecordRange;

    /// Change batches for records matching `pred`.
    auto watch(RecordPredicate pred, ChangeCallback callback) -> Subscription;

    /// The sync state of a stored record, tombstones included.
    auto sync_state(std::string_view id) const -> std::optional<SyncState>;

    // -- Sync control ---------------------------------------------------------

    void start();
    void stop();

    /// Ask for a sync cycle now (pull-to-refresh).
    void trigger_sync();

    /// Run one cycle on the calling thread.
    auto sync_now() -> CycleOutcome;

    auto sync_status() const -> SyncStatus;
    auto on_sync_status(StatusCallback callback) -> Subscription;

    auto pending_operation_count() const -> std::size_t;
    auto dead_lettered_operations() const -> std::vector<Operation>;

    /// Give up on a dead-lettered operation. The record it touched is left
    /// `conflicted` so the application can decide what to do with it.
    /// Returns false if `id` is not a dead letter.
    auto discard_dead_letter(const OperationId& id) -> bool;

    /// Queue a dead-lettered operation again and trigger a sync.
    auto retry_dead_letter(const OperationId& id) -> bool;

    /// Records whose local changes were overridden and await review,
    /// tombstones included.
    auto conflicted_records() const -> std::vector<Record>;

    /// Accept a conflicted record as it is now: it becomes clean, or is
    /// removed if it is a tombstone. Returns false if it is not conflicted.
    auto acknowledge_conflict(std::string_view id) -> bool;

    // -- Components -----------------------------------------------------------

    auto store() -> RecordStore& { return *store_; }
    auto operation_log() -> OperationLog& { return *log_; }
    auto orchestrator() -> SyncOrchestrator& { return *orchestrator_; }

private:
    void stamp(Record& record, const std::optional<StoredRecord>& previous) const;
    void write_and_enqueue(Record record, OperationKind kind,
                           const std::optional<StoredRecord>& previous);
    void requeue_unqueued_writes();

    Clock clock_;
    std::shared_ptr<ConnectivityMonitor> connectivity_;
    std::unique_ptr<RecordStore> store_;
    std::unique_ptr<OperationLog> log_;
    std::unique_ptr<SyncOrchestrator> orchestrator_;
};

}  // namespace offsync_cpp
