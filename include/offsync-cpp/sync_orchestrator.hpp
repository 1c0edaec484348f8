/// @file sync_orchestrator.hpp
/// @brief The state machine that moves changes between the local stores
///        and the remote.

#pragma once

#include <offsync-cpp/backoff.hpp>
#include <offsync-cpp/config.hpp>
#include <offsync-cpp/conflict_resolver.hpp>
#include <offsync-cpp/connectivity.hpp>
#include <offsync-cpp/error.hpp>
#include <offsync-cpp/operation_log.hpp>
#include <offsync-cpp/record_store.hpp>
#include <offsync-cpp/remote_gateway.hpp>
#include <offsync-cpp/subscription.hpp>

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string_view>
#include <thread>

namespace offsync_cpp {

namespace storage {
class Journal;
}  // namespace storage

/// Phases of the orchestrator's state machine.
enum class SyncPhase : std::uint8_t {
    idle,
    draining,       ///< Pushing queued operations.
    pulling,        ///< Fetching remote changes.
    reconciling,    ///< Applying a pulled page to the Record Store.
    error_backoff,  ///< Waiting before retrying after a failure.
    stopped,
};

constexpr auto to_string_view(SyncPhase phase) noexcept -> std::string_view {
    switch (phase) {
        case SyncPhase::idle:          return "idle";
        case SyncPhase::draining:      return "draining";
        case SyncPhase::pulling:       return "pulling";
        case SyncPhase::reconciling:   return "reconciling";
        case SyncPhase::error_backoff: return "error_backoff";
        case SyncPhase::stopped:       return "stopped";
    }
    return "unknown";
}

/// Snapshot of one orchestrator's progress, owned by that orchestrator.
struct SyncStatus {
    SyncPhase phase{SyncPhase::idle};
    std::uint32_t consecutive_failures{0};
    std::optional<Error> last_error;          ///< Cleared by a successful cycle.
    std::optional<Timestamp> last_synced_at;  ///< End of the last successful cycle.
    std::chrono::milliseconds backoff_delay{0};  ///< Current delay while in error_backoff.
    std::size_t pending_operations{0};
    std::size_t dead_letters{0};
    SyncCheckpoint checkpoint;
    bool fatal{false};  ///< Stopped because local state is corrupt.

    auto operator==(const SyncStatus&) const -> bool = default;
};

/// How a call to run_cycle() ended.
enum class CycleOutcome : std::uint8_t {
    synced,   ///< Queue drained and remote changes applied.
    offline,  ///< Not connected; nothing attempted or the cycle was cut short.
    backoff,  ///< A transient failure; the next attempt waits for the backoff delay.
    stopped,  ///< Stop was requested mid-cycle.
    fatal,    ///< Corrupt local state; the orchestrator is stopped for good.
};

constexpr auto to_string_view(CycleOutcome outcome) noexcept -> std::string_view {
    switch (outcome) {
        case CycleOutcome::synced:  return "synced";
        case CycleOutcome::offline: return "offline";
        case CycleOutcome::backoff: return "backoff";
        case CycleOutcome::stopped: return "stopped";
        case CycleOutcome::fatal:   return "fatal";
    }
    return "unknown";
}

using StatusCallback = std::function<void(const SyncStatus&)>;

/// Drains the Operation Log to the remote, pulls remote changes, resolves
/// conflicts and writes the results back to the Record Store.
///
/// One cycle runs Idle -> Draining -> (Pulling -> Reconciling)* -> Idle.
/// A transient failure moves to ErrorBackoff, after which the worker
/// retries from Draining; an Offline event returns to Idle and cancels the
/// backoff. Cycles never overlap.
///
/// Cycles run on a background worker started with start(), triggered by
/// Online events, the poll interval and trigger(); tests can drive cycles
/// synchronously with run_cycle() instead.
///
/// The checkpoint is persisted to `checkpoint.bin` under the configured
/// data directory (memory-only when it is empty) and only advances after
/// a pulled page has been applied.
class SyncOrchestrator {
public:
    /// The store, log and monitor must outlive the orchestrator. A null
    /// `resolver` selects the one configured in `config.conflict`.
    /// @throws StorageError if the checkpoint file cannot be read.
    SyncOrchestrator(RecordStore& store, OperationLog& log,
                     std::shared_ptr<RemoteGateway> remote,
                     ConnectivityMonitor& connectivity, SyncConfig config,
                     std::unique_ptr<ConflictResolver> resolver = nullptr);

    ~SyncOrchestrator();

    SyncOrchestrator(const SyncOrchestrator&) = delete;
    auto operator=(const SyncOrchestrator&) -> SyncOrchestrator& = delete;

    // -- Lifecycle ------------------------------------------------------------

    /// Start the background worker. No-op if already running or fatal.
    void start();

    /// Stop the worker, waiting at most the remote timeout for an in-flight
    /// call. An unconfirmed push stays queued.
    void stop();

    auto running() const -> bool;

    // -- Driving --------------------------------------------------------------

    /// Request a cycle from the worker.
    void trigger();

    /// Run one cycle on the calling thread.
    auto run_cycle() -> CycleOutcome;

    /// Forget the checkpoint so the next pull starts from the beginning,
    /// and trigger a cycle.
    void request_full_resync();

    // -- Observation ----------------------------------------------------------

    auto status() const -> SyncStatus;

    /// Called on every status change, on the thread that made it.
    auto on_status(StatusCallback callback) -> Subscription;

    auto checkpoint() const -> SyncCheckpoint;

    auto config() const -> const SyncConfig& { return config_; }

    // -- Coordination ---------------------------------------------------------

    /// Lock serializing local mutations and sync decisions for one record.
    /// Re-entrant, so watch callbacks may write to the repository.
    auto record_lock(std::string_view record_id) -> std::unique_lock<std::recursive_mutex>;

private:
    enum class Step : std::uint8_t { next, offline, backoff, stopped };

    void worker_loop(std::stop_token st);
    auto wait_for_backoff(std::stop_token st, std::chrono::milliseconds delay) -> bool;

    auto drain(std::stop_token st, std::size_t& pushed) -> Step;
    auto push_one(const Operation& queued) -> Step;
    void handle_ack(const Operation& op, const RemoteAck& ack);
    void handle_conflict(const Operation& op, const Record& remote);
    auto handle_push_failure(const Operation& op, const RemoteError& error) -> Step;

    auto pull(std::stop_token st, std::size_t& applied) -> Step;
    auto reconcile(const PullBatch& batch) -> std::size_t;

    void load_checkpoint();
    void save_checkpoint(const SyncCheckpoint& checkpoint);

    void set_phase(SyncPhase phase);
    void record_failure(Error error);
    void record_success();
    void publish_status();
    void on_connectivity(ConnectivityEvent event);

    auto cycle(std::stop_token st) -> CycleOutcome;

    RecordStore& store_;
    OperationLog& log_;
    std::shared_ptr<RemoteGateway> remote_;
    ConnectivityMonitor& connectivity_;
    SyncConfig config_;
    std::unique_ptr<ConflictResolver> resolver_;
    BackoffPolicy backoff_;

    std::unique_ptr<storage::Journal> checkpoint_file_;

    static constexpr std::size_t lock_stripes = 64;
    std::array<std::recursive_mutex, lock_stripes> record_locks_;

    // Serializes cycles between the worker and run_cycle().
    std::mutex cycle_mutex_;

    mutable std::mutex state_mutex_;
    SyncStatus status_;
    bool trigger_pending_{false};
    bool backoff_cancelled_{false};
    bool resync_requested_{false};
    std::condition_variable_any wake_;

    std::mutex listeners_mutex_;
    std::map<std::uint64_t, StatusCallback> listeners_;
    std::uint64_t next_listener_id_{1};

    Subscription connectivity_subscription_;
    std::jthread worker_;
};

}  // namespace offsync_cpp
