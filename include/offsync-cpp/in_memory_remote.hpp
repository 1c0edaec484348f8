/// @file in_memory_remote.hpp
/// @brief Reference RemoteGateway holding the authoritative state in memory.

#pragma once

#include <offsync-cpp/remote_gateway.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace offsync_cpp {

/// An in-process remote used by tests, examples and benchmarks.
///
/// Behaves like a well-formed server: it assigns a new version to every
/// accepted mutation, rejects mutations based on an outdated version with
/// a conflict carrying its current record, remembers acknowledgements by
/// operation id, and keeps an ordered change feed whose checkpoint token is
/// the decimal feed position. Several replicas may share one instance.
///
/// Faults can be injected to exercise retry and backoff paths.
class InMemoryRemote : public RemoteGateway {
public:
    InMemoryRemote() = default;

    auto push(const Operation& op) -> PushResult override;
    auto pull_since(const SyncCheckpoint& checkpoint, std::size_t max_changes)
        -> PullResult override;

    // -- Direct manipulation (another client writing) -------------------------

    /// Write a record as some other client would; returns the assigned version.
    auto put_remote(Record record) -> std::uint64_t;

    /// Delete a record as some other client would; returns the assigned version,
    /// or nullopt if there is no live record.
    auto erase_remote(const RecordId& id, Timestamp when) -> std::optional<std::uint64_t>;

    /// The remote's current record, tombstones included.
    auto get(const RecordId& id) const -> std::optional<Record>;

    /// All live records, ordered by id.
    auto live_records() const -> std::vector<Record>;

    // -- Fault injection ------------------------------------------------------

    /// Fail the next `count` pushes with `kind`.
    void fail_next_pushes(RemoteErrorKind kind, std::size_t count);

    /// Fail the next `count` pulls with `kind`.
    void fail_next_pulls(RemoteErrorKind kind, std::size_t count);

    /// While unreachable every call fails with a network error.
    void set_reachable(bool reachable);

    /// Sleep this long in every call before answering.
    void set_latency(std::chrono::milliseconds latency);

    // -- Counters -------------------------------------------------------------

    auto push_calls() const -> std::size_t;
    auto pull_calls() const -> std::size_t;

    /// Pushes that changed remote state (replays and rejections excluded).
    auto applied_pushes() const -> std::size_t;

    auto feed_size() const -> std::size_t;

private:
    auto apply_locked(const RecordId& id, OperationKind kind, Record payload) -> std::uint64_t;
    auto injected_fault_locked(bool for_push) -> std::optional<RemoteError>;
    void simulate_latency() const;

    mutable std::mutex mutex_;
    std::map<RecordId, Record> records_;
    std::vector<RemoteChange> feed_;
    std::unordered_map<OperationId, RemoteAck> acks_;

    bool reachable_{true};
    std::chrono::milliseconds latency_{0};
    RemoteErrorKind push_fault_kind_{RemoteErrorKind::network};
    std::size_t push_faults_{0};
    RemoteErrorKind pull_fault_kind_{RemoteErrorKind::network};
    std::size_t pull_faults_{0};

    std::size_t push_calls_{0};
    std::size_t pull_calls_{0};
    std::size_t applied_pushes_{0};
};

}  // namespace offsync_cpp
