/// @file remote_gateway.hpp
/// @brief Abstract boundary to the remote authoritative store.

#pragma once

#include <offsync-cpp/error.hpp>
#include <offsync-cpp/operation.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace offsync_cpp {

/// A failed remote interaction. Returned, never thrown.
///
/// A `conflict` always carries the remote's current record so the caller
/// can resolve without another round trip.
struct RemoteError {
    RemoteErrorKind kind{RemoteErrorKind::network};
    std::string message;
    std::optional<Record> remote;  ///< Set for conflicts.

    auto operator==(const RemoteError&) const -> bool = default;

    /// Engine-level view of this error, as reported in SyncStatus.
    auto to_error() const -> Error { return Error{to_error_kind(kind), message}; }
};

/// Outcome of a push.
using PushResult = std::variant<RemoteAck, RemoteError>;

/// One page of remote changes.
struct PullBatch {
    std::vector<RemoteChange> changes;
    SyncCheckpoint checkpoint;  ///< Cursor after the last change of this page.
    bool has_more{false};       ///< Another page is immediately available.

    auto operator==(const PullBatch&) const -> bool = default;
};

/// Outcome of a pull.
using PullResult = std::variant<PullBatch, RemoteError>;

/// Transport to the remote service.
///
/// Implementations must treat `Operation::id` as an idempotency key: a
/// repeated push of the same id returns the original acknowledgement and
/// leaves the remote state unchanged. `payload.version` is the remote
/// version the mutation was based on; a remote that has moved past it
/// answers with a conflict carrying its current record.
///
/// Calls may block; the orchestrator bounds them with a timeout. They may
/// be invoked from executor threads, so implementations must be
/// thread-safe.
class RemoteGateway {
public:
    virtual ~RemoteGateway() = default;

    virtual auto push(const Operation& op) -> PushResult = 0;

    /// Changes after `checkpoint` (empty = from the beginning), at most
    /// `max_changes` of them.
    virtual auto pull_since(const SyncCheckpoint& checkpoint, std::size_t max_changes)
        -> PullResult = 0;
};

}  // namespace offsync_cpp
