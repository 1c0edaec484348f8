/// @file operation.hpp
/// @brief Queued mutations and the values exchanged with the remote.

#pragma once

#include <offsync-cpp/record.hpp>
#include <offsync-cpp/types.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace offsync_cpp {

/// The three kinds of mutation that travel to the remote.
enum class OperationKind : std::uint8_t {
    create,
    update,
    erase,  ///< Delete. Named `erase` because `delete` is reserved.
};

constexpr auto to_string_view(OperationKind kind) noexcept -> std::string_view {
    switch (kind) {
        case OperationKind::create: return "create";
        case OperationKind::update: return "update";
        case OperationKind::erase:  return "delete";
    }
    return "unknown";
}

/// The Pending* state a record is in while an operation of `kind` is queued.
constexpr auto pending_state_for(OperationKind kind) noexcept -> SyncState {
    switch (kind) {
        case OperationKind::create: return SyncState::pending_create;
        case OperationKind::update: return SyncState::pending_update;
        case OperationKind::erase:  return SyncState::pending_delete;
    }
    return SyncState::pending_update;
}

/// A pending mutation owned by the Operation Log.
///
/// `payload` is the full record snapshot to send (a tombstone for deletes);
/// `payload.version` is the remote revision the mutation is based on.
struct Operation {
    OperationId id;
    RecordId record_id;
    OperationKind kind{OperationKind::update};
    Record payload;
    Timestamp enqueued_at{};
    std::uint32_t attempt_count{0};
    std::string last_error;

    auto operator==(const Operation&) const -> bool = default;
};

/// Strict FIFO order of the Operation Log: enqueued_at, then operation id.
struct OperationOrder {
    auto operator()(const Operation& a, const Operation& b) const -> bool {
        if (a.enqueued_at != b.enqueued_at) return a.enqueued_at < b.enqueued_at;
        return a.id < b.id;
    }
};

/// The remote's confirmation of a push.
struct RemoteAck {
    OperationId operation_id;
    std::uint64_t remote_version{0};  ///< Server-assigned revision.

    auto operator==(const RemoteAck&) const -> bool = default;
};

/// One entry of a pull response. Transient.
struct RemoteChange {
    RecordId record_id;
    OperationKind kind{OperationKind::update};
    Record payload;  ///< Remote state; a tombstone for deletes.
    std::uint64_t remote_version{0};
    Timestamp remote_updated_at{};

    auto operator==(const RemoteChange&) const -> bool = default;
};

/// Opaque cursor marking how much of the remote history has been pulled.
/// An empty token means "from the beginning".
struct SyncCheckpoint {
    std::string token;

    auto empty() const -> bool { return token.empty(); }
    auto operator==(const SyncCheckpoint&) const -> bool = default;
};

}  // namespace offsync_cpp
