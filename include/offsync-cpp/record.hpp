/// @file record.hpp
/// @brief Domain records, their sync metadata, and change events.

#pragma once

#include <offsync-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace offsync_cpp {

/// A domain entity as stored locally and remotely.
///
/// `version` is the last revision the remote confirmed for this record
/// (0 for a record the remote has never seen) and never decreases.
/// A deleted record is kept as a tombstone (`deleted == true`) until the
/// delete is confirmed; tombstones are never returned from queries.
struct Record {
    RecordId id;                                        ///< Globally unique id.
    std::uint64_t version{0};                           ///< Remote revision counter.
    Timestamp updated_at{};                             ///< Last modification time.
    bool deleted{false};                                ///< Tombstone marker.
    nlohmann::json fields = nlohmann::json::object();   ///< Entity-specific fields.

    auto operator==(const Record&) const -> bool = default;

    /// Build a tombstone for this record deleted at `when`.
    auto tombstone(Timestamp when) const -> Record {
        return Record{.id = id, .version = version, .updated_at = when,
                      .deleted = true, .fields = fields};
    }
};

/// True if both records carry the same user-visible state (ignores version).
inline auto same_content(const Record& a, const Record& b) -> bool {
    return a.id == b.id && a.updated_at == b.updated_at &&
           a.deleted == b.deleted && a.fields == b.fields;
}

/// Per-record synchronization metadata.
enum class SyncState : std::uint8_t {
    clean,           ///< Matches the remote; nothing queued.
    pending_create,  ///< A Create is queued.
    pending_update,  ///< An Update is queued.
    pending_delete,  ///< A Delete is queued; the record is a tombstone.
    conflicted,      ///< Resolution discarded local changes; needs attention.
};

constexpr auto to_string_view(SyncState state) noexcept -> std::string_view {
    switch (state) {
        case SyncState::clean:          return "clean";
        case SyncState::pending_create: return "pending_create";
        case SyncState::pending_update: return "pending_update";
        case SyncState::pending_delete: return "pending_delete";
        case SyncState::conflicted:     return "conflicted";
    }
    return "unknown";
}

constexpr auto is_pending(SyncState state) noexcept -> bool {
    return state == SyncState::pending_create ||
           state == SyncState::pending_update ||
           state == SyncState::pending_delete;
}

/// A record together with its sync metadata, as held by the Record Store.
struct StoredRecord {
    Record record;
    SyncState state{SyncState::clean};

    auto operator==(const StoredRecord&) const -> bool = default;
};

/// What happened to a record in a change event.
enum class ChangeKind : std::uint8_t {
    created,
    updated,
    deleted,
};

constexpr auto to_string_view(ChangeKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ChangeKind::created: return "created";
        case ChangeKind::updated: return "updated";
        case ChangeKind::deleted: return "deleted";
    }
    return "unknown";
}

/// One change event published by the Record Store.
///
/// Sequence numbers form a single total order per store instance.
struct RecordChange {
    std::uint64_t sequence{0};  ///< Position in the store's global order.
    ChangeKind kind{ChangeKind::updated};
    Record record;              ///< State after the change (last state for deletes).
    SyncState state{SyncState::clean};

    auto operator==(const RecordChange&) const -> bool = default;
};

/// A group of changes committed together and delivered as one notification.
using ChangeBatch = std::vector<RecordChange>;

}  // namespace offsync_cpp
