/// @file json.hpp
/// @brief nlohmann/json interoperability for offsync-cpp.
///
/// Provides ADL serialization (to_json/from_json) for records, operations
/// and the values exchanged with a remote, so a RemoteGateway over HTTP or
/// a debugging dump can use them directly, plus export/import of a whole
/// Record Store.

#pragma once

#include <offsync-cpp/error.hpp>
#include <offsync-cpp/operation.hpp>
#include <offsync-cpp/record.hpp>
#include <offsync-cpp/record_store.hpp>
#include <offsync-cpp/sync_orchestrator.hpp>
#include <offsync-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>

namespace offsync_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Identity types -----------------------------------------------------------

/// Milliseconds since the epoch, as a plain number.
void to_json(nlohmann::json& j, const Timestamp& t);
void from_json(const nlohmann::json& j, Timestamp& t);

/// Lower-case hex string.
void to_json(nlohmann::json& j, const ReplicaId& id);
void from_json(const nlohmann::json& j, ReplicaId& id);

/// "counter@replica-hex", the idempotency key form.
void to_json(nlohmann::json& j, const OperationId& id);
void from_json(const nlohmann::json& j, OperationId& id);

// -- Enums (string names) -----------------------------------------------------

void to_json(nlohmann::json& j, SyncState state);
void from_json(const nlohmann::json& j, SyncState& state);

void to_json(nlohmann::json& j, OperationKind kind);
void from_json(const nlohmann::json& j, OperationKind& kind);

void to_json(nlohmann::json& j, ChangeKind kind);
void to_json(nlohmann::json& j, ErrorKind kind);
void to_json(nlohmann::json& j, SyncPhase phase);

// -- Records ------------------------------------------------------------------

/// `{"id", "version", "updated_at", "deleted", "fields"}`. On input only
/// `id` is required.
void to_json(nlohmann::json& j, const Record& r);
void from_json(const nlohmann::json& j, Record& r);

void to_json(nlohmann::json& j, const StoredRecord& r);
void from_json(const nlohmann::json& j, StoredRecord& r);

void to_json(nlohmann::json& j, const RecordChange& c);

// -- Remote exchange ----------------------------------------------------------

void to_json(nlohmann::json& j, const Operation& op);
void from_json(const nlohmann::json& j, Operation& op);

void to_json(nlohmann::json& j, const RemoteAck& ack);
void from_json(const nlohmann::json& j, RemoteAck& ack);

void to_json(nlohmann::json& j, const RemoteChange& c);
void from_json(const nlohmann::json& j, RemoteChange& c);

void to_json(nlohmann::json& j, const SyncCheckpoint& c);
void from_json(const nlohmann::json& j, SyncCheckpoint& c);

// -- Status -------------------------------------------------------------------

void to_json(nlohmann::json& j, const Error& e);
void to_json(nlohmann::json& j, const SyncStatus& s);

// =============================================================================
// Store export / import
// =============================================================================

/// Every stored entry, tombstones included, as an array ordered by id.
auto export_json(const RecordStore& store) -> nlohmann::json;

/// Write the entries of an export_json() array into `store` as one batch.
/// Returns how many were written.
/// @throws std::runtime_error if `j` is not an array of stored records.
/// @throws StorageError if the write fails.
auto import_json(RecordStore& store, const nlohmann::json& j) -> std::size_t;

}  // namespace offsync_cpp
