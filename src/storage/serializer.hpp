#pragma once

// Byte stream serializer for journal chunk bodies.
// Internal header — not installed.

#include <offsync-cpp/operation.hpp>
#include <offsync-cpp/record.hpp>
#include <offsync-cpp/types.hpp>
#include "../encoding/leb128.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace offsync_cpp::storage {

class Serializer {
public:
    void write_u8(std::uint8_t v) {
        data_.push_back(static_cast<std::byte>(v));
    }

    void write_bool(bool v) { write_u8(v ? 1 : 0); }

    void write_bytes(std::span<const std::byte> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    void write_uleb128(std::uint64_t value) {
        encoding::encode_uleb128(value, data_);
    }

    void write_sleb128(std::int64_t value) {
        encoding::encode_sleb128(value, data_);
    }

    void write_string(std::string_view s) {
        write_uleb128(s.size());
        for (auto c : s) {
            data_.push_back(static_cast<std::byte>(c));
        }
    }

    // Length-prefixed byte blob.
    void write_blob(std::span<const std::byte> bytes) {
        write_uleb128(bytes.size());
        write_bytes(bytes);
    }

    void write_replica_id(const ReplicaId& id) {
        write_bytes(id.bytes);
    }

    void write_operation_id(const OperationId& id) {
        write_uleb128(id.counter);
        write_replica_id(id.replica);
    }

    void write_timestamp(Timestamp ts) {
        write_sleb128(ts.millis_since_epoch);
    }

    // Fields are stored as CBOR so any JSON value survives unchanged.
    void write_fields(const nlohmann::json& fields) {
        auto cbor = nlohmann::json::to_cbor(fields);
        write_uleb128(cbor.size());
        for (auto b : cbor) {
            data_.push_back(static_cast<std::byte>(b));
        }
    }

    void write_record(const Record& r) {
        write_string(r.id);
        write_uleb128(r.version);
        write_timestamp(r.updated_at);
        write_bool(r.deleted);
        write_fields(r.fields);
    }

    void write_stored_record(const StoredRecord& entry) {
        write_record(entry.record);
        write_u8(static_cast<std::uint8_t>(entry.state));
    }

    // flags: bit 0 = dead-lettered, bit 1 = dispatched to the remote.
    void write_operation(const Operation& op, std::uint8_t flags) {
        write_operation_id(op.id);
        write_string(op.record_id);
        write_u8(static_cast<std::uint8_t>(op.kind));
        write_record(op.payload);
        write_timestamp(op.enqueued_at);
        write_uleb128(op.attempt_count);
        write_string(op.last_error);
        write_u8(flags);
    }

    auto data() const -> const std::vector<std::byte>& { return data_; }
    auto take() -> std::vector<std::byte> { return std::move(data_); }

private:
    std::vector<std::byte> data_;
};

}  // namespace offsync_cpp::storage
