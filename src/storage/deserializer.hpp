#pragma once

// Byte stream deserializer for journal chunk bodies.
// Every read returns nullopt on malformed input; callers turn that into
// StorageError{corrupt}.
// Internal header — not installed.

#include <offsync-cpp/operation.hpp>
#include <offsync-cpp/record.hpp>
#include <offsync-cpp/types.hpp>
#include "../encoding/leb128.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace offsync_cpp::storage {

// A decoded operation entry with its queue flags.
struct OperationEntry {
    Operation op;
    bool dead_lettered{false};
    bool dispatched{false};
};

inline constexpr std::uint8_t operation_flag_dead = 0x01;
inline constexpr std::uint8_t operation_flag_dispatched = 0x02;

class Deserializer {
public:
    explicit Deserializer(std::span<const std::byte> data)
        : data_{data}, pos_{0} {}

    auto remaining() const -> std::size_t { return data_.size() - pos_; }
    auto at_end() const -> bool { return pos_ >= data_.size(); }

    auto read_u8() -> std::optional<std::uint8_t> {
        if (pos_ >= data_.size()) return std::nullopt;
        return static_cast<std::uint8_t>(data_[pos_++]);
    }

    auto read_bool() -> std::optional<bool> {
        auto v = read_u8();
        if (!v || *v > 1) return std::nullopt;
        return *v == 1;
    }

    auto read_bytes(std::size_t n) -> std::optional<std::span<const std::byte>> {
        if (n > remaining()) return std::nullopt;
        auto result = data_.subspan(pos_, n);
        pos_ += n;
        return result;
    }

    auto read_uleb128() -> std::optional<std::uint64_t> {
        auto result = encoding::decode_uleb128(data_.subspan(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result->value;
    }

    auto read_sleb128() -> std::optional<std::int64_t> {
        auto result = encoding::decode_sleb128(data_.subspan(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result->value;
    }

    auto read_string() -> std::optional<std::string> {
        auto len = read_uleb128();
        if (!len) return std::nullopt;
        auto bytes = read_bytes(static_cast<std::size_t>(*len));
        if (!bytes) return std::nullopt;
        return std::string{reinterpret_cast<const char*>(bytes->data()), bytes->size()};
    }

    auto read_blob() -> std::optional<std::span<const std::byte>> {
        auto len = read_uleb128();
        if (!len) return std::nullopt;
        return read_bytes(static_cast<std::size_t>(*len));
    }

    auto read_replica_id() -> std::optional<ReplicaId> {
        auto bytes = read_bytes(ReplicaId::size);
        if (!bytes) return std::nullopt;
        auto id = ReplicaId{};
        std::memcpy(id.bytes.data(), bytes->data(), ReplicaId::size);
        return id;
    }

    auto read_operation_id() -> std::optional<OperationId> {
        auto counter = read_uleb128();
        if (!counter) return std::nullopt;
        auto replica = read_replica_id();
        if (!replica) return std::nullopt;
        return OperationId{*counter, *replica};
    }

    auto read_timestamp() -> std::optional<Timestamp> {
        auto v = read_sleb128();
        if (!v) return std::nullopt;
        return Timestamp{*v};
    }

    auto read_fields() -> std::optional<nlohmann::json> {
        auto blob = read_blob();
        if (!blob) return std::nullopt;
        const auto* first = reinterpret_cast<const std::uint8_t*>(blob->data());
        // allow_exceptions = false: a malformed document yields a discarded value
        auto fields = nlohmann::json::from_cbor(first, first + blob->size(),
                                                /*strict=*/true,
                                                /*allow_exceptions=*/false);
        if (fields.is_discarded() || !fields.is_object()) return std::nullopt;
        return fields;
    }

    auto read_record() -> std::optional<Record> {
        auto id = read_string();
        if (!id) return std::nullopt;
        auto version = read_uleb128();
        if (!version) return std::nullopt;
        auto updated_at = read_timestamp();
        if (!updated_at) return std::nullopt;
        auto deleted = read_bool();
        if (!deleted) return std::nullopt;
        auto fields = read_fields();
        if (!fields) return std::nullopt;
        return Record{.id = std::move(*id), .version = *version,
                      .updated_at = *updated_at, .deleted = *deleted,
                      .fields = std::move(*fields)};
    }

    auto read_stored_record() -> std::optional<StoredRecord> {
        auto record = read_record();
        if (!record) return std::nullopt;
        auto state = read_u8();
        if (!state || *state > static_cast<std::uint8_t>(SyncState::conflicted)) {
            return std::nullopt;
        }
        return StoredRecord{std::move(*record), static_cast<SyncState>(*state)};
    }

    auto read_operation() -> std::optional<OperationEntry> {
        auto id = read_operation_id();
        if (!id) return std::nullopt;
        auto record_id = read_string();
        if (!record_id) return std::nullopt;
        auto kind = read_u8();
        if (!kind || *kind > static_cast<std::uint8_t>(OperationKind::erase)) {
            return std::nullopt;
        }
        auto payload = read_record();
        if (!payload) return std::nullopt;
        auto enqueued_at = read_timestamp();
        if (!enqueued_at) return std::nullopt;
        auto attempts = read_uleb128();
        if (!attempts) return std::nullopt;
        auto last_error = read_string();
        if (!last_error) return std::nullopt;
        auto flags = read_u8();
        if (!flags || (*flags & ~(operation_flag_dead | operation_flag_dispatched)) != 0) {
            return std::nullopt;
        }

        auto entry = OperationEntry{};
        entry.op = Operation{
            .id = *id,
            .record_id = std::move(*record_id),
            .kind = static_cast<OperationKind>(*kind),
            .payload = std::move(*payload),
            .enqueued_at = *enqueued_at,
            .attempt_count = static_cast<std::uint32_t>(*attempts),
            .last_error = std::move(*last_error),
        };
        entry.dead_lettered = (*flags & operation_flag_dead) != 0;
        entry.dispatched = (*flags & operation_flag_dispatched) != 0;
        return entry;
    }

private:
    std::span<const std::byte> data_;
    std::size_t pos_;
};

}  // namespace offsync_cpp::storage
