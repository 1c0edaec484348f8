/// @file types.hpp
/// @brief Core identity types: ReplicaId, OperationId, Timestamp, RecordId.

#pragma once

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace offsync_cpp {

/// Globally unique record identifier, chosen by the application.
using RecordId = std::string;

/// A 16-byte identifier for one local installation of the engine.
///
/// Every operation id embeds the replica that created it, so ids minted
/// on different devices never collide. Lexicographic ordering on raw bytes.
struct ReplicaId {
    static constexpr std::size_t size = 16;  ///< Fixed size in bytes.
    std::array<std::byte, size> bytes{};     ///< Raw identifier bytes.

    constexpr ReplicaId() = default;

    /// Construct from a byte array.
    explicit constexpr ReplicaId(std::array<std::byte, size> b) : bytes{b} {}

    /// Construct from a raw uint8_t array (convenience for tests).
    explicit ReplicaId(const std::uint8_t (&raw)[size]) {
        std::ranges::transform(raw, bytes.begin(),
            [](std::uint8_t b) { return std::byte{b}; });
    }

    auto operator<=>(const ReplicaId&) const = default;
    auto operator==(const ReplicaId&) const -> bool = default;

    /// Check if all bytes are zero.
    auto is_zero() const -> bool {
        return std::ranges::all_of(bytes, [](std::byte b) {
            return b == std::byte{0};
        });
    }

    /// Generate a fresh random replica id.
    static auto random() -> ReplicaId;

    /// Lower-case hex rendering (32 characters).
    auto to_hex() const -> std::string;

    /// Parse the hex rendering produced by to_hex().
    static auto from_hex(std::string_view hex) -> std::optional<ReplicaId>;
};

/// Identifies a single queued mutation: (counter, replica).
///
/// Operation ids are unique across replicas and totally ordered; the counter
/// increases monotonically per replica. The rendered form doubles as the
/// idempotency key the remote uses to recognise a replayed push.
struct OperationId {
    std::uint64_t counter{0};  ///< Monotonically increasing counter per replica.
    ReplicaId replica{};       ///< The replica that enqueued the operation.

    constexpr OperationId() = default;

    /// Construct with a counter and replica.
    constexpr OperationId(std::uint64_t c, ReplicaId r) : counter{c}, replica{r} {}

    auto operator<=>(const OperationId&) const = default;
    auto operator==(const OperationId&) const -> bool = default;

    /// Render as "<counter>@<replica-hex>".
    auto to_string() const -> std::string;

    /// Parse the form produced by to_string().
    static auto parse(std::string_view text) -> std::optional<OperationId>;
};

/// A millisecond-precision timestamp (wall clock or logical).
struct Timestamp {
    std::int64_t millis_since_epoch{0};  ///< Milliseconds since Unix epoch.

    auto operator<=>(const Timestamp&) const = default;
    auto operator==(const Timestamp&) const -> bool = default;

    /// The current system time.
    static auto now() -> Timestamp;
};

}  // namespace offsync_cpp

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<offsync_cpp::ReplicaId> {
    auto operator()(const offsync_cpp::ReplicaId& id) const noexcept -> std::size_t {
        // FNV-1a over the 16 bytes
        auto h = std::size_t{14695981039346656037ULL};
        for (auto b : id.bytes) {
            h ^= static_cast<std::size_t>(b);
            h *= std::size_t{1099511628211ULL};
        }
        return h;
    }
};

template <>
struct std::hash<offsync_cpp::OperationId> {
    auto operator()(const offsync_cpp::OperationId& id) const noexcept -> std::size_t {
        auto h1 = std::hash<std::uint64_t>{}(id.counter);
        auto h2 = std::hash<offsync_cpp::ReplicaId>{}(id.replica);
        return h1 ^ (h2 << 1);
    }
};

/// @endcond
