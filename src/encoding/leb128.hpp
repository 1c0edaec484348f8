#pragma once

// LEB128 (Little Endian Base 128) variable-length integers.
// Used by the journal format for lengths, counters and timestamps.
// Internal header — not installed.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace offsync_cpp::encoding {

// Decoded value + number of bytes consumed.
template <typename T>
struct Decoded {
    T value;
    std::size_t bytes_read;
};

inline void encode_uleb128(std::uint64_t value, std::vector<std::byte>& output) {
    do {
        auto byte = static_cast<std::byte>(value & 0x7F);
        value >>= 7;
        if (value != 0) byte |= std::byte{0x80};
        output.push_back(byte);
    } while (value != 0);
}

inline void encode_sleb128(std::int64_t value, std::vector<std::byte>& output) {
    while (true) {
        auto byte = static_cast<std::byte>(value & 0x7F);
        value >>= 7;  // arithmetic shift preserves sign
        const bool sign_bit = (byte & std::byte{0x40}) != std::byte{0};
        if ((value == 0 && !sign_bit) || (value == -1 && sign_bit)) {
            output.push_back(byte);
            return;
        }
        output.push_back(byte | std::byte{0x80});
    }
}

// Returns nullopt on truncated input or on a value wider than 64 bits.
inline auto decode_uleb128(std::span<const std::byte> input)
    -> std::optional<Decoded<std::uint64_t>> {
    auto value = std::uint64_t{0};
    for (std::size_t i = 0, shift = 0; i < input.size(); ++i, shift += 7) {
        if (shift >= 64) return std::nullopt;
        // The tenth byte carries bit 63 only.
        if (shift == 63 && static_cast<std::uint8_t>(input[i]) > 1) return std::nullopt;
        value |= (static_cast<std::uint64_t>(input[i]) & 0x7F) << shift;
        if ((input[i] & std::byte{0x80}) == std::byte{0}) {
            return Decoded<std::uint64_t>{value, i + 1};
        }
    }
    return std::nullopt;
}

inline auto decode_sleb128(std::span<const std::byte> input)
    -> std::optional<Decoded<std::int64_t>> {
    auto value = std::int64_t{0};
    for (std::size_t i = 0, shift = 0; i < input.size(); ++i) {
        if (shift >= 64) return std::nullopt;
        // The tenth byte holds bit 63 and its sign extension.
        if (shift == 63 && input[i] != std::byte{0x00} && input[i] != std::byte{0x7F}) {
            return std::nullopt;
        }
        value |= (static_cast<std::int64_t>(input[i]) & 0x7F) << shift;
        shift += 7;
        if ((input[i] & std::byte{0x80}) == std::byte{0}) {
            if (shift < 64 && (input[i] & std::byte{0x40}) != std::byte{0}) {
                value |= -(std::int64_t{1} << shift);
            }
            return Decoded<std::int64_t>{value, i + 1};
        }
    }
    return std::nullopt;
}

}  // namespace offsync_cpp::encoding
