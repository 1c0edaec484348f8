#pragma once

// Chunk envelope for journal files.
//
// Every journal entry is one chunk:
//   magic (4 bytes: 0x4F 0x46 0x53 0x4A, "OFSJ")
//   checksum (4 bytes: CRC-32 of body, little endian)
//   chunk_type (1 byte)
//   body_length (ULEB128)
//   body (body_length bytes)
//
// Internal header — not installed.

#include "../encoding/leb128.hpp"

#include <zlib.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <vector>

namespace offsync_cpp::storage {

inline constexpr std::array<std::byte, 4> chunk_magic = {
    std::byte{0x4F}, std::byte{0x46}, std::byte{0x53}, std::byte{0x4A}
};

// Chunk types across all journals. Values are part of the on-disk format.
enum class ChunkType : std::uint8_t {
    record_put        = 0x01,
    record_erase      = 0x02,
    record_snapshot   = 0x03,  // DEFLATE-compressed when flagged in the body
    record_batch      = 0x04,  // several puts/erases applied together
    operation_upsert  = 0x10,
    operation_remove  = 0x11,
    operation_header  = 0x12,  // replica id + next counter
    checkpoint        = 0x20,
};

// No writer produces a body this large, so a longer length is corruption
// rather than a torn write.
inline constexpr std::uint64_t max_chunk_body_size = std::uint64_t{1} << 30;

struct ChunkHeader {
    ChunkType type;
    std::uint32_t checksum;
    std::size_t body_offset;  // offset of the body from the start of the chunk
    std::size_t body_length;

    auto total_size() const -> std::size_t { return body_offset + body_length; }
};

inline auto compute_chunk_checksum(std::span<const std::byte> body) -> std::uint32_t {
    auto crc = ::crc32_z(0L, Z_NULL, 0);
    crc = ::crc32_z(crc, reinterpret_cast<const Bytef*>(body.data()),
                    static_cast<z_size_t>(body.size()));
    return static_cast<std::uint32_t>(crc);
}

// How parsing the chunk at the front of a buffer went.
enum class ParseStatus : std::uint8_t {
    ok,
    truncated,  // buffer ends inside the chunk (torn write)
    bad_magic,
    bad_length,  // declared body length exceeds max_chunk_body_size
};

struct ParsedHeader {
    ParseStatus status;
    std::optional<ChunkHeader> header;
};

// Parse the chunk header at the beginning of data. Does not verify the
// checksum; see validate_chunk_checksum().
inline auto parse_chunk_header(std::span<const std::byte> data) -> ParsedHeader {
    if (data.size() < chunk_magic.size()) {
        return {ParseStatus::truncated, std::nullopt};
    }
    if (std::memcmp(data.data(), chunk_magic.data(), chunk_magic.size()) != 0) {
        return {ParseStatus::bad_magic, std::nullopt};
    }

    auto pos = chunk_magic.size();
    if (pos + 5 > data.size()) return {ParseStatus::truncated, std::nullopt};

    auto checksum = std::uint32_t{0};
    for (std::size_t i = 0; i < 4; ++i) {
        checksum |= static_cast<std::uint32_t>(data[pos + i]) << (8 * i);
    }
    pos += 4;

    auto type = static_cast<ChunkType>(data[pos]);
    ++pos;

    auto len = encoding::decode_uleb128(data.subspan(pos));
    if (!len) return {ParseStatus::truncated, std::nullopt};
    pos += len->bytes_read;
    if (len->value > max_chunk_body_size) return {ParseStatus::bad_length, std::nullopt};

    auto header = ChunkHeader{
        .type = type,
        .checksum = checksum,
        .body_offset = pos,
        .body_length = static_cast<std::size_t>(len->value),
    };
    if (header.body_length > data.size() - pos) return {ParseStatus::truncated, header};
    return {ParseStatus::ok, header};
}

inline auto validate_chunk_checksum(const ChunkHeader& header,
                                    std::span<const std::byte> data) -> bool {
    if (header.body_offset > data.size()
        || header.body_length > data.size() - header.body_offset) {
        return false;
    }
    return compute_chunk_checksum(data.subspan(header.body_offset, header.body_length))
           == header.checksum;
}

// Append a complete chunk to output.
inline void write_chunk(ChunkType type, std::span<const std::byte> body,
                        std::vector<std::byte>& output) {
    output.insert(output.end(), chunk_magic.begin(), chunk_magic.end());

    const auto checksum = compute_chunk_checksum(body);
    for (std::size_t i = 0; i < 4; ++i) {
        output.push_back(static_cast<std::byte>((checksum >> (8 * i)) & 0xFF));
    }

    output.push_back(static_cast<std::byte>(type));
    encoding::encode_uleb128(body.size(), output);
    output.insert(output.end(), body.begin(), body.end());
}

}  // namespace offsync_cpp::storage
