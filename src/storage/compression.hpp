#pragma once

// DEFLATE compression for journal snapshot chunks.
//
// Snapshots larger than the threshold are compressed using raw DEFLATE
// (no zlib/gzip header); a flag byte in the snapshot body says which.
//
// Internal header — not installed.

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace offsync_cpp::storage {

// Snapshots smaller than this are stored uncompressed.
inline constexpr std::size_t deflate_threshold = 4096;

inline auto deflate_compress(std::span<const std::byte> input)
    -> std::optional<std::vector<std::byte>> {

    if (input.empty()) return std::vector<std::byte>{};

    auto stream = z_stream{};
    // windowBits = -15 for raw deflate (negative = no header)
    auto ret = ::deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                              -15, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) return std::nullopt;

    auto bound = ::deflateBound(&stream, static_cast<uLong>(input.size()));
    auto output = std::vector<std::byte>(bound);

    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(bound);

    ret = ::deflate(&stream, Z_FINISH);
    ::deflateEnd(&stream);
    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(stream.total_out);
    return output;
}

// DEFLATE cannot expand a byte of input into more than this many bytes.
inline constexpr std::size_t deflate_max_ratio = 1032;

// The uncompressed size is stored next to the data, so inflate in one pass.
// An expected_size above max_output_size, or above what the input could
// possibly inflate to, is rejected before anything is allocated.
inline auto deflate_decompress(std::span<const std::byte> input, std::size_t expected_size,
                               std::size_t max_output_size = std::size_t{1} << 30)
    -> std::optional<std::vector<std::byte>> {

    if (input.empty()) {
        if (expected_size != 0) return std::nullopt;
        return std::vector<std::byte>{};
    }
    if (expected_size > max_output_size) return std::nullopt;
    if (expected_size / deflate_max_ratio > input.size()) return std::nullopt;

    auto output = std::vector<std::byte>(std::max<std::size_t>(expected_size, 1));

    auto stream = z_stream{};
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output.size());

    auto ret = ::inflateInit2(&stream, -15);
    if (ret != Z_OK) return std::nullopt;
    ret = ::inflate(&stream, Z_FINISH);
    ::inflateEnd(&stream);

    if (ret != Z_STREAM_END || stream.total_out != expected_size) return std::nullopt;
    output.resize(stream.total_out);
    return output;
}

}  // namespace offsync_cpp::storage
