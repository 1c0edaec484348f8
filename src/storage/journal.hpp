#pragma once

// Append-only journal of checksummed chunks (see chunk.hpp).
//
// Each durable component owns one journal file. Appends go to the end of
// the file and are flushed before returning; compaction rewrites the file
// through a temporary and an atomic rename.
//
// Internal header — not installed.

#include "chunk.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <span>
#include <utility>
#include <vector>

namespace offsync_cpp::storage {

// A chunk waiting to be written: type + encoded body.
using PendingChunk = std::pair<ChunkType, std::vector<std::byte>>;

struct ReplayStats {
    std::size_t chunks{0};          // complete chunks handed to the visitor
    std::size_t discarded_bytes{0}; // torn tail removed from the file
};

class Journal {
public:
    explicit Journal(std::filesystem::path path);
    ~Journal();

    Journal(const Journal&) = delete;
    auto operator=(const Journal&) -> Journal& = delete;

    // Feed every complete chunk to visit() in file order. A truncated final
    // chunk is cut off the file; a bad magic, length or checksum throws
    // StorageError{corrupt}, as does a visitor returning false.
    auto replay(const std::function<bool(ChunkType, std::span<const std::byte>)>& visit)
        -> ReplayStats;

    // Append chunks with a single write. Throws StorageError{io}.
    void append(std::span<const PendingChunk> chunks);
    void append(ChunkType type, std::span<const std::byte> body);

    // Replace the whole file with the given chunks. Throws StorageError{io}.
    void rewrite(std::span<const PendingChunk> chunks);

    auto path() const -> const std::filesystem::path& { return path_; }

    // Chunks currently in the file (after replay, appends and rewrites).
    auto chunk_count() const -> std::size_t { return chunk_count_; }

private:
    void open_for_append();

    std::filesystem::path path_;
    std::ofstream out_;
    std::size_t chunk_count_{0};
    std::uintmax_t file_size_{0};
};

// Encode chunks into one contiguous buffer.
auto encode_chunks(std::span<const PendingChunk> chunks) -> std::vector<std::byte>;

}  // namespace offsync_cpp::storage
