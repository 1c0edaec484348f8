#include "journal.hpp"

#include <offsync-cpp/error.hpp>
#include <offsync-cpp/log.hpp>

#include <fstream>
#include <iterator>
#include <system_error>

namespace offsync_cpp::storage {

namespace {

auto read_file(const std::filesystem::path& path) -> std::vector<std::byte> {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) {
        throw StorageError{StorageErrorKind::io, "cannot open " + path.string()};
    }
    auto chars = std::vector<char>{std::istreambuf_iterator<char>{in},
                                   std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        throw StorageError{StorageErrorKind::io, "read failed on " + path.string()};
    }
    auto bytes = std::vector<std::byte>(chars.size());
    for (std::size_t i = 0; i < chars.size(); ++i) {
        bytes[i] = static_cast<std::byte>(chars[i]);
    }
    return bytes;
}

void write_all(std::ofstream& out, std::span<const std::byte> data,
               const std::filesystem::path& path) {
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
        throw StorageError{StorageErrorKind::io, "write failed on " + path.string()};
    }
}

}  // namespace

auto encode_chunks(std::span<const PendingChunk> chunks) -> std::vector<std::byte> {
    auto buffer = std::vector<std::byte>{};
    for (const auto& [type, body] : chunks) {
        if (body.size() > max_chunk_body_size) {
            throw StorageError{StorageErrorKind::io,
                               "chunk body of " + std::to_string(body.size()) + " bytes is too large"};
        }
        write_chunk(type, body, buffer);
    }
    return buffer;
}

Journal::Journal(std::filesystem::path path)
    : path_{std::move(path)} {
    auto ec = std::error_code{};
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw StorageError{StorageErrorKind::io,
                               "cannot create " + path_.parent_path().string() + ": " + ec.message()};
        }
    }
}

Journal::~Journal() = default;

auto Journal::replay(const std::function<bool(ChunkType, std::span<const std::byte>)>& visit)
    -> ReplayStats {
    auto stats = ReplayStats{};
    out_.close();

    if (!std::filesystem::exists(path_)) {
        chunk_count_ = 0;
        file_size_ = 0;
        open_for_append();
        return stats;
    }

    const auto data = read_file(path_);
    auto view = std::span<const std::byte>{data};
    auto pos = std::size_t{0};

    while (pos < view.size()) {
        const auto rest = view.subspan(pos);
        const auto parsed = parse_chunk_header(rest);
        if (parsed.status == ParseStatus::truncated) {
            stats.discarded_bytes = rest.size();
            break;
        }
        if (parsed.status == ParseStatus::bad_magic) {
            throw StorageError{StorageErrorKind::corrupt,
                               path_.string() + ": bad chunk magic at offset " + std::to_string(pos)};
        }
        if (parsed.status == ParseStatus::bad_length) {
            throw StorageError{StorageErrorKind::corrupt,
                               path_.string() + ": impossible chunk length at offset " + std::to_string(pos)};
        }
        const auto& header = *parsed.header;
        if (!validate_chunk_checksum(header, rest)) {
            throw StorageError{StorageErrorKind::corrupt,
                               path_.string() + ": checksum mismatch at offset " + std::to_string(pos)};
        }
        if (!visit(header.type, rest.subspan(header.body_offset, header.body_length))) {
            throw StorageError{StorageErrorKind::corrupt,
                               path_.string() + ": undecodable chunk at offset " + std::to_string(pos)};
        }
        ++stats.chunks;
        pos += header.total_size();
    }

    if (stats.discarded_bytes > 0) {
        log::logger()->warn("{}: discarding {} byte torn tail after {} complete chunks",
                            path_.string(), stats.discarded_bytes, stats.chunks);
        auto ec = std::error_code{};
        std::filesystem::resize_file(path_, pos, ec);
        if (ec) {
            throw StorageError{StorageErrorKind::io,
                               "cannot truncate " + path_.string() + ": " + ec.message()};
        }
    }

    chunk_count_ = stats.chunks;
    file_size_ = pos;
    open_for_append();
    return stats;
}

void Journal::append(std::span<const PendingChunk> chunks) {
    if (chunks.empty()) return;
    if (!out_.is_open()) open_for_append();
    const auto buffer = encode_chunks(chunks);
    try {
        write_all(out_, buffer, path_);
    } catch (const StorageError&) {
        // Cut a partially written chunk off so the next replay stays clean.
        out_.close();
        auto ec = std::error_code{};
        std::filesystem::resize_file(path_, file_size_, ec);
        throw;
    }
    file_size_ += buffer.size();
    chunk_count_ += chunks.size();
}

void Journal::append(ChunkType type, std::span<const std::byte> body) {
    auto chunk = PendingChunk{type, std::vector<std::byte>(body.begin(), body.end())};
    append(std::span<const PendingChunk>{&chunk, 1});
}

void Journal::rewrite(std::span<const PendingChunk> chunks) {
    auto tmp = path_;
    tmp += ".tmp";
    auto size = std::uintmax_t{0};
    {
        auto out = std::ofstream{tmp, std::ios::binary | std::ios::trunc};
        if (!out) {
            throw StorageError{StorageErrorKind::io, "cannot open " + tmp.string()};
        }
        const auto buffer = encode_chunks(chunks);
        write_all(out, buffer, tmp);
        size = buffer.size();
    }

    out_.close();
    auto ec = std::error_code{};
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        throw StorageError{StorageErrorKind::io,
                           "cannot replace " + path_.string() + ": " + ec.message()};
    }
    chunk_count_ = chunks.size();
    file_size_ = size;
    open_for_append();
}

void Journal::open_for_append() {
    out_.close();
    out_.clear();
    out_.open(path_, std::ios::binary | std::ios::app);
    if (!out_) {
        throw StorageError{StorageErrorKind::io, "cannot open " + path_.string() + " for append"};
    }
}

}  // namespace offsync_cpp::storage
