// Fuzz target for journal replay: feeds arbitrary bytes to the Record
// Store and the Operation Log as their on-disk journal. Opening must
// either succeed or throw StorageError; anything else is a bug.

#include <offsync-cpp/error.hpp>
#include <offsync-cpp/log.hpp>
#include <offsync-cpp/operation_log.hpp>
#include <offsync-cpp/record_store.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace {

auto scratch_dir() -> const std::filesystem::path& {
    static const auto dir = [] {
        auto path = std::filesystem::temp_directory_path() /
                    ("offsync-fuzz-" + std::to_string(::getpid()));
        std::filesystem::create_directories(path);
        offsync_cpp::log::configure(offsync_cpp::LogConfig{.level = "off"});
        return path;
    }();
    return dir;
}

void write_file(const std::filesystem::path& path, const uint8_t* data, size_t size) {
    auto out = std::ofstream{path, std::ios::binary | std::ios::trunc};
    out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto& dir = scratch_dir();

    write_file(dir / "records.journal", data, size);
    try {
        auto store = offsync_cpp::RecordStore{dir};
        // Whatever replayed must be readable and rewritable.
        for (const auto& record : store.scan()) (void)record;
        store.compact();
    } catch (const offsync_cpp::StorageError&) {
        // Rejected as corrupt or unreadable.
    }

    write_file(dir / "operations.journal", data, size);
    try {
        auto log = offsync_cpp::OperationLog{dir, 5};
        (void)log.peek_batch(32);
        log.compact();
    } catch (const offsync_cpp::StorageError&) {
        // Rejected as corrupt or unreadable.
    }
    return 0;
}
