#pragma once

// Scratch directory for tests that exercise durable storage.

#include <filesystem>
#include <random>
#include <string>

namespace offsync_cpp::test_support {

class TempDir {
public:
    TempDir() {
        auto rng = std::random_device{};
        path_ = std::filesystem::temp_directory_path() /
                ("offsync-test-" + std::to_string(rng()) + std::to_string(rng()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        auto ec = std::error_code{};
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    auto operator=(const TempDir&) -> TempDir& = delete;

    auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace offsync_cpp::test_support
