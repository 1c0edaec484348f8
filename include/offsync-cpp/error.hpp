/// @file error.hpp
/// @brief Error types for the offsync-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace offsync_cpp {

/// Categories of engine-level errors reported through SyncStatus.
enum class ErrorKind : std::uint8_t {
    storage_io,         ///< A local read or write failed and may be retried.
    storage_corrupt,    ///< Local persisted state is corrupt; fatal.
    remote_network,     ///< The remote could not be reached or timed out.
    remote_conflict,    ///< The remote rejected a mutation as concurrent.
    remote_unauthorized,///< The remote rejected our credentials.
    remote_server_fault,///< The remote failed to process a request.
    invalid_operation,  ///< An operation is invalid in the current context.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::storage_io:          return "storage_io";
        case ErrorKind::storage_corrupt:     return "storage_corrupt";
        case ErrorKind::remote_network:      return "remote_network";
        case ErrorKind::remote_conflict:     return "remote_conflict";
        case ErrorKind::remote_unauthorized: return "remote_unauthorized";
        case ErrorKind::remote_server_fault: return "remote_server_fault";
        case ErrorKind::invalid_operation:   return "invalid_operation";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

// -- Local persistence --------------------------------------------------------

/// The two classes of local persistence failure.
enum class StorageErrorKind : std::uint8_t {
    io,       ///< Transient I/O failure; the caller's retry path applies.
    corrupt,  ///< Persisted data failed validation; never retried.
};

constexpr auto to_string_view(StorageErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case StorageErrorKind::io:      return "io";
        case StorageErrorKind::corrupt: return "corrupt";
    }
    return "unknown";
}

/// Thrown by the Record Store, Operation Log and checkpoint file.
///
/// `corrupt` is fatal: the orchestrator stops and the Repository surfaces
/// it to the application instead of retrying.
class StorageError : public std::runtime_error {
public:
    StorageError(StorageErrorKind kind, const std::string& message)
        : std::runtime_error{std::string{to_string_view(kind)} + ": " + message},
          kind_{kind} {}

    auto kind() const noexcept -> StorageErrorKind { return kind_; }
    auto is_fatal() const noexcept -> bool { return kind_ == StorageErrorKind::corrupt; }

private:
    StorageErrorKind kind_;
};

// -- Remote interaction -------------------------------------------------------

/// Failure classes a Remote Gateway may report.
enum class RemoteErrorKind : std::uint8_t {
    network,       ///< Unreachable, dropped or timed out. Retried with backoff.
    conflict,      ///< Concurrent modification; resolved inline, not retried.
    unauthorized,  ///< Credentials rejected. Retried up to the ceiling.
    server_fault,  ///< Remote-side failure. Retried with backoff.
};

constexpr auto to_string_view(RemoteErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case RemoteErrorKind::network:      return "network";
        case RemoteErrorKind::conflict:     return "conflict";
        case RemoteErrorKind::unauthorized: return "unauthorized";
        case RemoteErrorKind::server_fault: return "server_fault";
    }
    return "unknown";
}

/// Map a remote failure class onto the engine-level ErrorKind.
constexpr auto to_error_kind(RemoteErrorKind kind) noexcept -> ErrorKind {
    switch (kind) {
        case RemoteErrorKind::network:      return ErrorKind::remote_network;
        case RemoteErrorKind::conflict:     return ErrorKind::remote_conflict;
        case RemoteErrorKind::unauthorized: return ErrorKind::remote_unauthorized;
        case RemoteErrorKind::server_fault: return ErrorKind::remote_server_fault;
    }
    return ErrorKind::invalid_operation;
}

/// Whether failures of this kind count toward the dead-letter ceiling.
/// Network failures are retried for as long as connectivity allows.
constexpr auto counts_toward_ceiling(RemoteErrorKind kind) noexcept -> bool {
    return kind == RemoteErrorKind::unauthorized || kind == RemoteErrorKind::server_fault;
}

}  // namespace offsync_cpp
