/// @file conflict_resolver.hpp
/// @brief Deterministic resolution of diverged local and remote records.

#pragma once

#include <offsync-cpp/record.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace offsync_cpp {

/// Built-in resolution strategies, selectable from configuration.
enum class ConflictStrategy : std::uint8_t {
    last_write_wins,
    field_merge,
};

constexpr auto to_string_view(ConflictStrategy strategy) noexcept -> std::string_view {
    switch (strategy) {
        case ConflictStrategy::last_write_wins: return "last_write_wins";
        case ConflictStrategy::field_merge:     return "field_merge";
    }
    return "unknown";
}

/// Parse "last_write_wins" or "field_merge".
auto parse_conflict_strategy(std::string_view name) -> std::optional<ConflictStrategy>;

/// Decides the outcome when local and remote versions of a record diverge.
///
/// Implementations must be pure: the same two inputs always give the same
/// output, so every replica resolving the same pair converges on the same
/// record. The result carries `version = max(local.version, remote.version)`
/// and `updated_at = max(local.updated_at, remote.updated_at)`.
class ConflictResolver {
public:
    virtual ~ConflictResolver() = default;

    virtual auto resolve(const Record& local, const Record& remote) const -> Record = 0;
};

/// The later `updated_at` wins; on a tie the remote record wins.
///
/// Deletes are tombstones, so a delete racing an update wins only when it
/// is strictly later.
class LastWriteWins : public ConflictResolver {
public:
    auto resolve(const Record& local, const Record& remote) const -> Record override;
};

/// Last-write-wins, except that the configured fields are unioned.
///
/// For each union field whose value is an array on both sides the result
/// holds the sorted, de-duplicated union of both arrays. If either side is
/// a tombstone the result is plain last-write-wins.
///
/// @code
/// auto merge = FieldMerge{{"tagIds"}};
/// // local {tagIds: ["a", "b"]} vs remote {tagIds: ["c"]} -> ["a", "b", "c"]
/// @endcode
class FieldMerge : public ConflictResolver {
public:
    explicit FieldMerge(std::vector<std::string> union_fields);

    auto resolve(const Record& local, const Record& remote) const -> Record override;

    auto union_fields() const -> const std::vector<std::string>& { return union_fields_; }

private:
    std::vector<std::string> union_fields_;
};

/// Build the resolver for a configured strategy. `union_fields` is only
/// used by field_merge.
auto make_resolver(ConflictStrategy strategy, std::vector<std::string> union_fields = {})
    -> std::unique_ptr<ConflictResolver>;

}  // namespace offsync_cpp
