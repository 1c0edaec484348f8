#include <offsync-cpp/conflict_resolver.hpp>

#include <algorithm>

namespace offsync_cpp {

namespace {

// The side that wins at record granularity; ties go to the remote.
auto lww_winner(const Record& local, const Record& remote) -> const Record& {
    return local.updated_at > remote.updated_at ? local : remote;
}

auto stamp(Record result, const Record& local, const Record& remote) -> Record {
    result.id = remote.id;
    result.version = std::max(local.version, remote.version);
    result.updated_at = std::max(local.updated_at, remote.updated_at);
    return result;
}

auto union_of(const nlohmann::json& a, const nlohmann::json& b) -> nlohmann::json {
    auto values = std::vector<nlohmann::json>{};
    values.reserve(a.size() + b.size());
    for (const auto& v : a) values.push_back(v);
    for (const auto& v : b) values.push_back(v);
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    return nlohmann::json(std::move(values));
}

}  // namespace

auto parse_conflict_strategy(std::string_view name) -> std::optional<ConflictStrategy> {
    if (name == "last_write_wins") return ConflictStrategy::last_write_wins;
    if (name == "field_merge") return ConflictStrategy::field_merge;
    return std::nullopt;
}

auto LastWriteWins::resolve(const Record& local, const Record& remote) const -> Record {
    return stamp(lww_winner(local, remote), local, remote);
}

FieldMerge::FieldMerge(std::vector<std::string> union_fields)
    : union_fields_{std::move(union_fields)} {}

auto FieldMerge::resolve(const Record& local, const Record& remote) const -> Record {
    auto result = stamp(lww_winner(local, remote), local, remote);
    if (local.deleted || remote.deleted) return result;

    for (const auto& field : union_fields_) {
        const auto l = local.fields.find(field);
        const auto r = remote.fields.find(field);
        if (l == local.fields.end() || r == remote.fields.end()) continue;
        if (!l->is_array() || !r->is_array()) continue;
        result.fields[field] = union_of(*l, *r);
    }
    return result;
}

auto make_resolver(ConflictStrategy strategy, std::vector<std::string> union_fields)
    -> std::unique_ptr<ConflictResolver> {
    switch (strategy) {
        case ConflictStrategy::last_write_wins:
            return std::make_unique<LastWriteWins>();
        case ConflictStrategy::field_merge:
            return std::make_unique<FieldMerge>(std::move(union_fields));
    }
    return std::make_unique<LastWriteWins>();
}

}  // namespace offsync_cpp
