#include <offsync-cpp/config.hpp>

#include <fstream>
#include <stdexcept>

namespace offsync_cpp {

namespace {

auto type_error(const std::string& key, const char* expected) -> std::invalid_argument {
    return std::invalid_argument{"config: '" + key + "' must be " + expected};
}

auto child(const nlohmann::json& j, const char* key, const std::string& path)
    -> const nlohmann::json* {
    auto it = j.find(key);
    if (it == j.end()) return nullptr;
    if (!it->is_object()) throw type_error(path + key, "an object");
    return &*it;
}

template <typename T>
void read_unsigned(const nlohmann::json& j, const char* key, const std::string& path, T& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<std::int64_t>() >= 0)) {
        throw type_error(path + key, "a non-negative integer");
    }
    out = static_cast<T>(it->get<std::uint64_t>());
}

void read_millis(const nlohmann::json& j, const char* key, const std::string& path,
                 std::chrono::milliseconds& out) {
    auto count = static_cast<std::uint64_t>(out.count());
    read_unsigned(j, key, path, count);
    out = std::chrono::milliseconds{static_cast<std::int64_t>(count)};
}

void read_string(const nlohmann::json& j, const char* key, const std::string& path,
                 std::string& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_string()) throw type_error(path + key, "a string");
    out = it->get<std::string>();
}

void read_bool(const nlohmann::json& j, const char* key, const std::string& path, bool& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_boolean()) throw type_error(path + key, "a boolean");
    out = it->get<bool>();
}

}  // namespace

auto parse_config(const nlohmann::json& j) -> SyncConfig {
    if (!j.is_object()) throw std::invalid_argument{"config: top level must be an object"};

    auto config = SyncConfig{};

    auto data_dir = std::string{};
    read_string(j, "data_dir", "", data_dir);
    if (!data_dir.empty()) config.data_dir = data_dir;

    read_unsigned(j, "push_batch_size", "", config.push_batch_size);
    read_unsigned(j, "pull_page_size", "", config.pull_page_size);
    read_unsigned(j, "max_attempts", "", config.max_attempts);
    read_millis(j, "poll_interval_ms", "", config.poll_interval);
    read_millis(j, "remote_timeout_ms", "", config.remote_timeout);

    if (config.push_batch_size == 0) throw type_error("push_batch_size", "at least 1");
    if (config.pull_page_size == 0) throw type_error("pull_page_size", "at least 1");
    if (config.remote_timeout.count() == 0) throw type_error("remote_timeout_ms", "at least 1");

    if (const auto* backoff = child(j, "backoff", "")) {
        read_millis(*backoff, "base_ms", "backoff.", config.backoff.base);
        read_millis(*backoff, "max_ms", "backoff.", config.backoff.max);
        read_millis(*backoff, "jitter_ms", "backoff.", config.backoff.jitter);
    }

    if (const auto* conflict = child(j, "conflict", "")) {
        auto strategy = std::string{to_string_view(config.conflict.strategy)};
        read_string(*conflict, "strategy", "conflict.", strategy);
        auto parsed = parse_conflict_strategy(strategy);
        if (!parsed) {
            throw type_error("conflict.strategy", "\"last_write_wins\" or \"field_merge\"");
        }
        config.conflict.strategy = *parsed;

        if (auto it = conflict->find("union_fields"); it != conflict->end()) {
            if (!it->is_array()) throw type_error("conflict.union_fields", "an array of strings");
            config.conflict.union_fields.clear();
            for (const auto& field : *it) {
                if (!field.is_string()) {
                    throw type_error("conflict.union_fields", "an array of strings");
                }
                config.conflict.union_fields.push_back(field.get<std::string>());
            }
        }
        read_bool(*conflict, "flag_for_review", "conflict.", config.conflict.flag_for_review);
    }

    if (const auto* logging = child(j, "log", "")) {
        read_string(*logging, "level", "log.", config.log.level);
        read_string(*logging, "file", "log.", config.log.file);
        read_unsigned(*logging, "max_file_size", "log.", config.log.max_file_size);
        read_unsigned(*logging, "max_files", "log.", config.log.max_files);
        // Reject an unknown level now rather than at log::configure().
        log::parse_level(config.log.level);
    }

    return config;
}

auto load_config(const std::filesystem::path& path) -> SyncConfig {
    auto in = std::ifstream{path};
    if (!in) throw std::runtime_error{"config: cannot open " + path.string()};
    auto j = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) throw std::runtime_error{"config: " + path.string() + " is not valid JSON"};
    return parse_config(j);
}

auto config_to_json(const SyncConfig& config) -> nlohmann::json {
    return nlohmann::json{
        {"data_dir", config.data_dir.string()},
        {"push_batch_size", config.push_batch_size},
        {"pull_page_size", config.pull_page_size},
        {"max_attempts", config.max_attempts},
        {"poll_interval_ms", config.poll_interval.count()},
        {"remote_timeout_ms", config.remote_timeout.count()},
        {"backoff", {
            {"base_ms", config.backoff.base.count()},
            {"max_ms", config.backoff.max.count()},
            {"jitter_ms", config.backoff.jitter.count()},
        }},
        {"conflict", {
            {"strategy", std::string{to_string_view(config.conflict.strategy)}},
            {"union_fields", config.conflict.union_fields},
            {"flag_for_review", config.conflict.flag_for_review},
        }},
        {"log", {
            {"level", config.log.level},
            {"file", config.log.file},
            {"max_file_size", config.log.max_file_size},
            {"max_files", config.log.max_files},
        }},
    };
}

}  // namespace offsync_cpp
