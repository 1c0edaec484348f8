#include <offsync-cpp/json.hpp>

#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace offsync_cpp {

namespace {

template <typename Enum>
auto enum_from_json(const nlohmann::json& j, std::initializer_list<Enum> values,
                    std::string_view what) -> Enum {
    if (!j.is_string()) {
        throw std::runtime_error{std::string{what} + " must be a string"};
    }
    const auto& name = j.get_ref<const std::string&>();
    for (auto value : values) {
        if (to_string_view(value) == name) return value;
    }
    throw std::runtime_error{"unknown " + std::string{what} + " '" + name + "'"};
}

}  // anonymous namespace

// =============================================================================
// ADL serialization
// =============================================================================

// -- Identity types -----------------------------------------------------------

void to_json(nlohmann::json& j, const Timestamp& t) {
    j = t.millis_since_epoch;
}

void from_json(const nlohmann::json& j, Timestamp& t) {
    if (!j.is_number_integer()) throw std::runtime_error{"timestamp must be an integer"};
    t.millis_since_epoch = j.get<std::int64_t>();
}

void to_json(nlohmann::json& j, const ReplicaId& id) {
    j = id.to_hex();
}

void from_json(const nlohmann::json& j, ReplicaId& id) {
    auto parsed = j.is_string() ? ReplicaId::from_hex(j.get_ref<const std::string&>())
                                : std::nullopt;
    if (!parsed) throw std::runtime_error{"invalid replica id"};
    id = *parsed;
}

void to_json(nlohmann::json& j, const OperationId& id) {
    j = id.to_string();
}

void from_json(const nlohmann::json& j, OperationId& id) {
    auto parsed = j.is_string() ? OperationId::parse(j.get_ref<const std::string&>())
                                : std::nullopt;
    if (!parsed) throw std::runtime_error{"invalid operation id"};
    id = *parsed;
}

// -- Enums --------------------------------------------------------------------

void to_json(nlohmann::json& j, SyncState state) {
    j = std::string{to_string_view(state)};
}

void from_json(const nlohmann::json& j, SyncState& state) {
    state = enum_from_json(j,
                           {SyncState::clean, SyncState::pending_create,
                            SyncState::pending_update, SyncState::pending_delete,
                            SyncState::conflicted},
                           "sync state");
}

void to_json(nlohmann::json& j, OperationKind kind) {
    j = std::string{to_string_view(kind)};
}

void from_json(const nlohmann::json& j, OperationKind& kind) {
    kind = enum_from_json(j, {OperationKind::create, OperationKind::update, OperationKind::erase},
                          "operation kind");
}

void to_json(nlohmann::json& j, ChangeKind kind) {
    j = std::string{to_string_view(kind)};
}

void to_json(nlohmann::json& j, ErrorKind kind) {
    j = std::string{to_string_view(kind)};
}

void to_json(nlohmann::json& j, SyncPhase phase) {
    j = std::string{to_string_view(phase)};
}

// -- Records ------------------------------------------------------------------

void to_json(nlohmann::json& j, const Record& r) {
    j = nlohmann::json{
        {"id", r.id},
        {"version", r.version},
        {"updated_at", r.updated_at},
        {"deleted", r.deleted},
        {"fields", r.fields},
    };
}

void from_json(const nlohmann::json& j, Record& r) {
    if (!j.is_object()) throw std::runtime_error{"record must be an object"};
    r = Record{};
    j.at("id").get_to(r.id);
    if (j.contains("version")) j.at("version").get_to(r.version);
    if (j.contains("updated_at")) j.at("updated_at").get_to(r.updated_at);
    if (j.contains("deleted")) j.at("deleted").get_to(r.deleted);
    if (j.contains("fields")) {
        if (!j.at("fields").is_object()) {
            throw std::runtime_error{"record '" + r.id + "': fields must be an object"};
        }
        r.fields = j.at("fields");
    }
}

void to_json(nlohmann::json& j, const StoredRecord& r) {
    j = nlohmann::json{{"record", r.record}, {"state", r.state}};
}

void from_json(const nlohmann::json& j, StoredRecord& r) {
    j.at("record").get_to(r.record);
    j.at("state").get_to(r.state);
}

void to_json(nlohmann::json& j, const RecordChange& c) {
    j = nlohmann::json{
        {"sequence", c.sequence},
        {"kind", c.kind},
        {"record", c.record},
        {"state", c.state},
    };
}

// -- Remote exchange ----------------------------------------------------------

void to_json(nlohmann::json& j, const Operation& op) {
    j = nlohmann::json{
        {"id", op.id},
        {"record_id", op.record_id},
        {"kind", op.kind},
        {"payload", op.payload},
        {"enqueued_at", op.enqueued_at},
        {"attempt_count", op.attempt_count},
    };
    if (!op.last_error.empty()) j["last_error"] = op.last_error;
}

void from_json(const nlohmann::json& j, Operation& op) {
    op = Operation{};
    j.at("id").get_to(op.id);
    j.at("record_id").get_to(op.record_id);
    j.at("kind").get_to(op.kind);
    j.at("payload").get_to(op.payload);
    if (j.contains("enqueued_at")) j.at("enqueued_at").get_to(op.enqueued_at);
    if (j.contains("attempt_count")) j.at("attempt_count").get_to(op.attempt_count);
    if (j.contains("last_error")) j.at("last_error").get_to(op.last_error);
}

void to_json(nlohmann::json& j, const RemoteAck& ack) {
    j = nlohmann::json{{"operation_id", ack.operation_id},
                       {"remote_version", ack.remote_version}};
}

void from_json(const nlohmann::json& j, RemoteAck& ack) {
    j.at("operation_id").get_to(ack.operation_id);
    j.at("remote_version").get_to(ack.remote_version);
}

void to_json(nlohmann::json& j, const RemoteChange& c) {
    j = nlohmann::json{
        {"record_id", c.record_id},
        {"kind", c.kind},
        {"payload", c.payload},
        {"remote_version", c.remote_version},
        {"remote_updated_at", c.remote_updated_at},
    };
}

void from_json(const nlohmann::json& j, RemoteChange& c) {
    c = RemoteChange{};
    j.at("record_id").get_to(c.record_id);
    j.at("kind").get_to(c.kind);
    j.at("payload").get_to(c.payload);
    j.at("remote_version").get_to(c.remote_version);
    if (j.contains("remote_updated_at")) j.at("remote_updated_at").get_to(c.remote_updated_at);
}

void to_json(nlohmann::json& j, const SyncCheckpoint& c) {
    j = c.token;
}

void from_json(const nlohmann::json& j, SyncCheckpoint& c) {
    if (j.is_null()) {
        c.token.clear();
        return;
    }
    j.get_to(c.token);
}

// -- Status -------------------------------------------------------------------

void to_json(nlohmann::json& j, const Error& e) {
    j = nlohmann::json{{"kind", e.kind}, {"message", e.message}};
}

void to_json(nlohmann::json& j, const SyncStatus& s) {
    j = nlohmann::json{
        {"phase", s.phase},
        {"consecutive_failures", s.consecutive_failures},
        {"backoff_delay_ms", s.backoff_delay.count()},
        {"pending_operations", s.pending_operations},
        {"dead_letters", s.dead_letters},
        {"checkpoint", s.checkpoint},
        {"fatal", s.fatal},
    };
    j["last_error"] = s.last_error ? nlohmann::json(*s.last_error) : nlohmann::json(nullptr);
    j["last_synced_at"] =
        s.last_synced_at ? nlohmann::json(*s.last_synced_at) : nlohmann::json(nullptr);
}

// =============================================================================
// Store export / import
// =============================================================================

auto export_json(const RecordStore& store) -> nlohmann::json {
    auto result = nlohmann::json::array();
    for (const auto& entry : store.scan_entries()) {
        result.push_back(entry);
    }
    return result;
}

auto import_json(RecordStore& store, const nlohmann::json& j) -> std::size_t {
    if (!j.is_array()) throw std::runtime_error{"import_json: expected an array"};
    auto writes = std::vector<RecordWrite>{};
    writes.reserve(j.size());
    for (const auto& item : j) {
        auto entry = item.get<StoredRecord>();
        writes.push_back(RecordWrite::put(std::move(entry.record), entry.state));
    }
    if (writes.empty()) return 0;
    return store.apply_batch(writes);
}

}  // namespace offsync_cpp
