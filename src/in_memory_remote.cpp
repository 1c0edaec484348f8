#include <offsync-cpp/in_memory_remote.hpp>

#include <algorithm>
#include <charconv>
#include <thread>

namespace offsync_cpp {

namespace {

auto parse_position(const SyncCheckpoint& checkpoint) -> std::optional<std::size_t> {
    if (checkpoint.empty()) return std::size_t{0};
    auto position = std::size_t{0};
    const auto& token = checkpoint.token;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), position);
    if (ec != std::errc{} || ptr != token.data() + token.size()) return std::nullopt;
    return position;
}

}  // namespace

void InMemoryRemote::simulate_latency() const {
    auto latency = std::chrono::milliseconds{0};
    {
        auto lock = std::scoped_lock{mutex_};
        latency = latency_;
    }
    if (latency.count() > 0) std::this_thread::sleep_for(latency);
}

auto InMemoryRemote::injected_fault_locked(bool for_push) -> std::optional<RemoteError> {
    if (!reachable_) {
        return RemoteError{RemoteErrorKind::network, "remote unreachable", std::nullopt};
    }
    auto& remaining = for_push ? push_faults_ : pull_faults_;
    if (remaining == 0) return std::nullopt;
    --remaining;
    const auto kind = for_push ? push_fault_kind_ : pull_fault_kind_;
    return RemoteError{kind, "injected " + std::string{to_string_view(kind)}, std::nullopt};
}

auto InMemoryRemote::apply_locked(const RecordId& id, OperationKind kind, Record payload)
    -> std::uint64_t {
    auto& slot = records_[id];
    const auto version = slot.version + 1;
    payload.id = id;
    payload.version = version;
    payload.deleted = kind == OperationKind::erase;
    slot = payload;
    feed_.push_back(RemoteChange{
        .record_id = id,
        .kind = kind,
        .payload = payload,
        .remote_version = version,
        .remote_updated_at = payload.updated_at,
    });
    return version;
}

auto InMemoryRemote::push(const Operation& op) -> PushResult {
    simulate_latency();
    auto lock = std::scoped_lock{mutex_};
    ++push_calls_;
    if (auto fault = injected_fault_locked(true)) return *fault;

    if (auto it = acks_.find(op.id); it != acks_.end()) return it->second;

    auto current = records_.find(op.record_id);
    const auto exists = current != records_.end();
    const auto current_version = exists ? current->second.version : 0;

    if (exists && op.payload.version < current_version) {
        return RemoteError{RemoteErrorKind::conflict,
                           "record '" + op.record_id + "' is at version " +
                               std::to_string(current_version),
                           current->second};
    }
    if (op.kind == OperationKind::erase && (!exists || current->second.deleted)) {
        // Deleting what is already gone succeeds without a new revision.
        auto ack = RemoteAck{op.id, current_version};
        acks_.emplace(op.id, ack);
        return ack;
    }

    const auto version = apply_locked(op.record_id, op.kind, op.payload);
    ++applied_pushes_;
    auto ack = RemoteAck{op.id, version};
    acks_.emplace(op.id, ack);
    return ack;
}

auto InMemoryRemote::pull_since(const SyncCheckpoint& checkpoint, std::size_t max_changes)
    -> PullResult {
    simulate_latency();
    auto lock = std::scoped_lock{mutex_};
    ++pull_calls_;
    if (auto fault = injected_fault_locked(false)) return *fault;

    auto position = parse_position(checkpoint);
    if (!position || *position > feed_.size()) {
        return RemoteError{RemoteErrorKind::server_fault,
                           "invalid checkpoint '" + checkpoint.token + "'", std::nullopt};
    }

    const auto count = std::min(max_changes, feed_.size() - *position);
    auto batch = PullBatch{};
    batch.changes.assign(feed_.begin() + static_cast<std::ptrdiff_t>(*position),
                         feed_.begin() + static_cast<std::ptrdiff_t>(*position + count));
    batch.checkpoint = SyncCheckpoint{std::to_string(*position + count)};
    batch.has_more = *position + count < feed_.size();
    return batch;
}

auto InMemoryRemote::put_remote(Record record) -> std::uint64_t {
    auto lock = std::scoped_lock{mutex_};
    const auto it = records_.find(record.id);
    const auto kind = (it == records_.end() || it->second.deleted) ? OperationKind::create
                                                                    : OperationKind::update;
    auto id = record.id;
    return apply_locked(id, kind, std::move(record));
}

auto InMemoryRemote::erase_remote(const RecordId& id, Timestamp when)
    -> std::optional<std::uint64_t> {
    auto lock = std::scoped_lock{mutex_};
    const auto it = records_.find(id);
    if (it == records_.end() || it->second.deleted) return std::nullopt;
    return apply_locked(id, OperationKind::erase, it->second.tombstone(when));
}

auto InMemoryRemote::get(const RecordId& id) const -> std::optional<Record> {
    auto lock = std::scoped_lock{mutex_};
    auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

auto InMemoryRemote::live_records() const -> std::vector<Record> {
    auto lock = std::scoped_lock{mutex_};
    auto result = std::vector<Record>{};
    for (const auto& [id, record] : records_) {
        if (!record.deleted) result.push_back(record);
    }
    return result;
}

void InMemoryRemote::fail_next_pushes(RemoteErrorKind kind, std::size_t count) {
    auto lock = std::scoped_lock{mutex_};
    push_fault_kind_ = kind;
    push_faults_ = count;
}

void InMemoryRemote::fail_next_pulls(RemoteErrorKind kind, std::size_t count) {
    auto lock = std::scoped_lock{mutex_};
    pull_fault_kind_ = kind;
    pull_faults_ = count;
}

void InMemoryRemote::set_reachable(bool reachable) {
    auto lock = std::scoped_lock{mutex_};
    reachable_ = reachable;
}

void InMemoryRemote::set_latency(std::chrono::milliseconds latency) {
    auto lock = std::scoped_lock{mutex_};
    latency_ = latency;
}

auto InMemoryRemote::push_calls() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return push_calls_;
}

auto InMemoryRemote::pull_calls() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return pull_calls_;
}

auto InMemoryRemote::applied_pushes() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return applied_pushes_;
}

auto InMemoryRemote::feed_size() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return feed_.size();
}

}  // namespace offsync_cpp
