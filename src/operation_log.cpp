#include <offsync-cpp/operation_log.hpp>

#include <offsync-cpp/log.hpp>

#include "storage/deserializer.hpp"
#include "storage/journal.hpp"
#include "storage/serializer.hpp"

#include <algorithm>
#include <set>

namespace offsync_cpp {

namespace {

constexpr auto journal_file_name = "operations.journal";

constexpr std::size_t compact_min_chunks = 1024;
constexpr std::size_t compact_ratio = 4;

// Net effect of `next` applied after `prev` for the same record.
// nullopt means the two cancel out.
auto coalesce_kind(OperationKind prev, OperationKind next) -> std::optional<OperationKind> {
    switch (prev) {
        case OperationKind::create:
            if (next == OperationKind::erase) return std::nullopt;
            return OperationKind::create;
        case OperationKind::update:
            return next == OperationKind::erase ? OperationKind::erase : OperationKind::update;
        case OperationKind::erase:
            // Re-creating a record the remote still holds is an update of it.
            return next == OperationKind::erase ? OperationKind::erase : OperationKind::update;
    }
    return next;
}

auto encode_header(const ReplicaId& replica, std::uint64_t next_counter) -> storage::PendingChunk {
    auto ser = storage::Serializer{};
    ser.write_replica_id(replica);
    ser.write_uleb128(next_counter);
    return {storage::ChunkType::operation_header, ser.take()};
}

}  // namespace

OperationLog::OperationLog(std::uint32_t max_attempts)
    : max_attempts_{max_attempts}, replica_{ReplicaId::random()} {}

OperationLog::OperationLog(const std::filesystem::path& dir, std::uint32_t max_attempts)
    : max_attempts_{max_attempts},
      journal_{std::make_unique<storage::Journal>(dir / journal_file_name)} {
    replay();
}

OperationLog::~OperationLog() = default;

// -- Persistence --------------------------------------------------------------

void OperationLog::replay() {
    auto have_header = false;
    auto stats = journal_->replay([&](storage::ChunkType type, std::span<const std::byte> body) {
        auto des = storage::Deserializer{body};
        switch (type) {
            case storage::ChunkType::operation_header: {
                auto replica = des.read_replica_id();
                auto counter = des.read_uleb128();
                if (!replica || !counter || !des.at_end()) return false;
                if (have_header && *replica != replica_) return false;
                replica_ = *replica;
                next_counter_ = std::max(next_counter_, *counter);
                have_header = true;
                return true;
            }
            case storage::ChunkType::operation_upsert: {
                auto decoded = des.read_operation();
                if (!decoded || !des.at_end()) return false;
                next_counter_ = std::max(next_counter_, decoded->op.id.counter + 1);
                auto entry = Entry{std::move(decoded->op), decoded->dead_lettered,
                                   decoded->dispatched};
                if (auto it = find_locked(entry.op.id); it != queue_.end()) {
                    *it = std::move(entry);
                } else {
                    queue_.push_back(std::move(entry));
                }
                return true;
            }
            case storage::ChunkType::operation_remove: {
                auto id = des.read_operation_id();
                if (!id || !des.at_end()) return false;
                std::erase_if(queue_, [&](const Entry& e) { return e.op.id == *id; });
                return true;
            }
            default:
                return false;
        }
    });

    if (!have_header) {
        if (stats.chunks > 0) {
            throw StorageError{StorageErrorKind::corrupt,
                               journal_->path().string() + ": missing replica header"};
        }
        replica_ = ReplicaId::random();
        const auto header = encode_header(replica_, next_counter_);
        journal_->append(std::span<const storage::PendingChunk>{&header, 1});
    }

    std::ranges::sort(queue_, OperationOrder{}, &Entry::op);
    for (const auto& entry : queue_) {
        last_enqueued_at_ = std::max(last_enqueued_at_, entry.op.enqueued_at);
    }

    log::logger()->debug("operation log: replica {}, {} entries replayed",
                         replica_.to_hex(), queue_.size());
    maybe_compact_locked();
}

void OperationLog::persist_upsert_locked(const Entry& entry) {
    if (!journal_) return;
    auto flags = std::uint8_t{0};
    if (entry.dead_lettered) flags |= storage::operation_flag_dead;
    if (entry.dispatched) flags |= storage::operation_flag_dispatched;
    auto ser = storage::Serializer{};
    ser.write_operation(entry.op, flags);
    journal_->append(storage::ChunkType::operation_upsert, ser.data());
}

void OperationLog::persist_remove_locked(const OperationId& id) {
    if (!journal_) return;
    auto ser = storage::Serializer{};
    ser.write_operation_id(id);
    journal_->append(storage::ChunkType::operation_remove, ser.data());
}

void OperationLog::write_snapshot_locked() {
    auto chunks = std::vector<storage::PendingChunk>{};
    chunks.reserve(queue_.size() + 1);
    chunks.push_back(encode_header(replica_, next_counter_));
    for (const auto& entry : queue_) {
        auto flags = std::uint8_t{0};
        if (entry.dead_lettered) flags |= storage::operation_flag_dead;
        if (entry.dispatched) flags |= storage::operation_flag_dispatched;
        auto ser = storage::Serializer{};
        ser.write_operation(entry.op, flags);
        chunks.emplace_back(storage::ChunkType::operation_upsert, ser.take());
    }
    journal_->rewrite(chunks);
}

void OperationLog::maybe_compact_locked() {
    if (!journal_) return;
    const auto chunks = journal_->chunk_count();
    if (chunks < compact_min_chunks || chunks < compact_ratio * (queue_.size() + 1)) return;
    log::logger()->info("operation log: compacting {} journal chunks into {} entries",
                        chunks, queue_.size());
    write_snapshot_locked();
}

void OperationLog::compact() {
    auto lock = std::scoped_lock{mutex_};
    if (journal_) write_snapshot_locked();
}

// -- Helpers ------------------------------------------------------------------

auto OperationLog::find_locked(const OperationId& id) -> std::vector<Entry>::iterator {
    return std::ranges::find(queue_, id, [](const Entry& e) { return e.op.id; });
}

auto OperationLog::find_locked(const OperationId& id) const -> std::vector<Entry>::const_iterator {
    return std::ranges::find(queue_, id, [](const Entry& e) { return e.op.id; });
}

// The newest entry for the record, if the remote has not seen it yet.
auto OperationLog::coalesce_target_locked(std::string_view record_id)
    -> std::vector<Entry>::iterator {
    auto target = queue_.end();
    for (auto it = queue_.begin(); it != queue_.end(); ++it) {
        if (it->op.record_id == record_id) target = it;
    }
    if (target != queue_.end() && (target->dispatched || target->dead_lettered)) {
        return queue_.end();
    }
    return target;
}

auto OperationLog::coalesce_target_locked(std::string_view record_id) const
    -> std::vector<Entry>::const_iterator {
    auto target = queue_.end();
    for (auto it = queue_.begin(); it != queue_.end(); ++it) {
        if (it->op.record_id == record_id) target = it;
    }
    if (target != queue_.end() && (target->dispatched || target->dead_lettered)) {
        return queue_.end();
    }
    return target;
}

auto OperationLog::next_id_locked() -> OperationId {
    return OperationId{next_counter_++, replica_};
}

// Wall clock, but never earlier than the previous entry so FIFO order
// matches enqueue order when the clock steps back.
auto OperationLog::next_timestamp_locked() -> Timestamp {
    last_enqueued_at_ = std::max(Timestamp::now(), last_enqueued_at_);
    return last_enqueued_at_;
}

// -- Producing ----------------------------------------------------------------

auto OperationLog::enqueue(RecordId record_id, OperationKind kind, Record payload)
    -> EnqueueResult {
    auto lock = std::scoped_lock{mutex_};

    auto target = coalesce_target_locked(record_id);
    if (target == queue_.end()) {
        auto entry = Entry{};
        entry.op = Operation{
            .id = next_id_locked(),
            .record_id = std::move(record_id),
            .kind = kind,
            .payload = std::move(payload),
            .enqueued_at = next_timestamp_locked(),
        };
        try {
            persist_upsert_locked(entry);
        } catch (const StorageError&) {
            --next_counter_;
            throw;
        }
        queue_.push_back(entry);
        log::logger()->debug("operation log: appended {} {} for '{}'",
                             to_string_view(kind), entry.op.id.to_string(), entry.op.record_id);
        maybe_compact_locked();
        return {EnqueueOutcome::appended, entry.op};
    }

    const auto merged = coalesce_kind(target->op.kind, kind);
    if (!merged) {
        const auto id = target->op.id;
        persist_remove_locked(id);
        queue_.erase(target);
        log::logger()->debug("operation log: create/delete of '{}' cancelled ({})",
                             record_id, id.to_string());
        return {EnqueueOutcome::cancelled, std::nullopt};
    }

    auto updated = *target;
    payload.version = std::max(payload.version, updated.op.payload.version);
    updated.op.kind = *merged;
    updated.op.payload = std::move(payload);
    persist_upsert_locked(updated);
    *target = updated;
    log::logger()->debug("operation log: coalesced {} into {} {} for '{}'",
                         to_string_view(kind), to_string_view(*merged),
                         updated.op.id.to_string(), record_id);
    maybe_compact_locked();
    return {EnqueueOutcome::coalesced, updated.op};
}

auto OperationLog::preview(std::string_view record_id, OperationKind kind) const
    -> std::optional<OperationKind> {
    auto lock = std::scoped_lock{mutex_};
    auto target = coalesce_target_locked(record_id);
    if (target == queue_.end()) return kind;
    return coalesce_kind(target->op.kind, kind);
}

// -- Draining -----------------------------------------------------------------

auto OperationLog::peek_batch(std::size_t max_n) const -> std::vector<Operation> {
    auto lock = std::scoped_lock{mutex_};
    auto batch = std::vector<Operation>{};
    auto seen = std::set<std::string_view>{};
    for (const auto& entry : queue_) {
        if (batch.size() >= max_n) break;
        // First entry per record only: a dead letter blocks the ones behind it.
        if (!seen.insert(entry.op.record_id).second) continue;
        if (entry.dead_lettered) continue;
        batch.push_back(entry.op);
    }
    return batch;
}

auto OperationLog::dispatch(const OperationId& id) -> std::optional<Operation> {
    auto lock = std::scoped_lock{mutex_};
    auto it = find_locked(id);
    if (it == queue_.end() || it->dead_lettered) return std::nullopt;
    if (!it->dispatched) {
        auto updated = *it;
        updated.dispatched = true;
        persist_upsert_locked(updated);
        it->dispatched = true;
    }
    return it->op;
}

auto OperationLog::ack(const OperationId& id) -> bool {
    auto lock = std::scoped_lock{mutex_};
    auto it = find_locked(id);
    if (it == queue_.end()) return false;
    persist_remove_locked(id);
    queue_.erase(it);
    maybe_compact_locked();
    return true;
}

auto OperationLog::fail(const OperationId& id, RemoteErrorKind kind, std::string_view message)
    -> FailOutcome {
    auto lock = std::scoped_lock{mutex_};
    auto it = find_locked(id);
    if (it == queue_.end() || it->dead_lettered) return FailOutcome::not_found;

    auto updated = *it;
    ++updated.op.attempt_count;
    updated.op.last_error = std::string{to_string_view(kind)} + ": " + std::string{message};
    updated.dead_lettered =
        counts_toward_ceiling(kind) && updated.op.attempt_count > max_attempts_;
    persist_upsert_locked(updated);
    *it = std::move(updated);

    if (it->dead_lettered) {
        log::logger()->warn("operation log: {} for '{}' dead-lettered after {} attempts: {}",
                            id.to_string(), it->op.record_id, it->op.attempt_count,
                            it->op.last_error);
        return FailOutcome::dead_lettered;
    }
    return FailOutcome::retained;
}

void OperationLog::rebase(std::string_view record_id, std::uint64_t remote_version) {
    auto lock = std::scoped_lock{mutex_};
    for (auto& entry : queue_) {
        if (entry.op.record_id != record_id || entry.op.payload.version >= remote_version) {
            continue;
        }
        auto updated = entry;
        updated.op.payload.version = remote_version;
        persist_upsert_locked(updated);
        entry = std::move(updated);
    }
}

auto OperationLog::supersede(std::string_view record_id) -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    auto removed = std::size_t{0};
    for (auto it = queue_.begin(); it != queue_.end();) {
        if (it->op.record_id == record_id && !it->dead_lettered) {
            persist_remove_locked(it->op.id);
            it = queue_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

// -- Inspection ---------------------------------------------------------------

auto OperationLog::get(const OperationId& id) const -> std::optional<Operation> {
    auto lock = std::scoped_lock{mutex_};
    auto it = find_locked(id);
    if (it == queue_.end()) return std::nullopt;
    return it->op;
}

auto OperationLog::latest_for(std::string_view record_id) const -> std::optional<Operation> {
    auto lock = std::scoped_lock{mutex_};
    for (auto it = queue_.rbegin(); it != queue_.rend(); ++it) {
        if (it->op.record_id == record_id) return it->op;
    }
    return std::nullopt;
}

auto OperationLog::has_pending(std::string_view record_id) const -> bool {
    auto lock = std::scoped_lock{mutex_};
    return std::ranges::any_of(queue_, [&](const Entry& e) { return e.op.record_id == record_id; });
}

auto OperationLog::pending_count() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return static_cast<std::size_t>(
        std::ranges::count_if(queue_, [](const Entry& e) { return !e.dead_lettered; }));
}

auto OperationLog::dead_lettered() const -> std::vector<Operation> {
    auto lock = std::scoped_lock{mutex_};
    auto result = std::vector<Operation>{};
    for (const auto& entry : queue_) {
        if (entry.dead_lettered) result.push_back(entry.op);
    }
    return result;
}

// -- Dead-letter handling -----------------------------------------------------

auto OperationLog::discard(const OperationId& id) -> std::optional<Operation> {
    auto lock = std::scoped_lock{mutex_};
    auto it = find_locked(id);
    if (it == queue_.end() || !it->dead_lettered) return std::nullopt;
    auto op = it->op;
    persist_remove_locked(id);
    queue_.erase(it);
    log::logger()->info("operation log: dead letter {} for '{}' discarded",
                        id.to_string(), op.record_id);
    return op;
}

auto OperationLog::resubmit(const OperationId& id) -> bool {
    auto lock = std::scoped_lock{mutex_};
    auto it = find_locked(id);
    if (it == queue_.end() || !it->dead_lettered) return false;
    auto updated = *it;
    updated.dead_lettered = false;
    updated.op.attempt_count = 0;
    persist_upsert_locked(updated);
    *it = std::move(updated);
    log::logger()->info("operation log: dead letter {} for '{}' resubmitted",
                        id.to_string(), it->op.record_id);
    return true;
}

}  // namespace offsync_cpp
