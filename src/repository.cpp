#include <offsync-cpp/repository.hpp>

#include <offsync-cpp/log.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace offsync_cpp {

namespace {

auto is_live(const std::optional<StoredRecord>& entry) -> bool {
    return entry && !entry->record.deleted;
}

auto kind_for_pending(SyncState state) -> std::optional<OperationKind> {
    switch (state) {
        case SyncState::pending_create: return OperationKind::create;
        case SyncState::pending_update: return OperationKind::update;
        case SyncState::pending_delete: return OperationKind::erase;
        default:                        return std::nullopt;
    }
}

}  // namespace

Repository::Repository(SyncConfig config, std::shared_ptr<RemoteGateway> remote,
                       std::shared_ptr<ConnectivityMonitor> connectivity, Clock clock)
    : clock_{std::move(clock)}, connectivity_{std::move(connectivity)} {
    if (!connectivity_) throw std::invalid_argument{"Repository: connectivity monitor is null"};
    if (!clock_) clock_ = Timestamp::now;

    if (config.data_dir.empty()) {
        store_ = std::make_unique<RecordStore>();
        log_ = std::make_unique<OperationLog>(config.max_attempts);
    } else {
        store_ = std::make_unique<RecordStore>(config.data_dir);
        log_ = std::make_unique<OperationLog>(config.data_dir, config.max_attempts);
    }
    log::logger()->info("repository: opened {} ({} records, {} queued operations)",
                        config.data_dir.empty() ? std::string{"in memory"}
                                                : config.data_dir.string(),
                        store_->size(), log_->pending_count());

    requeue_unqueued_writes();
    orchestrator_ = std::make_unique<SyncOrchestrator>(*store_, *log_, std::move(remote),
                                                       *connectivity_, std::move(config));
}

Repository::~Repository() {
    if (orchestrator_) orchestrator_->stop();
}

// -- Mutations ----------------------------------------------------------------

auto Repository::create(Record record) -> Record {
    auto lock = orchestrator_->record_lock(record.id);
    const auto previous = store_->get_entry(record.id);
    if (is_live(previous)) {
        throw std::invalid_argument{"create: record '" + record.id + "' already exists"};
    }
    record.deleted = false;
    stamp(record, previous);
    write_and_enqueue(record, OperationKind::create, previous);
    return record;
}

auto Repository::update(Record record) -> Record {
    auto lock = orchestrator_->record_lock(record.id);
    const auto previous = store_->get_entry(record.id);
    if (!is_live(previous)) {
        throw std::invalid_argument{"update: no record '" + record.id + "'"};
    }
    record.deleted = false;
    stamp(record, previous);
    write_and_enqueue(record, OperationKind::update, previous);
    return record;
}

void Repository::erase(std::string_view id) {
    auto lock = orchestrator_->record_lock(id);
    const auto previous = store_->get_entry(id);
    if (!is_live(previous)) {
        throw std::invalid_argument{"erase: no record '" + std::string{id} + "'"};
    }
    auto tombstone = previous->record.tombstone(previous->record.updated_at);
    stamp(tombstone, previous);
    write_and_enqueue(std::move(tombstone), OperationKind::erase, previous);
}

// updated_at strictly increases per record even if the clock steps back.
void Repository::stamp(Record& record, const std::optional<StoredRecord>& previous) const {
    auto now = clock_();
    if (previous) {
        const auto floor = Timestamp{previous->record.updated_at.millis_since_epoch + 1};
        now = std::max(now, floor);
        record.version = previous->record.version;
    } else {
        record.version = 0;
    }
    record.updated_at = now;
}

void Repository::write_and_enqueue(Record record, OperationKind kind,
                                   const std::optional<StoredRecord>& previous) {
    const auto id = record.id;
    const auto queued = log_->preview(id, kind);

    if (queued) {
        store_->put(record, pending_state_for(*queued));
    } else {
        // A create that never reached the remote, deleted again.
        store_->erase(id);
    }

    try {
        auto result = log_->enqueue(id, kind, std::move(record));
        log::logger()->debug("repository: {} '{}' {}", to_string_view(kind), id,
                             to_string_view(result.outcome));
    } catch (const StorageError& e) {
        log::logger()->error("repository: enqueue of {} '{}' failed, rolling back: {}",
                             to_string_view(kind), id, e.what());
        try {
            if (previous) {
                store_->put(previous->record, previous->state);
            } else {
                store_->erase(id);
            }
        } catch (const StorageError& rollback) {
            // Left pending without a queued operation; requeued on next open.
            log::logger()->error("repository: rollback of '{}' failed: {}", id, rollback.what());
        }
        throw;
    }

    if (orchestrator_->running()) orchestrator_->trigger();
}

void Repository::requeue_unqueued_writes() {
    const auto orphans = store_->scan_entries([this](const StoredRecord& entry) {
        return is_pending(entry.state) && !log_->has_pending(entry.record.id);
    });
    for (const auto& entry : orphans) {
        const auto kind = kind_for_pending(entry.state);
        log_->enqueue(entry.record.id, *kind, entry.record);
    }
    if (!orphans.empty()) {
        log::logger()->warn("repository: requeued {} local writes without a queued operation",
                            orphans.size());
    }
}

// -- Reads --------------------------------------------------------------------

auto Repository::get(std::string_view id) const -> std::optional<Record> {
    auto record = store_->get(id);
    if (record && record->deleted) return std::nullopt;
    return record;
}

auto Repository::query(RecordPredicate pred) const -> RecordRange {
    return store_->scan([pred = std::move(pred)](const Record& record) {
        return !record.deleted && (!pred || pred(record));
    });
}

auto Repository::watch(RecordPredicate pred, ChangeCallback callback) -> Subscription {
    return store_->watch(std::move(pred), std::move(callback));
}

auto Repository::sync_state(std::string_view id) const -> std::optional<SyncState> {
    if (auto entry = store_->get_entry(id)) return entry->state;
    return std::nullopt;
}

// -- Sync control -------------------------------------------------------------

void Repository::start() { orchestrator_->start(); }

void Repository::stop() { orchestrator_->stop(); }

void Repository::trigger_sync() { orchestrator_->trigger(); }

auto Repository::sync_now() -> CycleOutcome { return orchestrator_->run_cycle(); }

auto Repository::sync_status() const -> SyncStatus { return orchestrator_->status(); }

auto Repository::on_sync_status(StatusCallback callback) -> Subscription {
    return orchestrator_->on_status(std::move(callback));
}

auto Repository::pending_operation_count() const -> std::size_t {
    return log_->pending_count();
}

auto Repository::dead_lettered_operations() const -> std::vector<Operation> {
    return log_->dead_lettered();
}

auto Repository::discard_dead_letter(const OperationId& id) -> bool {
    const auto op = log_->get(id);
    if (!op) return false;

    auto lock = orchestrator_->record_lock(op->record_id);
    if (!log_->discard(id)) return false;

    if (!log_->has_pending(op->record_id)) {
        if (auto entry = store_->get_entry(op->record_id); entry && is_pending(entry->state)) {
            store_->put(entry->record, SyncState::conflicted);
        }
    }
    log::logger()->info("repository: discarded dead letter {} for '{}'", id.to_string(),
                        op->record_id);
    return true;
}

auto Repository::retry_dead_letter(const OperationId& id) -> bool {
    if (!log_->resubmit(id)) return false;
    log::logger()->info("repository: resubmitted dead letter {}", id.to_string());
    orchestrator_->trigger();
    return true;
}

auto Repository::conflicted_records() const -> std::vector<Record> {
    auto records = std::vector<Record>{};
    for (auto& entry : store_->scan_entries([](const StoredRecord& e) {
             return e.state == SyncState::conflicted;
         })) {
        records.push_back(std::move(entry.record));
    }
    return records;
}

auto Repository::acknowledge_conflict(std::string_view id) -> bool {
    auto lock = orchestrator_->record_lock(id);
    const auto entry = store_->get_entry(id);
    if (!entry || entry->state != SyncState::conflicted) return false;

    if (entry->record.deleted) {
        store_->erase(id);
    } else {
        store_->put(entry->record, SyncState::clean);
    }
    return true;
}

}  // namespace offsync_cpp
