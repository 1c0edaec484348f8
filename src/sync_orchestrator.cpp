#include <offsync-cpp/sync_orchestrator.hpp>

#include <offsync-cpp/log.hpp>

#include "executor.hpp"
#include "storage/deserializer.hpp"
#include "storage/journal.hpp"
#include "storage/serializer.hpp"

#include <algorithm>
#include <functional>
#include <unordered_map>
#include <variant>
#include <vector>

namespace offsync_cpp {

namespace {

constexpr auto checkpoint_file_name = "checkpoint.bin";

auto timeout_error(std::string_view what, std::chrono::milliseconds timeout) -> RemoteError {
    return RemoteError{RemoteErrorKind::network,
                       std::string{what} + " timed out after " +
                           std::to_string(timeout.count()) + " ms",
                       std::nullopt};
}

// User-visible content differs (timestamps and versions ignored).
auto content_differs(const Record& a, const Record& b) -> bool {
    return a.deleted != b.deleted || a.fields != b.fields;
}

}  // namespace

SyncOrchestrator::SyncOrchestrator(RecordStore& store, OperationLog& log,
                                   std::shared_ptr<RemoteGateway> remote,
                                   ConnectivityMonitor& connectivity, SyncConfig config,
                                   std::unique_ptr<ConflictResolver> resolver)
    : store_{store},
      log_{log},
      remote_{std::move(remote)},
      connectivity_{connectivity},
      config_{std::move(config)},
      resolver_{std::move(resolver)},
      backoff_{config_.backoff} {
    if (!remote_) throw std::invalid_argument{"SyncOrchestrator: remote gateway is null"};
    if (!resolver_) {
        resolver_ = make_resolver(config_.conflict.strategy, config_.conflict.union_fields);
    }
    load_checkpoint();
    connectivity_subscription_ = connectivity_.on_change(
        [this](ConnectivityEvent event) { on_connectivity(event); });
}

SyncOrchestrator::~SyncOrchestrator() {
    connectivity_subscription_.reset();
    stop();
}

// -- Lifecycle ----------------------------------------------------------------

void SyncOrchestrator::start() {
    {
        auto lock = std::scoped_lock{state_mutex_};
        if (worker_.joinable() || status_.fatal) return;
        status_.phase = SyncPhase::idle;
        trigger_pending_ = true;
    }
    log::logger()->info("sync: starting worker");
    worker_ = std::jthread{[this](std::stop_token st) { worker_loop(st); }};
    publish_status();
}

void SyncOrchestrator::stop() {
    if (worker_.joinable()) {
        worker_.request_stop();
        wake_.notify_all();
        worker_.join();
        worker_ = std::jthread{};
        log::logger()->info("sync: worker stopped");
    }
    set_phase(SyncPhase::stopped);
}

auto SyncOrchestrator::running() const -> bool {
    auto lock = std::scoped_lock{state_mutex_};
    return worker_.joinable() && !status_.fatal;
}

void SyncOrchestrator::worker_loop(std::stop_token st) {
    while (!st.stop_requested()) {
        {
            auto lock = std::unique_lock{state_mutex_};
            auto triggered = [this] { return trigger_pending_; };
            if (config_.poll_interval.count() > 0) {
                wake_.wait_for(lock, st, config_.poll_interval, triggered);
            } else {
                wake_.wait(lock, st, triggered);
            }
            if (st.stop_requested()) return;
            trigger_pending_ = false;
        }

        auto outcome = cycle(st);
        while (outcome == CycleOutcome::backoff) {
            if (!wait_for_backoff(st, status().backoff_delay)) break;
            outcome = cycle(st);
        }
        if (outcome == CycleOutcome::fatal) return;
    }
}

// Returns true once the delay has elapsed; false if stop was requested or
// an Offline event cancelled the backoff.
auto SyncOrchestrator::wait_for_backoff(std::stop_token st, std::chrono::milliseconds delay)
    -> bool {
    auto lock = std::unique_lock{state_mutex_};
    const auto cancelled = wake_.wait_for(lock, st, delay, [this] { return backoff_cancelled_; });
    if (cancelled || st.stop_requested()) return false;
    return true;
}

// -- Driving ------------------------------------------------------------------

void SyncOrchestrator::trigger() {
    {
        auto lock = std::scoped_lock{state_mutex_};
        trigger_pending_ = true;
    }
    wake_.notify_all();
}

auto SyncOrchestrator::run_cycle() -> CycleOutcome {
    return cycle(std::stop_token{});
}

void SyncOrchestrator::request_full_resync() {
    {
        auto lock = std::scoped_lock{state_mutex_};
        resync_requested_ = true;
    }
    log::logger()->info("sync: full resync requested");
    trigger();
}

auto SyncOrchestrator::cycle(std::stop_token st) -> CycleOutcome {
    auto cycle_lock = std::scoped_lock{cycle_mutex_};

    auto resync = false;
    {
        auto lock = std::scoped_lock{state_mutex_};
        if (status_.fatal) return CycleOutcome::fatal;
        resync = std::exchange(resync_requested_, false);
    }

    if (!connectivity_.is_connected()) {
        set_phase(SyncPhase::idle);
        return CycleOutcome::offline;
    }

    auto finish = [this](Step step) {
        switch (step) {
            case Step::offline:
                set_phase(SyncPhase::idle);
                return CycleOutcome::offline;
            case Step::stopped:
                set_phase(SyncPhase::idle);
                return CycleOutcome::stopped;
            case Step::backoff:
                return CycleOutcome::backoff;
            case Step::next:
                break;
        }
        return CycleOutcome::synced;
    };

    try {
        if (resync) save_checkpoint(SyncCheckpoint{});

        auto pushed = std::size_t{0};
        set_phase(SyncPhase::draining);
        if (auto step = drain(st, pushed); step != Step::next) return finish(step);

        auto applied = std::size_t{0};
        set_phase(SyncPhase::pulling);
        if (auto step = pull(st, applied); step != Step::next) return finish(step);

        record_success();
        log::logger()->info("sync: cycle complete, {} pushed, {} remote changes applied",
                            pushed, applied);
        return CycleOutcome::synced;
    } catch (const StorageError& e) {
        if (!e.is_fatal()) {
            record_failure(Error{ErrorKind::storage_io, e.what()});
            return CycleOutcome::backoff;
        }
        log::logger()->error("sync: stopping on corrupt local state: {}", e.what());
        {
            auto lock = std::scoped_lock{state_mutex_};
            status_.fatal = true;
            status_.phase = SyncPhase::stopped;
            status_.last_error = Error{ErrorKind::storage_corrupt, e.what()};
        }
        publish_status();
        return CycleOutcome::fatal;
    }
}

// -- Draining -----------------------------------------------------------------

auto SyncOrchestrator::drain(std::stop_token st, std::size_t& pushed) -> Step {
    while (true) {
        const auto batch = log_.peek_batch(config_.push_batch_size);
        if (batch.empty()) return Step::next;
        for (const auto& op : batch) {
            if (st.stop_requested()) return Step::stopped;
            if (!connectivity_.is_connected()) return Step::offline;
            if (auto step = push_one(op); step != Step::next) return step;
            ++pushed;
        }
    }
}

auto SyncOrchestrator::push_one(const Operation& queued) -> Step {
    auto current = std::optional<Operation>{};
    {
        auto lock = record_lock(queued.record_id);
        current = log_.dispatch(queued.id);
    }
    if (!current) return Step::next;

    auto result = std::optional<PushResult>{};
    try {
        result = detail::call_with_timeout(
            [remote = remote_, op = *current] { return remote->push(op); },
            config_.remote_timeout);
    } catch (const std::exception& e) {
        result = PushResult{RemoteError{RemoteErrorKind::server_fault, e.what(), std::nullopt}};
    }
    if (!result) result = PushResult{timeout_error("push", config_.remote_timeout)};

    auto lock = record_lock(current->record_id);
    if (const auto* ack = std::get_if<RemoteAck>(&*result)) {
        handle_ack(*current, *ack);
        return Step::next;
    }

    const auto& error = std::get<RemoteError>(*result);
    if (error.kind == RemoteErrorKind::conflict) {
        if (error.remote) {
            handle_conflict(*current, *error.remote);
            return Step::next;
        }
        auto malformed = error;
        malformed.kind = RemoteErrorKind::server_fault;
        malformed.message = "conflict without remote record: " + error.message;
        return handle_push_failure(*current, malformed);
    }
    return handle_push_failure(*current, error);
}

void SyncOrchestrator::handle_ack(const Operation& op, const RemoteAck& ack) {
    log_.ack(op.id);
    const auto later = log_.latest_for(op.record_id);
    const auto entry = store_.get_entry(op.record_id);

    if (later) {
        // Newer local changes are queued: stamp the confirmed version and
        // base them on it.
        log_.rebase(op.record_id, ack.remote_version);
        if (entry) {
            auto record = entry->record;
            record.version = std::max(record.version, ack.remote_version);
            store_.put(std::move(record), entry->state);
        }
    } else if (op.kind == OperationKind::erase) {
        store_.erase(op.record_id);
    } else if (entry) {
        auto record = entry->record;
        record.version = std::max(record.version, ack.remote_version);
        store_.put(std::move(record), SyncState::clean);
    }

    log::logger()->debug("sync: {} {} for '{}' acknowledged at version {}",
                         to_string_view(op.kind), op.id.to_string(), op.record_id,
                         ack.remote_version);
}

void SyncOrchestrator::handle_conflict(const Operation& op, const Record& remote) {
    // The current local record already reflects every later queued change,
    // so one resolution replaces them all.
    log_.ack(op.id);
    log_.supersede(op.record_id);

    const auto entry = store_.get_entry(op.record_id);
    const auto local = entry ? entry->record : op.payload;
    auto resolved = resolver_->resolve(local, remote);

    if (resolved.deleted && remote.deleted) {
        store_.erase(op.record_id);
        log::logger()->info("sync: conflict on '{}': deleted on both sides", op.record_id);
        return;
    }

    if (same_content(resolved, remote)) {
        const auto flag = config_.conflict.flag_for_review && content_differs(local, remote);
        if (remote.deleted && !flag) {
            store_.erase(op.record_id);
        } else {
            store_.put(remote, flag ? SyncState::conflicted : SyncState::clean);
        }
        log::logger()->info("sync: conflict on '{}' resolved to remote version {}{}",
                            op.record_id, remote.version, flag ? ", flagged for review" : "");
        return;
    }

    // The resolution differs from the remote: send it, based on the
    // version the remote reported.
    resolved.version = remote.version;
    const auto kind = resolved.deleted ? OperationKind::erase : OperationKind::update;
    store_.put(resolved, pending_state_for(kind));
    log_.enqueue(op.record_id, kind, std::move(resolved));
    log::logger()->info("sync: conflict on '{}' resolved locally, re-sending as {} on version {}",
                        op.record_id, to_string_view(kind), remote.version);
}

auto SyncOrchestrator::handle_push_failure(const Operation& op, const RemoteError& error) -> Step {
    const auto outcome = log_.fail(op.id, error.kind, error.message);
    log::logger()->warn("sync: push of {} for '{}' failed ({}): {}", op.id.to_string(),
                        op.record_id, to_string_view(error.kind), error.message);

    if (error.kind == RemoteErrorKind::network && !connectivity_.is_connected()) {
        {
            auto lock = std::scoped_lock{state_mutex_};
            status_.last_error = error.to_error();
        }
        return Step::offline;
    }
    if (outcome == FailOutcome::dead_lettered) {
        // Out of the queue's way; keep draining the other records.
        publish_status();
        return Step::next;
    }
    record_failure(error.to_error());
    return Step::backoff;
}

// -- Pulling and reconciling --------------------------------------------------

auto SyncOrchestrator::pull(std::stop_token st, std::size_t& applied) -> Step {
    while (true) {
        if (st.stop_requested()) return Step::stopped;
        if (!connectivity_.is_connected()) return Step::offline;

        const auto from = checkpoint();
        auto result = std::optional<PullResult>{};
        try {
            result = detail::call_with_timeout(
                [remote = remote_, from, n = config_.pull_page_size] {
                    return remote->pull_since(from, n);
                },
                config_.remote_timeout);
        } catch (const std::exception& e) {
            result = PullResult{RemoteError{RemoteErrorKind::server_fault, e.what(), std::nullopt}};
        }
        if (!result) result = PullResult{timeout_error("pull", config_.remote_timeout)};

        if (const auto* error = std::get_if<RemoteError>(&*result)) {
            log::logger()->warn("sync: pull since '{}' failed ({}): {}", from.token,
                                to_string_view(error->kind), error->message);
            if (error->kind == RemoteErrorKind::network && !connectivity_.is_connected()) {
                return Step::offline;
            }
            record_failure(error->to_error());
            return Step::backoff;
        }

        const auto& batch = std::get<PullBatch>(*result);
        set_phase(SyncPhase::reconciling);
        applied += reconcile(batch);
        save_checkpoint(batch.checkpoint);

        if (!batch.has_more || batch.checkpoint == from) return Step::next;
        set_phase(SyncPhase::pulling);
    }
}

auto SyncOrchestrator::reconcile(const PullBatch& batch) -> std::size_t {
    // Decisions are made against the store as it is now, plus earlier
    // changes of this page. Every write is conditional on the entry it was
    // decided against, so a local edit that lands in between wins.
    auto view = std::unordered_map<RecordId, std::optional<StoredRecord>>{};
    auto writes = std::vector<RecordWrite>{};
    auto deferred = std::size_t{0};

    for (const auto& change : batch.changes) {
        const auto& id = change.record_id;
        auto it = view.find(id);
        if (it == view.end()) it = view.emplace(id, store_.get_entry(id)).first;
        const auto current = it->second;

        if (log_.has_pending(id)) {
            ++deferred;
            continue;
        }

        auto remote = change.payload;
        remote.id = id;
        remote.version = change.remote_version;
        remote.deleted = remote.deleted || change.kind == OperationKind::erase;

        auto stage_remote = [&] {
            if (remote.deleted) {
                if (current) writes.push_back(RecordWrite::erase_if(id, current));
                it->second = std::nullopt;
            } else {
                writes.push_back(RecordWrite::put_if(remote, SyncState::clean, current));
                it->second = StoredRecord{remote, SyncState::clean};
            }
        };

        if (!current) {
            if (!remote.deleted) stage_remote();
            continue;
        }

        const auto& local = current->record;
        if (is_pending(current->state) || remote.version < local.version) continue;
        if (remote.version == local.version && same_content(local, remote)) continue;

        const auto clean = current->state == SyncState::clean;
        if (clean && remote.version > local.version) {
            stage_remote();
            continue;
        }

        // Equal versions that diverge, or a record awaiting review. A
        // record under review stays conflicted until acknowledged.
        auto resolved = resolver_->resolve(local, remote);
        if (same_content(resolved, remote) && (clean || remote.deleted)) {
            stage_remote();
            continue;
        }
        resolved.version = remote.version;
        writes.push_back(RecordWrite::put_if(resolved, SyncState::conflicted, current));
        it->second = StoredRecord{std::move(resolved), SyncState::conflicted};
    }

    const auto applied = writes.empty() ? std::size_t{0} : store_.apply_batch(writes);
    log::logger()->debug("sync: reconciled {} remote changes, {} applied, {} deferred",
                         batch.changes.size(), applied, deferred);
    return applied;
}

// -- Checkpoint ---------------------------------------------------------------

void SyncOrchestrator::load_checkpoint() {
    if (config_.data_dir.empty()) return;
    checkpoint_file_ = std::make_unique<storage::Journal>(config_.data_dir / checkpoint_file_name);

    auto loaded = SyncCheckpoint{};
    checkpoint_file_->replay([&](storage::ChunkType type, std::span<const std::byte> body) {
        if (type != storage::ChunkType::checkpoint) return false;
        auto des = storage::Deserializer{body};
        auto token = des.read_string();
        if (!token || !des.at_end()) return false;
        loaded.token = std::move(*token);
        return true;
    });

    auto lock = std::scoped_lock{state_mutex_};
    status_.checkpoint = std::move(loaded);
}

void SyncOrchestrator::save_checkpoint(const SyncCheckpoint& checkpoint) {
    {
        auto lock = std::scoped_lock{state_mutex_};
        if (status_.checkpoint == checkpoint) return;
    }
    if (checkpoint_file_) {
        auto ser = storage::Serializer{};
        ser.write_string(checkpoint.token);
        const auto chunk = storage::PendingChunk{storage::ChunkType::checkpoint, ser.take()};
        checkpoint_file_->rewrite(std::span<const storage::PendingChunk>{&chunk, 1});
    }
    auto lock = std::scoped_lock{state_mutex_};
    status_.checkpoint = checkpoint;
}

auto SyncOrchestrator::checkpoint() const -> SyncCheckpoint {
    auto lock = std::scoped_lock{state_mutex_};
    return status_.checkpoint;
}

// -- Status -------------------------------------------------------------------

auto SyncOrchestrator::status() const -> SyncStatus {
    auto snapshot = SyncStatus{};
    {
        auto lock = std::scoped_lock{state_mutex_};
        snapshot = status_;
    }
    snapshot.pending_operations = log_.pending_count();
    snapshot.dead_letters = log_.dead_lettered().size();
    return snapshot;
}

auto SyncOrchestrator::on_status(StatusCallback callback) -> Subscription {
    auto lock = std::scoped_lock{listeners_mutex_};
    const auto id = next_listener_id_++;
    listeners_.emplace(id, std::move(callback));
    return Subscription{[this, id] {
        auto lock = std::scoped_lock{listeners_mutex_};
        listeners_.erase(id);
    }};
}

void SyncOrchestrator::publish_status() {
    auto targets = std::vector<StatusCallback>{};
    {
        auto lock = std::scoped_lock{listeners_mutex_};
        if (listeners_.empty()) return;
        targets.reserve(listeners_.size());
        for (const auto& [id, cb] : listeners_) targets.push_back(cb);
    }
    const auto snapshot = status();
    for (const auto& cb : targets) cb(snapshot);
}

void SyncOrchestrator::set_phase(SyncPhase phase) {
    {
        auto lock = std::scoped_lock{state_mutex_};
        if (status_.fatal || status_.phase == phase) return;
        status_.phase = phase;
        if (phase != SyncPhase::error_backoff) status_.backoff_delay = std::chrono::milliseconds{0};
    }
    log::logger()->debug("sync: phase {}", to_string_view(phase));
    publish_status();
}

void SyncOrchestrator::record_failure(Error error) {
    auto delay = std::chrono::milliseconds{0};
    auto failures = std::uint32_t{0};
    {
        auto lock = std::scoped_lock{state_mutex_};
        failures = ++status_.consecutive_failures;
        delay = backoff_.delay(failures);
        status_.last_error = error;
        status_.backoff_delay = delay;
        status_.phase = SyncPhase::error_backoff;
        backoff_cancelled_ = false;
    }
    log::logger()->warn("sync: {} ({}), failure {} in a row, retrying in {} ms",
                        error.message, to_string_view(error.kind), failures, delay.count());
    publish_status();
}

void SyncOrchestrator::record_success() {
    {
        auto lock = std::scoped_lock{state_mutex_};
        status_.phase = SyncPhase::idle;
        status_.consecutive_failures = 0;
        status_.last_error.reset();
        status_.backoff_delay = std::chrono::milliseconds{0};
        status_.last_synced_at = Timestamp::now();
    }
    publish_status();
}

void SyncOrchestrator::on_connectivity(ConnectivityEvent event) {
    if (event == ConnectivityEvent::online) {
        trigger();
        return;
    }
    {
        auto lock = std::scoped_lock{state_mutex_};
        backoff_cancelled_ = true;
        if (status_.phase != SyncPhase::stopped && !status_.fatal) {
            status_.phase = SyncPhase::idle;
            status_.backoff_delay = std::chrono::milliseconds{0};
        }
    }
    wake_.notify_all();
    publish_status();
}

// -- Coordination -------------------------------------------------------------

auto SyncOrchestrator::record_lock(std::string_view record_id)
    -> std::unique_lock<std::recursive_mutex> {
    const auto stripe = std::hash<std::string_view>{}(record_id) % lock_stripes;
    return std::unique_lock{record_locks_[stripe]};
}

}  // namespace offsync_cpp
