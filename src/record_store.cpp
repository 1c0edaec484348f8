#include <offsync-cpp/record_store.hpp>

#include <offsync-cpp/error.hpp>
#include <offsync-cpp/log.hpp>

#include "storage/compression.hpp"
#include "storage/deserializer.hpp"
#include "storage/journal.hpp"
#include "storage/serializer.hpp"

#include <algorithm>
#include <atomic>

namespace offsync_cpp {

namespace {

constexpr auto journal_file_name = "records.journal";

// Compact once the journal holds this many chunks and four times the live count.
constexpr std::size_t compact_min_chunks = 1024;
constexpr std::size_t compact_ratio = 4;

enum : std::uint8_t { batch_put = 0, batch_erase = 1 };

auto encode_write(const RecordWrite& write) -> storage::PendingChunk {
    auto ser = storage::Serializer{};
    if (write.entry) {
        ser.write_stored_record(*write.entry);
        return {storage::ChunkType::record_put, ser.take()};
    }
    ser.write_string(write.id);
    return {storage::ChunkType::record_erase, ser.take()};
}

auto encode_batch(std::span<const RecordWrite> writes) -> storage::PendingChunk {
    auto ser = storage::Serializer{};
    ser.write_uleb128(writes.size());
    for (const auto& write : writes) {
        if (write.entry) {
            ser.write_u8(batch_put);
            ser.write_stored_record(*write.entry);
        } else {
            ser.write_u8(batch_erase);
            ser.write_string(write.id);
        }
    }
    return {storage::ChunkType::record_batch, ser.take()};
}

}  // namespace

struct RecordStore::Watcher {
    RecordPredicate pred;
    ChangeCallback callback;
    std::atomic<bool> active{true};
};

RecordStore::RecordStore() = default;

RecordStore::RecordStore(const std::filesystem::path& dir)
    : journal_{std::make_unique<storage::Journal>(dir / journal_file_name)} {
    replay();
}

RecordStore::~RecordStore() = default;

// -- Replay and compaction ----------------------------------------------------

void RecordStore::replay() {
    auto apply_put = [this](storage::Deserializer& des) {
        auto entry = des.read_stored_record();
        if (!entry) return false;
        auto id = entry->record.id;
        entries_.insert_or_assign(std::move(id), std::move(*entry));
        return true;
    };
    auto apply_erase = [this](storage::Deserializer& des) {
        auto id = des.read_string();
        if (!id) return false;
        entries_.erase(*id);
        return true;
    };

    auto stats = journal_->replay([&](storage::ChunkType type, std::span<const std::byte> body) {
        auto des = storage::Deserializer{body};
        switch (type) {
            case storage::ChunkType::record_put:
                return apply_put(des) && des.at_end();
            case storage::ChunkType::record_erase:
                return apply_erase(des) && des.at_end();
            case storage::ChunkType::record_batch: {
                auto count = des.read_uleb128();
                if (!count) return false;
                for (std::uint64_t i = 0; i < *count; ++i) {
                    auto tag = des.read_u8();
                    if (!tag) return false;
                    if (*tag == batch_put) {
                        if (!apply_put(des)) return false;
                    } else if (*tag == batch_erase) {
                        if (!apply_erase(des)) return false;
                    } else {
                        return false;
                    }
                }
                return des.at_end();
            }
            case storage::ChunkType::record_snapshot: {
                auto compressed = des.read_bool();
                auto raw_size = des.read_uleb128();
                auto blob = des.read_blob();
                if (!compressed || !raw_size || !blob || !des.at_end()) return false;

                auto inflated = std::optional<std::vector<std::byte>>{};
                if (*compressed) {
                    inflated = storage::deflate_decompress(*blob, static_cast<std::size_t>(*raw_size));
                    if (!inflated) return false;
                }
                auto inner = storage::Deserializer{
                    inflated ? std::span<const std::byte>{*inflated} : *blob};
                auto count = inner.read_uleb128();
                if (!count) return false;
                entries_.clear();
                for (std::uint64_t i = 0; i < *count; ++i) {
                    if (!apply_put(inner)) return false;
                }
                return inner.at_end();
            }
            default:
                return false;
        }
    });

    log::logger()->debug("record store: replayed {} chunks, {} records",
                         stats.chunks, entries_.size());
    maybe_compact_locked();
}

void RecordStore::write_snapshot_locked() {
    auto inner = storage::Serializer{};
    inner.write_uleb128(entries_.size());
    for (const auto& [id, entry] : entries_) {
        inner.write_stored_record(entry);
    }
    const auto& raw = inner.data();

    auto body = storage::Serializer{};
    auto compressed = std::optional<std::vector<std::byte>>{};
    if (raw.size() >= storage::deflate_threshold) {
        compressed = storage::deflate_compress(raw);
    }
    body.write_bool(compressed.has_value());
    body.write_uleb128(raw.size());
    body.write_blob(compressed ? std::span<const std::byte>{*compressed}
                               : std::span<const std::byte>{raw});

    const auto chunk = storage::PendingChunk{storage::ChunkType::record_snapshot, body.take()};
    journal_->rewrite(std::span<const storage::PendingChunk>{&chunk, 1});
}

void RecordStore::maybe_compact_locked() {
    if (!journal_) return;
    const auto chunks = journal_->chunk_count();
    if (chunks < compact_min_chunks || chunks < compact_ratio * entries_.size()) return;
    log::logger()->info("record store: compacting {} journal chunks into {} records",
                        chunks, entries_.size());
    write_snapshot_locked();
}

void RecordStore::compact() {
    auto lock = std::unique_lock{mutex_};
    if (!journal_) return;
    write_snapshot_locked();
}

// -- Reading ------------------------------------------------------------------

auto RecordStore::get(std::string_view id) const -> std::optional<Record> {
    auto lock = std::shared_lock{mutex_};
    auto it = entries_.find(RecordId{id});
    if (it == entries_.end()) return std::nullopt;
    return it->second.record;
}

auto RecordStore::get_entry(std::string_view id) const -> std::optional<StoredRecord> {
    auto lock = std::shared_lock{mutex_};
    auto it = entries_.find(RecordId{id});
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

auto RecordStore::contains(std::string_view id) const -> bool {
    auto lock = std::shared_lock{mutex_};
    return entries_.contains(RecordId{id});
}

auto RecordStore::size() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return entries_.size();
}

auto RecordStore::scan(RecordPredicate pred) const -> RecordRange {
    auto snapshot = std::make_shared<std::vector<StoredRecord>>();
    {
        auto lock = std::shared_lock{mutex_};
        snapshot->reserve(entries_.size());
        for (const auto& [id, entry] : entries_) snapshot->push_back(entry);
    }
    std::ranges::sort(*snapshot, {}, [](const StoredRecord& e) -> const RecordId& {
        return e.record.id;
    });

    auto entry_pred = RecordRange::EntryPredicate{};
    if (pred) {
        entry_pred = [pred = std::move(pred)](const StoredRecord& e) { return pred(e.record); };
    }
    return RecordRange{std::move(snapshot), std::move(entry_pred)};
}

auto RecordStore::scan_entries(const std::function<bool(const StoredRecord&)>& pred) const
    -> std::vector<StoredRecord> {
    auto result = std::vector<StoredRecord>{};
    {
        auto lock = std::shared_lock{mutex_};
        for (const auto& [id, entry] : entries_) {
            if (!pred || pred(entry)) result.push_back(entry);
        }
    }
    std::ranges::sort(result, {}, [](const StoredRecord& e) -> const RecordId& {
        return e.record.id;
    });
    return result;
}

auto RecordStore::stats() const -> StoreStats {
    auto lock = std::shared_lock{mutex_};
    auto stats = StoreStats{};
    stats.records = entries_.size();
    stats.journal_chunks = journal_ ? journal_->chunk_count() : 0;
    stats.last_sequence = sequence_;
    for (const auto& [id, entry] : entries_) {
        if (entry.record.deleted) ++stats.tombstones;
        ++stats.by_state[static_cast<std::size_t>(entry.state)];
    }
    return stats;
}

// -- Writing ------------------------------------------------------------------

auto RecordStore::apply_locked(std::span<const RecordWrite> writes) -> ChangeBatch {
    // Normalize against the current state plus earlier writes of this batch,
    // so the journal holds exactly what memory will hold.
    auto staged = std::unordered_map<RecordId, std::optional<StoredRecord>>{};
    auto lookup = [&](const RecordId& id) -> const StoredRecord* {
        if (auto s = staged.find(id); s != staged.end()) {
            return s->second ? &*s->second : nullptr;
        }
        auto it = entries_.find(id);
        return it != entries_.end() ? &it->second : nullptr;
    };

    auto normalized = std::vector<RecordWrite>{};
    auto batch = ChangeBatch{};
    for (const auto& write : writes) {
        const auto* existing = lookup(write.id);
        if (write.conditional) {
            const auto matches = existing ? (write.expected && *existing == *write.expected)
                                          : !write.expected.has_value();
            if (!matches) continue;
        }
        if (!write.entry) {
            if (!existing) continue;
            batch.push_back(RecordChange{.sequence = 0, .kind = ChangeKind::deleted,
                                         .record = existing->record, .state = existing->state});
            normalized.push_back(write);
            staged[write.id] = std::nullopt;
            continue;
        }

        auto entry = *write.entry;
        if (existing) {
            entry.record.version = std::max(entry.record.version, existing->record.version);
        }

        auto kind = ChangeKind::updated;
        if (entry.record.deleted || entry.state == SyncState::pending_delete) {
            kind = ChangeKind::deleted;
        } else if (!existing || existing->record.deleted) {
            kind = ChangeKind::created;
        }

        batch.push_back(RecordChange{.sequence = 0, .kind = kind,
                                     .record = entry.record, .state = entry.state});
        staged[write.id] = entry;
        normalized.push_back(RecordWrite{write.id, std::move(entry)});
    }

    if (normalized.empty()) return {};

    if (journal_) {
        if (normalized.size() == 1) {
            const auto chunk = encode_write(normalized.front());
            journal_->append(std::span<const storage::PendingChunk>{&chunk, 1});
        } else {
            const auto chunk = encode_batch(normalized);
            journal_->append(std::span<const storage::PendingChunk>{&chunk, 1});
        }
    }

    for (auto& write : normalized) {
        if (write.entry) {
            entries_.insert_or_assign(write.id, std::move(*write.entry));
        } else {
            entries_.erase(write.id);
        }
    }
    for (auto& change : batch) change.sequence = ++sequence_;

    maybe_compact_locked();
    return batch;
}

void RecordStore::put(Record record, SyncState state) {
    const auto write = RecordWrite::put(std::move(record), state);
    apply_batch(std::span<const RecordWrite>{&write, 1});
}

auto RecordStore::erase(std::string_view id) -> bool {
    const auto write = RecordWrite::erase(RecordId{id});
    auto erased = false;
    {
        auto lock = std::unique_lock{mutex_};
        auto batch = apply_locked(std::span<const RecordWrite>{&write, 1});
        erased = !batch.empty();
        if (erased) enqueue_notification_locked(std::move(batch));
    }
    deliver_notifications();
    return erased;
}

auto RecordStore::apply_batch(std::span<const RecordWrite> writes) -> std::size_t {
    auto applied = std::size_t{0};
    {
        auto lock = std::unique_lock{mutex_};
        auto batch = apply_locked(writes);
        applied = batch.size();
        if (!batch.empty()) enqueue_notification_locked(std::move(batch));
    }
    deliver_notifications();
    return applied;
}

// -- Change stream ------------------------------------------------------------

auto RecordStore::watch(RecordPredicate pred, ChangeCallback callback) -> Subscription {
    auto watcher = std::make_shared<Watcher>();
    watcher->pred = std::move(pred);
    watcher->callback = std::move(callback);

    auto lock = std::scoped_lock{watchers_mutex_};
    const auto id = next_watcher_id_++;
    watchers_.emplace(id, watcher);
    return Subscription{[this, id, weak = std::weak_ptr<Watcher>{watcher}] {
        if (auto w = weak.lock()) w->active.store(false);
        auto lock = std::scoped_lock{watchers_mutex_};
        watchers_.erase(id);
    }};
}

// Called with mutex_ held so the outbox order equals the sequence order.
void RecordStore::enqueue_notification_locked(ChangeBatch batch) {
    auto lock = std::scoped_lock{publish_mutex_};
    outbox_.push_back(std::move(batch));
}

// Whichever thread finds the outbox idle drains it; batches queued meanwhile
// (including by callbacks writing to the store) are delivered by that thread
// in order.
void RecordStore::deliver_notifications() {
    {
        auto lock = std::scoped_lock{publish_mutex_};
        if (publishing_) return;
        publishing_ = true;
    }

    while (true) {
        auto batch = ChangeBatch{};
        {
            auto lock = std::scoped_lock{publish_mutex_};
            if (outbox_.empty()) {
                publishing_ = false;
                return;
            }
            batch = std::move(outbox_.front());
            outbox_.pop_front();
        }

        auto targets = std::vector<std::shared_ptr<Watcher>>{};
        {
            auto lock = std::scoped_lock{watchers_mutex_};
            targets.reserve(watchers_.size());
            for (const auto& [id, w] : watchers_) targets.push_back(w);
        }

        for (const auto& w : targets) {
            if (!w->active.load()) continue;
            auto filtered = ChangeBatch{};
            for (const auto& change : batch) {
                if (!w->pred || w->pred(change.record)) filtered.push_back(change);
            }
            if (filtered.empty()) continue;
            try {
                w->callback(filtered);
            } catch (const std::exception& e) {
                log::logger()->error("record store: watcher threw: {}", e.what());
            }
        }
    }
}

}  // namespace offsync_cpp
