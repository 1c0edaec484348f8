// offsync-cpp benchmarks: throughput of local writes, queueing and sync.

#include <offsync-cpp/offsync.hpp>

#include <benchmark/benchmark.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <vector>

using namespace offsync_cpp;

static auto make_note(std::int64_t i) -> Record {
    return Record{.id = "note-" + std::to_string(i), .updated_at = Timestamp{i},
                  .fields = {{"title", "Note " + std::to_string(i)},
                             {"tagIds", nlohmann::json::array({"inbox"})}}};
}

static auto scratch_dir() -> std::filesystem::path {
    auto rng = std::random_device{};
    return std::filesystem::temp_directory_path() /
           ("offsync-bench-" + std::to_string(rng()) + std::to_string(rng()));
}

static auto bench_config() -> SyncConfig {
    auto config = SyncConfig{};
    config.poll_interval = std::chrono::milliseconds{0};
    config.log.level = "warn";
    offsync_cpp::log::configure(config.log);
    return config;
}

// =============================================================================
// Record Store
// =============================================================================

static void bm_store_put(benchmark::State& state) {
    auto store = RecordStore{};
    std::int64_t i = 0;
    for (auto _ : state) {
        store.put(make_note(i++ % 1000), SyncState::pending_update);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_store_put);

static void bm_store_put_durable(benchmark::State& state) {
    const auto dir = scratch_dir();
    {
        auto store = RecordStore{dir};
        std::int64_t i = 0;
        for (auto _ : state) {
            store.put(make_note(i++ % 1000), SyncState::pending_update);
        }
    }
    std::filesystem::remove_all(dir);
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_store_put_durable);

static void bm_store_get(benchmark::State& state) {
    auto store = RecordStore{};
    for (std::int64_t i = 0; i < 1000; ++i) store.put(make_note(i), SyncState::clean);
    std::int64_t i = 0;
    for (auto _ : state) {
        auto record = store.get("note-" + std::to_string(i++ % 1000));
        benchmark::DoNotOptimize(record);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_store_get);

static void bm_store_scan(benchmark::State& state) {
    const auto n = state.range(0);
    auto store = RecordStore{};
    for (std::int64_t i = 0; i < n; ++i) store.put(make_note(i), SyncState::clean);
    for (auto _ : state) {
        auto count = std::size_t{0};
        for (const auto& record : store.scan()) {
            benchmark::DoNotOptimize(record);
            ++count;
        }
        benchmark::DoNotOptimize(count);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_store_scan)->Range(100, 10000);

static void bm_store_reopen(benchmark::State& state) {
    const auto n = state.range(0);
    const auto dir = scratch_dir();
    {
        auto store = RecordStore{dir};
        for (std::int64_t i = 0; i < n; ++i) store.put(make_note(i), SyncState::clean);
    }
    for (auto _ : state) {
        auto store = RecordStore{dir};
        benchmark::DoNotOptimize(store.size());
    }
    std::filesystem::remove_all(dir);
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_store_reopen)->Range(100, 10000);

// =============================================================================
// Operation Log
// =============================================================================

static void bm_log_enqueue_distinct(benchmark::State& state) {
    auto log = OperationLog{};
    std::int64_t i = 0;
    for (auto _ : state) {
        auto note = make_note(i++);
        log.enqueue(note.id, OperationKind::create, std::move(note));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_log_enqueue_distinct);

static void bm_log_enqueue_coalesced(benchmark::State& state) {
    auto log = OperationLog{};
    std::int64_t i = 0;
    for (auto _ : state) {
        auto note = make_note(i++ % 16);
        log.enqueue(note.id, OperationKind::update, std::move(note));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_log_enqueue_coalesced);

static void bm_log_peek_batch(benchmark::State& state) {
    auto log = OperationLog{};
    for (std::int64_t i = 0; i < 1000; ++i) {
        auto note = make_note(i);
        log.enqueue(note.id, OperationKind::create, std::move(note));
    }
    for (auto _ : state) {
        auto batch = log.peek_batch(32);
        benchmark::DoNotOptimize(batch);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_log_peek_batch);

// =============================================================================
// Conflict resolution
// =============================================================================

static void bm_field_merge(benchmark::State& state) {
    const auto n = state.range(0);
    auto local = make_note(1);
    auto remote = make_note(2);
    auto local_tags = nlohmann::json::array();
    auto remote_tags = nlohmann::json::array();
    for (std::int64_t i = 0; i < n; ++i) {
        local_tags.push_back("tag-" + std::to_string(i * 2));
        remote_tags.push_back("tag-" + std::to_string(i * 3));
    }
    local.fields["tagIds"] = local_tags;
    remote.fields["tagIds"] = remote_tags;
    auto merge = FieldMerge{{"tagIds"}};
    for (auto _ : state) {
        auto resolved = merge.resolve(local, remote);
        benchmark::DoNotOptimize(resolved);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_field_merge)->Range(8, 512);

// =============================================================================
// Sync cycles
// =============================================================================

static void bm_sync_push_cycle(benchmark::State& state) {
    const auto n = state.range(0);
    auto remote = std::make_shared<InMemoryRemote>();
    auto repo = Repository{bench_config(), remote, std::make_shared<ManualConnectivityMonitor>()};
    std::int64_t next = 0;
    for (auto _ : state) {
        state.PauseTiming();
        for (std::int64_t i = 0; i < n; ++i) repo.create(make_note(next++));
        state.ResumeTiming();
        auto outcome = repo.sync_now();
        benchmark::DoNotOptimize(outcome);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_sync_push_cycle)->Range(10, 1000);

static void bm_sync_pull_cycle(benchmark::State& state) {
    const auto n = state.range(0);
    auto remote = std::make_shared<InMemoryRemote>();
    for (std::int64_t i = 0; i < n; ++i) remote->put_remote(make_note(i));
    for (auto _ : state) {
        auto repo = Repository{bench_config(), remote,
                               std::make_shared<ManualConnectivityMonitor>()};
        auto outcome = repo.sync_now();
        benchmark::DoNotOptimize(outcome);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_sync_pull_cycle)->Range(10, 1000);
