// offline_notes — a notes app that keeps working without a network
//
// Demonstrates: load_config, log::configure, Repository, queued writes,
//               watch, reconnecting, JSON export
//
// Usage: offline_notes [config.json]

#include <offsync-cpp/json.hpp>
#include <offsync-cpp/offsync.hpp>

#include <chrono>
#include <cstdio>
#include <exception>
#include <memory>
#include <string>
#include <thread>

namespace os = offsync_cpp;

static auto note(std::string id, std::string title) -> os::Record {
    return os::Record{.id = std::move(id), .fields = {{"title", std::move(title)}}};
}

static void print_notes(const os::Repository& repo) {
    for (const auto& record : repo.query()) {
        const auto state = repo.sync_state(record.id).value_or(os::SyncState::clean);
        std::printf("  %-8s v%-3llu %-16s %s\n", record.id.c_str(),
                    static_cast<unsigned long long>(record.version),
                    std::string{os::to_string_view(state)}.c_str(),
                    record.fields.value("title", "").c_str());
    }
}

static auto wait_until_idle(os::Repository& repo) -> bool {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
    while (std::chrono::steady_clock::now() < deadline) {
        if (repo.pending_operation_count() == 0 &&
            repo.sync_status().phase == os::SyncPhase::idle) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
    }
    return false;
}

int main(int argc, char** argv) {
    auto config = os::SyncConfig{};
    try {
        if (argc > 1) config = os::load_config(argv[1]);
        os::log::configure(config.log);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "offline_notes: %s\n", e.what());
        return 1;
    }

    auto remote = std::make_shared<os::InMemoryRemote>();
    auto network = std::make_shared<os::ManualConnectivityMonitor>(false);
    auto repo = os::Repository{config, remote, network};

    auto changes = repo.watch(nullptr, [](const os::ChangeBatch& batch) {
        for (const auto& change : batch) {
            std::printf("  [watch] #%llu %s %s (%s)\n",
                        static_cast<unsigned long long>(change.sequence),
                        std::string{os::to_string_view(change.kind)}.c_str(),
                        change.record.id.c_str(),
                        std::string{os::to_string_view(change.state)}.c_str());
        }
    });
    repo.start();

    // --- Offline: writes land locally and queue up ---
    std::printf("=== Offline ===\n");
    repo.create(note("groceries", "Milk, eggs"));
    repo.create(note("trip", "Lisbon in May"));
    repo.create(note("scratch", "delete me"));
    repo.update(note("groceries", "Milk, eggs, bread"));
    repo.erase("scratch");
    std::printf("Pending operations: %zu\n", repo.pending_operation_count());
    print_notes(repo);

    // --- Another client edits the server meanwhile ---
    remote->put_remote(os::Record{.id = "books", .updated_at = os::Timestamp::now(),
                                  .fields = {{"title", "Dune"}}});

    // --- Back online: the queue drains and remote changes arrive ---
    std::printf("\n=== Online ===\n");
    network->set_connected(true);
    if (!wait_until_idle(repo)) {
        std::fprintf(stderr, "offline_notes: sync did not settle\n");
    }
    std::printf("Pending operations: %zu, remote pushes applied: %zu\n",
                repo.pending_operation_count(), remote->applied_pushes());
    print_notes(repo);

    // --- Status and export ---
    std::printf("\n=== Status ===\n%s\n", nlohmann::json(repo.sync_status()).dump(2).c_str());
    std::printf("\n=== Export ===\n%s\n", os::export_json(repo.store()).dump(2).c_str());

    repo.stop();
    return 0;
}
