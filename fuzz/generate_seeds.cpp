// Helper to generate valid seed corpus files for fuzz_journal_replay.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include <offsync-cpp/offsync.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace offsync_cpp;

static auto note(const std::string& id, const std::string& title) -> Record {
    return Record{.id = id, .updated_at = Timestamp{1000},
                  .fields = {{"title", title}, {"tagIds", nlohmann::json::array({"a", "b"})}}};
}

static void copy_seed(const fs::path& journal, const fs::path& seed) {
    fs::copy_file(journal, seed, fs::copy_options::overwrite_existing);
}

int main() {
    const auto dir = fs::path{"fuzz/corpus"};
    const auto work = fs::temp_directory_path() / "offsync-seeds";
    fs::create_directories(dir);
    fs::remove_all(work);

    // Seed 1: a store with puts, an erase and a batch
    {
        auto store = RecordStore{work / "store"};
        store.put(note("note-1", "Groceries"), SyncState::pending_create);
        store.put(note("note-2", "Trip"), SyncState::clean);
        store.erase("note-2");
        const auto writes = std::vector<RecordWrite>{
            RecordWrite::put(note("note-3", "Books"), SyncState::pending_update),
            RecordWrite::put(note("note-1", "Groceries!"), SyncState::pending_create),
        };
        store.apply_batch(writes);
    }
    copy_seed(work / "store" / "records.journal", dir / "seed_records.bin");

    // Seed 2: the same store after compaction (snapshot chunk)
    {
        auto store = RecordStore{work / "store"};
        store.compact();
    }
    copy_seed(work / "store" / "records.journal", dir / "seed_records_snapshot.bin");

    // Seed 3: an operation log with coalesced, failed and dead-lettered entries
    {
        auto log = OperationLog{work / "log", 0};
        log.enqueue("note-1", OperationKind::create, note("note-1", "A"));
        log.enqueue("note-1", OperationKind::update, note("note-1", "B"));
        auto second = log.enqueue("note-2", OperationKind::update, note("note-2", "C"));
        log.enqueue("note-3", OperationKind::erase, note("note-3", "D").tombstone(Timestamp{2000}));
        if (second.operation) {
            log.dispatch(second.operation->id);
            log.fail(second.operation->id, RemoteErrorKind::server_fault, "503");
        }
    }
    copy_seed(work / "log" / "operations.journal", dir / "seed_operations.bin");

    fs::remove_all(work);
    return 0;
}
