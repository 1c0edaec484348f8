// two_devices — concurrent edits on two devices converging
//
// Demonstrates: shared remote, field_merge conflict resolution,
//               sync_now, flag_for_review and acknowledge_conflict

#include <offsync-cpp/offsync.hpp>

#include <chrono>
#include <cstdio>
#include <memory>
#include <string>

namespace os = offsync_cpp;

static auto make_config(os::ConflictStrategy strategy, bool flag_for_review) -> os::SyncConfig {
    auto config = os::SyncConfig{};
    config.poll_interval = std::chrono::milliseconds{0};
    config.conflict.strategy = strategy;
    config.conflict.union_fields = {"tagIds"};
    config.conflict.flag_for_review = flag_for_review;
    return config;
}

static void show(const char* device, os::Repository& repo, const std::string& id) {
    auto record = repo.get(id);
    if (!record) {
        std::printf("  %-7s (none)\n", device);
        return;
    }
    std::printf("  %-7s v%llu %s tags=%s [%s]\n", device,
                static_cast<unsigned long long>(record->version),
                record->fields.value("title", "").c_str(),
                record->fields.value("tagIds", nlohmann::json::array()).dump().c_str(),
                std::string{os::to_string_view(*repo.sync_state(id))}.c_str());
}

int main() {
    os::log::configure(os::LogConfig{.level = "warn"});
    auto remote = std::make_shared<os::InMemoryRemote>();

    // --- Scenario 1: both devices tag the same note ---
    std::printf("=== Scenario 1: field merge ===\n");
    {
        auto config = make_config(os::ConflictStrategy::field_merge, false);
        auto phone = os::Repository{config, remote, std::make_shared<os::ManualConnectivityMonitor>()};
        auto laptop = os::Repository{config, remote, std::make_shared<os::ManualConnectivityMonitor>()};

        phone.create(os::Record{.id = "trip", .fields = {{"title", "Trip"},
                                                         {"tagIds", nlohmann::json::array({"travel"})}}});
        phone.sync_now();
        laptop.sync_now();

        auto on_phone = *phone.get("trip");
        on_phone.fields["tagIds"].push_back("family");
        phone.update(on_phone);

        auto on_laptop = *laptop.get("trip");
        on_laptop.fields["title"] = "Trip to Lisbon";
        on_laptop.fields["tagIds"].push_back("2025");
        laptop.update(on_laptop);

        phone.sync_now();
        laptop.sync_now();
        phone.sync_now();

        show("phone", phone, "trip");
        show("laptop", laptop, "trip");
    }

    // --- Scenario 2: the losing side is flagged for review ---
    std::printf("\n=== Scenario 2: flag for review ===\n");
    {
        auto config = make_config(os::ConflictStrategy::last_write_wins, true);
        auto phone = os::Repository{config, remote, std::make_shared<os::ManualConnectivityMonitor>()};
        auto laptop = os::Repository{config, remote, std::make_shared<os::ManualConnectivityMonitor>()};
        phone.sync_now();
        laptop.sync_now();

        auto on_laptop = *laptop.get("trip");
        on_laptop.fields["title"] = "Trip (laptop)";
        laptop.update(on_laptop);

        auto on_phone = *phone.get("trip");
        on_phone.fields["title"] = "Trip (phone)";
        phone.update(on_phone);

        phone.sync_now();
        laptop.sync_now();

        show("phone", phone, "trip");
        show("laptop", laptop, "trip");
        for (const auto& record : laptop.conflicted_records()) {
            std::printf("  laptop must review '%s'\n", record.id.c_str());
            laptop.acknowledge_conflict(record.id);
        }
        show("laptop", laptop, "trip");
    }
    return 0;
}
