#include <offsync-cpp/connectivity.hpp>

#include <offsync-cpp/log.hpp>

#include <vector>

namespace offsync_cpp {

ManualConnectivityMonitor::ManualConnectivityMonitor(bool connected)
    : connected_{connected} {}

auto ManualConnectivityMonitor::is_connected() const -> bool {
    auto lock = std::scoped_lock{mutex_};
    return connected_;
}

auto ManualConnectivityMonitor::on_change(ConnectivityCallback callback) -> Subscription {
    auto lock = std::scoped_lock{mutex_};
    const auto id = next_id_++;
    listeners_.emplace(id, std::move(callback));
    return Subscription{[this, id] {
        auto lock = std::scoped_lock{mutex_};
        listeners_.erase(id);
    }};
}

void ManualConnectivityMonitor::set_connected(bool connected) {
    auto targets = std::vector<ConnectivityCallback>{};
    {
        auto lock = std::scoped_lock{mutex_};
        if (connected_ == connected) return;
        connected_ = connected;
        targets.reserve(listeners_.size());
        for (const auto& [id, cb] : listeners_) targets.push_back(cb);
    }

    const auto event = connected ? ConnectivityEvent::online : ConnectivityEvent::offline;
    log::logger()->info("connectivity: {}", to_string_view(event));
    for (const auto& cb : targets) cb(event);
}

}  // namespace offsync_cpp
