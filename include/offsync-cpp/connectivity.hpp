/// @file connectivity.hpp
/// @brief Network reachability as seen by the sync engine.

#pragma once

#include <offsync-cpp/subscription.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string_view>

namespace offsync_cpp {

/// A reachability transition.
enum class ConnectivityEvent : std::uint8_t {
    online,
    offline,
};

constexpr auto to_string_view(ConnectivityEvent event) noexcept -> std::string_view {
    switch (event) {
        case ConnectivityEvent::online:  return "online";
        case ConnectivityEvent::offline: return "offline";
    }
    return "unknown";
}

using ConnectivityCallback = std::function<void(ConnectivityEvent)>;

/// Reports reachability and notifies on transitions.
///
/// Purely informational: the orchestrator treats it as a hint and
/// re-validates after remote failures.
class ConnectivityMonitor {
public:
    virtual ~ConnectivityMonitor() = default;

    /// Point-in-time reachability.
    virtual auto is_connected() const -> bool = 0;

    /// Register for transitions. Callbacks run on the notifying thread.
    virtual auto on_change(ConnectivityCallback callback) -> Subscription = 0;
};

/// A monitor fed by the host platform.
///
/// The host calls set_connected() from its own reachability signal;
/// listeners are only notified when the value actually changes.
class ManualConnectivityMonitor : public ConnectivityMonitor {
public:
    explicit ManualConnectivityMonitor(bool connected = true);

    auto is_connected() const -> bool override;
    auto on_change(ConnectivityCallback callback) -> Subscription override;

    void set_connected(bool connected);

private:
    mutable std::mutex mutex_;
    bool connected_;
    std::map<std::uint64_t, ConnectivityCallback> listeners_;
    std::uint64_t next_id_{1};
};

}  // namespace offsync_cpp
