/// @file subscription.hpp
/// @brief RAII handle for publish/subscribe registrations.

#pragma once

#include <functional>
#include <utility>

namespace offsync_cpp {

/// Keeps a listener registered for as long as it is alive.
///
/// Returned by RecordStore::watch(), ConnectivityMonitor::on_change() and
/// SyncOrchestrator::on_status(). Destroying or reset()ing the handle
/// unregisters the listener; the publisher must outlive the handle.
class Subscription {
public:
    Subscription() = default;

    explicit Subscription(std::function<void()> cancel)
        : cancel_{std::move(cancel)} {}

    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    auto operator=(const Subscription&) -> Subscription& = delete;

    Subscription(Subscription&& other) noexcept
        : cancel_{std::exchange(other.cancel_, nullptr)} {}

    auto operator=(Subscription&& other) noexcept -> Subscription& {
        if (this != &other) {
            reset();
            cancel_ = std::exchange(other.cancel_, nullptr);
        }
        return *this;
    }

    /// Unregister now. Idempotent.
    void reset() {
        if (auto cancel = std::exchange(cancel_, nullptr)) cancel();
    }

    /// True while the listener is registered.
    auto active() const -> bool { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};

}  // namespace offsync_cpp
