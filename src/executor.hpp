#pragma once

// Process-global Taskflow executor for remote calls.
//
// The orchestrator's worker submits every push and pull through
// call_with_timeout() so a hung transport never blocks it for longer than
// the configured remote timeout. A call that outlives the timeout keeps
// running on the executor; its result is discarded.
//
// Internal header — not installed.

#include <taskflow/taskflow.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace offsync_cpp::detail {

// Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

// Run fn() on the global executor and wait at most `timeout` for it.
// Returns nullopt on timeout. Exceptions thrown by fn propagate.
template <typename Fn>
auto call_with_timeout(Fn&& fn, std::chrono::milliseconds timeout)
    -> std::optional<std::invoke_result_t<Fn>> {
    using Result = std::invoke_result_t<Fn>;
    // The promise is shared so an abandoned call can still complete it.
    auto promise = std::make_shared<std::promise<Result>>();
    auto future = promise->get_future();
    global_executor().silent_async([promise, fn = std::forward<Fn>(fn)]() mutable {
        try {
            promise->set_value(fn());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });
    if (future.wait_for(timeout) != std::future_status::ready) {
        return std::nullopt;
    }
    return future.get();
}

}  // namespace offsync_cpp::detail
