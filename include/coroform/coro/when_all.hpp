#pragma once

#include <atomic>
#include <coroutine>
#include <cstddef>
#include <exception>
#include <optional>
#include <type_traits>
#include <vector>

#include "coroform/coro/task.hpp"

namespace coroform {

namespace detail {

// Counts outstanding tasks plus one for the awaiting coroutine itself, so
// the awaiting coroutine is resumed only after it has actually suspended.
class WhenAllCounter {
    std::atomic<size_t> count_;
    std::coroutine_handle<> awaiting_;

public:
    explicit WhenAllCounter(size_t tasks) noexcept : count_(tasks + 1) {}

    void set_awaiting(std::coroutine_handle<> h) noexcept { awaiting_ = h; }

    // Returns true if the awaiting coroutine must stay suspended
    bool arm() noexcept {
        return count_.fetch_sub(1, std::memory_order_acq_rel) > 1;
    }

    void notify_complete() noexcept {
        if (count_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            awaiting_.resume();
        }
    }
};

template<typename T>
struct WhenAllSlot {
    std::optional<T> value;
    std::exception_ptr error;
};

template<typename T>
Task<void> when_all_driver(Task<T> task, WhenAllSlot<T>& slot, WhenAllCounter& counter) {
    try {
        slot.value.emplace(co_await std::move(task));
    } catch (...) {
        // Rethrown by when_all once every sibling has finished
        slot.error = std::current_exception();
    }
    counter.notify_complete();
}

template<typename T>
struct WhenAllAwaiter {
    std::vector<Task<T>>& tasks;
    std::vector<WhenAllSlot<T>>& slots;
    WhenAllCounter& counter;

    bool await_ready() const noexcept { return tasks.empty(); }

    bool await_suspend(std::coroutine_handle<> h) {
        counter.set_awaiting(h);
        for (size_t i = 0; i < tasks.size(); ++i) {
            when_all_driver(std::move(tasks[i]), slots[i], counter).start_detached();
        }
        return counter.arm();
    }

    void await_resume() const noexcept {}
};

} // namespace detail

// ============================================================================
// when_all - Fan-out / fan-in over a set of tasks
// ============================================================================

// Every task is started before any result is consumed. The returned task
// completes once all of them have completed; results keep the input order.
// If any task threw, the first exception in input order is rethrown after
// the remaining tasks have finished.
template<typename T>
Task<std::vector<T>> when_all(std::vector<Task<T>> tasks) {
    static_assert(!std::is_void_v<T>, "when_all requires tasks with a result");

    std::vector<detail::WhenAllSlot<T>> slots(tasks.size());
    detail::WhenAllCounter counter(tasks.size());

    co_await detail::WhenAllAwaiter<T>{tasks, slots, counter};

    for (auto& slot : slots) {
        if (slot.error) {
            std::rethrow_exception(slot.error);
        }
    }

    std::vector<T> results;
    results.reserve(slots.size());
    for (auto& slot : slots) {
        results.push_back(std::move(*slot.value));
    }
    co_return results;
}

} // namespace coroform
