#pragma once

#include <coroutine>
#include <vector>

namespace coroform::testing {

// Awaitable that stays pending until set() is called, then resumes every
// waiter on the calling thread
class ManualEvent {
    bool set_ = false;
    std::vector<std::coroutine_handle<>> waiters_;

public:
    bool is_set() const noexcept { return set_; }
    size_t waiting() const noexcept { return waiters_.size(); }

    void set() {
        set_ = true;
        auto waiters = std::move(waiters_);
        waiters_.clear();
        for (auto h : waiters) {
            h.resume();
        }
    }

    struct Awaiter {
        ManualEvent& event;

        bool await_ready() const noexcept { return event.set_; }
        void await_suspend(std::coroutine_handle<> h) { event.waiters_.push_back(h); }
        void await_resume() const noexcept {}
    };

    Awaiter operator co_await() noexcept { return Awaiter{*this}; }
};

} // namespace coroform::testing
