#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace coroform {

template<typename T = void>
class Task;

namespace detail {

// ============================================================================
// Task Promise Base
// ============================================================================

struct TaskPromiseBase {
    std::coroutine_handle<> continuation_ = std::noop_coroutine();
    std::exception_ptr exception_;
    bool detached_ = false;  // If true, self-destroy on completion

    struct FinalAwaiter {
        bool await_ready() const noexcept { return false; }

        template<typename Promise>
        std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> h) noexcept {
            auto& promise = h.promise();

            if (promise.detached_) {
                h.destroy();
                return std::noop_coroutine();
            }

            return promise.continuation_;
        }

        void await_resume() noexcept {}
    };

    std::suspend_always initial_suspend() noexcept { return {}; }
    FinalAwaiter final_suspend() noexcept { return {}; }

    void unhandled_exception() noexcept {
        exception_ = std::current_exception();
    }
};

template<typename T>
struct TaskPromise : TaskPromiseBase {
    std::optional<T> value_;

    Task<T> get_return_object() noexcept;

    template<typename U>
        requires std::convertible_to<U, T>
    void return_value(U&& value) noexcept(std::is_nothrow_constructible_v<T, U>) {
        value_.emplace(std::forward<U>(value));
    }

    T&& result() && {
        if (exception_) std::rethrow_exception(exception_);
        return std::move(*value_);
    }
};

template<>
struct TaskPromise<void> : TaskPromiseBase {
    Task<void> get_return_object() noexcept;

    void return_void() noexcept {}

    void result() {
        if (exception_) std::rethrow_exception(exception_);
    }
};

} // namespace detail

// ============================================================================
// Task<T> - Lazy coroutine, starts when awaited or started explicitly
// ============================================================================

template<typename T>
class [[nodiscard]] Task {
public:
    using promise_type = detail::TaskPromise<T>;
    using handle_type = std::coroutine_handle<promise_type>;

private:
    handle_type handle_;

public:
    Task() noexcept : handle_(nullptr) {}

    explicit Task(handle_type h) noexcept : handle_(h) {}

    Task(Task&& other) noexcept : handle_(other.handle_) {
        other.handle_ = nullptr;
    }

    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            if (handle_) handle_.destroy();
            handle_ = other.handle_;
            other.handle_ = nullptr;
        }
        return *this;
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    ~Task() {
        if (handle_) handle_.destroy();
    }

    bool valid() const noexcept { return handle_ != nullptr; }
    explicit operator bool() const noexcept { return valid(); }

    bool done() const noexcept { return handle_ && handle_.done(); }

    struct Awaiter {
        handle_type handle_;

        bool await_ready() const noexcept {
            return !handle_ || handle_.done();
        }

        std::coroutine_handle<> await_suspend(std::coroutine_handle<> continuation) noexcept {
            handle_.promise().continuation_ = continuation;
            return handle_;
        }

        T await_resume() {
            if constexpr (std::is_void_v<T>) {
                handle_.promise().result();
            } else {
                return std::move(handle_.promise()).result();
            }
        }
    };

    Awaiter operator co_await() && noexcept {
        return Awaiter{handle_};
    }

    // Resume the task until its first suspension point
    void start() {
        if (handle_ && !handle_.done()) {
            handle_.resume();
        }
    }

    // Run the task inline and return its result. There is no event loop
    // behind this: a task that suspends on something nobody resumes is
    // reported instead of waited for.
    T sync_wait() {
        start();
        if (!done()) {
            throw std::logic_error("sync_wait: task suspended without completing");
        }
        if constexpr (std::is_void_v<T>) {
            handle_.promise().result();
        } else {
            return std::move(handle_.promise()).result();
        }
    }

    // Start and detach in one call; the frame destroys itself on completion
    void start_detached() {
        if (handle_ && !handle_.done()) {
            auto h = handle_;
            handle_ = nullptr;  // We no longer own it
            h.promise().detached_ = true;
            h.resume();
        }
    }
};

namespace detail {

template<typename T>
Task<T> TaskPromise<T>::get_return_object() noexcept {
    return Task<T>{std::coroutine_handle<TaskPromise<T>>::from_promise(*this)};
}

inline Task<void> TaskPromise<void>::get_return_object() noexcept {
    return Task<void>{std::coroutine_handle<TaskPromise<void>>::from_promise(*this)};
}

} // namespace detail

} // namespace coroform
