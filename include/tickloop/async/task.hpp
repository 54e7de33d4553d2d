#pragma once

/**
 * @file
 * @brief Coroutine task type, promise awaiting and `spawn` bridging tasks
 * back into promises.
 */

#include "tickloop/async/promise.hpp"
#include "tickloop/runtime/scheduler.hpp"

#include <concepts>
#include <coroutine>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace tickloop {

template <class T>
class task;

namespace detail {

/// Scheduler and awaiting coroutine recorded in a coroutine's promise.
class coroutine_links {
public:
    [[nodiscard]] runtime::scheduler *scheduler_ptr() const noexcept {
        return scheduler_;
    }

    void set_scheduler(runtime::scheduler *value) noexcept {
        scheduler_ = value;
    }

    [[nodiscard]] std::coroutine_handle<> continuation() const noexcept {
        return continuation_;
    }

    void set_continuation(std::coroutine_handle<> continuation) noexcept {
        continuation_ = continuation;
    }

private:
    runtime::scheduler *scheduler_{nullptr};
    std::coroutine_handle<> continuation_{};
};

/// @brief Queue a coroutine resumption on the next tick.
inline void resume_later(runtime::scheduler& owner,
                         std::coroutine_handle<> handle) {
    owner.defer([handle]() { handle.resume(); });
}

/**
 * @brief Owning coroutine handle; destroys the frame it still holds.
 */
template <class Promise>
class unique_coroutine {
public:
    using handle_type = std::coroutine_handle<Promise>;

    unique_coroutine() noexcept = default;
    explicit unique_coroutine(handle_type handle) noexcept : handle_(handle) {}

    unique_coroutine(const unique_coroutine&) = delete;
    unique_coroutine& operator=(const unique_coroutine&) = delete;

    unique_coroutine(unique_coroutine&& other) noexcept
        : handle_(std::exchange(other.handle_, {})) {}

    unique_coroutine& operator=(unique_coroutine&& other) noexcept {
        if (this != &other) {
            reset();
            handle_ = std::exchange(other.handle_, {});
        }
        return *this;
    }

    ~unique_coroutine() {
        reset();
    }

    [[nodiscard]] handle_type get() const noexcept {
        return handle_;
    }

    /// @brief Give up ownership without destroying the frame.
    [[nodiscard]] handle_type release() noexcept {
        return std::exchange(handle_, {});
    }

    void reset() noexcept {
        if (handle_) {
            std::exchange(handle_, {}).destroy();
        }
    }

    explicit operator bool() const noexcept {
        return static_cast<bool>(handle_);
    }

private:
    handle_type handle_{};
};

/// Resume the awaiting coroutine on the next tick once a task finishes.
struct task_final_awaiter {
    [[nodiscard]] bool await_ready() const noexcept {
        return false;
    }

    template <class Promise>
    void await_suspend(std::coroutine_handle<Promise> handle) noexcept {
        auto& promise = handle.promise();
        const auto continuation = promise.continuation();
        if (!continuation) {
            return;
        }

        auto *owner = promise.scheduler_ptr();
        if (owner != nullptr) {
            resume_later(*owner, continuation);
            return;
        }

        continuation.resume();
    }

    void await_resume() const noexcept {}
};

/// Value or exception a finished `task<T>` hands to its awaiter.
template <class T>
class task_outcome {
public:
    template <class U>
        requires std::convertible_to<U, T>
    void return_value(U&& value) noexcept(std::is_nothrow_constructible_v<T, U&&>) {
        value_.emplace(std::forward<U>(value));
    }

    void unhandled_exception() noexcept {
        exception_ = std::current_exception();
    }

    /// @brief Move the result out, rethrowing a stored exception.
    [[nodiscard]] T consume_result() {
        if (exception_ != nullptr) {
            std::rethrow_exception(exception_);
        }
        if (!value_.has_value()) {
            throw std::logic_error("task result is not available");
        }
        return std::move(*value_);
    }

private:
    std::optional<T> value_{};
    std::exception_ptr exception_{};
};

template <>
class task_outcome<void> {
public:
    void return_void() const noexcept {}

    void unhandled_exception() noexcept {
        exception_ = std::current_exception();
    }

    void consume_result() const {
        if (exception_ != nullptr) {
            std::rethrow_exception(exception_);
        }
    }

private:
    std::exception_ptr exception_{};
};

template <class T>
struct task_promise : coroutine_links, task_outcome<T> {
    [[nodiscard]] task<T> get_return_object() noexcept {
        return task<T>{std::coroutine_handle<task_promise>::from_promise(*this)};
    }

    [[nodiscard]] std::suspend_always initial_suspend() const noexcept {
        return {};
    }

    [[nodiscard]] task_final_awaiter final_suspend() const noexcept {
        return {};
    }
};

} // namespace detail

/**
 * @brief Lazily started coroutine producing a `T` (or nothing for `void`).
 *
 * A task starts when awaited. The first resumption of an awaited child goes
 * through the scheduler inherited from the awaiting coroutine, so starting a
 * child never nests inside the caller's stack frame.
 */
template <class T>
class task {
public:
    using promise_type = detail::task_promise<T>;
    using handle_type = std::coroutine_handle<promise_type>;

    task() noexcept = default;
    explicit task(handle_type handle) noexcept : frame_(handle) {}

    /// @return `true` when a coroutine handle is owned.
    [[nodiscard]] bool valid() const noexcept {
        return static_cast<bool>(frame_);
    }

    /// @return `true` when the task has completed or is empty.
    [[nodiscard]] bool done() const noexcept {
        return !frame_ || frame_.get().done();
    }

    /// Owns the child frame while the awaiting coroutine is suspended.
    class awaiter {
    public:
        explicit awaiter(detail::unique_coroutine<promise_type> frame) noexcept
            : frame_(std::move(frame)) {}

        [[nodiscard]] bool await_ready() const noexcept {
            return !frame_ || frame_.get().done();
        }

        template <class Promise>
        bool await_suspend(std::coroutine_handle<Promise> awaiting) {
            const auto child = frame_.get();
            child.promise().set_continuation(awaiting);

            if constexpr (std::derived_from<Promise, detail::coroutine_links>) {
                if (child.promise().scheduler_ptr() == nullptr) {
                    child.promise().set_scheduler(awaiting.promise().scheduler_ptr());
                }
            }

            auto *owner = child.promise().scheduler_ptr();
            if (owner != nullptr) {
                detail::resume_later(*owner, child);
                return true;
            }

            child.resume();
            return false;
        }

        T await_resume() {
            if (!frame_) {
                throw std::logic_error("awaited task has no coroutine handle");
            }

            // A rethrown exception leaves the frame to the destructor.
            if constexpr (std::is_void_v<T>) {
                frame_.get().promise().consume_result();
                frame_.reset();
            } else {
                auto value = frame_.get().promise().consume_result();
                frame_.reset();
                return value;
            }
        }

    private:
        detail::unique_coroutine<promise_type> frame_;
    };

    /// @brief Await this task, transferring ownership to the awaiter.
    [[nodiscard]] awaiter operator co_await() && noexcept {
        return awaiter{std::move(frame_)};
    }

private:
    detail::unique_coroutine<promise_type> frame_{};
};

/**
 * @brief Awaiter suspending a coroutine until a promise settles.
 *
 * Resumption happens from the promise's handler dispatch, i.e. on a later
 * tick. A rejection is rethrown: exceptions unchanged, errors as
 * `promise_rejected`.
 */
template <class T>
class promise_awaiter {
public:
    explicit promise_awaiter(promise<T> awaited)
        : awaited_(std::move(awaited)),
          outcome_(std::make_shared<std::optional<std::variant<T, reason>>>()) {}

    [[nodiscard]] bool await_ready() const noexcept {
        return false;
    }

    void await_suspend(std::coroutine_handle<> handle) const {
        auto outcome = outcome_;
        awaited_.subscribe(
            [outcome, handle](const T& value) {
                outcome->emplace(std::in_place_index<0>, value);
                handle.resume();
            },
            [outcome, handle](const reason& why) {
                outcome->emplace(std::in_place_index<1>, why);
                handle.resume();
            });
    }

    T await_resume() const {
        if (!outcome_->has_value()) {
            throw std::logic_error("promise resumed before settling");
        }
        auto& settled = outcome_->value();
        if (settled.index() == 1) {
            std::get<1>(settled).rethrow();
        }
        return std::move(std::get<0>(settled));
    }

private:
    promise<T> awaited_;
    std::shared_ptr<std::optional<std::variant<T, reason>>> outcome_;
};

/// @brief Await a promise inside a `task`.
template <class T>
[[nodiscard]] promise_awaiter<T> operator co_await(promise<T> awaited) {
    return promise_awaiter<T>{std::move(awaited)};
}

namespace detail {

/**
 * @brief Self-destroying root coroutine used by `spawn`.
 *
 * Exceptions escaping the body propagate out of `resume()` into the
 * scheduler's callback failure reporting.
 */
class detached_task {
public:
    struct promise_type : coroutine_links {
        [[nodiscard]] detached_task get_return_object() noexcept {
            return detached_task{
                std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        [[nodiscard]] std::suspend_always initial_suspend() const noexcept {
            return {};
        }

        [[nodiscard]] std::suspend_never final_suspend() const noexcept {
            return {};
        }

        void return_void() const noexcept {}

        void unhandled_exception() const {
            throw;
        }
    };

    using handle_type = std::coroutine_handle<promise_type>;

    /// @brief Hand the frame over; it destroys itself when the body ends.
    [[nodiscard]] handle_type release() noexcept {
        return frame_.release();
    }

private:
    explicit detached_task(handle_type handle) noexcept : frame_(handle) {}

    unique_coroutine<promise_type> frame_;
};

template <class T>
detached_task drive(task<T> work, resolver<settled_t<T>> resolve,
                    rejecter<settled_t<T>> reject) {
    try {
        if constexpr (std::is_void_v<T>) {
            co_await std::move(work);
            resolve(unit{});
        } else {
            resolve(co_await std::move(work));
        }
    } catch (...) {
        reject(reason::from_current_exception());
    }
}

} // namespace detail

/**
 * @brief Start a task on the next tick of `owner`.
 * @return Promise settled with the task's value (`unit` for `task<void>`) or
 * with the exception it threw.
 */
template <class T>
[[nodiscard]] promise<detail::settled_t<T>> spawn(runtime::scheduler& owner,
                                                  task<T> work) {
    using value_type = detail::settled_t<T>;

    std::optional<resolver<value_type>> resolve{};
    std::optional<rejecter<value_type>> reject{};
    promise<value_type> outcome{
        owner, [&](resolver<value_type> on_value, rejecter<value_type> on_reason) {
            resolve.emplace(std::move(on_value));
            reject.emplace(std::move(on_reason));
        }};

    auto driver =
        detail::drive<T>(std::move(work), std::move(*resolve), std::move(*reject));
    const auto handle = driver.release();
    handle.promise().set_scheduler(&owner);
    detail::resume_later(owner, handle);
    return outcome;
}

} // namespace tickloop
