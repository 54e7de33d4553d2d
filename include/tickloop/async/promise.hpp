#pragma once

/**
 * @file
 * @brief One-shot promise with asynchronous handler chaining and the
 * `all` / `any` / `race` combinators.
 */

#include "tickloop/core/reason.hpp"
#include "tickloop/runtime/loop.hpp"
#include "tickloop/runtime/scheduler.hpp"

#include <concepts>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace tickloop {

/// Value of promises produced by handlers that return nothing.
using unit = std::monostate;

/**
 * @brief Promise-like capability used for flattening.
 *
 * Any type exposing `value_type` and
 * `subscribe(on_value, on_reason)` is adopted by promises resolved with it,
 * whatever its concrete class.
 */
template <class P>
concept thenable = requires(
    P& candidate, std::function<void(const typename P::value_type&)> on_value,
    std::function<void(const reason&)> on_reason) {
    typename P::value_type;
    candidate.subscribe(std::move(on_value), std::move(on_reason));
};

template <class T>
class promise;

/// @brief Settlement state of a promise.
enum class promise_status {
    pending,
    fulfilled,
    rejected,
};

namespace detail {

template <class R>
struct settled_type {
    using type = R;
};

template <>
struct settled_type<void> {
    using type = unit;
};

template <thenable R>
struct settled_type<R> {
    using type = typename R::value_type;
};

/// Value type of the promise produced by a handler returning `R`.
template <class R>
using settled_t = typename settled_type<std::remove_cvref_t<R>>::type;

/**
 * @brief Shared state behind `promise<T>`.
 *
 * Settlement is one-way. Resolving with a thenable locks the state: it stays
 * pending but ignores every later resolve/reject until the thenable settles.
 */
template <class T>
class promise_state : public std::enable_shared_from_this<promise_state<T>> {
public:
    using handler = std::function<void(const promise_state&)>;

    explicit promise_state(runtime::scheduler& owner) noexcept
        : scheduler_(&owner) {}

    promise_state(const promise_state&) = delete;
    promise_state& operator=(const promise_state&) = delete;

    [[nodiscard]] runtime::scheduler& scheduler() const noexcept {
        return *scheduler_;
    }

    [[nodiscard]] promise_status status() const noexcept {
        return status_;
    }

    [[nodiscard]] bool pending() const noexcept {
        return status_ == promise_status::pending;
    }

    [[nodiscard]] const T& value() const {
        if (status_ != promise_status::fulfilled) {
            throw std::logic_error("promise is not fulfilled");
        }
        return *value_;
    }

    [[nodiscard]] const reason& why() const {
        if (status_ != promise_status::rejected) {
            throw std::logic_error("promise is not rejected");
        }
        return *reason_;
    }

    void resolve(T value) {
        if (!open()) {
            return;
        }
        settle_fulfilled(std::move(value));
    }

    void reject(reason why) {
        if (!open()) {
            return;
        }
        settle_rejected(std::move(why));
    }

    template <thenable P>
        requires std::convertible_to<typename P::value_type, T>
    void adopt(P inner) {
        if (!open()) {
            return;
        }
        locked_ = true;

        auto self = this->shared_from_this();
        inner.subscribe(
            [self](const typename P::value_type& value) {
                self->settle_fulfilled(T(value));
            },
            [self](const reason& why) { self->settle_rejected(why); });
    }

    void add_handler(handler callback) {
        handlers_.push_back(std::move(callback));
        if (!pending()) {
            schedule_handlers();
        }
    }

private:
    [[nodiscard]] bool open() const noexcept {
        return pending() && !locked_;
    }

    void settle_fulfilled(T value) {
        if (!pending()) {
            return;
        }
        value_.emplace(std::move(value));
        status_ = promise_status::fulfilled;
        schedule_handlers();
    }

    void settle_rejected(reason why) {
        if (!pending()) {
            return;
        }
        reason_.emplace(std::move(why));
        status_ = promise_status::rejected;
        schedule_handlers();
    }

    void schedule_handlers() {
        if (handlers_.empty()) {
            return;
        }

        // One failing observer never starves the rest of the batch. Its
        // exception is rethrown from a deferred callback of its own so the
        // scheduler reports it.
        auto batch = std::exchange(handlers_, {});
        scheduler_->defer(
            [self = this->shared_from_this(), batch = std::move(batch)]() {
                for (const auto& callback : batch) {
                    try {
                        callback(*self);
                    } catch (...) {
                        self->scheduler_->defer(
                            [failure = std::current_exception()]() {
                                std::rethrow_exception(failure);
                            });
                    }
                }
            });
    }

    runtime::scheduler *scheduler_;
    promise_status status_{promise_status::pending};
    bool locked_{false};
    std::optional<T> value_{};
    std::optional<reason> reason_{};
    std::vector<handler> handlers_{};
};

/**
 * @brief Settle `next` from a handler's outcome: thenables are adopted,
 * `void` yields `unit`, exceptions reject.
 */
template <class U, class Fn, class Arg>
void settle_from(promise_state<U>& next, Fn& fn, const Arg& arg) {
    using raw_result = std::invoke_result_t<Fn&, const Arg&>;
    try {
        if constexpr (std::is_void_v<raw_result>) {
            std::invoke(fn, arg);
            next.resolve(U{});
        } else if constexpr (thenable<std::remove_cvref_t<raw_result>>) {
            next.adopt(std::invoke(fn, arg));
        } else {
            next.resolve(U(std::invoke(fn, arg)));
        }
    } catch (...) {
        next.reject(reason::from_current_exception());
    }
}

} // namespace detail

/**
 * @brief Capability that fulfils (or locks to a thenable) one promise.
 */
template <class T>
class resolver {
public:
    /// @brief Fulfil with a plain value. Ignored once settled or locked.
    void operator()(T value) const {
        state_->resolve(std::move(value));
    }

    /// @brief Adopt the eventual outcome of a thenable.
    template <thenable P>
        requires std::convertible_to<typename P::value_type, T>
    void operator()(P inner) const {
        state_->adopt(std::move(inner));
    }

private:
    template <class>
    friend class promise;

    explicit resolver(std::shared_ptr<detail::promise_state<T>> state) noexcept
        : state_(std::move(state)) {}

    std::shared_ptr<detail::promise_state<T>> state_;
};

/**
 * @brief Capability that rejects one promise.
 */
template <class T>
class rejecter {
public:
    /// @brief Reject with a reason. Ignored once settled or locked.
    void operator()(reason why) const {
        state_->reject(std::move(why));
    }

    /// @brief Reject with an exception object.
    template <class Exception>
        requires std::derived_from<std::remove_cvref_t<Exception>, std::exception>
    void operator()(Exception&& exception) const {
        state_->reject(reason::from_exception(std::forward<Exception>(exception)));
    }

private:
    template <class>
    friend class promise;

    explicit rejecter(std::shared_ptr<detail::promise_state<T>> state) noexcept
        : state_(std::move(state)) {}

    std::shared_ptr<detail::promise_state<T>> state_;
};

/**
 * @brief Shared handle to a one-shot asynchronous result.
 *
 * Copies refer to the same state. Handlers never run inside the call that
 * registered them or the call that settled the promise: every batch of
 * handlers goes through the owning scheduler's `defer`.
 *
 * @tparam T Copyable value type; must not itself be thenable.
 */
template <class T>
class promise {
    static_assert(!thenable<T>, "promise values are flattened; use promise<U>");
    static_assert(std::is_copy_constructible_v<T>,
                  "promise values are shared between handlers");

public:
    using value_type = T;

    /**
     * @brief Create a promise and run its executor synchronously.
     * @param owner Scheduler used for handler dispatch.
     * @param executor Callable receiving `(resolver<T>, rejecter<T>)`. An
     * exception escaping it rejects the promise.
     */
    template <class Executor>
        requires std::invocable<Executor&, resolver<T>, rejecter<T>>
    promise(runtime::scheduler& owner, Executor&& executor)
        : state_(std::make_shared<detail::promise_state<T>>(owner)) {
        try {
            executor(resolver<T>{state_}, rejecter<T>{state_});
        } catch (...) {
            state_->reject(reason::from_current_exception());
        }
    }

    /// @brief Create a promise dispatched through the process-wide loop.
    template <class Executor>
        requires std::invocable<Executor&, resolver<T>, rejecter<T>>
    explicit promise(Executor&& executor)
        : promise(runtime::loop::get(), std::forward<Executor>(executor)) {}

    /// @return Current settlement state.
    [[nodiscard]] promise_status status() const noexcept {
        return state_->status();
    }

    /// @return `true` until the promise is fulfilled or rejected.
    [[nodiscard]] bool pending() const noexcept {
        return state_->pending();
    }

    /// @return Scheduler that dispatches this promise's handlers.
    [[nodiscard]] runtime::scheduler& scheduler() const noexcept {
        return state_->scheduler();
    }

    /// @return `true` when both handles refer to the same promise.
    friend bool operator==(const promise& lhs, const promise& rhs) noexcept {
        return lhs.state_ == rhs.state_;
    }

    /**
     * @brief Chain a fulfilment handler; rejections propagate unchanged.
     * @return Promise of the handler's (flattened) result.
     */
    template <class OnFulfilled>
        requires std::invocable<OnFulfilled&, const T&>
    auto then(OnFulfilled on_fulfilled) const
        -> promise<detail::settled_t<std::invoke_result_t<OnFulfilled&, const T&>>> {
        using next_type =
            detail::settled_t<std::invoke_result_t<OnFulfilled&, const T&>>;

        return attach<next_type>(
            [fn = std::move(on_fulfilled)](const state_type& settled,
                                           detail::promise_state<next_type>& next) mutable {
                if (settled.status() == promise_status::fulfilled) {
                    detail::settle_from(next, fn, settled.value());
                    return;
                }
                next.reject(settled.why());
            });
    }

    /**
     * @brief Chain fulfilment and rejection handlers.
     *
     * Both handlers must produce the same (flattened) result type.
     */
    template <class OnFulfilled, class OnRejected>
        requires std::invocable<OnFulfilled&, const T&> &&
                 std::invocable<OnRejected&, const reason&> &&
                 std::same_as<
                     detail::settled_t<std::invoke_result_t<OnFulfilled&, const T&>>,
                     detail::settled_t<std::invoke_result_t<OnRejected&, const reason&>>>
    auto then(OnFulfilled on_fulfilled, OnRejected on_rejected) const
        -> promise<detail::settled_t<std::invoke_result_t<OnFulfilled&, const T&>>> {
        using next_type =
            detail::settled_t<std::invoke_result_t<OnFulfilled&, const T&>>;

        return attach<next_type>(
            [on_value = std::move(on_fulfilled), on_reason = std::move(on_rejected)](
                const state_type& settled,
                detail::promise_state<next_type>& next) mutable {
                if (settled.status() == promise_status::fulfilled) {
                    detail::settle_from(next, on_value, settled.value());
                    return;
                }
                detail::settle_from(next, on_reason, settled.why());
            });
    }

    /**
     * @brief Chain a rejection handler; values propagate unchanged.
     *
     * The handler recovers with a `T` (or a thenable of `T`).
     */
    template <class OnRejected>
        requires std::invocable<OnRejected&, const reason&> &&
                 std::same_as<
                     detail::settled_t<std::invoke_result_t<OnRejected&, const reason&>>, T>
    promise catch_(OnRejected on_rejected) const {
        return attach<T>([fn = std::move(on_rejected)](
                             const state_type& settled,
                             detail::promise_state<T>& next) mutable {
            if (settled.status() == promise_status::fulfilled) {
                next.resolve(settled.value());
                return;
            }
            detail::settle_from(next, fn, settled.why());
        });
    }

    /**
     * @brief Run a callback on either outcome, passing the outcome through.
     *
     * An exception from `on_finally` rejects the returned promise instead.
     */
    template <class OnFinally>
        requires std::invocable<OnFinally&>
    promise finally(OnFinally on_finally) const {
        return attach<T>([fn = std::move(on_finally)](
                             const state_type& settled,
                             detail::promise_state<T>& next) mutable {
            try {
                std::invoke(fn);
            } catch (...) {
                next.reject(reason::from_current_exception());
                return;
            }

            if (settled.status() == promise_status::fulfilled) {
                next.resolve(settled.value());
                return;
            }
            next.reject(settled.why());
        });
    }

    /**
     * @brief Observe the outcome without creating a continuation.
     *
     * This is the operation that makes `promise<T>` a `thenable`.
     */
    void subscribe(std::function<void(const T&)> on_value,
                   std::function<void(const reason&)> on_reason) const {
        state_->add_handler(
            [on_value = std::move(on_value),
             on_reason = std::move(on_reason)](const state_type& settled) {
                if (settled.status() == promise_status::fulfilled) {
                    on_value(settled.value());
                    return;
                }
                on_reason(settled.why());
            });
    }

    /// @brief Already-fulfilled promise.
    [[nodiscard]] static promise resolve(runtime::scheduler& owner, T value) {
        auto state = std::make_shared<detail::promise_state<T>>(owner);
        state->resolve(std::move(value));
        return promise{std::move(state)};
    }

    /// @brief Already-fulfilled promise on the process-wide loop.
    [[nodiscard]] static promise resolve(T value) {
        return resolve(runtime::loop::get(), std::move(value));
    }

    /// @brief A promise is returned unchanged.
    [[nodiscard]] static promise resolve(promise existing) noexcept {
        return existing;
    }

    /// @brief Promise adopting a foreign thenable.
    template <thenable P>
        requires(!std::same_as<std::remove_cvref_t<P>, promise>) &&
                std::convertible_to<typename P::value_type, T>
    [[nodiscard]] static promise resolve(runtime::scheduler& owner, P foreign) {
        auto state = std::make_shared<detail::promise_state<T>>(owner);
        state->adopt(std::move(foreign));
        return promise{std::move(state)};
    }

    /// @brief Already-rejected promise.
    [[nodiscard]] static promise reject(runtime::scheduler& owner, reason why) {
        auto state = std::make_shared<detail::promise_state<T>>(owner);
        state->reject(std::move(why));
        return promise{std::move(state)};
    }

    /// @brief Already-rejected promise on the process-wide loop.
    [[nodiscard]] static promise reject(reason why) {
        return reject(runtime::loop::get(), std::move(why));
    }

    /**
     * @brief Fulfil with every value, in input order, or reject with the
     * first rejection.
     *
     * Empty input fulfils with an empty vector.
     */
    [[nodiscard]] static promise<std::vector<T>>
    all(runtime::scheduler& owner, std::vector<promise> inputs) {
        auto combined =
            std::make_shared<detail::promise_state<std::vector<T>>>(owner);
        if (inputs.empty()) {
            combined->resolve(std::vector<T>{});
            return promise<std::vector<T>>{std::move(combined)};
        }

        struct fan_in {
            std::vector<std::optional<T>> values;
            std::size_t remaining;
        };
        auto progress = std::make_shared<fan_in>(
            fan_in{std::vector<std::optional<T>>(inputs.size()), inputs.size()});

        for (std::size_t i = 0; i < inputs.size(); ++i) {
            inputs[i].subscribe(
                [combined, progress, i](const T& value) {
                    if (!combined->pending()) {
                        return;
                    }
                    progress->values[i].emplace(value);
                    if (--progress->remaining != 0) {
                        return;
                    }

                    std::vector<T> values;
                    values.reserve(progress->values.size());
                    for (auto& slot : progress->values) {
                        values.push_back(std::move(*slot));
                    }
                    combined->resolve(std::move(values));
                },
                [combined](const reason& why) { combined->reject(why); });
        }
        return promise<std::vector<T>>{std::move(combined)};
    }

    /// @brief `all` dispatched through the first input's scheduler.
    [[nodiscard]] static promise<std::vector<T>> all(std::vector<promise> inputs) {
        auto& owner = default_owner(inputs);
        return all(owner, std::move(inputs));
    }

    /**
     * @brief Fulfil with the first fulfilment.
     *
     * Rejects with `errc::all_rejected`, caused by the first rejection, once
     * every input rejected; rejects with `errc::no_promises` when empty.
     */
    [[nodiscard]] static promise any(runtime::scheduler& owner,
                                     std::vector<promise> inputs) {
        auto combined = std::make_shared<detail::promise_state<T>>(owner);
        if (inputs.empty()) {
            combined->reject(reason{errc::no_promises});
            return promise{std::move(combined)};
        }

        struct tally {
            std::size_t remaining;
            std::optional<reason> first{};
        };
        auto progress = std::make_shared<tally>(tally{inputs.size()});

        for (auto& input : inputs) {
            input.subscribe(
                [combined](const T& value) { combined->resolve(value); },
                [combined, progress](const reason& why) {
                    if (!progress->first.has_value()) {
                        progress->first.emplace(why);
                    }
                    if (--progress->remaining == 0) {
                        combined->reject(reason::aggregate(
                            make_error(errc::all_rejected), *progress->first));
                    }
                });
        }
        return promise{std::move(combined)};
    }

    /// @brief `any` dispatched through the first input's scheduler.
    [[nodiscard]] static promise any(std::vector<promise> inputs) {
        auto& owner = default_owner(inputs);
        return any(owner, std::move(inputs));
    }

    /**
     * @brief Settle like the first input to settle, in either direction.
     *
     * Rejects with `errc::no_promises` when empty.
     */
    [[nodiscard]] static promise race(runtime::scheduler& owner,
                                      std::vector<promise> inputs) {
        auto combined = std::make_shared<detail::promise_state<T>>(owner);
        if (inputs.empty()) {
            combined->reject(reason{errc::no_promises});
            return promise{std::move(combined)};
        }

        for (auto& input : inputs) {
            input.subscribe(
                [combined](const T& value) { combined->resolve(value); },
                [combined](const reason& why) { combined->reject(why); });
        }
        return promise{std::move(combined)};
    }

    /// @brief `race` dispatched through the first input's scheduler.
    [[nodiscard]] static promise race(std::vector<promise> inputs) {
        auto& owner = default_owner(inputs);
        return race(owner, std::move(inputs));
    }

private:
    template <class>
    friend class promise;

    using state_type = detail::promise_state<T>;

    explicit promise(std::shared_ptr<state_type> state) noexcept
        : state_(std::move(state)) {}

    [[nodiscard]] static runtime::scheduler&
    default_owner(const std::vector<promise>& inputs) {
        if (inputs.empty()) {
            return runtime::loop::get();
        }
        return inputs.front().scheduler();
    }

    template <class U, class Handler>
    promise<U> attach(Handler on_settled) const {
        auto next = std::make_shared<detail::promise_state<U>>(state_->scheduler());
        state_->add_handler(
            [next, on_settled = std::move(on_settled)](const state_type& settled) mutable {
                try {
                    on_settled(settled, *next);
                } catch (...) {
                    // Copying the settled value into `next` can throw too.
                    next->reject(reason::from_current_exception());
                }
            });
        return promise<U>{std::move(next)};
    }

    std::shared_ptr<state_type> state_;
};

} // namespace tickloop
