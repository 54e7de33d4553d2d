#pragma once

/**
 * @file
 * @brief Externally settled promise.
 */

#include "tickloop/async/promise.hpp"
#include "tickloop/core/result.hpp"

#include <optional>
#include <utility>

namespace tickloop {

/**
 * @brief Owner of a promise together with its resolve/reject capabilities.
 *
 * The first successful `resolve` or `reject` consumes both capabilities;
 * later calls return `errc::already_settled` and leave the promise alone.
 */
template <class T>
class deferred {
public:
    /// @brief Create a pending promise dispatched through `owner`.
    explicit deferred(runtime::scheduler& owner)
        : promise_(owner, [this](resolver<T> resolve, rejecter<T> reject) {
              resolve_.emplace(std::move(resolve));
              reject_.emplace(std::move(reject));
          }) {}

    /// @brief Create a pending promise on the process-wide loop.
    deferred() : deferred(runtime::loop::get()) {}

    deferred(const deferred&) = delete;
    deferred& operator=(const deferred&) = delete;
    deferred(deferred&&) = delete;
    deferred& operator=(deferred&&) = delete;

    /// @return The same promise on every call.
    [[nodiscard]] const tickloop::promise<T>& promise() const noexcept {
        return promise_;
    }

    /// @return `true` once `resolve` or `reject` succeeded.
    [[nodiscard]] bool settled() const noexcept {
        return !resolve_.has_value();
    }

    /// @brief Fulfil the promise.
    [[nodiscard]] result<void> resolve(T value) {
        if (settled()) {
            return err<void>(errc::already_settled);
        }
        auto capability = take_resolver();
        capability(std::move(value));
        return ok();
    }

    /// @brief Lock the promise to a thenable's eventual outcome.
    template <thenable P>
        requires std::convertible_to<typename P::value_type, T>
    [[nodiscard]] result<void> resolve(P inner) {
        if (settled()) {
            return err<void>(errc::already_settled);
        }
        auto capability = take_resolver();
        capability(std::move(inner));
        return ok();
    }

    /// @brief Reject the promise.
    [[nodiscard]] result<void> reject(reason why) {
        if (settled()) {
            return err<void>(errc::already_settled);
        }
        auto capability = std::move(*reject_);
        resolve_.reset();
        reject_.reset();
        capability(std::move(why));
        return ok();
    }

private:
    resolver<T> take_resolver() {
        auto capability = std::move(*resolve_);
        resolve_.reset();
        reject_.reset();
        return capability;
    }

    // Declared before promise_: the executor fills them during construction.
    std::optional<resolver<T>> resolve_{};
    std::optional<rejecter<T>> reject_{};
    tickloop::promise<T> promise_;
};

} // namespace tickloop
