#pragma once

/**
 * @file
 * @brief Rejection reason carried by rejected promises and failed callbacks.
 */

#include "tickloop/core/error.hpp"

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace tickloop {

/**
 * @brief Tagged rejection value: either an `error` or a captured exception.
 *
 * Domain failures travel as `error` without throwing; anything thrown by
 * user code is captured as `std::exception_ptr`. A reason may carry a cause,
 * which `promise<T>::any` uses to expose the first rejection behind an
 * `errc::all_rejected` aggregate.
 */
class reason {
public:
    /// Construct from an error value.
    reason(error value) noexcept;
    /// Construct from an error condition.
    reason(errc value) noexcept;
    /// Construct from a captured exception. A null pointer is kept as-is.
    reason(std::exception_ptr exception) noexcept;

    /// @brief Capture the exception currently being handled.
    [[nodiscard]] static reason from_current_exception() noexcept;

    /// @brief Wrap an exception object without throwing it.
    template <class Exception>
    [[nodiscard]] static reason from_exception(Exception&& exception) {
        return reason{std::make_exception_ptr(std::forward<Exception>(exception))};
    }

    /**
     * @brief Build an aggregate reason.
     * @param value Aggregate error condition.
     * @param cause Underlying reason exposed through `cause()`.
     */
    [[nodiscard]] static reason aggregate(error value, reason cause);

    /// @return `true` when the reason holds an `error`.
    [[nodiscard]] bool holds_error() const noexcept;
    /// @return `true` when the reason holds an exception.
    [[nodiscard]] bool holds_exception() const noexcept;

    /// @return Held error, or `nullptr` when the reason is an exception.
    [[nodiscard]] const error *as_error() const noexcept;
    /// @return Held exception, or null when the reason is an error.
    [[nodiscard]] std::exception_ptr exception() const noexcept;

    /**
     * @brief Error code view of the reason.
     *
     * Errors return their code; `std::system_error` exceptions return the
     * exception's code; any other exception yields an empty code.
     */
    [[nodiscard]] std::error_code code() const noexcept;

    /// @return Underlying cause, or `nullptr`.
    [[nodiscard]] const reason *cause() const noexcept;

    /// @return Human-readable description.
    [[nodiscard]] std::string message() const;

    /**
     * @brief Throw the reason.
     *
     * Exceptions are rethrown unchanged; errors are thrown as
     * `promise_rejected`.
     */
    [[noreturn]] void rethrow() const;

private:
    std::variant<error, std::exception_ptr> value_;
    std::shared_ptr<const reason> cause_{};
};

/**
 * @brief Exception thrown when an `error`-kind reason surfaces in code that
 * only speaks exceptions (awaiting a rejected promise in a task).
 */
class promise_rejected : public std::system_error {
public:
    explicit promise_rejected(tickloop::reason why);

    /// @return Original rejection reason.
    [[nodiscard]] const tickloop::reason& why() const noexcept;

private:
    tickloop::reason why_;
};

} // namespace tickloop
