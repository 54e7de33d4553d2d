#pragma once

/**
 * @file
 * @brief Error codes and error wrapper used across the runtime.
 */

#include <cerrno>
#include <string>
#include <system_error>
#include <type_traits>

namespace tickloop {

/**
 * @brief Runtime-specific failure conditions.
 *
 * Values live in the `tickloop` error category; OS failures keep using the
 * system category through `error::from_errno`.
 */
enum class errc {
    /// Negative delay/interval or an invalid descriptor.
    invalid_input = 1,
    /// `run()` called while the reactor is already running.
    already_running,
    /// Second resolve/reject on a deferred.
    already_settled,
    /// Loop facade configured after its reactor was constructed.
    already_initialized,
    /// Combinator invoked with an empty input list.
    no_promises,
    /// Every input of `any` rejected.
    all_rejected,
    /// A timeout elapsed before the awaited promise settled.
    timed_out,
    /// Requested readiness backend is not compiled in or not supported.
    backend_unavailable,
};

/// @return The `tickloop` error category singleton.
[[nodiscard]] const std::error_category& tickloop_category() noexcept;

/// @brief Build an `std::error_code` from `errc` (found through ADL).
[[nodiscard]] std::error_code make_error_code(errc value) noexcept;

/**
 * @brief Error value used across `result<T>`.
 *
 * This type wraps `std::error_code` while providing helper constructors
 * for errno-based and runtime-specific failures.
 */
class error {
public:
    /// Construct a success-like empty error (`value() == 0`).
    error() noexcept = default;
    /// Construct from an explicit error code.
    explicit error(std::error_code code) noexcept;
    /// Construct from a runtime error condition.
    explicit error(errc value) noexcept;

    /**
     * @brief Build an error from errno.
     * @param value errno value. Defaults to current `errno`.
     * @return Converted `error` in the system category.
     */
    [[nodiscard]] static error from_errno(int value = errno) noexcept;

    /// @return Underlying `std::error_code`.
    [[nodiscard]] std::error_code code() const noexcept;
    /// @return Integer code value.
    [[nodiscard]] int value() const noexcept;
    /// @return Human-readable message for the code.
    [[nodiscard]] std::string message() const;

    /// @return `true` when this error carries the given runtime condition.
    [[nodiscard]] bool is(errc value) const noexcept;

    friend bool operator==(const error& lhs, const error& rhs) noexcept {
        return lhs.code_ == rhs.code_;
    }

private:
    std::error_code code_;
};

/**
 * @brief Convenience helper that wraps an errno value into `error`.
 * @param value errno value to convert.
 */
[[nodiscard]] error make_error_from_errno(int value) noexcept;

/// @brief Convenience helper that wraps a runtime condition into `error`.
[[nodiscard]] error make_error(errc value) noexcept;

} // namespace tickloop

template <>
struct std::is_error_code_enum<tickloop::errc> : std::true_type {};
