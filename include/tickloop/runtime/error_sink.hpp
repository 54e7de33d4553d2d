#pragma once

/**
 * @file
 * @brief Reporting capability for failures caught at the tick boundary.
 */

#include "tickloop/core/reason.hpp"

#include <iosfwd>
#include <memory>
#include <string_view>

namespace tickloop::runtime {

/**
 * @brief Receives exceptions that escaped reactor callbacks.
 */
class error_sink {
public:
    virtual ~error_sink() = default;

    /**
     * @brief Report one contained failure.
     * @param context Callback category (`"deferred"`, `"timer"`, ...) or
     *        `"multiplexer"` for a failed readiness wait.
     * @param failure Captured failure.
     */
    virtual void report(std::string_view context,
                        const reason& failure) noexcept = 0;
};

/**
 * @brief Sink writing one line per failure to an output stream.
 *
 * Exceptions are reported as escaping a `<context>` callback; error codes
 * reported by the reactor itself read `tickloop: <context> failed: ...`.
 */
class stream_error_sink final : public error_sink {
public:
    /// Write to `std::cerr`.
    stream_error_sink() noexcept;
    /// Write to `out`, which must outlive the sink.
    explicit stream_error_sink(std::ostream& out) noexcept;

    void report(std::string_view context,
                const reason& failure) noexcept override;

private:
    std::ostream *out_;
};

/// @return Shared default sink writing to `std::cerr`.
[[nodiscard]] std::shared_ptr<error_sink> default_error_sink();

} // namespace tickloop::runtime
