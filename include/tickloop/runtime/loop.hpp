#pragma once

/**
 * @file
 * @brief Process-wide reactor facade.
 */

#include "tickloop/runtime/reactor.hpp"

#include <chrono>
#include <memory>

namespace tickloop::runtime {

/**
 * @brief Lazily constructed, process-wide reactor.
 *
 * The reactor is built on the first `get()` (or forwarding call) with the
 * options given to `configure()`, or defaults, and lives until process exit.
 * Components that need a scheduler take one explicitly; the facade is only
 * the default when none is supplied.
 */
class loop final {
public:
    loop() = delete;

    /**
     * @brief Set the options used to build the process-wide reactor.
     * @return `errc::already_initialized` once the reactor exists.
     */
    [[nodiscard]] static result<void>
    configure(reactor_options options, std::shared_ptr<error_sink> sink = nullptr);

    /// @return The process-wide reactor, constructing it on first use.
    [[nodiscard]] static reactor& get();
    /// @return `true` once the reactor has been constructed.
    [[nodiscard]] static bool initialized() noexcept;

    static watcher_id defer(task_callback callback);
    [[nodiscard]] static result<watcher_id>
    delay(std::chrono::duration<double> seconds, task_callback callback);
    [[nodiscard]] static result<watcher_id>
    repeat(std::chrono::duration<double> seconds, task_callback callback);
    [[nodiscard]] static result<watcher_id> on_readable(int fd,
                                                        stream_callback callback);
    [[nodiscard]] static result<watcher_id> on_writable(int fd,
                                                        stream_callback callback);
    static void cancel(watcher_id id) noexcept;
    [[nodiscard]] static result<void> run();
    static void stop() noexcept;
};

} // namespace tickloop::runtime
