#pragma once

/**
 * @file
 * @brief Single-threaded tick loop multiplexing deferred callbacks, timers,
 * repeats and stream watchers.
 */

#include "tickloop/core/result.hpp"
#include "tickloop/io/multiplexer.hpp"
#include "tickloop/runtime/error_sink.hpp"
#include "tickloop/runtime/scheduler.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace tickloop::runtime {

/**
 * @brief Construction-time reactor settings.
 */
struct reactor_options {
    /// Readiness backend used for stream watchers.
    io::backend selected_backend{io::backend::epoll};
    /// SQ/CQ entry count when `io_uring` is selected.
    std::uint32_t uring_queue_depth{256};
    /// Upper bound of one readiness wait or timer sleep.
    std::chrono::milliseconds max_wait{1000};
    /// Sleep applied when a tick finds nothing to wait for.
    std::chrono::milliseconds idle_sleep{1};
};

/**
 * @brief Cooperative event reactor.
 *
 * One tick runs, in order: deferred callbacks queued before the tick, due
 * timers, due repeats, then one readiness wait and dispatch for stream
 * watchers (or a bounded sleep when there are none). Exceptions escaping a
 * callback are reported to the error sink and never abort the tick.
 */
class reactor final : public scheduler {
public:
    using clock = std::chrono::steady_clock;

    /**
     * @brief Construct a reactor.
     * @param options Backend and timing settings.
     * @param sink Failure sink; `nullptr` selects `default_error_sink()`.
     */
    explicit reactor(reactor_options options = {},
                     std::shared_ptr<error_sink> sink = nullptr);
    ~reactor() override;

    reactor(const reactor&) = delete;
    reactor& operator=(const reactor&) = delete;
    reactor(reactor&&) = delete;
    reactor& operator=(reactor&&) = delete;

    /// @return `true` when the readiness backend initialized.
    [[nodiscard]] bool valid() const noexcept;
    /// @return Backend initialization failure, if any.
    [[nodiscard]] std::optional<error> init_error() const noexcept;
    /// @return Options the reactor was built with.
    [[nodiscard]] const reactor_options& options() const noexcept;

    /// @brief Queue a callback for the next tick.
    watcher_id defer(task_callback callback) override;

    /**
     * @brief Schedule a one-shot callback.
     * @param seconds Delay from now; `errc::invalid_input` when negative or
     *        NaN. Infinite or out-of-range delays never fire.
     */
    [[nodiscard]] result<watcher_id> delay(std::chrono::duration<double> seconds,
                                           task_callback callback);

    /**
     * @brief Schedule a repeating callback.
     *
     * After each firing the next deadline is the firing tick's time plus the
     * interval, so a slow callback lengthens the period instead of causing a
     * catch-up burst.
     *
     * @param seconds Interval; `errc::invalid_input` when negative or NaN.
     *        Infinite or out-of-range intervals never fire.
     */
    [[nodiscard]] result<watcher_id>
    repeat(std::chrono::duration<double> seconds, task_callback callback);

    /**
     * @brief Watch a descriptor for read readiness (level-triggered).
     * @param fd Open descriptor; `errc::invalid_input` otherwise.
     */
    [[nodiscard]] result<watcher_id> on_readable(int fd,
                                                 stream_callback callback);
    /**
     * @brief Watch a descriptor for write readiness (level-triggered).
     * @param fd Open descriptor; `errc::invalid_input` otherwise.
     */
    [[nodiscard]] result<watcher_id> on_writable(int fd,
                                                 stream_callback callback);

    /// @brief Remove a watcher. Unknown or already-fired ids are ignored.
    void cancel(watcher_id id) noexcept;

    /**
     * @brief Run ticks until `stop()` is observed.
     * @return `errc::already_running` for a reentrant call, the backend
     * initialization error when invalid, success otherwise.
     */
    [[nodiscard]] result<void> run();
    /// @brief Request exit at the top of the next tick.
    void stop() noexcept;
    /// @return `true` while `run()` is executing.
    [[nodiscard]] bool running() const noexcept;

    /// @return Number of registered watchers across all tables.
    [[nodiscard]] std::size_t watcher_count() const noexcept;

private:
    struct timer_entry {
        task_callback callback;
        clock::time_point deadline;
    };

    struct repeat_entry {
        task_callback callback;
        clock::duration interval;
        clock::time_point next_deadline;
    };

    struct stream_entry {
        int fd{-1};
        stream_callback callback;
    };

    using stream_table = std::map<std::uint64_t, stream_entry>;

    void tick();
    void run_deferred();
    void run_timers(clock::time_point now);
    void run_repeats(clock::time_point now);
    [[nodiscard]] clock::duration compute_timeout(clock::time_point now) const;
    void poll_streams(clock::duration timeout);
    void dispatch_streams(stream_table& table, watcher_kind kind,
                          std::size_t ready_count);
    void idle(clock::duration timeout);
    [[nodiscard]] result<watcher_id> watch(stream_table& table,
                                           watcher_kind kind, int fd,
                                           stream_callback callback);
    void report(const char *context) noexcept;

    reactor_options options_;
    std::shared_ptr<error_sink> sink_;
    std::unique_ptr<io::multiplexer> multiplexer_{};
    std::optional<error> init_error_{};

    // Keyed by sequence number, so iteration follows registration order.
    std::map<std::uint64_t, task_callback> deferred_{};
    std::map<std::uint64_t, timer_entry> timers_{};
    std::map<std::uint64_t, repeat_entry> repeats_{};
    stream_table readable_{};
    stream_table writable_{};

    std::vector<io::interest> interests_{};
    std::vector<io::ready_event> ready_{};

    bool running_{false};
    bool stop_requested_{false};
};

} // namespace tickloop::runtime
