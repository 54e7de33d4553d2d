#pragma once

/**
 * @file
 * @brief Watcher identity, callback types and the scheduling seam used by
 * the promise engine.
 */

#include <cstdint>
#include <functional>

namespace tickloop::runtime {

/// @brief Table a watcher lives in.
enum class watcher_kind : std::uint8_t {
    none,
    deferred,
    timer,
    repeat,
    readable,
    writable,
};

/**
 * @brief Opaque watcher handle returned by every scheduling call.
 *
 * Sequence numbers come from one process-wide monotonic counter, so an id is
 * never reused while the process runs. A default-constructed id is invalid.
 */
class watcher_id {
public:
    /// Construct an invalid id.
    constexpr watcher_id() noexcept = default;

    /// @return `true` for ids issued by a scheduling call.
    [[nodiscard]] constexpr bool valid() const noexcept {
        return kind_ != watcher_kind::none;
    }
    /// @return Table this id belongs to.
    [[nodiscard]] constexpr watcher_kind kind() const noexcept {
        return kind_;
    }
    /// @return Process-wide sequence number.
    [[nodiscard]] constexpr std::uint64_t sequence() const noexcept {
        return sequence_;
    }

    friend constexpr bool operator==(watcher_id lhs, watcher_id rhs) noexcept {
        return lhs.kind_ == rhs.kind_ && lhs.sequence_ == rhs.sequence_;
    }

    /// @brief Issue a fresh id for the given table.
    [[nodiscard]] static watcher_id next(watcher_kind kind) noexcept;

private:
    constexpr watcher_id(watcher_kind kind, std::uint64_t sequence) noexcept
        : kind_(kind), sequence_(sequence) {}

    watcher_kind kind_{watcher_kind::none};
    std::uint64_t sequence_{0};
};

/// Callback run by `defer`, `delay` and `repeat`.
using task_callback = std::function<void()>;
/// Callback run by stream watchers; receives the ready descriptor.
using stream_callback = std::function<void(int fd)>;

/**
 * @brief Deferral interface implemented by the reactor.
 *
 * The promise engine only needs "run this on the next tick"; depending on
 * this seam keeps promises testable against any reactor instance.
 */
class scheduler {
public:
    virtual ~scheduler() = default;

    /**
     * @brief Queue a callback for the next tick.
     * @param callback Work to run; insertion order is preserved.
     * @return Id usable with `cancel`.
     */
    virtual watcher_id defer(task_callback callback) = 0;
};

} // namespace tickloop::runtime
