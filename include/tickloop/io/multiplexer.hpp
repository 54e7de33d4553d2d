#pragma once

/**
 * @file
 * @brief Readiness multiplexer interface used by the reactor's I/O phase.
 */

#include "tickloop/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

namespace tickloop::io {

/**
 * @brief Interest declared for one descriptor during a wait.
 */
struct interest {
    /// Watched descriptor.
    int fd{-1};
    /// Report read readiness.
    bool readable{false};
    /// Report write readiness.
    bool writable{false};
};

/**
 * @brief Readiness reported for one descriptor.
 */
struct ready_event {
    /// Ready descriptor.
    int fd{-1};
    /// Descriptor is readable (or hung up / in error).
    bool readable{false};
    /// Descriptor is writable (or in error).
    bool writable{false};
};

/// @brief Supported readiness backends.
enum class backend {
    epoll,
    io_uring,
};

/// @return Stable lowercase backend name.
[[nodiscard]] std::string_view to_string(backend value) noexcept;

/**
 * @brief Blocking level-triggered readiness wait over a set of descriptors.
 *
 * Each call receives the full interest set for the current tick. A
 * descriptor present in one call and missing from the next stops being
 * watched.
 */
class multiplexer {
public:
    virtual ~multiplexer() = default;

    /**
     * @brief Wait until at least one descriptor is ready or the timeout elapses.
     * @param interests Descriptors to watch, at most one entry per descriptor.
     * @param ready Output slots; must hold at least `interests.size()` entries.
     * @param timeout Maximum wait duration.
     * @return Number of filled `ready` entries (zero on timeout).
     */
    [[nodiscard]] virtual result<std::size_t>
    wait(std::span<const interest> interests, std::span<ready_event> ready,
         std::chrono::milliseconds timeout) noexcept = 0;

    /// @return Backend implemented by this multiplexer.
    [[nodiscard]] virtual backend kind() const noexcept = 0;
};

/**
 * @brief Create a multiplexer for the selected backend.
 * @param choice Backend implementation.
 * @param uring_queue_depth Ring depth when `io_uring` is selected.
 */
[[nodiscard]] result<std::unique_ptr<multiplexer>>
make_multiplexer(backend choice, std::uint32_t uring_queue_depth = 256);

} // namespace tickloop::io
