#pragma once

/**
 * @file
 * @brief `io_uring` readiness multiplexer built on one-shot poll requests.
 */

#include "tickloop/core/result.hpp"
#include "tickloop/io/multiplexer.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <liburing.h>
#include <memory>
#include <span>
#include <vector>

namespace tickloop::uring {

/**
 * @brief RAII wrapper over a configured `io_uring` ring implementing
 * `io::multiplexer`.
 *
 * Every `wait()` submits one poll-add per interest, tagged with the wait's
 * generation. Polls that did not complete are removed before returning;
 * their late completions carry an old generation and are discarded.
 */
class multiplexer final : public io::multiplexer {
public:
    /// Construct an invalid multiplexer.
    multiplexer() noexcept = default;
    /// Construct from an initialized ring object.
    explicit multiplexer(
        std::unique_ptr<io_uring, void (*)(io_uring *)> ring) noexcept;

    multiplexer(const multiplexer&) = delete;
    multiplexer& operator=(const multiplexer&) = delete;
    multiplexer(multiplexer&&) noexcept = default;
    multiplexer& operator=(multiplexer&&) noexcept = default;

    /**
     * @brief Create and initialize an `io_uring` instance.
     * @param entries Ring queue depth.
     */
    [[nodiscard]] static result<multiplexer>
    create(std::uint32_t entries = 256) noexcept;

    [[nodiscard]] result<std::size_t>
    wait(std::span<const io::interest> interests,
         std::span<io::ready_event> ready,
         std::chrono::milliseconds timeout) noexcept override;

    [[nodiscard]] io::backend kind() const noexcept override;

    /// @return `true` when the ring is initialized.
    [[nodiscard]] bool valid() const noexcept;

private:
    [[nodiscard]] io_uring_sqe *acquire_sqe() noexcept;
    [[nodiscard]] result<void> submit() noexcept;
    [[nodiscard]] result<void>
    submit_polls(std::span<const io::interest> interests) noexcept;
    [[nodiscard]] result<void>
    remove_unfinished(std::span<const io::interest> interests) noexcept;
    void discard_stale_completions() noexcept;
    [[nodiscard]] std::uint64_t token(std::size_t index) const noexcept;

    std::unique_ptr<io_uring, void (*)(io_uring *)> ring_{nullptr, nullptr};
    std::uint32_t generation_{0};
    std::vector<std::uint32_t> completed_masks_{};
    std::vector<bool> finished_{};
};

} // namespace tickloop::uring
