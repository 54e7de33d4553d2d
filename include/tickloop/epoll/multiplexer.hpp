#pragma once

/**
 * @file
 * @brief Level-triggered epoll readiness multiplexer.
 */

#include "tickloop/core/result.hpp"
#include "tickloop/core/unique_fd.hpp"
#include "tickloop/io/multiplexer.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <unordered_map>
#include <vector>

namespace tickloop::epoll {

/**
 * @brief RAII wrapper over an epoll instance implementing `io::multiplexer`.
 *
 * The kernel interest list is reconciled against the interest set passed to
 * every `wait()`: new descriptors are added, vanished ones removed, the rest
 * re-armed so a closed-and-reused descriptor number is registered again.
 *
 * Descriptors epoll refuses to watch (regular files, or numbers closed since
 * they were handed in) are reported ready on every wait, the way `poll(2)`
 * reports them, and the wait does not block while any are present.
 */
class multiplexer final : public io::multiplexer {
public:
    /// Construct an invalid multiplexer.
    multiplexer() noexcept = default;
    /// Construct from an existing epoll descriptor.
    explicit multiplexer(tickloop::unique_fd epoll_fd) noexcept;

    multiplexer(const multiplexer&) = delete;
    multiplexer& operator=(const multiplexer&) = delete;
    multiplexer(multiplexer&&) noexcept = default;
    multiplexer& operator=(multiplexer&&) noexcept = default;

    /// @brief Create a new epoll instance.
    [[nodiscard]] static result<multiplexer> create() noexcept;

    [[nodiscard]] result<std::size_t>
    wait(std::span<const io::interest> interests,
         std::span<io::ready_event> ready,
         std::chrono::milliseconds timeout) noexcept override;

    [[nodiscard]] io::backend kind() const noexcept override;

    /// @return Native epoll descriptor.
    [[nodiscard]] int native_handle() const noexcept;
    /// @return `true` when a valid epoll descriptor is owned.
    [[nodiscard]] bool valid() const noexcept;
    /// @return Number of descriptors currently in the kernel interest list.
    [[nodiscard]] std::size_t registered_count() const noexcept;

private:
    [[nodiscard]] result<void>
    reconcile(std::span<const io::interest> interests) noexcept;
    [[nodiscard]] result<void> arm(int fd, std::uint32_t events) noexcept;
    [[nodiscard]] result<void> ctl(int operation, int fd, std::uint32_t events,
                                   bool has_event) noexcept;

    tickloop::unique_fd epoll_fd_;
    std::unordered_map<int, std::uint32_t> registered_{};
    std::vector<io::interest> forced_ready_{};
};

} // namespace tickloop::epoll
