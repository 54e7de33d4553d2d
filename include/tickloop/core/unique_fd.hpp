#pragma once

/**
 * @file
 * @brief RAII ownership wrapper for POSIX file descriptors and descriptor
 * helpers used by stream watchers.
 */

#include "tickloop/core/result.hpp"

namespace tickloop {

/**
 * @brief Move-only owner of a file descriptor.
 */
class unique_fd {
public:
    /// Construct an empty handle (`fd == -1`).
    unique_fd() noexcept = default;
    /// Take ownership of an existing descriptor.
    explicit unique_fd(int fd) noexcept;
    /// Close the descriptor if still owned.
    ~unique_fd() noexcept;

    unique_fd(const unique_fd&) = delete;
    unique_fd& operator=(const unique_fd&) = delete;

    /// Move ownership from another instance.
    unique_fd(unique_fd&& other) noexcept;
    /// Move-assign ownership from another instance.
    unique_fd& operator=(unique_fd&& other) noexcept;

    /// @return Owned file descriptor or `-1`.
    [[nodiscard]] int get() const noexcept;
    /// @return `true` when the object owns a valid descriptor.
    [[nodiscard]] bool valid() const noexcept;
    /// @return Same as `valid()`.
    [[nodiscard]] explicit operator bool() const noexcept;

    /**
     * @brief Release ownership without closing.
     * @return Previously owned descriptor or `-1`.
     */
    [[nodiscard]] int release() noexcept;
    /**
     * @brief Replace the owned descriptor.
     * @param fd New descriptor. Defaults to `-1` (close and clear).
     */
    void reset(int fd = -1) noexcept;

private:
    int fd_{-1};
};

/**
 * @brief Both ends of an anonymous pipe.
 */
struct pipe_pair {
    /// Read end.
    unique_fd read_end;
    /// Write end.
    unique_fd write_end;
};

/**
 * @brief Create a close-on-exec pipe.
 * @param nonblocking Set `O_NONBLOCK` on both ends.
 */
[[nodiscard]] result<pipe_pair> open_pipe(bool nonblocking = true) noexcept;

/**
 * @brief Check that a descriptor refers to an open file description.
 * @param fd Descriptor to probe.
 */
[[nodiscard]] bool descriptor_is_open(int fd) noexcept;

} // namespace tickloop
