#include "tickloop/uring/multiplexer.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <new>
#include <optional>
#include <poll.h>

namespace {

constexpr std::uint64_t kIndexMask = 0xffffffffULL;
constexpr unsigned kReadReadyMask = POLLIN | POLLERR | POLLHUP | POLLRDHUP;
constexpr unsigned kWriteReadyMask = POLLOUT | POLLERR | POLLHUP;

void destroy_ring(io_uring *ring) noexcept {
    if (ring == nullptr) {
        return;
    }
    ::io_uring_queue_exit(ring);
    delete ring;
}

[[nodiscard]] __kernel_timespec
to_kernel_timespec(std::chrono::nanoseconds timeout) noexcept {
    if (timeout < std::chrono::nanoseconds{0}) {
        timeout = std::chrono::nanoseconds{0};
    }

    const auto seconds =
        std::chrono::duration_cast<std::chrono::seconds>(timeout);
    const auto nanoseconds = timeout - seconds;

    __kernel_timespec ts{};
    ts.tv_sec = static_cast<decltype(ts.tv_sec)>(seconds.count());
    ts.tv_nsec = static_cast<decltype(ts.tv_nsec)>(nanoseconds.count());
    return ts;
}

[[nodiscard]] unsigned poll_mask(const tickloop::io::interest& entry) noexcept {
    unsigned mask = 0;
    if (entry.readable) {
        mask |= POLLIN | POLLRDHUP;
    }
    if (entry.writable) {
        mask |= POLLOUT;
    }
    return mask;
}

} // namespace

namespace tickloop::uring {

multiplexer::multiplexer(
    std::unique_ptr<io_uring, void (*)(io_uring *)> ring) noexcept
    : ring_(std::move(ring)) {}

result<multiplexer> multiplexer::create(std::uint32_t entries) noexcept {
    if (entries == 0U) {
        return err<multiplexer>(make_error_from_errno(EINVAL));
    }

    std::unique_ptr<io_uring, void (*)(io_uring *)> ring{
        new (std::nothrow) io_uring{}, destroy_ring};
    if (ring == nullptr) {
        return err<multiplexer>(make_error_from_errno(ENOMEM));
    }

    const int init_result =
        ::io_uring_queue_init(static_cast<unsigned>(entries), ring.get(), 0U);
    if (init_result < 0) {
        // Never initialized: release without io_uring_queue_exit.
        delete ring.release();
        return err<multiplexer>(make_error_from_errno(-init_result));
    }

    return multiplexer{std::move(ring)};
}

result<std::size_t> multiplexer::wait(std::span<const io::interest> interests,
                                      std::span<io::ready_event> ready,
                                      std::chrono::milliseconds timeout) noexcept {
    if (!valid()) {
        return err<std::size_t>(make_error_from_errno(EBADF));
    }
    if (ready.size() < interests.size()) {
        return err<std::size_t>(make_error_from_errno(EINVAL));
    }

    discard_stale_completions();
    ++generation_;
    completed_masks_.assign(interests.size(), 0U);
    finished_.assign(interests.size(), false);

    const auto submit_result = submit_polls(interests);
    if (!submit_result.has_value()) {
        return err<std::size_t>(submit_result.error());
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::optional<error> failure{};
    bool collected = false;

    while (!collected && !failure.has_value()) {
        io_uring_cqe *cqe = nullptr;
        auto remaining = deadline - std::chrono::steady_clock::now();
        auto timeout_spec = to_kernel_timespec(
            std::chrono::duration_cast<std::chrono::nanoseconds>(remaining));

        const int wait_result =
            ::io_uring_wait_cqe_timeout(ring_.get(), &cqe, &timeout_spec);
        if (wait_result == -ETIME || wait_result == -EINTR) {
            break;
        }
        if (wait_result < 0) {
            failure = make_error_from_errno(-wait_result);
            break;
        }

        while (cqe != nullptr) {
            const auto user_data = ::io_uring_cqe_get_data64(cqe);
            const int res = cqe->res;
            ::io_uring_cqe_seen(ring_.get(), cqe);

            const auto index = user_data & kIndexMask;
            if ((user_data >> 32U) == generation_ && index != 0U &&
                index <= interests.size()) {
                finished_[index - 1U] = true;
                if (res > 0) {
                    completed_masks_[index - 1U] = static_cast<std::uint32_t>(res);
                    collected = true;
                } else if (res < 0 && res != -ECANCELED) {
                    // A descriptor the kernel cannot poll is reported ready;
                    // its callback sees the error on its next I/O call.
                    completed_masks_[index - 1U] = POLLERR;
                    collected = true;
                }
            }

            cqe = nullptr;
            if (::io_uring_peek_cqe(ring_.get(), &cqe) != 0) {
                cqe = nullptr;
            }
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
    }

    const auto remove_result = remove_unfinished(interests);
    if (failure.has_value()) {
        return err<std::size_t>(failure.value());
    }
    if (!remove_result.has_value()) {
        return err<std::size_t>(remove_result.error());
    }

    std::size_t filled = 0;
    for (std::size_t i = 0; i < interests.size(); ++i) {
        const auto mask = completed_masks_[i];
        const bool readable =
            interests[i].readable && (mask & kReadReadyMask) != 0U;
        const bool writable =
            interests[i].writable && (mask & kWriteReadyMask) != 0U;
        if (!readable && !writable) {
            continue;
        }
        ready[filled] = io::ready_event{
            .fd = interests[i].fd, .readable = readable, .writable = writable};
        ++filled;
    }
    return filled;
}

io::backend multiplexer::kind() const noexcept {
    return io::backend::io_uring;
}

bool multiplexer::valid() const noexcept {
    return ring_ != nullptr;
}

io_uring_sqe *multiplexer::acquire_sqe() noexcept {
    io_uring_sqe *sqe = ::io_uring_get_sqe(ring_.get());
    if (sqe != nullptr) {
        return sqe;
    }

    // Submission queue full: flush it and retry once.
    if (::io_uring_submit(ring_.get()) < 0) {
        return nullptr;
    }
    return ::io_uring_get_sqe(ring_.get());
}

result<void> multiplexer::submit() noexcept {
    const int submit_result = ::io_uring_submit(ring_.get());
    if (submit_result < 0) {
        return err<void>(make_error_from_errno(-submit_result));
    }
    return ok();
}

result<void>
multiplexer::submit_polls(std::span<const io::interest> interests) noexcept {
    for (std::size_t i = 0; i < interests.size(); ++i) {
        const auto mask = poll_mask(interests[i]);
        if (interests[i].fd < 0 || mask == 0U) {
            return err<void>(make_error_from_errno(EINVAL));
        }

        io_uring_sqe *sqe = acquire_sqe();
        if (sqe == nullptr) {
            return err<void>(make_error_from_errno(EBUSY));
        }
        ::io_uring_prep_poll_add(sqe, interests[i].fd, mask);
        ::io_uring_sqe_set_data64(sqe, token(i));
    }
    return submit();
}

result<void>
multiplexer::remove_unfinished(std::span<const io::interest> interests) noexcept {
    bool pending_removal = false;
    for (std::size_t i = 0; i < interests.size(); ++i) {
        if (finished_[i]) {
            continue;
        }

        io_uring_sqe *sqe = acquire_sqe();
        if (sqe == nullptr) {
            return err<void>(make_error_from_errno(EBUSY));
        }
        ::io_uring_prep_poll_remove(sqe, token(i));
        ::io_uring_sqe_set_data64(sqe, 0U);
        pending_removal = true;
    }

    if (!pending_removal) {
        return ok();
    }
    return submit();
}

void multiplexer::discard_stale_completions() noexcept {
    io_uring_cqe *cqe = nullptr;
    while (::io_uring_peek_cqe(ring_.get(), &cqe) == 0 && cqe != nullptr) {
        ::io_uring_cqe_seen(ring_.get(), cqe);
        cqe = nullptr;
    }
}

std::uint64_t multiplexer::token(std::size_t index) const noexcept {
    return (static_cast<std::uint64_t>(generation_) << 32U) |
           static_cast<std::uint64_t>(index + 1U);
}

} // namespace tickloop::uring
