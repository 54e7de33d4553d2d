#include "tickloop/epoll/multiplexer.hpp"

#include <algorithm>
#include <cerrno>
#include <limits>
#include <sys/epoll.h>
#include <unordered_set>
#include <vector>

namespace tickloop::epoll {

namespace {

constexpr std::size_t kMaxCachedEventBatch = 1024;
constexpr std::uint32_t kReadReadyMask =
    EPOLLIN | EPOLLERR | EPOLLHUP | EPOLLRDHUP;
constexpr std::uint32_t kWriteReadyMask = EPOLLOUT | EPOLLERR | EPOLLHUP;

// epoll_ctl refuses regular files with EPERM; poll(2) reports them ready.
// A descriptor closed behind the reactor's back fails with EBADF and is
// reported ready so its callback observes the error on its next I/O call.
[[nodiscard]] bool reported_as_ready(const tickloop::error& failure) noexcept {
    return failure.value() == EPERM || failure.value() == EBADF;
}

[[nodiscard]] std::uint32_t interest_mask(const io::interest& entry) noexcept {
    std::uint32_t mask = 0;
    if (entry.readable) {
        mask |= EPOLLIN | EPOLLRDHUP;
    }
    if (entry.writable) {
        mask |= EPOLLOUT;
    }
    return mask;
}

} // namespace

multiplexer::multiplexer(tickloop::unique_fd epoll_fd) noexcept
    : epoll_fd_(std::move(epoll_fd)) {}

result<multiplexer> multiplexer::create() noexcept {
    const int fd = ::epoll_create1(EPOLL_CLOEXEC);
    if (fd < 0) {
        return err<multiplexer>(error::from_errno());
    }

    return multiplexer{tickloop::unique_fd{fd}};
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

    const auto reconcile_result = reconcile(interests);
    if (!reconcile_result.has_value()) {
        return err<std::size_t>(reconcile_result.error());
    }

    const std::size_t batch = std::max<std::size_t>(interests.size(), 1U);
    ::epoll_event *sys_events_ptr = nullptr;
    std::vector<::epoll_event> uncached_events{};

    if (batch <= kMaxCachedEventBatch) {
        thread_local std::vector<::epoll_event> cached_events{};
        if (cached_events.size() < batch) {
            cached_events.resize(batch);
        }
        sys_events_ptr = cached_events.data();
    } else {
        uncached_events.resize(batch);
        sys_events_ptr = uncached_events.data();
    }

    int timeout_ms = 0;
    if (timeout.count() > 0 && forced_ready_.empty()) {
        timeout_ms = static_cast<int>(std::min<long long>(
            timeout.count(),
            static_cast<long long>(std::numeric_limits<int>::max())));
    }

    const int ready_count = ::epoll_wait(epoll_fd_.get(), sys_events_ptr,
                                         static_cast<int>(batch), timeout_ms);
    if (ready_count < 0) {
        if (errno == EINTR) {
            return static_cast<std::size_t>(0);
        }
        return err<std::size_t>(error::from_errno());
    }

    std::size_t filled = 0;
    for (int i = 0; i < ready_count; ++i) {
        const auto& event = sys_events_ptr[static_cast<std::size_t>(i)];
        const auto it = registered_.find(event.data.fd);
        if (it == registered_.end()) {
            continue;
        }

        const bool readable =
            (it->second & EPOLLIN) != 0U && (event.events & kReadReadyMask) != 0U;
        const bool writable = (it->second & EPOLLOUT) != 0U &&
                              (event.events & kWriteReadyMask) != 0U;
        if (!readable && !writable) {
            continue;
        }

        ready[filled] = io::ready_event{
            .fd = event.data.fd, .readable = readable, .writable = writable};
        ++filled;
    }

    for (const auto& entry : forced_ready_) {
        if (filled == ready.size()) {
            break;
        }
        ready[filled] = io::ready_event{
            .fd = entry.fd, .readable = entry.readable, .writable = entry.writable};
        ++filled;
    }
    return filled;
}

io::backend multiplexer::kind() const noexcept {
    return io::backend::epoll;
}

int multiplexer::native_handle() const noexcept {
    return epoll_fd_.get();
}

bool multiplexer::valid() const noexcept {
    return epoll_fd_.valid();
}

std::size_t multiplexer::registered_count() const noexcept {
    return registered_.size();
}

result<void>
multiplexer::reconcile(std::span<const io::interest> interests) noexcept {
    std::unordered_set<int> wanted{};
    wanted.reserve(interests.size());
    for (const auto& entry : interests) {
        wanted.insert(entry.fd);
    }

    for (auto it = registered_.begin(); it != registered_.end();) {
        if (wanted.contains(it->first)) {
            ++it;
            continue;
        }

        const auto remove_result = ctl(EPOLL_CTL_DEL, it->first, 0, false);
        if (!remove_result.has_value()) {
            return remove_result;
        }
        it = registered_.erase(it);
    }

    forced_ready_.clear();
    for (const auto& entry : interests) {
        const auto mask = interest_mask(entry);
        if (entry.fd < 0 || mask == 0U) {
            return err<void>(make_error_from_errno(EINVAL));
        }

        const auto arm_result = arm(entry.fd, mask);
        if (arm_result.has_value()) {
            continue;
        }
        if (!reported_as_ready(arm_result.error())) {
            return arm_result;
        }
        forced_ready_.push_back(entry);
    }
    return ok();
}

result<void> multiplexer::arm(int fd, std::uint32_t events) noexcept {
    const auto it = registered_.find(fd);
    if (it == registered_.end()) {
        auto add_result = ctl(EPOLL_CTL_ADD, fd, events, true);
        if (!add_result.has_value() && add_result.error().value() == EEXIST) {
            add_result = ctl(EPOLL_CTL_MOD, fd, events, true);
        }
        if (!add_result.has_value()) {
            return add_result;
        }
        registered_.emplace(fd, events);
        return ok();
    }

    auto modify_result = ctl(EPOLL_CTL_MOD, fd, events, true);
    if (!modify_result.has_value() && modify_result.error().value() == ENOENT) {
        // The previous file description was closed and the number reused.
        modify_result = ctl(EPOLL_CTL_ADD, fd, events, true);
    }
    if (!modify_result.has_value()) {
        registered_.erase(it);
        return modify_result;
    }
    it->second = events;
    return ok();
}

result<void> multiplexer::ctl(int operation, int fd, std::uint32_t events,
                              bool has_event) noexcept {
    if (!valid()) {
        return err<void>(make_error_from_errno(EBADF));
    }
    if (fd < 0) {
        return err<void>(make_error_from_errno(EBADF));
    }

    epoll_event event{};
    event.events = events;
    event.data.fd = fd;

    epoll_event *event_ptr = has_event ? &event : nullptr;
    if (::epoll_ctl(epoll_fd_.get(), operation, fd, event_ptr) == 0) {
        return ok();
    }

    if (operation == EPOLL_CTL_DEL && (errno == ENOENT || errno == EBADF)) {
        return ok();
    }
    return err<void>(error::from_errno());
}

} // namespace tickloop::epoll
