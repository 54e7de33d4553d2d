#include "tickloop/runtime/reactor.hpp"

#include "tickloop/core/unique_fd.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <thread>
#include <unordered_set>
#include <utility>

namespace tickloop::runtime {

namespace {

std::atomic<std::uint64_t> watcher_sequence{0};

// NaN and negative values are rejected; +infinity means "never".
[[nodiscard]] bool valid_interval(std::chrono::duration<double> seconds) noexcept {
    return !std::isnan(seconds.count()) && seconds.count() >= 0.0;
}

// Intervals past the clock's range saturate to duration::max().
[[nodiscard]] reactor::clock::duration
to_clock_duration(std::chrono::duration<double> seconds) noexcept {
    const double ticks =
        std::chrono::duration<double, reactor::clock::period>(seconds).count();
    if (ticks >= static_cast<double>(reactor::clock::duration::max().count())) {
        return reactor::clock::duration::max();
    }
    return reactor::clock::duration{static_cast<reactor::clock::rep>(ticks)};
}

[[nodiscard]] reactor::clock::time_point
deadline_after(reactor::clock::time_point now,
               reactor::clock::duration offset) noexcept {
    if (offset >= reactor::clock::time_point::max() - now) {
        return reactor::clock::time_point::max();
    }
    return now + offset;
}

} // namespace

watcher_id watcher_id::next(watcher_kind kind) noexcept {
    return watcher_id{
        kind, watcher_sequence.fetch_add(1, std::memory_order_relaxed) + 1};
}

reactor::reactor(reactor_options options, std::shared_ptr<error_sink> sink)
    : options_(options),
      sink_(sink != nullptr ? std::move(sink) : default_error_sink()) {
    auto created = io::make_multiplexer(options_.selected_backend,
                                        options_.uring_queue_depth);
    if (!created.has_value()) {
        init_error_ = created.error();
        return;
    }
    multiplexer_ = std::move(created.value());
}

reactor::~reactor() = default;

bool reactor::valid() const noexcept {
    return !init_error_.has_value() && multiplexer_ != nullptr;
}

std::optional<error> reactor::init_error() const noexcept {
    return init_error_;
}

const reactor_options& reactor::options() const noexcept {
    return options_;
}

watcher_id reactor::defer(task_callback callback) {
    const auto id = watcher_id::next(watcher_kind::deferred);
    deferred_.emplace(id.sequence(), std::move(callback));
    return id;
}

result<watcher_id> reactor::delay(std::chrono::duration<double> seconds,
                                  task_callback callback) {
    if (!valid_interval(seconds)) {
        return err<watcher_id>(errc::invalid_input);
    }

    const auto id = watcher_id::next(watcher_kind::timer);
    timers_.emplace(id.sequence(),
                    timer_entry{std::move(callback),
                                deadline_after(clock::now(),
                                               to_clock_duration(seconds))});
    return id;
}

result<watcher_id> reactor::repeat(std::chrono::duration<double> seconds,
                                   task_callback callback) {
    if (!valid_interval(seconds)) {
        return err<watcher_id>(errc::invalid_input);
    }

    const auto interval = to_clock_duration(seconds);
    const auto id = watcher_id::next(watcher_kind::repeat);
    repeats_.emplace(id.sequence(),
                     repeat_entry{std::move(callback), interval,
                                  deadline_after(clock::now(), interval)});
    return id;
}

result<watcher_id> reactor::on_readable(int fd, stream_callback callback) {
    return watch(readable_, watcher_kind::readable, fd, std::move(callback));
}

result<watcher_id> reactor::on_writable(int fd, stream_callback callback) {
    return watch(writable_, watcher_kind::writable, fd, std::move(callback));
}

void reactor::cancel(watcher_id id) noexcept {
    switch (id.kind()) {
    case watcher_kind::deferred:
        deferred_.erase(id.sequence());
        break;
    case watcher_kind::timer:
        timers_.erase(id.sequence());
        break;
    case watcher_kind::repeat:
        repeats_.erase(id.sequence());
        break;
    case watcher_kind::readable:
        readable_.erase(id.sequence());
        break;
    case watcher_kind::writable:
        writable_.erase(id.sequence());
        break;
    case watcher_kind::none:
        break;
    }
}

result<void> reactor::run() {
    if (running_) {
        return err<void>(errc::already_running);
    }
    if (!valid()) {
        return err<void>(init_error_.value_or(make_error(errc::backend_unavailable)));
    }

    struct running_guard {
        bool& flag;
        ~running_guard() {
            flag = false;
        }
    };

    running_ = true;
    stop_requested_ = false;
    const running_guard guard{running_};

    while (!stop_requested_) {
        tick();
    }
    return ok();
}

void reactor::stop() noexcept {
    stop_requested_ = true;
}

bool reactor::running() const noexcept {
    return running_;
}

std::size_t reactor::watcher_count() const noexcept {
    return deferred_.size() + timers_.size() + repeats_.size() +
           readable_.size() + writable_.size();
}

void reactor::tick() {
    run_deferred();

    const auto now = clock::now();
    run_timers(now);
    run_repeats(now);

    const auto timeout = compute_timeout(clock::now());
    if (!readable_.empty() || !writable_.empty()) {
        poll_streams(timeout);
        return;
    }
    idle(timeout);
}

void reactor::run_deferred() {
    auto batch = std::exchange(deferred_, {});
    for (auto& [sequence, callback] : batch) {
        if (!callback) {
            continue;
        }
        try {
            callback();
        } catch (...) {
            report("deferred");
        }
    }
}

void reactor::run_timers(clock::time_point now) {
    std::vector<std::uint64_t> due{};
    for (const auto& [sequence, entry] : timers_) {
        if (entry.deadline <= now) {
            due.push_back(sequence);
        }
    }

    for (const auto sequence : due) {
        auto it = timers_.find(sequence);
        if (it == timers_.end()) {
            continue;
        }

        auto callback = std::move(it->second.callback);
        timers_.erase(it);
        if (!callback) {
            continue;
        }
        try {
            callback();
        } catch (...) {
            report("timer");
        }
    }
}

void reactor::run_repeats(clock::time_point now) {
    std::vector<std::uint64_t> due{};
    for (const auto& [sequence, entry] : repeats_) {
        if (entry.next_deadline <= now) {
            due.push_back(sequence);
        }
    }

    for (const auto sequence : due) {
        auto it = repeats_.find(sequence);
        if (it == repeats_.end()) {
            continue;
        }

        // Copy: the callback may cancel its own entry.
        auto callback = it->second.callback;
        if (callback) {
            try {
                callback();
            } catch (...) {
                report("repeat");
            }
        }

        it = repeats_.find(sequence);
        if (it != repeats_.end()) {
            it->second.next_deadline = deadline_after(now, it->second.interval);
        }
    }
}

reactor::clock::duration reactor::compute_timeout(clock::time_point now) const {
    if (!deferred_.empty()) {
        return clock::duration::zero();
    }

    std::optional<clock::duration> nearest{};
    const auto consider = [&](clock::time_point deadline) {
        const auto remaining =
            std::max(deadline - now, clock::duration::zero());
        if (!nearest.has_value() || remaining < nearest.value()) {
            nearest = remaining;
        }
    };
    for (const auto& [sequence, entry] : timers_) {
        consider(entry.deadline);
    }
    for (const auto& [sequence, entry] : repeats_) {
        consider(entry.next_deadline);
    }

    const auto ceiling =
        std::chrono::duration_cast<clock::duration>(options_.max_wait);
    if (!nearest.has_value()) {
        if (readable_.empty() && writable_.empty()) {
            return clock::duration::zero();
        }
        return ceiling;
    }
    return std::min(nearest.value(), ceiling);
}

void reactor::poll_streams(clock::duration timeout) {
    std::map<int, io::interest> merged{};
    for (const auto& [sequence, entry] : readable_) {
        auto& slot = merged[entry.fd];
        slot.fd = entry.fd;
        slot.readable = true;
    }
    for (const auto& [sequence, entry] : writable_) {
        auto& slot = merged[entry.fd];
        slot.fd = entry.fd;
        slot.writable = true;
    }

    interests_.clear();
    for (const auto& [fd, entry] : merged) {
        interests_.push_back(entry);
    }
    ready_.resize(interests_.size());

    const auto wait_result = multiplexer_->wait(
        interests_, ready_, std::chrono::ceil<std::chrono::milliseconds>(timeout));
    if (!wait_result.has_value()) {
        sink_->report("multiplexer", reason{wait_result.error()});
        // Bound the tick anyway so a persistent failure does not spin.
        idle(timeout);
        return;
    }

    dispatch_streams(readable_, watcher_kind::readable, wait_result.value());
    dispatch_streams(writable_, watcher_kind::writable, wait_result.value());
}

void reactor::dispatch_streams(stream_table& table, watcher_kind kind,
                               std::size_t ready_count) {
    std::unordered_set<int> ready_fds{};
    for (std::size_t i = 0; i < ready_count; ++i) {
        const bool ready = kind == watcher_kind::readable ? ready_[i].readable
                                                          : ready_[i].writable;
        if (ready) {
            ready_fds.insert(ready_[i].fd);
        }
    }
    if (ready_fds.empty()) {
        return;
    }

    std::vector<std::uint64_t> due{};
    for (const auto& [sequence, entry] : table) {
        if (ready_fds.contains(entry.fd)) {
            due.push_back(sequence);
        }
    }

    const char *context =
        kind == watcher_kind::readable ? "readable" : "writable";
    for (const auto sequence : due) {
        const auto it = table.find(sequence);
        if (it == table.end()) {
            continue;
        }

        const int fd = it->second.fd;
        auto callback = it->second.callback;
        if (!callback) {
            continue;
        }
        try {
            callback(fd);
        } catch (...) {
            report(context);
        }
    }
}

void reactor::idle(clock::duration timeout) {
    if (timeout > clock::duration::zero()) {
        std::this_thread::sleep_for(timeout);
        return;
    }
    if (deferred_.empty()) {
        std::this_thread::sleep_for(options_.idle_sleep);
    }
}

result<watcher_id> reactor::watch(stream_table& table, watcher_kind kind,
                                  int fd, stream_callback callback) {
    if (!descriptor_is_open(fd)) {
        return err<watcher_id>(errc::invalid_input);
    }
    if (!valid()) {
        return err<watcher_id>(
            init_error_.value_or(make_error(errc::backend_unavailable)));
    }

    const auto id = watcher_id::next(kind);
    table.emplace(id.sequence(), stream_entry{fd, std::move(callback)});
    return id;
}

void reactor::report(const char *context) noexcept {
    sink_->report(context, reason::from_current_exception());
}

} // namespace tickloop::runtime
