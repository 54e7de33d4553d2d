#include "tickloop/runtime/loop.hpp"

#include <utility>

namespace tickloop::runtime {

namespace {

struct loop_state {
    reactor_options options{};
    std::shared_ptr<error_sink> sink{};
    std::unique_ptr<reactor> instance{};
};

loop_state& state() {
    static loop_state value{};
    return value;
}

} // namespace

result<void> loop::configure(reactor_options options,
                             std::shared_ptr<error_sink> sink) {
    auto& current = state();
    if (current.instance != nullptr) {
        return err<void>(errc::already_initialized);
    }

    current.options = options;
    current.sink = std::move(sink);
    return ok();
}

reactor& loop::get() {
    auto& current = state();
    if (current.instance == nullptr) {
        current.instance =
            std::make_unique<reactor>(current.options, current.sink);
    }
    return *current.instance;
}

bool loop::initialized() noexcept {
    return state().instance != nullptr;
}

watcher_id loop::defer(task_callback callback) {
    return get().defer(std::move(callback));
}

result<watcher_id> loop::delay(std::chrono::duration<double> seconds,
                               task_callback callback) {
    return get().delay(seconds, std::move(callback));
}

result<watcher_id> loop::repeat(std::chrono::duration<double> seconds,
                                task_callback callback) {
    return get().repeat(seconds, std::move(callback));
}

result<watcher_id> loop::on_readable(int fd, stream_callback callback) {
    return get().on_readable(fd, std::move(callback));
}

result<watcher_id> loop::on_writable(int fd, stream_callback callback) {
    return get().on_writable(fd, std::move(callback));
}

void loop::cancel(watcher_id id) noexcept {
    if (!initialized()) {
        return;
    }
    get().cancel(id);
}

result<void> loop::run() {
    return get().run();
}

void loop::stop() noexcept {
    if (!initialized()) {
        return;
    }
    get().stop();
}

} // namespace tickloop::runtime
