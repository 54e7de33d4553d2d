#include "tickloop/io/multiplexer.hpp"

#include "tickloop/epoll/multiplexer.hpp"

#if defined(TICKLOOP_HAS_URING)
#include "tickloop/uring/multiplexer.hpp"
#endif

namespace tickloop::io {

std::string_view to_string(backend value) noexcept {
    switch (value) {
    case backend::epoll:
        return "epoll";
    case backend::io_uring:
        return "io_uring";
    }
    return "unknown";
}

result<std::unique_ptr<multiplexer>>
make_multiplexer(backend choice, std::uint32_t uring_queue_depth) {
    if (choice == backend::epoll) {
        auto created = tickloop::epoll::multiplexer::create();
        if (!created.has_value()) {
            return err<std::unique_ptr<multiplexer>>(created.error());
        }
        return std::make_unique<tickloop::epoll::multiplexer>(
            std::move(created.value()));
    }

#if defined(TICKLOOP_HAS_URING)
    auto created = tickloop::uring::multiplexer::create(uring_queue_depth);
    if (!created.has_value()) {
        return err<std::unique_ptr<multiplexer>>(created.error());
    }
    return std::make_unique<tickloop::uring::multiplexer>(
        std::move(created.value()));
#else
    (void)uring_queue_depth;
    return err<std::unique_ptr<multiplexer>>(errc::backend_unavailable);
#endif
}

} // namespace tickloop::io
