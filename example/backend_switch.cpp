#include "tickloop/tickloop.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <system_error>
#include <unistd.h>

namespace {

tickloop::task<void> run_backend_probe(tickloop::runtime::reactor& reactor,
                                       int read_fd) {
    co_await tickloop::sleep_for(reactor, std::chrono::milliseconds{50});

    tickloop::deferred<int> readable{reactor};
    const auto watcher = reactor.on_readable(read_fd, [&](int fd) {
        char byte = 0;
        if (readable.settled() || ::read(fd, &byte, 1) != 1) {
            return;
        }
        const auto resolved = readable.resolve(byte);
        if (!resolved.has_value()) {
            throw std::system_error(resolved.error().code(), "resolve");
        }
    });
    if (!watcher.has_value()) {
        throw std::system_error(watcher.error().code(), "on_readable");
    }

    auto received = tickloop::with_timeout(reactor, readable.promise(),
                                           std::chrono::seconds{1});
    int value = 0;
    try {
        value = co_await received;
    } catch (...) {
        reactor.cancel(watcher.value());
        throw;
    }
    reactor.cancel(watcher.value());
    std::cout << "received byte " << value << '\n';
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 2) {
        std::cerr << "usage: tickloop_backend_switch [epoll|io_uring]\n";
        return 2;
    }

    const std::string backend_name = argc > 1 ? argv[1] : "epoll";

    tickloop::runtime::reactor_options options{};
    if (backend_name == "epoll") {
        options.selected_backend = tickloop::io::backend::epoll;
    } else if (backend_name == "io_uring") {
        options.selected_backend = tickloop::io::backend::io_uring;
    } else {
        std::cerr << "unknown backend '" << backend_name
                  << "', expected 'epoll' or 'io_uring'\n";
        return 2;
    }
    options.uring_queue_depth = 512;

    tickloop::runtime::reactor reactor{options};
    if (!reactor.valid()) {
        std::cerr << "backend unavailable: " << backend_name << ": "
                  << reactor.init_error()->message() << '\n';
        return 1;
    }

    auto pipe_result = tickloop::open_pipe();
    if (!pipe_result.has_value()) {
        std::cerr << "pipe: " << pipe_result.error().message() << '\n';
        return 1;
    }
    const auto& ends = pipe_result.value();

    const auto writer = reactor.delay(std::chrono::milliseconds{100}, [&]() {
        const char byte = 42;
        if (::write(ends.write_end.get(), &byte, 1) != 1) {
            reactor.stop();
        }
    });
    if (!writer.has_value()) {
        std::cerr << "delay: " << writer.error().message() << '\n';
        return 1;
    }

    int exit_code = 0;
    tickloop::spawn(reactor, run_backend_probe(reactor, ends.read_end.get()))
        .then([&](const tickloop::unit&) { reactor.stop(); },
              [&](const tickloop::reason& why) {
                  std::cerr << "probe failed: " << why.message() << '\n';
                  exit_code = 1;
                  reactor.stop();
              });

    const auto run_status = reactor.run();
    if (!run_status.has_value()) {
        std::cerr << "runtime error: " << run_status.error().message() << '\n';
        return 1;
    }
    if (exit_code == 0) {
        std::cout << "backend " << backend_name << " executed successfully\n";
    }
    return exit_code;
}
