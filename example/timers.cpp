#include "tickloop/tickloop.hpp"

#include <chrono>
#include <iostream>

int main() {
    using namespace std::chrono_literals;

    tickloop::runtime::reactor reactor;
    if (!reactor.valid()) {
        std::cerr << "backend unavailable: " << reactor.init_error()->message()
                  << '\n';
        return 1;
    }

    const auto started = std::chrono::steady_clock::now();
    const auto elapsed_ms = [started]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - started)
            .count();
    };

    int ticks = 0;
    tickloop::runtime::watcher_id heartbeat{};
    const auto registered = reactor.repeat(100ms, [&]() {
        std::cout << "heartbeat " << ++ticks << " at " << elapsed_ms() << "ms\n";
        if (ticks == 5) {
            reactor.cancel(heartbeat);
        }
    });
    if (!registered.has_value()) {
        std::cerr << "repeat: " << registered.error().message() << '\n';
        return 1;
    }
    heartbeat = registered.value();

    reactor.defer([]() { std::cout << "deferred runs first\n"; });

    tickloop::with_timeout(reactor, tickloop::sleep_for(reactor, 2s), 250ms)
        .catch_([&](const tickloop::reason& why) {
            std::cout << "sleep abandoned after " << elapsed_ms()
                      << "ms: " << why.message() << '\n';
            return tickloop::unit{};
        });

    tickloop::sleep_for(reactor, 600ms).then([&](const tickloop::unit&) {
        std::cout << "done at " << elapsed_ms() << "ms\n";
        reactor.stop();
    });

    const auto run_status = reactor.run();
    if (!run_status.has_value()) {
        std::cerr << "runtime error: " << run_status.error().message() << '\n';
        return 1;
    }
    return 0;
}
