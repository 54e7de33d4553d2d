#include "tickloop/tickloop.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

tickloop::promise<int> fetch_score(const std::string& player, int score,
                                   std::chrono::milliseconds latency) {
    tickloop::promise<int> pending{
        [player, score, latency](tickloop::resolver<int> resolve,
                                 tickloop::rejecter<int> reject) {
            const auto timer = tickloop::runtime::loop::delay(
                latency, [player, score, resolve, reject]() {
                    if (score < 0) {
                        reject(std::invalid_argument("no score for " + player));
                        return;
                    }
                    resolve(score);
                });
            if (!timer.has_value()) {
                reject(timer.error());
            }
        }};
    return pending;
}

} // namespace

int main() {
    using namespace std::chrono_literals;

    std::vector<tickloop::promise<int>> scores{
        fetch_score("ada", 31, 30ms),
        fetch_score("brian", 12, 10ms),
        fetch_score("grace", 47, 20ms),
    };

    tickloop::promise<int>::all(scores)
        .then([](const std::vector<int>& values) {
            int total = 0;
            for (const int value : values) {
                total += value;
            }
            return total;
        })
        .then([](const int& total) {
            std::cout << "total score " << total << '\n';
        });

    tickloop::promise<int>::race({fetch_score("linus", -1, 5ms),
                                  fetch_score("ken", 8, 15ms)})
        .catch_([](const tickloop::reason& why) {
            std::cout << "race lost: " << why.message() << '\n';
            return 0;
        });

    tickloop::promise<int>::any({fetch_score("dennis", -1, 5ms),
                                 fetch_score("bjarne", 64, 25ms)})
        .then([](const int& first) {
            std::cout << "first available score " << first << '\n';
        })
        .finally([]() { tickloop::runtime::loop::stop(); });

    const auto run_status = tickloop::runtime::loop::run();
    if (!run_status.has_value()) {
        std::cerr << "runtime error: " << run_status.error().message() << '\n';
        return 1;
    }
    return 0;
}
