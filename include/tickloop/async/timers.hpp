#pragma once

/**
 * @file
 * @brief Promise-returning wrappers over reactor timers.
 */

#include "tickloop/async/promise.hpp"
#include "tickloop/runtime/reactor.hpp"

#include <chrono>
#include <utility>

namespace tickloop {

/**
 * @brief Promise fulfilled with `unit` once `seconds` elapsed.
 *
 * A negative or non-finite duration rejects with `errc::invalid_input`.
 */
[[nodiscard]] promise<unit> sleep_for(runtime::reactor& owner,
                                      std::chrono::duration<double> seconds);

/**
 * @brief Settle like `input`, or reject with `errc::timed_out` when `limit`
 * elapses first.
 *
 * The timeout timer is cancelled as soon as `input` settles.
 */
template <class T>
[[nodiscard]] promise<T> with_timeout(runtime::reactor& owner, promise<T> input,
                                      std::chrono::duration<double> limit) {
    auto *reactor = &owner;
    return promise<T>{
        owner, [reactor, input = std::move(input), limit](resolver<T> resolve,
                                                          rejecter<T> reject) {
            auto timer = reactor->delay(
                limit, [reject]() { reject(reason{errc::timed_out}); });
            if (!timer.has_value()) {
                reject(reason{timer.error()});
                return;
            }

            const auto id = timer.value();
            input.subscribe(
                [reactor, id, resolve](const T& value) {
                    reactor->cancel(id);
                    resolve(value);
                },
                [reactor, id, reject](const reason& why) {
                    reactor->cancel(id);
                    reject(why);
                });
        }};
}

} // namespace tickloop
