#include "tickloop/async/timers.hpp"

namespace tickloop {

promise<unit> sleep_for(runtime::reactor& owner,
                        std::chrono::duration<double> seconds) {
    return promise<unit>{owner, [&owner, seconds](resolver<unit> resolve,
                                                  rejecter<unit> reject) {
        auto timer = owner.delay(seconds, [resolve]() { resolve(unit{}); });
        if (!timer.has_value()) {
            reject(reason{timer.error()});
        }
    }};
}

} // namespace tickloop
