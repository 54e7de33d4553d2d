#include "tickloop/runtime/error_sink.hpp"

#include <iostream>

namespace tickloop::runtime {

stream_error_sink::stream_error_sink() noexcept : out_(&std::cerr) {}

stream_error_sink::stream_error_sink(std::ostream& out) noexcept
    : out_(&out) {}

void stream_error_sink::report(std::string_view context,
                               const reason& failure) noexcept {
    try {
        if (failure.holds_exception()) {
            *out_ << "tickloop: uncaught exception in " << context
                  << " callback: " << failure.message() << '\n';
        } else {
            // Runtime failures (a multiplexer wait, ...) carry an error code.
            *out_ << "tickloop: " << context << " failed: " << failure.message()
                  << '\n';
        }
    } catch (const std::exception&) {
        // The stream is the last resort; nothing left to report to.
    }
}

std::shared_ptr<error_sink> default_error_sink() {
    static const auto sink = std::make_shared<stream_error_sink>();
    return sink;
}

} // namespace tickloop::runtime
