#include "tickloop/core/reason.hpp"

#include <utility>

namespace tickloop {

reason::reason(error value) noexcept : value_(value) {}

reason::reason(errc value) noexcept : value_(error{value}) {}

reason::reason(std::exception_ptr exception) noexcept
    : value_(std::move(exception)) {}

reason reason::from_current_exception() noexcept {
    return reason{std::current_exception()};
}

reason reason::aggregate(error value, reason cause) {
    reason combined{value};
    combined.cause_ = std::make_shared<const reason>(std::move(cause));
    return combined;
}

bool reason::holds_error() const noexcept {
    return std::holds_alternative<error>(value_);
}

bool reason::holds_exception() const noexcept {
    return std::holds_alternative<std::exception_ptr>(value_);
}

const error *reason::as_error() const noexcept {
    return std::get_if<error>(&value_);
}

std::exception_ptr reason::exception() const noexcept {
    if (const auto *held = std::get_if<std::exception_ptr>(&value_)) {
        return *held;
    }
    return nullptr;
}

std::error_code reason::code() const noexcept {
    if (const auto *held = as_error()) {
        return held->code();
    }

    const auto held = exception();
    if (held == nullptr) {
        return {};
    }
    try {
        std::rethrow_exception(held);
    } catch (const std::system_error& failure) {
        return failure.code();
    } catch (...) {
        return {};
    }
}

const reason *reason::cause() const noexcept {
    return cause_.get();
}

std::string reason::message() const {
    if (const auto *held = as_error()) {
        return held->message();
    }

    const auto held = exception();
    if (held == nullptr) {
        return "empty exception";
    }
    try {
        std::rethrow_exception(held);
    } catch (const std::exception& failure) {
        return failure.what();
    } catch (...) {
        return "non-standard exception";
    }
}

void reason::rethrow() const {
    const auto held = exception();
    if (held != nullptr) {
        std::rethrow_exception(held);
    }
    throw promise_rejected{*this};
}

promise_rejected::promise_rejected(tickloop::reason why)
    : std::system_error(why.code(), why.message()), why_(std::move(why)) {}

const tickloop::reason& promise_rejected::why() const noexcept {
    return why_;
}

} // namespace tickloop
