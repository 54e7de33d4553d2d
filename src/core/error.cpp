#include "tickloop/core/error.hpp"

namespace tickloop {

namespace {

class tickloop_error_category final : public std::error_category {
public:
    [[nodiscard]] const char *name() const noexcept override {
        return "tickloop";
    }

    [[nodiscard]] std::string message(int value) const override {
        switch (static_cast<errc>(value)) {
        case errc::invalid_input:
            return "invalid input";
        case errc::already_running:
            return "event loop is already running";
        case errc::already_settled:
            return "promise has already been resolved or rejected";
        case errc::already_initialized:
            return "event loop is already initialized";
        case errc::no_promises:
            return "no promises provided";
        case errc::all_rejected:
            return "all promises rejected";
        case errc::timed_out:
            return "operation timed out";
        case errc::backend_unavailable:
            return "readiness backend unavailable";
        }
        return "unknown tickloop error";
    }
};

} // namespace

const std::error_category& tickloop_category() noexcept {
    static const tickloop_error_category category;
    return category;
}

std::error_code make_error_code(errc value) noexcept {
    return std::error_code{static_cast<int>(value), tickloop_category()};
}

error::error(std::error_code code) noexcept : code_(code) {}

error::error(errc value) noexcept : code_(make_error_code(value)) {}

error error::from_errno(int value) noexcept {
    return error{std::error_code{value, std::system_category()}};
}

std::error_code error::code() const noexcept {
    return code_;
}

int error::value() const noexcept {
    return code_.value();
}

std::string error::message() const {
    return code_.message();
}

bool error::is(errc value) const noexcept {
    return code_ == make_error_code(value);
}

error make_error_from_errno(int value) noexcept {
    return error::from_errno(value);
}

error make_error(errc value) noexcept {
    return error{value};
}

} // namespace tickloop
