#include "tickloop/core/unique_fd.hpp"
#include "tickloop/uring/multiplexer.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <gtest/gtest.h>
#include <unistd.h>

namespace {

using namespace std::chrono_literals;

TEST(uring_multiplexer_test, poll_reports_pipe_readability) {
    auto created = tickloop::uring::multiplexer::create();
    if (!created.has_value()) {
        GTEST_SKIP() << "io_uring unavailable: " << created.error().message();
    }
    auto& mux = created.value();
    EXPECT_EQ(mux.kind(), tickloop::io::backend::io_uring);

    auto pipe_result = tickloop::open_pipe();
    ASSERT_TRUE(pipe_result.has_value()) << pipe_result.error().message();
    const auto& ends = pipe_result.value();

    constexpr std::array<std::byte, 1> payload{std::byte{0x21}};
    ASSERT_EQ(::write(ends.write_end.get(), payload.data(), payload.size()), 1);

    const std::array<tickloop::io::interest, 1> interests{
        tickloop::io::interest{.fd = ends.read_end.get(), .readable = true}};
    std::array<tickloop::io::ready_event, 1> ready{};

    const auto waited = mux.wait(interests, ready, 250ms);
    ASSERT_TRUE(waited.has_value()) << waited.error().message();
    ASSERT_EQ(waited.value(), 1U);
    EXPECT_EQ(ready[0].fd, ends.read_end.get());
    EXPECT_TRUE(ready[0].readable);
}

TEST(uring_multiplexer_test, timeout_returns_no_events) {
    auto created = tickloop::uring::multiplexer::create();
    if (!created.has_value()) {
        GTEST_SKIP() << "io_uring unavailable: " << created.error().message();
    }

    auto pipe_result = tickloop::open_pipe();
    ASSERT_TRUE(pipe_result.has_value()) << pipe_result.error().message();

    const std::array<tickloop::io::interest, 1> interests{tickloop::io::interest{
        .fd = pipe_result.value().read_end.get(), .readable = true}};
    std::array<tickloop::io::ready_event, 1> ready{};

    const auto started = std::chrono::steady_clock::now();
    const auto waited = created.value().wait(interests, ready, 30ms);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(waited.has_value()) << waited.error().message();
    EXPECT_EQ(waited.value(), 0U);
    EXPECT_GE(elapsed, 20ms);
}

TEST(uring_multiplexer_test, late_completion_does_not_wake_next_wait) {
    auto created = tickloop::uring::multiplexer::create();
    if (!created.has_value()) {
        GTEST_SKIP() << "io_uring unavailable: " << created.error().message();
    }
    auto& mux = created.value();

    auto first_pipe = tickloop::open_pipe();
    auto second_pipe = tickloop::open_pipe();
    ASSERT_TRUE(first_pipe.has_value());
    ASSERT_TRUE(second_pipe.has_value());

    const std::array<tickloop::io::interest, 1> first_interest{tickloop::io::interest{
        .fd = first_pipe.value().read_end.get(), .readable = true}};
    std::array<tickloop::io::ready_event, 1> ready{};
    ASSERT_TRUE(mux.wait(first_interest, ready, 0ms).has_value());

    constexpr std::array<std::byte, 1> payload{std::byte{0x02}};
    ASSERT_EQ(::write(first_pipe.value().write_end.get(), payload.data(),
                      payload.size()),
              1);

    const std::array<tickloop::io::interest, 1> second_interest{tickloop::io::interest{
        .fd = second_pipe.value().read_end.get(), .readable = true}};
    const auto waited = mux.wait(second_interest, ready, 20ms);
    ASSERT_TRUE(waited.has_value()) << waited.error().message();
    EXPECT_EQ(waited.value(), 0U);
}

TEST(uring_multiplexer_test, create_rejects_zero_depth) {
    const auto created = tickloop::uring::multiplexer::create(0);
    ASSERT_FALSE(created.has_value());
}

} // namespace
