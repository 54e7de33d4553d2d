#include "tickloop/core/unique_fd.hpp"
#include "tickloop/epoll/multiplexer.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <gtest/gtest.h>
#include <unistd.h>

namespace {

using namespace std::chrono_literals;

tickloop::unique_fd open_scratch_file() {
    char path[] = "/tmp/tickloop-epoll-XXXXXX";
    tickloop::unique_fd file{::mkstemp(path)};
    if (file.valid()) {
        ::unlink(path);
    }
    return file;
}

TEST(epoll_multiplexer_test, create_owns_epoll_descriptor) {
    auto created = tickloop::epoll::multiplexer::create();
    ASSERT_TRUE(created.has_value()) << created.error().message();

    EXPECT_TRUE(created.value().valid());
    EXPECT_GE(created.value().native_handle(), 0);
    EXPECT_EQ(created.value().kind(), tickloop::io::backend::epoll);
}

TEST(epoll_multiplexer_test, reports_pipe_readiness) {
    auto created = tickloop::epoll::multiplexer::create();
    ASSERT_TRUE(created.has_value()) << created.error().message();
    auto& mux = created.value();

    auto pipe_result = tickloop::open_pipe();
    ASSERT_TRUE(pipe_result.has_value()) << pipe_result.error().message();
    const auto& ends = pipe_result.value();

    const std::array<tickloop::io::interest, 2> interests{
        tickloop::io::interest{.fd = ends.read_end.get(), .readable = true},
        tickloop::io::interest{.fd = ends.write_end.get(), .writable = true}};
    std::array<tickloop::io::ready_event, 2> ready{};

    auto first = mux.wait(interests, ready, 50ms);
    ASSERT_TRUE(first.has_value()) << first.error().message();
    ASSERT_EQ(first.value(), 1U);
    EXPECT_EQ(ready[0].fd, ends.write_end.get());
    EXPECT_TRUE(ready[0].writable);
    EXPECT_FALSE(ready[0].readable);

    constexpr std::array<std::byte, 1> payload{std::byte{0x01}};
    ASSERT_EQ(::write(ends.write_end.get(), payload.data(), payload.size()), 1);

    auto second = mux.wait(interests, ready, 50ms);
    ASSERT_TRUE(second.has_value()) << second.error().message();
    ASSERT_EQ(second.value(), 2U);
    bool saw_readable = false;
    for (std::size_t i = 0; i < second.value(); ++i) {
        saw_readable = saw_readable ||
                       (ready[i].fd == ends.read_end.get() && ready[i].readable);
    }
    EXPECT_TRUE(saw_readable);
}

TEST(epoll_multiplexer_test, timeout_returns_no_events) {
    auto created = tickloop::epoll::multiplexer::create();
    ASSERT_TRUE(created.has_value()) << created.error().message();

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

TEST(epoll_multiplexer_test, dropped_interests_are_unregistered) {
    auto created = tickloop::epoll::multiplexer::create();
    ASSERT_TRUE(created.has_value()) << created.error().message();
    auto& mux = created.value();

    auto pipe_result = tickloop::open_pipe();
    ASSERT_TRUE(pipe_result.has_value()) << pipe_result.error().message();

    const std::array<tickloop::io::interest, 1> interests{tickloop::io::interest{
        .fd = pipe_result.value().read_end.get(), .readable = true}};
    std::array<tickloop::io::ready_event, 1> ready{};

    ASSERT_TRUE(mux.wait(interests, ready, 0ms).has_value());
    EXPECT_EQ(mux.registered_count(), 1U);

    ASSERT_TRUE(mux.wait({}, {}, 0ms).has_value());
    EXPECT_EQ(mux.registered_count(), 0U);
}

TEST(epoll_multiplexer_test, regular_file_does_not_fail_the_wait) {
    auto created = tickloop::epoll::multiplexer::create();
    ASSERT_TRUE(created.has_value()) << created.error().message();
    auto& mux = created.value();

    const auto file = open_scratch_file();
    ASSERT_TRUE(file.valid());
    auto pipe_result = tickloop::open_pipe();
    ASSERT_TRUE(pipe_result.has_value()) << pipe_result.error().message();
    const auto& ends = pipe_result.value();

    constexpr std::array<std::byte, 1> payload{std::byte{0x01}};
    ASSERT_EQ(::write(ends.write_end.get(), payload.data(), payload.size()), 1);

    const std::array<tickloop::io::interest, 2> interests{
        tickloop::io::interest{.fd = file.get(), .readable = true, .writable = true},
        tickloop::io::interest{.fd = ends.read_end.get(), .readable = true}};
    std::array<tickloop::io::ready_event, 2> ready{};

    const auto started = std::chrono::steady_clock::now();
    auto waited = mux.wait(interests, ready, 2s);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    ASSERT_TRUE(waited.has_value()) << waited.error().message();
    ASSERT_EQ(waited.value(), 2U);
    EXPECT_LT(elapsed, 1s);
    EXPECT_EQ(mux.registered_count(), 1U);

    bool saw_file = false;
    bool saw_pipe = false;
    for (std::size_t i = 0; i < waited.value(); ++i) {
        if (ready[i].fd == file.get()) {
            saw_file = ready[i].readable && ready[i].writable;
        }
        if (ready[i].fd == ends.read_end.get()) {
            saw_pipe = ready[i].readable;
        }
    }
    EXPECT_TRUE(saw_file);
    EXPECT_TRUE(saw_pipe);

    // Without pending pipe data only the file is reported, still without blocking.
    std::array<std::byte, 1> drained{};
    ASSERT_EQ(::read(ends.read_end.get(), drained.data(), drained.size()), 1);
    waited = mux.wait(interests, ready, 2s);
    ASSERT_TRUE(waited.has_value()) << waited.error().message();
    ASSERT_EQ(waited.value(), 1U);
    EXPECT_EQ(ready[0].fd, file.get());
}

TEST(epoll_multiplexer_test, closed_descriptor_is_reported_ready) {
    auto created = tickloop::epoll::multiplexer::create();
    ASSERT_TRUE(created.has_value()) << created.error().message();
    auto& mux = created.value();

    auto pipe_result = tickloop::open_pipe();
    ASSERT_TRUE(pipe_result.has_value()) << pipe_result.error().message();
    auto& ends = pipe_result.value();
    const int closed_fd = ends.read_end.get();
    ends.read_end.reset();

    const std::array<tickloop::io::interest, 2> interests{
        tickloop::io::interest{.fd = closed_fd, .readable = true},
        tickloop::io::interest{.fd = ends.write_end.get(), .writable = true}};
    std::array<tickloop::io::ready_event, 2> ready{};

    const auto waited = mux.wait(interests, ready, 50ms);
    ASSERT_TRUE(waited.has_value()) << waited.error().message();
    EXPECT_EQ(waited.value(), 2U);
}

TEST(epoll_multiplexer_test, rejects_undersized_ready_buffer) {
    auto created = tickloop::epoll::multiplexer::create();
    ASSERT_TRUE(created.has_value()) << created.error().message();

    const std::array<tickloop::io::interest, 1> interests{
        tickloop::io::interest{.fd = 0, .readable = true}};

    const auto waited = created.value().wait(interests, {}, 0ms);
    ASSERT_FALSE(waited.has_value());
    EXPECT_EQ(waited.error().value(), EINVAL);
}

TEST(epoll_multiplexer_test, factory_builds_epoll_backend) {
    auto created = tickloop::io::make_multiplexer(tickloop::io::backend::epoll);
    ASSERT_TRUE(created.has_value()) << created.error().message();
    EXPECT_EQ(created.value()->kind(), tickloop::io::backend::epoll);
    EXPECT_EQ(tickloop::io::to_string(tickloop::io::backend::epoll), "epoll");
    EXPECT_EQ(tickloop::io::to_string(tickloop::io::backend::io_uring), "io_uring");
}

} // namespace
