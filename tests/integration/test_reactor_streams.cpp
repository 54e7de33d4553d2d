#include "tickloop/core/unique_fd.hpp"
#include "tickloop/runtime/reactor.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <string_view>
#include <unistd.h>
#include <utility>
#include <vector>

namespace {

using namespace std::chrono_literals;

class recording_sink final : public tickloop::runtime::error_sink {
public:
    void report(std::string_view context,
                const tickloop::reason& failure) noexcept override {
        entries.emplace_back(std::string{context}, failure.message());
    }

    std::vector<std::pair<std::string, std::string>> entries{};
};

/// Open an unlinked regular file; epoll refuses to register these.
tickloop::unique_fd open_scratch_file() {
    char path[] = "/tmp/tickloop-streams-XXXXXX";
    tickloop::unique_fd file{::mkstemp(path)};
    if (file.valid()) {
        ::unlink(path);
    }
    return file;
}

class reactor_streams_test : public ::testing::TestWithParam<tickloop::io::backend> {
protected:
    void SetUp() override {
        tickloop::runtime::reactor_options options{};
        options.selected_backend = GetParam();
        reactor_ = std::make_unique<tickloop::runtime::reactor>(options, sink_);
        if (!reactor_->valid()) {
            GTEST_SKIP() << tickloop::io::to_string(GetParam())
                         << " unavailable: " << reactor_->init_error()->message();
        }

        auto pipe_result = tickloop::open_pipe();
        ASSERT_TRUE(pipe_result.has_value()) << pipe_result.error().message();
        pipe_ = std::move(pipe_result.value());

        const auto armed = reactor_->delay(5s, [this]() {
            ADD_FAILURE() << "safety timer fired";
            reactor_->stop();
        });
        ASSERT_TRUE(armed.has_value());
    }

    void write_byte() {
        constexpr std::array<std::byte, 1> payload{std::byte{0x5a}};
        ASSERT_EQ(::write(pipe_.write_end.get(), payload.data(), payload.size()), 1);
    }

    std::shared_ptr<recording_sink> sink_{std::make_shared<recording_sink>()};
    std::unique_ptr<tickloop::runtime::reactor> reactor_{};
    tickloop::pipe_pair pipe_{};
};

TEST_P(reactor_streams_test, readable_fires_when_data_arrives) {
    std::vector<std::byte> received{};
    const auto watcher = reactor_->on_readable(pipe_.read_end.get(), [&](int fd) {
        std::array<std::byte, 16> buffer{};
        const auto count = ::read(fd, buffer.data(), buffer.size());
        if (count > 0) {
            received.insert(received.end(), buffer.begin(), buffer.begin() + count);
        }
        reactor_->stop();
    });
    ASSERT_TRUE(watcher.has_value()) << watcher.error().message();
    EXPECT_EQ(watcher.value().kind(), tickloop::runtime::watcher_kind::readable);

    ASSERT_TRUE(reactor_->delay(20ms, [this]() { write_byte(); }).has_value());

    const auto started = std::chrono::steady_clock::now();
    ASSERT_TRUE(reactor_->run().has_value());
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_EQ(received.size(), 1U);
    EXPECT_EQ(received[0], std::byte{0x5a});
    EXPECT_GE(elapsed, 15ms);
}

TEST_P(reactor_streams_test, writable_fires_for_empty_pipe) {
    int ready_fd = -1;
    const auto watcher =
        reactor_->on_writable(pipe_.write_end.get(), [&](int fd) {
            ready_fd = fd;
            reactor_->stop();
        });
    ASSERT_TRUE(watcher.has_value()) << watcher.error().message();

    ASSERT_TRUE(reactor_->run().has_value());
    EXPECT_EQ(ready_fd, pipe_.write_end.get());
}

TEST_P(reactor_streams_test, readiness_is_level_triggered) {
    write_byte();

    int fired = 0;
    const auto watcher = reactor_->on_readable(pipe_.read_end.get(), [&](int) {
        if (++fired == 3) {
            reactor_->stop();
        }
    });
    ASSERT_TRUE(watcher.has_value()) << watcher.error().message();

    ASSERT_TRUE(reactor_->run().has_value());
    EXPECT_EQ(fired, 3);
}

TEST_P(reactor_streams_test, cancel_inside_callback_skips_pending_watcher) {
    write_byte();

    int second_fired = 0;
    tickloop::runtime::watcher_id second{};
    const auto first = reactor_->on_readable(pipe_.read_end.get(), [&](int) {
        reactor_->cancel(second);
        ASSERT_TRUE(reactor_->delay(30ms, [this]() { reactor_->stop(); })
                        .has_value());
    });
    ASSERT_TRUE(first.has_value());
    const auto registered =
        reactor_->on_readable(pipe_.read_end.get(), [&](int) { ++second_fired; });
    ASSERT_TRUE(registered.has_value());
    second = registered.value();

    ASSERT_TRUE(reactor_->run().has_value());
    EXPECT_EQ(second_fired, 0);
}

TEST_P(reactor_streams_test, timers_fire_while_streams_are_idle) {
    bool stream_fired = false;
    const auto watcher = reactor_->on_readable(
        pipe_.read_end.get(), [&](int) { stream_fired = true; });
    ASSERT_TRUE(watcher.has_value());

    bool timer_fired = false;
    ASSERT_TRUE(reactor_
                    ->delay(20ms,
                            [&]() {
                                timer_fired = true;
                                reactor_->stop();
                            })
                    .has_value());

    ASSERT_TRUE(reactor_->run().has_value());
    EXPECT_TRUE(timer_fired);
    EXPECT_FALSE(stream_fired);
}

TEST_P(reactor_streams_test, rejects_closed_descriptors) {
    const auto negative = reactor_->on_readable(-1, [](int) {});
    ASSERT_FALSE(negative.has_value());
    EXPECT_TRUE(negative.error().is(tickloop::errc::invalid_input));

    const int closed_fd = pipe_.read_end.get();
    pipe_.read_end.reset();
    const auto closed = reactor_->on_writable(closed_fd, [](int) {});
    ASSERT_FALSE(closed.has_value());
    EXPECT_TRUE(closed.error().is(tickloop::errc::invalid_input));
}

TEST_P(reactor_streams_test, regular_file_is_always_ready_beside_pipes) {
    const auto file = open_scratch_file();
    ASSERT_TRUE(file.valid());

    int file_fired = 0;
    bool pipe_fired = false;
    const auto file_watcher =
        reactor_->on_readable(file.get(), [&](int) { ++file_fired; });
    ASSERT_TRUE(file_watcher.has_value()) << file_watcher.error().message();
    const auto pipe_watcher =
        reactor_->on_readable(pipe_.read_end.get(), [&](int) {
            pipe_fired = true;
            reactor_->stop();
        });
    ASSERT_TRUE(pipe_watcher.has_value()) << pipe_watcher.error().message();

    write_byte();
    const auto started = std::chrono::steady_clock::now();
    ASSERT_TRUE(reactor_->run().has_value());
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(pipe_fired);
    EXPECT_GE(file_fired, 1);
    EXPECT_LT(elapsed, 1s);
    EXPECT_TRUE(sink_->entries.empty())
        << sink_->entries.front().first << ": " << sink_->entries.front().second;
}

INSTANTIATE_TEST_SUITE_P(backends, reactor_streams_test,
                         ::testing::Values(tickloop::io::backend::epoll,
                                           tickloop::io::backend::io_uring),
                         [](const auto& info) {
                             return std::string{tickloop::io::to_string(info.param)};
                         });

} // namespace
