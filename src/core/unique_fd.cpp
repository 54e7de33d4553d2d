#include "tickloop/core/unique_fd.hpp"

#include <array>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <utility>

namespace tickloop {

unique_fd::unique_fd(int fd) noexcept : fd_(fd) {}

unique_fd::~unique_fd() noexcept {
    reset();
}

unique_fd::unique_fd(unique_fd&& other) noexcept : fd_(other.release()) {}

unique_fd& unique_fd::operator=(unique_fd&& other) noexcept {
    if (this != &other) {
        reset(other.release());
    }
    return *this;
}

int unique_fd::get() const noexcept {
    return fd_;
}

bool unique_fd::valid() const noexcept {
    return fd_ >= 0;
}

unique_fd::operator bool() const noexcept {
    return valid();
}

int unique_fd::release() noexcept {
    return std::exchange(fd_, -1);
}

void unique_fd::reset(int fd) noexcept {
    if (fd_ == fd) {
        return;
    }
    if (valid()) {
        (void)::close(fd_);
    }
    fd_ = fd;
}

result<pipe_pair> open_pipe(bool nonblocking) noexcept {
    std::array<int, 2> fds{};
    const int flags = O_CLOEXEC | (nonblocking ? O_NONBLOCK : 0);
    if (::pipe2(fds.data(), flags) != 0) {
        return err<pipe_pair>(error::from_errno());
    }

    return pipe_pair{unique_fd{fds[0]}, unique_fd{fds[1]}};
}

bool descriptor_is_open(int fd) noexcept {
    if (fd < 0) {
        return false;
    }
    return ::fcntl(fd, F_GETFD) != -1 || errno != EBADF;
}

} // namespace tickloop
