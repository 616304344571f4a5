#include "descriptor.hpp"
#include "platform.hpp"
#include <cerrno>
#include <cstring>

#ifndef _WIN32
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif

namespace platform {

std::string last_error() {
    return std::strerror(errno);
}

int stream_fd(StreamName stream) {
    return stream == StreamName::Stdout ? 1 : 2;
}

#ifdef _WIN32

bool supports_fd_redirect() { return false; }

Result<int> duplicate_fd(int) {
    return Result<int>::Err("unsupported: descriptor duplication is not available on Windows");
}

Result<void> replace_fd(int, int) {
    return Result<void>::Err("unsupported: descriptor duplication is not available on Windows");
}

Result<PipeFds> open_pipe() {
    return Result<PipeFds>::Err("unsupported: pipes for redirection are not available on Windows");
}

Result<void> write_all(int, const char*, std::size_t) {
    return Result<void>::Err("unsupported: raw descriptor writes are not available on Windows");
}

ReadStatus read_some(int, char*, std::size_t, std::size_t& got) {
    got = 0;
    return ReadStatus::Error;
}

int poll_readable(int, int) { return -1; }

void close_fd(int) {}

#else // POSIX

bool supports_fd_redirect() { return true; }

Result<int> duplicate_fd(int fd) {
    int copy = fcntl(fd, F_DUPFD_CLOEXEC, 0);
    if (copy < 0)
        return Result<int>::Err("dup(" + std::to_string(fd) + ") failed: " + last_error());
    return Result<int>::Ok(copy);
}

Result<void> replace_fd(int source, int target) {
    while (dup2(source, target) < 0) {
        if (errno == EINTR) continue;
        return Result<void>::Err("dup2(" + std::to_string(source) + ", " +
                                 std::to_string(target) + ") failed: " + last_error());
    }
    return Result<void>::Ok();
}

Result<PipeFds> open_pipe() {
    int fds[2];
    if (pipe(fds) != 0)
        return Result<PipeFds>::Err("pipe() failed: " + last_error());

    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    int flags = fcntl(fds[0], F_GETFL, 0);
    fcntl(fds[0], F_SETFL, flags | O_NONBLOCK);

    PipeFds out;
    out.read_fd = fds[0];
    out.write_fd = fds[1];
    return Result<PipeFds>::Ok(out);
}

Result<void> write_all(int fd, const char* data, std::size_t len) {
    std::size_t sent = 0;
    while (sent < len) {
        ssize_t w = ::write(fd, data + sent, len - sent);
        if (w < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN) {
                sleep_ms(1);
                continue;
            }
            return Result<void>::Err("write(" + std::to_string(fd) + ") failed: " + last_error());
        }
        sent += static_cast<std::size_t>(w);
    }
    return Result<void>::Ok();
}

ReadStatus read_some(int fd, char* buf, std::size_t cap, std::size_t& got) {
    got = 0;
    for (;;) {
        ssize_t n = ::read(fd, buf, cap);
        if (n > 0) {
            got = static_cast<std::size_t>(n);
            return ReadStatus::Data;
        }
        if (n == 0) return ReadStatus::Eof;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return ReadStatus::Again;
        return ReadStatus::Error;
    }
}

int poll_readable(int fd, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    if (ret < 0 && errno == EINTR) return 0;
    if (ret <= 0) return ret;
    return pfd.revents;
}

void close_fd(int fd) {
    if (fd >= 0) close(fd);
}

#endif

} // namespace platform
