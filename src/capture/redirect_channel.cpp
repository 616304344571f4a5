#include "redirect_channel.hpp"
#include "fd_redirect.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/descriptor.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <limits>

// Reads per lock acquisition on the pump thread, so attach/detach are not
// starved by a producer that never pauses.
static constexpr std::size_t PUMP_READS_PER_LOCK = 16;
static constexpr std::size_t DRAIN_ALL = std::numeric_limits<std::size_t>::max();

// ── Lifecycle ──────────────────────────────────────────────────

RedirectChannel& RedirectChannel::for_stream(StreamName stream) {
    static RedirectChannel out_channel(StreamName::Stdout);
    static RedirectChannel err_channel(StreamName::Stderr);
    return stream == StreamName::Stdout ? out_channel : err_channel;
}

RedirectChannel::RedirectChannel(StreamName stream)
    : stream_(stream), fd_(platform::stream_fd(stream)) {}

RedirectChannel::~RedirectChannel() {
    // Process exit with a capture still installed: put the descriptor back.
    running_ = false;
    if (pump_.joinable()) pump_.join();
    std::lock_guard<std::mutex> lock(stack_.mutex());
    if (saved_fd_ >= 0) close_locked();
}

Result<void> RedirectChannel::attach(FdRedirect* capture, const ConsoleSettings& settings) {
    flush_stdio();
    std::lock_guard<std::mutex> life(lifecycle_mutex_);
    std::lock_guard<std::mutex> lock(stack_.mutex());

    if (stack_.active() == capture)
        return Result<void>::Err(ERR_ALREADY_ACTIVE);

    if (saved_fd_ < 0) {
        auto opened = open_locked(settings);
        if (opened.is_err()) return opened;
    } else if (drain_locked(DRAIN_ALL) == DrainStatus::Failed) {
        linecap_log(fmt::format("redirect:{}: stream no longer captured until all "
                                "redirects are uninstalled", stream_label(stream_)));
    }

    auto pushed = stack_.push(capture);
    if (pushed.is_err()) return pushed;

    linecap_log(fmt::format("redirect:{}: installed (depth {})",
                            stream_label(stream_), stack_.depth()));
    return Result<void>::Ok();
}

Result<void> RedirectChannel::detach(FdRedirect* capture) {
    flush_stdio();
    std::lock_guard<std::mutex> life(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(stack_.mutex());
        if (!stack_.contains(capture))
            return Result<void>::Err(ERR_NOT_INSTALLED);

        if (stack_.depth() > 1) {
            drain_locked(DRAIN_ALL);
            auto removed = stack_.remove(capture);
            linecap_log(fmt::format("redirect:{}: uninstalled (depth {})",
                                    stream_label(stream_), stack_.depth()));
            return removed;
        }
    }

    // Last capture on this stream. The pump drains what it can see before
    // exiting; close_locked() picks up anything written after that.
    running_ = false;
    if (pump_.joinable()) pump_.join();

    std::lock_guard<std::mutex> lock(stack_.mutex());
    close_locked();
    auto removed = stack_.remove(capture);
    linecap_log(fmt::format("redirect:{}: uninstalled, descriptor {} restored",
                            stream_label(stream_), fd_));
    return removed;
}

bool RedirectChannel::attached(const FdRedirect* capture) {
    // Asked from inside a callback: this thread already holds the lock.
    if (delivering_.load() == std::this_thread::get_id())
        return stack_.contains(capture);
    std::lock_guard<std::mutex> lock(stack_.mutex());
    return stack_.contains(capture);
}

// ── Descriptor setup / teardown ────────────────────────────────

Result<void> RedirectChannel::open_locked(const ConsoleSettings& settings) {
    std::size_t buf_size = std::clamp<std::size_t>(settings.pump_buffer, 1, PUMP_MAX_BUF_SIZE);
    buffer_.assign(buf_size, 0);
    poll_ms_ = settings.pump_poll_ms > 0 ? settings.pump_poll_ms : PUMP_POLL_MS;

    auto saved = platform::duplicate_fd(fd_);
    if (saved.is_err()) return Result<void>::Err(saved.error);

    auto pipe = platform::open_pipe();
    if (pipe.is_err()) {
        platform::close_fd(saved.value);
        return Result<void>::Err(pipe.error);
    }

    // dup2 swaps the descriptor in one step; writers see either the old
    // target or the pipe, never a closed descriptor.
    auto swapped = platform::replace_fd(pipe.value.write_fd, fd_);
    platform::close_fd(pipe.value.write_fd);
    if (swapped.is_err()) {
        platform::close_fd(pipe.value.read_fd);
        platform::close_fd(saved.value);
        return swapped;
    }

    saved_fd_ = saved.value;
    read_fd_ = pipe.value.read_fd;
    restored_ = false;
    write_failed_ = false;

    running_ = true;
    pump_ = std::thread(&RedirectChannel::pump_loop, this);
    return Result<void>::Ok();
}

void RedirectChannel::close_locked() {
    if (!restored_) {
        auto r = platform::replace_fd(saved_fd_, fd_);
        if (r.is_ok()) restored_ = true;
        else linecap_log(fmt::format("redirect:{}: restore failed: {}",
                                     stream_label(stream_), r.error));
    }

    drain_locked(DRAIN_ALL);

    platform::close_fd(read_fd_);
    platform::close_fd(saved_fd_);
    read_fd_ = -1;
    saved_fd_ = -1;
}

// ── Pump ───────────────────────────────────────────────────────

void RedirectChannel::pump_loop() {
    linecap_log(fmt::format("redirect:{}: pump started (fd {} -> pipe {})",
                            stream_label(stream_), fd_, read_fd_));

    while (running_) {
        int ready = platform::poll_readable(read_fd_, poll_ms_);
        if (ready == 0) continue;
        std::string poll_error = ready < 0 ? platform::last_error() : std::string();

        std::lock_guard<std::mutex> lock(stack_.mutex());
        if (ready < 0) {
            fail_safe_restore_locked("poll failed: " + poll_error);
            return;
        }
        DrainStatus status = drain_locked(PUMP_READS_PER_LOCK);
        if (status == DrainStatus::Closed) {
            linecap_log(fmt::format("redirect:{}: pipe closed by writers, pump exiting",
                                    stream_label(stream_)));
            return;
        }
        if (status == DrainStatus::Failed) return;
    }

    std::lock_guard<std::mutex> lock(stack_.mutex());
    drain_locked(DRAIN_ALL);
    linecap_log(fmt::format("redirect:{}: pump stopped", stream_label(stream_)));
}

RedirectChannel::DrainStatus RedirectChannel::drain_locked(std::size_t max_reads) {
    if (read_fd_ < 0) return DrainStatus::Drained;

    for (std::size_t i = 0; i < max_reads; i++) {
        std::size_t got = 0;
        switch (platform::read_some(read_fd_, buffer_.data(), buffer_.size(), got)) {
        case platform::ReadStatus::Data:
            deliver_locked(buffer_.data(), got);
            break;
        case platform::ReadStatus::Again:
            return DrainStatus::Drained;
        case platform::ReadStatus::Eof:
            return DrainStatus::Closed;
        case platform::ReadStatus::Error:
            fail_safe_restore_locked("read failed: " + platform::last_error());
            return DrainStatus::Failed;
        }
    }
    return DrainStatus::Drained;
}

void RedirectChannel::deliver_locked(const char* data, std::size_t len) {
    if (!write_failed_) {
        auto w = platform::write_all(saved_fd_, data, len);
        if (w.is_err()) {
            write_failed_ = true;
            linecap_log(fmt::format("redirect:{}: echo to console stopped: {}",
                                    stream_label(stream_), w.error));
        }
    }
    FdRedirect* active = stack_.active();
    if (!active) return;
    delivering_ = std::this_thread::get_id();
    active->mirror(data, len);
    delivering_ = std::thread::id();
}

void RedirectChannel::fail_safe_restore_locked(const std::string& why) {
    if (!restored_) {
        auto r = platform::replace_fd(saved_fd_, fd_);
        if (r.is_ok()) restored_ = true;
        else linecap_log(fmt::format("redirect:{}: restore failed: {}",
                                     stream_label(stream_), r.error));
    }
    linecap_log(fmt::format("redirect:{}: pump stopped: {}; descriptor {} restored",
                            stream_label(stream_), why, fd_));
}

void RedirectChannel::flush_stdio() {
    if (stream_ == StreamName::Stdout) {
        std::cout.flush();
        std::fflush(stdout);
    } else {
        std::cerr.flush();
        std::fflush(stderr);
    }
}
