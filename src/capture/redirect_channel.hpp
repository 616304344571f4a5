#pragma once

#include <atomic>
#include <cstddef>
#include <mutex>
#include <thread>
#include <vector>
#include "install_stack.hpp"
#include <core/types.hpp>

class FdRedirect;

// RedirectChannel: the pipe, pump thread and install stack of one descriptor.
//
// While at least one FdRedirect is installed, the stream's descriptor is a
// pipe write end and the original descriptor lives on as a private
// duplicate. The pump thread reads the pipe, writes every byte to the
// duplicate and feeds it to the active FdRedirect.
//
// Two locks:
//   lifecycle_mutex_  serialises attach/detach, held across the pump join
//   stack_.mutex()    shared with the pump; guards the stack, the
//                     descriptors and every active emulator
//
// Switching the active capture first drains the pipe, so bytes written
// before the switch are credited to the capture that was active when they
// were written.
class RedirectChannel {
public:
    static RedirectChannel& for_stream(StreamName stream);

    ~RedirectChannel();

    RedirectChannel(const RedirectChannel&) = delete;
    RedirectChannel& operator=(const RedirectChannel&) = delete;

    Result<void> attach(FdRedirect* capture, const ConsoleSettings& settings);
    Result<void> detach(FdRedirect* capture);
    bool attached(const FdRedirect* capture);

private:
    enum class DrainStatus {
        Drained,   // pipe empty for now
        Closed,    // no write end left
        Failed,    // read error; descriptor already restored
    };

    explicit RedirectChannel(StreamName stream);

    Result<void> open_locked(const ConsoleSettings& settings);
    void close_locked();
    void pump_loop();
    DrainStatus drain_locked(std::size_t max_reads);
    void deliver_locked(const char* data, std::size_t len);
    void fail_safe_restore_locked(const std::string& why);
    void flush_stdio();

    StreamName stream_;
    int fd_;

    std::mutex lifecycle_mutex_;
    InstallStack<FdRedirect> stack_;

    int saved_fd_ = -1;     // duplicate of the original descriptor
    int read_fd_ = -1;      // pipe read end
    bool restored_ = true;  // fd_ points at the original target again
    bool write_failed_ = false;
    std::vector<char> buffer_;
    int poll_ms_ = 0;

    std::atomic<bool> running_{false};
    std::thread pump_;
    // Thread running callbacks right now (holding stack_.mutex()), if any.
    std::atomic<std::thread::id> delivering_{std::thread::id()};
};
