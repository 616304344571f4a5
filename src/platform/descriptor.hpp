#pragma once

// Cross-platform file-descriptor utilities for stream redirection.
// Only POSIX provides dup/dup2/pipe semantics usable here; on Windows every
// call reports "unsupported".

#include <cstddef>
#include <string>
#include <core/types.hpp>

namespace platform {

// True where descriptors can be duplicated and replaced by a pipe.
bool supports_fd_redirect();

// Descriptor number behind a standard stream (1 or 2).
int stream_fd(StreamName stream);

// dup() with close-on-exec set, so child processes never inherit the copy.
Result<int> duplicate_fd(int fd);

// dup2(): make `target` refer to what `source` refers to.
Result<void> replace_fd(int source, int target);

struct PipeFds {
    int read_fd = -1;
    int write_fd = -1;
};

// Unidirectional pipe. The read end is non-blocking and close-on-exec.
Result<PipeFds> open_pipe();

// Write the whole buffer, retrying on EINTR / short writes.
Result<void> write_all(int fd, const char* data, std::size_t len);

enum class ReadStatus {
    Data,    // `got` bytes were read
    Again,   // nothing available right now
    Eof,     // every write end is closed
    Error,
};

ReadStatus read_some(int fd, char* buf, std::size_t cap, std::size_t& got);

// Wait until `fd` is readable. Returns >0 ready, 0 timeout, <0 error
// (EINTR is reported as a timeout).
int poll_readable(int fd, int timeout_ms);

void close_fd(int fd);

// strerror(errno) of the last failed call on this thread.
std::string last_error();

} // namespace platform
