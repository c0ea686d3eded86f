//! # Subprocess Internals
//!
//! File descriptor ownership and the output drain loop shared by
//! `SubprocessRunner` and its tests.

#pragma once

#include <poll.h>
#include <string>
#include <unistd.h>

namespace probeci::harness::detail {

/// Owns a file descriptor and closes it on destruction.
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() {
        close();
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.release();
        }
        return *this;
    }

    int get() const {
        return fd_;
    }

    bool valid() const {
        return fd_ >= 0;
    }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

struct Pipe {
    FileDescriptor read_end;
    FileDescriptor write_end;
};

using PollFn = int (*)(pollfd*, nfds_t, int);

/// Reads both pipes until each reaches EOF. Returns 0, or the `errno` of a
/// failed `poll_fn`.
///
/// Both descriptors are closed on return either way, so a child still
/// writing gets `EPIPE` instead of blocking on a pipe nobody reads.
auto drain_pipes(FileDescriptor& stdout_fd, FileDescriptor& stderr_fd, std::string& stdout_data,
                 std::string& stderr_data, PollFn poll_fn = ::poll) -> int;

} // namespace probeci::harness::detail
