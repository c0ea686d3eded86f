//! # Subprocess Runner
//!
//! Unix implementation of `ProcessRunner`:
//!
//! 1. Create stdout/stderr pipes plus a close-on-exec status pipe
//! 2. Fork; the child redirects its streams and calls `execvp`
//! 3. If `execvp` fails the child writes `errno` to the status pipe
//! 4. The parent drains both output pipes with `poll()` until EOF, and
//!    closes them early if `poll()` fails so the child cannot block on them
//! 5. `waitpid` collects the exit status

#include "harness/process.hpp"

#include "harness/process_internal.hpp"
#include "log/log.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>

namespace probeci::harness {

namespace detail {

auto drain_pipes(FileDescriptor& stdout_fd, FileDescriptor& stderr_fd, std::string& stdout_data,
                 std::string& stderr_data, PollFn poll_fn) -> int {
    char buf[4096];

    while (stdout_fd.valid() || stderr_fd.valid()) {
        pollfd fds[2];
        nfds_t count = 0;
        std::string* sinks[2];
        FileDescriptor* owners[2];

        if (stdout_fd.valid()) {
            fds[count] = {stdout_fd.get(), POLLIN, 0};
            sinks[count] = &stdout_data;
            owners[count] = &stdout_fd;
            ++count;
        }
        if (stderr_fd.valid()) {
            fds[count] = {stderr_fd.get(), POLLIN, 0};
            sinks[count] = &stderr_data;
            owners[count] = &stderr_fd;
            ++count;
        }

        if (poll_fn(fds, count, -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            stdout_fd.close();
            stderr_fd.close();
            return err;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                owners[i]->close();
            }
        }
    }
    return 0;
}

} // namespace detail

namespace {

using detail::FileDescriptor;
using detail::Pipe;

auto make_pipe(Pipe& out) -> bool {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    out.read_end = FileDescriptor(fds[0]);
    out.write_end = FileDescriptor(fds[1]);
    return true;
}

auto os_error(int err) -> std::string {
    return std::strerror(err);
}

auto wait_child(pid_t pid, int& status) -> bool {
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return false;
        }
    }
    return true;
}

/// Reads the child's exec errno from the status pipe; 0 means exec succeeded.
auto read_exec_errno(FileDescriptor& status_fd) -> int {
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_fd.get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    return n == static_cast<ssize_t>(sizeof(child_errno)) ? child_errno : 0;
}

} // namespace

auto CommandSpec::to_string() const -> std::string {
    std::string out = program;
    for (const auto& arg : args) {
        out += ' ';
        if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos) {
            out += '"';
            out += arg;
            out += '"';
        } else {
            out += arg;
        }
    }
    return out;
}

auto SubprocessRunner::run(const CommandSpec& command) -> Result<ProcessOutput, HarnessError> {
    using Clock = std::chrono::steady_clock;
    auto start = Clock::now();

    PROBECI_LOG_DEBUG("process", "Running: " << command.to_string());

    Pipe stdout_pipe, stderr_pipe, status_pipe;
    if (!make_pipe(stdout_pipe) || !make_pipe(stderr_pipe) || !make_pipe(status_pipe)) {
        return HarnessError::spawn("failed to create pipes for '" + command.program +
                                   "': " + os_error(errno));
    }

    // Built before fork; the child must not allocate
    std::vector<char*> c_args;
    c_args.push_back(const_cast<char*>(command.program.c_str()));
    for (const auto& a : command.args) {
        c_args.push_back(const_cast<char*>(a.c_str()));
    }
    c_args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return HarnessError::spawn("failed to fork for '" + command.program +
                                   "': " + os_error(errno));
    }

    if (pid == 0) {
        // Child process
        int dev_null = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (dev_null >= 0) {
            ::dup2(dev_null, STDIN_FILENO);
        }
        ::dup2(stdout_pipe.write_end.get(), STDOUT_FILENO);
        ::dup2(stderr_pipe.write_end.get(), STDERR_FILENO);

        ::execvp(command.program.c_str(), c_args.data());

        int err = errno;
        ssize_t ignored = ::write(status_pipe.write_end.get(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    stdout_pipe.write_end.close();
    stderr_pipe.write_end.close();
    status_pipe.write_end.close();

    ProcessOutput output;
    int drain_errno = detail::drain_pipes(stdout_pipe.read_end, stderr_pipe.read_end,
                                  output.stdout_output, output.stderr_output);
    int exec_errno = read_exec_errno(status_pipe.read_end);

    int status = 0;
    if (!wait_child(pid, status)) {
        return HarnessError::spawn("failed to wait for '" + command.program +
                                   "': " + os_error(errno));
    }

    if (exec_errno != 0) {
        PROBECI_LOG_WARN("process", "Could not execute '" << command.program
                                                          << "': " << os_error(exec_errno));
        return HarnessError::spawn("failed to execute '" + command.program +
                                   "': " + os_error(exec_errno));
    }
    if (drain_errno != 0) {
        return HarnessError::spawn("failed to read output of '" + command.program +
                                   "': " + os_error(drain_errno));
    }

    if (WIFEXITED(status)) {
        output.exit_code = WEXITSTATUS(status);
        output.success = output.exit_code == 0;
    } else {
        output.exit_code = -1;
        output.success = false;
        if (WIFSIGNALED(status)) {
            PROBECI_LOG_WARN("process",
                             "'" << command.program << "' killed by signal " << WTERMSIG(status));
        }
    }

    auto end = Clock::now();
    output.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

    PROBECI_LOG_INFO("process", "'" << command.program << "' exited with code "
                                    << output.exit_code << " in " << output.duration_ms << "ms ("
                                    << output.stdout_output.size() << " bytes stdout, "
                                    << output.stderr_output.size() << " bytes stderr)");
    return output;
}

} // namespace probeci::harness
