//! # Process Execution
//!
//! Runs an external command to completion and captures its exit status and
//! both output streams.
//!
//! ## Error Semantics
//!
//! | Situation                              | Result                               |
//! |----------------------------------------|--------------------------------------|
//! | program exits with status 0            | `ProcessOutput{success = true}`      |
//! | program exits non-zero or is signalled | `ProcessOutput{success = false}`     |
//! | program cannot be launched             | `HarnessError` of kind `Spawn`       |
//!
//! `ProcessRunner` is the seam between the pipeline and the operating
//! system; tests substitute a scripted runner.

#pragma once

#include "common.hpp"
#include "harness/error.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace probeci::harness {

/// A program and its arguments. `program` is resolved through `PATH`.
struct CommandSpec {
    std::string program;
    std::vector<std::string> args;

    /// Shell-like rendering for logs, e.g. `cargo test --features "fona gps"`.
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator==(const CommandSpec& other) const -> bool = default;
};

/// Exit status and raw output bytes of a finished command.
struct ProcessOutput {
    bool success = false;
    int exit_code = -1; ///< -1 when terminated by a signal
    std::string stdout_output;
    std::string stderr_output;
    int64_t duration_ms = 0;
};

/// Runs a command synchronously.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /// Runs `command` and waits for it to exit.
    ///
    /// Returns a `Spawn` error only when the program could not be started.
    virtual auto run(const CommandSpec& command) -> Result<ProcessOutput, HarnessError> = 0;
};

/// `ProcessRunner` backed by fork + execvp.
///
/// The child's stdin is `/dev/null`; stdout and stderr are piped back and
/// drained together, so a child writing large amounts to either stream
/// cannot block on a full pipe.
class SubprocessRunner : public ProcessRunner {
public:
    auto run(const CommandSpec& command) -> Result<ProcessOutput, HarnessError> override;
};

} // namespace probeci::harness
