//! # Harness Errors
//!
//! Every fatal condition of a run is a `HarnessError`. Errors form a causal
//! chain: a stage wraps the error it received with a message describing what
//! it was doing, and the driver prints the chain from the outermost message
//! down to the root cause.
//!
//! ## Error Kinds
//!
//! | Kind        | Raised when                                          |
//! |-------------|------------------------------------------------------|
//! | `Io`        | stdin closed or unreadable, stdout not writable      |
//! | `Spawn`     | an external command could not be launched            |
//! | `Transport` | the report request failed at the network/TLS level   |
//! | `Response`  | the endpoint answered with a status other than 200   |
//! | `Context`   | a wrapper adding a higher-level message to a cause   |
//!
//! A build or test command exiting with a failure status is not an error;
//! it is recorded in the report.
//!
//! ## Example
//!
//! ```cpp
//! auto output = runner.run(command);
//! if (is_err(output)) {
//!     return HarnessError::context("error running the build command",
//!                                  std::move(unwrap_err(output)));
//! }
//! ```

#pragma once

#include "common.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace probeci::harness {

enum class ErrorKind { Io, Spawn, Transport, Response, Context };

/// Returns a short lower-case name for the kind ("io", "spawn", ...).
[[nodiscard]] auto error_kind_name(ErrorKind kind) -> const char*;

/// Process-wide switches for error construction.
struct ErrorOptions {
    /// Capture a stack trace when a root error is created.
    /// Enabled by the driver when PROBECI_BACKTRACE is set.
    static inline bool capture_backtrace = false;
};

struct HarnessError {
    ErrorKind kind = ErrorKind::Context;

    /// Display message of this link of the chain.
    std::string message;

    /// HTTP status, `Response` errors only.
    long status = 0;

    /// Raw response body, `Response` errors only.
    std::string body;

    /// The error this one wraps, if any.
    Rc<const HarnessError> cause;

    /// Stack trace captured at creation; empty unless enabled.
    std::string backtrace;

    [[nodiscard]] static auto io(std::string message) -> HarnessError;
    [[nodiscard]] static auto spawn(std::string message) -> HarnessError;
    [[nodiscard]] static auto transport(std::string message) -> HarnessError;
    [[nodiscard]] static auto response(long status, std::string body) -> HarnessError;
    [[nodiscard]] static auto context(std::string message, HarnessError cause) -> HarnessError;

    /// The links of the chain, outermost first.
    [[nodiscard]] auto chain() const -> std::vector<const HarnessError*>;

    /// The innermost error of the chain.
    [[nodiscard]] auto root_cause() const -> const HarnessError&;

    /// First non-empty backtrace along the chain, or `nullptr`.
    [[nodiscard]] auto find_backtrace() const -> const std::string*;

    /// Every message of the chain joined with ": ".
    [[nodiscard]] auto to_string() const -> std::string;
};

/// Renders a status code with its reason phrase, e.g. "404 Not Found".
[[nodiscard]] auto http_status_text(long status) -> std::string;

/// Prints `error` the way the driver reports a failed run:
///
/// ```text
/// An error occurred: error sending result
///     caused by: A '500 Internal Server Error' status code was received, ...
/// ```
///
/// followed by the backtrace when one was captured.
void print_error(std::ostream& out, const HarnessError& error, bool colors);

} // namespace probeci::harness
