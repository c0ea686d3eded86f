//! # Operator Prompts
//!
//! Read-validate-reprompt loops over injected streams. The harness talks to
//! the operator only through these functions, so tests drive them with
//! `std::istringstream`/`std::ostringstream`.
//!
//! | Function          | Prompt                                  | Accepts            |
//! |-------------------|-----------------------------------------|--------------------|
//! | `read_auth_key`   | `Please, insert your authentication key:` | trimmed length == N |
//! | `confirm_sms_cost`| `You decided to test by sending SMSs ...` | `y` or `n`         |
//!
//! Both loops have no retry limit; only a closed input stream ends them with
//! an `Io` error.

#pragma once

#include "common.hpp"
#include "harness/error.hpp"

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

namespace probeci::harness {

inline constexpr const char* KEY_PROMPT = "Please, insert your authentication key:";
inline constexpr const char* KEY_REPROMPT = "Invalid key, please, insert the correct key:";
inline constexpr const char* SMS_PROMPT =
    "You decided to test by sending SMSs but this can cost you money, are you sure? (y/n)";
inline constexpr const char* SMS_REPROMPT = "Please, select 'y' (yes) or 'n' (no)";

/// Strips leading and trailing ASCII whitespace (including `\r`).
[[nodiscard]] auto trim(std::string_view s) -> std::string_view;

/// Reads one line from `in`, without the line terminator.
///
/// Returns an `Io` error when the stream is at end of input or failed.
[[nodiscard]] auto read_line(std::istream& in) -> Result<std::string, HarnessError>;

/// Prompts for the operator key until a line whose trimmed length is exactly
/// `key_length` is entered, and returns it trimmed.
[[nodiscard]] auto read_auth_key(std::istream& in, std::ostream& out, size_t key_length)
    -> Result<std::string, HarnessError>;

/// Asks the operator to confirm the SMS cost.
///
/// Returns `true` for `y`, `false` for `n` (after printing `Aborting test.`).
[[nodiscard]] auto confirm_sms_cost(std::istream& in, std::ostream& out)
    -> Result<bool, HarnessError>;

} // namespace probeci::harness
