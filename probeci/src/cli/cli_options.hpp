//! # Command-Line Options
//!
//! Parses the harness flags. Logging options (`--log-*`, `-v`, `-q`) are
//! accepted and skipped here; `log::parse_log_options()` reads them.
//!
//! | Flag             | Effect                                    |
//! |------------------|-------------------------------------------|
//! | `--raspicam`     | Test the Raspberry Pi camera              |
//! | `--fona`         | Test the Adafruit FONA module             |
//! | `--no_sms`       | Skip SMS sending (requires `--fona`)      |
//! | `--gps`          | Test the GPS                              |
//! | `--telemetry`    | Test the telemetry                        |
//! | `--no_power_off` | Do not power the Raspberry Pi off         |
//! | `--help`, `-h`   | Print usage                               |
//! | `--version`, `-V`| Print version                             |

#pragma once

#include "common.hpp"
#include "harness/features.hpp"

#include <string>

namespace probeci::cli {

struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    harness::FeatureFlags flags;
};

/// Parses `argv`. Returns a usage error message on an unknown argument or
/// when `--no_sms` is given without `--fona`.
auto parse_cli_args(int argc, char* argv[]) -> Result<CliOptions, std::string>;

} // namespace probeci::cli
