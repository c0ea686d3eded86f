//! # CLI Utilities Interface
//!
//! Shared helpers for the command-line driver.
//!
//! | Function / Type   | Description                              |
//! |-------------------|------------------------------------------|
//! | `print_usage()`   | Print the help text                      |
//! | `print_version()` | Print the harness version                |
//! | `ColorOutput`     | ANSI colors that can be switched off     |

#pragma once

#include <ostream>

namespace probeci::cli {

namespace colors {
inline const char* reset = "\033[0m";
inline const char* bold = "\033[1m";
inline const char* red = "\033[31m";
inline const char* green = "\033[32m";
} // namespace colors

struct ColorOutput {
    bool enabled;

    ColorOutput(bool use_color) : enabled(use_color) {}

    const char* reset() const {
        return enabled ? colors::reset : "";
    }
    const char* bold() const {
        return enabled ? colors::bold : "";
    }
    const char* red() const {
        return enabled ? colors::red : "";
    }
    const char* green() const {
        return enabled ? colors::green : "";
    }
};

/// True when stdout is a terminal and `NO_COLOR` is unset.
bool stdout_supports_color();

void print_usage(std::ostream& out);
void print_version(std::ostream& out);

} // namespace probeci::cli
