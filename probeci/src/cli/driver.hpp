//! # Harness Driver Interface
//!
//! `probeci_main()` parses the command line, runs the pipeline against the
//! real process runner and HTTP transport, and maps the outcome to an exit
//! code.

#pragma once

namespace probeci::cli {

/// Entry point with the real stdin/stdout.
int probeci_main(int argc, char* argv[]);

} // namespace probeci::cli
