//! # Build and Test Phases
//!
//! The two external commands of a run, both executed in the target
//! repository through its manifest:
//!
//! ```text
//! cargo build --manifest-path <repo>/Cargo.toml
//! cargo test --manifest-path <repo>/Cargo.toml --no-default-features \
//!     [--features "<f1 f2 ...>"] -- --ignored
//! ```
//!
//! A phase whose command exits with a failure status still succeeds: the
//! failure is recorded in the `TestResult`. Only a command that cannot be
//! launched aborts the run.

#pragma once

#include "common.hpp"
#include "harness/config.hpp"
#include "harness/error.hpp"
#include "harness/features.hpp"
#include "harness/process.hpp"
#include "harness/result.hpp"

namespace probeci::harness {

inline constexpr const char* BUILD_COMMAND_CONTEXT = "error running the build command";
inline constexpr const char* TEST_COMMAND_CONTEXT =
    "error running the default features test command";

[[nodiscard]] auto build_command(const HarnessConfig& config) -> CommandSpec;

/// The `--features` pair is omitted when `features` is empty.
[[nodiscard]] auto test_command(const HarnessConfig& config, const FeatureSet& features)
    -> CommandSpec;

/// Runs the build and records its outcome in `result.build`.
[[nodiscard]] auto run_build_phase(ProcessRunner& runner, const HarnessConfig& config,
                                   TestResult& result) -> Result<bool, HarnessError>;

/// Runs the ignored test suite and records its outcome in `result.test`.
[[nodiscard]] auto run_test_phase(ProcessRunner& runner, const HarnessConfig& config,
                                  const FeatureSet& features, TestResult& result)
    -> Result<bool, HarnessError>;

} // namespace probeci::harness
