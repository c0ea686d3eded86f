//! # Test Result
//!
//! The record reported at the end of a run. It is created empty, filled in
//! by the build phase and the test phase, finalized with the feature list,
//! and serialized once for the report.
//!
//! ## Wire Format
//!
//! ```json
//! {
//!   "build": true,
//!   "build_stdout": "...",
//!   "build_stderr": "...",
//!   "features": ["fona", "gps"],
//!   "test": false,
//!   "test_stderr": "...",
//!   "test_stdout": "..."
//! }
//! ```

#pragma once

#include "harness/features.hpp"
#include "harness/process.hpp"
#include "json/json_value.hpp"

#include <string>
#include <vector>

namespace probeci::harness {

/// Outcome of one build or test command.
struct PhaseOutcome {
    bool succeeded = false;
    std::string stdout_text;
    std::string stderr_text;

    /// Converts captured output, replacing invalid UTF-8 with U+FFFD.
    [[nodiscard]] static auto from_output(const ProcessOutput& output) -> PhaseOutcome;

    auto operator==(const PhaseOutcome& other) const -> bool = default;
};

struct TestResult {
    PhaseOutcome build;
    PhaseOutcome test;
    std::vector<std::string> features;
};

/// Stores the feature names that were passed to the test command.
void aggregate_result(TestResult& result, const FeatureSet& features);

/// Encodes the result as the report's JSON object.
[[nodiscard]] auto to_json(const TestResult& result) -> json::JsonValue;

} // namespace probeci::harness
