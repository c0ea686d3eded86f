//! # Harness Pipeline
//!
//! Sequences one complete run:
//!
//! ```text
//! read_auth_key -> select_features -> build -> test -> aggregate -> report
//! ```
//!
//! Each stage gates the next. Declining the SMS confirmation ends the run
//! before anything is built or sent. A failing build does not stop the test
//! phase; both outcomes are reported.

#pragma once

#include "common.hpp"
#include "harness/config.hpp"
#include "harness/error.hpp"
#include "harness/features.hpp"
#include "harness/process.hpp"
#include "harness/report.hpp"

#include <istream>
#include <ostream>

namespace probeci::harness {

enum class RunOutcome {
    Reported, ///< The result was accepted by the endpoint
    Declined, ///< The operator declined the SMS cost
};

[[nodiscard]] auto run_pipeline(const HarnessConfig& config, const FeatureFlags& flags,
                                std::istream& in, std::ostream& out, ProcessRunner& runner,
                                HttpTransport& transport) -> Result<RunOutcome, HarnessError>;

} // namespace probeci::harness
