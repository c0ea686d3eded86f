//! # Harness Configuration
//!
//! Fixed settings of a harness run. The defaults are the probe's compiled-in
//! values; the struct is passed into `run_pipeline()` so tests can point the
//! harness at a scratch repository, a fake build tool or a local endpoint.

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace probeci::harness {

/// Probe-side location of the server repository under test.
inline constexpr const char* DEFAULT_REPO_PATH = "/opt/openstratos/server-rs";

/// Build descriptor inside the repository.
inline constexpr const char* DEFAULT_MANIFEST_NAME = "Cargo.toml";

/// Build and test tool invoked for both phases.
inline constexpr const char* DEFAULT_BUILD_TOOL = "cargo";

/// REST endpoint receiving the test report.
inline constexpr const char* DEFAULT_REPORT_ENDPOINT = "http://staging.openstratos.org/test";

/// Exact length of a valid operator key.
inline constexpr size_t DEFAULT_KEY_LENGTH = 20;

struct HarnessConfig {
    std::string repo_path = DEFAULT_REPO_PATH;
    std::string manifest_name = DEFAULT_MANIFEST_NAME;
    std::string build_tool = DEFAULT_BUILD_TOOL;
    std::string report_endpoint = DEFAULT_REPORT_ENDPOINT;
    size_t key_length = DEFAULT_KEY_LENGTH;

    /// `<repo_path>/<manifest_name>`
    [[nodiscard]] auto manifest_path() const -> std::string {
        return (std::filesystem::path(repo_path) / manifest_name).string();
    }
};

} // namespace probeci::harness
