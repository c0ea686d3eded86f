//! # Feature Selection
//!
//! Maps the hardware flags given on the command line to the ordered feature
//! list passed to the test build, and runs the SMS-cost confirmation gate.
//!
//! ## Feature Vocabulary
//!
//! | Flag             | Feature        | Recorded |
//! |------------------|----------------|----------|
//! | `--raspicam`     | `raspicam`     | yes      |
//! | `--fona`         | `fona`         | yes      |
//! | `--no_sms`       | `no_sms`       | no       |
//! | `--gps`          | `gps`          | yes      |
//! | `--telemetry`    | `telemetry`    | yes      |
//! | `--no_power_off` | `no_power_off` | yes      |
//!
//! `no_sms` never reaches the feature list; it only skips the confirmation.

#pragma once

#include "common.hpp"
#include "harness/error.hpp"

#include <array>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace probeci::harness {

enum class Feature { Raspicam, Fona, NoSms, Gps, Telemetry, NoPowerOff };

/// Every feature in declaration order.
inline constexpr std::array<Feature, 6> ALL_FEATURES = {
    Feature::Raspicam, Feature::Fona,      Feature::NoSms,
    Feature::Gps,      Feature::Telemetry, Feature::NoPowerOff,
};

/// Wire/flag name of a feature, e.g. "no_power_off".
[[nodiscard]] auto feature_name(Feature feature) -> const char*;

/// Looks up a feature by name. Returns `std::nullopt` for unknown names.
[[nodiscard]] auto parse_feature(std::string_view name) -> std::optional<Feature>;

/// The hardware flags selected for a run.
struct FeatureFlags {
    bool raspicam = false;
    bool fona = false;
    bool no_sms = false;
    bool gps = false;
    bool telemetry = false;
    bool no_power_off = false;

    void set(Feature feature, bool value = true);
    [[nodiscard]] auto is_set(Feature feature) const -> bool;
};

/// Ordered list of feature names handed to the test build.
class FeatureSet {
public:
    FeatureSet() = default;

    void add(Feature feature) {
        names_.emplace_back(feature_name(feature));
    }

    [[nodiscard]] auto names() const -> const std::vector<std::string>& {
        return names_;
    }

    [[nodiscard]] auto empty() const -> bool {
        return names_.empty();
    }

    /// Names separated by single spaces, "" when empty.
    [[nodiscard]] auto joined() const -> std::string;

    auto operator==(const FeatureSet& other) const -> bool = default;

private:
    std::vector<std::string> names_;
};

/// Builds the feature list in the fixed order raspicam, fona, gps,
/// telemetry, no_power_off. `no_sms` is never added.
[[nodiscard]] auto collect_features(const FeatureFlags& flags) -> FeatureSet;

/// Collects the features and, unless `no_sms` is set, asks the operator to
/// confirm the SMS cost.
///
/// Returns `std::nullopt` when the operator declines.
[[nodiscard]] auto select_features(const FeatureFlags& flags, std::istream& in,
                                   std::ostream& out)
    -> Result<std::optional<FeatureSet>, HarnessError>;

} // namespace probeci::harness
