#include "harness/features.hpp"

#include "harness/prompt.hpp"
#include "log/log.hpp"

namespace probeci::harness {

auto feature_name(Feature feature) -> const char* {
    switch (feature) {
    case Feature::Raspicam:
        return "raspicam";
    case Feature::Fona:
        return "fona";
    case Feature::NoSms:
        return "no_sms";
    case Feature::Gps:
        return "gps";
    case Feature::Telemetry:
        return "telemetry";
    case Feature::NoPowerOff:
        return "no_power_off";
    }
    return "unknown";
}

auto parse_feature(std::string_view name) -> std::optional<Feature> {
    for (Feature feature : ALL_FEATURES) {
        if (name == feature_name(feature)) {
            return feature;
        }
    }
    return std::nullopt;
}

// ============================================================================
// FeatureFlags
// ============================================================================

void FeatureFlags::set(Feature feature, bool value) {
    switch (feature) {
    case Feature::Raspicam:
        raspicam = value;
        break;
    case Feature::Fona:
        fona = value;
        break;
    case Feature::NoSms:
        no_sms = value;
        break;
    case Feature::Gps:
        gps = value;
        break;
    case Feature::Telemetry:
        telemetry = value;
        break;
    case Feature::NoPowerOff:
        no_power_off = value;
        break;
    }
}

auto FeatureFlags::is_set(Feature feature) const -> bool {
    switch (feature) {
    case Feature::Raspicam:
        return raspicam;
    case Feature::Fona:
        return fona;
    case Feature::NoSms:
        return no_sms;
    case Feature::Gps:
        return gps;
    case Feature::Telemetry:
        return telemetry;
    case Feature::NoPowerOff:
        return no_power_off;
    }
    return false;
}

// ============================================================================
// FeatureSet
// ============================================================================

auto FeatureSet::joined() const -> std::string {
    std::string out;
    for (const auto& name : names_) {
        if (!out.empty()) {
            out += ' ';
        }
        out += name;
    }
    return out;
}

auto collect_features(const FeatureFlags& flags) -> FeatureSet {
    FeatureSet features;
    for (Feature feature : ALL_FEATURES) {
        if (feature != Feature::NoSms && flags.is_set(feature)) {
            features.add(feature);
        }
    }
    return features;
}

auto select_features(const FeatureFlags& flags, std::istream& in, std::ostream& out)
    -> Result<std::optional<FeatureSet>, HarnessError> {
    FeatureSet features = collect_features(flags);
    PROBECI_LOG_INFO("harness", "Selected features: ["
                                    << features.joined() << "]"
                                    << (flags.no_sms ? " (SMS sending disabled)" : ""));

    if (!flags.no_sms) {
        auto confirmed = confirm_sms_cost(in, out);
        if (is_err(confirmed)) {
            return unwrap_err(confirmed);
        }
        if (!unwrap(confirmed)) {
            PROBECI_LOG_INFO("harness", "Operator declined the SMS cost, aborting");
            return std::optional<FeatureSet>(std::nullopt);
        }
    }

    return std::optional<FeatureSet>(std::move(features));
}

} // namespace probeci::harness
