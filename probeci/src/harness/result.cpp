#include "harness/result.hpp"

#include "common/utf8.hpp"
#include "json/json_builder.hpp"

namespace probeci::harness {

auto PhaseOutcome::from_output(const ProcessOutput& output) -> PhaseOutcome {
    PhaseOutcome outcome;
    outcome.succeeded = output.success;
    outcome.stdout_text = utf8_lossy(output.stdout_output);
    outcome.stderr_text = utf8_lossy(output.stderr_output);
    return outcome;
}

void aggregate_result(TestResult& result, const FeatureSet& features) {
    result.features = features.names();
}

auto to_json(const TestResult& result) -> json::JsonValue {
    json::JsonBuilder builder;
    builder.object()
        .field("build", result.build.succeeded)
        .field("build_stdout", result.build.stdout_text)
        .field("build_stderr", result.build.stderr_text)
        .field("test", result.test.succeeded)
        .field("test_stdout", result.test.stdout_text)
        .field("test_stderr", result.test.stderr_text)
        .field_array("features");
    for (const auto& name : result.features) {
        builder.item(name);
    }
    builder.end().end();
    return builder.build();
}

} // namespace probeci::harness
