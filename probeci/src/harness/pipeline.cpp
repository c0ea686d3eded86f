#include "harness/pipeline.hpp"

#include "harness/phases.hpp"
#include "harness/prompt.hpp"
#include "harness/result.hpp"
#include "log/log.hpp"

namespace probeci::harness {

auto run_pipeline(const HarnessConfig& config, const FeatureFlags& flags, std::istream& in,
                  std::ostream& out, ProcessRunner& runner, HttpTransport& transport)
    -> Result<RunOutcome, HarnessError> {
    PROBECI_LOG_INFO("harness", "Testing " << config.manifest_path() << ", reporting to "
                                           << config.report_endpoint);

    auto key = read_auth_key(in, out, config.key_length);
    if (is_err(key)) {
        return unwrap_err(key);
    }

    auto selected = select_features(flags, in, out);
    if (is_err(selected)) {
        return unwrap_err(selected);
    }
    if (!unwrap(selected).has_value()) {
        return RunOutcome::Declined;
    }
    const FeatureSet& features = *unwrap(selected);

    TestResult result;

    auto built = run_build_phase(runner, config, result);
    if (is_err(built)) {
        return unwrap_err(built);
    }

    auto tested = run_test_phase(runner, config, features, result);
    if (is_err(tested)) {
        return unwrap_err(tested);
    }

    aggregate_result(result, features);

    ReportClient client(transport, config.report_endpoint);
    auto sent = client.send(unwrap(key), result);
    if (is_err(sent)) {
        return HarnessError::context(SEND_RESULT_CONTEXT, std::move(unwrap_err(sent)));
    }

    PROBECI_LOG_INFO("harness", "Run complete (build " << (result.build.succeeded ? "ok" : "failed")
                                                       << ", test "
                                                       << (result.test.succeeded ? "ok" : "failed")
                                                       << ")");
    return RunOutcome::Reported;
}

} // namespace probeci::harness
