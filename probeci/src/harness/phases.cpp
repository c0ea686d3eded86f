#include "harness/phases.hpp"

#include "log/log.hpp"

namespace probeci::harness {

namespace {

/// Runs `command` and stores its outcome; returns whether it succeeded.
auto run_phase(ProcessRunner& runner, const CommandSpec& command, const char* phase,
               const char* context, PhaseOutcome& outcome) -> Result<bool, HarnessError> {
    PROBECI_LOG_INFO("harness", "Starting " << phase << " phase: " << command.to_string());

    auto output = runner.run(command);
    if (is_err(output)) {
        PROBECI_LOG_ERROR("harness", "Could not run the " << phase << " command: "
                                                          << unwrap_err(output).message);
        return HarnessError::context(context, std::move(unwrap_err(output)));
    }

    outcome = PhaseOutcome::from_output(unwrap(output));
    if (outcome.succeeded) {
        PROBECI_LOG_INFO("harness", "The " << phase << " phase succeeded");
    } else {
        PROBECI_LOG_WARN("harness", "The " << phase << " phase failed with exit code "
                                           << unwrap(output).exit_code);
    }
    return outcome.succeeded;
}

} // namespace

auto build_command(const HarnessConfig& config) -> CommandSpec {
    return CommandSpec{config.build_tool, {"build", "--manifest-path", config.manifest_path()}};
}

auto test_command(const HarnessConfig& config, const FeatureSet& features) -> CommandSpec {
    CommandSpec command{config.build_tool,
                        {"test", "--manifest-path", config.manifest_path(), "--no-default-features"}};
    if (!features.empty()) {
        command.args.push_back("--features");
        command.args.push_back(features.joined());
    }
    command.args.push_back("--");
    command.args.push_back("--ignored");
    return command;
}

auto run_build_phase(ProcessRunner& runner, const HarnessConfig& config, TestResult& result)
    -> Result<bool, HarnessError> {
    return run_phase(runner, build_command(config), "build", BUILD_COMMAND_CONTEXT, result.build);
}

auto run_test_phase(ProcessRunner& runner, const HarnessConfig& config,
                    const FeatureSet& features, TestResult& result)
    -> Result<bool, HarnessError> {
    return run_phase(runner, test_command(config, features), "test", TEST_COMMAND_CONTEXT,
                     result.test);
}

} // namespace probeci::harness
