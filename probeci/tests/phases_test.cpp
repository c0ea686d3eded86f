//! # Build and Test Phase Tests
//!
//! Command lines, outcome recording and result encoding.

#include "harness/phases.hpp"
#include "harness/result.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>

using namespace probeci;
using namespace probeci::harness;
using namespace probeci::fakes;

namespace {

auto features_of(std::initializer_list<Feature> list) -> FeatureSet {
    FeatureSet features;
    for (Feature feature : list) {
        features.add(feature);
    }
    return features;
}

} // namespace

// ============================================================================
// Command Lines
// ============================================================================

TEST(CommandLineTest, BuildCommand) {
    HarnessConfig config;
    auto command = build_command(config);

    EXPECT_EQ(command.program, "cargo");
    EXPECT_EQ(command.args, (std::vector<std::string>{"build", "--manifest-path",
                                                      "/opt/openstratos/server-rs/Cargo.toml"}));
}

TEST(CommandLineTest, TestCommandWithoutFeatures) {
    HarnessConfig config;
    auto command = test_command(config, FeatureSet{});

    EXPECT_EQ(command.args,
              (std::vector<std::string>{"test", "--manifest-path",
                                        "/opt/openstratos/server-rs/Cargo.toml",
                                        "--no-default-features", "--", "--ignored"}));
}

TEST(CommandLineTest, TestCommandWithFeatures) {
    HarnessConfig config;
    auto command = test_command(config, features_of({Feature::Fona, Feature::Gps}));

    EXPECT_EQ(command.args,
              (std::vector<std::string>{"test", "--manifest-path",
                                        "/opt/openstratos/server-rs/Cargo.toml",
                                        "--no-default-features", "--features", "fona gps", "--",
                                        "--ignored"}));
}

TEST(CommandLineTest, UsesConfiguredRepositoryAndTool) {
    HarnessConfig config;
    config.repo_path = "/tmp/server";
    config.build_tool = "/usr/local/bin/cargo";

    auto command = build_command(config);
    EXPECT_EQ(command.program, "/usr/local/bin/cargo");
    EXPECT_EQ(command.args.back(), "/tmp/server/Cargo.toml");
}

// ============================================================================
// Phase Execution
// ============================================================================

class PhaseTest : public ::testing::Test {
protected:
    HarnessConfig config;
    FakeProcessRunner runner;
    TestResult result;
};

TEST_F(PhaseTest, BuildSuccessIsRecorded) {
    runner.push(exited(0, "Finished\n", "Compiling server\n"));

    auto ran = run_build_phase(runner, config, result);
    ASSERT_TRUE(is_ok(ran));
    EXPECT_TRUE(unwrap(ran));
    EXPECT_TRUE(result.build.succeeded);
    EXPECT_EQ(result.build.stdout_text, "Finished\n");
    EXPECT_EQ(result.build.stderr_text, "Compiling server\n");
}

TEST_F(PhaseTest, BuildFailureIsDataNotError) {
    runner.push(exited(101, "", "error[E0425]"));

    auto ran = run_build_phase(runner, config, result);
    ASSERT_TRUE(is_ok(ran));
    EXPECT_FALSE(unwrap(ran));
    EXPECT_FALSE(result.build.succeeded);
    EXPECT_EQ(result.build.stderr_text, "error[E0425]");
}

TEST_F(PhaseTest, BuildSpawnErrorIsWrapped) {
    runner.push(HarnessError::spawn("failed to execute 'cargo': No such file or directory"));

    auto ran = run_build_phase(runner, config, result);
    ASSERT_TRUE(is_err(ran));
    const auto& error = unwrap_err(ran);
    EXPECT_EQ(error.kind, ErrorKind::Context);
    EXPECT_EQ(error.message, BUILD_COMMAND_CONTEXT);
    ASSERT_TRUE(error.cause);
    EXPECT_EQ(error.cause->kind, ErrorKind::Spawn);
}

TEST_F(PhaseTest, TestSpawnErrorIsWrapped) {
    runner.push(HarnessError::spawn("failed to execute 'cargo'"));

    auto ran = run_test_phase(runner, config, FeatureSet{}, result);
    ASSERT_TRUE(is_err(ran));
    EXPECT_EQ(unwrap_err(ran).message, "error running the default features test command");
}

TEST_F(PhaseTest, InvalidUtf8OutputIsReplaced) {
    runner.push(exited(1, "bad \xFF byte", ""));

    auto ran = run_test_phase(runner, config, FeatureSet{}, result);
    ASSERT_TRUE(is_ok(ran));
    EXPECT_EQ(result.test.stdout_text, "bad \xEF\xBF\xBD byte");
}

// ============================================================================
// Aggregation and Encoding
// ============================================================================

TEST(ResultTest, AggregateStoresFeatureNames) {
    TestResult result;
    aggregate_result(result, features_of({Feature::Fona, Feature::Gps}));
    EXPECT_EQ(result.features, (std::vector<std::string>{"fona", "gps"}));
}

TEST(ResultTest, JsonHasAllFields) {
    TestResult result;
    result.build = {true, "built", ""};
    result.test = {false, "1 failed", "panicked"};
    result.features = {"fona", "gps"};

    auto json = to_json(result);
    EXPECT_EQ(json.to_string(),
              "{\"build\":true,\"build_stderr\":\"\",\"build_stdout\":\"built\","
              "\"features\":[\"fona\",\"gps\"],\"test\":false,"
              "\"test_stderr\":\"panicked\",\"test_stdout\":\"1 failed\"}");
}

TEST(ResultTest, EmptyFeaturesEncodeAsEmptyArray) {
    TestResult result;
    auto json = to_json(result);

    ASSERT_NE(json.get("features"), nullptr);
    EXPECT_TRUE(json.get("features")->is_array());
    EXPECT_EQ(json.get("features")->size(), 0u);
}
