//! # CLI Tests
//!
//! Flag parsing, help text and driver exit codes for runs that stop before
//! the pipeline.

#include "cli/cli_options.hpp"
#include "cli/driver.hpp"
#include "cli/utils.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace probeci;
using namespace probeci::cli;

namespace {

/// Owns the argument strings for the duration of a call.
class Argv {
public:
    Argv(std::initializer_list<std::string> args) : storage_{"probeci"} {
        storage_.insert(storage_.end(), args.begin(), args.end());
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const {
        return static_cast<int>(storage_.size());
    }

    char** argv() {
        return pointers_.data();
    }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

auto parse(std::initializer_list<std::string> args) -> Result<CliOptions, std::string> {
    Argv argv(args);
    return parse_cli_args(argv.argc(), argv.argv());
}

} // namespace

TEST(CliParseTest, NoArgumentsSelectsNothing) {
    auto parsed = parse({});
    ASSERT_TRUE(is_ok(parsed));
    EXPECT_FALSE(unwrap(parsed).show_help);
    EXPECT_FALSE(unwrap(parsed).flags.fona);
}

TEST(CliParseTest, AllFeatureFlags) {
    auto parsed = parse({"--raspicam", "--fona", "--no_sms", "--gps", "--telemetry",
                         "--no_power_off"});
    ASSERT_TRUE(is_ok(parsed));

    const auto& flags = unwrap(parsed).flags;
    EXPECT_TRUE(flags.raspicam);
    EXPECT_TRUE(flags.fona);
    EXPECT_TRUE(flags.no_sms);
    EXPECT_TRUE(flags.gps);
    EXPECT_TRUE(flags.telemetry);
    EXPECT_TRUE(flags.no_power_off);
}

TEST(CliParseTest, NoSmsRequiresFona) {
    auto parsed = parse({"--no_sms", "--gps"});
    ASSERT_TRUE(is_err(parsed));
    EXPECT_NE(unwrap_err(parsed).find("--fona"), std::string::npos);
}

TEST(CliParseTest, UnknownArgumentIsRejected) {
    auto parsed = parse({"--fona", "--camera"});
    ASSERT_TRUE(is_err(parsed));
    EXPECT_NE(unwrap_err(parsed).find("--camera"), std::string::npos);

    EXPECT_TRUE(is_err(parse({"fona"})));
    EXPECT_TRUE(is_err(parse({"--no-sms", "--fona"})));
}

TEST(CliParseTest, LogOptionsAreSkipped) {
    auto parsed = parse({"-vv", "--log-file=/tmp/probeci.log", "--gps"});
    ASSERT_TRUE(is_ok(parsed));
    EXPECT_TRUE(unwrap(parsed).flags.gps);
}

TEST(CliParseTest, HelpAndVersion) {
    EXPECT_TRUE(unwrap(parse({"-h"})).show_help);
    EXPECT_TRUE(unwrap(parse({"--help"})).show_help);
    EXPECT_TRUE(unwrap(parse({"-V"})).show_version);
    EXPECT_TRUE(unwrap(parse({"--version"})).show_version);
}

TEST(CliUtilsTest, UsageListsEveryFlag) {
    std::ostringstream out;
    print_usage(out);
    const std::string text = out.str();

    for (const char* flag : {"--raspicam", "--fona", "--no_sms", "--gps", "--telemetry",
                             "--no_power_off", "--help", "--version", "--log-level="}) {
        EXPECT_NE(text.find(flag), std::string::npos) << flag;
    }
}

TEST(CliUtilsTest, VersionLine) {
    std::ostringstream out;
    print_version(out);
    EXPECT_EQ(out.str(), std::string("probeci ") + VERSION + "\n");
}

TEST(CliUtilsTest, ColorOutputCanBeDisabled) {
    ColorOutput off(false);
    EXPECT_STREQ(off.green(), "");
    ColorOutput on(true);
    EXPECT_STREQ(on.green(), colors::green);
}

// ============================================================================
// Driver Exit Codes
// ============================================================================

TEST(DriverTest, UsageErrorExitsWithOne) {
    Argv argv({"--no_sms"});
    EXPECT_EQ(probeci_main(argv.argc(), argv.argv()), 1);
}

TEST(DriverTest, VersionExitsWithZero) {
    Argv argv({"--version"});
    EXPECT_EQ(probeci_main(argv.argc(), argv.argv()), 0);
}
