#include "cli_options.hpp"

#include "log/log.hpp"

#include <string_view>

namespace probeci::cli {

auto parse_cli_args(int argc, char* argv[]) -> Result<CliOptions, std::string> {
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--version" || arg == "-V") {
            options.show_version = true;
            continue;
        }
        if (log::is_log_option(arg)) {
            continue;
        }

        if (arg.starts_with("--")) {
            if (auto feature = harness::parse_feature(arg.substr(2))) {
                options.flags.set(*feature);
                continue;
            }
        }

        return "error: unexpected argument '" + std::string(arg) + "' found";
    }

    if (options.show_help || options.show_version) {
        return options;
    }

    if (options.flags.no_sms && !options.flags.fona) {
        return std::string("error: the argument '--no_sms' requires '--fona'");
    }

    return options;
}

} // namespace probeci::cli
