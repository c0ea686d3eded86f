//! # Harness Driver
//!
//! ```text
//! probeci_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ usage error    → message on stderr, exit 1
//!   └─ run_pipeline()
//!        ├─ Reported  → "All tests OK", exit 0
//!        ├─ Declined  → exit 0
//!        └─ error     → error chain on stdout, exit 1
//! ```
//!
//! ## Return Codes
//!
//! | Code | Meaning                                  |
//! |------|------------------------------------------|
//! | 0    | Result reported, or the operator aborted |
//! | 1    | Usage error or failed run                |

#include "cli_options.hpp"
#include "driver.hpp"
#include "harness/config.hpp"
#include "harness/curl_transport.hpp"
#include "harness/error.hpp"
#include "harness/pipeline.hpp"
#include "harness/process.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace probeci::cli {

namespace {

auto backtrace_requested() -> bool {
    const char* value = std::getenv("PROBECI_BACKTRACE");
    return value && *value && std::strcmp(value, "0") != 0;
}

} // namespace

int probeci_main(int argc, char* argv[]) {
    auto parsed = parse_cli_args(argc, argv);
    if (is_err(parsed)) {
        std::cerr << unwrap_err(parsed) << "\n\n";
        std::cerr << "For more information try --help\n";
        return 1;
    }
    const CliOptions& options = unwrap(parsed);

    if (options.show_help) {
        print_usage(std::cout);
        return 0;
    }
    if (options.show_version) {
        print_version(std::cout);
        return 0;
    }

    log::Logger::init(log::parse_log_options(argc, argv));
    harness::ErrorOptions::capture_backtrace = backtrace_requested();

    ColorOutput c(stdout_supports_color());
    harness::HarnessConfig config;
    harness::SubprocessRunner runner;
    harness::CurlTransport transport;

    auto outcome = harness::run_pipeline(config, options.flags, std::cin, std::cout, runner,
                                         transport);
    if (is_err(outcome)) {
        const auto& error = unwrap_err(outcome);
        PROBECI_LOG_ERROR("cli", "Run failed: " << error.to_string());
        harness::print_error(std::cout, error, c.enabled);
        log::Logger::instance().flush();
        return 1;
    }

    if (unwrap(outcome) == harness::RunOutcome::Reported) {
        std::cout << c.green() << "All tests OK" << c.reset() << std::endl;
    }
    log::Logger::instance().flush();
    return 0;
}

} // namespace probeci::cli
