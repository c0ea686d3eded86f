//! # CLI Utilities
//!
//! Help text, version banner and terminal color detection.

#include "utils.hpp"

#include "common.hpp"

#include <cstdlib>
#include <unistd.h>

namespace probeci::cli {

bool stdout_supports_color() {
    if (std::getenv("NO_COLOR")) {
        return false;
    }
    return isatty(STDOUT_FILENO) != 0;
}

void print_usage(std::ostream& out) {
    out << "OpenStratos Continuous Integration " << VERSION << "\n";
    out << "Checks OpenStratos code in the real testing probe, with real hardware.\n\n";
    out << "Usage: probeci [flags] [log options]\n\n";
    out << "Flags:\n";
    out << "  --raspicam         Wether to test the Raspberry Pi camera.\n";
    out << "  --fona             Wether to test the Adafruit FONA module.\n";
    out << "  --no_sms           Do not send SMSs. (requires --fona)\n";
    out << "  --gps              Wether to test the GPS module.\n";
    out << "  --telemetry        Wether to test the telemetry module.\n";
    out << "  --no_power_off     Do not power the Raspberry Pi off.\n";
    out << "  --help, -h         Show this help\n";
    out << "  --version, -V      Show version\n";
    out << "\nLog options:\n";
    out << "  --log-level=<lvl>     trace, debug, info, warn, error, fatal, off\n";
    out << "  --log-filter=<spec>   Per-module levels, e.g. process=debug,*=warn\n";
    out << "  --log-file=<path>     Also write log records to a file\n";
    out << "  --log-format=<fmt>    text or json\n";
    out << "  -v, -vv, -vvv         Raise verbosity (info, debug, trace)\n";
    out << "  -q, --quiet           Only log errors\n";
    out << "\nEnvironment:\n";
    out << "  PROBECI_LOG         Log filter used when no log option is given\n";
    out << "  PROBECI_BACKTRACE   Set to 1 to print a backtrace on error\n";
}

void print_version(std::ostream& out) {
    out << "probeci " << VERSION << "\n";
}

} // namespace probeci::cli
