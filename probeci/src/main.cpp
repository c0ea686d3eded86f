//! # probeci Entry Point
//!
//! Hardware-in-the-loop CI harness for the test probe. Builds the server
//! repository, runs its hardware test suite with the selected features and
//! reports the outcome to the CI endpoint.
//!
//! ```bash
//! probeci --fona --gps            # asks for the key, then the SMS confirmation
//! probeci --fona --no_sms --gps   # no SMS confirmation
//! probeci -vv --raspicam          # debug logging on stderr
//! ```
//!
//! All work happens in `cli/dispatcher.cpp`.

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return probeci::cli::probeci_main(argc, argv);
}
