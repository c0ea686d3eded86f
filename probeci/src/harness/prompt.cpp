#include "harness/prompt.hpp"

#include "log/log.hpp"

namespace probeci::harness {

namespace {

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

auto check_output(std::ostream& out) -> Result<bool, HarnessError> {
    out.flush();
    if (!out) {
        return HarnessError::io("failed to write to the output stream");
    }
    return true;
}

} // namespace

auto trim(std::string_view s) -> std::string_view {
    size_t start = 0;
    while (start < s.size() && is_space(s[start])) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && is_space(s[end - 1])) {
        --end;
    }
    return s.substr(start, end - start);
}

auto read_line(std::istream& in) -> Result<std::string, HarnessError> {
    std::string line;
    if (!std::getline(in, line)) {
        if (in.eof()) {
            return HarnessError::io("unexpected end of input while reading from stdin");
        }
        return HarnessError::io("failed to read from stdin");
    }
    return line;
}

auto read_auth_key(std::istream& in, std::ostream& out, size_t key_length)
    -> Result<std::string, HarnessError> {
    out << KEY_PROMPT << "\n";
    if (auto flushed = check_output(out); is_err(flushed)) {
        return unwrap_err(flushed);
    }

    while (true) {
        auto line = read_line(in);
        if (is_err(line)) {
            return unwrap_err(line);
        }

        auto key = trim(unwrap(line));
        if (key.size() == key_length) {
            PROBECI_LOG_DEBUG("harness", "Accepted authentication key (" << key.size()
                                                                         << " characters)");
            return std::string(key);
        }

        PROBECI_LOG_DEBUG("harness", "Rejected authentication key of length "
                                         << key.size() << ", expected " << key_length);
        out << KEY_REPROMPT << "\n";
        if (auto flushed = check_output(out); is_err(flushed)) {
            return unwrap_err(flushed);
        }
    }
}

auto confirm_sms_cost(std::istream& in, std::ostream& out) -> Result<bool, HarnessError> {
    // No newline: the answer is typed on the same line
    out << SMS_PROMPT << " ";
    if (auto flushed = check_output(out); is_err(flushed)) {
        return unwrap_err(flushed);
    }

    while (true) {
        auto line = read_line(in);
        if (is_err(line)) {
            return unwrap_err(line);
        }

        auto answer = trim(unwrap(line));
        if (answer == "y") {
            return true;
        }
        if (answer == "n") {
            out << "Aborting test.\n";
            if (auto flushed = check_output(out); is_err(flushed)) {
                return unwrap_err(flushed);
            }
            return false;
        }

        out << SMS_REPROMPT << "\n";
        if (auto flushed = check_output(out); is_err(flushed)) {
            return unwrap_err(flushed);
        }
    }
}

} // namespace probeci::harness
