#include "harness/error.hpp"

#include <cstdlib>
#include <sstream>

#if defined(__GLIBC__)
#include <execinfo.h>
#endif

namespace probeci::harness {

namespace {

constexpr int MAX_BACKTRACE_FRAMES = 64;

auto capture_backtrace() -> std::string {
#if defined(__GLIBC__)
    void* frames[MAX_BACKTRACE_FRAMES];
    int count = ::backtrace(frames, MAX_BACKTRACE_FRAMES);
    char** symbols = ::backtrace_symbols(frames, count);
    if (!symbols) {
        return {};
    }
    std::ostringstream oss;
    // Frame 0 is capture_backtrace itself
    for (int i = 1; i < count; ++i) {
        oss << "\t" << (i - 1) << ": " << symbols[i] << "\n";
    }
    std::free(symbols);
    return oss.str();
#else
    return {};
#endif
}

auto make_root(ErrorKind kind, std::string message) -> HarnessError {
    HarnessError error;
    error.kind = kind;
    error.message = std::move(message);
    if (ErrorOptions::capture_backtrace) {
        error.backtrace = capture_backtrace();
    }
    return error;
}

} // namespace

auto error_kind_name(ErrorKind kind) -> const char* {
    switch (kind) {
    case ErrorKind::Io:
        return "io";
    case ErrorKind::Spawn:
        return "spawn";
    case ErrorKind::Transport:
        return "transport";
    case ErrorKind::Response:
        return "response";
    case ErrorKind::Context:
        return "context";
    }
    return "unknown";
}

auto HarnessError::io(std::string message) -> HarnessError {
    return make_root(ErrorKind::Io, std::move(message));
}

auto HarnessError::spawn(std::string message) -> HarnessError {
    return make_root(ErrorKind::Spawn, std::move(message));
}

auto HarnessError::transport(std::string message) -> HarnessError {
    return make_root(ErrorKind::Transport, std::move(message));
}

auto HarnessError::response(long status, std::string body) -> HarnessError {
    std::string message = "A '" + http_status_text(status) +
                          "' status code was received, with this response body:\n" + body;
    HarnessError error = make_root(ErrorKind::Response, std::move(message));
    error.status = status;
    error.body = std::move(body);
    return error;
}

auto HarnessError::context(std::string message, HarnessError cause) -> HarnessError {
    HarnessError error;
    error.kind = ErrorKind::Context;
    error.message = std::move(message);
    error.cause = make_rc<const HarnessError>(std::move(cause));
    return error;
}

auto HarnessError::chain() const -> std::vector<const HarnessError*> {
    std::vector<const HarnessError*> links;
    for (const HarnessError* link = this; link; link = link->cause.get()) {
        links.push_back(link);
    }
    return links;
}

auto HarnessError::root_cause() const -> const HarnessError& {
    const HarnessError* link = this;
    while (link->cause) {
        link = link->cause.get();
    }
    return *link;
}

auto HarnessError::find_backtrace() const -> const std::string* {
    for (const HarnessError* link : chain()) {
        if (!link->backtrace.empty()) {
            return &link->backtrace;
        }
    }
    return nullptr;
}

auto HarnessError::to_string() const -> std::string {
    std::string out;
    for (const HarnessError* link : chain()) {
        if (!out.empty()) {
            out += ": ";
        }
        out += link->message;
    }
    return out;
}

auto http_status_text(long status) -> std::string {
    const char* reason = "";
    switch (status) {
    case 200:
        reason = "OK";
        break;
    case 201:
        reason = "Created";
        break;
    case 202:
        reason = "Accepted";
        break;
    case 204:
        reason = "No Content";
        break;
    case 301:
        reason = "Moved Permanently";
        break;
    case 302:
        reason = "Found";
        break;
    case 304:
        reason = "Not Modified";
        break;
    case 400:
        reason = "Bad Request";
        break;
    case 401:
        reason = "Unauthorized";
        break;
    case 403:
        reason = "Forbidden";
        break;
    case 404:
        reason = "Not Found";
        break;
    case 405:
        reason = "Method Not Allowed";
        break;
    case 409:
        reason = "Conflict";
        break;
    case 413:
        reason = "Payload Too Large";
        break;
    case 422:
        reason = "Unprocessable Entity";
        break;
    case 429:
        reason = "Too Many Requests";
        break;
    case 500:
        reason = "Internal Server Error";
        break;
    case 502:
        reason = "Bad Gateway";
        break;
    case 503:
        reason = "Service Unavailable";
        break;
    case 504:
        reason = "Gateway Timeout";
        break;
    default:
        break;
    }

    std::string text = std::to_string(status);
    if (*reason) {
        text += ' ';
        text += reason;
    }
    return text;
}

void print_error(std::ostream& out, const HarnessError& error, bool colors) {
    const char* red = colors ? "\033[31m" : "";
    const char* reset = colors ? "\033[0m" : "";

    auto links = error.chain();
    out << red << "An error occurred: " << links.front()->message << reset << "\n";
    for (size_t i = 1; i < links.size(); ++i) {
        out << red << "\tcaused by: " << links[i]->message << reset << "\n";
    }

    if (const std::string* trace = error.find_backtrace()) {
        out << "\n" << red << "\tbacktrace:\n" << *trace << reset;
    }
    out.flush();
}

} // namespace probeci::harness
