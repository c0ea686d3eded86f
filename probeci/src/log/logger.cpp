//! # Logger Implementation
//!
//! Implements the Logger singleton, the sinks, and LogFilter.

#include "log/log.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <unistd.h>

namespace probeci::log {

namespace {

/// Detects if stderr supports ANSI color codes.
bool detect_terminal_colors() {
    if (!isatty(fileno(stderr)))
        return false;

    const char* term = std::getenv("TERM");
    if (!term)
        return false;

    return std::string(term) != "dumb";
}

const char* level_color(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m"; // Dark gray
    case LogLevel::Debug:
        return "\033[36m"; // Cyan
    case LogLevel::Info:
        return "\033[32m"; // Green
    case LogLevel::Warn:
        return "\033[33m"; // Yellow
    case LogLevel::Error:
        return "\033[31m"; // Red
    case LogLevel::Fatal:
        return "\033[1;31m"; // Bold red
    case LogLevel::Off:
        return "";
    }
    return "";
}

/// Local wall-clock time as "HH:MM:SS.mmm".
std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&now_c, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count();
    return oss.str();
}

int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

void append_json_escaped(std::ostringstream& oss, std::string_view text) {
    for (char c : text) {
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
            } else {
                oss << c;
            }
        }
    }
}

} // namespace

std::string format_record(const LogRecord& record, LogFormat format) {
    std::ostringstream oss;
    if (format == LogFormat::JSON) {
        oss << "{\"ts\":" << record.timestamp_ms << ",\"level\":\"" << level_name(record.level)
            << "\",\"module\":\"";
        append_json_escaped(oss, record.module);
        oss << "\",\"msg\":\"";
        append_json_escaped(oss, record.message);
        oss << "\"}\n";
    } else {
        oss << get_timestamp() << " " << std::left << std::setw(5) << level_name(record.level)
            << " [" << record.module << "] " << record.message << "\n";
    }
    return oss.str();
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors)
    : colors_enabled_(use_colors && detect_terminal_colors()) {}

void ConsoleSink::write(const LogRecord& record) {
    if (format_ == LogFormat::JSON || !colors_enabled_) {
        std::cerr << format_record(record, format_);
        return;
    }

    // Only the level name is colored, padded to 5 chars for alignment
    std::ostringstream oss;
    oss << get_timestamp() << " " << level_color(record.level) << std::left << std::setw(5)
        << level_name(record.level) << "\033[0m"
        << " [" << record.module << "] " << record.message << "\n";
    std::cerr << oss.str();
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path) : file_(path, std::ios::out | std::ios::app) {}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;

    file_ << format_record(record, format_);

    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    size_t pos = 0;
    while (pos < spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }

        auto token = spec.substr(pos, comma - pos);
        size_t eq = token.find('=');

        if (eq != std::string_view::npos) {
            auto mod = token.substr(0, eq);
            auto lvl = parse_level(token.substr(eq + 1));
            if (mod == "*") {
                default_level_ = lvl;
            } else {
                module_levels_[std::string(mod)] = lvl;
            }
        } else if (!token.empty()) {
            module_levels_[std::string(token)] = LogLevel::Trace;
        }

        pos = comma + 1;
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto it = module_levels_.find(std::string(module));
    if (it != module_levels_.end()) {
        return level >= it->second;
    }
    return level >= default_level_;
}

LogLevel LogFilter::min_level() const {
    LogLevel min = default_level_;
    for (const auto& [_, level] : module_levels_) {
        if (level < min)
            min = level;
    }
    return min;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    filter_.set_default_level(level_);
    sinks_.push_back(std::make_unique<ConsoleSink>());
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.level_ = config.level;
    logger.filter_ = LogFilter();
    // Modules not named in the filter fall back to the configured level
    // unless the filter carries its own "*=level".
    logger.filter_.set_default_level(config.level);

    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
        logger.level_ = logger.filter_.min_level();
    }

    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        logger.sinks_.push_back(std::move(console));
    }

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        file->set_format(config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    if (level < level_)
        return false;

    return filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    LogRecord record{level, module, message, file, line, epoch_ms()};
    log(record);
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    filter_.set_default_level(level);
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    level_ = filter_.min_level();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace probeci::log
