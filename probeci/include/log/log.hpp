//! # probeci Logging
//!
//! Diagnostic output for the harness. Every record carries a level and a
//! module tag (`harness`, `process`, `report`, `cli`) so a run can be made
//! chatty for one stage only, e.g. `--log-filter=process=debug`.
//!
//! Operator prompts never go through the logger; they are written to the
//! stream handed to the pipeline. Records go to stderr and optionally to a
//! file, as text lines or one JSON object per line.
//!
//! ```cpp
//! PROBECI_LOG_INFO("process", "Spawning " << command.to_string());
//! PROBECI_LOG_DEBUG("report", "Payload is " << body.size() << " bytes");
//! ```
//!
//! Defining `PROBECI_MIN_LOG_LEVEL` removes the cheaper levels at compile time.

#ifndef PROBECI_LOG_HPP
#define PROBECI_LOG_HPP

#include <array>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace probeci::log {

// ============================================================================
// Levels
// ============================================================================

enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6 ///< Suppresses everything
};

inline constexpr std::array<const char*, 7> LEVEL_NAMES = {"TRACE", "DEBUG", "INFO", "WARN",
                                                           "ERROR", "FATAL", "OFF"};

inline const char* level_name(LogLevel level) {
    auto index = static_cast<size_t>(level);
    return index < LEVEL_NAMES.size() ? LEVEL_NAMES[index] : "???";
}

/// Case-insensitive level lookup. Unknown names map to Info.
inline LogLevel parse_level(std::string_view s) {
    for (size_t i = 0; i < LEVEL_NAMES.size(); ++i) {
        std::string_view name = LEVEL_NAMES[i];
        if (name.size() != s.size()) {
            continue;
        }
        bool same = true;
        for (size_t j = 0; j < s.size() && same; ++j) {
            char c = s[j];
            same = (c >= 'a' && c <= 'z' ? static_cast<char>(c - 'a' + 'A') : c) == name[j];
        }
        if (same) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::Info;
}

// ============================================================================
// Records and Sinks
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms; ///< Wall clock, milliseconds since the epoch
};

enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< `{"ts":...,"level":...,"module":...,"msg":...}`
};

/// One line, newline included.
std::string format_record(const LogRecord& record, LogFormat format);

class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr. Level names are colored when stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// Appends to a file, flushing after each Error or Fatal record.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

// ============================================================================
// Filtering
// ============================================================================

/// Per-module thresholds from a string like `process=trace,report=debug,*=warn`.
/// `*` sets the threshold for unnamed modules; a bare module name means Trace.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// The most verbose threshold of any module, or the default.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Empty means no per-module thresholds
    std::string log_file;    ///< Empty means no file sink
    bool console = true;
    bool colors = true;
};

/// Process-wide logger. Until `init()` runs it logs Warn and above to stderr.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Checked by the macros before the message is formatted.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();

    void set_level(LogLevel level);
    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Command Line
// ============================================================================

/// True for the options `parse_log_options` consumes.
bool is_log_option(std::string_view arg);

/// Reads `--log-level=`, `--log-filter=`, `--log-file=`, `--log-format=`,
/// `-v`/`-vv`/`-vvv`, `--verbose` and `-q`/`--quiet`. Without a level or
/// filter on the command line, `PROBECI_LOG` is used.
LogConfig parse_log_options(int argc, char* argv[]);

// ============================================================================
// Macros
// ============================================================================

#ifndef PROBECI_MIN_LOG_LEVEL
#define PROBECI_MIN_LOG_LEVEL 0
#endif

#define PROBECI_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= PROBECI_MIN_LOG_LEVEL) {                                    \
            auto& logger_ = ::probeci::log::Logger::instance();                                    \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define PROBECI_LOG_DEBUG(module, msg) PROBECI_LOG_IMPL(::probeci::log::LogLevel::Debug, module, msg)
#define PROBECI_LOG_INFO(module, msg) PROBECI_LOG_IMPL(::probeci::log::LogLevel::Info, module, msg)
#define PROBECI_LOG_WARN(module, msg) PROBECI_LOG_IMPL(::probeci::log::LogLevel::Warn, module, msg)
#define PROBECI_LOG_ERROR(module, msg) PROBECI_LOG_IMPL(::probeci::log::LogLevel::Error, module, msg)

} // namespace probeci::log

#endif // PROBECI_LOG_HPP
