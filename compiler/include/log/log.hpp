//! # Strata Logging
//!
//! Structured logging for the compilation core:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//! - Console, file and null sinks, text or JSON lines
//! - Thread-safe dispatch
//! - Compile-time level elision via STRATA_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! STRATA_LOG_DEBUG("filter", "Running " << filter_name << " on " << rep.describe());
//! STRATA_LOG_INFO("write", "create " << path.string());
//! ```
//!
//! ## Modules
//!
//! | Tag      | Component                      |
//! |----------|--------------------------------|
//! | `rep`    | Item representation, snapshots |
//! | `filter` | Filter execution               |
//! | `layout` | Layout execution               |
//! | `write`  | Output writer, file actions    |
//! | `deps`   | Dependency tracker             |
//! | `driver` | Rep compiler retry loop        |
//! | `config` | strata.toml loading            |

#ifndef STRATA_LOG_HPP
#define STRATA_LOG_HPP

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace strata::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Potential issues
    Error = 4, ///< Recoverable errors
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name for a log level (e.g., "DEBUG").
const char* level_name(LogLevel level);

/// Parses a log level name (either case). Unknown names yield `LogLevel::Info`.
LogLevel parse_level(std::string_view s);

/// Returns true if `s` names a log level.
bool is_level_name(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "rep", "write")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< One JSON object per line
};

/// Writes `record` as one text line: `HH:MM:SS.mmm LEVEL [module] message`.
void write_text_line(std::ostream& out, const LogRecord& record);

/// Writes `record` as one JSON object line with `ts`, `level`, `module`, `msg`.
void write_json_line(std::ostream& out, const LogRecord& record);

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;

    virtual void flush() = 0;
};

/// Writes to stderr, with ANSI colors when stderr is a color terminal.
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

/// Appends log lines to a file. Flushes after Error and Fatal records.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
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
// Log Filter
// ============================================================================

/// Module-based level filter.
///
/// Parses specifications such as `"rep=trace,write=info,*=warn"`. A bare
/// module name enables Trace for that module.
class LogFilter {
public:
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level configured for any module, or the default.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
};

/// Thread-safe process-wide logger.
///
/// Usable without explicit initialization; `init()` replaces the sinks and
/// levels with those described by a `LogConfig`.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before building the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink (records are dropped until a sink is added).
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Returns current local time formatted as "HH:MM:SS.mmm".
std::string get_timestamp();

/// Returns milliseconds since epoch.
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// Parses --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv and -q.
/// Falls back to the STRATA_LOG environment variable when neither a level nor a
/// filter was given on the command line.
LogConfig parse_log_options(int argc, char* argv[]);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef STRATA_MIN_LOG_LEVEL
#define STRATA_MIN_LOG_LEVEL 0
#endif

#define STRATA_LOG_IMPL(level, module_str, msg)                                                    \
    do {                                                                                           \
        if (static_cast<int>(level) >= STRATA_MIN_LOG_LEVEL) {                                     \
            auto& logger_ = ::strata::log::Logger::instance();                                     \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define STRATA_LOG_TRACE(module, msg) STRATA_LOG_IMPL(::strata::log::LogLevel::Trace, module, msg)
#define STRATA_LOG_DEBUG(module, msg) STRATA_LOG_IMPL(::strata::log::LogLevel::Debug, module, msg)
#define STRATA_LOG_INFO(module, msg) STRATA_LOG_IMPL(::strata::log::LogLevel::Info, module, msg)
#define STRATA_LOG_WARN(module, msg) STRATA_LOG_IMPL(::strata::log::LogLevel::Warn, module, msg)
#define STRATA_LOG_ERROR(module, msg) STRATA_LOG_IMPL(::strata::log::LogLevel::Error, module, msg)
#define STRATA_LOG_FATAL(module, msg) STRATA_LOG_IMPL(::strata::log::LogLevel::Fatal, module, msg)

} // namespace strata::log

#endif // STRATA_LOG_HPP
