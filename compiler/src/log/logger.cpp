//! # Logger Implementation
//!
//! Logger singleton, sinks, line formatting and the module filter.

#include "log/log.hpp"

#include <cstdlib>
#include <ctime>
#include <iomanip>

#ifdef _WIN32
#include <io.h>
#define STRATA_ISATTY(fd) _isatty(fd)
#define STRATA_FILENO(f) _fileno(f)
#else
#include <unistd.h>
#define STRATA_ISATTY(fd) isatty(fd)
#define STRATA_FILENO(f) fileno(f)
#endif

namespace strata::log {

// ============================================================================
// Levels
// ============================================================================

const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

namespace {

struct LevelName {
    std::string_view lower;
    std::string_view upper;
    LogLevel level;
};

constexpr LevelName LEVEL_NAMES[] = {
    {"trace", "TRACE", LogLevel::Trace}, {"debug", "DEBUG", LogLevel::Debug},
    {"info", "INFO", LogLevel::Info},    {"warn", "WARN", LogLevel::Warn},
    {"error", "ERROR", LogLevel::Error}, {"fatal", "FATAL", LogLevel::Fatal},
    {"off", "OFF", LogLevel::Off},
};

bool colors_supported() {
#ifdef _WIN32
    return false;
#else
    if (!STRATA_ISATTY(STRATA_FILENO(stderr)))
        return false;
    const char* term = std::getenv("TERM");
    return term && std::string_view(term) != "dumb";
#endif
}

const char* level_color(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m";
    case LogLevel::Debug:
        return "\033[36m";
    case LogLevel::Info:
        return "\033[32m";
    case LogLevel::Warn:
        return "\033[33m";
    case LogLevel::Error:
        return "\033[31m";
    case LogLevel::Fatal:
        return "\033[1;31m";
    case LogLevel::Off:
        return "";
    }
    return "";
}

void write_json_escaped(std::ostream& out, std::string_view text) {
    for (char c : text) {
        switch (c) {
        case '"':
            out << "\\\"";
            break;
        case '\\':
            out << "\\\\";
            break;
        case '\n':
            out << "\\n";
            break;
        case '\r':
            out << "\\r";
            break;
        case '\t':
            out << "\\t";
            break;
        default:
            out << c;
        }
    }
}

} // namespace

LogLevel parse_level(std::string_view s) {
    for (const auto& entry : LEVEL_NAMES) {
        if (s == entry.lower || s == entry.upper)
            return entry.level;
    }
    return LogLevel::Info;
}

bool is_level_name(std::string_view s) {
    for (const auto& entry : LEVEL_NAMES) {
        if (s == entry.lower || s == entry.upper)
            return true;
    }
    return false;
}

std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now_c);
#else
    localtime_r(&now_c, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

// ============================================================================
// Line Formatting
// ============================================================================

void write_text_line(std::ostream& out, const LogRecord& record) {
    out << get_timestamp() << " " << std::left << std::setw(5) << level_name(record.level) << " ["
        << record.module << "] " << record.message << "\n";
}

void write_json_line(std::ostream& out, const LogRecord& record) {
    out << "{\"ts\":" << record.timestamp_ms << ",\"level\":\"" << level_name(record.level)
        << "\",\"module\":\"";
    write_json_escaped(out, record.module);
    out << "\",\"msg\":\"";
    write_json_escaped(out, record.message);
    out << "\"}\n";
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors) : colors_enabled_(use_colors && colors_supported()) {}

void ConsoleSink::write(const LogRecord& record) {
    std::ostringstream oss;
    if (format_ == LogFormat::JSON) {
        write_json_line(oss, record);
    } else if (colors_enabled_) {
        oss << get_timestamp() << " " << level_color(record.level) << std::left << std::setw(5)
            << level_name(record.level) << "\033[0m [" << record.module << "] " << record.message
            << "\n";
    } else {
        write_text_line(oss, record);
    }
    std::cerr << oss.str();
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out) {}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;

    if (format_ == LogFormat::JSON) {
        write_json_line(file_, record);
    } else {
        write_text_line(file_, record);
    }

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

    // A spec without "*=level" keeps the configured level as its default
    logger.filter_.set_default_level(config.level);
    logger.filter_.parse(config.filter_spec);
    logger.level_ = logger.filter_.min_level();

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

    std::lock_guard<std::mutex> lock(mutex_);
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
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = message;
    record.file = file;
    record.line = line;
    record.timestamp_ms = epoch_ms();

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
    if (filter_.min_level() < level_) {
        level_ = filter_.min_level();
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace strata::log
