//! # a2c Logging
//!
//! A structured logging library for the backend with:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-pass filtering
//! - Multiple output sinks (Console, File, Null, Multi)
//! - Thread-safe output, since parallel builds log from worker threads
//! - Compile-time level elision via A2C_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! A2C_LOG_INFO("driver", "Compiling module " << name);
//! A2C_LOG_DEBUG("mono", "Instantiated " << key << " as " << mangled);
//! A2C_LOG_TRACE("layout", "Variant " << v.name << " = " << v.discriminant);
//! ```
//!
//! ## Module tags
//!
//! | Tag         | Component                         |
//! |-------------|-----------------------------------|
//! | `assemble`  | Fragment assembler                |
//! | `mono`      | Type resolver and monomorphizer   |
//! | `layout`    | ADT layout compiler               |
//! | `ownership` | Parameter classifier              |
//! | `lower`     | Method lowering                   |
//! | `codegen`   | Statement lowering and emitter    |
//! | `driver`    | Compilation runs, parallel builds |
//! | `config`    | Build configuration loading       |

#ifndef A2C_LOG_HPP
#define A2C_LOG_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace a2c::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Pass decisions
    Info = 2,  ///< Per-module progress
    Warn = 3,  ///< Suspicious but accepted input
    Error = 4, ///< Failed compilation runs
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the string name for a log level (e.g., "TRACE", "DEBUG").
inline const char* level_name(LogLevel level) {
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

/// Parses a log level from a string (lower or upper case).
/// Returns std::nullopt if the string is not recognized.
std::optional<LogLevel> try_parse_level(std::string_view s);

/// Parses a log level, falling back to LogLevel::Info.
inline LogLevel parse_level(std::string_view s) {
    return try_parse_level(s).value_or(LogLevel::Info);
}

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "mono", "codegen")
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

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    /// Write a log record to the sink.
    virtual void write(const LogRecord& record) = 0;

    /// Flush any buffered output.
    virtual void flush() = 0;
};

/// Console sink that writes to stderr with optional ANSI colors.
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

    const char* level_color(LogLevel level) const;
};

/// File sink that writes log messages to a file.
/// Auto-flushes on Error and Fatal messages.
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

/// Null sink that discards all messages.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Multi-sink that fans out log records to multiple child sinks.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    size_t size() const {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

/// Renders a record as a single text line (no trailing newline).
std::string format_text(const LogRecord& record);

/// Renders a record as a single JSON object (no trailing newline).
std::string format_json(const LogRecord& record);

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses filter strings like "mono=trace,layout=debug,*=warn" and
/// provides fast `should_log(level, module)` checks.
class LogFilter {
public:
    LogFilter() = default;

    /// Parse a filter specification string.
    /// Module names without "=level" are set to Trace.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Minimum configured level across all modules and the default.
    LogLevel min_level() const {
        LogLevel min = default_level_;
        for (const auto& [_, level] : module_levels_) {
            if (level < min)
                min = level;
        }
        return min;
    }

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
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

/// Applies the A2C_LOG environment variable to a config.
///
/// A value containing '=' or ',' is a filter spec, anything else a level.
/// Explicit settings already present in `config` win over the variable.
void apply_env_overrides(LogConfig& config);

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Logging is the one process-wide service of the backend; per-run state
/// never lives here.
class Logger {
public:
    /// Initialize the global logger with the given configuration.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink (used by tests to install a capture sink).
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

// ============================================================================
// Timestamp Helpers
// ============================================================================

/// Returns current time formatted as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
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

/// Returns milliseconds since epoch.
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// Logging Macros
// ============================================================================

// Define A2C_MIN_LOG_LEVEL before including this header to elide
// log calls below that level at compile time.
// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef A2C_MIN_LOG_LEVEL
#define A2C_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level macros below.
#define A2C_LOG_IMPL(level, module_str, msg)                                                       \
    do {                                                                                           \
        if (static_cast<int>(level) >= A2C_MIN_LOG_LEVEL) {                                        \
            auto& logger_ = ::a2c::log::Logger::instance();                                        \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Log a trace-level message.
/// Usage: A2C_LOG_TRACE("module", "message " << value);
#define A2C_LOG_TRACE(module, msg) A2C_LOG_IMPL(::a2c::log::LogLevel::Trace, module, msg)

#define A2C_LOG_DEBUG(module, msg) A2C_LOG_IMPL(::a2c::log::LogLevel::Debug, module, msg)

#define A2C_LOG_INFO(module, msg) A2C_LOG_IMPL(::a2c::log::LogLevel::Info, module, msg)

#define A2C_LOG_WARN(module, msg) A2C_LOG_IMPL(::a2c::log::LogLevel::Warn, module, msg)

#define A2C_LOG_ERROR(module, msg) A2C_LOG_IMPL(::a2c::log::LogLevel::Error, module, msg)

#define A2C_LOG_FATAL(module, msg) A2C_LOG_IMPL(::a2c::log::LogLevel::Fatal, module, msg)

} // namespace a2c::log

#endif // A2C_LOG_HPP
