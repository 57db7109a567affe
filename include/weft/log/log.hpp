//! # weft Logging
//!
//! Structured logging for the serialization engine:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages (`json`, `dynamic`, `descriptor`, `cli`)
//! - Console, file and null sinks, fan-out via `MultiSink`
//! - Thread-safe output with mutex protection
//! - Compile-time level elision via WEFT_MIN_LOG_LEVEL
//!
//! The library never configures the logger. Until a host program calls
//! `Logger::init()` (the `weft-json` tool does so from its flags) there are no
//! sinks and the threshold is Warn.
//!
//! ## Usage
//!
//! ```cpp
//! WEFT_LOG_DEBUG("json", "Skipping unknown key '" << key << "'");
//! WEFT_LOG_TRACE("dynamic", "Coerced element " << name << " to null");
//! ```

#ifndef WEFT_LOG_HPP
#define WEFT_LOG_HPP

#include <atomic>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace weft::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Per-element decode tracing
    Debug = 1, ///< Policy decisions (coercions, skipped keys)
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Suspicious but accepted input
    Error = 4, ///< Failed operations
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Upper-case name of a level, e.g. "TRACE".
[[nodiscard]] constexpr auto level_name(LogLevel level) -> const char* {
    constexpr const char* NAMES[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL", "OFF"};
    auto index = static_cast<int>(level);
    return index >= 0 && index <= 6 ? NAMES[index] : "???";
}

/// Parses a level name in any letter case. Returns `nullopt` for anything
/// that is not a level name.
[[nodiscard]] auto parse_level(std::string_view s) -> std::optional<LogLevel>;

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "json")
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

/// Writes `record` as a single-line JSON object:
/// `{"ts":...,"level":"...","module":"...","msg":"..."}`.
void write_json_record(std::ostream& out, const LogRecord& record);

// ============================================================================
// Log Formatter
// ============================================================================

/// Template engine for text log lines.
///
/// | Token       | Expands to                                 |
/// |-------------|--------------------------------------------|
/// | `{time}`    | Local time of the record, `HH:MM:SS.mmm`   |
/// | `{time_ms}` | Milliseconds since epoch                   |
/// | `{level}`   | Level name                                 |
/// | `{module}`  | Module tag                                 |
/// | `{message}` | Message text                               |
/// | `{file}`    | Source file                                |
/// | `{line}`    | Source line                                |
///
/// Unknown tokens are copied through unchanged. The template is split into
/// segments once, when it is set.
class LogFormatter {
public:
    explicit LogFormatter(std::string_view format_template = "{time} {level} [{module}] {message}");

    [[nodiscard]] auto format(const LogRecord& record) const -> std::string;

    void set_template(std::string_view format_template);

    [[nodiscard]] auto get_template() const -> const std::string& {
        return template_;
    }

private:
    enum class Field { Literal, Time, TimeMs, Level, Module, Message, File, Line };

    struct Segment {
        Field field;
        std::string literal;
    };

    std::string template_;
    std::vector<Segment> segments_;
};

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

/// Console sink that writes to stderr. Colors are used only when requested
/// and stderr is a terminal other than `TERM=dumb`.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_color_enabled(bool enabled) {
        colors_enabled_ = enabled;
    }
    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
    LogFormatter formatter_;
};

/// File sink. Flushes after every Error or Fatal record.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
    LogFormatter formatter_;
};

/// Sink that discards all messages.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Fans out log records to multiple child sinks.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    [[nodiscard]] auto size() const -> size_t {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Per-module thresholds parsed from strings like
/// `"json=trace,dynamic=debug,*=warn"`.
///
/// A bare module name enables Trace for it, `*` sets the default. Entries
/// with an unknown level are ignored.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view filter);

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// Lowest threshold across all modules and the default.
    [[nodiscard]] auto min_level() const -> LogLevel;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
class Logger {
public:
    /// Replaces the sinks and thresholds of the global logger.
    static void init(const LogConfig& config);

    static auto instance() -> Logger&;

    /// Checked by the macros before the message is built. The global
    /// threshold is read without locking.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink. Used by tests to restore a silent logger.
    void clear_sinks();

    void set_level(LogLevel level);

    [[nodiscard]] auto level() const -> LogLevel {
        return threshold_.load(std::memory_order_relaxed);
    }

    void set_filter(std::string_view filter);

    void flush();

private:
    Logger();

    std::atomic<LogLevel> threshold_{LogLevel::Warn};
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// CLI Parsing
// ============================================================================

/// Parse logging-related CLI options from argv.
/// Extracts: --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv, -q
/// Falls back to the WEFT_LOG environment variable.
auto parse_log_options(int argc, char* argv[]) -> LogConfig;

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef WEFT_MIN_LOG_LEVEL
#define WEFT_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific macros below.
#define WEFT_LOG_IMPL(level, module_str, msg)                                                      \
    do {                                                                                           \
        if (static_cast<int>(level) >= WEFT_MIN_LOG_LEVEL) {                                       \
            auto& logger_ = ::weft::log::Logger::instance();                                       \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Usage: WEFT_LOG_TRACE("module", "message " << value);
#define WEFT_LOG_TRACE(module, msg) WEFT_LOG_IMPL(::weft::log::LogLevel::Trace, module, msg)
#define WEFT_LOG_DEBUG(module, msg) WEFT_LOG_IMPL(::weft::log::LogLevel::Debug, module, msg)
#define WEFT_LOG_INFO(module, msg) WEFT_LOG_IMPL(::weft::log::LogLevel::Info, module, msg)
#define WEFT_LOG_WARN(module, msg) WEFT_LOG_IMPL(::weft::log::LogLevel::Warn, module, msg)
#define WEFT_LOG_ERROR(module, msg) WEFT_LOG_IMPL(::weft::log::LogLevel::Error, module, msg)
#define WEFT_LOG_FATAL(module, msg) WEFT_LOG_IMPL(::weft::log::LogLevel::Fatal, module, msg)

} // namespace weft::log

#endif // WEFT_LOG_HPP
