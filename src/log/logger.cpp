//! # Logger Implementation
//!
//! Implements the Logger singleton, the sinks, LogFormatter and LogFilter.

#include "weft/log/log.hpp"

#include "weft/json/json_writer.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <unistd.h>

namespace weft::log {

namespace {

auto detect_terminal_colors() -> bool {
    if (!isatty(fileno(stderr))) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term && std::string_view(term) != "dumb";
}

auto level_color(LogLevel level) -> const char* {
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
        break;
    }
    return "";
}

auto now_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// Local wall-clock time of `epoch_ms` as "HH:MM:SS.mmm".
auto clock_time(int64_t epoch_ms) -> std::string {
    auto seconds = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm parts{};
    localtime_r(&seconds, &parts);

    std::ostringstream oss;
    oss << std::put_time(&parts, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << (epoch_ms % 1000);
    return oss.str();
}

auto equals_ignore_case(std::string_view a, std::string_view b) -> bool {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        auto lower = [](char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c; };
        if (lower(a[i]) != lower(b[i])) {
            return false;
        }
    }
    return true;
}

} // namespace

auto parse_level(std::string_view s) -> std::optional<LogLevel> {
    for (int i = 0; i <= static_cast<int>(LogLevel::Off); ++i) {
        auto level = static_cast<LogLevel>(i);
        if (equals_ignore_case(s, level_name(level))) {
            return level;
        }
    }
    return std::nullopt;
}

void write_json_record(std::ostream& out, const LogRecord& record) {
    out << "{\"ts\":" << record.timestamp_ms << ",\"level\":\"" << level_name(record.level)
        << "\",\"module\":\"" << json::escape_string(record.module) << "\",\"msg\":\""
        << json::escape_string(record.message) << "\"}\n";
}

// ============================================================================
// LogFormatter
// ============================================================================

LogFormatter::LogFormatter(std::string_view format_template) {
    set_template(format_template);
}

void LogFormatter::set_template(std::string_view format_template) {
    static const std::pair<std::string_view, Field> TOKENS[] = {
        {"time", Field::Time},       {"time_ms", Field::TimeMs}, {"level", Field::Level},
        {"module", Field::Module},   {"message", Field::Message}, {"file", Field::File},
        {"line", Field::Line},
    };

    template_ = std::string(format_template);
    segments_.clear();

    std::string literal;
    auto flush_literal = [&] {
        if (!literal.empty()) {
            segments_.push_back({Field::Literal, std::move(literal)});
            literal.clear();
        }
    };

    size_t i = 0;
    while (i < template_.size()) {
        size_t close = template_[i] == '{' ? template_.find('}', i + 1) : std::string::npos;
        if (close == std::string::npos) {
            literal += template_[i++];
            continue;
        }

        auto token = std::string_view(template_).substr(i + 1, close - i - 1);
        const Field* field = nullptr;
        for (const auto& [name, value] : TOKENS) {
            if (name == token) {
                field = &value;
                break;
            }
        }

        if (field) {
            flush_literal();
            segments_.push_back({*field, {}});
        } else {
            literal.append(template_, i, close - i + 1);
        }
        i = close + 1;
    }
    flush_literal();
}

auto LogFormatter::format(const LogRecord& record) const -> std::string {
    std::string result;
    result.reserve(template_.size() + record.message.size() + 32);

    for (const auto& segment : segments_) {
        switch (segment.field) {
        case Field::Literal:
            result += segment.literal;
            break;
        case Field::Time:
            result += clock_time(record.timestamp_ms);
            break;
        case Field::TimeMs:
            result += std::to_string(record.timestamp_ms);
            break;
        case Field::Level:
            result += level_name(record.level);
            break;
        case Field::Module:
            result += record.module;
            break;
        case Field::Message:
            result += record.message;
            break;
        case Field::File:
            result += record.file ? record.file : "";
            break;
        case Field::Line:
            result += std::to_string(record.line);
            break;
        }
    }
    return result;
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors)
    : colors_enabled_(use_colors && detect_terminal_colors()) {}

void ConsoleSink::write(const LogRecord& record) {
    // One insertion per record so concurrent writers do not interleave.
    std::ostringstream line;
    if (format_ == LogFormat::JSON) {
        write_json_record(line, record);
    } else if (colors_enabled_) {
        line << level_color(record.level) << formatter_.format(record) << "\033[0m\n";
    } else {
        line << formatter_.format(record) << '\n';
    }
    std::cerr << line.str();
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    if (format_ == LogFormat::JSON) {
        write_json_record(file_, record);
    } else {
        file_ << formatter_.format(record) << '\n';
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

void MultiSink::write(const LogRecord& record) {
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void MultiSink::flush() {
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

void MultiSink::add(std::unique_ptr<LogSink> sink) {
    sinks_.push_back(std::move(sink));
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view filter) {
    module_levels_.clear();

    while (!filter.empty()) {
        size_t comma = filter.find(',');
        auto entry = filter.substr(0, comma);
        filter = comma == std::string_view::npos ? std::string_view{} : filter.substr(comma + 1);

        if (entry.empty()) {
            continue;
        }

        size_t eq = entry.find('=');
        if (eq == std::string_view::npos) {
            module_levels_[std::string(entry)] = LogLevel::Trace;
            continue;
        }

        auto module = entry.substr(0, eq);
        auto level = parse_level(entry.substr(eq + 1));
        if (!level) {
            continue;
        }
        if (module == "*") {
            default_level_ = *level;
        } else {
            module_levels_[std::string(module)] = *level;
        }
    }
}

auto LogFilter::should_log(LogLevel level, std::string_view module) const -> bool {
    auto it = module_levels_.find(std::string(module));
    return level >= (it != module_levels_.end() ? it->second : default_level_);
}

auto LogFilter::min_level() const -> LogLevel {
    LogLevel min = default_level_;
    for (const auto& [_, level] : module_levels_) {
        if (level < min) {
            min = level;
        }
    }
    return min;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    filter_.set_default_level(LogLevel::Warn);
}

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.filter_ = LogFilter{};
    logger.filter_.set_default_level(config.level);

    auto threshold = config.level;
    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
        // Per-module entries may ask for more than the global level.
        threshold = logger.filter_.min_level();
    }
    logger.threshold_.store(threshold, std::memory_order_relaxed);

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

auto Logger::should_log(LogLevel level, std::string_view module) const -> bool {
    if (level < threshold_.load(std::memory_order_relaxed)) {
        return false;
    }
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
    log(LogRecord{level, module, message, file, line, now_ms()});
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
    threshold_.store(level, std::memory_order_relaxed);
    filter_.set_default_level(level);
}

void Logger::set_filter(std::string_view filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(filter);
    threshold_.store(filter_.min_level(), std::memory_order_relaxed);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace weft::log
