//! # Logger Unit Tests
//!
//! Tests for the weft logging system: LogFilter parsing, file and JSON
//! output, sink fan-out, formatter tokens, command-line option parsing and
//! the records the codecs emit.
//!
//! ## Test Coverage
//! - Module filter specs (`json=trace,*=warn`)
//! - FileSink text and JSON lines
//! - `parse_log_options` flags and the `WEFT_LOG` variable
//! - Records emitted while decoding (skipped keys, coerced values)

#include "weft/json/json.hpp"
#include "weft/log/log.hpp"

#include "test_models.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace weft::log;
namespace fs = std::filesystem;

namespace {

class CaptureSink : public LogSink {
public:
    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    explicit CaptureSink(std::vector<Entry>& records) : records_(records) {}

    void write(const LogRecord& record) override {
        records_.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

private:
    std::vector<Entry>& records_;
};

auto make_record(LogLevel level, std::string_view module, std::string message) -> LogRecord {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = std::move(message);
    record.file = __FILE__;
    record.line = 7;
    record.timestamp_ms = 1234567890;
    return record;
}

/// Owns argv storage for `parse_log_options`.
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
    }

    auto argc() -> int {
        return static_cast<int>(pointers_.size());
    }
    auto argv() -> char** {
        return pointers_.data();
    }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

} // namespace

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("json=debug,*=warn");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "json"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "json"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "json"));

    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "dynamic"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "dynamic"));
}

TEST_F(LogFilterTest, BareModuleNameEnablesTrace) {
    filter.parse("dynamic");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "dynamic"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "json"));
}

TEST_F(LogFilterTest, ModuleOff) {
    filter.parse("json=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "json"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "cli"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("json=trace,dynamic=error,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, EmptyFilter) {
    filter.parse("");
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "anything"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "anything"));
}

// ============================================================================
// Level Helpers
// ============================================================================

TEST(LogLevelHelpersTest, LevelNames) {
    EXPECT_STREQ(level_name(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(level_name(LogLevel::Warn), "WARN");
    EXPECT_STREQ(level_name(LogLevel::Off), "OFF");
}

TEST(LogLevelHelpersTest, ParseLevel) {
    EXPECT_EQ(parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_level("ERROR"), LogLevel::Error);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("Warn"), LogLevel::Warn);
    EXPECT_EQ(parse_level("garbage"), std::nullopt);
    EXPECT_EQ(parse_level(""), std::nullopt);
}

TEST_F(LogFilterTest, UnknownLevelEntryIgnored) {
    filter.parse("json=loud,dynamic=debug");

    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "json"));
    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "dynamic"));
}

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "weft_log_test.log";
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    void TearDown() override {
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    auto read_file() -> std::string {
        std::ifstream f(temp_file);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }
};

TEST_F(FileSinkTest, WritesTextLines) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "json", "first"));
        sink.write(make_record(LogLevel::Warn, "dynamic", "second"));
        sink.flush();
    }

    std::string content = read_file();
    EXPECT_NE(content.find("INFO [json] first"), std::string::npos);
    EXPECT_NE(content.find("WARN [dynamic] second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonFormatEscapesMessage) {
    {
        FileSink sink(temp_file.string(), false);
        sink.set_format(LogFormat::JSON);
        sink.write(make_record(LogLevel::Debug, "json", "key \"a\"\nskipped"));
    }

    std::string content = read_file();
    EXPECT_NE(content.find("\"level\":\"DEBUG\""), std::string::npos);
    EXPECT_NE(content.find("\"module\":\"json\""), std::string::npos);
    EXPECT_NE(content.find("key \\\"a\\\"\\nskipped"), std::string::npos);
}

// ============================================================================
// MultiSink and Formatter
// ============================================================================

TEST(MultiSinkTest, FansOutToAllChildren) {
    std::vector<CaptureSink::Entry> first;
    std::vector<CaptureSink::Entry> second;
    MultiSink multi;
    multi.add(std::make_unique<CaptureSink>(first));
    multi.add(std::make_unique<CaptureSink>(second));
    EXPECT_EQ(multi.size(), 2u);

    multi.write(make_record(LogLevel::Info, "cli", "fan-out"));

    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(first[0].message, "fan-out");
    EXPECT_EQ(second[0].module, "cli");
}

TEST(LogFormatterTest, FormatTokens) {
    LogFormatter formatter("{level} ({module}) {message} @{line}");
    std::string output = formatter.format(make_record(LogLevel::Warn, "json", "careful"));
    EXPECT_EQ(output, "WARN (json) careful @7");
}

TEST(LogFormatterTest, TimeComesFromRecord) {
    LogFormatter formatter("{time_ms}|{time}");
    std::string output = formatter.format(make_record(LogLevel::Info, "json", "x"));
    ASSERT_EQ(output.size(), std::string("1234567890|HH:MM:SS.mmm").size());
    EXPECT_EQ(output.substr(0, 11), "1234567890|");
    EXPECT_EQ(output.substr(output.size() - 4), ".890");
}

TEST(LogFormatterTest, UnknownTokenPreserved) {
    LogFormatter formatter("{level} {thread}");
    std::string output = formatter.format(make_record(LogLevel::Info, "json", "x"));
    EXPECT_EQ(output, "INFO {thread}");
}

// ============================================================================
// Command-line Options
// ============================================================================

TEST(LogOptionsTest, DefaultsToWarn) {
    unsetenv("WEFT_LOG");
    Args args{"weft-json", "input.json"};
    LogConfig config = parse_log_options(args.argc(), args.argv());
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_TRUE(config.filter_spec.empty());
}

TEST(LogOptionsTest, VerbosityFlags) {
    Args debug{"weft-json", "-vv"};
    EXPECT_EQ(parse_log_options(debug.argc(), debug.argv()).level, LogLevel::Debug);

    Args trace{"weft-json", "-vvv"};
    EXPECT_EQ(parse_log_options(trace.argc(), trace.argv()).level, LogLevel::Trace);

    Args quiet{"weft-json", "-q"};
    EXPECT_EQ(parse_log_options(quiet.argc(), quiet.argv()).level, LogLevel::Error);
}

TEST(LogOptionsTest, ExplicitOptions) {
    Args args{"weft-json", "--log-level=info", "--log-filter=json=trace", "--log-format=json",
              "--log-file=weft.log"};
    LogConfig config = parse_log_options(args.argc(), args.argv());
    EXPECT_EQ(config.level, LogLevel::Info);
    EXPECT_EQ(config.filter_spec, "json=trace");
    EXPECT_EQ(config.format, LogFormat::JSON);
    EXPECT_EQ(config.log_file, "weft.log");
}

TEST(LogOptionsTest, EnvironmentVariable) {
    setenv("WEFT_LOG", "dynamic=debug,*=error", 1);
    Args args{"weft-json"};
    LogConfig config = parse_log_options(args.argc(), args.argv());
    EXPECT_EQ(config.filter_spec, "dynamic=debug,*=error");

    setenv("WEFT_LOG", "trace", 1);
    EXPECT_EQ(parse_log_options(args.argc(), args.argv()).level, LogLevel::Trace);

    Args explicit_level{"weft-json", "--log-level=error"};
    EXPECT_EQ(parse_log_options(explicit_level.argc(), explicit_level.argv()).level,
              LogLevel::Error);
    unsetenv("WEFT_LOG");
}

// ============================================================================
// Records Emitted by the Codecs
// ============================================================================

class CodecLoggingTest : public ::testing::Test {
protected:
    std::vector<CaptureSink::Entry> records;

    void SetUp() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_level(LogLevel::Trace);
        logger.add_sink(std::make_unique<CaptureSink>(records));
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_filter("");
        logger.set_level(LogLevel::Warn);
    }

    auto has_record(LogLevel level, const std::string& module, const std::string& fragment) const
        -> bool {
        for (const auto& entry : records) {
            if (entry.level == level && entry.module == module &&
                entry.message.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }
};

TEST_F(CodecLoggingTest, SkippedUnknownKeyIsDebugRecord) {
    const auto& json = weft::json::Json::default_instance();
    auto point = json.decode_from_string(weft::test::PointSerializer{},
                                         R"({"x": 1, "extra": [1, 2], "y": 2})");
    ASSERT_TRUE(weft::is_ok(point));
    EXPECT_TRUE(has_record(LogLevel::Debug, "json", "extra"));
}

TEST_F(CodecLoggingTest, AbsentNullableIsTraceRecord) {
    weft::json::JsonConfiguration config;
    config.explicit_nulls = false;
    auto json = weft::json::Json::make(config);
    ASSERT_TRUE(weft::is_ok(json));

    auto note = weft::unwrap(json).decode_from_string(weft::test::NoteSerializer{},
                                                      R"({"title": "t"})");
    ASSERT_TRUE(weft::is_ok(note));
    EXPECT_TRUE(has_record(LogLevel::Trace, "json", "body"));
}

TEST_F(CodecLoggingTest, FilterSilencesModule) {
    Logger::instance().set_filter("json=off,*=trace");
    const auto& json = weft::json::Json::default_instance();
    auto point = json.decode_from_string(weft::test::PointSerializer{},
                                         R"({"x": 1, "extra": 0, "y": 2})");
    ASSERT_TRUE(weft::is_ok(point));
    EXPECT_FALSE(has_record(LogLevel::Debug, "json", "extra"));
}
