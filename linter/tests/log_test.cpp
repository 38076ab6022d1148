//! # Logger Unit Tests
//!
//! Tests for the logging library: LogFilter parsing, sinks, JSON output,
//! level and module filtering, command-line options and thread safety.

#include "log/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace pmc::log;
namespace fs = std::filesystem;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("engine=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "engine"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "engine"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "engine"));

    // Unmatched modules use the default
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "cli"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "cli"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    filter.parse("loader");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "loader"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "engine"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    filter.parse("config=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "config"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "cli"));
}

TEST_F(LogFilterTest, ParseMultipleModules) {
    filter.parse("engine=trace,loader=info,cli=warn,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "engine"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "loader"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "loader"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "cli"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "cli"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "other"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "other"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("engine=trace,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, EmptyFilter) {
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "anything"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "anything"));
}

// ============================================================================
// Helper: Capture sink that stores records in memory
// ============================================================================

class CaptureSink : public LogSink {
public:
    void write(const LogRecord& record) override {
        records.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    std::vector<Entry> records;
};

/// Points the global logger at a CaptureSink for the duration of a test.
class LoggerTest : public ::testing::Test {
protected:
    CaptureSink* capture = nullptr;

    void SetUp() override {
        LogConfig config;
        config.console = false;
        config.level = LogLevel::Trace;
        Logger::init(config);

        auto sink = std::make_unique<CaptureSink>();
        capture = sink.get();
        Logger::instance().add_sink(std::move(sink));
    }

    void TearDown() override {
        LogConfig config;
        config.console = false;
        Logger::init(config);
    }
};

TEST_F(LoggerTest, MacroFormatsStreamExpression) {
    PMC_LOG_INFO("cli", "Checked " << 3 << " files");

    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_EQ(capture->records[0].level, LogLevel::Info);
    EXPECT_EQ(capture->records[0].module, "cli");
    EXPECT_EQ(capture->records[0].message, "Checked 3 files");
}

TEST_F(LoggerTest, DebugHiddenAtInfoLevel) {
    Logger::instance().set_level(LogLevel::Info);

    PMC_LOG_DEBUG("engine", "hidden");
    PMC_LOG_INFO("engine", "shown");

    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_EQ(capture->records[0].message, "shown");
}

TEST_F(LoggerTest, AllHiddenAtOff) {
    Logger::instance().set_level(LogLevel::Off);

    PMC_LOG_ERROR("engine", "hidden");
    PMC_LOG_FATAL("engine", "hidden");

    EXPECT_TRUE(capture->records.empty());
}

TEST_F(LoggerTest, ModuleFilterSelectsModule) {
    Logger::instance().set_filter("engine=trace,*=error");

    PMC_LOG_TRACE("engine", "PMC001 at 1:0");
    PMC_LOG_INFO("loader", "hidden");
    PMC_LOG_ERROR("loader", "shown");

    ASSERT_EQ(capture->records.size(), 2u);
    EXPECT_EQ(capture->records[0].module, "engine");
    EXPECT_EQ(capture->records[1].message, "shown");
}

TEST_F(LoggerTest, MessageNotBuiltWhenFiltered) {
    Logger::instance().set_level(LogLevel::Warn);

    int evaluations = 0;
    auto expensive = [&evaluations]() {
        ++evaluations;
        return "value";
    };
    PMC_LOG_DEBUG("engine", expensive());

    EXPECT_EQ(evaluations, 0);
}

TEST_F(LoggerTest, ConcurrentLogging) {
    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([t, messages_per_thread]() {
            for (int i = 0; i < messages_per_thread; i++) {
                PMC_LOG_INFO("test", "thread-" << t << "-msg-" << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(capture->records.size(), static_cast<size_t>(num_threads * messages_per_thread));
}

// ============================================================================
// Record Formatting and FileSink
// ============================================================================

namespace {

auto make_record(LogLevel level, std::string_view module, std::string message) -> LogRecord {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = std::move(message);
    record.file = __FILE__;
    record.line = __LINE__;
    record.timestamp_ms = 1234567890;
    return record;
}

} // namespace

TEST(LogFormatTest, TextContainsLevelModuleAndMessage) {
    std::ostringstream out;
    format_text(out, make_record(LogLevel::Warn, "config", "unknown key 'x'"));

    std::string line = out.str();
    EXPECT_NE(line.find("WARN"), std::string::npos);
    EXPECT_NE(line.find("[config] unknown key 'x'"), std::string::npos);
    EXPECT_EQ(line.back(), '\n');
}

TEST(LogFormatTest, JsonEscapesMessage) {
    std::ostringstream out;
    format_json(out, make_record(LogLevel::Error, "cli", "a \"quoted\"\npath\\x"));

    EXPECT_EQ(out.str(), "{\"ts\":1234567890,\"level\":\"ERROR\",\"module\":\"cli\","
                         "\"msg\":\"a \\\"quoted\\\"\\npath\\\\x\"}\n");
}

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "pmc_log_test.log";
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    void TearDown() override {
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    std::string read_file(const fs::path& path) {
        std::ifstream f(path);
        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        return content;
    }
};

TEST_F(FileSinkTest, CreatesAndWritesFile) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "loader", "Loaded 12 nodes"));
        sink.flush();
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[loader] Loaded 12 nodes"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsToExistingFile) {
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Info, "m1", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Warn, "m2", "second"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonFormat) {
    {
        FileSink sink(temp_file.string(), false);
        sink.set_format(LogFormat::JSON);
        sink.write(make_record(LogLevel::Error, "engine", "malformed Assign node"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(content.find("\"module\":\"engine\""), std::string::npos);
    EXPECT_NE(content.find("\"msg\":\"malformed Assign node\""), std::string::npos);
}

// ============================================================================
// Level Helpers
// ============================================================================

TEST(LogLevelHelpersTest, LevelNameRoundTrip) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                       LogLevel::Error, LogLevel::Fatal, LogLevel::Off}) {
        EXPECT_EQ(parse_level(level_name(level)), level);
    }
}

TEST(LogLevelHelpersTest, ParseAcceptsWarningAlias) {
    EXPECT_EQ(parse_level("warning"), LogLevel::Warn);
}

TEST(LogLevelHelpersTest, ParseUnknownDefaultsToInfo) {
    EXPECT_EQ(parse_level("loud"), LogLevel::Info);
}

// ============================================================================
// Command-Line Options
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("PMC_LOG");
    }

    void TearDown() override {
        unsetenv("PMC_LOG");
    }

    static auto parse(std::vector<std::string> args) -> LogConfig {
        args.insert(args.begin(), "pmc-lint");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parse_log_options(static_cast<int>(argv.size()), argv.data());
    }
};

TEST_F(LogOptionsTest, DefaultsToWarn) {
    auto config = parse({"trees/"});
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_TRUE(config.filter_spec.empty());
    EXPECT_TRUE(config.log_file.empty());
}

TEST_F(LogOptionsTest, ExplicitOptions) {
    auto config = parse({"--log-level=debug", "--log-filter=engine=trace",
                         "--log-file=/tmp/pmc.log", "--log-format=json", "--no-color"});
    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_EQ(config.filter_spec, "engine=trace");
    EXPECT_EQ(config.log_file, "/tmp/pmc.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
    EXPECT_FALSE(config.colors);
}

TEST_F(LogOptionsTest, VerbosityFlags) {
    EXPECT_EQ(parse({"-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"--verbose"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, ExplicitLevelBeatsVerbosity) {
    EXPECT_EQ(parse({"-vvv", "--log-level=error"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, EnvironmentLevel) {
    setenv("PMC_LOG", "debug", 1);
    EXPECT_EQ(parse({}).level, LogLevel::Debug);
}

TEST_F(LogOptionsTest, EnvironmentFilter) {
    setenv("PMC_LOG", "engine=trace,*=warn", 1);
    EXPECT_EQ(parse({}).filter_spec, "engine=trace,*=warn");
}

TEST_F(LogOptionsTest, FlagsBeatEnvironment) {
    setenv("PMC_LOG", "trace", 1);
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, RecognizesLogOptions) {
    EXPECT_TRUE(is_log_option("--log-level=info"));
    EXPECT_TRUE(is_log_option("-vv"));
    EXPECT_TRUE(is_log_option("--quiet"));
    EXPECT_FALSE(is_log_option("-V"));
    EXPECT_FALSE(is_log_option("--annoy"));
    EXPECT_FALSE(is_log_option("-j4"));
}
