//! # Logger Unit Tests
//!
//! LogFilter parsing, FileSink output in both formats, CLI option parsing,
//! the logging macros and thread safety.

#include "log/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace schemly::log;
namespace fs = std::filesystem;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("pivot=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "pivot"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "pivot"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "pivot"));

    // Unmatched modules use the default
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "graph"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "graph"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    filter.parse("config=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "config"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "resolve"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    // Bare module name (no =level) sets module to Trace
    filter.parse("relation");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "relation"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "validate"));
}

TEST_F(LogFilterTest, ParseMultipleModules) {
    filter.parse("relation=trace,pivot=info,graph=warn,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "relation"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "pivot"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "pivot"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "graph"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "graph"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "other"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "other"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("field=trace,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);

    LogFilter plain;
    plain.set_default_level(LogLevel::Error);
    EXPECT_EQ(plain.min_level(), LogLevel::Error);
}

TEST_F(LogFilterTest, EmptyFilter) {
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "anything"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "anything"));
}

TEST(LogLevelTest, ParseLevel) {
    EXPECT_EQ(parse_level("TRACE"), LogLevel::Trace);
    EXPECT_EQ(parse_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_level("Off"), LogLevel::Off);
    EXPECT_EQ(parse_level("bogus"), LogLevel::Info);
    EXPECT_STREQ(level_name(LogLevel::Error), "ERROR");
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

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "schemly_log_test.log";
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

    static LogRecord make_record(LogLevel level, std::string_view module, std::string message) {
        LogRecord record;
        record.level = level;
        record.module = module;
        record.message = std::move(message);
        record.file = __FILE__;
        record.line = __LINE__;
        record.timestamp_ms = 12345;
        return record;
    }
};

TEST_F(FileSinkTest, CreatesAndWritesFile) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "pivot", "derived posts_tags"));
        sink.flush();
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[pivot]"), std::string::npos);
    EXPECT_NE(content.find("derived posts_tags"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsToExistingFile) {
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Info, "config", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Warn, "config", "second"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonLinesEscapeSpecialCharacters) {
    {
        FileSink sink(temp_file.string(), false);
        sink.set_format(LogFormat::JSON);
        sink.write(make_record(LogLevel::Error, "validate", "line1\nline2\t\"quoted\"\\"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("{\"ts\":12345,"), std::string::npos);
    EXPECT_NE(content.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(content.find("\"module\":\"validate\""), std::string::npos);
    EXPECT_NE(content.find("line1\\nline2\\t\\\"quoted\\\"\\\\"), std::string::npos);
}

TEST(RecordFormatTest, TextLine) {
    LogRecord record;
    record.level = LogLevel::Warn;
    record.module = "relation";
    record.message = "ignoring cascade policy";
    record.file = __FILE__;
    record.line = __LINE__;
    record.timestamp_ms = 0;

    std::ostringstream os;
    write_text_line(os, record);
    EXPECT_NE(os.str().find("WARN  [relation] ignoring cascade policy\n"), std::string::npos);
}

// ============================================================================
// CLI Options
// ============================================================================

namespace {

auto parse(std::vector<std::string> args) -> LogConfig {
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return parse_log_options(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(LogOptionsTest, Defaults) {
    unsetenv("SCHEMLY_LOG");
    auto config = parse({"schemly-resolve", "schema.yaml"});
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_TRUE(config.filter_spec.empty());
    EXPECT_EQ(config.format, LogFormat::Text);
}

TEST(LogOptionsTest, VerbosityFlags) {
    unsetenv("SCHEMLY_LOG");
    EXPECT_EQ(parse({"x", "-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"x", "-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"x", "-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"x", "-q"}).level, LogLevel::Error);
    // An explicit level wins over -v
    EXPECT_EQ(parse({"x", "-vvv", "--log-level=error"}).level, LogLevel::Error);
}

TEST(LogOptionsTest, FilterFileAndFormat) {
    auto config = parse({"x", "--log-filter=pivot=trace,*=warn", "--log-file=/tmp/schemly.log",
                         "--log-format=json"});
    EXPECT_EQ(config.filter_spec, "pivot=trace,*=warn");
    EXPECT_EQ(config.log_file, "/tmp/schemly.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST(LogOptionsTest, EnvironmentFallback) {
    setenv("SCHEMLY_LOG", "graph=debug", 1);
    EXPECT_EQ(parse({"x"}).filter_spec, "graph=debug");

    setenv("SCHEMLY_LOG", "info", 1);
    EXPECT_EQ(parse({"x"}).level, LogLevel::Info);
    // The command line takes precedence
    EXPECT_EQ(parse({"x", "--log-level=trace"}).level, LogLevel::Trace);
    unsetenv("SCHEMLY_LOG");
}

TEST(LogOptionsTest, RecognizesLogOptions) {
    EXPECT_TRUE(is_log_option("--log-level=debug"));
    EXPECT_TRUE(is_log_option("-vv"));
    EXPECT_TRUE(is_log_option("--quiet"));
    EXPECT_FALSE(is_log_option("-V"));
    EXPECT_FALSE(is_log_option("--json"));
    EXPECT_FALSE(is_log_option("schema.yaml"));
}

// ============================================================================
// Logger
// ============================================================================

TEST(LoggerTest, MacrosRespectFilter) {
    auto& logger = Logger::instance();
    logger.clear_sinks();
    auto capture = std::make_unique<CaptureSink>();
    auto* records = &capture->records;
    logger.add_sink(std::move(capture));
    logger.set_filter("pivot=debug,*=error");

    SCHEMLY_LOG_DEBUG("pivot", "merged " << 2 << " claims");
    SCHEMLY_LOG_DEBUG("graph", "hidden");
    SCHEMLY_LOG_ERROR("graph", "shown");

    ASSERT_EQ(records->size(), 2u);
    EXPECT_EQ((*records)[0].module, "pivot");
    EXPECT_EQ((*records)[0].message, "merged 2 claims");
    EXPECT_EQ((*records)[1].level, LogLevel::Error);

    logger.clear_sinks();
    logger.set_filter("*=warn");
    logger.set_level(LogLevel::Warn);
}

TEST(LoggerThreadSafetyTest, ConcurrentLogging) {
    auto& logger = Logger::instance();
    logger.clear_sinks();
    auto capture = std::make_unique<CaptureSink>();
    auto* capture_ptr = capture.get();
    logger.add_sink(std::move(capture));
    logger.set_level(LogLevel::Trace);

    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&logger, t, messages_per_thread]() {
            for (int i = 0; i < messages_per_thread; i++) {
                std::ostringstream oss;
                oss << "thread-" << t << "-msg-" << i;
                logger.log(LogLevel::Info, "resolve", oss.str(), __FILE__, __LINE__);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(capture_ptr->records.size()), num_threads * messages_per_thread);

    logger.clear_sinks();
    logger.set_level(LogLevel::Warn);
}
