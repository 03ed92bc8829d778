//! # Logger Unit Tests
//!
//! LogFilter parsing, FileSink I/O, logger level and module filtering,
//! the logging macros, CLI option parsing and thread safety.

#include "log/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace irt::log;
namespace fs = std::filesystem;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("printer=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "printer"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "printer"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "printer"));

    // Unmatched modules use default (Info)
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "verify"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "verify"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    filter.parse("symbols=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "symbols"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "printer"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    // Bare module name (no =level) sets module to Trace
    filter.parse("builder");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "builder"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "printer"));
}

TEST_F(LogFilterTest, ParseMultipleModules) {
    filter.parse("printer=trace,verify=info,symbols=warn,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "printer"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "verify"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "verify"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "symbols"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "symbols"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "other"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "other"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("printer=trace,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, MinLevelDefaultOnly) {
    filter.set_default_level(LogLevel::Error);
    EXPECT_EQ(filter.min_level(), LogLevel::Error);
}

TEST(LogLevelTest, NamesRoundTrip) {
    EXPECT_STREQ(level_name(LogLevel::Warn), "WARN");
    EXPECT_EQ(parse_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_level("TRACE"), LogLevel::Trace);
    EXPECT_EQ(parse_level("Debug"), LogLevel::Debug);
    EXPECT_EQ(parse_level("bogus"), LogLevel::Info);
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
        temp_file = fs::temp_directory_path() / "irt_log_test.log";
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
        record.timestamp_ms = epoch_ms();
        return record;
    }
};

TEST_F(FileSinkTest, CreatesAndWritesFile) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "printer", "file sink test"));
        sink.flush();
    }

    ASSERT_TRUE(fs::exists(temp_file));
    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[printer]"), std::string::npos);
    EXPECT_NE(content.find("file sink test"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsToExistingFile) {
    {
        FileSink sink(temp_file.string(), true);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "m1", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Warn, "m2", "second"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, OpenFailureIsReported) {
    FileSink sink((temp_file / "missing" / "x.log").string(), false);
    EXPECT_FALSE(sink.is_open());
}

// ============================================================================
// Logger
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    CaptureSink* capture = nullptr;

    void SetUp() override {
        LogConfig config;
        config.console = false;
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

TEST_F(LoggerTest, DefaultLevelDropsInfo) {
    IRT_LOG_INFO("printer", "not shown");
    IRT_LOG_WARN("printer", "shown " << 1);

    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_EQ(capture->records[0].level, LogLevel::Warn);
    EXPECT_EQ(capture->records[0].module, "printer");
    EXPECT_EQ(capture->records[0].message, "shown 1");
}

TEST_F(LoggerTest, SetLevelLowersThreshold) {
    Logger::instance().set_level(LogLevel::Debug);

    IRT_LOG_TRACE("verify", "dropped");
    IRT_LOG_DEBUG("verify", "kept");

    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_EQ(capture->records[0].message, "kept");
}

TEST_F(LoggerTest, ModuleFilterSelectsModules) {
    Logger::instance().set_filter("builder=trace,*=error");

    IRT_LOG_TRACE("builder", "id assigned");
    IRT_LOG_WARN("printer", "dropped");
    IRT_LOG_ERROR("printer", "kept");

    ASSERT_EQ(capture->records.size(), 2u);
    EXPECT_EQ(capture->records[0].module, "builder");
    EXPECT_EQ(capture->records[1].message, "kept");
}

TEST_F(LoggerTest, InitWithFilterAdmitsVerboseModule) {
    LogConfig config;
    config.console = false;
    config.filter_spec = "symbols=debug";
    Logger::init(config);

    auto sink = std::make_unique<CaptureSink>();
    auto* records = sink.get();
    Logger::instance().add_sink(std::move(sink));

    IRT_LOG_DEBUG("symbols", "kept");
    IRT_LOG_DEBUG("printer", "dropped");

    ASSERT_EQ(records->records.size(), 1u);
    EXPECT_EQ(records->records[0].module, "symbols");
}

TEST_F(LoggerTest, NullSinkDiscardsRecords) {
    Logger::instance().add_sink(std::make_unique<NullSink>());

    IRT_LOG_ERROR("cli", "reaches both sinks");
    Logger::instance().flush();

    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_EQ(capture->records[0].level, LogLevel::Error);
}

TEST_F(LoggerTest, ConcurrentLogging) {
    auto& logger = Logger::instance();
    logger.set_level(LogLevel::Trace);

    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < messages_per_thread; i++) {
                std::ostringstream oss;
                oss << "thread-" << t << "-msg-" << i;
                logger.log(LogLevel::Info, "test", oss.str(), __FILE__, __LINE__);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(capture->records.size()), num_threads * messages_per_thread);
}

// ============================================================================
// CLI Parsing
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("IRT_LOG");
    }

    void TearDown() override {
        unsetenv("IRT_LOG");
    }

    LogConfig parse(std::vector<std::string> args) {
        args.insert(args.begin(), "irt");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parse_log_options(static_cast<int>(argv.size()), argv.data());
    }
};

TEST_F(LogOptionsTest, DefaultsToWarn) {
    auto config = parse({"sample"});
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_TRUE(config.filter_spec.empty());
    EXPECT_TRUE(config.log_file.empty());
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

TEST_F(LogOptionsTest, FilterAndFile) {
    auto config = parse({"--log-filter=printer=trace", "--log-file=/tmp/irt.log"});
    EXPECT_EQ(config.filter_spec, "printer=trace");
    EXPECT_EQ(config.log_file, "/tmp/irt.log");
}

TEST_F(LogOptionsTest, EnvironmentFallback) {
    setenv("IRT_LOG", "debug", 1);
    EXPECT_EQ(parse({}).level, LogLevel::Debug);

    setenv("IRT_LOG", "verify=trace", 1);
    EXPECT_EQ(parse({}).filter_spec, "verify=trace");

    // Command-line flags take precedence
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
    EXPECT_TRUE(parse({"-q"}).filter_spec.empty());
}

TEST(IsLogOptionTest, RecognizesLoggingFlags) {
    EXPECT_TRUE(is_log_option("-v"));
    EXPECT_TRUE(is_log_option("-vvv"));
    EXPECT_TRUE(is_log_option("-q"));
    EXPECT_TRUE(is_log_option("--log-level=debug"));
    EXPECT_TRUE(is_log_option("--log-filter=printer"));
    EXPECT_TRUE(is_log_option("--log-file=x.log"));

    EXPECT_FALSE(is_log_option("-o"));
    EXPECT_FALSE(is_log_option("--verify"));
    EXPECT_FALSE(is_log_option("-vx"));
    EXPECT_FALSE(is_log_option("sample"));
}
