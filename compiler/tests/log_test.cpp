//! # Logger Unit Tests
//!
//! LogFilter parsing, record formatting, FileSink output, environment
//! overrides and the logging macros.

#include "log/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace a2c::log;
namespace fs = std::filesystem;

namespace {

auto make_record(LogLevel level, std::string_view module, std::string message) -> LogRecord {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = std::move(message);
    record.file = __FILE__;
    record.line = __LINE__;
    record.timestamp_ms = 1700000000123;
    return record;
}

/// Keeps every record it receives.
class CaptureSink : public LogSink {
public:
    explicit CaptureSink(std::vector<std::string>* lines) : lines_(lines) {}

    void write(const LogRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_->push_back(std::string(record.module) + ":" + record.message);
    }
    void flush() override {}

private:
    std::vector<std::string>* lines_;
    std::mutex mutex_;
};

void set_env(const char* name, const char* value) {
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

void unset_env(const char* name) {
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

} // namespace

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ModuleLevelAndDefault) {
    filter.parse("mono=debug,*=warn");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "mono"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "mono"));

    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "layout"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "layout"));
}

TEST_F(LogFilterTest, BareModuleNameEnablesTrace) {
    filter.parse("ownership");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "ownership"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "codegen"));
}

TEST_F(LogFilterTest, OffDisablesModule) {
    filter.parse("driver=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "driver"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "codegen"));
}

TEST_F(LogFilterTest, MinLevelCoversOverrides) {
    filter.parse("lower=trace,*=error");
    EXPECT_EQ(filter.default_level(), LogLevel::Error);
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, ReparseClearsPreviousModules) {
    filter.parse("mono=trace");
    filter.parse("layout=trace");
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "mono"));
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "layout"));
}

// ============================================================================
// Levels
// ============================================================================

TEST(LogLevelTest, ParseNames) {
    EXPECT_EQ(try_parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(try_parse_level("WARN"), LogLevel::Warn);
    EXPECT_EQ(try_parse_level("off"), LogLevel::Off);
    EXPECT_FALSE(try_parse_level("loud").has_value());
    EXPECT_EQ(parse_level("loud"), LogLevel::Info);
}

TEST(LogLevelTest, Names) {
    EXPECT_STREQ(level_name(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(level_name(LogLevel::Fatal), "FATAL");
}

// ============================================================================
// Formatting
// ============================================================================

TEST(LogFormatTest, TextLine) {
    auto text = format_text(make_record(LogLevel::Info, "driver", "Compiling module geo"));
    EXPECT_NE(text.find("INFO  [driver] Compiling module geo"), std::string::npos);
    EXPECT_EQ(text.find('\n'), std::string::npos);
}

TEST(LogFormatTest, JsonObject) {
    auto json = format_json(make_record(LogLevel::Error, "codegen", "bad \"name\"\n"));
    EXPECT_EQ(json, "{\"ts\":1700000000123,\"level\":\"ERROR\",\"module\":\"codegen\","
                    "\"msg\":\"bad \\\"name\\\"\\n\"}");
}

// ============================================================================
// Sinks
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path path;

    void SetUp() override {
        path = fs::temp_directory_path() / "a2c_test_log_sink.log";
        fs::remove(path);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path, ec);
    }

    auto contents() -> std::string {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }
};

TEST_F(FileSinkTest, WritesOneLinePerRecord) {
    {
        FileSink sink(path.string());
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "mono", "first"));
        sink.write(make_record(LogLevel::Warn, "layout", "second"));
    }

    auto text = contents();
    EXPECT_NE(text.find("[mono] first\n"), std::string::npos);
    EXPECT_NE(text.find("[layout] second\n"), std::string::npos);
}

TEST_F(FileSinkTest, JsonFormat) {
    {
        FileSink sink(path.string());
        sink.set_format(LogFormat::JSON);
        sink.write(make_record(LogLevel::Debug, "lower", "done"));
    }
    EXPECT_EQ(contents(),
              "{\"ts\":1700000000123,\"level\":\"DEBUG\",\"module\":\"lower\",\"msg\":\"done\"}\n");
}

TEST(MultiSinkTest, FansOut) {
    std::vector<std::string> first;
    std::vector<std::string> second;
    MultiSink multi;
    multi.add(std::make_unique<CaptureSink>(&first));
    multi.add(std::make_unique<CaptureSink>(&second));
    EXPECT_EQ(multi.size(), 2u);

    multi.write(make_record(LogLevel::Info, "driver", "x"));
    EXPECT_EQ(first, std::vector<std::string>{"driver:x"});
    EXPECT_EQ(second, std::vector<std::string>{"driver:x"});
}

// ============================================================================
// Environment
// ============================================================================

class EnvOverrideTest : public ::testing::Test {
protected:
    void TearDown() override {
        unset_env("A2C_LOG");
    }
};

TEST_F(EnvOverrideTest, LevelValue) {
    set_env("A2C_LOG", "debug");
    LogConfig config;
    apply_env_overrides(config);
    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_TRUE(config.filter_spec.empty());
}

TEST_F(EnvOverrideTest, FilterValue) {
    set_env("A2C_LOG", "mono=trace,*=warn");
    LogConfig config;
    apply_env_overrides(config);
    EXPECT_EQ(config.filter_spec, "mono=trace,*=warn");
}

TEST_F(EnvOverrideTest, ExplicitFilterWins) {
    set_env("A2C_LOG", "trace");
    LogConfig config;
    config.filter_spec = "codegen=debug";
    apply_env_overrides(config);
    EXPECT_EQ(config.filter_spec, "codegen=debug");
    EXPECT_EQ(config.level, LogLevel::Warn);
}

// ============================================================================
// Logger and Macros
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    std::vector<std::string> lines;

    void SetUp() override {
        LogConfig config;
        config.console = false;
        config.level = LogLevel::Info;
        Logger::init(config);
        Logger::instance().add_sink(std::make_unique<CaptureSink>(&lines));
    }

    void TearDown() override {
        Logger::init(LogConfig{});
    }
};

TEST_F(LoggerTest, LevelGatesMessages) {
    A2C_LOG_INFO("driver", "Compiling " << 2 << " modules");
    A2C_LOG_DEBUG("driver", "hidden");

    EXPECT_EQ(lines, std::vector<std::string>{"driver:Compiling 2 modules"});
}

TEST_F(LoggerTest, FilterOpensOneModule) {
    Logger::instance().set_filter("mono=trace,*=info");
    A2C_LOG_TRACE("mono", "instantiated");
    A2C_LOG_TRACE("layout", "hidden");

    EXPECT_EQ(lines, std::vector<std::string>{"mono:instantiated"});
}

TEST_F(LoggerTest, ConcurrentLogging) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < 25; ++i) {
                A2C_LOG_INFO("driver", "worker " << t << " message " << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(lines.size(), 100u);
}
