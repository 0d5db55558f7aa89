//! # Logging Tests
//!
//! Level names, record rendering, module thresholds, the sinks, the process
//! logger and the logging command line options.

#include "log/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace cmscript;
using namespace cmscript::log;
namespace fs = std::filesystem;

namespace {

auto make_record(LogLevel level, std::string module, std::string message) -> LogRecord {
    return LogRecord{.level = level,
                     .module = std::move(module),
                     .message = std::move(message),
                     .file = nullptr,
                     .line = 0,
                     .time = std::chrono::system_clock::time_point{}};
}

auto read_all(const fs::path& path) -> std::string {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

// ============================================================================
// Levels
// ============================================================================

TEST(LogLevelTest, NamesAreUpperCase) {
    EXPECT_EQ(level_name(LogLevel::Trace), "TRACE");
    EXPECT_EQ(level_name(LogLevel::Warn), "WARN");
    EXPECT_EQ(level_name(LogLevel::Off), "OFF");
}

TEST(LogLevelTest, ParseIgnoresCase) {
    EXPECT_EQ(parse_level("TRACE"), LogLevel::Trace);
    EXPECT_EQ(parse_level("Debug"), LogLevel::Debug);
    EXPECT_EQ(parse_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
}

TEST(LogLevelTest, UnknownNameIsRejected) {
    EXPECT_FALSE(parse_level("bogus").has_value());
    EXPECT_FALSE(parse_level("").has_value());
}

// ============================================================================
// Rendering
// ============================================================================

TEST(RenderTest, TextLineHasLevelModuleAndMessage) {
    auto line = render(make_record(LogLevel::Warn, "fmt", "slow file"), LogFormat::Text);

    EXPECT_NE(line.find("WARN  [fmt] slow file"), std::string::npos);
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(line.find('\033'), std::string::npos);
}

TEST(RenderTest, ColorWrapsLevelName) {
    auto line = render(make_record(LogLevel::Error, "cache", "x"), LogFormat::Text, true);

    EXPECT_NE(line.find("\033[31mERROR\033[0m"), std::string::npos);
}

TEST(RenderTest, JsonEscapesMessage) {
    auto record = make_record(LogLevel::Info, "parse", "say \"hi\"\n");
    record.file = "parser.cpp";
    record.line = 12;

    auto line = render(record, LogFormat::Json, true);

    EXPECT_EQ(line, "{\"time\":0,\"level\":\"INFO\",\"module\":\"parse\","
                    "\"msg\":\"say \\\"hi\\\"\\n\",\"at\":\"parser.cpp:12\"}\n");
}

TEST(RenderTest, JsonOmitsMissingLocation) {
    auto line = render(make_record(LogLevel::Debug, "q", "m"), LogFormat::Json);

    EXPECT_EQ(line.find("\"at\""), std::string::npos);
}

// ============================================================================
// LogFilter
// ============================================================================

TEST(LogFilterTest, DefaultsToWarn) {
    LogFilter filter;

    EXPECT_EQ(filter.fallback(), LogLevel::Warn);
    EXPECT_TRUE(filter.allows(LogLevel::Warn, "fmt"));
    EXPECT_FALSE(filter.allows(LogLevel::Info, "fmt"));
}

TEST(LogFilterTest, ModuleRuleAndFallback) {
    LogFilter filter;
    auto added = filter.parse("parse=debug,*=info");

    ASSERT_TRUE(is_ok(added));
    EXPECT_EQ(unwrap(added), 2u);
    EXPECT_TRUE(filter.allows(LogLevel::Debug, "parse"));
    EXPECT_FALSE(filter.allows(LogLevel::Trace, "parse"));
    EXPECT_TRUE(filter.allows(LogLevel::Info, "fmt"));
    EXPECT_FALSE(filter.allows(LogLevel::Debug, "fmt"));
}

TEST(LogFilterTest, OffSilencesModule) {
    LogFilter filter(LogLevel::Trace);
    ASSERT_TRUE(is_ok(filter.parse("cache=off")));

    EXPECT_FALSE(filter.allows(LogLevel::Fatal, "cache"));
    EXPECT_TRUE(filter.allows(LogLevel::Trace, "fmt"));
}

TEST(LogFilterTest, BareModuleMeansTrace) {
    LogFilter filter;
    ASSERT_TRUE(is_ok(filter.parse("query")));

    EXPECT_EQ(filter.threshold("query"), LogLevel::Trace);
    EXPECT_EQ(filter.threshold("fmt"), LogLevel::Warn);
}

TEST(LogFilterTest, LaterRuleReplacesEarlier) {
    LogFilter filter;
    ASSERT_TRUE(is_ok(filter.parse("parse=trace,parse=error")));

    EXPECT_EQ(filter.threshold("parse"), LogLevel::Error);
}

TEST(LogFilterTest, EmptyRulesAreSkipped) {
    LogFilter filter;
    auto added = filter.parse(",fmt=info,,");

    ASSERT_TRUE(is_ok(added));
    EXPECT_EQ(unwrap(added), 1u);
}

TEST(LogFilterTest, MalformedRuleKeepsEarlierRules) {
    LogFilter filter;
    auto added = filter.parse("fmt=info,parse=loud,cache=off");

    ASSERT_TRUE(is_err(added));
    EXPECT_NE(unwrap_err(added).find("parse=loud"), std::string::npos);
    EXPECT_EQ(filter.threshold("fmt"), LogLevel::Info);
    EXPECT_EQ(filter.threshold("cache"), LogLevel::Warn);
}

TEST(LogFilterTest, RuleWithoutModuleIsMalformed) {
    LogFilter filter;
    EXPECT_TRUE(is_err(filter.parse("=debug")));
}

TEST(LogFilterTest, LowestCoversEveryRule) {
    LogFilter filter;
    ASSERT_TRUE(is_ok(filter.parse("parse=trace,cache=error")));

    EXPECT_EQ(filter.lowest(), LogLevel::Trace);
}

// ============================================================================
// Sinks
// ============================================================================

TEST(StreamSinkTest, WritesRenderedRecord) {
    std::ostringstream out;
    StreamSink sink(out, LogFormat::Text);

    sink.write(make_record(LogLevel::Info, "fmt", "hello"));

    EXPECT_NE(out.str().find("INFO  [fmt] hello\n"), std::string::npos);
}

class FileSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = fs::temp_directory_path() / "cmscript_log_test.log";
        fs::remove(path_);
    }

    void TearDown() override {
        fs::remove(path_);
    }

    fs::path path_;
};

TEST_F(FileSinkTest, AppendsJsonLines) {
    {
        auto sink = FileSink::open(path_.string(), LogFormat::Json);
        ASSERT_TRUE(is_ok(sink));
        unwrap(sink)->write(make_record(LogLevel::Warn, "cache", "first"));
    }
    {
        auto sink = FileSink::open(path_.string(), LogFormat::Json);
        ASSERT_TRUE(is_ok(sink));
        unwrap(sink)->write(make_record(LogLevel::Warn, "cache", "second"));
    }

    auto content = read_all(path_);
    EXPECT_NE(content.find("\"msg\":\"first\""), std::string::npos);
    EXPECT_NE(content.find("\"msg\":\"second\""), std::string::npos);
}

TEST_F(FileSinkTest, TruncatesWithoutAppend) {
    std::ofstream(path_) << "old contents\n";

    {
        auto sink = FileSink::open(path_.string(), LogFormat::Text, false);
        ASSERT_TRUE(is_ok(sink));
        unwrap(sink)->write(make_record(LogLevel::Error, "fmt", "fresh"));
    }

    auto content = read_all(path_);
    EXPECT_EQ(content.find("old contents"), std::string::npos);
    EXPECT_NE(content.find("[fmt] fresh"), std::string::npos);
}

TEST_F(FileSinkTest, MissingDirectoryIsAnError) {
    auto sink = FileSink::open((path_ / "nested" / "x.log").string(), LogFormat::Text);

    ASSERT_TRUE(is_err(sink));
    EXPECT_NE(unwrap_err(sink).find("x.log"), std::string::npos);
}

// ============================================================================
// Logger
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogConfig config;
        config.level = LogLevel::Info;
        config.console = false;
        Logger::init(config);

        auto sink = std::make_unique<MemorySink>();
        memory_ = sink.get();
        Logger::instance().add_sink(std::move(sink));
    }

    void TearDown() override {
        Logger::init(LogConfig{});
    }

    MemorySink* memory_ = nullptr;
};

TEST_F(LoggerTest, MacroRecordsCallSite) {
    CMSCRIPT_LOG_INFO("fmt", "formatted " << 3 << " files");

    auto records = memory_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, LogLevel::Info);
    EXPECT_EQ(records[0].module, "fmt");
    EXPECT_EQ(records[0].message, "formatted 3 files");
    ASSERT_NE(records[0].file, nullptr);
    EXPECT_GT(records[0].line, 0);
}

TEST_F(LoggerTest, BelowThresholdIsNotBuilt) {
    int evaluated = 0;
    auto count = [&evaluated] { return ++evaluated; };

    CMSCRIPT_LOG_DEBUG("fmt", "value " << count());

    EXPECT_EQ(evaluated, 0);
    EXPECT_TRUE(memory_->records().empty());
}

TEST_F(LoggerTest, FilterRaisesOneModule) {
    ASSERT_TRUE(is_ok(Logger::instance().set_filter("parse=trace")));

    CMSCRIPT_LOG_TRACE("parse", "token");
    CMSCRIPT_LOG_TRACE("fmt", "hidden");

    auto records = memory_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].module, "parse");
}

TEST_F(LoggerTest, SetLevelKeepsModuleRules) {
    ASSERT_TRUE(is_ok(Logger::instance().set_filter("cache=off")));
    Logger::instance().set_level(LogLevel::Trace);

    EXPECT_TRUE(Logger::instance().enabled(LogLevel::Trace, "fmt"));
    EXPECT_FALSE(Logger::instance().enabled(LogLevel::Error, "cache"));
}

TEST_F(LoggerTest, ConcurrentWritesAreAllKept) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < 50; ++i) {
                CMSCRIPT_LOG_WARN("worker", "thread " << t << " item " << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(memory_->records().size(), 200u);
}

TEST(LoggerInitTest, ReportsProblems) {
    LogConfig config;
    config.console = false;
    config.filter = "fmt=shout";
    config.file = "/nonexistent-dir/cmscript.log";
    config.problems.push_back("unknown log level 'x'");

    auto problems = Logger::init(config);
    Logger::init(LogConfig{});

    ASSERT_EQ(problems.size(), 3u);
    EXPECT_EQ(problems[0], "unknown log level 'x'");
    EXPECT_NE(problems[1].find("fmt=shout"), std::string::npos);
    EXPECT_NE(problems[2].find("cmscript.log"), std::string::npos);
}

// ============================================================================
// Command Line Options
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("CMSCRIPT_LOG");
    }

    void TearDown() override {
        unsetenv("CMSCRIPT_LOG");
    }

    auto parse(std::vector<std::string> args) -> LogConfig {
        args.insert(args.begin(), "cmscript");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parse_log_options(static_cast<int>(argv.size()), argv.data());
    }
};

TEST_F(LogOptionsTest, DefaultsToWarnText) {
    auto config = parse({"fmt", "."});

    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_EQ(config.format, LogFormat::Text);
    EXPECT_TRUE(config.filter.empty());
    EXPECT_TRUE(config.problems.empty());
}

TEST_F(LogOptionsTest, ValueOptions) {
    auto config = parse({"--log-level=debug", "--log-filter=parse=trace",
                         "--log-file=/tmp/cm.log", "--log-format=json"});

    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_EQ(config.filter, "parse=trace");
    EXPECT_EQ(config.file, "/tmp/cm.log");
    EXPECT_EQ(config.format, LogFormat::Json);
}

TEST_F(LogOptionsTest, VerbosityFlags) {
    EXPECT_EQ(parse({"-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"--verbose"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"-v", "-vv"}).level, LogLevel::Debug);
}

TEST_F(LogOptionsTest, ExplicitLevelBeatsQuietAndVerbose) {
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
    EXPECT_EQ(parse({"-q", "-vv"}).level, LogLevel::Error);
    EXPECT_EQ(parse({"-vv", "--log-level=warn"}).level, LogLevel::Warn);
}

TEST_F(LogOptionsTest, BadValuesBecomeProblems) {
    auto config = parse({"--log-level=loud", "--log-format=xml"});

    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_EQ(config.format, LogFormat::Text);
    ASSERT_EQ(config.problems.size(), 2u);
    EXPECT_NE(config.problems[0].find("loud"), std::string::npos);
    EXPECT_NE(config.problems[1].find("xml"), std::string::npos);
}

TEST_F(LogOptionsTest, EnvironmentLevel) {
    setenv("CMSCRIPT_LOG", "debug", 1);

    EXPECT_EQ(parse({"fmt"}).level, LogLevel::Debug);
}

TEST_F(LogOptionsTest, EnvironmentRules) {
    setenv("CMSCRIPT_LOG", "parse=trace,cache", 1);

    auto config = parse({"fmt"});
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_EQ(config.filter, "parse=trace,cache");
}

TEST_F(LogOptionsTest, CommandLineHidesEnvironment) {
    setenv("CMSCRIPT_LOG", "trace", 1);

    EXPECT_EQ(parse({"-v"}).level, LogLevel::Info);
}

TEST(IsLogOptionTest, RecognizesLoggingFlags) {
    EXPECT_TRUE(is_log_option("-v"));
    EXPECT_TRUE(is_log_option("-vvv"));
    EXPECT_TRUE(is_log_option("--verbose"));
    EXPECT_TRUE(is_log_option("-q"));
    EXPECT_TRUE(is_log_option("--log-filter=fmt"));
    EXPECT_FALSE(is_log_option("--check"));
    EXPECT_FALSE(is_log_option("-"));
    EXPECT_FALSE(is_log_option("src/CMakeLists.txt"));
}
