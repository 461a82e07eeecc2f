//! # Logger Tests
//!
//! Module filter parsing, CLI option extraction, record formatting and the
//! build engine's log output through a capture sink.

#include "../common/temp_project.hpp"
#include "compiler/compiler.hpp"
#include "log/log.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace loom::log;

// ============================================================================
// LogFilter
// ============================================================================

TEST(LogFilterTest, ModuleLevelsAndDefault) {
    LogFilter filter;
    filter.parse("resolve=trace,build=warn,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "resolve"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "build"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "build"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "config"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "config"));
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST(LogFilterTest, BareModuleEnablesEverything) {
    LogFilter filter;
    filter.parse("build");
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "build"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "resolve"));
}

TEST(LogFilterTest, OffSilencesModule) {
    LogFilter filter;
    filter.parse("resolve=off");
    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "resolve"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "build"));
}

// ============================================================================
// CLI Options
// ============================================================================

TEST(LogOptionsTest, VerbosityFlags) {
    char prog[] = "loom";
    char build[] = "build";
    char vv[] = "-vv";
    char* argv[] = {prog, build, vv};
    auto config = parse_log_options(3, argv);
    EXPECT_EQ(config.level, LogLevel::Debug);
}

TEST(LogOptionsTest, ExplicitLevelBeatsVerbosity) {
    char prog[] = "loom";
    char v[] = "-vvv";
    char level[] = "--log-level=error";
    char filter[] = "--log-filter=build=debug";
    char format[] = "--log-format=json";
    char* argv[] = {prog, v, level, filter, format};
    auto config = parse_log_options(5, argv);
    EXPECT_EQ(config.level, LogLevel::Error);
    EXPECT_EQ(config.filter_spec, "build=debug");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST(LogOptionsTest, RecognizesOnlyLogOptions) {
    EXPECT_TRUE(is_log_option("-v"));
    EXPECT_TRUE(is_log_option("-vvv"));
    EXPECT_TRUE(is_log_option("--quiet"));
    EXPECT_TRUE(is_log_option("--log-file=build.log"));
    EXPECT_FALSE(is_log_option("--json"));
    EXPECT_FALSE(is_log_option("-V"));
    EXPECT_FALSE(is_log_option("build"));
}

// ============================================================================
// Formatting
// ============================================================================

TEST(LogFormatTest, JsonEscapesMessage) {
    LogRecord record{LogLevel::Warn, "resolve", "cannot resolve \"x\"\nfrom a", __FILE__,
                     __LINE__, 1234};
    EXPECT_EQ(format_json(record), "{\"ts\":1234,\"level\":\"WARN\",\"module\":\"resolve\","
                                   "\"msg\":\"cannot resolve \\\"x\\\"\\nfrom a\"}\n");
}

TEST(LogFormatTest, TextContainsLevelAndModule) {
    LogRecord record{LogLevel::Info, "build", "done", __FILE__, __LINE__, epoch_ms()};
    auto line = format_text(record);
    EXPECT_NE(line.find("INFO  [build] done\n"), std::string::npos);
}

// ============================================================================
// Engine Output
// ============================================================================

namespace {

struct Captured {
    std::mutex mutex;
    std::vector<std::pair<std::string, std::string>> records;
};

class CaptureSink : public LogSink {
public:
    explicit CaptureSink(std::shared_ptr<Captured> out) : out_(std::move(out)) {}

    void write(const LogRecord& record) override {
        std::lock_guard<std::mutex> lock(out_->mutex);
        out_->records.emplace_back(std::string(record.module), record.message);
    }
    void flush() override {}

private:
    std::shared_ptr<Captured> out_;
};

} // namespace

class EngineLogTest : public ::testing::Test {
protected:
    std::shared_ptr<Captured> captured = std::make_shared<Captured>();

    void SetUp() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.add_sink(std::make_unique<CaptureSink>(captured));
        logger.set_level(LogLevel::Info);
    }

    void TearDown() override {
        LogConfig config;
        config.level = LogLevel::Warn;
        Logger::init(config);
    }

    auto messages(const std::string& module) -> std::vector<std::string> {
        std::lock_guard<std::mutex> lock(captured->mutex);
        std::vector<std::string> out;
        for (const auto& [mod, message] : captured->records) {
            if (mod == module)
                out.push_back(message);
        }
        return out;
    }
};

TEST_F(EngineLogTest, BuildReportsModuleCount) {
    loom::test::TempProject project;
    loom::test::write_normal_project(project);

    auto compiler = loom::Compiler::create(project.root());
    ASSERT_TRUE(loom::is_ok(compiler));
    ASSERT_TRUE(loom::is_ok(loom::unwrap(compiler)->build()));

    auto build = messages("build");
    ASSERT_FALSE(build.empty());
    EXPECT_EQ(build.front(), "module count: 4");
}

TEST_F(EngineLogTest, FailedBuildLogsError) {
    loom::test::TempProject project;
    project.write("index.ts", "import './nope';\n");

    auto compiler = loom::Compiler::create(project.root());
    ASSERT_TRUE(loom::is_ok(compiler));
    ASSERT_TRUE(loom::is_err(loom::unwrap(compiler)->build()));

    auto build = messages("build");
    ASSERT_EQ(build.size(), 1u);
    EXPECT_EQ(build[0].rfind("ResolveError", 0), 0u);
}

TEST_F(EngineLogTest, DebugOutputHiddenAtInfo) {
    LOOM_LOG_DEBUG("build", "hidden");
    LOOM_LOG_INFO("build", "shown " << 42);
    EXPECT_EQ(messages("build"), std::vector<std::string>{"shown 42"});
}
