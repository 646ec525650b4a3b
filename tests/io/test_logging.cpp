/**
 * @file test_logging.cpp
 * @brief Tests for Console, LogEntry and LogService
 */

#include <gtest/gtest.h>

#include <philbrick/io/Console.hpp>
#include <philbrick/io/LogService.hpp>

#include <string>
#include <thread>
#include <vector>

using namespace philbrick;

// =============================================================================
// Console Tests
// =============================================================================

TEST(Console, ColorCanBeDisabled) {
    Console console(false);
    EXPECT_FALSE(console.IsColorEnabled());
    EXPECT_EQ(console.Colorize("test", ansi::kRed), "test");
    EXPECT_EQ(console.Tag(LogLevel::Warning), "[WRN]");
}

TEST(Console, ColorizeWrapsWhenEnabled) {
    Console console;
    console.SetColorEnabled(true);
    EXPECT_EQ(console.Colorize("test", ansi::kRed),
              std::string(ansi::kRed) + "test" + ansi::kReset);
    EXPECT_EQ(console.Tag(LogLevel::Error),
              std::string(ansi::kRed) + "[ERR]" + ansi::kReset);
}

TEST(Console, PadRight) {
    EXPECT_EQ(Console::PadRight("abc", 6), "abc   ");
    EXPECT_EQ(Console::PadRight("abcdef", 3), "abcdef");
}

TEST(Console, PadLeft) {
    EXPECT_EQ(Console::PadLeft("abc", 6), "   abc");
    EXPECT_EQ(Console::PadLeft("abcdef", 3), "abcdef");
}

TEST(Console, FormatNumber) {
    EXPECT_EQ(Console::FormatNumber(3.14159, 2), "3.14");
    EXPECT_EQ(Console::FormatNumber(-1.0), "-1.0000");
}

TEST(Console, Rule) {
    EXPECT_EQ(Console::Rule(5, '='), "=====");
    EXPECT_EQ(Console::Rule(3), "---");
}

TEST(Console, LevelTags) {
    EXPECT_STREQ(StyleOf(LogLevel::Trace).tag, "[TRC]");
    EXPECT_STREQ(StyleOf(LogLevel::Info).tag, "[INF]");
    EXPECT_STREQ(StyleOf(LogLevel::Event).tag, "[EVT]");
    EXPECT_STREQ(StyleOf(LogLevel::Warning).tag, "[WRN]");
    EXPECT_STREQ(StyleOf(LogLevel::Fatal).tag, "[FTL]");
}

// =============================================================================
// LogEntry / LogContext Tests
// =============================================================================

TEST(LogContext, Path) {
    LogContext ctx;
    EXPECT_TRUE(ctx.Empty());

    ctx.circuit = "osc";
    EXPECT_EQ(ctx.Path(), "osc");
    ctx.component = "INT1";
    EXPECT_EQ(ctx.Path(), "osc.INT1");
    ctx.circuit.clear();
    EXPECT_EQ(ctx.Path(), "INT1");
}

TEST(LogEntry, FormatIncludesTimeLevelAndContext) {
    LogEntry entry{LogLevel::Warning, 1.25, "saturated", LogContext{"osc", "INT1"}};
    EXPECT_EQ(entry.Format(), "[1.250] [WRN] [osc.INT1] saturated");
    EXPECT_EQ(entry.Format(false), "[1.250] [WRN] saturated");
}

TEST(LogEntry, FormatOmitsEmptyContext) {
    LogEntry entry{LogLevel::Info, 0.0, "built", LogContext{}};
    EXPECT_EQ(entry.Format(), "[0.000] [INF] built");
}

TEST(ScopedLogContext, RestoresOnExit) {
    LogContext::Current() = LogContext{};
    {
        ScopedLogContext outer("osc", "");
        EXPECT_EQ(LogContext::Current().circuit, "osc");
        {
            ScopedLogContext inner("", "SM1");
            EXPECT_EQ(LogContext::Current().circuit, "osc");
            EXPECT_EQ(LogContext::Current().component, "SM1");
        }
        EXPECT_TRUE(LogContext::Current().component.empty());
    }
    EXPECT_TRUE(LogContext::Current().Empty());
}

TEST(ScopedLogContext, IsPerThread) {
    ScopedLogContext ctx("osc", "INT1");
    LogContext seen{"unset", "unset"};
    std::thread worker([&seen] { seen = LogContext::Current(); });
    worker.join();
    EXPECT_TRUE(seen.Empty());
    EXPECT_EQ(LogContext::Current().Path(), "osc.INT1");
}

// =============================================================================
// LogService Tests
// =============================================================================

class LogServiceTest : public ::testing::Test {
  protected:
    void SetUp() override { service.AddSink(LogSinks::Collect(collected)); }

    LogService service;
    std::vector<LogEntry> collected;
};

TEST_F(LogServiceTest, DeliversRightAwayWhenNotBuffering) {
    EXPECT_FALSE(service.IsBuffering());
    service.Log(LogLevel::Info, 0.0, "hello");
    ASSERT_EQ(collected.size(), 1u);
    EXPECT_EQ(collected[0].message, "hello");
    EXPECT_EQ(service.PendingCount(), 0u);
}

TEST_F(LogServiceTest, MinLevelDropsBelow) {
    EXPECT_EQ(service.MinLevel(), LogLevel::Info);
    service.Log(LogLevel::Debug, 0.0, "dropped");
    service.Log(LogLevel::Trace, 0.0, "dropped");
    service.Log(LogLevel::Warning, 0.0, "kept");
    ASSERT_EQ(collected.size(), 1u);
    EXPECT_EQ(collected[0].level, LogLevel::Warning);

    service.SetMinLevel(LogLevel::Trace);
    service.Log(LogLevel::Debug, 0.0, "now kept");
    EXPECT_EQ(collected.size(), 2u);
}

TEST_F(LogServiceTest, SinkMinLevelFilters) {
    std::vector<LogEntry> errors_only;
    service.AddSink(LogSinks::Collect(errors_only), LogLevel::Error);

    service.Log(LogLevel::Info, 0.0, "info");
    service.Log(LogLevel::Error, 0.0, "error");

    EXPECT_EQ(collected.size(), 2u);
    ASSERT_EQ(errors_only.size(), 1u);
    EXPECT_EQ(errors_only[0].message, "error");
}

TEST_F(LogServiceTest, BufferedScopeFlushesOnExit) {
    {
        LogService::BufferedScope scope(service);
        EXPECT_TRUE(service.IsBuffering());
        service.Log(LogLevel::Event, 0.1, "a");
        service.Log(LogLevel::Event, 0.2, "b");
        EXPECT_EQ(service.PendingCount(), 2u);
        EXPECT_TRUE(collected.empty());
    }
    EXPECT_FALSE(service.IsBuffering());
    EXPECT_EQ(service.PendingCount(), 0u);
    ASSERT_EQ(collected.size(), 2u);
    EXPECT_EQ(collected[1].message, "b");
    EXPECT_DOUBLE_EQ(collected[1].time, 0.2);
}

TEST_F(LogServiceTest, DiscardDropsPending) {
    {
        LogService::BufferedScope scope(service);
        service.Log(LogLevel::Info, 0.0, "x");
        service.Discard();
    }
    EXPECT_TRUE(collected.empty());
}

TEST_F(LogServiceTest, CountsErrorsAndFatals) {
    service.Log(LogLevel::Warning, 0.0, "w");
    service.Log(LogLevel::Error, 0.0, "e1");
    service.Log(LogLevel::Error, 0.0, "e2");
    service.Log(LogLevel::Fatal, 0.0, "f");
    EXPECT_EQ(service.ErrorCount(), 3u);

    service.ResetErrorCount();
    EXPECT_EQ(service.ErrorCount(), 0u);
}

TEST_F(LogServiceTest, UsesThreadContext) {
    ScopedLogContext ctx("osc", "INT1");
    service.Log(LogLevel::Info, 0.0, "msg");
    ASSERT_EQ(collected.size(), 1u);
    EXPECT_EQ(collected[0].context.Path(), "osc.INT1");
}

TEST_F(LogServiceTest, ExplicitContextOverridesThread) {
    ScopedLogContext ctx("osc", "INT1");
    service.Log(LogLevel::Info, 0.0, "msg", LogContext{"loader", "a.yaml"});
    ASSERT_EQ(collected.size(), 1u);
    EXPECT_EQ(collected[0].context.Path(), "loader.a.yaml");
}
