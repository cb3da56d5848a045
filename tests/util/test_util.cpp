// CHAMA - Util Module Tests
// Copyright (c) 2024 CHAMA Developers
// MIT License

#include <gtest/gtest.h>

#include <chama/util/logging.h>
#include <chama/util/time.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

namespace chama {
namespace util {
namespace {

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
        Logger::Instance().EnableAllCategories();
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
        Logger::Instance().EnableAllCategories();
    }

    std::shared_ptr<CallbackSink> Capture(LogLevel level = LogLevel::Trace) {
        auto sink = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { captured_.push_back(entry); }, level);
        Logger::Instance().AddSink(sink);
        return sink;
    }

    std::vector<LogEntry> captured_;
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelToString(LogLevel::Info), "INFO");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
    EXPECT_STREQ(LogLevelToString(LogLevel::Fatal), "FATAL");
    EXPECT_STREQ(LogLevelToString(LogLevel::Off), "OFF");
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("none"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("invalid"), LogLevel::Info); // Default
}

TEST_F(LoggingTest, LoggerSingleton) {
    EXPECT_EQ(&Logger::Instance(), &Logger::Instance());
}

TEST_F(LoggingTest, LoggerAddRemoveSink) {
    auto& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 0u);

    auto sink = std::make_shared<ConsoleSink>();
    logger.AddSink(sink);
    EXPECT_EQ(logger.SinkCount(), 1u);

    logger.RemoveSink(sink);
    EXPECT_EQ(logger.SinkCount(), 0u);
}

TEST_F(LoggingTest, LoggerWillLog) {
    auto& logger = Logger::Instance();

    EXPECT_FALSE(logger.WillLog(LogLevel::Debug, LogCategory::GROUP));
    EXPECT_TRUE(logger.WillLog(LogLevel::Info, LogCategory::GROUP));
    EXPECT_TRUE(logger.WillLog(LogLevel::Error, LogCategory::GROUP));
    EXPECT_FALSE(logger.WillLog(LogLevel::Off, LogCategory::GROUP));

    logger.SetLevel(LogLevel::Off);
    EXPECT_FALSE(logger.WillLog(LogLevel::Fatal, LogCategory::GROUP));
}

TEST_F(LoggingTest, LoggerCategoryFiltering) {
    auto& logger = Logger::Instance();

    logger.DisableAllCategories();
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::PAYOUT));

    logger.EnableCategory(LogCategory::PAYOUT);
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::PAYOUT));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::GOV));

    logger.DisableCategory(LogCategory::PAYOUT);
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::PAYOUT));

    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::GOV));
}

TEST_F(LoggingTest, StreamMacroCarriesCategoryAndLocation) {
    Capture();

    LOG_WARN(LogCategory::PUNISH) << "member " << 7 << " banned";

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].level, LogLevel::Warn);
    EXPECT_EQ(captured_[0].category, "punish");
    EXPECT_EQ(captured_[0].message, "member 7 banned");
    EXPECT_EQ(GetBasename(captured_[0].file), "test_util.cpp");
    EXPECT_GT(captured_[0].line, 0);
}

TEST_F(LoggingTest, FilteredMessagesAreDropped) {
    Capture();

    LOG_DEBUG(LogCategory::CONTRIB) << "hidden";
    Logger::Instance().DisableAllCategories();
    Logger::Instance().EnableCategory(LogCategory::GOV);
    LOG_INFO(LogCategory::CONTRIB) << "hidden";
    LOG_INFO(LogCategory::GOV) << "shown";

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "shown");
}

TEST_F(LoggingTest, PrintfStyle) {
    Capture();
    LogInfoF(LogCategory::PAYOUT, "period %d paid %s", 3, "0.40000000");

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "period 3 paid 0.40000000");
}

TEST_F(LoggingTest, SinkLevelFiltersIndependently) {
    Logger::Instance().SetLevel(LogLevel::Trace);
    Capture(LogLevel::Error);

    LOG_INFO(LogCategory::GROUP) << "info";
    LOG_ERROR(LogCategory::GROUP) << "error";

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "error");
}

TEST_F(LoggingTest, FileSinkWritesEntries) {
    const std::string path = "/tmp/chama_log_test_" + std::to_string(GetTime()) + ".log";
    {
        auto sink = std::make_shared<FileSink>(path);
        ASSERT_TRUE(sink->IsOpen());
        Logger::Instance().AddSink(sink);
        LOG_INFO(LogCategory::REGISTRY) << "group created";
        Logger::Instance().ClearSinks();
    }

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("[INFO ] [registry]"), std::string::npos);
    EXPECT_NE(content.str().find("group created"), std::string::npos);
    std::remove(path.c_str());
}

TEST_F(LoggingTest, FileSinkFlushesWarningsImmediately) {
    const std::string path = "/tmp/chama_log_warn_" + std::to_string(GetTime()) + ".log";
    auto sink = std::make_shared<FileSink>(path, LogLevel::Info);
    ASSERT_TRUE(sink->IsOpen());
    Logger::Instance().SetLevel(LogLevel::Debug);
    Logger::Instance().AddSink(sink);

    LOG_DEBUG(LogCategory::PUNISH) << "below sink level";
    LOG_WARN(LogCategory::PUNISH) << "member banned";

    // Still attached and unflushed by the caller
    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("[WARN ] [punish] member banned"), std::string::npos);
    EXPECT_NE(content.str().find("test_util.cpp:"), std::string::npos);
    EXPECT_EQ(content.str().find("below sink level"), std::string::npos);

    Logger::Instance().ClearSinks();
    std::remove(path.c_str());
}

TEST_F(LoggingTest, Helpers) {
    EXPECT_EQ(FixedWidth("INFO", 5), "INFO ");
    EXPECT_EQ(FixedWidth("TOOLONG", 3), "TOO");
    EXPECT_EQ(GetBasename("/a/b/c.cpp"), "c.cpp");
    EXPECT_EQ(GetBasename("c.cpp"), "c.cpp");
}

// ============================================================================
// Time Tests
// ============================================================================

class TimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        DisableMockTime();
    }

    void TearDown() override {
        DisableMockTime();
    }
};

TEST_F(TimeTest, GetTime) {
    int64_t time1 = GetTime();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    int64_t time2 = GetTime();

    EXPECT_GT(time1, 1600000000);
    EXPECT_GE(time2, time1);
}

TEST_F(TimeTest, MockTime) {
    EnableMockTime();
    EXPECT_TRUE(IsMockTimeEnabled());

    SetMockTime(1700000000);
    EXPECT_EQ(GetTime(), 1700000000);
    EXPECT_EQ(ToUnixTime(GetSystemTime()), 1700000000);

    AdvanceMockTime(SECONDS_PER_DAY);
    EXPECT_EQ(GetTime(), 1700000000 + SECONDS_PER_DAY);
    EXPECT_EQ(GetMockTime(), GetTime());

    DisableMockTime();
    EXPECT_FALSE(IsMockTimeEnabled());
    EXPECT_NE(GetTime(), 1700000000 + SECONDS_PER_DAY);
}

TEST_F(TimeTest, UnixTimeConversion) {
    EXPECT_EQ(ToUnixTime(FromUnixTime(1700000000)), 1700000000);
}

TEST_F(TimeTest, FormatISO8601) {
    EXPECT_EQ(FormatISO8601(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(FormatISO8601(1700000000), "2023-11-14T22:13:20Z");
}

TEST_F(TimeTest, ParseISO8601) {
    EXPECT_EQ(ParseISO8601("2023-11-14T22:13:20Z"), 1700000000);
    EXPECT_EQ(ParseISO8601("2023-11-14T22:13:20"), 1700000000);
    EXPECT_EQ(ParseISO8601("2023-11-14 22:13:20"), 1700000000);
    EXPECT_EQ(ParseISO8601("2023-11-14"), 1699920000);
    EXPECT_FALSE(ParseISO8601("next week").has_value());
    EXPECT_FALSE(ParseISO8601("2023-11-14T22:13:20+02").has_value());
}

TEST_F(TimeTest, FormatDuration) {
    EXPECT_EQ(FormatDuration(0), "0s");
    EXPECT_EQ(FormatDuration(59), "59s");
    EXPECT_EQ(FormatDuration(SECONDS_PER_DAY + 2 * SECONDS_PER_HOUR), "1d 2h");
    EXPECT_EQ(FormatDuration(3661), "1h 1m 1s");
    EXPECT_EQ(FormatDuration(-90), "-1m 30s");
}

TEST_F(TimeTest, ParseDuration) {
    EXPECT_EQ(ParseDuration("45"), 45);
    EXPECT_EQ(ParseDuration("45s"), 45);
    EXPECT_EQ(ParseDuration("90m"), 5400);
    EXPECT_EQ(ParseDuration("6H"), 6 * SECONDS_PER_HOUR);
    EXPECT_EQ(ParseDuration("3d"), 3 * SECONDS_PER_DAY);
    EXPECT_EQ(ParseDuration("2w"), 2 * SECONDS_PER_WEEK);

    EXPECT_FALSE(ParseDuration("").has_value());
    EXPECT_FALSE(ParseDuration("d").has_value());
    EXPECT_FALSE(ParseDuration("-1d").has_value());
    EXPECT_FALSE(ParseDuration("1y").has_value());
    EXPECT_FALSE(ParseDuration("1.5d").has_value());
    EXPECT_FALSE(ParseDuration("99999999999999999999").has_value());
}

} // namespace
} // namespace util
} // namespace chama
