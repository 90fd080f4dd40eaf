// ZKVOTE - Util Module Tests
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#include <gtest/gtest.h>

#include <zkvote/util/config.h>
#include <zkvote/util/logging.h>
#include <zkvote/util/time.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace zkvote {
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
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("off"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("invalid"), LogLevel::Info);
}

TEST_F(LoggingTest, LoggerAddRemoveSink) {
    auto& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 0u);

    auto sink = Capture();
    EXPECT_EQ(logger.SinkCount(), 1u);

    logger.RemoveSink(sink);
    EXPECT_EQ(logger.SinkCount(), 0u);
}

TEST_F(LoggingTest, LevelFiltering) {
    Capture();
    auto& logger = Logger::Instance();

    EXPECT_FALSE(logger.WillLog(LogLevel::Debug, LogCategory::BALLOT));
    logger.Log(LogLevel::Debug, LogCategory::BALLOT, "dropped");
    logger.Log(LogLevel::Warn, LogCategory::BALLOT, "kept");

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "kept");
    EXPECT_EQ(captured_[0].level, LogLevel::Warn);
    EXPECT_EQ(captured_[0].category, LogCategory::BALLOT);
}

TEST_F(LoggingTest, SinkLevelFiltering) {
    Capture(LogLevel::Error);
    Logger::Instance().Log(LogLevel::Info, LogCategory::LEDGER, "below sink level");
    Logger::Instance().Log(LogLevel::Error, LogCategory::LEDGER, "store failed");
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "store failed");
}

TEST_F(LoggingTest, CategoryFiltering) {
    Capture();
    auto& logger = Logger::Instance();

    logger.EnableCategory(LogCategory::TALLY);
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::TALLY));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::VERIFY));

    logger.Log(LogLevel::Info, LogCategory::VERIFY, "hidden");
    logger.Log(LogLevel::Info, LogCategory::TALLY, "shown");
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "shown");

    logger.DisableCategory(LogCategory::TALLY);
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::TALLY));

    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::VERIFY));
}

TEST_F(LoggingTest, StreamAndFormatMacros) {
    Capture();
    LOG_INFO(LogCategory::REGISTRY) << "proposal " << 7 << " created";
    LogWarnF(LogCategory::CONFIG, "%s=%d", "dbcache", 0);
    LOG_DEBUG(LogCategory::REGISTRY) << "not emitted";

    ASSERT_EQ(captured_.size(), 2u);
    EXPECT_EQ(captured_[0].message, "proposal 7 created");
    EXPECT_GT(captured_[0].line, 0);
    EXPECT_EQ(GetBasename(captured_[0].file), "test_util.cpp");
    EXPECT_EQ(captured_[1].message, "dbcache=0");
}

TEST_F(LoggingTest, FileSinkWritesLines) {
    std::string path = "/tmp/zkvote_log_test_" + std::to_string(::getpid()) + ".log";
    std::remove(path.c_str());
    {
        FileSink::Config config;
        config.path = path;
        config.autoFlush = true;
        auto sink = std::make_shared<FileSink>(config);
        ASSERT_TRUE(sink->IsOpen());
        Logger::Instance().AddSink(sink);
        LOG_INFO(LogCategory::DB) << "opened ballots";
        Logger::Instance().ClearSinks();
    }

    std::ifstream in(path);
    std::string line;
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_NE(line.find("[INFO]"), std::string::npos);
    EXPECT_NE(line.find("[db]"), std::string::npos);
    EXPECT_NE(line.find("opened ballots"), std::string::npos);
    std::remove(path.c_str());
}

TEST_F(LoggingTest, FileSinkUnopenablePath) {
    FileSink::Config config;
    config.path = "/nonexistent-dir/zkvote/debug.log";
    FileSink sink(config);
    EXPECT_FALSE(sink.IsOpen());
}

TEST_F(LoggingTest, InitFromConfig) {
    ConfigManager config;
    config.Set(ConfigKeys::PRINTTOCONSOLE, "0");
    config.Set(ConfigKeys::LOGLEVEL, "warn");
    InitLoggingFromConfig(config);
    EXPECT_EQ(Logger::Instance().GetLevel(), LogLevel::Warn);
    EXPECT_EQ(Logger::Instance().SinkCount(), 0u);

    // A category list narrows output and lowers the level to debug
    config.Set(ConfigKeys::DEBUG, "tally,verify");
    InitLoggingFromConfig(config);
    EXPECT_EQ(Logger::Instance().GetLevel(), LogLevel::Debug);
    EXPECT_TRUE(Logger::Instance().IsCategoryEnabled(LogCategory::TALLY));
    EXPECT_FALSE(Logger::Instance().IsCategoryEnabled(LogCategory::DB));

    config.Set(ConfigKeys::DEBUG, "1");
    config.Set(ConfigKeys::PRINTTOCONSOLE, "1");
    InitLoggingFromConfig(config);
    EXPECT_TRUE(Logger::Instance().IsCategoryEnabled(LogCategory::DB));
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
}

TEST_F(LoggingTest, Helpers) {
    EXPECT_EQ(GetBasename("/a/b/engine.cpp"), "engine.cpp");
    EXPECT_EQ(GetBasename("engine.cpp"), "engine.cpp");

    std::string stamp = FormatLogTimestamp(FromUnixTime(1704067200));
    EXPECT_EQ(stamp.size(), std::string("2024-01-01 00:00:00.000").size());
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

    EXPECT_GE(time2, time1);
    EXPECT_GT(time1, 0);
    EXPECT_GE(GetTimeMillis() / 1000, time1);
}

TEST_F(TimeTest, MockTime) {
    EXPECT_FALSE(IsMockTimeEnabled());

    EnableMockTime();
    EXPECT_TRUE(IsMockTimeEnabled());

    SetMockTime(1000);
    EXPECT_EQ(GetTime(), 1000);
    EXPECT_EQ(GetTimeMillis(), 1000000);

    AdvanceMockTime(Seconds{100});
    EXPECT_EQ(GetTime(), 1100);

    DisableMockTime();
    EXPECT_FALSE(IsMockTimeEnabled());
    EXPECT_GT(GetTime(), 1100);
}

TEST_F(TimeTest, FormatISO8601) {
    EXPECT_EQ(FormatISO8601(1704067200), "2024-01-01T00:00:00Z");
    EXPECT_EQ(FormatISO8601(0), "1970-01-01T00:00:00Z");
}

TEST_F(TimeTest, FormatDuration) {
    EXPECT_EQ(FormatDuration(Seconds{0}), "0s");
    EXPECT_EQ(FormatDuration(Seconds{45}), "45s");
    EXPECT_EQ(FormatDuration(Seconds{90}), "1m 30s");
    EXPECT_EQ(FormatDuration(Seconds{3661}), "1h 1m 1s");
    EXPECT_EQ(FormatDuration(Seconds{90061}), "1d 1h 1m 1s");
    EXPECT_EQ(FormatDuration(Seconds{-60}), "-1m 0s");
}

TEST_F(TimeTest, ParseDuration) {
    EXPECT_EQ(ParseDuration("3600"), std::optional<int64_t>(3600));
    EXPECT_EQ(ParseDuration("30s"), std::optional<int64_t>(30));
    EXPECT_EQ(ParseDuration("15m"), std::optional<int64_t>(900));
    EXPECT_EQ(ParseDuration("2H"), std::optional<int64_t>(7200));
    EXPECT_EQ(ParseDuration("7d"), std::optional<int64_t>(604800));

    EXPECT_FALSE(ParseDuration("").has_value());
    EXPECT_FALSE(ParseDuration("h").has_value());
    EXPECT_FALSE(ParseDuration("-5").has_value());
    EXPECT_FALSE(ParseDuration("5w").has_value());
    EXPECT_FALSE(ParseDuration("5hm").has_value());
    EXPECT_FALSE(ParseDuration("99999999999999999999").has_value());
    EXPECT_FALSE(ParseDuration("9223372036854775807d").has_value());
}

} // namespace
} // namespace util
} // namespace zkvote
