// STAKEVOTE - Util Module Tests
// Copyright (c) 2024 STAKEVOTE Developers
// MIT License

#include <gtest/gtest.h>

#include <stakevote/util/logging.h>
#include <stakevote/util/time.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace stakevote {
namespace util {
namespace {

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Clear any existing sinks
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
        Logger::Instance().EnableAllCategories();
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
        Logger::Instance().EnableAllCategories();
    }

    std::shared_ptr<CallbackSink> Capture(std::vector<LogEntry>& entries,
                                          LogLevel level = LogLevel::Trace) {
        auto sink = std::make_shared<CallbackSink>(
            [&entries](const LogEntry& entry) { entries.push_back(entry); }, level);
        Logger::Instance().AddSink(sink);
        return sink;
    }
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelToString(LogLevel::Info), "INFO");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
    EXPECT_STREQ(LogLevelToString(LogLevel::Fatal), "FATAL");
}

TEST_F(LoggingTest, ParseLogLevel) {
    LogLevel level = LogLevel::Info;
    EXPECT_TRUE(ParseLogLevel("trace", level));
    EXPECT_EQ(level, LogLevel::Trace);
    EXPECT_TRUE(ParseLogLevel("DEBUG", level));
    EXPECT_EQ(level, LogLevel::Debug);
    EXPECT_TRUE(ParseLogLevel("warning", level));
    EXPECT_EQ(level, LogLevel::Warn);
    EXPECT_TRUE(ParseLogLevel("Error", level));
    EXPECT_EQ(level, LogLevel::Error);

    EXPECT_FALSE(ParseLogLevel("invalid", level));
    EXPECT_EQ(level, LogLevel::Error);  // Unchanged
}

TEST_F(LoggingTest, LoggerSingleton) {
    auto& logger1 = Logger::Instance();
    auto& logger2 = Logger::Instance();
    EXPECT_EQ(&logger1, &logger2);
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
    logger.SetLevel(LogLevel::Info);

    EXPECT_FALSE(logger.WillLog(LogLevel::Debug, LogCategory::DEFAULT));
    EXPECT_TRUE(logger.WillLog(LogLevel::Info, LogCategory::DEFAULT));
    EXPECT_TRUE(logger.WillLog(LogLevel::Error, LogCategory::VOTING));
    EXPECT_FALSE(logger.WillLog(LogLevel::Off, LogCategory::DEFAULT));
}

TEST_F(LoggingTest, LoggerCategoryFiltering) {
    auto& logger = Logger::Instance();

    logger.EnableCategory(LogCategory::VOTING);
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::VOTING));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::LEDGER));

    logger.DisableCategory(LogCategory::VOTING);
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::VOTING));

    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::VOTING));
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::LEDGER));
}

TEST_F(LoggingTest, EnableCategoriesList) {
    auto& logger = Logger::Instance();

    logger.EnableCategories("voting, db");
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::VOTING));
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::DB));
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::DEFAULT));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::LEDGER));

    logger.EnableCategories("all");
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::LEDGER));
}

TEST_F(LoggingTest, CallbackSink) {
    std::vector<LogEntry> entries;
    Capture(entries, LogLevel::Info);

    Logger::Instance().Log(LogLevel::Info, LogCategory::DEFAULT, "Test message");
    Logger::Instance().Log(LogLevel::Warn, LogCategory::VOTING, "Second");

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].message, "Test message");
    EXPECT_EQ(entries[1].category, LogCategory::VOTING);
    EXPECT_EQ(entries[1].level, LogLevel::Warn);
}

TEST_F(LoggingTest, SinkLevelFilters) {
    std::vector<LogEntry> entries;
    Capture(entries, LogLevel::Warn);

    Logger::Instance().Log(LogLevel::Info, LogCategory::DEFAULT, "dropped");
    Logger::Instance().Log(LogLevel::Error, LogCategory::DEFAULT, "kept");

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "kept");
}

TEST_F(LoggingTest, StreamMacros) {
    std::vector<LogEntry> entries;
    Capture(entries);
    Logger::Instance().SetLevel(LogLevel::Debug);

    LOG_DEBUG(LogCategory::LEDGER) << "minted " << 42 << " units";
    LOG_TRACE(LogCategory::LEDGER) << "below the logger level";
    LogWarn() << "plain";

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].message, "minted 42 units");
    EXPECT_EQ(entries[0].category, LogCategory::LEDGER);
    EXPECT_EQ(GetBasename(entries[0].file), "test_util.cpp");
    EXPECT_GT(entries[0].line, 0);
    EXPECT_EQ(entries[1].category, LogCategory::DEFAULT);
}

TEST_F(LoggingTest, DisabledMessageIsNotEvaluated) {
    Logger::Instance().SetLevel(LogLevel::Error);

    int evaluations = 0;
    auto expensive = [&evaluations]() {
        ++evaluations;
        return std::string("value");
    };

    LOG_INFO(LogCategory::DEFAULT) << expensive();
    EXPECT_EQ(evaluations, 0);

    LOG_ERROR(LogCategory::DEFAULT) << expensive();
    EXPECT_EQ(evaluations, 1);
}

TEST_F(LoggingTest, FormatLogEntry) {
    LogEntry entry;
    entry.level = LogLevel::Warn;
    entry.category = LogCategory::VOTING;
    entry.message = "hello";

    LogFormat format;
    format.showTimestamp = false;
    EXPECT_EQ(FormatLogEntry(entry, format), "[WARN ] [voting] hello");

    entry.category = LogCategory::DEFAULT;
    EXPECT_EQ(FormatLogEntry(entry, format), "[WARN ] hello");

    format.showLevel = false;
    EXPECT_EQ(FormatLogEntry(entry, format), "hello");
}

TEST_F(LoggingTest, FileSinkWritesAndRotates) {
    std::random_device rd;
    auto dir = std::filesystem::temp_directory_path() /
               ("stakevote_log_test_" + std::to_string(rd()));
    std::filesystem::create_directories(dir);

    FileSink::Config config;
    config.path = (dir / "test.log").string();
    config.autoFlush = true;
    config.maxSize = 64;
    config.maxFiles = 2;
    config.format = LogFormat{false, false, false, false, false};

    {
        auto sink = std::make_shared<FileSink>(config);
        ASSERT_TRUE(sink->IsOpen());
        Logger::Instance().AddSink(sink);

        for (int i = 0; i < 10; ++i) {
            Logger::Instance().Log(LogLevel::Info, LogCategory::DEFAULT,
                                   "line number " + std::to_string(i));
        }
        Logger::Instance().ClearSinks();
    }

    EXPECT_TRUE(std::filesystem::exists(dir / "test.log"));
    EXPECT_TRUE(std::filesystem::exists(dir / "test.log.1"));
    EXPECT_LE(std::filesystem::file_size(dir / "test.log"), 64u);

    std::ifstream last(dir / "test.log");
    std::string content((std::istreambuf_iterator<char>(last)),
                        std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("line number 9"), std::string::npos);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
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
    int64_t t = GetTime();
    EXPECT_GT(t, 1704067200);  // After 2024-01-01
}

TEST_F(TimeTest, MockTime) {
    SetMockTime(1700000000);
    EnableMockTime();
    EXPECT_TRUE(IsMockTimeEnabled());
    EXPECT_EQ(GetTime(), 1700000000);

    AdvanceMockTime(SECONDS_PER_DAY);
    EXPECT_EQ(GetTime(), 1700000000 + SECONDS_PER_DAY);
    EXPECT_EQ(GetMockTime(), 1700000000 + SECONDS_PER_DAY);

    DisableMockTime();
    EXPECT_FALSE(IsMockTimeEnabled());
    EXPECT_NE(GetTime(), 1700000000 + SECONDS_PER_DAY);
}

TEST_F(TimeTest, FormatISO8601) {
    EXPECT_EQ(FormatISO8601(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(FormatISO8601(1704067200), "2024-01-01T00:00:00Z");
    EXPECT_EQ(FormatISO8601(1705314600), "2024-01-15T10:30:00Z");
}

TEST_F(TimeTest, FormatDuration) {
    EXPECT_EQ(FormatDuration(0), "0s");
    EXPECT_EQ(FormatDuration(59), "59s");
    EXPECT_EQ(FormatDuration(3600), "1h");
    EXPECT_EQ(FormatDuration(93784), "1d 2h 3m 4s");
    EXPECT_EQ(FormatDuration(-90), "-1m 30s");
}

TEST_F(TimeTest, ParseISO8601) {
    EXPECT_EQ(ParseISO8601("2024-01-15T10:30:00Z"), std::optional<int64_t>(1705314600));
    EXPECT_EQ(ParseISO8601("2024-01-15T10:30:00"), std::optional<int64_t>(1705314600));
    EXPECT_EQ(ParseISO8601("2024-01-15 10:30:00"), std::optional<int64_t>(1705314600));
    EXPECT_FALSE(ParseISO8601("yesterday").has_value());
    EXPECT_FALSE(ParseISO8601("2024-01-15T10:30:00+02").has_value());
}

TEST_F(TimeTest, ParseDuration) {
    EXPECT_EQ(ParseDuration("90"), std::optional<int64_t>(90));
    EXPECT_EQ(ParseDuration("90s"), std::optional<int64_t>(90));
    EXPECT_EQ(ParseDuration("15m"), std::optional<int64_t>(900));
    EXPECT_EQ(ParseDuration("6h"), std::optional<int64_t>(6 * SECONDS_PER_HOUR));
    EXPECT_EQ(ParseDuration("7d"), std::optional<int64_t>(7 * SECONDS_PER_DAY));
    EXPECT_EQ(ParseDuration("2w"), std::optional<int64_t>(2 * SECONDS_PER_WEEK));

    EXPECT_FALSE(ParseDuration("").has_value());
    EXPECT_FALSE(ParseDuration("-5").has_value());
    EXPECT_FALSE(ParseDuration("5x").has_value());
    EXPECT_FALSE(ParseDuration("5dd").has_value());
    EXPECT_FALSE(ParseDuration("99999999999999999999").has_value());
    EXPECT_FALSE(ParseDuration("9999999999999999w").has_value());
}

// ============================================================================
// Utility Tests
// ============================================================================

TEST(UtilityTest, FormatLogTimestamp) {
    auto tp = std::chrono::system_clock::from_time_t(1704067200);
    std::string ts = FormatLogTimestamp(tp);

    // Local time, so only the shape is fixed
    EXPECT_EQ(ts.size(), 23u);
    EXPECT_EQ(ts.substr(ts.size() - 4), ".000");
}

TEST(UtilityTest, GetBasename) {
    EXPECT_EQ(GetBasename("/usr/local/bin/test"), "test");
    EXPECT_EQ(GetBasename("test.txt"), "test.txt");
    EXPECT_EQ(GetBasename("/"), "");
}

} // namespace
} // namespace util
} // namespace stakevote
