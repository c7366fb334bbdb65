// Satchel - Logging Tests
// Copyright (c) 2024 Satchel Developers
// MIT License

#include <gtest/gtest.h>

#include <satchel/util/logging.h>

#include <memory>
#include <string>
#include <vector>

namespace satchel {
namespace util {
namespace {

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
            [this](const LogEntry& e) { entries_.push_back(e); }, level);
        Logger::Instance().AddSink(sink);
        return sink;
    }

    std::vector<LogEntry> entries_;
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Off), "OFF");
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("WARNING"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("off"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("chatty"), LogLevel::Info);
}

TEST_F(LoggingTest, SilentWithoutSinks) {
    Logger& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 0u);
    EXPECT_FALSE(logger.WillLog(LogLevel::Error, LogCategory::WALLET));
}

TEST_F(LoggingTest, AddRemoveSink) {
    Logger& logger = Logger::Instance();
    auto sink = Capture();
    EXPECT_EQ(logger.SinkCount(), 1u);
    logger.RemoveSink(sink);
    EXPECT_EQ(logger.SinkCount(), 0u);
}

TEST_F(LoggingTest, LevelFiltering) {
    Logger& logger = Logger::Instance();
    Capture();
    logger.SetLevel(LogLevel::Warn);

    LOG_INFO(LogCategory::TX) << "hidden";
    LOG_WARN(LogCategory::TX) << "shown " << 42;

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Warn);
    EXPECT_EQ(entries_[0].category, LogCategory::TX);
    EXPECT_EQ(entries_[0].message, "shown 42");
    EXPECT_GT(entries_[0].line, 0);
}

TEST_F(LoggingTest, SinkLevelAppliesPerSink) {
    Logger& logger = Logger::Instance();
    logger.SetLevel(LogLevel::Debug);
    Capture(LogLevel::Error);

    LOG_DEBUG(LogCategory::KEYS) << "debug";
    LOG_ERROR(LogCategory::KEYS) << "error";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "error");
}

TEST_F(LoggingTest, CategoryFiltering) {
    Logger& logger = Logger::Instance();
    Capture();
    logger.EnableCategory(LogCategory::SELECT);

    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::SELECT));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::WALLET));

    LOG_INFO(LogCategory::WALLET) << "filtered";
    LOG_INFO(LogCategory::SELECT) << "kept";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "kept");

    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::WALLET));
}

TEST_F(LoggingTest, PrintfStyle) {
    Capture();
    LogInfoF(LogCategory::WALLET, "%s sweep %zu inputs", "bitcoin-mainnet", static_cast<size_t>(3));
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "bitcoin-mainnet sweep 3 inputs");
}

TEST_F(LoggingTest, StreamArgumentsNotEvaluatedWhenFiltered) {
    Capture();
    Logger::Instance().SetLevel(LogLevel::Error);
    int evaluated = 0;
    auto touch = [&] { return ++evaluated; };
    LOG_DEBUG(LogCategory::DEFAULT) << touch();
    EXPECT_EQ(evaluated, 0);
}

TEST_F(LoggingTest, ScopedTimerLogsAtDebug) {
    Capture();
    Logger::Instance().SetLevel(LogLevel::Debug);
    {
        SATCHEL_LOG_TIMER(LogCategory::KEYS, "derive");
    }
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Debug);
    EXPECT_EQ(entries_[0].message.rfind("derive took ", 0), 0u);
}

TEST_F(LoggingTest, FormatLogEntry) {
    LogEntry entry;
    entry.level = LogLevel::Warn;
    entry.category = LogCategory::CONFIG;
    entry.message = "bad value";
    entry.file = "/src/util/config.cpp";
    entry.line = 12;

    EXPECT_EQ(FormatLogEntry(entry, false), "[WARN ] [config] bad value");
    EXPECT_EQ(FormatLogEntry(entry, false, true), "[WARN ] [config] config.cpp:12 bad value");

    entry.category = LogCategory::DEFAULT;
    EXPECT_EQ(FormatLogEntry(entry, false), "[WARN ] bad value");
}

TEST_F(LoggingTest, InitializeIsIdempotent) {
    Logger& logger = Logger::Instance();
    logger.Initialize(LogLevel::Error);
    logger.Initialize(LogLevel::Error);
    EXPECT_EQ(logger.SinkCount(), 1u);
    EXPECT_EQ(logger.GetLevel(), LogLevel::Error);
    logger.Shutdown();
    EXPECT_EQ(logger.SinkCount(), 0u);
}

} // namespace
} // namespace util
} // namespace satchel
