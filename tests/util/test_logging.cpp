// VFACE - Logging Tests
// Copyright (c) 2024 VFACE Developers
// MIT License

#include <gtest/gtest.h>

#include "vface/util/logging.h"

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace vface {
namespace util {
namespace test {

class LoggingTest : public ::testing::Test {
protected:
    std::vector<LogEntry> captured_;

    void SetUp() override {
        Logger& logger = Logger::Instance();
        logger.ClearSinks();
        logger.SetLevel(LogLevel::Debug);
        logger.SetCategories({});
        logger.AddSink(std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { captured_.push_back(entry); },
            LogLevel::Trace));
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
        Logger::Instance().SetCategories({});
    }
};

TEST_F(LoggingTest, StreamMacrosCaptureMessageAndLocation) {
    LOG_INFO(LogCategory::CHAIN) << "Appended entry " << 7 << " hash " << LogId(std::string(64, 'a'));

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].level, LogLevel::Info);
    EXPECT_EQ(captured_[0].category, LogCategory::CHAIN);
    EXPECT_EQ(captured_[0].message, "Appended entry 7 hash aaaaaaaa...");
    EXPECT_EQ(captured_[0].file, "test_logging.cpp");
    EXPECT_GT(captured_[0].line, 0);
}

TEST_F(LoggingTest, LevelThreshold) {
    Logger::Instance().SetLevel(LogLevel::Warn);
    LOG_DEBUG(LogCategory::DB) << "hidden";
    LOG_INFO(LogCategory::DB) << "hidden";
    LOG_WARN(LogCategory::DB) << "shown";
    LogInfoF(LogCategory::DB, "hidden %d", 1);

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "shown");
}

TEST_F(LoggingTest, CategoryFilterNeverHidesErrors) {
    Logger::Instance().SetCategories({"registry"});
    LOG_DEBUG(LogCategory::REGISTRY) << "registry debug";
    LOG_DEBUG(LogCategory::MATCHER) << "matcher debug";
    LOG_ERROR(LogCategory::MATCHER) << "matcher error";

    ASSERT_EQ(captured_.size(), 2u);
    EXPECT_EQ(captured_[0].message, "registry debug");
    EXPECT_EQ(captured_[1].message, "matcher error");

    captured_.clear();
    Logger::Instance().SetCategories({"registry", "all"});
    LOG_DEBUG(LogCategory::MATCHER) << "matcher debug";
    EXPECT_EQ(captured_.size(), 1u);
}

TEST_F(LoggingTest, PrintfStyle) {
    LogDebugF(LogCategory::MATCHER, "Query scanned %zu entries, %d skipped", size_t{12}, 3);
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "Query scanned 12 entries, 3 skipped");
}

TEST_F(LoggingTest, SinkLevelFiltersIndependently) {
    std::vector<std::string> errors;
    Logger::Instance().AddSink(std::make_shared<CallbackSink>(
        [&errors](const LogEntry& entry) { errors.push_back(entry.message); },
        LogLevel::Error));

    LOG_INFO(LogCategory::RPC) << "request";
    LOG_ERROR(LogCategory::RPC) << "handler threw";

    EXPECT_EQ(captured_.size(), 2u);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "handler threw");
}

TEST(LoggingHelpersTest, LevelNames) {
    EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("none"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("verbose"), LogLevel::Info);
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
}

TEST(LoggingHelpersTest, LogIdShortensLongIdentifiers) {
    EXPECT_EQ(LogId("abc"), "abc");
    EXPECT_EQ(LogId("0123456789abcdef"), "01234567...");
    EXPECT_EQ(LogId("0123456789abcdef", 4), "0123...");
}

TEST(FileSinkTest, RotatesBySize) {
    char pattern[] = "/tmp/vface_log_test_XXXXXX";
    int fd = mkstemp(pattern);
    ASSERT_GE(fd, 0);
    close(fd);
    std::string path = pattern;

    FileSink::Config config;
    config.path = path;
    config.maxSize = 64;
    config.maxFiles = 2;
    {
        FileSink sink(config);
        ASSERT_TRUE(sink.IsOpen());

        LogEntry entry;
        entry.category = LogCategory::DB;
        entry.message = std::string(80, 'x');
        entry.timestamp = std::chrono::system_clock::now();
        sink.Write(entry);
        entry.message = "second";
        sink.Write(entry);
        sink.Flush();
    }

    std::ifstream rotated(path + ".1");
    ASSERT_TRUE(rotated.is_open());
    std::string first;
    std::getline(rotated, first);
    EXPECT_NE(first.find(std::string(80, 'x')), std::string::npos);

    std::ifstream current(path);
    std::string second;
    std::getline(current, second);
    EXPECT_NE(second.find("[db]"), std::string::npos);
    EXPECT_NE(second.find("second"), std::string::npos);

    std::remove(path.c_str());
    std::remove((path + ".1").c_str());
}

} // namespace test
} // namespace util
} // namespace vface
