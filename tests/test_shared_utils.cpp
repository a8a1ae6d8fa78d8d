#include <gtest/gtest.h>
#include <filesystem>
#include "utils/logger.hpp"

using namespace arbguard::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::filesystem::create_directories("test_logs");
    }

    void TearDown() override {
        Logger::shutdown();
        std::filesystem::remove_all("test_logs");
    }
};

TEST_F(LoggerTest, InitializationAndBasicLogging) {
    EXPECT_NO_THROW(Logger::initialize("test_logs/test.log", LogLevel::DEBUG));

    EXPECT_NO_THROW(Logger::info("Test info message"));
    EXPECT_NO_THROW(Logger::debug("Test debug message"));
    EXPECT_NO_THROW(Logger::warn("Test warning message"));
    EXPECT_NO_THROW(ARBGUARD_LOG_INFO("Formatted {} at height {}", "message", 42));

    EXPECT_EQ(Logger::get_level(), LogLevel::DEBUG);
    EXPECT_TRUE(Logger::is_enabled(LogLevel::INFO));
    EXPECT_TRUE(Logger::is_enabled(LogLevel::DEBUG));
    EXPECT_TRUE(std::filesystem::exists("test_logs/test.log"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    Logger::initialize("test_logs/level_test.log", LogLevel::WARN);

    EXPECT_EQ(Logger::get_level(), LogLevel::WARN);
    EXPECT_FALSE(Logger::is_enabled(LogLevel::DEBUG));
    EXPECT_FALSE(Logger::is_enabled(LogLevel::INFO));
    EXPECT_TRUE(Logger::is_enabled(LogLevel::WARN));
    EXPECT_TRUE(Logger::is_enabled(LogLevel::ERROR));

    Logger::set_level(LogLevel::TRACE);
    EXPECT_TRUE(Logger::is_enabled(LogLevel::TRACE));
}

TEST_F(LoggerTest, ReinitializeReplacesLogger) {
    Logger::initialize("test_logs/first.log", LogLevel::INFO, 1024 * 1024, 1, false, true);
    EXPECT_NO_THROW(Logger::initialize("test_logs/second.log", LogLevel::ERROR, 1024 * 1024, 1, false, true));
    EXPECT_EQ(Logger::get_level(), LogLevel::ERROR);
}

TEST_F(LoggerTest, LoggingBeforeInitializeIsIgnored) {
    Logger::shutdown();
    EXPECT_NO_THROW(Logger::error("dropped"));
    EXPECT_NO_THROW(ARBGUARD_LOG_WARN("dropped {}", 1));
}

TEST_F(LoggerTest, ValidationLogging) {
    Logger::initialize("test_logs/validation.log", LogLevel::DEBUG, 1024 * 1024, 1, false, true);

    EXPECT_NO_THROW(ValidationLogger::log_condition_rejected(7, "PRICE_GAP", "23bps < 50bps"));
    EXPECT_NO_THROW(ValidationLogger::log_opportunity_accepted(8, "dex_c", "dex_b", 847, "8474.57"));
    EXPECT_NO_THROW(ValidationLogger::log_opportunity_recorded(0, 8, "node-1", "8474.57"));
    EXPECT_NO_THROW(ValidationLogger::log_opportunity_executed(0, "8000"));
    EXPECT_NO_THROW(ValidationLogger::log_system_event("TEST", "validation logging"));
}

TEST_F(LoggerTest, ScopedTimer) {
    Logger::initialize("test_logs/timer.log", LogLevel::DEBUG, 1024 * 1024, 1, false, true);
    {
        ARBGUARD_SCOPED_TIMER("test_operation");
    }
    SUCCEED();
}

TEST(LogLevelTest, ParseNames) {
    EXPECT_EQ(parse_log_level("TRACE"), LogLevel::TRACE);
    EXPECT_EQ(parse_log_level("WARNING"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("CRITICAL"), LogLevel::CRITICAL);
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("", LogLevel::ERROR), LogLevel::ERROR);
}
