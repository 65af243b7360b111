/**
 * @file test_logger.cpp
 * @brief Tests for the root and per-setup loggers
 * @author DR Logger Test Team
 * @date 2026-10-19
 */

#include <gtest/gtest.h>
#include "../cpp/include/logger.hpp"

using namespace drLogger;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::shutdown();
        LoggingConfig config;
        config.log_file.clear();
        config.console_level = LogLevel::CRITICAL;
        Logger::initialize(config);
    }

    void TearDown() override {
        Logger::shutdown();
    }
};

TEST_F(LoggerTest, Initialize_ConsoleOnlyWhenNoLogFile) {
    EXPECT_TRUE(Logger::isInitialized());
    EXPECT_EQ(Logger::get()->sinks().size(), 1u);
    EXPECT_EQ(Logger::get()->name(), Logger::kRootName);
}

TEST_F(LoggerTest, ForSetup_SharesRootSinks) {
    auto ivan = Logger::forSetup("Ivan");

    EXPECT_EQ(ivan->name(), "session.Ivan");
    EXPECT_EQ(ivan, Logger::forSetup("Ivan"));
    ASSERT_EQ(ivan->sinks().size(), Logger::get()->sinks().size());
    EXPECT_EQ(ivan->sinks()[0], Logger::get()->sinks()[0]);
}

TEST_F(LoggerTest, SetLevel_AppliesToSetupLoggers) {
    auto ivan = Logger::forSetup("Ivan");

    Logger::setLevel(LogLevel::ERROR);

    EXPECT_EQ(Logger::get()->level(), spdlog::level::err);
    EXPECT_EQ(ivan->level(), spdlog::level::err);
}

TEST_F(LoggerTest, Shutdown_ThenGet_Reinitializes) {
    Logger::shutdown();
    EXPECT_FALSE(Logger::isInitialized());

    EXPECT_NE(Logger::get(), nullptr);
    EXPECT_TRUE(Logger::isInitialized());
}
