/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <gtest/gtest.h>

#include "core/Logger.hpp"
#include "config/Config.hpp"

using namespace Beacon;

// The global test environment initializes logging once for the whole run
TEST(LoggerTest, InitializedByEnvironment) {
    EXPECT_TRUE(Logger::IsInitialized());
    EXPECT_EQ("BEACON", Logger::GetEngineLogger().name());
    EXPECT_EQ("APP", Logger::GetAppLogger().name());
}

TEST(LoggerTest, SecondInitializeIsIgnored) {
    auto* engine = &Logger::GetEngineLogger();

    Logger::Initialize("", false);

    EXPECT_EQ(engine, &Logger::GetEngineLogger());
}

TEST(LoggerTest, SetLevelAppliesToBothLoggers) {
    auto previous = Logger::GetEngineLogger().level();

    Logger::SetLevel(spdlog::level::err);
    EXPECT_EQ(spdlog::level::err, Logger::GetEngineLogger().level());
    EXPECT_EQ(spdlog::level::err, Logger::GetAppLogger().level());

    Logger::SetLevel(previous);
}

TEST(LoggerTest, ConfigureAcceptsKnownLevel) {
    Config config;
    config.Set("logging.level", std::string("error"));

    Logger::Configure(config);
    EXPECT_EQ(spdlog::level::err, Logger::GetEngineLogger().level());

    Logger::SetLevel(spdlog::level::warn);
}

TEST(LoggerTest, ConfigureFallsBackToInfoForUnknownLevel) {
    Config config;
    config.Set("logging.level", std::string("verbose"));

    Logger::Configure(config);
    EXPECT_EQ(spdlog::level::info, Logger::GetEngineLogger().level());
    EXPECT_EQ(spdlog::level::info, Logger::GetAppLogger().level());

    Logger::SetLevel(spdlog::level::warn);
}

TEST(LoggerTest, MacrosDoNotThrow) {
    EXPECT_NO_THROW(BEACON_LOG_DEBUG("debug {}", 1));
    EXPECT_NO_THROW(BEACON_LOG_WARN("warn {}", "two"));
    EXPECT_NO_THROW(APP_LOG_INFO("info {}", 3.0));
}

TEST(LoggerTest, ShutdownFallsBackToDefaultLogger) {
    Logger::Shutdown();

    EXPECT_FALSE(Logger::IsInitialized());
    EXPECT_EQ(spdlog::default_logger_raw(), &Logger::GetEngineLogger());
    EXPECT_NO_THROW(APP_LOG_INFO("after shutdown"));

    // Restore the environment's logging for the remaining tests
    Config config;
    config.Set("logging.level", std::string("warn"));
    Logger::Configure(config);

    EXPECT_TRUE(Logger::IsInitialized());
    EXPECT_EQ(spdlog::level::warn, Logger::GetAppLogger().level());
}
