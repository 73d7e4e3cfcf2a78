#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

namespace Beacon {

class Config;

/**
 * @brief Logging system wrapper around spdlog
 *
 * Provides convenient logging macros and initialization. Until Initialize()
 * runs, both accessors hand out spdlog's default logger.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param logFile Optional file path for logging
     * @param consoleOutput Enable console output
     */
    static void Initialize(const std::string& logFile = "",
                          bool consoleOutput = true);

    /**
     * @brief Initialize from the "logging" section of a configuration
     *
     * Reads logging.file, logging.console and logging.level.
     */
    static void Configure(const Config& config);

    /**
     * @brief Shutdown the logging system
     */
    static void Shutdown();

    /**
     * @brief Set the minimum log level
     */
    static void SetLevel(spdlog::level::level_enum level);

    [[nodiscard]] static bool IsInitialized() { return s_initialized; }

    /**
     * @brief Get the library logger
     */
    static spdlog::logger& GetEngineLogger() {
        return s_engineLogger ? *s_engineLogger : *spdlog::default_logger_raw();
    }

    /**
     * @brief Get the application logger
     */
    static spdlog::logger& GetAppLogger() {
        return s_appLogger ? *s_appLogger : *spdlog::default_logger_raw();
    }

private:
    static std::shared_ptr<spdlog::logger> s_engineLogger;
    static std::shared_ptr<spdlog::logger> s_appLogger;
    static std::shared_ptr<spdlog::logger> s_previousDefault;
    static bool s_initialized;
};

} // namespace Beacon

// Convenience macros for library logging
#define BEACON_LOG_TRACE(...)    ::Beacon::Logger::GetEngineLogger().trace(__VA_ARGS__)
#define BEACON_LOG_DEBUG(...)    ::Beacon::Logger::GetEngineLogger().debug(__VA_ARGS__)
#define BEACON_LOG_INFO(...)     ::Beacon::Logger::GetEngineLogger().info(__VA_ARGS__)
#define BEACON_LOG_WARN(...)     ::Beacon::Logger::GetEngineLogger().warn(__VA_ARGS__)
#define BEACON_LOG_ERROR(...)    ::Beacon::Logger::GetEngineLogger().error(__VA_ARGS__)
#define BEACON_LOG_CRITICAL(...) ::Beacon::Logger::GetEngineLogger().critical(__VA_ARGS__)

// Convenience macros for application logging
#define APP_LOG_TRACE(...)    ::Beacon::Logger::GetAppLogger().trace(__VA_ARGS__)
#define APP_LOG_DEBUG(...)    ::Beacon::Logger::GetAppLogger().debug(__VA_ARGS__)
#define APP_LOG_INFO(...)     ::Beacon::Logger::GetAppLogger().info(__VA_ARGS__)
#define APP_LOG_WARN(...)     ::Beacon::Logger::GetAppLogger().warn(__VA_ARGS__)
#define APP_LOG_ERROR(...)    ::Beacon::Logger::GetAppLogger().error(__VA_ARGS__)
#define APP_LOG_CRITICAL(...) ::Beacon::Logger::GetAppLogger().critical(__VA_ARGS__)
