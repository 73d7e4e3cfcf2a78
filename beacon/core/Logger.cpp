#include "core/Logger.hpp"
#include "config/Config.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <array>
#include <string_view>
#include <vector>

namespace Beacon {

namespace {

constexpr std::array<std::string_view, 8> kLevelNames = {
    "trace", "debug", "info", "warn", "warning", "error", "critical", "off"
};

// spdlog::level::from_str maps unknown names to off
spdlog::level::level_enum ParseLevel(const std::string& name) {
    if (std::find(kLevelNames.begin(), kLevelNames.end(), name) == kLevelNames.end()) {
        BEACON_LOG_WARN("Unknown log level '{}', using info", name);
        return spdlog::level::info;
    }
    return spdlog::level::from_str(name);
}

} // namespace

std::shared_ptr<spdlog::logger> Logger::s_engineLogger;
std::shared_ptr<spdlog::logger> Logger::s_appLogger;
std::shared_ptr<spdlog::logger> Logger::s_previousDefault;
bool Logger::s_initialized = false;

void Logger::Initialize(const std::string& logFile, bool consoleOutput) {
    if (s_initialized) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    // Console sink
    if (consoleOutput) {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("%^[%T] [%n] [%l]%$ %v");
        sinks.push_back(consoleSink);
    }

    // File sink
    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile, 5 * 1024 * 1024, 3);  // 5MB max, 3 files
        fileSink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    // Create library logger
    s_engineLogger = std::make_shared<spdlog::logger>("BEACON", sinks.begin(), sinks.end());
    s_engineLogger->set_level(spdlog::level::trace);
    s_engineLogger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_engineLogger);

    // Create application logger
    s_appLogger = std::make_shared<spdlog::logger>("APP", sinks.begin(), sinks.end());
    s_appLogger->set_level(spdlog::level::trace);
    s_appLogger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_appLogger);

    // Set as default, remembering the one to restore on shutdown
    s_previousDefault = spdlog::default_logger();
    spdlog::set_default_logger(s_engineLogger);

    s_initialized = true;
}

void Logger::Configure(const Config& config) {
    Initialize(config.Get<std::string>("logging.file", ""),
               config.Get<bool>("logging.console", true));
    SetLevel(ParseLevel(config.Get<std::string>("logging.level", "info")));
}

void Logger::Shutdown() {
    if (!s_initialized) {
        return;
    }

    s_engineLogger->flush();
    s_appLogger->flush();

    spdlog::drop(s_engineLogger->name());
    spdlog::drop(s_appLogger->name());
    spdlog::set_default_logger(s_previousDefault);

    s_engineLogger.reset();
    s_appLogger.reset();
    s_previousDefault.reset();
    s_initialized = false;
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    if (s_engineLogger) {
        s_engineLogger->set_level(level);
    }
    if (s_appLogger) {
        s_appLogger->set_level(level);
    }
}

} // namespace Beacon
