#pragma once

#include <expected>
#include <filesystem>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace Beacon {

/**
 * @brief Failure reasons for configuration file operations
 */
enum class ConfigError {
    FileNotFound,
    ParseError,
    WriteError
};

/**
 * @brief JSON-based configuration for logging and registry settings
 *
 * Keys are dot-separated paths into the document ("registry.allowOverride").
 * Each composition root owns its Config and hands it to the registries and
 * the logger it sets up.
 */
class Config {
public:
    Config() = default;
    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * @brief Load configuration from JSON file
     * @param filepath Path to configuration file, created with defaults if missing
     * @return WriteError if a missing file could not be created
     */
    std::expected<void, ConfigError> Load(const std::filesystem::path& filepath);

    /**
     * @brief Replace the document with parsed JSON text
     */
    std::expected<void, ConfigError> LoadFromString(std::string_view text);

    /**
     * @brief Save current configuration to JSON file
     * @param filepath Path to save to (uses loaded path if empty)
     */
    std::expected<void, ConfigError> Save(const std::filesystem::path& filepath = "");

    /**
     * @brief Reload configuration from disk
     */
    std::expected<void, ConfigError> Reload();

    /**
     * @brief Get a configuration value with type safety
     * @tparam T The expected type
     * @param key Dot-separated key path (e.g., "logging.level")
     * @param defaultValue Value to return if key not found or of another type
     */
    template<typename T>
    T Get(std::string_view key, const T& defaultValue = T{}) const;

    /**
     * @brief Set a configuration value, creating intermediate objects
     */
    template<typename T>
    void Set(std::string_view key, const T& value);

    /**
     * @brief Check if a key exists
     */
    bool Has(std::string_view key) const;

    /**
     * @brief Default document
     */
    static nlohmann::json Defaults();

    /**
     * @brief Create default configuration file, including parent directories
     */
    static std::expected<void, ConfigError> CreateDefault(const std::filesystem::path& filepath);

private:
    nlohmann::json m_data = Defaults();
    std::filesystem::path m_filepath;
    mutable std::shared_mutex m_mutex;

    nlohmann::json* NavigateToKey(std::string_view key, bool create);
    const nlohmann::json* NavigateToKey(std::string_view key) const;
};

// Template implementations
template<typename T>
T Config::Get(std::string_view key, const T& defaultValue) const {
    std::shared_lock lock(m_mutex);
    const auto* node = NavigateToKey(key);
    if (!node || node->is_null()) {
        return defaultValue;
    }

    try {
        return node->get<T>();
    } catch (const nlohmann::json::exception&) {
        return defaultValue;
    }
}

template<typename T>
void Config::Set(std::string_view key, const T& value) {
    std::unique_lock lock(m_mutex);
    *NavigateToKey(key, true) = value;
}

} // namespace Beacon
