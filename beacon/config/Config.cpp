#include "config/Config.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <iomanip>
#include <system_error>
#include <vector>

namespace Beacon {

namespace {

std::vector<std::string> SplitKey(std::string_view key) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end = 0;
    while ((end = key.find('.', start)) != std::string_view::npos) {
        parts.emplace_back(key.substr(start, end - start));
        start = end + 1;
    }
    parts.emplace_back(key.substr(start));
    return parts;
}

} // namespace

std::expected<void, ConfigError> Config::Load(const std::filesystem::path& filepath) {
    std::unique_lock lock(m_mutex);
    m_filepath = filepath;

    std::error_code ec;
    if (!std::filesystem::exists(filepath, ec)) {
        spdlog::warn("Config file not found: {}. Creating default.", filepath.string());
        if (auto created = CreateDefault(filepath); !created) {
            return std::unexpected(created.error());
        }
    }

    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            spdlog::error("Failed to open config file: {}", filepath.string());
            return std::unexpected(ConfigError::FileNotFound);
        }

        m_data = nlohmann::json::parse(file);
        spdlog::info("Loaded configuration from: {}", filepath.string());
        return {};
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to parse config file: {}", e.what());
        return std::unexpected(ConfigError::ParseError);
    }
}

std::expected<void, ConfigError> Config::LoadFromString(std::string_view text) {
    std::unique_lock lock(m_mutex);
    try {
        m_data = nlohmann::json::parse(text);
        return {};
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to parse configuration text: {}", e.what());
        return std::unexpected(ConfigError::ParseError);
    }
}

std::expected<void, ConfigError> Config::Save(const std::filesystem::path& filepath) {
    std::shared_lock lock(m_mutex);
    const auto& path = filepath.empty() ? m_filepath : filepath;
    if (path.empty()) {
        spdlog::error("No config file path set, cannot save");
        return std::unexpected(ConfigError::WriteError);
    }

    try {
        // Create parent directories if they don't exist
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            spdlog::error("Failed to open config file for writing: {}", path.string());
            return std::unexpected(ConfigError::WriteError);
        }

        file << std::setw(4) << m_data << std::endl;
        spdlog::info("Saved configuration to: {}", path.string());
        return {};
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config file: {}", e.what());
        return std::unexpected(ConfigError::WriteError);
    }
}

std::expected<void, ConfigError> Config::Reload() {
    std::filesystem::path filepath;
    {
        std::shared_lock lock(m_mutex);
        filepath = m_filepath;
    }

    // Load acquires its own lock
    if (filepath.empty()) {
        spdlog::warn("No config file path set, cannot reload");
        return std::unexpected(ConfigError::FileNotFound);
    }
    return Load(filepath);
}

bool Config::Has(std::string_view key) const {
    std::shared_lock lock(m_mutex);
    return NavigateToKey(key) != nullptr;
}

nlohmann::json* Config::NavigateToKey(std::string_view key, bool create) {
    nlohmann::json* current = &m_data;
    for (const auto& p : SplitKey(key)) {
        if (!current->is_object() || !current->contains(p)) {
            if (!create) {
                return nullptr;
            }
            if (!current->is_object()) {
                *current = nlohmann::json::object();
            }
            (*current)[p] = nlohmann::json::object();
        }
        current = &(*current)[p];
    }
    return current;
}

const nlohmann::json* Config::NavigateToKey(std::string_view key) const {
    const nlohmann::json* current = &m_data;
    for (const auto& p : SplitKey(key)) {
        if (!current->is_object() || !current->contains(p)) {
            return nullptr;
        }
        current = &(*current)[p];
    }
    return current;
}

nlohmann::json Config::Defaults() {
    nlohmann::json config;

    // Logging settings
    config["logging"]["level"] = "info";
    config["logging"]["file"] = "";
    config["logging"]["console"] = true;

    // Registry settings
    config["registry"]["name"] = "default";
    config["registry"]["allowOverride"] = true;
    config["registry"]["erasedLookup"] = true;

    return config;
}

std::expected<void, ConfigError> Config::CreateDefault(const std::filesystem::path& filepath) {
    try {
        // Create parent directories if needed
        if (filepath.has_parent_path()) {
            std::filesystem::create_directories(filepath.parent_path());
        }
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Failed to create config directory: {}", e.what());
        return std::unexpected(ConfigError::WriteError);
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        spdlog::error("Failed to create default configuration file: {}", filepath.string());
        return std::unexpected(ConfigError::WriteError);
    }

    file << std::setw(4) << Defaults() << std::endl;
    spdlog::info("Created default configuration file: {}", filepath.string());
    return {};
}

} // namespace Beacon
