/**
 * @file test_config.cpp
 * @brief Unit tests for Config
 */

#include <gtest/gtest.h>

#include "config/Config.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace Beacon;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_dir = std::filesystem::temp_directory_path() /
                ("beacon_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(m_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(m_dir);
    }

    std::filesystem::path m_dir;
    Config config;
};

// =============================================================================
// Defaults
// =============================================================================

TEST_F(ConfigTest, StartsWithDefaults) {
    EXPECT_EQ("info", config.Get<std::string>("logging.level"));
    EXPECT_TRUE(config.Get<bool>("logging.console"));
    EXPECT_EQ("default", config.Get<std::string>("registry.name"));
    EXPECT_TRUE(config.Get<bool>("registry.allowOverride"));
    EXPECT_TRUE(config.Get<bool>("registry.erasedLookup"));
}

TEST_F(ConfigTest, MissingKeyReturnsDefaultValue) {
    EXPECT_FALSE(config.Has("registry.unknown"));
    EXPECT_EQ(17, config.Get<int>("registry.unknown", 17));
    EXPECT_EQ("x", config.Get<std::string>("no.such.path", "x"));
}

TEST_F(ConfigTest, WrongTypeReturnsDefaultValue) {
    EXPECT_EQ(3, config.Get<int>("logging.level", 3));
}

// =============================================================================
// Get / Set
// =============================================================================

TEST_F(ConfigTest, SetCreatesIntermediateObjects) {
    config.Set("registry.limits.max", 8);

    EXPECT_TRUE(config.Has("registry.limits"));
    EXPECT_EQ(8, config.Get<int>("registry.limits.max"));
    // Siblings survive
    EXPECT_EQ("default", config.Get<std::string>("registry.name"));
}

TEST_F(ConfigTest, SetOverwritesValue) {
    config.Set("registry.allowOverride", false);
    EXPECT_FALSE(config.Get<bool>("registry.allowOverride", true));
}

// =============================================================================
// Parsing
// =============================================================================

TEST_F(ConfigTest, LoadFromStringReplacesDocument) {
    auto result = config.LoadFromString(R"({"logging": {"level": "debug"}})");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ("debug", config.Get<std::string>("logging.level"));
    EXPECT_FALSE(config.Has("registry"));
}

TEST_F(ConfigTest, LoadFromStringReportsParseError) {
    auto result = config.LoadFromString("{ not json");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(ConfigError::ParseError, result.error());
    // Document is left as it was
    EXPECT_EQ("info", config.Get<std::string>("logging.level"));
}

// =============================================================================
// Files
// =============================================================================

TEST_F(ConfigTest, SaveAndLoadRoundTrip) {
    auto path = m_dir / "beacon.json";
    config.Set("registry.name", std::string("saved"));

    ASSERT_TRUE(config.Save(path).has_value());
    ASSERT_TRUE(std::filesystem::exists(path));

    Config loaded;
    ASSERT_TRUE(loaded.Load(path).has_value());
    EXPECT_EQ("saved", loaded.Get<std::string>("registry.name"));
}

TEST_F(ConfigTest, SaveWithoutPathFails) {
    auto result = config.Save();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(ConfigError::WriteError, result.error());
}

TEST_F(ConfigTest, LoadMissingFileCreatesDefault) {
    auto path = m_dir / "nested" / "missing.json";

    ASSERT_TRUE(config.Load(path).has_value());

    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ("default", config.Get<std::string>("registry.name"));
}

TEST_F(ConfigTest, LoadUnderRegularFileReportsWriteError) {
    std::filesystem::create_directories(m_dir);
    auto blocker = m_dir / "plainfile";
    std::ofstream(blocker) << "not a directory";

    std::expected<void, ConfigError> result;
    EXPECT_NO_THROW(result = config.Load(blocker / "sub" / "config.json"));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(ConfigError::WriteError, result.error());
    // Document is left as it was
    EXPECT_EQ("default", config.Get<std::string>("registry.name"));
}

TEST_F(ConfigTest, CreateDefaultUnderRegularFileReportsWriteError) {
    std::filesystem::create_directories(m_dir);
    auto blocker = m_dir / "plainfile";
    std::ofstream(blocker) << "not a directory";

    auto result = Config::CreateDefault(blocker / "config.json");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(ConfigError::WriteError, result.error());
}

TEST_F(ConfigTest, LoadReportsParseErrorForBadFile) {
    std::filesystem::create_directories(m_dir);
    auto path = m_dir / "broken.json";
    std::ofstream(path) << "{ \"registry\": ";

    auto result = config.Load(path);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(ConfigError::ParseError, result.error());
}

TEST_F(ConfigTest, ReloadPicksUpChanges) {
    auto path = m_dir / "reload.json";
    ASSERT_TRUE(config.Load(path).has_value());

    Config writer;
    writer.Set("registry.name", std::string("changed"));
    ASSERT_TRUE(writer.Save(path).has_value());

    ASSERT_TRUE(config.Reload().has_value());
    EXPECT_EQ("changed", config.Get<std::string>("registry.name"));
}

TEST_F(ConfigTest, ReloadWithoutPathFails) {
    auto result = config.Reload();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(ConfigError::FileNotFound, result.error());
}
