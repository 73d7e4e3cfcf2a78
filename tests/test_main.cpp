/**
 * @file test_main.cpp
 * @brief Test entry point - Initialize test environment and global fixtures
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "core/Logger.hpp"
#include "reflection/TypeCatalog.hpp"

#include <iostream>

namespace Beacon {
namespace Test {

// =============================================================================
// Global Test Environment
// =============================================================================

/**
 * @brief Global test environment for Beacon tests
 *
 * Handles one-time setup and teardown for the entire test suite:
 * - Configure logging
 * - Reset the process-wide type catalog
 */
class BeaconTestEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        std::cout << "=== Beacon Test Suite Starting ===" << std::endl;

        // Suppress verbose logging during tests
        Logger::Initialize("", true);
        Logger::SetLevel(spdlog::level::warn);
    }

    void TearDown() override {
        std::cout << "=== Beacon Test Suite Complete ===" << std::endl;

        Reflect::TypeCatalog::Instance().Clear();
        Logger::Shutdown();
    }
};

} // namespace Test
} // namespace Beacon

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char** argv) {
    // Initialize GoogleMock (also initializes GoogleTest)
    ::testing::InitGoogleMock(&argc, argv);

    ::testing::AddGlobalTestEnvironment(new Beacon::Test::BeaconTestEnvironment());

    return RUN_ALL_TESTS();
}
