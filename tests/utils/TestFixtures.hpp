/**
 * @file TestFixtures.hpp
 * @brief Common test fixtures for Beacon tests
 */

#pragma once

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "core/ServiceRegistry.hpp"
#include "mocks/MockServices.hpp"

#include <memory>
#include <string>
#include <vector>

namespace Beacon {
namespace Test {

// =============================================================================
// Registry Test Fixture
// =============================================================================

/**
 * @brief Fixture owning a fresh registry with a few common bindings
 */
class RegistryTestFixture : public ::testing::Test {
protected:
    void SetUp() override {
        m_clock = std::make_shared<FixedClock>(1234);
        m_greeter = std::make_shared<PoliteGreeter>();
        m_strings = std::make_shared<std::vector<std::string>>(
            std::vector<std::string>{"alpha", "beta"});
        m_ints = std::make_shared<std::vector<int>>(std::vector<int>{1, 2, 3});

        m_registry = std::make_unique<ServiceRegistry>("test");
        m_registry->Register<IClock>(m_clock);
        m_registry->Register<IGreeter>(m_greeter);
    }

    void TearDown() override {
        m_registry.reset();
    }

    void RegisterVectors() {
        m_registry->Register<std::vector<std::string>>(m_strings);
        m_registry->Register<std::vector<int>>(m_ints);
    }

    std::unique_ptr<ServiceRegistry> m_registry;
    std::shared_ptr<FixedClock> m_clock;
    std::shared_ptr<PoliteGreeter> m_greeter;
    std::shared_ptr<std::vector<std::string>> m_strings;
    std::shared_ptr<std::vector<int>> m_ints;
};

} // namespace Test
} // namespace Beacon
