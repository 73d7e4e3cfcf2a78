#pragma once

/**
 * @file Beacon.hpp
 * @brief Main include for the Beacon service locator
 */

#include "config/Config.hpp"
#include "core/Logger.hpp"
#include "core/ServiceErrors.hpp"
#include "core/ServiceInstance.hpp"
#include "core/ServiceLocator.hpp"
#include "core/ServiceRegistry.hpp"
#include "reflection/Reflection.hpp"
