#pragma once

/**
 * @file Reflection.hpp
 * @brief Main include for the Beacon type description layer
 */

#include "reflection/ReflectionErrors.hpp"
#include "reflection/TypeCatalog.hpp"
#include "reflection/TypeDescriptor.hpp"
#include "reflection/TypeReference.hpp"
