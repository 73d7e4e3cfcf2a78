#pragma once

#include "reflection/ReflectionErrors.hpp"
#include "reflection/TypeDescriptor.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace Beacon {

// ============================================================================
// ServiceResolutionError - Base of every registry-side lookup failure
// ============================================================================

/**
 * @brief Base exception for failures reported while resolving a descriptor
 *
 * Carries the requested descriptor exactly as the caller's overload produced it.
 */
class ServiceResolutionError : public std::runtime_error {
public:
    ServiceResolutionError(const std::string& message, Reflect::TypeDescriptor requested)
        : std::runtime_error(message)
        , m_requested(std::move(requested)) {}

    [[nodiscard]] const Reflect::TypeDescriptor& GetDescriptor() const noexcept {
        return m_requested;
    }

private:
    Reflect::TypeDescriptor m_requested;
};

/**
 * @brief Exception thrown when no binding exists for a descriptor
 */
class UnresolvedServiceError : public ServiceResolutionError {
public:
    explicit UnresolvedServiceError(const Reflect::TypeDescriptor& requested)
        : ServiceResolutionError("Service not found: " + requested.GetName(), requested) {}

    UnresolvedServiceError(const Reflect::TypeDescriptor& requested, const std::string& reason)
        : ServiceResolutionError("Service not found: " + requested.GetName() + " (" + reason + ")",
                                 requested) {}
};

/**
 * @brief Exception thrown when more than one binding matches a descriptor
 */
class AmbiguousServiceError : public ServiceResolutionError {
public:
    AmbiguousServiceError(const Reflect::TypeDescriptor& requested,
                          std::vector<Reflect::TypeDescriptor> candidates)
        : ServiceResolutionError(Describe(requested, candidates), requested)
        , m_candidates(std::move(candidates)) {}

    [[nodiscard]] const std::vector<Reflect::TypeDescriptor>& GetCandidates() const noexcept {
        return m_candidates;
    }

private:
    static std::string Describe(const Reflect::TypeDescriptor& requested,
                                const std::vector<Reflect::TypeDescriptor>& candidates) {
        std::string message = "Ambiguous service: " + requested.GetName() + " matches";
        for (size_t i = 0; i < candidates.size(); ++i) {
            message += (i == 0 ? " " : ", ") + candidates[i].GetName();
        }
        return message;
    }

    std::vector<Reflect::TypeDescriptor> m_candidates;
};

/**
 * @brief Exception thrown when the bound instance is not of the requested type
 *
 * Typical after an erased lookup picked a sibling specialization.
 */
class ServiceTypeMismatchError : public ServiceResolutionError {
public:
    ServiceTypeMismatchError(const Reflect::TypeDescriptor& requested,
                             Reflect::TypeDescriptor expected,
                             Reflect::TypeDescriptor bound)
        : ServiceResolutionError("Service type mismatch for " + requested.GetName() +
                                     ": expected " + expected.GetName() +
                                     ", bound " + bound.GetName(),
                                 requested)
        , m_expected(std::move(expected))
        , m_bound(std::move(bound)) {}

    [[nodiscard]] const Reflect::TypeDescriptor& GetExpected() const noexcept { return m_expected; }
    [[nodiscard]] const Reflect::TypeDescriptor& GetBound() const noexcept { return m_bound; }

private:
    Reflect::TypeDescriptor m_expected;
    Reflect::TypeDescriptor m_bound;
};

/**
 * @brief Exception thrown when registering over an existing binding is refused
 */
class DuplicateServiceError : public std::runtime_error {
public:
    explicit DuplicateServiceError(const Reflect::TypeDescriptor& descriptor)
        : std::runtime_error("Service already registered: " + descriptor.GetName())
        , m_descriptor(descriptor) {}

    [[nodiscard]] const Reflect::TypeDescriptor& GetDescriptor() const noexcept {
        return m_descriptor;
    }

private:
    Reflect::TypeDescriptor m_descriptor;
};

} // namespace Beacon
