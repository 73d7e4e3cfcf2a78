#pragma once

/**
 * @file TypeReference.hpp
 * @brief Carrier that captures a type descriptor from its own declaration
 *
 * A TypeReference is created at a call site, handed to the locator, and
 * dropped. The captured descriptor comes from the carrier's declared
 * specialization, never from a value supplied at runtime:
 *
 * @code{.cpp}
 * auto names = locator.Resolve(TypeReference<std::vector<std::string>>{});
 *
 * // A named carrier works the same way, the argument is read from the base
 * struct Handlers : TypeReference<std::map<std::string, Handler>> {};
 * auto handlers = locator.Resolve(Handlers{});
 * @endcode
 *
 * A carrier declared without a type argument (TypeReference<>) has nothing to
 * capture and throws MissingTypeParameterError on construction.
 */

#include "reflection/ReflectionErrors.hpp"
#include "reflection/TypeDescriptor.hpp"

namespace Beacon {
namespace Reflect {

/**
 * @brief Placeholder argument of a carrier declared without a type
 */
struct Unspecified {};

/**
 * @brief Untyped part of every TypeReference
 *
 * Holds the captured descriptor. The capture runs once, in the constructor,
 * and the descriptor is immutable afterwards.
 */
class TypeReferenceBase {
public:
    [[nodiscard]] const TypeDescriptor& GetDescriptor() const noexcept {
        return m_descriptor;
    }

protected:
    /**
     * @param carrier Descriptor of the carrier's declared specialization
     * @throws MissingTypeParameterError if the carrier has no usable type argument
     */
    explicit TypeReferenceBase(const TypeDescriptor& carrier);

    ~TypeReferenceBase() = default;

    TypeReferenceBase(const TypeReferenceBase&) = default;
    TypeReferenceBase& operator=(const TypeReferenceBase&) = default;

private:
    [[nodiscard]] static TypeDescriptor Capture(const TypeDescriptor& carrier);

    TypeDescriptor m_descriptor;
};

/**
 * @brief Single-parameter type carrier
 * @tparam T The type to capture. Only this first argument is ever read.
 */
template<typename T = Unspecified>
class TypeReference : public TypeReferenceBase {
public:
    using Type = T;

    TypeReference()
        : TypeReferenceBase(TypeDescriptor::Of<TypeReference<T>>()) {}
};

} // namespace Reflect
} // namespace Beacon
