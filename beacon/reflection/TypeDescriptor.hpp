#pragma once

/**
 * @file TypeDescriptor.hpp
 * @brief Runtime descriptor of a fully-specified type
 *
 * A TypeDescriptor is the lookup key of the service locator. It names one
 * exact type, including the arguments of a template specialization:
 *
 * @code{.cpp}
 * auto strings = TypeDescriptor::Of<std::vector<std::string>>();
 * auto ints    = TypeDescriptor::Of<std::vector<int>>();
 *
 * strings == ints;                    // false
 * strings.Erased() == ints.Erased();  // true, both are "std::vector"
 * strings.GetArgument(0);             // descriptor of std::string
 * @endcode
 *
 * Only templates whose parameters are all types are decomposed. A type such
 * as std::array<int, 4> is described as a plain type without arguments.
 */

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace Beacon {
namespace Reflect {

namespace detail {

/**
 * @brief Tag type standing for a whole template family (e.g. std::vector)
 */
template<template<typename...> class G>
struct TemplateFamily {};

template<typename T>
struct Specialization {
    static constexpr bool value = false;
};

template<template<typename...> class G, typename... Args>
struct Specialization<G<Args...>> {
    static constexpr bool value = true;
    using Family = TemplateFamily<G>;
};

/**
 * @brief Demangle a type_info name (GCC/Clang), pass through otherwise
 */
[[nodiscard]] std::string DemangleTypeName(const char* mangledName);

} // namespace detail

class TypeDescriptor {
public:
    /**
     * @brief Describe T exactly, including its template arguments
     */
    template<typename T>
    [[nodiscard]] static TypeDescriptor Of() {
        using Type = std::remove_cvref_t<T>;

        if constexpr (detail::Specialization<Type>::value) {
            return DescribeSpecialization<Type>(
                static_cast<Type*>(nullptr));
        } else {
            return TypeDescriptor(typeid(Type));
        }
    }

    /**
     * @brief Describe a class token
     *
     * A type_info carries no template-argument metadata, so the result is
     * never parameterized. It still compares equal to Of<T>() for the same T.
     */
    explicit TypeDescriptor(const std::type_info& clazz);

    [[nodiscard]] std::type_index GetTypeIndex() const noexcept { return m_type; }
    [[nodiscard]] const std::string& GetName() const noexcept { return m_name; }

    /**
     * @brief True when this describes a template specialization with arguments
     */
    [[nodiscard]] bool IsParameterized() const noexcept { return !m_arguments.empty(); }

    /**
     * @brief True when this is the erased form of a template family
     */
    [[nodiscard]] bool IsErased() const noexcept { return m_erased; }

    [[nodiscard]] const std::vector<TypeDescriptor>& GetArguments() const noexcept { return m_arguments; }

    /**
     * @throws std::out_of_range if index >= argument count
     */
    [[nodiscard]] const TypeDescriptor& GetArgument(size_t index) const;

    /**
     * @brief Drop template arguments
     *
     * A specialization erases to its template family, shared by every
     * specialization of that family. Any other descriptor erases to itself.
     */
    [[nodiscard]] TypeDescriptor Erased() const;

    [[nodiscard]] bool operator==(const TypeDescriptor& other) const noexcept {
        return m_type == other.m_type;
    }

    [[nodiscard]] bool operator!=(const TypeDescriptor& other) const noexcept {
        return !(*this == other);
    }

    [[nodiscard]] size_t Hash() const noexcept { return m_type.hash_code(); }

private:
    TypeDescriptor(std::type_index type, std::string name, bool erased);

    TypeDescriptor(const std::type_info& type, const std::type_info& family,
                   std::vector<TypeDescriptor> arguments);

    template<typename Type, template<typename...> class G, typename... Args>
    static TypeDescriptor DescribeSpecialization(G<Args...>*) {
        return TypeDescriptor(typeid(Type), typeid(detail::TemplateFamily<G>),
                              std::vector<TypeDescriptor>{Of<Args>()...});
    }

    std::type_index m_type;
    std::optional<std::type_index> m_family;
    std::vector<TypeDescriptor> m_arguments;
    std::string m_name;
    bool m_erased = false;
};

std::ostream& operator<<(std::ostream& os, const TypeDescriptor& descriptor);

} // namespace Reflect
} // namespace Beacon

template<>
struct std::hash<Beacon::Reflect::TypeDescriptor> {
    size_t operator()(const Beacon::Reflect::TypeDescriptor& descriptor) const noexcept {
        return descriptor.Hash();
    }
};
