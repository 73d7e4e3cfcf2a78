#include "reflection/TypeDescriptor.hpp"

#include <cstdlib>
#include <stdexcept>

// Platform-specific demangling support
#if defined(__GNUC__) || defined(__clang__)
#include <cxxabi.h>
#endif

namespace Beacon {
namespace Reflect {

namespace detail {

std::string DemangleTypeName(const char* mangledName) {
#if defined(__GNUC__) || defined(__clang__)
    int status = 0;
    char* demangled = abi::__cxa_demangle(mangledName, nullptr, nullptr, &status);
    if (status == 0 && demangled) {
        std::string result(demangled);
        std::free(demangled);
        return result;
    }
#endif
    // MSVC or fallback - name is already readable
    return std::string(mangledName);
}

} // namespace detail

namespace {

// "std::vector<int, std::allocator<int> >" -> "std::vector"
// Strips the trailing argument list only, so "Outer<int>::Inner<char>" -> "Outer<int>::Inner"
std::string FamilyName(const std::string& specializationName) {
    if (specializationName.empty() || specializationName.back() != '>') {
        return specializationName;
    }

    int depth = 0;
    for (size_t i = specializationName.size(); i-- > 0;) {
        if (specializationName[i] == '>') {
            ++depth;
        } else if (specializationName[i] == '<' && --depth == 0) {
            return specializationName.substr(0, i);
        }
    }
    return specializationName;
}

} // namespace

TypeDescriptor::TypeDescriptor(const std::type_info& clazz)
    : m_type(clazz)
    , m_name(detail::DemangleTypeName(clazz.name())) {}

TypeDescriptor::TypeDescriptor(std::type_index type, std::string name, bool erased)
    : m_type(type)
    , m_name(std::move(name))
    , m_erased(erased) {}

TypeDescriptor::TypeDescriptor(const std::type_info& type, const std::type_info& family,
                               std::vector<TypeDescriptor> arguments)
    : m_type(type)
    , m_family(std::type_index(family))
    , m_arguments(std::move(arguments))
    , m_name(detail::DemangleTypeName(type.name())) {}

const TypeDescriptor& TypeDescriptor::GetArgument(size_t index) const {
    if (index >= m_arguments.size()) {
        throw std::out_of_range("Type argument " + std::to_string(index) +
                                " out of range for " + m_name);
    }
    return m_arguments[index];
}

TypeDescriptor TypeDescriptor::Erased() const {
    if (!m_family) {
        return *this;
    }
    return TypeDescriptor(*m_family, FamilyName(m_name) + "<...>", true);
}

std::ostream& operator<<(std::ostream& os, const TypeDescriptor& descriptor) {
    return os << descriptor.GetName();
}

} // namespace Reflect
} // namespace Beacon
