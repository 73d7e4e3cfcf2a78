#include "reflection/TypeReference.hpp"

namespace Beacon {
namespace Reflect {

TypeReferenceBase::TypeReferenceBase(const TypeDescriptor& carrier)
    : m_descriptor(Capture(carrier)) {}

TypeDescriptor TypeReferenceBase::Capture(const TypeDescriptor& carrier) {
    // No template arguments at all: nothing was declared to read from
    if (!carrier.IsParameterized()) {
        throw MissingTypeParameterError(carrier.GetName());
    }

    // An argument slot exists but was left at its placeholder
    const TypeDescriptor& argument = carrier.GetArgument(0);
    if (argument == TypeDescriptor::Of<Unspecified>()) {
        throw MissingTypeParameterError(carrier.GetName());
    }

    return argument;
}

} // namespace Reflect
} // namespace Beacon
