#include "reflection/TypeCatalog.hpp"

namespace Beacon {
namespace Reflect {

TypeCatalog& TypeCatalog::Instance() {
    static TypeCatalog instance;
    return instance;
}

const TypeDescriptor* TypeCatalog::Find(std::type_index type) const {
    auto it = m_byIndex.find(type);
    return it != m_byIndex.end() ? &it->second : nullptr;
}

const TypeDescriptor* TypeCatalog::FindByName(std::string_view name) const {
    auto it = m_byName.find(std::string(name));
    if (it == m_byName.end()) {
        return nullptr;
    }
    return Find(it->second);
}

void TypeCatalog::Clear() {
    m_byIndex.clear();
    m_byName.clear();
}

TypeDescriptor TypeCatalog::Intern(const TypeDescriptor& descriptor) {
    for (const auto& argument : descriptor.GetArguments()) {
        if (m_byIndex.find(argument.GetTypeIndex()) == m_byIndex.end()) {
            Intern(argument);
        }
    }

    auto [it, inserted] = m_byIndex.try_emplace(descriptor.GetTypeIndex(), descriptor);
    if (inserted) {
        m_byName.try_emplace(descriptor.GetName(), descriptor.GetTypeIndex());
    }
    return it->second;
}

} // namespace Reflect
} // namespace Beacon
