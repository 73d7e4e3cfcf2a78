#pragma once

#include "core/ServiceErrors.hpp"
#include "reflection/TypeDescriptor.hpp"

#include <memory>
#include <type_traits>
#include <typeinfo>

namespace Beacon {

/**
 * @brief Untyped answer of a resolution
 *
 * Pairs the object with the descriptor it was bound under, so the typed
 * accessors can check the cast instead of trusting it.
 */
class ServiceInstance {
public:
    ServiceInstance(Reflect::TypeDescriptor bound, std::shared_ptr<void> object)
        : m_bound(std::move(bound))
        , m_object(std::move(object)) {}

    [[nodiscard]] const Reflect::TypeDescriptor& GetDescriptor() const noexcept { return m_bound; }
    [[nodiscard]] const std::shared_ptr<void>& Get() const noexcept { return m_object; }

    template<typename T>
    [[nodiscard]] bool Is() const noexcept {
        return m_bound.GetTypeIndex() == std::type_index(typeid(std::remove_cv_t<T>));
    }

    /**
     * @brief Cast to the bound type
     * @param requested Descriptor of the lookup, reported on failure
     * @throws ServiceTypeMismatchError if the binding is not a T
     */
    template<typename T>
    [[nodiscard]] std::shared_ptr<T> As(const Reflect::TypeDescriptor& requested) const {
        if (!Is<T>()) {
            throw ServiceTypeMismatchError(requested, Reflect::TypeDescriptor::Of<T>(), m_bound);
        }
        return std::static_pointer_cast<T>(m_object);
    }

private:
    Reflect::TypeDescriptor m_bound;
    std::shared_ptr<void> m_object;
};

} // namespace Beacon
