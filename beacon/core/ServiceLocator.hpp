#pragma once

/**
 * @file ServiceLocator.hpp
 * @brief Resolution contract of the Beacon service locator
 *
 * Every way of naming "the type I want" is projected onto one TypeDescriptor
 * and handed to the single canonical operation, Resolve(descriptor). The
 * overloads differ only in how much of the type survives the projection:
 *
 * | Overload                        | Key                          | Precision  |
 * |---------------------------------|------------------------------|------------|
 * | Resolve(TypeReference<T>)       | captured descriptor          | exact      |
 * | ResolveUnsafe<T>()              | TypeCatalog descriptor       | exact, NOT thread-safe |
 * | ResolveErased<T>()              | template family of T         | lossy      |
 * | Resolve<T>(typeid(C))           | class token                  | exact, no argument metadata |
 *
 * A failed lookup is never retried through another overload.
 *
 * @section usage Basic Usage
 * @code{.cpp}
 * ServiceRegistry registry("game");
 * registry.Register<ILogService>(std::make_shared<ConsoleLogService>());
 * registry.Register<std::vector<std::string>>(std::make_shared<std::vector<std::string>>());
 *
 * ServiceLocator& locator = registry;
 * auto log   = locator.Resolve<ILogService>(typeid(ILogService));
 * auto names = locator.Resolve(TypeReference<std::vector<std::string>>{});
 * @endcode
 *
 * There is no global locator. A composition root creates one and passes it
 * to whatever needs to resolve services.
 */

#include "core/ServiceErrors.hpp"
#include "core/ServiceInstance.hpp"
#include "reflection/TypeCatalog.hpp"
#include "reflection/TypeDescriptor.hpp"
#include "reflection/TypeReference.hpp"

#include <memory>
#include <typeinfo>

namespace Beacon {

class ServiceLocator {
public:
    virtual ~ServiceLocator() = default;

    // -------------------------------------------------------------------------
    // Canonical Resolution
    // -------------------------------------------------------------------------

    /**
     * @brief Resolve a service registered in the locator
     *
     * The one true lookup primitive. Every other overload ends here.
     *
     * @param descriptor Exact type to look up
     * @return The bound instance and the descriptor it was bound under
     * @throws UnresolvedServiceError if nothing is bound to descriptor
     * @throws AmbiguousServiceError if the registry cannot pick one binding
     */
    [[nodiscard]] ServiceInstance Resolve(const Reflect::TypeDescriptor& descriptor) {
        return DoResolve(descriptor);
    }

    /**
     * @brief Typed form of the canonical operation
     * @throws ServiceTypeMismatchError if the bound instance is not a T
     */
    template<typename T>
    [[nodiscard]] std::shared_ptr<T> Resolve(const Reflect::TypeDescriptor& descriptor) {
        return Resolve(descriptor).template As<T>(descriptor);
    }

    // -------------------------------------------------------------------------
    // Convenience Overloads
    // -------------------------------------------------------------------------

    /**
     * @brief Resolve through an explicit type reference
     *
     * The only overload guaranteed to keep template arguments without touching
     * shared reflective state. Prefer it whenever a service may be resolved
     * from several threads.
     *
     * @code{.cpp}
     * auto routes = locator.Resolve(TypeReference<std::map<std::string, Route>>{});
     * @endcode
     */
    template<typename T>
    [[nodiscard]] std::shared_ptr<T> Resolve(const Reflect::TypeReference<T>& typeReference) {
        return Resolve<T>(typeReference.GetDescriptor());
    }

    /**
     * @copydoc Resolve(const Reflect::TypeReference<T>&)
     * @throws InvalidArgumentError if typeReference is null, before any lookup
     */
    template<typename T>
    [[nodiscard]] std::shared_ptr<T> Resolve(const Reflect::TypeReference<T>* typeReference) {
        if (typeReference == nullptr) {
            throw InvalidArgumentError("Type reference can't be null");
        }
        return Resolve<T>(typeReference->GetDescriptor());
    }

    /**
     * @brief Resolve using the TypeCatalog description of T
     *
     * @warning NOT thread-safe. TypeCatalog memoizes descriptors without
     * locking, so concurrent callers must guard the call:
     * @code{.cpp}
     * std::shared_ptr<Cache<Texture>> textures;
     * {
     *     std::scoped_lock lock(Reflect::TypeCatalog::Instance().GetMutex());
     *     textures = locator.ResolveUnsafe<Cache<Texture>>();
     * }
     * @endcode
     * As a workaround, use the TypeReference overload.
     */
    template<typename T>
    [[nodiscard]] std::shared_ptr<T> ResolveUnsafe() {
        return Resolve<T>(Reflect::TypeCatalog::Instance().Describe<T>());
    }

    /**
     * @brief Resolve by the erased form of T
     *
     * @warning Template arguments are dropped: std::vector<std::string> and
     * std::vector<int> are the same request. Which binding answers is the
     * registry's erased-key policy; a sibling specialization is reported as
     * ServiceTypeMismatchError rather than returned.
     */
    template<typename T>
    [[nodiscard]] std::shared_ptr<T> ResolveErased() {
        return Resolve<T>(Reflect::TypeDescriptor::Of<T>().Erased());
    }

    /**
     * @brief Resolve by class or interface token
     * @param clazz typeid of the class or interface
     */
    template<typename T>
    [[nodiscard]] std::shared_ptr<T> Resolve(const std::type_info& clazz) {
        return Resolve<T>(Reflect::TypeDescriptor(clazz));
    }

protected:
    /**
     * @brief Registry lookup behind the canonical operation
     *
     * Implementations look up the exact descriptor and throw
     * UnresolvedServiceError / AmbiguousServiceError on failure.
     */
    virtual ServiceInstance DoResolve(const Reflect::TypeDescriptor& descriptor) = 0;
};

} // namespace Beacon
