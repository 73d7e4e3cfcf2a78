#pragma once

/**
 * @file ServiceRegistry.hpp
 * @brief Reference ServiceLocator keyed by TypeDescriptor
 *
 * Provides a registry for service interfaces with:
 * - Type-safe service registration, including template specializations
 * - Thread-safe access with read-write locking
 * - Lazy initialization support via factory functions
 * - Debug utilities for service inspection
 *
 * @section usage Basic Usage
 * @code{.cpp}
 * ServiceRegistry registry("editor");
 *
 * // Register a concrete service implementation
 * registry.Register<ILogService>(std::make_shared<ConsoleLogService>());
 *
 * // Register with lazy initialization
 * registry.RegisterLazy<IAssetService>([]() {
 *     return std::make_shared<AssetService>("assets/");
 * });
 *
 * // Resolve through any ServiceLocator overload
 * auto log = registry.Resolve(TypeReference<ILogService>{});
 * @endcode
 */

#include "config/Config.hpp"
#include "core/ServiceLocator.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Beacon {

// ============================================================================
// RegistryOptions
// ============================================================================

/**
 * @brief Registry behaviour switches
 */
struct RegistryOptions {
    /// Replace an existing binding on re-registration (otherwise DuplicateServiceError)
    bool allowOverride = true;

    /// Let an erased key match the parameterized bindings of its template family
    bool erasedLookup = true;

    /**
     * @brief Read registry.allowOverride and registry.erasedLookup
     */
    [[nodiscard]] static RegistryOptions FromConfig(const Config& config);
};

namespace detail {

/**
 * @brief Internal service entry storing either an instance or a factory
 *
 * Held by shared_ptr so a resolution in progress keeps it alive across a
 * concurrent Unregister.
 */
struct ServiceEntry {
    std::shared_ptr<void> instance;
    std::function<std::shared_ptr<void>()> factory;
    bool isLazy = false;
    std::atomic<bool> isInitialized{false};
    std::mutex initMutex;

    /**
     * @brief Get or create the service instance
     * @return Shared pointer to the service, null if a lazy factory produced none
     */
    std::shared_ptr<void> GetOrCreate() {
        if (!isLazy || isInitialized.load(std::memory_order_acquire)) {
            return instance;
        }

        // Double-checked locking for lazy initialization
        std::lock_guard<std::mutex> lock(initMutex);
        if (!isInitialized.load(std::memory_order_relaxed)) {
            if (factory) {
                instance = factory();
            }
            isInitialized.store(true, std::memory_order_release);
        }
        return instance;
    }
};

} // namespace detail

// ============================================================================
// ServiceRegistry
// ============================================================================

/**
 * @brief Concrete service locator owned by a composition root
 *
 * Thread Safety:
 * - Registration/unregistration operations are serialized
 * - Resolution can proceed concurrently
 * - Lazy initialization uses double-checked locking
 *
 * Disambiguation:
 * An exact descriptor match always wins. An erased key (from ResolveErased)
 * with no exact binding collects the parameterized bindings of its template
 * family; one candidate resolves, several raise AmbiguousServiceError.
 */
class ServiceRegistry final : public ServiceLocator {
public:
    explicit ServiceRegistry(std::string name = "default", RegistryOptions options = {});

    /**
     * @brief Create a registry from the "registry" section of a configuration
     */
    explicit ServiceRegistry(const Config& config);

    ServiceRegistry(const ServiceRegistry&) = delete;
    ServiceRegistry& operator=(const ServiceRegistry&) = delete;

    // -------------------------------------------------------------------------
    // Service Registration
    // -------------------------------------------------------------------------

    /**
     * @brief Register a service instance
     *
     * @tparam TInterface The interface type to register under
     * @tparam TImpl The implementation type (must be derived from TInterface)
     * @param instance Shared pointer to the service implementation
     * @throws DuplicateServiceError if overrides are disabled and TInterface is bound
     *
     * @code{.cpp}
     * auto service = std::make_shared<ConcreteService>();
     * registry.Register<IService>(service);
     * @endcode
     */
    template<typename TInterface, typename TImpl = TInterface>
    void Register(std::shared_ptr<TImpl> instance) {
        static_assert(std::is_base_of_v<TInterface, TImpl> || std::is_same_v<TInterface, TImpl>,
            "TImpl must be derived from TInterface");

        auto entry = std::make_shared<detail::ServiceEntry>();
        entry->instance = std::static_pointer_cast<void>(
            std::static_pointer_cast<TInterface>(std::move(instance)));
        entry->isInitialized.store(true);

        Bind(Reflect::TypeDescriptor::Of<TInterface>(), std::move(entry));
    }

    /**
     * @brief Register a service under the type captured by a carrier
     *
     * @code{.cpp}
     * registry.Register(TypeReference<std::vector<std::string>>{}, names);
     * @endcode
     */
    template<typename T>
    void Register(const Reflect::TypeReference<T>& typeReference, std::shared_ptr<T> instance) {
        auto entry = std::make_shared<detail::ServiceEntry>();
        entry->instance = std::static_pointer_cast<void>(std::move(instance));
        entry->isInitialized.store(true);

        Bind(typeReference.GetDescriptor(), std::move(entry));
    }

    /**
     * @brief Register a service with lazy initialization
     *
     * The factory will be called on first resolution to create the service.
     * Thread-safe: if multiple threads resolve simultaneously, only one will
     * call the factory. It runs without the registry lock held, so it may
     * resolve or register other services on the same registry.
     */
    template<typename TInterface>
    void RegisterLazy(std::function<std::shared_ptr<TInterface>()> factory) {
        auto entry = std::make_shared<detail::ServiceEntry>();
        entry->factory = [f = std::move(factory)]() -> std::shared_ptr<void> {
            return std::static_pointer_cast<void>(f());
        };
        entry->isLazy = true;

        Bind(Reflect::TypeDescriptor::Of<TInterface>(), std::move(entry));
    }

    /**
     * @brief Unregister a service
     *
     * @note This will release the shared_ptr reference. If this is the last
     *       reference, the service will be destroyed.
     */
    template<typename TInterface>
    bool Unregister() {
        return Unregister(Reflect::TypeDescriptor::Of<TInterface>());
    }

    /**
     * @return true if a binding was removed
     */
    bool Unregister(const Reflect::TypeDescriptor& descriptor);

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    /**
     * @brief Check if a service is registered
     * @return true if service is registered (may not be initialized yet for lazy)
     */
    template<typename TInterface>
    [[nodiscard]] bool Has() const {
        return Has(Reflect::TypeDescriptor::Of<TInterface>());
    }

    [[nodiscard]] bool Has(const Reflect::TypeDescriptor& descriptor) const;

    /**
     * @brief Clear all registered services
     */
    void Clear();

    [[nodiscard]] size_t GetServiceCount() const;

    [[nodiscard]] const std::string& GetName() const noexcept { return m_name; }

    [[nodiscard]] const RegistryOptions& GetOptions() const noexcept { return m_options; }

    // -------------------------------------------------------------------------
    // Debug Utilities
    // -------------------------------------------------------------------------

    /**
     * @brief Get list of all registered service type names
     *
     * @return Names with "[eager]", "[lazy:pending]" or "[lazy:initialized]"
     */
    [[nodiscard]] std::vector<std::string> GetRegisteredServices() const;

    /**
     * @brief Log all registered services at info level
     */
    void DumpServices() const;

protected:
    ServiceInstance DoResolve(const Reflect::TypeDescriptor& descriptor) override;

private:
    /**
     * @brief Pick the binding answering descriptor, under the shared lock
     * @throws UnresolvedServiceError, AmbiguousServiceError
     */
    [[nodiscard]] std::pair<Reflect::TypeDescriptor, std::shared_ptr<detail::ServiceEntry>>
    FindEntry(const Reflect::TypeDescriptor& descriptor) const;

    void Bind(Reflect::TypeDescriptor descriptor, std::shared_ptr<detail::ServiceEntry> entry);

    std::string m_name;
    RegistryOptions m_options;

    mutable std::shared_mutex m_mutex;
    std::unordered_map<Reflect::TypeDescriptor, std::shared_ptr<detail::ServiceEntry>> m_services;
};

// ============================================================================
// RAII Service Registration Helper
// ============================================================================

/**
 * @brief RAII helper for automatic service unregistration
 *
 * @code{.cpp}
 * {
 *     ScopedService<ILogService> scopedLog(registry, std::make_shared<MyLogger>());
 *     // Service is resolvable from registry
 * } // Service automatically unregistered
 * @endcode
 */
template<typename TInterface>
class ScopedService {
public:
    template<typename TImpl>
    ScopedService(ServiceRegistry& registry, std::shared_ptr<TImpl> instance)
        : m_registry(&registry) {
        m_registry->Register<TInterface, TImpl>(std::move(instance));
    }

    ~ScopedService() {
        if (m_registry) {
            m_registry->Unregister<TInterface>();
        }
    }

    // Non-copyable
    ScopedService(const ScopedService&) = delete;
    ScopedService& operator=(const ScopedService&) = delete;

    // Movable
    ScopedService(ScopedService&& other) noexcept
        : m_registry(std::exchange(other.m_registry, nullptr)) {}

    /**
     * Releases the current binding unless other is bound in the same
     * registry, where it already replaced it.
     */
    ScopedService& operator=(ScopedService&& other) noexcept {
        if (this != &other) {
            if (m_registry && m_registry != other.m_registry) {
                m_registry->Unregister<TInterface>();
            }
            m_registry = std::exchange(other.m_registry, nullptr);
        }
        return *this;
    }

private:
    ServiceRegistry* m_registry;
};

} // namespace Beacon
