#include "core/ServiceRegistry.hpp"
#include "core/Logger.hpp"

namespace Beacon {

RegistryOptions RegistryOptions::FromConfig(const Config& config) {
    RegistryOptions options;
    options.allowOverride = config.Get<bool>("registry.allowOverride", options.allowOverride);
    options.erasedLookup = config.Get<bool>("registry.erasedLookup", options.erasedLookup);
    return options;
}

ServiceRegistry::ServiceRegistry(std::string name, RegistryOptions options)
    : m_name(std::move(name))
    , m_options(options) {}

ServiceRegistry::ServiceRegistry(const Config& config)
    : ServiceRegistry(config.Get<std::string>("registry.name", "default"),
                      RegistryOptions::FromConfig(config)) {}

void ServiceRegistry::Bind(Reflect::TypeDescriptor descriptor,
                           std::shared_ptr<detail::ServiceEntry> entry) {
    std::unique_lock lock(m_mutex);

    auto it = m_services.find(descriptor);
    if (it != m_services.end()) {
        if (!m_options.allowOverride) {
            BEACON_LOG_ERROR("[{}] Refusing to override service {}", m_name, descriptor.GetName());
            throw DuplicateServiceError(descriptor);
        }
        BEACON_LOG_WARN("[{}] Overriding service {}", m_name, descriptor.GetName());
        it->second = std::move(entry);
        return;
    }

    BEACON_LOG_DEBUG("[{}] Registered service {}{}", m_name, descriptor.GetName(),
                     entry->isLazy ? " [lazy]" : "");
    m_services.emplace(std::move(descriptor), std::move(entry));
}

bool ServiceRegistry::Unregister(const Reflect::TypeDescriptor& descriptor) {
    std::unique_lock lock(m_mutex);
    return m_services.erase(descriptor) > 0;
}

bool ServiceRegistry::Has(const Reflect::TypeDescriptor& descriptor) const {
    std::shared_lock lock(m_mutex);
    return m_services.find(descriptor) != m_services.end();
}

void ServiceRegistry::Clear() {
    std::unique_lock lock(m_mutex);
    m_services.clear();
}

size_t ServiceRegistry::GetServiceCount() const {
    std::shared_lock lock(m_mutex);
    return m_services.size();
}

ServiceInstance ServiceRegistry::DoResolve(const Reflect::TypeDescriptor& descriptor) {
    auto [bound, entry] = FindEntry(descriptor);

    // Outside the registry lock: a lazy factory may resolve or register services
    auto object = entry->GetOrCreate();
    if (!object) {
        BEACON_LOG_DEBUG("[{}] Factory for {} produced no instance", m_name, bound.GetName());
        throw UnresolvedServiceError(descriptor, "factory produced no instance");
    }
    return ServiceInstance(std::move(bound), std::move(object));
}

std::pair<Reflect::TypeDescriptor, std::shared_ptr<detail::ServiceEntry>>
ServiceRegistry::FindEntry(const Reflect::TypeDescriptor& descriptor) const {
    std::shared_lock lock(m_mutex);

    // Exact match always wins
    auto it = m_services.find(descriptor);
    if (it != m_services.end()) {
        return {it->first, it->second};
    }

    if (descriptor.IsErased() && m_options.erasedLookup) {
        std::vector<Reflect::TypeDescriptor> candidates;
        std::shared_ptr<detail::ServiceEntry> match;

        for (const auto& [bound, entry] : m_services) {
            if (bound.IsParameterized() && bound.Erased() == descriptor) {
                candidates.push_back(bound);
                match = entry;
            }
        }

        if (candidates.size() == 1) {
            return {candidates.front(), std::move(match)};
        }
        if (candidates.size() > 1) {
            BEACON_LOG_DEBUG("[{}] Erased key {} matches {} services", m_name,
                             descriptor.GetName(), candidates.size());
            throw AmbiguousServiceError(descriptor, std::move(candidates));
        }
    }

    BEACON_LOG_DEBUG("[{}] No service bound to {}", m_name, descriptor.GetName());
    throw UnresolvedServiceError(descriptor);
}

std::vector<std::string> ServiceRegistry::GetRegisteredServices() const {
    std::shared_lock lock(m_mutex);

    std::vector<std::string> result;
    result.reserve(m_services.size());

    for (const auto& [descriptor, entry] : m_services) {
        std::string status = entry->isLazy
            ? (entry->isInitialized.load() ? " [lazy:initialized]" : " [lazy:pending]")
            : " [eager]";
        result.push_back(descriptor.GetName() + status);
    }

    return result;
}

void ServiceRegistry::DumpServices() const {
    auto services = GetRegisteredServices();
    BEACON_LOG_INFO("=== ServiceRegistry '{}' ===", m_name);
    BEACON_LOG_INFO("Total services: {}", services.size());
    for (const auto& service : services) {
        BEACON_LOG_INFO("  - {}", service);
    }
}

} // namespace Beacon
