/**
 * @file composition_root.cpp
 * @brief Builds two registries from configuration and resolves through every overload
 *
 * Usage: beacon_example [config.json]
 */

#include "Beacon.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace Beacon;
using namespace Beacon::Reflect;

namespace {

class IGreeter {
public:
    virtual ~IGreeter() = default;
    virtual std::string Greet(const std::string& name) const = 0;
};

class ConsoleGreeter : public IGreeter {
public:
    explicit ConsoleGreeter(std::string greeting) : m_greeting(std::move(greeting)) {}
    std::string Greet(const std::string& name) const override { return m_greeting + ", " + name; }

private:
    std::string m_greeting;
};

template<typename T>
struct Cache {
    std::map<std::string, T> entries;
};

struct Routes : TypeReference<std::map<std::string, std::string>> {};

void RegisterServices(ServiceRegistry& registry) {
    registry.Register<IGreeter>(std::make_shared<ConsoleGreeter>("Hello"));
    registry.Register<std::vector<std::string>>(
        std::make_shared<std::vector<std::string>>(std::vector<std::string>{"north", "south"}));
    registry.Register(Routes{}, std::make_shared<std::map<std::string, std::string>>(
        std::map<std::string, std::string>{{"/", "index"}, {"/about", "about"}}));
    registry.RegisterLazy<Cache<int>>([]() {
        APP_LOG_DEBUG("Building integer cache");
        auto cache = std::make_shared<Cache<int>>();
        cache->entries["answer"] = 42;
        return cache;
    });
}

void Demonstrate(ServiceLocator& locator) {
    // Exact, thread-safe
    auto regions = locator.Resolve(TypeReference<std::vector<std::string>>{});
    APP_LOG_INFO("Regions: {}", regions->size());

    auto routes = locator.Resolve(Routes{});
    APP_LOG_INFO("Routes: {}", routes->size());

    // Class token
    auto greeter = locator.Resolve<IGreeter>(typeid(IGreeter));
    APP_LOG_INFO("{}", greeter->Greet("composition root"));

    // Catalog lookup must be guarded
    std::shared_ptr<Cache<int>> cache;
    {
        std::scoped_lock lock(TypeCatalog::Instance().GetMutex());
        cache = locator.ResolveUnsafe<Cache<int>>();
    }
    APP_LOG_INFO("Cache answer: {}", cache->entries.at("answer"));

    // Only one Cache specialization is bound, so the erased key finds it
    // unless the registry has erased lookup switched off
    try {
        auto erased = locator.ResolveErased<Cache<int>>();
        APP_LOG_INFO("Erased lookup returned the same cache: {}", erased == cache);
    } catch (const UnresolvedServiceError& e) {
        APP_LOG_WARN("Erased lookup refused: {}", e.what());
    }

    const TypeReference<std::vector<int>>* missing = nullptr;
    try {
        (void)locator.Resolve(missing);
    } catch (const InvalidArgumentError& e) {
        APP_LOG_WARN("Rejected: {}", e.what());
    }

    try {
        (void)locator.Resolve(TypeReference<std::vector<int>>{});
    } catch (const UnresolvedServiceError& e) {
        APP_LOG_WARN("Expected failure: {}", e.what());
    }
}

} // namespace

int main(int argc, char** argv) {
    Config config;
    if (argc > 1) {
        if (auto result = config.Load(argv[1]); !result) {
            spdlog::error("Could not load {}, using defaults", argv[1]);
        }
    }

    Logger::Configure(config);

    ServiceRegistry primary(config);
    ServiceRegistry secondary("secondary", RegistryOptions{.allowOverride = false, .erasedLookup = false});

    RegisterServices(primary);
    RegisterServices(secondary);
    primary.DumpServices();

    try {
        Demonstrate(primary);

        // Same requests, different composition root
        Demonstrate(secondary);
    } catch (const ServiceResolutionError& e) {
        APP_LOG_ERROR("[{}] {}", e.GetDescriptor().GetName(), e.what());
    }

    Logger::Shutdown();
    return 0;
}
