#include "ServiceManager.h"

#include "core/Logging/Logging.h"

namespace FCBForge {

std::map<std::string, ServiceFactory>& ServiceManager::getRegistry() {
    static std::map<std::string, ServiceFactory> registry;
    return registry;
}

std::map<std::string, std::unique_ptr<ServiceBase>>& ServiceManager::getInstances() {
    static std::map<std::string, std::unique_ptr<ServiceBase>> instances;
    return instances;
}

// One lock for registry and instances; lifecycle helpers call back into getService
std::recursive_mutex& ServiceManager::getMutex() {
    static std::recursive_mutex mutex;
    return mutex;
}

bool ServiceManager::registerService(const std::string& serviceName, ServiceFactory factory) {
    std::lock_guard<std::recursive_mutex> lock(getMutex());

    auto& registry = getRegistry();

    if (registry.find(serviceName) != registry.end()) {
        Log(WARNING, "ServiceManager", "Service {} already registered, skipping", serviceName);
        return false;
    }

    registry[serviceName] = factory;
    Log(DEBUG, "ServiceManager", "Dynamically registered service: {}", serviceName);
    return true;
}

std::unique_ptr<ServiceBase> ServiceManager::createService(const std::string& serviceName) {
    std::lock_guard<std::recursive_mutex> lock(getMutex());

    auto& registry = getRegistry();
    auto it = registry.find(serviceName);
    if (it == registry.end()) {
        Log(ERROR, "ServiceManager", "Service not found: {}", serviceName);
        return nullptr;
    }

    try {
        return it->second();
    } catch (const std::exception& e) {
        Log(ERROR, "ServiceManager", "Failed to create service {}: {}", serviceName, e.what());
        return nullptr;
    }
}

std::vector<std::string> ServiceManager::getAvailableServices() {
    std::lock_guard<std::recursive_mutex> lock(getMutex());

    auto& registry = getRegistry();
    std::vector<std::string> services;
    services.reserve(registry.size());

    for (const auto& [name, factory] : registry) {
        services.push_back(name);
    }

    return services;
}

bool ServiceManager::isServiceRegistered(const std::string& serviceName) {
    std::lock_guard<std::recursive_mutex> lock(getMutex());
    auto& registry = getRegistry();
    return registry.find(serviceName) != registry.end();
}

ServiceBase* ServiceManager::getService(const std::string& serviceName) {
    std::lock_guard<std::recursive_mutex> lock(getMutex());

    auto& instances = getInstances();

    // Check if service instance already exists
    auto it = instances.find(serviceName);
    if (it != instances.end()) {
        return it->second.get();
    }

    // Try to create a new service instance
    auto newService = createService(serviceName);
    if (newService) {
        if (!newService->isInitialized()) {
            newService->initialize();
        }
        auto* servicePtr = newService.get();
        instances[serviceName] = std::move(newService);
        Log(DEBUG, "ServiceManager", "Created singleton service instance: {}", serviceName);
        return servicePtr;
    }

    Log(ERROR, "ServiceManager", "Failed to create service instance: {}", serviceName);
    return nullptr;
}

void ServiceManager::registerServiceInstance(const std::string& serviceName, std::unique_ptr<ServiceBase> service) {
    std::lock_guard<std::recursive_mutex> lock(getMutex());

    auto& instances = getInstances();

    auto it = instances.find(serviceName);
    if (it != instances.end()) {
        Log(WARNING, "ServiceManager", "Service instance {} already registered, replacing", serviceName);
        if (it->second) {
            it->second->cleanup();
        }
    }

    instances[serviceName] = std::move(service);
    Log(DEBUG, "ServiceManager", "Registered service instance: {}", serviceName);
}

void ServiceManager::releaseInstances() {
    std::lock_guard<std::recursive_mutex> lock(getMutex());

    auto& instances = getInstances();
    for (auto& [serviceName, service] : instances) {
        if (service) {
            service->cleanup();
        }
    }
    instances.clear();
    Log(DEBUG, "ServiceManager", "Released all service instances");
}

// Lifecycle management methods
void ServiceManager::onApplicationStart() {
    Log(DEBUG, "ServiceManager", "Application start lifecycle triggered");
    initializeServicesByLifecycle(ServiceLifecycle::APPLICATION_START);
    notifyServicesOfEvent(ServiceLifecycle::APPLICATION_START);
}

void ServiceManager::onApplicationShutdown() {
    Log(DEBUG, "ServiceManager", "Application shutdown lifecycle triggered");
    notifyServicesOfEvent(ServiceLifecycle::APPLICATION_SHUTDOWN);
    cleanupServicesByScope(ServiceScope::SINGLETON);
}

void ServiceManager::onLevelLoadStart(const std::string& levelPath) {
    Log(DEBUG, "ServiceManager", "Level load start lifecycle triggered for: {}", levelPath);
    initializeServicesByLifecycle(ServiceLifecycle::LEVEL_LOAD_START, levelPath);
    notifyServicesOfEvent(ServiceLifecycle::LEVEL_LOAD_START, levelPath);
}

void ServiceManager::onLevelLoadEnd(const std::string& levelPath) {
    Log(DEBUG, "ServiceManager", "Level load end lifecycle triggered for: {}", levelPath);
    notifyServicesOfEvent(ServiceLifecycle::LEVEL_LOAD_END, levelPath);
}

void ServiceManager::onLevelSaveStart(const std::string& levelPath) {
    Log(DEBUG, "ServiceManager", "Level save start lifecycle triggered for: {}", levelPath);
    initializeServicesByLifecycle(ServiceLifecycle::LEVEL_SAVE_START, levelPath);
    notifyServicesOfEvent(ServiceLifecycle::LEVEL_SAVE_START, levelPath);
}

void ServiceManager::onLevelSaveEnd(const std::string& levelPath) {
    Log(DEBUG, "ServiceManager", "Level save end lifecycle triggered for: {}", levelPath);
    notifyServicesOfEvent(ServiceLifecycle::LEVEL_SAVE_END, levelPath);
    cleanupServicesByScope(ServiceScope::LEVEL_SCOPED);
}

void ServiceManager::registerCommands(CommandTable& commandTable) {
    const CommandTable& registry = ServiceBase::getCommandRegistry();
    commandTable.insert(registry.begin(), registry.end());
}

// Private lifecycle management helpers
void ServiceManager::initializeServicesByLifecycle(ServiceLifecycle lifecycle, const std::string& context) {
    std::lock_guard<std::recursive_mutex> lock(getMutex());

    auto& registry = getRegistry();
    auto& instances = getInstances();

    for (const auto& [serviceName, factory] : registry) {
        if (instances.find(serviceName) != instances.end()) {
            continue;
        }
        // Create a temporary instance to check its lifecycle
        auto service = factory();
        if (service && service->getLifecycle() == lifecycle && service->shouldAutoInitialize()) {
            try {
                service->initialize(context);
            } catch (const std::exception& e) {
                Log(ERROR, "ServiceManager", "Failed to initialize service {}: {}", serviceName, e.what());
                continue;
            }
            instances[serviceName] = std::move(service);
            Log(DEBUG, "ServiceManager", "Auto-initialized service: {} for lifecycle: {}", serviceName, static_cast<int>(lifecycle));
        }
    }
}

void ServiceManager::cleanupServicesByScope(ServiceScope scope) {
    std::lock_guard<std::recursive_mutex> lock(getMutex());

    auto& instances = getInstances();

    for (auto it = instances.begin(); it != instances.end();) {
        if (it->second && it->second->getScope() == scope) {
            Log(DEBUG, "ServiceManager", "Cleaning up service: {} for scope: {}", it->first, static_cast<int>(scope));
            it->second->cleanup();
            it = instances.erase(it);
        } else {
            ++it;
        }
    }
}

void ServiceManager::notifyServicesOfEvent(ServiceLifecycle event, const std::string& context) {
    std::lock_guard<std::recursive_mutex> lock(getMutex());

    auto& instances = getInstances();

    for (auto& [serviceName, service] : instances) {
        if (service) {
            try {
                service->onLifecycleEvent(event, context);
            } catch (const std::exception& e) {
                Log(ERROR, "ServiceManager", "Error in service {} during lifecycle event {}: {}",
                    serviceName, static_cast<int>(event), e.what());
            }
        }
    }
}

} // namespace FCBForge
