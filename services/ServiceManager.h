#pragma once

#include "ServiceBase.h"

#include <string>
#include <functional>
#include <memory>
#include <map>
#include <mutex>
#include <vector>

#include "plugins/CommandRegistry.h"

namespace FCBForge {

/**
 * @brief Service factory function type
 */
using ServiceFactory = std::function<std::unique_ptr<ServiceBase>()>;

/**
 * @brief Unified service manager for dynamic service registration and loading
 *
 * Services register themselves using static initialization through
 * REGISTER_SERVICE; instances are created on demand or when their
 * lifecycle phase starts.
 */
class ServiceManager {
public:
    /**
     * @brief Register a service factory
     * @param serviceName Name of the service
     * @param factory Factory function to create the service
     * @return true if registered successfully
     */
    static bool registerService(const std::string& serviceName, ServiceFactory factory);

    /**
     * @brief Create a service instance by name
     * @param serviceName Name of the service to create
     * @return Unique pointer to the service instance, or nullptr if not found
     */
    static std::unique_ptr<ServiceBase> createService(const std::string& serviceName);

    /**
     * @brief Get all registered service names
     * @return Vector of service names
     */
    static std::vector<std::string> getAvailableServices();

    /**
     * @brief Check if a service is registered
     * @param serviceName Name of the service
     * @return true if registered
     */
    static bool isServiceRegistered(const std::string& serviceName);

    /**
     * @brief Get or create a singleton service instance
     * @param serviceName Name of the service
     * @return Pointer to the service instance, or nullptr if not found
     */
    static ServiceBase* getService(const std::string& serviceName);

    /**
     * @brief Register a singleton service instance, replacing any existing one
     * @param serviceName Name of the service
     * @param service Unique pointer to the service instance
     */
    static void registerServiceInstance(const std::string& serviceName, std::unique_ptr<ServiceBase> service);

    /**
     * @brief Release every live instance (registered factories stay)
     */
    static void releaseInstances();

    // Lifecycle management methods
    static void onApplicationStart();
    static void onApplicationShutdown();

    /**
     * @brief Level load/save lifecycle
     * @param levelPath The level container directory
     */
    static void onLevelLoadStart(const std::string& levelPath);
    static void onLevelLoadEnd(const std::string& levelPath);
    static void onLevelSaveStart(const std::string& levelPath);
    static void onLevelSaveEnd(const std::string& levelPath);

    /**
     * @brief Register service commands to the command table
     * @param commandTable The command table to register commands to
     */
    static void registerCommands(CommandTable& commandTable);

private:
    static std::map<std::string, ServiceFactory>& getRegistry();
    static std::map<std::string, std::unique_ptr<ServiceBase>>& getInstances();
    static std::recursive_mutex& getMutex();

    // Lifecycle management helpers
    static void initializeServicesByLifecycle(ServiceLifecycle lifecycle, const std::string& context = "");
    static void cleanupServicesByScope(ServiceScope scope);
    static void notifyServicesOfEvent(ServiceLifecycle event, const std::string& context = "");
};

} // namespace FCBForge
