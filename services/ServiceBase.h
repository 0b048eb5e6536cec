#pragma once

#include <functional>
#include <memory>
#include <string>

#include "plugins/CommandRegistry.h"

namespace FCBForge {

// Service lifecycle phases
enum class ServiceLifecycle {
  // Application-level lifecycles
  APPLICATION_START,    // When app starts (ConversionCache)
  APPLICATION_SHUTDOWN, // When app shuts down

  // Level operation lifecycles, context is the container directory
  LEVEL_LOAD_START, // Before the files of a level are read
  LEVEL_LOAD_END,   // After every file is loaded or reported
  LEVEL_SAVE_START, // Before dirty files are written
  LEVEL_SAVE_END,   // After the save report is built

  // On-demand lifecycles
  ON_DEMAND,   // Only when explicitly requested
  ON_FIRST_USE // Lazy initialization on first access
};

// Service scoping
enum class ServiceScope {
    SINGLETON,        // One instance for entire application
    LEVEL_SCOPED,     // One instance per level load/save
    OPERATION_SCOPED  // One instance per operation
};

/**
 * @brief Base interface for all services managed by ServiceManager
 *
 * Services provide shared functionality to the plugins and commands and
 * are created and released according to their lifecycle and scope.
 */
class ServiceBase {
public:
    virtual ~ServiceBase() = default;

    /**
     * @brief Initialize the service
     * @param context Lifecycle context, e.g. a level directory
     */
    virtual void initialize(const std::string& context = "") = 0;

    /**
     * @brief Clean up the service and release resources
     */
    virtual void cleanup() = 0;

    /**
     * @brief Check if the service is currently initialized
     * @return true if initialized, false otherwise
     */
    virtual bool isInitialized() const = 0;

    // Lifecycle management methods
    /**
     * @brief Get the lifecycle phase when this service should be initialized
     * @return The lifecycle phase
     */
    virtual ServiceLifecycle getLifecycle() const = 0;

    /**
     * @brief Get the scope of this service instance
     * @return The service scope
     */
    virtual ServiceScope getScope() const = 0;

    /**
     * @brief Check if this service should be auto-initialized
     * @return true if auto-initialize, false otherwise
     */
    virtual bool shouldAutoInitialize() const = 0;

    /**
     * @brief Handle lifecycle events
     * @param event The lifecycle event
     * @param context Additional context data (level directory, file name)
     */
    virtual void onLifecycleEvent(ServiceLifecycle event, const std::string& context = "") = 0;

    // Register service commands (static method to avoid instantiation)
    static void registerCommands(CommandTable& commandTable) {}

    /**
     * @brief Register a service factory with the service manager
     * @param serviceName Name of the service
     * @param factory Factory function to create the service
     * @return true if registered successfully
     */
    static bool registerServiceFactory(const std::string& serviceName,
                                      std::function<std::unique_ptr<ServiceBase>()> factory);

    // Static command registry shared by all services
    static CommandTable& getCommandRegistry();
};

// Macro for easy service registration
#define REGISTER_SERVICE(ServiceClass) \
    namespace { \
        static bool registered_##ServiceClass = [] { \
            FCBForge::ServiceClass::registerCommands(FCBForge::ServiceBase::getCommandRegistry()); \
            return FCBForge::ServiceBase::registerServiceFactory( \
                #ServiceClass, \
                []() -> std::unique_ptr<FCBForge::ServiceBase> { \
                    return std::make_unique<FCBForge::ServiceClass>(); \
                }); \
        }(); \
    }

} // namespace FCBForge
