#pragma once

#include "services/ServiceBase.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "ConversionOrchestrator.h"
#include "Level.h"
#include "ReferenceResolver.h"
#include "plugins/CommandRegistry.h"

namespace FCBForge {

class ConversionCacheService;

/**
 * @brief Level commands: load, save, reference checks and entity editing
 *
 * Every command opens the level named on its command line, or the one in
 * the configuration, applies its change through the resolver and saves the
 * dirty files back through the orchestrator.
 */
class LevelService : public ServiceBase {
public:
    LevelService() = default;
    ~LevelService() override = default;

    // ServiceBase interface
    void initialize(const std::string& context = "") override;
    void cleanup() override;
    bool isInitialized() const override { return initialized_; }

    ServiceLifecycle getLifecycle() const override { return ServiceLifecycle::ON_DEMAND; }
    ServiceScope getScope() const override { return ServiceScope::SINGLETON; }
    bool shouldAutoInitialize() const override { return false; }
    void onLifecycleEvent(ServiceLifecycle event, const std::string& context = "") override;

    const ReferenceResolver& resolver() const { return *resolver_; }
    ConversionOrchestrator makeOrchestrator() const;

    /**
     * @brief Loads a level and prints its load report
     * @return the level, or nullptr when its directory cannot be listed
     */
    std::unique_ptr<Level> openLevel(const std::string& containerDir, const std::string& sectorDir,
                                     LoadReport& report) const;
    // Saves every dirty file and prints the save report, true when nothing failed
    bool saveLevel(Level& level) const;

    // Command entry points
    int loadCommand(const std::vector<std::string>& args) const;
    int saveCommand(const std::vector<std::string>& args) const;
    int refsCommand(const std::vector<std::string>& args) const;
    int renumberCommand(const std::vector<std::string>& args) const;
    int duplicateCommand(const std::vector<std::string>& args) const;
    int removeCommand(const std::vector<std::string>& args) const;
    int exportCommand(const std::vector<std::string>& args) const;
    int importCommand(const std::vector<std::string>& args) const;

    static void registerCommands(CommandTable& commandTable);

private:
    static LevelService* getInstance();
    std::unique_ptr<Level> openConfiguredLevel(const std::vector<std::string>& args, size_t firstDirArg) const;
    ConversionCacheService* cacheService() const;

    std::unique_ptr<ReferenceResolver> resolver_;
    bool initialized_ = false;
    mutable std::mutex serviceMutex_;
};

} // namespace FCBForge
