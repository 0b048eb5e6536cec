#include "LevelService.h"

#include <iostream>

#include "core/CFG.h"
#include "core/Hashing.h"
#include "core/Logging/Logging.h"
#include "plugins/PluginBase.h"
#include "plugins/PluginManager.h"
#include "services/ConversionCacheService/ConversionCacheService.h"
#include "services/ServiceManager.h"

namespace FCBForge {

namespace {

    bool parseId(const std::string& text, uint64_t& id) {
        if (auto parsed = parseNodeId(text)) {
            id = *parsed;
            return true;
        }
        std::cerr << "Not a node ID: " << text << std::endl;
        return false;
    }

    std::string pathText(const NodePath& path) {
        std::string text;
        for (size_t i = 0; i < path.size(); ++i) {
            text += (i == 0 ? "" : "/") + std::to_string(path[i]);
        }
        return text;
    }

    void printReference(const Reference& reference) {
        std::cout << "  " << reference.source.file << ":" << pathText(reference.source.path) << " "
                  << formatHash(reference.attribute) << " -> " << reference.target << " ("
                  << referenceScopeName(reference.scope) << ")" << std::endl;
    }

    void printLoadReport(const LoadReport& report) {
        for (const auto& file : report.files) {
            std::cout << "  " << file.name << ": " << loadStatusName(file.status);
            if (file.status == FileLoadResult::Status::Loaded) {
                std::cout << " from " << authorityDecisionName(file.authority) << " (" << fileStateName(file.state);
                if (file.cacheHit) std::cout << ", cached";
                if (file.sidecarWritten) std::cout << ", markup written";
                std::cout << ")";
            } else if (file.error) {
                std::cout << " " << errorKindName(*file.error) << ": " << file.message;
            } else if (!file.message.empty()) {
                std::cout << ": " << file.message;
            }
            std::cout << std::endl;
        }
        std::cout << report.loadedCount() << "/" << report.files.size() << " files loaded" << std::endl;
    }

} // namespace

void LevelService::initialize(const std::string& context) {
    std::lock_guard<std::mutex> lock(serviceMutex_);
    ReferenceSchema schema;
    if (!FCBFORGE_CFG.ReferenceSchema.empty()) {
        if (!schema.loadFromFile(FCBFORGE_CFG.ReferenceSchema)) {
            Log(WARNING, "LevelService", "Using the built-in reference schema");
        }
    }
    resolver_ = std::make_unique<ReferenceResolver>(std::move(schema), FCBFORGE_CFG.DuplicateOffset);
    initialized_ = true;
    Log(DEBUG, "LevelService", "Initialized with {} reference rules", resolver_->schema().rules().size());
}

void LevelService::cleanup() {
    std::lock_guard<std::mutex> lock(serviceMutex_);
    resolver_.reset();
    initialized_ = false;
}

void LevelService::onLifecycleEvent(ServiceLifecycle event, const std::string& context) {
    if (event == ServiceLifecycle::LEVEL_LOAD_START) {
        Log(DEBUG, "LevelService", "Level load starting: {}", context);
    }
}

ConversionCacheService* LevelService::cacheService() const {
    return dynamic_cast<ConversionCacheService*>(ServiceManager::getService("ConversionCacheService"));
}

ConversionOrchestrator LevelService::makeOrchestrator() const {
    return ConversionOrchestrator(OrchestratorOptions::fromConfig(), cacheService(), resolver_.get());
}

std::unique_ptr<Level> LevelService::openLevel(const std::string& containerDir, const std::string& sectorDir,
                                               LoadReport& report) const {
    auto level = std::make_unique<Level>(containerDir, sectorDir);
    ServiceManager::onLevelLoadStart(containerDir);
    try {
        ConversionOrchestrator orchestrator = makeOrchestrator();
        report = orchestrator.loadLevel(*level);
    } catch (const FCBError& e) {
        Log(ERROR, "LevelService", "Cannot open level {}: {}", containerDir, e.what());
        ServiceManager::onLevelLoadEnd(containerDir);
        return nullptr;
    }
    ServiceManager::onLevelLoadEnd(containerDir);

    std::cout << "Level " << containerDir << ":" << std::endl;
    printLoadReport(report);
    return level;
}

std::unique_ptr<Level> LevelService::openConfiguredLevel(const std::vector<std::string>& args,
                                                         size_t firstDirArg) const {
    std::string container = args.size() > firstDirArg ? args[firstDirArg] : FCBFORGE_CFG.LevelPath;
    std::string sector;
    if (args.size() > firstDirArg + 1) {
        sector = args[firstDirArg + 1];
    } else if (!FCBFORGE_CFG.SectorPath.empty()) {
        sector = FCBFORGE_CFG.SectorPath;
    } else {
        sector = container;
    }

    if (container.empty()) {
        std::cerr << "No level directory given and LevelPath is not configured" << std::endl;
        return nullptr;
    }

    LoadReport report;
    auto level = openLevel(container, sector, report);
    if (level && !report.ok()) {
        std::cerr << "Level did not load cleanly, not modifying it" << std::endl;
        return nullptr;
    }
    return level;
}

bool LevelService::saveLevel(Level& level) const {
    ServiceManager::onLevelSaveStart(level.containerDir().string());
    ConversionOrchestrator orchestrator = makeOrchestrator();
    SaveReport report = orchestrator.saveLevel(level);
    ServiceManager::onLevelSaveEnd(level.containerDir().string());

    for (const auto& file : report.files) {
        std::cout << "  " << file.name << ": ";
        if (file.saved) {
            std::cout << "saved" << (file.sidecarWritten ? " (markup written)" : "");
        } else {
            std::cout << "FAILED " << (file.error ? errorKindName(*file.error) : "") << ": " << file.message;
        }
        std::cout << std::endl;
    }
    if (!report.danglingReferences.empty()) {
        std::cout << report.danglingReferences.size() << " dangling references:" << std::endl;
        for (const auto& reference : report.danglingReferences) {
            printReference(reference);
        }
    }
    std::cout << report.savedCount() << "/" << report.files.size() << " files saved" << std::endl;
    return report.ok();
}

int LevelService::loadCommand(const std::vector<std::string>& args) const {
    std::string container = !args.empty() ? args[0] : FCBFORGE_CFG.LevelPath;
    std::string sector = args.size() > 1 ? args[1] : (!FCBFORGE_CFG.SectorPath.empty() ? FCBFORGE_CFG.SectorPath : container);
    if (container.empty()) {
        std::cerr << "Usage: level load [container] [sectors]" << std::endl;
        return 1;
    }
    LoadReport report;
    auto level = openLevel(container, sector, report);
    return level && report.ok() ? 0 : 1;
}

int LevelService::saveCommand(const std::vector<std::string>& args) const {
    auto level = openConfiguredLevel(args, 0);
    if (!level) {
        return 1;
    }
    return saveLevel(*level) ? 0 : 1;
}

int LevelService::refsCommand(const std::vector<std::string>& args) const {
    std::string container = !args.empty() ? args[0] : FCBFORGE_CFG.LevelPath;
    std::string sector = args.size() > 1 ? args[1] : (!FCBFORGE_CFG.SectorPath.empty() ? FCBFORGE_CFG.SectorPath : container);
    if (container.empty()) {
        std::cerr << "Usage: level refs [container] [sectors]" << std::endl;
        return 1;
    }
    LoadReport report;
    auto level = openLevel(container, sector, report);
    if (!level) {
        return 1;
    }

    std::vector<Reference> references = resolver_->scan(*level);
    std::vector<Reference> dangling = resolver_->findDangling(*level);
    std::cout << references.size() << " references, " << resolver_->buildIdIndex(*level).locations.size()
              << " identities, " << dangling.size() << " dangling" << std::endl;
    for (const auto& reference : dangling) {
        printReference(reference);
    }
    return dangling.empty() ? 0 : 1;
}

int LevelService::renumberCommand(const std::vector<std::string>& args) const {
    uint64_t oldId = 0;
    uint64_t newId = 0;
    if (args.size() < 2) {
        std::cerr << "Usage: level renumber <old> <new> [container] [sectors]" << std::endl;
        return 1;
    }
    if (!parseId(args[0], oldId) || !parseId(args[1], newId)) {
        return 1;
    }
    auto level = openConfiguredLevel(args, 2);
    if (!level) {
        return 1;
    }

    try {
        RenumberResult result = resolver_->renumber(*level, oldId, newId);
        if (!result.found) {
            std::cout << "ID " << oldId << " not found, nothing to do" << std::endl;
            return 0;
        }
        std::cout << "Renumbered " << oldId << " -> " << newId << ": " << result.identitiesChanged
                  << " identities, " << result.referencesChanged << " references" << std::endl;
    } catch (const FCBError& e) {
        std::cerr << "Renumber failed: " << errorKindName(e.kind()) << ": " << e.what() << std::endl;
        return 1;
    }
    return saveLevel(*level) ? 0 : 1;
}

int LevelService::duplicateCommand(const std::vector<std::string>& args) const {
    uint64_t id = 0;
    if (args.empty()) {
        std::cerr << "Usage: entity duplicate <id> [container] [sectors]" << std::endl;
        return 1;
    }
    if (!parseId(args[0], id)) {
        return 1;
    }
    auto level = openConfiguredLevel(args, 1);
    if (!level) {
        return 1;
    }

    auto location = resolver_->findEntity(*level, id);
    if (!location) {
        std::cerr << "Entity " << id << " not found" << std::endl;
        return 1;
    }
    try {
        DuplicateResult result = resolver_->duplicate(*level, location->file, location->path);
        auto copyId = result.idMap.find(id);
        std::cout << "Duplicated " << id << " as " << (copyId != result.idMap.end() ? copyId->second : 0);
        if (!result.name.empty()) {
            std::cout << " '" << result.name << "'";
        }
        std::cout << " in " << result.copy.file << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Duplicate failed: " << e.what() << std::endl;
        return 1;
    }
    return saveLevel(*level) ? 0 : 1;
}

int LevelService::removeCommand(const std::vector<std::string>& args) const {
    uint64_t id = 0;
    if (args.empty()) {
        std::cerr << "Usage: entity remove <id> [container] [sectors]" << std::endl;
        return 1;
    }
    if (!parseId(args[0], id)) {
        return 1;
    }
    auto level = openConfiguredLevel(args, 1);
    if (!level) {
        return 1;
    }

    RemoveResult result = resolver_->removeEntity(*level, id);
    if (!result.removed) {
        std::cerr << "Entity " << id << " not found" << std::endl;
        return 1;
    }
    std::cout << "Removed " << id << " (" << result.nodesRemoved << " nodes)" << std::endl;
    if (!result.newlyDangling.empty()) {
        std::cout << result.newlyDangling.size() << " references now dangle:" << std::endl;
        for (const auto& reference : result.newlyDangling) {
            printReference(reference);
        }
    }
    return saveLevel(*level) ? 0 : 1;
}

int LevelService::exportCommand(const std::vector<std::string>& args) const {
    uint64_t id = 0;
    if (args.size() < 2) {
        std::cerr << "Usage: entity export <id> <out.xml> [container] [sectors]" << std::endl;
        return 1;
    }
    if (!parseId(args[0], id)) {
        return 1;
    }
    auto level = openConfiguredLevel(args, 2);
    if (!level) {
        return 1;
    }

    auto exported = resolver_->exportEntity(*level, id);
    if (!exported) {
        std::cerr << "Entity " << id << " not found" << std::endl;
        return 1;
    }
    try {
        auto plugin = PluginManager::getInstance().createPlugin(args[1], ResourceForm::Markup);
        if (!plugin) {
            return 1;
        }
        plugin->save(*exported);
    } catch (const std::exception& e) {
        std::cerr << "Export failed: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Exported " << id << " to " << args[1] << std::endl;
    return 0;
}

int LevelService::importCommand(const std::vector<std::string>& args) const {
    if (args.size() < 2) {
        std::cerr << "Usage: entity import <in.xml> <sector file name> [container] [sectors]" << std::endl;
        return 1;
    }

    ResourceFile source;
    try {
        auto plugin = PluginManager::getInstance().createPlugin(args[0], ResourceForm::Markup);
        if (!plugin) {
            return 1;
        }
        source = plugin->load();
    } catch (const std::exception& e) {
        std::cerr << "Cannot read " << args[0] << ": " << e.what() << std::endl;
        return 1;
    }

    auto level = openConfiguredLevel(args, 2);
    if (!level) {
        return 1;
    }
    try {
        auto imported = resolver_->importEntities(*level, args[1], source);
        std::cout << "Imported " << imported.size() << " entities into " << args[1] << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Import failed: " << e.what() << std::endl;
        return 1;
    }
    return saveLevel(*level) ? 0 : 1;
}

LevelService* LevelService::getInstance() {
    auto* service = dynamic_cast<LevelService*>(ServiceManager::getService("LevelService"));
    if (!service) {
        Log(ERROR, "LevelService", "LevelService is not available");
    }
    return service;
}

void LevelService::registerCommands(CommandTable& commandTable) {
    auto dispatch = [](int (LevelService::*command)(const std::vector<std::string>&) const) {
        return [command](const std::vector<std::string>& args) -> int {
            LevelService* service = getInstance();
            return service ? (service->*command)(args) : 1;
        };
    };

    commandTable["level"] = {
        "Level operations",
        {
            {"load", {"Load every file of a level and print the report (e.g., level load <container> [sectors])",
                      dispatch(&LevelService::loadCommand)}},
            {"save", {"Load a level and save every dirty file (e.g., level save <container> [sectors])",
                      dispatch(&LevelService::saveCommand)}},
            {"refs", {"List dangling references (e.g., level refs <container> [sectors])",
                      dispatch(&LevelService::refsCommand)}},
            {"renumber", {"Renumber a node ID across the level (e.g., level renumber 1234 5678)",
                          dispatch(&LevelService::renumberCommand)}},
        }
    };

    commandTable["entity"] = {
        "Entity editing operations",
        {
            {"duplicate", {"Duplicate an entity with fresh IDs (e.g., entity duplicate 1234)",
                           dispatch(&LevelService::duplicateCommand)}},
            {"remove", {"Remove an entity and report references it leaves dangling (e.g., entity remove 1234)",
                        dispatch(&LevelService::removeCommand)}},
            {"export", {"Export an entity subtree to markup (e.g., entity export 1234 tree.xml)",
                        dispatch(&LevelService::exportCommand)}},
            {"import", {"Import entities from markup into a file (e.g., entity import tree.xml 12.data.fcb)",
                        dispatch(&LevelService::importCommand)}},
        }
    };
}

} // namespace FCBForge

REGISTER_SERVICE(LevelService)
