#include "CFG.h"

#include <filesystem>
#include <algorithm>
#include <vector>
#include <iostream>
#include <thread>

#include "ConfigParser.h"
#include "Logging/Logging.h"

namespace FCBForge {

CFG::CFG() {
    resetToDefaults();
}

void CFG::resetToDefaults() {
    configFilePath.clear();
    LevelPath.clear();
    SectorPath.clear();
    Logging = true;
    LogLevel = "WARNING";
    LogFile = "fcbforge.log";
    ClassDefinitions.clear();
    ReferenceSchema.clear();
    WorkerThreads = 0;
    WriteMarkupSidecars = true;
    PreserveUnknownTags = true;
    CacheDir = ".fcbforge";
    KeepBackups = false;
    DuplicateOffset = 20.0;
    ForceConversion = false;
    PreferredForm.reset();
}

void CFG::initialize(const std::string& configFile) {
    configFilePath = configFile;
    ConfigParser config;

    if (configFile.empty()) {
        Log(WARNING, "Config", "No config file found, using defaults");
    } else if (!config.loadFromFile(configFile)) {
        // If config file doesn't exist or can't be loaded, use defaults
        Log(WARNING, "Config", "Could not load config file: {}, using defaults", configFile);
    }

    applyConfig(config);
}

void CFG::applyConfig(const ConfigParser& config) {
    LevelPath = config.get("LevelPath", LevelPath);
    SectorPath = config.get("SectorPath", SectorPath);

    // Read logging settings
    Logging = config.getBool("Logging", Logging);
    LogLevel = config.get("LogLevel", LogLevel);
    LogFile = config.get("LogFile", LogFile);

    ClassDefinitions = config.get("ClassDefinitions", ClassDefinitions);
    ReferenceSchema = config.get("ReferenceSchema", ReferenceSchema);

    WorkerThreads = config.getInt("WorkerThreads", WorkerThreads);
    if (WorkerThreads < 0) {
        Log(WARNING, "Config", "WorkerThreads cannot be negative, using hardware concurrency");
        WorkerThreads = 0;
    }

    WriteMarkupSidecars = config.getBool("WriteMarkupSidecars", WriteMarkupSidecars);
    PreserveUnknownTags = config.getBool("PreserveUnknownTags", PreserveUnknownTags);
    CacheDir = config.get("CacheDir", CacheDir);
    KeepBackups = config.getBool("KeepBackups", KeepBackups);
    DuplicateOffset = config.getDouble("DuplicateOffset", DuplicateOffset);

    Log(DEBUG, "Config", "LevelPath={} SectorPath={} WorkerThreads={} CacheDir={}",
        LevelPath, SectorPath, WorkerThreads, CacheDir);
}

std::string CFG::getSectorPath() const {
    return SectorPath.empty() ? LevelPath : SectorPath;
}

unsigned CFG::getWorkerThreadCount() const {
    if (WorkerThreads > 0) {
        return static_cast<unsigned>(WorkerThreads);
    }
    return std::max(1u, std::thread::hardware_concurrency());
}

// Helper function to auto-detect config file
std::string CFG::findConfigFile() {
    try {
        std::vector<std::string> configFiles;
        for (const auto &entry : std::filesystem::directory_iterator(".")) {
            if (entry.is_regular_file() && entry.path().extension() == ".cfg") {
                configFiles.push_back(entry.path().string());
            }
        }
        if (!configFiles.empty()) {
            std::sort(configFiles.begin(), configFiles.end());
            return configFiles[0];
        }
    } catch (const std::filesystem::filesystem_error &e) {
        std::cerr << "Error scanning for config files: " << e.what() << std::endl;
    }
    return "";
}

// Define the global variable
CFG FCBFORGE_CFG;

} // namespace FCBForge
