#ifndef CFG_H
#define CFG_H

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ResourceKind.h"

namespace FCBForge {

class ConfigParser;

class CFG {
    public:
    std::string configFilePath;

    std::string LevelPath;
    std::string SectorPath;
    bool Logging;
    std::string LogLevel;
    std::string LogFile;
    std::string ClassDefinitions;
    std::string ReferenceSchema;
    int WorkerThreads;
    bool WriteMarkupSidecars;
    bool PreserveUnknownTags;
    std::string CacheDir;
    bool KeepBackups;
    double DuplicateOffset;

    // Command line switches, not read from the config file
    bool ForceConversion;
    std::optional<ResourceForm> PreferredForm;

    CFG();

    void initialize(const std::string& configFile);
    void applyConfig(const ConfigParser& config);
    void resetToDefaults();

    void setLevelPath(const std::string& path) { LevelPath = path; }
    const std::string& getLevelPath() const { return LevelPath; }
    // Defaults to the container directory when no sector path is configured
    std::string getSectorPath() const;
    void setLogging(bool enabled) { Logging = enabled; }
    bool getLogging() const { return Logging; }
    // WorkerThreads, or the hardware concurrency when it is 0
    unsigned getWorkerThreadCount() const;
    static std::string findConfigFile();

private:
    CFG(const CFG&) = delete;
    CFG& operator=(const CFG&) = delete;
};

// Global variable declaration always use this
extern CFG FCBFORGE_CFG;

} // namespace FCBForge

#endif // CFG_H
