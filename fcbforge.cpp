#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/CFG.h"
#include "core/Logging/FileLogWriter.h"
#include "core/Logging/Logging.h"
#include "plugins/CommandRegistry.h"
#include "plugins/PluginManager.h"
#include "services/ServiceManager.h"

using namespace FCBForge;

int main(int argc, char **argv) {
    std::string configFile;
    bool force = false;
    std::optional<ResourceForm> preferredForm;

    // Strip global options anywhere on the line, argv keeps <type> <action> [args]
    int kept = 1;
    for (int i = 1; i < argc; ++i) {
        std::string_view a = argv[i];
        if (a == "-c" && i + 1 < argc) {
            configFile = argv[i + 1];
            ++i;
            continue;
        }
        if (a.rfind("-c=", 0) == 0 && a.size() > 3) {
            configFile = std::string(a.substr(3));
            continue;
        }
        if (a == "--force") {
            force = true;
            continue;
        }
        if (a == "--prefer-markup") {
            preferredForm = ResourceForm::Markup;
            continue;
        }
        if (a == "--prefer-binary") {
            preferredForm = ResourceForm::Binary;
            continue;
        }
        argv[kept++] = argv[i];
    }
    argc = kept;

    // Auto-detect config file if not specified, defaults otherwise
    if (configFile.empty()) {
        configFile = CFG::findConfigFile();
    }

    // Initialize command registry for help or execution
    CommandTable commandTable;
    PluginManager::getInstance().registerAllCommands(commandTable);

    // Show help if no command specified
    if (argc <= 1) {
        printHelp(commandTable, argv[0]);
        return 0;
    }

    // The log file is added once the config names it
    LoggingOptions loggingOptions;
    loggingOptions.filePath.clear();
    InitializeLogging(loggingOptions);

    FCBFORGE_CFG.initialize(configFile);
    FCBFORGE_CFG.ForceConversion = force;
    FCBFORGE_CFG.PreferredForm = preferredForm;

    ToggleLogging(FCBFORGE_CFG.Logging);
    SetConsoleWindowLogLevel(ParseLogLevel(FCBFORGE_CFG.LogLevel, WARNING));
    if (FCBFORGE_CFG.Logging && !FCBFORGE_CFG.LogFile.empty()) {
        AddLogWriter(std::make_shared<FileLogWriter>(FCBFORGE_CFG.LogFile, DEBUG));
    }
    Log(MESSAGE, "Core", "FCBForge using LevelPath: {}", FCBFORGE_CFG.LevelPath);

    // Trigger application start lifecycle
    ServiceManager::onApplicationStart();

    int result = prepareCommands(commandTable, argc, argv);

    // Trigger application shutdown lifecycle
    ServiceManager::onApplicationShutdown();

    // Shutdown our logging system
    ShutdownLogging();
    return result;
}
