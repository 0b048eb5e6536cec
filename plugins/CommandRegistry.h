#ifndef COMMAND_REGISTRY_H
#define COMMAND_REGISTRY_H

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <iostream>
#include <getopt.h>

namespace FCBForge {

struct Action 
{
    std::string help;
    std::function<int(const std::vector<std::string>& args)> handler;
};

struct Command 
{
    std::string help;
    std::map<std::string, Action> actions;
};

using CommandTable = std::map<std::string, Command>;

// Function signature for plugin command registration
using CommandRegistrationFunction = void(*)(CommandTable&);

// Helper functions
// argv[optind] is the command type, argv[optind + 1] the action, the rest are arguments
static int prepareCommands(CommandTable& commandTable, int& argc, char** argv) {
    if (optind >= argc) {
        std::cerr << "No command given" << std::endl;
        return 1;
    }

    // Parse command arguments
    std::string type = argv[optind];
    std::string action = (optind + 1 < argc) ? argv[optind + 1] : "";

    // Find and execute command
    auto commandIt = commandTable.find(type);
    if (commandIt == commandTable.end()) {
        std::cerr << "Unknown command type: " << type << std::endl;
        std::cerr << "Available commands:" << std::endl;
        for (const auto& cmd : commandTable) {
            std::cerr << "  " << cmd.first << " - " << cmd.second.help << std::endl;
        }
        return 1;
    }

    auto actionIt = commandIt->second.actions.find(action);
    if (actionIt == commandIt->second.actions.end()) {
        std::cerr << "Unknown action: " << action << " for command: " << type << std::endl;
        std::cerr << "Available actions for " << type << ":" << std::endl;
        for (const auto& act : commandIt->second.actions) {
            std::cerr << "  " << act.first << " - " << act.second.help << std::endl;
        }
        
        return 1;
    }

    // Prepare arguments and execute command
    std::vector<std::string> args;
    for (int i = optind + 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    return actionIt->second.handler(args);
}

static void printHelp(const CommandTable& commandTable, const char* programName) {
    std::cout << "Usage: " << programName << " <type> <action> [args] [-c config_file] [--force] [--prefer-markup|--prefer-binary]" << std::endl;
    std::cout << "\nTypes:" << std::endl;
    for (const auto& cmd : commandTable) {
        std::cout << "  " << cmd.first << " - " << cmd.second.help << std::endl;
    }
    std::cout << "\nActions:" << std::endl;
    for (const auto& cmd : commandTable) {
        std::cout << cmd.first << " actions:" << std::endl;
        for (const auto& act : cmd.second.actions) {
            std::cout << "  " << act.first << " - " << act.second.help << std::endl;
        }
        std::cout << std::endl;
    }
    std::cout << "Optional:\n"
              << "  -c <config_file>  - FCBForge configuration file (auto-detected if not specified)\n"
              << "  --force           - ignore the conversion cache and regenerate markup\n"
              << "  --prefer-markup   - treat the .converted.xml files as authoritative\n"
              << "  --prefer-binary   - treat the .fcb files as authoritative" << std::endl;
}

} // namespace FCBForge
#endif // COMMAND_REGISTRY_H
