#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "CommandRegistry.h"
#include "core/ResourceKind.h"
#include "core/Resource/ClassDictionary.h"

namespace FCBForge {
    class PluginBase;

// Everything a plugin needs to decode or encode a file
struct CodecSettings {
    std::shared_ptr<const ClassDictionary> dictionary;
    bool preserveUnknownTags = true;
};

using PluginFactory =
    std::function<std::unique_ptr<PluginBase>(const std::filesystem::path&, const CodecSettings&)>;

/**
 * @brief Manages the form plugins and single-file conversions
 *
 * Each ResourceForm has exactly one plugin, registered at static
 * initialization through REGISTER_PLUGIN.
 */
class PluginManager {
public:
    static PluginManager& getInstance() {
        static PluginManager instance; // Static instance, initialized once
        return instance;
    }

    PluginManager();
    ~PluginManager();

    // Plugin registration
    void registerPlugin(ResourceForm form, PluginFactory factory);

    // Plugin discovery
    std::vector<ResourceForm> getSupportedForms() const;
    bool isFormSupported(ResourceForm form) const;

    std::unique_ptr<PluginBase> createPlugin(const std::filesystem::path& resourcePath, ResourceForm form,
                                             const CodecSettings& settings) const;
    std::unique_ptr<PluginBase> createPlugin(const std::filesystem::path& resourcePath, ResourceForm form);

    // *.xml is markup, everything else binary
    static ResourceForm formForPath(const std::filesystem::path& path);

    /**
     * @brief Codec settings from FCBFORGE_CFG
     *
     * The class dictionary is built on first use from the built-in table and
     * the ClassDefinitions file, then shared.
     */
    CodecSettings getDefaultCodecSettings();
    void setDictionary(std::shared_ptr<const ClassDictionary> dictionary);

    // Individual resource operations
    bool convertResource(const std::filesystem::path& input, const std::filesystem::path& output);
    bool verifyResource(const std::filesystem::path& input);

    // Command registration
    void registerAllCommands(CommandTable& commandTable);

private:
    PluginManager(const PluginManager&) = delete;
    PluginManager& operator=(const PluginManager&) = delete;

    std::map<ResourceForm, PluginFactory> pluginFactories_;
    std::shared_ptr<const ClassDictionary> dictionary_;
    mutable std::mutex mutex_;
};

} // namespace FCBForge
