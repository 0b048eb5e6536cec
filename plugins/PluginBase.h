#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "CommandRegistry.h"
#include "PluginManager.h"
#include "core/Logging/Logging.h"
#include "core/ResourceKind.h"
#include "core/Resource/ClassDictionary.h"
#include "core/Resource/ResourceFile.h"

namespace FCBForge {

// Macro for auto-registering plugins
#define REGISTER_PLUGIN(PluginClass, Form) \
    namespace { \
        struct PluginClass##_registrar { \
            PluginClass##_registrar() { \
                Log(DEBUG, "PluginBase", "Auto-registering plugin: " #PluginClass " for form: " #Form); \
                PluginBase::registerPluginFactory(Form, \
                    [](const std::filesystem::path& resourcePath, const CodecSettings& settings) -> std::unique_ptr<PluginBase> { \
                        return std::make_unique<PluginClass>(resourcePath, settings); \
                    }); \
                /* Register commands statically */ \
                PluginClass::registerCommands(PluginBase::getCommandRegistry()); \
            } \
        }; \
        static PluginClass##_registrar PluginClass##_instance; \
    } \
    /* Force the static variable to be used to prevent optimization */ \
    static int PluginClass##_force_init = (PluginClass##_instance, 0)

/**
 * @brief Abstract base class for the binary and markup form plugins
 *
 * A plugin owns the path of one file in one form and converts between that
 * form's bytes and a ResourceFile. decode(), encode(), load() and save()
 * throw FCBError; load() and save() add IOFailure for file system errors.
 */
class PluginBase {
public:
    PluginBase(const std::filesystem::path& resourcePath, ResourceForm form, const CodecSettings& settings);
    virtual ~PluginBase();

    // Core operations that all plugins must implement
    virtual ResourceFile decode(const std::vector<uint8_t>& bytes) const = 0;
    virtual std::vector<uint8_t> encode(const ResourceFile& file) const = 0;

    // Reads the resource path and decodes it
    ResourceFile load() const;

    /**
     * @brief Encodes `file` and atomically replaces the resource path
     *
     * The bytes go to a temporary file next to the target which is then
     * renamed over it. On failure the temporary file is removed and the
     * target is left untouched.
     *
     * @param keepBackup copy the previous target to <target>.bak first
     */
    void save(const ResourceFile& file, bool keepBackup = false) const;

    // Static command registry
    static CommandTable& getCommandRegistry();

    // Register plugin commands (static method to avoid instantiation)
    static void registerCommands(CommandTable& commandTable) {}

    // Plugin metadata
    virtual std::string getPluginName() const = 0;
    ResourceForm getResourceForm() const { return form_; }
    const std::filesystem::path& getResourcePath() const { return resourcePath_; }
    // File name used as the key inside a Level
    std::string getResourceName() const;

    // Static registration helper, used by REGISTER_PLUGIN
    static void registerPluginFactory(ResourceForm form, PluginFactory factory);

    // Helpers shared with the orchestrator
    static std::vector<uint8_t> readFileBytes(const std::filesystem::path& path);
    static void writeFileAtomically(const std::filesystem::path& path, const std::vector<uint8_t>& bytes,
                                    bool keepBackup = false);

protected:
    const ClassDictionary& dictionary() const { return *settings_.dictionary; }

    std::filesystem::path resourcePath_;
    ResourceForm form_;
    CodecSettings settings_;
};

} // namespace FCBForge
