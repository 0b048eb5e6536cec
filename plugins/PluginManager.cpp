#include "PluginManager.h"

#include <algorithm>
#include <iostream>

#include "PluginBase.h"
#include "core/CFG.h"
#include "core/FCBError.h"
#include "core/Logging/Logging.h"
#include "services/ServiceManager.h"

namespace FCBForge {

    namespace fs = std::filesystem;

namespace {

const char* formName(ResourceForm form) {
    return form == ResourceForm::Binary ? "binary" : "markup";
}

} // namespace

PluginManager::PluginManager() = default;

PluginManager::~PluginManager() {}

void PluginManager::registerPlugin(ResourceForm form, PluginFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    pluginFactories_[form] = std::move(factory);
    Log(DEBUG, "PluginManager", "Registered plugin for form: {}", formName(form));
}

std::vector<ResourceForm> PluginManager::getSupportedForms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ResourceForm> forms;
    for (const auto& [form, factory] : pluginFactories_) {
        forms.push_back(form);
    }
    return forms;
}

bool PluginManager::isFormSupported(ResourceForm form) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pluginFactories_.find(form) != pluginFactories_.end();
}

std::unique_ptr<PluginBase> PluginManager::createPlugin(const fs::path& resourcePath, ResourceForm form,
                                                        const CodecSettings& settings) const {
    PluginFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pluginFactories_.find(form);
        if (it == pluginFactories_.end()) {
            Log(ERROR, "PluginManager", "No plugin registered for {} form", formName(form));
            return nullptr;
        }
        factory = it->second;
    }
    return factory(resourcePath, settings);
}

std::unique_ptr<PluginBase> PluginManager::createPlugin(const fs::path& resourcePath, ResourceForm form) {
    return createPlugin(resourcePath, form, getDefaultCodecSettings());
}

ResourceForm PluginManager::formForPath(const fs::path& path) {
    return ResourceKinds::endsWith(ResourceKinds::toLower(path.filename().string()), ".xml") ? ResourceForm::Markup
                                                                                             : ResourceForm::Binary;
}

CodecSettings PluginManager::getDefaultCodecSettings() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!dictionary_) {
        auto dictionary = std::make_shared<ClassDictionary>();
        if (!FCBFORGE_CFG.ClassDefinitions.empty()) {
            if (!dictionary->loadFromFile(FCBFORGE_CFG.ClassDefinitions)) {
                Log(WARNING, "PluginManager", "Continuing with built-in class names only");
            }
        }
        dictionary_ = dictionary;
    }

    CodecSettings settings;
    settings.dictionary = dictionary_;
    settings.preserveUnknownTags = FCBFORGE_CFG.PreserveUnknownTags;
    return settings;
}

void PluginManager::setDictionary(std::shared_ptr<const ClassDictionary> dictionary) {
    std::lock_guard<std::mutex> lock(mutex_);
    dictionary_ = std::move(dictionary);
}

bool PluginManager::convertResource(const fs::path& input, const fs::path& output) {
    ResourceForm from = formForPath(input);
    ResourceForm to = formForPath(output);
    if (from == to) {
        Log(ERROR, "PluginManager", "{} and {} are both {} files, nothing to convert", input.string(),
            output.string(), formName(from));
        return false;
    }

    auto reader = createPlugin(input, from);
    auto writer = createPlugin(output, to);
    if (!reader || !writer) {
        return false;
    }

    try {
        ResourceFile file = reader->load();
        writer->save(file);
        Log(MESSAGE, "PluginManager", "Converted {} ({}) to {} ({}), {} nodes", input.string(), formName(from),
            output.string(), formName(to), file.nodeCount());
        std::cout << input.string() << " -> " << output.string() << std::endl;
        return true;
    } catch (const FCBError& e) {
        Log(ERROR, "PluginManager", "Conversion of {} failed: {}", input.string(), e.what());
    } catch (const std::exception& e) {
        Log(ERROR, "PluginManager", "Conversion of {} failed: {}", input.string(), e.what());
    }
    return false;
}

bool PluginManager::verifyResource(const fs::path& input) {
    auto binary = createPlugin(input, ResourceForm::Binary);
    auto markup = createPlugin(input, ResourceForm::Markup);
    if (!binary || !markup) {
        return false;
    }

    try {
        std::vector<uint8_t> original = PluginBase::readFileBytes(input);
        ResourceFile file = binary->decode(original);

        std::vector<uint8_t> rewritten = binary->encode(file);
        if (rewritten != original) {
            auto mismatch = std::mismatch(original.begin(), original.end(), rewritten.begin(), rewritten.end());
            size_t offset = static_cast<size_t>(mismatch.first - original.begin());
            Log(ERROR, "PluginManager", "{}: binary round trip differs at offset 0x{:X} ({} vs {} bytes)",
                input.string(), offset, original.size(), rewritten.size());
            std::cout << "FAIL " << input.string() << ": binary round trip differs" << std::endl;
            return false;
        }

        ResourceFile reparsed = markup->decode(markup->encode(file));
        if (reparsed != file) {
            Log(ERROR, "PluginManager", "{}: markup round trip changed the tree", input.string());
            std::cout << "FAIL " << input.string() << ": markup round trip differs" << std::endl;
            return false;
        }

        Log(MESSAGE, "PluginManager", "{}: {} nodes, round trip identical", input.string(), file.nodeCount());
        std::cout << "OK " << input.string() << " (" << file.nodeCount() << " nodes)" << std::endl;
        return true;
    } catch (const FCBError& e) {
        Log(ERROR, "PluginManager", "Verification of {} failed: {}", input.string(), e.what());
        std::cout << "FAIL " << input.string() << ": " << e.what() << std::endl;
    }
    return false;
}

void PluginManager::registerAllCommands(CommandTable& commandTable) {
    // Copy commands from the static registries (auto-discovered during registration)
    commandTable.insert(PluginBase::getCommandRegistry().begin(), PluginBase::getCommandRegistry().end());
    ServiceManager::registerCommands(commandTable);
}

} // namespace FCBForge
