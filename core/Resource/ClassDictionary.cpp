#include "ClassDictionary.h"

#include <pugixml.hpp>

#include "core/Hashing.h"
#include "core/Logging/Logging.h"

namespace FCBForge {

namespace {

// Level classes every Dunia level file uses
const char* const kBuiltinClasses[] = {
    "Entity", "EntityLibrary", "EntityArchetype", "MissionLayer", "WorldSector",
    "Component", "CGraphicComponent", "CPhysComponent", "LinkedEntities", "EntityLink",
    "Managers", "Manager", "Omnis", "Omni", "SectorsDep", "SectorDep", "MapsData", "Map",
};

const char* const kBuiltinMembers[] = {
    "disEntityId", "hidName", "hidPos", "hidPos_precise", "hidAngles", "hidScale",
    "hidEnabled", "hidArchetype", "hidResourceId", "disLinkedEntityId", "disParentId",
    "disTargetId", "disLibraryId", "sectorId", "sectorX", "sectorY", "fileName", "tplName",
};

} // namespace

ClassDictionary::ClassDictionary(bool withBuiltins) {
    if (withBuiltins) {
        addBuiltins();
    }
}

void ClassDictionary::addBuiltins() {
    for (const char* name : kBuiltinClasses) {
        addClass(name);
    }
    for (const char* name : kBuiltinMembers) {
        addMember(name);
    }
}

void ClassDictionary::addClass(std::string_view name) {
    addClass(hashName(name), name);
}

void ClassDictionary::addClass(uint32_t hash, std::string_view name) {
    classNames_[hash] = std::string(name);
    classHashes_[std::string(name)] = hash;
}

void ClassDictionary::addMember(std::string_view name) {
    addMember(hashName(name), name);
}

void ClassDictionary::addMember(uint32_t hash, std::string_view name) {
    memberNames_[hash] = std::string(name);
    memberHashes_[std::string(name)] = hash;
}

const std::string* ClassDictionary::className(uint32_t hash) const {
    auto it = classNames_.find(hash);
    return it == classNames_.end() ? nullptr : &it->second;
}

const std::string* ClassDictionary::memberName(uint32_t hash) const {
    auto it = memberNames_.find(hash);
    return it == memberNames_.end() ? nullptr : &it->second;
}

std::optional<uint32_t> ClassDictionary::classHash(std::string_view name) const {
    auto it = classHashes_.find(std::string(name));
    if (it == classHashes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<uint32_t> ClassDictionary::memberHash(std::string_view name) const {
    auto it = memberHashes_.find(std::string(name));
    if (it == memberHashes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ClassDictionary::loadFromFile(const std::filesystem::path& path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        Log(ERROR, "ClassDictionary", "Failed to load class definitions {}: {} (offset {})",
            path.string(), result.description(), static_cast<long long>(result.offset));
        return false;
    }
    return loadDocument(doc, path.string());
}

bool ClassDictionary::loadFromString(const std::string& xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size());
    if (!result) {
        Log(ERROR, "ClassDictionary", "Failed to parse class definitions: {} (offset {})",
            result.description(), static_cast<long long>(result.offset));
        return false;
    }
    return loadDocument(doc, "<string>");
}

bool ClassDictionary::loadDocument(const pugi::xml_document& doc, const std::string& source) {
    size_t classesAdded = 0;
    size_t membersAdded = 0;

    // <class> elements may be nested under any container element
    for (const pugi::xpath_node& classEntry : doc.select_nodes("//class")) {
        pugi::xml_node classNode = classEntry.node();
        std::string name = classNode.attribute("name").value();
        std::string hashText = classNode.attribute("hash").value();

        if (!hashText.empty()) {
            auto hash = parseHash(hashText);
            if (!hash) {
                Log(WARNING, "ClassDictionary", "{}: class '{}' has invalid hash '{}', skipped", source, name, hashText);
                continue;
            }
            // Unnamed classes still become part of the known vocabulary
            addClass(*hash, name.empty() ? "Class_" + formatHash(*hash) : name);
            ++classesAdded;
        } else if (!name.empty()) {
            addClass(name);
            ++classesAdded;
        }

        for (pugi::xml_node member : classNode.children("member")) {
            std::string memberName = member.attribute("name").value();
            std::string memberHashText = member.attribute("hash").value();
            if (memberName.empty()) {
                continue;
            }
            if (memberHashText.empty()) {
                addMember(memberName);
                ++membersAdded;
                continue;
            }
            auto memberHash = parseHash(memberHashText);
            if (!memberHash) {
                Log(WARNING, "ClassDictionary", "{}: member '{}' has invalid hash '{}', skipped", source, memberName, memberHashText);
                continue;
            }
            addMember(*memberHash, memberName);
            ++membersAdded;
        }
    }

    Log(MESSAGE, "ClassDictionary", "Loaded {} class and {} member names from {}", classesAdded, membersAdded, source);
    return true;
}

} // namespace FCBForge
