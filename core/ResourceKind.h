/**
 * @file ResourceKind.h
 * Classifies the files that make up a level by their file names.
 */

#ifndef RESOURCE_KIND_H
#define RESOURCE_KIND_H

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace FCBForge {

enum class ResourceKind {
    Unknown = 0,
    MapsData,     // mapsdata.fcb
    Managers,     // <level>.managers.fcb
    Omnis,        // <level>.omnis.fcb
    SectorsDep,   // sectorsdep.fcb
    SectorData    // worldsectors/<n>.data.fcb
};

// Which form of a file is authoritative or being addressed
enum class ResourceForm {
    Binary,
    Markup
};

namespace ResourceKinds {

    struct ResourceKindInfo {
        ResourceKind kind;
        const char* suffix;        // matched against the lower-cased file name
        const char* description;
        bool container;            // lives in the level container directory
    };

    inline const std::vector<ResourceKindInfo>& getResourceKindTable() {
        // Longest suffixes first, "mapsdata.fcb" must not be taken for a sector "data.fcb"
        static const std::vector<ResourceKindInfo> table = {
            {ResourceKind::Managers,   ".managers.fcb",  "Manager tables",           true},
            {ResourceKind::Omnis,      ".omnis.fcb",     "Universal object tables",  true},
            {ResourceKind::SectorsDep, "sectorsdep.fcb", "Sector dependency tables", true},
            {ResourceKind::MapsData,   "mapsdata.fcb",   "Map data",                 true},
            {ResourceKind::SectorData, ".data.fcb",      "Sector data",              false},
        };
        return table;
    }

    inline std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    inline bool endsWith(const std::string& value, const std::string& suffix) {
        return value.size() >= suffix.size() &&
               value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    inline ResourceKind classify(const std::string& fileName) {
        std::string lower = toLower(fileName);
        for (const auto& info : getResourceKindTable()) {
            if (endsWith(lower, info.suffix)) {
                return info.kind;
            }
        }
        return ResourceKind::Unknown;
    }

    inline const char* getDescription(ResourceKind kind) {
        for (const auto& info : getResourceKindTable()) {
            if (info.kind == kind) {
                return info.description;
            }
        }
        return "Unknown";
    }

    inline bool isContainerKind(ResourceKind kind) {
        for (const auto& info : getResourceKindTable()) {
            if (info.kind == kind) {
                return info.container;
            }
        }
        return false;
    }

    // Markup sidecar written next to every binary file
    inline const char* markupSuffix() { return ".converted.xml"; }

    inline std::string markupPathFor(const std::string& binaryPath) {
        return binaryPath + markupSuffix();
    }

    // Maps a sidecar back to the binary it was derived from, or "" if it is not a sidecar
    inline std::string binaryPathFor(const std::string& markupPath) {
        const std::string suffix = markupSuffix();
        if (!endsWith(toLower(markupPath), suffix)) {
            return "";
        }
        return markupPath.substr(0, markupPath.size() - suffix.size());
    }
}

} // namespace FCBForge

#endif // RESOURCE_KIND_H
