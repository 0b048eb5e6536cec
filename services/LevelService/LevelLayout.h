#pragma once

#include <filesystem>
#include <vector>

namespace FCBForge {

/**
 * @brief Enumerates the files that make up a level
 *
 * Container directory: mapsdata.fcb, then *.managers.fcb, *.omnis.fcb and
 * sectorsdep.fcb. Sector directory: *.data.fcb. Each group is sorted by file
 * name. A binary that only exists as its .converted.xml sidecar is listed by
 * its binary path. Throws FCBError(IOFailure) when the container directory
 * does not exist.
 */
class LevelLayout {
public:
    static std::vector<std::filesystem::path> discover(const std::filesystem::path& containerDir,
                                                       const std::filesystem::path& sectorDir);
};

} // namespace FCBForge
