#include "LevelLayout.h"

#include <map>

#include "core/FCBError.h"
#include "core/Logging/Logging.h"
#include "core/ResourceKind.h"

namespace fs = std::filesystem;

namespace FCBForge {

namespace {

    int groupOrder(ResourceKind kind) {
        switch (kind) {
            case ResourceKind::MapsData: return 0;
            case ResourceKind::Managers: return 1;
            case ResourceKind::Omnis: return 2;
            case ResourceKind::SectorsDep: return 3;
            case ResourceKind::SectorData: return 4;
            default: return -1;
        }
    }

    // Binary paths of the level files in one directory, keyed by (group, name)
    void collect(const fs::path& dir, bool container, std::map<std::pair<int, std::string>, fs::path>& out) {
        std::error_code ec;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            if (!it->is_regular_file(ec)) {
                continue;
            }
            std::string fileName = it->path().filename().string();
            std::string binaryName = ResourceKinds::binaryPathFor(fileName);
            if (binaryName.empty()) {
                binaryName = fileName;
            }

            ResourceKind kind = ResourceKinds::classify(binaryName);
            if (kind == ResourceKind::Unknown || ResourceKinds::isContainerKind(kind) != container) {
                continue;
            }
            out.emplace(std::make_pair(groupOrder(kind), ResourceKinds::toLower(binaryName)), dir / binaryName);
        }
        if (ec) {
            Log(WARNING, "LevelLayout", "Error while listing {}: {}", dir.string(), ec.message());
        }
    }

} // namespace

std::vector<fs::path> LevelLayout::discover(const fs::path& containerDir, const fs::path& sectorDir) {
    std::error_code ec;
    if (!fs::is_directory(containerDir, ec)) {
        throw FCBError(ErrorKind::IOFailure, "Level container directory not found: " + containerDir.string());
    }

    std::map<std::pair<int, std::string>, fs::path> found;
    collect(containerDir, true, found);

    if (!sectorDir.empty()) {
        if (fs::is_directory(sectorDir, ec)) {
            collect(sectorDir, false, found);
        } else {
            Log(WARNING, "LevelLayout", "Sector directory not found: {}", sectorDir.string());
        }
    }

    std::vector<fs::path> paths;
    paths.reserve(found.size());
    for (const auto& entry : found) {
        paths.push_back(entry.second);
    }
    Log(DEBUG, "LevelLayout", "Discovered {} level files", paths.size());
    return paths;
}

} // namespace FCBForge
