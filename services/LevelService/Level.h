#pragma once

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/ResourceKind.h"
#include "core/Resource/ResourceFile.h"

namespace FCBForge {

/**
 * @brief Conversion state of one file of a level
 *
 * Unloaded -> BinaryLoaded -> MarkupSynced on a binary load, Dirty after a
 * markup-authoritative load or any edit, Saved once written back.
 */
enum class FileState {
    Unloaded,
    BinaryLoaded,
    MarkupSynced,
    Dirty,
    Saved
};

const char* fileStateName(FileState state);
bool isValidTransition(FileState from, FileState to);

struct LevelFile {
    std::filesystem::path binaryPath;
    std::filesystem::path markupPath;
    ResourceKind kind = ResourceKind::Unknown;
    FileState state = FileState::Unloaded;
    ResourceForm loadedFrom = ResourceForm::Binary;
    ResourceFile resource;

    const std::string& name() const { return resource.name; }
};

/**
 * @brief The files of one level, addressed by file name
 *
 * A Level is an explicit handle: every operation receives the level it
 * works on. Files keep the order they were added in. All mutations and
 * ID-space reads go through lock(); the lock is recursive so resolver
 * operations can nest.
 */
class Level {
public:
    Level(std::filesystem::path containerDir, std::filesystem::path sectorDir);

    const std::filesystem::path& containerDir() const { return containerDir_; }
    const std::filesystem::path& sectorDir() const { return sectorDir_; }

    std::recursive_mutex& lock() const { return mutex_; }

    // Replaces a file of the same name, keeping its position
    LevelFile& addFile(LevelFile file);
    bool removeFile(const std::string& name);

    LevelFile* findFile(const std::string& name);
    const LevelFile* findFile(const std::string& name) const;

    std::vector<LevelFile>& files() { return files_; }
    const std::vector<LevelFile>& files() const { return files_; }
    size_t fileCount() const { return files_.size(); }

    /**
     * @brief Applies an in-memory edit to one file and marks it Dirty
     * @return false when no file of that name is loaded
     */
    bool edit(const std::string& name, const std::function<void(ResourceFile&)>& mutation);
    static void markDirty(LevelFile& file);

    // Throws std::logic_error on a transition the state machine forbids
    static void setState(LevelFile& file, FileState state);

    std::vector<std::string> dirtyFiles() const;

private:
    std::filesystem::path containerDir_;
    std::filesystem::path sectorDir_;
    std::vector<LevelFile> files_;
    mutable std::recursive_mutex mutex_;
};

} // namespace FCBForge
