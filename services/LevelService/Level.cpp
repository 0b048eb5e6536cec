#include "Level.h"

#include <stdexcept>

#include "core/Logging/Logging.h"

namespace fs = std::filesystem;

namespace FCBForge {

const char* fileStateName(FileState state) {
    switch (state) {
        case FileState::Unloaded: return "Unloaded";
        case FileState::BinaryLoaded: return "BinaryLoaded";
        case FileState::MarkupSynced: return "MarkupSynced";
        case FileState::Dirty: return "Dirty";
        case FileState::Saved: return "Saved";
    }
    return "Unknown";
}

bool isValidTransition(FileState from, FileState to) {
    if (to == FileState::Unloaded) {
        return true;
    }
    switch (from) {
        case FileState::Unloaded:
            return to == FileState::BinaryLoaded || to == FileState::Dirty;
        case FileState::BinaryLoaded:
            return to == FileState::MarkupSynced || to == FileState::Dirty;
        case FileState::MarkupSynced:
        case FileState::Saved:
            return to == FileState::Dirty;
        case FileState::Dirty:
            return to == FileState::Dirty || to == FileState::Saved;
    }
    return false;
}

Level::Level(fs::path containerDir, fs::path sectorDir)
    : containerDir_(std::move(containerDir)), sectorDir_(std::move(sectorDir)) {}

LevelFile& Level::addFile(LevelFile file) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    for (auto& existing : files_) {
        if (existing.name() == file.name()) {
            existing = std::move(file);
            return existing;
        }
    }
    files_.push_back(std::move(file));
    return files_.back();
}

bool Level::removeFile(const std::string& name) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    for (auto it = files_.begin(); it != files_.end(); ++it) {
        if (it->name() == name) {
            files_.erase(it);
            return true;
        }
    }
    return false;
}

LevelFile* Level::findFile(const std::string& name) {
    for (auto& file : files_) {
        if (file.name() == name) {
            return &file;
        }
    }
    return nullptr;
}

const LevelFile* Level::findFile(const std::string& name) const {
    for (const auto& file : files_) {
        if (file.name() == name) {
            return &file;
        }
    }
    return nullptr;
}

bool Level::edit(const std::string& name, const std::function<void(ResourceFile&)>& mutation) {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    LevelFile* file = findFile(name);
    if (!file) {
        Log(WARNING, "Level", "Cannot edit {}: not loaded", name);
        return false;
    }
    mutation(file->resource);
    markDirty(*file);
    return true;
}

void Level::markDirty(LevelFile& file) {
    setState(file, FileState::Dirty);
}

void Level::setState(LevelFile& file, FileState state) {
    if (!isValidTransition(file.state, state)) {
        throw std::logic_error(std::string("Invalid state transition for ") + file.name() + ": " +
                               fileStateName(file.state) + " -> " + fileStateName(state));
    }
    Log(DEBUG, "Level", "{}: {} -> {}", file.name(), fileStateName(file.state), fileStateName(state));
    file.state = state;
}

std::vector<std::string> Level::dirtyFiles() const {
    std::lock_guard<std::recursive_mutex> guard(mutex_);
    std::vector<std::string> names;
    for (const auto& file : files_) {
        if (file.state == FileState::Dirty) {
            names.push_back(file.name());
        }
    }
    return names;
}

} // namespace FCBForge
