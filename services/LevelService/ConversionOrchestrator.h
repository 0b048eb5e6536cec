#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Level.h"
#include "ReferenceResolver.h"
#include "core/FCBError.h"
#include "core/Hashing.h"
#include "core/Tasks/CancellationToken.h"
#include "plugins/PluginManager.h"

namespace FCBForge {

class ConversionCacheService;

enum class AuthorityDecision {
    Binary,
    Markup,
    Conflict, // both forms changed since the last sync
    Missing   // neither form exists
};

const char* authorityDecisionName(AuthorityDecision decision);

struct AuthorityInputs {
    bool binaryExists = false;
    bool markupExists = false;
    std::optional<ResourceForm> explicitChoice;

    // Fingerprints from the conversion cache, both set when the pair was synced before
    std::optional<FileFingerprint> syncedBinary;
    std::optional<FileFingerprint> syncedMarkup;
    std::optional<FileFingerprint> currentBinary;
    std::optional<FileFingerprint> currentMarkup;

    std::optional<std::filesystem::file_time_type> binaryTime;
    std::optional<std::filesystem::file_time_type> markupTime;
};

/**
 * @brief Picks the authoritative form of one file
 *
 * 1. An explicit choice wins when that form exists.
 * 2. When only one form exists it wins.
 * 3. With a cache record, the form whose fingerprint changed since the last
 *    sync wins; both changed is a Conflict, neither changed is Binary.
 * 4. Otherwise markup wins only when strictly newer than the binary.
 */
AuthorityDecision decideAuthority(const AuthorityInputs& inputs);

struct FileLoadResult {
    enum class Status {
        Loaded,
        Failed,
        Conflict,
        Cancelled
    };

    std::string name;
    std::filesystem::path binaryPath;
    Status status = Status::Cancelled;
    AuthorityDecision authority = AuthorityDecision::Missing;
    FileState state = FileState::Unloaded;
    std::optional<ErrorKind> error;
    std::string message;
    bool sidecarWritten = false;
    bool cacheHit = false;
};

const char* loadStatusName(FileLoadResult::Status status);

struct LoadReport {
    std::vector<FileLoadResult> files;

    size_t count(FileLoadResult::Status status) const;
    size_t loadedCount() const { return count(FileLoadResult::Status::Loaded); }
    size_t failedCount() const { return count(FileLoadResult::Status::Failed); }
    size_t conflictCount() const { return count(FileLoadResult::Status::Conflict); }
    size_t cancelledCount() const { return count(FileLoadResult::Status::Cancelled); }
    bool ok() const { return loadedCount() == files.size(); }
};

struct FileSaveResult {
    std::string name;
    bool saved = false;
    bool sidecarWritten = false;
    std::optional<ErrorKind> error;
    std::string message;
};

struct SaveReport {
    std::vector<FileSaveResult> files;
    std::vector<Reference> danglingReferences;

    size_t savedCount() const;
    size_t failedCount() const { return files.size() - savedCount(); }
    bool ok() const { return failedCount() == 0; }
};

struct OrchestratorOptions {
    CodecSettings codec;
    // 1 loads on the calling thread
    size_t workerThreads = 1;
    bool writeMarkupSidecars = true;
    bool force = false;
    std::optional<ResourceForm> preferredForm;
    bool keepBackups = false;
    // Called in input order as results are collected
    std::function<void(const FileLoadResult&)> onFileLoaded;

    // FCBFORGE_CFG plus the shared plugin codec settings
    static OrchestratorOptions fromConfig();
};

/**
 * @brief Loads and saves the files of a Level in either form
 *
 * Files are decoded in parallel, one task per file, without touching the
 * Level; results are inserted in input order once every task finished, so
 * concurrent and sequential loads give identical levels. Per-file failures
 * end up in the report and never stop the other files.
 */
class ConversionOrchestrator {
public:
    explicit ConversionOrchestrator(OrchestratorOptions options, ConversionCacheService* cache = nullptr,
                                    const ReferenceResolver* resolver = nullptr);

    const OrchestratorOptions& options() const { return options_; }

    // Discovers the level files with LevelLayout, then loads them
    LoadReport loadLevel(Level& level, const CancellationToken& token = CancellationToken());
    LoadReport loadLevel(Level& level, const std::vector<std::filesystem::path>& binaryPaths,
                         const CancellationToken& token = CancellationToken());

    AuthorityInputs gatherAuthorityInputs(const std::filesystem::path& binaryPath) const;

    /**
     * @brief Writes every Dirty file through the binary writer
     *
     * Each file is replaced atomically; a file that fails stays Dirty with its
     * tree intact. Dangling references are reported but never block the save.
     */
    SaveReport saveLevel(Level& level);
    // A file that is not Dirty is reported as saved without being written
    FileSaveResult saveFile(Level& level, const std::string& name);

    // Regenerates the .converted.xml sidecar of a loaded file and records the sync
    bool writeSidecar(LevelFile& file) const;

private:
    std::pair<FileLoadResult, std::optional<LevelFile>> loadFile(const std::filesystem::path& binaryPath) const;
    FileSaveResult saveLoadedFile(LevelFile& file);

    OrchestratorOptions options_;
    ConversionCacheService* cache_;
    const ReferenceResolver* resolver_;
};

} // namespace FCBForge
