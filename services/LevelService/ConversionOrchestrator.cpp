#include "ConversionOrchestrator.h"

#include <algorithm>
#include <future>

#include "LevelLayout.h"
#include "core/CFG.h"
#include "core/Logging/Logging.h"
#include "core/Tasks/TaskScheduler.h"
#include "plugins/PluginBase.h"
#include "services/ConversionCacheService/ConversionCacheService.h"

namespace fs = std::filesystem;

namespace FCBForge {

const char* authorityDecisionName(AuthorityDecision decision) {
    switch (decision) {
        case AuthorityDecision::Binary: return "binary";
        case AuthorityDecision::Markup: return "markup";
        case AuthorityDecision::Conflict: return "conflict";
        case AuthorityDecision::Missing: return "missing";
    }
    return "unknown";
}

const char* loadStatusName(FileLoadResult::Status status) {
    switch (status) {
        case FileLoadResult::Status::Loaded: return "loaded";
        case FileLoadResult::Status::Failed: return "failed";
        case FileLoadResult::Status::Conflict: return "conflict";
        case FileLoadResult::Status::Cancelled: return "cancelled";
    }
    return "unknown";
}

AuthorityDecision decideAuthority(const AuthorityInputs& inputs) {
    if (inputs.explicitChoice) {
        if (*inputs.explicitChoice == ResourceForm::Binary && inputs.binaryExists) {
            return AuthorityDecision::Binary;
        }
        if (*inputs.explicitChoice == ResourceForm::Markup && inputs.markupExists) {
            return AuthorityDecision::Markup;
        }
    }

    if (!inputs.binaryExists && !inputs.markupExists) {
        return AuthorityDecision::Missing;
    }
    if (!inputs.markupExists) {
        return AuthorityDecision::Binary;
    }
    if (!inputs.binaryExists) {
        return AuthorityDecision::Markup;
    }

    if (inputs.syncedBinary && inputs.syncedMarkup) {
        bool binaryChanged = inputs.currentBinary != inputs.syncedBinary;
        bool markupChanged = inputs.currentMarkup != inputs.syncedMarkup;
        if (binaryChanged && markupChanged) {
            return AuthorityDecision::Conflict;
        }
        return markupChanged ? AuthorityDecision::Markup : AuthorityDecision::Binary;
    }

    if (inputs.binaryTime && inputs.markupTime && *inputs.markupTime > *inputs.binaryTime) {
        return AuthorityDecision::Markup;
    }
    return AuthorityDecision::Binary;
}

size_t LoadReport::count(FileLoadResult::Status status) const {
    size_t n = 0;
    for (const auto& file : files) {
        if (file.status == status) {
            ++n;
        }
    }
    return n;
}

size_t SaveReport::savedCount() const {
    size_t n = 0;
    for (const auto& file : files) {
        if (file.saved) {
            ++n;
        }
    }
    return n;
}

OrchestratorOptions OrchestratorOptions::fromConfig() {
    OrchestratorOptions options;
    options.codec = PluginManager::getInstance().getDefaultCodecSettings();
    options.workerThreads = FCBFORGE_CFG.getWorkerThreadCount();
    options.writeMarkupSidecars = FCBFORGE_CFG.WriteMarkupSidecars;
    options.force = FCBFORGE_CFG.ForceConversion;
    options.preferredForm = FCBFORGE_CFG.PreferredForm;
    options.keepBackups = FCBFORGE_CFG.KeepBackups;
    return options;
}

ConversionOrchestrator::ConversionOrchestrator(OrchestratorOptions options, ConversionCacheService* cache,
                                               const ReferenceResolver* resolver)
    : options_(std::move(options)), cache_(cache), resolver_(resolver) {
    if (!options_.codec.dictionary) {
        options_.codec.dictionary = std::make_shared<const ClassDictionary>();
    }
}

AuthorityInputs ConversionOrchestrator::gatherAuthorityInputs(const fs::path& binaryPath) const {
    AuthorityInputs inputs;
    fs::path markupPath = ResourceKinds::markupPathFor(binaryPath.string());
    std::error_code ec;

    inputs.binaryExists = fs::is_regular_file(binaryPath, ec);
    inputs.markupExists = fs::is_regular_file(markupPath, ec);
    inputs.explicitChoice = options_.preferredForm;

    if (inputs.binaryExists) {
        auto time = fs::last_write_time(binaryPath, ec);
        if (!ec) inputs.binaryTime = time;
    }
    if (inputs.markupExists) {
        auto time = fs::last_write_time(markupPath, ec);
        if (!ec) inputs.markupTime = time;
    }

    if (cache_ && !options_.force && inputs.binaryExists && inputs.markupExists) {
        if (auto record = cache_->lookup(binaryPath)) {
            inputs.syncedBinary = record->binary;
            inputs.syncedMarkup = record->markup;
            inputs.currentBinary = fingerprintFile(binaryPath);
            inputs.currentMarkup = fingerprintFile(markupPath);
        }
    }
    return inputs;
}

bool ConversionOrchestrator::writeSidecar(LevelFile& file) const {
    try {
        auto plugin = PluginManager::getInstance().createPlugin(file.markupPath, ResourceForm::Markup, options_.codec);
        if (!plugin) {
            Log(ERROR, "ConversionOrchestrator", "No markup plugin registered");
            return false;
        }
        plugin->save(file.resource);
        if (cache_) {
            cache_->recordSync(file.binaryPath, file.markupPath);
        }
        Log(DEBUG, "ConversionOrchestrator", "Wrote sidecar {}", file.markupPath.string());
        return true;
    } catch (const std::exception& e) {
        Log(WARNING, "ConversionOrchestrator", "Could not write sidecar for {}: {}", file.name(), e.what());
        return false;
    }
}

std::pair<FileLoadResult, std::optional<LevelFile>> ConversionOrchestrator::loadFile(const fs::path& binaryPath) const {
    FileLoadResult result;
    result.name = binaryPath.filename().string();
    result.binaryPath = binaryPath;

    LevelFile file;
    file.binaryPath = binaryPath;
    file.markupPath = ResourceKinds::markupPathFor(binaryPath.string());
    file.kind = ResourceKinds::classify(result.name);

    AuthorityInputs inputs = gatherAuthorityInputs(binaryPath);
    result.authority = decideAuthority(inputs);

    if (result.authority == AuthorityDecision::Missing) {
        result.status = FileLoadResult::Status::Failed;
        result.error = ErrorKind::IOFailure;
        result.message = "neither " + binaryPath.string() + " nor its markup exists";
        Log(ERROR, "ConversionOrchestrator", "{}: {}", result.name, result.message);
        return {result, std::nullopt};
    }
    if (result.authority == AuthorityDecision::Conflict) {
        result.status = FileLoadResult::Status::Conflict;
        result.message = "binary and markup both changed since the last sync, use --prefer-binary or --prefer-markup";
        Log(WARNING, "ConversionOrchestrator", "{}: {}", result.name, result.message);
        return {result, std::nullopt};
    }

    try {
        ResourceForm form = result.authority == AuthorityDecision::Markup ? ResourceForm::Markup : ResourceForm::Binary;
        const fs::path& source = form == ResourceForm::Markup ? file.markupPath : file.binaryPath;
        auto plugin = PluginManager::getInstance().createPlugin(source, form, options_.codec);
        if (!plugin) {
            throw FCBError(ErrorKind::IOFailure, "no plugin registered for " + source.string());
        }
        file.resource = plugin->load();
        file.resource.name = result.name;
        file.loadedFrom = form;

        if (form == ResourceForm::Markup) {
            // The binary is re-derived on the next save
            Level::setState(file, FileState::Dirty);
        } else {
            Level::setState(file, FileState::BinaryLoaded);
            if (options_.writeMarkupSidecars) {
                if (!options_.force && cache_ && cache_->isMarkupCurrent(file.binaryPath, file.markupPath)) {
                    result.cacheHit = true;
                    Level::setState(file, FileState::MarkupSynced);
                } else if (writeSidecar(file)) {
                    result.sidecarWritten = true;
                    Level::setState(file, FileState::MarkupSynced);
                }
            }
        }
    } catch (const FCBError& e) {
        result.status = FileLoadResult::Status::Failed;
        result.error = e.kind();
        result.message = e.what();
        Log(ERROR, "ConversionOrchestrator", "Failed to load {}: {}", result.name, e.what());
        return {result, std::nullopt};
    } catch (const std::exception& e) {
        result.status = FileLoadResult::Status::Failed;
        result.error = ErrorKind::IOFailure;
        result.message = e.what();
        Log(ERROR, "ConversionOrchestrator", "Failed to load {}: {}", result.name, e.what());
        return {result, std::nullopt};
    }

    result.status = FileLoadResult::Status::Loaded;
    result.state = file.state;
    Log(DEBUG, "ConversionOrchestrator", "{}: loaded from {} ({})", result.name,
        authorityDecisionName(result.authority), fileStateName(file.state));
    return {result, std::move(file)};
}

LoadReport ConversionOrchestrator::loadLevel(Level& level, const CancellationToken& token) {
    return loadLevel(level, LevelLayout::discover(level.containerDir(), level.sectorDir()), token);
}

LoadReport ConversionOrchestrator::loadLevel(Level& level, const std::vector<fs::path>& binaryPaths,
                                             const CancellationToken& token) {
    using Outcome = std::pair<FileLoadResult, std::optional<LevelFile>>;

    auto job = [this, &token](const fs::path& path) -> Outcome {
        if (token.isCancelled()) {
            FileLoadResult cancelled;
            cancelled.name = path.filename().string();
            cancelled.binaryPath = path;
            cancelled.status = FileLoadResult::Status::Cancelled;
            return {cancelled, std::nullopt};
        }
        return loadFile(path);
    };

    std::vector<Outcome> outcomes;
    outcomes.reserve(binaryPaths.size());

    if (options_.workerThreads > 1 && binaryPaths.size() > 1) {
        TaskScheduler scheduler;
        scheduler.initialize(std::min(options_.workerThreads, binaryPaths.size()));

        std::vector<std::future<Outcome>> futures;
        futures.reserve(binaryPaths.size());
        for (const auto& path : binaryPaths) {
            futures.push_back(scheduler.submitTask([&job, path]() { return job(path); }, "load:" + path.filename().string()));
        }
        for (auto& future : futures) {
            outcomes.push_back(future.get());
            if (options_.onFileLoaded) {
                options_.onFileLoaded(outcomes.back().first);
            }
        }
        scheduler.shutdown();
    } else {
        for (const auto& path : binaryPaths) {
            outcomes.push_back(job(path));
            if (options_.onFileLoaded) {
                options_.onFileLoaded(outcomes.back().first);
            }
        }
    }

    LoadReport report;
    {
        std::lock_guard<std::recursive_mutex> guard(level.lock());
        for (auto& outcome : outcomes) {
            if (outcome.second) {
                level.addFile(std::move(*outcome.second));
            }
            report.files.push_back(std::move(outcome.first));
        }
    }

    Log(MESSAGE, "ConversionOrchestrator", "Loaded {}/{} files ({} failed, {} conflicts, {} cancelled)",
        report.loadedCount(), report.files.size(), report.failedCount(), report.conflictCount(),
        report.cancelledCount());
    return report;
}

FileSaveResult ConversionOrchestrator::saveLoadedFile(LevelFile& file) {
    FileSaveResult result;
    result.name = file.name();

    try {
        auto plugin = PluginManager::getInstance().createPlugin(file.binaryPath, ResourceForm::Binary, options_.codec);
        if (!plugin) {
            throw FCBError(ErrorKind::IOFailure, "no binary plugin registered");
        }
        plugin->save(file.resource, options_.keepBackups);
    } catch (const FCBError& e) {
        result.error = e.kind();
        result.message = e.what();
        Log(ERROR, "ConversionOrchestrator", "Failed to save {}: {}", result.name, e.what());
        return result;
    } catch (const std::exception& e) {
        result.error = ErrorKind::IOFailure;
        result.message = e.what();
        Log(ERROR, "ConversionOrchestrator", "Failed to save {}: {}", result.name, e.what());
        return result;
    }

    result.saved = true;
    Level::setState(file, FileState::Saved);
    if (options_.writeMarkupSidecars) {
        result.sidecarWritten = writeSidecar(file);
    }
    Log(DEBUG, "ConversionOrchestrator", "Saved {}", file.binaryPath.string());
    return result;
}

FileSaveResult ConversionOrchestrator::saveFile(Level& level, const std::string& name) {
    std::lock_guard<std::recursive_mutex> guard(level.lock());
    LevelFile* file = level.findFile(name);
    if (!file) {
        FileSaveResult result;
        result.name = name;
        result.error = ErrorKind::IOFailure;
        result.message = name + " is not loaded";
        Log(ERROR, "ConversionOrchestrator", "Cannot save {}: not loaded", name);
        return result;
    }
    if (file->state != FileState::Dirty) {
        FileSaveResult result;
        result.name = name;
        result.saved = true;
        result.message = "no changes";
        return result;
    }
    return saveLoadedFile(*file);
}

SaveReport ConversionOrchestrator::saveLevel(Level& level) {
    std::lock_guard<std::recursive_mutex> guard(level.lock());
    SaveReport report;

    if (resolver_) {
        report.danglingReferences = resolver_->findDangling(level);
    }

    for (auto& file : level.files()) {
        if (file.state != FileState::Dirty) {
            continue;
        }
        report.files.push_back(saveLoadedFile(file));
    }

    Log(MESSAGE, "ConversionOrchestrator", "Saved {}/{} dirty files, {} dangling references",
        report.savedCount(), report.files.size(), report.danglingReferences.size());
    return report;
}

} // namespace FCBForge
