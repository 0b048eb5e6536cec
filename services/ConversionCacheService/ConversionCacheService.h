#pragma once

#include "services/ServiceBase.h"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/Hashing.h"

namespace FCBForge {

/**
 * @brief Remembers which binary/markup pairs were last known to be in sync
 *
 * Each sync appends one JSON line to <CacheDir>/conversions.jsonl:
 *   {"event":"sync","ts":"...","binary":"/abs/a.fcb","binaryCrc":"1A2B3C4D",
 *    "binarySize":123,"markup":"/abs/a.fcb.converted.xml","markupCrc":...}
 * The newest line per binary path wins when the ledger is read back.
 * Appends are buffered and flushed at level end events and shutdown.
 */
class ConversionCacheService : public ServiceBase {
public:
    struct SyncRecord {
        std::string binaryPath;
        std::string markupPath;
        FileFingerprint binary;
        FileFingerprint markup;
        std::string syncedAt;
    };

    // ServiceBase interface
    // context overrides the configured CacheDir when not empty
    void initialize(const std::string& context = "") override;
    void cleanup() override;
    bool isInitialized() const override { return initialized_; }

    ServiceLifecycle getLifecycle() const override { return ServiceLifecycle::APPLICATION_START; }
    ServiceScope getScope() const override { return ServiceScope::SINGLETON; }
    bool shouldAutoInitialize() const override { return true; }
    void onLifecycleEvent(ServiceLifecycle event, const std::string& context = "") override;

    std::optional<SyncRecord> lookup(const std::filesystem::path& binaryPath) const;

    // True when both files still match the fingerprints of their last sync
    bool isMarkupCurrent(const std::filesystem::path& binaryPath, const std::filesystem::path& markupPath,
                         bool force = false) const;

    // Fingerprints both files as they are now and records them as in sync
    bool recordSync(const std::filesystem::path& binaryPath, const std::filesystem::path& markupPath);
    void forget(const std::filesystem::path& binaryPath);

    void flush();

    std::filesystem::path getLedgerPath() const;
    size_t recordCount() const;

private:
    static std::string makeKey(const std::filesystem::path& path);
    void loadLedgerUnsafe();
    void flushPendingUnsafe();
    void writeJsonlUnsafe(const std::string& line);

    std::unordered_map<std::string, SyncRecord> records_;
    std::filesystem::path cacheDir_;
    bool initialized_ = false;
    mutable std::mutex mtx_;
    std::vector<std::string> pendingLines_; // buffered JSONL lines
};

} // namespace FCBForge
