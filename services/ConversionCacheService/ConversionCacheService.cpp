#include "ConversionCacheService.h"

#include <chrono>
#include <ctime>
#include <fstream>
#include <nlohmann/json.hpp>

#include "core/CFG.h"
#include "core/Logging/Logging.h"

namespace fs = std::filesystem;
namespace FCBForge {

static std::string nowIso8601() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tmBuf{};
    gmtime_r(&t, &tmBuf);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmBuf);
    return std::string(buf);
}

void ConversionCacheService::initialize(const std::string& context) {
    std::lock_guard<std::mutex> lock(mtx_);
    cacheDir_ = context.empty() ? fs::path(FCBFORGE_CFG.CacheDir) : fs::path(context);
    records_.clear();
    pendingLines_.clear();
    loadLedgerUnsafe();
    initialized_ = true;
    Log(DEBUG, "ConversionCacheService", "Loaded {} sync records from {}", records_.size(),
        (cacheDir_ / "conversions.jsonl").string());
}

void ConversionCacheService::cleanup() {
    std::lock_guard<std::mutex> lock(mtx_);
    flushPendingUnsafe();
    records_.clear();
    initialized_ = false;
}

void ConversionCacheService::onLifecycleEvent(ServiceLifecycle event, const std::string& context) {
    switch (event) {
        case ServiceLifecycle::LEVEL_LOAD_END:
        case ServiceLifecycle::LEVEL_SAVE_END:
        case ServiceLifecycle::APPLICATION_SHUTDOWN:
            flush();
            break;
        default:
            break;
    }
}

fs::path ConversionCacheService::getLedgerPath() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return cacheDir_ / "conversions.jsonl";
}

size_t ConversionCacheService::recordCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return records_.size();
}

std::string ConversionCacheService::makeKey(const fs::path& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    return (ec ? path : absolute).lexically_normal().string();
}

void ConversionCacheService::loadLedgerUnsafe() {
    fs::path ledgerPath = cacheDir_ / "conversions.jsonl";
    std::ifstream in(ledgerPath);
    if (!in.is_open()) {
        return;
    }

    std::string line;
    size_t lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (line.empty()) continue;

        nlohmann::json entry = nlohmann::json::parse(line, nullptr, false);
        if (entry.is_discarded() || !entry.is_object()) {
            Log(WARNING, "ConversionCacheService", "{}:{}: skipping malformed ledger line", ledgerPath.string(), lineNumber);
            continue;
        }

        std::string event = entry.value("event", "");
        std::string binary = entry.value("binary", "");
        if (binary.empty()) continue;

        if (event == "forget") {
            records_.erase(binary);
            continue;
        }
        if (event != "sync") continue;

        auto binaryCrc = parseHash(entry.value("binaryCrc", ""));
        auto markupCrc = parseHash(entry.value("markupCrc", ""));
        if (!binaryCrc || !markupCrc) {
            Log(WARNING, "ConversionCacheService", "{}:{}: sync record without valid checksums", ledgerPath.string(), lineNumber);
            continue;
        }

        SyncRecord record;
        record.binaryPath = binary;
        record.markupPath = entry.value("markup", "");
        record.binary = FileFingerprint{*binaryCrc, entry.value("binarySize", uint64_t{0})};
        record.markup = FileFingerprint{*markupCrc, entry.value("markupSize", uint64_t{0})};
        record.syncedAt = entry.value("ts", "");
        records_[binary] = std::move(record);
    }
}

void ConversionCacheService::writeJsonlUnsafe(const std::string& line) {
    // Buffer lines in-memory; flushed on level end events and shutdown
    pendingLines_.push_back(line);
}

void ConversionCacheService::flushPendingUnsafe() {
    if (pendingLines_.empty()) return;

    std::error_code ec;
    fs::create_directories(cacheDir_, ec);
    fs::path ledgerPath = cacheDir_ / "conversions.jsonl";
    std::ofstream out(ledgerPath, std::ios::app);
    if (!out.is_open()) {
        Log(ERROR, "ConversionCacheService", "Failed to open ledger for flush: {}", ledgerPath.string());
        return;
    }
    for (const auto& l : pendingLines_) {
        out << l << '\n';
    }
    out.flush();
    if (!out) {
        Log(ERROR, "ConversionCacheService", "Failed to write ledger: {}", ledgerPath.string());
        return;
    }
    pendingLines_.clear();
}

void ConversionCacheService::flush() {
    std::lock_guard<std::mutex> lock(mtx_);
    flushPendingUnsafe();
}

std::optional<ConversionCacheService::SyncRecord> ConversionCacheService::lookup(const fs::path& binaryPath) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = records_.find(makeKey(binaryPath));
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ConversionCacheService::isMarkupCurrent(const fs::path& binaryPath, const fs::path& markupPath, bool force) const {
    if (force) return false;

    auto record = lookup(binaryPath);
    if (!record) return false;

    auto binary = fingerprintFile(binaryPath);
    auto markup = fingerprintFile(markupPath);
    if (!binary || !markup) return false;

    bool current = *binary == record->binary && *markup == record->markup;
    Log(DEBUG, "ConversionCacheService", "{}: markup {}", binaryPath.string(), current ? "current" : "stale");
    return current;
}

bool ConversionCacheService::recordSync(const fs::path& binaryPath, const fs::path& markupPath) {
    auto binary = fingerprintFile(binaryPath);
    auto markup = fingerprintFile(markupPath);
    if (!binary || !markup) {
        Log(WARNING, "ConversionCacheService", "Cannot fingerprint {} / {}, not recording sync",
            binaryPath.string(), markupPath.string());
        return false;
    }

    SyncRecord record;
    record.binaryPath = makeKey(binaryPath);
    record.markupPath = makeKey(markupPath);
    record.binary = *binary;
    record.markup = *markup;
    record.syncedAt = nowIso8601();

    nlohmann::json entry = {
        {"event", "sync"},
        {"ts", record.syncedAt},
        {"binary", record.binaryPath},
        {"binaryCrc", formatHash(record.binary.crc)},
        {"binarySize", record.binary.size},
        {"markup", record.markupPath},
        {"markupCrc", formatHash(record.markup.crc)},
        {"markupSize", record.markup.size}
    };

    std::lock_guard<std::mutex> lock(mtx_);
    writeJsonlUnsafe(entry.dump());
    records_[record.binaryPath] = std::move(record);
    return true;
}

void ConversionCacheService::forget(const fs::path& binaryPath) {
    std::string key = makeKey(binaryPath);
    nlohmann::json entry = {
        {"event", "forget"},
        {"ts", nowIso8601()},
        {"binary", key}
    };

    std::lock_guard<std::mutex> lock(mtx_);
    if (records_.erase(key) > 0) {
        writeJsonlUnsafe(entry.dump());
    }
}

} // namespace FCBForge

REGISTER_SERVICE(ConversionCacheService)
