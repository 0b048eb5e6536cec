#pragma once

#include "Logger.h"

#include <vector>

namespace FCBForge {

/**
 * @brief Keeps every message it receives in memory
 *
 * Used to assert on diagnostics (unknown tags, dangling references) without
 * scraping the console.
 */
class MemoryLogWriter : public LogWriter {
public:
    explicit MemoryLogWriter(LogLevel level = DEBUG) : LogWriter(level) {}

    void WriteLogMessage(const LogMessage& msg) override;

    std::vector<LogMessage> messages() const;
    size_t countContaining(LogLevel level, const std::string& needle) const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<LogMessage> messages_;
};

} // namespace FCBForge
