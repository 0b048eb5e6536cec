#include "MemoryLogWriter.h"

namespace FCBForge {

void MemoryLogWriter::WriteLogMessage(const LogMessage& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(msg);
}

std::vector<LogMessage> MemoryLogWriter::messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
}

size_t MemoryLogWriter::countContaining(LogLevel level, const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& msg : messages_) {
        if (msg.level == level && msg.message.find(needle) != std::string::npos) {
            ++count;
        }
    }
    return count;
}

void MemoryLogWriter::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.clear();
}

} // namespace FCBForge
