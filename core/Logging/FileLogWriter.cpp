#include "FileLogWriter.h"
#include <chrono>
#include <iomanip>
#include <sstream>

namespace FCBForge {

FileLogWriter::FileLogWriter(const std::filesystem::path& logPath, LogLevel level)
    : LogWriter(level)
{
    logFile.open(logPath, std::ios::trunc);

    if (logFile.is_open()) {
        logFile << "=== FCBForge Log Started ===" << std::endl;
    }
}

FileLogWriter::~FileLogWriter() {
    if (logFile.is_open()) {
        logFile << "=== FCBForge Log Ended ===" << std::endl;
        logFile.close();
    }
}

void FileLogWriter::WriteLogMessage(const LogMessage& msg) {
    std::lock_guard<std::mutex> lock(fileMutex);
    if (!logFile.is_open()) {
        return;
    }

    logFile << getCurrentTimestamp() << " [" << LogLevelName(msg.level) << "]["
            << msg.owner << "] "
            << msg.message << '\n';
}

void FileLogWriter::Flush() {
    std::lock_guard<std::mutex> lock(fileMutex);
    if (logFile.is_open()) {
        logFile.flush();
    }
}

std::string FileLogWriter::getCurrentTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm localTime{};
    localtime_r(&time_t, &localTime);

    std::stringstream ss;
    ss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();

    return ss.str();
}

} // namespace FCBForge
