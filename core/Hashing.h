#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace FCBForge {

// CRC-32 (zlib polynomial) of a class or member name, the engine's name hash
uint32_t hashName(std::string_view name);

uint32_t crc32Bytes(const uint8_t* data, size_t size);
uint32_t crc32Bytes(const std::vector<uint8_t>& data);

/**
 * @brief Content fingerprint of a file on disk
 * @return CRC-32 and size, or nullopt when the file cannot be read
 */
struct FileFingerprint {
    uint32_t crc = 0;
    uint64_t size = 0;

    bool operator==(const FileFingerprint& other) const = default;
};
std::optional<FileFingerprint> fingerprintFile(const std::filesystem::path& path);
FileFingerprint fingerprintBytes(const std::vector<uint8_t>& data);

// "0012ABCD" style, always 8 upper-case digits
std::string formatHash(uint32_t hash);
// Accepts exactly 8 hex digits (either case)
std::optional<uint32_t> parseHash(std::string_view text);

// Decimal node ID as typed by a user, or hex with an explicit 0x prefix
std::optional<uint64_t> parseNodeId(std::string_view text);

} // namespace FCBForge
