#include "Hashing.h"

#include <algorithm>
#include <charconv>
#include <format>
#include <fstream>
#include <limits>

#include <zlib.h>

namespace FCBForge {

uint32_t crc32Bytes(const uint8_t* data, size_t size) {
    uLong crc = crc32(0L, Z_NULL, 0);
    // zlib takes uInt lengths, feed large buffers in chunks
    while (size > 0) {
        uInt chunk = static_cast<uInt>(std::min<size_t>(size, std::numeric_limits<uInt>::max()));
        crc = crc32(crc, reinterpret_cast<const Bytef*>(data), chunk);
        data += chunk;
        size -= chunk;
    }
    return static_cast<uint32_t>(crc);
}

uint32_t crc32Bytes(const std::vector<uint8_t>& data) {
    return crc32Bytes(data.data(), data.size());
}

uint32_t hashName(std::string_view name) {
    return crc32Bytes(reinterpret_cast<const uint8_t*>(name.data()), name.size());
}

FileFingerprint fingerprintBytes(const std::vector<uint8_t>& data) {
    return FileFingerprint{crc32Bytes(data), static_cast<uint64_t>(data.size())};
}

std::optional<FileFingerprint> fingerprintFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }

    FileFingerprint fp;
    uLong crc = crc32(0L, Z_NULL, 0);
    std::vector<char> buffer(64 * 1024);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got <= 0) {
            break;
        }
        crc = crc32(crc, reinterpret_cast<const Bytef*>(buffer.data()), static_cast<uInt>(got));
        fp.size += static_cast<uint64_t>(got);
    }
    if (in.bad()) {
        return std::nullopt;
    }
    fp.crc = static_cast<uint32_t>(crc);
    return fp;
}

std::string formatHash(uint32_t hash) {
    return std::format("{:08X}", hash);
}

std::optional<uint32_t> parseHash(std::string_view text) {
    if (text.size() != 8) {
        return std::nullopt;
    }
    uint32_t value = 0;
    for (char c : text) {
        value <<= 4;
        if (c >= '0' && c <= '9') value |= static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') value |= static_cast<uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') value |= static_cast<uint32_t>(c - 'A' + 10);
        else return std::nullopt;
    }
    return value;
}

std::optional<uint64_t> parseNodeId(std::string_view text) {
    int base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
        base = 16;
    }
    if (text.empty()) {
        return std::nullopt;
    }
    uint64_t id = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), id, base);
    if (ec != std::errc() || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return id;
}

} // namespace FCBForge
