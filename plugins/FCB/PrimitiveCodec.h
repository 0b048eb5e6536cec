#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/Resource/Value.h"

namespace FCBForge {

/**
 * @brief Little-endian read cursor over a byte range
 *
 * Every read checks the remaining length first and throws
 * FCBError(TruncatedInput) with the absolute offset of the failed read.
 * Bytes are assembled one at a time, so host byte order never matters.
 */
class ByteReader {
public:
    explicit ByteReader(const std::vector<uint8_t>& data);
    ByteReader(const uint8_t* data, size_t size, size_t baseOffset = 0);

    // Absolute offset, counted from the start of the outermost buffer
    size_t position() const { return baseOffset_ + pos_; }
    size_t remaining() const { return size_ - pos_; }
    bool atEnd() const { return pos_ == size_; }

    uint8_t readU8();
    uint16_t readU16();
    uint32_t readU32();
    uint64_t readU64();
    int8_t readI8();
    int16_t readI16();
    int32_t readI32();
    int64_t readI64();
    float readF32();
    double readF64();

    std::vector<uint8_t> readBlob(size_t length);
    // u32 length including the NUL terminator, then the bytes
    std::string readString();

    void skip(size_t length);

    // Reader over the next `length` bytes; this reader moves past them
    ByteReader sub(size_t length);

private:
    void require(size_t length, const char* what) const;

    template<typename T>
    T readLE(const char* what);

    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
    size_t baseOffset_ = 0;
};

/**
 * @brief Little-endian append-only byte sink with back-patching
 */
class ByteWriter {
public:
    size_t size() const { return buffer_.size(); }
    const std::vector<uint8_t>& bytes() const { return buffer_; }
    std::vector<uint8_t> take() { return std::move(buffer_); }

    void writeU8(uint8_t value);
    void writeU16(uint16_t value);
    void writeU32(uint32_t value);
    void writeU64(uint64_t value);
    void writeI8(int8_t value) { writeU8(static_cast<uint8_t>(value)); }
    void writeI16(int16_t value) { writeU16(static_cast<uint16_t>(value)); }
    void writeI32(int32_t value) { writeU32(static_cast<uint32_t>(value)); }
    void writeI64(int64_t value) { writeU64(static_cast<uint64_t>(value)); }
    void writeF32(float value);
    void writeF64(double value);

    void writeBlob(const uint8_t* data, size_t length);
    void writeBlob(const std::vector<uint8_t>& data) { writeBlob(data.data(), data.size()); }
    void writeString(std::string_view text);

    // Placeholder for a length written once the content is known
    size_t reserveU32();
    void patchU32(size_t position, uint32_t value);

private:
    template<typename T>
    void writeLE(T value);

    std::vector<uint8_t> buffer_;
};

/**
 * @brief Reads one attribute value of the given kind
 *
 * Strings and blobs carry a u32 length prefix, Vector3 is three floats,
 * everything else is a fixed-width scalar.
 */
Value readScalar(ByteReader& reader, ValueKind kind);

/**
 * @brief Writes `value`, which must be of `kind`
 * @return number of bytes written
 */
size_t writeScalar(ByteWriter& writer, ValueKind kind, const Value& value);

} // namespace FCBForge
