#include "PrimitiveCodec.h"

#include <bit>
#include <cstring>
#include <format>
#include <limits>
#include <type_traits>

#include "core/FCBError.h"

namespace FCBForge {

ByteReader::ByteReader(const std::vector<uint8_t>& data)
    : data_(data.data()), size_(data.size()) {}

ByteReader::ByteReader(const uint8_t* data, size_t size, size_t baseOffset)
    : data_(data), size_(size), baseOffset_(baseOffset) {}

void ByteReader::require(size_t length, const char* what) const {
    if (length > remaining()) {
        throw FCBError(ErrorKind::TruncatedInput,
                       std::format("{} needs {} bytes, {} remaining", what, length, remaining()),
                       position());
    }
}

template<typename T>
T ByteReader::readLE(const char* what) {
    static_assert(std::is_integral_v<T>);
    require(sizeof(T), what);
    uint64_t value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<uint64_t>(data_[pos_ + i]) << (8 * i);
    }
    pos_ += sizeof(T);
    return static_cast<T>(value);
}

uint8_t ByteReader::readU8() { return readLE<uint8_t>("u8"); }
uint16_t ByteReader::readU16() { return readLE<uint16_t>("u16"); }
uint32_t ByteReader::readU32() { return readLE<uint32_t>("u32"); }
uint64_t ByteReader::readU64() { return readLE<uint64_t>("u64"); }
int8_t ByteReader::readI8() { return readLE<int8_t>("i8"); }
int16_t ByteReader::readI16() { return readLE<int16_t>("i16"); }
int32_t ByteReader::readI32() { return readLE<int32_t>("i32"); }
int64_t ByteReader::readI64() { return readLE<int64_t>("i64"); }

float ByteReader::readF32() {
    return std::bit_cast<float>(readLE<uint32_t>("f32"));
}

double ByteReader::readF64() {
    return std::bit_cast<double>(readLE<uint64_t>("f64"));
}

std::vector<uint8_t> ByteReader::readBlob(size_t length) {
    require(length, "blob");
    std::vector<uint8_t> blob(data_ + pos_, data_ + pos_ + length);
    pos_ += length;
    return blob;
}

std::string ByteReader::readString() {
    size_t start = position();
    uint32_t length = readU32();
    require(length, "string");

    const char* text = reinterpret_cast<const char*>(data_ + pos_);
    if (length == 0) {
        throw FCBError(ErrorKind::EncodingError, "string length 0 leaves no room for the terminator", start);
    }
    if (text[length - 1] != '\0') {
        throw FCBError(ErrorKind::EncodingError,
                       std::format("string of declared length {} is not NUL terminated", length), start);
    }
    const void* embedded = std::memchr(text, '\0', length - 1);
    if (embedded != nullptr) {
        size_t actual = static_cast<size_t>(static_cast<const char*>(embedded) - text);
        throw FCBError(ErrorKind::EncodingError,
                       std::format("string declares {} bytes but ends after {}", length - 1, actual), start);
    }

    std::string result(text, length - 1);
    pos_ += length;
    return result;
}

void ByteReader::skip(size_t length) {
    require(length, "skip");
    pos_ += length;
}

ByteReader ByteReader::sub(size_t length) {
    require(length, "sub-range");
    ByteReader child(data_ + pos_, length, position());
    pos_ += length;
    return child;
}

template<typename T>
void ByteWriter::writeLE(T value) {
    static_assert(std::is_unsigned_v<T>);
    for (size_t i = 0; i < sizeof(T); ++i) {
        buffer_.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
}

void ByteWriter::writeU8(uint8_t value) { buffer_.push_back(value); }
void ByteWriter::writeU16(uint16_t value) { writeLE(value); }
void ByteWriter::writeU32(uint32_t value) { writeLE(value); }
void ByteWriter::writeU64(uint64_t value) { writeLE(value); }

void ByteWriter::writeF32(float value) {
    writeLE(std::bit_cast<uint32_t>(value));
}

void ByteWriter::writeF64(double value) {
    writeLE(std::bit_cast<uint64_t>(value));
}

void ByteWriter::writeBlob(const uint8_t* data, size_t length) {
    buffer_.insert(buffer_.end(), data, data + length);
}

void ByteWriter::writeString(std::string_view text) {
    if (text.find('\0') != std::string_view::npos) {
        throw FCBError(ErrorKind::EncodingError, "string contains an embedded NUL and cannot be encoded", size());
    }
    if (text.size() >= std::numeric_limits<uint32_t>::max()) {
        throw FCBError(ErrorKind::EncodingError, "string too long for a u32 length prefix", size());
    }
    writeU32(static_cast<uint32_t>(text.size() + 1));
    writeBlob(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    writeU8(0);
}

size_t ByteWriter::reserveU32() {
    size_t position = buffer_.size();
    writeU32(0);
    return position;
}

void ByteWriter::patchU32(size_t position, uint32_t value) {
    for (size_t i = 0; i < 4; ++i) {
        buffer_[position + i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

Value readScalar(ByteReader& reader, ValueKind kind) {
    switch (kind) {
        case ValueKind::Bool: {
            size_t offset = reader.position();
            uint8_t byte = reader.readU8();
            if (byte > 1) {
                throw FCBError(ErrorKind::EncodingError, std::format("boolean byte 0x{:02X} is neither 0 nor 1", byte), offset);
            }
            return Value(byte == 1);
        }
        case ValueKind::Int8: return Value(reader.readI8());
        case ValueKind::UInt8: return Value(reader.readU8());
        case ValueKind::Int16: return Value(reader.readI16());
        case ValueKind::UInt16: return Value(reader.readU16());
        case ValueKind::Int32: return Value(reader.readI32());
        case ValueKind::UInt32: return Value(reader.readU32());
        case ValueKind::Int64: return Value(reader.readI64());
        case ValueKind::UInt64: return Value(reader.readU64());
        case ValueKind::Float32: return Value(reader.readF32());
        case ValueKind::Float64: return Value(reader.readF64());
        case ValueKind::String: return Value(reader.readString());
        case ValueKind::Blob: {
            uint32_t length = reader.readU32();
            return Value(reader.readBlob(length));
        }
        case ValueKind::Reference: return Value(NodeRef{reader.readU64()});
        case ValueKind::Vector3: {
            Vector3 v;
            v.x = reader.readF32();
            v.y = reader.readF32();
            v.z = reader.readF32();
            return Value(v);
        }
        case ValueKind::Hash32: return Value(Hash32{reader.readU32()});
    }
    throw FCBError(ErrorKind::MalformedHeader,
                   std::format("unknown value kind 0x{:02X}", static_cast<unsigned>(kind)), reader.position());
}

size_t writeScalar(ByteWriter& writer, ValueKind kind, const Value& value) {
    if (value.kind() != kind) {
        throw FCBError(ErrorKind::EncodingError,
                       std::format("value of kind {} written as {}", Value::kindName(value.kind()), Value::kindName(kind)),
                       writer.size());
    }

    size_t start = writer.size();
    switch (kind) {
        case ValueKind::Bool: writer.writeU8(*value.get<bool>() ? 1 : 0); break;
        case ValueKind::Int8: writer.writeI8(*value.get<int8_t>()); break;
        case ValueKind::UInt8: writer.writeU8(*value.get<uint8_t>()); break;
        case ValueKind::Int16: writer.writeI16(*value.get<int16_t>()); break;
        case ValueKind::UInt16: writer.writeU16(*value.get<uint16_t>()); break;
        case ValueKind::Int32: writer.writeI32(*value.get<int32_t>()); break;
        case ValueKind::UInt32: writer.writeU32(*value.get<uint32_t>()); break;
        case ValueKind::Int64: writer.writeI64(*value.get<int64_t>()); break;
        case ValueKind::UInt64: writer.writeU64(*value.get<uint64_t>()); break;
        case ValueKind::Float32: writer.writeF32(*value.get<float>()); break;
        case ValueKind::Float64: writer.writeF64(*value.get<double>()); break;
        case ValueKind::String: writer.writeString(*value.get<std::string>()); break;
        case ValueKind::Blob: {
            const Blob& blob = *value.get<Blob>();
            if (blob.size() > std::numeric_limits<uint32_t>::max()) {
                throw FCBError(ErrorKind::EncodingError, "blob too long for a u32 length prefix", start);
            }
            writer.writeU32(static_cast<uint32_t>(blob.size()));
            writer.writeBlob(blob);
            break;
        }
        case ValueKind::Reference: writer.writeU64(value.get<NodeRef>()->id); break;
        case ValueKind::Vector3: {
            const Vector3& v = *value.get<Vector3>();
            writer.writeF32(v.x);
            writer.writeF32(v.y);
            writer.writeF32(v.z);
            break;
        }
        case ValueKind::Hash32: writer.writeU32(value.get<Hash32>()->value); break;
    }
    return writer.size() - start;
}

} // namespace FCBForge
