#include <gtest/gtest.h>

#include <bit>
#include <functional>
#include <cmath>
#include <limits>

#include "core/FCBError.h"
#include "plugins/FCB/PrimitiveCodec.h"

using namespace FCBForge;

namespace {

ErrorKind kindOf(const std::function<void()>& action) {
    try {
        action();
    } catch (const FCBError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected an FCBError";
    return ErrorKind::IOFailure;
}

} // namespace

TEST(PrimitiveCodec, ReadsLittleEndianIntegers) {
    std::vector<uint8_t> bytes = {0x34, 0x12, 0x78, 0x56, 0x34, 0x12, 0xFF};
    ByteReader reader(bytes);
    EXPECT_EQ(reader.readU16(), 0x1234);
    EXPECT_EQ(reader.readU32(), 0x12345678u);
    EXPECT_EQ(reader.readI8(), -1);
    EXPECT_TRUE(reader.atEnd());
}

TEST(PrimitiveCodec, WriterMatchesReader) {
    ByteWriter writer;
    writer.writeU64(0x0102030405060708ull);
    writer.writeI32(-42);
    writer.writeF32(-0.0f);
    writer.writeF64(3.25);

    ByteReader reader(writer.bytes());
    EXPECT_EQ(reader.readU64(), 0x0102030405060708ull);
    EXPECT_EQ(reader.readI32(), -42);
    EXPECT_EQ(std::bit_cast<uint32_t>(reader.readF32()), 0x80000000u);
    EXPECT_EQ(reader.readF64(), 3.25);
    EXPECT_EQ(writer.bytes()[0], 0x08);
}

TEST(PrimitiveCodec, TruncatedScalarReportsOffset) {
    std::vector<uint8_t> bytes = {0x01, 0x02, 0x03};
    ByteReader reader(bytes);
    reader.readU8();
    try {
        reader.readU32();
        FAIL() << "expected TruncatedInput";
    } catch (const FCBError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TruncatedInput);
        EXPECT_EQ(e.offset(), 1u);
    }
}

TEST(PrimitiveCodec, SubReaderKeepsAbsolutePositions) {
    std::vector<uint8_t> bytes = {0, 0, 0, 0xAA, 0xBB, 0xCC};
    ByteReader reader(bytes);
    reader.skip(3);
    ByteReader sub = reader.sub(2);
    EXPECT_EQ(sub.position(), 3u);
    EXPECT_EQ(sub.readU8(), 0xAA);
    EXPECT_EQ(sub.remaining(), 1u);
    EXPECT_EQ(reader.position(), 5u);
    EXPECT_EQ(kindOf([&] { sub.readU16(); }), ErrorKind::TruncatedInput);
}

TEST(PrimitiveCodec, StringIncludesTerminatorInLength) {
    ByteWriter writer;
    writer.writeString("hidName");
    ASSERT_EQ(writer.size(), 4u + 8u);
    EXPECT_EQ(writer.bytes()[4 + 7], 0);

    ByteReader reader(writer.bytes());
    EXPECT_EQ(reader.readString(), "hidName");
    EXPECT_TRUE(reader.atEnd());
}

TEST(PrimitiveCodec, StringEncodingErrors) {
    // length 0
    std::vector<uint8_t> empty = {0, 0, 0, 0};
    EXPECT_EQ(kindOf([&] { ByteReader(empty).readString(); }), ErrorKind::EncodingError);

    // no terminator
    std::vector<uint8_t> unterminated = {3, 0, 0, 0, 'a', 'b', 'c'};
    EXPECT_EQ(kindOf([&] { ByteReader(unterminated).readString(); }), ErrorKind::EncodingError);

    // terminator before the declared end
    std::vector<uint8_t> early = {4, 0, 0, 0, 'a', 0, 'c', 0};
    EXPECT_EQ(kindOf([&] { ByteReader(early).readString(); }), ErrorKind::EncodingError);

    // declared length beyond the input
    std::vector<uint8_t> overrun = {9, 0, 0, 0, 'a', 0};
    EXPECT_EQ(kindOf([&] { ByteReader(overrun).readString(); }), ErrorKind::TruncatedInput);

    ByteWriter writer;
    EXPECT_EQ(kindOf([&] { writer.writeString(std::string("a\0b", 3)); }), ErrorKind::EncodingError);
}

TEST(PrimitiveCodec, BoolAcceptsOnlyZeroAndOne) {
    std::vector<uint8_t> bytes = {0x00, 0x01, 0x02};
    ByteReader reader(bytes);
    EXPECT_EQ(*readScalar(reader, ValueKind::Bool).get<bool>(), false);
    EXPECT_EQ(*readScalar(reader, ValueKind::Bool).get<bool>(), true);
    EXPECT_EQ(kindOf([&] { readScalar(reader, ValueKind::Bool); }), ErrorKind::EncodingError);
}

TEST(PrimitiveCodec, ScalarKindsRoundTrip) {
    std::vector<Value> values = {
        Value(true),
        Value(int8_t{-5}),
        Value(uint16_t{65535}),
        Value(std::numeric_limits<int64_t>::min()),
        Value(std::numeric_limits<float>::quiet_NaN()),
        Value(std::string("Tree_01")),
        Value(Blob{0xDE, 0xAD}),
        Value(NodeRef{0x1122334455667788ull}),
        Value(Vector3{1.5f, -2.0f, 0.0f}),
        Value(Hash32{0xCAFEBABE}),
    };

    ByteWriter writer;
    for (const auto& value : values) {
        writeScalar(writer, value.kind(), value);
    }
    ByteReader reader(writer.bytes());
    for (const auto& value : values) {
        EXPECT_EQ(readScalar(reader, value.kind()), value) << Value::kindName(value.kind());
    }
    EXPECT_TRUE(reader.atEnd());
}

TEST(PrimitiveCodec, WriteScalarRejectsKindMismatch) {
    ByteWriter writer;
    EXPECT_EQ(kindOf([&] { writeScalar(writer, ValueKind::UInt32, Value(int32_t{1})); }), ErrorKind::EncodingError);
    EXPECT_EQ(writer.size(), 0u);
}

TEST(PrimitiveCodec, PatchesReservedLength) {
    ByteWriter writer;
    size_t slot = writer.reserveU32();
    writer.writeU16(7);
    writer.patchU32(slot, static_cast<uint32_t>(writer.size() - slot - 4));
    ByteReader reader(writer.bytes());
    EXPECT_EQ(reader.readU32(), 2u);
}
