#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

#include "PrimitiveCodec.h"

namespace FCBForge {

// FCB v3 container layout, all fields little-endian.
// File:  FCBHeader, then rootCount nodes, then optional trailer bytes.
// Node:  FCBNodeHeader, then payloadLength bytes of payload.
// Payload of a structured node:
//   u16 attributeCount
//   attributeCount x { u32 nameHash, u8 kind, value }
//   u32 childCount
//   childCount x node
//   trailing bytes up to payloadLength

constexpr char kFCBSignature[4] = {'n', 'b', 'C', 'F'};
constexpr uint16_t kFCBVersion = 3;
constexpr size_t kNodeHeaderSize = 8;
// nameHash + kind + the shortest value (1 byte)
constexpr size_t kMinAttributeSize = 6;
constexpr size_t kMaxNodeDepth = 1024;

#pragma pack(push, 1)

struct FCBHeader {
  char signature[4]; // 0x0000 'n','b','C','F'
  uint16_t version;  // 0x0004 format version, 3
  uint16_t flags;    // 0x0006 opaque, preserved
  uint32_t rootCount; // 0x0008 number of top-level nodes

  bool isValid() const {
    return std::memcmp(signature, kFCBSignature, 4) == 0 &&
           version == kFCBVersion;
  }

  static FCBHeader read(ByteReader &reader) {
    FCBHeader header{};
    for (char &c : header.signature) {
      c = static_cast<char>(reader.readU8());
    }
    header.version = reader.readU16();
    header.flags = reader.readU16();
    header.rootCount = reader.readU32();
    return header;
  }

  void write(ByteWriter &writer) const {
    for (char c : signature) {
      writer.writeU8(static_cast<uint8_t>(c));
    }
    writer.writeU16(version);
    writer.writeU16(flags);
    writer.writeU32(rootCount);
  }
};

struct FCBNodeHeader {
  uint32_t typeTag;       // 0x0000 CRC-32 of the class name
  uint32_t payloadLength; // 0x0004 bytes following this header

  static FCBNodeHeader read(ByteReader &reader) {
    FCBNodeHeader header{};
    header.typeTag = reader.readU32();
    header.payloadLength = reader.readU32();
    return header;
  }
};

#pragma pack(pop)

static_assert(sizeof(FCBHeader) == 12, "FCB header must be 12 bytes");
static_assert(sizeof(FCBNodeHeader) == kNodeHeaderSize,
              "FCB node header must be 8 bytes");

} // namespace FCBForge
