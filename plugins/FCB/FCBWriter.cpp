#include "FCBWriter.h"

#include <format>
#include <limits>

#include "core/FCBError.h"
#include "core/Hashing.h"

namespace FCBForge {

std::vector<uint8_t> FCBWriter::serialize(const ResourceFile& file) const {
    if (file.roots.size() > std::numeric_limits<uint32_t>::max()) {
        throw FCBError(ErrorKind::MalformedHeader, std::format("{} root nodes exceed the u32 root count", file.roots.size()));
    }

    FCBHeader header{};
    std::memcpy(header.signature, kFCBSignature, 4);
    header.version = file.version;
    header.flags = file.flags;
    header.rootCount = static_cast<uint32_t>(file.roots.size());

    ByteWriter writer;
    header.write(writer);
    for (const Node& root : file.roots) {
        writeNode(writer, root, 0);
    }
    writer.writeBlob(file.trailer);
    return writer.take();
}

void FCBWriter::writeNode(ByteWriter& writer, const Node& node, size_t depth) const {
    if (depth >= kMaxNodeDepth) {
        throw FCBError(ErrorKind::MalformedHeader,
                       std::format("node nesting deeper than {} levels", kMaxNodeDepth), writer.size());
    }

    writer.writeU32(node.typeTag());
    size_t lengthPosition = writer.reserveU32();
    size_t payloadStart = writer.size();

    if (node.isOpaque()) {
        writer.writeBlob(node.rawPayload());
    } else {
        const auto& attributes = node.attributes();
        if (attributes.size() > std::numeric_limits<uint16_t>::max()) {
            throw FCBError(ErrorKind::MalformedHeader,
                           std::format("node {} has {} attributes, the format allows {}",
                                       formatHash(node.typeTag()), attributes.size(),
                                       std::numeric_limits<uint16_t>::max()),
                           payloadStart);
        }
        writer.writeU16(static_cast<uint16_t>(attributes.size()));
        for (const Attribute& attribute : attributes) {
            writer.writeU32(attribute.nameHash);
            writer.writeU8(static_cast<uint8_t>(attribute.value.kind()));
            writeScalar(writer, attribute.value.kind(), attribute.value);
        }

        const auto& children = node.children();
        if (children.size() > std::numeric_limits<uint32_t>::max()) {
            throw FCBError(ErrorKind::MalformedHeader,
                           std::format("node {} has too many children", formatHash(node.typeTag())), writer.size());
        }
        writer.writeU32(static_cast<uint32_t>(children.size()));
        for (const Node& child : children) {
            writeNode(writer, child, depth + 1);
        }
    }

    writer.writeBlob(node.trailing());

    size_t payloadLength = writer.size() - payloadStart;
    if (payloadLength > std::numeric_limits<uint32_t>::max()) {
        throw FCBError(ErrorKind::MalformedHeader,
                       std::format("node {} payload of {} bytes exceeds 4 GiB", formatHash(node.typeTag()), payloadLength),
                       payloadStart);
    }
    writer.patchU32(lengthPosition, static_cast<uint32_t>(payloadLength));
}

} // namespace FCBForge
