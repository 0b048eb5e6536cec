#include "FCBReader.h"

#include <format>
#include <map>
#include <unordered_set>

#include "core/FCBError.h"
#include "core/Hashing.h"
#include "core/Logging/Logging.h"

namespace FCBForge {

struct FCBReader::ParseContext {
    std::string fileName;
    // Unknown tag -> number of nodes kept opaque
    std::map<uint32_t, size_t> unknownTags;
};

FCBReader::FCBReader(const ClassDictionary& dictionary, ReaderOptions options)
    : dictionary_(dictionary), options_(options) {}

ResourceFile FCBReader::parse(const std::vector<uint8_t>& bytes, const std::string& name) const {
    if (bytes.size() < sizeof(FCBHeader)) {
        throw FCBError(ErrorKind::TruncatedInput,
                       std::format("{} bytes is too short for the {}-byte file header", bytes.size(), sizeof(FCBHeader)),
                       0);
    }

    ByteReader reader(bytes);
    FCBHeader header = FCBHeader::read(reader);
    if (std::memcmp(header.signature, kFCBSignature, 4) != 0) {
        throw FCBError(ErrorKind::MalformedHeader,
                       std::format("bad magic {:02X} {:02X} {:02X} {:02X}, expected 'nbCF'",
                                   static_cast<uint8_t>(header.signature[0]), static_cast<uint8_t>(header.signature[1]),
                                   static_cast<uint8_t>(header.signature[2]), static_cast<uint8_t>(header.signature[3])),
                       0);
    }
    if (header.version != kFCBVersion) {
        throw FCBError(ErrorKind::MalformedHeader,
                       std::format("unsupported version {}, expected {}", header.version, kFCBVersion), 4);
    }
    if (static_cast<uint64_t>(header.rootCount) * kNodeHeaderSize > reader.remaining()) {
        throw FCBError(ErrorKind::TruncatedInput,
                       std::format("header declares {} root nodes but only {} bytes follow",
                                   header.rootCount, reader.remaining()),
                       8);
    }

    ResourceFile file;
    file.name = name;
    file.version = header.version;
    file.flags = header.flags;
    file.roots.reserve(header.rootCount);

    ParseContext context;
    context.fileName = name;
    for (uint32_t i = 0; i < header.rootCount; ++i) {
        file.roots.push_back(readNode(reader, 0, true, context));
    }

    if (!reader.atEnd()) {
        Log(DEBUG, "FCBReader", "{}: keeping {} trailer bytes after the last root", name, reader.remaining());
        file.trailer = reader.readBlob(reader.remaining());
    }

    for (const auto& [tag, count] : context.unknownTags) {
        Log(MESSAGE, "FCBReader", "{}: unknown type tag {} kept opaque in {} node(s)", name, formatHash(tag), count);
    }

    return file;
}

Node FCBReader::readNode(ByteReader& reader, size_t depth, bool topLevel, ParseContext& context) const {
    if (depth >= kMaxNodeDepth) {
        throw FCBError(ErrorKind::MalformedHeader,
                       std::format("node nesting deeper than {} levels", kMaxNodeDepth), reader.position());
    }

    size_t nodeOffset = reader.position();
    FCBNodeHeader header = FCBNodeHeader::read(reader);
    if (header.payloadLength > reader.remaining()) {
        // A top-level node can only be cut off by the end of the file; a
        // nested one contradicts its parent's declared length.
        throw FCBError(topLevel ? ErrorKind::TruncatedInput : ErrorKind::MalformedHeader,
                       std::format("node {} declares a {}-byte payload but only {} bytes remain",
                                   formatHash(header.typeTag), header.payloadLength, reader.remaining()),
                       nodeOffset);
    }

    ByteReader payload = reader.sub(header.payloadLength);

    Node node(header.typeTag);
    if (options_.preserveUnknownTags && !dictionary_.isKnownClass(header.typeTag)) {
        ++context.unknownTags[header.typeTag];
        node = Node::opaque(header.typeTag, payload.readBlob(payload.remaining()));
    } else {
        try {
            readStructuredPayload(node, payload, depth, context);
        } catch (const FCBError& e) {
            if (e.kind() != ErrorKind::TruncatedInput) {
                throw;
            }
            throw FCBError(ErrorKind::MalformedHeader,
                           std::format("node {} content runs past its declared {}-byte payload: {}",
                                       formatHash(header.typeTag), header.payloadLength, e.detail()),
                           e.offset());
        }
    }

    if (options_.recordOffsets) {
        node.setSourceRange(nodeOffset, kNodeHeaderSize + header.payloadLength);
    }
    return node;
}

void FCBReader::readStructuredPayload(Node& node, ByteReader& payload, size_t depth, ParseContext& context) const {
    size_t countOffset = payload.position();
    uint16_t attributeCount = payload.readU16();
    if (static_cast<size_t>(attributeCount) * kMinAttributeSize > payload.remaining()) {
        throw FCBError(ErrorKind::MalformedHeader,
                       std::format("{} attributes cannot fit in {} remaining payload bytes",
                                   attributeCount, payload.remaining()),
                       countOffset);
    }

    std::unordered_set<uint32_t> seen;
    seen.reserve(attributeCount);
    for (uint16_t i = 0; i < attributeCount; ++i) {
        size_t attributeOffset = payload.position();
        uint32_t nameHash = payload.readU32();
        uint8_t kindCode = payload.readU8();
        if (!Value::isValidKindCode(kindCode)) {
            throw FCBError(ErrorKind::MalformedHeader,
                           std::format("attribute {} has unknown value kind 0x{:02X}", formatHash(nameHash), kindCode),
                           attributeOffset + 4);
        }
        if (!seen.insert(nameHash).second) {
            const std::string* name = dictionary_.memberName(nameHash);
            throw FCBError(ErrorKind::MalformedHeader,
                           std::format("duplicate attribute {} in node {}",
                                       name ? *name : formatHash(nameHash), formatHash(node.typeTag())),
                           attributeOffset);
        }
        node.setAttribute(nameHash, readScalar(payload, static_cast<ValueKind>(kindCode)));
    }

    countOffset = payload.position();
    uint32_t childCount = payload.readU32();
    if (static_cast<uint64_t>(childCount) * kNodeHeaderSize > payload.remaining()) {
        throw FCBError(ErrorKind::MalformedHeader,
                       std::format("{} children cannot fit in {} remaining payload bytes",
                                   childCount, payload.remaining()),
                       countOffset);
    }

    node.children().reserve(childCount);
    for (uint32_t i = 0; i < childCount; ++i) {
        node.addChild(readNode(payload, depth + 1, false, context));
    }

    if (!payload.atEnd()) {
        node.setTrailing(payload.readBlob(payload.remaining()));
    }
}

} // namespace FCBForge
