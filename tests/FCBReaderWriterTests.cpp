#include <gtest/gtest.h>

#include "TestFixtures.h"
#include "core/FCBError.h"
#include "plugins/FCB/FCBReader.h"
#include "plugins/FCB/FCBWriter.h"

using namespace FCBForge;
using namespace FCBForge::Testing;

namespace {

std::vector<uint8_t> nodeBytes(uint32_t tag, const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> out;
    putU32(out, tag);
    putU32(out, static_cast<uint32_t>(payload.size()));
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

// u16 0 attributes, u32 0 children
std::vector<uint8_t> emptyPayload() {
    std::vector<uint8_t> out;
    putU16(out, 0);
    putU32(out, 0);
    return out;
}

std::vector<uint8_t> withRoots(const std::vector<std::vector<uint8_t>>& roots) {
    std::vector<uint8_t> out = fileHeader(static_cast<uint32_t>(roots.size()));
    for (const auto& root : roots) {
        out.insert(out.end(), root.begin(), root.end());
    }
    return out;
}

class FCBReaderTest : public ::testing::Test {
protected:
    void SetUp() override { testLog(); }

    ErrorKind parseError(const std::vector<uint8_t>& bytes) const {
        try {
            reader.parse(bytes, "test.fcb");
        } catch (const FCBError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected an FCBError";
        return ErrorKind::IOFailure;
    }

    ClassDictionary dictionary;
    FCBReader reader{dictionary};
};

} // namespace

TEST_F(FCBReaderTest, BinaryRoundTripIsByteIdentical) {
    ResourceFile file = makeSectorFile("12.data.fcb", {
        makeEntity(100, "Tree", {1.0f, 2.0f, 3.0f}),
        makeEntity(101, "Rock", {-4.5f, 0.25f, 1e-3f}),
    });
    file.roots[0].children()[0].addChild(makeLink(101));
    file.roots[0].children()[1].setAttribute("hidEnabled", Value(true));
    file.flags = 0x0102;

    std::vector<uint8_t> bytes = serialize(file);
    ResourceFile parsed = reader.parse(bytes, "12.data.fcb");
    EXPECT_EQ(parsed, file);
    EXPECT_EQ(parsed.name, "12.data.fcb");
    EXPECT_EQ(FCBWriter().serialize(parsed), bytes);
}

TEST_F(FCBReaderTest, RecordsSourceRanges) {
    ResourceFile file = makeSectorFile("a.data.fcb", {makeEntity(1, "A")});
    std::vector<uint8_t> bytes = serialize(file);
    ResourceFile parsed = reader.parse(bytes);

    const Node& root = parsed.roots[0];
    ASSERT_TRUE(root.sourceOffset().has_value());
    EXPECT_EQ(*root.sourceOffset(), 12u);
    EXPECT_EQ(*root.sourceLength(), bytes.size() - 12);
}

TEST_F(FCBReaderTest, HeaderErrors) {
    EXPECT_EQ(parseError({'n', 'b', 'C', 'F', 3, 0}), ErrorKind::TruncatedInput);

    std::vector<uint8_t> badMagic = fileHeader(0);
    badMagic[0] = 'X';
    EXPECT_EQ(parseError(badMagic), ErrorKind::MalformedHeader);

    EXPECT_EQ(parseError(fileHeader(0, 2)), ErrorKind::MalformedHeader);

    // 1000 roots cannot fit in zero remaining bytes
    EXPECT_EQ(parseError(fileHeader(1000)), ErrorKind::TruncatedInput);
}

TEST_F(FCBReaderTest, EmptyFileHasNoRoots) {
    ResourceFile parsed = reader.parse(fileHeader(0));
    EXPECT_TRUE(parsed.roots.empty());
    EXPECT_TRUE(parsed.trailer.empty());
}

TEST_F(FCBReaderTest, TopLevelOverrunIsTruncated) {
    std::vector<uint8_t> root = nodeBytes(hashName("Entity"), emptyPayload());
    root[4] = 60; // declared payload longer than the file
    EXPECT_EQ(parseError(withRoots({root})), ErrorKind::TruncatedInput);
}

TEST_F(FCBReaderTest, NestedOverrunIsMalformed) {
    std::vector<uint8_t> child = nodeBytes(hashName("Entity"), emptyPayload());
    child[4] = 40; // beyond the parent's payload

    std::vector<uint8_t> payload;
    putU16(payload, 0);
    putU32(payload, 1);
    payload.insert(payload.end(), child.begin(), child.end());
    std::vector<uint8_t> bytes = withRoots({nodeBytes(hashName("WorldSector"), payload)});
    // keep the file long enough that only the parent bound is violated
    bytes.resize(bytes.size() + 64, 0);
    EXPECT_EQ(parseError(bytes), ErrorKind::MalformedHeader);
}

TEST_F(FCBReaderTest, AttributeCountBeyondPayloadIsMalformed) {
    std::vector<uint8_t> payload;
    putU16(payload, 500);
    putU32(payload, 0);
    EXPECT_EQ(parseError(withRoots({nodeBytes(hashName("Entity"), payload)})), ErrorKind::MalformedHeader);
}

TEST_F(FCBReaderTest, ChildCountBeyondPayloadIsMalformed) {
    std::vector<uint8_t> payload;
    putU16(payload, 0);
    putU32(payload, 3);
    EXPECT_EQ(parseError(withRoots({nodeBytes(hashName("Entity"), payload)})), ErrorKind::MalformedHeader);
}

TEST_F(FCBReaderTest, InvalidKindCodeIsMalformed) {
    std::vector<uint8_t> payload;
    putU16(payload, 1);
    putU32(payload, hashName("hidEnabled"));
    payload.push_back(0x42);
    payload.push_back(1);
    putU32(payload, 0);
    EXPECT_EQ(parseError(withRoots({nodeBytes(hashName("Entity"), payload)})), ErrorKind::MalformedHeader);
}

TEST_F(FCBReaderTest, DuplicateAttributeIsMalformed) {
    std::vector<uint8_t> payload;
    putU16(payload, 2);
    for (int i = 0; i < 2; ++i) {
        putU32(payload, hashName("hidEnabled"));
        payload.push_back(static_cast<uint8_t>(ValueKind::Bool));
        payload.push_back(1);
    }
    putU32(payload, 0);
    EXPECT_EQ(parseError(withRoots({nodeBytes(hashName("Entity"), payload)})), ErrorKind::MalformedHeader);
}

TEST_F(FCBReaderTest, ScalarPastPayloadIsMalformed) {
    // one attribute claiming a u64 inside a payload that is too short for it
    std::vector<uint8_t> payload;
    putU16(payload, 1);
    putU32(payload, hashName("disEntityId"));
    payload.push_back(static_cast<uint8_t>(ValueKind::UInt64));
    payload.push_back(1);
    payload.push_back(2);
    std::vector<uint8_t> bytes = withRoots({nodeBytes(hashName("Entity"), payload)});
    bytes.resize(bytes.size() + 32, 0);
    EXPECT_EQ(parseError(bytes), ErrorKind::MalformedHeader);
}

TEST_F(FCBReaderTest, BadBooleanByteIsEncodingError) {
    std::vector<uint8_t> payload;
    putU16(payload, 1);
    putU32(payload, hashName("hidEnabled"));
    payload.push_back(static_cast<uint8_t>(ValueKind::Bool));
    payload.push_back(7);
    putU32(payload, 0);
    EXPECT_EQ(parseError(withRoots({nodeBytes(hashName("Entity"), payload)})), ErrorKind::EncodingError);
}

TEST_F(FCBReaderTest, UnknownTagIsKeptOpaqueAndRoundTrips) {
    const uint32_t unknownTag = 0x0BADF00D;
    std::vector<uint8_t> opaquePayload = {0x01, 0x02, 0x03, 0x04, 0x05};

    std::vector<uint8_t> payload;
    putU16(payload, 0);
    putU32(payload, 1);
    std::vector<uint8_t> child = nodeBytes(unknownTag, opaquePayload);
    payload.insert(payload.end(), child.begin(), child.end());
    std::vector<uint8_t> bytes = withRoots({nodeBytes(hashName("WorldSector"), payload)});

    FlushLogs();
    testLog()->clear();
    ResourceFile parsed = reader.parse(bytes, "u.data.fcb");
    ASSERT_EQ(parsed.roots[0].children().size(), 1u);
    const Node& opaque = parsed.roots[0].children()[0];
    EXPECT_TRUE(opaque.isOpaque());
    EXPECT_EQ(opaque.typeTag(), unknownTag);
    EXPECT_EQ(opaque.rawPayload(), opaquePayload);
    EXPECT_EQ(FCBWriter().serialize(parsed), bytes);

    FlushLogs();
    EXPECT_EQ(testLog()->countContaining(MESSAGE, "0BADF00D"), 1u);
}

TEST_F(FCBReaderTest, UnknownTagsParsedWhenPreservationIsOff) {
    ReaderOptions options;
    options.preserveUnknownTags = false;
    FCBReader structural(dictionary, options);

    std::vector<uint8_t> bytes = withRoots({nodeBytes(0x12345678, emptyPayload())});
    ResourceFile parsed = structural.parse(bytes);
    EXPECT_FALSE(parsed.roots[0].isOpaque());
    EXPECT_EQ(parsed.roots[0].typeTag(), 0x12345678u);
}

TEST_F(FCBReaderTest, TrailingBytesArePreserved) {
    std::vector<uint8_t> payload = emptyPayload();
    payload.push_back(0xEE);
    payload.push_back(0xFF);
    std::vector<uint8_t> bytes = withRoots({nodeBytes(hashName("Entity"), payload)});
    bytes.push_back(0x99); // file trailer

    ResourceFile parsed = reader.parse(bytes);
    EXPECT_EQ(parsed.roots[0].trailing(), (std::vector<uint8_t>{0xEE, 0xFF}));
    EXPECT_EQ(parsed.trailer, (std::vector<uint8_t>{0x99}));
    EXPECT_EQ(FCBWriter().serialize(parsed), bytes);
}

TEST_F(FCBReaderTest, ExcessiveNestingIsMalformed) {
    std::vector<uint8_t> node = nodeBytes(hashName("Entity"), emptyPayload());
    for (size_t depth = 0; depth < kMaxNodeDepth; ++depth) {
        std::vector<uint8_t> payload;
        putU16(payload, 0);
        putU32(payload, 1);
        payload.insert(payload.end(), node.begin(), node.end());
        node = nodeBytes(hashName("Entity"), payload);
    }
    EXPECT_EQ(parseError(withRoots({node})), ErrorKind::MalformedHeader);
}

TEST(FCBWriter, LengthMatchesWhatTheReaderComputes) {
    ClassDictionary dictionary;
    ResourceFile file = makeSectorFile("w.data.fcb", {makeEntity(5, "Lamp", {1, 2, 3})});
    file.roots[0].children()[0].setAttribute("hidResourceId", Value(Blob{1, 2, 3, 4, 5}));

    std::vector<uint8_t> bytes = serialize(file);
    ResourceFile parsed = FCBReader(dictionary).parse(bytes);
    const Node& entity = parsed.roots[0].children()[0];
    ResourceFile single;
    single.roots.push_back(entity);
    EXPECT_EQ(serialize(single).size(), 12 + *entity.sourceLength());
}

TEST(FCBWriter, EditedTreeSerializesIdempotently) {
    ClassDictionary dictionary;
    ResourceFile file = makeSectorFile("e.data.fcb", {makeEntity(1, "A"), makeEntity(2, "B")});
    file.roots[0].removeChild(0);
    file.roots[0].children()[0].setAttribute("hidName", Value(std::string("Renamed")));

    std::vector<uint8_t> first = serialize(file);
    std::vector<uint8_t> second = serialize(FCBReader(dictionary).parse(first));
    EXPECT_EQ(first, second);
}
