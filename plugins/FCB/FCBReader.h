#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "FCBV3.hpp"
#include "core/Resource/ClassDictionary.h"
#include "core/Resource/ResourceFile.h"

namespace FCBForge {

struct ReaderOptions {
    // Keep nodes with unknown type tags as raw payload instead of decoding them
    bool preserveUnknownTags = true;
    // Store source offsets on every node for diagnostics
    bool recordOffsets = true;
};

/**
 * @brief Decodes FCB v3 bytes into a ResourceFile
 *
 * parse() holds no state between calls and only reads the dictionary, so one
 * reader may be shared by several threads parsing independent files.
 *
 * Throws FCBError:
 *  - TruncatedInput when the header or a top-level node runs past the input
 *  - MalformedHeader for bad magic/version, nested overruns, impossible
 *    counts and duplicate attribute names
 *  - EncodingError for invalid strings or booleans
 */
class FCBReader {
public:
    explicit FCBReader(const ClassDictionary& dictionary, ReaderOptions options = {});

    ResourceFile parse(const std::vector<uint8_t>& bytes, const std::string& name = "") const;

    const ReaderOptions& options() const { return options_; }

private:
    struct ParseContext;

    Node readNode(ByteReader& reader, size_t depth, bool topLevel, ParseContext& context) const;
    void readStructuredPayload(Node& node, ByteReader& payload, size_t depth, ParseContext& context) const;

    const ClassDictionary& dictionary_;
    ReaderOptions options_;
};

} // namespace FCBForge
