#pragma once

#include <cstdint>
#include <vector>

#include "FCBV3.hpp"
#include "core/Resource/ResourceFile.h"

namespace FCBForge {

/**
 * @brief Encodes a ResourceFile as FCB v3 bytes
 *
 * Payload lengths are computed from the emitted content and back-patched.
 * Opaque payloads, per-node trailing bytes and the file trailer are written
 * verbatim. No padding is ever inserted.
 */
class FCBWriter {
public:
    std::vector<uint8_t> serialize(const ResourceFile& file) const;

private:
    void writeNode(ByteWriter& writer, const Node& node, size_t depth) const;
};

} // namespace FCBForge
