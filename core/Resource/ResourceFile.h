#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "Node.h"

namespace FCBForge {

constexpr uint16_t kDefaultFCBVersion = 3;

/**
 * @brief A whole FCB file: header fields plus its root nodes
 *
 * The file owns its tree exclusively. `name` is the file name used as the
 * key inside a Level and does not take part in equality.
 */
struct ResourceFile {
    std::string name;
    uint16_t version = kDefaultFCBVersion;
    uint16_t flags = 0;
    std::vector<Node> roots;
    // Bytes after the last root node
    std::vector<uint8_t> trailer;

    Node* findNode(const NodePath& path);
    const Node* findNode(const NodePath& path) const;

    // Depth-first, parents before children, in child order
    void forEachNode(const std::function<void(const Node&, const NodePath&)>& visit) const;
    void forEachNode(const std::function<void(Node&, const NodePath&)>& visit);

    size_t nodeCount() const;

    bool operator==(const ResourceFile& other) const {
        return version == other.version && flags == other.flags &&
               roots == other.roots && trailer == other.trailer;
    }
    bool operator!=(const ResourceFile& other) const { return !(*this == other); }
};

} // namespace FCBForge
