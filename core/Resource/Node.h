#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "Value.h"

namespace FCBForge {

struct Attribute {
    uint32_t nameHash = 0;
    Value value;

    bool operator==(const Attribute& other) const {
        return nameHash == other.nameHash && value == other.value;
    }
};

// Root index followed by child indices
using NodePath = std::vector<size_t>;

/**
 * @brief One node of a resource tree
 *
 * A node is either structured (attributes and children) or opaque (unknown
 * type tag, payload kept verbatim). Equality is semantic: source offsets
 * are ignored.
 */
class Node {
public:
    Node() = default;
    explicit Node(uint32_t typeTag) : typeTag_(typeTag) {}

    static Node opaque(uint32_t typeTag, std::vector<uint8_t> payload);

    uint32_t typeTag() const { return typeTag_; }
    void setTypeTag(uint32_t typeTag) { typeTag_ = typeTag; }

    bool isOpaque() const { return rawPayload_.has_value(); }
    const std::vector<uint8_t>& rawPayload() const;

    // Attributes, kept in insertion order
    const std::vector<Attribute>& attributes() const { return attributes_; }
    const Value* getAttribute(uint32_t nameHash) const;
    Value* getAttribute(uint32_t nameHash);
    const Value* getAttribute(std::string_view name) const;
    Value* getAttribute(std::string_view name);
    bool hasAttribute(uint32_t nameHash) const { return getAttribute(nameHash) != nullptr; }

    // Replaces in place when the name exists, appends otherwise
    void setAttribute(uint32_t nameHash, Value value);
    void setAttribute(std::string_view name, Value value);
    bool removeAttribute(uint32_t nameHash);

    // Children, order is significant
    const std::vector<Node>& children() const { return children_; }
    std::vector<Node>& children() { return children_; }
    Node& addChild(Node child);
    Node& insertChild(size_t index, Node child);
    bool removeChild(size_t index);
    bool reorderChild(size_t from, size_t to);

    // Payload bytes after the last child that the reader could not attribute
    const std::vector<uint8_t>& trailing() const { return trailing_; }
    void setTrailing(std::vector<uint8_t> bytes) { trailing_ = std::move(bytes); }

    // Diagnostics only, the writer never reads these
    std::optional<size_t> sourceOffset() const { return sourceOffset_; }
    std::optional<size_t> sourceLength() const { return sourceLength_; }
    void setSourceRange(size_t offset, size_t length);
    void clearSourceRange();

    size_t subtreeSize() const;

    bool operator==(const Node& other) const;
    bool operator!=(const Node& other) const { return !(*this == other); }

private:
    void requireStructured(const char* operation) const;

    uint32_t typeTag_ = 0;
    std::vector<Attribute> attributes_;
    std::vector<Node> children_;
    std::optional<std::vector<uint8_t>> rawPayload_;
    std::vector<uint8_t> trailing_;
    std::optional<size_t> sourceOffset_;
    std::optional<size_t> sourceLength_;
};

} // namespace FCBForge
