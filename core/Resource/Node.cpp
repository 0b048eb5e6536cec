#include "Node.h"

#include <algorithm>
#include <format>
#include <stdexcept>

#include "core/Hashing.h"

namespace FCBForge {

Node Node::opaque(uint32_t typeTag, std::vector<uint8_t> payload) {
    Node node(typeTag);
    node.rawPayload_ = std::move(payload);
    return node;
}

const std::vector<uint8_t>& Node::rawPayload() const {
    static const std::vector<uint8_t> empty;
    return rawPayload_ ? *rawPayload_ : empty;
}

void Node::requireStructured(const char* operation) const {
    if (isOpaque()) {
        throw std::logic_error(std::format("{} on opaque node {}", operation, formatHash(typeTag_)));
    }
}

const Value* Node::getAttribute(uint32_t nameHash) const {
    for (const auto& attribute : attributes_) {
        if (attribute.nameHash == nameHash) {
            return &attribute.value;
        }
    }
    return nullptr;
}

Value* Node::getAttribute(uint32_t nameHash) {
    for (auto& attribute : attributes_) {
        if (attribute.nameHash == nameHash) {
            return &attribute.value;
        }
    }
    return nullptr;
}

const Value* Node::getAttribute(std::string_view name) const {
    return getAttribute(hashName(name));
}

Value* Node::getAttribute(std::string_view name) {
    return getAttribute(hashName(name));
}

void Node::setAttribute(uint32_t nameHash, Value value) {
    requireStructured("setAttribute");
    if (Value* existing = getAttribute(nameHash)) {
        *existing = std::move(value);
        return;
    }
    attributes_.push_back(Attribute{nameHash, std::move(value)});
}

void Node::setAttribute(std::string_view name, Value value) {
    setAttribute(hashName(name), std::move(value));
}

bool Node::removeAttribute(uint32_t nameHash) {
    auto it = std::find_if(attributes_.begin(), attributes_.end(),
                           [nameHash](const Attribute& a) { return a.nameHash == nameHash; });
    if (it == attributes_.end()) {
        return false;
    }
    attributes_.erase(it);
    return true;
}

Node& Node::addChild(Node child) {
    requireStructured("addChild");
    children_.push_back(std::move(child));
    return children_.back();
}

Node& Node::insertChild(size_t index, Node child) {
    requireStructured("insertChild");
    index = std::min(index, children_.size());
    auto it = children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(index), std::move(child));
    return *it;
}

bool Node::removeChild(size_t index) {
    if (index >= children_.size()) {
        return false;
    }
    children_.erase(children_.begin() + static_cast<std::ptrdiff_t>(index));
    return true;
}

bool Node::reorderChild(size_t from, size_t to) {
    if (from >= children_.size() || to >= children_.size()) {
        return false;
    }
    if (from == to) {
        return true;
    }
    Node moved = std::move(children_[from]);
    children_.erase(children_.begin() + static_cast<std::ptrdiff_t>(from));
    children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(to), std::move(moved));
    return true;
}

void Node::setSourceRange(size_t offset, size_t length) {
    sourceOffset_ = offset;
    sourceLength_ = length;
}

void Node::clearSourceRange() {
    sourceOffset_.reset();
    sourceLength_.reset();
    for (auto& child : children_) {
        child.clearSourceRange();
    }
}

size_t Node::subtreeSize() const {
    size_t total = 1;
    for (const auto& child : children_) {
        total += child.subtreeSize();
    }
    return total;
}

bool Node::operator==(const Node& other) const {
    return typeTag_ == other.typeTag_ &&
           rawPayload_ == other.rawPayload_ &&
           attributes_ == other.attributes_ &&
           trailing_ == other.trailing_ &&
           children_ == other.children_;
}

} // namespace FCBForge
