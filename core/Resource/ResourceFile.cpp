#include "ResourceFile.h"

namespace FCBForge {

namespace {

template<typename NodeT, typename Visitor>
void walk(NodeT& node, NodePath& path, const Visitor& visit) {
    visit(node, path);
    for (size_t i = 0; i < node.children().size(); ++i) {
        path.push_back(i);
        walk(node.children()[i], path, visit);
        path.pop_back();
    }
}

} // namespace

Node* ResourceFile::findNode(const NodePath& path) {
    return const_cast<Node*>(static_cast<const ResourceFile&>(*this).findNode(path));
}

const Node* ResourceFile::findNode(const NodePath& path) const {
    if (path.empty() || path[0] >= roots.size()) {
        return nullptr;
    }
    const Node* node = &roots[path[0]];
    for (size_t depth = 1; depth < path.size(); ++depth) {
        if (path[depth] >= node->children().size()) {
            return nullptr;
        }
        node = &node->children()[path[depth]];
    }
    return node;
}

void ResourceFile::forEachNode(const std::function<void(const Node&, const NodePath&)>& visit) const {
    NodePath path;
    for (size_t i = 0; i < roots.size(); ++i) {
        path.assign(1, i);
        walk(roots[i], path, visit);
    }
}

void ResourceFile::forEachNode(const std::function<void(Node&, const NodePath&)>& visit) {
    NodePath path;
    for (size_t i = 0; i < roots.size(); ++i) {
        path.assign(1, i);
        walk(roots[i], path, visit);
    }
}

size_t ResourceFile::nodeCount() const {
    size_t total = 0;
    for (const auto& root : roots) {
        total += root.subtreeSize();
    }
    return total;
}

} // namespace FCBForge
