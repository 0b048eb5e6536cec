#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "Level.h"
#include "ReferenceSchema.h"

namespace FCBForge {

struct NodeLocation {
    std::string file;
    NodePath path;

    bool operator==(const NodeLocation& other) const { return file == other.file && path == other.path; }
    bool operator<(const NodeLocation& other) const {
        return file != other.file ? file < other.file : path < other.path;
    }
};

// An attribute that names another node by ID
struct Reference {
    NodeLocation source;
    uint32_t attribute = 0;
    uint64_t target = 0;
    ReferenceScope scope = ReferenceScope::Level;

    bool operator==(const Reference& other) const {
        return source == other.source && attribute == other.attribute && target == other.target;
    }
    bool operator<(const Reference& other) const {
        if (!(source == other.source)) return source < other.source;
        if (attribute != other.attribute) return attribute < other.attribute;
        return target < other.target;
    }
};

struct IdIndex {
    // Every node carrying each ID, in level order
    std::map<uint64_t, std::vector<NodeLocation>> locations;
    uint64_t maxId = 0;

    bool contains(uint64_t id) const { return locations.count(id) != 0; }
    bool containsInFile(uint64_t id, const std::string& file) const;
    const NodeLocation* find(uint64_t id) const;
};

struct RenumberResult {
    bool found = false;
    size_t identitiesChanged = 0;
    size_t referencesChanged = 0;
};

struct DuplicateResult {
    NodeLocation copy;
    std::map<uint64_t, uint64_t> idMap; // original ID -> fresh ID
    std::string name;
};

struct RemoveResult {
    bool removed = false;
    size_t nodesRemoved = 0;
    std::vector<Reference> newlyDangling;
};

/**
 * @brief Cross-file node ID bookkeeping for a Level
 *
 * The ID index is rebuilt from the level on every call, nothing points into
 * the trees between calls. Every operation holds the level lock for its
 * whole duration. Mutating operations mark the touched files Dirty.
 */
class ReferenceResolver {
public:
    explicit ReferenceResolver(ReferenceSchema schema = ReferenceSchema(), double duplicateOffset = 20.0);

    const ReferenceSchema& schema() const { return schema_; }

    std::vector<Reference> scan(const Level& level) const;
    IdIndex buildIdIndex(const Level& level) const;

    /**
     * @brief Replaces every occurrence of oldId, as identity or reference target
     *
     * File-scoped references follow only when oldId is an identity in their
     * own file. Throws FCBError(IDCollision) when newId is 0, already in
     * use, or already the target of a reference that would resolve to it, and FCBError(EncodingError) when a value cannot hold newId; nothing
     * is modified in either case. A missing oldId is a no-op.
     */
    RenumberResult renumber(Level& level, uint64_t oldId, uint64_t newId) const;

    // References whose target does not exist within their scope; ID 0 never dangles
    std::vector<Reference> findDangling(const Level& level) const;

    /**
     * @brief Copies the subtree at `path` and inserts it right after the original
     *
     * Every identity in the copy gets a fresh ID above the highest one in the
     * level, references into the copied subtree follow, the root's position is
     * moved by the duplicate offset on x and y and its name gets a _Copy suffix.
     * Throws std::invalid_argument when the path does not name a node.
     */
    DuplicateResult duplicate(Level& level, const std::string& file, const NodePath& path) const;

    std::optional<uint64_t> nodeId(const Node& node) const;
    std::optional<NodeLocation> findEntity(const Level& level, uint64_t id) const;

    // Deletes the entity subtree and reports the references it leaves dangling
    RemoveResult removeEntity(Level& level, uint64_t id) const;

    // Standalone file holding a copy of the entity subtree as its only root
    std::optional<ResourceFile> exportEntity(const Level& level, uint64_t id) const;

    /**
     * @brief Imports the roots of `source` into a file of the level
     *
     * Entities get fresh IDs and unique names like duplicate(), positions are
     * kept. They are appended under the file's first root, or become roots of
     * an empty file. Throws std::invalid_argument when the file is not loaded.
     */
    std::vector<NodeLocation> importEntities(Level& level, const std::string& file, const ResourceFile& source) const;

private:
    std::vector<Reference> collectDangling(const Level& level) const;
    std::set<std::string> collectNames(const Level& level) const;
    std::string uniqueName(const std::string& base, std::set<std::string>& taken) const;
    // Fresh identities, internal retargeting and a unique name for a detached copy
    std::map<uint64_t, uint64_t> prepareCopy(Node& copy, uint64_t& nextId, std::set<std::string>& names,
                                             std::string& assignedName) const;
    void offsetPosition(Node& node) const;

    ReferenceSchema schema_;
    double duplicateOffset_;
};

} // namespace FCBForge
