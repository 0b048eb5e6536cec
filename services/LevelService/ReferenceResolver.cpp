#include "ReferenceResolver.h"

#include <algorithm>
#include <functional>
#include <stdexcept>

#include "core/FCBError.h"
#include "core/Hashing.h"
#include "core/Logging/Logging.h"

namespace FCBForge {

namespace {

    void walk(Node& node, const std::function<void(Node&)>& visit) {
        visit(node);
        for (auto& child : node.children()) {
            walk(child, visit);
        }
    }

    void walk(const Node& node, const std::function<void(const Node&)>& visit) {
        visit(node);
        for (const auto& child : node.children()) {
            walk(child, visit);
        }
    }

    std::string describe(const NodeLocation& location) {
        std::string text = location.file + ":";
        for (size_t i = 0; i < location.path.size(); ++i) {
            text += (i == 0 ? "" : "/") + std::to_string(location.path[i]);
        }
        return text;
    }

    bool resolves(const IdIndex& index, const Reference& reference) {
        if (reference.scope == ReferenceScope::File) {
            return index.containsInFile(reference.target, reference.source.file);
        }
        return index.contains(reference.target);
    }

} // namespace

bool IdIndex::containsInFile(uint64_t id, const std::string& file) const {
    auto it = locations.find(id);
    if (it == locations.end()) {
        return false;
    }
    for (const auto& location : it->second) {
        if (location.file == file) {
            return true;
        }
    }
    return false;
}

const NodeLocation* IdIndex::find(uint64_t id) const {
    auto it = locations.find(id);
    if (it == locations.end() || it->second.empty()) {
        return nullptr;
    }
    return &it->second.front();
}

ReferenceResolver::ReferenceResolver(ReferenceSchema schema, double duplicateOffset)
    : schema_(std::move(schema)), duplicateOffset_(duplicateOffset) {}

std::optional<uint64_t> ReferenceResolver::nodeId(const Node& node) const {
    for (uint32_t hash : schema_.identityAttributes()) {
        if (const Value* value = node.getAttribute(hash)) {
            auto id = value->asId();
            if (id && *id != 0) {
                return id;
            }
        }
    }
    return std::nullopt;
}

std::vector<Reference> ReferenceResolver::scan(const Level& level) const {
    std::lock_guard<std::recursive_mutex> guard(level.lock());
    std::vector<Reference> references;
    for (const auto& file : level.files()) {
        file.resource.forEachNode([&](const Node& node, const NodePath& path) {
            for (const auto& attribute : node.attributes()) {
                auto scope = schema_.referenceScope(node.typeTag(), attribute.nameHash, attribute.value);
                if (!scope) {
                    continue;
                }
                auto target = attribute.value.asId();
                if (!target || *target == 0) {
                    continue;
                }
                references.push_back(Reference{{file.name(), path}, attribute.nameHash, *target, *scope});
            }
        });
    }
    return references;
}

IdIndex ReferenceResolver::buildIdIndex(const Level& level) const {
    std::lock_guard<std::recursive_mutex> guard(level.lock());
    IdIndex index;
    for (const auto& file : level.files()) {
        file.resource.forEachNode([&](const Node& node, const NodePath& path) {
            for (const auto& attribute : node.attributes()) {
                if (!schema_.isIdentity(attribute.nameHash)) {
                    continue;
                }
                auto id = attribute.value.asId();
                if (!id || *id == 0) {
                    continue;
                }
                index.locations[*id].push_back(NodeLocation{file.name(), path});
                index.maxId = std::max(index.maxId, *id);
            }
        });
    }
    return index;
}

RenumberResult ReferenceResolver::renumber(Level& level, uint64_t oldId, uint64_t newId) const {
    std::lock_guard<std::recursive_mutex> guard(level.lock());
    RenumberResult result;

    IdIndex index = buildIdIndex(level);
    result.found = index.contains(oldId);
    if (!result.found) {
        Log(WARNING, "ReferenceResolver", "Renumber: ID {} is not used in the level", oldId);
        return result;
    }
    if (oldId == newId) {
        return result;
    }
    if (newId == 0) {
        throw FCBError(ErrorKind::IDCollision, "Cannot renumber " + std::to_string(oldId) + " to the null ID 0");
    }
    if (index.contains(newId)) {
        throw FCBError(ErrorKind::IDCollision, "Cannot renumber " + std::to_string(oldId) + " to " +
                       std::to_string(newId) + ": ID already in use at " + describe(*index.find(newId)));
    }

    std::set<std::string> ownerFiles;
    for (const auto& location : index.locations[oldId]) {
        ownerFiles.insert(location.file);
    }

    // A reference already aiming at newId would silently start resolving to the renumbered node
    for (const auto& reference : scan(level)) {
        if (reference.target != newId) {
            continue;
        }
        if (reference.scope == ReferenceScope::File && ownerFiles.count(reference.source.file) == 0) {
            continue;
        }
        throw FCBError(ErrorKind::IDCollision, "Cannot renumber " + std::to_string(oldId) + " to " +
                       std::to_string(newId) + ": ID is referenced from " + describe(reference.source));
    }

    struct Change {
        LevelFile* file;
        NodePath path;
        uint32_t attribute;
        bool identity;
    };
    std::vector<Change> changes;

    for (auto& file : level.files()) {
        const ResourceFile& resource = file.resource;
        resource.forEachNode([&](const Node& node, const NodePath& path) {
            for (const auto& attribute : node.attributes()) {
                auto id = attribute.value.asId();
                if (!id || *id != oldId) {
                    continue;
                }
                if (schema_.isIdentity(attribute.nameHash)) {
                    changes.push_back(Change{&file, path, attribute.nameHash, true});
                    continue;
                }
                auto scope = schema_.referenceScope(node.typeTag(), attribute.nameHash, attribute.value);
                if (!scope) {
                    continue;
                }
                if (*scope == ReferenceScope::File && ownerFiles.count(file.name()) == 0) {
                    continue;
                }
                changes.push_back(Change{&file, path, attribute.nameHash, false});
            }
        });
    }

    // Validate every change before touching anything
    for (const auto& change : changes) {
        Value probe = *change.file->resource.findNode(change.path)->getAttribute(change.attribute);
        if (!probe.replaceId(newId)) {
            throw FCBError(ErrorKind::EncodingError, "ID " + std::to_string(newId) + " does not fit the " +
                           Value::kindName(probe.kind()) + " attribute " + formatHash(change.attribute) +
                           " at " + describe(NodeLocation{change.file->name(), change.path}));
        }
    }

    std::set<LevelFile*> touched;
    for (const auto& change : changes) {
        change.file->resource.findNode(change.path)->getAttribute(change.attribute)->replaceId(newId);
        touched.insert(change.file);
        if (change.identity) {
            ++result.identitiesChanged;
        } else {
            ++result.referencesChanged;
        }
    }
    for (LevelFile* file : touched) {
        level.markDirty(*file);
    }

    Log(MESSAGE, "ReferenceResolver", "Renumbered {} -> {}: {} identities, {} references in {} files",
        oldId, newId, result.identitiesChanged, result.referencesChanged, touched.size());
    return result;
}

std::vector<Reference> ReferenceResolver::collectDangling(const Level& level) const {
    IdIndex index = buildIdIndex(level);
    std::vector<Reference> dangling;
    for (const auto& reference : scan(level)) {
        if (!resolves(index, reference)) {
            dangling.push_back(reference);
        }
    }
    return dangling;
}

std::vector<Reference> ReferenceResolver::findDangling(const Level& level) const {
    std::lock_guard<std::recursive_mutex> guard(level.lock());
    std::vector<Reference> dangling = collectDangling(level);
    for (const auto& reference : dangling) {
        Log(WARNING, "ReferenceResolver", "Dangling {} reference {} -> {} at {}", referenceScopeName(reference.scope),
            formatHash(reference.attribute), reference.target, describe(reference.source));
    }
    return dangling;
}

std::set<std::string> ReferenceResolver::collectNames(const Level& level) const {
    std::set<std::string> names;
    for (const auto& file : level.files()) {
        file.resource.forEachNode([&](const Node& node, const NodePath&) {
            if (const Value* value = node.getAttribute(schema_.nameAttribute())) {
                if (const std::string* name = value->get<std::string>()) {
                    names.insert(*name);
                }
            }
        });
    }
    return names;
}

std::string ReferenceResolver::uniqueName(const std::string& base, std::set<std::string>& taken) const {
    std::string candidate = base + "_Copy";
    for (int n = 2; taken.count(candidate) != 0; ++n) {
        candidate = base + "_Copy_" + std::to_string(n);
    }
    taken.insert(candidate);
    return candidate;
}

std::map<uint64_t, uint64_t> ReferenceResolver::prepareCopy(Node& copy, uint64_t& nextId,
                                                            std::set<std::string>& names,
                                                            std::string& assignedName) const {
    std::map<uint64_t, uint64_t> idMap;
    walk(static_cast<const Node&>(copy), [&](const Node& node) {
        for (const auto& attribute : node.attributes()) {
            if (!schema_.isIdentity(attribute.nameHash)) {
                continue;
            }
            auto id = attribute.value.asId();
            if (id && *id != 0 && idMap.count(*id) == 0) {
                idMap[*id] = nextId++;
            }
        }
    });

    walk(copy, [&](Node& node) {
        uint32_t typeTag = node.typeTag();
        for (const auto& attribute : node.attributes()) {
            auto id = attribute.value.asId();
            if (!id) {
                continue;
            }
            auto mapped = idMap.find(*id);
            if (mapped == idMap.end()) {
                continue;
            }
            bool identity = schema_.isIdentity(attribute.nameHash);
            if (!identity && !schema_.referenceScope(typeTag, attribute.nameHash, attribute.value)) {
                continue;
            }
            Value* value = node.getAttribute(attribute.nameHash);
            if (!value->replaceId(mapped->second)) {
                throw FCBError(ErrorKind::EncodingError, "Fresh ID " + std::to_string(mapped->second) +
                               " does not fit attribute " + formatHash(attribute.nameHash));
            }
        }
    });

    assignedName.clear();
    if (Value* value = copy.getAttribute(schema_.nameAttribute())) {
        if (std::string* name = value->get<std::string>()) {
            assignedName = uniqueName(*name, names);
            *name = assignedName;
        }
    }
    return idMap;
}

void ReferenceResolver::offsetPosition(Node& node) const {
    float offset = static_cast<float>(duplicateOffset_);
    for (uint32_t hash : schema_.positionAttributes()) {
        Value* value = node.getAttribute(hash);
        if (!value) {
            continue;
        }
        if (Vector3* position = value->get<Vector3>()) {
            position->x += offset;
            position->y += offset;
        } else {
            Log(DEBUG, "ReferenceResolver", "Position attribute {} is a {}, not moved", formatHash(hash),
                Value::kindName(value->kind()));
        }
    }
}

DuplicateResult ReferenceResolver::duplicate(Level& level, const std::string& file, const NodePath& path) const {
    std::lock_guard<std::recursive_mutex> guard(level.lock());
    LevelFile* levelFile = level.findFile(file);
    const Node* original = levelFile ? levelFile->resource.findNode(path) : nullptr;
    if (!original) {
        throw std::invalid_argument("No node at " + describe(NodeLocation{file, path}));
    }

    // Above every identity and every target so a dangling reference never starts resolving
    uint64_t nextId = buildIdIndex(level).maxId;
    for (const auto& reference : scan(level)) {
        nextId = std::max(nextId, reference.target);
    }
    ++nextId;

    std::set<std::string> names = collectNames(level);
    DuplicateResult result;
    Node copy = *original;
    copy.clearSourceRange();
    result.idMap = prepareCopy(copy, nextId, names, result.name);
    offsetPosition(copy);

    result.copy = NodeLocation{file, path};
    result.copy.path.back() += 1;
    if (path.size() == 1) {
        auto& roots = levelFile->resource.roots;
        roots.insert(roots.begin() + static_cast<std::ptrdiff_t>(path[0] + 1), std::move(copy));
    } else {
        NodePath parentPath(path.begin(), path.end() - 1);
        levelFile->resource.findNode(parentPath)->insertChild(path.back() + 1, std::move(copy));
    }
    level.markDirty(*levelFile);

    Log(MESSAGE, "ReferenceResolver", "Duplicated {} as {} with {} fresh IDs", describe(NodeLocation{file, path}),
        result.name.empty() ? describe(result.copy) : result.name, result.idMap.size());
    return result;
}

std::optional<NodeLocation> ReferenceResolver::findEntity(const Level& level, uint64_t id) const {
    std::lock_guard<std::recursive_mutex> guard(level.lock());
    IdIndex index = buildIdIndex(level);
    if (const NodeLocation* location = index.find(id)) {
        return *location;
    }
    return std::nullopt;
}

RemoveResult ReferenceResolver::removeEntity(Level& level, uint64_t id) const {
    std::lock_guard<std::recursive_mutex> guard(level.lock());
    RemoveResult result;

    IdIndex before = buildIdIndex(level);
    const NodeLocation* location = before.find(id);
    if (!location) {
        Log(WARNING, "ReferenceResolver", "Cannot remove entity {}: not found", id);
        return result;
    }
    NodeLocation target = *location;
    LevelFile* levelFile = level.findFile(target.file);
    Node* node = levelFile->resource.findNode(target.path);

    std::set<uint64_t> removedIds;
    walk(static_cast<const Node&>(*node), [&](const Node& n) {
        if (auto nid = nodeId(n)) {
            removedIds.insert(*nid);
        }
    });
    result.nodesRemoved = node->subtreeSize();

    if (target.path.size() == 1) {
        auto& roots = levelFile->resource.roots;
        roots.erase(roots.begin() + static_cast<std::ptrdiff_t>(target.path[0]));
    } else {
        NodePath parentPath(target.path.begin(), target.path.end() - 1);
        levelFile->resource.findNode(parentPath)->removeChild(target.path.back());
    }
    result.removed = true;
    level.markDirty(*levelFile);

    for (const auto& reference : collectDangling(level)) {
        if (removedIds.count(reference.target) != 0 && resolves(before, reference)) {
            Log(WARNING, "ReferenceResolver", "Removing {} leaves {} -> {} dangling at {}", id,
                formatHash(reference.attribute), reference.target, describe(reference.source));
            result.newlyDangling.push_back(reference);
        }
    }

    Log(MESSAGE, "ReferenceResolver", "Removed entity {} ({} nodes) from {}", id, result.nodesRemoved, target.file);
    return result;
}

std::optional<ResourceFile> ReferenceResolver::exportEntity(const Level& level, uint64_t id) const {
    std::lock_guard<std::recursive_mutex> guard(level.lock());
    auto location = findEntity(level, id);
    if (!location) {
        Log(WARNING, "ReferenceResolver", "Cannot export entity {}: not found", id);
        return std::nullopt;
    }
    const LevelFile* levelFile = level.findFile(location->file);
    ResourceFile exported;
    exported.name = "entity_" + std::to_string(id);
    exported.version = levelFile->resource.version;
    exported.flags = levelFile->resource.flags;
    exported.roots.push_back(*levelFile->resource.findNode(location->path));
    exported.roots.back().clearSourceRange();
    return exported;
}

std::vector<NodeLocation> ReferenceResolver::importEntities(Level& level, const std::string& file,
                                                            const ResourceFile& source) const {
    std::lock_guard<std::recursive_mutex> guard(level.lock());
    LevelFile* levelFile = level.findFile(file);
    if (!levelFile) {
        throw std::invalid_argument("Cannot import into " + file + ": file not loaded");
    }

    uint64_t nextId = buildIdIndex(level).maxId;
    for (const auto& reference : scan(level)) {
        nextId = std::max(nextId, reference.target);
    }
    ++nextId;
    std::set<std::string> names = collectNames(level);

    std::vector<NodeLocation> imported;
    auto& roots = levelFile->resource.roots;
    for (const auto& root : source.roots) {
        Node copy = root;
        std::string name;
        auto idMap = prepareCopy(copy, nextId, names, name);
        if (!roots.empty() && !roots[0].isOpaque()) {
            roots[0].addChild(std::move(copy));
            imported.push_back(NodeLocation{file, {0, roots[0].children().size() - 1}});
        } else {
            roots.push_back(std::move(copy));
            imported.push_back(NodeLocation{file, {roots.size() - 1}});
        }
        Log(MESSAGE, "ReferenceResolver", "Imported {} into {} with {} fresh IDs",
            name.empty() ? std::string("entity") : name, describe(imported.back()), idMap.size());
    }
    if (!imported.empty()) {
        level.markDirty(*levelFile);
    }
    return imported;
}

} // namespace FCBForge
