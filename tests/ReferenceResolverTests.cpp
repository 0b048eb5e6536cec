#include <gtest/gtest.h>

#include <algorithm>
#include <thread>

#include "TestFixtures.h"
#include "core/FCBError.h"
#include "core/Hashing.h"
#include "services/LevelService/ReferenceResolver.h"

using namespace FCBForge;
using namespace FCBForge::Testing;

namespace {

/*
 * a.data.fcb
 *   WorldSector
 *     Entity 1 "Tree" (10,20,30)
 *       EntityLink -> 2
 *       Entity 10 "Branch"
 *         EntityLink -> 1
 *     Entity 2 "Rock", disParentId 1
 * b.data.fcb
 *   WorldSector
 *     Entity 3 "Bush", disParentId 1 (file scoped, dangles)
 *       EntityLink -> 99 (dangles)
 *       EntityLink -> 0 (null)
 */
class ReferenceResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        testLog();

        Node branch = makeEntity(10, "Branch");
        branch.addChild(makeLink(1));
        Node tree = makeEntity(1, "Tree", {10.0f, 20.0f, 30.0f});
        tree.addChild(makeLink(2));
        tree.addChild(std::move(branch));
        Node rock = makeEntity(2, "Rock");
        rock.setAttribute("disParentId", Value(uint64_t{1}));
        addFile(makeSectorFile("a.data.fcb", {std::move(tree), std::move(rock)}));

        Node bush = makeEntity(3, "Bush");
        bush.setAttribute("disParentId", Value(uint64_t{1}));
        bush.addChild(makeLink(99));
        bush.addChild(makeLink(0));
        addFile(makeSectorFile("b.data.fcb", {std::move(bush)}));
    }

    void addFile(ResourceFile resource) {
        LevelFile file;
        file.binaryPath = resource.name;
        file.kind = ResourceKind::SectorData;
        file.state = FileState::MarkupSynced;
        file.resource = std::move(resource);
        level.addFile(std::move(file));
    }

    const Node& nodeAt(const std::string& file, const NodePath& path) const {
        const Node* node = level.findFile(file)->resource.findNode(path);
        EXPECT_NE(node, nullptr);
        return *node;
    }

    uint64_t idOf(const std::string& file, const NodePath& path) const {
        return *nodeAt(file, path).getAttribute("disEntityId")->asId();
    }

    uint64_t linkTarget(const std::string& file, const NodePath& path) const {
        return *nodeAt(file, path).getAttribute("disLinkedEntityId")->asId();
    }

    Level level{"container", "sectors"};
    ReferenceResolver resolver;
};

} // namespace

TEST_F(ReferenceResolverTest, ScanFindsEveryNonNullReference) {
    std::vector<Reference> references = resolver.scan(level);
    ASSERT_EQ(references.size(), 5u);

    size_t fileScoped = std::count_if(references.begin(), references.end(),
                                      [](const Reference& r) { return r.scope == ReferenceScope::File; });
    EXPECT_EQ(fileScoped, 2u);
    for (const auto& reference : references) {
        EXPECT_NE(reference.target, 0u);
    }
}

TEST_F(ReferenceResolverTest, ReferenceKindIsLevelScopedWithoutRule) {
    level.edit("b.data.fcb", [](ResourceFile& file) {
        file.roots[0].children()[0].setAttribute(0x7777AAAAu, Value(NodeRef{2}));
    });
    auto references = resolver.scan(level);
    auto it = std::find_if(references.begin(), references.end(),
                           [](const Reference& r) { return r.attribute == 0x7777AAAAu; });
    ASSERT_NE(it, references.end());
    EXPECT_EQ(it->scope, ReferenceScope::Level);
    EXPECT_EQ(it->target, 2u);
}

TEST_F(ReferenceResolverTest, BuildsIdIndex) {
    IdIndex index = resolver.buildIdIndex(level);
    EXPECT_EQ(index.locations.size(), 4u);
    EXPECT_EQ(index.maxId, 10u);
    ASSERT_NE(index.find(10), nullptr);
    EXPECT_EQ(index.find(10)->file, "a.data.fcb");
    EXPECT_EQ(index.find(10)->path, (NodePath{0, 0, 1}));
    EXPECT_TRUE(index.containsInFile(3, "b.data.fcb"));
    EXPECT_FALSE(index.containsInFile(3, "a.data.fcb"));
}

TEST_F(ReferenceResolverTest, FindsDanglingReferencesWithinScope) {
    std::vector<Reference> dangling = resolver.findDangling(level);
    ASSERT_EQ(dangling.size(), 2u);
    for (const auto& reference : dangling) {
        EXPECT_EQ(reference.source.file, "b.data.fcb");
    }
    EXPECT_TRUE(std::any_of(dangling.begin(), dangling.end(), [](const Reference& r) { return r.target == 99; }));
    EXPECT_TRUE(std::any_of(dangling.begin(), dangling.end(),
                            [](const Reference& r) { return r.target == 1 && r.scope == ReferenceScope::File; }));
}

TEST_F(ReferenceResolverTest, RenumberUpdatesIdentityAndReferences) {
    RenumberResult result = resolver.renumber(level, 1, 50);
    EXPECT_TRUE(result.found);
    EXPECT_EQ(result.identitiesChanged, 1u);
    EXPECT_EQ(result.referencesChanged, 2u);

    EXPECT_EQ(idOf("a.data.fcb", {0, 0}), 50u);
    EXPECT_EQ(linkTarget("a.data.fcb", {0, 0, 1, 0}), 50u);
    EXPECT_EQ(*nodeAt("a.data.fcb", {0, 1}).getAttribute("disParentId")->asId(), 50u);
    // file scoped reference from another file does not follow
    EXPECT_EQ(*nodeAt("b.data.fcb", {0, 0}).getAttribute("disParentId")->asId(), 1u);

    EXPECT_EQ(level.findFile("a.data.fcb")->state, FileState::Dirty);
    EXPECT_EQ(level.findFile("b.data.fcb")->state, FileState::MarkupSynced);
    EXPECT_EQ(resolver.findDangling(level).size(), 2u);
}

TEST_F(ReferenceResolverTest, RenumberIntoUsedIdThrowsWithoutChanges) {
    ResourceFile before = level.findFile("a.data.fcb")->resource;
    try {
        resolver.renumber(level, 1, 2);
        FAIL() << "expected IDCollision";
    } catch (const FCBError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IDCollision);
    }
    EXPECT_EQ(level.findFile("a.data.fcb")->resource, before);
    EXPECT_EQ(level.findFile("a.data.fcb")->state, FileState::MarkupSynced);

    EXPECT_THROW(resolver.renumber(level, 1, 0), FCBError);
}

TEST_F(ReferenceResolverTest, RenumberOntoPlaceholderTargetThrows) {
    ResourceFile beforeA = level.findFile("a.data.fcb")->resource;
    ResourceFile beforeB = level.findFile("b.data.fcb")->resource;
    ASSERT_EQ(resolver.findDangling(level).size(), 2u);

    try {
        resolver.renumber(level, 2, 99);
        FAIL() << "expected IDCollision";
    } catch (const FCBError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::IDCollision);
    }
    EXPECT_EQ(level.findFile("a.data.fcb")->resource, beforeA);
    EXPECT_EQ(level.findFile("b.data.fcb")->resource, beforeB);
    EXPECT_TRUE(level.dirtyFiles().empty());
    EXPECT_EQ(resolver.findDangling(level).size(), 2u);
}

TEST_F(ReferenceResolverTest, RenumberIgnoresFileScopedTargetsInOtherFiles) {
    // Bush's disParentId 1 only looks inside b.data.fcb, Rock lives in a.data.fcb
    resolver.renumber(level, 1, 500);
    RenumberResult result = resolver.renumber(level, 2, 1);
    EXPECT_EQ(result.identitiesChanged, 1u);
    EXPECT_EQ(idOf("a.data.fcb", {0, 1}), 1u);
    EXPECT_EQ(resolver.findDangling(level).size(), 2u);
}

TEST_F(ReferenceResolverTest, RenumberOfMissingIdIsNoOp) {
    RenumberResult result = resolver.renumber(level, 12345, 777);
    EXPECT_FALSE(result.found);
    EXPECT_EQ(result.identitiesChanged + result.referencesChanged, 0u);
    EXPECT_TRUE(level.dirtyFiles().empty());
}

TEST_F(ReferenceResolverTest, RenumberValidatesStorageBeforeWriting) {
    level.edit("b.data.fcb", [](ResourceFile& file) {
        Node small(hashName("Entity"));
        small.setAttribute("disEntityId", Value(uint8_t{5}));
        file.roots[0].addChild(std::move(small));
        file.roots[0].addChild(makeLink(5));
    });
    ResourceFile before = level.findFile("b.data.fcb")->resource;

    try {
        resolver.renumber(level, 5, 300);
        FAIL() << "expected EncodingError";
    } catch (const FCBError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::EncodingError);
    }
    EXPECT_EQ(level.findFile("b.data.fcb")->resource, before);
}

TEST_F(ReferenceResolverTest, DuplicateAssignsFreshIdsAndRetargetsInternalReferences) {
    DuplicateResult result = resolver.duplicate(level, "a.data.fcb", {0, 0});

    EXPECT_EQ(result.copy.path, (NodePath{0, 1}));
    EXPECT_EQ(result.name, "Tree_Copy");
    ASSERT_EQ(result.idMap.size(), 2u);
    // above every ID and every reference target in the level (99)
    EXPECT_EQ(result.idMap.at(1), 100u);
    EXPECT_EQ(result.idMap.at(10), 101u);

    const Node& copy = nodeAt("a.data.fcb", {0, 1});
    EXPECT_EQ(idOf("a.data.fcb", {0, 1}), 100u);
    EXPECT_EQ(*copy.getAttribute("hidName")->get<std::string>(), "Tree_Copy");
    const Vector3& position = *copy.getAttribute("hidPos")->get<Vector3>();
    EXPECT_EQ(position.x, 30.0f);
    EXPECT_EQ(position.y, 40.0f);
    EXPECT_EQ(position.z, 30.0f);

    // external reference unchanged, internal one follows the copy
    EXPECT_EQ(linkTarget("a.data.fcb", {0, 1, 0}), 2u);
    EXPECT_EQ(idOf("a.data.fcb", {0, 1, 1}), 101u);
    EXPECT_EQ(linkTarget("a.data.fcb", {0, 1, 1, 0}), 100u);

    // original untouched, following sibling shifted
    EXPECT_EQ(idOf("a.data.fcb", {0, 0}), 1u);
    EXPECT_EQ(linkTarget("a.data.fcb", {0, 0, 1, 0}), 1u);
    EXPECT_EQ(idOf("a.data.fcb", {0, 2}), 2u);

    EXPECT_EQ(level.findFile("a.data.fcb")->state, FileState::Dirty);
    EXPECT_EQ(resolver.findDangling(level).size(), 2u);
}

TEST_F(ReferenceResolverTest, RepeatedDuplicatesGetNumberedNames) {
    resolver.duplicate(level, "a.data.fcb", {0, 0});
    DuplicateResult second = resolver.duplicate(level, "a.data.fcb", {0, 0});
    EXPECT_EQ(second.name, "Tree_Copy_2");
    EXPECT_EQ(second.idMap.at(1), 102u);

    IdIndex index = resolver.buildIdIndex(level);
    for (const auto& [id, locations] : index.locations) {
        EXPECT_EQ(locations.size(), 1u) << "ID " << id << " used twice";
    }
}

TEST_F(ReferenceResolverTest, DuplicateOfMissingPathThrows) {
    EXPECT_THROW(resolver.duplicate(level, "a.data.fcb", {0, 9}), std::invalid_argument);
    EXPECT_THROW(resolver.duplicate(level, "missing.data.fcb", {0}), std::invalid_argument);
}

TEST_F(ReferenceResolverTest, RemoveReportsNewlyDanglingReferences) {
    RemoveResult result = resolver.removeEntity(level, 2);
    EXPECT_TRUE(result.removed);
    EXPECT_EQ(result.nodesRemoved, 1u);
    ASSERT_EQ(result.newlyDangling.size(), 1u);
    EXPECT_EQ(result.newlyDangling[0].target, 2u);
    EXPECT_EQ(result.newlyDangling[0].source.path, (NodePath{0, 0, 0}));
    EXPECT_FALSE(resolver.findEntity(level, 2).has_value());
}

TEST_F(ReferenceResolverTest, RemoveSubtreeDropsItsOwnReferences) {
    RemoveResult result = resolver.removeEntity(level, 1);
    EXPECT_EQ(result.nodesRemoved, 4u);
    // only Rock's parent reference resolved before and dangles now
    ASSERT_EQ(result.newlyDangling.size(), 1u);
    EXPECT_EQ(result.newlyDangling[0].scope, ReferenceScope::File);
    EXPECT_EQ(result.newlyDangling[0].source.file, "a.data.fcb");

    EXPECT_FALSE(resolver.removeEntity(level, 4242).removed);
}

TEST_F(ReferenceResolverTest, ExportAndImportWithFreshIds) {
    auto exported = resolver.exportEntity(level, 10);
    ASSERT_TRUE(exported.has_value());
    ASSERT_EQ(exported->roots.size(), 1u);
    EXPECT_EQ(exported->roots[0], nodeAt("a.data.fcb", {0, 0, 1}));

    auto imported = resolver.importEntities(level, "b.data.fcb", *exported);
    ASSERT_EQ(imported.size(), 1u);
    EXPECT_EQ(imported[0].path, (NodePath{0, 1}));
    EXPECT_EQ(idOf("b.data.fcb", {0, 1}), 100u);
    EXPECT_EQ(*nodeAt("b.data.fcb", {0, 1}).getAttribute("hidName")->get<std::string>(), "Branch_Copy");
    // the reference to Tree points outside the imported subtree
    EXPECT_EQ(linkTarget("b.data.fcb", {0, 1, 0}), 1u);
    EXPECT_EQ(level.findFile("b.data.fcb")->state, FileState::Dirty);

    EXPECT_FALSE(resolver.exportEntity(level, 4242).has_value());
    EXPECT_THROW(resolver.importEntities(level, "missing.data.fcb", *exported), std::invalid_argument);
}

TEST_F(ReferenceResolverTest, ImportIntoEmptyFileAddsRoots) {
    ResourceFile empty;
    empty.name = "c.data.fcb";
    addFile(empty);

    ResourceFile source;
    source.roots.push_back(makeEntity(1, "Tree"));
    auto imported = resolver.importEntities(level, "c.data.fcb", source);
    ASSERT_EQ(imported.size(), 1u);
    EXPECT_EQ(imported[0].path, (NodePath{0}));
    EXPECT_EQ(*nodeAt("c.data.fcb", {0}).getAttribute("hidName")->get<std::string>(), "Tree_Copy");
}

TEST_F(ReferenceResolverTest, CustomSchemaFromJson) {
    ReferenceSchema schema;
    ASSERT_TRUE(schema.loadFromString(R"({
        "identity": ["disEntityId"],
        "references": [{"tag": "EntityLink", "attribute": "disLinkedEntityId", "scope": "file"}],
        "name": "hidName"
    })"));
    ReferenceResolver fileScoped(schema);

    // disParentId is no longer a reference, links are file scoped
    std::vector<Reference> references = fileScoped.scan(level);
    EXPECT_EQ(references.size(), 3u);
    EXPECT_EQ(fileScoped.findDangling(level).size(), 1u);

    EXPECT_FALSE(schema.loadFromString("{\"references\": [{\"attribute\": \"x\", \"scope\": \"galaxy\"}]}"));
    EXPECT_FALSE(schema.loadFromString("not json"));
    EXPECT_EQ(schema.rules().size(), 1u);
}

TEST_F(ReferenceResolverTest, RenumberIsAtomicForConcurrentScans) {
    std::atomic<bool> done{false};
    std::thread writer([&] {
        for (int i = 0; i < 200; ++i) {
            resolver.renumber(level, i % 2 == 0 ? 1 : 500, i % 2 == 0 ? 500 : 1);
        }
        done = true;
    });

    size_t scans = 0;
    while (!done || scans == 0) {
        // a half-applied renumber would leave Branch's link dangling
        EXPECT_EQ(resolver.findDangling(level).size(), 2u);
        ++scans;
    }
    writer.join();
    EXPECT_EQ(idOf("a.data.fcb", {0, 0}), 1u);
}

TEST(NodeIdText, DecimalUnlessPrefixedWithHex) {
    EXPECT_EQ(parseNodeId("010"), std::optional<uint64_t>(10));
    EXPECT_EQ(parseNodeId("42"), std::optional<uint64_t>(42));
    EXPECT_EQ(parseNodeId("0x1F"), std::optional<uint64_t>(31));
    EXPECT_EQ(parseNodeId("0X1f"), std::optional<uint64_t>(31));
    EXPECT_EQ(parseNodeId("18446744073709551615"), std::optional<uint64_t>(UINT64_MAX));

    EXPECT_FALSE(parseNodeId(""));
    EXPECT_FALSE(parseNodeId("0x"));
    EXPECT_FALSE(parseNodeId("-1"));
    EXPECT_FALSE(parseNodeId(" 7"));
    EXPECT_FALSE(parseNodeId("12abc"));
    EXPECT_FALSE(parseNodeId("18446744073709551616"));
}
