// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "TempTree.h"
#include "../index/NodeView.h"

using namespace FsIndex;
using FsIndex::Test::TempTreeTest;

TEST(FsPathTest, PathHelpers) {
    EXPECT_EQ(FsPath::join("/", "a"), "/a");
    EXPECT_EQ(FsPath::join("/a", "b"), "/a/b");
    EXPECT_EQ(FsPath::parent("/a/b"), "/a");
    EXPECT_EQ(FsPath::parent("/a"), "/");
    EXPECT_EQ(FsPath::parent("/"), "");
    EXPECT_EQ(FsPath::fileName("/a/b"), "b");
    EXPECT_EQ(FsPath::fileName("/"), "/");
    EXPECT_EQ(FsPath::componentDepth("/"), 0u);
    EXPECT_EQ(FsPath::componentDepth("/a//b/"), 2u);
    EXPECT_TRUE(FsPath::isSameOrDescendant("/a/b", "/a"));
    EXPECT_TRUE(FsPath::isSameOrDescendant("/a", "/a"));
    EXPECT_FALSE(FsPath::isSameOrDescendant("/ab", "/a"));
    EXPECT_EQ(FsPath::extensionOf("Main.RS"), "rs");
    EXPECT_EQ(FsPath::extensionOf(".bashrc"), "bashrc");
    EXPECT_FALSE(FsPath::extensionOf("trailing.").has_value());
    EXPECT_EQ(FsPath::clean("/a/b//"), "/a/b");
    EXPECT_EQ(FsPath::clean(""), "/");
}

class ConstructionTest : public TempTreeTest {
protected:
    void SetUp() override {
        TempTreeTest::SetUp();
        writeFile("src/main.rs", "fn main() {}");
        writeFile("src/lib.rs", "pub mod x;");
        writeFile("src/nested/deep/readme", "deep");
        writeFile("docs/readme", "docs");
        writeFile(".hidden/secret.txt", "s");
        writeFile("README.md", "# title");
        makeDir("empty");
    }
};

TEST_F(ConstructionTest, WalkAndConstruct_ParentChildLinksAreConsistent) {
    auto data = buildIndex();
    ASSERT_NE(data, nullptr);

    const auto& slab = data->fileNodes().slab();
    std::size_t nodes = 0;
    data->forEachNode([&](SlabIndex index, const SlabNode& node) {
        ++nodes;
        const auto parent = node.parent().toOption();
        if (!parent) {
            EXPECT_EQ(data->fileNodes().root(), index);
            return;
        }
        const SlabNode* parentNode = slab.get(*parent);
        ASSERT_NE(parentNode, nullptr);
        EXPECT_EQ(std::count(parentNode->children().begin(), parentNode->children().end(), index), 1);

        for (const SlabIndex child : node.children()) {
            const SlabNode* childNode = slab.get(child);
            ASSERT_NE(childNode, nullptr);
            EXPECT_EQ(childNode->parent().toOption(), index);
        }
    });
    EXPECT_EQ(nodes, data->entryCount());
}

TEST_F(ConstructionTest, NameIndex_HoldsOneEntryPerNode) {
    auto data = buildIndex();
    ASSERT_NE(data, nullptr);

    std::map<std::pair<std::string, std::uint32_t>, int> expected;
    data->forEachNode([&](SlabIndex index, const SlabNode& node) {
        ++expected[{std::string(node.name()), index.get()}];
    });

    std::map<std::pair<std::string, std::uint32_t>, int> actual;
    for (const auto& [name, bucket] : data->nameIndex()) {
        for (const SlabIndex index : bucket) ++actual[{std::string(name), index.get()}];
    }
    EXPECT_EQ(actual, expected);

    // Buckets are ordered by full path.
    const SortedSlabIndices* readmes = data->nameIndex().get("readme");
    ASSERT_NE(readmes, nullptr);
    ASSERT_EQ(readmes->size(), 2u);
    const NodeView first(data->fileNodes().slab(), (*readmes)[0]);
    const NodeView second(data->fileNodes().slab(), (*readmes)[1]);
    EXPECT_EQ(first.computePath(), path("docs/readme"));
    EXPECT_EQ(second.computePath(), path("src/nested/deep/readme"));
}

TEST_F(ConstructionTest, Counters_CountFilesAndDirectories) {
    auto data = buildIndex();
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(data->counters().scannedFiles, 6u);
    // root, src, src/nested, src/nested/deep, docs, .hidden, empty
    EXPECT_EQ(data->counters().scannedDirs, 7u);
    EXPECT_EQ(data->errors(), 0u);
}

TEST_F(ConstructionTest, WithoutCounters_StartsAtZero) {
    WalkData walk(rootPath(), {});
    auto tree = walkIt(walk);
    ASSERT_TRUE(tree);

    const RootIndexData data(construct(*tree), rootPath());
    EXPECT_EQ(data.rootPath(), rootPath());
    EXPECT_EQ(data.counters().scannedFiles, 0u);
    EXPECT_EQ(data.counters().scannedDirs, 0u);
    EXPECT_EQ(data.errors(), 0u);
    EXPECT_TRUE(data.nodeIdForPath(path("README.md"), true).has_value());
}

TEST_F(ConstructionTest, NodeView_ComputesPathDepthAndHiddenness) {
    auto data = buildIndex();
    ASSERT_NE(data, nullptr);

    const auto secret = data->nodeIdForPath(path(".hidden/secret.txt"), true);
    ASSERT_TRUE(secret.has_value());
    const NodeView view(data->fileNodes().slab(), *secret);
    EXPECT_EQ(view.computePath(), path(".hidden/secret.txt"));
    EXPECT_EQ(view.computeDepth(), FsPath::componentDepth(rootPath()) + 2);
    EXPECT_EQ(view.isHiddenWithinDepth(0), false);
    EXPECT_EQ(view.isHiddenWithinDepth(1), true);
}

TEST_F(ConstructionTest, NodeIdForPath_HonorsCaseSensitivity) {
    auto data = buildIndex();
    ASSERT_NE(data, nullptr);

    EXPECT_TRUE(data->nodeIdForPath(path("src/main.rs"), true).has_value());
    EXPECT_FALSE(data->nodeIdForPath(path("SRC/Main.rs"), true).has_value());
    EXPECT_EQ(data->nodeIdForPath(path("SRC/Main.rs"), false), data->nodeIdForPath(path("src/main.rs"), true));
    EXPECT_FALSE(data->nodeIdForPath(path("missing"), false).has_value());
}

TEST_F(ConstructionTest, IdHelpers_SelectByTypeAndExtension) {
    auto data = buildIndex();
    ASSERT_NE(data, nullptr);

    EXPECT_EQ(data->fileIds().size(), 6u);
    const auto rs = data->indicesForExtension("RS");
    ASSERT_EQ(rs.size(), 2u);
    EXPECT_TRUE(std::is_sorted(rs.begin(), rs.end()));
    EXPECT_TRUE(data->indicesForExtension("zip").empty());
}

TEST_F(ConstructionTest, IgnoredDirectories_AreNotWalked) {
    auto data = buildIndex({path("src")});
    ASSERT_NE(data, nullptr);
    EXPECT_FALSE(data->nodeIdForPath(path("src"), true).has_value());
    EXPECT_FALSE(data->nodeIdForPath(path("src/main.rs"), true).has_value());
    EXPECT_TRUE(data->nodeIdForPath(path("docs/readme"), true).has_value());
}

TEST_F(ConstructionTest, UpsertAndRemove_KeepNameIndexInSync) {
    auto data = buildIndex();
    ASSERT_NE(data, nullptr);

    writeFile("docs/new.txt", "n");
    const auto inserted = data->upsertEntry(path("docs/new.txt"), NamePool::global());
    ASSERT_TRUE(inserted.has_value());
    ASSERT_NE(data->nameIndex().get("new.txt"), nullptr);
    EXPECT_EQ(data->nodeIdForPath(path("docs/new.txt"), true), inserted);

    // Parent not indexed: nothing is created.
    writeFile("ghost/file.txt", "g");
    EXPECT_FALSE(data->upsertEntry(path("ghost/file.txt"), NamePool::global()).has_value());

    EXPECT_TRUE(data->removeEntry(path("src")));
    EXPECT_FALSE(data->nodeIdForPath(path("src/lib.rs"), true).has_value());
    EXPECT_EQ(data->nameIndex().get("lib.rs"), nullptr);
    EXPECT_EQ(data->nameIndex().get("readme")->size(), 1u);
    EXPECT_FALSE(data->removeEntry(path("src")));
}

TEST_F(ConstructionTest, NameBuckets_StayInPreorderWhenSiblingNamesShareAPrefix) {
    makeDir("tree/a/x");
    makeDir("tree/a-c/x");
    makeDir("tree/a.b/x");
    auto data = buildIndex();
    ASSERT_NE(data, nullptr);

    const auto bucketPaths = [&]() {
        std::vector<std::string> out;
        const SortedSlabIndices* bucket = data->nameIndex().get("x");
        if (!bucket) return out;
        for (const SlabIndex id : *bucket) {
            out.push_back(NodeView(data->fileNodes().slab(), id).computePath().value_or(""));
        }
        return out;
    };

    EXPECT_EQ(bucketPaths(), (std::vector<std::string>{path("tree/a/x"), path("tree/a-c/x"), path("tree/a.b/x")}));

    // ' ' and '0' sort below and above '-'; both must land between the existing entries.
    makeDir("tree/a 0/x");
    makeDir("tree/a0/x");
    ASSERT_TRUE(data->upsertEntry(path("tree/a 0"), NamePool::global()).has_value());
    ASSERT_TRUE(data->upsertEntry(path("tree/a 0/x"), NamePool::global()).has_value());
    ASSERT_TRUE(data->upsertEntry(path("tree/a0"), NamePool::global()).has_value());
    ASSERT_TRUE(data->upsertEntry(path("tree/a0/x"), NamePool::global()).has_value());

    const std::vector<std::string> paths = bucketPaths();
    EXPECT_EQ(paths, (std::vector<std::string>{path("tree/a/x"), path("tree/a 0/x"), path("tree/a-c/x"),
                                               path("tree/a.b/x"), path("tree/a0/x")}));
    EXPECT_TRUE(std::is_sorted(paths.begin(), paths.end(), [](const std::string& a, const std::string& b) {
        return comparePathsByComponent(a, b) < 0;
    }));
}
