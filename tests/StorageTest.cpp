// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include "../storage/NameIndex.h"
#include "../storage/NamePool.h"
#include "../storage/SlabIndex.h"
#include "../storage/SlabNode.h"
#include "../storage/ThinSlab.h"
#include "../storage/ThinVector.h"

using namespace FsIndex;

TEST(ThinVectorTest, PushInsertErase_KeepsOrder) {
    ThinVector<std::uint32_t> v;
    EXPECT_TRUE(v.empty());
    EXPECT_EQ(v.data(), nullptr);

    v.push_back(1);
    v.push_back(3);
    v.insert(1, 2);
    v.insert(0, 0);
    ASSERT_EQ(v.size(), 4u);
    for (std::uint32_t i = 0; i < 4; ++i) EXPECT_EQ(v[i], i);

    v.erase(0);
    v.erase(2);
    ASSERT_EQ(v.size(), 2u);
    EXPECT_EQ(v[0], 1u);
    EXPECT_EQ(v[1], 2u);

    EXPECT_THROW(v.erase(5), std::out_of_range);
    EXPECT_THROW(v.insert(3, 9), std::out_of_range);
}

TEST(ThinVectorTest, CopyAndMove_AreIndependent) {
    ThinVector<std::uint32_t> a;
    for (std::uint32_t i = 0; i < 10; ++i) a.push_back(i);

    ThinVector<std::uint32_t> b(a);
    b.push_back(99);
    EXPECT_EQ(a.size(), 10u);
    EXPECT_EQ(b.size(), 11u);

    ThinVector<std::uint32_t> c(std::move(b));
    EXPECT_TRUE(b.empty());
    EXPECT_EQ(c.size(), 11u);
    EXPECT_EQ(c[10], 99u);
}

TEST(SlabIndexTest, Sentinel_IsRejectedAndMapsToNone) {
    EXPECT_THROW(SlabIndex(static_cast<std::size_t>(SlabIndex::INVALID)), std::length_error);

    EXPECT_TRUE(OptionSlabIndex::none().isNone());
    EXPECT_FALSE(OptionSlabIndex::none().toOption().has_value());

    const OptionSlabIndex some = OptionSlabIndex::fromOption(SlabIndex(7));
    ASSERT_TRUE(some.isSome());
    EXPECT_EQ(some.toOption()->get(), 7u);
}

TEST(ThinSlabTest, RemovedSlotsAreReused) {
    ThinSlab<int> slab;
    const SlabIndex a = slab.insert(1);
    const SlabIndex b = slab.insert(2);
    EXPECT_EQ(slab.size(), 2u);

    auto removed = slab.tryRemove(a);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, 1);
    EXPECT_EQ(slab.get(a), nullptr);
    EXPECT_FALSE(slab.tryRemove(a).has_value());
    EXPECT_THROW((void)slab[a], std::out_of_range);

    const SlabIndex c = slab.insert(3);
    EXPECT_EQ(c, a);
    EXPECT_EQ(slab.size(), 2u);
    EXPECT_EQ(slab.slotCount(), 2u);
    EXPECT_EQ(*slab.get(b), 2);
}

TEST(ThinSlabTest, ForEach_VisitsOccupiedSlotsInOrder) {
    ThinSlab<int> slab;
    for (int i = 0; i < 5; ++i) (void)slab.insert(i);
    (void)slab.tryRemove(SlabIndex(2));

    std::vector<std::uint32_t> seen;
    slab.forEach([&](SlabIndex index, const int&) { seen.push_back(index.get()); });
    EXPECT_EQ(seen, (std::vector<std::uint32_t>{0, 1, 3, 4}));
}

TEST(SlabNodeTest, Metadata_PacksStateTypeAndSize) {
    const auto meta = SlabNodeMetadata::some(NodeFileType::File, 1234, 10, 20);
    EXPECT_EQ(meta.state(), MetadataState::Some);
    EXPECT_EQ(meta.fileType(), NodeFileType::File);
    EXPECT_EQ(meta.rawSize(), 1234u);
    EXPECT_EQ(meta.ctime(), 10u);
    EXPECT_EQ(meta.mtime(), 20u);

    const auto huge = SlabNodeMetadata::some(NodeFileType::File, UINT64_MAX, 0, 0);
    EXPECT_EQ(huge.rawSize(), SlabNodeMetadata::kSizeMask);
    EXPECT_EQ(huge.fileType(), NodeFileType::File);

    EXPECT_EQ(SlabNodeMetadata::unaccessible().state(), MetadataState::Unaccessible);
}

TEST(SlabNodeTest, Accessors_DependOnMetadata) {
    SlabNode file("archive.tar.gz", OptionSlabIndex::none(), SlabNodeMetadata::some(NodeFileType::File, 5, 1, 2));
    EXPECT_EQ(file.size(), 5u);
    EXPECT_EQ(file.modifiedAt(), 2u);
    EXPECT_EQ(file.createdAt(), 1u);

    SlabNode dir("src", OptionSlabIndex::none(), SlabNodeMetadata::some(NodeFileType::Dir, 4096, 1, 2));
    EXPECT_FALSE(dir.size().has_value());
    EXPECT_TRUE(dir.isDir());

    SlabNode synthetic("usr", OptionSlabIndex::none(), SlabNodeMetadata::none());
    EXPECT_TRUE(synthetic.isDir());
    EXPECT_FALSE(synthetic.modifiedAt().has_value());

    SlabNode dotfile(".bashrc", OptionSlabIndex::none(), SlabNodeMetadata::none());
    EXPECT_TRUE(dotfile.isHidden());
}

TEST(SlabNodeTest, Children_AddAndRemoveAreIdempotent) {
    SlabNode dir("d", OptionSlabIndex::none(), SlabNodeMetadata::none());
    EXPECT_TRUE(dir.addChild(SlabIndex(1)));
    EXPECT_FALSE(dir.addChild(SlabIndex(1)));
    EXPECT_TRUE(dir.addChild(SlabIndex(2)));
    EXPECT_EQ(dir.children().size(), 2u);

    EXPECT_TRUE(dir.removeChild(SlabIndex(1)));
    EXPECT_FALSE(dir.removeChild(SlabIndex(1)));
    EXPECT_EQ(dir.children().size(), 1u);
}

TEST(NamePoolTest, Intern_ReturnsStableSharedViews) {
    NamePool pool;
    const std::string_view a = pool.intern(std::string("main.rs"));
    for (int i = 0; i < 1000; ++i) (void)pool.intern("name" + std::to_string(i));
    const std::string_view b = pool.intern("main.rs");

    EXPECT_EQ(a.data(), b.data());
    EXPECT_EQ(a, "main.rs");
    EXPECT_TRUE(pool.contains("name999"));
    EXPECT_EQ(pool.size(), 1001u);
}

TEST(NameIndexTest, SortedInsertFollowsFullPath) {
    NamePool pool;
    const std::string_view name = pool.intern("readme");

    const std::map<std::uint32_t, std::string> paths{
        {0, "/b/readme"}, {1, "/a/readme"}, {2, "/c/readme"}, {3, "/a/readme"}
    };
    const NameIndex::PathFn pathOf = [&](SlabIndex index) -> std::optional<std::string> {
        auto it = paths.find(index.get());
        if (it == paths.end()) return std::nullopt;
        return it->second;
    };

    NameIndex index;
    index.addIndexSorted(name, SlabIndex(0), pathOf);
    index.addIndexSorted(name, SlabIndex(2), pathOf);
    index.addIndexSorted(name, SlabIndex(1), pathOf);
    // Same path as index 1; rejected.
    index.addIndexSorted(name, SlabIndex(3), pathOf);

    const SortedSlabIndices* bucket = index.get("readme");
    ASSERT_NE(bucket, nullptr);
    ASSERT_EQ(bucket->size(), 3u);
    EXPECT_EQ((*bucket)[0].get(), 1u);
    EXPECT_EQ((*bucket)[1].get(), 0u);
    EXPECT_EQ((*bucket)[2].get(), 2u);
    EXPECT_EQ(index.entryCount(), 3u);
}

TEST(NameIndexTest, ComparePathsByComponent_SlashSortsFirst) {
    EXPECT_LT(comparePathsByComponent("/r/a/x", "/r/a-c/x"), 0);
    EXPECT_LT(comparePathsByComponent("/r/a/x", "/r/a x"), 0);
    EXPECT_GT(comparePathsByComponent("/r/a.b/x", "/r/a/zzz"), 0);
    EXPECT_LT(comparePathsByComponent("/r/a", "/r/a/b"), 0);
    EXPECT_LT(comparePathsByComponent("/r/a-c", "/r/a.b"), 0);
    EXPECT_GT(comparePathsByComponent("/r/\xc3\xa9", "/r/z"), 0);
    EXPECT_EQ(comparePathsByComponent("/r/a", "/r/a"), 0);
}

TEST(NameIndexTest, SortedInsertAgreesWithPreorder) {
    NamePool pool;
    const std::string_view name = pool.intern("x");

    const std::map<std::uint32_t, std::string> paths{
        {0, "/r/a-c/x"}, {1, "/r/a/x"}, {2, "/r/a.b/x"}
    };
    const NameIndex::PathFn pathOf = [&](SlabIndex index) -> std::optional<std::string> {
        auto it = paths.find(index.get());
        if (it == paths.end()) return std::nullopt;
        return it->second;
    };

    NameIndex index;
    index.addIndexSorted(name, SlabIndex(0), pathOf);
    index.addIndexSorted(name, SlabIndex(2), pathOf);
    index.addIndexSorted(name, SlabIndex(1), pathOf);

    const SortedSlabIndices* bucket = index.get("x");
    ASSERT_NE(bucket, nullptr);
    ASSERT_EQ(bucket->size(), 3u);
    EXPECT_EQ((*bucket)[0].get(), 1u);
    EXPECT_EQ((*bucket)[1].get(), 0u);
    EXPECT_EQ((*bucket)[2].get(), 2u);
}

TEST(NameIndexTest, RemovingLastIndexDropsTheBucket) {
    NamePool pool;
    NameIndex index;
    index.addIndexOrdered(pool.intern("a"), SlabIndex(4));
    index.addIndexOrdered(pool.intern("a"), SlabIndex(5));

    EXPECT_TRUE(index.removeIndex("a", SlabIndex(4)));
    EXPECT_FALSE(index.removeIndex("a", SlabIndex(4)));
    EXPECT_EQ(index.nameCount(), 1u);

    EXPECT_TRUE(index.removeIndex("a", SlabIndex(5)));
    EXPECT_EQ(index.get("a"), nullptr);
    EXPECT_TRUE(index.empty());
}
