// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <gtest/gtest.h>

#include <random>
#include <string>
#include <vector>

#include "../index/FsPath.h"
#include "../watcher/PathScope.h"

using namespace FsIndex;

TEST(PathScopeTest, PathInScope_DirectoryAndFileRoots) {
    EXPECT_TRUE(pathInScope("/home/u", true, "/home/u"));
    EXPECT_TRUE(pathInScope("/home/u", true, "/home/u/a/b"));
    EXPECT_FALSE(pathInScope("/home/u", true, "/home/user"));
    EXPECT_FALSE(pathInScope("/home/u", true, "/home"));
    EXPECT_TRUE(pathInScope("/", true, "/anything"));

    EXPECT_TRUE(pathInScope("/home/u/file", false, "/home/u/file"));
    EXPECT_FALSE(pathInScope("/home/u/file", false, "/home/u/file/x"));
}

TEST(PathScopeTest, PathIsIgnored_MatchesWholeComponents) {
    const std::vector<std::string> ignored{"/home/u/.cache", "/home/u/build"};
    EXPECT_TRUE(pathIsIgnored("/home/u/.cache", ignored));
    EXPECT_TRUE(pathIsIgnored("/home/u/.cache/x/y", ignored));
    EXPECT_FALSE(pathIsIgnored("/home/u/.cache2", ignored));
    EXPECT_FALSE(pathIsIgnored("/home/u/src", ignored));
    EXPECT_FALSE(pathIsIgnored("/home/u/src", {}));
}

TEST(PathScopeTest, Coalesce_DropsDescendantsAndDuplicates) {
    const auto out = coalesceEventPaths({"/a/b/c", "/a/b", "/a/b/", "/x/y", "/a/bc", "/x/y/z/w"});
    EXPECT_EQ(out, (std::vector<std::string>{"/a/b", "/a/bc", "/x/y"}));
}

TEST(PathScopeTest, Coalesce_EmptyInputGivesEmptyOutput) {
    EXPECT_TRUE(coalesceEventPaths({}).empty());
}

TEST(PathScopeTest, Coalesce_PropertyNoAncestorPairsAndFullCoverage) {
    std::mt19937 rng(1234);
    const std::vector<std::string> names{"a", "b", "c", "ab", "a.b"};

    for (int round = 0; round < 200; ++round) {
        std::vector<std::string> paths;
        const int count = static_cast<int>(rng() % 20);
        for (int i = 0; i < count; ++i) {
            std::string p;
            const int depth = 1 + static_cast<int>(rng() % 4);
            for (int d = 0; d < depth; ++d) p += "/" + names[rng() % names.size()];
            paths.push_back(p);
        }

        const auto out = coalesceEventPaths(paths);

        for (std::size_t i = 0; i < out.size(); ++i) {
            for (std::size_t j = 0; j < out.size(); ++j) {
                if (i == j) continue;
                EXPECT_FALSE(FsPath::isSameOrDescendant(out[i], out[j]))
                    << out[i] << " is covered by " << out[j];
            }
        }
        for (const auto& p : paths) {
            bool covered = false;
            for (const auto& o : out) covered = covered || FsPath::isSameOrDescendant(p, o);
            EXPECT_TRUE(covered) << p;
        }
    }
}
