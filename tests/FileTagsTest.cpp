// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <gtest/gtest.h>

#include <cstring>
#include <string>
#include <sys/xattr.h>

#include "TempTree.h"
#include "../search/FileTags.h"

using namespace FsIndex;
using FsIndex::Test::TempTreeTest;

class FileTagsTest : public TempTreeTest {
protected:
    // false when the filesystem under the temp dir has no user xattrs.
    bool tag(const std::string& relative, const std::string& value) const {
        const std::string target = path(relative);
#ifdef __APPLE__
        return ::setxattr(target.c_str(), kTagsXattrName, value.data(), value.size(), 0, 0) == 0;
#else
        return ::setxattr(target.c_str(), kTagsXattrName, value.data(), value.size(), 0) == 0;
#endif
    }
};

TEST_F(FileTagsTest, ReadsCommaSeparatedTags) {
    writeFile("a.txt", "a");
    if (!tag("a.txt", "red, Blue ,,green")) GTEST_SKIP() << "user xattrs unsupported here";

    EXPECT_EQ(readFileTags(path("a.txt")), (std::vector<std::string>{"red", "Blue", "green"}));
}

TEST_F(FileTagsTest, MatchesAnyWantedTag) {
    writeFile("a.txt", "a");
    if (!tag("a.txt", "red,Blue")) GTEST_SKIP() << "user xattrs unsupported here";

    EXPECT_TRUE(fileHasAnyTag(path("a.txt"), {"blue"}, true));
    EXPECT_FALSE(fileHasAnyTag(path("a.txt"), {"blue"}, false));
    EXPECT_TRUE(fileHasAnyTag(path("a.txt"), {"Blue"}, false));
    EXPECT_TRUE(fileHasAnyTag(path("a.txt"), {"green", "red"}, true));
    EXPECT_FALSE(fileHasAnyTag(path("a.txt"), {}, true));
}

TEST_F(FileTagsTest, UntaggedOrMissing_HasNoTags) {
    writeFile("plain.txt", "a");
    EXPECT_TRUE(readFileTags(path("plain.txt")).empty());
    EXPECT_TRUE(readFileTags(path("missing.txt")).empty());
    EXPECT_FALSE(fileHasAnyTag(path("missing.txt"), {"red"}, true));
}
