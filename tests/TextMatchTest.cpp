// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../query/QueryPath.h"
#include "../query/TextMatch.h"

using namespace FsIndex;

TEST(TextMatchTest, Wildcards) {
    EXPECT_TRUE(wildcardMatches("*.txt", "report.txt"));
    EXPECT_FALSE(wildcardMatches("*.txt", "report.txt.bak"));
    EXPECT_TRUE(wildcardMatches("a?c", "abc"));
    EXPECT_FALSE(wildcardMatches("a?c", "ac"));
    EXPECT_TRUE(wildcardMatches("*", ""));
    EXPECT_TRUE(wildcardMatches("a*b*c", "aXXbYYc"));
    EXPECT_FALSE(wildcardMatches("a*b*c", "aXXbYY"));
}

TEST(TextMatchTest, Wildcards_QuestionMarkTakesOneCodePoint) {
    EXPECT_TRUE(wildcardMatches("caf?", "caf\xC3\xA9"));
    EXPECT_FALSE(wildcardMatches("caf??", "caf\xC3\xA9"));
    // Invalid UTF-8 falls back to byte matching.
    EXPECT_TRUE(wildcardMatches("a??", "a\xFF\xFE"));
}

TEST(TextMatchTest, SegmentQueryText_AssignsMatchKinds) {
    const auto single = segmentQueryText("main");
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(single[0].matcher->kind(), TextSegmentMatchKind::Substr);

    EXPECT_EQ(segmentQueryText("/main")[0].matcher->kind(), TextSegmentMatchKind::Prefix);
    EXPECT_EQ(segmentQueryText("main/")[0].matcher->kind(), TextSegmentMatchKind::Suffix);
    EXPECT_EQ(segmentQueryText("/main/")[0].matcher->kind(), TextSegmentMatchKind::Exact);

    const auto multi = segmentQueryText("src/**/main");
    ASSERT_EQ(multi.size(), 3u);
    EXPECT_EQ(multi[0].matcher->kind(), TextSegmentMatchKind::Suffix);
    EXPECT_EQ(multi[1].kind, TextQuerySegment::Kind::GlobStar);
    EXPECT_EQ(multi[2].matcher->kind(), TextSegmentMatchKind::Prefix);

    EXPECT_TRUE(segmentQueryText("a//b").empty());
    EXPECT_TRUE(segmentQueryText("///").empty());
}

TEST(TextMatchTest, PathQueries) {
    const std::vector<std::string> path = splitPathSegments("/home/u/project/src/main.rs");

    EXPECT_TRUE(textMatches("main", "main.rs", "/home/u/project/src/main.rs", path));
    EXPECT_TRUE(textMatches("src/main", "main.rs", "/home/u/project/src/main.rs", path));
    EXPECT_TRUE(textMatches("project/*/main.rs", "main.rs", "/home/u/project/src/main.rs", path));
    EXPECT_TRUE(textMatches("u/**/main.rs", "main.rs", "/home/u/project/src/main.rs", path));
    EXPECT_FALSE(textMatches("u/*/main.rs", "main.rs", "/home/u/project/src/main.rs", path));
    EXPECT_FALSE(textMatches("/src/main.rs/x", "main.rs", "/home/u/project/src/main.rs", path));
    EXPECT_TRUE(textMatches("*.rs", "main.rs", "/home/u/project/src/main.rs", path));
    EXPECT_TRUE(textMatches("", "main.rs", "/home/u/project/src/main.rs", path));
}

TEST(TextMatchTest, NamePrefilterTerms) {
    EXPECT_TRUE(isNamePrefilterTerm("main"));
    EXPECT_TRUE(isNamePrefilterTerm("hello world"));
    EXPECT_FALSE(isNamePrefilterTerm("src/main"));
    EXPECT_FALSE(isNamePrefilterTerm("*.rs"));
    EXPECT_FALSE(isNamePrefilterTerm("   "));
}

TEST(QueryPathTest, ScopePaths) {
    EXPECT_EQ(normalizePathForCompare("C:\\dir\\"), "C:/dir");
    EXPECT_EQ(normalizePathForCompare(""), "/");
    EXPECT_TRUE(isDirectChildPath("/a/b", "/a"));
    EXPECT_FALSE(isDirectChildPath("/a/b/c", "/a"));
    EXPECT_TRUE(isDirectChildPath("/a", "/"));
    EXPECT_TRUE(isDescendantPath("/a/b/c", "/a"));
    EXPECT_FALSE(isDescendantPath("/ab", "/a"));
    EXPECT_FALSE(isDescendantPath("/a", "/a"));
    EXPECT_TRUE(isDescendantPath("/a", "/"));
}
