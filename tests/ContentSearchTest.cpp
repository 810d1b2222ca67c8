// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <gtest/gtest.h>

#include <string>

#include "TempTree.h"
#include "../query/ContentSearch.h"

using namespace FsIndex;
using FsIndex::Test::TempTreeTest;

TEST(RabinKarpFinderTest, FindsFirstOccurrence) {
    const RabinKarpFinder finder("needle");
    EXPECT_EQ(finder.find("hay needle and needle"), std::optional<std::size_t>(4));
    EXPECT_EQ(finder.find("needle"), std::optional<std::size_t>(0));
    EXPECT_EQ(finder.find("xxneedle"), std::optional<std::size_t>(2));
    EXPECT_FALSE(finder.find("needl").has_value());
    EXPECT_FALSE(finder.find("haystack only").has_value());
}

TEST(RabinKarpFinderTest, HandlesHighBytes) {
    const std::string needle = "\xff\xfe\x80";
    const RabinKarpFinder finder(needle);
    const std::string haystack = std::string("abc\xff\xfe\x7f") + needle + "z";
    EXPECT_EQ(finder.find(haystack), std::optional<std::size_t>(6));
}

class ContentSearchTest : public TempTreeTest {};

TEST_F(ContentSearchTest, MatchesSingleAndMultiByteNeedles) {
    writeFile("a.txt", "hello world");
    const auto token = CancellationToken::noop();

    EXPECT_EQ(fileContentMatches(path("a.txt"), "world", false, token), std::optional<bool>(true));
    EXPECT_EQ(fileContentMatches(path("a.txt"), "w", false, token), std::optional<bool>(true));
    EXPECT_EQ(fileContentMatches(path("a.txt"), "planet", false, token), std::optional<bool>(false));
    EXPECT_EQ(fileContentMatches(path("a.txt"), "q", false, token), std::optional<bool>(false));
}

TEST_F(ContentSearchTest, CaseInsensitive_ExpectsLowercaseNeedle) {
    writeFile("a.txt", "Some MIXED Case");
    const auto token = CancellationToken::noop();

    EXPECT_EQ(fileContentMatches(path("a.txt"), "mixed case", true, token), std::optional<bool>(true));
    EXPECT_EQ(fileContentMatches(path("a.txt"), "m", true, token), std::optional<bool>(true));
    EXPECT_EQ(fileContentMatches(path("a.txt"), "mixed case", false, token), std::optional<bool>(false));
}

TEST_F(ContentSearchTest, NeedleAcrossChunkBoundary_IsFound) {
    const std::string needle = "boundary-needle";
    for (std::size_t split = 1; split < needle.size(); ++split) {
        std::string content(kContentBufferBytes - split, 'x');
        content += needle;
        content += std::string(100, 'y');
        writeFile("big.bin", content);

        EXPECT_EQ(fileContentMatches(path("big.bin"), needle, false, CancellationToken::noop()),
                  std::optional<bool>(true)) << "split " << split;
    }
}

TEST_F(ContentSearchTest, CaseInsensitiveNeedleAcrossChunkBoundary_IsFound) {
    const std::string onDisk = "Boundary-NEEDLE";
    const std::string needle = "boundary-needle";
    for (std::size_t split = 1; split < onDisk.size(); ++split) {
        // Uppercase filler keeps the carried overlap bytes non-trivial to lowercase.
        std::string content(kContentBufferBytes - split, 'X');
        content += onDisk;
        content += std::string(100, 'Y');
        writeFile("big.bin", content);

        EXPECT_EQ(fileContentMatches(path("big.bin"), needle, true, CancellationToken::noop()),
                  std::optional<bool>(true)) << "split " << split;
        EXPECT_EQ(fileContentMatches(path("big.bin"), needle, false, CancellationToken::noop()),
                  std::optional<bool>(false)) << "split " << split;
    }
}

TEST_F(ContentSearchTest, CaseInsensitive_CarriedOverlapIsLowercased) {
    // The first 'X' is the last byte of chunk one and reaches chunk two only through the carry.
    std::string content(kContentBufferBytes - 1, 'a');
    content += "XX";
    writeFile("big.bin", content);

    EXPECT_EQ(fileContentMatches(path("big.bin"), "axx", true, CancellationToken::noop()),
              std::optional<bool>(true));
    EXPECT_EQ(fileContentMatches(path("big.bin"), "axx", false, CancellationToken::noop()),
              std::optional<bool>(false));
}

TEST_F(ContentSearchTest, CaseInsensitiveSingleByte_AtChunkEdges) {
    std::string content(kContentBufferBytes, 'q');
    content.back() = 'Z';
    writeFile("last.bin", content);
    EXPECT_EQ(fileContentMatches(path("last.bin"), "z", true, CancellationToken::noop()), std::optional<bool>(true));
    EXPECT_EQ(fileContentMatches(path("last.bin"), "z", false, CancellationToken::noop()), std::optional<bool>(false));

    content.back() = 'q';
    content += 'Z';
    writeFile("next.bin", content);
    EXPECT_EQ(fileContentMatches(path("next.bin"), "z", true, CancellationToken::noop()), std::optional<bool>(true));
}

TEST_F(ContentSearchTest, NeedleAtVeryEnd_IsFound) {
    std::string content(3 * kContentBufferBytes, 'x');
    content += "tail";
    writeFile("big.bin", content);
    EXPECT_EQ(fileContentMatches(path("big.bin"), "tail", false, CancellationToken::noop()),
              std::optional<bool>(true));
    EXPECT_EQ(fileContentMatches(path("big.bin"), "tails", false, CancellationToken::noop()),
              std::optional<bool>(false));
}

TEST_F(ContentSearchTest, EmptyNeedleOrMissingFile_IsNoMatch) {
    writeFile("a.txt", "abc");
    const auto token = CancellationToken::noop();
    EXPECT_EQ(fileContentMatches(path("a.txt"), "", false, token), std::optional<bool>(false));
    EXPECT_EQ(fileContentMatches(path("missing.txt"), "abc", false, token), std::optional<bool>(false));
    EXPECT_EQ(fileContentMatches(path("empty.txt"), "abc", false, token), std::optional<bool>(false));
}

TEST_F(ContentSearchTest, CancelledToken_GivesNullopt) {
    writeFile("a.txt", "abc");
    SearchVersionTracker tracker;
    const CancellationToken token = tracker.nextToken();
    (void)tracker.nextVersion();

    EXPECT_FALSE(fileContentMatches(path("a.txt"), "abc", false, token).has_value());
}
