// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <gtest/gtest.h>

#include <variant>
#include <vector>

#include "../watcher/FsEvent.h"

using namespace FsIndex;

TEST(FsEventTest, Classify_MapsFlagGroups) {
    EXPECT_EQ(classifyFsEventFlags(FsEventFlags::HistoryDone), FsEventType::Nop);
    EXPECT_EQ(classifyFsEventFlags(FsEventFlags::EventIdsWrapped), FsEventType::Nop);
    EXPECT_EQ(classifyFsEventFlags(FsEventFlags::RootChanged), FsEventType::ReScan);
    EXPECT_EQ(classifyFsEventFlags(FsEventFlags::MustScanSubDirs | FsEventFlags::UserDropped), FsEventType::ReScan);
    EXPECT_EQ(classifyFsEventFlags(FsEventFlags::ItemCreated | FsEventFlags::ItemIsDir), FsEventType::Folder);
    EXPECT_EQ(classifyFsEventFlags(FsEventFlags::ItemRemoved | FsEventFlags::ItemIsFile), FsEventType::SingleNode);
    EXPECT_EQ(classifyFsEventFlags(0), FsEventType::SingleNode);
}

TEST(FsEventTest, Translate_CollectsPathsAndTracksMaxId) {
    std::uint64_t lastId = 5;
    const std::vector<FsEvent> batch{
        {"/r/a.txt", FsEventFlags::ItemCreated | FsEventFlags::ItemIsFile, 10},
        {"/r/dir", FsEventFlags::ItemRenamed | FsEventFlags::ItemIsDir, 12},
        {"/r", FsEventFlags::HistoryDone, 11},
    };

    const auto events = translateFsEventBatch(batch, "/r", lastId);
    EXPECT_EQ(lastId, 12u);
    ASSERT_EQ(events.size(), 2u);

    EXPECT_TRUE(std::holds_alternative<HistoryDone>(events[0]));
    const auto* changed = std::get_if<PathsChanged>(&events[1]);
    ASSERT_NE(changed, nullptr);
    EXPECT_EQ(changed->paths, (std::vector<std::string>{"/r/a.txt", "/r/dir"}));
    EXPECT_EQ(changed->eventId, 12u);
}

TEST(FsEventTest, Translate_RescanSupersedesTheBatch) {
    std::uint64_t lastId = 0;
    const std::vector<FsEvent> batch{
        {"/r/a.txt", FsEventFlags::ItemModified | FsEventFlags::ItemIsFile, 1},
        {"/r/sub", FsEventFlags::MustScanSubDirs, 2},
    };

    const auto events = translateFsEventBatch(batch, "/r", lastId);
    ASSERT_EQ(events.size(), 1u);
    const auto* rescan = std::get_if<RescanRequired>(&events[0]);
    ASSERT_NE(rescan, nullptr);
    EXPECT_EQ(rescan->eventId, 2u);
    EXPECT_FALSE(rescan->reason.empty());
}

TEST(FsEventTest, Translate_EventOnRootRequiresRescan) {
    std::uint64_t lastId = 0;
    const auto events = translateFsEventBatch({{"/r/", FsEventFlags::ItemRemoved | FsEventFlags::ItemIsDir, 3}},
                                              "/r", lastId);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<RescanRequired>(events[0]));
}

TEST(FsEventTest, Translate_OnlyNopsProduceNothing) {
    std::uint64_t lastId = 100;
    const auto events = translateFsEventBatch({{"/r", FsEventFlags::EventIdsWrapped, 4}}, "/r", lastId);
    EXPECT_TRUE(events.empty());
    EXPECT_EQ(lastId, 100u);
}
