// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "FsEvent.h"
#include "../index/FsPath.h"

#include <algorithm>

namespace FsIndex {
    FsEventType classifyFsEventFlags(std::uint32_t flags) {
        if (flags & (FsEventFlags::HistoryDone | FsEventFlags::EventIdsWrapped)) return FsEventType::Nop;
        if (flags & (FsEventFlags::RootChanged | FsEventFlags::MustScanSubDirs)) return FsEventType::ReScan;
        if (flags & FsEventFlags::ItemIsDir) return FsEventType::Folder;
        return FsEventType::SingleNode;
    }

    std::vector<WatcherEvent> translateFsEventBatch(const std::vector<FsEvent>& batch,
                                                    std::string_view root,
                                                    std::uint64_t& lastEventId) {
        std::vector<WatcherEvent> out;

        bool historyDone = false;
        bool rescan = false;
        std::string rescanReason;
        std::uint64_t maxId = lastEventId;
        std::vector<std::string> paths;

        for (const FsEvent& event : batch) {
            maxId = std::max(maxId, event.id);
            if (event.flags & FsEventFlags::HistoryDone) historyDone = true;

            switch (event.type()) {
                case FsEventType::Nop:
                    break;
                case FsEventType::ReScan:
                    if (!rescan) rescanReason = "backend requested a rescan at " + event.path;
                    rescan = true;
                    break;
                case FsEventType::Folder:
                case FsEventType::SingleNode:
                    if (FsPath::clean(event.path) == root) {
                        if (!rescan) rescanReason = "watched root changed";
                        rescan = true;
                    } else {
                        paths.push_back(event.path);
                    }
                    break;
            }
        }

        lastEventId = maxId;

        if (historyDone) out.emplace_back(HistoryDone{});
        if (rescan) {
            out.emplace_back(RescanRequired{std::move(rescanReason), maxId});
        } else if (!paths.empty()) {
            out.emplace_back(PathsChanged{std::move(paths), maxId});
        }
        return out;
    }
}
