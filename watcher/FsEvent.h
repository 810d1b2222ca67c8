// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_WATCHER_FSEVENT_H
#define FSINDEX_WATCHER_FSEVENT_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "WatcherEvent.h"

namespace FsIndex {
    // FSEventStreamEventFlags bits (values as defined by CoreServices).
    namespace FsEventFlags {
        inline constexpr std::uint32_t MustScanSubDirs = 0x00000001;
        inline constexpr std::uint32_t UserDropped = 0x00000002;
        inline constexpr std::uint32_t KernelDropped = 0x00000004;
        inline constexpr std::uint32_t EventIdsWrapped = 0x00000008;
        inline constexpr std::uint32_t HistoryDone = 0x00000010;
        inline constexpr std::uint32_t RootChanged = 0x00000020;
        inline constexpr std::uint32_t ItemCreated = 0x00000100;
        inline constexpr std::uint32_t ItemRemoved = 0x00000200;
        inline constexpr std::uint32_t ItemInodeMetaMod = 0x00000400;
        inline constexpr std::uint32_t ItemRenamed = 0x00000800;
        inline constexpr std::uint32_t ItemModified = 0x00001000;
        inline constexpr std::uint32_t ItemIsFile = 0x00010000;
        inline constexpr std::uint32_t ItemIsDir = 0x00020000;
        inline constexpr std::uint32_t ItemIsSymlink = 0x00040000;
    }

    enum class FsEventType {
        Nop,        // history marker or id wrap; nothing to apply
        ReScan,     // the kernel lost track; only a full rebuild is safe
        Folder,
        SingleNode
    };

    [[nodiscard]] FsEventType classifyFsEventFlags(std::uint32_t flags);

    // One FSEvents record, copied out of the callback payload.
    struct FsEvent {
        std::string path;
        std::uint32_t flags = 0;
        std::uint64_t id = 0;

        [[nodiscard]] FsEventType type() const { return classifyFsEventFlags(flags); }
    };

    /**
     * Turns one delivered FSEvents batch into channel messages.
     *
     * Emits HistoryDone first if any record carries that flag. Then either a single
     * RescanRequired (a ReScan record, or any record naming the root itself) or one
     * PathsChanged with every non-Nop path in delivery order.
     *
     * @param lastEventId Raised to the highest id seen in the batch.
     */
    [[nodiscard]] std::vector<WatcherEvent> translateFsEventBatch(const std::vector<FsEvent>& batch,
                                                                  std::string_view root,
                                                                  std::uint64_t& lastEventId);
}

#endif //FSINDEX_WATCHER_FSEVENT_H
