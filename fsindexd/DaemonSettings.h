// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FSINDEX_FSINDEXD_DAEMONSETTINGS_H
#define FSINDEX_FSINDEXD_DAEMONSETTINGS_H

#include <QString>
#include <QStringList>

#include <cstddef>

#include "../search/SearchTypes.h"

class QSettings;

namespace FsIndex {
    // Everything fsindexd reads from its QSettings file at startup.
    struct DaemonSettings {
        // [index]
        QString root;
        QStringList ignoredPaths;

        // [search] defaults; a Search() call may override any of them.
        SearchRequest searchDefaults;

        // [watcher]
        quint64 lastEventId = 0;
        std::size_t pendingCoalesceThreshold = 4096;

        // Location of the settings file; reported as the status cache path.
        QString filePath;

        /**
         * Reads all groups, applying defaults for missing keys.
         * An empty or missing index/root falls back to $HOME, then to "/".
         */
        [[nodiscard]] static DaemonSettings load(QSettings& s);

        static void saveLastEventId(QSettings& s, quint64 eventId);
    };
}

#endif //FSINDEX_FSINDEXD_DAEMONSETTINGS_H
