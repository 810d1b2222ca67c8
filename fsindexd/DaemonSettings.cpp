// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "DaemonSettings.h"

#include <QDir>
#include <QSettings>
#include <QtGlobal>

#include <limits>

namespace FsIndex {
    DaemonSettings DaemonSettings::load(QSettings& s) {
        DaemonSettings out;
        out.filePath = s.fileName();

        s.beginGroup(QStringLiteral("index"));
        out.root = s.value(QStringLiteral("root"), QString()).toString().trimmed();
        out.ignoredPaths = s.value(QStringLiteral("ignoredPaths"), QStringList()).toStringList();
        s.endGroup();

        if (out.root.isEmpty()) {
            out.root = qEnvironmentVariable("HOME");
        }
        if (out.root.isEmpty()) {
            out.root = QStringLiteral("/");
        }
        out.root = QDir::cleanPath(out.root);
        out.ignoredPaths.removeAll(QString());

        SearchRequest& d = out.searchDefaults;
        s.beginGroup(QStringLiteral("search"));
        d.maxResults = static_cast<std::size_t>(s.value(QStringLiteral("maxResults"), 200).toULongLong());
        const QVariant maxDepth = s.value(QStringLiteral("maxDepth"));
        bool depthOk = false;
        const qulonglong depth = maxDepth.toULongLong(&depthOk);
        d.maxDepth = depthOk ? static_cast<std::size_t>(depth) : std::numeric_limits<std::size_t>::max();
        d.includeHidden = s.value(QStringLiteral("includeHidden"), false).toBool();
        d.caseSensitive = s.value(QStringLiteral("caseSensitive"), false).toBool();
        s.endGroup();

        s.beginGroup(QStringLiteral("watcher"));
        out.lastEventId = s.value(QStringLiteral("lastEventId"), 0).toULongLong();
        const qulonglong threshold = s.value(QStringLiteral("pendingCoalesceThreshold"), 4096).toULongLong();
        out.pendingCoalesceThreshold = threshold > 0 ? static_cast<std::size_t>(threshold) : 4096;
        s.endGroup();

        return out;
    }

    void DaemonSettings::saveLastEventId(QSettings& s, quint64 eventId) {
        s.beginGroup(QStringLiteral("watcher"));
        s.setValue(QStringLiteral("lastEventId"), eventId);
        s.endGroup();
        s.sync();
    }
}
