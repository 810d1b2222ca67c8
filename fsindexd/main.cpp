// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QCoreApplication>
#include <QDBusConnection>
#include <QDBusError>
#include <QDebug>
#include <QSettings>

#include <algorithm>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "DaemonSettings.h"
#include "IndexService.h"
#include "../Version.h"
#include "../watcher/IndexWorker.h"

#ifdef __APPLE__
#include "../watcher/FsEventStream.h"
#else
#include "../watcher/InotifyWatcher.h"
#endif

int main(int argc, char** argv) {
    bool useSessionBus = false;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == "--version") {
            std::cout << "fsindexd v" << Version::VERSION << std::endl;
            return 0;
        }
        if (arg == "--session") {
            useSessionBus = true;
        }
    }

    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("fsindexd");
    QCoreApplication::setOrganizationDomain("reikooters.net");

    constexpr const char* kServiceName = "net.reikooters.FsIndex1";
    constexpr const char* kObjectPath  = "/net/reikooters/FsIndex1";

    QSettings settings;
    const FsIndex::DaemonSettings config = FsIndex::DaemonSettings::load(settings);

    FsIndex::IndexWorkerConfig workerConfig;
    workerConfig.root = config.root.toStdString();
    for (const QString& p : config.ignoredPaths) workerConfig.ignoredPaths.push_back(p.toStdString());
    workerConfig.cachePath = config.filePath.toStdString();
    workerConfig.pendingCoalesceThreshold = config.pendingCoalesceThreshold;

    FsIndex::IndexWorker worker(workerConfig);
    worker.start();

#ifdef __APPLE__
    const std::uint64_t sinceEventId = config.lastEventId > 0 ? config.lastEventId
                                                              : kFSEventStreamEventIdSinceNow;
    auto watcher = std::make_unique<FsIndex::FsEventStream>(worker.rootPath(), worker.ignoredPaths(),
                                                            sinceEventId, worker.sink());
    if (!watcher->start()) {
        qCritical().noquote() << QStringLiteral("[watch] Failed to start FSEvents stream: %1")
            .arg(QString::fromStdString(watcher->status().error));
        worker.stop();
        return 4;
    }
#else
    auto watcher = std::make_unique<FsIndex::InotifyWatcher>(worker.rootPath(), worker.ignoredPaths(), worker.sink());
    if (!watcher->start()) {
        qCritical().noquote() << QStringLiteral("[watch] Failed to watch %1: %2")
            .arg(config.root, watcher->status().error);
        worker.stop();
        return 4;
    }
#endif
    worker.setWatcherEnabled(true);

    auto conn = useSessionBus ? QDBusConnection::sessionBus() : QDBusConnection::systemBus();
    if (!conn.isConnected()) {
        qCritical() << "Failed to connect to" << (useSessionBus ? "session" : "system") << "bus:"
                    << conn.lastError().message();
        watcher.reset();
        worker.stop();
        return 1;
    }

    if (!conn.registerService(kServiceName)) {
        qCritical() << "Failed to register service" << kServiceName << ":" << conn.lastError().message();
        watcher.reset();
        worker.stop();
        return 2;
    }

    FsIndex::IndexService svc(worker, config.searchDefaults);
    svc.setEventIdObserver([&settings](quint64 eventId) {
        FsIndex::DaemonSettings::saveLastEventId(settings, eventId);
    });

    if (!conn.registerObject(kObjectPath, &svc,
                             QDBusConnection::ExportAllSlots | QDBusConnection::ExportAllSignals)) {
        qCritical() << "Failed to register object" << kObjectPath << ":" << conn.lastError().message();
        watcher.reset();
        worker.stop();
        return 3;
    }

    qInfo().noquote() << QStringLiteral("fsindexd running on %1 bus as %2 object %3, indexing %4")
        .arg(useSessionBus ? QStringLiteral("session") : QStringLiteral("system"),
             QString::fromLatin1(kServiceName), QString::fromLatin1(kObjectPath), config.root);

    const int rc = app.exec();

    // Events stop first so the final resume token is really the last one.
    watcher.reset();
    worker.sync();
    FsIndex::DaemonSettings::saveLastEventId(settings, std::max<quint64>(config.lastEventId, worker.status().lastEventId));
    worker.stop();
    return rc;
}
