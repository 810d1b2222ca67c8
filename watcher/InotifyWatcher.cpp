// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include "InotifyWatcher.h"
#include "PathScope.h"
#include "../index/FsPath.h"
#include "../index/Walker.h"

#include <QDebug>
#include <QMetaObject>
#include <QSocketNotifier>

#include <cerrno>
#include <cstring>
#include <utility>

#include <sys/inotify.h>
#include <unistd.h>

namespace FsIndex {
    static constexpr std::uint32_t kWatchMask =
        IN_CREATE | IN_DELETE | IN_MODIFY | IN_ATTRIB | IN_CLOSE_WRITE |
        IN_MOVED_FROM | IN_MOVED_TO | IN_DELETE_SELF | IN_MOVE_SELF | IN_DONT_FOLLOW;

    static QString errnoText(int err) {
        return QString::fromLocal8Bit(std::strerror(err));
    }

    InotifyWatcher::InotifyWatcher(std::string root, std::vector<std::string> ignoredPaths, WatcherSink sink,
                                   QObject* parent)
        : QObject(parent),
          m_root(FsPath::clean(root)),
          m_ignoredPaths(std::move(ignoredPaths)),
          m_sink(std::move(sink)) {}

    InotifyWatcher::~InotifyWatcher() {
        stop();
    }

    InotifyWatcher::Status InotifyWatcher::status() const {
        std::lock_guard lock(m_statusMutex);
        return m_status;
    }

    std::size_t InotifyWatcher::watchCount() const {
        std::lock_guard lock(m_statusMutex);
        return m_watchCount;
    }

    void InotifyWatcher::setStatus(const QString& state, const QString& error) {
        {
            std::lock_guard lock(m_statusMutex);
            m_status = Status{state, error};
            m_watchCount = m_wdPaths.size();
        }
        emit statusChanged(state, error);
    }

    bool InotifyWatcher::start() {
        if (m_fd >= 0) return true;

        m_fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
        if (m_fd < 0) {
            const int err = errno;
            setStatus(QStringLiteral("error"),
                      QStringLiteral("inotify_init1 failed (%1): %2").arg(err).arg(errnoText(err)));
            return false;
        }

        QString error;
        if (!addWatch(m_root, &error)) {
            ::close(m_fd);
            m_fd = -1;
            setStatus(QStringLiteral("error"), error);
            return false;
        }
        m_rootWd = m_wdPaths.begin()->first;
        m_armFailures = 0;
        addWatchesRecursive(m_root);

        if (m_armFailures > 0) {
            qWarning().noquote() << QStringLiteral("[watch] root=%1 could not arm %2 directories (watch limit?)")
                                    .arg(QString::fromStdString(m_root))
                                    .arg(m_armFailures);
        }

        m_context = std::make_unique<QObject>();
        m_context->moveToThread(&m_thread);
        m_thread.setObjectName(QStringLiteral("fsindex-inotify"));
        m_thread.start();

        QMetaObject::invokeMethod(m_context.get(), [this]() {
            m_notifier = new QSocketNotifier(m_fd, QSocketNotifier::Read, m_context.get());
            connect(m_notifier, &QSocketNotifier::activated, m_context.get(), [this]() {
                onInotifyReadable();
            });
        }, Qt::BlockingQueuedConnection);

        setStatus(QStringLiteral("watching"), QString());
        qInfo().noquote() << QStringLiteral("[watch] root=%1 watching %2 directories")
                             .arg(QString::fromStdString(m_root))
                             .arg(m_wdPaths.size());
        return true;
    }

    void InotifyWatcher::stop() {
        if (m_context) {
            QMetaObject::invokeMethod(m_context.get(), [this]() {
                if (m_notifier) {
                    m_notifier->setEnabled(false);
                    m_notifier->deleteLater();
                    m_notifier = nullptr;
                }
            }, Qt::BlockingQueuedConnection);

            m_thread.quit();
            m_thread.wait();

            m_context.reset();
        }

        if (m_fd >= 0) {
            ::close(m_fd);
            m_fd = -1;
            m_wdPaths.clear();
            m_rootWd = -1;
            setStatus(QStringLiteral("stopped"), QString());
        }
    }

    bool InotifyWatcher::addWatch(const std::string& dir, QString* errorOut) {
        const int wd = inotify_add_watch(m_fd, dir.c_str(), kWatchMask);
        if (wd < 0) {
            const int err = errno;
            if (errorOut) {
                *errorOut = QStringLiteral("inotify_add_watch(%1) failed (%2): %3")
                                .arg(QString::fromStdString(dir))
                                .arg(err)
                                .arg(errnoText(err));
            }
            return false;
        }
        // Re-adding a known inode returns the same wd; the new path wins (renames).
        m_wdPaths[wd] = dir;
        return true;
    }

    void InotifyWatcher::addWatchesRecursive(const std::string& dir) {
        std::vector<std::string> names;
        if (!listDirectory(dir, names)) return;

        for (const auto& name : names) {
            const std::string child = FsPath::join(dir, name);
            if (pathIsIgnored(child, m_ignoredPaths)) continue;

            const auto metadata = statPath(child);
            if (!metadata || metadata->fileType() != NodeFileType::Dir) continue;

            if (!addWatch(child, nullptr)) {
                ++m_armFailures;
                continue;
            }
            addWatchesRecursive(child);
        }
    }

    void InotifyWatcher::dropWatchesUnder(const std::string& dir) {
        for (auto it = m_wdPaths.begin(); it != m_wdPaths.end();) {
            if (it->first != m_rootWd && FsPath::isSameOrDescendant(it->second, dir)) {
                inotify_rm_watch(m_fd, it->first);
                it = m_wdPaths.erase(it);
                continue;
            }
            ++it;
        }
    }

    void InotifyWatcher::onInotifyReadable() {
        if (m_fd < 0) return;

        alignas(inotify_event) char buf[16 * 1024];

        std::vector<std::string> changed;
        bool rescan = false;
        QString rescanReason;

        while (true) {
            const ssize_t nread = ::read(m_fd, buf, sizeof(buf));
            if (nread < 0) {
                const int err = errno;
                if (err == EAGAIN || err == EWOULDBLOCK) break;
                if (err == EINTR) continue;

                const QString message = QStringLiteral("inotify read failed: %1").arg(errnoText(err));
                qWarning().noquote() << QStringLiteral("[watch] root=%1 %2")
                                        .arg(QString::fromStdString(m_root), message);
                setStatus(QStringLiteral("error"), message);
                m_sink(WatcherError{message.toStdString()});
                break;
            }
            if (nread == 0) break;

            for (const char* p = buf; p < buf + nread;) {
                const auto* ev = reinterpret_cast<const inotify_event*>(p);
                p += sizeof(inotify_event) + ev->len;

                if (ev->mask & IN_Q_OVERFLOW) {
                    rescan = true;
                    rescanReason = QStringLiteral("inotify queue overflow");
                    continue;
                }

                auto it = m_wdPaths.find(ev->wd);
                if (it == m_wdPaths.end()) continue;
                const std::string dirPath = it->second;

                if (ev->mask & (IN_DELETE_SELF | IN_MOVE_SELF | IN_IGNORED)) {
                    if (ev->wd == m_rootWd) {
                        rescan = true;
                        rescanReason = QStringLiteral("watched root was removed or moved");
                    }
                    if (ev->mask & IN_IGNORED) m_wdPaths.erase(ev->wd);
                    continue;
                }

                // A directory also reports its own changes to its parent's watch, with a name.
                if (ev->len == 0) continue;

                std::string path = FsPath::join(dirPath, ev->name);
                if (pathIsIgnored(path, m_ignoredPaths)) continue;

                if (ev->mask & IN_ISDIR) {
                    if (ev->mask & IN_MOVED_FROM) {
                        dropWatchesUnder(path);
                    } else if (ev->mask & (IN_CREATE | IN_MOVED_TO)) {
                        if (addWatch(path, nullptr)) {
                            addWatchesRecursive(path);
                        } else {
                            ++m_armFailures;
                        }
                    }
                }

                changed.push_back(std::move(path));
            }
        }

        {
            std::lock_guard lock(m_statusMutex);
            m_watchCount = m_wdPaths.size();
        }

        if (rescan) {
            qInfo().noquote() << QStringLiteral("[watch] root=%1 rescan required: %2")
                                 .arg(QString::fromStdString(m_root), rescanReason);
            m_sink(RescanRequired{rescanReason.toStdString(), 0});
            return;
        }
        if (!changed.empty()) {
            m_sink(PathsChanged{std::move(changed), 0});
        }
    }
}
