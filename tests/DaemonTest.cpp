// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <gtest/gtest.h>

#include <QSettings>
#include <QSignalSpy>
#include <QStringList>
#include <QVariantList>
#include <QtDBus/QDBusVariant>

#include <chrono>
#include <limits>

#include "TempTree.h"
#include "../Version.h"
#include "../fsindexd/DaemonSettings.h"
#include "../fsindexd/DbusConversions.h"
#include "../fsindexd/IndexService.h"
#include "../query/QueryError.h"

using namespace FsIndex;
using FsIndex::Test::TempTreeTest;
using namespace std::chrono_literals;

TEST(DbusConversionsTest, Options_OverrideDefaults) {
    SearchRequest defaults;
    defaults.maxResults = 50;
    defaults.includeHidden = true;

    QVariantMap options;
    options.insert(QStringLiteral("kind"), QStringLiteral("directories"));
    options.insert(QStringLiteral("maxDepth"), QVariant::fromValue(QDBusVariant(QVariant(3))));
    options.insert(QStringLiteral("caseSensitive"), true);
    options.insert(QStringLiteral("searchVersion"), quint64(9));
    options.insert(QStringLiteral("somethingElse"), 1);

    const SearchCall call = searchCallFromOptions(QStringLiteral("ext:rs"), options, defaults);
    EXPECT_EQ(call.request.query, "ext:rs");
    EXPECT_EQ(call.request.kind, KindFilter::Directories);
    EXPECT_EQ(call.request.maxDepth, 3u);
    EXPECT_TRUE(call.request.caseSensitive);
    EXPECT_TRUE(call.request.includeHidden);
    EXPECT_EQ(call.request.maxResults, 50u);
    EXPECT_EQ(call.searchVersion, std::optional<quint64>(9));
}

TEST(DbusConversionsTest, UnknownKind_Throws) {
    QVariantMap options;
    options.insert(QStringLiteral("kind"), QStringLiteral("sockets"));
    EXPECT_THROW((void)searchCallFromOptions(QString(), options, SearchRequest{}), QueryParseError);
}

TEST(DbusConversionsTest, StatusMap_OmitsUnsetOptionals) {
    IndexStatus status;
    status.state = IndexState::Ready;
    status.root = "/data";
    status.ignoredPaths = {"/data/cache"};
    status.indexedEntries = 12;
    status.finishedAt = 1700000000000;
    status.lastEventId = 77;

    const QVariantMap m = statusToVariantMap(status);
    EXPECT_EQ(m.value(QStringLiteral("state")).toString(), QStringLiteral("ready"));
    EXPECT_EQ(m.value(QStringLiteral("root")).toString(), QStringLiteral("/data"));
    EXPECT_EQ(m.value(QStringLiteral("ignoredPaths")).toStringList(), QStringList{QStringLiteral("/data/cache")});
    EXPECT_EQ(m.value(QStringLiteral("indexedEntries")).toULongLong(), 12u);
    EXPECT_EQ(m.value(QStringLiteral("finishedAt")).toLongLong(), 1700000000000);
    EXPECT_EQ(m.value(QStringLiteral("lastEventId")).toULongLong(), 77u);
    EXPECT_FALSE(m.contains(QStringLiteral("startedAt")));
    EXPECT_FALSE(m.contains(QStringLiteral("lastError")));
}

TEST(DbusConversionsTest, ResultMap_CarriesEntriesAndIndexFields) {
    SearchResult result;
    result.query = "main";
    result.root = "/src";
    result.count = 1;
    result.scanned = 40;
    result.highlightTerms = {"main"};
    result.indexState = IndexState::Building;

    FileEntry entry;
    entry.path = "/src/main.rs";
    entry.name = "main.rs";
    entry.type = FileType::File;
    entry.size = 10240;
    result.entries.push_back(entry);

    const QVariantMap m = searchResultToVariantMap(result);
    EXPECT_EQ(m.value(QStringLiteral("count")).toULongLong(), 1u);
    EXPECT_EQ(m.value(QStringLiteral("scanned")).toULongLong(), 40u);
    EXPECT_EQ(m.value(QStringLiteral("indexState")).toString(), QStringLiteral("building"));
    EXPECT_EQ(m.value(QStringLiteral("highlightTerms")).toStringList(), QStringList{QStringLiteral("main")});

    const QVariantList entries = m.value(QStringLiteral("entries")).toList();
    ASSERT_EQ(entries.size(), 1);
    const QVariantMap row = entries.front().toMap();
    EXPECT_EQ(row.value(QStringLiteral("path")).toString(), QStringLiteral("/src/main.rs"));
    EXPECT_EQ(row.value(QStringLiteral("type")).toString(), QStringLiteral("file"));
    EXPECT_EQ(row.value(QStringLiteral("size")).toULongLong(), 10240u);
    EXPECT_FALSE(row.contains(QStringLiteral("modifiedAt")));
    EXPECT_FALSE(row.contains(QStringLiteral("icon")));
}

class DaemonSettingsTest : public TempTreeTest {};

TEST_F(DaemonSettingsTest, MissingKeys_UseDefaults) {
    QSettings s(path("fsindexd.ini"), QSettings::IniFormat);
    const DaemonSettings settings = DaemonSettings::load(s);

    EXPECT_FALSE(settings.root.isEmpty());
    EXPECT_TRUE(settings.ignoredPaths.isEmpty());
    EXPECT_EQ(settings.searchDefaults.maxResults, 200u);
    EXPECT_EQ(settings.searchDefaults.maxDepth, std::numeric_limits<std::size_t>::max());
    EXPECT_FALSE(settings.searchDefaults.includeHidden);
    EXPECT_FALSE(settings.searchDefaults.caseSensitive);
    EXPECT_EQ(settings.lastEventId, 0u);
    EXPECT_EQ(settings.pendingCoalesceThreshold, 4096u);
    EXPECT_EQ(settings.filePath, QString::fromStdString(path("fsindexd.ini")));
}

TEST_F(DaemonSettingsTest, ReadsEveryGroup) {
    {
        QSettings s(path("fsindexd.ini"), QSettings::IniFormat);
        s.setValue(QStringLiteral("index/root"), QStringLiteral("/srv/data/"));
        s.setValue(QStringLiteral("index/ignoredPaths"), QStringList{QStringLiteral("/srv/data/tmp")});
        s.setValue(QStringLiteral("search/maxResults"), 25);
        s.setValue(QStringLiteral("search/maxDepth"), 4);
        s.setValue(QStringLiteral("search/includeHidden"), true);
        s.setValue(QStringLiteral("watcher/pendingCoalesceThreshold"), 0);
        s.sync();
    }

    QSettings s(path("fsindexd.ini"), QSettings::IniFormat);
    const DaemonSettings settings = DaemonSettings::load(s);
    EXPECT_EQ(settings.root, QStringLiteral("/srv/data"));
    EXPECT_EQ(settings.ignoredPaths, QStringList{QStringLiteral("/srv/data/tmp")});
    EXPECT_EQ(settings.searchDefaults.maxResults, 25u);
    EXPECT_EQ(settings.searchDefaults.maxDepth, 4u);
    EXPECT_TRUE(settings.searchDefaults.includeHidden);
    EXPECT_EQ(settings.pendingCoalesceThreshold, 4096u);
}

TEST_F(DaemonSettingsTest, LastEventId_Persists) {
    {
        QSettings s(path("fsindexd.ini"), QSettings::IniFormat);
        DaemonSettings::saveLastEventId(s, 123456789012ULL);
    }
    QSettings s(path("fsindexd.ini"), QSettings::IniFormat);
    EXPECT_EQ(DaemonSettings::load(s).lastEventId, 123456789012ULL);
}

class IndexServiceTest : public TempTreeTest {
protected:
    void SetUp() override {
        TempTreeTest::SetUp();
        writeFileOfSize("src/main.rs", 10 * 1024);
        writeFileOfSize("README.md", 2 * 1024);
        writeFile(".git/config", "x");

        IndexWorkerConfig config;
        config.root = rootPath();
        m_worker = std::make_unique<IndexWorker>(config);
        m_worker->start();
        ASSERT_TRUE(m_worker->waitUntilReady(10s));
    }

    void TearDown() override {
        m_worker.reset();
        TempTreeTest::TearDown();
    }

    std::unique_ptr<IndexWorker> m_worker;
};

TEST_F(IndexServiceTest, Ping_ReportsVersions) {
    IndexService service(*m_worker, SearchRequest{});
    QString version;
    quint32 api = 0;
    service.Ping(version, api);
    EXPECT_TRUE(version.startsWith(QStringLiteral("fsindexd ")));
    EXPECT_EQ(api, Version::API_VERSION);
}

TEST_F(IndexServiceTest, Search_ReturnsMapWithIndexState) {
    IndexService service(*m_worker, SearchRequest{});
    const QVariantMap reply = service.Search(QStringLiteral("ext:rs size:>5kb"), {});

    EXPECT_FALSE(reply.value(QStringLiteral("cancelled")).toBool());
    EXPECT_EQ(reply.value(QStringLiteral("count")).toULongLong(), 1u);
    EXPECT_EQ(reply.value(QStringLiteral("indexState")).toString(), QStringLiteral("ready"));
    EXPECT_TRUE(reply.contains(QStringLiteral("indexFinishedAt")));

    const QVariantList entries = reply.value(QStringLiteral("entries")).toList();
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries.front().toMap().value(QStringLiteral("path")).toString(),
              QString::fromStdString(path("src/main.rs")));
}

TEST_F(IndexServiceTest, Search_UsesConfiguredDefaults) {
    SearchRequest defaults;
    defaults.includeHidden = true;
    IndexService service(*m_worker, defaults);

    EXPECT_EQ(service.Search(QStringLiteral("config"), {}).value(QStringLiteral("count")).toULongLong(), 1u);

    QVariantMap options;
    options.insert(QStringLiteral("includeHidden"), false);
    EXPECT_EQ(service.Search(QStringLiteral("config"), options).value(QStringLiteral("count")).toULongLong(), 0u);
}

TEST_F(IndexServiceTest, InvalidQuery_GivesEmptyReply) {
    IndexService service(*m_worker, SearchRequest{});
    EXPECT_TRUE(service.Search(QStringLiteral("\"open"), {}).isEmpty());
    EXPECT_THROW((void)service.runSearch(searchCallFromOptions(QStringLiteral("(a"), {}, SearchRequest{})),
                 QueryParseError);
}

TEST_F(IndexServiceTest, StaleSearchVersion_IsCancelled) {
    IndexService service(*m_worker, SearchRequest{});
    const quint64 first = service.NextSearchVersion();
    const quint64 second = service.NextSearchVersion();
    EXPECT_GT(second, first);

    QVariantMap options;
    options.insert(QStringLiteral("searchVersion"), first);
    const QVariantMap stale = service.Search(QStringLiteral("main"), options);
    EXPECT_TRUE(stale.value(QStringLiteral("cancelled")).toBool());
    EXPECT_FALSE(stale.contains(QStringLiteral("entries")));

    options.insert(QStringLiteral("searchVersion"), second);
    const QVariantMap current = service.Search(QStringLiteral("main"), options);
    EXPECT_FALSE(current.value(QStringLiteral("cancelled")).toBool());
    EXPECT_EQ(current.value(QStringLiteral("count")).toULongLong(), 1u);
}

TEST_F(IndexServiceTest, Status_AndStateSignal) {
    IndexService service(*m_worker, SearchRequest{});
    const QVariantMap status = service.Status();
    EXPECT_EQ(status.value(QStringLiteral("state")).toString(), QStringLiteral("ready"));
    EXPECT_EQ(status.value(QStringLiteral("root")).toString(), QString::fromStdString(rootPath()));

    QSignalSpy spy(&service, &IndexService::IndexStateChanged);
    service.pollWorker();
    ASSERT_EQ(spy.count(), 1);
    EXPECT_EQ(spy.at(0).at(0).toString(), QStringLiteral("ready"));

    // Nothing changed since the last poll.
    service.pollWorker();
    EXPECT_EQ(spy.count(), 1);
}

TEST_F(IndexServiceTest, EventIdObserver_SeesAdvances) {
    IndexService service(*m_worker, SearchRequest{});
    quint64 observed = 0;
    service.setEventIdObserver([&observed](quint64 id) { observed = id; });

    m_worker->post(PathsChanged{{}, 500});
    ASSERT_TRUE(m_worker->sync());
    service.pollWorker();
    EXPECT_EQ(observed, 500u);
}

TEST_F(IndexServiceTest, Rescan_RebuildsIndex) {
    IndexService service(*m_worker, SearchRequest{});
    writeFile("docs/new.md", "x");

    (void)service.Rescan();
    ASSERT_TRUE(m_worker->sync());
    ASSERT_TRUE(m_worker->waitUntilReady(10s));

    EXPECT_EQ(service.Search(QStringLiteral("new.md"), {}).value(QStringLiteral("count")).toULongLong(), 1u);
    EXPECT_EQ(service.Status().value(QStringLiteral("rescanCount")).toULongLong(), 1u);
}
