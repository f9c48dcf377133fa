/**
 * @file test_sessionmanager.cpp
 * @brief Unit tests for SessionManager.
 *
 * Each session gets a fresh MockTransportAdapter from the factory. Listings
 * depend on the FTP host so the tests can tell sessions apart by what the
 * remote panel shows.
 */

#include <QtTest/QtTest>
#include <QPointer>
#include <QSet>
#include <QSignalSpy>

#include "mocks/mocktransportadapter.h"
#include "models/transferqueue.h"
#include "services/batchrunner.h"
#include "services/circuitbreaker.h"
#include "services/foldermergenegotiator.h"
#include "services/overwritenegotiator.h"
#include "services/sessionmanager.h"

class TestSessionManager : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testCreateSessionConnectsAndRefreshes();
    void testInvalidParamsRejected();
    void testConnectFailureRemovesSession();
    void testSwitchShowsCachedStateImmediately();
    void testSwitchPreservesOutgoingSession();
    void testReconnectFailureDowngradesToCached();
    void testRapidSwitchesKeepLatest();
    void testSwitchBlockedWhileBatchRuns();
    void testCloseActiveSwitchesToRemaining();
    void testDisconnectAll();

private:
    [[nodiscard]] static ConnectionParams ftp(const QString &host);
    [[nodiscard]] static RemoteEntry entry(const QString &name);
    QString openSession(const QString &host);
    [[nodiscard]] QStringList remoteNames() const;

    PanelNavigator *navigator_ = nullptr;
    SessionManager *manager_ = nullptr;
    QList<QPointer<MockTransportAdapter>> created_;
    QSet<QString> failingHosts_;
};

void TestSessionManager::init()
{
    created_.clear();
    failingHosts_.clear();
    navigator_ = new PanelNavigator(this);

    auto factory = [this](const ConnectionParams &params) -> ITransportAdapter * {
        const QString host = std::get<FtpParams>(params).host;
        auto *mock = new MockTransportAdapter;
        mock->mockSetAutoProcess(true);
        mock->mockSetDirectoryListing("/", {entry(host + "-root.txt")});
        mock->mockSetDirectoryListing("/pub", {entry(host + "-pub.txt")});
        if (failingHosts_.contains(host)) {
            mock->mockSetOpenResult(false, "Connection refused");
        }
        created_.append(mock);
        return mock;
    };
    manager_ = new SessionManager(navigator_, factory, this);
}

void TestSessionManager::cleanup()
{
    delete manager_;
    delete navigator_;
    manager_ = nullptr;
    navigator_ = nullptr;
}

ConnectionParams TestSessionManager::ftp(const QString &host)
{
    FtpParams params;
    params.host = host;
    params.user = "deploy";
    return params;
}

RemoteEntry TestSessionManager::entry(const QString &name)
{
    RemoteEntry e;
    e.name = name;
    return e;
}

QString TestSessionManager::openSession(const QString &host)
{
    QSignalSpy refreshedSpy(manager_, &SessionManager::sessionRefreshed);
    const QString id = manager_->createSession(QString(), ftp(host));
    if (!id.isEmpty()) {
        refreshedSpy.wait(1000);
    }
    return id;
}

QStringList TestSessionManager::remoteNames() const
{
    QStringList names;
    for (const RemoteEntry &e : navigator_->remoteListing()) {
        names.append(e.name);
    }
    return names;
}

void TestSessionManager::testCreateSessionConnectsAndRefreshes()
{
    QSignalSpy addedSpy(manager_, &SessionManager::sessionAdded);

    const QString id = openSession("a.example");
    QCOMPARE(id, QString("session-1"));
    QCOMPARE(addedSpy.count(), 1);
    QCOMPARE(manager_->activeSessionId(), id);

    const Session session = manager_->session(id);
    QCOMPARE(session.status, Session::Status::Connected);
    QCOMPARE(session.serverLabel, QString("deploy@a.example"));
    QCOMPARE(session.panels.remoteListing.size(), 1);
    QVERIFY(manager_->isActiveConnected());
    QCOMPARE(remoteNames(), QStringList({"a.example-root.txt"}));
    QCOMPARE(manager_->activeAdapter(), static_cast<ITransportAdapter *>(created_.last().data()));
}

void TestSessionManager::testInvalidParamsRejected()
{
    QSignalSpy failedSpy(manager_, &SessionManager::sessionConnectFailed);

    QVERIFY(manager_->createSession("empty", ftp(QString())).isEmpty());
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(failedSpy.at(0).at(1).toString(), QString("No host configured"));
    QVERIFY(manager_->sessions().isEmpty());
    QVERIFY(created_.isEmpty());
}

void TestSessionManager::testConnectFailureRemovesSession()
{
    QSignalSpy failedSpy(manager_, &SessionManager::sessionConnectFailed);
    QSignalSpy removedSpy(manager_, &SessionManager::sessionRemoved);
    failingHosts_.insert("down.example");

    const QString id = manager_->createSession(QString(), ftp("down.example"));
    QVERIFY(!id.isEmpty());
    QTRY_COMPARE(failedSpy.count(), 1);

    QCOMPARE(failedSpy.at(0).at(0).toString(), id);
    QCOMPARE(failedSpy.at(0).at(1).toString(), QString("Connection refused"));
    QCOMPARE(removedSpy.count(), 1);
    QVERIFY(!manager_->contains(id));
    QVERIFY(manager_->activeSessionId().isEmpty());
    QVERIFY(!manager_->activeAdapter());
}

void TestSessionManager::testSwitchShowsCachedStateImmediately()
{
    const QString a = openSession("a.example");
    QVERIFY(navigator_->navigateRemote("/pub"));
    QTRY_COMPARE(navigator_->remotePath(), QString("/pub"));

    const QString b = openSession("b.example");
    QCOMPARE(remoteNames(), QStringList({"b.example-root.txt"}));
    QCOMPARE(manager_->session(a).status, Session::Status::Cached);

    QSignalSpy refreshedSpy(manager_, &SessionManager::sessionRefreshed);
    QVERIFY(manager_->switchTo(a));

    // Phase 1 ran synchronously
    QCOMPARE(manager_->activeSessionId(), a);
    QCOMPARE(navigator_->remotePath(), QString("/pub"));
    QCOMPARE(remoteNames(), QStringList({"a.example-pub.txt"}));
    QCOMPARE(manager_->session(a).status, Session::Status::Connecting);

    // Phase 2 reconnects and refreshes the same directory
    QTRY_COMPARE(refreshedSpy.count(), 1);
    QCOMPARE(refreshedSpy.at(0).at(0).toString(), a);
    QCOMPARE(manager_->session(a).status, Session::Status::Connected);
    QCOMPARE(created_.last()->mockGetListRequests(), QStringList({"/pub"}));
    QCOMPARE(created_.size(), 3);
    Q_UNUSED(b)
}

void TestSessionManager::testSwitchPreservesOutgoingSession()
{
    const QString a = openSession("a.example");
    QVERIFY(navigator_->enableSync());
    const SyncState syncA = navigator_->syncState();

    const QString b = openSession("b.example");
    // New sessions start without sync
    QVERIFY(!navigator_->isSyncEnabled());

    const Session cachedA = manager_->session(a);
    QCOMPARE(cachedA.status, Session::Status::Cached);
    QCOMPARE(cachedA.panels.remotePath, QString("/"));
    QCOMPARE(cachedA.panels.remoteListing.first().name, QString("a.example-root.txt"));
    QCOMPARE(cachedA.panels.sync, syncA);

    QVERIFY(manager_->switchTo(a));
    QVERIFY(navigator_->isSyncEnabled());
    QCOMPARE(navigator_->syncState(), syncA);
    QCOMPARE(manager_->session(b).status, Session::Status::Cached);
    QCOMPARE(manager_->session(b).panels.remoteListing.first().name,
             QString("b.example-root.txt"));
}

void TestSessionManager::testReconnectFailureDowngradesToCached()
{
    const QString a = openSession("a.example");
    const QString b = openSession("b.example");
    failingHosts_.insert("a.example");

    QSignalSpy failedSpy(manager_, &SessionManager::sessionReconnectFailed);
    QVERIFY(manager_->switchTo(a));
    QTRY_COMPARE(failedSpy.count(), 1);

    QCOMPARE(failedSpy.at(0).at(0).toString(), a);
    QVERIFY(manager_->contains(a));
    QCOMPARE(manager_->activeSessionId(), a);
    QCOMPARE(manager_->session(a).status, Session::Status::Cached);
    QVERIFY(!manager_->isActiveConnected());
    // The cached listing stays visible
    QCOMPARE(remoteNames(), QStringList({"a.example-root.txt"}));
    Q_UNUSED(b)
}

void TestSessionManager::testRapidSwitchesKeepLatest()
{
    const QString a = openSession("a.example");
    const QString b = openSession("b.example");
    const QString c = openSession("c.example");

    QSignalSpy refreshedSpy(manager_, &SessionManager::sessionRefreshed);
    QVERIFY(manager_->switchTo(a));
    QVERIFY(manager_->switchTo(b));

    QTRY_COMPARE(refreshedSpy.count(), 1);
    QTest::qWait(20);
    QCOMPARE(refreshedSpy.count(), 1);
    QCOMPARE(refreshedSpy.at(0).at(0).toString(), b);
    QCOMPARE(manager_->activeSessionId(), b);
    QCOMPARE(remoteNames(), QStringList({"b.example-root.txt"}));
    QCOMPARE(manager_->session(a).status, Session::Status::Cached);
    QCOMPARE(manager_->session(c).status, Session::Status::Cached);
    QCOMPARE(manager_->session(b).status, Session::Status::Connected);
}

void TestSessionManager::testSwitchBlockedWhileBatchRuns()
{
    TransferQueue queue;
    CircuitBreaker breaker;
    OverwriteNegotiator overwrite;
    FolderMergeNegotiator folders;
    BatchRunner runner(&queue, &breaker, &overwrite, &folders);
    manager_->setBatchRunner(&runner);

    const QString a = openSession("a.example");
    const QString b = openSession("b.example");
    QCOMPARE(runner.transportAdapter(), manager_->activeAdapter());

    // A conflict prompt keeps the batch open
    QSignalSpy promptSpy(&overwrite, &OverwriteNegotiator::overwriteDecisionNeeded);
    BatchRequest request;
    request.destinationDirectory = "/";
    TransferRequest item;
    item.name = "b.example-root.txt";
    item.sourcePath = "/tmp/b.example-root.txt";
    request.items.append(item);
    request.destinationEntries = navigator_->remoteListing();
    QVERIFY(runner.startBatch(request) > 0);
    QTRY_COMPARE(promptSpy.count(), 1);

    QSignalSpy blockedSpy(manager_, &SessionManager::switchBlocked);
    QVERIFY(!manager_->switchTo(a));
    QCOMPARE(blockedSpy.count(), 1);
    QCOMPARE(manager_->activeSessionId(), b);
    QVERIFY(manager_->createSession(QString(), ftp("c.example")).isEmpty());
    QVERIFY(!manager_->closeSession(b));

    // Closing a background session is still fine
    QVERIFY(manager_->closeSession(a));

    runner.requestHardCancel();
    QVERIFY(!runner.isRunning());
    QVERIFY(manager_->switchTo(b));

    manager_->setBatchRunner(nullptr);
}

void TestSessionManager::testCloseActiveSwitchesToRemaining()
{
    const QString a = openSession("a.example");
    const QString b = openSession("b.example");

    QSignalSpy activeSpy(manager_, &SessionManager::activeSessionChanged);
    QVERIFY(manager_->closeSession(b));

    QVERIFY(!manager_->contains(b));
    QCOMPARE(manager_->activeSessionId(), a);
    QCOMPARE(activeSpy.last().at(0).toString(), a);
    QCOMPARE(remoteNames(), QStringList({"a.example-root.txt"}));
    QTRY_COMPARE(manager_->session(a).status, Session::Status::Connected);

    QVERIFY(!manager_->closeSession("session-99"));
}

void TestSessionManager::testDisconnectAll()
{
    openSession("a.example");
    openSession("b.example");
    QPointer<MockTransportAdapter> active = created_.last();

    QSignalSpy removedSpy(manager_, &SessionManager::sessionRemoved);
    manager_->disconnectAll();

    QCOMPARE(removedSpy.count(), 2);
    QVERIFY(manager_->sessions().isEmpty());
    QVERIFY(manager_->activeSessionId().isEmpty());
    QVERIFY(!manager_->activeAdapter());
    QVERIFY(!active || active->mockDisconnectCount() == 1);
}

QTEST_GUILESS_MAIN(TestSessionManager)
#include "test_sessionmanager.moc"
