/**
 * @file test_localtransportadapter.cpp
 * @brief Tests for LocalTransportAdapter against a temporary directory tree.
 */

#include <QtTest/QtTest>
#include <QDir>
#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "services/localtransportadapter.h"

class TestLocalTransportAdapter : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testOpenMissingRootFails();
    void testOpenWrongProtocolFails();
    void testListing();
    void testResolveStaysInsideRoot();
    void testUploadAndDownloadFile();
    void testMissingSourceFails();
    void testFolderMergeOverwrite();
    void testFolderMergeSkipExisting();
    void testFolderReplace();
    void testMakeDirectory();
    void testNotConnected();

private:
    void openAdapter();
    static void writeFile(const QString &path, const QByteArray &content);
    static QByteArray readFile(const QString &path);
    [[nodiscard]] TransferOutcome waitForOutcome();

    QTemporaryDir *local_ = nullptr;
    QTemporaryDir *endpoint_ = nullptr;
    LocalTransportAdapter *adapter_ = nullptr;
};

void TestLocalTransportAdapter::init()
{
    local_ = new QTemporaryDir;
    endpoint_ = new QTemporaryDir;
    QVERIFY(local_->isValid());
    QVERIFY(endpoint_->isValid());
    adapter_ = new LocalTransportAdapter(this);
}

void TestLocalTransportAdapter::cleanup()
{
    delete adapter_;
    delete endpoint_;
    delete local_;
    adapter_ = nullptr;
    endpoint_ = nullptr;
    local_ = nullptr;
}

void TestLocalTransportAdapter::openAdapter()
{
    QSignalSpy openSpy(adapter_, &ITransportAdapter::openFinished);
    LocalMountParams params;
    params.rootPath = endpoint_->path();
    adapter_->open(params);
    QVERIFY(openSpy.wait(1000));
    QVERIFY(openSpy.at(0).at(0).toBool());
    QVERIFY(adapter_->isConnected());
}

void TestLocalTransportAdapter::writeFile(const QString &path, const QByteArray &content)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(content);
}

QByteArray TestLocalTransportAdapter::readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

TransferOutcome TestLocalTransportAdapter::waitForOutcome()
{
    QSignalSpy finishedSpy(adapter_, &ITransportAdapter::transferFinished);
    if (!finishedSpy.wait(2000)) {
        return TransferOutcome();
    }
    return finishedSpy.at(0).at(0).value<TransferOutcome>();
}

void TestLocalTransportAdapter::testOpenMissingRootFails()
{
    QSignalSpy openSpy(adapter_, &ITransportAdapter::openFinished);
    LocalMountParams params;
    params.rootPath = endpoint_->path() + "/missing";
    adapter_->open(params);

    QVERIFY(openSpy.wait(1000));
    QVERIFY(!openSpy.at(0).at(0).toBool());
    QVERIFY(openSpy.at(0).at(1).toString().startsWith("No such file or directory"));
    QVERIFY(!adapter_->isConnected());
}

void TestLocalTransportAdapter::testOpenWrongProtocolFails()
{
    QSignalSpy openSpy(adapter_, &ITransportAdapter::openFinished);
    FtpParams params;
    params.host = "example.com";
    adapter_->open(params);

    QVERIFY(openSpy.wait(1000));
    QVERIFY(!openSpy.at(0).at(0).toBool());
    QCOMPARE(openSpy.at(0).at(1).toString(), QString("Local adapter cannot open ftp endpoints"));
}

void TestLocalTransportAdapter::testListing()
{
    openAdapter();
    writeFile(endpoint_->filePath("site/index.html"), "<html/>");
    QVERIFY(QDir().mkpath(endpoint_->filePath("site/assets")));

    QSignalSpy listedSpy(adapter_, &ITransportAdapter::directoryListed);
    adapter_->changeDirectory(7, "/site/");
    QVERIFY(listedSpy.wait(1000));

    QCOMPARE(listedSpy.at(0).at(0).toULongLong(), quint64(7));
    const DirectoryListing listing = listedSpy.at(0).at(1).value<DirectoryListing>();
    QCOMPARE(listing.currentPath, QString("/site"));
    QCOMPARE(listing.entries.size(), 2);

    QSignalSpy failedSpy(adapter_, &ITransportAdapter::directoryFailed);
    adapter_->listDirectory(8, "/nowhere");
    QVERIFY(failedSpy.wait(1000));
    QCOMPARE(failedSpy.at(0).at(0).toULongLong(), quint64(8));
}

void TestLocalTransportAdapter::testResolveStaysInsideRoot()
{
    openAdapter();
    const QString root = QDir::cleanPath(endpoint_->path());

    QCOMPARE(adapter_->resolve("/"), root);
    QCOMPARE(adapter_->resolve("/a/b"), root + "/a/b");
    QCOMPARE(adapter_->resolve("a/./b/../c"), root + "/a/c");
    QVERIFY(adapter_->resolve("/../etc").isEmpty());
    QVERIFY(adapter_->resolve("/a/../../etc").isEmpty());
}

void TestLocalTransportAdapter::testUploadAndDownloadFile()
{
    openAdapter();
    const QString source = local_->filePath("report.txt");
    writeFile(source, "quarterly numbers");

    QSignalSpy progressSpy(adapter_, &ITransportAdapter::transferProgress);
    adapter_->uploadFile("t-1#1", source, "/report.txt");
    TransferOutcome outcome = waitForOutcome();
    QCOMPARE(outcome.transferId, QString("t-1#1"));
    QVERIFY2(outcome.success, qPrintable(outcome.message));
    QCOMPARE(readFile(endpoint_->filePath("report.txt")), QByteArray("quarterly numbers"));
    QCOMPARE(progressSpy.count(), 1);
    QCOMPARE(progressSpy.at(0).at(0).value<TransferProgress>().bytesDone, qint64(17));

    adapter_->downloadFile("t-2#1", "/report.txt", local_->filePath("copy.txt"));
    outcome = waitForOutcome();
    QVERIFY(outcome.success);
    QCOMPARE(readFile(local_->filePath("copy.txt")), QByteArray("quarterly numbers"));
}

void TestLocalTransportAdapter::testMissingSourceFails()
{
    openAdapter();

    adapter_->downloadFile("t-1#1", "/absent.bin", local_->filePath("absent.bin"));
    const TransferOutcome outcome = waitForOutcome();
    QVERIFY(!outcome.success);
    QVERIFY(outcome.message.startsWith("No such file or directory"));
    QCOMPARE(outcome.cause, ErrorCause::PathNotFound);

    // Words in the path do not change the diagnosis
    adapter_->downloadFile("t-3#1", "/auth/login.php", local_->filePath("login.php"));
    const TransferOutcome loginPage = waitForOutcome();
    QVERIFY(!loginPage.success);
    QCOMPARE(loginPage.cause, ErrorCause::PathNotFound);
    QCOMPARE(classifyTransferError(loginPage.message, loginPage.cause).kind, ErrorKind::Item);

    adapter_->uploadFile("t-2#1", local_->filePath("x"), "/../outside");
    const TransferOutcome outside = waitForOutcome();
    QVERIFY(!outside.success);
    QVERIFY(outside.message.startsWith("Permission denied"));
    QCOMPARE(outside.cause, ErrorCause::PermissionDenied);
}

void TestLocalTransportAdapter::testFolderMergeOverwrite()
{
    openAdapter();
    writeFile(local_->filePath("site/index.html"), "new index");
    writeFile(local_->filePath("site/css/main.css"), "body{}");
    QVERIFY(QDir().mkpath(local_->filePath("site/empty")));
    writeFile(endpoint_->filePath("site/index.html"), "old index");
    writeFile(endpoint_->filePath("site/keep.txt"), "untouched");

    QSignalSpy progressSpy(adapter_, &ITransportAdapter::transferProgress);
    adapter_->uploadFolder("t-1#1", local_->filePath("site"), "/site", MergePolicy::Overwrite);
    const TransferOutcome outcome = waitForOutcome();
    QVERIFY2(outcome.success, qPrintable(outcome.message));

    QCOMPARE(readFile(endpoint_->filePath("site/index.html")), QByteArray("new index"));
    QCOMPARE(readFile(endpoint_->filePath("site/css/main.css")), QByteArray("body{}"));
    QCOMPARE(readFile(endpoint_->filePath("site/keep.txt")), QByteArray("untouched"));
    QVERIFY(QDir(endpoint_->filePath("site/empty")).exists());

    const TransferProgress last = progressSpy.last().at(0).value<TransferProgress>();
    QCOMPARE(last.totalFiles, 2);
    QCOMPARE(last.transferredFiles, 2);
}

void TestLocalTransportAdapter::testFolderMergeSkipExisting()
{
    openAdapter();
    writeFile(local_->filePath("site/index.html"), "new index");
    writeFile(local_->filePath("site/about.html"), "about");
    writeFile(endpoint_->filePath("site/index.html"), "old index");

    adapter_->uploadFolder("t-1#1", local_->filePath("site"), "/site", MergePolicy::SkipExisting);
    QVERIFY(waitForOutcome().success);

    QCOMPARE(readFile(endpoint_->filePath("site/index.html")), QByteArray("old index"));
    QCOMPARE(readFile(endpoint_->filePath("site/about.html")), QByteArray("about"));
}

void TestLocalTransportAdapter::testFolderReplace()
{
    openAdapter();
    writeFile(endpoint_->filePath("site/stale.html"), "stale");
    writeFile(endpoint_->filePath("site/index.html"), "old index");
    writeFile(local_->filePath("site/index.html"), "new index");

    adapter_->downloadFolder("t-1#1", "/site", local_->filePath("mirror"), MergePolicy::Overwrite);
    QVERIFY(waitForOutcome().success);
    QCOMPARE(readFile(local_->filePath("mirror/stale.html")), QByteArray("stale"));

    adapter_->uploadFolder("t-2#1", local_->filePath("site"), "/site", MergePolicy::Replace);
    QVERIFY(waitForOutcome().success);

    QVERIFY(!QFile::exists(endpoint_->filePath("site/stale.html")));
    QCOMPARE(readFile(endpoint_->filePath("site/index.html")), QByteArray("new index"));
}

void TestLocalTransportAdapter::testMakeDirectory()
{
    openAdapter();
    QSignalSpy createdSpy(adapter_, &ITransportAdapter::directoryCreated);
    QSignalSpy failedSpy(adapter_, &ITransportAdapter::directoryFailed);

    adapter_->makeDirectory(3, "/drafts");
    QVERIFY(createdSpy.wait(1000));
    QCOMPARE(createdSpy.at(0).at(1).toString(), QString("/drafts"));
    QVERIFY(QDir(endpoint_->filePath("drafts")).exists());

    adapter_->makeDirectory(4, "/drafts");
    QVERIFY(failedSpy.wait(1000));
    QCOMPARE(failedSpy.at(0).at(0).toULongLong(), quint64(4));
}

void TestLocalTransportAdapter::testNotConnected()
{
    adapter_->uploadFile("t-1#1", local_->filePath("a"), "/a");
    const TransferOutcome outcome = waitForOutcome();
    QVERIFY(!outcome.success);
    QCOMPARE(outcome.message, QString("Not connected"));
    QCOMPARE(outcome.cause, ErrorCause::ConnectionLost);

    QSignalSpy reconnectSpy(adapter_, &ITransportAdapter::reconnectFinished);
    adapter_->reconnect();
    QVERIFY(reconnectSpy.wait(1000));
    QVERIFY(!reconnectSpy.at(0).at(0).toBool());
}

QTEST_GUILESS_MAIN(TestLocalTransportAdapter)
#include "test_localtransportadapter.moc"
