/**
 * @file test_ftptransportadapter.cpp
 * @brief Unit tests for FtpTransportAdapter guards and control-line handling.
 *
 * Tests verify:
 * - Initial state
 * - Transfer and directory calls while not connected fail with the caller's id
 * - Cancelling with nothing in flight does nothing
 * - Endpoints the adapter cannot serve are refused
 * - Reconnect without a previous open fails
 * - Control replies are decoded one complete line at a time
 *
 * None of these reach the network.
 */

#include <QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "services/ftptransportadapter.h"

class TestFtpTransportAdapter : public QObject
{
    Q_OBJECT

private:
    FtpTransportAdapter *ftp = nullptr;
    QTemporaryDir *local = nullptr;

    TransferOutcome waitForOutcome(QSignalSpy &spy)
    {
        if (spy.isEmpty()) {
            spy.wait(1000);
        }
        if (spy.isEmpty()) {
            return TransferOutcome();
        }
        return spy.takeFirst().at(0).value<TransferOutcome>();
    }

    void verifyNotConnectedOutcome(const TransferOutcome &outcome, const QString &transferId)
    {
        QCOMPARE(outcome.transferId, transferId);
        QVERIFY(!outcome.success);
        QCOMPARE(outcome.message, QString("Not connected"));
        QCOMPARE(outcome.cause, ErrorCause::ConnectionLost);
    }

private slots:
    void init()
    {
        ftp = new FtpTransportAdapter(this);
        local = new QTemporaryDir;
        QVERIFY(local->isValid());
    }

    void cleanup()
    {
        delete ftp;
        ftp = nullptr;
        delete local;
        local = nullptr;
    }

    // === Initial state ===

    void testInitialState_Disconnected()
    {
        QCOMPARE(ftp->state(), FtpTransportAdapter::State::Disconnected);
        QVERIFY(!ftp->isConnected());
        QCOMPARE(ftp->currentDirectory(), QString("/"));
    }

    // === Transfers while not connected ===

    void testUploadFile_FailsWhenNotConnected()
    {
        QSignalSpy finishedSpy(ftp, &ITransportAdapter::transferFinished);

        ftp->uploadFile("item-1#1", local->filePath("a.txt"), "/srv/a.txt");

        // Reported on a later loop turn, never from inside the call
        QCOMPARE(finishedSpy.count(), 0);
        verifyNotConnectedOutcome(waitForOutcome(finishedSpy), "item-1#1");
        QCOMPARE(finishedSpy.count(), 0);
    }

    void testDownloadFile_FailsWhenNotConnected()
    {
        QSignalSpy finishedSpy(ftp, &ITransportAdapter::transferFinished);

        ftp->downloadFile("item-2#3", "/srv/login.php", local->filePath("login.php"));

        verifyNotConnectedOutcome(waitForOutcome(finishedSpy), "item-2#3");
        QVERIFY(!QFileInfo::exists(local->filePath("login.php")));
    }

    void testUploadFolder_FailsWhenNotConnected()
    {
        QSignalSpy finishedSpy(ftp, &ITransportAdapter::transferFinished);

        ftp->uploadFolder("item-3#1", local->path(), "/srv/site", MergePolicy::Replace);

        verifyNotConnectedOutcome(waitForOutcome(finishedSpy), "item-3#1");
    }

    void testDownloadFolder_FailsWhenNotConnected()
    {
        QSignalSpy finishedSpy(ftp, &ITransportAdapter::transferFinished);
        const QString target = local->filePath("site");

        ftp->downloadFolder("item-4#2", "/srv/site", target, MergePolicy::Overwrite);

        verifyNotConnectedOutcome(waitForOutcome(finishedSpy), "item-4#2");
        QVERIFY(!QFileInfo::exists(target));
    }

    void testSecondTransferSupersedesFirst()
    {
        QSignalSpy finishedSpy(ftp, &ITransportAdapter::transferFinished);

        ftp->uploadFile("item-5#1", local->filePath("a.txt"), "/srv/a.txt");
        ftp->uploadFile("item-6#1", local->filePath("b.txt"), "/srv/b.txt");

        verifyNotConnectedOutcome(waitForOutcome(finishedSpy), "item-6#1");
        QTest::qWait(20);
        QCOMPARE(finishedSpy.count(), 0);
    }

    // === Cancel ===

    void testCancelCurrentTransfer_WhenIdle_NoOp()
    {
        QSignalSpy finishedSpy(ftp, &ITransportAdapter::transferFinished);
        QSignalSpy progressSpy(ftp, &ITransportAdapter::transferProgress);
        QSignalSpy disconnectedSpy(ftp, &ITransportAdapter::disconnected);

        ftp->cancelCurrentTransfer();
        QTest::qWait(20);

        QCOMPARE(finishedSpy.count(), 0);
        QCOMPARE(progressSpy.count(), 0);
        QCOMPARE(disconnectedSpy.count(), 0);
        QCOMPARE(ftp->state(), FtpTransportAdapter::State::Disconnected);
    }

    void testCancelCurrentTransfer_DropsPendingFailure()
    {
        QSignalSpy finishedSpy(ftp, &ITransportAdapter::transferFinished);

        ftp->uploadFile("item-7#1", local->filePath("a.txt"), "/srv/a.txt");
        ftp->cancelCurrentTransfer();
        QTest::qWait(20);

        QCOMPARE(finishedSpy.count(), 0);
    }

    // === Open and reconnect ===

    void testOpen_SecureEndpointRefused()
    {
        QSignalSpy openSpy(ftp, &ITransportAdapter::openFinished);

        FtpParams params;
        params.host = "ftp.example.com";
        params.secure = true;
        ftp->open(params);

        QVERIFY(openSpy.wait(1000));
        QCOMPARE(openSpy.count(), 1);
        QVERIFY(!openSpy.at(0).at(0).toBool());
        QCOMPARE(openSpy.at(0).at(1).toString(),
                 QString("Explicit TLS is not supported by this client"));
        QCOMPARE(ftp->state(), FtpTransportAdapter::State::Disconnected);
        QVERIFY(!ftp->isConnected());
    }

    void testOpen_OtherProtocolRefused()
    {
        QSignalSpy openSpy(ftp, &ITransportAdapter::openFinished);

        SftpParams params;
        params.host = "sftp.example.com";
        ftp->open(params);

        QVERIFY(openSpy.wait(1000));
        QVERIFY(!openSpy.at(0).at(0).toBool());
        QCOMPARE(ftp->state(), FtpTransportAdapter::State::Disconnected);
    }

    void testReconnect_FailsWithoutPreviousOpen()
    {
        QSignalSpy reconnectSpy(ftp, &ITransportAdapter::reconnectFinished);

        ftp->reconnect();

        QVERIFY(reconnectSpy.wait(1000));
        QCOMPARE(reconnectSpy.count(), 1);
        QVERIFY(!reconnectSpy.at(0).at(0).toBool());
        QVERIFY(reconnectSpy.at(0).at(1).toString().startsWith("Not connected"));
        QCOMPARE(ftp->state(), FtpTransportAdapter::State::Disconnected);
    }

    void testReconnect_AfterRefusedSecureOpenStillFails()
    {
        QSignalSpy openSpy(ftp, &ITransportAdapter::openFinished);
        QSignalSpy reconnectSpy(ftp, &ITransportAdapter::reconnectFinished);

        FtpParams params;
        params.host = "ftp.example.com";
        params.secure = true;
        ftp->open(params);
        QVERIFY(openSpy.wait(1000));

        // The refused endpoint was never remembered
        ftp->reconnect();
        QVERIFY(reconnectSpy.wait(1000));
        QVERIFY(!reconnectSpy.at(0).at(0).toBool());
    }

    // === Directory requests while not connected ===

    void testDirectoryRequests_FailWhenNotConnected()
    {
        QSignalSpy failedSpy(ftp, &ITransportAdapter::directoryFailed);

        ftp->listDirectory(5, "/srv");
        ftp->changeDirectory(6, "/srv/site");
        ftp->makeDirectory(7, "/srv/new");

        QTRY_COMPARE(failedSpy.count(), 3);
        QCOMPARE(failedSpy.at(0).at(0).toULongLong(), quint64(5));
        QCOMPARE(failedSpy.at(1).at(0).toULongLong(), quint64(6));
        QCOMPARE(failedSpy.at(2).at(0).toULongLong(), quint64(7));
        QCOMPARE(failedSpy.at(2).at(1).toString(), QString("/srv/new"));
        QCOMPARE(failedSpy.at(0).at(2).toString(), QString("Not connected"));
    }

    // === Control line splitting ===

    void testTakeReplyLines_KeepsPartialLine()
    {
        QByteArray buffer("220 Ready\r\n331 Password required\r\n230 Lo");

        const QStringList lines = FtpTransportAdapter::takeReplyLines(&buffer);

        QCOMPARE(lines, QStringList({"220 Ready", "331 Password required"}));
        QCOMPARE(buffer, QByteArray("230 Lo"));
    }

    void testTakeReplyLines_MultibyteSplitAcrossReads()
    {
        // "é" is C3 A9; the first read ends between the two bytes
        QByteArray buffer("257 \"/srv/caf\xc3");
        QVERIFY(FtpTransportAdapter::takeReplyLines(&buffer).isEmpty());

        buffer.append("\xa9\" is the current directory\r\n");
        const QStringList lines = FtpTransportAdapter::takeReplyLines(&buffer);

        QCOMPARE(lines.size(), 1);
        QCOMPARE(lines.at(0), QString::fromUtf8("257 \"/srv/caf\xc3\xa9\" is the current directory"));
        QVERIFY(lines.at(0).contains(QChar(0x00E9)));
        QVERIFY(!lines.at(0).contains(QChar::ReplacementCharacter));
        QVERIFY(buffer.isEmpty());
    }

    void testTakeReplyLines_EmptyBuffer()
    {
        QByteArray buffer;
        QVERIFY(FtpTransportAdapter::takeReplyLines(&buffer).isEmpty());
        QVERIFY(buffer.isEmpty());
    }
};

QTEST_GUILESS_MAIN(TestFtpTransportAdapter)
#include "test_ftptransportadapter.moc"
