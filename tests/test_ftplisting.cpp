/**
 * @file test_ftplisting.cpp
 * @brief Protocol-level tests for FtpTransportAdapter's reply parsing.
 *
 * These run without a server: they feed raw LIST data and 227 replies
 * through the static parsers.
 */

#include <QtTest>

#include "services/ftptransportadapter.h"

class TestFtpListing : public QObject
{
    Q_OBJECT

private slots:
    void testUnixListing()
    {
        const QByteArray data =
            "total 12\r\n"
            "drwxr-xr-x    2 deploy   www          4096 Mar 14 09:30 assets\r\n"
            "-rw-r--r--    1 deploy   www          1832 Jan  3  2023 index.html\r\n"
            "-rw-r--r--    1 deploy   www             0 Feb 29  2024 empty file.txt\r\n";

        const QList<RemoteEntry> entries =
            FtpTransportAdapter::parseDirectoryListing(data, QDate(2024, 6, 1));
        QCOMPARE(entries.size(), 3);

        QCOMPARE(entries[0].name, QString("assets"));
        QVERIFY(entries[0].isDirectory);
        QCOMPARE(entries[0].size, qint64(0));
        QCOMPARE(entries[0].permissions, QString("rwxr-xr-x"));
        QCOMPARE(entries[0].modified,
                 QDateTime(QDate(2024, 3, 14), QTime(9, 30), Qt::UTC));

        QCOMPARE(entries[1].name, QString("index.html"));
        QVERIFY(!entries[1].isDirectory);
        QCOMPARE(entries[1].size, qint64(1832));
        QCOMPARE(entries[1].modified.date(), QDate(2023, 1, 3));

        QCOMPARE(entries[2].name, QString("empty file.txt"));
        QCOMPARE(entries[2].modified.date(), QDate(2024, 2, 29));
    }

    void testDateWithoutYearInFutureIsLastYear()
    {
        const QByteArray data =
            "-rw-r--r-- 1 u g 10 Dec 24 18:00 gift.txt\n";

        const QList<RemoteEntry> entries =
            FtpTransportAdapter::parseDirectoryListing(data, QDate(2024, 6, 1));
        QCOMPARE(entries.size(), 1);
        QCOMPARE(entries[0].modified.date(), QDate(2023, 12, 24));
    }

    void testSymlinkNameStripped()
    {
        const QByteArray data =
            "lrwxrwxrwx 1 u g 11 May  2 10:00 current -> releases/42\n";

        const QList<RemoteEntry> entries =
            FtpTransportAdapter::parseDirectoryListing(data, QDate(2024, 6, 1));
        QCOMPARE(entries.size(), 1);
        QCOMPARE(entries[0].name, QString("current"));
        QVERIFY(!entries[0].isDirectory);
    }

    void testBareNamesAndDotEntries()
    {
        const QByteArray data = "readme.txt\r\n.\r\n..\r\n\r\nnotes\n";

        const QList<RemoteEntry> entries =
            FtpTransportAdapter::parseDirectoryListing(data, QDate(2024, 6, 1));
        QCOMPARE(entries.size(), 2);
        QCOMPARE(entries[0].name, QString("readme.txt"));
        QCOMPARE(entries[1].name, QString("notes"));
        QVERIFY(!entries[0].modified.isValid());
    }

    void testPassiveResponse()
    {
        QString host;
        quint16 port = 0;

        QVERIFY(FtpTransportAdapter::parsePassiveResponse(
            "Entering Passive Mode (192,168,1,64,195,80).", &host, &port));
        QCOMPARE(host, QString("192.168.1.64"));
        QCOMPARE(port, quint16(195 * 256 + 80));

        QVERIFY(!FtpTransportAdapter::parsePassiveResponse("Entering Passive Mode", &host, &port));
    }
};

QTEST_GUILESS_MAIN(TestFtpListing)
#include "test_ftplisting.moc"
