#include <QtTest>

#include "utils/pathutils.h"

class TestPathUtils : public QObject
{
    Q_OBJECT

private slots:
    void testNormalize_data()
    {
        QTest::addColumn<QString>("input");
        QTest::addColumn<QString>("expected");

        QTest::newRow("empty") << "" << "/";
        QTest::newRow("root") << "/" << "/";
        QTest::newRow("trailing slash") << "/srv/site/" << "/srv/site";
        QTest::newRow("double slashes") << "/srv//site" << "/srv/site";
        QTest::newRow("dot segments") << "/srv/./site/../site/img" << "/srv/site/img";
    }

    void testNormalize()
    {
        QFETCH(QString, input);
        QFETCH(QString, expected);
        QCOMPARE(PathUtils::normalize(input), expected);
    }

    void testJoin()
    {
        QCOMPARE(PathUtils::join("/srv/site", "index.html"), QString("/srv/site/index.html"));
        QCOMPARE(PathUtils::join("/srv/site/", "/index.html"), QString("/srv/site/index.html"));
        QCOMPARE(PathUtils::join("/", "pub"), QString("/pub"));
        QCOMPARE(PathUtils::join("/srv", QString()), QString("/srv"));
    }

    void testFileNameAndParent()
    {
        QCOMPARE(PathUtils::fileName("/srv/site/index.html"), QString("index.html"));
        QCOMPARE(PathUtils::fileName("/"), QString());
        QCOMPARE(PathUtils::parentPath("/srv/site"), QString("/srv"));
        QCOMPARE(PathUtils::parentPath("/srv"), QString("/"));
        QCOMPARE(PathUtils::parentPath("/"), QString("/"));
    }

    void testAncestry()
    {
        QVERIFY(PathUtils::isWithin("/srv/site", "/srv/site"));
        QVERIFY(PathUtils::isWithin("/srv/site", "/srv/site/assets/img"));
        QVERIFY(!PathUtils::isWithin("/srv/site", "/srv/sitemap"));
        QVERIFY(PathUtils::isWithin("/", "/anything"));

        QVERIFY(PathUtils::isAncestor("/srv", "/srv/site"));
        QVERIFY(PathUtils::isAncestor("/", "/srv/site"));
        QVERIFY(!PathUtils::isAncestor("/srv/site", "/srv/site"));
        QVERIFY(!PathUtils::isAncestor("/srv/si", "/srv/site"));
    }

    void testRelativeTo()
    {
        QCOMPARE(PathUtils::relativeTo("/srv/site", "/srv/site/assets/img"), QString("assets/img"));
        QCOMPARE(PathUtils::relativeTo("/srv/site", "/srv/site"), QString());
        QCOMPARE(PathUtils::relativeTo("/srv/site", "/etc"), QString());
        QCOMPARE(PathUtils::relativeTo("/", "/pub/a"), QString("pub/a"));
    }

    void testUniqueName()
    {
        QCOMPARE(PathUtils::uniqueName("photo.jpg", {"photo.jpg"}), QString("photo (1).jpg"));
        QCOMPARE(PathUtils::uniqueName("photo.jpg", {"photo.jpg", "photo (1).jpg"}),
                 QString("photo (2).jpg"));
        QCOMPARE(PathUtils::uniqueName("README", {"README"}), QString("README (1)"));
        QCOMPARE(PathUtils::uniqueName(".bashrc", {".bashrc"}), QString(".bashrc (1)"));
        QCOMPARE(PathUtils::uniqueName("archive.tar.gz", {}), QString("archive.tar (1).gz"));
    }
};

QTEST_GUILESS_MAIN(TestPathUtils)
#include "test_pathutils.moc"
