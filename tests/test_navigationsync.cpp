#include <QtTest>

#include "services/navigationsyncengine.h"

class TestNavigationSync : public QObject
{
    Q_OBJECT

private slots:
    void testDisabledDoesNothing()
    {
        NavigationSyncEngine engine;
        QVERIFY(!engine.isEnabled());
        QCOMPARE(engine.mirror(Panel::Remote, "/srv/site").kind, MirrorResult::Kind::NotSynced);
        QVERIFY(engine.isNavigationAllowed(Panel::Remote, "/"));
    }

    void testMirrorsBothWays()
    {
        NavigationSyncEngine engine;
        engine.enable("/srv/site/", "/home/u/site");

        MirrorResult result = engine.mirror(Panel::Remote, "/srv/site/assets/img");
        QCOMPARE(result.kind, MirrorResult::Kind::Mirror);
        QCOMPARE(result.targetPath, QString("/home/u/site/assets/img"));

        result = engine.mirror(Panel::Local, "/home/u/site/docs");
        QCOMPARE(result.kind, MirrorResult::Kind::Mirror);
        QCOMPARE(result.targetPath, QString("/srv/site/docs"));

        result = engine.mirror(Panel::Local, "/home/u/site");
        QCOMPARE(result.kind, MirrorResult::Kind::Mirror);
        QCOMPARE(result.targetPath, QString("/srv/site"));
    }

    void testAncestorOfBaseBlocked()
    {
        NavigationSyncEngine engine;
        engine.enable("/srv/site", "/home/u/site");

        QVERIFY(!engine.isNavigationAllowed(Panel::Remote, "/srv"));
        QVERIFY(!engine.isNavigationAllowed(Panel::Remote, "/"));
        QVERIFY(!engine.isNavigationAllowed(Panel::Local, "/home/u"));
        QVERIFY(engine.isNavigationAllowed(Panel::Remote, "/srv/site"));
        QVERIFY(engine.isNavigationAllowed(Panel::Remote, "/srv/other"));

        QCOMPARE(engine.mirror(Panel::Remote, "/srv").kind, MirrorResult::Kind::Blocked);
    }

    void testSiblingIsOutside()
    {
        NavigationSyncEngine engine;
        engine.enable("/srv/site", "/home/u/site");

        const MirrorResult result = engine.mirror(Panel::Remote, "/srv/sitemap");
        QCOMPARE(result.kind, MirrorResult::Kind::Outside);
        QVERIFY(result.targetPath.isEmpty());
    }

    void testRootBase()
    {
        NavigationSyncEngine engine;
        engine.enable("/", "/home/u/mirror");

        const MirrorResult result = engine.mirror(Panel::Remote, "/pub/releases");
        QCOMPARE(result.kind, MirrorResult::Kind::Mirror);
        QCOMPARE(result.targetPath, QString("/home/u/mirror/pub/releases"));
    }

    void testStateRoundTrip()
    {
        NavigationSyncEngine engine;
        engine.enable("/srv/site", "/home/u/site");
        const SyncState saved = engine.state();

        engine.disable();
        QVERIFY(!engine.isEnabled());
        QVERIFY(engine.state().remoteBase.isEmpty());

        engine.restore(saved);
        QVERIFY(engine.isEnabled());
        QCOMPARE(engine.state(), saved);
    }
};

QTEST_GUILESS_MAIN(TestNavigationSync)
#include "test_navigationsync.moc"
