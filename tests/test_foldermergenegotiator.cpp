#include <QtTest>
#include <QSignalSpy>

#include "services/batchcontext.h"
#include "services/foldermergenegotiator.h"

class TestFolderMergeNegotiator : public QObject
{
    Q_OBJECT

private:
    static FolderMergeQuery folderQuery(const QString &name, bool destinationIsFolder = true)
    {
        FolderMergeQuery query;
        query.itemId = "transfer-1";
        query.folderName = name;
        query.remainingQueueCount = 2;
        RemoteEntry existing;
        existing.name = name;
        existing.isDirectory = destinationIsFolder;
        query.destination = existing;
        return query;
    }

private slots:
    void testNoDestinationMerges()
    {
        FolderMergeNegotiator negotiator;
        BatchContext context;
        QSignalSpy promptSpy(&negotiator, &FolderMergeNegotiator::folderMergeDecisionNeeded);
        QList<FolderMergeDecision> decisions;

        FolderMergeQuery query;
        query.folderName = "assets";
        negotiator.resolve(query, context, [&](const FolderMergeDecision &d) { decisions << d; });

        // A same-named file is not a folder conflict either
        negotiator.resolve(folderQuery("assets", false), context,
                           [&](const FolderMergeDecision &d) { decisions << d; });

        QCOMPARE(promptSpy.count(), 0);
        QCOMPARE(decisions.size(), 2);
        QCOMPARE(decisions.at(0).action, FolderMergeAction::MergeOverwrite);
        QCOMPARE(decisions.at(1).action, FolderMergeAction::MergeOverwrite);
    }

    void testExistingFolderPrompts()
    {
        FolderMergeNegotiator negotiator;
        BatchContext context;
        QSignalSpy promptSpy(&negotiator, &FolderMergeNegotiator::folderMergeDecisionNeeded);
        QList<FolderMergeDecision> decisions;

        negotiator.resolve(folderQuery("assets"), context,
                           [&](const FolderMergeDecision &d) { decisions << d; });
        QCOMPARE(promptSpy.count(), 1);
        QVERIFY(negotiator.isAwaitingDecision());
        QCOMPARE(negotiator.pendingQuery().folderName, QString("assets"));
        QVERIFY(decisions.isEmpty());

        QVERIFY(negotiator.respond(FolderMergeDecision{FolderMergeAction::Replace, false}));
        QCOMPARE(decisions.size(), 1);
        QCOMPARE(decisions.first().action, FolderMergeAction::Replace);
        QVERIFY(!negotiator.isAwaitingDecision());
        QVERIFY(!negotiator.respond(FolderMergeDecision{}));
    }

    void testApplyToAllRemembered()
    {
        FolderMergeNegotiator negotiator;
        BatchContext context;
        QSignalSpy promptSpy(&negotiator, &FolderMergeNegotiator::folderMergeDecisionNeeded);
        QList<FolderMergeDecision> decisions;
        auto record = [&](const FolderMergeDecision &d) { decisions << d; };

        negotiator.resolve(folderQuery("a"), context, record);
        QVERIFY(negotiator.respond(
            FolderMergeDecision{FolderMergeAction::MergeSkipExisting, true}));
        negotiator.resolve(folderQuery("b"), context, record);

        QCOMPARE(promptSpy.count(), 1);
        QCOMPARE(decisions.size(), 2);
        QCOMPARE(decisions.at(1).action, FolderMergeAction::MergeSkipExisting);
    }

    void testCancelNotRemembered()
    {
        FolderMergeNegotiator negotiator;
        BatchContext context;
        QList<FolderMergeDecision> decisions;

        negotiator.resolve(folderQuery("a"), context,
                           [&](const FolderMergeDecision &d) { decisions << d; });
        QVERIFY(negotiator.respond(FolderMergeDecision{FolderMergeAction::Cancel, true}));

        QCOMPARE(decisions.first().action, FolderMergeAction::Cancel);
        QVERIFY(!context.folderMergeForAll.has_value());
    }

    void testDefaultsAnswerWithoutPrompt()
    {
        FolderMergeNegotiator negotiator;
        BatchContext context;
        QSignalSpy promptSpy(&negotiator, &FolderMergeNegotiator::folderMergeDecisionNeeded);
        QList<FolderMergeDecision> decisions;
        auto record = [&](const FolderMergeDecision &d) { decisions << d; };

        negotiator.setDefaultAction(FolderExistsAction::Skip);
        negotiator.resolve(folderQuery("a"), context, record);
        negotiator.setDefaultAction(FolderExistsAction::Replace);
        negotiator.resolve(folderQuery("a"), context, record);
        negotiator.setDefaultAction(FolderExistsAction::MergeSkipExisting);
        negotiator.resolve(folderQuery("a"), context, record);

        QCOMPARE(promptSpy.count(), 0);
        QCOMPARE(decisions.size(), 3);
        QCOMPARE(decisions.at(0).action, FolderMergeAction::Skip);
        QCOMPARE(decisions.at(1).action, FolderMergeAction::Replace);
        QCOMPARE(decisions.at(2).action, FolderMergeAction::MergeSkipExisting);
    }

    void testCancelPendingResolvesAsCancel()
    {
        FolderMergeNegotiator negotiator;
        BatchContext context;
        QList<FolderMergeDecision> decisions;

        negotiator.resolve(folderQuery("a"), context,
                           [&](const FolderMergeDecision &d) { decisions << d; });
        negotiator.cancelPending();

        QCOMPARE(decisions.size(), 1);
        QCOMPARE(decisions.first().action, FolderMergeAction::Cancel);
        QVERIFY(!negotiator.isAwaitingDecision());
    }

    void testMergePolicies()
    {
        QCOMPARE(mergePolicyFor(FolderMergeAction::MergeOverwrite), MergePolicy::Overwrite);
        QCOMPARE(mergePolicyFor(FolderMergeAction::MergeSkipExisting), MergePolicy::SkipExisting);
        QCOMPARE(mergePolicyFor(FolderMergeAction::Replace), MergePolicy::Replace);
    }
};

QTEST_GUILESS_MAIN(TestFolderMergeNegotiator)
#include "test_foldermergenegotiator.moc"
