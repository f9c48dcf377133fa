/**
 * @file foldermergenegotiator.h
 * @brief Folder-level conflict resolution before a folder transfer begins.
 */

#ifndef FOLDERMERGENEGOTIATOR_H
#define FOLDERMERGENEGOTIATOR_H

#include <QObject>
#include <QStringList>

#include <functional>
#include <optional>

#include "itransportadapter.h"
#include "remoteentry.h"
#include "transfersettings.h"

struct BatchContext;

enum class FolderMergeAction { MergeOverwrite, MergeSkipExisting, Replace, Skip, Cancel };

[[nodiscard]] const char *folderMergeActionToString(FolderMergeAction action);

/// Merge policy the transport applies for a decision that transfers the folder.
[[nodiscard]] MergePolicy mergePolicyFor(FolderMergeAction action);

struct FolderMergeDecision {
    FolderMergeAction action = FolderMergeAction::MergeOverwrite;
    bool applyToAll = false;
};

struct FolderMergeQuery {
    QString itemId;
    QString folderName;
    bool sourceIsRemote = false;
    int remainingQueueCount = 0;
    std::optional<RemoteEntry> destination;
};

Q_DECLARE_METATYPE(FolderMergeQuery)

/**
 * @brief Decides how a folder transfer treats a same-named destination folder.
 *
 * Same protocol as OverwriteNegotiator, scoped to a whole folder.
 */
class FolderMergeNegotiator : public QObject
{
    Q_OBJECT

public:
    using DecisionCallback = std::function<void(const FolderMergeDecision &)>;

    explicit FolderMergeNegotiator(QObject *parent = nullptr);

    void setDefaultAction(FolderExistsAction action) { defaultAction_ = action; }
    [[nodiscard]] FolderExistsAction defaultAction() const { return defaultAction_; }

    void resolve(const FolderMergeQuery &query, BatchContext &context, DecisionCallback callback);
    bool respond(const FolderMergeDecision &decision);
    void cancelPending();

    [[nodiscard]] bool isAwaitingDecision() const { return static_cast<bool>(pendingCallback_); }
    [[nodiscard]] FolderMergeQuery pendingQuery() const { return pendingQuery_; }

signals:
    void folderMergeDecisionNeeded(const FolderMergeQuery &query);

private:
    FolderExistsAction defaultAction_ = FolderExistsAction::Ask;
    FolderMergeQuery pendingQuery_;
    BatchContext *pendingContext_ = nullptr;
    DecisionCallback pendingCallback_;
};

#endif // FOLDERMERGENEGOTIATOR_H
