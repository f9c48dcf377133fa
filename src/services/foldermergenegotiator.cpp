#include "foldermergenegotiator.h"

#include "batchcontext.h"
#include "utils/logging.h"

#include <QDebug>

const char *folderMergeActionToString(FolderMergeAction action)
{
    switch (action) {
    case FolderMergeAction::MergeOverwrite: return "merge_overwrite";
    case FolderMergeAction::MergeSkipExisting: return "merge_skip_existing";
    case FolderMergeAction::Replace: return "replace";
    case FolderMergeAction::Skip: return "skip";
    case FolderMergeAction::Cancel: return "cancel";
    }
    return "merge_overwrite";
}

MergePolicy mergePolicyFor(FolderMergeAction action)
{
    switch (action) {
    case FolderMergeAction::MergeSkipExisting:
        return MergePolicy::SkipExisting;
    case FolderMergeAction::Replace:
        return MergePolicy::Replace;
    case FolderMergeAction::MergeOverwrite:
    case FolderMergeAction::Skip:
    case FolderMergeAction::Cancel:
        break;
    }
    return MergePolicy::Overwrite;
}

FolderMergeNegotiator::FolderMergeNegotiator(QObject *parent)
    : QObject(parent)
{
}

void FolderMergeNegotiator::resolve(const FolderMergeQuery &query, BatchContext &context,
                                    DecisionCallback callback)
{
    if (pendingCallback_) {
        qWarning() << "FolderMergeNegotiator: Query for" << query.folderName
                   << "while another is pending, cancelling the older one";
        cancelPending();
    }

    if (!query.destination.has_value() || !query.destination->isDirectory) {
        callback(FolderMergeDecision{FolderMergeAction::MergeOverwrite, false});
        return;
    }

    if (context.folderMergeForAll.has_value()) {
        LOG_VERBOSE() << "FolderMergeNegotiator: Applying remembered decision to"
                      << query.folderName;
        callback(*context.folderMergeForAll);
        return;
    }

    FolderMergeDecision decision;
    switch (defaultAction_) {
    case FolderExistsAction::Ask:
        break;
    case FolderExistsAction::MergeOverwrite:
        decision.action = FolderMergeAction::MergeOverwrite;
        callback(decision);
        return;
    case FolderExistsAction::MergeSkipExisting:
        decision.action = FolderMergeAction::MergeSkipExisting;
        callback(decision);
        return;
    case FolderExistsAction::Replace:
        decision.action = FolderMergeAction::Replace;
        callback(decision);
        return;
    case FolderExistsAction::Skip:
        decision.action = FolderMergeAction::Skip;
        callback(decision);
        return;
    }

    pendingQuery_ = query;
    pendingContext_ = &context;
    pendingCallback_ = std::move(callback);
    qDebug() << "FolderMergeNegotiator: Asking about existing folder" << query.folderName;
    emit folderMergeDecisionNeeded(query);
}

bool FolderMergeNegotiator::respond(const FolderMergeDecision &decision)
{
    if (!pendingCallback_) {
        qWarning() << "FolderMergeNegotiator: respond() without a pending query";
        return false;
    }

    DecisionCallback callback = std::move(pendingCallback_);
    pendingCallback_ = nullptr;
    BatchContext *context = pendingContext_;
    pendingContext_ = nullptr;

    if (decision.applyToAll && decision.action != FolderMergeAction::Cancel && context) {
        context->folderMergeForAll = decision;
    }
    callback(decision);
    return true;
}

void FolderMergeNegotiator::cancelPending()
{
    if (!pendingCallback_) {
        return;
    }
    qDebug() << "FolderMergeNegotiator: Cancelling pending query for" << pendingQuery_.folderName;
    respond(FolderMergeDecision{FolderMergeAction::Cancel, false});
}
