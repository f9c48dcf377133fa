#include "overwritenegotiator.h"

#include "batchcontext.h"
#include "utils/logging.h"
#include "utils/pathutils.h"

#include <QDebug>

const char *overwriteActionToString(OverwriteAction action)
{
    switch (action) {
    case OverwriteAction::Overwrite: return "overwrite";
    case OverwriteAction::Skip: return "skip";
    case OverwriteAction::Rename: return "rename";
    case OverwriteAction::Cancel: return "cancel";
    }
    return "overwrite";
}

OverwriteNegotiator::OverwriteNegotiator(QObject *parent)
    : QObject(parent)
{
}

void OverwriteNegotiator::resolve(const OverwriteQuery &query, BatchContext &context,
                                  DecisionCallback callback)
{
    if (pendingCallback_) {
        qWarning() << "OverwriteNegotiator: Query for" << query.filename
                   << "while another is pending, cancelling the older one";
        cancelPending();
    }

    if (!query.destination.has_value()) {
        callback(OverwriteDecision{OverwriteAction::Overwrite, false, QString()});
        return;
    }

    // A file cannot replace a folder; only Skip, Rename or Cancel apply to it
    const bool folderInTheWay = query.destination->isDirectory;

    if (context.overwriteForAll.has_value()) {
        const OverwriteDecision remembered = finalizeRename(*context.overwriteForAll, query);
        if (!folderInTheWay || remembered.action != OverwriteAction::Overwrite) {
            LOG_VERBOSE() << "OverwriteNegotiator: Applying remembered decision to"
                          << query.filename;
            callback(remembered);
            return;
        }
    }

    if (const auto decision = decideFromDefault(query)) {
        LOG_VERBOSE() << "OverwriteNegotiator: Default action"
                      << fileExistsActionToString(defaultAction_) << "->"
                      << overwriteActionToString(decision->action) << "for" << query.filename;
        callback(*decision);
        return;
    }

    pendingQuery_ = query;
    pendingContext_ = &context;
    pendingCallback_ = std::move(callback);
    if (folderInTheWay) {
        qDebug() << "OverwriteNegotiator: Asking about folder in the way of" << query.filename;
    } else {
        qDebug() << "OverwriteNegotiator: Asking about existing file" << query.filename;
    }
    emit overwriteDecisionNeeded(query);
}

bool OverwriteNegotiator::respond(const OverwriteDecision &decision)
{
    if (!pendingCallback_) {
        qWarning() << "OverwriteNegotiator: respond() without a pending query";
        return false;
    }

    DecisionCallback callback = std::move(pendingCallback_);
    pendingCallback_ = nullptr;
    BatchContext *context = pendingContext_;
    pendingContext_ = nullptr;

    if (decision.applyToAll && decision.action != OverwriteAction::Cancel && context) {
        // A typed name belongs to this file only; later files get generated names
        OverwriteDecision remembered = decision;
        remembered.newName.clear();
        context->overwriteForAll = remembered;
    }

    OverwriteDecision answer = decision;
    if (answer.action == OverwriteAction::Overwrite && pendingQuery_.destination.has_value()
        && pendingQuery_.destination->isDirectory) {
        qWarning() << "OverwriteNegotiator: Cannot replace folder" << pendingQuery_.filename
                   << "with a file, renaming instead";
        answer.action = OverwriteAction::Rename;
        answer.newName.clear();
    }
    callback(finalizeRename(answer, pendingQuery_));
    return true;
}

void OverwriteNegotiator::cancelPending()
{
    if (!pendingCallback_) {
        return;
    }
    qDebug() << "OverwriteNegotiator: Cancelling pending query for" << pendingQuery_.filename;
    respond(OverwriteDecision{OverwriteAction::Cancel, false, QString()});
}

std::optional<OverwriteDecision> OverwriteNegotiator::decideFromDefault(
    const OverwriteQuery &query) const
{
    const RemoteEntry &destination = *query.destination;
    if (destination.isDirectory && defaultAction_ != FileExistsAction::Skip
        && defaultAction_ != FileExistsAction::Rename) {
        return std::nullopt;
    }
    const bool bothDated = query.modified.isValid() && destination.modified.isValid();
    const qint64 deltaMs = bothDated
        ? destination.modified.msecsTo(query.modified) : 0;  // > 0: source is newer
    const bool sameTime = bothDated && qAbs(deltaMs) <= TimestampToleranceMs;
    const bool sameSize = query.size == destination.size;

    OverwriteDecision decision;
    switch (defaultAction_) {
    case FileExistsAction::Ask:
        return std::nullopt;
    case FileExistsAction::Overwrite:
    case FileExistsAction::Resume:
        decision.action = OverwriteAction::Overwrite;
        return decision;
    case FileExistsAction::Skip:
        decision.action = OverwriteAction::Skip;
        return decision;
    case FileExistsAction::Rename:
        decision.action = OverwriteAction::Rename;
        return finalizeRename(decision, query);
    case FileExistsAction::OverwriteIfNewer:
        if (!bothDated) {
            return std::nullopt;
        }
        decision.action = deltaMs > TimestampToleranceMs
            ? OverwriteAction::Overwrite : OverwriteAction::Skip;
        return decision;
    case FileExistsAction::OverwriteIfDifferent:
        if (!bothDated) {
            return std::nullopt;
        }
        decision.action = (!sameTime || !sameSize)
            ? OverwriteAction::Overwrite : OverwriteAction::Skip;
        return decision;
    case FileExistsAction::SkipIfIdentical:
        if (!bothDated) {
            return std::nullopt;
        }
        decision.action = (sameTime && sameSize)
            ? OverwriteAction::Skip : OverwriteAction::Overwrite;
        return decision;
    }
    return std::nullopt;
}

OverwriteDecision OverwriteNegotiator::finalizeRename(OverwriteDecision decision,
                                                      const OverwriteQuery &query) const
{
    if (decision.action != OverwriteAction::Rename) {
        decision.newName.clear();
        return decision;
    }
    const QString trimmed = decision.newName.trimmed();
    const bool usable = !trimmed.isEmpty() && trimmed != query.filename
        && !query.destinationNames.contains(trimmed) && !trimmed.contains('/');
    decision.newName = usable
        ? trimmed : PathUtils::uniqueName(query.filename, query.destinationNames);
    return decision;
}
