#include "batchrunner.h"

#include "foldermergenegotiator.h"
#include "overwritenegotiator.h"
#include "utils/logging.h"
#include "utils/pathutils.h"

#include <QDebug>
#include <QTimer>

const char *batchFinishReasonToString(BatchFinishReason reason)
{
    switch (reason) {
    case BatchFinishReason::Completed: return "completed";
    case BatchFinishReason::Cancelled: return "cancelled";
    case BatchFinishReason::Aborted: return "aborted";
    }
    return "completed";
}

BatchRunner::BatchRunner(TransferQueue *queue, CircuitBreaker *breaker,
                         OverwriteNegotiator *overwriteNegotiator,
                         FolderMergeNegotiator *folderNegotiator,
                         QObject *parent)
    : QObject(parent)
    , queue_(queue)
    , breaker_(breaker)
    , overwriteNegotiator_(overwriteNegotiator)
    , folderNegotiator_(folderNegotiator)
{
    connect(queue, &TransferQueue::retryRequested,
            this, &BatchRunner::onRetryRequested);
}

BatchRunner::~BatchRunner()
{
    // Disconnect before members are destroyed; QObject's own disconnection
    // runs after this destructor body
    if (adapter_) {
        disconnect(adapter_, nullptr, this, nullptr);
    }
}

void BatchRunner::setTransportAdapter(ITransportAdapter *adapter)
{
    if (context_) {
        qWarning() << "BatchRunner: Cannot change transport while a batch is running";
        return;
    }
    if (adapter_ == adapter) {
        return;
    }
    if (adapter_) {
        disconnect(adapter_, nullptr, this, nullptr);
    }

    adapter_ = adapter;

    if (adapter) {
        connect(adapter, &ITransportAdapter::transferProgress,
                this, &BatchRunner::onTransferProgress);
        connect(adapter, &ITransportAdapter::transferFinished,
                this, &BatchRunner::onTransferFinished);
        connect(adapter, &ITransportAdapter::reconnectFinished,
                this, &BatchRunner::onReconnectFinished);
    }
}

QString BatchRunner::currentItemId() const
{
    return context_ ? context_->currentItemId() : QString();
}

int BatchRunner::startBatch(const BatchRequest &request)
{
    if (context_) {
        qWarning() << "BatchRunner: Batch" << context_->batchId
                   << "already running, refusing a new one";
        return -1;
    }
    if (!adapter_) {
        qWarning() << "BatchRunner: No transport adapter, cannot start a batch";
        return -1;
    }
    if (request.items.isEmpty()) {
        qWarning() << "BatchRunner: Ignoring empty batch";
        return -1;
    }

    // Forget origins of items that are no longer in the queue
    for (auto it = retryOrigins_.begin(); it != retryOrigins_.end();) {
        if (!queue_->contains(it.key())) {
            it = retryOrigins_.erase(it);
        } else {
            ++it;
        }
    }

    auto context = std::make_unique<BatchContext>();
    context->batchId = nextBatchId_++;
    context->direction = request.direction;
    context->destinationDirectory = request.destinationDirectory;
    context->destinationEntries = request.destinationEntries;

    for (const TransferRequest &entry : request.items) {
        const QString id = queue_->addItem(entry.name, entry.sourcePath, entry.size,
                                           request.direction);
        queue_->setDestinationPath(id, PathUtils::join(request.destinationDirectory, entry.name));
        if (entry.isFolder) {
            queue_->markAsFolder(id);
        }
        context->itemIds.append(id);
        context->requests.insert(id, entry);
    }

    const int batchId = context->batchId;
    launch(std::move(context));
    return batchId;
}

void BatchRunner::launch(std::unique_ptr<BatchContext> context)
{
    context_ = std::move(context);
    for (const QString &id : context_->itemIds) {
        registerRetryClosure(id);
    }
    pauseInfo_ = PauseInfo();
    breaker_->reset();

    qDebug() << "BatchRunner: Starting batch" << context_->batchId << "with"
             << context_->itemIds.size() << "items"
             << transferDirectionToString(context_->direction)
             << "to" << context_->destinationDirectory;
    emit batchStarted(context_->batchId, context_->itemIds.size());
    scheduleProcessNext();
}

void BatchRunner::registerRetryClosure(const QString &itemId)
{
    context_->retryClosures.insert(itemId, [this, itemId]() {
        // Still ahead of (or at) the cursor: the loop will reach it anyway
        if (context_->itemIds.lastIndexOf(itemId) >= context_->cursor) {
            return;
        }
        LOG_VERBOSE() << "BatchRunner: Appending retried item" << itemId
                      << "to batch" << context_->batchId;
        context_->resolvedItems.remove(itemId);
        context_->itemIds.append(itemId);
        if (state_ == State::Idle) {
            scheduleProcessNext();
        }
    });
}

void BatchRunner::onRetryRequested(const QString &itemId)
{
    if (context_) {
        if (resumingItem_) {
            return;
        }
        context_->userRetries.insert(itemId);
        const auto closure = context_->retryClosures.value(itemId);
        if (closure) {
            closure();
        } else {
            // Belongs to an earlier batch; run it once this one is done
            deferredRetries_.append(itemId);
        }
        return;
    }
    startRetryBatch(itemId);
}

void BatchRunner::startRetryBatch(const QString &itemId)
{
    if (!retryOrigins_.contains(itemId)) {
        qWarning() << "BatchRunner: No origin recorded for retried item" << itemId;
        return;
    }
    if (!adapter_) {
        qWarning() << "BatchRunner: No transport adapter, cannot retry" << itemId;
        return;
    }

    const RetryOrigin origin = retryOrigins_.value(itemId);
    auto context = std::make_unique<BatchContext>();
    context->batchId = nextBatchId_++;
    context->direction = origin.direction;
    context->destinationDirectory = origin.destinationDirectory;
    context->destinationEntries = origin.destinationEntries;
    context->itemIds.append(itemId);
    context->requests.insert(itemId, origin.request);

    launch(std::move(context));
}

void BatchRunner::startDeferredRetry()
{
    while (!context_ && !deferredRetries_.isEmpty()) {
        const QString itemId = deferredRetries_.takeFirst();
        if (queue_->item(itemId).status == TransferItem::Status::Pending) {
            startRetryBatch(itemId);
        }
    }
}

void BatchRunner::processNext()
{
    if (!context_ || state_ != State::Idle) {
        return;
    }
    if (context_->isCancelled()) {
        finishBatch(BatchFinishReason::Cancelled, tr("Cancelled"));
        return;
    }

    // Skip items that were stopped or removed from outside
    while (context_->cursor < context_->itemIds.size()) {
        const QString id = context_->itemIds.at(context_->cursor);
        if (queue_->contains(id) && queue_->item(id).status == TransferItem::Status::Pending) {
            break;
        }
        context_->cursor++;
    }

    if (context_->cursor >= context_->itemIds.size()) {
        finishBatch(BatchFinishReason::Completed, QString());
        return;
    }

    const QString id = context_->currentItemId();
    emit itemStarted(id);

    if (context_->resolvedItems.contains(id)) {
        beginTransfer(id, context_->resolvedItems.value(id));
        return;
    }
    negotiate(id);
}

void BatchRunner::negotiate(const QString &itemId)
{
    setState(State::Negotiating);

    const TransferRequest request = context_->requests.value(itemId);
    const int batchId = context_->batchId;
    const bool sourceIsRemote = context_->direction == TransferDirection::Download;

    if (request.isFolder) {
        FolderMergeQuery query;
        query.itemId = itemId;
        query.folderName = request.name;
        query.sourceIsRemote = sourceIsRemote;
        query.remainingQueueCount = context_->remainingAfterCursor();
        query.destination = context_->destinationEntry(request.name);

        folderNegotiator_->resolve(query, *context_,
            [this, batchId, itemId](const FolderMergeDecision &decision) {
                enqueueEvent([this, batchId, itemId, decision]() {
                    onFolderMergeDecided(batchId, itemId, decision);
                });
            });
        return;
    }

    OverwriteQuery query;
    query.itemId = itemId;
    query.filename = request.name;
    query.size = request.size;
    query.modified = request.modified;
    query.sourceIsRemote = sourceIsRemote;
    query.remainingQueueCount = context_->remainingAfterCursor();
    query.destination = context_->destinationEntry(request.name);
    query.destinationNames = context_->destinationNames();

    overwriteNegotiator_->resolve(query, *context_,
        [this, batchId, itemId](const OverwriteDecision &decision) {
            enqueueEvent([this, batchId, itemId, decision]() {
                onOverwriteDecided(batchId, itemId, decision);
            });
        });
}

bool BatchRunner::isNegotiating(int batchId, const QString &itemId) const
{
    return context_ && context_->batchId == batchId && state_ == State::Negotiating
        && context_->currentItemId() == itemId;
}

void BatchRunner::onOverwriteDecided(int batchId, const QString &itemId,
                                     const OverwriteDecision &decision)
{
    if (!isNegotiating(batchId, itemId)) {
        LOG_VERBOSE() << "BatchRunner: Dropping stale overwrite decision for" << itemId;
        return;
    }

    LOG_VERBOSE() << "BatchRunner: Overwrite decision for" << itemId << "-"
                  << overwriteActionToString(decision.action);

    switch (decision.action) {
    case OverwriteAction::Cancel:
        cancelFromPrompt(itemId);
        return;
    case OverwriteAction::Skip:
        queue_->completeTransfer(itemId, true);
        emit itemFinished(itemId, TransferItem::Status::Completed);
        setState(State::Idle);
        advance();
        return;
    case OverwriteAction::Rename:
        queue_->setDestinationPath(itemId, PathUtils::join(context_->destinationDirectory,
                                                           decision.newName));
        break;
    case OverwriteAction::Overwrite:
        break;
    }
    context_->resolvedItems.insert(itemId, MergePolicy::Overwrite);
    beginTransfer(itemId, MergePolicy::Overwrite);
}

void BatchRunner::onFolderMergeDecided(int batchId, const QString &itemId,
                                       const FolderMergeDecision &decision)
{
    if (!isNegotiating(batchId, itemId)) {
        LOG_VERBOSE() << "BatchRunner: Dropping stale folder decision for" << itemId;
        return;
    }

    LOG_VERBOSE() << "BatchRunner: Folder decision for" << itemId << "-"
                  << folderMergeActionToString(decision.action);

    switch (decision.action) {
    case FolderMergeAction::Cancel:
        cancelFromPrompt(itemId);
        return;
    case FolderMergeAction::Skip:
        queue_->completeTransfer(itemId, true);
        emit itemFinished(itemId, TransferItem::Status::Completed);
        setState(State::Idle);
        advance();
        return;
    case FolderMergeAction::MergeOverwrite:
    case FolderMergeAction::MergeSkipExisting:
    case FolderMergeAction::Replace:
        break;
    }
    const MergePolicy policy = mergePolicyFor(decision.action);
    context_->resolvedItems.insert(itemId, policy);
    beginTransfer(itemId, policy);
}

void BatchRunner::cancelFromPrompt(const QString &itemId)
{
    qDebug() << "BatchRunner: Batch" << context_->batchId << "cancelled at" << itemId;
    context_->softCancel = true;
    context_->cancelLevel = BatchContext::CancelHard;
    queue_->stopAll();
    emit itemFinished(itemId, TransferItem::Status::Stopped);
    finishBatch(BatchFinishReason::Cancelled, tr("Cancelled"));
}

void BatchRunner::beginTransfer(const QString &itemId, MergePolicy policy)
{
    currentPolicy_ = policy;
    if (!queue_->startTransfer(itemId)) {
        setState(State::Idle);
        advance();
        return;
    }
    startAttempt();
}

void BatchRunner::startAttempt()
{
    if (!context_ || context_->cancelLevel == BatchContext::CancelHard) {
        return;
    }

    const QString id = context_->currentItemId();
    if (!adapter_) {
        qWarning() << "BatchRunner: Transport adapter went away during batch"
                   << context_->batchId;
        queue_->failTransfer(id, tr("Not connected"));
        emit itemFinished(id, TransferItem::Status::Failed);
        queue_->stopPending();
        finishBatch(BatchFinishReason::Aborted, tr("Not connected"));
        return;
    }

    queue_->recordAttempt(id);
    const TransferItem item = queue_->item(id);
    inFlightTransferId_ = QStringLiteral("%1#%2").arg(id).arg(item.attempts);
    setState(State::Transferring);

    LOG_VERBOSE() << "BatchRunner: Attempt" << inFlightTransferId_ << item.sourcePath
                  << "->" << item.destinationPath;

    const QString transferId = inFlightTransferId_;
    if (context_->direction == TransferDirection::Upload) {
        if (item.isFolder) {
            adapter_->uploadFolder(transferId, item.sourcePath, item.destinationPath,
                                   currentPolicy_);
        } else {
            adapter_->uploadFile(transferId, item.sourcePath, item.destinationPath);
        }
    } else {
        if (item.isFolder) {
            adapter_->downloadFolder(transferId, item.sourcePath, item.destinationPath,
                                     currentPolicy_);
        } else {
            adapter_->downloadFile(transferId, item.sourcePath, item.destinationPath);
        }
    }
}

void BatchRunner::onTransferProgress(const TransferProgress &progress)
{
    if (!context_ || inFlightTransferId_.isEmpty()
        || progress.transferId != inFlightTransferId_) {
        return;
    }
    const QString id = context_->currentItemId();
    queue_->updateProgress(id, progress.bytesDone, progress.bytesTotal, progress.speedBps);
    if (progress.totalFiles >= 0 && progress.transferredFiles >= 0) {
        queue_->updateFolderProgress(id, progress.totalFiles, progress.transferredFiles);
    }
}

void BatchRunner::onTransferFinished(const TransferOutcome &outcome)
{
    enqueueEvent([this, outcome]() { handleOutcome(outcome); });
}

void BatchRunner::handleOutcome(const TransferOutcome &outcome)
{
    if (!context_ || inFlightTransferId_.isEmpty()
        || outcome.transferId != inFlightTransferId_) {
        LOG_VERBOSE() << "BatchRunner: Ignoring outcome for" << outcome.transferId;
        return;
    }
    inFlightTransferId_.clear();

    const QString id = context_->currentItemId();
    if (!outcome.success) {
        handleFailure(id, classifyTransferError(outcome.message, outcome.cause));
        return;
    }

    queue_->completeTransfer(id);
    breaker_->recordSuccess();

    const TransferItem item = queue_->item(id);
    RemoteEntry landed;
    landed.name = PathUtils::fileName(item.destinationPath);
    landed.isDirectory = item.isFolder;
    landed.size = item.isFolder ? 0 : item.size;
    landed.modified = QDateTime::currentDateTime();
    context_->addDestinationEntry(landed);

    emit itemFinished(id, TransferItem::Status::Completed);
    setState(State::Idle);
    advance();
}

void BatchRunner::handleFailure(const QString &itemId, const TransferError &error)
{
    const QString &message = error.message;
    const int attempts = queue_->item(itemId).attempts;

    qWarning() << "BatchRunner: Attempt" << attempts << "for" << itemId << "failed ("
               << errorKindToString(error.kind) << "/" << errorCauseToString(error.cause)
               << "):" << message;

    if (error.kind != ErrorKind::Fatal && breaker_->shouldRetry(attempts, error.kind)) {
        const int delay = breaker_->retryDelayMs(attempts);
        if (error.kind == ErrorKind::Network && adapter_) {
            pendingRetryDelayMs_ = delay;
            reconnectPurpose_ = ReconnectPurpose::BeforeRetry;
            setState(State::Reconnecting);
            adapter_->reconnect();
            return;
        }
        scheduleRetry(delay);
        return;
    }

    // A trip keeps the item Transferring until the reconnect or pause decides its fate
    const FailureVerdict verdict = breaker_->recordFailure(error);
    if (!verdict.tripped) {
        failCurrentItem(message);
        setState(State::Idle);
        advance();
        return;
    }
    onBreakerOpened(error);
}

void BatchRunner::failCurrentItem(const QString &message)
{
    const QString id = context_->currentItemId();
    if (queue_->item(id).status != TransferItem::Status::Transferring) {
        return;
    }
    queue_->failTransfer(id, message);
    emit itemFinished(id, TransferItem::Status::Failed);
}

void BatchRunner::scheduleRetry(int delayMs)
{
    setState(State::WaitingRetry);
    const quint64 token = stepToken_.next();
    LOG_VERBOSE() << "BatchRunner: Retrying" << currentItemId() << "in" << delayMs << "ms";
    QTimer::singleShot(delayMs, this, [this, token]() {
        if (!stepToken_.isCurrent(token)) {
            return;
        }
        startAttempt();
    });
}

void BatchRunner::onReconnectFinished(bool success, const QString &message)
{
    if (reconnectPurpose_ == ReconnectPurpose::None || !context_) {
        return;
    }
    const ReconnectPurpose purpose = reconnectPurpose_;
    reconnectPurpose_ = ReconnectPurpose::None;

    if (purpose == ReconnectPurpose::BeforeRetry) {
        if (!success) {
            qWarning() << "BatchRunner: Reconnect before retry failed:" << message;
        }
        // The next attempt runs either way; if still offline it fails and counts
        scheduleRetry(pendingRetryDelayMs_);
        return;
    }

    TransferError error = tripError_;
    if (success) {
        breaker_->markReconnected();
        if (!context_->isCancelled()) {
            qDebug() << "BatchRunner: Reconnected after connection loss, retrying"
                     << context_->currentItemId();
            scheduleRetry(0);
            return;
        }
    } else {
        qWarning() << "BatchRunner: Reconnect after connection loss failed:" << message;
        breaker_->markReconnectFailed();
        if (!message.isEmpty()) {
            error.message = message;
        }
    }
    // Cancelled while reconnecting: pause() fails the item and ends the batch
    pause(error);
}

void BatchRunner::onBreakerOpened(const TransferError &error)
{
    tripError_ = error;
    const PauseReason reason = breaker_->pauseReason();

    emit batchNotification(pauseReasonDescription(reason), error.message);

    switch (reason) {
    case PauseReason::FatalError:
        failCurrentItem(error.message);
        queue_->stopPending();
        finishBatch(BatchFinishReason::Aborted, error.message);
        return;
    case PauseReason::ConnectionLost:
        if (context_->reconnectedAtIndex != context_->cursor && adapter_) {
            context_->reconnectedAtIndex = context_->cursor;
            breaker_->markReconnecting();
            reconnectPurpose_ = ReconnectPurpose::AfterTrip;
            setState(State::Reconnecting);
            adapter_->reconnect();
            return;
        }
        break;
    case PauseReason::RateLimited:
    case PauseReason::UnknownError:
    case PauseReason::None:
        break;
    }
    pause(error);
}

void BatchRunner::pause(const TransferError &error)
{
    const int index = context_->cursor;
    const QString id = context_->currentItemId();
    failCurrentItem(error.message);

    if (context_->isCancelled()) {
        queue_->stopPending();
        finishBatch(BatchFinishReason::Cancelled, tr("Cancelled"));
        return;
    }

    const int resumes = context_->resumeCounts.value(index);
    if (resumes >= MaxResumesPerItem) {
        qWarning() << "BatchRunner: Item" << id << "failed after" << resumes
                   << "resumes, cancelling batch" << context_->batchId;
        queue_->stopPending();
        emit batchNotification(tr("Transfer cancelled"),
                               tr("%1 kept failing after %2 resume attempts: %3")
                                   .arg(queue_->item(id).filename)
                                   .arg(resumes)
                                   .arg(error.message));
        finishBatch(BatchFinishReason::Cancelled, error.message);
        return;
    }

    pauseInfo_ = PauseInfo();
    pauseInfo_.batchId = context_->batchId;
    pauseInfo_.itemId = id;
    pauseInfo_.filename = queue_->item(id).filename;
    pauseInfo_.queueIndex = index;
    pauseInfo_.reason = breaker_->pauseReason();
    pauseInfo_.kind = error.kind;
    pauseInfo_.message = error.message;
    pauseInfo_.resumeCount = resumes;

    qDebug() << "BatchRunner: Paused batch" << context_->batchId << "at" << id
             << "reason" << pauseReasonToString(pauseInfo_.reason);
    setState(State::Paused);
    emit pauseRequested(pauseInfo_);
}

bool BatchRunner::resume()
{
    if (!context_ || state_ != State::Paused) {
        qWarning() << "BatchRunner: resume() while not paused";
        return false;
    }
    context_->resumeCounts[context_->cursor]++;
    qDebug() << "BatchRunner: Resuming batch" << context_->batchId << "at"
             << context_->currentItemId() << "(resume"
             << context_->resumeCounts.value(context_->cursor) << ")";
    breaker_->reset();
    pauseInfo_ = PauseInfo();
    emit resumed();
    retryCurrentItem();
    return true;
}

bool BatchRunner::cancelPaused()
{
    if (!context_ || state_ != State::Paused) {
        qWarning() << "BatchRunner: cancelPaused() while not paused";
        return false;
    }
    context_->softCancel = true;
    queue_->stopPending();
    finishBatch(BatchFinishReason::Cancelled, pauseInfo_.message);
    return true;
}

void BatchRunner::retryCurrentItem()
{
    // The cursor stays on the failed item so the loop runs it again
    const QString id = context_->currentItemId();
    const TransferItem item = queue_->item(id);
    if (item.status == TransferItem::Status::Failed
        || item.status == TransferItem::Status::Stopped) {
        resumingItem_ = true;
        queue_->retryItem(id);
        resumingItem_ = false;
    }
    setState(State::Idle);
    scheduleProcessNext();
}

void BatchRunner::advance()
{
    context_->cursor++;
    scheduleProcessNext();
}

void BatchRunner::requestSoftCancel()
{
    if (!context_) {
        return;
    }
    qDebug() << "BatchRunner: Soft cancel of batch" << context_->batchId;
    context_->softCancel = true;
    if (context_->cancelLevel < BatchContext::CancelSoft) {
        context_->cancelLevel = BatchContext::CancelSoft;
    }
    queue_->stopPending();

    if (state_ == State::Paused) {
        finishBatch(BatchFinishReason::Cancelled, tr("Cancelled"));
    } else if (state_ == State::Negotiating) {
        // Nothing is in flight yet; answer the open prompt so the batch can end
        overwriteNegotiator_->cancelPending();
        folderNegotiator_->cancelPending();
    } else if (state_ == State::Idle) {
        scheduleProcessNext();
    }
}

void BatchRunner::requestHardCancel()
{
    if (!context_) {
        return;
    }
    qDebug() << "BatchRunner: Hard cancel of batch" << context_->batchId;
    context_->softCancel = true;
    context_->cancelLevel = BatchContext::CancelHard;
    stepToken_.invalidate();
    reconnectPurpose_ = ReconnectPurpose::None;

    const QString id = context_->currentItemId();
    if (!inFlightTransferId_.isEmpty()) {
        inFlightTransferId_.clear();
        if (adapter_) {
            adapter_->cancelCurrentTransfer();
        }
    }

    queue_->stopAll();
    if (!id.isEmpty() && queue_->item(id).status == TransferItem::Status::Stopped) {
        emit itemFinished(id, TransferItem::Status::Stopped);
    }
    finishBatch(BatchFinishReason::Cancelled, tr("Cancelled"));
}

void BatchRunner::finishBatch(BatchFinishReason reason, const QString &message)
{
    if (!context_) {
        return;
    }

    stepToken_.invalidate();
    reconnectPurpose_ = ReconnectPurpose::None;
    inFlightTransferId_.clear();

    // A prompt may still be open (hard cancel while asking); its callback
    // arrives after the context is gone and is dropped
    if (overwriteNegotiator_) {
        overwriteNegotiator_->cancelPending();
    }
    if (folderNegotiator_) {
        folderNegotiator_->cancelPending();
    }

    const BatchSummary summary = summarize(reason, message);

    for (const QString &id : context_->itemIds) {
        // Retried by the user after the cancel; it gets its own batch
        if (context_->userRetries.contains(id)
            && queue_->item(id).status == TransferItem::Status::Pending
            && !deferredRetries_.contains(id)) {
            deferredRetries_.append(id);
        }
        RetryOrigin origin;
        origin.request = context_->requests.value(id);
        origin.direction = context_->direction;
        origin.destinationDirectory = context_->destinationDirectory;
        origin.destinationEntries = context_->destinationEntries;
        retryOrigins_.insert(id, origin);
    }

    context_.reset();
    pauseInfo_ = PauseInfo();
    setState(State::Idle);

    qDebug() << "BatchRunner: Batch" << summary.batchId << "finished ("
             << batchFinishReasonToString(reason) << ") completed" << summary.completed
             << "skipped" << summary.skipped << "failed" << summary.failed
             << "stopped" << summary.stopped;
    emit batchFinished(summary);

    if (!deferredRetries_.isEmpty()) {
        enqueueEvent([this]() { startDeferredRetry(); });
    }
}

BatchSummary BatchRunner::summarize(BatchFinishReason reason, const QString &message) const
{
    BatchSummary summary;
    summary.batchId = context_->batchId;
    summary.reason = reason;
    summary.message = message;

    QStringList seen;
    for (const QString &id : context_->itemIds) {
        if (seen.contains(id)) {
            continue;
        }
        seen.append(id);
        summary.total++;

        const TransferItem item = queue_->item(id);
        switch (item.status) {
        case TransferItem::Status::Completed:
            if (item.skipped) {
                summary.skipped++;
            } else {
                summary.completed++;
            }
            break;
        case TransferItem::Status::Failed:
            summary.failed++;
            break;
        case TransferItem::Status::Stopped:
            summary.stopped++;
            break;
        case TransferItem::Status::Pending:
        case TransferItem::Status::Transferring:
            break;
        }
    }
    return summary;
}

void BatchRunner::setState(State state)
{
    if (state_ == state) {
        return;
    }
    LOG_VERBOSE() << "BatchRunner: State" << static_cast<int>(state_) << "->"
                  << static_cast<int>(state);
    state_ = state;
    emit stateChanged(state_);
}

void BatchRunner::scheduleProcessNext()
{
    enqueueEvent([this]() { processNext(); });
}

void BatchRunner::enqueueEvent(std::function<void()> event)
{
    eventQueue_.enqueue(std::move(event));

    // Schedule event processing if not already scheduled
    if (!eventProcessingScheduled_) {
        eventProcessingScheduled_ = true;
        QTimer::singleShot(0, this, &BatchRunner::processEventQueue);
    }
}

void BatchRunner::processEventQueue()
{
    eventProcessingScheduled_ = false;

    // Re-entrancy guard: if we're already processing, let the outer call finish
    if (processingEvents_) {
        if (!eventQueue_.isEmpty() && !eventProcessingScheduled_) {
            eventProcessingScheduled_ = true;
            QTimer::singleShot(0, this, &BatchRunner::processEventQueue);
        }
        return;
    }

    processingEvents_ = true;
    while (!eventQueue_.isEmpty()) {
        auto event = eventQueue_.dequeue();
        event();
    }
    processingEvents_ = false;
}

void BatchRunner::flushEventQueue()
{
    if (processingEvents_) {
        return;
    }

    eventProcessingScheduled_ = false;
    processingEvents_ = true;
    while (!eventQueue_.isEmpty()) {
        auto event = eventQueue_.dequeue();
        event();
    }
    processingEvents_ = false;
}
