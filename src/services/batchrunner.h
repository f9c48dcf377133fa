/**
 * @file batchrunner.h
 * @brief Drives a batch of transfer items through conflicts, the transport
 * and the circuit breaker.
 */

#ifndef BATCHRUNNER_H
#define BATCHRUNNER_H

#include <QHash>
#include <QObject>
#include <QPointer>
#include <QQueue>
#include <QStringList>

#include <functional>
#include <memory>

#include "batchcontext.h"
#include "circuitbreaker.h"
#include "itransportadapter.h"
#include "models/transferqueue.h"
#include "utils/generationtoken.h"

class FolderMergeNegotiator;
class OverwriteNegotiator;

/**
 * @brief A user request to move entries from one panel into a directory of
 * the other panel.
 */
struct BatchRequest {
    TransferDirection direction = TransferDirection::Upload;
    QList<TransferRequest> items;
    QString destinationDirectory;

    /// Destination listing at the time of the request, used for conflict checks
    QList<RemoteEntry> destinationEntries;
};

enum class BatchFinishReason {
    Completed,  ///< Every item was processed (some may have failed)
    Cancelled,  ///< User cancel, conflict-prompt cancel or resume limit
    Aborted     ///< A fatal error ended the batch
};

[[nodiscard]] const char *batchFinishReasonToString(BatchFinishReason reason);

struct BatchSummary {
    int batchId = -1;
    int total = 0;
    int completed = 0;  ///< Transferred (skipped items not included)
    int skipped = 0;
    int failed = 0;
    int stopped = 0;
    BatchFinishReason reason = BatchFinishReason::Completed;
    QString message;
};

/**
 * @brief Details of a breaker pause awaiting resume() or cancelPaused().
 */
struct PauseInfo {
    int batchId = -1;
    QString itemId;
    QString filename;
    int queueIndex = -1;
    PauseReason reason = PauseReason::None;
    ErrorKind kind = ErrorKind::Unknown;
    QString message;
    int resumeCount = 0;  ///< Resumes already spent on this item
};

Q_DECLARE_METATYPE(BatchSummary)
Q_DECLARE_METATYPE(PauseInfo)

/**
 * @brief Processes one batch at a time, item by item, in queue order.
 *
 * For each item the runner:
 * 1. Runs the file or folder conflict check (may wait for the user)
 * 2. Calls the transport adapter and waits for its terminal message
 * 3. Retries retryable failures with exponential backoff, reconnecting
 *    first after a network failure
 * 4. Records the outcome in the queue and the circuit breaker
 *
 * When the breaker opens on a connection loss the runner reconnects once and
 * makes one more attempt at the same item, which stays Transferring until
 * then; otherwise, or if that attempt fails again, the item is marked Failed
 * and the runner pauses and emits pauseRequested(). resume() retries the item that tripped the
 * breaker; after MaxResumesPerItem resumes at the same item the batch is
 * cancelled instead of pausing again. A fatal error aborts the batch.
 *
 * Everything happens on the Qt event loop. Steps are deferred through an
 * internal event queue so that adapter signals emitted synchronously from
 * inside a call never re-enter the runner.
 *
 * Each transport attempt is tagged "<itemId>#<attempt>"; messages with any
 * other tag (late messages after a cancel, a superseded attempt) are dropped.
 */
class BatchRunner : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle,
        Negotiating,   ///< Waiting for a conflict decision
        Transferring,  ///< Transport call in flight
        WaitingRetry,  ///< Backoff before the next attempt
        Reconnecting,
        Paused         ///< Breaker open, waiting for resume or cancel
    };
    Q_ENUM(State)

    static constexpr int MaxResumesPerItem = 3;

    BatchRunner(TransferQueue *queue, CircuitBreaker *breaker,
                OverwriteNegotiator *overwriteNegotiator,
                FolderMergeNegotiator *folderNegotiator,
                QObject *parent = nullptr);
    ~BatchRunner() override;

    /**
     * @brief Sets the adapter used for transfers. Ignored while a batch runs.
     */
    void setTransportAdapter(ITransportAdapter *adapter);
    [[nodiscard]] ITransportAdapter *transportAdapter() const { return adapter_; }

    /**
     * @brief Enqueues the request's items and starts processing them.
     * @return The batch id, or -1 if a batch is already running, no adapter
     * is set or the request is empty.
     */
    int startBatch(const BatchRequest &request);

    /// @name Cancellation and pause control
    /// @{

    /// Stops pulling new items; the current item finishes.
    void requestSoftCancel();

    /// Stops everything now, including the in-flight transfer.
    void requestHardCancel();

    /// Retries the item that tripped the breaker. @return false if not paused.
    bool resume();

    /// Ends a paused batch. @return false if not paused.
    bool cancelPaused();
    /// @}

    [[nodiscard]] bool isRunning() const { return static_cast<bool>(context_); }
    [[nodiscard]] bool isPaused() const { return state_ == State::Paused; }
    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] int activeBatchId() const { return context_ ? context_->batchId : -1; }
    [[nodiscard]] QString currentItemId() const;
    [[nodiscard]] PauseInfo pauseInfo() const { return pauseInfo_; }

    // For testing: immediately process all pending events
    void flushEventQueue();

signals:
    void batchStarted(int batchId, int itemCount);
    void itemStarted(const QString &itemId);
    void itemFinished(const QString &itemId, TransferItem::Status status);
    void pauseRequested(const PauseInfo &info);
    void resumed();
    void batchNotification(const QString &title, const QString &details);
    void batchFinished(const BatchSummary &summary);
    void stateChanged(BatchRunner::State state);

private slots:
    void onTransferProgress(const TransferProgress &progress);
    void onTransferFinished(const TransferOutcome &outcome);
    void onReconnectFinished(bool success, const QString &message);
    void onRetryRequested(const QString &itemId);

private:
    enum class ReconnectPurpose { None, BeforeRetry, AfterTrip };

    /// What a finished batch leaves behind so a later retryItem() can rerun an item
    struct RetryOrigin {
        TransferRequest request;
        TransferDirection direction = TransferDirection::Upload;
        QString destinationDirectory;
        QList<RemoteEntry> destinationEntries;
    };

    void launch(std::unique_ptr<BatchContext> context);
    void registerRetryClosure(const QString &itemId);
    void startRetryBatch(const QString &itemId);
    void startDeferredRetry();

    void processNext();
    void negotiate(const QString &itemId);
    void onOverwriteDecided(int batchId, const QString &itemId, const OverwriteDecision &decision);
    void onFolderMergeDecided(int batchId, const QString &itemId,
                              const FolderMergeDecision &decision);
    [[nodiscard]] bool isNegotiating(int batchId, const QString &itemId) const;
    void beginTransfer(const QString &itemId, MergePolicy policy);
    void startAttempt();
    void handleOutcome(const TransferOutcome &outcome);
    void handleFailure(const QString &itemId, const TransferError &error);
    void failCurrentItem(const QString &message);
    void scheduleRetry(int delayMs);
    void onBreakerOpened(const TransferError &error);
    void pause(const TransferError &error);
    void retryCurrentItem();
    void advance();
    void cancelFromPrompt(const QString &itemId);
    void finishBatch(BatchFinishReason reason, const QString &message);
    [[nodiscard]] BatchSummary summarize(BatchFinishReason reason, const QString &message) const;
    void setState(State state);

    void scheduleProcessNext();  // Defers processNext() to prevent re-entrancy
    void enqueueEvent(std::function<void()> event);
    void processEventQueue();

    QPointer<TransferQueue> queue_;
    QPointer<CircuitBreaker> breaker_;
    QPointer<OverwriteNegotiator> overwriteNegotiator_;
    QPointer<FolderMergeNegotiator> folderNegotiator_;
    QPointer<ITransportAdapter> adapter_;

    std::unique_ptr<BatchContext> context_;
    State state_ = State::Idle;
    int nextBatchId_ = 1;

    QString inFlightTransferId_;
    MergePolicy currentPolicy_ = MergePolicy::Overwrite;
    ReconnectPurpose reconnectPurpose_ = ReconnectPurpose::None;
    int pendingRetryDelayMs_ = 0;
    TransferError tripError_;
    PauseInfo pauseInfo_;
    bool resumingItem_ = false;  // retryItem() issued by resume(), not by the user

    // Invalidated whenever a timed step (backoff) must not fire any more
    GenerationToken stepToken_;

    QHash<QString, RetryOrigin> retryOrigins_;
    QStringList deferredRetries_;

    // Event queue for deferred processing (prevents re-entrancy)
    QQueue<std::function<void()>> eventQueue_;
    bool processingEvents_ = false;  // Re-entrancy guard
    bool eventProcessingScheduled_ = false;  // Prevents multiple timer posts
};

#endif // BATCHRUNNER_H
