/**
 * @file transferservice.h
 * @brief Entry point the UI uses to move panel selections between panels.
 *
 * This service owns the transfer engine (queue, circuit breaker, conflict
 * negotiators and batch runner) and turns names selected in one panel into a
 * batch for the directory shown in the other panel.
 */

#ifndef TRANSFERSERVICE_H
#define TRANSFERSERVICE_H

#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>

#include "batchrunner.h"
#include "foldermergenegotiator.h"
#include "models/transferqueue.h"
#include "overwritenegotiator.h"

class CircuitBreaker;
class ErrorHandler;
class PanelNavigator;
class SessionManager;
class TransferSettings;

/**
 * @brief Facade over the transfer engine.
 *
 * TransferService wires the engine to the active session and the panels so
 * that callers only deal with names and answers:
 * - uploadNames() / downloadNames() start a batch from the current panels
 * - respondToOverwrite() / respondToFolderMerge() answer conflict prompts
 * - resume() / cancelPaused() answer a breaker pause
 * - cancelSoft() / cancelHard() stop the running batch
 *
 * Settings changes are applied to the breaker and the negotiators between
 * batches. Failures and batch notifications go to the ErrorHandler.
 *
 * @par Example usage:
 * @code
 * TransferService *service = new TransferService(sessions, navigator,
 *                                                settings, errors, this);
 * connect(service, &TransferService::overwriteDecisionNeeded,
 *         this, &MyWidget::askOverwrite);
 *
 * service->uploadNames({"index.html", "assets"});
 * @endcode
 */
class TransferService : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a transfer service.
     * @param sessions Source of the active adapter and connection state (not owned).
     * @param navigator Panel paths and listings (not owned).
     * @param settings Retry and conflict preferences (not owned).
     * @param errors Where failures are reported, may be null (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    TransferService(SessionManager *sessions,
                    PanelNavigator *navigator,
                    TransferSettings *settings,
                    ErrorHandler *errors,
                    QObject *parent = nullptr);

    ~TransferService() override;

    /// @name Starting batches
    /// @{

    /**
     * @brief Uploads entries of the local panel into the remote directory.
     * @return The batch id, or -1 if rejected (see transferRejected()).
     */
    int uploadNames(const QStringList &names);

    /**
     * @brief Downloads entries of the remote panel into the local directory.
     * @return The batch id, or -1 if rejected (see transferRejected()).
     */
    int downloadNames(const QStringList &names);
    /// @}

    /// @name Batch control
    /// @{
    void cancelSoft();
    void cancelHard();
    bool resume();
    bool cancelPaused();
    bool respondToOverwrite(const OverwriteDecision &decision);
    bool respondToFolderMerge(const FolderMergeDecision &decision);
    /// @}

    /// @name Queue management
    /// @{
    bool retryItem(const QString &itemId);
    int removeFinished();

    /// Clears the queue. Refused while a batch is running.
    bool clear();
    /// @}

    [[nodiscard]] bool isRunning() const;
    [[nodiscard]] bool isPaused() const;

    [[nodiscard]] TransferQueue *queue() const { return queue_; }
    [[nodiscard]] CircuitBreaker *breaker() const { return breaker_; }
    [[nodiscard]] BatchRunner *runner() const { return runner_; }
    [[nodiscard]] OverwriteNegotiator *overwriteNegotiator() const { return overwriteNegotiator_; }
    [[nodiscard]] FolderMergeNegotiator *folderMergeNegotiator() const { return folderNegotiator_; }

    /// Copies the current TransferSettings into the engine.
    void applySettings();

signals:
    void batchStarted(int batchId, int itemCount);
    void batchFinished(const BatchSummary &summary);
    void pauseRequested(const PauseInfo &info);
    void overwriteDecisionNeeded(const OverwriteQuery &query);
    void folderMergeDecisionNeeded(const FolderMergeQuery &query);
    void transferRejected(const QString &reason);

private slots:
    void onItemFinished(const QString &itemId, TransferItem::Status status);
    void onBatchFinished(const BatchSummary &summary);

private:
    int startFromPanel(TransferDirection direction, const QStringList &names);
    bool reject(const QString &reason);

    QPointer<SessionManager> sessions_;
    QPointer<PanelNavigator> navigator_;
    QPointer<TransferSettings> settings_;
    QPointer<ErrorHandler> errors_;

    TransferQueue *queue_ = nullptr;
    CircuitBreaker *breaker_ = nullptr;
    OverwriteNegotiator *overwriteNegotiator_ = nullptr;
    FolderMergeNegotiator *folderNegotiator_ = nullptr;
    BatchRunner *runner_ = nullptr;

    TransferDirection lastDirection_ = TransferDirection::Upload;
    bool settingsDirty_ = false;
};

#endif // TRANSFERSERVICE_H
