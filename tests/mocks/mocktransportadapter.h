/**
 * @file mocktransportadapter.h
 * @brief Mock transport adapter for engine tests.
 *
 * This mock implements ITransportAdapter and can be injected wherever the
 * engine expects a live adapter (BatchRunner, PanelNavigator, or through
 * the SessionManager adapter factory).
 */

#ifndef MOCKTRANSPORTADAPTER_H
#define MOCKTRANSPORTADAPTER_H

#include <QHash>
#include <QList>
#include <QQueue>
#include <QStringList>

#include "services/itransportadapter.h"

/**
 * @brief Controllable ITransportAdapter for testing.
 *
 * @par Features:
 * - Queue-based operation processing, manual or automatic
 * - Configurable directory listings and directory failures
 * - Scripted transfer failures, per attempt or per source path
 * - Configurable open and reconnect results
 * - Request tracking for test assertions
 *
 * @par Example usage:
 * @code
 * MockTransportAdapter *mock = new MockTransportAdapter(this);
 * mock->mockSetConnected(true);
 * mock->mockScriptTransferFailures({"Connection reset by peer", QString()});
 *
 * runner->setTransportAdapter(mock);
 * runner->startBatch(request);
 *
 * QTRY_COMPARE(mock->mockPendingOperationCount(), 1);
 * mock->mockProcessNextOperation();
 * @endcode
 */
class MockTransportAdapter : public ITransportAdapter
{
    Q_OBJECT

public:
    struct TransferCall {
        enum Kind { UploadFile, DownloadFile, UploadFolder, DownloadFolder };

        QString transferId;
        Kind kind = UploadFile;
        QString source;
        QString destination;
        MergePolicy policy = MergePolicy::Overwrite;
    };

    explicit MockTransportAdapter(QObject *parent = nullptr);
    ~MockTransportAdapter() override = default;

    /// @name ITransportAdapter Implementation
    /// @{
    void open(const ConnectionParams &params) override;
    void reconnect() override;
    void disconnectFromEndpoint() override;
    [[nodiscard]] bool isConnected() const override { return connected_; }

    void listDirectory(quint64 generation, const QString &path) override;
    void changeDirectory(quint64 generation, const QString &path) override;
    void makeDirectory(quint64 generation, const QString &path) override;

    void uploadFile(const QString &transferId, const QString &localPath,
                    const QString &remotePath) override;
    void downloadFile(const QString &transferId, const QString &remotePath,
                      const QString &localPath) override;
    void uploadFolder(const QString &transferId, const QString &localPath,
                      const QString &remotePath, MergePolicy policy) override;
    void downloadFolder(const QString &transferId, const QString &remotePath,
                        const QString &localPath, MergePolicy policy) override;
    void cancelCurrentTransfer() override;
    /// @}

    /// @name Mock Control Methods
    /// @{

    /**
     * @brief Processes every queued operation on the next event-loop turn
     * instead of waiting for mockProcessNextOperation().
     */
    void mockSetAutoProcess(bool enabled) { autoProcess_ = enabled; }

    /// Sets the connection flag without emitting anything.
    void mockSetConnected(bool connected) { connected_ = connected; }

    void mockSetOpenResult(bool success, const QString &message = QString());
    void mockSetReconnectResult(bool success, const QString &message = QString());

    void mockSetDirectoryListing(const QString &path, const QList<RemoteEntry> &entries);

    /// Listing, entering or creating @p path fails with @p message.
    void mockSetDirectoryFails(const QString &path, const QString &message);
    void mockClearDirectoryFails(const QString &path);

    /**
     * @brief Scripts the outcome of the next transfer attempts in order.
     *
     * Each attempt takes the next entry: an empty string succeeds, anything
     * else fails with that message. Attempts beyond the script succeed.
     */
    void mockScriptTransferFailures(const QStringList &messages);

    /// Every attempt whose source is @p sourcePath fails with @p message.
    void mockFailTransfersFrom(const QString &sourcePath, const QString &message);

    /// Cause attached to failed outcomes, as a real adapter diagnoses it.
    void mockSetFailureCause(ErrorCause cause) { failureCause_ = cause; }

    void mockProcessNextOperation();
    void mockProcessAllOperations();

    /// Resets all mock state.
    void mockReset();
    /// @}

    /// @name Test Inspection Methods
    /// @{
    [[nodiscard]] int mockPendingOperationCount() const { return pendingOps_.size(); }
    [[nodiscard]] QList<TransferCall> mockGetTransferCalls() const { return transferCalls_; }
    [[nodiscard]] QStringList mockGetTransferIds() const;
    [[nodiscard]] QStringList mockGetTransferSources() const;
    [[nodiscard]] QStringList mockGetListRequests() const { return listRequests_; }
    [[nodiscard]] QStringList mockGetChangeDirectoryRequests() const { return changeDirRequests_; }
    [[nodiscard]] QStringList mockGetMkdirRequests() const { return mkdirRequests_; }
    [[nodiscard]] int mockOpenCount() const { return openCount_; }
    [[nodiscard]] int mockReconnectCount() const { return reconnectCount_; }
    [[nodiscard]] int mockCancelCount() const { return cancelCount_; }
    [[nodiscard]] int mockDisconnectCount() const { return disconnectCount_; }
    /// @}

private:
    struct PendingOp {
        enum Type { Open, Reconnect, List, ChangeDir, Mkdir, Transfer };
        Type type = Open;
        quint64 generation = 0;
        QString path;
        TransferCall transfer;
    };

    void enqueue(const PendingOp &op);
    void recordTransfer(TransferCall::Kind kind, const QString &transferId,
                        const QString &source, const QString &destination,
                        MergePolicy policy);
    [[nodiscard]] QString failureFor(const TransferCall &call);

    bool autoProcess_ = false;
    bool connected_ = false;
    bool openSucceeds_ = true;
    QString openMessage_;
    bool reconnectSucceeds_ = true;
    QString reconnectMessage_;

    QQueue<PendingOp> pendingOps_;
    QHash<QString, QList<RemoteEntry>> listings_;
    QHash<QString, QString> failingDirectories_;
    QStringList scriptedFailures_;
    QHash<QString, QString> failingSources_;
    ErrorCause failureCause_ = ErrorCause::Unrecognized;

    // Track requests for assertions
    QList<TransferCall> transferCalls_;
    QStringList listRequests_;
    QStringList changeDirRequests_;
    QStringList mkdirRequests_;
    int openCount_ = 0;
    int reconnectCount_ = 0;
    int cancelCount_ = 0;
    int disconnectCount_ = 0;
};

#endif // MOCKTRANSPORTADAPTER_H
