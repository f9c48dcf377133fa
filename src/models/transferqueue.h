#ifndef TRANSFERQUEUE_H
#define TRANSFERQUEUE_H

#include <QAbstractListModel>
#include <QList>
#include <QString>

enum class TransferDirection { Upload, Download };

/// @brief Convert TransferDirection to string for logging
[[nodiscard]] inline const char* transferDirectionToString(TransferDirection direction) {
    switch (direction) {
        case TransferDirection::Upload: return "upload";
        case TransferDirection::Download: return "download";
    }
    return "unknown";
}

struct FolderProgress {
    int totalFiles = 0;
    int transferredFiles = 0;
};

struct TransferItem {
    enum class Status { Pending, Transferring, Completed, Failed, Stopped };

    QString id;
    QString filename;
    QString sourcePath;       // Full path on the source side
    QString destinationPath;  // Full path on the destination side, updated on rename
    qint64 size = 0;
    TransferDirection direction = TransferDirection::Upload;
    bool isFolder = false;
    Status status = Status::Pending;
    bool skipped = false;     // Completed without transferring
    FolderProgress folderProgress;
    QString errorMessage;

    // Latest progress event
    qint64 bytesDone = 0;
    qint64 bytesTotal = 0;
    double speedBps = 0.0;

    int attempts = 0;

    [[nodiscard]] bool isTerminal() const {
        return status == Status::Completed || status == Status::Failed
            || status == Status::Stopped;
    }
};

/// @brief Convert TransferItem::Status to string for logging
[[nodiscard]] inline const char* transferStatusToString(TransferItem::Status status) {
    switch (status) {
        case TransferItem::Status::Pending: return "pending";
        case TransferItem::Status::Transferring: return "transferring";
        case TransferItem::Status::Completed: return "completed";
        case TransferItem::Status::Failed: return "failed";
        case TransferItem::Status::Stopped: return "stopped";
    }
    return "unknown";
}

/**
 * @brief Ordered list of transfer items exposed as a list model.
 *
 * TransferQueue is a pure state container: it performs no I/O and knows
 * nothing about transports. The BatchRunner drives items through
 *
 *     pending -> transferring -> completed | failed | stopped
 *
 * and the UI observes the model. Transitions that would break this order are
 * rejected, logged, and leave the item untouched. A terminal item only returns
 * to pending through retryItem().
 */
class TransferQueue : public QAbstractListModel
{
    Q_OBJECT

public:
    enum Roles {
        FileNameRole = Qt::UserRole + 1,
        SourcePathRole,
        DestinationPathRole,
        DirectionRole,
        StatusRole,
        ProgressRole,
        BytesDoneRole,
        BytesTotalRole,
        ErrorMessageRole,
        IsFolderRole,
        FolderTotalFilesRole,
        FolderTransferredFilesRole,
        SkippedRole
    };

    explicit TransferQueue(QObject *parent = nullptr);
    ~TransferQueue() override;

    /// @name Item lifecycle
    /// @{
    QString addItem(const QString &filename, const QString &sourcePath, qint64 size,
                    TransferDirection direction);
    bool startTransfer(const QString &id);
    bool completeTransfer(const QString &id, bool skipped = false);
    bool failTransfer(const QString &id, const QString &message);
    bool retryItem(const QString &id);
    /// @}

    /// @name Cancellation
    /// @{

    /// Soft cancel: pending items become stopped, the in-flight item is untouched.
    int stopPending();

    /// Hard cancel: pending and in-flight items become stopped.
    int stopAll();

    bool stopItem(const QString &id);
    /// @}

    /// @name Item details
    /// @{
    bool markAsFolder(const QString &id);
    bool updateFolderProgress(const QString &id, int totalFiles, int transferredFiles);
    bool updateProgress(const QString &id, qint64 bytesDone, qint64 bytesTotal, double speedBps);
    bool setDestinationPath(const QString &id, const QString &path);
    bool recordAttempt(const QString &id);
    /// @}

    void clear();
    int removeFinished();

    [[nodiscard]] bool contains(const QString &id) const { return indexOf(id) >= 0; }
    [[nodiscard]] TransferItem item(const QString &id) const;
    [[nodiscard]] QList<TransferItem> items() const { return items_; }
    [[nodiscard]] int count() const { return items_.size(); }
    [[nodiscard]] int pendingCount() const;
    [[nodiscard]] int activeCount() const;
    [[nodiscard]] int countWithStatus(TransferItem::Status status) const;
    [[nodiscard]] bool hasActiveTransfers() const { return activeCount() > 0; }

    // QAbstractListModel interface
    [[nodiscard]] int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    [[nodiscard]] QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    [[nodiscard]] QHash<int, QByteArray> roleNames() const override;

signals:
    void itemAdded(const QString &id);
    void itemChanged(const QString &id);
    void queueChanged();

    /// Emitted after a terminal item was reset to pending by retryItem().
    void retryRequested(const QString &id);

private:
    [[nodiscard]] int indexOf(const QString &id) const;
    [[nodiscard]] int requireIndex(const char *operation, const QString &id) const;
    void rejectTransition(const char *operation, const TransferItem &item) const;
    void notifyChanged(int row);

    QList<TransferItem> items_;
    int nextId_ = 1;
};

Q_DECLARE_METATYPE(TransferItem)

#endif // TRANSFERQUEUE_H
