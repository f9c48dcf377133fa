#include "transferqueue.h"

#include "utils/logging.h"

#include <QDebug>

TransferQueue::TransferQueue(QObject *parent)
    : QAbstractListModel(parent)
{
}

TransferQueue::~TransferQueue() = default;

QString TransferQueue::addItem(const QString &filename, const QString &sourcePath, qint64 size,
                               TransferDirection direction)
{
    TransferItem item;
    item.id = QStringLiteral("transfer-%1").arg(nextId_++);
    item.filename = filename;
    item.sourcePath = sourcePath;
    item.size = size;
    item.bytesTotal = size;
    item.direction = direction;

    beginInsertRows(QModelIndex(), items_.size(), items_.size());
    items_.append(item);
    endInsertRows();

    LOG_VERBOSE() << "TransferQueue: Added" << item.id << transferDirectionToString(direction)
                  << filename;
    emit itemAdded(item.id);
    emit queueChanged();
    return item.id;
}

bool TransferQueue::startTransfer(const QString &id)
{
    const int row = requireIndex("startTransfer", id);
    if (row < 0) {
        return false;
    }
    TransferItem &item = items_[row];
    if (item.status != TransferItem::Status::Pending) {
        rejectTransition("startTransfer", item);
        return false;
    }
    item.status = TransferItem::Status::Transferring;
    item.bytesDone = 0;
    item.speedBps = 0.0;
    notifyChanged(row);
    return true;
}

bool TransferQueue::completeTransfer(const QString &id, bool skipped)
{
    const int row = requireIndex("completeTransfer", id);
    if (row < 0) {
        return false;
    }
    TransferItem &item = items_[row];
    // A skip decision is taken before the transport is involved
    const bool allowed = item.status == TransferItem::Status::Transferring
        || (skipped && item.status == TransferItem::Status::Pending);
    if (!allowed) {
        rejectTransition("completeTransfer", item);
        return false;
    }
    item.status = TransferItem::Status::Completed;
    item.skipped = skipped;
    item.errorMessage.clear();
    if (!skipped && item.bytesTotal > 0) {
        item.bytesDone = item.bytesTotal;
    }
    notifyChanged(row);
    return true;
}

bool TransferQueue::failTransfer(const QString &id, const QString &message)
{
    const int row = requireIndex("failTransfer", id);
    if (row < 0) {
        return false;
    }
    TransferItem &item = items_[row];
    if (item.isTerminal()) {
        rejectTransition("failTransfer", item);
        return false;
    }
    item.status = TransferItem::Status::Failed;
    item.errorMessage = message;
    item.speedBps = 0.0;
    qDebug() << "TransferQueue:" << id << "failed:" << message;
    notifyChanged(row);
    return true;
}

bool TransferQueue::retryItem(const QString &id)
{
    const int row = requireIndex("retryItem", id);
    if (row < 0) {
        return false;
    }
    TransferItem &item = items_[row];
    if (item.status != TransferItem::Status::Failed
        && item.status != TransferItem::Status::Stopped) {
        rejectTransition("retryItem", item);
        return false;
    }
    item.status = TransferItem::Status::Pending;
    item.errorMessage.clear();
    item.skipped = false;
    item.bytesDone = 0;
    item.speedBps = 0.0;
    item.folderProgress = FolderProgress();
    item.attempts = 0;
    notifyChanged(row);

    qDebug() << "TransferQueue: Retrying" << id;
    emit retryRequested(id);
    return true;
}

int TransferQueue::stopPending()
{
    int stopped = 0;
    for (int row = 0; row < items_.size(); ++row) {
        if (items_[row].status == TransferItem::Status::Pending) {
            items_[row].status = TransferItem::Status::Stopped;
            emit itemChanged(items_[row].id);
            ++stopped;
        }
    }
    if (stopped > 0) {
        emit dataChanged(index(0), index(items_.size() - 1));
        emit queueChanged();
    }
    LOG_VERBOSE() << "TransferQueue: stopPending stopped" << stopped << "items";
    return stopped;
}

int TransferQueue::stopAll()
{
    int stopped = 0;
    for (int row = 0; row < items_.size(); ++row) {
        TransferItem &item = items_[row];
        if (item.status == TransferItem::Status::Pending
            || item.status == TransferItem::Status::Transferring) {
            item.status = TransferItem::Status::Stopped;
            item.speedBps = 0.0;
            emit itemChanged(item.id);
            ++stopped;
        }
    }
    if (stopped > 0) {
        emit dataChanged(index(0), index(items_.size() - 1));
        emit queueChanged();
    }
    LOG_VERBOSE() << "TransferQueue: stopAll stopped" << stopped << "items";
    return stopped;
}

bool TransferQueue::stopItem(const QString &id)
{
    const int row = requireIndex("stopItem", id);
    if (row < 0) {
        return false;
    }
    TransferItem &item = items_[row];
    if (item.isTerminal()) {
        rejectTransition("stopItem", item);
        return false;
    }
    item.status = TransferItem::Status::Stopped;
    item.speedBps = 0.0;
    notifyChanged(row);
    return true;
}

bool TransferQueue::markAsFolder(const QString &id)
{
    const int row = requireIndex("markAsFolder", id);
    if (row < 0) {
        return false;
    }
    items_[row].isFolder = true;
    notifyChanged(row);
    return true;
}

bool TransferQueue::updateFolderProgress(const QString &id, int totalFiles, int transferredFiles)
{
    const int row = requireIndex("updateFolderProgress", id);
    if (row < 0) {
        return false;
    }
    TransferItem &item = items_[row];
    if (!item.isFolder) {
        qWarning() << "TransferQueue: updateFolderProgress on non-folder item" << id;
        return false;
    }
    if (totalFiles < 0 || transferredFiles < 0 || transferredFiles > totalFiles) {
        qWarning() << "TransferQueue: Invalid folder progress" << transferredFiles << "/"
                   << totalFiles << "for" << id;
        return false;
    }
    item.folderProgress.totalFiles = totalFiles;
    item.folderProgress.transferredFiles = transferredFiles;
    notifyChanged(row);
    return true;
}

bool TransferQueue::updateProgress(const QString &id, qint64 bytesDone, qint64 bytesTotal,
                                   double speedBps)
{
    const int row = requireIndex("updateProgress", id);
    if (row < 0) {
        return false;
    }
    TransferItem &item = items_[row];
    if (item.status != TransferItem::Status::Transferring) {
        // Late progress after a stop is expected; not worth a warning
        LOG_VERBOSE() << "TransferQueue: Ignoring progress for" << id << "in state"
                      << transferStatusToString(item.status);
        return false;
    }
    item.bytesDone = bytesDone;
    if (bytesTotal > 0) {
        item.bytesTotal = bytesTotal;
    }
    item.speedBps = speedBps;
    notifyChanged(row);
    return true;
}

bool TransferQueue::setDestinationPath(const QString &id, const QString &path)
{
    const int row = requireIndex("setDestinationPath", id);
    if (row < 0) {
        return false;
    }
    items_[row].destinationPath = path;
    notifyChanged(row);
    return true;
}

bool TransferQueue::recordAttempt(const QString &id)
{
    const int row = requireIndex("recordAttempt", id);
    if (row < 0) {
        return false;
    }
    items_[row].attempts++;
    notifyChanged(row);
    return true;
}

void TransferQueue::clear()
{
    beginResetModel();
    items_.clear();
    endResetModel();
    emit queueChanged();
}

int TransferQueue::removeFinished()
{
    int removed = 0;
    for (int row = items_.size() - 1; row >= 0; --row) {
        if (items_[row].isTerminal()) {
            beginRemoveRows(QModelIndex(), row, row);
            items_.removeAt(row);
            endRemoveRows();
            ++removed;
        }
    }
    if (removed > 0) {
        emit queueChanged();
    }
    return removed;
}

TransferItem TransferQueue::item(const QString &id) const
{
    const int row = indexOf(id);
    if (row < 0) {
        return TransferItem();
    }
    return items_[row];
}

int TransferQueue::pendingCount() const
{
    return countWithStatus(TransferItem::Status::Pending);
}

int TransferQueue::activeCount() const
{
    return countWithStatus(TransferItem::Status::Transferring);
}

int TransferQueue::countWithStatus(TransferItem::Status status) const
{
    int count = 0;
    for (const auto &item : items_) {
        if (item.status == status) {
            count++;
        }
    }
    return count;
}

int TransferQueue::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return items_.size();
}

QVariant TransferQueue::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= items_.size()) {
        return QVariant();
    }

    const TransferItem &item = items_[index.row()];

    switch (role) {
    case Qt::DisplayRole:
    case FileNameRole:
        return item.filename;
    case SourcePathRole:
        return item.sourcePath;
    case DestinationPathRole:
        return item.destinationPath;
    case DirectionRole:
        return static_cast<int>(item.direction);
    case StatusRole:
        return static_cast<int>(item.status);
    case ProgressRole:
        if (item.isFolder && item.folderProgress.totalFiles > 0) {
            return (item.folderProgress.transferredFiles * 100) / item.folderProgress.totalFiles;
        }
        if (item.bytesTotal > 0) {
            return static_cast<int>((item.bytesDone * 100) / item.bytesTotal);
        }
        return item.status == TransferItem::Status::Completed ? 100 : 0;
    case BytesDoneRole:
        return item.bytesDone;
    case BytesTotalRole:
        return item.bytesTotal;
    case ErrorMessageRole:
        return item.errorMessage;
    case IsFolderRole:
        return item.isFolder;
    case FolderTotalFilesRole:
        return item.folderProgress.totalFiles;
    case FolderTransferredFilesRole:
        return item.folderProgress.transferredFiles;
    case SkippedRole:
        return item.skipped;
    }

    return QVariant();
}

QHash<int, QByteArray> TransferQueue::roleNames() const
{
    QHash<int, QByteArray> roles;
    roles[FileNameRole] = "fileName";
    roles[SourcePathRole] = "sourcePath";
    roles[DestinationPathRole] = "destinationPath";
    roles[DirectionRole] = "direction";
    roles[StatusRole] = "status";
    roles[ProgressRole] = "progress";
    roles[BytesDoneRole] = "bytesDone";
    roles[BytesTotalRole] = "bytesTotal";
    roles[ErrorMessageRole] = "errorMessage";
    roles[IsFolderRole] = "isFolder";
    roles[FolderTotalFilesRole] = "folderTotalFiles";
    roles[FolderTransferredFilesRole] = "folderTransferredFiles";
    roles[SkippedRole] = "skipped";
    return roles;
}

int TransferQueue::indexOf(const QString &id) const
{
    for (int row = 0; row < items_.size(); ++row) {
        if (items_[row].id == id) {
            return row;
        }
    }
    return -1;
}

int TransferQueue::requireIndex(const char *operation, const QString &id) const
{
    const int row = indexOf(id);
    if (row < 0) {
        qWarning() << "TransferQueue:" << operation << "- unknown item" << id;
    }
    return row;
}

void TransferQueue::rejectTransition(const char *operation, const TransferItem &item) const
{
    qWarning() << "TransferQueue:" << operation << "rejected for" << item.id
               << "in state" << transferStatusToString(item.status);
}

void TransferQueue::notifyChanged(int row)
{
    const QModelIndex changed = index(row);
    emit dataChanged(changed, changed);
    emit itemChanged(items_[row].id);
    emit queueChanged();
}
