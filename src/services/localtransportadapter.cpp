#include "localtransportadapter.h"

#include "utils/localdirectory.h"
#include "utils/logging.h"
#include "utils/pathutils.h"

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QTimer>

namespace {

ErrorCause causeForFileError(QFileDevice::FileError error)
{
    switch (error) {
    case QFileDevice::PermissionsError:
        return ErrorCause::PermissionDenied;
    case QFileDevice::ResourceError:
    case QFileDevice::ReadError:
    case QFileDevice::WriteError:
        return ErrorCause::LocalDisk;
    case QFileDevice::OpenError:
        return ErrorCause::PathNotFound;
    default:
        return ErrorCause::Unrecognized;
    }
}

} // namespace

LocalTransportAdapter::LocalTransportAdapter(QObject *parent)
    : ITransportAdapter(parent)
{
}

LocalTransportAdapter::~LocalTransportAdapter() = default;

QString LocalTransportAdapter::checkRoot(const QString &rootPath)
{
    const QFileInfo info(rootPath);
    if (!info.exists()) {
        return tr("No such file or directory: %1").arg(rootPath);
    }
    if (!info.isDir()) {
        return tr("Not a directory: %1").arg(rootPath);
    }
    if (!info.isReadable()) {
        return tr("Permission denied: %1").arg(rootPath);
    }
    return QString();
}

void LocalTransportAdapter::open(const ConnectionParams &params)
{
    transferToken_.invalidate();
    connected_ = false;

    const auto *mount = std::get_if<LocalMountParams>(&params);
    if (!mount) {
        const QString message = tr("Local adapter cannot open %1 endpoints")
                                    .arg(protocolName(params));
        QTimer::singleShot(0, this, [this, message]() { emit openFinished(false, message); });
        return;
    }

    rootPath_ = QDir::cleanPath(mount->rootPath);
    currentPath_ = QStringLiteral("/");
    const QString error = checkRoot(rootPath_);
    qDebug() << "LocalTransportAdapter: Opening" << rootPath_;

    QTimer::singleShot(0, this, [this, error]() {
        connected_ = error.isEmpty();
        if (!connected_) {
            qWarning() << "LocalTransportAdapter: Cannot open root:" << error;
        }
        emit openFinished(connected_, error);
    });
}

void LocalTransportAdapter::reconnect()
{
    QTimer::singleShot(0, this, [this]() {
        const QString error = rootPath_.isEmpty() ? tr("Not connected: no endpoint was opened")
                                                  : checkRoot(rootPath_);
        connected_ = error.isEmpty();
        emit reconnectFinished(connected_, error);
    });
}

void LocalTransportAdapter::disconnectFromEndpoint()
{
    transferToken_.invalidate();
    if (!connected_) {
        return;
    }
    connected_ = false;
    emit disconnected();
}

QString LocalTransportAdapter::resolve(const QString &endpointPath) const
{
    if (rootPath_.isEmpty()) {
        return QString();
    }
    const QString diskPath = QDir::cleanPath(rootPath_ + QLatin1Char('/') + endpointPath);
    if (!PathUtils::isWithin(rootPath_, diskPath)) {
        return QString();
    }
    return diskPath;
}

void LocalTransportAdapter::listDirectory(quint64 generation, const QString &path)
{
    QTimer::singleShot(0, this, [this, generation, path]() { emitListing(generation, path); });
}

void LocalTransportAdapter::changeDirectory(quint64 generation, const QString &path)
{
    QTimer::singleShot(0, this, [this, generation, path]() {
        emitListing(generation, path);
    });
}

void LocalTransportAdapter::emitListing(quint64 generation, const QString &path)
{
    if (!connected_) {
        emit directoryFailed(generation, path, tr("Not connected"));
        return;
    }
    const QString diskPath = resolve(path);
    if (diskPath.isEmpty()) {
        emit directoryFailed(generation, path, tr("Permission denied: %1").arg(path));
        return;
    }

    DirectoryListing listing;
    QString error;
    if (!LocalDirectory::read(diskPath, &listing.entries, &error)) {
        LOG_VERBOSE() << "LocalTransportAdapter: Listing" << path << "failed:" << error;
        emit directoryFailed(generation, path, error);
        return;
    }
    listing.currentPath = PathUtils::normalize(QLatin1Char('/') + path);
    currentPath_ = listing.currentPath;
    emit directoryListed(generation, listing);
}

void LocalTransportAdapter::makeDirectory(quint64 generation, const QString &path)
{
    QTimer::singleShot(0, this, [this, generation, path]() {
        if (!connected_) {
            emit directoryFailed(generation, path, tr("Not connected"));
            return;
        }
        const QString diskPath = resolve(path);
        if (diskPath.isEmpty() || !QDir().mkdir(diskPath)) {
            emit directoryFailed(generation, path,
                                 tr("Cannot create directory %1").arg(path));
            return;
        }
        emit directoryCreated(generation, PathUtils::normalize(path));
    });
}

void LocalTransportAdapter::uploadFile(const QString &transferId, const QString &localPath,
                                       const QString &remotePath)
{
    startFileCopy(transferId, localPath, resolve(remotePath));
}

void LocalTransportAdapter::downloadFile(const QString &transferId, const QString &remotePath,
                                         const QString &localPath)
{
    startFileCopy(transferId, resolve(remotePath), localPath);
}

void LocalTransportAdapter::uploadFolder(const QString &transferId, const QString &localPath,
                                         const QString &remotePath, MergePolicy policy)
{
    startFolderCopy(transferId, localPath, resolve(remotePath), policy);
}

void LocalTransportAdapter::downloadFolder(const QString &transferId, const QString &remotePath,
                                           const QString &localPath, MergePolicy policy)
{
    startFolderCopy(transferId, resolve(remotePath), localPath, policy);
}

void LocalTransportAdapter::cancelCurrentTransfer()
{
    qDebug() << "LocalTransportAdapter: Cancelling current transfer";
    transferToken_.invalidate();
}

void LocalTransportAdapter::startFileCopy(const QString &transferId, const QString &source,
                                          const QString &destination)
{
    const quint64 token = transferToken_.next();
    QTimer::singleShot(0, this, [this, token, transferId, source, destination]() {
        if (!transferToken_.isCurrent(token)) {
            return;
        }
        if (!connected_) {
            finishTransfer(transferId, false, tr("Not connected"), ErrorCause::ConnectionLost);
            return;
        }
        if (source.isEmpty() || destination.isEmpty()) {
            finishTransfer(transferId, false, tr("Permission denied: path is outside the endpoint"),
                           ErrorCause::PermissionDenied);
            return;
        }

        QElapsedTimer elapsed;
        elapsed.start();
        qint64 bytes = 0;
        QString error;
        ErrorCause cause = ErrorCause::Unrecognized;
        if (!copyFile(source, destination, &bytes, &error, &cause)) {
            finishTransfer(transferId, false, error, cause);
            return;
        }

        TransferProgress progress;
        progress.transferId = transferId;
        progress.bytesDone = bytes;
        progress.bytesTotal = bytes;
        const qint64 ms = qMax<qint64>(1, elapsed.elapsed());
        progress.speedBps = bytes * 1000.0 / ms;
        emit transferProgress(progress);
        finishTransfer(transferId, true, QString());
    });
}

void LocalTransportAdapter::startFolderCopy(const QString &transferId, const QString &source,
                                            const QString &destination, MergePolicy policy)
{
    const quint64 token = transferToken_.next();
    QTimer::singleShot(0, this, [this, token, transferId, source, destination, policy]() {
        if (!transferToken_.isCurrent(token)) {
            return;
        }
        if (!connected_) {
            finishTransfer(transferId, false, tr("Not connected"), ErrorCause::ConnectionLost);
            return;
        }
        if (source.isEmpty() || destination.isEmpty()) {
            finishTransfer(transferId, false, tr("Permission denied: path is outside the endpoint"),
                           ErrorCause::PermissionDenied);
            return;
        }
        if (!QFileInfo(source).isDir()) {
            finishTransfer(transferId, false, tr("No such file or directory: %1").arg(source),
                           ErrorCause::PathNotFound);
            return;
        }

        QDir destinationDir(destination);
        if (policy == MergePolicy::Replace && destinationDir.exists()) {
            qDebug() << "LocalTransportAdapter: Replacing" << destination;
            if (!destinationDir.removeRecursively()) {
                finishTransfer(transferId, false,
                               tr("Permission denied: cannot remove %1").arg(destination),
                               ErrorCause::PermissionDenied);
                return;
            }
        }
        if (!QDir().mkpath(destination)) {
            finishTransfer(transferId, false,
                           tr("Permission denied: cannot create %1").arg(destination),
                           ErrorCause::PermissionDenied);
            return;
        }

        folder_ = FolderCopy();
        folder_.transferId = transferId;
        folder_.sourceRoot = source;
        folder_.destinationRoot = destination;
        folder_.policy = policy;

        const QDir sourceDir(source);
        QDirIterator it(source, QDir::AllEntries | QDir::Hidden | QDir::NoDotAndDotDot,
                        QDirIterator::Subdirectories);
        while (it.hasNext()) {
            it.next();
            const QFileInfo info = it.fileInfo();
            const QString relative = sourceDir.relativeFilePath(info.filePath());
            if (info.isDir()) {
                // Empty subfolders are copied too
                if (!QDir().mkpath(QDir(destination).filePath(relative))) {
                    finishTransfer(transferId, false,
                                   tr("Permission denied: cannot create %1").arg(relative),
                                   ErrorCause::PermissionDenied);
                    return;
                }
            } else {
                folder_.files.append(relative);
                folder_.bytesTotal += info.size();
            }
        }

        LOG_VERBOSE() << "LocalTransportAdapter: Folder" << source << "has"
                      << folder_.files.size() << "files";
        copyNextFolderFile(token);
    });
}

void LocalTransportAdapter::copyNextFolderFile(quint64 token)
{
    if (!transferToken_.isCurrent(token)) {
        LOG_VERBOSE() << "LocalTransportAdapter: Folder copy stopped between files";
        return;
    }
    if (!connected_) {
        finishTransfer(folder_.transferId, false, tr("Not connected"),
                       ErrorCause::ConnectionLost);
        return;
    }

    TransferProgress progress;
    progress.transferId = folder_.transferId;
    progress.bytesTotal = folder_.bytesTotal;
    progress.totalFiles = folder_.files.size();

    if (folder_.next >= folder_.files.size()) {
        progress.bytesDone = folder_.bytesDone;
        progress.transferredFiles = folder_.files.size();
        emit transferProgress(progress);
        finishTransfer(folder_.transferId, true, QString());
        return;
    }

    const QString relative = folder_.files.at(folder_.next);
    const QString source = QDir(folder_.sourceRoot).filePath(relative);
    const QString destination = QDir(folder_.destinationRoot).filePath(relative);

    if (folder_.policy == MergePolicy::SkipExisting && QFileInfo::exists(destination)) {
        LOG_VERBOSE() << "LocalTransportAdapter: Keeping existing" << destination;
        folder_.bytesDone += QFileInfo(source).size();
    } else {
        qint64 bytes = 0;
        QString error;
        ErrorCause cause = ErrorCause::Unrecognized;
        if (!copyFile(source, destination, &bytes, &error, &cause)) {
            finishTransfer(folder_.transferId, false, error, cause);
            return;
        }
        folder_.bytesDone += bytes;
    }

    ++folder_.next;
    progress.bytesDone = folder_.bytesDone;
    progress.transferredFiles = folder_.next;
    emit transferProgress(progress);

    QTimer::singleShot(0, this, [this, token]() { copyNextFolderFile(token); });
}

bool LocalTransportAdapter::copyFile(const QString &source, const QString &destination,
                                     qint64 *bytes, QString *error, ErrorCause *cause)
{
    QFile in(source);
    if (!in.exists()) {
        *error = tr("No such file or directory: %1").arg(source);
        *cause = ErrorCause::PathNotFound;
        return false;
    }
    if (!in.open(QIODevice::ReadOnly)) {
        *error = tr("Cannot read %1: %2").arg(source, in.errorString());
        *cause = causeForFileError(in.error());
        return false;
    }

    QFile out(destination);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        *error = tr("Cannot write %1: %2").arg(destination, out.errorString());
        *cause = causeForFileError(out.error());
        return false;
    }

    qint64 total = 0;
    while (!in.atEnd()) {
        const QByteArray chunk = in.read(CopyChunkSize);
        if (chunk.isEmpty() && in.error() != QFileDevice::NoError) {
            *error = tr("Cannot read %1: %2").arg(source, in.errorString());
            *cause = causeForFileError(in.error());
            return false;
        }
        if (out.write(chunk) != chunk.size()) {
            *error = tr("Cannot write %1: %2").arg(destination, out.errorString());
            *cause = causeForFileError(out.error());
            out.close();
            out.remove();
            return false;
        }
        total += chunk.size();
    }

    // Keep the source timestamp so newer/different checks stay meaningful
    const QDateTime modified = QFileInfo(source).lastModified();
    if (modified.isValid() && !out.setFileTime(modified, QFileDevice::FileModificationTime)) {
        qWarning() << "LocalTransportAdapter: Cannot set modification time on" << destination;
    }
    *bytes = total;
    return true;
}

void LocalTransportAdapter::finishTransfer(const QString &transferId, bool success,
                                           const QString &message, ErrorCause cause)
{
    if (!success) {
        qWarning() << "LocalTransportAdapter: Transfer" << transferId << "failed ("
                   << errorCauseToString(cause) << "):" << message;
    }
    TransferOutcome outcome;
    outcome.transferId = transferId;
    outcome.success = success;
    outcome.message = message;
    outcome.cause = cause;
    emit transferFinished(outcome);
}
