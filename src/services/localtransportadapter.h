/**
 * @file localtransportadapter.h
 * @brief Transport adapter whose endpoint is a directory on this machine.
 */

#ifndef LOCALTRANSPORTADAPTER_H
#define LOCALTRANSPORTADAPTER_H

#include <QList>
#include <QString>

#include "itransportadapter.h"
#include "utils/generationtoken.h"

/**
 * @brief Serves a mounted directory (or any local folder) as a remote endpoint.
 *
 * Endpoint paths are absolute ("/a/b") and resolved below the root given in
 * LocalMountParams. Every operation completes on a later event-loop turn so
 * callers see the same asynchronous behaviour as with a network adapter.
 * Folder copies advance one file per turn; cancelCurrentTransfer() stops them
 * between files.
 */
class LocalTransportAdapter : public ITransportAdapter
{
    Q_OBJECT

public:
    static constexpr qint64 CopyChunkSize = 64 * 1024;

    explicit LocalTransportAdapter(QObject *parent = nullptr);
    ~LocalTransportAdapter() override;

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

    [[nodiscard]] QString rootPath() const { return rootPath_; }

    /**
     * @brief Maps an endpoint path to a path on disk.
     * @return Empty if the path leaves the root.
     */
    [[nodiscard]] QString resolve(const QString &endpointPath) const;

private:
    struct FolderCopy {
        QString transferId;
        QString sourceRoot;
        QString destinationRoot;
        MergePolicy policy = MergePolicy::Overwrite;
        QStringList files;  ///< Paths relative to sourceRoot
        int next = 0;
        qint64 bytesDone = 0;
        qint64 bytesTotal = 0;
    };

    [[nodiscard]] static QString checkRoot(const QString &rootPath);
    void emitListing(quint64 generation, const QString &path);
    void startFileCopy(const QString &transferId, const QString &source,
                       const QString &destination);
    void startFolderCopy(const QString &transferId, const QString &source,
                         const QString &destination, MergePolicy policy);
    void copyNextFolderFile(quint64 token);
    bool copyFile(const QString &source, const QString &destination, qint64 *bytes,
                  QString *error, ErrorCause *cause);
    void finishTransfer(const QString &transferId, bool success, const QString &message,
                        ErrorCause cause = ErrorCause::Unrecognized);

    QString rootPath_;
    bool connected_ = false;
    QString currentPath_ = QStringLiteral("/");

    GenerationToken transferToken_;
    FolderCopy folder_;
};

#endif // LOCALTRANSPORTADAPTER_H
