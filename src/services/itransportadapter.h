/**
 * @file itransportadapter.h
 * @brief Interface for protocol-specific transport adapters.
 *
 * The transfer engine talks to every endpoint (FTP, SFTP, S3, WebDAV, ...)
 * through this interface. Implementations can be swapped at runtime, which
 * also allows a mock adapter to be injected for testing.
 */

#ifndef ITRANSPORTADAPTER_H
#define ITRANSPORTADAPTER_H

#include <QObject>
#include <QString>

#include "connectionparams.h"
#include "remoteentry.h"
#include "transfererror.h"

/**
 * @brief How a folder transfer treats a destination folder that already exists.
 */
enum class MergePolicy {
    Overwrite,     ///< Merge, replacing files that already exist
    SkipExisting,  ///< Merge, keeping files that already exist
    Replace        ///< Delete the destination folder, then copy
};

/**
 * @brief Progress message for the in-flight transfer.
 *
 * For folder transfers totalFiles/transferredFiles are filled as the adapter
 * discovers and finishes sub-files; they are -1 for single files.
 */
struct TransferProgress {
    QString transferId;
    qint64 bytesDone = 0;
    qint64 bytesTotal = 0;
    double speedBps = 0.0;
    int totalFiles = -1;
    int transferredFiles = -1;
};

/**
 * @brief Terminal message for a transfer.
 */
struct TransferOutcome {
    QString transferId;
    bool success = false;
    QString message;  ///< Error text on failure, optional summary on success

    /// Why it failed, when the adapter knows (reply code, file error);
    /// Unrecognized leaves the decision to the message text
    ErrorCause cause = ErrorCause::Unrecognized;
};

Q_DECLARE_METATYPE(MergePolicy)
Q_DECLARE_METATYPE(TransferProgress)
Q_DECLARE_METATYPE(TransferOutcome)

/**
 * @brief Abstract interface for transport adapters.
 *
 * All operations are asynchronous: they return immediately and report their
 * result through a signal. At most one transfer is in flight at a time;
 * the caller tags each transfer with an id and every progress or terminal
 * message carries that id back.
 *
 * Directory operations carry a generation token chosen by the caller. The
 * adapter echoes it unchanged so callers can drop responses that were
 * superseded by a newer request.
 *
 * @par Example usage:
 * @code
 * ITransportAdapter *adapter = new FtpTransportAdapter(this);
 * connect(adapter, &ITransportAdapter::transferFinished,
 *         this, &MyClass::onTransferFinished);
 *
 * adapter->open(FtpParams{"ftp.example.com"});
 * adapter->downloadFile("transfer-1#1", "/pub/readme.txt", "/home/u/readme.txt");
 * @endcode
 */
class ITransportAdapter : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a transport adapter interface.
     * @param parent Optional parent QObject for memory management.
     */
    explicit ITransportAdapter(QObject *parent = nullptr) : QObject(parent) {}

    ~ITransportAdapter() override = default;

    /// @name Connection Management
    /// @{

    /**
     * @brief Opens a connection with the given parameters.
     *
     * Replaces any existing connection. Emits openFinished().
     */
    virtual void open(const ConnectionParams &params) = 0;

    /**
     * @brief Re-establishes the connection using the last parameters.
     *
     * Emits reconnectFinished().
     */
    virtual void reconnect() = 0;

    /**
     * @brief Closes the connection. Pending operations are dropped.
     */
    virtual void disconnectFromEndpoint() = 0;

    /**
     * @brief Checks if the adapter is connected and ready for commands.
     */
    [[nodiscard]] virtual bool isConnected() const = 0;
    /// @}

    /// @name Directory Operations
    /// @{

    /**
     * @brief Lists a directory without changing the working directory.
     * @param generation Token echoed in the response.
     * @param path Directory to list.
     */
    virtual void listDirectory(quint64 generation, const QString &path) = 0;

    /**
     * @brief Changes the working directory and lists it.
     * @param generation Token echoed in the response.
     * @param path Directory to enter.
     */
    virtual void changeDirectory(quint64 generation, const QString &path) = 0;

    /**
     * @brief Creates a directory (parents must exist).
     * @param generation Token echoed in the response.
     * @param path Directory to create.
     */
    virtual void makeDirectory(quint64 generation, const QString &path) = 0;
    /// @}

    /// @name Transfer Operations
    /// @{

    virtual void uploadFile(const QString &transferId,
                            const QString &localPath,
                            const QString &remotePath) = 0;

    virtual void downloadFile(const QString &transferId,
                              const QString &remotePath,
                              const QString &localPath) = 0;

    /**
     * @brief Recursively uploads a local folder.
     * @param transferId Id echoed in progress and terminal messages.
     * @param localPath Source folder.
     * @param remotePath Destination folder (created if missing).
     * @param policy What to do with files that already exist.
     */
    virtual void uploadFolder(const QString &transferId,
                              const QString &localPath,
                              const QString &remotePath,
                              MergePolicy policy) = 0;

    virtual void downloadFolder(const QString &transferId,
                                const QString &remotePath,
                                const QString &localPath,
                                MergePolicy policy) = 0;

    /**
     * @brief Aborts the in-flight transfer, if any.
     *
     * The adapter may or may not emit a terminal message for the aborted
     * transfer; callers must not depend on it.
     */
    virtual void cancelCurrentTransfer() = 0;
    /// @}

signals:
    /// @name Connection Signals
    /// @{
    void openFinished(bool success, const QString &message);
    void reconnectFinished(bool success, const QString &message);
    void disconnected();
    /// @}

    /// @name Directory Signals
    /// @{
    void directoryListed(quint64 generation, const DirectoryListing &listing);
    void directoryCreated(quint64 generation, const QString &path);
    void directoryFailed(quint64 generation, const QString &path, const QString &message);
    /// @}

    /// @name Transfer Signals
    /// @{

    /**
     * @brief Progress for the in-flight transfer.
     */
    void transferProgress(const TransferProgress &progress);

    /**
     * @brief Terminal message for a transfer (success or failure).
     */
    void transferFinished(const TransferOutcome &outcome);
    /// @}
};

#endif // ITRANSPORTADAPTER_H
