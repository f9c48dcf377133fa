/**
 * @file ftptransportadapter.h
 * @brief Transport adapter for plain FTP endpoints.
 *
 * Speaks the RFC 959 subset needed for browsing and transfers over a
 * QTcpSocket control connection and passive-mode data connections.
 */

#ifndef FTPTRANSPORTADAPTER_H
#define FTPTRANSPORTADAPTER_H

#include <QAbstractSocket>
#include <QDate>
#include <QElapsedTimer>
#include <QFile>
#include <QQueue>
#include <QSet>
#include <QStringList>

#include <functional>
#include <memory>
#include <optional>

#include "itransportadapter.h"
#include "utils/generationtoken.h"

class QTcpSocket;
class QTimer;

/**
 * @brief FTP implementation of ITransportAdapter.
 *
 * Commands are queued and sent one at a time; each queued command carries the
 * handler that receives its final reply. LIST, RETR and STOR first negotiate a
 * passive data connection. Failure messages start with the server's reply code
 * (for example "550 No such file or directory") so that the transfer error
 * classifier can bucket them; local socket failures use descriptive text
 * instead ("Connection lost: ...", "Timed out ...").
 *
 * Folder transfers walk the tree: downloads recurse with LIST, uploads use
 * QDirIterator and list the destination first so that the merge policy can be
 * applied per file.
 *
 * @par Example usage:
 * @code
 * FtpTransportAdapter *ftp = new FtpTransportAdapter(this);
 * connect(ftp, &ITransportAdapter::openFinished, this, &MyClass::onOpened);
 *
 * FtpParams params;
 * params.host = "ftp.example.com";
 * params.user = "deploy";
 * ftp->open(params);
 * @endcode
 */
class FtpTransportAdapter : public ITransportAdapter
{
    Q_OBJECT

public:
    /// @name FTP Protocol Constants
    /// @{
    static constexpr int FtpReplyCodeLength = 3;
    static constexpr int FtpReplyTextOffset = 4;
    static constexpr int PassivePortMultiplier = 256;
    /// @}

    /// @name FTP Response Codes (RFC 959)
    /// @{
    static constexpr int FtpReplyDataConnectionOpen = 125;
    static constexpr int FtpReplyFileStatusOk = 150;
    static constexpr int FtpReplyServiceReady = 220;
    static constexpr int FtpReplyAbortOk = 225;
    static constexpr int FtpReplyTransferComplete = 226;
    static constexpr int FtpReplyEnteringPassive = 227;
    static constexpr int FtpReplyUserLoggedIn = 230;
    static constexpr int FtpReplyActionOk = 250;
    static constexpr int FtpReplyPathCreated = 257;
    static constexpr int FtpReplyPasswordRequired = 331;
    static constexpr int FtpReplyTransferAborted = 426;
    static constexpr int FtpReplyErrorThreshold = 400;
    static constexpr int FtpReplyPermanentError = 500;
    /// @}

    static constexpr int ConnectionTimeoutMs = 15000;
    static constexpr int CommandTimeoutMs = 30000;
    static constexpr qint64 UploadChunkSize = 64 * 1024;

    enum class State {
        Disconnected,  ///< No control connection
        Connecting,    ///< TCP connection in progress
        LoggingIn,     ///< Greeting, USER/PASS, TYPE and PWD in progress
        Ready,         ///< Logged in, no command in flight
        Busy           ///< A command is in flight
    };
    Q_ENUM(State)

    explicit FtpTransportAdapter(QObject *parent = nullptr);
    ~FtpTransportAdapter() override;

    void open(const ConnectionParams &params) override;
    void reconnect() override;
    void disconnectFromEndpoint() override;
    [[nodiscard]] bool isConnected() const override { return loggedIn_; }

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

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] QString currentDirectory() const { return currentDir_; }

    /**
     * @brief Parses a LIST reply.
     *
     * Understands Unix-style lines ("drwxr-xr-x 2 user group 4096 Jan 1 12:00
     * name") and falls back to bare names. Dates without a year are placed in
     * the last twelve months relative to @p today.
     */
    [[nodiscard]] static QList<RemoteEntry> parseDirectoryListing(const QByteArray &data,
                                                                  const QDate &today);

    /**
     * @brief Removes every complete CRLF-terminated line from @p buffer and
     * returns them decoded.
     *
     * A trailing partial line stays in the buffer, so a UTF-8 sequence split
     * across two socket reads is decoded once it is whole.
     */
    [[nodiscard]] static QStringList takeReplyLines(QByteArray *buffer);

    /// Extracts host and port from a 227 reply text.
    [[nodiscard]] static bool parsePassiveResponse(const QString &text, QString *host,
                                                   quint16 *port);

private slots:
    void onControlConnected();
    void onControlDisconnected();
    void onControlReadyRead();
    void onControlError(QAbstractSocket::SocketError error);
    void onConnectionTimeout();
    void onCommandTimeout();

    void onDataReadyRead();
    void onDataDisconnected();
    void onDataError(QAbstractSocket::SocketError error);
    void onDataBytesWritten(qint64 bytes);

private:
    enum class Command {
        None,
        User,
        Pass,
        Type,
        Pwd,
        Cwd,
        List,
        Retr,
        Stor,
        Mkd,
        Dele,
        Rmd,
        Abor
    };

    /// Receives the final reply of a command; code 0 means a local failure.
    using ReplyHandler = std::function<void(int code, const QString &text)>;

    struct PendingCommand {
        Command cmd = Command::None;
        QString arg;
        QString localPath;  ///< RETR destination or STOR source
        ReplyHandler onReply;
        bool belongsToTransfer = false;
    };

    enum class ConnectPurpose { None, Open, Reconnect };

    enum class FolderPhase { Scanning, Preparing, Files };

    struct FolderFile {
        QString relativePath;
        qint64 size = 0;
    };

    struct ActiveTransfer {
        QString id;
        bool upload = false;
        bool isFolder = false;
        MergePolicy policy = MergePolicy::Overwrite;
        QString localRoot;
        QString remoteRoot;

        FolderPhase phase = FolderPhase::Scanning;
        QStringList dirsToScan;         ///< Remote directories, relative to remoteRoot
        QList<FolderFile> files;
        QStringList subdirs;            ///< Subdirectories to create at the destination, parents first
        QSet<QString> remoteFiles;      ///< Existing destination files (relative)
        QStringList remoteDirs;         ///< Existing destination directories (relative)
        bool remoteRootExists = false;
        QList<PendingCommand> steps;    ///< DELE/RMD/MKD commands run before the files
        int nextFile = 0;

        qint64 bytesDone = 0;           ///< Finished files
        qint64 bytesTotal = 0;
        qint64 fileBytes = 0;           ///< Current file
        qint64 fileSize = 0;
        QElapsedTimer elapsed;
    };

    void setState(State state);
    void startConnect(ConnectPurpose purpose);
    void finishConnect(bool success, const QString &message);
    void sendCommand(const QString &command);
    void enqueue(PendingCommand command);
    void queueCommand(Command cmd, const QString &arg, ReplyHandler onReply);
    void onLoggedIn();
    void processNextCommand();
    void sendCurrentCommand();
    void handleReply(int code, const QString &text);
    void completeCurrent(int code, const QString &text);
    void failAll(const QString &message);
    void resetDataState();
    void writeNextUploadChunk();
    [[nodiscard]] bool isDataCommand(Command cmd) const;
    [[nodiscard]] static QString commandName(Command cmd);
    [[nodiscard]] static QString replyMessage(int code, const QString &text);

    void failDirectoryRequestLater(quint64 generation, const QString &path);
    void queueListing(quint64 generation, const QString &path);
    void beginTransfer(const QString &transferId, bool upload, bool isFolder,
                       const QString &localRoot, const QString &remoteRoot,
                       MergePolicy policy);
    void queueRetr(quint64 token, const QString &remotePath, const QString &localPath,
                   std::function<void()> onSuccess);
    void queueStor(quint64 token, const QString &localPath, const QString &remotePath,
                   std::function<void()> onSuccess);
    void advanceFolder(quint64 token);
    void scanNextRemoteDir(quint64 token);
    void finishScan(quint64 token);
    void runNextStep(quint64 token);
    void transferNextFolderFile(quint64 token);
    void emitProgress();
    void failTransfer(quint64 token, const QString &message, ErrorCause cause);
    void failTransferWithReply(int code, const QString &text);
    void finishTransfer(bool success, const QString &message,
                        ErrorCause cause = ErrorCause::Unrecognized);

    QTcpSocket *controlSocket_ = nullptr;
    QTcpSocket *dataSocket_ = nullptr;
    QTimer *connectionTimer_ = nullptr;
    QTimer *commandTimer_ = nullptr;

    std::optional<FtpParams> params_;
    ConnectPurpose connectPurpose_ = ConnectPurpose::None;
    State state_ = State::Disconnected;
    bool loggedIn_ = false;
    bool awaitingGreeting_ = false;
    QString currentDir_ = QStringLiteral("/");

    // Command processing
    QQueue<PendingCommand> commandQueue_;
    PendingCommand current_;
    bool passivePhase_ = false;
    QByteArray responseBuffer_;  // Raw bytes; decoded one complete line at a time

    // Data connection state for the command in flight
    QByteArray listBuffer_;
    std::unique_ptr<QFile> dataFile_;
    std::optional<std::pair<int, QString>> pendingFinal_;
    QString dataError_;
    bool uploadWriting_ = false;

    GenerationToken transferToken_;
    std::optional<ActiveTransfer> transfer_;
};

#endif // FTPTRANSPORTADAPTER_H
