#include "ftptransportadapter.h"

#include "utils/logging.h"
#include "utils/pathutils.h"

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QRegularExpression>
#include <QTcpSocket>
#include <QTimer>

#include <algorithm>

namespace {

bool isPositive(int code)
{
    return code >= 200 && code < 400;
}

int monthFromName(const QString &name)
{
    static const QStringList months = {
        QStringLiteral("jan"), QStringLiteral("feb"), QStringLiteral("mar"),
        QStringLiteral("apr"), QStringLiteral("may"), QStringLiteral("jun"),
        QStringLiteral("jul"), QStringLiteral("aug"), QStringLiteral("sep"),
        QStringLiteral("oct"), QStringLiteral("nov"), QStringLiteral("dec")};
    return months.indexOf(name.toLower()) + 1;
}

} // namespace

FtpTransportAdapter::FtpTransportAdapter(QObject *parent)
    : ITransportAdapter(parent)
    , controlSocket_(new QTcpSocket(this))
    , dataSocket_(new QTcpSocket(this))
    , connectionTimer_(new QTimer(this))
    , commandTimer_(new QTimer(this))
{
    connectionTimer_->setSingleShot(true);
    connect(connectionTimer_, &QTimer::timeout,
            this, &FtpTransportAdapter::onConnectionTimeout);
    commandTimer_->setSingleShot(true);
    connect(commandTimer_, &QTimer::timeout,
            this, &FtpTransportAdapter::onCommandTimeout);

    connect(controlSocket_, &QTcpSocket::connected,
            this, &FtpTransportAdapter::onControlConnected);
    connect(controlSocket_, &QTcpSocket::disconnected,
            this, &FtpTransportAdapter::onControlDisconnected);
    connect(controlSocket_, &QTcpSocket::readyRead,
            this, &FtpTransportAdapter::onControlReadyRead);
    connect(controlSocket_, &QTcpSocket::errorOccurred,
            this, &FtpTransportAdapter::onControlError);

    connect(dataSocket_, &QTcpSocket::connected, this, [this]() {
        LOG_VERBOSE() << "FtpTransportAdapter: Data connection open";
        if (uploadWriting_) {
            writeNextUploadChunk();
        }
    });
    connect(dataSocket_, &QTcpSocket::readyRead,
            this, &FtpTransportAdapter::onDataReadyRead);
    connect(dataSocket_, &QTcpSocket::disconnected,
            this, &FtpTransportAdapter::onDataDisconnected);
    connect(dataSocket_, &QTcpSocket::errorOccurred,
            this, &FtpTransportAdapter::onDataError);
    connect(dataSocket_, &QTcpSocket::bytesWritten,
            this, &FtpTransportAdapter::onDataBytesWritten);
}

FtpTransportAdapter::~FtpTransportAdapter()
{
    transferToken_.invalidate();
    disconnect(controlSocket_, nullptr, this, nullptr);
    disconnect(dataSocket_, nullptr, this, nullptr);
    dataSocket_->abort();
    controlSocket_->abort();
}

void FtpTransportAdapter::setState(State state)
{
    if (state_ != state) {
        LOG_VERBOSE() << "FtpTransportAdapter: State" << state;
        state_ = state;
    }
}

// Connection management

void FtpTransportAdapter::open(const ConnectionParams &params)
{
    const auto *ftp = std::get_if<FtpParams>(&params);
    QString error;
    if (!ftp) {
        error = tr("FTP adapter cannot open %1 endpoints").arg(protocolName(params));
    } else if (ftp->secure) {
        error = tr("Explicit TLS is not supported by this client");
    }
    if (!error.isEmpty()) {
        qWarning() << "FtpTransportAdapter:" << error;
        QTimer::singleShot(0, this, [this, error]() { emit openFinished(false, error); });
        return;
    }

    params_ = *ftp;
    startConnect(ConnectPurpose::Open);
}

void FtpTransportAdapter::reconnect()
{
    if (!params_) {
        QTimer::singleShot(0, this, [this]() {
            emit reconnectFinished(false, tr("Not connected: no endpoint was opened"));
        });
        return;
    }
    startConnect(ConnectPurpose::Reconnect);
}

void FtpTransportAdapter::disconnectFromEndpoint()
{
    transferToken_.invalidate();
    transfer_.reset();
    if (state_ == State::Disconnected) {
        return;
    }

    const bool wasLoggedIn = loggedIn_;
    commandQueue_.clear();
    current_ = PendingCommand();
    passivePhase_ = false;
    connectPurpose_ = ConnectPurpose::None;
    loggedIn_ = false;
    connectionTimer_->stop();
    commandTimer_->stop();
    setState(State::Disconnected);
    resetDataState();

    if (controlSocket_->state() == QAbstractSocket::ConnectedState) {
        sendCommand(QStringLiteral("QUIT"));
        controlSocket_->disconnectFromHost();
    } else {
        controlSocket_->abort();
    }

    qDebug() << "FtpTransportAdapter: Disconnected";
    if (wasLoggedIn) {
        emit disconnected();
    }
}

void FtpTransportAdapter::startConnect(ConnectPurpose purpose)
{
    if (connectPurpose_ != ConnectPurpose::None) {
        finishConnect(false, tr("Connection attempt superseded"));
    }
    if (state_ != State::Disconnected) {
        failAll(tr("Connection reset by reconnect"));
    }
    commandQueue_.clear();
    responseBuffer_.clear();

    connectPurpose_ = purpose;
    setState(State::Connecting);
    qDebug() << "FtpTransportAdapter: Connecting to" << params_->host << ":" << params_->port;
    connectionTimer_->start(ConnectionTimeoutMs);
    controlSocket_->connectToHost(params_->host, params_->port);
}

void FtpTransportAdapter::finishConnect(bool success, const QString &message)
{
    connectionTimer_->stop();
    const ConnectPurpose purpose = connectPurpose_;
    connectPurpose_ = ConnectPurpose::None;

    if (success) {
        loggedIn_ = true;
        qDebug() << "FtpTransportAdapter: Logged in, working directory" << currentDir_;
    } else {
        qWarning() << "FtpTransportAdapter: Connection failed:" << message;
        failAll(message);
    }

    if (purpose == ConnectPurpose::Open) {
        emit openFinished(success, message);
    } else if (purpose == ConnectPurpose::Reconnect) {
        emit reconnectFinished(success, message);
    }
}

void FtpTransportAdapter::onLoggedIn()
{
    queueCommand(Command::Type, QStringLiteral("I"), [](int code, const QString &text) {
        if (code != 0 && !isPositive(code)) {
            qWarning() << "FtpTransportAdapter: TYPE I refused:" << code << text;
        }
    });
    queueCommand(Command::Pwd, QString(), [this](int code, const QString &text) {
        if (connectPurpose_ == ConnectPurpose::None) {
            return;
        }
        if (code == FtpReplyPathCreated) {
            // 257 "/path" is current directory
            static const QRegularExpression rx(QStringLiteral("\"(.*)\""));
            const auto match = rx.match(text);
            if (match.hasMatch()) {
                currentDir_ = PathUtils::normalize(match.captured(1));
            }
        }
        finishConnect(true, QString());
    });
}

void FtpTransportAdapter::failAll(const QString &message)
{
    QList<ReplyHandler> handlers;
    if (current_.onReply) {
        handlers.append(current_.onReply);
    }
    for (const PendingCommand &pending : std::as_const(commandQueue_)) {
        if (pending.onReply) {
            handlers.append(pending.onReply);
        }
    }
    commandQueue_.clear();
    current_ = PendingCommand();
    passivePhase_ = false;
    loggedIn_ = false;
    connectionTimer_->stop();
    commandTimer_->stop();
    setState(State::Disconnected);
    resetDataState();
    controlSocket_->abort();

    for (const ReplyHandler &handler : handlers) {
        handler(0, message);
    }
}

void FtpTransportAdapter::onControlConnected()
{
    qDebug() << "FtpTransportAdapter: Control connection open to"
             << controlSocket_->peerAddress().toString();
    connectionTimer_->stop();
    setState(State::LoggingIn);
    awaitingGreeting_ = true;
    commandTimer_->start(CommandTimeoutMs);
}

void FtpTransportAdapter::onControlDisconnected()
{
    if (state_ == State::Disconnected) {
        return;
    }
    qDebug() << "FtpTransportAdapter: Control connection closed by server";
    if (connectPurpose_ != ConnectPurpose::None) {
        finishConnect(false, tr("Connection closed by server during login"));
        return;
    }
    const bool wasLoggedIn = loggedIn_;
    failAll(tr("Connection lost: server closed the control connection"));
    if (wasLoggedIn) {
        emit disconnected();
    }
}

void FtpTransportAdapter::onControlError(QAbstractSocket::SocketError error)
{
    if (state_ == State::Disconnected) {
        return;
    }
    qDebug() << "FtpTransportAdapter: Control socket error:" << error
             << controlSocket_->errorString();
    if (connectPurpose_ != ConnectPurpose::None) {
        finishConnect(false, tr("Connection failed: %1").arg(controlSocket_->errorString()));
        return;
    }
    const bool wasLoggedIn = loggedIn_;
    failAll(tr("Connection lost: %1").arg(controlSocket_->errorString()));
    if (wasLoggedIn) {
        emit disconnected();
    }
}

void FtpTransportAdapter::onConnectionTimeout()
{
    finishConnect(false, tr("Connection timed out after %1 seconds")
                             .arg(ConnectionTimeoutMs / 1000));
}

void FtpTransportAdapter::onCommandTimeout()
{
    const QString message = tr("Timed out waiting for the server to answer %1")
                                .arg(commandName(current_.cmd));
    qWarning() << "FtpTransportAdapter:" << message;
    if (connectPurpose_ != ConnectPurpose::None) {
        finishConnect(false, message);
        return;
    }
    const bool wasLoggedIn = loggedIn_;
    failAll(message);
    if (wasLoggedIn) {
        emit disconnected();
    }
}

// Command processing

void FtpTransportAdapter::sendCommand(const QString &command)
{
    if (controlSocket_->state() != QAbstractSocket::ConnectedState) {
        qDebug() << "FtpTransportAdapter: Cannot send command, socket not connected";
        return;
    }
    if (command.startsWith(QLatin1String("PASS "))) {
        LOG_VERBOSE() << "FtpTransportAdapter: >> PASS ****";
    } else {
        LOG_VERBOSE() << "FtpTransportAdapter: >>" << command;
    }
    controlSocket_->write((command + QStringLiteral("\r\n")).toUtf8());
}

void FtpTransportAdapter::enqueue(PendingCommand command)
{
    if (state_ == State::Disconnected) {
        ReplyHandler handler = std::move(command.onReply);
        if (handler) {
            const QString message = tr("Not connected");
            QTimer::singleShot(0, this, [handler, message]() { handler(0, message); });
        }
        return;
    }
    commandQueue_.enqueue(std::move(command));
    if (state_ == State::Ready) {
        processNextCommand();
    }
}

void FtpTransportAdapter::queueCommand(Command cmd, const QString &arg, ReplyHandler onReply)
{
    PendingCommand pending;
    pending.cmd = cmd;
    pending.arg = arg;
    pending.onReply = std::move(onReply);
    enqueue(std::move(pending));
}

void FtpTransportAdapter::processNextCommand()
{
    if (state_ == State::Disconnected || current_.cmd != Command::None) {
        return;
    }
    if (commandQueue_.isEmpty()) {
        if (loggedIn_) {
            setState(State::Ready);
        }
        commandTimer_->stop();
        return;
    }

    current_ = commandQueue_.dequeue();
    if (loggedIn_) {
        setState(State::Busy);
    }
    commandTimer_->start(CommandTimeoutMs);

    if (!isDataCommand(current_.cmd)) {
        sendCurrentCommand();
        return;
    }

    resetDataState();
    if (current_.cmd == Command::Retr) {
        dataFile_ = std::make_unique<QFile>(current_.localPath);
        if (!dataFile_->open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            const QString message = tr("Cannot write %1: %2")
                                        .arg(current_.localPath, dataFile_->errorString());
            dataFile_.reset();
            completeCurrent(0, message);
            return;
        }
    } else if (current_.cmd == Command::Stor) {
        dataFile_ = std::make_unique<QFile>(current_.localPath);
        if (!dataFile_->open(QIODevice::ReadOnly)) {
            const QString message = dataFile_->exists()
                ? tr("Cannot read %1: %2").arg(current_.localPath, dataFile_->errorString())
                : tr("No such file or directory: %1").arg(current_.localPath);
            dataFile_.reset();
            completeCurrent(0, message);
            return;
        }
    }

    passivePhase_ = true;
    sendCommand(QStringLiteral("PASV"));
}

void FtpTransportAdapter::sendCurrentCommand()
{
    switch (current_.cmd) {
    case Command::User:
        sendCommand(QStringLiteral("USER ") + current_.arg);
        break;
    case Command::Pass:
        sendCommand(QStringLiteral("PASS ") + current_.arg);
        break;
    case Command::Type:
        sendCommand(QStringLiteral("TYPE ") + current_.arg);
        break;
    case Command::Pwd:
        sendCommand(QStringLiteral("PWD"));
        break;
    case Command::Cwd:
        sendCommand(QStringLiteral("CWD ") + current_.arg);
        break;
    case Command::List:
        sendCommand(QStringLiteral("LIST ") + current_.arg);
        break;
    case Command::Retr:
        sendCommand(QStringLiteral("RETR ") + current_.arg);
        break;
    case Command::Stor:
        sendCommand(QStringLiteral("STOR ") + current_.arg);
        break;
    case Command::Mkd:
        sendCommand(QStringLiteral("MKD ") + current_.arg);
        break;
    case Command::Dele:
        sendCommand(QStringLiteral("DELE ") + current_.arg);
        break;
    case Command::Rmd:
        sendCommand(QStringLiteral("RMD ") + current_.arg);
        break;
    case Command::Abor:
        sendCommand(QStringLiteral("ABOR"));
        break;
    case Command::None:
        break;
    }
}

QStringList FtpTransportAdapter::takeReplyLines(QByteArray *buffer)
{
    QStringList lines;
    int idx = buffer->indexOf("\r\n");
    while (idx >= 0) {
        lines.append(QString::fromUtf8(buffer->left(idx)));
        buffer->remove(0, idx + 2);
        idx = buffer->indexOf("\r\n");
    }
    return lines;
}

void FtpTransportAdapter::onControlReadyRead()
{
    responseBuffer_.append(controlSocket_->readAll());

    const QStringList lines = takeReplyLines(&responseBuffer_);
    for (const QString &line : lines) {
        if (line.length() < FtpReplyCodeLength) {
            continue;
        }
        bool ok = false;
        const int code = line.left(FtpReplyCodeLength).toInt(&ok);
        if (!ok) {
            continue;  // Body of a multi-line reply
        }
        if (line.length() > FtpReplyCodeLength && line[FtpReplyCodeLength] == '-') {
            continue;  // First line of a multi-line reply, wait for "NNN "
        }
        handleReply(code, line.mid(FtpReplyTextOffset));
        if (state_ == State::Disconnected) {
            responseBuffer_.clear();
            return;
        }
    }
}

void FtpTransportAdapter::handleReply(int code, const QString &text)
{
    LOG_VERBOSE() << "FtpTransportAdapter: <<" << code << text;
    commandTimer_->start(CommandTimeoutMs);

    if (awaitingGreeting_) {
        if (code < 200) {
            return;
        }
        awaitingGreeting_ = false;
        if (code != FtpReplyServiceReady) {
            finishConnect(false, replyMessage(code, text));
            return;
        }
        const QString user = params_->user.isEmpty() ? QStringLiteral("anonymous") : params_->user;
        queueCommand(Command::User, user, [this](int code, const QString &text) {
            if (connectPurpose_ == ConnectPurpose::None) {
                return;
            }
            if (code == FtpReplyUserLoggedIn) {
                onLoggedIn();
            } else if (code == FtpReplyPasswordRequired) {
                queueCommand(Command::Pass, params_->password, [this](int code, const QString &text) {
                    if (connectPurpose_ == ConnectPurpose::None) {
                        return;
                    }
                    if (code == FtpReplyUserLoggedIn) {
                        onLoggedIn();
                    } else {
                        finishConnect(false, tr("Login failed: %1").arg(replyMessage(code, text)));
                    }
                });
            } else {
                finishConnect(false, tr("Login failed: %1").arg(replyMessage(code, text)));
            }
        });
        processNextCommand();
        return;
    }

    if (current_.cmd == Command::None) {
        LOG_VERBOSE() << "FtpTransportAdapter: Ignoring unsolicited reply" << code;
        return;
    }

    if (current_.cmd == Command::Abor) {
        // The aborted command's own 426 comes first; ABOR's reply ends the exchange
        if (code == FtpReplyAbortOk || code == FtpReplyTransferComplete
            || code >= FtpReplyPermanentError) {
            completeCurrent(code, text);
        }
        return;
    }

    if (passivePhase_) {
        passivePhase_ = false;
        if (code != FtpReplyEnteringPassive) {
            completeCurrent(code, text);
            return;
        }
        QString dataHost;
        quint16 dataPort = 0;
        if (!parsePassiveResponse(text, &dataHost, &dataPort)) {
            completeCurrent(0, tr("Data connection failed: malformed passive reply"));
            return;
        }
        // Servers behind NAT announce internal addresses; the control peer is reachable
        const QString actualHost = controlSocket_->peerAddress().toString();
        LOG_VERBOSE() << "FtpTransportAdapter: PASV" << dataHost << "using" << actualHost
                      << ":" << dataPort;
        dataSocket_->connectToHost(actualHost, dataPort);
        sendCurrentCommand();
        return;
    }

    if (code < 200) {
        if (current_.cmd == Command::Stor && !uploadWriting_) {
            uploadWriting_ = true;
            if (dataSocket_->state() == QAbstractSocket::ConnectedState) {
                writeNextUploadChunk();
            }
        } else if (current_.cmd == Command::Retr && transfer_ && transfer_->fileSize == 0) {
            static const QRegularExpression rx(QStringLiteral("\\((\\d+)\\s+bytes\\)"));
            const auto match = rx.match(text);
            if (match.hasMatch()) {
                transfer_->fileSize = match.captured(1).toLongLong();
            }
        }
        return;
    }

    // LIST and RETR data may still be in flight after 226
    if (code == FtpReplyTransferComplete
        && (current_.cmd == Command::List || current_.cmd == Command::Retr)
        && dataSocket_->state() != QAbstractSocket::UnconnectedState) {
        pendingFinal_ = std::make_pair(code, text);
        return;
    }

    completeCurrent(code, text);
}

void FtpTransportAdapter::completeCurrent(int code, const QString &text)
{
    PendingCommand done = std::move(current_);
    current_ = PendingCommand();
    passivePhase_ = false;
    pendingFinal_.reset();

    int finalCode = code;
    QString finalText = text;
    if (isDataCommand(done.cmd)) {
        if (!dataError_.isEmpty()) {
            finalCode = 0;
            finalText = dataError_;
        }
        if (dataFile_) {
            dataFile_->close();
        }
        uploadWriting_ = false;
        if (dataSocket_->state() != QAbstractSocket::UnconnectedState) {
            dataSocket_->abort();
        }
    }

    if (done.onReply) {
        done.onReply(finalCode, finalText);
    }
    if (isDataCommand(done.cmd)) {
        resetDataState();
    }
    processNextCommand();
}

void FtpTransportAdapter::resetDataState()
{
    listBuffer_.clear();
    dataFile_.reset();
    pendingFinal_.reset();
    dataError_.clear();
    uploadWriting_ = false;
    if (dataSocket_->state() != QAbstractSocket::UnconnectedState) {
        dataSocket_->abort();
    }
}

bool FtpTransportAdapter::isDataCommand(Command cmd) const
{
    return cmd == Command::List || cmd == Command::Retr || cmd == Command::Stor;
}

QString FtpTransportAdapter::commandName(Command cmd)
{
    switch (cmd) {
    case Command::User: return QStringLiteral("USER");
    case Command::Pass: return QStringLiteral("PASS");
    case Command::Type: return QStringLiteral("TYPE");
    case Command::Pwd: return QStringLiteral("PWD");
    case Command::Cwd: return QStringLiteral("CWD");
    case Command::List: return QStringLiteral("LIST");
    case Command::Retr: return QStringLiteral("RETR");
    case Command::Stor: return QStringLiteral("STOR");
    case Command::Mkd: return QStringLiteral("MKD");
    case Command::Dele: return QStringLiteral("DELE");
    case Command::Rmd: return QStringLiteral("RMD");
    case Command::Abor: return QStringLiteral("ABOR");
    case Command::None: break;
    }
    return QStringLiteral("the greeting");
}

QString FtpTransportAdapter::replyMessage(int code, const QString &text)
{
    if (code == 0) {
        return text;
    }
    return QStringLiteral("%1 %2").arg(code).arg(text);
}

// Data connection

void FtpTransportAdapter::onDataReadyRead()
{
    const QByteArray data = dataSocket_->readAll();
    commandTimer_->start(CommandTimeoutMs);

    if (current_.cmd == Command::List) {
        listBuffer_.append(data);
    } else if (current_.cmd == Command::Retr && dataFile_) {
        if (dataFile_->write(data) != data.size()) {
            dataError_ = tr("Cannot write %1: %2").arg(dataFile_->fileName(),
                                                       dataFile_->errorString());
            qWarning() << "FtpTransportAdapter:" << dataError_;
            dataSocket_->abort();
            return;
        }
        if (transfer_) {
            transfer_->fileBytes += data.size();
            emitProgress();
        }
    }
}

void FtpTransportAdapter::onDataDisconnected()
{
    if (dataSocket_->bytesAvailable() > 0) {
        onDataReadyRead();
    }
    if (pendingFinal_) {
        const auto reply = *pendingFinal_;
        completeCurrent(reply.first, reply.second);
    }
}

void FtpTransportAdapter::onDataError(QAbstractSocket::SocketError error)
{
    // The server closes the data connection after sending; drain what is left
    if (error == QAbstractSocket::RemoteHostClosedError) {
        if (dataSocket_->bytesAvailable() > 0) {
            onDataReadyRead();
        }
        return;
    }
    if (!isDataCommand(current_.cmd)) {
        return;
    }
    qDebug() << "FtpTransportAdapter: Data socket error:" << error << dataSocket_->errorString();
    if (dataError_.isEmpty()) {
        dataError_ = tr("Data connection failed: %1").arg(dataSocket_->errorString());
    }
    if (pendingFinal_) {
        const auto reply = *pendingFinal_;
        completeCurrent(reply.first, reply.second);
    }
}

void FtpTransportAdapter::onDataBytesWritten(qint64 bytes)
{
    commandTimer_->start(CommandTimeoutMs);
    if (current_.cmd != Command::Stor) {
        return;
    }
    if (transfer_) {
        transfer_->fileBytes += bytes;
        emitProgress();
    }
    if (uploadWriting_ && dataSocket_->bytesToWrite() == 0) {
        writeNextUploadChunk();
    }
}

void FtpTransportAdapter::writeNextUploadChunk()
{
    if (!dataFile_ || current_.cmd != Command::Stor
        || dataSocket_->state() != QAbstractSocket::ConnectedState) {
        return;
    }

    const QByteArray chunk = dataFile_->read(UploadChunkSize);
    if (chunk.isEmpty()) {
        uploadWriting_ = false;
        if (dataFile_->error() != QFileDevice::NoError) {
            dataError_ = tr("Cannot read %1: %2").arg(dataFile_->fileName(),
                                                      dataFile_->errorString());
            dataSocket_->abort();
            return;
        }
        // End of file: closing the data connection tells the server we are done
        dataSocket_->disconnectFromHost();
        return;
    }
    dataSocket_->write(chunk);
}

// Directory operations

void FtpTransportAdapter::failDirectoryRequestLater(quint64 generation, const QString &path)
{
    QTimer::singleShot(0, this, [this, generation, path]() {
        emit directoryFailed(generation, path, tr("Not connected"));
    });
}

void FtpTransportAdapter::listDirectory(quint64 generation, const QString &path)
{
    if (!loggedIn_) {
        failDirectoryRequestLater(generation, path);
        return;
    }
    queueListing(generation, PathUtils::normalize(path));
}

void FtpTransportAdapter::queueListing(quint64 generation, const QString &path)
{
    queueCommand(Command::List, path, [this, generation, path](int code, const QString &text) {
        if (code != FtpReplyTransferComplete) {
            emit directoryFailed(generation, path, replyMessage(code, text));
            return;
        }
        DirectoryListing listing;
        listing.currentPath = path;
        listing.entries = parseDirectoryListing(listBuffer_, QDate::currentDate());
        LOG_VERBOSE() << "FtpTransportAdapter: Listed" << path << listing.entries.size()
                      << "entries";
        emit directoryListed(generation, listing);
    });
}

void FtpTransportAdapter::changeDirectory(quint64 generation, const QString &path)
{
    if (!loggedIn_) {
        failDirectoryRequestLater(generation, path);
        return;
    }
    const QString target = PathUtils::normalize(path);
    queueCommand(Command::Cwd, target, [this, generation, target](int code, const QString &text) {
        if (code != FtpReplyActionOk) {
            emit directoryFailed(generation, target, replyMessage(code, text));
            return;
        }
        currentDir_ = target;
        queueCommand(Command::Pwd, QString(), [this, generation](int code, const QString &text) {
            if (code == FtpReplyPathCreated) {
                static const QRegularExpression rx(QStringLiteral("\"(.*)\""));
                const auto match = rx.match(text);
                if (match.hasMatch()) {
                    currentDir_ = PathUtils::normalize(match.captured(1));
                }
            } else if (code == 0) {
                emit directoryFailed(generation, currentDir_, text);
                return;
            }
            queueListing(generation, currentDir_);
        });
    });
}

void FtpTransportAdapter::makeDirectory(quint64 generation, const QString &path)
{
    if (!loggedIn_) {
        failDirectoryRequestLater(generation, path);
        return;
    }
    const QString target = PathUtils::normalize(path);
    queueCommand(Command::Mkd, target, [this, generation, target](int code, const QString &text) {
        if (code != FtpReplyPathCreated) {
            emit directoryFailed(generation, target, replyMessage(code, text));
            return;
        }
        emit directoryCreated(generation, target);
    });
}

// Transfers

void FtpTransportAdapter::beginTransfer(const QString &transferId, bool upload, bool isFolder,
                                        const QString &localRoot, const QString &remoteRoot,
                                        MergePolicy policy)
{
    if (transfer_) {
        qWarning() << "FtpTransportAdapter: Starting" << transferId << "while"
                   << transfer_->id << "is in flight, cancelling it";
        cancelCurrentTransfer();
    }
    transfer_.emplace();
    transfer_->id = transferId;
    transfer_->upload = upload;
    transfer_->isFolder = isFolder;
    transfer_->policy = policy;
    transfer_->localRoot = localRoot;
    transfer_->remoteRoot = PathUtils::normalize(remoteRoot);
    transfer_->elapsed.start();
    qDebug() << "FtpTransportAdapter:" << (upload ? "Uploading" : "Downloading")
             << (isFolder ? "folder" : "file") << transferId;
}

void FtpTransportAdapter::failTransfer(quint64 token, const QString &message, ErrorCause cause)
{
    QTimer::singleShot(0, this, [this, token, message, cause]() {
        if (transferToken_.isCurrent(token)) {
            finishTransfer(false, message, cause);
        }
    });
}

void FtpTransportAdapter::failTransferWithReply(int code, const QString &text)
{
    // Code 0 carries a locally built message (socket error, timeout, local file)
    const ErrorCause cause = code == 0 ? ErrorCause::Unrecognized
                                       : errorCauseForFtpReply(code, text);
    finishTransfer(false, replyMessage(code, text), cause);
}

void FtpTransportAdapter::finishTransfer(bool success, const QString &message, ErrorCause cause)
{
    if (!transfer_) {
        return;
    }
    TransferOutcome outcome;
    outcome.transferId = transfer_->id;
    outcome.success = success;
    outcome.message = message;
    outcome.cause = cause;
    if (!success) {
        qWarning() << "FtpTransportAdapter: Transfer" << outcome.transferId << "failed ("
                   << errorCauseToString(cause) << "):" << message;
    }
    transfer_.reset();
    transferToken_.invalidate();
    emit transferFinished(outcome);
}

void FtpTransportAdapter::emitProgress()
{
    if (!transfer_) {
        return;
    }
    const ActiveTransfer &t = *transfer_;
    if (t.isFolder && t.phase != FolderPhase::Files) {
        return;
    }

    TransferProgress progress;
    progress.transferId = t.id;
    progress.bytesDone = t.bytesDone + t.fileBytes;
    progress.bytesTotal = t.isFolder ? t.bytesTotal : std::max(t.fileSize, t.fileBytes);
    progress.speedBps = progress.bytesDone * 1000.0 / std::max<qint64>(1, t.elapsed.elapsed());
    if (t.isFolder) {
        progress.totalFiles = t.files.size();
        progress.transferredFiles = t.nextFile;
    }
    emit transferProgress(progress);
}

void FtpTransportAdapter::queueRetr(quint64 token, const QString &remotePath,
                                    const QString &localPath, std::function<void()> onSuccess)
{
    PendingCommand pending;
    pending.cmd = Command::Retr;
    pending.arg = remotePath;
    pending.localPath = localPath;
    pending.belongsToTransfer = true;
    pending.onReply = [this, token, localPath, onSuccess](int code, const QString &text) {
        if (code != FtpReplyTransferComplete) {
            // Leave no truncated file behind
            if (QFileInfo::exists(localPath) && !QFile::remove(localPath)) {
                qWarning() << "FtpTransportAdapter: Cannot remove partial file" << localPath;
            }
        }
        if (!transferToken_.isCurrent(token)) {
            return;
        }
        if (code != FtpReplyTransferComplete) {
            failTransferWithReply(code, text);
            return;
        }
        onSuccess();
    };
    enqueue(std::move(pending));
}

void FtpTransportAdapter::queueStor(quint64 token, const QString &localPath,
                                    const QString &remotePath, std::function<void()> onSuccess)
{
    PendingCommand pending;
    pending.cmd = Command::Stor;
    pending.arg = remotePath;
    pending.localPath = localPath;
    pending.belongsToTransfer = true;
    pending.onReply = [this, token, onSuccess](int code, const QString &text) {
        if (!transferToken_.isCurrent(token)) {
            return;
        }
        if (code != FtpReplyTransferComplete) {
            failTransferWithReply(code, text);
            return;
        }
        onSuccess();
    };
    enqueue(std::move(pending));
}

void FtpTransportAdapter::uploadFile(const QString &transferId, const QString &localPath,
                                     const QString &remotePath)
{
    beginTransfer(transferId, true, false, localPath, remotePath, MergePolicy::Overwrite);
    const quint64 token = transferToken_.next();
    transfer_->fileSize = QFileInfo(localPath).size();
    if (!loggedIn_) {
        failTransfer(token, tr("Not connected"), ErrorCause::ConnectionLost);
        return;
    }
    queueStor(token, localPath, transfer_->remoteRoot, [this]() { finishTransfer(true, QString()); });
}

void FtpTransportAdapter::downloadFile(const QString &transferId, const QString &remotePath,
                                       const QString &localPath)
{
    beginTransfer(transferId, false, false, localPath, remotePath, MergePolicy::Overwrite);
    const quint64 token = transferToken_.next();
    if (!loggedIn_) {
        failTransfer(token, tr("Not connected"), ErrorCause::ConnectionLost);
        return;
    }
    queueRetr(token, transfer_->remoteRoot, localPath, [this]() { finishTransfer(true, QString()); });
}

void FtpTransportAdapter::downloadFolder(const QString &transferId, const QString &remotePath,
                                         const QString &localPath, MergePolicy policy)
{
    beginTransfer(transferId, false, true, localPath, remotePath, policy);
    const quint64 token = transferToken_.next();
    if (!loggedIn_) {
        failTransfer(token, tr("Not connected"), ErrorCause::ConnectionLost);
        return;
    }

    QDir localDir(localPath);
    if (policy == MergePolicy::Replace && localDir.exists() && !localDir.removeRecursively()) {
        failTransfer(token, tr("Permission denied: cannot remove %1").arg(localPath),
                     ErrorCause::PermissionDenied);
        return;
    }
    if (!QDir().mkpath(localPath)) {
        failTransfer(token, tr("Permission denied: cannot create %1").arg(localPath),
                     ErrorCause::PermissionDenied);
        return;
    }

    transfer_->dirsToScan.append(QString());
    advanceFolder(token);
}

void FtpTransportAdapter::uploadFolder(const QString &transferId, const QString &localPath,
                                       const QString &remotePath, MergePolicy policy)
{
    beginTransfer(transferId, true, true, localPath, remotePath, policy);
    const quint64 token = transferToken_.next();
    if (!loggedIn_) {
        failTransfer(token, tr("Not connected"), ErrorCause::ConnectionLost);
        return;
    }
    if (!QFileInfo(localPath).isDir()) {
        failTransfer(token, tr("No such file or directory: %1").arg(localPath),
                     ErrorCause::PathNotFound);
        return;
    }

    const QDir sourceDir(localPath);
    QDirIterator it(localPath, QDir::AllEntries | QDir::Hidden | QDir::NoDotAndDotDot,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        const QFileInfo info = it.fileInfo();
        const QString relative = sourceDir.relativeFilePath(info.filePath());
        if (info.isDir()) {
            transfer_->subdirs.append(relative);
        } else {
            transfer_->files.append(FolderFile{relative, info.size()});
            transfer_->bytesTotal += info.size();
        }
    }
    // Parents sort before their children
    std::sort(transfer_->subdirs.begin(), transfer_->subdirs.end());

    // Only merge decisions that look at existing files need the destination tree
    if (policy != MergePolicy::Overwrite) {
        transfer_->dirsToScan.append(QString());
    }
    advanceFolder(token);
}

void FtpTransportAdapter::advanceFolder(quint64 token)
{
    if (!transferToken_.isCurrent(token) || !transfer_) {
        return;
    }
    switch (transfer_->phase) {
    case FolderPhase::Scanning:
        scanNextRemoteDir(token);
        break;
    case FolderPhase::Preparing:
        runNextStep(token);
        break;
    case FolderPhase::Files:
        transferNextFolderFile(token);
        break;
    }
}

void FtpTransportAdapter::scanNextRemoteDir(quint64 token)
{
    if (transfer_->dirsToScan.isEmpty()) {
        finishScan(token);
        return;
    }

    const QString relative = transfer_->dirsToScan.takeFirst();
    const QString remoteDir = relative.isEmpty()
        ? transfer_->remoteRoot
        : PathUtils::join(transfer_->remoteRoot, relative);

    PendingCommand pending;
    pending.cmd = Command::List;
    pending.arg = remoteDir;
    pending.belongsToTransfer = true;
    pending.onReply = [this, token, relative, remoteDir](int code, const QString &text) {
        if (!transferToken_.isCurrent(token)) {
            return;
        }
        if (code != FtpReplyTransferComplete) {
            if (transfer_->upload && code >= FtpReplyErrorThreshold) {
                LOG_VERBOSE() << "FtpTransportAdapter:" << remoteDir << "does not exist yet";
                advanceFolder(token);
                return;
            }
            failTransferWithReply(code, text);
            return;
        }

        if (relative.isEmpty()) {
            transfer_->remoteRootExists = true;
        }
        const QList<RemoteEntry> entries = parseDirectoryListing(listBuffer_, QDate::currentDate());
        for (const RemoteEntry &entry : entries) {
            const QString child = relative.isEmpty() ? entry.name
                                                     : relative + QLatin1Char('/') + entry.name;
            if (entry.isDirectory) {
                transfer_->dirsToScan.append(child);
                if (transfer_->upload) {
                    transfer_->remoteDirs.append(child);
                } else {
                    transfer_->subdirs.append(child);
                }
            } else if (transfer_->upload) {
                transfer_->remoteFiles.insert(child);
            } else {
                transfer_->files.append(FolderFile{child, entry.size});
                transfer_->bytesTotal += entry.size;
            }
        }
        advanceFolder(token);
    };
    enqueue(std::move(pending));
}

void FtpTransportAdapter::finishScan(quint64 token)
{
    ActiveTransfer &t = *transfer_;

    if (!t.upload) {
        for (const QString &dir : std::as_const(t.subdirs)) {
            if (!QDir().mkpath(QDir(t.localRoot).filePath(dir))) {
                failTransfer(token, tr("Permission denied: cannot create %1").arg(dir),
                             ErrorCause::PermissionDenied);
                return;
            }
        }
        LOG_VERBOSE() << "FtpTransportAdapter: Folder" << t.remoteRoot << "has"
                      << t.files.size() << "files";
        t.phase = FolderPhase::Files;
        emitProgress();
        advanceFolder(token);
        return;
    }

    auto step = [](Command cmd, const QString &path) {
        PendingCommand pending;
        pending.cmd = cmd;
        pending.arg = path;
        pending.belongsToTransfer = true;
        return pending;
    };

    if (t.policy == MergePolicy::Replace && t.remoteRootExists) {
        for (const QString &file : std::as_const(t.remoteFiles)) {
            t.steps.append(step(Command::Dele, PathUtils::join(t.remoteRoot, file)));
        }
        // Deepest directories first
        for (auto it = t.remoteDirs.crbegin(); it != t.remoteDirs.crend(); ++it) {
            t.steps.append(step(Command::Rmd, PathUtils::join(t.remoteRoot, *it)));
        }
        t.steps.append(step(Command::Rmd, t.remoteRoot));
        t.remoteFiles.clear();
        t.remoteDirs.clear();
        t.remoteRootExists = false;
    }

    if (!t.remoteRootExists) {
        t.steps.append(step(Command::Mkd, t.remoteRoot));
    }
    for (const QString &dir : std::as_const(t.subdirs)) {
        if (!t.remoteDirs.contains(dir)) {
            t.steps.append(step(Command::Mkd, PathUtils::join(t.remoteRoot, dir)));
        }
    }

    t.phase = FolderPhase::Preparing;
    advanceFolder(token);
}

void FtpTransportAdapter::runNextStep(quint64 token)
{
    if (transfer_->steps.isEmpty()) {
        transfer_->phase = FolderPhase::Files;
        emitProgress();
        advanceFolder(token);
        return;
    }

    PendingCommand pending = transfer_->steps.takeFirst();
    const Command cmd = pending.cmd;
    const QString path = pending.arg;
    pending.onReply = [this, token, cmd, path](int code, const QString &text) {
        if (!transferToken_.isCurrent(token)) {
            return;
        }
        if (code == 0) {
            finishTransfer(false, text);
            return;
        }
        if (!isPositive(code)) {
            if (cmd != Command::Mkd) {
                failTransferWithReply(code, text);
                return;
            }
            // Usually "already exists"; a real problem shows up on STOR
            LOG_VERBOSE() << "FtpTransportAdapter: MKD" << path << "refused:" << code << text;
        }
        advanceFolder(token);
    };
    enqueue(std::move(pending));
}

void FtpTransportAdapter::transferNextFolderFile(quint64 token)
{
    ActiveTransfer &t = *transfer_;
    if (t.nextFile >= t.files.size()) {
        emitProgress();
        finishTransfer(true, QString());
        return;
    }

    const FolderFile file = t.files.at(t.nextFile);
    const QString localPath = QDir(t.localRoot).filePath(file.relativePath);
    const QString remotePath = PathUtils::join(t.remoteRoot, file.relativePath);

    const bool exists = t.upload ? t.remoteFiles.contains(file.relativePath)
                                 : QFileInfo::exists(localPath);
    if (t.policy == MergePolicy::SkipExisting && exists) {
        LOG_VERBOSE() << "FtpTransportAdapter: Keeping existing" << file.relativePath;
        t.bytesDone += file.size;
        ++t.nextFile;
        emitProgress();
        QTimer::singleShot(0, this, [this, token]() { advanceFolder(token); });
        return;
    }

    t.fileBytes = 0;
    t.fileSize = file.size;
    auto onSuccess = [this, token]() {
        transfer_->bytesDone += std::max(transfer_->fileBytes, transfer_->fileSize);
        transfer_->fileBytes = 0;
        ++transfer_->nextFile;
        emitProgress();
        advanceFolder(token);
    };
    if (t.upload) {
        queueStor(token, localPath, remotePath, onSuccess);
    } else {
        queueRetr(token, remotePath, localPath, onSuccess);
    }
}

void FtpTransportAdapter::cancelCurrentTransfer()
{
    if (!transfer_) {
        return;
    }
    qDebug() << "FtpTransportAdapter: Cancelling transfer" << transfer_->id;
    transferToken_.invalidate();
    transfer_.reset();

    QQueue<PendingCommand> kept;
    while (!commandQueue_.isEmpty()) {
        PendingCommand pending = commandQueue_.dequeue();
        if (!pending.belongsToTransfer) {
            kept.enqueue(std::move(pending));
        }
    }
    commandQueue_ = std::move(kept);

    if (current_.belongsToTransfer && isDataCommand(current_.cmd)) {
        const QString localPath = current_.cmd == Command::Retr ? current_.localPath : QString();
        resetDataState();
        if (!localPath.isEmpty() && !QFile::remove(localPath)) {
            qWarning() << "FtpTransportAdapter: Cannot remove partial file" << localPath;
        }
        current_ = PendingCommand();
        current_.cmd = Command::Abor;
        passivePhase_ = false;
        sendCurrentCommand();
    }
}

// Parsing

bool FtpTransportAdapter::parsePassiveResponse(const QString &text, QString *host, quint16 *port)
{
    // 227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)
    static const QRegularExpression rx(
        QStringLiteral("\\((\\d+),(\\d+),(\\d+),(\\d+),(\\d+),(\\d+)\\)"));
    const auto match = rx.match(text);
    if (!match.hasMatch()) {
        return false;
    }

    *host = QStringLiteral("%1.%2.%3.%4")
                .arg(match.captured(1), match.captured(2), match.captured(3), match.captured(4));
    const int p1 = match.captured(5).toInt();
    const int p2 = match.captured(6).toInt();
    *port = static_cast<quint16>((p1 * PassivePortMultiplier) + p2);
    return true;
}

QList<RemoteEntry> FtpTransportAdapter::parseDirectoryListing(const QByteArray &data,
                                                             const QDate &today)
{
    QList<RemoteEntry> entries;
    const QStringList lines = QString::fromUtf8(data).split(QLatin1Char('\n'), Qt::SkipEmptyParts);

    // drwxr-xr-x 2 user group 4096 Jan 1 12:00 dirname
    static const QRegularExpression unixRx(QStringLiteral(
        "^([dl\\-])([rwxsStT\\-]{9})\\S*\\s+\\d+\\s+\\S+\\s+\\S+\\s+(\\d+)\\s+"
        "(\\w{3})\\s+(\\d{1,2})\\s+(\\d{1,2}:\\d{2}|\\d{4})\\s+(.+)$"));

    for (QString line : lines) {
        if (line.endsWith(QLatin1Char('\r'))) {
            line.chop(1);
        }
        if (line.trimmed().isEmpty() || line.startsWith(QLatin1String("total "))) {
            continue;
        }

        RemoteEntry entry;
        const auto match = unixRx.match(line);
        if (match.hasMatch()) {
            entry.isDirectory = match.captured(1) == QLatin1String("d");
            entry.permissions = match.captured(2);
            entry.size = entry.isDirectory ? 0 : match.captured(3).toLongLong();
            entry.name = match.captured(7);
            if (match.captured(1) == QLatin1String("l")) {
                const int arrow = entry.name.indexOf(QLatin1String(" -> "));
                if (arrow > 0) {
                    entry.name.truncate(arrow);
                }
            }

            const int month = monthFromName(match.captured(4));
            const int day = match.captured(5).toInt();
            const QString yearOrTime = match.captured(6);
            if (month > 0) {
                QDate date;
                QTime time(0, 0);
                if (yearOrTime.contains(QLatin1Char(':'))) {
                    // Recent entries omit the year
                    time = QTime::fromString(yearOrTime, QStringLiteral("H:mm"));
                    date = QDate(today.year(), month, day);
                    if (date.isValid() && date > today.addDays(1)) {
                        date = QDate(today.year() - 1, month, day);
                    }
                } else {
                    date = QDate(yearOrTime.toInt(), month, day);
                }
                if (date.isValid()) {
                    entry.modified = QDateTime(date, time.isValid() ? time : QTime(0, 0), Qt::UTC);
                }
            }
        } else {
            entry.name = line.trimmed();
        }

        if (!entry.name.isEmpty() && entry.name != QLatin1String(".")
            && entry.name != QLatin1String("..")) {
            entries.append(entry);
        }
    }

    return entries;
}
