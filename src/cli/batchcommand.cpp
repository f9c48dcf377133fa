#include "batchcommand.h"

#include "services/errorhandler.h"
#include "services/ftptransportadapter.h"
#include "services/localtransportadapter.h"
#include "services/panelnavigator.h"
#include "services/sessionmanager.h"
#include "services/transferservice.h"
#include "services/transfersettings.h"
#include "utils/logging.h"

#include <QDebug>
#include <QTimer>

#include <cstdio>

BatchCommand::BatchCommand(const BatchCommandOptions &options, TransferSettings *settings,
                           QObject *parent)
    : QObject(parent)
    , options_(options)
    , settings_(settings)
    , errors_(new ErrorHandler(this))
    , navigator_(new PanelNavigator(this))
    , out_(stdout)
    , err_(stderr)
    , in_(stdin)
{
    sessions_ = new SessionManager(navigator_, &BatchCommand::createAdapter, this);
    service_ = new TransferService(sessions_, navigator_, settings_, errors_, this);

    connect(sessions_, &SessionManager::sessionRefreshed,
            this, &BatchCommand::onSessionRefreshed);
    connect(sessions_, &SessionManager::sessionConnectFailed,
            this, &BatchCommand::onSessionConnectFailed);
    connect(sessions_, &SessionManager::sessionReconnectFailed,
            this, &BatchCommand::onSessionConnectFailed);
    connect(navigator_, &PanelNavigator::remoteListingChanged,
            this, &BatchCommand::onRemoteListingChanged);
    connect(navigator_, &PanelNavigator::navigationFailed,
            this, &BatchCommand::onNavigationFailed);

    connect(service_, &TransferService::overwriteDecisionNeeded,
            this, &BatchCommand::onOverwriteDecisionNeeded);
    connect(service_, &TransferService::folderMergeDecisionNeeded,
            this, &BatchCommand::onFolderMergeDecisionNeeded);
    connect(service_, &TransferService::pauseRequested,
            this, &BatchCommand::onPauseRequested);
    connect(service_, &TransferService::batchFinished,
            this, &BatchCommand::onBatchFinished);
    connect(service_, &TransferService::transferRejected, this, [this](const QString &reason) {
        fail(ExitSetupError, reason);
    });
    connect(service_->runner(), &BatchRunner::itemFinished,
            this, &BatchCommand::onItemFinished);

    connect(errors_, &ErrorHandler::criticalError, this,
            [this](const QString &title, const QString &details) {
                err_ << title << ": " << details << Qt::endl;
            });
    connect(errors_, &ErrorHandler::statusMessage, this, [](const QString &message, int) {
        LOG_VERBOSE() << "BatchCommand: Status:" << message;
    });
}

BatchCommand::~BatchCommand() = default;

ITransportAdapter *BatchCommand::createAdapter(const ConnectionParams &params)
{
    return std::visit(Overloaded{
        [](const FtpParams &) -> ITransportAdapter * { return new FtpTransportAdapter; },
        [](const LocalMountParams &) -> ITransportAdapter * { return new LocalTransportAdapter; },
        [](const SftpParams &) -> ITransportAdapter * { return nullptr; },
        [](const S3Params &) -> ITransportAdapter * { return nullptr; },
        [](const WebDavParams &) -> ITransportAdapter * { return nullptr; },
        [](const OAuthParams &) -> ITransportAdapter * { return nullptr; },
    }, params);
}

void BatchCommand::start()
{
    QString error;
    const std::optional<ConnectionParams> params = connectionParamsFromUrl(options_.endpoint, &error);
    if (!params) {
        errors_->handleConfigurationError(error);
        fail(ExitSetupError, error);
        return;
    }

    if (!navigator_->navigateLocal(options_.localDirectory)) {
        fail(ExitSetupError, tr("Cannot open local directory %1").arg(options_.localDirectory));
        return;
    }

    step_ = Step::Connecting;
    out_ << tr("Connecting to %1").arg(endpointLabel(*params)) << Qt::endl;
    if (sessions_->createSession(QString(), *params).isEmpty() && step_ == Step::Connecting) {
        fail(ExitSetupError, tr("Invalid endpoint %1").arg(options_.endpoint.toDisplayString()));
    }
}

void BatchCommand::onSessionRefreshed(const QString &id)
{
    Q_UNUSED(id)
    if (step_ != Step::Connecting) {
        return;
    }
    if (options_.remoteDirectory.isEmpty()
        || navigator_->remotePath() == options_.remoteDirectory) {
        startTransfer();
        return;
    }
    step_ = Step::Navigating;
    if (!navigator_->navigateRemote(options_.remoteDirectory)) {
        fail(ExitSetupError, tr("Cannot open remote directory %1").arg(options_.remoteDirectory));
    }
}

void BatchCommand::onSessionConnectFailed(const QString &id, const QString &message)
{
    Q_UNUSED(id)
    if (step_ != Step::Connecting) {
        return;
    }
    fail(ExitConnectionError, message);
}

void BatchCommand::onRemoteListingChanged()
{
    if (step_ == Step::Navigating) {
        startTransfer();
    }
}

void BatchCommand::onNavigationFailed(Panel panel, const QString &path, const QString &message)
{
    errors_->handleNavigationError(path, message);
    if (step_ == Step::Navigating && panel == Panel::Remote) {
        fail(ExitSetupError, message);
    }
}

void BatchCommand::startTransfer()
{
    step_ = Step::Transferring;
    const bool upload = options_.direction == TransferDirection::Upload;
    out_ << tr("%1 %2 item(s): %3 -> %4")
                .arg(upload ? tr("Uploading") : tr("Downloading"))
                .arg(options_.names.size())
                .arg(upload ? navigator_->localPath() : navigator_->remotePath(),
                     upload ? navigator_->remotePath() : navigator_->localPath())
         << Qt::endl;

    const int batchId = upload ? service_->uploadNames(options_.names)
                               : service_->downloadNames(options_.names);
    if (batchId < 0 && step_ == Step::Transferring) {
        fail(ExitSetupError, tr("The batch could not be started"));
    }
}

QString BatchCommand::ask(const QString &question)
{
    out_ << question << ' ' << Qt::flush;
    return in_.readLine().trimmed();
}

void BatchCommand::onOverwriteDecisionNeeded(const OverwriteQuery &query)
{
    OverwriteDecision decision;
    if (!options_.interactive) {
        out_ << tr("Skipping existing %1").arg(query.filename) << Qt::endl;
        decision.action = OverwriteAction::Skip;
        if (!service_->respondToOverwrite(decision)) {
            qWarning() << "BatchCommand: Overwrite answer for" << query.filename << "was not taken";
        }
        return;
    }

    QString details;
    if (query.destination && query.destination->isDirectory) {
        details = tr(" as a folder; overwrite renames the file instead");
    } else if (query.destination) {
        details = tr(" (existing: %1 bytes, %2; new: %3 bytes, %4)")
                      .arg(query.destination->size)
                      .arg(query.destination->modified.toString(Qt::ISODate))
                      .arg(query.size)
                      .arg(query.modified.toString(Qt::ISODate));
    }
    const QString answer = ask(tr("%1 exists%2. [o]verwrite, [s]kip, [r]ename, [c]ancel "
                                  "(capital letter applies to the %3 remaining):")
                                   .arg(query.filename, details)
                                   .arg(query.remainingQueueCount));

    const QChar choice = answer.isEmpty() ? QLatin1Char('s') : answer.at(0);
    decision.applyToAll = choice.isUpper();
    switch (choice.toLower().toLatin1()) {
    case 'o':
        decision.action = OverwriteAction::Overwrite;
        break;
    case 'r':
        decision.action = OverwriteAction::Rename;
        if (!decision.applyToAll) {
            decision.newName = ask(tr("New name (empty for automatic):"));
        }
        break;
    case 'c':
        decision.action = OverwriteAction::Cancel;
        break;
    default:
        decision.action = OverwriteAction::Skip;
        break;
    }
    if (!service_->respondToOverwrite(decision)) {
        qWarning() << "BatchCommand: Overwrite answer for" << query.filename << "was not taken";
    }
}

void BatchCommand::onFolderMergeDecisionNeeded(const FolderMergeQuery &query)
{
    FolderMergeDecision decision;
    if (!options_.interactive) {
        out_ << tr("Skipping existing folder %1").arg(query.folderName) << Qt::endl;
        decision.action = FolderMergeAction::Skip;
        if (!service_->respondToFolderMerge(decision)) {
            qWarning() << "BatchCommand: Merge answer for" << query.folderName << "was not taken";
        }
        return;
    }

    const QString answer = ask(tr("Folder %1 exists. [m]erge and overwrite, merge and [k]eep "
                                  "existing, [r]eplace, [s]kip, [c]ancel "
                                  "(capital letter applies to the %2 remaining):")
                                   .arg(query.folderName)
                                   .arg(query.remainingQueueCount));

    const QChar choice = answer.isEmpty() ? QLatin1Char('s') : answer.at(0);
    decision.applyToAll = choice.isUpper();
    switch (choice.toLower().toLatin1()) {
    case 'm':
        decision.action = FolderMergeAction::MergeOverwrite;
        break;
    case 'k':
        decision.action = FolderMergeAction::MergeSkipExisting;
        break;
    case 'r':
        decision.action = FolderMergeAction::Replace;
        break;
    case 'c':
        decision.action = FolderMergeAction::Cancel;
        break;
    default:
        decision.action = FolderMergeAction::Skip;
        break;
    }
    if (!service_->respondToFolderMerge(decision)) {
        qWarning() << "BatchCommand: Merge answer for" << query.folderName << "was not taken";
    }
}

void BatchCommand::onPauseRequested(const PauseInfo &info)
{
    err_ << tr("Paused at %1: %2").arg(info.filename, pauseReasonDescription(info.reason))
         << Qt::endl;
    if (!info.message.isEmpty()) {
        err_ << "  " << info.message << Qt::endl;
    }

    const bool resume = options_.interactive
        && ask(tr("Resume the batch? [y/N]:")).startsWith(QLatin1Char('y'), Qt::CaseInsensitive);
    const bool accepted = resume ? service_->resume() : service_->cancelPaused();
    if (!accepted) {
        qWarning() << "BatchCommand: Pause answer was not taken";
    }
}

void BatchCommand::onItemFinished(const QString &itemId, TransferItem::Status status)
{
    const TransferItem item = service_->queue()->item(itemId);
    QString label = QString::fromLatin1(transferStatusToString(status));
    if (status == TransferItem::Status::Completed && item.skipped) {
        label = QStringLiteral("skipped");
    }
    out_ << '[' << label << "] " << item.filename;
    if (!item.errorMessage.isEmpty()) {
        out_ << ": " << item.errorMessage;
    }
    out_ << Qt::endl;
}

void BatchCommand::onBatchFinished(const BatchSummary &summary)
{
    if (step_ != Step::Transferring) {
        return;
    }
    out_ << tr("Batch %1 %2: %3 of %4 completed, %5 skipped, %6 failed, %7 stopped")
                .arg(summary.batchId)
                .arg(QString::fromLatin1(batchFinishReasonToString(summary.reason)))
                .arg(summary.completed)
                .arg(summary.total)
                .arg(summary.skipped)
                .arg(summary.failed)
                .arg(summary.stopped)
         << Qt::endl;
    if (!summary.message.isEmpty()) {
        out_ << summary.message << Qt::endl;
    }

    const bool clean = summary.reason == BatchFinishReason::Completed
        && summary.failed == 0 && summary.stopped == 0;
    finish(clean ? ExitSuccess : ExitIncomplete);
}

void BatchCommand::fail(int exitCode, const QString &message)
{
    if (step_ == Step::Done) {
        return;
    }
    qWarning() << "BatchCommand:" << message;
    err_ << tr("Error: %1").arg(message) << Qt::endl;
    finish(exitCode);
}

void BatchCommand::finish(int exitCode)
{
    if (step_ == Step::Done) {
        return;
    }
    step_ = Step::Done;
    // Deferred so that the engine unwinds before the connection goes away
    QTimer::singleShot(0, this, [this, exitCode]() {
        sessions_->disconnectAll();
        emit finished(exitCode);
    });
}
