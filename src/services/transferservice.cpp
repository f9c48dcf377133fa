#include "transferservice.h"

#include "circuitbreaker.h"
#include "errorhandler.h"
#include "panelnavigator.h"
#include "sessionmanager.h"
#include "transfersettings.h"
#include "utils/pathutils.h"

#include <QDebug>

TransferService::TransferService(SessionManager *sessions,
                                 PanelNavigator *navigator,
                                 TransferSettings *settings,
                                 ErrorHandler *errors,
                                 QObject *parent)
    : QObject(parent)
    , sessions_(sessions)
    , navigator_(navigator)
    , settings_(settings)
    , errors_(errors)
    , queue_(new TransferQueue(this))
    , breaker_(new CircuitBreaker(this))
    , overwriteNegotiator_(new OverwriteNegotiator(this))
    , folderNegotiator_(new FolderMergeNegotiator(this))
    , runner_(new BatchRunner(queue_, breaker_, overwriteNegotiator_, folderNegotiator_, this))
{
    sessions->setBatchRunner(runner_);

    connect(runner_, &BatchRunner::batchStarted,
            this, &TransferService::batchStarted);
    connect(runner_, &BatchRunner::batchFinished,
            this, &TransferService::onBatchFinished);
    connect(runner_, &BatchRunner::pauseRequested,
            this, &TransferService::pauseRequested);
    connect(runner_, &BatchRunner::itemFinished,
            this, &TransferService::onItemFinished);
    connect(overwriteNegotiator_, &OverwriteNegotiator::overwriteDecisionNeeded,
            this, &TransferService::overwriteDecisionNeeded);
    connect(folderNegotiator_, &FolderMergeNegotiator::folderMergeDecisionNeeded,
            this, &TransferService::folderMergeDecisionNeeded);

    if (errors) {
        connect(runner_, &BatchRunner::batchNotification,
                errors, &ErrorHandler::handleBatchNotification);
    }

    if (settings) {
        connect(settings, &TransferSettings::settingsChanged, this, [this]() {
            if (runner_->isRunning()) {
                settingsDirty_ = true;
            } else {
                applySettings();
            }
        });
    }
    applySettings();
}

TransferService::~TransferService() = default;

int TransferService::uploadNames(const QStringList &names)
{
    return startFromPanel(TransferDirection::Upload, names);
}

int TransferService::downloadNames(const QStringList &names)
{
    return startFromPanel(TransferDirection::Download, names);
}

int TransferService::startFromPanel(TransferDirection direction, const QStringList &names)
{
    if (!sessions_ || !sessions_->isActiveConnected()) {
        reject(tr("Not connected"));
        return -1;
    }
    if (runner_->isRunning()) {
        reject(tr("A transfer is already in progress"));
        return -1;
    }
    if (names.isEmpty()) {
        reject(tr("Nothing selected"));
        return -1;
    }

    const bool upload = direction == TransferDirection::Upload;
    const QString sourceDir = upload ? navigator_->localPath() : navigator_->remotePath();
    const QList<RemoteEntry> sourceListing = upload ? navigator_->localListing()
                                                    : navigator_->remoteListing();

    BatchRequest request;
    request.direction = direction;
    request.destinationDirectory = upload ? navigator_->remotePath() : navigator_->localPath();
    request.destinationEntries = upload ? navigator_->remoteListing()
                                        : navigator_->localListing();

    for (const QString &name : names) {
        bool found = false;
        for (const RemoteEntry &entry : sourceListing) {
            if (entry.name != name) {
                continue;
            }
            TransferRequest item;
            item.name = entry.name;
            item.sourcePath = PathUtils::join(sourceDir, entry.name);
            item.size = entry.size;
            item.modified = entry.modified;
            item.isFolder = entry.isDirectory;
            request.items.append(item);
            found = true;
            break;
        }
        if (!found) {
            qWarning() << "TransferService:" << name << "is not in" << sourceDir;
        }
    }

    if (request.items.isEmpty()) {
        reject(tr("None of the selected entries exist in %1").arg(sourceDir));
        return -1;
    }

    lastDirection_ = direction;
    return runner_->startBatch(request);
}

void TransferService::cancelSoft()
{
    runner_->requestSoftCancel();
}

void TransferService::cancelHard()
{
    runner_->requestHardCancel();
}

bool TransferService::resume()
{
    return runner_->resume();
}

bool TransferService::cancelPaused()
{
    return runner_->cancelPaused();
}

bool TransferService::respondToOverwrite(const OverwriteDecision &decision)
{
    return overwriteNegotiator_->respond(decision);
}

bool TransferService::respondToFolderMerge(const FolderMergeDecision &decision)
{
    return folderNegotiator_->respond(decision);
}

bool TransferService::retryItem(const QString &itemId)
{
    if (!sessions_ || !sessions_->isActiveConnected()) {
        return reject(tr("Not connected"));
    }
    return queue_->retryItem(itemId);
}

int TransferService::removeFinished()
{
    return queue_->removeFinished();
}

bool TransferService::clear()
{
    if (runner_->isRunning()) {
        qWarning() << "TransferService: Cannot clear the queue while a batch is running";
        return false;
    }
    queue_->clear();
    return true;
}

bool TransferService::isRunning() const
{
    return runner_->isRunning();
}

bool TransferService::isPaused() const
{
    return runner_->isPaused();
}

void TransferService::applySettings()
{
    settingsDirty_ = false;
    if (!settings_) {
        return;
    }
    breaker_->setConfig(settings_->breakerConfig());
    overwriteNegotiator_->setDefaultAction(settings_->fileExistsAction());
    folderNegotiator_->setDefaultAction(settings_->folderExistsAction());
}

void TransferService::onItemFinished(const QString &itemId, TransferItem::Status status)
{
    if (status != TransferItem::Status::Failed || !errors_) {
        return;
    }
    const TransferItem item = queue_->item(itemId);
    errors_->handleTransferFailed(item.filename, item.errorMessage);
}

void TransferService::onBatchFinished(const BatchSummary &summary)
{
    if (settingsDirty_) {
        applySettings();
    }

    // Show what landed in the destination panel
    if (navigator_ && sessions_ && sessions_->isActiveConnected()) {
        if (lastDirection_ == TransferDirection::Upload) {
            navigator_->refreshRemote();
        } else {
            navigator_->refreshLocal();
        }
    }
    emit batchFinished(summary);
}

bool TransferService::reject(const QString &reason)
{
    qWarning() << "TransferService: Rejected:" << reason;
    emit transferRejected(reason);
    return false;
}
