#include "panelnavigator.h"

#include "utils/localdirectory.h"
#include "utils/logging.h"
#include "utils/pathutils.h"

#include <QDebug>
#include <QDir>

PanelNavigator::PanelNavigator(QObject *parent)
    : QObject(parent)
    , localPath_(QDir::homePath())
{
}

PanelNavigator::~PanelNavigator()
{
    if (adapter_) {
        disconnect(adapter_, nullptr, this, nullptr);
    }
}

void PanelNavigator::setTransportAdapter(ITransportAdapter *adapter)
{
    if (adapter_ == adapter) {
        return;
    }
    if (adapter_) {
        disconnect(adapter_, nullptr, this, nullptr);
    }

    adapter_ = adapter;
    // Responses from the previous adapter must not land in the new session
    remoteGeneration_.invalidate();
    remoteRequest_ = RemoteRequest::None;

    if (adapter) {
        connect(adapter, &ITransportAdapter::directoryListed,
                this, &PanelNavigator::onDirectoryListed);
        connect(adapter, &ITransportAdapter::directoryCreated,
                this, &PanelNavigator::onDirectoryCreated);
        connect(adapter, &ITransportAdapter::directoryFailed,
                this, &PanelNavigator::onDirectoryFailed);
    }
}

PanelState PanelNavigator::panelState() const
{
    PanelState state;
    state.remotePath = remotePath_;
    state.localPath = localPath_;
    state.remoteListing = remoteListing_;
    state.localListing = localListing_;
    state.sync = syncEngine_.state();
    return state;
}

void PanelNavigator::restoreState(const PanelState &state)
{
    remoteGeneration_.invalidate();
    remoteRequest_ = RemoteRequest::None;
    missingTarget_.clear();

    const bool syncWas = syncEngine_.isEnabled();
    syncEngine_.restore(state.sync);

    remotePath_ = PathUtils::normalize(state.remotePath);
    localPath_ = state.localPath;
    remoteListing_ = state.remoteListing;
    localListing_ = state.localListing;

    emit remotePathChanged(remotePath_);
    emit localPathChanged(localPath_);
    emit remoteListingChanged();
    emit localListingChanged();
    if (syncWas != syncEngine_.isEnabled()) {
        emit syncChanged(syncEngine_.isEnabled());
    }
}

bool PanelNavigator::navigateRemote(const QString &path)
{
    const QString target = PathUtils::normalize(path);
    if (!syncEngine_.isNavigationAllowed(Panel::Remote, target)) {
        qDebug() << "PanelNavigator: Remote navigation to" << target << "blocked by sync";
        emit navigationBlocked(Panel::Remote, target);
        return false;
    }
    if (!adapter_) {
        qWarning() << "PanelNavigator: No transport adapter for remote navigation";
        return false;
    }
    requestRemote(RemoteRequest::Navigate, target);
    return true;
}

bool PanelNavigator::navigateLocal(const QString &path)
{
    const QString target = PathUtils::normalize(path);
    if (!syncEngine_.isNavigationAllowed(Panel::Local, target)) {
        qDebug() << "PanelNavigator: Local navigation to" << target << "blocked by sync";
        emit navigationBlocked(Panel::Local, target);
        return false;
    }
    return applyLocal(target, true);
}

quint64 PanelNavigator::refreshRemote()
{
    if (!adapter_) {
        qWarning() << "PanelNavigator: No transport adapter to refresh";
        return 0;
    }
    return requestRemote(RemoteRequest::Refresh, remotePath_);
}

bool PanelNavigator::refreshLocal()
{
    return applyLocal(localPath_, false);
}

bool PanelNavigator::enableSync()
{
    if (syncEngine_.isEnabled()) {
        return true;
    }
    if (localPath_.isEmpty()) {
        qWarning() << "PanelNavigator: Cannot enable sync without a local path";
        return false;
    }
    syncEngine_.enable(remotePath_, localPath_);
    emit syncChanged(true);
    return true;
}

void PanelNavigator::disableSync()
{
    missingTarget_.clear();
    if (!syncEngine_.isEnabled()) {
        return;
    }
    syncEngine_.disable();
    emit syncChanged(false);
}

bool PanelNavigator::toggleSync()
{
    if (syncEngine_.isEnabled()) {
        disableSync();
        return false;
    }
    return enableSync();
}

bool PanelNavigator::createMissingMirrorTarget()
{
    if (missingTarget_.isEmpty()) {
        qWarning() << "PanelNavigator: No missing mirror target to create";
        return false;
    }

    const QString target = missingTarget_;
    const Panel panel = missingPanel_;
    missingTarget_.clear();

    if (panel == Panel::Local) {
        if (!QDir().mkpath(target)) {
            qWarning() << "PanelNavigator: Failed to create local directory" << target;
            emit navigationFailed(Panel::Local, target,
                                  tr("Could not create directory %1").arg(target));
            return false;
        }
        return applyLocal(target, false);
    }

    if (!adapter_) {
        qWarning() << "PanelNavigator: No transport adapter to create" << target;
        return false;
    }
    requestRemote(RemoteRequest::MakeMirrorTarget, target);
    return true;
}

quint64 PanelNavigator::requestRemote(RemoteRequest kind, const QString &path)
{
    const quint64 generation = remoteGeneration_.next();
    remoteRequest_ = kind;
    remoteRequestPath_ = path;

    LOG_VERBOSE() << "PanelNavigator: Remote request" << generation << path;

    switch (kind) {
    case RemoteRequest::Navigate:
    case RemoteRequest::MirrorNavigate:
        adapter_->changeDirectory(generation, path);
        break;
    case RemoteRequest::Refresh:
        adapter_->listDirectory(generation, path);
        break;
    case RemoteRequest::MakeMirrorTarget:
        adapter_->makeDirectory(generation, path);
        break;
    case RemoteRequest::None:
        break;
    }
    return generation;
}

void PanelNavigator::onDirectoryListed(quint64 generation, const DirectoryListing &listing)
{
    if (!remoteGeneration_.isCurrent(generation)) {
        LOG_VERBOSE() << "PanelNavigator: Dropping stale listing" << generation;
        return;
    }

    const RemoteRequest kind = remoteRequest_;
    remoteRequest_ = RemoteRequest::None;

    const QString newPath = PathUtils::normalize(
        listing.currentPath.isEmpty() ? remoteRequestPath_ : listing.currentPath);
    const bool pathChanged = newPath != remotePath_;
    remotePath_ = newPath;
    remoteListing_ = listing.entries;

    if (pathChanged) {
        emit remotePathChanged(remotePath_);
    }
    emit remoteListingChanged();
    emit remoteListingApplied(generation, listing);

    if (kind == RemoteRequest::Navigate) {
        mirrorFrom(Panel::Remote, remotePath_);
    }
}

void PanelNavigator::onDirectoryCreated(quint64 generation, const QString &path)
{
    if (!remoteGeneration_.isCurrent(generation)
        || remoteRequest_ != RemoteRequest::MakeMirrorTarget) {
        return;
    }
    qDebug() << "PanelNavigator: Created remote directory" << path;
    requestRemote(RemoteRequest::MirrorNavigate, remoteRequestPath_);
}

void PanelNavigator::onDirectoryFailed(quint64 generation, const QString &path,
                                       const QString &message)
{
    if (!remoteGeneration_.isCurrent(generation)) {
        LOG_VERBOSE() << "PanelNavigator: Dropping stale failure" << generation;
        return;
    }

    const RemoteRequest kind = remoteRequest_;
    remoteRequest_ = RemoteRequest::None;
    emit remoteListingFailed(generation, path, message);

    if (kind == RemoteRequest::MirrorNavigate && syncEngine_.isEnabled()) {
        qDebug() << "PanelNavigator: Mirrored remote directory missing:" << path;
        missingPanel_ = Panel::Remote;
        missingTarget_ = remoteRequestPath_;
        emit mirrorTargetMissing(Panel::Remote, missingTarget_);
        return;
    }

    qWarning() << "PanelNavigator: Remote request for" << path << "failed:" << message;
    emit navigationFailed(Panel::Remote, path, message);
}

bool PanelNavigator::applyLocal(const QString &path, bool mirror)
{
    QList<RemoteEntry> entries;
    QString error;
    if (!LocalDirectory::read(path, &entries, &error)) {
        qWarning() << "PanelNavigator: Cannot read local directory" << path << "-" << error;
        emit navigationFailed(Panel::Local, path, error);
        return false;
    }

    const bool pathChanged = path != localPath_;
    localPath_ = path;
    localListing_ = entries;
    if (pathChanged) {
        emit localPathChanged(localPath_);
    }
    emit localListingChanged();

    if (mirror) {
        mirrorFrom(Panel::Local, localPath_);
    }
    return true;
}

void PanelNavigator::mirrorFrom(Panel panel, const QString &path)
{
    const MirrorResult result = syncEngine_.mirror(panel, path);
    if (result.kind != MirrorResult::Kind::Mirror) {
        return;
    }

    if (panel == Panel::Local) {
        if (!adapter_) {
            return;
        }
        // A failure of this request means the mirrored directory is missing
        requestRemote(RemoteRequest::MirrorNavigate, result.targetPath);
        return;
    }

    if (!QDir(result.targetPath).exists()) {
        qDebug() << "PanelNavigator: Mirrored local directory missing:" << result.targetPath;
        missingPanel_ = Panel::Local;
        missingTarget_ = result.targetPath;
        emit mirrorTargetMissing(Panel::Local, missingTarget_);
        return;
    }
    applyLocal(result.targetPath, false);
}
