#include "sessionmanager.h"

#include "batchrunner.h"
#include "itransportadapter.h"
#include "utils/logging.h"

#include <QDebug>

const char *sessionStatusToString(Session::Status status)
{
    switch (status) {
    case Session::Status::Connecting: return "connecting";
    case Session::Status::Connected: return "connected";
    case Session::Status::Cached: return "cached";
    case Session::Status::Disconnected: return "disconnected";
    }
    return "disconnected";
}

SessionManager::SessionManager(PanelNavigator *navigator, AdapterFactory factory,
                               QObject *parent)
    : QObject(parent)
    , navigator_(navigator)
    , factory_(std::move(factory))
{
    connect(navigator, &PanelNavigator::remoteListingApplied,
            this, &SessionManager::onRemoteListingApplied);
    connect(navigator, &PanelNavigator::remoteListingFailed,
            this, &SessionManager::onRemoteListingFailed);
}

SessionManager::~SessionManager()
{
    if (adapter_) {
        disconnect(adapter_, nullptr, this, nullptr);
    }
}

void SessionManager::setBatchRunner(BatchRunner *runner)
{
    runner_ = runner;
    if (runner_) {
        runner_->setTransportAdapter(adapter_);
    }
}

QString SessionManager::createSession(const QString &label, const ConnectionParams &params)
{
    const QString error = validateConnectionParams(params);
    if (!error.isEmpty()) {
        qWarning() << "SessionManager: Invalid connection parameters:" << error;
        emit sessionConnectFailed(QString(), error);
        return QString();
    }
    if (isBatchRunning()) {
        emit switchBlocked(QString(), tr("A transfer is in progress"));
        return QString();
    }

    captureActive();

    Session session;
    session.id = QStringLiteral("session-%1").arg(nextSessionId_++);
    session.serverLabel = label.isEmpty() ? endpointLabel(params) : label;
    session.status = Session::Status::Connecting;
    session.params = params;
    session.panels.remotePath = initialRemotePath(params);
    session.panels.localPath = navigator_->localPath();
    session.panels.localListing = navigator_->localListing();

    sessions_.append(session);
    activeId_ = session.id;
    qDebug() << "SessionManager: Created" << session.id << protocolName(params)
             << session.serverLabel;

    navigator_->restoreState(session.panels);
    emit sessionAdded(session.id);
    emit activeSessionChanged(session.id);

    connectActive(true);
    return session.id;
}

bool SessionManager::switchTo(const QString &id)
{
    if (id == activeId_) {
        return true;
    }
    const int index = indexOf(id);
    if (index < 0) {
        qWarning() << "SessionManager: Unknown session" << id;
        return false;
    }
    if (isBatchRunning()) {
        qDebug() << "SessionManager: Switch to" << id << "refused, batch running";
        emit switchBlocked(id, tr("A transfer is in progress"));
        return false;
    }

    // Phase 1: no I/O, the incoming session's cached state shows at once
    captureActive();
    activeId_ = id;
    navigator_->restoreState(sessions_[index].panels);
    emit activeSessionChanged(id);

    // Phase 2: reconnect in the background
    connectActive(false);
    return true;
}

bool SessionManager::closeSession(const QString &id)
{
    const int index = indexOf(id);
    if (index < 0) {
        qWarning() << "SessionManager: Cannot close unknown session" << id;
        return false;
    }

    if (id != activeId_) {
        removeAt(index);
        return true;
    }

    if (isBatchRunning()) {
        emit switchBlocked(id, tr("A transfer is in progress"));
        return false;
    }

    switchGeneration_.invalidate();
    refreshGeneration_ = 0;
    teardownAdapter();
    installAdapter(nullptr);
    activeId_.clear();
    removeAt(indexOf(id));

    if (!sessions_.isEmpty()) {
        switchTo(sessions_.first().id);
    } else {
        emit activeSessionChanged(QString());
    }
    return true;
}

void SessionManager::disconnectAll()
{
    if (runner_ && runner_->isRunning()) {
        runner_->requestHardCancel();
    }

    switchGeneration_.invalidate();
    refreshGeneration_ = 0;
    teardownAdapter();
    installAdapter(nullptr);

    const bool hadActive = !activeId_.isEmpty();
    activeId_.clear();
    while (!sessions_.isEmpty()) {
        removeAt(sessions_.size() - 1);
    }
    if (hadActive) {
        emit activeSessionChanged(QString());
    }
    qDebug() << "SessionManager: All sessions disconnected";
}

Session SessionManager::session(const QString &id) const
{
    const int index = indexOf(id);
    return index >= 0 ? sessions_[index] : Session();
}

bool SessionManager::isActiveConnected() const
{
    const int index = indexOf(activeId_);
    return index >= 0 && sessions_[index].status == Session::Status::Connected
        && adapter_ && adapter_->isConnected();
}

int SessionManager::indexOf(const QString &id) const
{
    for (int i = 0; i < sessions_.size(); ++i) {
        if (sessions_[i].id == id) {
            return i;
        }
    }
    return -1;
}

bool SessionManager::isBatchRunning() const
{
    return runner_ && runner_->isRunning();
}

void SessionManager::captureActive()
{
    const int index = indexOf(activeId_);
    if (index < 0) {
        return;
    }
    sessions_[index].panels = navigator_->panelState();
    LOG_VERBOSE() << "SessionManager: Captured" << activeId_ << "at"
                  << sessions_[index].panels.remotePath;
    setStatus(activeId_, Session::Status::Cached);
}

void SessionManager::connectActive(bool isNewSession)
{
    const int index = indexOf(activeId_);
    if (index < 0) {
        return;
    }

    teardownAdapter();
    refreshGeneration_ = 0;
    const quint64 token = switchGeneration_.next();
    const QString id = activeId_;

    ITransportAdapter *adapter = factory_ ? factory_(sessions_[index].params) : nullptr;
    if (!adapter) {
        const QString message = tr("No transport for %1").arg(protocolName(sessions_[index].params));
        qWarning() << "SessionManager:" << message;
        onOpenFinished(token, id, isNewSession, false, message);
        return;
    }
    adapter->setParent(this);

    connect(adapter, &ITransportAdapter::openFinished, this,
            [this, token, id, isNewSession](bool success, const QString &message) {
                onOpenFinished(token, id, isNewSession, success, message);
            });
    connect(adapter, &ITransportAdapter::disconnected, this,
            [this, token]() { onAdapterDisconnected(token); });

    setStatus(id, Session::Status::Connecting);
    installAdapter(adapter);
    adapter->open(sessions_[index].params);
}

void SessionManager::onOpenFinished(quint64 token, const QString &id, bool isNewSession,
                                    bool success, const QString &message)
{
    if (!switchGeneration_.isCurrent(token) || id != activeId_) {
        LOG_VERBOSE() << "SessionManager: Dropping stale open result for" << id;
        return;
    }

    if (success) {
        qDebug() << "SessionManager:" << id << "connected";
        setStatus(id, Session::Status::Connected);
        refreshGeneration_ = navigator_->refreshRemote();
        return;
    }

    qWarning() << "SessionManager: Connecting" << id << "failed:" << message;
    if (isNewSession) {
        switchGeneration_.invalidate();
        teardownAdapter();
        installAdapter(nullptr);
        activeId_.clear();
        removeAt(indexOf(id));
        emit activeSessionChanged(QString());
        emit sessionConnectFailed(id, message);
        return;
    }

    setStatus(id, Session::Status::Cached);
    emit sessionReconnectFailed(id, message);
}

void SessionManager::onAdapterDisconnected(quint64 token)
{
    if (!switchGeneration_.isCurrent(token) || isBatchRunning()) {
        return;
    }
    const int index = indexOf(activeId_);
    if (index >= 0 && sessions_[index].status == Session::Status::Connected) {
        qDebug() << "SessionManager:" << activeId_ << "lost its connection";
        setStatus(activeId_, Session::Status::Cached);
    }
}

void SessionManager::onRemoteListingApplied(quint64 generation, const DirectoryListing &listing)
{
    Q_UNUSED(listing)
    if (refreshGeneration_ == 0 || generation != refreshGeneration_) {
        return;
    }
    refreshGeneration_ = 0;

    const int index = indexOf(activeId_);
    if (index < 0) {
        return;
    }
    sessions_[index].panels = navigator_->panelState();
    emit sessionRefreshed(activeId_);
}

void SessionManager::onRemoteListingFailed(quint64 generation, const QString &path,
                                           const QString &message)
{
    if (refreshGeneration_ == 0 || generation != refreshGeneration_) {
        return;
    }
    refreshGeneration_ = 0;

    qWarning() << "SessionManager: Refreshing" << path << "for" << activeId_
               << "failed:" << message;
    setStatus(activeId_, Session::Status::Cached);
    emit sessionReconnectFailed(activeId_, message);
}

void SessionManager::teardownAdapter()
{
    if (!adapter_) {
        return;
    }
    ITransportAdapter *old = adapter_;
    disconnect(old, nullptr, this, nullptr);
    old->disconnectFromEndpoint();
    old->deleteLater();
    adapter_ = nullptr;
}

void SessionManager::installAdapter(ITransportAdapter *adapter)
{
    adapter_ = adapter;
    navigator_->setTransportAdapter(adapter);
    if (runner_) {
        runner_->setTransportAdapter(adapter);
    }
    emit activeAdapterChanged(adapter);
}

void SessionManager::setStatus(const QString &id, Session::Status status)
{
    const int index = indexOf(id);
    if (index < 0 || sessions_[index].status == status) {
        return;
    }
    LOG_VERBOSE() << "SessionManager:" << id << sessionStatusToString(sessions_[index].status)
                  << "->" << sessionStatusToString(status);
    sessions_[index].status = status;
    emit sessionStatusChanged(id, status);
}

void SessionManager::removeAt(int index)
{
    if (index < 0 || index >= sessions_.size()) {
        return;
    }
    const QString id = sessions_[index].id;
    setStatus(id, Session::Status::Disconnected);
    sessions_.removeAt(index);
    emit sessionRemoved(id);
}
