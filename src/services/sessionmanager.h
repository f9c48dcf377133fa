/**
 * @file sessionmanager.h
 * @brief Cached remote sessions with instant switching.
 */

#ifndef SESSIONMANAGER_H
#define SESSIONMANAGER_H

#include <QList>
#include <QObject>
#include <QPointer>
#include <QString>

#include <functional>

#include "connectionparams.h"
#include "panelnavigator.h"
#include "utils/generationtoken.h"

class BatchRunner;
class ITransportAdapter;

/**
 * @brief One remote endpoint the user connected to, with its panel snapshot.
 */
struct Session {
    enum class Status { Connecting, Connected, Cached, Disconnected };

    QString id;
    QString serverLabel;
    Status status = Status::Connecting;
    ConnectionParams params;

    /// Paths, listings and sync state as last seen while this session was active
    PanelState panels;
};

[[nodiscard]] const char *sessionStatusToString(Session::Status status);

Q_DECLARE_METATYPE(Session)

/**
 * @brief Manages N sessions of which exactly one is active.
 *
 * Only the active session holds a live transport adapter. Switching is
 * two-phase:
 * - Phase 1 (synchronous): the outgoing session's live panel state is
 *   captured into its record and the incoming record's cached state is
 *   restored into the PanelNavigator, so the UI shows it at once.
 * - Phase 2 (asynchronous): a fresh adapter is opened with the saved
 *   parameters and the remote listing is refreshed. Success marks the session
 *   connected and updates its cache; failure downgrades it to cached.
 *
 * Phase-2 responses carry the switch generation; a response belonging to an
 * earlier switch is dropped. Switching, closing the active session and
 * creating sessions are refused while a batch is running.
 */
class SessionManager : public QObject
{
    Q_OBJECT

public:
    /// Creates an unopened adapter suitable for the given parameters.
    using AdapterFactory = std::function<ITransportAdapter *(const ConnectionParams &)>;

    SessionManager(PanelNavigator *navigator, AdapterFactory factory,
                   QObject *parent = nullptr);
    ~SessionManager() override;

    /**
     * @brief Sets the runner whose activity blocks switching. The runner
     * also receives the active adapter.
     */
    void setBatchRunner(BatchRunner *runner);

    /// @name Session lifecycle
    /// @{

    /**
     * @brief Adds a session and makes it active.
     *
     * The session starts as Connecting and is removed again if the
     * connection cannot be opened (sessionConnectFailed()).
     *
     * @return The new session id, or an empty string if the parameters are
     * invalid or a batch is running.
     */
    QString createSession(const QString &label, const ConnectionParams &params);

    /**
     * @brief Makes @p id the active session.
     * @return false if the id is unknown or a batch is running.
     */
    bool switchTo(const QString &id);

    bool closeSession(const QString &id);

    /// Removes every session. A running batch is cancelled first.
    void disconnectAll();
    /// @}

    [[nodiscard]] bool contains(const QString &id) const { return indexOf(id) >= 0; }
    [[nodiscard]] Session session(const QString &id) const;
    [[nodiscard]] QList<Session> sessions() const { return sessions_; }
    [[nodiscard]] QString activeSessionId() const { return activeId_; }
    [[nodiscard]] ITransportAdapter *activeAdapter() const { return adapter_; }
    [[nodiscard]] bool isActiveConnected() const;

signals:
    void sessionAdded(const QString &id);
    void sessionRemoved(const QString &id);
    void sessionStatusChanged(const QString &id, Session::Status status);
    void activeSessionChanged(const QString &id);
    void activeAdapterChanged(ITransportAdapter *adapter);

    /// Phase 2 finished and the session's cached listing was updated.
    void sessionRefreshed(const QString &id);

    /// Phase 2 failed; the session is now cached.
    void sessionReconnectFailed(const QString &id, const QString &message);

    /// A new session could not be opened and was removed.
    void sessionConnectFailed(const QString &id, const QString &message);

    void switchBlocked(const QString &id, const QString &reason);

private slots:
    void onRemoteListingApplied(quint64 generation, const DirectoryListing &listing);
    void onRemoteListingFailed(quint64 generation, const QString &path, const QString &message);

private:
    [[nodiscard]] int indexOf(const QString &id) const;
    [[nodiscard]] bool isBatchRunning() const;
    void captureActive();
    void connectActive(bool isNewSession);
    void onOpenFinished(quint64 token, const QString &id, bool isNewSession,
                        bool success, const QString &message);
    void onAdapterDisconnected(quint64 token);
    void teardownAdapter();
    void installAdapter(ITransportAdapter *adapter);
    void setStatus(const QString &id, Session::Status status);
    void removeAt(int index);

    QPointer<PanelNavigator> navigator_;
    QPointer<BatchRunner> runner_;
    AdapterFactory factory_;

    QList<Session> sessions_;
    QString activeId_;
    QPointer<ITransportAdapter> adapter_;
    int nextSessionId_ = 1;

    GenerationToken switchGeneration_;
    quint64 refreshGeneration_ = 0;
};

#endif // SESSIONMANAGER_H
