/**
 * @file panelnavigator.h
 * @brief Live state of the local and remote panels and navigation between
 * directories.
 */

#ifndef PANELNAVIGATOR_H
#define PANELNAVIGATOR_H

#include <QList>
#include <QObject>
#include <QPointer>
#include <QString>

#include "itransportadapter.h"
#include "navigationsyncengine.h"
#include "remoteentry.h"
#include "utils/generationtoken.h"

/**
 * @brief Everything a session needs to restore both panels exactly.
 */
struct PanelState {
    QString remotePath = QStringLiteral("/");
    QString localPath;
    QList<RemoteEntry> remoteListing;
    QList<RemoteEntry> localListing;
    SyncState sync;
};

Q_DECLARE_METATYPE(PanelState)

/**
 * @brief Owns the two panel cursors and their listings.
 *
 * Remote navigation is asynchronous: every request to the adapter carries a
 * generation token and only the response to the latest request is applied,
 * so quickly clicking through directories never shows a stale listing.
 * Local navigation reads the directory synchronously.
 *
 * While sync is enabled each navigation is mirrored to the other panel
 * through NavigationSyncEngine. If the mirrored directory is missing,
 * mirrorTargetMissing() is emitted and the caller resolves it with
 * createMissingMirrorTarget() or disableSync().
 */
class PanelNavigator : public QObject
{
    Q_OBJECT

public:
    explicit PanelNavigator(QObject *parent = nullptr);
    ~PanelNavigator() override;

    void setTransportAdapter(ITransportAdapter *adapter);
    [[nodiscard]] ITransportAdapter *transportAdapter() const { return adapter_; }

    /// @name Session capture
    /// @{
    [[nodiscard]] PanelState panelState() const;

    /**
     * @brief Replaces both panels with @p state without touching the
     * adapter. Outstanding remote requests are invalidated.
     */
    void restoreState(const PanelState &state);
    /// @}

    /// @name Navigation
    /// @{

    /**
     * @brief Changes the remote directory.
     * @return false if sync forbids the path or no adapter is set.
     */
    bool navigateRemote(const QString &path);

    /**
     * @brief Changes the local directory.
     * @return false if sync forbids the path or it cannot be read.
     */
    bool navigateLocal(const QString &path);

    /**
     * @brief Re-lists the current remote directory.
     * @return The generation of the request, 0 if no adapter is set.
     */
    quint64 refreshRemote();

    bool refreshLocal();
    /// @}

    /// @name Sync navigation
    /// @{

    /// Enables sync with the current paths as the base pair.
    bool enableSync();
    void disableSync();
    bool toggleSync();
    [[nodiscard]] bool isSyncEnabled() const { return syncEngine_.isEnabled(); }
    [[nodiscard]] SyncState syncState() const { return syncEngine_.state(); }

    /**
     * @brief Creates the directory reported by mirrorTargetMissing() and
     * moves that panel into it.
     * @return false if nothing is pending or the local mkdir failed.
     */
    bool createMissingMirrorTarget();

    [[nodiscard]] bool hasMissingMirrorTarget() const { return !missingTarget_.isEmpty(); }
    /// @}

    [[nodiscard]] QString remotePath() const { return remotePath_; }
    [[nodiscard]] QString localPath() const { return localPath_; }
    [[nodiscard]] QList<RemoteEntry> remoteListing() const { return remoteListing_; }
    [[nodiscard]] QList<RemoteEntry> localListing() const { return localListing_; }

signals:
    void remotePathChanged(const QString &path);
    void localPathChanged(const QString &path);
    void remoteListingChanged();
    void localListingChanged();

    /// Latest remote listing request @p generation was applied.
    void remoteListingApplied(quint64 generation, const DirectoryListing &listing);

    /// Latest remote listing request @p generation failed.
    void remoteListingFailed(quint64 generation, const QString &path, const QString &message);

    void navigationFailed(Panel panel, const QString &path, const QString &message);
    void navigationBlocked(Panel panel, const QString &path);
    void mirrorTargetMissing(Panel panel, const QString &path);
    void syncChanged(bool enabled);

private slots:
    void onDirectoryListed(quint64 generation, const DirectoryListing &listing);
    void onDirectoryCreated(quint64 generation, const QString &path);
    void onDirectoryFailed(quint64 generation, const QString &path, const QString &message);

private:
    enum class RemoteRequest { None, Navigate, MirrorNavigate, Refresh, MakeMirrorTarget };

    quint64 requestRemote(RemoteRequest kind, const QString &path);
    bool applyLocal(const QString &path, bool mirror);
    void mirrorFrom(Panel panel, const QString &path);

    QPointer<ITransportAdapter> adapter_;
    NavigationSyncEngine syncEngine_;

    QString remotePath_ = QStringLiteral("/");
    QString localPath_;
    QList<RemoteEntry> remoteListing_;
    QList<RemoteEntry> localListing_;

    GenerationToken remoteGeneration_;
    RemoteRequest remoteRequest_ = RemoteRequest::None;
    QString remoteRequestPath_;

    Panel missingPanel_ = Panel::Local;
    QString missingTarget_;
};

#endif // PANELNAVIGATOR_H
