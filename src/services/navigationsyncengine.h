/**
 * @file navigationsyncengine.h
 * @brief Keeps the local and remote directory cursors mirrored.
 */

#ifndef NAVIGATIONSYNCENGINE_H
#define NAVIGATIONSYNCENGINE_H

#include <QMetaType>
#include <QString>

enum class Panel { Remote, Local };

/**
 * @brief Per-session sync state: whether mirroring is on and the base pair.
 */
struct SyncState {
    bool enabled = false;
    QString remoteBase;
    QString localBase;

    bool operator==(const SyncState &other) const
    {
        return enabled == other.enabled && remoteBase == other.remoteBase
            && localBase == other.localBase;
    }
};

/**
 * @brief Outcome of mirroring one navigation to the other panel.
 */
struct MirrorResult {
    enum class Kind {
        NotSynced,  ///< Sync is off; the other panel stays put
        Mirror,     ///< Move the other panel to targetPath
        Blocked,    ///< Navigation above the base is not allowed while synced
        Outside     ///< Path is beside the mirrored tree; the other panel stays put
    };

    Kind kind = Kind::NotSynced;
    QString targetPath;
};

/**
 * @brief Maps a path in one panel onto the other panel's tree.
 *
 * Enabling records a (remoteBase, localBase) pair. A path below one base is
 * translated by replacing that base with the other one:
 *
 *     remoteBase=/srv/site  localBase=/home/u/site
 *     /srv/site/assets/img  ->  /home/u/site/assets/img
 *
 * Navigating a panel to an ancestor of its base ("/srv" above) is blocked.
 */
class NavigationSyncEngine
{
public:
    void enable(const QString &remoteBase, const QString &localBase);
    void disable();
    [[nodiscard]] bool isEnabled() const { return state_.enabled; }

    [[nodiscard]] SyncState state() const { return state_; }
    void restore(const SyncState &state);

    [[nodiscard]] bool isNavigationAllowed(Panel panel, const QString &path) const;

    /**
     * @brief Computes where the other panel goes when @p panel moves to @p path.
     */
    [[nodiscard]] MirrorResult mirror(Panel panel, const QString &path) const;

private:
    SyncState state_;
};

Q_DECLARE_METATYPE(Panel)
Q_DECLARE_METATYPE(SyncState)

#endif // NAVIGATIONSYNCENGINE_H
