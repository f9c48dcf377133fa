#include "navigationsyncengine.h"

#include "utils/logging.h"
#include "utils/pathutils.h"

#include <QDebug>

void NavigationSyncEngine::enable(const QString &remoteBase, const QString &localBase)
{
    state_.enabled = true;
    state_.remoteBase = PathUtils::normalize(remoteBase);
    state_.localBase = PathUtils::normalize(localBase);
    qDebug() << "NavigationSyncEngine: Sync enabled" << state_.remoteBase << "<->"
             << state_.localBase;
}

void NavigationSyncEngine::disable()
{
    if (state_.enabled) {
        qDebug() << "NavigationSyncEngine: Sync disabled";
    }
    state_ = SyncState();
}

void NavigationSyncEngine::restore(const SyncState &state)
{
    state_ = state;
    if (state_.enabled) {
        state_.remoteBase = PathUtils::normalize(state_.remoteBase);
        state_.localBase = PathUtils::normalize(state_.localBase);
    }
}

bool NavigationSyncEngine::isNavigationAllowed(Panel panel, const QString &path) const
{
    if (!state_.enabled) {
        return true;
    }
    const QString &base = panel == Panel::Remote ? state_.remoteBase : state_.localBase;
    return !PathUtils::isAncestor(PathUtils::normalize(path), base);
}

MirrorResult NavigationSyncEngine::mirror(Panel panel, const QString &path) const
{
    MirrorResult result;
    if (!state_.enabled) {
        return result;
    }

    const QString normalized = PathUtils::normalize(path);
    const QString &base = panel == Panel::Remote ? state_.remoteBase : state_.localBase;
    const QString &otherBase = panel == Panel::Remote ? state_.localBase : state_.remoteBase;

    if (PathUtils::isAncestor(normalized, base)) {
        result.kind = MirrorResult::Kind::Blocked;
        return result;
    }
    if (!PathUtils::isWithin(base, normalized)) {
        LOG_VERBOSE() << "NavigationSyncEngine:" << normalized << "is outside" << base;
        result.kind = MirrorResult::Kind::Outside;
        return result;
    }

    const QString relative = PathUtils::relativeTo(base, normalized);
    result.kind = MirrorResult::Kind::Mirror;
    result.targetPath = relative.isEmpty() ? otherBase : PathUtils::join(otherBase, relative);
    return result;
}
