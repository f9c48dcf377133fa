/**
 * @file localdirectory.h
 * @brief Reads a local directory into the listing type used by both panels.
 */

#ifndef LOCALDIRECTORY_H
#define LOCALDIRECTORY_H

#include <QList>
#include <QString>

#include "services/remoteentry.h"

namespace LocalDirectory {

/**
 * @brief Lists @p path (hidden entries included, "." and ".." excluded).
 *
 * Directories come first, then files, each group sorted by name.
 *
 * @return false and sets @p error if the directory cannot be read.
 */
bool read(const QString &path, QList<RemoteEntry> *entries, QString *error = nullptr);

/// Converts a Unix-style permission mask for display ("rwxr-xr-x").
[[nodiscard]] QString permissionString(const QString &path);

} // namespace LocalDirectory

#endif // LOCALDIRECTORY_H
