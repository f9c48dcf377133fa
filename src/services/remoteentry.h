#ifndef REMOTEENTRY_H
#define REMOTEENTRY_H

#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <QString>

/**
 * @brief Represents a single entry in a directory listing (either panel).
 */
struct RemoteEntry {
    QString name;              ///< Name of the file or directory
    bool isDirectory = false;  ///< True if this entry is a directory
    qint64 size = 0;           ///< Size in bytes (0 for directories)
    QString permissions;       ///< Unix-style permission string, if known
    QDateTime modified;        ///< Last modification timestamp

    bool operator==(const RemoteEntry &other) const
    {
        return name == other.name && isDirectory == other.isDirectory
            && size == other.size && modified == other.modified;
    }
};

/**
 * @brief Result of a listing or change-directory call.
 */
struct DirectoryListing {
    QString currentPath;        ///< Directory that was listed, as reported by the endpoint
    QList<RemoteEntry> entries;
};

Q_DECLARE_METATYPE(RemoteEntry)
Q_DECLARE_METATYPE(DirectoryListing)

#endif // REMOTEENTRY_H
