#include "localdirectory.h"

#include <QDir>
#include <QFileInfo>

namespace LocalDirectory {

bool read(const QString &path, QList<RemoteEntry> *entries, QString *error)
{
    const QDir dir(path);
    if (!dir.exists()) {
        if (error) {
            *error = QStringLiteral("No such file or directory: %1").arg(path);
        }
        return false;
    }
    if (!QFileInfo(path).isReadable()) {
        if (error) {
            *error = QStringLiteral("Permission denied: %1").arg(path);
        }
        return false;
    }

    const QFileInfoList infos = dir.entryInfoList(
        QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot,
        QDir::DirsFirst | QDir::Name);

    entries->clear();
    entries->reserve(infos.size());
    for (const QFileInfo &info : infos) {
        RemoteEntry entry;
        entry.name = info.fileName();
        entry.isDirectory = info.isDir();
        entry.size = info.isDir() ? 0 : info.size();
        entry.modified = info.lastModified();
        entry.permissions = permissionString(info.filePath());
        entries->append(entry);
    }
    return true;
}

QString permissionString(const QString &path)
{
    const QFileInfo info(path);
    const QFile::Permissions p = info.permissions();
    QString result;
    result += info.isDir() ? 'd' : '-';
    result += (p & QFile::ReadOwner) ? 'r' : '-';
    result += (p & QFile::WriteOwner) ? 'w' : '-';
    result += (p & QFile::ExeOwner) ? 'x' : '-';
    result += (p & QFile::ReadGroup) ? 'r' : '-';
    result += (p & QFile::WriteGroup) ? 'w' : '-';
    result += (p & QFile::ExeGroup) ? 'x' : '-';
    result += (p & QFile::ReadOther) ? 'r' : '-';
    result += (p & QFile::WriteOther) ? 'w' : '-';
    result += (p & QFile::ExeOther) ? 'x' : '-';
    return result;
}

} // namespace LocalDirectory
