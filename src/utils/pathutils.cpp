#include "pathutils.h"

#include <QDir>
#include <QStringList>

namespace PathUtils {

QString normalize(const QString &path)
{
    if (path.isEmpty()) {
        return QStringLiteral("/");
    }

    QString cleaned = QDir::cleanPath(QDir::fromNativeSeparators(path));
    if (cleaned.isEmpty() || cleaned == QLatin1String(".")) {
        return QStringLiteral("/");
    }
    // cleanPath keeps a trailing slash only for the root
    if (cleaned.size() > 1 && cleaned.endsWith('/')) {
        cleaned.chop(1);
    }
    return cleaned;
}

QString join(const QString &dir, const QString &name)
{
    if (name.isEmpty()) {
        return normalize(dir);
    }
    QString base = normalize(dir);
    QString child = name;
    while (child.startsWith('/')) {
        child.remove(0, 1);
    }
    if (base.endsWith('/')) {
        return normalize(base + child);
    }
    return normalize(base + '/' + child);
}

QString fileName(const QString &path)
{
    const QString normalized = normalize(path);
    if (normalized == QLatin1String("/")) {
        return QString();
    }
    const int slash = normalized.lastIndexOf('/');
    return slash < 0 ? normalized : normalized.mid(slash + 1);
}

QString parentPath(const QString &path)
{
    const QString normalized = normalize(path);
    const int slash = normalized.lastIndexOf('/');
    if (slash <= 0) {
        return QStringLiteral("/");
    }
    return normalized.left(slash);
}

bool isWithin(const QString &base, const QString &path)
{
    const QString b = normalize(base);
    const QString p = normalize(path);
    if (b == p || b == QLatin1String("/")) {
        return true;
    }
    return p.startsWith(b + '/');
}

bool isAncestor(const QString &candidate, const QString &path)
{
    const QString c = normalize(candidate);
    const QString p = normalize(path);
    return c != p && isWithin(c, p);
}

QString relativeTo(const QString &base, const QString &path)
{
    const QString b = normalize(base);
    const QString p = normalize(path);
    if (b == p || !isWithin(b, p)) {
        return QString();
    }
    if (b == QLatin1String("/")) {
        return p.mid(1);
    }
    return p.mid(b.size() + 1);
}

QString uniqueName(const QString &name, const QStringList &taken)
{
    // Dot files such as ".bashrc" have no extension
    const int dot = name.lastIndexOf('.');
    const bool hasExtension = dot > 0;
    const QString stem = hasExtension ? name.left(dot) : name;
    const QString extension = hasExtension ? name.mid(dot) : QString();

    int counter = 1;
    QString candidate;
    do {
        candidate = QStringLiteral("%1 (%2)%3").arg(stem).arg(counter).arg(extension);
        ++counter;
    } while (taken.contains(candidate));
    return candidate;
}

} // namespace PathUtils
