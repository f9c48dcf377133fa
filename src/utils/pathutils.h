/**
 * @file pathutils.h
 * @brief Slash-separated path helpers shared by local and remote panels.
 *
 * Remote endpoints always use '/' separators. Local paths are handled with
 * the same rules after QDir::fromNativeSeparators().
 */

#ifndef PATHUTILS_H
#define PATHUTILS_H

#include <QString>

namespace PathUtils {

/**
 * @brief Normalizes a path: collapses duplicate separators, resolves "." and
 * "..", and strips a trailing separator. An empty path becomes "/".
 */
[[nodiscard]] QString normalize(const QString &path);

/**
 * @brief Joins a directory and a child name with exactly one separator.
 */
[[nodiscard]] QString join(const QString &dir, const QString &name);

/// Last path component ("" for the root).
[[nodiscard]] QString fileName(const QString &path);

/// Parent directory ("/" for top-level entries and for the root itself).
[[nodiscard]] QString parentPath(const QString &path);

/**
 * @brief True if @p path equals @p base or lies below it.
 */
[[nodiscard]] bool isWithin(const QString &base, const QString &path);

/**
 * @brief True if @p candidate is a strict ancestor of @p path.
 *
 * "/srv" is an ancestor of "/srv/site"; "/srv/si" is not.
 */
[[nodiscard]] bool isAncestor(const QString &candidate, const QString &path);

/**
 * @brief Returns the part of @p path below @p base, without a leading
 * separator. Empty when the paths are equal or @p path is outside @p base.
 */
[[nodiscard]] QString relativeTo(const QString &base, const QString &path);

/**
 * @brief Builds a unique "name (n).ext" variant not present in @p taken.
 */
[[nodiscard]] QString uniqueName(const QString &name, const QStringList &taken);

} // namespace PathUtils

#endif // PATHUTILS_H
