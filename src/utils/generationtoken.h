/**
 * @file generationtoken.h
 * @brief Monotonic counter used to discard stale asynchronous responses.
 */

#ifndef GENERATIONTOKEN_H
#define GENERATIONTOKEN_H

#include <QtGlobal>

/**
 * @brief Issues increasing tokens and tells whether a token is still current.
 *
 * Each asynchronous request captures the value returned by next(); when the
 * response arrives it is applied only if isCurrent() still holds for it.
 *
 * @par Example usage:
 * @code
 * const quint64 token = listingGeneration_.next();
 * adapter->changeDirectory(token, path);
 * ...
 * void onDirectoryListed(quint64 token, const DirectoryListing &listing) {
 *     if (!listingGeneration_.isCurrent(token)) return;  // superseded
 * }
 * @endcode
 */
class GenerationToken
{
public:
    /// Issues a new token, invalidating every earlier one.
    quint64 next() { return ++current_; }

    /// Latest issued token (0 before the first call to next()).
    [[nodiscard]] quint64 current() const { return current_; }

    [[nodiscard]] bool isCurrent(quint64 token) const { return token != 0 && token == current_; }

    /// Invalidates all outstanding tokens without issuing a new request.
    void invalidate() { ++current_; }

private:
    quint64 current_ = 0;
};

#endif // GENERATIONTOKEN_H
