/**
 * @file transfererror.h
 * @brief Classification of transport failures for retry and breaker decisions.
 */

#ifndef TRANSFERERROR_H
#define TRANSFERERROR_H

#include <QMetaType>
#include <QString>

/**
 * @brief Recovery class of a transport failure.
 */
enum class ErrorKind {
    Network,      ///< Connection dropped; reconnect, then retry
    RateLimited,  ///< Provider throttling; retry after backoff
    Fatal,        ///< Credentials, quota, local disk; abort the batch
    Item,         ///< Confined to one item; fail it and move on
    Unknown       ///< Unrecognized; bounded retries, then ask the user
};

/**
 * @brief Specific cause behind an ErrorKind, kept for diagnostics.
 */
enum class ErrorCause {
    ConnectionLost,
    Timeout,
    RateLimit,
    Authentication,
    QuotaExceeded,
    LocalDisk,
    PermissionDenied,
    PathNotFound,
    FileLocked,
    Unrecognized
};

struct TransferError {
    QString message;
    ErrorKind kind = ErrorKind::Unknown;
    ErrorCause cause = ErrorCause::Unrecognized;

    /// Whether another attempt at the same item can succeed.
    [[nodiscard]] bool isRetryable() const
    {
        return kind == ErrorKind::Network || kind == ErrorKind::RateLimited
            || kind == ErrorKind::Unknown;
    }

    /// Whether the failure counts toward the consecutive-failure threshold.
    [[nodiscard]] bool countsTowardBreaker() const { return kind != ErrorKind::Item; }
};

/**
 * @brief Buckets a raw adapter error message.
 *
 * Matching is case-insensitive, on whole words, and ordered: quota,
 * authentication and disk problems win over generic connection wording so
 * that e.g. "530 Login incorrect, closing connection" is treated as fatal.
 * Tokens that look like paths or file names ("/srv/auth/login.php",
 * "ghost.txt") are ignored, so a file name never decides the bucket.
 */
[[nodiscard]] TransferError classifyTransferError(const QString &message);

/**
 * @brief Classifies a failure the adapter already diagnosed.
 *
 * A known @p cause decides the kind on its own; the message is only kept
 * for display. With ErrorCause::Unrecognized this falls back to the text
 * rules above.
 */
[[nodiscard]] TransferError classifyTransferError(const QString &message, ErrorCause cause);

/// Recovery class implied by a diagnosed cause.
[[nodiscard]] ErrorKind errorKindForCause(ErrorCause cause);

/**
 * @brief Maps an FTP reply to a cause.
 *
 * @p text is only consulted to tell a missing path from a refused one on
 * 550. Codes without a definite meaning give ErrorCause::Unrecognized.
 */
[[nodiscard]] ErrorCause errorCauseForFtpReply(int code, const QString &text);

[[nodiscard]] const char *errorKindToString(ErrorKind kind);
[[nodiscard]] const char *errorCauseToString(ErrorCause cause);

Q_DECLARE_METATYPE(ErrorKind)
Q_DECLARE_METATYPE(ErrorCause)
Q_DECLARE_METATYPE(TransferError)

#endif // TRANSFERERROR_H
