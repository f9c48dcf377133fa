#include "transfererror.h"

#include <QRegularExpression>
#include <QStringList>

namespace {

// Whole-word match of any needle; needles may span several words
bool containsAny(const QString &haystack, const QStringList &needles)
{
    QStringList escaped;
    escaped.reserve(needles.size());
    for (const QString &needle : needles) {
        escaped.append(QRegularExpression::escape(needle));
    }
    const QRegularExpression pattern(QStringLiteral("\\b(?:%1)\\b").arg(escaped.join('|')));
    return pattern.match(haystack).hasMatch();
}

// Drops path and file-name tokens so their words cannot match a rule
QString withoutPaths(const QString &lower)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    static const QRegularExpression fileName(QStringLiteral("^[\\w.-]+\\.[a-z0-9]{1,5}$"));
    static const QString edgePunctuation = QStringLiteral("\"'()<>[],;:.");

    QStringList kept;
    const QStringList tokens = lower.split(whitespace, Qt::SkipEmptyParts);
    for (const QString &token : tokens) {
        QString bare = token;
        while (!bare.isEmpty() && edgePunctuation.contains(bare.front())) {
            bare.remove(0, 1);
        }
        while (!bare.isEmpty() && edgePunctuation.contains(bare.back())) {
            bare.chop(1);
        }
        const bool pathLike = (bare.contains(QLatin1Char('/'))
                               || bare.contains(QLatin1Char('\\')))
            && bare != QLatin1String("i/o");
        if (pathLike || fileName.match(bare).hasMatch()) {
            continue;
        }
        kept.append(token);
    }
    return kept.join(QLatin1Char(' '));
}

bool mentionsMissingPath(const QString &lower)
{
    return containsAny(lower, {QStringLiteral("not found"), QStringLiteral("no such")});
}

TransferError make(const QString &message, ErrorKind kind, ErrorCause cause)
{
    TransferError error;
    error.message = message;
    error.kind = kind;
    error.cause = cause;
    return error;
}

} // namespace

TransferError classifyTransferError(const QString &message)
{
    const QString lower = withoutPaths(message.toLower());

    // FTP 552: exceeded storage allocation
    if (containsAny(lower, {QStringLiteral("quota"), QStringLiteral("storage full"),
                            QStringLiteral("insufficient storage"), QStringLiteral("552")})) {
        return make(message, ErrorKind::Fatal, ErrorCause::QuotaExceeded);
    }
    // FTP 530, HTTP 401
    if (containsAny(lower, {QStringLiteral("auth"), QStringLiteral("authentication"),
                            QStringLiteral("unauthorized"), QStringLiteral("login"),
                            QStringLiteral("credential"), QStringLiteral("credentials"),
                            QStringLiteral("401"), QStringLiteral("530")})) {
        return make(message, ErrorKind::Fatal, ErrorCause::Authentication);
    }
    if (containsAny(lower, {QStringLiteral("disk full"), QStringLiteral("no space"),
                            QStringLiteral("i/o error")})) {
        return make(message, ErrorKind::Fatal, ErrorCause::LocalDisk);
    }
    // FTP 550 is also used for missing paths; leave those to the not-found rule
    const bool notFoundWording = mentionsMissingPath(lower);
    if (containsAny(lower, {QStringLiteral("permission denied"), QStringLiteral("access denied"),
                            QStringLiteral("403")})
        || (containsAny(lower, {QStringLiteral("550")}) && !notFoundWording)) {
        return make(message, ErrorKind::Item, ErrorCause::PermissionDenied);
    }
    if (containsAny(lower, {QStringLiteral("timeout"), QStringLiteral("timed out")})) {
        return make(message, ErrorKind::Network, ErrorCause::Timeout);
    }
    // HTTP 429, FTP 421 (too many connections)
    if (containsAny(lower, {QStringLiteral("rate limit"), QStringLiteral("too many requests"),
                            QStringLiteral("429"), QStringLiteral("421"),
                            QStringLiteral("slow down")})) {
        return make(message, ErrorKind::RateLimited, ErrorCause::RateLimit);
    }
    if (containsAny(lower, {QStringLiteral("locked"), QStringLiteral("in use")})) {
        return make(message, ErrorKind::Item, ErrorCause::FileLocked);
    }
    if (containsAny(lower, {QStringLiteral("connection"), QStringLiteral("network"),
                            QStringLiteral("dns"), QStringLiteral("refused"),
                            QStringLiteral("reset"), QStringLiteral("eof"),
                            QStringLiteral("broken pipe"), QStringLiteral("not connected"),
                            QStringLiteral("host")})) {
        return make(message, ErrorKind::Network, ErrorCause::ConnectionLost);
    }
    if (notFoundWording || containsAny(lower, {QStringLiteral("404")})) {
        return make(message, ErrorKind::Item, ErrorCause::PathNotFound);
    }

    return make(message, ErrorKind::Unknown, ErrorCause::Unrecognized);
}

TransferError classifyTransferError(const QString &message, ErrorCause cause)
{
    if (cause == ErrorCause::Unrecognized) {
        return classifyTransferError(message);
    }
    return make(message, errorKindForCause(cause), cause);
}

ErrorKind errorKindForCause(ErrorCause cause)
{
    switch (cause) {
    case ErrorCause::ConnectionLost:
    case ErrorCause::Timeout:
        return ErrorKind::Network;
    case ErrorCause::RateLimit:
        return ErrorKind::RateLimited;
    case ErrorCause::Authentication:
    case ErrorCause::QuotaExceeded:
    case ErrorCause::LocalDisk:
        return ErrorKind::Fatal;
    case ErrorCause::PermissionDenied:
    case ErrorCause::PathNotFound:
    case ErrorCause::FileLocked:
        return ErrorKind::Item;
    case ErrorCause::Unrecognized:
        return ErrorKind::Unknown;
    }
    return ErrorKind::Unknown;
}

ErrorCause errorCauseForFtpReply(int code, const QString &text)
{
    switch (code) {
    case 421:  // Service closing; usually too many connections
        return ErrorCause::RateLimit;
    case 425:
    case 426:
        return ErrorCause::ConnectionLost;
    case 450:
        return ErrorCause::FileLocked;
    case 452:
    case 552:
        return ErrorCause::QuotaExceeded;
    case 530:
    case 532:
        return ErrorCause::Authentication;
    case 550:
        return mentionsMissingPath(withoutPaths(text.toLower()))
            ? ErrorCause::PathNotFound : ErrorCause::PermissionDenied;
    case 553:
        return ErrorCause::PermissionDenied;
    default:
        return ErrorCause::Unrecognized;
    }
}

const char *errorKindToString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::Network: return "network";
    case ErrorKind::RateLimited: return "rate_limited";
    case ErrorKind::Fatal: return "fatal";
    case ErrorKind::Item: return "item";
    case ErrorKind::Unknown: return "unknown";
    }
    return "unknown";
}

const char *errorCauseToString(ErrorCause cause)
{
    switch (cause) {
    case ErrorCause::ConnectionLost: return "connection_lost";
    case ErrorCause::Timeout: return "timeout";
    case ErrorCause::RateLimit: return "rate_limit";
    case ErrorCause::Authentication: return "authentication";
    case ErrorCause::QuotaExceeded: return "quota_exceeded";
    case ErrorCause::LocalDisk: return "local_disk";
    case ErrorCause::PermissionDenied: return "permission_denied";
    case ErrorCause::PathNotFound: return "path_not_found";
    case ErrorCause::FileLocked: return "file_locked";
    case ErrorCause::Unrecognized: return "unrecognized";
    }
    return "unrecognized";
}
