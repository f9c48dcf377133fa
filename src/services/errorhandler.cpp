#include "errorhandler.h"

#include <QDebug>

ErrorHandler::ErrorHandler(QObject *parent)
    : QObject(parent)
{
}

void ErrorHandler::handleError(ErrorCategory category,
                               ErrorSeverity severity,
                               const QString &title,
                               const QString &details)
{
    logError(category, severity, title, details);

    emit statusMessage(composeMessage(title, details), timeoutForSeverity(severity));

    if (severity == ErrorSeverity::Critical) {
        emit criticalError(title, details.isEmpty() ? title : details);
    }
}

void ErrorHandler::handleErrorWithRetry(ErrorCategory category,
                                        const QString &title,
                                        const QString &details,
                                        const std::function<void()> &retryCallback)
{
    logError(category, ErrorSeverity::Warning, title, details);
    emit statusMessage(composeMessage(title, details),
                       timeoutForSeverity(ErrorSeverity::Warning));

    pendingRetry_ = retryCallback;
    emit retryOffered(title, details.isEmpty() ? title : details);
}

bool ErrorHandler::acceptRetry()
{
    if (!pendingRetry_) {
        return false;
    }
    // Move out first: the callback may offer a new retry
    const std::function<void()> callback = std::move(pendingRetry_);
    pendingRetry_ = nullptr;
    callback();
    return true;
}

void ErrorHandler::declineRetry()
{
    pendingRetry_ = nullptr;
}

void ErrorHandler::handleConnectionError(const QString &message)
{
    handleError(ErrorCategory::Connection,
                ErrorSeverity::Critical,
                tr("Connection Error"),
                message);
}

void ErrorHandler::handleTransferFailed(const QString &filename, const QString &error)
{
    handleError(ErrorCategory::Transfer,
                ErrorSeverity::Warning,
                tr("Transfer of %1 failed").arg(filename),
                error);
}

void ErrorHandler::handleNavigationError(const QString &path, const QString &message)
{
    handleError(ErrorCategory::Navigation,
                ErrorSeverity::Warning,
                tr("Cannot open %1").arg(path),
                message);
}

void ErrorHandler::handleConfigurationError(const QString &message)
{
    handleError(ErrorCategory::Configuration,
                ErrorSeverity::Warning,
                tr("Invalid configuration"),
                message);
}

void ErrorHandler::handleBatchNotification(const QString &title, const QString &details)
{
    handleError(ErrorCategory::Transfer, ErrorSeverity::Critical, title, details);
}

void ErrorHandler::logError(ErrorCategory category,
                            ErrorSeverity severity,
                            const QString &title,
                            const QString &details)
{
    const QString line = QStringLiteral("ErrorHandler: [%1/%2] %3")
        .arg(categoryToString(category), severityToString(severity),
             composeMessage(title, details));

    if (severity == ErrorSeverity::Critical) {
        qCritical().noquote() << line;
    } else if (severity == ErrorSeverity::Warning) {
        qWarning().noquote() << line;
    } else {
        qInfo().noquote() << line;
    }

    emit errorLogged(category, severity, title, details);
}

QString ErrorHandler::composeMessage(const QString &title, const QString &details)
{
    if (details.isEmpty() || details == title) {
        return title;
    }
    return QString("%1: %2").arg(title, details);
}

int ErrorHandler::timeoutForSeverity(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return 3000;
    case ErrorSeverity::Warning:
        return 5000;
    case ErrorSeverity::Critical:
        return 0;     // Stays until replaced
    }
    return 5000;
}

QString ErrorHandler::categoryToString(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Connection:
        return QStringLiteral("Connection");
    case ErrorCategory::Transfer:
        return QStringLiteral("Transfer");
    case ErrorCategory::Navigation:
        return QStringLiteral("Navigation");
    case ErrorCategory::Configuration:
        return QStringLiteral("Config");
    case ErrorCategory::System:
        return QStringLiteral("System");
    }
    return QStringLiteral("Unknown");
}

QString ErrorHandler::severityToString(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return QStringLiteral("INFO");
    case ErrorSeverity::Warning:
        return QStringLiteral("WARN");
    case ErrorSeverity::Critical:
        return QStringLiteral("CRIT");
    }
    return QStringLiteral("UNKNOWN");
}
