/**
 * @file errorhandler.h
 * @brief Single place where user-facing errors are categorized and surfaced.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QObject>
#include <QString>
#include <functional>

enum class ErrorCategory {
    Connection,     ///< Opening, losing or re-establishing an endpoint connection
    Transfer,       ///< Item failures and batch-level notifications
    Navigation,     ///< Listing or changing directories, sync mirroring
    Configuration,  ///< Settings, connection parameters, command-line input
    System          ///< Everything else
};

enum class ErrorSeverity {
    Info,      ///< Status text, short timeout
    Warning,   ///< Status text, longer timeout
    Critical   ///< Status text that stays, plus criticalError()
};

Q_DECLARE_METATYPE(ErrorCategory)
Q_DECLARE_METATYPE(ErrorSeverity)

/**
 * @brief Routes errors to logging and to whatever presents them.
 *
 * Every error is logged through Qt logging and announced with
 * statusMessage(). Critical errors additionally raise criticalError() so a
 * front end can show a dialog; the handler itself has no UI.
 *
 * @par Example usage:
 * @code
 * ErrorHandler *handler = new ErrorHandler(this);
 * connect(runner, &BatchRunner::batchNotification,
 *         handler, &ErrorHandler::handleBatchNotification);
 *
 * handler->handleErrorWithRetry(ErrorCategory::Connection,
 *                               "Connection lost", "Server closed the session",
 *                               [this]() { reconnect(); });
 * // Later, when the user answers the prompt:
 * handler->acceptRetry();
 * @endcode
 */
class ErrorHandler : public QObject
{
    Q_OBJECT

public:
    explicit ErrorHandler(QObject *parent = nullptr);
    ~ErrorHandler() override = default;

    /// @name Generic Error Handling
    /// @{
    void handleError(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details = QString());

    /**
     * @brief Reports an error and offers a retry.
     *
     * Emits retryOffered(). The callback runs if acceptRetry() is called
     * before the next offer replaces it.
     */
    void handleErrorWithRetry(ErrorCategory category,
                              const QString &title,
                              const QString &details,
                              const std::function<void()> &retryCallback);

    /// Runs the pending retry callback. @return false if none is pending.
    bool acceptRetry();

    /// Drops the pending retry callback.
    void declineRetry();

    [[nodiscard]] bool hasPendingRetry() const { return static_cast<bool>(pendingRetry_); }
    /// @}

    /// @name Convenience Methods for Common Error Sources
    /// @{
    void handleConnectionError(const QString &message);
    void handleTransferFailed(const QString &filename, const QString &error);
    void handleNavigationError(const QString &path, const QString &message);
    void handleConfigurationError(const QString &message);

    /**
     * @brief Surfaces a batch-level notification (breaker opened, batch
     * aborted or auto-cancelled) as a critical error.
     */
    void handleBatchNotification(const QString &title, const QString &details);
    /// @}

    [[nodiscard]] static QString categoryToString(ErrorCategory category);
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);
    [[nodiscard]] static int timeoutForSeverity(ErrorSeverity severity);

signals:
    /**
     * @brief Emitted to display a status message.
     * @param timeout Display timeout in milliseconds (0 for no timeout).
     */
    void statusMessage(const QString &message, int timeout);

    /// A front end should show @p details in a blocking dialog.
    void criticalError(const QString &title, const QString &details);

    /// A front end should ask whether to retry, then call acceptRetry() or declineRetry().
    void retryOffered(const QString &title, const QString &details);

    void errorLogged(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details);

private:
    void logError(ErrorCategory category,
                  ErrorSeverity severity,
                  const QString &title,
                  const QString &details);

    [[nodiscard]] static QString composeMessage(const QString &title, const QString &details);

    std::function<void()> pendingRetry_;
};

#endif // ERRORHANDLER_H
