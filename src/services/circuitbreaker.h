/**
 * @file circuitbreaker.h
 * @brief Consecutive-failure gate and retry backoff for transfer batches.
 */

#ifndef CIRCUITBREAKER_H
#define CIRCUITBREAKER_H

#include <QObject>
#include <QString>

#include "transfererror.h"

struct CircuitBreakerConfig {
    int maxConsecutiveErrors = 3;
    int maxRetriesPerFile = 2;      ///< Retries beyond the first attempt
    int baseRetryDelayMs = 1000;
    int maxRetryDelayMs = 10000;
    double backoffMultiplier = 2.0;
};

/**
 * @brief Why an open breaker paused the batch.
 */
enum class PauseReason {
    None,
    FatalError,
    ConnectionLost,
    RateLimited,
    UnknownError
};

[[nodiscard]] const char *pauseReasonToString(PauseReason reason);

/// Human-readable explanation of a pause reason for status text and dialogs.
[[nodiscard]] QString pauseReasonDescription(PauseReason reason);

/**
 * @brief Result of CircuitBreaker::recordFailure().
 */
struct FailureVerdict {
    bool tripped = false;   ///< This failure opened the breaker
    ErrorKind kind = ErrorKind::Unknown;
    bool retryable = false;
};

/**
 * @brief Tracks consecutive transfer failures and opens when a batch should
 * stop pulling new items.
 *
 * The breaker counts one failure per item whose retries are exhausted, not
 * one per attempt. Fatal errors open it immediately; network, rate-limit and
 * unclassified errors open it when the consecutive count reaches
 * maxConsecutiveErrors. Item-scoped errors are never counted.
 *
 * While open on a connection loss the runner may attempt a reconnect, during
 * which the breaker reports State::Reconnecting. A successful reconnect closes
 * the breaker on probation: the next counted failure reopens it at once, the
 * next success clears the count.
 */
class CircuitBreaker : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Closed,
        Open,
        Reconnecting
    };
    Q_ENUM(State)

    explicit CircuitBreaker(QObject *parent = nullptr);

    void setConfig(const CircuitBreakerConfig &config);
    [[nodiscard]] CircuitBreakerConfig config() const { return config_; }

    /// @name Recording outcomes
    /// @{
    void recordSuccess();
    FailureVerdict recordFailure(const TransferError &error);
    FailureVerdict recordFailure(const QString &message);
    /// @}

    /// @name Retry policy
    /// @{

    /**
     * @brief Delay before the retry following attempt number @p attempt.
     *
     * base * multiplier^(attempt - 1), capped at maxRetryDelayMs.
     */
    [[nodiscard]] int retryDelayMs(int attempt) const;

    /**
     * @brief Whether an item that has made @p attempts attempts and failed
     * with @p kind should be attempted again.
     */
    [[nodiscard]] bool shouldRetry(int attempts, ErrorKind kind) const;
    /// @}

    /// @name Reconnect cycle
    /// @{
    void markReconnecting();
    void markReconnected();
    void markReconnectFailed();
    /// @}

    /// Back to closed with no history. Used when a batch starts or resumes.
    void reset();

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] bool isOpen() const { return state_ != State::Closed; }
    [[nodiscard]] int consecutiveFailures() const { return consecutiveFailures_; }
    [[nodiscard]] PauseReason pauseReason() const { return pauseReason_; }
    [[nodiscard]] ErrorKind trippedErrorKind() const { return trippedKind_; }
    [[nodiscard]] TransferError lastError() const { return lastError_; }

signals:
    void stateChanged(CircuitBreaker::State state);
    void tripped(PauseReason reason, const QString &message);

private:
    void setState(State state);
    void trip(const TransferError &error);

    CircuitBreakerConfig config_;
    State state_ = State::Closed;
    int consecutiveFailures_ = 0;
    PauseReason pauseReason_ = PauseReason::None;
    ErrorKind trippedKind_ = ErrorKind::Unknown;
    TransferError lastError_;
};

#endif // CIRCUITBREAKER_H
