#include "circuitbreaker.h"

#include "utils/logging.h"

#include <QDebug>
#include <QtMath>

const char *pauseReasonToString(PauseReason reason)
{
    switch (reason) {
    case PauseReason::None: return "none";
    case PauseReason::FatalError: return "fatal_error";
    case PauseReason::ConnectionLost: return "connection_lost";
    case PauseReason::RateLimited: return "rate_limited";
    case PauseReason::UnknownError: return "unknown_error";
    }
    return "none";
}

QString pauseReasonDescription(PauseReason reason)
{
    switch (reason) {
    case PauseReason::None:
        return QString();
    case PauseReason::FatalError:
        return QObject::tr("The transfer cannot continue");
    case PauseReason::ConnectionLost:
        return QObject::tr("The connection to the server was lost");
    case PauseReason::RateLimited:
        return QObject::tr("The server is limiting requests");
    case PauseReason::UnknownError:
        return QObject::tr("Transfers keep failing for an unknown reason");
    }
    return QString();
}

CircuitBreaker::CircuitBreaker(QObject *parent)
    : QObject(parent)
{
}

void CircuitBreaker::setConfig(const CircuitBreakerConfig &config)
{
    config_ = config;
    if (config_.maxConsecutiveErrors < 1) {
        qWarning() << "CircuitBreaker: maxConsecutiveErrors must be positive, using 1";
        config_.maxConsecutiveErrors = 1;
    }
    if (config_.maxRetriesPerFile < 0) {
        config_.maxRetriesPerFile = 0;
    }
}

void CircuitBreaker::recordSuccess()
{
    consecutiveFailures_ = 0;
    pauseReason_ = PauseReason::None;
    setState(State::Closed);
}

FailureVerdict CircuitBreaker::recordFailure(const QString &message)
{
    return recordFailure(classifyTransferError(message));
}

FailureVerdict CircuitBreaker::recordFailure(const TransferError &error)
{
    FailureVerdict verdict;
    verdict.kind = error.kind;
    verdict.retryable = error.isRetryable();

    if (!error.countsTowardBreaker()) {
        LOG_VERBOSE() << "CircuitBreaker: Item error not counted:" << error.message;
        return verdict;
    }

    lastError_ = error;
    consecutiveFailures_++;
    LOG_VERBOSE() << "CircuitBreaker: Failure" << consecutiveFailures_ << "of"
                  << config_.maxConsecutiveErrors << errorKindToString(error.kind);

    if (state_ != State::Closed) {
        return verdict;
    }

    if (error.kind == ErrorKind::Fatal
        || consecutiveFailures_ >= config_.maxConsecutiveErrors) {
        trip(error);
        verdict.tripped = true;
    }
    return verdict;
}

int CircuitBreaker::retryDelayMs(int attempt) const
{
    if (attempt < 1) {
        attempt = 1;
    }
    const double delay = config_.baseRetryDelayMs
        * qPow(config_.backoffMultiplier, attempt - 1);
    if (delay >= config_.maxRetryDelayMs) {
        return config_.maxRetryDelayMs;
    }
    return static_cast<int>(delay);
}

bool CircuitBreaker::shouldRetry(int attempts, ErrorKind kind) const
{
    switch (kind) {
    case ErrorKind::Network:
    case ErrorKind::RateLimited:
    case ErrorKind::Unknown:
        return attempts <= config_.maxRetriesPerFile;
    case ErrorKind::Fatal:
    case ErrorKind::Item:
        return false;
    }
    return false;
}

void CircuitBreaker::markReconnecting()
{
    if (state_ == State::Closed) {
        qWarning() << "CircuitBreaker: Reconnect requested while closed";
        return;
    }
    setState(State::Reconnecting);
}

void CircuitBreaker::markReconnected()
{
    if (state_ != State::Reconnecting) {
        qWarning() << "CircuitBreaker: markReconnected outside a reconnect";
        return;
    }
    // Probation: one more counted failure reopens the breaker
    consecutiveFailures_ = config_.maxConsecutiveErrors - 1;
    pauseReason_ = PauseReason::None;
    qDebug() << "CircuitBreaker: Reconnected, closing";
    setState(State::Closed);
}

void CircuitBreaker::markReconnectFailed()
{
    if (state_ != State::Reconnecting) {
        qWarning() << "CircuitBreaker: markReconnectFailed outside a reconnect";
        return;
    }
    qDebug() << "CircuitBreaker: Reconnect failed, staying open";
    setState(State::Open);
}

void CircuitBreaker::reset()
{
    consecutiveFailures_ = 0;
    pauseReason_ = PauseReason::None;
    trippedKind_ = ErrorKind::Unknown;
    lastError_ = TransferError();
    setState(State::Closed);
}

void CircuitBreaker::setState(State state)
{
    if (state_ == state) {
        return;
    }
    state_ = state;
    emit stateChanged(state_);
}

void CircuitBreaker::trip(const TransferError &error)
{
    switch (error.kind) {
    case ErrorKind::Fatal:
        pauseReason_ = PauseReason::FatalError;
        break;
    case ErrorKind::Network:
        pauseReason_ = PauseReason::ConnectionLost;
        break;
    case ErrorKind::RateLimited:
        pauseReason_ = PauseReason::RateLimited;
        break;
    case ErrorKind::Unknown:
    case ErrorKind::Item:
        pauseReason_ = PauseReason::UnknownError;
        break;
    }
    trippedKind_ = error.kind;

    qWarning() << "CircuitBreaker: Opened after" << consecutiveFailures_ << "failures,"
               << "reason" << pauseReasonToString(pauseReason_) << "-" << error.message;
    setState(State::Open);
    emit tripped(pauseReason_, error.message);
}
