/**
 * @file test_circuitbreaker.cpp
 * @brief Unit tests for CircuitBreaker.
 *
 * Tests verify:
 * - The breaker opens after the configured number of counted failures
 * - Fatal errors open it at once, item errors never count
 * - Backoff delays grow exponentially up to the cap
 * - The reconnect cycle and probation after a reconnect
 */

#include <QtTest/QtTest>
#include <QSignalSpy>

#include "services/circuitbreaker.h"

class TestCircuitBreaker : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testStartsClosed();
    void testOpensAtThreshold();
    void testFatalOpensImmediately();
    void testItemErrorsNotCounted();
    void testSuccessResetsCount();
    void testRateLimitAndUnknownReasons();
    void testFailuresWhileOpenDoNotTripAgain();

    void testRetryDelays();
    void testShouldRetry();

    void testReconnectSuccessClosesOnProbation();
    void testReconnectFailureStaysOpen();
    void testReconnectRequiresOpenBreaker();
    void testReset();
    void testConfigClampsThreshold();

private:
    CircuitBreaker *breaker_ = nullptr;
};

void TestCircuitBreaker::init()
{
    breaker_ = new CircuitBreaker(this);
}

void TestCircuitBreaker::cleanup()
{
    delete breaker_;
    breaker_ = nullptr;
}

void TestCircuitBreaker::testStartsClosed()
{
    QCOMPARE(breaker_->state(), CircuitBreaker::State::Closed);
    QVERIFY(!breaker_->isOpen());
    QCOMPARE(breaker_->consecutiveFailures(), 0);
    QCOMPARE(breaker_->pauseReason(), PauseReason::None);
    QCOMPARE(breaker_->config().maxConsecutiveErrors, 3);
    QCOMPARE(breaker_->config().maxRetriesPerFile, 2);
}

void TestCircuitBreaker::testOpensAtThreshold()
{
    QSignalSpy trippedSpy(breaker_, &CircuitBreaker::tripped);

    FailureVerdict verdict = breaker_->recordFailure("Connection reset by peer");
    QVERIFY(!verdict.tripped);
    QCOMPARE(verdict.kind, ErrorKind::Network);
    QVERIFY(verdict.retryable);

    verdict = breaker_->recordFailure("Connection reset by peer");
    QVERIFY(!verdict.tripped);
    QVERIFY(!breaker_->isOpen());

    verdict = breaker_->recordFailure("Connection reset by peer");
    QVERIFY(verdict.tripped);
    QCOMPARE(breaker_->state(), CircuitBreaker::State::Open);
    QCOMPARE(breaker_->pauseReason(), PauseReason::ConnectionLost);
    QCOMPARE(breaker_->trippedErrorKind(), ErrorKind::Network);
    QCOMPARE(trippedSpy.count(), 1);
    QCOMPARE(trippedSpy.at(0).at(1).toString(), QString("Connection reset by peer"));
}

void TestCircuitBreaker::testFatalOpensImmediately()
{
    const FailureVerdict verdict = breaker_->recordFailure("530 Login incorrect");
    QVERIFY(verdict.tripped);
    QCOMPARE(verdict.kind, ErrorKind::Fatal);
    QVERIFY(!verdict.retryable);
    QCOMPARE(breaker_->pauseReason(), PauseReason::FatalError);
    QCOMPARE(breaker_->consecutiveFailures(), 1);
}

void TestCircuitBreaker::testItemErrorsNotCounted()
{
    for (int i = 0; i < 5; ++i) {
        const FailureVerdict verdict = breaker_->recordFailure("550 No such file or directory");
        QVERIFY(!verdict.tripped);
        QCOMPARE(verdict.kind, ErrorKind::Item);
    }
    QCOMPARE(breaker_->consecutiveFailures(), 0);
    QVERIFY(!breaker_->isOpen());
}

void TestCircuitBreaker::testSuccessResetsCount()
{
    breaker_->recordFailure("Connection reset");
    breaker_->recordFailure("Connection reset");
    QCOMPARE(breaker_->consecutiveFailures(), 2);

    breaker_->recordSuccess();
    QCOMPARE(breaker_->consecutiveFailures(), 0);

    // Needs a full run of failures again
    QVERIFY(!breaker_->recordFailure("Connection reset").tripped);
    QVERIFY(!breaker_->recordFailure("Connection reset").tripped);
    QVERIFY(breaker_->recordFailure("Connection reset").tripped);

    breaker_->recordSuccess();
    QCOMPARE(breaker_->state(), CircuitBreaker::State::Closed);
    QCOMPARE(breaker_->pauseReason(), PauseReason::None);
}

void TestCircuitBreaker::testRateLimitAndUnknownReasons()
{
    breaker_->recordFailure("429 Too Many Requests");
    breaker_->recordFailure("429 Too Many Requests");
    QVERIFY(breaker_->recordFailure("429 Too Many Requests").tripped);
    QCOMPARE(breaker_->pauseReason(), PauseReason::RateLimited);

    breaker_->reset();
    breaker_->recordFailure("weird");
    breaker_->recordFailure("weird");
    QVERIFY(breaker_->recordFailure("weird").tripped);
    QCOMPARE(breaker_->pauseReason(), PauseReason::UnknownError);
    QCOMPARE(breaker_->trippedErrorKind(), ErrorKind::Unknown);
}

void TestCircuitBreaker::testFailuresWhileOpenDoNotTripAgain()
{
    QSignalSpy trippedSpy(breaker_, &CircuitBreaker::tripped);
    QVERIFY(breaker_->recordFailure("530 Login incorrect").tripped);
    QVERIFY(!breaker_->recordFailure("530 Login incorrect").tripped);
    QCOMPARE(trippedSpy.count(), 1);
}

void TestCircuitBreaker::testRetryDelays()
{
    QCOMPARE(breaker_->retryDelayMs(1), 1000);
    QCOMPARE(breaker_->retryDelayMs(2), 2000);
    QCOMPARE(breaker_->retryDelayMs(3), 4000);
    QCOMPARE(breaker_->retryDelayMs(4), 8000);
    QCOMPARE(breaker_->retryDelayMs(5), 10000);
    QCOMPARE(breaker_->retryDelayMs(20), 10000);
    QCOMPARE(breaker_->retryDelayMs(0), 1000);

    CircuitBreakerConfig config;
    config.baseRetryDelayMs = 0;
    config.maxRetryDelayMs = 0;
    breaker_->setConfig(config);
    QCOMPARE(breaker_->retryDelayMs(3), 0);
}

void TestCircuitBreaker::testShouldRetry()
{
    // Two retries beyond the first attempt
    QVERIFY(breaker_->shouldRetry(1, ErrorKind::Network));
    QVERIFY(breaker_->shouldRetry(2, ErrorKind::Network));
    QVERIFY(!breaker_->shouldRetry(3, ErrorKind::Network));

    QVERIFY(breaker_->shouldRetry(1, ErrorKind::RateLimited));
    QVERIFY(breaker_->shouldRetry(2, ErrorKind::Unknown));
    QVERIFY(!breaker_->shouldRetry(3, ErrorKind::Unknown));

    QVERIFY(!breaker_->shouldRetry(1, ErrorKind::Fatal));
    QVERIFY(!breaker_->shouldRetry(1, ErrorKind::Item));

    CircuitBreakerConfig config;
    config.maxRetriesPerFile = 0;
    breaker_->setConfig(config);
    QVERIFY(!breaker_->shouldRetry(1, ErrorKind::Network));
}

void TestCircuitBreaker::testReconnectSuccessClosesOnProbation()
{
    QSignalSpy stateSpy(breaker_, &CircuitBreaker::stateChanged);

    breaker_->recordFailure("Connection reset");
    breaker_->recordFailure("Connection reset");
    QVERIFY(breaker_->recordFailure("Connection reset").tripped);

    breaker_->markReconnecting();
    QCOMPARE(breaker_->state(), CircuitBreaker::State::Reconnecting);
    QVERIFY(breaker_->isOpen());

    breaker_->markReconnected();
    QCOMPARE(breaker_->state(), CircuitBreaker::State::Closed);
    QCOMPARE(breaker_->pauseReason(), PauseReason::None);
    QCOMPARE(stateSpy.count(), 3);

    // One more counted failure reopens at once
    QVERIFY(breaker_->recordFailure("Connection reset").tripped);
    QCOMPARE(breaker_->state(), CircuitBreaker::State::Open);
}

void TestCircuitBreaker::testReconnectFailureStaysOpen()
{
    breaker_->recordFailure("Connection reset");
    breaker_->recordFailure("Connection reset");
    breaker_->recordFailure("Connection reset");

    breaker_->markReconnecting();
    breaker_->markReconnectFailed();
    QCOMPARE(breaker_->state(), CircuitBreaker::State::Open);
    QCOMPARE(breaker_->pauseReason(), PauseReason::ConnectionLost);
}

void TestCircuitBreaker::testReconnectRequiresOpenBreaker()
{
    breaker_->markReconnecting();
    QCOMPARE(breaker_->state(), CircuitBreaker::State::Closed);

    breaker_->markReconnected();
    QCOMPARE(breaker_->state(), CircuitBreaker::State::Closed);
    QCOMPARE(breaker_->consecutiveFailures(), 0);
}

void TestCircuitBreaker::testReset()
{
    breaker_->recordFailure("530 Login incorrect");
    breaker_->reset();
    QCOMPARE(breaker_->state(), CircuitBreaker::State::Closed);
    QCOMPARE(breaker_->consecutiveFailures(), 0);
    QCOMPARE(breaker_->pauseReason(), PauseReason::None);
    QVERIFY(breaker_->lastError().message.isEmpty());
}

void TestCircuitBreaker::testConfigClampsThreshold()
{
    CircuitBreakerConfig config;
    config.maxConsecutiveErrors = 0;
    config.maxRetriesPerFile = -4;
    breaker_->setConfig(config);

    QCOMPARE(breaker_->config().maxConsecutiveErrors, 1);
    QCOMPARE(breaker_->config().maxRetriesPerFile, 0);
    QVERIFY(breaker_->recordFailure("Connection reset").tripped);
}

QTEST_GUILESS_MAIN(TestCircuitBreaker)
#include "test_circuitbreaker.moc"
