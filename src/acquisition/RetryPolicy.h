#pragma once

#include <QByteArray>
#include <QDateTime>
#include <optional>

class QRandomGenerator;

// Delay arithmetic for thumbnail retries.
class RetryPolicy {
public:
    // previousDelay*2 + jitter, jitter uniform in [0, jitterMs), capped
    static int rateLimitBackoffMs(int previousDelayMs, int jitterMs, int maxBackoffMs,
                                  QRandomGenerator* rng = nullptr);

    // Retry-After as delta-seconds or HTTP-date. nullopt if absent or unparseable.
    static std::optional<int> parseRetryAfter(const QByteArray& value,
                                              const QDateTime& nowUtc = QDateTime::currentDateTimeUtc());
};
