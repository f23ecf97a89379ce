#include "RetryPolicy.h"

#include <QLocale>
#include <QRandomGenerator>
#include <QTimeZone>
#include <limits>

int RetryPolicy::rateLimitBackoffMs(int previousDelayMs, int jitterMs, int maxBackoffMs,
                                    QRandomGenerator* rng)
{
    if (!rng) rng = QRandomGenerator::global();

    const qint64 jitter = jitterMs > 0 ? rng->bounded(jitterMs) : 0;
    qint64 delay = qint64(qMax(0, previousDelayMs)) * 2 + jitter;
    if (maxBackoffMs > 0)
        delay = qMin<qint64>(delay, maxBackoffMs);
    return static_cast<int>(qMin<qint64>(delay, std::numeric_limits<int>::max()));
}

std::optional<int> RetryPolicy::parseRetryAfter(const QByteArray& value, const QDateTime& nowUtc)
{
    const QByteArray trimmed = value.trimmed();
    if (trimmed.isEmpty()) return std::nullopt;

    // delta-seconds
    bool ok = false;
    const qint64 seconds = trimmed.toLongLong(&ok);
    if (ok) {
        if (seconds < 0) return std::nullopt;
        return static_cast<int>(qMin<qint64>(seconds * 1000, std::numeric_limits<int>::max()));
    }

    // HTTP-date (IMF-fixdate), e.g. "Sun, 06 Nov 1994 08:49:37 GMT"
    const QString text = QString::fromLatin1(trimmed);
    QDateTime when = QLocale::c().toDateTime(text, QStringLiteral("ddd, dd MMM yyyy HH:mm:ss 'GMT'"));
    if (when.isValid())
        when = QDateTime(when.date(), when.time(), QTimeZone::utc());
    else
        when = QDateTime::fromString(text, Qt::RFC2822Date);
    if (!when.isValid()) return std::nullopt;

    const qint64 ms = nowUtc.msecsTo(when);
    return static_cast<int>(qBound<qint64>(0, ms, std::numeric_limits<int>::max()));
}
