#include "Settings.h"
#include <QDir>
#include <QStandardPaths>
#include <QDebug>

// ── Settings INI path ───────────────────────────────────────────────
// <GenericDataLocation>/Tessera/settings.ini
QString Settings::settingsPath()
{
    QDir dir(QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
             + QStringLiteral("/Tessera"));
    if (!dir.exists()) dir.mkpath(QStringLiteral("."));
    return dir.filePath(QStringLiteral("settings.ini"));
}

// ── Singleton ───────────────────────────────────────────────────────
Settings* Settings::instance()
{
    static Settings s;
    return &s;
}

// ── Constructor ─────────────────────────────────────────────────────
Settings::Settings(QObject* parent)
    : QObject(parent)
    , m_settings(settingsPath(), QSettings::IniFormat)
{
    qDebug() << "[Settings] INI path:" << m_settings.fileName();
}

// ── Grid layout ─────────────────────────────────────────────────────
int Settings::gridGap() const
{
    return m_settings.value(QStringLiteral("grid/gap"), 16).toInt();
}

void Settings::setGridGap(int px)
{
    m_settings.setValue(QStringLiteral("grid/gap"), qMax(0, px));
}

int Settings::fallbackItemHeight() const
{
    return m_settings.value(QStringLiteral("grid/fallbackItemHeight"), 300).toInt();
}

void Settings::setFallbackItemHeight(int px)
{
    m_settings.setValue(QStringLiteral("grid/fallbackItemHeight"), qMax(1, px));
}

// ── Virtual window ──────────────────────────────────────────────────
int Settings::virtualThreshold() const
{
    return m_settings.value(QStringLiteral("grid/virtualThreshold"), 100).toInt();
}

void Settings::setVirtualThreshold(int count)
{
    m_settings.setValue(QStringLiteral("grid/virtualThreshold"), qMax(0, count));
}

int Settings::virtualBuffer() const
{
    return m_settings.value(QStringLiteral("grid/virtualBuffer"), 15).toInt();
}

void Settings::setVirtualBuffer(int items)
{
    m_settings.setValue(QStringLiteral("grid/virtualBuffer"), qMax(0, items));
}

bool Settings::adaptiveVirtualBuffer() const
{
    return m_settings.value(QStringLiteral("grid/adaptiveBuffer"), true).toBool();
}

void Settings::setAdaptiveVirtualBuffer(bool enabled)
{
    m_settings.setValue(QStringLiteral("grid/adaptiveBuffer"), enabled);
}

int Settings::cardPoolSize() const
{
    return m_settings.value(QStringLiteral("grid/cardPoolSize"), 60).toInt();
}

void Settings::setCardPoolSize(int cards)
{
    m_settings.setValue(QStringLiteral("grid/cardPoolSize"), qMax(0, cards));
}

int Settings::estimatedItemHeight() const
{
    return m_settings.value(QStringLiteral("grid/estimatedItemHeight"), 300).toInt();
}

void Settings::setEstimatedItemHeight(int px)
{
    m_settings.setValue(QStringLiteral("grid/estimatedItemHeight"), qMax(1, px));
}

int Settings::relayoutCoalesceMs() const
{
    return m_settings.value(QStringLiteral("grid/relayoutCoalesceMs"), 80).toInt();
}

void Settings::setRelayoutCoalesceMs(int ms)
{
    m_settings.setValue(QStringLiteral("grid/relayoutCoalesceMs"), qMax(0, ms));
}

int Settings::visibilityMarginPx() const
{
    return m_settings.value(QStringLiteral("grid/visibilityMarginPx"), 200).toInt();
}

void Settings::setVisibilityMarginPx(int px)
{
    m_settings.setValue(QStringLiteral("grid/visibilityMarginPx"), qMax(0, px));
}

// ── Thumbnails ──────────────────────────────────────────────────────
int Settings::thumbnailConcurrency() const
{
    return m_settings.value(QStringLiteral("thumbnails/concurrency"), 6).toInt();
}

void Settings::setThumbnailConcurrency(int count)
{
    m_settings.setValue(QStringLiteral("thumbnails/concurrency"), qMax(1, count));
}

int Settings::thumbnailRetryBudget() const
{
    return m_settings.value(QStringLiteral("thumbnails/retryBudget"), 10).toInt();
}

void Settings::setThumbnailRetryBudget(int attempts)
{
    m_settings.setValue(QStringLiteral("thumbnails/retryBudget"), qMax(1, attempts));
}

int Settings::thumbnailProcessingDelayMs() const
{
    return m_settings.value(QStringLiteral("thumbnails/processingDelayMs"), 2000).toInt();
}

void Settings::setThumbnailProcessingDelayMs(int ms)
{
    m_settings.setValue(QStringLiteral("thumbnails/processingDelayMs"), qMax(0, ms));
}

int Settings::thumbnailRateLimitBaseDelayMs() const
{
    return m_settings.value(QStringLiteral("thumbnails/rateLimitBaseDelayMs"), 1000).toInt();
}

void Settings::setThumbnailRateLimitBaseDelayMs(int ms)
{
    m_settings.setValue(QStringLiteral("thumbnails/rateLimitBaseDelayMs"), qMax(0, ms));
}

int Settings::thumbnailMaxBackoffMs() const
{
    return m_settings.value(QStringLiteral("thumbnails/maxBackoffMs"), 60000).toInt();
}

void Settings::setThumbnailMaxBackoffMs(int ms)
{
    m_settings.setValue(QStringLiteral("thumbnails/maxBackoffMs"), qMax(0, ms));
}

int Settings::thumbnailRequestTimeoutMs() const
{
    return m_settings.value(QStringLiteral("thumbnails/requestTimeoutMs"), 15000).toInt();
}

void Settings::setThumbnailRequestTimeoutMs(int ms)
{
    m_settings.setValue(QStringLiteral("thumbnails/requestTimeoutMs"), qMax(0, ms));
}

int Settings::thumbnailCacheEntries() const
{
    return m_settings.value(QStringLiteral("thumbnails/cacheEntries"), 200).toInt();
}

void Settings::setThumbnailCacheEntries(int entries)
{
    m_settings.setValue(QStringLiteral("thumbnails/cacheEntries"), qMax(0, entries));
}

// ── Generic access ──────────────────────────────────────────────────
QVariant Settings::value(const QString& key, const QVariant& defaultValue) const
{
    return m_settings.value(key, defaultValue);
}

void Settings::setValue(const QString& key, const QVariant& value)
{
    m_settings.setValue(key, value);
}

void Settings::remove(const QString& key)
{
    m_settings.remove(key);
}
