#pragma once

#include <QObject>
#include <QSettings>
#include <QVariant>

class Settings : public QObject {
    Q_OBJECT

public:
    static Settings* instance();

    // ── Grid layout ─────────────────────────────────────────────────
    int gridGap() const;
    void setGridGap(int px);

    // Height used when an item has neither a declared aspect nor a
    // measured height yet
    int fallbackItemHeight() const;
    void setFallbackItemHeight(int px);

    // ── Virtual window ──────────────────────────────────────────────
    // Item count above which only the visible window is materialized
    int virtualThreshold() const;
    void setVirtualThreshold(int count);

    // Buffer, in estimated item heights, above and below the viewport
    int virtualBuffer() const;
    void setVirtualBuffer(int items);

    // Let the buffer follow the measured frame rate
    bool adaptiveVirtualBuffer() const;
    void setAdaptiveVirtualBuffer(bool enabled);

    // Detached cards kept for reuse while scrolling
    int cardPoolSize() const;
    void setCardPoolSize(int cards);

    int estimatedItemHeight() const;
    void setEstimatedItemHeight(int px);

    int relayoutCoalesceMs() const;
    void setRelayoutCoalesceMs(int ms);

    int visibilityMarginPx() const;
    void setVisibilityMarginPx(int px);

    // ── Thumbnails ──────────────────────────────────────────────────
    int thumbnailConcurrency() const;
    void setThumbnailConcurrency(int count);

    int thumbnailRetryBudget() const;
    void setThumbnailRetryBudget(int attempts);

    // Poll interval while the server answers 202 (still generating)
    int thumbnailProcessingDelayMs() const;
    void setThumbnailProcessingDelayMs(int ms);

    // Starting delay for 429 backoff
    int thumbnailRateLimitBaseDelayMs() const;
    void setThumbnailRateLimitBaseDelayMs(int ms);

    int thumbnailMaxBackoffMs() const;
    void setThumbnailMaxBackoffMs(int ms);

    int thumbnailRequestTimeoutMs() const;
    void setThumbnailRequestTimeoutMs(int ms);

    int thumbnailCacheEntries() const;
    void setThumbnailCacheEntries(int entries);

    // ── Generic access (for external callers) ────────────────────────
    QVariant value(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);
    void remove(const QString& key);
    void sync() { m_settings.sync(); }

    // INI file path, use to create local QSettings(IniFormat) in other files
    static QString settingsPath();

private:
    explicit Settings(QObject* parent = nullptr);
    QSettings m_settings;
};
