#pragma once

#include <QObject>
#include <QElapsedTimer>
#include <QHash>
#include <QRectF>
#include <QSet>
#include <QVector>
#include <functional>

#include "../core/MediaItem.h"

class IRenderSurface;
class PackingLayoutEngine;

struct WindowOptions {
    int buffer = 10;                     // in estimated item heights
    double estimatedItemHeight = 300.0;  // initial estimate before any measurement
    int threshold = 100;                 // windowing engages above this count

    // Frame-rate driven buffer: shrink when renders are slow, grow when fast
    bool adaptiveBuffer = true;
    int minBuffer = 6;
    int maxBuffer = 30;
    int bufferStep = 2;
    int fpsSampleWindow = 30;
    int bufferAdjustIntervalMs = 1000;

    static WindowOptions fromSettings();
};

// Keeps only the slice of a large item set that intersects the viewport
// (plus a buffer) materialized on the surface.
//
// Rendering is two-phase. Uncached in-range items are first rendered
// off-surface, laid out as a batch by PackingLayoutEngine after one
// event-loop turn, and their sizes committed to the measurement cache.
// Materialization then places visible nodes at cached coordinates, or at
// estimated ones until the measurement lands.
//
// The measurement cache only grows, except on explicit invalidation (a
// width change or a new item set). It determines the scrollable extent:
// measured heights plus the running mean estimate for everything else.
class VirtualWindow : public QObject {
    Q_OBJECT
public:
    struct Range {
        int start = 0;
        int end = 0;    // exclusive
    };

    VirtualWindow(IRenderSurface* surface, PackingLayoutEngine* engine,
                  const WindowOptions& options = WindowOptions(),
                  QObject* parent = nullptr);

    static bool shouldActivate(int itemCount, int threshold);

    void setItems(const MediaItemList& items);
    void setScrollTop(double scrollTop);
    void setViewport(double width, double height);
    void setBuffer(int buffer);
    void render();

    // Monotonic milliseconds; defaults to a QElapsedTimer started at construction
    using FrameClock = std::function<double()>;
    void setFrameClock(FrameClock clock) { m_clock = std::move(clock); }
    void destroy();

    Range calculateVisibleRange() const;

    int startIndex() const { return m_startIndex; }
    int endIndex() const { return m_endIndex; }
    int itemCount() const { return m_items.size(); }
    int buffer() const { return m_options.buffer; }
    double scrollTop() const { return m_scrollTop; }
    double estimatedItemHeight() const { return m_estimatedItemHeight; }
    double totalHeight() const { return m_totalHeight; }
    double averageFps() const;
    int fpsSampleCount() const { return m_fpsSamples.size(); }
    bool isMeasuring() const { return m_isMeasuring; }

    bool hasMeasurement(int index) const { return m_measurementCache.contains(index); }
    QRectF measurement(int index) const { return m_measurementCache.value(index); }
    int measuredCount() const { return m_measurementCache.size(); }

    NodeRef nodeAt(int index) const { return m_visibleNodes.value(index, 0); }
    int materializedCount() const { return m_visibleNodes.size(); }

signals:
    void rangeChanged(int start, int end);
    void measurementCommitted(int count);
    void totalHeightChanged(double height);
    void bufferChanged(int buffer);

private:
    double heightAt(int index) const;
    double accumulatedTop(int index) const;
    QRectF estimatedGeometry(double top) const;

    void measure(const QVector<int>& indices);
    void commitMeasurements(quint64 generation, double width,
                            const QVector<int>& indices, const QVector<NodeRef>& nodes);
    void invalidate();
    void dematerializeAll();
    void updateScrollHeight();

    void recordFrame();
    void adjustBufferByFps();

    IRenderSurface* m_surface = nullptr;
    PackingLayoutEngine* m_engine = nullptr;
    WindowOptions m_options;

    MediaItemList m_items;
    double m_scrollTop = 0.0;
    double m_viewportWidth = 0.0;
    double m_viewportHeight = 0.0;
    int m_startIndex = 0;
    int m_endIndex = 0;

    QHash<int, QRectF> m_measurementCache;
    double m_measuredHeightSum = 0.0;
    double m_estimatedItemHeight = 300.0;
    double m_totalHeight = 0.0;

    QHash<int, NodeRef> m_visibleNodes;
    QSet<int> m_placedAtEstimate;   // visible, waiting for their measurement

    bool m_isMeasuring = false;
    quint64 m_generation = 0;       // bumped whenever pending measurements go stale

    QElapsedTimer m_elapsed;
    FrameClock m_clock;
    double m_lastFrameMs = -1.0;
    double m_lastBufferAdjustMs = -1.0;
    QVector<double> m_fpsSamples;
};
