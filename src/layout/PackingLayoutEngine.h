#pragma once

#include <QObject>
#include <QRectF>
#include <QSizeF>
#include <QVector>
#include <optional>

#include "../core/MediaItem.h"

// ── Layout data ─────────────────────────────────────────────────────
struct LayoutItem {
    NodeRef node = 0;
    std::optional<QSizeF> declaredAspect;   // w:h, from item metadata
    double measuredHeight = 0.0;            // 0 = not laid out / hidden

    // Written by PackingLayoutEngine
    QRectF geometry;
    int column = -1;
};

struct LayoutOptions {
    double gap = 16.0;
    double fallbackHeight = 300.0;

    static LayoutOptions fromSettings();
};

// Greedy shortest-column (masonry) packing.
//
// Items are placed strictly in sequence order: each goes to the column with
// the smallest current height, lowest index on ties. The engine owns the
// column heights and the laid-out set; both are mutated only here, under a
// reentrancy guard. A relayout requested while a pass is running is dropped
// and answered with a single relayoutRequested() once the pass completes.
class PackingLayoutEngine : public QObject {
    Q_OBJECT
public:
    explicit PackingLayoutEngine(const LayoutOptions& options = LayoutOptions(),
                                 QObject* parent = nullptr);

    // Breakpoint step function: wider viewport ⇒ more or equal columns
    static int columnsForWidth(int viewportWidth);

    void setViewportWidth(int viewportWidth);
    int columnCount() const { return m_columns; }
    const LayoutOptions& options() const { return m_options; }

    // Both return false when nothing was laid out (empty input, zero-width
    // container, or dropped by the reentrancy guard).
    bool relayoutAll(double containerWidth, const QVector<LayoutItem>& items);
    bool relayoutIncremental(double containerWidth, const QVector<LayoutItem>& newItems);

    // Places a batch on fresh columns without touching the engine's state.
    QVector<LayoutItem> layoutBatch(double containerWidth,
                                    const QVector<LayoutItem>& items) const;

    double itemWidth(double containerWidth) const;

    const QVector<LayoutItem>& items() const { return m_items; }
    QVector<double> columnHeights() const { return m_columnHeights; }
    double containerHeight() const;
    bool hasColumnState() const { return m_columnHeights.size() == m_columns; }
    bool isLayingOut() const { return m_isLayingOut; }

    void clear();

signals:
    void containerHeightChanged(double height);
    void relayoutRequested();

private:
    bool beginPass();
    void endPass();
    void placeRange(int from, double itemWidth);

    static void placeItem(LayoutItem& item, QVector<double>& columnHeights,
                          double itemWidth, const LayoutOptions& options);

    LayoutOptions m_options;
    int m_columns = 2;
    QVector<double> m_columnHeights;    // ColumnState
    QVector<LayoutItem> m_items;
    bool m_isLayingOut = false;
    bool m_droppedDuringPass = false;
};
