#include "PackingLayoutEngine.h"
#include "../core/Settings.h"

#include <QDebug>
#include <algorithm>

LayoutOptions LayoutOptions::fromSettings()
{
    auto* s = Settings::instance();
    LayoutOptions o;
    o.gap = s->gridGap();
    o.fallbackHeight = s->fallbackItemHeight();
    return o;
}

PackingLayoutEngine::PackingLayoutEngine(const LayoutOptions& options, QObject* parent)
    : QObject(parent)
    , m_options(options)
{
}

// ═══════════════════════════════════════════════════════════════════
//  Column breakpoints
// ═══════════════════════════════════════════════════════════════════
int PackingLayoutEngine::columnsForWidth(int viewportWidth)
{
    // Large screens first
    if (viewportWidth >= 3840) return 12;
    if (viewportWidth >= 2560) return 10;
    if (viewportWidth >= 1920) return 8;

    if (viewportWidth >= 1536) return 6;
    if (viewportWidth >= 1280) return 5;
    if (viewportWidth >= 1024) return 4;
    if (viewportWidth >= 768) return 3;
    return 2;
}

void PackingLayoutEngine::setViewportWidth(int viewportWidth)
{
    int columns = columnsForWidth(viewportWidth);
    if (columns == m_columns) return;

    qDebug() << "[Layout] Columns" << m_columns << "->" << columns
             << "at width" << viewportWidth;
    m_columns = columns;
    // ColumnState no longer matches; next call relays out everything
    m_columnHeights.clear();
}

double PackingLayoutEngine::itemWidth(double containerWidth) const
{
    return (containerWidth - m_options.gap * (m_columns - 1)) / m_columns;
}

double PackingLayoutEngine::containerHeight() const
{
    if (m_columnHeights.isEmpty()) return 0.0;
    return *std::max_element(m_columnHeights.cbegin(), m_columnHeights.cend());
}

void PackingLayoutEngine::clear()
{
    m_items.clear();
    m_columnHeights.clear();
}

// ═══════════════════════════════════════════════════════════════════
//  Reentrancy guard
// ═══════════════════════════════════════════════════════════════════
bool PackingLayoutEngine::beginPass()
{
    if (m_isLayingOut) {
        m_droppedDuringPass = true;
        qDebug() << "[Layout] Relayout already in progress, request dropped";
        return false;
    }
    m_isLayingOut = true;
    return true;
}

void PackingLayoutEngine::endPass()
{
    emit containerHeightChanged(containerHeight());
    m_isLayingOut = false;

    if (m_droppedDuringPass) {
        m_droppedDuringPass = false;
        emit relayoutRequested();
    }
}

// ═══════════════════════════════════════════════════════════════════
//  Placement
// ═══════════════════════════════════════════════════════════════════
void PackingLayoutEngine::placeItem(LayoutItem& item, QVector<double>& columnHeights,
                                    double itemWidth, const LayoutOptions& options)
{
    // First minimum wins: ties go to the lowest column index
    auto it = std::min_element(columnHeights.begin(), columnHeights.end());
    const int col = static_cast<int>(it - columnHeights.begin());

    double height = 0.0;
    if (item.declaredAspect && item.declaredAspect->width() > 0
        && item.declaredAspect->height() > 0 && itemWidth > 0) {
        height = itemWidth * (item.declaredAspect->height() / item.declaredAspect->width());
    } else {
        height = item.measuredHeight > 0 ? item.measuredHeight : options.fallbackHeight;
    }

    item.column = col;
    item.geometry = QRectF(col * (itemWidth + options.gap), columnHeights[col],
                           itemWidth, height);
    columnHeights[col] += height + options.gap;
}

void PackingLayoutEngine::placeRange(int from, double itemWidth)
{
    for (int i = from; i < m_items.size(); ++i)
        placeItem(m_items[i], m_columnHeights, itemWidth, m_options);
}

bool PackingLayoutEngine::relayoutAll(double containerWidth, const QVector<LayoutItem>& items)
{
    if (items.isEmpty() || containerWidth <= 0) return false;
    if (!beginPass()) return false;

    m_items = items;
    m_columnHeights = QVector<double>(m_columns, 0.0);
    placeRange(0, itemWidth(containerWidth));

    endPass();
    return true;
}

bool PackingLayoutEngine::relayoutIncremental(double containerWidth,
                                              const QVector<LayoutItem>& newItems)
{
    if (newItems.isEmpty() || containerWidth <= 0) return false;
    if (!beginPass()) return false;

    const int firstNew = m_items.size();
    m_items += newItems;

    if (!hasColumnState()) {
        // First batch, or the column count changed since the last pass
        m_columnHeights = QVector<double>(m_columns, 0.0);
        placeRange(0, itemWidth(containerWidth));
    } else {
        placeRange(firstNew, itemWidth(containerWidth));
    }

    endPass();
    return true;
}

QVector<LayoutItem> PackingLayoutEngine::layoutBatch(double containerWidth,
                                                     const QVector<LayoutItem>& items) const
{
    QVector<LayoutItem> placed = items;
    if (placed.isEmpty() || containerWidth <= 0) return placed;

    QVector<double> heights(m_columns, 0.0);
    const double w = itemWidth(containerWidth);
    for (LayoutItem& item : placed)
        placeItem(item, heights, w, m_options);
    return placed;
}
