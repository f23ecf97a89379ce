#include "VirtualWindow.h"
#include "IRenderSurface.h"
#include "PackingLayoutEngine.h"
#include "../core/Settings.h"

#include <QTimer>
#include <QDebug>

WindowOptions WindowOptions::fromSettings()
{
    auto* s = Settings::instance();
    WindowOptions o;
    o.buffer = s->virtualBuffer();
    o.estimatedItemHeight = s->estimatedItemHeight();
    o.threshold = s->virtualThreshold();
    o.adaptiveBuffer = s->adaptiveVirtualBuffer();
    return o;
}

VirtualWindow::VirtualWindow(IRenderSurface* surface, PackingLayoutEngine* engine,
                             const WindowOptions& options, QObject* parent)
    : QObject(parent)
    , m_surface(surface)
    , m_engine(engine)
    , m_options(options)
    , m_estimatedItemHeight(options.estimatedItemHeight)
{
    m_elapsed.start();
    m_clock = [this]() { return m_elapsed.nsecsElapsed() / 1e6; };
}

bool VirtualWindow::shouldActivate(int itemCount, int threshold)
{
    return itemCount > threshold;
}

// ═══════════════════════════════════════════════════════════════════
//  Inputs
// ═══════════════════════════════════════════════════════════════════

void VirtualWindow::setItems(const MediaItemList& items)
{
    qDebug() << "[VirtualWindow] setItems:" << items.size() << "items";

    dematerializeAll();
    invalidate();
    m_items = items;
    m_scrollTop = 0.0;

    updateScrollHeight();
    render();
}

void VirtualWindow::setScrollTop(double scrollTop)
{
    m_scrollTop = qMax(0.0, scrollTop);
    render();
}

void VirtualWindow::setViewport(double width, double height)
{
    const bool widthChanged = !qFuzzyCompare(width + 1.0, m_viewportWidth + 1.0);
    m_viewportWidth = width;
    m_viewportHeight = qMax(0.0, height);

    if (m_engine)
        m_engine->setViewportWidth(static_cast<int>(width));

    if (widthChanged && !m_items.isEmpty()) {
        // Measurements were taken at the old item width
        dematerializeAll();
        invalidate();
        updateScrollHeight();
    }
    render();
}

void VirtualWindow::setBuffer(int buffer)
{
    m_options.buffer = qMax(0, buffer);
}

void VirtualWindow::destroy()
{
    dematerializeAll();
    invalidate();
    m_items.clear();
    m_startIndex = 0;
    m_endIndex = 0;
    m_totalHeight = 0.0;
    if (m_surface)
        m_surface->setContentHeight(0.0);
}

// ═══════════════════════════════════════════════════════════════════
//  Visible range (phase 1)
// ═══════════════════════════════════════════════════════════════════

double VirtualWindow::heightAt(int index) const
{
    auto it = m_measurementCache.constFind(index);
    return it != m_measurementCache.cend() ? it->height() : m_estimatedItemHeight;
}

double VirtualWindow::accumulatedTop(int index) const
{
    double top = 0.0;
    for (int i = 0; i < index && i < m_items.size(); ++i)
        top += heightAt(i);
    return top;
}

VirtualWindow::Range VirtualWindow::calculateVisibleRange() const
{
    Range range;
    const int count = m_items.size();
    if (count == 0) return range;

    const double bufferPx = m_options.buffer * m_estimatedItemHeight;
    const double visibleTop = m_scrollTop - bufferPx;
    const double visibleBottom = m_scrollTop + m_viewportHeight + bufferPx;

    // First item whose bottom edge is below the buffered top
    double currentTop = 0.0;
    range.start = count;
    for (int i = 0; i < count; ++i) {
        const double h = heightAt(i);
        if (currentTop + h > visibleTop) {
            range.start = i;
            break;
        }
        currentTop += h;
    }

    // First item whose top is past the buffered bottom
    range.end = count;
    for (int i = range.start; i < count; ++i) {
        if (currentTop > visibleBottom) {
            range.end = i;
            break;
        }
        currentTop += heightAt(i);
    }
    return range;
}

// ═══════════════════════════════════════════════════════════════════
//  render: measurement kick-off + materialization
// ═══════════════════════════════════════════════════════════════════

void VirtualWindow::render()
{
    if (!m_surface) return;

    const Range range = calculateVisibleRange();

    QVector<int> toMeasure;
    for (int i = range.start; i < range.end; ++i) {
        if (!m_measurementCache.contains(i))
            toMeasure.append(i);
    }
    if (!toMeasure.isEmpty())
        measure(toMeasure);

    // Drop nodes that left the range
    for (auto it = m_visibleNodes.begin(); it != m_visibleNodes.end();) {
        if (it.key() < range.start || it.key() >= range.end) {
            m_surface->dematerialize(it.key(), it.value());
            m_placedAtEstimate.remove(it.key());
            it = m_visibleNodes.erase(it);
        } else {
            ++it;
        }
    }

    // Create newly in-range nodes; move estimated ones onto their measurement
    double top = accumulatedTop(range.start);
    for (int i = range.start; i < range.end; ++i) {
        const bool cached = m_measurementCache.contains(i);
        const QRectF geometry = cached ? m_measurementCache.value(i)
                                       : estimatedGeometry(top);

        auto it = m_visibleNodes.constFind(i);
        if (it == m_visibleNodes.cend()) {
            NodeRef node = m_surface->materialize(i, m_items.at(i), geometry);
            m_visibleNodes.insert(i, node);
            if (!cached)
                m_placedAtEstimate.insert(i);
        } else if (cached && m_placedAtEstimate.contains(i)) {
            m_surface->placeNode(it.value(), geometry);
            m_placedAtEstimate.remove(i);
        }
        top += heightAt(i);
    }

    if (range.start != m_startIndex || range.end != m_endIndex) {
        m_startIndex = range.start;
        m_endIndex = range.end;
        emit rangeChanged(m_startIndex, m_endIndex);
    }

    recordFrame();
    adjustBufferByFps();
}

QRectF VirtualWindow::estimatedGeometry(double top) const
{
    const double width = m_engine && m_surface ? m_engine->itemWidth(m_surface->surfaceWidth())
                                               : 0.0;
    return QRectF(0.0, top, qMax(0.0, width), m_estimatedItemHeight);
}

// ═══════════════════════════════════════════════════════════════════
//  Measurement (phase 2)
// ═══════════════════════════════════════════════════════════════════

void VirtualWindow::measure(const QVector<int>& indices)
{
    // One pass at a time; the follow-up render picks up what is left
    if (m_isMeasuring || indices.isEmpty() || !m_engine) return;

    const double width = m_surface->surfaceWidth();
    if (width <= 0) return;

    m_isMeasuring = true;
    const double itemWidth = m_engine->itemWidth(width);

    QVector<NodeRef> nodes;
    nodes.reserve(indices.size());
    for (int index : indices)
        nodes.append(m_surface->createMeasurementNode(index, m_items.at(index), itemWidth));

    // Let the surface lay the off-surface nodes out before reading them back
    const quint64 generation = m_generation;
    QTimer::singleShot(0, this, [this, generation, width, indices, nodes]() {
        commitMeasurements(generation, width, indices, nodes);
    });
}

void VirtualWindow::commitMeasurements(quint64 generation, double width,
                                       const QVector<int>& indices,
                                       const QVector<NodeRef>& nodes)
{
    // Item set or width changed while waiting: the nodes are already gone
    if (generation != m_generation) return;
    m_isMeasuring = false;

    QVector<LayoutItem> batch;
    QVector<QSizeF> sizes;
    batch.reserve(indices.size());
    sizes.reserve(indices.size());
    for (int k = 0; k < indices.size(); ++k) {
        const MediaItem& item = m_items.at(indices[k]);
        const QSizeF size = m_surface->measuredSize(nodes[k]);

        LayoutItem li;
        li.node = nodes[k];
        if (item.hasDimensions())
            li.declaredAspect = QSizeF(item.dimensions);
        li.measuredHeight = size.height();
        batch.append(li);
        sizes.append(size);
    }

    // The batch is packed on fresh columns and then shifted down to the
    // linear accumulated top of its first index. Consecutive small batches
    // therefore start again at column 0, and a far jump leaves the skipped
    // span at estimated height.
    const QVector<LayoutItem> placed = m_engine->layoutBatch(width, batch);
    const double origin = accumulatedTop(indices.first());

    for (int k = 0; k < indices.size(); ++k) {
        const QRectF& g = placed[k].geometry;
        const double h = sizes[k].height() > 0 ? sizes[k].height() : g.height();
        const double w = sizes[k].width() > 0 ? sizes[k].width() : g.width();
        m_measurementCache.insert(indices[k], QRectF(g.left(), origin + g.top(), w, h));
        m_measuredHeightSum += h;
    }
    m_surface->releaseMeasurementNodes();

    // Self-correcting estimate: mean of everything measured so far
    m_estimatedItemHeight = m_measuredHeightSum / m_measurementCache.size();

    updateScrollHeight();
    emit measurementCommitted(indices.size());

    render();
}

// ═══════════════════════════════════════════════════════════════════
//  Helpers
// ═══════════════════════════════════════════════════════════════════

void VirtualWindow::invalidate()
{
    ++m_generation;
    if (m_isMeasuring && m_surface)
        m_surface->releaseMeasurementNodes();
    m_isMeasuring = false;
    m_measurementCache.clear();
    m_measuredHeightSum = 0.0;
}

void VirtualWindow::dematerializeAll()
{
    if (m_surface) {
        for (auto it = m_visibleNodes.cbegin(); it != m_visibleNodes.cend(); ++it)
            m_surface->dematerialize(it.key(), it.value());
    }
    m_visibleNodes.clear();
    m_placedAtEstimate.clear();
    m_startIndex = 0;
    m_endIndex = 0;
}

void VirtualWindow::updateScrollHeight()
{
    double total = 0.0;
    for (int i = 0; i < m_items.size(); ++i)
        total += heightAt(i);

    m_totalHeight = total;
    if (m_surface)
        m_surface->setContentHeight(total);
    emit totalHeightChanged(total);
}

// ═══════════════════════════════════════════════════════════════════
//  Adaptive buffer
// ═══════════════════════════════════════════════════════════════════

void VirtualWindow::recordFrame()
{
    const double now = m_clock();
    if (m_lastFrameMs >= 0.0) {
        const double frameTime = now - m_lastFrameMs;
        const double fps = frameTime > 0.0 ? 1000.0 / frameTime : 0.0;
        // Bursts of renders inside one frame say nothing about the frame rate
        if (fps > 0.0 && fps < 120.0) {
            m_fpsSamples.append(fps);
            if (m_fpsSamples.size() > m_options.fpsSampleWindow)
                m_fpsSamples.removeFirst();
        }
    }
    m_lastFrameMs = now;
}

double VirtualWindow::averageFps() const
{
    if (m_fpsSamples.isEmpty()) return 0.0;
    double sum = 0.0;
    for (double fps : m_fpsSamples)
        sum += fps;
    return sum / m_fpsSamples.size();
}

void VirtualWindow::adjustBufferByFps()
{
    if (!m_options.adaptiveBuffer || m_fpsSamples.size() < 5) return;

    const double now = m_clock();
    if (m_lastBufferAdjustMs >= 0.0
        && now - m_lastBufferAdjustMs < m_options.bufferAdjustIntervalMs)
        return;

    const double avg = averageFps();
    int buffer = m_options.buffer;
    if (avg < 45.0)
        buffer = qMax(m_options.minBuffer, buffer - m_options.bufferStep);
    else if (avg > 58.0)
        buffer = qMin(m_options.maxBuffer, buffer + m_options.bufferStep);

    if (buffer != m_options.buffer) {
        qDebug() << "[VirtualWindow] Buffer" << m_options.buffer << "->" << buffer
                 << "at" << qRound(avg) << "fps";
        m_options.buffer = buffer;
        m_lastBufferAdjustMs = now;
        emit bufferChanged(buffer);
    }
}
