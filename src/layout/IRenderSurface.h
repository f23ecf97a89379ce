#pragma once

#include <QRectF>
#include <QSizeF>
#include "../core/MediaItem.h"

// Host rendering surface: places rectangular nodes at absolute offsets,
// supports invisible off-surface nodes for measurement, and reports the
// size a node actually rendered at.
class IRenderSurface {
public:
    virtual ~IRenderSurface() = default;

    virtual double surfaceWidth() const = 0;

    // ── Off-surface measurement (invisible, non-interactive) ─────────
    virtual NodeRef createMeasurementNode(int index, const MediaItem& item, double width) = 0;
    virtual QSizeF measuredSize(NodeRef node) const = 0;
    virtual void releaseMeasurementNodes() = 0;

    // ── Visible tree ─────────────────────────────────────────────────
    virtual NodeRef materialize(int index, const MediaItem& item, const QRectF& geometry) = 0;
    virtual void placeNode(NodeRef node, const QRectF& geometry) = 0;
    virtual void dematerialize(int index, NodeRef node) = 0;
    virtual void setContentHeight(double height) = 0;

    virtual bool isAttached(NodeRef node) const = 0;
};
