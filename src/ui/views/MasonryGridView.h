#pragma once

#include <QWidget>
#include <QHash>
#include <QScrollArea>
#include <QSet>
#include <QVector>
#include <memory>

#include "../../core/CancellationRegistry.h"
#include "../../core/MediaItem.h"
#include "../../layout/IRenderSurface.h"
#include "../../layout/PackingLayoutEngine.h"
#include "../../layout/VirtualWindow.h"
#include "../../acquisition/AcquisitionPipeline.h"

class QTimer;
class INetworkLayer;
class RelayoutScheduler;
class ThumbnailCard;

struct GridViewOptions {
    LayoutOptions layout;
    WindowOptions window;
    AcquisitionConfig acquisition;
    int relayoutCoalesceMs = 80;
    int visibilityMarginPx = 200;
    int resizeDebounceMs = 150;
    int maxPoolSize = 60;               // detached cards kept for reuse

    static GridViewOptions fromSettings();
};

// Scrollable masonry grid of media thumbnails.
//
// Small sets are packed directly: every card exists and
// PackingLayoutEngine places them all. Above the virtual threshold the
// grid hands its items to a VirtualWindow and only materializes the
// visible slice. Either way, a card that scrolls within the visibility
// margin is handed to the AcquisitionPipeline once, and loaded
// thumbnails trigger a coalesced relayout.
class MasonryGridView : public QWidget, public IRenderSurface
{
    Q_OBJECT

public:
    // Null network = own a QtNetworkLayer; null registry = own one too
    explicit MasonryGridView(QWidget* parent = nullptr);
    MasonryGridView(const GridViewOptions& options, INetworkLayer* network,
                    CancellationRegistry* registry, QWidget* parent = nullptr);
    ~MasonryGridView() override;

    void setItems(const MediaItemList& items);
    void appendItems(const MediaItemList& items);
    void clearItems();

    // Cancels every in-flight thumbnail request of this grid
    void abortThumbnails();
    void requestRelayout();

    bool isVirtualized() const { return m_virtualized; }
    int itemCount() const { return m_items.size(); }
    int cardCount() const { return m_cards.size(); }
    ThumbnailCard* cardForNode(NodeRef node) const { return m_cards.value(node); }
    ThumbnailCard* cardAt(int index) const;
    int pooledCardCount() const { return m_cardPool.size(); }
    int createdCardCount() const { return m_createdCards; }
    int reusedCardCount() const { return m_reusedCards; }
    QScrollArea* scrollArea() const { return m_scrollArea; }

    PackingLayoutEngine* layoutEngine() const { return m_engine; }
    VirtualWindow* virtualWindow() const { return m_window; }
    AcquisitionPipeline* pipeline() const { return m_pipeline; }
    CancellationRegistry* cancellationRegistry() const { return m_registry; }

    // ── IRenderSurface ──────────────────────────────────────────────
    double surfaceWidth() const override;
    NodeRef createMeasurementNode(int index, const MediaItem& item, double width) override;
    QSizeF measuredSize(NodeRef node) const override;
    void releaseMeasurementNodes() override;
    NodeRef materialize(int index, const MediaItem& item, const QRectF& geometry) override;
    void placeNode(NodeRef node, const QRectF& geometry) override;
    void dematerialize(int index, NodeRef node) override;
    void setContentHeight(double height) override;
    bool isAttached(NodeRef node) const override;

protected:
    void resizeEvent(QResizeEvent* event) override;
    void showEvent(QShowEvent* event) override;

private:
    void setupUI();
    void connectSignals();

    ThumbnailCard* createCard(const MediaItem& item, QWidget* parent, NodeRef& node);
    void removeCard(NodeRef node);
    void enterDirectMode(const MediaItemList& items);
    void enterVirtualMode(const MediaItemList& items);

    void relayoutDirect();
    void onRelayoutDue();
    void onViewportResized();
    void onScrolled(int value);

    void observe(NodeRef node);
    void checkVisibility();
    void onVisible(NodeRef node);

    QVector<LayoutItem> layoutItemsFor(const QVector<NodeRef>& nodes) const;
    void applyGeometry(const QVector<LayoutItem>& laidOut);

    GridViewOptions m_options;

    QScrollArea* m_scrollArea = nullptr;
    QWidget* m_canvas = nullptr;
    QWidget* m_measureHost = nullptr;

    std::unique_ptr<CancellationRegistry> m_ownedRegistry;
    CancellationRegistry* m_registry = nullptr;
    INetworkLayer* m_network = nullptr;
    PackingLayoutEngine* m_engine = nullptr;
    VirtualWindow* m_window = nullptr;
    AcquisitionPipeline* m_pipeline = nullptr;
    RelayoutScheduler* m_relayout = nullptr;
    QTimer* m_resizeDebounceTimer = nullptr;

    MediaItemList m_items;
    bool m_virtualized = false;

    NodeRef m_nextNode = 1;
    QHash<NodeRef, ThumbnailCard*> m_cards;         // visible tree
    QHash<NodeRef, ThumbnailCard*> m_measureCards;  // off-surface
    QVector<NodeRef> m_directOrder;                 // direct mode, item order
    QSet<NodeRef> m_observed;                       // not yet reported visible
    QVector<ThumbnailCard*> m_cardPool;             // hidden, ready for reuse
    int m_createdCards = 0;
    int m_reusedCards = 0;

    int m_lastViewportWidth = -1;
};
