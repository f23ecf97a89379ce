#include "MasonryGridView.h"

#include <QDebug>
#include <QResizeEvent>
#include <QScrollBar>
#include <QShowEvent>
#include <QTimer>
#include <QtMath>

#include "../../core/Settings.h"
#include "../../acquisition/QtNetworkLayer.h"
#include "../../layout/RelayoutScheduler.h"
#include "../../widgets/ThumbnailCard.h"

GridViewOptions GridViewOptions::fromSettings()
{
    GridViewOptions o;
    o.layout = LayoutOptions::fromSettings();
    o.window = WindowOptions::fromSettings();
    o.acquisition = AcquisitionConfig::fromSettings();
    o.relayoutCoalesceMs = Settings::instance()->relayoutCoalesceMs();
    o.visibilityMarginPx = Settings::instance()->visibilityMarginPx();
    o.maxPoolSize = Settings::instance()->cardPoolSize();
    return o;
}

// ═══════════════════════════════════════════════════════════════════
//  Constructor
// ═══════════════════════════════════════════════════════════════════
MasonryGridView::MasonryGridView(QWidget* parent)
    : MasonryGridView(GridViewOptions::fromSettings(), nullptr, nullptr, parent)
{
}

MasonryGridView::MasonryGridView(const GridViewOptions& options, INetworkLayer* network,
                                 CancellationRegistry* registry, QWidget* parent)
    : QWidget(parent)
    , m_options(options)
{
    if (!registry) {
        m_ownedRegistry = std::make_unique<CancellationRegistry>();
        registry = m_ownedRegistry.get();
    }
    m_registry = registry;

    if (!network)
        network = new QtNetworkLayer(this);
    m_network = network;

    m_engine = new PackingLayoutEngine(m_options.layout, this);
    m_window = new VirtualWindow(this, m_engine, m_options.window, this);
    m_pipeline = new AcquisitionPipeline(m_network, m_registry, m_options.acquisition, this);
    m_relayout = new RelayoutScheduler(m_options.relayoutCoalesceMs, this);

    m_resizeDebounceTimer = new QTimer(this);
    m_resizeDebounceTimer->setSingleShot(true);
    m_resizeDebounceTimer->setInterval(m_options.resizeDebounceMs);

    setupUI();
    connectSignals();
}

MasonryGridView::~MasonryGridView()
{
    // Cards go down with the canvas; in-flight requests must not outlive us
    m_pipeline->clear();
}

// ═══════════════════════════════════════════════════════════════════
//  UI
// ═══════════════════════════════════════════════════════════════════
void MasonryGridView::setupUI()
{
    setObjectName(QStringLiteral("MasonryGridView"));

    m_scrollArea = new QScrollArea(this);
    m_scrollArea->setFrameShape(QFrame::NoFrame);
    m_scrollArea->setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    // Keeps the viewport width stable when the content height changes
    m_scrollArea->setVerticalScrollBarPolicy(Qt::ScrollBarAlwaysOn);
    m_scrollArea->setWidgetResizable(false);

    m_canvas = new QWidget();
    m_canvas->setObjectName(QStringLiteral("MasonryCanvas"));
    m_scrollArea->setWidget(m_canvas);

    // Off-surface parent for measurement cards: never shown
    m_measureHost = new QWidget(this);
    m_measureHost->hide();
    m_measureHost->setAttribute(Qt::WA_TransparentForMouseEvents);

    m_scrollArea->setGeometry(rect());
}

void MasonryGridView::connectSignals()
{
    connect(m_resizeDebounceTimer, &QTimer::timeout, this, &MasonryGridView::onViewportResized);
    connect(m_relayout, &RelayoutScheduler::relayoutDue, this, &MasonryGridView::onRelayoutDue);
    connect(m_engine, &PackingLayoutEngine::relayoutRequested,
            m_relayout, &RelayoutScheduler::request);

    connect(m_engine, &PackingLayoutEngine::containerHeightChanged, this, [this](double h) {
        if (!m_virtualized) setContentHeight(h);
    });
    connect(m_window, &VirtualWindow::rangeChanged, this, [this](int, int) {
        checkVisibility();
    });
    connect(m_window, &VirtualWindow::measurementCommitted, this, [this](int) {
        checkVisibility();
    });

    connect(m_scrollArea->verticalScrollBar(), &QScrollBar::valueChanged,
            this, &MasonryGridView::onScrolled);

    m_pipeline->setAttachmentCheck([this](NodeRef node) { return isAttached(node); });

    connect(m_pipeline, &AcquisitionPipeline::thumbnailReady,
            this, [this](NodeRef node, const QImage& image) {
        ThumbnailCard* card = m_cards.value(node);
        if (!card) return;
        const bool aspectKnown = card->item().hasDimensions();
        card->setThumbnail(image);
        // Without declared dimensions the card only now knows its height
        if (!aspectKnown)
            m_relayout->request();
    });
    connect(m_pipeline, &AcquisitionPipeline::thumbnailProcessing,
            this, [this](NodeRef node, const QImage& placeholder) {
        if (ThumbnailCard* card = m_cards.value(node))
            card->setProcessing(placeholder);
    });
    // A cancelled fetch for a card that is still on screen (group abort)
    // gets another chance the next time visibility is checked
    connect(m_pipeline, &AcquisitionPipeline::taskStateChanged,
            this, [this](NodeRef node, AcquisitionPipeline::TaskState state) {
        if (state != AcquisitionPipeline::TaskState::Cancelled) return;
        ThumbnailCard* card = m_cards.value(node);
        if (card && !card->hasThumbnail())
            observe(node);
    });
    connect(m_pipeline, &AcquisitionPipeline::thumbnailFailed,
            this, [this](NodeRef node, AcquisitionPipeline::FailureKind, const QString&) {
        if (ThumbnailCard* card = m_cards.value(node))
            card->setFailed();
    });
}

// ═══════════════════════════════════════════════════════════════════
//  Items
// ═══════════════════════════════════════════════════════════════════
void MasonryGridView::setItems(const MediaItemList& items)
{
    clearItems();
    m_items = items;

    if (VirtualWindow::shouldActivate(items.size(), m_options.window.threshold))
        enterVirtualMode(items);
    else
        enterDirectMode(items);
}

void MasonryGridView::appendItems(const MediaItemList& items)
{
    if (items.isEmpty()) return;

    if (m_virtualized
        || VirtualWindow::shouldActivate(m_items.size() + items.size(),
                                         m_options.window.threshold)) {
        setItems(m_items + items);
        return;
    }

    const int laidOut = m_engine->items().size();
    QVector<NodeRef> added;
    for (const MediaItem& item : items) {
        NodeRef node = 0;
        ThumbnailCard* card = createCard(item, m_canvas, node);
        card->show();
        m_directOrder.append(node);
        added.append(node);
    }
    m_items += items;

    if (laidOut != m_directOrder.size() - added.size()) {
        relayoutDirect();
        return;
    }
    if (m_engine->relayoutIncremental(surfaceWidth(), layoutItemsFor(added)))
        applyGeometry(m_engine->items());
    checkVisibility();
}

void MasonryGridView::clearItems()
{
    m_relayout->cancel();

    if (m_virtualized) {
        m_window->destroy();
        m_virtualized = false;
    }

    const QList<NodeRef> nodes = m_cards.keys();
    for (NodeRef node : nodes)
        removeCard(node);

    m_directOrder.clear();
    m_observed.clear();
    m_items.clear();
    m_engine->clear();
    setContentHeight(0.0);
}

void MasonryGridView::enterDirectMode(const MediaItemList& items)
{
    qDebug() << "[Grid] Direct packing:" << items.size() << "items";
    m_virtualized = false;
    m_engine->setViewportWidth(m_scrollArea->viewport()->width());

    for (const MediaItem& item : items) {
        NodeRef node = 0;
        ThumbnailCard* card = createCard(item, m_canvas, node);
        card->show();
        m_directOrder.append(node);
    }
    relayoutDirect();
}

void MasonryGridView::enterVirtualMode(const MediaItemList& items)
{
    qDebug() << "[Grid] Virtual window:" << items.size() << "items";
    m_virtualized = true;

    QWidget* viewport = m_scrollArea->viewport();
    m_window->setViewport(viewport->width(), viewport->height());
    m_window->setItems(items);
}

void MasonryGridView::abortThumbnails()
{
    m_registry->abort(m_options.acquisition.group);
}

void MasonryGridView::requestRelayout()
{
    m_relayout->request();
}

ThumbnailCard* MasonryGridView::cardAt(int index) const
{
    if (m_virtualized)
        return m_cards.value(m_window->nodeAt(index));
    if (index < 0 || index >= m_directOrder.size()) return nullptr;
    return m_cards.value(m_directOrder.at(index));
}

// ═══════════════════════════════════════════════════════════════════
//  Cards
// ═══════════════════════════════════════════════════════════════════
ThumbnailCard* MasonryGridView::createCard(const MediaItem& item, QWidget* parent, NodeRef& node)
{
    node = m_nextNode++;

    if (parent != m_canvas) {
        auto* card = new ThumbnailCard(item, parent);
        m_measureCards.insert(node, card);
        return card;
    }

    ThumbnailCard* card = nullptr;
    if (!m_cardPool.isEmpty()) {
        card = m_cardPool.takeLast();
        card->reset(item);
        ++m_reusedCards;
    } else {
        card = new ThumbnailCard(item, parent);
        ++m_createdCards;
    }
    m_cards.insert(node, card);
    observe(node);
    return card;
}

void MasonryGridView::removeCard(NodeRef node)
{
    ThumbnailCard* card = m_cards.take(node);
    m_observed.remove(node);

    // Stops a pending or in-flight fetch aimed at this card
    m_pipeline->cancelNode(node);

    if (!card) return;
    card->hide();
    if (m_cardPool.size() < m_options.maxPoolSize) {
        card->reset(MediaItem());
        m_cardPool.append(card);
    } else {
        card->deleteLater();
    }
}

QVector<LayoutItem> MasonryGridView::layoutItemsFor(const QVector<NodeRef>& nodes) const
{
    const int width = qFloor(m_engine->itemWidth(surfaceWidth()));

    QVector<LayoutItem> out;
    out.reserve(nodes.size());
    for (NodeRef node : nodes) {
        ThumbnailCard* card = m_cards.value(node);
        if (!card) continue;

        LayoutItem li;
        li.node = node;
        if (card->item().hasDimensions())
            li.declaredAspect = QSizeF(card->item().dimensions);
        li.measuredHeight = card->heightForWidth(width);
        out.append(li);
    }
    return out;
}

void MasonryGridView::applyGeometry(const QVector<LayoutItem>& laidOut)
{
    for (const LayoutItem& li : laidOut)
        placeNode(li.node, li.geometry);
}

// ═══════════════════════════════════════════════════════════════════
//  Relayout
// ═══════════════════════════════════════════════════════════════════
void MasonryGridView::relayoutDirect()
{
    if (m_directOrder.isEmpty()) return;
    if (m_engine->relayoutAll(surfaceWidth(), layoutItemsFor(m_directOrder)))
        applyGeometry(m_engine->items());
    checkVisibility();
}

void MasonryGridView::onRelayoutDue()
{
    if (m_virtualized)
        m_window->render();
    else
        relayoutDirect();
}

void MasonryGridView::onViewportResized()
{
    QWidget* viewport = m_scrollArea->viewport();
    const int width = viewport->width();
    m_canvas->resize(width, m_canvas->height());

    if (m_virtualized) {
        // Invalidates measurements itself when the width changed
        m_window->setViewport(width, viewport->height());
    } else if (width != m_lastViewportWidth) {
        m_engine->setViewportWidth(width);
        relayoutDirect();
    } else {
        checkVisibility();
    }
    m_lastViewportWidth = width;
}

void MasonryGridView::onScrolled(int value)
{
    if (m_virtualized)
        m_window->setScrollTop(value);
    checkVisibility();
}

// ═══════════════════════════════════════════════════════════════════
//  Events
// ═══════════════════════════════════════════════════════════════════
void MasonryGridView::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    m_scrollArea->setGeometry(rect());
    m_resizeDebounceTimer->start();
}

void MasonryGridView::showEvent(QShowEvent* event)
{
    QWidget::showEvent(event);
    // First show: lay out once the scroll area has its geometry,
    // without waiting for the resize debounce
    if (m_lastViewportWidth < 0)
        QTimer::singleShot(0, this, &MasonryGridView::onViewportResized);
}

// ═══════════════════════════════════════════════════════════════════
//  Visibility
// ═══════════════════════════════════════════════════════════════════
void MasonryGridView::observe(NodeRef node)
{
    m_observed.insert(node);
}

void MasonryGridView::checkVisibility()
{
    if (m_observed.isEmpty()) return;

    QWidget* viewport = m_scrollArea->viewport();
    const int margin = m_options.visibilityMarginPx;
    const int top = m_scrollArea->verticalScrollBar()->value();
    const QRect area(0, top - margin, qMax(1, viewport->width()),
                     viewport->height() + 2 * margin);

    QVector<NodeRef> entered;
    for (NodeRef node : std::as_const(m_observed)) {
        ThumbnailCard* card = m_cards.value(node);
        if (card && !card->geometry().isEmpty() && card->geometry().intersects(area))
            entered.append(node);
    }

    // Reported once per node: observation ends on first entry
    for (NodeRef node : std::as_const(entered)) {
        m_observed.remove(node);
        onVisible(node);
    }
}

void MasonryGridView::onVisible(NodeRef node)
{
    ThumbnailCard* card = m_cards.value(node);
    if (!card || card->hasThumbnail()) return;

    m_pipeline->enqueueVisible(node, card->item().thumbnailUrl);
}

// ═══════════════════════════════════════════════════════════════════
//  IRenderSurface
// ═══════════════════════════════════════════════════════════════════
double MasonryGridView::surfaceWidth() const
{
    return m_scrollArea->viewport()->width();
}

NodeRef MasonryGridView::createMeasurementNode(int index, const MediaItem& item, double width)
{
    Q_UNUSED(index);
    NodeRef node = 0;
    ThumbnailCard* card = createCard(item, m_measureHost, node);
    const int w = qFloor(width);
    card->resize(w, card->heightForWidth(w));
    return node;
}

QSizeF MasonryGridView::measuredSize(NodeRef node) const
{
    ThumbnailCard* card = m_measureCards.value(node);
    if (!card) return QSizeF();
    // Zero height = unknown aspect; the layout falls back
    return QSizeF(card->width(), card->heightForWidth(card->width()));
}

void MasonryGridView::releaseMeasurementNodes()
{
    for (ThumbnailCard* card : std::as_const(m_measureCards))
        card->deleteLater();
    m_measureCards.clear();
}

NodeRef MasonryGridView::materialize(int index, const MediaItem& item, const QRectF& geometry)
{
    Q_UNUSED(index);
    NodeRef node = 0;
    ThumbnailCard* card = createCard(item, m_canvas, node);
    card->setGeometry(geometry.toRect());
    card->show();
    return node;
}

void MasonryGridView::placeNode(NodeRef node, const QRectF& geometry)
{
    if (ThumbnailCard* card = m_cards.value(node))
        card->setGeometry(geometry.toRect());
}

void MasonryGridView::dematerialize(int index, NodeRef node)
{
    Q_UNUSED(index);
    removeCard(node);
}

void MasonryGridView::setContentHeight(double height)
{
    m_canvas->resize(m_scrollArea->viewport()->width(), qCeil(height));
}

bool MasonryGridView::isAttached(NodeRef node) const
{
    return m_cards.contains(node);
}
