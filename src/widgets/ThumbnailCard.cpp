#include "ThumbnailCard.h"

#include <QPainter>
#include <QPainterPath>
#include <QtMath>

ThumbnailCard::ThumbnailCard(const MediaItem& item, QWidget* parent)
    : QWidget(parent)
    , m_item(item)
{
    setObjectName(QStringLiteral("ThumbnailCard"));
    setAttribute(Qt::WA_OpaquePaintEvent, false);
    setFocusPolicy(Qt::NoFocus);
    setToolTip(item.name);
}

void ThumbnailCard::reset(const MediaItem& item)
{
    m_item = item;
    m_state = State::Placeholder;
    m_pixmap = QPixmap();
    setToolTip(item.name);
    update();
}

void ThumbnailCard::setThumbnail(const QImage& image)
{
    m_pixmap = QPixmap::fromImage(image);
    m_state = State::Loaded;
    update();
}

void ThumbnailCard::setProcessing(const QImage& placeholder)
{
    if (m_state == State::Loaded) return;
    m_pixmap = QPixmap::fromImage(placeholder);
    m_state = State::Processing;
    update();
}

void ThumbnailCard::setFailed()
{
    if (m_state == State::Loaded) return;
    m_pixmap = QPixmap();
    m_state = State::Failed;
    update();
}

int ThumbnailCard::heightForWidth(int width) const
{
    if (width <= 0) return 0;
    if (m_item.hasDimensions())
        return qCeil(width * double(m_item.dimensions.height()) / m_item.dimensions.width());
    if (m_state == State::Loaded && !m_pixmap.isNull() && m_pixmap.width() > 0)
        return qCeil(width * double(m_pixmap.height()) / m_pixmap.width());
    return 0;
}

// ── paintEvent ──────────────────────────────────────────────────────
void ThumbnailCard::paintEvent(QPaintEvent*)
{
    QPainter p(this);
    p.setRenderHint(QPainter::Antialiasing);
    p.setRenderHint(QPainter::SmoothPixmapTransform);

    const QRectF r = rect();
    QPainterPath clip;
    clip.addRoundedRect(r, 6, 6);
    p.setClipPath(clip);
    p.fillRect(r, QColor(0x37, 0x41, 0x51));

    if (!m_pixmap.isNull()) {
        QPixmap scaled = m_pixmap.scaled(size(), Qt::KeepAspectRatioByExpanding,
                                         Qt::SmoothTransformation);
        const QPoint offset((width() - scaled.width()) / 2, (height() - scaled.height()) / 2);
        p.drawPixmap(offset, scaled);
    }

    if (m_state == State::Processing) {
        p.fillRect(r, QColor(0, 0, 0, 80));
    } else if (m_state == State::Failed) {
        // Fallback state: the thumbnail will not arrive
        p.setPen(QColor(0xC0, 0x84, 0xFC));
        QFont f = font();
        f.setPointSizeF(9);
        f.setBold(true);
        p.setFont(f);
        p.drawText(r, Qt::AlignCenter, QStringLiteral("BROKEN"));
    }

    if (m_item.isVideo) {
        // Play badge, bottom-left
        const QRectF badge(8, height() - 28, 20, 20);
        p.setPen(Qt::NoPen);
        p.setBrush(QColor(0, 0, 0, 140));
        p.drawEllipse(badge);
        QPainterPath tri;
        tri.moveTo(badge.left() + 8, badge.top() + 5);
        tri.lineTo(badge.left() + 8, badge.bottom() - 5);
        tri.lineTo(badge.right() - 5, badge.center().y());
        tri.closeSubpath();
        p.setBrush(Qt::white);
        p.drawPath(tri);
    }
}
