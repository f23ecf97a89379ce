#pragma once

#include <QWidget>
#include <QImage>
#include <QPixmap>
#include "../core/MediaItem.h"

class ThumbnailCard : public QWidget
{
    Q_OBJECT

public:
    enum class State { Placeholder, Processing, Loaded, Failed };
    Q_ENUM(State)

    explicit ThumbnailCard(const MediaItem& item, QWidget* parent = nullptr);

    const MediaItem& item() const { return m_item; }
    State state() const { return m_state; }
    bool hasThumbnail() const { return m_state == State::Loaded; }

    // Back to a placeholder for another item (card reuse)
    void reset(const MediaItem& item);

    void setThumbnail(const QImage& image);
    void setProcessing(const QImage& placeholder);
    void setFailed();

    // 0 while the aspect is unknown (no declared size, nothing loaded)
    bool hasHeightForWidth() const override { return true; }
    int heightForWidth(int width) const override;

protected:
    void paintEvent(QPaintEvent* event) override;

private:
    MediaItem m_item;
    State m_state = State::Placeholder;
    QPixmap m_pixmap;
};
