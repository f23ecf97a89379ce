#pragma once

#include <QString>
#include <QSize>
#include <QVector>
#include <QtGlobal>

// Opaque handle to a node on the rendering surface. 0 is "no node".
using NodeRef = quint64;

// ── Data Structs ────────────────────────────────────────────────────
struct MediaItem {
    QString path;           // relative path inside the library
    QString name;
    QString thumbnailUrl;   // absolute URL of the preview resource
    QSize   dimensions;     // original pixel size, invalid if unknown
    bool    isVideo = false;

    bool hasDimensions() const
    {
        return dimensions.width() > 0 && dimensions.height() > 0;
    }
};

using MediaItemList = QVector<MediaItem>;
