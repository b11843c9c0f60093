/*
 * pagemetrics.cpp — Page geometry for document and device modes
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pagemetrics.h"

#include <QtGlobal>

namespace Layout {

PageMetrics PageMetrics::document(qreal width, qreal height)
{
    PageMetrics m;
    m.mode = Document;
    m.pageWidth = width;
    m.pageHeight = height;
    return m;
}

PageMetrics PageMetrics::device(const QSizeF &viewport)
{
    PageMetrics m;
    m.mode = Device;
    m.viewportWidth = viewport.width();
    // Sheet width: min(680px, 96vw)
    m.pageWidth = qMin<qreal>(680.0, viewport.width() * 0.96);
    m.pageHeight = viewport.height();
    return m;
}

qreal PageMetrics::contentWidth() const
{
    if (mode == Document)
        return pageWidth - 2 * paddingSide;
    // The sheet is centred in a container padded on both sides
    return qMax<qreal>(0, qMin(pageWidth, viewportWidth - 2 * paddingSide));
}

} // namespace Layout
