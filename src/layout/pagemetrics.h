/*
 * pagemetrics.h — Page geometry for document and device modes
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_PAGEMETRICS_H
#define PAGEWRIGHT_PAGEMETRICS_H

#include <QSizeF>

namespace Layout {

struct PageMetrics {
    enum Mode { Document, Device };

    Mode mode = Document;
    qreal pageWidth = 800;
    qreal pageHeight = 1000;

    // Page container padding (2rem 1.5rem 0.5rem)
    qreal paddingTop = 32;
    qreal paddingBottom = 8;
    qreal paddingSide = 24;

    // Extra top space a page with a subchapter heading gets on devices
    qreal headingPaddingDevice = 16;

    static PageMetrics document(qreal width = 800, qreal height = 1000);
    static PageMetrics device(const QSizeF &viewport);

    qreal bodyHeight() const { return pageHeight - paddingTop - paddingBottom; }
    qreal contentWidth() const;
    qreal footnoteWidth() const { return pageWidth - 60; }
    qreal headingPadding(bool hasHeading) const
    {
        return (mode == Device && hasHeading) ? headingPaddingDevice : 0;
    }

    qreal viewportWidth = 0; // device mode only
};

} // namespace Layout

#endif // PAGEWRIGHT_PAGEMETRICS_H
