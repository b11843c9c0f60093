/*
 * measurementoracle.h — Rendered-height measurement interface
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_MEASUREMENTORACLE_H
#define PAGEWRIGHT_MEASUREMENTORACLE_H

#include <QString>

namespace Layout {

// Inherited style and padding of the container a fragment is measured in.
// A container with bottom padding keeps its last child's bottom margin.
struct StyleContext {
    QString fontFamily = QStringLiteral(
        "\"Times New Roman\", Times, Garamond, Baskerville, Caslon, "
        "\"Hoefler Text\", \"Minion Pro\", Palatino, Georgia, serif");
    qreal rootFontSize = 16;
    qreal fontSize = 16;
    qreal lineHeight = 1.2;
    qreal paddingTop = 0;
    qreal paddingBottom = 0;
    qreal paddingLeft = 0;
    qreal paddingRight = 0;

    bool operator==(const StyleContext &o) const
    {
        return fontFamily == o.fontFamily && rootFontSize == o.rootFontSize
            && fontSize == o.fontSize && lineHeight == o.lineHeight
            && paddingTop == o.paddingTop && paddingBottom == o.paddingBottom
            && paddingLeft == o.paddingLeft && paddingRight == o.paddingRight;
    }
};

class MeasurementOracle
{
public:
    virtual ~MeasurementOracle() = default;

    // Height in px of the fragment laid out at widthPx inside a container
    // described by ctx. Margins escaping an unpadded container are excluded.
    virtual qreal measureHeight(const QString &html, qreal widthPx,
                                const StyleContext &ctx = {}) = 0;
};

} // namespace Layout

#endif // PAGEWRIGHT_MEASUREMENTORACLE_H
