/*
 * fixedtextmetrics.h — Fixed-advance text metrics
 *
 * Every character advances by a fixed fraction of its font size, and
 * lines break after whitespace. Used for headless runs without fonts
 * and for reproducible tests.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_FIXEDTEXTMETRICS_H
#define PAGEWRIGHT_FIXEDTEXTMETRICS_H

#include "textmetrics.h"

namespace Layout {

class FixedTextMetrics : public TextMetrics
{
public:
    explicit FixedTextMetrics(qreal advanceEm = 0.5);

    QList<LineMetrics> breakIntoLines(const QString &text,
                                      const QList<TextRunStyle> &styles,
                                      qreal width) override;

    qreal advanceEm() const { return m_advanceEm; }

private:
    qreal m_advanceEm;
};

} // namespace Layout

#endif // PAGEWRIGHT_FIXEDTEXTMETRICS_H
