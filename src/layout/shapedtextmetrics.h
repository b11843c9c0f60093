/*
 * shapedtextmetrics.h — Font-backed text metrics
 *
 * Shapes text with HarfBuzz through TextShaper and breaks lines at ICU
 * line-break opportunities.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_SHAPEDTEXTMETRICS_H
#define PAGEWRIGHT_SHAPEDTEXTMETRICS_H

#include "textmetrics.h"

#include <memory>

class FontManager;
class TextShaper;

namespace icu {
class BreakIterator;
}

namespace Layout {

class ShapedTextMetrics : public TextMetrics
{
public:
    explicit ShapedTextMetrics(FontManager *fontManager);
    ~ShapedTextMetrics() override;

    QList<LineMetrics> breakIntoLines(const QString &text,
                                      const QList<TextRunStyle> &styles,
                                      qreal width) override;

private:
    QList<int> breakOpportunities(const QString &text);

    FontManager *m_fontManager;
    std::unique_ptr<TextShaper> m_shaper;
    std::unique_ptr<icu::BreakIterator> m_lineBreaker;
};

} // namespace Layout

#endif // PAGEWRIGHT_SHAPEDTEXTMETRICS_H
