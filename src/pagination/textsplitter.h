/*
 * textsplitter.h — Cut a text element at a sentence or word boundary
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_TEXTSPLITTER_H
#define PAGEWRIGHT_TEXTSPLITTER_H

#include <QList>
#include <QPair>
#include <QString>

#include <optional>

#include "htmlfragment.h"
#include "paginationsettings.h"

namespace Layout {
class MeasurementOracle;
}

namespace Pagination {

struct SplitResult {
    std::optional<Content::HtmlNode> first;
    std::optional<Content::HtmlNode> second;
    int firstCharCount = 0;     // cut offset in text-content coordinates

    bool isWhole() const { return first && !second; }
};

class TextSplitter
{
public:
    TextSplitter(Layout::MeasurementOracle *oracle, qreal width,
                 const PaginationSettings &settings = {});

    // The prefix fits when measure(precedingHtml + prefix) <= maxHeight
    // plus the fit tolerance. Without precedingHtml maxHeight is the
    // space left for the element alone.
    SplitResult splitAtWordBoundary(const Content::HtmlNode &element, qreal maxHeight,
                                    const QString &precedingHtml = {});
    SplitResult splitAtSentenceBoundary(const Content::HtmlNode &element, qreal maxHeight,
                                        const QString &precedingHtml = {});

    // Sentence boundaries first, then word boundaries
    SplitResult split(const Content::HtmlNode &element, qreal maxHeight,
                      const QString &precedingHtml = {});

    // Offsets where a whitespace run starts after a non-space character,
    // excluding offsets inside the given ranges
    static QList<int> wordCutCandidates(const QString &text,
                                        const QList<QPair<int, int>> &protectedRanges = {});

    // Text-content ranges [start, end) of the footnote markers in element
    static QList<QPair<int, int>> footnoteMarkerRanges(const Content::HtmlNode &element);

    // Offsets just past a sentence-ending punctuation mark that is
    // followed by whitespace and a capital letter
    static QList<int> sentenceCuts(const QString &text);

private:
    bool prefixFits(const Content::HtmlNode &element, int cut, qreal maxHeight,
                    const QString &precedingHtml);
    bool fits(const QString &html, qreal maxHeight, const QString &precedingHtml);
    SplitResult cutAt(const Content::HtmlNode &element, int cut, int textLength) const;

    Layout::MeasurementOracle *m_oracle;
    qreal m_width;
    PaginationSettings m_settings;
};

} // namespace Pagination

#endif // PAGEWRIGHT_TEXTSPLITTER_H
