/*
 * elementpaginator.h — Fit a block's elements onto pages
 *
 * Walks the elements of one content block in order and decides, for
 * each, whether it joins the pending page, starts a new page, or is
 * split with the tail re-queued for the next page. Karaoke blocks are
 * handed to the slicer.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_ELEMENTPAGINATOR_H
#define PAGEWRIGHT_ELEMENTPAGINATOR_H

#include <QList>
#include <QSet>
#include <QString>

#include <optional>

#include "contentmodel.h"
#include "pagemetrics.h"
#include "paginationsettings.h"

namespace Layout {
class MeasurementOracle;
}

namespace Pagination {

class FootnoteTracker;
class KaraokeSlicer;
class PageAssembler;

class ElementPaginator
{
public:
    ElementPaginator(Layout::MeasurementOracle *oracle, FootnoteTracker *footnotes,
                     PageAssembler *assembler, KaraokeSlicer *karaoke,
                     const Layout::PageMetrics &metrics, const PaginationSettings &settings);

    // Paginates the elements and finalises the block's last page
    void paginateBlock(const Content::ContentBlock &block,
                       const QList<Content::Element> &elements, int chapterIndex);

private:
    struct Fit {
        QSet<int> elementFootnotes;
        QSet<int> pageFootnotes;    // pending footnotes plus the element's
        qreal reserved = 0;
        qreal available = 0;
        qreal total = 0;            // pending page plus element
        qreal remaining = 0;
        bool fits = false;
    };

    // Returns an element to process next: the tail of a split, or the
    // element itself when it was pushed to a fresh page for another try.
    std::optional<Content::Element> process(const Content::Element &element, bool isLast,
                                            const Content::ContentBlock &block,
                                            int chapterIndex);

    Fit evaluate(const QString &html);
    qreal availableHeight(qreal reserved, bool hasHeading) const;
    qreal measure(const QString &html);
    qreal measureWrapped(const QString &html, qreal reserved);

    std::optional<Content::Element> processSplittable(const Content::Element &element,
                                                      const QString &html, const Fit &fit,
                                                      bool isLast,
                                                      const Content::ContentBlock &block);

    void place(const QString &html, const QSet<int> &footnotes);
    std::optional<Content::Element> pushWhole(const Content::Element &element,
                                              const QString &html,
                                              const QSet<int> &footnotes,
                                              const Content::ContentBlock &block);
    std::optional<Content::Element> placeSplit(const Content::HtmlNode &first,
                                               const std::optional<Content::HtmlNode> &second,
                                               const Content::ContentBlock &block);
    void updateOverflow();

    static int wordCount(const QString &text);

    Layout::MeasurementOracle *m_oracle;
    FootnoteTracker *m_footnotes;
    PageAssembler *m_assembler;
    KaraokeSlicer *m_karaoke;
    Layout::PageMetrics m_metrics;
    PaginationSettings m_settings;
};

} // namespace Pagination

#endif // PAGEWRIGHT_ELEMENTPAGINATOR_H
