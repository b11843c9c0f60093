/*
 * karaokeslicer.h — Spread a karaoke block over as many pages as it needs
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_KARAOKESLICER_H
#define PAGEWRIGHT_KARAOKESLICER_H

#include <QMap>
#include <QString>

#include "contentmodel.h"
#include "karaokesource.h"
#include "pagemetrics.h"
#include "paginationsettings.h"

namespace Layout {
class MeasurementOracle;
}

namespace Pagination {

class FootnoteTracker;
class PageAssembler;

class KaraokeSlicer
{
public:
    KaraokeSlicer(Layout::MeasurementOracle *oracle, FootnoteTracker *footnotes,
                  PageAssembler *assembler, const Layout::PageMetrics &metrics,
                  const PaginationSettings &settings);

    // Forgets the sources of a previous run
    void reset();

    // Slices the block's text onto the pending page and the pages after
    // it. Returns false when the payload is unusable or its text is empty;
    // the caller then places the element whole.
    bool paginate(const Content::HtmlNode &node, const Content::ContentBlock &block,
                  int chapterIndex);

    const QMap<QString, Karaoke::KaraokeSource> &sources() const { return m_sources; }

    static QString sliceHtml(const Karaoke::KaraokeSlice &slice, const QString &text);

private:
    QString karaokeId(const Content::HtmlNode &node, const Content::ContentBlock &block,
                      int chapterIndex);

    Layout::MeasurementOracle *m_oracle;
    FootnoteTracker *m_footnotes;
    PageAssembler *m_assembler;
    Layout::PageMetrics m_metrics;
    PaginationSettings m_settings;

    QMap<QString, Karaoke::KaraokeSource> m_sources;
    int m_sequence = 0;
};

} // namespace Pagination

#endif // PAGEWRIGHT_KARAOKESLICER_H
