/*
 * footnotetracker.h — Book-wide footnote numbering and page sections
 *
 * Footnotes are written inline, either as ^[content] markers or as
 * <sup class="footnote-ref" data-content="..."> / <footnote-ref> nodes.
 * The tracker numbers them once over the whole book, in document order,
 * so the same content keeps its number wherever it appears. Pages then
 * ask it which footnotes an element references, how tall their section
 * would be, and for the rendered section itself.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_FOOTNOTETRACKER_H
#define PAGEWRIGHT_FOOTNOTETRACKER_H

#include <QHash>
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

class FootnoteTracker
{
public:
    FootnoteTracker(Layout::MeasurementOracle *oracle, const Layout::PageMetrics &metrics,
                    const PaginationSettings &settings);

    // Numbers every footnote of the (sorted) chapters, first-seen wins:
    // each chapter's own content, then its children in order.
    void build(const QList<Content::ChapterRecord> &sortedChapters);

    const QList<Content::Footnote> &footnotes() const { return m_footnotes; }
    std::optional<int> numberFor(const QString &content) const;
    std::optional<Content::Footnote> footnote(int number) const;

    // Global numbers referenced by the fragment; unknown contents are ignored
    QSet<int> extractFootnoteRefs(const QString &html) const;

    // Height of the section for these numbers, less the extra bottom
    // padding of the measured section. 0 for an empty set.
    qreal measureSectionHeight(const QSet<int> &numbers);

    QString renderSection(const QList<Content::Footnote> &footnotes) const;

    struct MarkedContent {
        QString html;
        QList<Content::Footnote> footnotes; // sorted by number
    };
    // Turns every marker into a numbered superscript
    MarkedContent replaceMarkers(const QString &html) const;

    // Marker contents of the fragment in document order (trimmed)
    static QStringList scanMarkers(const QString &html);

private:
    struct Marker {
        int start = 0;
        int length = 0;
        QString content;
    };
    static QList<Marker> findMarkers(const QString &html);

    Layout::MeasurementOracle *m_oracle;
    Layout::PageMetrics m_metrics;
    PaginationSettings m_settings;

    QList<Content::Footnote> m_footnotes;
    QHash<QString, int> m_numbers;
    QHash<QString, qreal> m_heightCache;
};

} // namespace Pagination

#endif // PAGEWRIGHT_FOOTNOTETRACKER_H
