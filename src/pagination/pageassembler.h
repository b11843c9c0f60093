/*
 * pageassembler.h — Accumulates page content and emits finished pages
 *
 * The paginator and the karaoke slicer append element markup to the
 * pending page; pushPage() turns it into a Page: footnote markers are
 * numbered, the footnote section is rendered, and the content is wrapped
 * with the bottom padding the page needs.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_PAGEASSEMBLER_H
#define PAGEWRIGHT_PAGEASSEMBLER_H

#include <QList>
#include <QMap>
#include <QSet>
#include <QString>
#include <QStringList>

#include "contentmodel.h"
#include "page.h"
#include "pagemetrics.h"
#include "paginationsettings.h"

namespace Pagination {

class FootnoteTracker;

struct PendingPage {
    QStringList elements;       // outer HTML, in order
    QSet<int> footnotes;
    bool hasHeading = false;
    bool acceptedOverflow = false;
    QList<Karaoke::KaraokeSlice> karaokeSlices;

    bool isEmpty() const { return elements.isEmpty(); }
    QString html() const { return elements.join(QString()); }
};

class PageAssembler
{
public:
    PageAssembler(FootnoteTracker *footnotes, const Layout::PageMetrics &metrics,
                  const PaginationSettings &settings);

    void beginChapter(const Content::ChapterRecord &chapter, int chapterIndex,
                      const QMap<int, QString> &backgroundVideos);

    PendingPage &pending() { return m_pending; }
    const PendingPage &pending() const { return m_pending; }

    // Emits the pending page when it has content. Returns whether a page
    // was emitted; the pending page is reset either way.
    bool pushPage(const Content::ContentBlock &block);
    void startNewPage(bool hasHeading);

    void emitEmptyPage();
    bool emitEpigraphPage(const Content::ContentBlock &block);
    void emitVideoPage(const QString &src, const Content::ContentBlock &block);

    int chapterPageIndex() const { return m_pageIndex; }
    bool isStandaloneFirstPage() const;

    // Bottom space reserved while fitting a page with these footnotes
    qreal fittingReserve(const QSet<int> &footnotes);

    QList<Page> takePages();
    const QList<Page> &pages() const { return m_pages; }

    // Drops up to maxRemovals leading empty paragraphs
    static int removeLeadingEmptyParagraphs(QStringList &elements, int maxRemovals);

private:
    Page basePage(const Content::ContentBlock *block) const;
    void emitPage(Page page);

    FootnoteTracker *m_footnotes;
    Layout::PageMetrics m_metrics;
    PaginationSettings m_settings;

    Content::ChapterRecord m_chapter;
    int m_chapterIndex = 0;
    QMap<int, QString> m_backgroundVideos;
    int m_pageIndex = 0;

    PendingPage m_pending;
    QList<Page> m_pages;
};

} // namespace Pagination

#endif // PAGEWRIGHT_PAGEASSEMBLER_H
