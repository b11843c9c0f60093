/*
 * page.h — Finished book pages and reading positions
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_PAGE_H
#define PAGEWRIGHT_PAGE_H

#include <QList>
#include <QMap>
#include <QString>

#include <optional>

#include "contentmodel.h"
#include "karaokesource.h"

namespace Pagination {

struct Page {
    int chapterIndex = 0;       // order, -2 first page, -1 cover
    QString chapterId;
    QString chapterTitle;
    QString subchapterId;       // empty outside subchapters
    QString subchapterTitle;
    int pageIndex = 0;          // within the chapter

    QString content;            // wrapped markup with footnote section
    QList<Content::Footnote> footnotes;
    bool hasHeading = false;

    QString backgroundVideoSrc;
    QString backgroundImageUrl;

    bool isEpigraph = false;
    bool isVideo = false;
    bool isCover = false;
    bool isFirstPage = false;
    std::optional<int> totalPages;

    std::optional<Content::Epigraph> epigraph;
    QString videoSrc;
    QList<Karaoke::KaraokeSlice> karaokeSlices;

    // Set when an element was placed although the page then exceeds the
    // fit bound (oversized atomic element, tolerated overflow).
    bool acceptedOverflow = false;

    // Bottom space the page was fitted against: the footnote section
    // height, or the default bottom margin.
    qreal reservedBottom = 0;
    // padding-bottom written on the content wrapper
    qreal bottomPadding = 0;
    // Page body as measured while fitting, before footnote markers are
    // replaced and the wrapper is added
    QString bodyHtml;

    bool isSpecial() const { return isCover || isEpigraph || isVideo; }
};

struct ReadingPosition {
    QString chapterId;
    int pageIndex = 0;

    bool isValid() const { return !chapterId.isEmpty(); }
};

struct PaginationResult {
    QList<Page> pages;
    QMap<QString, Karaoke::KaraokeSource> karaokeSources;
    QList<Content::Footnote> footnotes;
};

} // namespace Pagination

#endif // PAGEWRIGHT_PAGE_H
