/*
 * paginationsettings.h — Tuned thresholds of the pagination heuristics
 *
 * The values are kept per decision branch even where neighbouring
 * branches use similar numbers; each one is a separately tuned constant.
 * All of them can be overridden in the [Pagination] group of the
 * application config file.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_PAGINATIONSETTINGS_H
#define PAGEWRIGHT_PAGINATIONSETTINGS_H

#include <QtGlobal>

#include <KSharedConfig>

namespace Pagination {

struct PaginationSettings {
    // Fit test and split tolerance (px)
    qreal fitTolerance = 2;
    qreal safetyMarginFirstPage = -100;
    qreal safetyMarginHeading = 8;
    qreal safetyMarginDefault = 2;

    // Bottom space reserved while fitting when a page has no footnotes
    qreal bottomReserve = 32;
    qreal bottomReserveFirstPage = 20;

    // Bottom padding of assembled pages without footnotes
    qreal pagePadding = 48;
    qreal pagePaddingKaraoke = 32;
    qreal pagePaddingFirstPage = 20;

    // Split decision when the element fits the plain fit test
    qreal smallSpaceRemaining = 50;
    int smallSpaceMinLength = 50;
    qreal likelyLastRemaining = 80;
    qreal likelyLastOverflow = 30;
    int shortTextLength = 100;
    qreal shortTextOverflow = 30;
    qreal overflowTolerance = 30;
    qreal overflowToleranceFirstPage = 50;
    qreal skipSplitRemaining = 20;
    int skipSplitMinLength = 200;
    qreal minSplitOverflow = 10;

    // Acceptance of a split result
    int minFirstPartWords = 2;
    qreal keepWholeFirstRemaining = 30;
    qreal keepWholeOverflow = 30;
    qreal pushWholeFirstRemaining = 15;
    qreal pushWholeOverflow = 30;

    // Measured footnote section includes this much padding not present on pages
    qreal footnoteExtraPadding = 16;

    // Karaoke slicing
    qreal karaokeReserve = 32;
    int karaokeMinChunk = 80;

    // Leading empty paragraphs dropped from the standalone first page
    qreal compactScreenHeight = 700;
    int compactScreenRemovals = 5;
    qreal mediumScreenHeight = 850;
    int mediumScreenRemovals = 1;

    // Asynchronous edges (ms)
    int imageTimeoutMs = 3000;
    int hyphenationDelayMs = 100;

    static PaginationSettings load();
    static PaginationSettings load(const KSharedConfigPtr &config);
    void save(const KSharedConfigPtr &config) const;

    qreal safetyMargin(bool standaloneFirstPage, bool hasHeading) const
    {
        if (standaloneFirstPage)
            return safetyMarginFirstPage;
        return hasHeading ? safetyMarginHeading : safetyMarginDefault;
    }

    qreal defaultBottomReserve(bool standaloneFirstPage) const
    {
        return standaloneFirstPage ? bottomReserveFirstPage : bottomReserve;
    }

    int emptyParagraphRemovals(qreal screenHeight) const
    {
        if (screenHeight <= compactScreenHeight)
            return compactScreenRemovals;
        if (screenHeight <= mediumScreenHeight)
            return mediumScreenRemovals;
        return 0;
    }
};

} // namespace Pagination

#endif // PAGEWRIGHT_PAGINATIONSETTINGS_H
