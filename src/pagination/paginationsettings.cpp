/*
 * paginationsettings.cpp — Tuned thresholds of the pagination heuristics
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "paginationsettings.h"

#include <KConfigGroup>

namespace Pagination {

PaginationSettings PaginationSettings::load()
{
    return load(KSharedConfig::openConfig());
}

PaginationSettings PaginationSettings::load(const KSharedConfigPtr &config)
{
    PaginationSettings s;
    KConfigGroup group(config, QStringLiteral("Pagination"));
    s.fitTolerance = group.readEntry("FitTolerance", double(s.fitTolerance));
    s.safetyMarginFirstPage = group.readEntry("SafetyMarginFirstPage", double(s.safetyMarginFirstPage));
    s.safetyMarginHeading = group.readEntry("SafetyMarginHeading", double(s.safetyMarginHeading));
    s.safetyMarginDefault = group.readEntry("SafetyMarginDefault", double(s.safetyMarginDefault));
    s.bottomReserve = group.readEntry("BottomReserve", double(s.bottomReserve));
    s.bottomReserveFirstPage = group.readEntry("BottomReserveFirstPage", double(s.bottomReserveFirstPage));
    s.pagePadding = group.readEntry("PagePadding", double(s.pagePadding));
    s.pagePaddingKaraoke = group.readEntry("PagePaddingKaraoke", double(s.pagePaddingKaraoke));
    s.pagePaddingFirstPage = group.readEntry("PagePaddingFirstPage", double(s.pagePaddingFirstPage));
    s.smallSpaceRemaining = group.readEntry("SmallSpaceRemaining", double(s.smallSpaceRemaining));
    s.smallSpaceMinLength = group.readEntry("SmallSpaceMinLength", s.smallSpaceMinLength);
    s.likelyLastRemaining = group.readEntry("LikelyLastRemaining", double(s.likelyLastRemaining));
    s.likelyLastOverflow = group.readEntry("LikelyLastOverflow", double(s.likelyLastOverflow));
    s.shortTextLength = group.readEntry("ShortTextLength", s.shortTextLength);
    s.shortTextOverflow = group.readEntry("ShortTextOverflow", double(s.shortTextOverflow));
    s.overflowTolerance = group.readEntry("OverflowTolerance", double(s.overflowTolerance));
    s.overflowToleranceFirstPage = group.readEntry("OverflowToleranceFirstPage", double(s.overflowToleranceFirstPage));
    s.skipSplitRemaining = group.readEntry("SkipSplitRemaining", double(s.skipSplitRemaining));
    s.skipSplitMinLength = group.readEntry("SkipSplitMinLength", s.skipSplitMinLength);
    s.minSplitOverflow = group.readEntry("MinSplitOverflow", double(s.minSplitOverflow));
    s.minFirstPartWords = group.readEntry("MinFirstPartWords", s.minFirstPartWords);
    s.keepWholeFirstRemaining = group.readEntry("KeepWholeFirstRemaining", double(s.keepWholeFirstRemaining));
    s.keepWholeOverflow = group.readEntry("KeepWholeOverflow", double(s.keepWholeOverflow));
    s.pushWholeFirstRemaining = group.readEntry("PushWholeFirstRemaining", double(s.pushWholeFirstRemaining));
    s.pushWholeOverflow = group.readEntry("PushWholeOverflow", double(s.pushWholeOverflow));
    s.footnoteExtraPadding = group.readEntry("FootnoteExtraPadding", double(s.footnoteExtraPadding));
    s.karaokeReserve = group.readEntry("KaraokeReserve", double(s.karaokeReserve));
    s.karaokeMinChunk = group.readEntry("KaraokeMinChunk", s.karaokeMinChunk);
    s.compactScreenHeight = group.readEntry("CompactScreenHeight", double(s.compactScreenHeight));
    s.compactScreenRemovals = group.readEntry("CompactScreenRemovals", s.compactScreenRemovals);
    s.mediumScreenHeight = group.readEntry("MediumScreenHeight", double(s.mediumScreenHeight));
    s.mediumScreenRemovals = group.readEntry("MediumScreenRemovals", s.mediumScreenRemovals);
    s.imageTimeoutMs = group.readEntry("ImageTimeoutMs", s.imageTimeoutMs);
    s.hyphenationDelayMs = group.readEntry("HyphenationDelayMs", s.hyphenationDelayMs);
    return s;
}

void PaginationSettings::save(const KSharedConfigPtr &config) const
{
    KConfigGroup group(config, QStringLiteral("Pagination"));
    group.writeEntry("FitTolerance", fitTolerance);
    group.writeEntry("SafetyMarginFirstPage", safetyMarginFirstPage);
    group.writeEntry("SafetyMarginHeading", safetyMarginHeading);
    group.writeEntry("SafetyMarginDefault", safetyMarginDefault);
    group.writeEntry("BottomReserve", bottomReserve);
    group.writeEntry("BottomReserveFirstPage", bottomReserveFirstPage);
    group.writeEntry("PagePadding", pagePadding);
    group.writeEntry("PagePaddingKaraoke", pagePaddingKaraoke);
    group.writeEntry("PagePaddingFirstPage", pagePaddingFirstPage);
    group.writeEntry("SmallSpaceRemaining", smallSpaceRemaining);
    group.writeEntry("SmallSpaceMinLength", smallSpaceMinLength);
    group.writeEntry("LikelyLastRemaining", likelyLastRemaining);
    group.writeEntry("LikelyLastOverflow", likelyLastOverflow);
    group.writeEntry("ShortTextLength", shortTextLength);
    group.writeEntry("ShortTextOverflow", shortTextOverflow);
    group.writeEntry("OverflowTolerance", overflowTolerance);
    group.writeEntry("OverflowToleranceFirstPage", overflowToleranceFirstPage);
    group.writeEntry("SkipSplitRemaining", skipSplitRemaining);
    group.writeEntry("SkipSplitMinLength", skipSplitMinLength);
    group.writeEntry("MinSplitOverflow", minSplitOverflow);
    group.writeEntry("MinFirstPartWords", minFirstPartWords);
    group.writeEntry("KeepWholeFirstRemaining", keepWholeFirstRemaining);
    group.writeEntry("KeepWholeOverflow", keepWholeOverflow);
    group.writeEntry("PushWholeFirstRemaining", pushWholeFirstRemaining);
    group.writeEntry("PushWholeOverflow", pushWholeOverflow);
    group.writeEntry("FootnoteExtraPadding", footnoteExtraPadding);
    group.writeEntry("KaraokeReserve", karaokeReserve);
    group.writeEntry("KaraokeMinChunk", karaokeMinChunk);
    group.writeEntry("CompactScreenHeight", compactScreenHeight);
    group.writeEntry("CompactScreenRemovals", compactScreenRemovals);
    group.writeEntry("MediumScreenHeight", mediumScreenHeight);
    group.writeEntry("MediumScreenRemovals", mediumScreenRemovals);
    group.writeEntry("ImageTimeoutMs", imageTimeoutMs);
    group.writeEntry("HyphenationDelayMs", hyphenationDelayMs);
    group.sync();
}

} // namespace Pagination
