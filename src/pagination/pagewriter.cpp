/*
 * pagewriter.cpp — JSON form of pagination results
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pagewriter.h"

namespace Pagination {

namespace PageWriter {

QJsonObject footnoteToJson(const Content::Footnote &footnote)
{
    QJsonObject obj;
    obj.insert(QLatin1String("globalNumber"), footnote.globalNumber);
    obj.insert(QLatin1String("content"), footnote.content);
    return obj;
}

QJsonObject pageToJson(const Page &page)
{
    QJsonObject obj;
    obj.insert(QLatin1String("chapterIndex"), page.chapterIndex);
    obj.insert(QLatin1String("chapterId"), page.chapterId);
    obj.insert(QLatin1String("chapterTitle"), page.chapterTitle);
    if (!page.subchapterId.isEmpty()) {
        obj.insert(QLatin1String("subchapterId"), page.subchapterId);
        obj.insert(QLatin1String("subchapterTitle"), page.subchapterTitle);
    }
    obj.insert(QLatin1String("pageIndex"), page.pageIndex);
    obj.insert(QLatin1String("content"), page.content);

    QJsonArray footnotes;
    for (const Content::Footnote &footnote : page.footnotes)
        footnotes.append(footnoteToJson(footnote));
    obj.insert(QLatin1String("footnotes"), footnotes);

    obj.insert(QLatin1String("hasHeading"), page.hasHeading);
    if (!page.backgroundVideoSrc.isEmpty())
        obj.insert(QLatin1String("backgroundVideoSrc"), page.backgroundVideoSrc);
    if (!page.backgroundImageUrl.isEmpty())
        obj.insert(QLatin1String("backgroundImageUrl"), page.backgroundImageUrl);

    obj.insert(QLatin1String("isEpigraph"), page.isEpigraph);
    obj.insert(QLatin1String("isVideo"), page.isVideo);
    obj.insert(QLatin1String("isCover"), page.isCover);
    obj.insert(QLatin1String("isFirstPage"), page.isFirstPage);
    obj.insert(QLatin1String("totalPages"),
               page.totalPages ? QJsonValue(*page.totalPages) : QJsonValue(QJsonValue::Null));

    if (page.epigraph) {
        QJsonObject epigraph;
        epigraph.insert(QLatin1String("text"), page.epigraph->text);
        epigraph.insert(QLatin1String("author"), page.epigraph->author);
        epigraph.insert(QLatin1String("align"), page.epigraph->align);
        obj.insert(QLatin1String("epigraph"), epigraph);
    }
    if (!page.videoSrc.isEmpty())
        obj.insert(QLatin1String("videoSrc"), page.videoSrc);

    if (!page.karaokeSlices.isEmpty()) {
        QJsonArray slices;
        for (const Karaoke::KaraokeSlice &slice : page.karaokeSlices)
            slices.append(Karaoke::sliceToJson(slice));
        obj.insert(QLatin1String("karaokeSlices"), slices);
    }
    obj.insert(QLatin1String("acceptedOverflow"), page.acceptedOverflow);
    obj.insert(QLatin1String("reservedBottom"), page.reservedBottom);
    return obj;
}

QJsonArray pagesToJson(const QList<Page> &pages)
{
    QJsonArray array;
    for (const Page &page : pages)
        array.append(pageToJson(page));
    return array;
}

QJsonObject resultToJson(const PaginationResult &result, std::optional<int> startPage)
{
    QJsonObject sources;
    for (auto it = result.karaokeSources.constBegin(); it != result.karaokeSources.constEnd(); ++it)
        sources.insert(it.key(), Karaoke::sourceToJson(it.value()));

    QJsonArray footnotes;
    for (const Content::Footnote &footnote : result.footnotes)
        footnotes.append(footnoteToJson(footnote));

    QJsonObject obj;
    obj.insert(QLatin1String("pages"), pagesToJson(result.pages));
    obj.insert(QLatin1String("karaokeSources"), sources);
    obj.insert(QLatin1String("footnotes"), footnotes);
    obj.insert(QLatin1String("startPage"),
               startPage ? QJsonValue(*startPage) : QJsonValue(QJsonValue::Null));
    return obj;
}

} // namespace PageWriter

} // namespace Pagination
