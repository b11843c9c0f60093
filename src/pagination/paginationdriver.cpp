/*
 * paginationdriver.cpp — Book-level pagination runs
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "paginationdriver.h"

#include <QCoreApplication>
#include <QDebug>
#include <QElapsedTimer>
#include <QHash>

#include <algorithm>

#include "chapterstore.h"
#include "elementpaginator.h"
#include "elementparser.h"
#include "footnotetracker.h"
#include "htmlfragment.h"
#include "imagesizecache.h"
#include "karaokeslicer.h"
#include "measurementoracle.h"
#include "pageassembler.h"

namespace Pagination {

using Content::ChapterRecord;
using Content::ContentBlock;

PaginationDriver::PaginationDriver(Layout::MeasurementOracle *oracle,
                                   Layout::ImageSizeCache *images,
                                   const Layout::PageMetrics &metrics,
                                   const PaginationSettings &settings, QObject *parent)
    : QObject(parent)
    , m_oracle(oracle)
    , m_images(images)
    , m_metrics(metrics)
    , m_settings(settings)
    , m_progress([]() { QCoreApplication::processEvents(); })
{
}

QStringList PaginationDriver::collectImageSources(const QList<ChapterRecord> &chapters)
{
    QStringList sources;
    auto scan = [&sources](const QString &html) {
        if (html.isEmpty())
            return;
        for (const Content::HtmlNode &node : Html::parseFragment(html)) {
            auto visit = [&sources](const Content::HtmlNode &element) {
                if (element.tag != QLatin1String("img"))
                    return;
                const QString src = element.attribute(QStringLiteral("src"));
                if (!src.isEmpty() && !sources.contains(src))
                    sources.append(src);
            };
            if (node.isElement())
                visit(node);
            Html::forEachElement(node, visit);
        }
    };
    for (const ChapterRecord &chapter : chapters) {
        scan(chapter.contentHtml);
        for (const ChapterRecord &child : chapter.children)
            scan(child.contentHtml);
    }
    return sources;
}

std::optional<PaginationResult> PaginationDriver::paginate(const QList<ChapterRecord> &chapters)
{
    const quint64 generation = ++m_generation;
    ++m_running;
    Q_EMIT paginationStarted(generation);

    QElapsedTimer timer;
    timer.start();

    auto superseded = [this, generation]() {
        if (isCurrent(generation))
            return false;
        qDebug() << "PaginationDriver: run" << generation << "superseded by" << m_generation;
        --m_running;
        Q_EMIT paginationSuperseded(generation);
        return true;
    };

    const QList<ChapterRecord> sorted = Content::ChapterStore::sortChapters(chapters);

    FootnoteTracker footnotes(m_oracle, m_metrics, m_settings);
    footnotes.build(sorted);

    if (m_images) {
        const QStringList sources = collectImageSources(sorted);
        if (!sources.isEmpty())
            m_images->preload(sources, m_settings.imageTimeoutMs, m_progress);
    }
    if (superseded())
        return std::nullopt;

    PageAssembler assembler(&footnotes, m_metrics, m_settings);
    KaraokeSlicer karaoke(m_oracle, &footnotes, &assembler, m_metrics, m_settings);
    ElementPaginator paginator(m_oracle, &footnotes, &assembler, &karaoke, m_metrics, m_settings);

    QList<Page> pages;
    for (int position = 0; position < sorted.size(); ++position) {
        const ChapterRecord &chapter = sorted.at(position);
        const int chapterIndex = Content::ChapterStore::determineChapterIndex(chapter, position);
        const QList<ContentBlock> blocks = Content::ChapterStore::buildContentBlocks(chapter);

        QMap<int, QString> backgroundVideos;
        for (const ContentBlock &block : blocks) {
            const QMap<int, QString> videos =
                Content::ElementParser::collectBackgroundVideos(block.html);
            for (auto it = videos.constBegin(); it != videos.constEnd(); ++it)
                backgroundVideos.insert(it.key(), it.value());
        }
        assembler.beginChapter(chapter, chapterIndex, backgroundVideos);

        if (blocks.isEmpty()) {
            if (chapter.isSpecial())
                assembler.emitEmptyPage();
            pages.append(assembler.takePages());
            continue;
        }

        for (const ContentBlock &block : blocks) {
            if (superseded())
                return std::nullopt;

            assembler.emitEpigraphPage(block);

            const Content::PreparedBlock prepared =
                Content::ElementParser::prepareBlock(block.html);
            for (const QString &src : prepared.blankPageVideos)
                assembler.emitVideoPage(src, block);

            assembler.startNewPage(false);
            paginator.paginateBlock(block, Content::ElementParser::parseElements(prepared.nodes),
                                    chapterIndex);
        }
        pages.append(assembler.takePages());

        if (m_progress)
            m_progress();
    }
    if (superseded())
        return std::nullopt;

    finalizePages(pages);

    PaginationResult result;
    result.pages = pages;
    result.karaokeSources = karaoke.sources();
    result.footnotes = footnotes.footnotes();

    qDebug() << "PaginationDriver:" << pages.size() << "pages from" << sorted.size()
             << "chapters in" << timer.elapsed() << "ms";

    --m_running;
    Q_EMIT paginationFinished(result);
    return result;
}

void PaginationDriver::finalizePages(QList<Page> &pages)
{
    QHash<int, int> perChapter;
    for (const Page &page : std::as_const(pages)) {
        if (!page.isCover)
            ++perChapter[page.chapterIndex];
    }
    for (Page &page : pages) {
        if (page.isCover || page.isFirstPage)
            page.totalPages.reset();
        else
            page.totalPages = qMax(1, perChapter.value(page.chapterIndex));
    }

    const auto firstIt = std::find_if(pages.begin(), pages.end(),
                                      [](const Page &p) { return p.isFirstPage; });
    if (firstIt != pages.end() && firstIt != pages.begin()) {
        qWarning() << "PaginationDriver: first page not at position 0, moving it";
        std::rotate(pages.begin(), firstIt, firstIt + 1);
    }
    const bool hasFirst = !pages.isEmpty() && pages.first().isFirstPage;
    const int coverTarget = hasFirst ? 1 : 0;
    const auto coverIt = std::find_if(pages.begin(), pages.end(), [](const Page &p) {
        return p.isCover && !p.isFirstPage;
    });
    if (coverIt != pages.end() && coverIt - pages.begin() != coverTarget
        && coverTarget < pages.size()) {
        qWarning() << "PaginationDriver: cover not in place, moving it";
        const auto target = pages.begin() + coverTarget;
        if (coverIt > target)
            std::rotate(target, coverIt, coverIt + 1);
        else
            std::rotate(coverIt, coverIt + 1, target + 1);
    }
}

std::optional<int> PaginationDriver::restorePosition(const QList<Page> &pages,
                                                     const std::optional<ReadingPosition> &position)
{
    if (pages.isEmpty())
        return std::nullopt;

    if (position && position->isValid()) {
        for (int i = 0; i < pages.size(); ++i) {
            const Page &page = pages.at(i);
            if (!page.isCover && page.chapterId == position->chapterId
                && page.pageIndex == position->pageIndex)
                return i;
        }
    }
    for (int i = 0; i < pages.size(); ++i) {
        if (pages.at(i).isFirstPage)
            return i;
    }
    for (int i = 0; i < pages.size(); ++i) {
        if (pages.at(i).isCover)
            return i;
    }
    return 0;
}

ReadingPosition PaginationDriver::positionOf(const Page &page)
{
    return {page.chapterId, page.pageIndex};
}

} // namespace Pagination
