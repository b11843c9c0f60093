/*
 * pageassembler.cpp — Accumulates page content and emits finished pages
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pageassembler.h"

#include <QDebug>
#include <QRegularExpression>

#include "footnotetracker.h"
#include "htmlfragment.h"

namespace Pagination {

using Content::HtmlNode;

namespace {

bool isEmptyParagraph(const QString &html)
{
    const auto node = Html::parseElement(html);
    if (!node || node->tag != QLatin1String("p"))
        return false;
    if (!node->textContent().trimmed().isEmpty())
        return false;

    int elementChildren = 0;
    bool onlyBr = true;
    for (const HtmlNode &child : node->children) {
        if (!child.isElement())
            continue;
        ++elementChildren;
        if (child.tag != QLatin1String("br"))
            onlyBr = false;
    }
    static const QRegularExpression blankRx(QStringLiteral("^\\s*$"));
    return elementChildren == 0 || (elementChildren == 1 && onlyBr)
        || blankRx.match(node->innerHtml()).hasMatch();
}

bool hasKaraokeMarkup(const PendingPage &pending)
{
    if (!pending.karaokeSlices.isEmpty())
        return true;
    for (const QString &html : pending.elements) {
        if (html.contains(QLatin1String("karaoke-slice"))
            || html.contains(QLatin1String("data-karaoke")))
            return true;
    }
    return false;
}

} // namespace

PageAssembler::PageAssembler(FootnoteTracker *footnotes, const Layout::PageMetrics &metrics,
                             const PaginationSettings &settings)
    : m_footnotes(footnotes)
    , m_metrics(metrics)
    , m_settings(settings)
{
}

void PageAssembler::beginChapter(const Content::ChapterRecord &chapter, int chapterIndex,
                                 const QMap<int, QString> &backgroundVideos)
{
    m_chapter = chapter;
    m_chapterIndex = chapterIndex;
    m_backgroundVideos = backgroundVideos;
    m_pageIndex = 0;
    m_pending = PendingPage{};
}

bool PageAssembler::isStandaloneFirstPage() const
{
    return m_chapter.isFirstPage && m_pageIndex == 0;
}

qreal PageAssembler::fittingReserve(const QSet<int> &footnotes)
{
    if (!footnotes.isEmpty()) {
        const qreal height = m_footnotes->measureSectionHeight(footnotes);
        if (height > 0)
            return height;
    }
    return m_settings.defaultBottomReserve(isStandaloneFirstPage());
}

int PageAssembler::removeLeadingEmptyParagraphs(QStringList &elements, int maxRemovals)
{
    int removed = 0;
    while (removed < maxRemovals && !elements.isEmpty() && isEmptyParagraph(elements.first())) {
        elements.removeFirst();
        ++removed;
    }
    return removed;
}

Page PageAssembler::basePage(const Content::ContentBlock *block) const
{
    Page page;
    page.chapterIndex = m_chapterIndex;
    page.chapterId = m_chapter.id;
    page.chapterTitle = m_chapter.title;
    if (block) {
        page.subchapterId = block->subchapterId;
        if (block->kind == Content::ContentBlock::Subchapter)
            page.subchapterTitle = block->title;
    }
    page.pageIndex = m_pageIndex;
    page.backgroundImageUrl = m_chapter.backgroundImageUrl;
    page.isCover = m_chapter.isCover;
    page.isFirstPage = m_chapter.isFirstPage;
    return page;
}

void PageAssembler::emitPage(Page page)
{
    m_pages.append(std::move(page));
    ++m_pageIndex;
}

bool PageAssembler::pushPage(const Content::ContentBlock &block)
{
    if (m_pending.isEmpty()) {
        startNewPage(false);
        return false;
    }

    const bool firstPage = isStandaloneFirstPage();
    QStringList elements = m_pending.elements;
    if (firstPage && m_metrics.mode == Layout::PageMetrics::Device) {
        const int removed = removeLeadingEmptyParagraphs(
            elements, m_settings.emptyParagraphRemovals(m_metrics.pageHeight));
        if (removed > 0)
            qDebug() << "PageAssembler: dropped" << removed << "empty paragraphs from the first page";
    }

    Page page = basePage(&block);
    page.bodyHtml = elements.join(QString());
    page.hasHeading = m_pending.hasHeading;
    page.karaokeSlices = m_pending.karaokeSlices;
    page.acceptedOverflow = m_pending.acceptedOverflow;

    const FootnoteTracker::MarkedContent marked = m_footnotes->replaceMarkers(page.bodyHtml);
    page.footnotes = marked.footnotes;

    QSet<int> numbers = m_pending.footnotes;
    for (const Content::Footnote &fn : marked.footnotes)
        numbers.insert(fn.globalNumber);

    page.reservedBottom = fittingReserve(m_pending.footnotes);
    if (!page.footnotes.isEmpty())
        page.bottomPadding = m_footnotes->measureSectionHeight(numbers);
    else if (hasKaraokeMarkup(m_pending))
        page.bottomPadding = m_settings.pagePaddingKaraoke;
    else if (firstPage)
        page.bottomPadding = m_settings.pagePaddingFirstPage;
    else
        page.bottomPadding = m_settings.pagePadding;

    page.content = QStringLiteral("<div class=\"page-content-main\" style=\"padding-bottom: ")
        + QString::number(page.bottomPadding) + QStringLiteral("px;\">") + marked.html
        + QStringLiteral("</div>") + m_footnotes->renderSection(page.footnotes);

    page.backgroundVideoSrc = m_backgroundVideos.value(m_pageIndex + 1);

    emitPage(std::move(page));
    startNewPage(false);
    return true;
}

void PageAssembler::startNewPage(bool hasHeading)
{
    m_pending = PendingPage{};
    m_pending.hasHeading = hasHeading;
}

void PageAssembler::emitEmptyPage()
{
    emitPage(basePage(nullptr));
}

bool PageAssembler::emitEpigraphPage(const Content::ContentBlock &block)
{
    if (!block.epigraph || block.epigraph->text.trimmed().isEmpty())
        return false;

    Page page = basePage(&block);
    page.isEpigraph = true;
    Content::Epigraph epigraph = *block.epigraph;
    epigraph.text = epigraph.text.trimmed();
    epigraph.author = epigraph.author.trimmed();
    if (epigraph.align.isEmpty())
        epigraph.align = QStringLiteral("center");
    page.epigraph = epigraph;
    emitPage(std::move(page));
    return true;
}

void PageAssembler::emitVideoPage(const QString &src, const Content::ContentBlock &block)
{
    Page page = basePage(&block);
    page.isVideo = true;
    page.videoSrc = src;
    emitPage(std::move(page));
}

QList<Page> PageAssembler::takePages()
{
    QList<Page> pages;
    pages.swap(m_pages);
    return pages;
}

} // namespace Pagination
