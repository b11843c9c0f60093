/*
 * elementpaginator.cpp — Fit a block's elements onto pages
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "elementpaginator.h"

#include <QDebug>

#include "footnotetracker.h"
#include "karaokeslicer.h"
#include "measurementoracle.h"
#include "pageassembler.h"
#include "textsplitter.h"

namespace Pagination {

using Content::Element;
using Content::HtmlNode;

ElementPaginator::ElementPaginator(Layout::MeasurementOracle *oracle, FootnoteTracker *footnotes,
                                   PageAssembler *assembler, KaraokeSlicer *karaoke,
                                   const Layout::PageMetrics &metrics,
                                   const PaginationSettings &settings)
    : m_oracle(oracle)
    , m_footnotes(footnotes)
    , m_assembler(assembler)
    , m_karaoke(karaoke)
    , m_metrics(metrics)
    , m_settings(settings)
{
}

void ElementPaginator::paginateBlock(const Content::ContentBlock &block,
                                     const QList<Element> &elements, int chapterIndex)
{
    QList<Element> queue = elements;
    for (int i = 0; i < queue.size(); ++i) {
        const bool isLast = i == queue.size() - 1;
        std::optional<Element> next = process(queue.at(i), isLast, block, chapterIndex);
        if (next)
            queue.insert(i + 1, std::move(*next));
    }
    m_assembler->pushPage(block);
}

// --- Measurement ---

qreal ElementPaginator::measure(const QString &html)
{
    if (html.isEmpty())
        return 0;
    return m_oracle->measureHeight(html, m_metrics.contentWidth());
}

qreal ElementPaginator::measureWrapped(const QString &html, qreal reserved)
{
    return measure(QStringLiteral("<div class=\"page-content-main\" style=\"padding-bottom: ")
                   + QString::number(reserved) + QStringLiteral("px;\">") + html
                   + QStringLiteral("</div>"));
}

qreal ElementPaginator::availableHeight(qreal reserved, bool hasHeading) const
{
    return m_metrics.bodyHeight() - reserved - m_metrics.headingPadding(hasHeading);
}

ElementPaginator::Fit ElementPaginator::evaluate(const QString &html)
{
    const PendingPage &page = m_assembler->pending();
    const bool firstPage = m_assembler->isStandaloneFirstPage();

    Fit fit;
    fit.elementFootnotes = m_footnotes->extractFootnoteRefs(html);
    fit.pageFootnotes = page.footnotes;
    fit.pageFootnotes.unite(fit.elementFootnotes);

    fit.reserved = m_assembler->fittingReserve(fit.pageFootnotes);
    fit.available = availableHeight(fit.reserved, page.hasHeading);
    if (fit.available < 0) {
        qWarning() << "ElementPaginator: footnotes leave no room on the page"
                   << "(reserved" << fit.reserved << "px), using the default margin";
        fit.reserved = m_settings.defaultBottomReserve(firstPage);
        fit.available = availableHeight(fit.reserved, page.hasHeading);
    }

    const QString current = page.html();
    fit.total = measure(current + html);
    fit.remaining = qMax<qreal>(0, fit.available - measure(current));
    fit.fits = firstPage
        || fit.total <= fit.available - m_settings.safetyMargin(firstPage, page.hasHeading);
    return fit;
}

void ElementPaginator::updateOverflow()
{
    PendingPage &page = m_assembler->pending();
    const qreal available =
        availableHeight(m_assembler->fittingReserve(page.footnotes), page.hasHeading);
    const qreal height = measure(page.html());
    if (height > available + m_settings.fitTolerance && !page.acceptedOverflow) {
        page.acceptedOverflow = true;
        qDebug() << "ElementPaginator: page" << m_assembler->chapterPageIndex()
                 << "overflows by" << height - available << "px";
    }
}

int ElementPaginator::wordCount(const QString &text)
{
    return int(text.simplified().split(QLatin1Char(' '), Qt::SkipEmptyParts).size());
}

// --- Placement ---

void ElementPaginator::place(const QString &html, const QSet<int> &footnotes)
{
    PendingPage &page = m_assembler->pending();
    page.elements.append(html);
    page.footnotes.unite(footnotes);
    updateOverflow();
}

std::optional<Element> ElementPaginator::pushWhole(const Element &element, const QString &html,
                                                   const QSet<int> &footnotes,
                                                   const Content::ContentBlock &block)
{
    if (!m_assembler->pending().isEmpty()) {
        m_assembler->pushPage(block);
        m_assembler->startNewPage(false);
        return element;
    }
    // Nothing to gain from another page; keep the content
    place(html, footnotes);
    return std::nullopt;
}

std::optional<Element> ElementPaginator::placeSplit(const HtmlNode &first,
                                                    const std::optional<HtmlNode> &second,
                                                    const Content::ContentBlock &block)
{
    const QString html = first.outerHtml();
    place(html, m_footnotes->extractFootnoteRefs(html));
    m_assembler->pushPage(block);
    m_assembler->startNewPage(false);
    if (second)
        return Element(Content::Paragraph{*second});
    return std::nullopt;
}

// --- Decisions ---

std::optional<Element> ElementPaginator::process(const Element &element, bool isLast,
                                                 const Content::ContentBlock &block,
                                                 int chapterIndex)
{
    const HtmlNode &node = Content::elementNode(element);
    PendingPage &page = m_assembler->pending();

    if (const auto *heading = std::get_if<Content::Heading>(&element)) {
        if (heading->level >= 4 && !page.hasHeading)
            page.hasHeading = true;
    }
    if (const auto *video = std::get_if<Content::Video>(&element)) {
        if (video->mode == QLatin1String("background"))
            return std::nullopt;
    }
    if (std::holds_alternative<Content::KaraokeBlock>(element)) {
        if (m_karaoke->paginate(node, block, chapterIndex))
            return std::nullopt;
        qWarning() << "ElementPaginator: karaoke block in" << block.chapterId
                   << "placed without slicing";
    }

    const QString html = node.outerHtml();
    const Fit fit = evaluate(html);

    if (!Content::isSplittable(element)) {
        if (fit.fits) {
            place(html, fit.elementFootnotes);
            return std::nullopt;
        }
        if (!page.isEmpty())
            m_assembler->pushPage(block);
        m_assembler->startNewPage(std::holds_alternative<Content::Heading>(element));
        place(html, fit.elementFootnotes);
        return std::nullopt;
    }

    return processSplittable(element, html, fit, isLast, block);
}

std::optional<Element> ElementPaginator::processSplittable(const Element &element,
                                                           const QString &html, const Fit &fit,
                                                           bool isLast,
                                                           const Content::ContentBlock &block)
{
    const HtmlNode &node = Content::elementNode(element);
    const PendingPage &page = m_assembler->pending();
    const bool firstPage = m_assembler->isStandaloneFirstPage();
    const int textLength = int(node.textContent().size());
    const QString current = page.html();
    const PaginationSettings &s = m_settings;

    TextSplitter splitter(m_oracle, m_metrics.contentWidth(), m_settings);

    if (fit.fits) {
        const qreal finalTotal = measureWrapped(current + html, fit.reserved);
        qreal overflow = 0;
        if (firstPage)
            overflow = 0;
        else if (m_metrics.mode == Layout::PageMetrics::Document)
            overflow = finalTotal - m_metrics.bodyHeight();
        else
            overflow = finalTotal - fit.available;

        const bool smallSpace = fit.remaining > 0 && fit.remaining < s.smallSpaceRemaining
            && textLength > s.smallSpaceMinLength;
        const bool likelyLast = fit.remaining < s.likelyLastRemaining
            && overflow < s.likelyLastOverflow;
        const bool isShort = textLength < s.shortTextLength && overflow < s.shortTextOverflow;
        const qreal tolerance = firstPage ? s.overflowToleranceFirstPage : s.overflowTolerance;
        const bool allowSmallOverflow = (isLast || likelyLast || isShort || firstPage)
            && overflow > 0 && overflow < tolerance;
        const bool skipSplit = fit.remaining > 0 && fit.remaining < s.skipSplitRemaining
            && textLength > s.skipSplitMinLength;

        const bool shouldSplit = (overflow >= s.minSplitOverflow || smallSpace)
            && finalTotal > fit.available && !allowSmallOverflow && !skipSplit;
        if (!shouldSplit) {
            place(html, fit.elementFootnotes);
            return std::nullopt;
        }

        const SplitResult split = splitter.split(node, fit.available, current);
        if (!split.first || fit.remaining <= 0)
            return pushWhole(element, html, fit.elementFootnotes, block);
        if (wordCount(split.first->textContent()) < s.minFirstPartWords)
            return pushWhole(element, html, fit.elementFootnotes, block);

        const qreal firstHeight =
            measureWrapped(current + split.first->outerHtml(), fit.reserved);
        const qreal firstRemaining = fit.available - firstHeight;

        if (firstRemaining > s.keepWholeFirstRemaining && overflow < s.keepWholeOverflow) {
            place(html, fit.elementFootnotes);
            return std::nullopt;
        }
        if (firstRemaining < s.pushWholeFirstRemaining && overflow < s.pushWholeOverflow)
            return pushWhole(element, html, fit.elementFootnotes, block);

        return placeSplit(*split.first, split.second, block);
    }

    if (fit.remaining > 0 && fit.remaining < s.skipSplitRemaining
        && textLength > s.skipSplitMinLength)
        return pushWhole(element, html, fit.elementFootnotes, block);
    if (fit.remaining <= 0)
        return pushWhole(element, html, fit.elementFootnotes, block);

    const SplitResult split = splitter.split(node, fit.available, current);
    if (!split.first || wordCount(split.first->textContent()) < s.minFirstPartWords)
        return pushWhole(element, html, fit.elementFootnotes, block);

    // The first part may carry fewer footnotes than the whole element
    const QString firstHtml = split.first->outerHtml();
    QSet<int> firstFootnotes = page.footnotes;
    firstFootnotes.unite(m_footnotes->extractFootnoteRefs(firstHtml));
    const qreal availableFirst =
        availableHeight(m_assembler->fittingReserve(firstFootnotes), page.hasHeading);
    if (measure(current + firstHtml) > availableFirst + s.fitTolerance)
        return pushWhole(element, html, fit.elementFootnotes, block);

    return placeSplit(*split.first, split.second, block);
}

} // namespace Pagination
