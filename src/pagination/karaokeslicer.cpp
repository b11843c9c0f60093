/*
 * karaokeslicer.cpp — Spread a karaoke block over as many pages as it needs
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "karaokeslicer.h"

#include <QDebug>

#include "footnotetracker.h"
#include "htmlfragment.h"
#include "pageassembler.h"
#include "textsplitter.h"

namespace Pagination {

using Content::HtmlNode;

KaraokeSlicer::KaraokeSlicer(Layout::MeasurementOracle *oracle, FootnoteTracker *footnotes,
                             PageAssembler *assembler, const Layout::PageMetrics &metrics,
                             const PaginationSettings &settings)
    : m_oracle(oracle)
    , m_footnotes(footnotes)
    , m_assembler(assembler)
    , m_metrics(metrics)
    , m_settings(settings)
{
}

void KaraokeSlicer::reset()
{
    m_sources.clear();
    m_sequence = 0;
}

QString KaraokeSlicer::karaokeId(const HtmlNode &node, const Content::ContentBlock &block,
                                 int chapterIndex)
{
    const QString id = node.attribute(QStringLiteral("data-karaoke-id"));
    if (!id.isEmpty())
        return id;
    const QString owner = block.subchapterId.isEmpty() ? block.chapterId : block.subchapterId;
    return QStringLiteral("karaoke-%1-%2-%3").arg(chapterIndex).arg(owner).arg(m_sequence++);
}

QString KaraokeSlicer::sliceHtml(const Karaoke::KaraokeSlice &slice, const QString &text)
{
    QString body = Html::escapeText(text);
    body.replace(QLatin1Char('\n'), QStringLiteral("<br>"));
    return QStringLiteral("<span class=\"karaoke-slice\" data-karaoke-id=\"")
        + Html::escapeAttribute(slice.karaokeId)
        + QStringLiteral("\" data-karaoke-start=\"") + QString::number(slice.startChar)
        + QStringLiteral("\" data-karaoke-end=\"") + QString::number(slice.endChar)
        + QStringLiteral("\">") + body + QStringLiteral("</span>");
}

bool KaraokeSlicer::paginate(const HtmlNode &node, const Content::ContentBlock &block,
                             int chapterIndex)
{
    // The block may be a wrapper around the karaoke object
    const HtmlNode *source = &node;
    if (!node.hasAttribute(QStringLiteral("data-karaoke"))
        && !node.hasAttribute(QStringLiteral("data-timings"))) {
        Html::forEachElement(node, [&source, &node](const HtmlNode &child) {
            if (source == &node
                && (child.hasAttribute(QStringLiteral("data-karaoke"))
                    || child.hasClass(QStringLiteral("karaoke-object"))))
                source = &child;
        });
    }

    const auto payload = Karaoke::parsePayload(*source);
    if (!payload)
        return false;
    if (Karaoke::normalizeText(payload->text).trimmed().isEmpty()) {
        qWarning() << "KaraokeSlicer: karaoke block without text in" << block.chapterId;
        return false;
    }

    const QString id = karaokeId(*source, block, chapterIndex);
    if (!m_sources.contains(id))
        m_sources.insert(id, Karaoke::buildSource(id, *payload));

    const QString text = m_sources.value(id).text;
    const int length = int(text.size());
    TextSplitter splitter(m_oracle, m_metrics.contentWidth(), m_settings);

    int cursor = 0;
    while (cursor < length) {
        PendingPage &page = m_assembler->pending();

        const qreal reserved = page.footnotes.isEmpty()
            ? m_settings.karaokeReserve
            : m_footnotes->measureSectionHeight(page.footnotes);
        const qreal available = qMax<qreal>(
            0, m_metrics.bodyHeight() - reserved - m_metrics.headingPadding(page.hasHeading));
        const QString remaining = text.mid(cursor);

        HtmlNode measureBox = HtmlNode::element(QStringLiteral("div"));
        measureBox.setAttribute(QStringLiteral("class"), QStringLiteral("karaoke-slice-measure"));
        measureBox.children.push_back(HtmlNode::textNode(remaining));

        const SplitResult split = splitter.splitAtWordBoundary(measureBox, available, page.html());
        int take = split.first ? split.firstCharCount : 0;

        if (take == 0) {
            if (!page.isEmpty()) {
                m_assembler->pushPage(block);
                m_assembler->startNewPage(false);
                continue;
            }
            take = qMin(int(remaining.size()), m_settings.karaokeMinChunk);
            page.acceptedOverflow = true;
            qWarning() << "KaraokeSlicer: forcing" << take << "characters of" << id
                       << "onto an empty page";
        }

        const Karaoke::KaraokeSlice slice{id, cursor, cursor + take};
        const QString html = sliceHtml(slice, text.mid(cursor, take));
        page.footnotes.unite(m_footnotes->extractFootnoteRefs(html));
        page.elements.append(html);
        page.karaokeSlices.append(slice);

        cursor += take;
        if (cursor < length) {
            m_assembler->pushPage(block);
            m_assembler->startNewPage(false);
        }
    }
    return true;
}

} // namespace Pagination
