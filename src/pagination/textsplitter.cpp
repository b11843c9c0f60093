/*
 * textsplitter.cpp — Cut a text element at a sentence or word boundary
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "textsplitter.h"

#include <QRegularExpression>

#include "measurementoracle.h"

namespace Pagination {

using Content::HtmlNode;

namespace {

bool isBreakPunctuation(QChar c)
{
    static const QString punctuation = QStringLiteral(",.;:!?");
    return punctuation.contains(c);
}

bool isFootnoteElement(const HtmlNode &node)
{
    return node.tag == QLatin1String("footnote-ref")
        || (node.tag == QLatin1String("sup") && node.hasClass(QStringLiteral("footnote-ref")));
}

void collectMarkerRanges(const HtmlNode &node, int &pos, QList<QPair<int, int>> &out)
{
    for (const HtmlNode &child : node.children) {
        if (child.isText()) {
            pos += int(child.text.size());
            continue;
        }
        if (isFootnoteElement(child)) {
            const int length = int(child.textContent().size());
            out.append({pos, pos + length});
            pos += length;
            continue;
        }
        collectMarkerRanges(child, pos, out);
    }
}

} // namespace

TextSplitter::TextSplitter(Layout::MeasurementOracle *oracle, qreal width,
                           const PaginationSettings &settings)
    : m_oracle(oracle)
    , m_width(width)
    , m_settings(settings)
{
}

QList<QPair<int, int>> TextSplitter::footnoteMarkerRanges(const HtmlNode &element)
{
    QList<QPair<int, int>> ranges;
    int pos = 0;
    collectMarkerRanges(element, pos, ranges);

    static const QRegularExpression legacyRx(QStringLiteral("\\^\\[[^\\]]+\\]"));
    auto it = legacyRx.globalMatch(element.textContent());
    while (it.hasNext()) {
        const auto m = it.next();
        ranges.append({int(m.capturedStart()), int(m.capturedEnd())});
    }
    return ranges;
}

QList<int> TextSplitter::wordCutCandidates(const QString &text,
                                           const QList<QPair<int, int>> &protectedRanges)
{
    QList<int> cuts;
    for (int i = 1; i < text.size(); ++i) {
        if (!text.at(i).isSpace() || text.at(i - 1).isSpace())
            continue;
        bool inside = false;
        for (const auto &range : protectedRanges) {
            if (i > range.first && i < range.second) {
                inside = true;
                break;
            }
        }
        if (!inside)
            cuts.append(i);
    }
    return cuts;
}

QList<int> TextSplitter::sentenceCuts(const QString &text)
{
    static const QRegularExpression sentenceRx(QStringLiteral("[.!?](?=\\s+[A-Z])"));
    QList<int> cuts;
    auto it = sentenceRx.globalMatch(text);
    while (it.hasNext())
        cuts.append(int(it.next().capturedEnd()));
    return cuts;
}

bool TextSplitter::fits(const QString &html, qreal maxHeight, const QString &precedingHtml)
{
    const qreal height = m_oracle->measureHeight(precedingHtml + html, m_width);
    return height <= maxHeight + m_settings.fitTolerance;
}

bool TextSplitter::prefixFits(const HtmlNode &element, int cut, qreal maxHeight,
                              const QString &precedingHtml)
{
    return fits(Html::sliceByText(element, 0, cut).outerHtml(), maxHeight, precedingHtml);
}

SplitResult TextSplitter::cutAt(const HtmlNode &element, int cut, int textLength) const
{
    SplitResult result;
    result.first = Html::sliceByText(element, 0, cut);
    result.firstCharCount = cut;

    HtmlNode second = Html::sliceByText(element, cut, textLength);
    Html::trimLeadingWhitespace(second);
    if (!second.textContent().trimmed().isEmpty())
        result.second = std::move(second);
    return result;
}

SplitResult TextSplitter::splitAtWordBoundary(const HtmlNode &element, qreal maxHeight,
                                              const QString &precedingHtml)
{
    const QString text = element.textContent();
    const int length = int(text.size());

    SplitResult whole;
    whole.first = element;
    whole.firstCharCount = length;

    if (text.trimmed().isEmpty())
        return whole;
    if (fits(element.outerHtml(), maxHeight, precedingHtml))
        return whole;

    SplitResult none;
    none.second = element;

    const QList<int> cuts = wordCutCandidates(text, footnoteMarkerRanges(element));
    if (cuts.isEmpty())
        return none;

    // Largest cut whose prefix fits
    int low = 0;
    int high = int(cuts.size()) - 1;
    int best = -1;
    while (low <= high) {
        const int mid = (low + high) / 2;
        if (prefixFits(element, cuts.at(mid), maxHeight, precedingHtml)) {
            best = mid;
            low = mid + 1;
        } else {
            high = mid - 1;
        }
    }
    if (best < 0)
        return none;

    // Do not leave a page ending on punctuation when an earlier cut avoids it
    if (isBreakPunctuation(text.at(cuts.at(best) - 1))) {
        for (int i = best - 1; i >= 0; --i) {
            if (!isBreakPunctuation(text.at(cuts.at(i) - 1))) {
                best = i;
                break;
            }
        }
    }

    return cutAt(element, cuts.at(best), length);
}

SplitResult TextSplitter::splitAtSentenceBoundary(const HtmlNode &element, qreal maxHeight,
                                                  const QString &precedingHtml)
{
    const QString text = element.textContent();
    const int length = int(text.size());

    SplitResult whole;
    whole.first = element;
    whole.firstCharCount = length;

    if (text.trimmed().isEmpty())
        return whole;

    const QList<QPair<int, int>> markers = footnoteMarkerRanges(element);
    QList<int> cuts;
    for (int cut : sentenceCuts(text)) {
        bool inside = false;
        for (const auto &range : markers) {
            if (cut > range.first && cut < range.second)
                inside = true;
        }
        if (!inside)
            cuts.append(cut);
    }
    if (cuts.isEmpty())
        return splitAtWordBoundary(element, maxHeight, precedingHtml);

    // Whole sentences, greedily
    int best = -1;
    for (int i = 0; i < cuts.size(); ++i) {
        if (!prefixFits(element, cuts.at(i), maxHeight, precedingHtml))
            break;
        best = i;
    }
    if (best < 0)
        return splitAtWordBoundary(element, maxHeight, precedingHtml);
    if (best == cuts.size() - 1 && fits(element.outerHtml(), maxHeight, precedingHtml))
        return whole;

    return cutAt(element, cuts.at(best), length);
}

SplitResult TextSplitter::split(const HtmlNode &element, qreal maxHeight,
                                const QString &precedingHtml)
{
    SplitResult result = splitAtSentenceBoundary(element, maxHeight, precedingHtml);
    if (!result.first && !result.second)
        result = splitAtWordBoundary(element, maxHeight, precedingHtml);
    return result;
}

} // namespace Pagination
