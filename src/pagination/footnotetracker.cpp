/*
 * footnotetracker.cpp — Book-wide footnote numbering and page sections
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "footnotetracker.h"

#include <QDebug>
#include <QRegularExpression>

#include <algorithm>

#include "elementparser.h"
#include "htmlfragment.h"
#include "measurementoracle.h"

namespace Pagination {

namespace {

QString attributeValue(const QString &attrs, const QString &name)
{
    const QRegularExpression rx(QStringLiteral("\\b%1\\s*=\\s*([\"'])(.*?)\\1").arg(name),
                                QRegularExpression::CaseInsensitiveOption
                                    | QRegularExpression::DotMatchesEverythingOption);
    const auto match = rx.match(attrs);
    return match.hasMatch() ? match.captured(2) : QString();
}

// Attribute text is stored decoded; footnote content is kept as markup
QString contentFromAttribute(const QString &value)
{
    return Html::escapeText(Html::decodeEntities(value)).trimmed();
}

} // namespace

FootnoteTracker::FootnoteTracker(Layout::MeasurementOracle *oracle,
                                 const Layout::PageMetrics &metrics,
                                 const PaginationSettings &settings)
    : m_oracle(oracle)
    , m_metrics(metrics)
    , m_settings(settings)
{
}

QList<FootnoteTracker::Marker> FootnoteTracker::findMarkers(const QString &html)
{
    static const QRegularExpression legacyRx(QStringLiteral("\\^\\[([^\\]]+)\\]"));
    static const QRegularExpression supRx(QStringLiteral("<sup\\b([^>]*)>([\\s\\S]*?)</sup\\s*>"),
                                          QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression refRx(
        QStringLiteral("<footnote-ref\\b([^>]*?)(?:/>|>([\\s\\S]*?)</footnote-ref\\s*>)"),
        QRegularExpression::CaseInsensitiveOption);

    QList<Marker> markers;

    auto legacy = legacyRx.globalMatch(html);
    while (legacy.hasNext()) {
        const auto m = legacy.next();
        markers.append({int(m.capturedStart()), int(m.capturedLength()), m.captured(1).trimmed()});
    }

    auto sups = supRx.globalMatch(html);
    while (sups.hasNext()) {
        const auto m = sups.next();
        const QString attrs = m.captured(1);
        const QStringList classes = attributeValue(attrs, QStringLiteral("class"))
                                        .split(QRegularExpression(QStringLiteral("\\s+")),
                                               Qt::SkipEmptyParts);
        if (!classes.contains(QLatin1String("footnote-ref")))
            continue;
        const QString content = contentFromAttribute(
            attributeValue(attrs, QStringLiteral("data-content")));
        if (content.isEmpty())
            continue;
        markers.append({int(m.capturedStart()), int(m.capturedLength()), content});
    }

    auto refs = refRx.globalMatch(html);
    while (refs.hasNext()) {
        const auto m = refs.next();
        const QString content = contentFromAttribute(
            attributeValue(m.captured(1), QStringLiteral("data-content")));
        if (content.isEmpty())
            continue;
        markers.append({int(m.capturedStart()), int(m.capturedLength()), content});
    }

    std::sort(markers.begin(), markers.end(),
              [](const Marker &a, const Marker &b) { return a.start < b.start; });

    // A legacy marker written inside a footnote element belongs to it
    QList<Marker> result;
    int end = 0;
    for (const Marker &m : std::as_const(markers)) {
        if (m.start < end)
            continue;
        result.append(m);
        end = m.start + m.length;
    }
    return result;
}

QStringList FootnoteTracker::scanMarkers(const QString &html)
{
    QStringList contents;
    for (const Marker &m : findMarkers(html))
        contents.append(m.content);
    return contents;
}

void FootnoteTracker::build(const QList<Content::ChapterRecord> &sortedChapters)
{
    m_footnotes.clear();
    m_numbers.clear();
    m_heightCache.clear();

    auto scan = [this](const QString &html) {
        if (html.isEmpty())
            return;
        // Pages carry the prepared, re-serialized markup; number that form
        const QString prepared =
            Html::serialize(Content::ElementParser::prepareBlock(html).nodes);
        for (const QString &content : scanMarkers(prepared)) {
            if (content.isEmpty() || m_numbers.contains(content))
                continue;
            const int number = int(m_footnotes.size()) + 1;
            m_numbers.insert(content, number);
            m_footnotes.append({number, content});
        }
    };

    for (const Content::ChapterRecord &chapter : sortedChapters) {
        scan(chapter.contentHtml);
        for (const Content::ChapterRecord &child : chapter.children)
            scan(child.contentHtml);
    }
}

std::optional<int> FootnoteTracker::numberFor(const QString &content) const
{
    const auto it = m_numbers.constFind(content.trimmed());
    if (it == m_numbers.constEnd())
        return std::nullopt;
    return it.value();
}

std::optional<Content::Footnote> FootnoteTracker::footnote(int number) const
{
    if (number < 1 || number > m_footnotes.size())
        return std::nullopt;
    return m_footnotes.at(number - 1);
}

QSet<int> FootnoteTracker::extractFootnoteRefs(const QString &html) const
{
    QSet<int> numbers;
    if (html.isEmpty() || m_footnotes.isEmpty())
        return numbers;
    for (const Marker &m : findMarkers(html)) {
        if (const auto number = numberFor(m.content))
            numbers.insert(*number);
    }
    return numbers;
}

QString FootnoteTracker::renderSection(const QList<Content::Footnote> &footnotes) const
{
    if (footnotes.isEmpty())
        return {};

    QString html = QStringLiteral("<div class=\"footnotes-section\">"
                                  "<div class=\"footnotes-divider\"></div>"
                                  "<div class=\"footnotes-list\">");
    for (const Content::Footnote &fn : footnotes) {
        html += QStringLiteral("<div class=\"footnote-item\"><span class=\"footnote-number\">")
              + QString::number(fn.globalNumber)
              + QStringLiteral(".</span><span class=\"footnote-content\">") + fn.content
              + QStringLiteral("</span></div>");
    }
    html += QStringLiteral("</div></div>");
    return html;
}

qreal FootnoteTracker::measureSectionHeight(const QSet<int> &numbers)
{
    if (numbers.isEmpty())
        return 0;

    QList<int> sorted(numbers.begin(), numbers.end());
    std::sort(sorted.begin(), sorted.end());

    QList<Content::Footnote> items;
    QStringList key;
    for (int number : std::as_const(sorted)) {
        const auto fn = footnote(number);
        if (!fn) {
            qWarning() << "FootnoteTracker: no footnote numbered" << number;
            continue;
        }
        items.append(*fn);
        key.append(QString::number(number));
    }
    if (items.isEmpty())
        return 0;

    const QString cacheKey = key.join(QLatin1Char(','));
    const auto cached = m_heightCache.constFind(cacheKey);
    if (cached != m_heightCache.constEnd())
        return cached.value();

    const qreal measured = m_oracle->measureHeight(renderSection(items), m_metrics.footnoteWidth());
    const qreal height = qMax<qreal>(0, measured - m_settings.footnoteExtraPadding);
    m_heightCache.insert(cacheKey, height);
    return height;
}

FootnoteTracker::MarkedContent FootnoteTracker::replaceMarkers(const QString &html) const
{
    MarkedContent result;
    const QList<Marker> markers = findMarkers(html);
    if (markers.isEmpty()) {
        result.html = html;
        return result;
    }

    QSet<int> seen;
    int last = 0;
    for (const Marker &m : markers) {
        result.html += html.mid(last, m.start - last);
        const auto number = numberFor(m.content);
        if (number) {
            result.html += QStringLiteral(
                "<sup class=\"footnote-ref\" data-footnote-number=\"%1\">%1</sup>")
                               .arg(*number);
            if (!seen.contains(*number)) {
                seen.insert(*number);
                result.footnotes.append(m_footnotes.at(*number - 1));
            }
        } else {
            result.html += QStringLiteral("<sup class=\"footnote-ref\">?</sup>");
        }
        last = m.start + m.length;
    }
    result.html += html.mid(last);

    std::sort(result.footnotes.begin(), result.footnotes.end(),
              [](const Content::Footnote &a, const Content::Footnote &b) {
                  return a.globalNumber < b.globalNumber;
              });
    return result;
}

} // namespace Pagination
