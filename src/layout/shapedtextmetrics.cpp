/*
 * shapedtextmetrics.cpp — Font-backed text metrics
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "shapedtextmetrics.h"
#include "fontmanager.h"
#include "textshaper.h"

#include <QDebug>
#include <QSet>

#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/unistr.h>

namespace Layout {

ShapedTextMetrics::ShapedTextMetrics(FontManager *fontManager)
    : m_fontManager(fontManager)
    , m_shaper(std::make_unique<TextShaper>(fontManager))
{
    UErrorCode err = U_ZERO_ERROR;
    m_lineBreaker.reset(icu::BreakIterator::createLineInstance(icu::Locale::getDefault(), err));
    if (U_FAILURE(err)) {
        qWarning() << "ShapedTextMetrics: ICU line break iterator unavailable:" << u_errorName(err);
        m_lineBreaker.reset();
    }

    if (FontFace *fallback = m_fontManager->loadFont(QStringLiteral("serif")))
        m_shaper->setFallbackFont(fallback);
}

ShapedTextMetrics::~ShapedTextMetrics() = default;

QList<int> ShapedTextMetrics::breakOpportunities(const QString &text)
{
    QList<int> positions;
    if (!m_lineBreaker) {
        // Without ICU, break after whitespace runs
        for (int i = 1; i < text.size(); ++i) {
            if (text.at(i - 1).isSpace() && !text.at(i).isSpace())
                positions.append(i);
        }
        return positions;
    }

    icu::UnicodeString ustr(reinterpret_cast<const UChar *>(text.utf16()), text.length());
    m_lineBreaker->setText(ustr);
    for (int32_t pos = m_lineBreaker->first();
         pos != icu::BreakIterator::DONE;
         pos = m_lineBreaker->next()) {
        if (pos > 0 && pos < text.size())
            positions.append(pos);
    }
    return positions;
}

QList<LineMetrics> ShapedTextMetrics::breakIntoLines(const QString &text,
                                                     const QList<TextRunStyle> &styles,
                                                     qreal width)
{
    if (text.isEmpty())
        return {};

    QList<StyleRun> styleRuns;
    styleRuns.reserve(styles.size());
    for (const TextRunStyle &s : styles) {
        StyleRun sr;
        sr.start = s.start;
        sr.length = s.length;
        sr.fontFamily = s.fontFamily;
        sr.fontWeight = s.fontWeight;
        sr.fontItalic = s.italic;
        sr.fontSize = s.fontSize;
        styleRuns.append(sr);
    }

    // Glyph advances attributed to the character starting their cluster
    const QList<qreal> advances = m_shaper->advances(text, styleRuns);

    const QList<int> opportunities = breakOpportunities(text);
    const QSet<int> breakPositions(opportunities.cbegin(), opportunities.cend());

    // Word boxes split at break opportunities and newlines
    QList<WordBox> words;
    WordBox current;
    current.start = 0;

    auto flush = [&](int end) {
        current.length = end - current.start;
        if (current.length > 0)
            words.append(current);
        current = WordBox{};
        current.start = end;
    };

    for (int i = 0; i < text.size(); ++i) {
        const QChar c = text.at(i);
        if (c == QLatin1Char('\n')) {
            flush(i);
            WordBox nl;
            nl.start = i;
            nl.length = 1;
            nl.isNewline = true;
            words.append(nl);
            current.start = i + 1;
            continue;
        }
        if (breakPositions.contains(i) && i > current.start)
            flush(i);

        current.width += advances[i];
        current.advances.append(advances[i]);
        if (c.isSpace() && c != QChar(0x00A0)) {
            current.trailingSpaceWidth += advances[i];
            ++current.trailingSpaceLength;
        } else {
            current.trailingSpaceWidth = 0;
            current.trailingSpaceLength = 0;
        }
    }
    flush(text.size());

    return greedyLineFill(words, width);
}

} // namespace Layout
