/*
 * fixedtextmetrics.cpp — Fixed-advance text metrics
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "fixedtextmetrics.h"

namespace Layout {

namespace {

bool isBreakingSpace(QChar c)
{
    return c != QLatin1Char('\n') && c != QChar(0x00A0) && c.isSpace();
}

} // anonymous namespace

FixedTextMetrics::FixedTextMetrics(qreal advanceEm)
    : m_advanceEm(advanceEm)
{
}

QList<LineMetrics> FixedTextMetrics::breakIntoLines(const QString &text,
                                                    const QList<TextRunStyle> &styles,
                                                    qreal width)
{
    if (text.isEmpty())
        return {};

    // Per-character advance from the covering style run
    QList<qreal> advances(text.size(), (styles.isEmpty() ? 16.0 : styles.first().fontSize) * m_advanceEm);
    for (const TextRunStyle &run : styles) {
        for (int i = run.start; i < run.start + run.length && i < text.size(); ++i)
            advances[i] = run.fontSize * m_advanceEm;
    }

    QList<WordBox> words;
    int pos = 0;
    while (pos < text.size()) {
        if (text.at(pos) == QLatin1Char('\n')) {
            WordBox nl;
            nl.start = pos;
            nl.length = 1;
            nl.isNewline = true;
            words.append(nl);
            ++pos;
            continue;
        }

        WordBox word;
        word.start = pos;
        while (pos < text.size() && text.at(pos) != QLatin1Char('\n') && !isBreakingSpace(text.at(pos))) {
            word.width += advances[pos];
            word.advances.append(advances[pos]);
            ++pos;
        }
        while (pos < text.size() && isBreakingSpace(text.at(pos))) {
            word.width += advances[pos];
            word.trailingSpaceWidth += advances[pos];
            word.advances.append(advances[pos]);
            ++word.trailingSpaceLength;
            ++pos;
        }
        word.length = pos - word.start;
        words.append(word);
    }

    return greedyLineFill(words, width);
}

} // namespace Layout
