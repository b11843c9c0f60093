/*
 * textmetrics.cpp — Greedy line fill shared by the text back-ends
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "textmetrics.h"

namespace Layout {

QList<LineMetrics> greedyLineFill(const QList<WordBox> &words, qreal width)
{
    QList<LineMetrics> lines;
    if (words.isEmpty())
        return lines;

    LineMetrics current;
    current.start = words.first().start;
    qreal x = 0;            // pen position including hanging whitespace
    bool hasContent = false;

    auto closeLine = [&](int end, int nextStart) {
        current.length = end - current.start;
        lines.append(current);
        current = LineMetrics{};
        current.start = nextStart;
        x = 0;
        hasContent = false;
    };

    for (const WordBox &word : words) {
        const int wordEnd = word.start + word.length;

        if (word.isNewline) {
            closeLine(wordEnd, wordEnd);
            continue;
        }

        const qreal visible = word.width - word.trailingSpaceWidth;

        if (hasContent && x + visible > width)
            closeLine(word.start, word.start);

        // Words wider than the line are broken between characters
        if (!hasContent && visible > width) {
            const int visibleChars = word.length - word.trailingSpaceLength;
            qreal partWidth = 0;
            for (int i = 0; i < visibleChars && i < word.advances.size(); ++i) {
                const qreal adv = word.advances[i];
                if (partWidth + adv > width && partWidth > 0) {
                    current.width = partWidth;
                    closeLine(word.start + i, word.start + i);
                    partWidth = 0;
                }
                partWidth += adv;
            }
            current.width = partWidth;
            x = partWidth + word.trailingSpaceWidth;
            current.length = wordEnd - current.start;
            hasContent = true;
            continue;
        }

        current.width = x + visible;
        x += word.width;
        current.length = wordEnd - current.start;
        hasContent = true;
    }

    if (hasContent)
        lines.append(current);

    return lines;
}

} // namespace Layout
