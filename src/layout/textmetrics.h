/*
 * textmetrics.h — Line breaking back-ends for inline text
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_TEXTMETRICS_H
#define PAGEWRIGHT_TEXTMETRICS_H

#include <QList>
#include <QString>

namespace Layout {

struct TextRunStyle {
    int start = 0;
    int length = 0;
    QString fontFamily;
    int fontWeight = 400;
    bool italic = false;
    qreal fontSize = 16;
};

struct LineMetrics {
    int start = 0;
    int length = 0;   // includes trailing whitespace consumed by the break
    qreal width = 0;  // trailing whitespace excluded
};

// A breakable unit: a word with its trailing whitespace, or a forced break.
struct WordBox {
    int start = 0;
    int length = 0;
    qreal width = 0;             // including trailing whitespace
    qreal trailingSpaceWidth = 0;
    int trailingSpaceLength = 0;
    bool isNewline = false;
    QList<qreal> advances;       // per character, for forced breaks
};

class TextMetrics
{
public:
    virtual ~TextMetrics() = default;

    // '\n' in text is a forced break. An empty text yields no lines.
    virtual QList<LineMetrics> breakIntoLines(const QString &text,
                                              const QList<TextRunStyle> &styles,
                                              qreal width) = 0;
};

// Greedy fill shared by the back-ends. Trailing whitespace may hang past
// the line end; words wider than the line are broken between characters.
QList<LineMetrics> greedyLineFill(const QList<WordBox> &words, qreal width);

} // namespace Layout

#endif // PAGEWRIGHT_TEXTMETRICS_H
