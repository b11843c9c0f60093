/*
 * sliceview.cpp — Word-level model of a karaoke slice on screen
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "sliceview.h"

#include <QDebug>

#include "htmlfragment.h"

namespace Karaoke {

namespace {

bool isAttachedPunctuation(QChar c)
{
    static const QString punctuation = QStringLiteral(".,!?;:");
    return punctuation.contains(c);
}

} // namespace

SliceView::SliceView(const KaraokeSlice &slice)
    : m_slice(slice)
{
}

bool SliceView::ensureInitialized(const KaraokeSource *source)
{
    if (!m_connected) {
        qWarning() << "SliceView: cannot initialise" << m_slice.karaokeId << "- not connected";
        return false;
    }
    if (m_initialized)
        return true;
    if (!source || !source->isValid()) {
        qWarning() << "SliceView: cannot initialise" << m_slice.karaokeId << "- no source";
        return false;
    }

    const QString text = source->text.mid(m_slice.startChar, m_slice.endChar - m_slice.startChar);
    if (text.trimmed().isEmpty()) {
        qWarning() << "SliceView: cannot initialise" << m_slice.karaokeId << "- no text";
        return false;
    }

    m_text = text;
    m_words.clear();
    const int sliceStart = m_slice.startChar;
    const int sliceEnd = sliceStart + int(text.size());

    for (const auto &range : source->wordCharRanges) {
        if (!range || range->charEnd <= sliceStart || range->charStart >= sliceEnd)
            continue;

        WordEntry entry;
        entry.wordIndex = range->wordIndex;
        entry.start = range->start;
        entry.end = range->end;
        entry.localStart = qMax(0, range->charStart - sliceStart);
        entry.localEnd = qMin(int(text.size()), range->charEnd - sliceStart);
        if (entry.localEnd <= entry.localStart)
            continue;

        while (entry.localEnd < text.size() && isAttachedPunctuation(text.at(entry.localEnd))) {
            ++entry.localEnd;
            ++entry.punctuationLength;
        }
        m_words.append(entry);
    }

    m_initialized = true;
    return true;
}

void SliceView::setWordProgress(int entry, double fill)
{
    if (entry < 0 || entry >= m_words.size())
        return;
    WordEntry &word = m_words[entry];
    word.fill = qBound(0.0, fill, 1.0);
    if (word.fill >= 1.0)
        word.state = WordEntry::Complete;
    else if (word.fill > 0.0)
        word.state = WordEntry::Active;
    else
        word.state = WordEntry::Pending;
}

void SliceView::markComplete(int entry)
{
    setWordProgress(entry, 1.0);
}

void SliceView::resetHighlight()
{
    for (WordEntry &word : m_words) {
        word.fill = 0;
        word.state = WordEntry::Pending;
    }
}

QString SliceView::renderHtml() const
{
    QString html;
    int cursor = 0;
    for (const WordEntry &word : m_words) {
        if (word.localStart < cursor)
            continue;
        if (word.localStart > cursor)
            html += Html::escapeText(m_text.mid(cursor, word.localStart - cursor));

        QString cls = QStringLiteral("karaoke-word");
        if (word.state == WordEntry::Active)
            cls += QLatin1String(" karaoke-word-active");
        else if (word.state == WordEntry::Complete)
            cls += QLatin1String(" karaoke-word-complete");

        const int wordLength = word.localEnd - word.localStart - word.punctuationLength;
        html += QLatin1String("<span class=\"") + cls
            + QLatin1String("\" data-word-index=\"") + QString::number(word.wordIndex)
            + QLatin1String("\" data-start=\"") + QString::number(word.start)
            + QLatin1String("\" data-end=\"") + QString::number(word.end)
            + QLatin1String("\" style=\"--karaoke-fill: ")
            + QString::number(word.fill, 'f', 3) + QLatin1String("\">")
            + Html::escapeText(m_text.mid(word.localStart, wordLength));
        if (word.punctuationLength > 0)
            html += QLatin1String("<span class=\"karaoke-punctuation\">")
                + Html::escapeText(m_text.mid(word.localStart + wordLength,
                                              word.punctuationLength))
                + QLatin1String("</span>");
        html += QLatin1String("</span>");
        cursor = word.localEnd;
    }
    if (cursor < m_text.size())
        html += Html::escapeText(m_text.mid(cursor));
    return html;
}

} // namespace Karaoke
