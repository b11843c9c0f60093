/*
 * sliceview.h — Word-level model of a karaoke slice on screen
 *
 * A slice is mounted as plain text; initialisation splits it into word
 * entries carrying the timing of their source word so the playback loop
 * can fill them progressively.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_SLICEVIEW_H
#define PAGEWRIGHT_SLICEVIEW_H

#include <QList>
#include <QString>

#include "karaokesource.h"

namespace Karaoke {

struct WordEntry {
    enum State { Pending, Active, Complete };

    int wordIndex = 0;
    double start = 0;
    double end = 0;
    int localStart = 0;         // offsets in the slice text
    int localEnd = 0;           // exclusive, includes attached punctuation
    int punctuationLength = 0;

    double fill = 0;
    State state = Pending;
};

class SliceView
{
public:
    explicit SliceView(const KaraokeSlice &slice);

    const KaraokeSlice &slice() const { return m_slice; }
    QString karaokeId() const { return m_slice.karaokeId; }

    bool isConnected() const { return m_connected; }
    void setConnected(bool connected) { m_connected = connected; }

    // Builds the word entries once. Fails while disconnected, without a
    // source, or when the slice text is blank.
    bool ensureInitialized(const KaraokeSource *source);
    bool isInitialized() const { return m_initialized; }

    QString text() const { return m_text; }
    const QList<WordEntry> &words() const { return m_words; }

    void setWordProgress(int entry, double fill);
    void markComplete(int entry);
    void resetHighlight();

    // Markup of the initialised slice: one span.karaoke-word per entry
    // with its state and fill, plain text between words.
    QString renderHtml() const;

private:
    KaraokeSlice m_slice;
    QString m_text;
    QList<WordEntry> m_words;
    bool m_connected = true;
    bool m_initialized = false;
};

} // namespace Karaoke

#endif // PAGEWRIGHT_SLICEVIEW_H
