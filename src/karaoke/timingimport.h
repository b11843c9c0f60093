/*
 * timingimport.h — Word timing files and their alignment to text
 *
 * Reads word timings exported by an editor or returned by a speech
 * recognition service, and maps recognised words onto the words of the
 * karaoke text.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_TIMINGIMPORT_H
#define PAGEWRIGHT_TIMINGIMPORT_H

#include <QByteArray>
#include <QList>
#include <QString>

#include <optional>

#include "karaokesource.h"

namespace Karaoke {

enum class TimingImportError {
    None,
    UnsupportedFormat,
    Empty,
};

QString timingImportErrorString(TimingImportError error);

// Accepts a JSON array of {word, start, end}, an object with a
// "wordTimings" array, or a recognition response shaped
// results.channels[0].alternatives[0].words[].
std::optional<QList<WordTiming>> importTimings(const QByteArray &bytes,
                                               TimingImportError *error = nullptr);

// One timing per whitespace-separated word of `text`, taken from the
// recognised words with a look-ahead of three; unmatched words are
// interpolated from their neighbours.
QList<WordTiming> alignTimingsToText(const QList<WordTiming> &recognized, const QString &text);

} // namespace Karaoke

#endif // PAGEWRIGHT_TIMINGIMPORT_H
