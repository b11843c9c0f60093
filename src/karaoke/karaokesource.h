/*
 * karaokesource.h — Audio-synchronised text sources and their slices
 *
 * A karaoke block carries its text, an audio URL and a list of word
 * timings. Building a source matches the timing words against the text
 * and spreads each word's duration over its letters, so playback can
 * highlight any character range of the text.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_KARAOKESOURCE_H
#define PAGEWRIGHT_KARAOKESOURCE_H

#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QString>

#include <optional>

#include "htmlfragment.h"

namespace Karaoke {

struct WordTiming {
    QString word;
    double start = 0;
    double end = 0;
    std::optional<double> confidence;
};

struct LetterTiming {
    double start = 0;
    double end = 0;
};

struct WordCharRange {
    QString word;
    double start = 0;
    double end = 0;
    int charStart = 0;
    int charEnd = 0;            // exclusive
    int wordIndex = 0;
};

struct KaraokePayload {
    QString text;
    QString audioUrl;
    QList<WordTiming> wordTimings;
};

struct KaraokeSource {
    QString id;
    QString text;               // normalised
    QString audioUrl;
    QList<std::optional<LetterTiming>> letterTimings;   // one per character
    QList<std::optional<WordCharRange>> wordCharRanges; // one per timing word

    bool isValid() const { return !id.isEmpty(); }
};

// Character range [startChar, endChar) of a source placed on one page
struct KaraokeSlice {
    QString karaokeId;
    int startChar = 0;
    int endChar = 0;

    bool operator==(const KaraokeSlice &o) const
    {
        return karaokeId == o.karaokeId && startChar == o.startChar && endChar == o.endChar;
    }
};

// Reads data-karaoke (URI-encoded or raw JSON), falling back to
// data-audio-url / data-timings with the element's text.
std::optional<KaraokePayload> parsePayload(const Content::HtmlNode &node);
std::optional<KaraokePayload> payloadFromJson(const QJsonObject &obj);

QList<WordTiming> wordTimingsFromJson(const QJsonArray &array);
QJsonObject wordTimingToJson(const WordTiming &timing);

// Right single quotes to apostrophes, soft hyphens removed
QString normalizeText(const QString &text);

// NFKD, combining marks stripped, lower-cased, only [a-z0-9'] kept
QString normalizeWord(const QString &word);

struct Token {
    int start = 0;
    int end = 0;
    QString normalized;
};
QList<Token> tokenize(const QString &text);

KaraokeSource buildSource(const QString &id, const KaraokePayload &payload);

QJsonObject sourceToJson(const KaraokeSource &source);
QJsonObject sliceToJson(const KaraokeSlice &slice);

} // namespace Karaoke

#endif // PAGEWRIGHT_KARAOKESOURCE_H
