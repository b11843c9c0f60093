/*
 * timingimport.cpp — Word timing files and their alignment to text
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "timingimport.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>

namespace Karaoke {

namespace {

constexpr int kLookAhead = 3;
constexpr double kDefaultWordDuration = 0.5;

// Lower-cased letters, digits and underscores only
QString alignmentKey(const QString &word)
{
    QString key;
    key.reserve(word.size());
    for (const QChar c : word) {
        if (c.isLetterOrNumber() || c == QLatin1Char('_'))
            key.append(c.toLower());
    }
    return key;
}

std::optional<QJsonArray> recognitionWords(const QJsonObject &response)
{
    const QJsonArray channels = response.value(QLatin1String("results")).toObject()
                                    .value(QLatin1String("channels")).toArray();
    if (channels.isEmpty())
        return std::nullopt;
    const QJsonArray alternatives =
        channels.first().toObject().value(QLatin1String("alternatives")).toArray();
    if (alternatives.isEmpty())
        return std::nullopt;
    const QJsonValue words = alternatives.first().toObject().value(QLatin1String("words"));
    if (!words.isArray())
        return std::nullopt;
    return words.toArray();
}

} // namespace

QString timingImportErrorString(TimingImportError error)
{
    switch (error) {
    case TimingImportError::None:
        return QStringLiteral("no error");
    case TimingImportError::UnsupportedFormat:
        return QStringLiteral("unsupported timing format");
    case TimingImportError::Empty:
        return QStringLiteral("no words in timing file");
    }
    return {};
}

std::optional<QList<WordTiming>> importTimings(const QByteArray &bytes, TimingImportError *error)
{
    auto fail = [error](TimingImportError reason) {
        if (error)
            *error = reason;
        return std::nullopt;
    };
    if (error)
        *error = TimingImportError::None;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "TimingImport:" << parseError.errorString();
        return fail(TimingImportError::UnsupportedFormat);
    }

    QJsonArray words;
    if (doc.isArray()) {
        words = doc.array();
    } else if (doc.isObject()) {
        const QJsonObject obj = doc.object();
        if (obj.value(QLatin1String("wordTimings")).isArray()) {
            words = obj.value(QLatin1String("wordTimings")).toArray();
        } else if (const std::optional<QJsonArray> recognized = recognitionWords(obj)) {
            words = *recognized;
        } else {
            return fail(TimingImportError::UnsupportedFormat);
        }
    } else {
        return fail(TimingImportError::UnsupportedFormat);
    }

    for (const QJsonValue &value : std::as_const(words)) {
        if (!value.isObject() || !value.toObject().contains(QLatin1String("start")))
            return fail(TimingImportError::UnsupportedFormat);
    }

    QList<WordTiming> timings = wordTimingsFromJson(words);
    for (WordTiming &timing : timings) {
        if (timing.end < timing.start)
            timing.end = timing.start;
    }
    if (timings.isEmpty())
        return fail(TimingImportError::Empty);
    return timings;
}

QList<WordTiming> alignTimingsToText(const QList<WordTiming> &recognized, const QString &text)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    const QStringList textWords = text.split(whitespace, Qt::SkipEmptyParts);

    double averageDuration = kDefaultWordDuration;
    if (!recognized.isEmpty()) {
        double sum = 0;
        for (const WordTiming &w : recognized)
            sum += w.end - w.start;
        averageDuration = sum / recognized.size();
    }

    QList<WordTiming> aligned;
    aligned.reserve(textWords.size());
    int cursor = 0;
    int interpolated = 0;

    for (int i = 0; i < textWords.size(); ++i) {
        const QString &textWord = textWords.at(i);
        const QString key = alignmentKey(textWord);

        int match = -1;
        const int limit = qMin(cursor + kLookAhead, int(recognized.size()));
        for (int j = cursor; j < limit && !key.isEmpty(); ++j) {
            const QString candidate = alignmentKey(recognized.at(j).word);
            if (candidate.isEmpty())
                continue;
            if (candidate == key || candidate.contains(key) || key.contains(candidate)) {
                match = j;
                break;
            }
        }

        WordTiming timing;
        timing.word = textWord;
        if (match >= 0) {
            timing.start = recognized.at(match).start;
            timing.end = recognized.at(match).end;
            cursor = match + 1;
        } else {
            ++interpolated;
            if (!aligned.isEmpty()) {
                timing.start = aligned.last().end;
                timing.end = timing.start + averageDuration;
            } else if (!recognized.isEmpty()) {
                timing.start = recognized.first().start;
                timing.end = timing.start + kDefaultWordDuration;
            } else {
                timing.start = i * kDefaultWordDuration;
                timing.end = timing.start + kDefaultWordDuration;
            }
        }
        aligned.append(timing);
    }

    if (interpolated > 0)
        qDebug() << "TimingImport: interpolated" << interpolated << "of" << textWords.size()
                 << "words";
    return aligned;
}

} // namespace Karaoke
