/*
 * testsupport.h — Shared fixtures for the unit tests
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_TESTSUPPORT_H
#define PAGEWRIGHT_TESTSUPPORT_H

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "audiohandle.h"
#include "contentmodel.h"
#include "htmlfragment.h"
#include "karaokesource.h"
#include "measurementoracle.h"

namespace TestSupport {

// Height proportional to the text content, independent of width and
// markup. Makes slice boundaries exact.
class TextLengthOracle : public Layout::MeasurementOracle
{
public:
    explicit TextLengthOracle(qreal pxPerChar)
        : m_pxPerChar(pxPerChar)
    {
    }

    qreal measureHeight(const QString &html, qreal, const Layout::StyleContext &) override
    {
        ++calls;
        return Html::stripTags(html).size() * m_pxPerChar;
    }

    int calls = 0;

private:
    qreal m_pxPerChar;
};

// Playback position set by the test
class FakeAudioHandle : public Karaoke::AudioHandle
{
public:
    explicit FakeAudioHandle(double duration = 0)
        : m_duration(duration)
    {
    }

    QString source() const override { return QStringLiteral("fake://audio"); }
    void play() override { playing = true; }
    void pause() override { playing = false; }
    bool isPlaying() const override { return playing; }
    double currentTime() const override { return time; }
    void setCurrentTime(double seconds) override { time = seconds; }
    double duration() const override { return m_duration; }

    bool playing = false;
    double time = 0;

private:
    double m_duration;
};

// " w00000000 w00000001 ..." : word k occupies [10k + 1, 10k + 10)
inline QString numberedWords(int count)
{
    QString text;
    for (int k = 0; k < count; ++k)
        text += QLatin1Char(' ') + QStringLiteral("w%1").arg(k, 8, 10, QLatin1Char('0'));
    return text;
}

// Word k plays from k to k + 0.8 seconds
inline QList<Karaoke::WordTiming> numberedTimings(int count)
{
    QList<Karaoke::WordTiming> timings;
    for (int k = 0; k < count; ++k)
        timings.append({QStringLiteral("w%1").arg(k, 8, 10, QLatin1Char('0')), double(k),
                        k + 0.8, std::nullopt});
    return timings;
}

inline QString karaokeObjectHtml(const QString &text, const QList<Karaoke::WordTiming> &timings)
{
    QJsonArray words;
    for (const Karaoke::WordTiming &t : timings)
        words.append(Karaoke::wordTimingToJson(t));
    QJsonObject payload;
    payload.insert(QStringLiteral("type"), QStringLiteral("karaoke"));
    payload.insert(QStringLiteral("text"), text);
    payload.insert(QStringLiteral("audioUrl"), QStringLiteral("audio/reading.mp3"));
    payload.insert(QStringLiteral("wordTimings"), words);
    const QString json = QString::fromUtf8(QJsonDocument(payload).toJson(QJsonDocument::Compact));
    return QStringLiteral("<div class=\"karaoke-object\" data-karaoke=\"")
        + Html::escapeAttribute(json) + QStringLiteral("\"></div>");
}

inline QString repeatedWords(const QString &word, int count)
{
    QStringList words;
    for (int i = 0; i < count; ++i)
        words.append(word);
    return words.join(QLatin1Char(' '));
}

inline Content::ChapterRecord chapter(const QString &id, int order, const QString &html)
{
    Content::ChapterRecord c;
    c.id = id;
    c.title = id;
    c.order = order;
    c.contentHtml = html;
    return c;
}

} // namespace TestSupport

#endif // PAGEWRIGHT_TESTSUPPORT_H
