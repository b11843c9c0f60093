/*
 * karaokesource.cpp — Audio-synchronised text sources and their slices
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "karaokesource.h"

#include <QDebug>
#include <QJsonDocument>
#include <QJsonValue>
#include <QRegularExpression>
#include <QUrl>

namespace Karaoke {

namespace {

constexpr QChar kRightSingleQuote(0x2019);
constexpr QChar kSoftHyphen(0x00AD);

std::optional<QJsonObject> parseJsonObject(const QString &text)
{
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject())
        return std::nullopt;
    return doc.object();
}

} // namespace

QList<WordTiming> wordTimingsFromJson(const QJsonArray &array)
{
    QList<WordTiming> timings;
    timings.reserve(array.size());
    for (const QJsonValue &value : array) {
        if (!value.isObject())
            continue;
        const QJsonObject obj = value.toObject();
        WordTiming t;
        t.word = obj.value(QLatin1String("word")).toString();
        if (t.word.isEmpty())
            t.word = obj.value(QLatin1String("punctuated_word")).toString();
        t.start = obj.value(QLatin1String("start")).toDouble();
        t.end = obj.value(QLatin1String("end")).toDouble();
        if (obj.contains(QLatin1String("confidence")))
            t.confidence = obj.value(QLatin1String("confidence")).toDouble();
        timings.append(t);
    }
    return timings;
}

QJsonObject wordTimingToJson(const WordTiming &timing)
{
    QJsonObject obj;
    obj.insert(QLatin1String("word"), timing.word);
    obj.insert(QLatin1String("start"), timing.start);
    obj.insert(QLatin1String("end"), timing.end);
    if (timing.confidence)
        obj.insert(QLatin1String("confidence"), *timing.confidence);
    return obj;
}

std::optional<KaraokePayload> payloadFromJson(const QJsonObject &obj)
{
    const QString type = obj.value(QLatin1String("type")).toString();
    if (!type.isEmpty() && type != QLatin1String("karaoke"))
        return std::nullopt;

    KaraokePayload payload;
    payload.text = obj.value(QLatin1String("text")).toString();
    payload.audioUrl = obj.value(QLatin1String("audioUrl")).toString();
    payload.wordTimings = wordTimingsFromJson(obj.value(QLatin1String("wordTimings")).toArray());
    return payload;
}

std::optional<KaraokePayload> parsePayload(const Content::HtmlNode &node)
{
    const QString raw = node.attribute(QStringLiteral("data-karaoke"));
    if (!raw.isEmpty()) {
        const QString decoded = QUrl::fromPercentEncoding(raw.toUtf8());
        std::optional<QJsonObject> obj = parseJsonObject(decoded);
        if (!obj)
            obj = parseJsonObject(raw);
        if (!obj) {
            qWarning() << "KaraokeSource: unparsable data-karaoke payload";
            return std::nullopt;
        }
        std::optional<KaraokePayload> payload = payloadFromJson(*obj);
        if (payload && payload->text.isEmpty())
            payload->text = node.textContent();
        return payload;
    }

    const QString timingsAttr = node.attribute(QStringLiteral("data-timings"));
    if (timingsAttr.isEmpty())
        return std::nullopt;

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(
        QUrl::fromPercentEncoding(timingsAttr.toUtf8()).toUtf8(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isArray()) {
        qWarning() << "KaraokeSource: unparsable data-timings attribute";
        return std::nullopt;
    }

    KaraokePayload payload;
    payload.text = node.textContent();
    payload.audioUrl = node.attribute(QStringLiteral("data-audio-url"));
    payload.wordTimings = wordTimingsFromJson(doc.array());
    return payload;
}

QString normalizeText(const QString &text)
{
    QString out = text;
    out.replace(kRightSingleQuote, QLatin1Char('\''));
    out.remove(kSoftHyphen);
    return out;
}

QString normalizeWord(const QString &word)
{
    if (word.isEmpty())
        return {};

    const QString decomposed = word.normalized(QString::NormalizationForm_KD);
    QString out;
    out.reserve(decomposed.size());
    for (QChar c : decomposed) {
        if (c == kRightSingleQuote)
            c = QLatin1Char('\'');
        if (c.unicode() >= 0x0300 && c.unicode() <= 0x036F)
            continue;
        c = c.toLower();
        if ((c >= QLatin1Char('a') && c <= QLatin1Char('z'))
            || (c >= QLatin1Char('0') && c <= QLatin1Char('9'))
            || c == QLatin1Char('\''))
            out.append(c);
    }
    return out;
}

QList<Token> tokenize(const QString &text)
{
    static const QRegularExpression tokenRx(QStringLiteral(
        "[a-zA-Z0-9\\x{00C0}-\\x{017F}\\x{0400}-\\x{04FF}\\x{3040}-\\x{309F}"
        "\\x{30A0}-\\x{30FF}\\x{4E00}-\\x{9FFF}'\\x{2019}]+"));

    QList<Token> tokens;
    auto it = tokenRx.globalMatch(text);
    while (it.hasNext()) {
        const auto match = it.next();
        Token token;
        token.start = int(match.capturedStart());
        token.end = int(match.capturedEnd());
        token.normalized = normalizeWord(match.captured());
        tokens.append(token);
    }
    return tokens;
}

KaraokeSource buildSource(const QString &id, const KaraokePayload &payload)
{
    KaraokeSource source;
    source.id = id;
    source.text = normalizeText(payload.text);
    source.audioUrl = payload.audioUrl;
    source.letterTimings = QList<std::optional<LetterTiming>>(source.text.size());

    const QList<Token> tokens = tokenize(source.text);
    int pointer = 0;
    int unmatched = 0;

    for (const WordTiming &timing : payload.wordTimings) {
        const QString wanted = normalizeWord(timing.word);
        if (wanted.isEmpty()) {
            source.wordCharRanges.append(std::nullopt);
            continue;
        }

        // Search forward without consuming the tokens on a miss, so one
        // unrecognised word does not unmatch the rest of the list.
        int found = -1;
        for (int i = pointer; i < tokens.size(); ++i) {
            if (!tokens.at(i).normalized.isEmpty() && tokens.at(i).normalized == wanted) {
                found = i;
                break;
            }
        }
        if (found < 0) {
            source.wordCharRanges.append(std::nullopt);
            ++unmatched;
            continue;
        }

        const Token &token = tokens.at(found);
        const double duration = qMax(timing.end - timing.start, 0.001);
        const int span = qMax(1, token.end - token.start);
        for (int idx = token.start; idx < token.end; ++idx) {
            const int position = idx - token.start;
            LetterTiming lt;
            lt.start = timing.start + duration * position / span;
            lt.end = timing.start + duration * (position + 1) / span;
            source.letterTimings[idx] = lt;
        }

        WordCharRange range;
        range.word = timing.word;
        range.start = timing.start;
        range.end = timing.end;
        range.charStart = token.start;
        range.charEnd = token.end;
        range.wordIndex = int(source.wordCharRanges.size());
        source.wordCharRanges.append(range);

        pointer = found + 1;
    }

    if (unmatched > 0)
        qDebug() << "KaraokeSource:" << id << "left" << unmatched << "timing words unmatched";

    return source;
}

QJsonObject sliceToJson(const KaraokeSlice &slice)
{
    QJsonObject obj;
    obj.insert(QLatin1String("karaokeId"), slice.karaokeId);
    obj.insert(QLatin1String("startChar"), slice.startChar);
    obj.insert(QLatin1String("endChar"), slice.endChar);
    return obj;
}

QJsonObject sourceToJson(const KaraokeSource &source)
{
    QJsonArray letters;
    for (const auto &lt : source.letterTimings) {
        if (!lt) {
            letters.append(QJsonValue(QJsonValue::Null));
            continue;
        }
        QJsonObject obj;
        obj.insert(QLatin1String("start"), lt->start);
        obj.insert(QLatin1String("end"), lt->end);
        letters.append(obj);
    }

    QJsonArray words;
    for (const auto &range : source.wordCharRanges) {
        if (!range) {
            words.append(QJsonValue(QJsonValue::Null));
            continue;
        }
        QJsonObject obj;
        obj.insert(QLatin1String("word"), range->word);
        obj.insert(QLatin1String("start"), range->start);
        obj.insert(QLatin1String("end"), range->end);
        obj.insert(QLatin1String("charStart"), range->charStart);
        obj.insert(QLatin1String("charEnd"), range->charEnd);
        obj.insert(QLatin1String("wordIndex"), range->wordIndex);
        words.append(obj);
    }

    QJsonObject obj;
    obj.insert(QLatin1String("id"), source.id);
    obj.insert(QLatin1String("text"), source.text);
    obj.insert(QLatin1String("audioUrl"), source.audioUrl);
    obj.insert(QLatin1String("letterTimings"), letters);
    obj.insert(QLatin1String("wordCharRanges"), words);
    return obj;
}

} // namespace Karaoke
