/*
 * chapterstore.cpp — Chapter records from JSON, ordering and flattening
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "chapterstore.h"

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include <algorithm>
#include <climits>

namespace Content {

namespace {

QString firstString(const QJsonObject &obj, std::initializer_list<const char *> keys)
{
    for (const char *key : keys) {
        const QJsonValue v = obj.value(QLatin1String(key));
        if (v.isString())
            return v.toString();
    }
    return {};
}

bool firstBool(const QJsonObject &obj, std::initializer_list<const char *> keys)
{
    for (const char *key : keys) {
        const QJsonValue v = obj.value(QLatin1String(key));
        if (v.isBool())
            return v.toBool();
    }
    return false;
}

} // anonymous namespace

std::optional<Epigraph> ChapterStore::epigraphFromJson(const QJsonValue &value)
{
    Epigraph epigraph;
    if (value.isString()) {
        epigraph.text = value.toString();
    } else if (value.isObject()) {
        const QJsonObject obj = value.toObject();
        epigraph.text = obj.value(QLatin1String("text")).toString();
        epigraph.author = obj.value(QLatin1String("author")).toString();
        const QString align = obj.value(QLatin1String("align")).toString();
        if (!align.isEmpty())
            epigraph.align = align;
    }
    if (epigraph.text.trimmed().isEmpty())
        return std::nullopt;
    return epigraph;
}

ChapterRecord ChapterStore::chapterFromJson(const QJsonObject &obj)
{
    ChapterRecord chapter;
    const QJsonValue id = obj.value(QLatin1String("id"));
    chapter.id = id.isDouble() ? QString::number(id.toInteger()) : id.toString();
    chapter.title = obj.value(QLatin1String("title")).toString();
    chapter.contentHtml = firstString(obj, {"contentHtml", "content"});
    chapter.epigraph = epigraphFromJson(obj.value(QLatin1String("epigraph")));
    chapter.backgroundImageUrl = firstString(obj, {"backgroundImageUrl", "backgroundImage"});
    chapter.order = obj.value(QLatin1String("order")).toInt(-1);
    chapter.isCover = firstBool(obj, {"isCover", "is_cover"});
    chapter.isFirstPage = firstBool(obj, {"isFirstPage", "is_first_page"});

    QJsonArray children = obj.value(QLatin1String("children")).toArray();
    if (children.isEmpty())
        children = obj.value(QLatin1String("subchapters")).toArray();
    for (const QJsonValue &child : std::as_const(children)) {
        if (child.isObject())
            chapter.children.append(chapterFromJson(child.toObject()));
    }
    return chapter;
}

std::optional<QList<ChapterRecord>> ChapterStore::fromJson(const QByteArray &json)
{
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &error);
    if (error.error != QJsonParseError::NoError) {
        qWarning() << "ChapterStore: invalid JSON:" << error.errorString();
        return std::nullopt;
    }

    QJsonArray array;
    if (doc.isArray())
        array = doc.array();
    else if (doc.isObject() && doc.object().value(QLatin1String("chapters")).isArray())
        array = doc.object().value(QLatin1String("chapters")).toArray();
    else {
        qWarning() << "ChapterStore: expected an array of chapters";
        return std::nullopt;
    }

    QList<ChapterRecord> chapters;
    for (const QJsonValue &value : std::as_const(array)) {
        if (value.isObject())
            chapters.append(chapterFromJson(value.toObject()));
    }
    return chapters;
}

std::optional<QList<ChapterRecord>> ChapterStore::loadFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "ChapterStore: Cannot open" << path;
        return std::nullopt;
    }
    return fromJson(file.readAll());
}

QList<ChapterRecord> ChapterStore::sortChapters(QList<ChapterRecord> chapters)
{
    auto rank = [](const ChapterRecord &c) {
        if (c.isFirstPage)
            return 0;
        if (c.isCover)
            return 1;
        return 2;
    };
    std::stable_sort(chapters.begin(), chapters.end(),
                     [&](const ChapterRecord &a, const ChapterRecord &b) {
        const int ra = rank(a);
        const int rb = rank(b);
        if (ra != rb)
            return ra < rb;
        if (ra < 2)
            return false;
        // Unset order sorts after every ordered chapter
        const int oa = a.order < 0 ? INT_MAX : a.order;
        const int ob = b.order < 0 ? INT_MAX : b.order;
        return oa < ob;
    });
    return chapters;
}

int ChapterStore::determineChapterIndex(const ChapterRecord &chapter, int position)
{
    if (chapter.isFirstPage)
        return -2;
    if (chapter.isCover)
        return -1;
    return chapter.order >= 0 ? chapter.order : position;
}

bool ChapterStore::hasContent(const QString &html)
{
    return !html.trimmed().isEmpty();
}

QList<ContentBlock> ChapterStore::buildContentBlocks(const ChapterRecord &chapter)
{
    QList<ContentBlock> blocks;
    const bool chapterHasContent = hasContent(chapter.contentHtml);

    if (chapterHasContent) {
        ContentBlock block;
        block.kind = ContentBlock::Chapter;
        block.title = chapter.title;
        block.html = chapter.contentHtml;
        block.epigraph = chapter.epigraph;
        block.chapterId = chapter.id;
        blocks.append(block);
    }

    bool firstSubchapter = true;
    for (const ChapterRecord &child : chapter.children) {
        if (!hasContent(child.contentHtml))
            continue;
        ContentBlock block;
        block.kind = ContentBlock::Subchapter;
        block.title = child.title;
        block.html = child.contentHtml;
        block.epigraph = child.epigraph;
        block.chapterId = chapter.id;
        block.subchapterId = child.id;
        block.includeChapterTitle = !chapterHasContent && firstSubchapter;
        blocks.append(block);
        firstSubchapter = false;
    }
    return blocks;
}

} // namespace Content
