/*
 * chapterstore.h — Chapter records from JSON, ordering and flattening
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_CHAPTERSTORE_H
#define PAGEWRIGHT_CHAPTERSTORE_H

#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QString>

#include <optional>

#include "contentmodel.h"

namespace Content {

class ChapterStore
{
public:
    // Accepts a JSON array of chapters or an object with a "chapters" array.
    static std::optional<QList<ChapterRecord>> fromJson(const QByteArray &json);
    static std::optional<QList<ChapterRecord>> loadFile(const QString &path);

    static ChapterRecord chapterFromJson(const QJsonObject &obj);
    static std::optional<Epigraph> epigraphFromJson(const QJsonValue &value);

    // First page, then cover, then ascending order (stable)
    static QList<ChapterRecord> sortChapters(QList<ChapterRecord> chapters);

    // -2 for the first page, -1 for the cover, else order (or position)
    static int determineChapterIndex(const ChapterRecord &chapter, int position);

    static QList<ContentBlock> buildContentBlocks(const ChapterRecord &chapter);

    static bool hasContent(const QString &html);
};

} // namespace Content

#endif // PAGEWRIGHT_CHAPTERSTORE_H
