/*
 * contentmodel.h — Book content types (header-only, std::variant)
 *
 * Chapter records as they arrive from the chapter store, the content
 * blocks a chapter flattens into, and the top-level elements the
 * paginator walks over.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_CONTENTMODEL_H
#define PAGEWRIGHT_CONTENTMODEL_H

#include <QList>
#include <QString>

#include <optional>
#include <variant>

#include "htmlfragment.h"

namespace Content {

// --- Chapter input ---

struct Epigraph {
    QString text;
    QString author;
    QString align = QStringLiteral("center");
};

struct ChapterRecord {
    QString id;
    QString title;
    QString contentHtml;
    std::optional<Epigraph> epigraph;
    QString backgroundImageUrl;
    int order = -1;             // -1 = unset
    bool isCover = false;
    bool isFirstPage = false;
    QList<ChapterRecord> children;

    bool isSpecial() const { return isCover || isFirstPage; }
};

struct ContentBlock {
    enum Kind { Chapter, Subchapter };

    Kind kind = Chapter;
    QString title;
    QString html;
    std::optional<Epigraph> epigraph;
    QString chapterId;
    QString subchapterId;       // empty for Chapter blocks
    bool includeChapterTitle = false;
};

struct Footnote {
    int globalNumber = 0;
    QString content;
};

// --- Top-level elements ---

struct Heading {
    int level = 1;
    HtmlNode node;
};

struct Image {
    HtmlNode node;
};

struct Video {
    QString src;
    QString mode;               // "blank-page", "background" or "inline"
    int targetPage = 0;         // 1-based, background videos only
    HtmlNode node;
};

struct Poetry {
    HtmlNode node;
};

struct Dinkus {
    HtmlNode node;
};

struct KaraokeBlock {
    HtmlNode node;
};

struct Paragraph {
    HtmlNode node;
};

using Element = std::variant<Heading, Image, Video, Poetry, Dinkus, KaraokeBlock, Paragraph>;

inline const HtmlNode &elementNode(const Element &element)
{
    return std::visit([](const auto &e) -> const HtmlNode & { return e.node; }, element);
}

inline QString elementHtml(const Element &element)
{
    return elementNode(element).outerHtml();
}

inline bool isSplittable(const Element &element)
{
    return std::holds_alternative<Paragraph>(element);
}

} // namespace Content

#endif // PAGEWRIGHT_CONTENTMODEL_H
