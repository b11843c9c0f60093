/*
 * elementparser.h — Classify block HTML into paginator elements
 *
 * Prepares a content block for pagination: pulls blank-page and
 * background videos out of the flow, normalises long dashes, and turns
 * each top-level node into an Element.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_ELEMENTPARSER_H
#define PAGEWRIGHT_ELEMENTPARSER_H

#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>

#include "contentmodel.h"

namespace Content {

struct PreparedBlock {
    std::vector<HtmlNode> nodes;
    QStringList blankPageVideos; // src of each removed blank-page video, in order
};

class ElementParser
{
public:
    // 1-based page number -> video src for
    // <video data-video-mode="background" data-target-page="N">
    static QMap<int, QString> collectBackgroundVideos(const QString &html);

    static PreparedBlock prepareBlock(const QString &html);

    static QList<Element> parseElements(const std::vector<HtmlNode> &nodes);
    static Element classify(const HtmlNode &node);

    static QString replaceLongDashes(const QString &text);
    static QString videoSource(const HtmlNode &video);
    static QString videoMode(const HtmlNode &video);

    static bool isKaraokeNode(const HtmlNode &node);
};

} // namespace Content

#endif // PAGEWRIGHT_ELEMENTPARSER_H
