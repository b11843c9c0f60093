/*
 * layoutengine.h — HTML fragment → block flow heights
 *
 * Lays out parsed HTML fragments as a vertical block flow: resolves a
 * small built-in stylesheet plus inline style attributes, collapses
 * vertical margins, breaks inline content into lines through a
 * TextMetrics back-end, and sizes replaced elements.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_LAYOUTENGINE_H
#define PAGEWRIGHT_LAYOUTENGINE_H

#include <QList>
#include <QString>

#include <optional>
#include <vector>

#include "htmlfragment.h"
#include "measurementoracle.h"
#include "textmetrics.h"

namespace Layout {

class ImageSizeCache;

// --- Computed style ---

struct BoxStyle {
    enum Display { Block, Inline, Replaced, None };

    Display display = Inline;
    QString fontFamily;
    qreal fontSize = 16;
    int fontWeight = 400;
    bool italic = false;
    qreal lineHeight = 1.2;     // multiplier of fontSize
    bool preWrap = false;

    qreal marginTop = 0;
    qreal marginBottom = 0;
    qreal marginLeft = 0;
    qreal marginRight = 0;
    qreal paddingTop = 0;
    qreal paddingBottom = 0;
    qreal paddingLeft = 0;
    qreal paddingRight = 0;
    qreal borderTop = 0;
    qreal borderBottom = 0;
    qreal minHeight = 0;
    std::optional<qreal> height;
};

// Parses a CSS length ("12px", "1.3rem", "0.8em", "50%", "0") in px.
// Percentages resolve against percentBase.
std::optional<qreal> parseLength(const QString &value, qreal fontSize, qreal rootFontSize,
                                 qreal percentBase = 0);

class Engine {
public:
    explicit Engine(TextMetrics *metrics, const ImageSizeCache *images = nullptr);

    qreal measure(const std::vector<Content::HtmlNode> &nodes, qreal width,
                  const StyleContext &ctx);

    // Height of replaced elements whose size is unknown, as a fraction of width
    void setDefaultMediaAspect(qreal aspect) { m_defaultMediaAspect = aspect; }

private:
    struct Box {
        qreal height = 0;
        qreal marginTop = 0;
        qreal marginBottom = 0;
        bool collapsesThrough = false;
    };

    struct Flow {
        qreal height = 0;
        qreal marginTop = 0;    // escaping through the container top
        qreal marginBottom = 0; // escaping through the container bottom
        bool empty = true;
    };

    // Inline text collected for one anonymous line box
    struct InlineText {
        QString text;
        QList<TextRunStyle> runs;
        QList<qreal> lineHeights;   // px, parallel to runs
        bool lastWasSpace = true;   // collapse state for white-space: normal
        bool hasContent = false;
    };

    BoxStyle rootStyle(const StyleContext &ctx) const;
    BoxStyle computeStyle(const Content::HtmlNode &node, const BoxStyle &parent,
                          const Content::HtmlNode *parentNode) const;
    void applyInlineStyle(const QString &css, BoxStyle &style, qreal parentFontSize) const;

    Flow layoutFlow(const std::vector<Content::HtmlNode> &children,
                    const BoxStyle &parentStyle, const Content::HtmlNode *parentNode,
                    qreal width, bool paddedTop, bool paddedBottom);
    Box layoutBlock(const Content::HtmlNode &node, const BoxStyle &style, qreal width);
    Box layoutReplaced(const Content::HtmlNode &node, const BoxStyle &style, qreal width);
    qreal layoutInline(const InlineText &inlineText, const BoxStyle &blockStyle, qreal width);

    void collectInline(const Content::HtmlNode &node, const BoxStyle &style,
                       InlineText &out) const;
    void appendText(const QString &text, const BoxStyle &style, InlineText &out) const;

    TextMetrics *m_metrics;
    const ImageSizeCache *m_images;
    qreal m_rootFontSize = 16;
    qreal m_defaultMediaAspect = 0.5625;
};

} // namespace Layout

#endif // PAGEWRIGHT_LAYOUTENGINE_H
