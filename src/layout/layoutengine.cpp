/*
 * layoutengine.cpp — HTML fragment → block flow heights
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "layoutengine.h"
#include "imagesizecache.h"

#include <QDebug>
#include <QSet>

#include <array>

using Content::HtmlNode;

namespace Layout {

namespace {

constexpr QChar kSoftHyphen(0x00AD);
constexpr QChar kNbsp(0x00A0);

const QString &paragraphFontFamily()
{
    static const QString family = StyleContext().fontFamily;
    return family;
}

// Adjoining vertical margins: largest positive plus most negative
qreal collapse(qreal a, qreal b)
{
    if (a >= 0 && b >= 0)
        return qMax(a, b);
    if (a <= 0 && b <= 0)
        return qMin(a, b);
    return a + b;
}

bool isCollapsibleSpace(QChar c)
{
    return c != kNbsp && c.isSpace();
}

bool isBlockTag(const QString &tag)
{
    static const QSet<QString> blocks = {
        QStringLiteral("div"), QStringLiteral("section"), QStringLiteral("article"),
        QStringLiteral("header"), QStringLiteral("footer"), QStringLiteral("main"),
        QStringLiteral("aside"), QStringLiteral("nav"), QStringLiteral("figure"),
        QStringLiteral("figcaption"), QStringLiteral("blockquote"), QStringLiteral("ul"),
        QStringLiteral("ol"), QStringLiteral("li"), QStringLiteral("pre"),
        QStringLiteral("table"), QStringLiteral("tr"), QStringLiteral("address"),
        QStringLiteral("dl"), QStringLiteral("dt"), QStringLiteral("dd"),
        QStringLiteral("center"), QStringLiteral("form"), QStringLiteral("fieldset"),
    };
    return blocks.contains(tag);
}

bool isReplacedTag(const QString &tag)
{
    return tag == QLatin1String("img") || tag == QLatin1String("video")
        || tag == QLatin1String("iframe") || tag == QLatin1String("svg")
        || tag == QLatin1String("canvas") || tag == QLatin1String("audio");
}

bool isEmptyParagraph(const HtmlNode &p)
{
    if (!p.textContent().trimmed().isEmpty())
        return false;
    int elements = 0;
    bool onlyBr = true;
    for (const auto &child : p.children) {
        if (!child.isElement())
            continue;
        ++elements;
        if (child.tag != QLatin1String("br"))
            onlyBr = false;
    }
    return elements == 0 || (elements == 1 && onlyBr);
}

// Splits a CSS shorthand value into its 1-4 components (top, right, bottom, left)
std::array<QString, 4> expandBox(const QString &value)
{
    const QStringList parts = value.simplified().split(QLatin1Char(' '), Qt::SkipEmptyParts);
    std::array<QString, 4> out;
    switch (parts.size()) {
    case 0:
        break;
    case 1:
        out = {parts[0], parts[0], parts[0], parts[0]};
        break;
    case 2:
        out = {parts[0], parts[1], parts[0], parts[1]};
        break;
    case 3:
        out = {parts[0], parts[1], parts[2], parts[1]};
        break;
    default:
        out = {parts[0], parts[1], parts[2], parts[3]};
        break;
    }
    return out;
}

} // anonymous namespace

std::optional<qreal> parseLength(const QString &value, qreal fontSize, qreal rootFontSize,
                                 qreal percentBase)
{
    const QString v = value.trimmed().toLower();
    if (v.isEmpty() || v == QLatin1String("auto") || v == QLatin1String("none"))
        return std::nullopt;

    auto number = [](const QString &s) -> std::optional<qreal> {
        bool ok = false;
        const qreal n = s.toDouble(&ok);
        if (!ok)
            return std::nullopt;
        return n;
    };

    if (v.endsWith(QLatin1String("rem"))) {
        if (auto n = number(v.chopped(3)))
            return *n * rootFontSize;
    } else if (v.endsWith(QLatin1String("em"))) {
        if (auto n = number(v.chopped(2)))
            return *n * fontSize;
    } else if (v.endsWith(QLatin1String("px"))) {
        return number(v.chopped(2));
    } else if (v.endsWith(QLatin1String("pt"))) {
        if (auto n = number(v.chopped(2)))
            return *n * 4.0 / 3.0;
    } else if (v.endsWith(QLatin1Char('%'))) {
        if (auto n = number(v.chopped(1)))
            return *n * percentBase / 100.0;
    } else {
        return number(v);
    }
    return std::nullopt;
}

Engine::Engine(TextMetrics *metrics, const ImageSizeCache *images)
    : m_metrics(metrics)
    , m_images(images)
{
}

// --- Style resolution ---

BoxStyle Engine::rootStyle(const StyleContext &ctx) const
{
    BoxStyle style;
    style.display = BoxStyle::Block;
    style.fontFamily = ctx.fontFamily;
    style.fontSize = ctx.fontSize;
    style.lineHeight = ctx.lineHeight;
    style.paddingTop = ctx.paddingTop;
    style.paddingBottom = ctx.paddingBottom;
    style.paddingLeft = ctx.paddingLeft;
    style.paddingRight = ctx.paddingRight;
    return style;
}

BoxStyle Engine::computeStyle(const HtmlNode &node, const BoxStyle &parent,
                              const HtmlNode *parentNode) const
{
    BoxStyle s;
    s.fontFamily = parent.fontFamily;
    s.fontSize = parent.fontSize;
    s.fontWeight = parent.fontWeight;
    s.italic = parent.italic;
    s.lineHeight = parent.lineHeight;
    s.preWrap = parent.preWrap;

    const QString &tag = node.tag;
    const qreal rem = m_rootFontSize;

    if (tag == QLatin1String("script") || tag == QLatin1String("style")
        || tag == QLatin1String("template") || tag == QLatin1String("head")
        || node.hasAttribute(QStringLiteral("hidden"))) {
        s.display = BoxStyle::None;
        return s;
    }

    if (isReplacedTag(tag))
        s.display = BoxStyle::Replaced;
    else if (isBlockTag(tag))
        s.display = BoxStyle::Block;

    if (tag == QLatin1String("p")) {
        s.display = BoxStyle::Block;
        s.fontFamily = paragraphFontFamily();
        s.fontSize = 1.3 * rem;
        s.lineHeight = 1.35;
        s.marginTop = s.marginBottom = 0.35 * rem;
        if (parentNode && parentNode->hasClass(QStringLiteral("poetry"))) {
            s.marginTop = s.marginBottom = 0.3 * s.fontSize;
            s.lineHeight = 1.6;
        }
        if (isEmptyParagraph(node))
            s.minHeight = 0.7 * rem;
    } else if (tag.size() == 2 && tag.at(0) == QLatin1Char('h')
               && tag.at(1) >= QLatin1Char('1') && tag.at(1) <= QLatin1Char('6')) {
        static const qreal sizes[] = {2.0, 1.5, 1.17, 1.0, 0.83, 0.67};
        static const qreal margins[] = {0.67, 0.83, 1.0, 1.33, 1.67, 2.33};
        const int level = tag.at(1).digitValue();
        s.display = BoxStyle::Block;
        s.fontSize = sizes[level - 1] * rem;
        s.fontWeight = 700;
        s.lineHeight = 1.2;
        s.marginTop = s.marginBottom = margins[level - 1] * s.fontSize;
    } else if (tag == QLatin1String("blockquote") || tag == QLatin1String("figure")) {
        s.marginTop = s.marginBottom = s.fontSize;
        s.marginLeft = s.marginRight = 40;
    } else if (tag == QLatin1String("ul") || tag == QLatin1String("ol")) {
        s.marginTop = s.marginBottom = s.fontSize;
        s.paddingLeft = 40;
    } else if (tag == QLatin1String("pre")) {
        s.preWrap = true;
        s.fontFamily = QStringLiteral("monospace");
        s.marginTop = s.marginBottom = s.fontSize;
    } else if (tag == QLatin1String("hr")) {
        s.display = BoxStyle::Block;
        s.borderTop = s.borderBottom = 1;
        s.marginTop = s.marginBottom = 0.5 * s.fontSize;
    } else if (tag == QLatin1String("em") || tag == QLatin1String("i")
               || tag == QLatin1String("cite") || tag == QLatin1String("var")) {
        s.italic = true;
    } else if (tag == QLatin1String("strong") || tag == QLatin1String("b")) {
        s.fontWeight = 700;
    } else if (tag == QLatin1String("sup") || tag == QLatin1String("sub")) {
        s.fontSize = 0.75 * parent.fontSize;
    } else if (tag == QLatin1String("small")) {
        s.fontSize = 0.83 * parent.fontSize;
    } else if (tag == QLatin1String("code") || tag == QLatin1String("kbd")
               || tag == QLatin1String("samp")) {
        s.fontFamily = QStringLiteral("monospace");
    }

    // Class rules
    if (node.hasClass(QStringLiteral("poetry"))) {
        s.display = BoxStyle::Block;
        s.marginTop = s.marginBottom = 0.8 * s.fontSize;
        s.paddingLeft = s.paddingRight = s.fontSize;
        s.italic = true;
    }
    if (node.hasClass(QStringLiteral("dinkus"))) {
        s.display = BoxStyle::Block;
        s.fontSize = 1.3 * rem;
        s.lineHeight = 1.35;
        s.marginTop = s.marginBottom = 1.5 * rem;
    }
    if (node.hasClass(QStringLiteral("karaoke-slice"))
        || node.hasClass(QStringLiteral("karaoke-slice-measure"))
        || node.hasClass(QStringLiteral("karaoke-object"))) {
        s.display = BoxStyle::Block;
        s.fontFamily = paragraphFontFamily();
        s.fontSize = 1.3 * rem;
        s.lineHeight = 1.35;
        s.marginTop = 0;
        s.marginBottom = 0.85 * rem;
        if (!node.hasClass(QStringLiteral("karaoke-object")))
            s.preWrap = true;
    }
    if (node.hasClass(QStringLiteral("page-content-main"))) {
        s.display = BoxStyle::Block;
    }
    if (node.hasClass(QStringLiteral("footnotes-section"))) {
        s.display = BoxStyle::Block;
        s.paddingTop = s.paddingBottom = rem;
        s.paddingLeft = s.paddingRight = 1.5 * rem;
    }
    if (node.hasClass(QStringLiteral("footnotes-divider"))) {
        s.display = BoxStyle::Block;
        s.borderTop = 1;
        s.marginBottom = 0.5 * rem;
    }
    if (node.hasClass(QStringLiteral("footnotes-list"))) {
        s.display = BoxStyle::Block;
        s.fontSize = 0.9 * rem;
        s.lineHeight = 1.5;
    }
    if (node.hasClass(QStringLiteral("footnote-item"))) {
        s.display = BoxStyle::Block;
    }

    const QString css = node.attribute(QStringLiteral("style"));
    if (!css.isEmpty())
        applyInlineStyle(css, s, parent.fontSize);

    return s;
}

void Engine::applyInlineStyle(const QString &css, BoxStyle &style, qreal parentFontSize) const
{
    const qreal rem = m_rootFontSize;
    QList<QPair<QString, QString>> decls;
    for (const QString &decl : css.split(QLatin1Char(';'), Qt::SkipEmptyParts)) {
        const int colon = decl.indexOf(QLatin1Char(':'));
        if (colon < 0)
            continue;
        QString value = decl.mid(colon + 1).trimmed();
        value.remove(QStringLiteral("!important"));
        decls.append({decl.left(colon).trimmed().toLower(), value.trimmed()});
    }

    // font-size first: em lengths of the other properties depend on it
    for (const auto &[prop, value] : std::as_const(decls)) {
        if (prop == QLatin1String("font-size")) {
            if (auto px = parseLength(value, parentFontSize, rem, parentFontSize))
                style.fontSize = *px;
        }
    }

    auto len = [&](const QString &v) {
        return parseLength(v, style.fontSize, rem).value_or(0);
    };

    for (const auto &[prop, value] : std::as_const(decls)) {
        const QString v = value.toLower();
        if (prop == QLatin1String("display")) {
            if (v == QLatin1String("none"))
                style.display = BoxStyle::None;
            else if (v == QLatin1String("block") || v == QLatin1String("flex")
                     || v == QLatin1String("list-item") || v == QLatin1String("grid"))
                style.display = style.display == BoxStyle::Replaced ? BoxStyle::Replaced : BoxStyle::Block;
            else if (v.startsWith(QLatin1String("inline")))
                style.display = style.display == BoxStyle::Replaced ? BoxStyle::Replaced : BoxStyle::Inline;
        } else if (prop == QLatin1String("line-height")) {
            bool ok = false;
            const qreal n = v.toDouble(&ok);
            if (ok)
                style.lineHeight = n;
            else if (v == QLatin1String("normal"))
                style.lineHeight = 1.2;
            else if (auto px = parseLength(v, style.fontSize, rem, style.fontSize); px && style.fontSize > 0)
                style.lineHeight = *px / style.fontSize;
        } else if (prop == QLatin1String("font-style")) {
            style.italic = (v == QLatin1String("italic") || v == QLatin1String("oblique"));
        } else if (prop == QLatin1String("font-weight")) {
            bool ok = false;
            const int w = v.toInt(&ok);
            if (ok)
                style.fontWeight = w;
            else if (v == QLatin1String("bold") || v == QLatin1String("bolder"))
                style.fontWeight = 700;
            else if (v == QLatin1String("normal"))
                style.fontWeight = 400;
        } else if (prop == QLatin1String("font-family")) {
            style.fontFamily = value;
        } else if (prop == QLatin1String("white-space")) {
            style.preWrap = v.startsWith(QLatin1String("pre")) || v == QLatin1String("break-spaces");
        } else if (prop == QLatin1String("margin")) {
            const auto box = expandBox(v);
            style.marginTop = len(box[0]);
            style.marginRight = len(box[1]);
            style.marginBottom = len(box[2]);
            style.marginLeft = len(box[3]);
        } else if (prop == QLatin1String("margin-top")) {
            style.marginTop = len(v);
        } else if (prop == QLatin1String("margin-bottom")) {
            style.marginBottom = len(v);
        } else if (prop == QLatin1String("margin-left")) {
            style.marginLeft = len(v);
        } else if (prop == QLatin1String("margin-right")) {
            style.marginRight = len(v);
        } else if (prop == QLatin1String("padding")) {
            const auto box = expandBox(v);
            style.paddingTop = len(box[0]);
            style.paddingRight = len(box[1]);
            style.paddingBottom = len(box[2]);
            style.paddingLeft = len(box[3]);
        } else if (prop == QLatin1String("padding-top")) {
            style.paddingTop = len(v);
        } else if (prop == QLatin1String("padding-bottom")) {
            style.paddingBottom = len(v);
        } else if (prop == QLatin1String("padding-left")) {
            style.paddingLeft = len(v);
        } else if (prop == QLatin1String("padding-right")) {
            style.paddingRight = len(v);
        } else if (prop == QLatin1String("height")) {
            style.height = parseLength(v, style.fontSize, rem);
        } else if (prop == QLatin1String("min-height")) {
            style.minHeight = len(v);
        } else if (prop == QLatin1String("border") || prop == QLatin1String("border-top")
                   || prop == QLatin1String("border-bottom")) {
            qreal width = 0;
            if (!v.contains(QLatin1String("none"))) {
                for (const QString &token : v.split(QLatin1Char(' '), Qt::SkipEmptyParts)) {
                    if (auto px = parseLength(token, style.fontSize, rem)) {
                        width = *px;
                        break;
                    }
                }
            }
            if (prop != QLatin1String("border-bottom"))
                style.borderTop = width;
            if (prop != QLatin1String("border-top"))
                style.borderBottom = width;
        }
    }
}

// --- Block flow ---

qreal Engine::measure(const std::vector<HtmlNode> &nodes, qreal width, const StyleContext &ctx)
{
    m_rootFontSize = ctx.rootFontSize;
    const BoxStyle root = rootStyle(ctx);
    const qreal inner = qMax<qreal>(0, width - ctx.paddingLeft - ctx.paddingRight);
    const Flow flow = layoutFlow(nodes, root, nullptr, inner,
                                 ctx.paddingTop > 0, ctx.paddingBottom > 0);
    // Margins escaping the container do not count towards its height
    return ctx.paddingTop + flow.height + ctx.paddingBottom;
}

Engine::Flow Engine::layoutFlow(const std::vector<HtmlNode> &children,
                                const BoxStyle &parentStyle, const HtmlNode *parentNode,
                                qreal width, bool paddedTop, bool paddedBottom)
{
    Flow flow;
    qreal y = 0;
    qreal pending = 0;
    bool atTop = true;
    InlineText inlineText;

    auto place = [&](const Box &box) {
        if (box.collapsesThrough) {
            pending = collapse(pending, collapse(box.marginTop, box.marginBottom));
            return;
        }
        const qreal margin = collapse(pending, box.marginTop);
        if (atTop && !paddedTop)
            flow.marginTop = margin;
        else
            y += margin;
        atTop = false;
        y += box.height;
        pending = box.marginBottom;
    };

    auto flushInline = [&]() {
        if (inlineText.hasContent) {
            Box lines;
            lines.height = layoutInline(inlineText, parentStyle, width);
            place(lines);
        }
        inlineText = InlineText{};
    };

    for (const HtmlNode &child : children) {
        if (child.isText()) {
            appendText(child.text, parentStyle, inlineText);
            continue;
        }
        const BoxStyle style = computeStyle(child, parentStyle, parentNode);
        switch (style.display) {
        case BoxStyle::None:
            break;
        case BoxStyle::Inline:
            collectInline(child, style, inlineText);
            break;
        case BoxStyle::Block:
            flushInline();
            place(layoutBlock(child, style, width));
            break;
        case BoxStyle::Replaced:
            flushInline();
            place(layoutReplaced(child, style, width));
            break;
        }
    }
    flushInline();

    if (atTop) {
        flow.empty = true;
        if (paddedTop && paddedBottom)
            y += pending;
        else
            flow.marginTop = flow.marginBottom = pending;
    } else {
        flow.empty = false;
        if (paddedBottom)
            y += pending;
        else
            flow.marginBottom = pending;
    }
    flow.height = y;
    return flow;
}

Engine::Box Engine::layoutBlock(const HtmlNode &node, const BoxStyle &style, qreal width)
{
    const qreal inner = qMax<qreal>(0, width - style.marginLeft - style.marginRight
                                           - style.paddingLeft - style.paddingRight);
    const bool paddedTop = style.paddingTop > 0 || style.borderTop > 0;
    const bool paddedBottom = style.paddingBottom > 0 || style.borderBottom > 0
        || style.height.has_value();

    const Flow flow = layoutFlow(node.children, style, &node, inner, paddedTop, paddedBottom);

    qreal content = style.height ? *style.height : flow.height;
    content = qMax(content, style.minHeight);

    Box box;
    box.height = style.borderTop + style.paddingTop + content
        + style.paddingBottom + style.borderBottom;
    box.marginTop = paddedTop ? style.marginTop : collapse(style.marginTop, flow.marginTop);
    box.marginBottom = paddedBottom ? style.marginBottom
                                    : collapse(style.marginBottom, flow.marginBottom);
    box.collapsesThrough = flow.empty && box.height <= 0 && !style.height;
    return box;
}

Engine::Box Engine::layoutReplaced(const HtmlNode &node, const BoxStyle &style, qreal width)
{
    const qreal avail = qMax<qreal>(0, width - style.marginLeft - style.marginRight
                                           - style.paddingLeft - style.paddingRight);
    const auto attrWidth = parseLength(node.attribute(QStringLiteral("width")),
                                       style.fontSize, m_rootFontSize, avail);
    const auto attrHeight = parseLength(node.attribute(QStringLiteral("height")),
                                        style.fontSize, m_rootFontSize);

    std::optional<QSize> intrinsic;
    const QString src = node.attribute(QStringLiteral("src"));
    if (m_images && !src.isEmpty())
        intrinsic = m_images->size(src);

    qreal h = 0;
    if (style.height) {
        h = *style.height;
    } else if (attrWidth && attrHeight && *attrWidth > 0) {
        h = *attrWidth > avail ? *attrHeight * avail / *attrWidth : *attrHeight;
    } else if (intrinsic && intrinsic->width() > 0) {
        const qreal w = qMin(attrWidth.value_or(intrinsic->width()), avail);
        h = attrHeight.value_or(intrinsic->height() * w / intrinsic->width());
    } else if (attrHeight) {
        h = *attrHeight;
    } else {
        const qreal w = qMin(attrWidth.value_or(avail), avail);
        h = w * m_defaultMediaAspect;
    }

    Box box;
    box.height = style.borderTop + style.paddingTop + qMax(h, style.minHeight)
        + style.paddingBottom + style.borderBottom;
    box.marginTop = style.marginTop;
    box.marginBottom = style.marginBottom;
    return box;
}

// --- Inline content ---

void Engine::appendText(const QString &text, const BoxStyle &style, InlineText &out) const
{
    QString chunk;
    chunk.reserve(text.size());
    bool visible = false;
    for (QChar c : text) {
        if (c == kSoftHyphen)
            continue;
        if (style.preWrap) {
            if (c == QLatin1Char('\r'))
                continue;
            if (c == QLatin1Char('\t'))
                c = QLatin1Char(' ');
            chunk.append(c);
            visible = true;
            out.lastWasSpace = (c == QLatin1Char('\n'));
            continue;
        }
        if (isCollapsibleSpace(c)) {
            if (!out.lastWasSpace) {
                chunk.append(QLatin1Char(' '));
                out.lastWasSpace = true;
            }
            continue;
        }
        chunk.append(c);
        visible = true;
        out.lastWasSpace = false;
    }
    if (chunk.isEmpty())
        return;

    TextRunStyle run;
    run.start = out.text.size();
    run.length = chunk.size();
    run.fontFamily = style.fontFamily;
    run.fontWeight = style.fontWeight;
    run.italic = style.italic;
    run.fontSize = style.fontSize;
    out.runs.append(run);
    out.lineHeights.append(style.lineHeight * style.fontSize);
    out.text.append(chunk);
    if (visible)
        out.hasContent = true;
}

void Engine::collectInline(const HtmlNode &node, const BoxStyle &style, InlineText &out) const
{
    if (node.isText()) {
        appendText(node.text, style, out);
        return;
    }
    if (node.tag == QLatin1String("br")) {
        BoxStyle br = style;
        br.preWrap = true;
        appendText(QStringLiteral("\n"), br, out);
        return;
    }
    for (const HtmlNode &child : node.children) {
        if (child.isText()) {
            appendText(child.text, style, out);
            continue;
        }
        const BoxStyle childStyle = computeStyle(child, style, &node);
        if (childStyle.display == BoxStyle::None || childStyle.display == BoxStyle::Replaced)
            continue;
        collectInline(child, childStyle, out);
    }
}

qreal Engine::layoutInline(const InlineText &inlineText, const BoxStyle &blockStyle, qreal width)
{
    const QList<LineMetrics> lines = m_metrics->breakIntoLines(inlineText.text, inlineText.runs, width);

    // Line box height: the block's strut or the tallest run on the line
    const qreal strut = blockStyle.lineHeight * blockStyle.fontSize;
    qreal total = 0;
    for (const LineMetrics &line : lines) {
        const int lineEnd = line.start + qMax(line.length, 1);
        qreal height = strut;
        for (int i = 0; i < inlineText.runs.size(); ++i) {
            const TextRunStyle &run = inlineText.runs[i];
            if (run.start < lineEnd && run.start + run.length > line.start)
                height = qMax(height, inlineText.lineHeights[i]);
        }
        total += height;
    }
    return total;
}

} // namespace Layout
