/*
 * elementparser.cpp — Classify block HTML into paginator elements
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "elementparser.h"

#include <QDebug>

namespace Content {

namespace {

const HtmlNode *findDescendant(const HtmlNode &node, const std::function<bool(const HtmlNode &)> &pred)
{
    if (node.isElement() && pred(node))
        return &node;
    for (const auto &child : node.children) {
        if (const HtmlNode *found = findDescendant(child, pred))
            return found;
    }
    return nullptr;
}

bool isTag(const HtmlNode &n, const char *tag)
{
    return n.isElement() && n.tag == QLatin1String(tag);
}

} // anonymous namespace

QString ElementParser::videoSource(const HtmlNode &video)
{
    QString src = video.attribute(QStringLiteral("src"));
    if (!src.isEmpty())
        return src;
    for (const auto &child : video.children) {
        if (isTag(child, "source") && child.hasAttribute(QStringLiteral("src")))
            return child.attribute(QStringLiteral("src"));
    }
    return {};
}

QString ElementParser::videoMode(const HtmlNode &video)
{
    const QString mode = video.attribute(QStringLiteral("data-video-mode"));
    return mode.isEmpty() ? QStringLiteral("blank-page") : mode;
}

bool ElementParser::isKaraokeNode(const HtmlNode &node)
{
    return node.isElement()
        && (node.hasClass(QStringLiteral("karaoke-object"))
            || node.hasAttribute(QStringLiteral("data-karaoke-block"))
            || node.hasAttribute(QStringLiteral("data-karaoke")));
}

QMap<int, QString> ElementParser::collectBackgroundVideos(const QString &html)
{
    QMap<int, QString> videos;
    HtmlNode root = HtmlNode::element(QStringLiteral("div"));
    root.children = Html::parseFragment(html);

    Html::forEachElement(root, [&](const HtmlNode &n) {
        if (n.tag != QLatin1String("video") || videoMode(n) != QLatin1String("background"))
            return;
        bool ok = false;
        const int page = n.attribute(QStringLiteral("data-target-page")).toInt(&ok);
        const QString src = videoSource(n);
        if (!ok || page < 1 || src.isEmpty()) {
            qDebug() << "ElementParser: ignoring background video without target page or source";
            return;
        }
        if (!videos.contains(page))
            videos.insert(page, src);
    });
    return videos;
}

QString ElementParser::replaceLongDashes(const QString &text)
{
    QString out = text;
    out.replace(QChar(0x2014), QLatin1Char('-'));
    out.replace(QChar(0x2013), QLatin1Char('-'));
    return out;
}

PreparedBlock ElementParser::prepareBlock(const QString &html)
{
    PreparedBlock block;
    std::vector<HtmlNode> nodes = Html::parseFragment(html);

    for (auto &node : nodes) {
        bool hadVideo = false;
        auto isPagedVideo = [&](const HtmlNode &n) {
            if (n.tag != QLatin1String("video"))
                return false;
            const QString mode = videoMode(n);
            if (mode == QLatin1String("blank-page")) {
                const QString src = videoSource(n);
                if (!src.isEmpty())
                    block.blankPageVideos.append(src);
                hadVideo = true;
                return true;
            }
            if (mode == QLatin1String("background")) {
                hadVideo = true;
                return true;
            }
            return false;
        };

        if (node.isElement() && isPagedVideo(node))
            continue; // top-level video: dropped entirely
        if (node.isElement())
            Html::removeElements(node, isPagedVideo);

        // Drop wrappers that held nothing but the removed video
        if (hadVideo && node.textContent().trimmed().isEmpty()
            && !findDescendant(node, [](const HtmlNode &n) { return n.isVoid() && n.tag != QLatin1String("br"); }))
            continue;

        Html::transformText(node, &ElementParser::replaceLongDashes);
        block.nodes.push_back(std::move(node));
    }
    return block;
}

Element ElementParser::classify(const HtmlNode &node)
{
    if (node.isText()) {
        HtmlNode p = HtmlNode::element(QStringLiteral("p"));
        p.children.push_back(node);
        return Paragraph{p};
    }

    const QString &tag = node.tag;
    if (tag.size() == 2 && tag.at(0) == QLatin1Char('h') && tag.at(1) >= QLatin1Char('1')
        && tag.at(1) <= QLatin1Char('6'))
        return Heading{tag.at(1).digitValue(), node};

    if (findDescendant(node, &ElementParser::isKaraokeNode))
        return KaraokeBlock{node};

    if (findDescendant(node, [](const HtmlNode &n) { return n.hasClass(QStringLiteral("poetry")); }))
        return Poetry{node};

    if (tag == QLatin1String("figure")
        || findDescendant(node, [](const HtmlNode &n) { return n.tag == QLatin1String("img"); }))
        return Image{node};

    if (const HtmlNode *video = findDescendant(node, [](const HtmlNode &n) { return n.tag == QLatin1String("video"); }))
        return Video{videoSource(*video), videoMode(*video), 0, node};

    if (tag == QLatin1String("hr") || node.hasClass(QStringLiteral("dinkus")))
        return Dinkus{node};

    return Paragraph{node};
}

QList<Element> ElementParser::parseElements(const std::vector<HtmlNode> &nodes)
{
    QList<Element> elements;
    for (const auto &node : nodes) {
        if (node.isText() && node.text.trimmed().isEmpty())
            continue;
        if (node.isElement() && (node.tag == QLatin1String("script") || node.tag == QLatin1String("style")))
            continue;
        elements.append(classify(node));
    }
    return elements;
}

} // namespace Content
