/*
 * htmlfragment.h — Lightweight HTML fragment tree
 *
 * A lenient parser and serializer for the HTML subset stored in chapter
 * content, plus the text-offset operations pagination needs: cutting an
 * element at a character offset of its text content while keeping the
 * enclosing inline markup open on both halves.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_HTMLFRAGMENT_H
#define PAGEWRIGHT_HTMLFRAGMENT_H

#include <QList>
#include <QString>
#include <QStringList>

#include <functional>
#include <optional>
#include <vector>

namespace Content {

struct HtmlAttribute {
    QString name;
    QString value;
};

struct HtmlNode {
    enum Type { Element, Text };

    Type type = Element;
    QString tag;                    // lower-case, elements only
    QList<HtmlAttribute> attributes;
    QString text;                   // decoded text, text nodes only
    std::vector<HtmlNode> children;

    static HtmlNode element(const QString &tag);
    static HtmlNode textNode(const QString &text);

    bool isElement() const { return type == Element; }
    bool isText() const { return type == Text; }
    bool isVoid() const;

    bool hasAttribute(const QString &name) const;
    QString attribute(const QString &name, const QString &defaultValue = {}) const;
    void setAttribute(const QString &name, const QString &value);
    void removeAttribute(const QString &name);

    QStringList classes() const;
    bool hasClass(const QString &cls) const;

    QString textContent() const;
    QString innerHtml() const;
    QString outerHtml() const;
};

} // namespace Content

namespace Html {

using Content::HtmlNode;

std::vector<HtmlNode> parseFragment(const QString &html);

// First element of the fragment, ignoring surrounding whitespace text
std::optional<HtmlNode> parseElement(const QString &html);

QString serialize(const std::vector<HtmlNode> &nodes);

QString escapeText(const QString &text);
QString escapeAttribute(const QString &value);
QString decodeEntities(const QString &text);

bool isVoidElement(const QString &tag);

// Text content of an HTML fragment
QString stripTags(const QString &html);

// Clone of the node restricted to text-content offsets [from, to).
// Wrapper elements are cloned onto the result when any of their text is
// kept; void elements are kept when their position lies in the range.
HtmlNode sliceByText(const HtmlNode &node, int from, int to);

// Removes leading whitespace from the text content; stops at the first
// non-space character or replaced element.
void trimLeadingWhitespace(HtmlNode &node);

// Depth-first visit of all descendant elements (not the node itself)
void forEachElement(const HtmlNode &node, const std::function<void(const HtmlNode &)> &visit);

// Removes descendant elements matching the predicate; returns the count removed
int removeElements(HtmlNode &node, const std::function<bool(const HtmlNode &)> &predicate);

// Applies fn to every descendant text node
void transformText(HtmlNode &node, const std::function<QString(const QString &)> &fn);

} // namespace Html

#endif // PAGEWRIGHT_HTMLFRAGMENT_H
