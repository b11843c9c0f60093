/*
 * htmlfragment.cpp — Lightweight HTML fragment tree
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "htmlfragment.h"

#include <QHash>
#include <QSet>

using Content::HtmlAttribute;
using Content::HtmlNode;

// --- HtmlNode ---

HtmlNode HtmlNode::element(const QString &tag)
{
    HtmlNode n;
    n.type = Element;
    n.tag = tag.toLower();
    return n;
}

HtmlNode HtmlNode::textNode(const QString &text)
{
    HtmlNode n;
    n.type = Text;
    n.text = text;
    return n;
}

bool HtmlNode::isVoid() const
{
    return type == Element && Html::isVoidElement(tag);
}

bool HtmlNode::hasAttribute(const QString &name) const
{
    for (const auto &a : attributes) {
        if (a.name == name)
            return true;
    }
    return false;
}

QString HtmlNode::attribute(const QString &name, const QString &defaultValue) const
{
    for (const auto &a : attributes) {
        if (a.name == name)
            return a.value;
    }
    return defaultValue;
}

void HtmlNode::setAttribute(const QString &name, const QString &value)
{
    for (auto &a : attributes) {
        if (a.name == name) {
            a.value = value;
            return;
        }
    }
    attributes.append({name, value});
}

void HtmlNode::removeAttribute(const QString &name)
{
    attributes.removeIf([&](const HtmlAttribute &a) { return a.name == name; });
}

QStringList HtmlNode::classes() const
{
    return attribute(QStringLiteral("class")).split(QLatin1Char(' '), Qt::SkipEmptyParts);
}

bool HtmlNode::hasClass(const QString &cls) const
{
    return classes().contains(cls);
}

QString HtmlNode::textContent() const
{
    if (type == Text)
        return text;
    QString result;
    for (const auto &child : children)
        result += child.textContent();
    return result;
}

QString HtmlNode::innerHtml() const
{
    if (type == Text)
        return Html::escapeText(text);
    return Html::serialize(children);
}

QString HtmlNode::outerHtml() const
{
    if (type == Text)
        return Html::escapeText(text);

    QString out;
    out += QLatin1Char('<') + tag;
    for (const auto &a : attributes) {
        out += QLatin1Char(' ') + a.name + QStringLiteral("=\"")
               + Html::escapeAttribute(a.value) + QLatin1Char('"');
    }
    out += QLatin1Char('>');
    if (isVoid())
        return out;
    out += Html::serialize(children);
    out += QStringLiteral("</") + tag + QLatin1Char('>');
    return out;
}

namespace Html {

// --- Entities ---

static const QHash<QString, QChar> &namedEntities()
{
    static const QHash<QString, QChar> entities = {
        {QStringLiteral("amp"), QChar(u'&')},
        {QStringLiteral("lt"), QChar(u'<')},
        {QStringLiteral("gt"), QChar(u'>')},
        {QStringLiteral("quot"), QChar(u'"')},
        {QStringLiteral("apos"), QChar(u'\'')},
        {QStringLiteral("nbsp"), QChar(0x00A0)},
        {QStringLiteral("shy"), QChar(0x00AD)},
        {QStringLiteral("mdash"), QChar(0x2014)},
        {QStringLiteral("ndash"), QChar(0x2013)},
        {QStringLiteral("hellip"), QChar(0x2026)},
        {QStringLiteral("lsquo"), QChar(0x2018)},
        {QStringLiteral("rsquo"), QChar(0x2019)},
        {QStringLiteral("ldquo"), QChar(0x201C)},
        {QStringLiteral("rdquo"), QChar(0x201D)},
        {QStringLiteral("laquo"), QChar(0x00AB)},
        {QStringLiteral("raquo"), QChar(0x00BB)},
        {QStringLiteral("copy"), QChar(0x00A9)},
    };
    return entities;
}

QString decodeEntities(const QString &text)
{
    if (!text.contains(QLatin1Char('&')))
        return text;

    QString out;
    out.reserve(text.size());
    int i = 0;
    while (i < text.size()) {
        const QChar c = text.at(i);
        if (c != QLatin1Char('&')) {
            out.append(c);
            ++i;
            continue;
        }
        int semi = text.indexOf(QLatin1Char(';'), i + 1);
        if (semi < 0 || semi - i > 10) {
            out.append(c);
            ++i;
            continue;
        }
        const QString name = text.mid(i + 1, semi - i - 1);
        bool decoded = false;
        if (name.startsWith(QLatin1Char('#'))) {
            bool ok = false;
            uint cp = (name.size() > 1 && (name.at(1) == QLatin1Char('x') || name.at(1) == QLatin1Char('X')))
                ? name.mid(2).toUInt(&ok, 16)
                : name.mid(1).toUInt(&ok, 10);
            if (ok && cp > 0 && cp <= 0x10FFFF) {
                char32_t ch = cp;
                out.append(QString::fromUcs4(&ch, 1));
                decoded = true;
            }
        } else if (auto it = namedEntities().constFind(name); it != namedEntities().constEnd()) {
            out.append(it.value());
            decoded = true;
        }
        if (decoded) {
            i = semi + 1;
        } else {
            out.append(c);
            ++i;
        }
    }
    return out;
}

QString escapeText(const QString &text)
{
    QString out;
    out.reserve(text.size());
    for (const QChar c : text) {
        if (c == QLatin1Char('&'))
            out += QStringLiteral("&amp;");
        else if (c == QLatin1Char('<'))
            out += QStringLiteral("&lt;");
        else if (c == QLatin1Char('>'))
            out += QStringLiteral("&gt;");
        else
            out += c;
    }
    return out;
}

QString escapeAttribute(const QString &value)
{
    QString out = escapeText(value);
    out.replace(QLatin1Char('"'), QStringLiteral("&quot;"));
    return out;
}

bool isVoidElement(const QString &tag)
{
    static const QSet<QString> voids = {
        QStringLiteral("area"), QStringLiteral("base"), QStringLiteral("br"),
        QStringLiteral("col"), QStringLiteral("embed"), QStringLiteral("hr"),
        QStringLiteral("img"), QStringLiteral("input"), QStringLiteral("link"),
        QStringLiteral("meta"), QStringLiteral("source"), QStringLiteral("track"),
        QStringLiteral("wbr"),
    };
    return voids.contains(tag);
}

// --- Parser ---

namespace {

bool closesParagraph(const QString &tag)
{
    static const QSet<QString> blocks = {
        QStringLiteral("p"), QStringLiteral("div"), QStringLiteral("h1"),
        QStringLiteral("h2"), QStringLiteral("h3"), QStringLiteral("h4"),
        QStringLiteral("h5"), QStringLiteral("h6"), QStringLiteral("ul"),
        QStringLiteral("ol"), QStringLiteral("blockquote"), QStringLiteral("figure"),
        QStringLiteral("hr"), QStringLiteral("section"), QStringLiteral("table"),
        QStringLiteral("pre"),
    };
    return blocks.contains(tag);
}

bool isRawText(const QString &tag)
{
    return tag == QLatin1String("script") || tag == QLatin1String("style");
}

class FragmentParser
{
public:
    explicit FragmentParser(const QString &src) : m_src(src) {}

    std::vector<HtmlNode> run()
    {
        HtmlNode root = HtmlNode::element(QStringLiteral("#root"));
        m_stack.push_back(&root);
        // Stack holds pointers into vectors; children are appended only to the
        // top element, so pointers below the top stay valid.
        while (m_pos < m_src.size()) {
            if (m_src.at(m_pos) == QLatin1Char('<') && m_pos + 1 < m_src.size()) {
                const QChar next = m_src.at(m_pos + 1);
                if (m_src.mid(m_pos, 4) == QLatin1String("<!--")) {
                    int end = m_src.indexOf(QStringLiteral("-->"), m_pos + 4);
                    m_pos = end < 0 ? m_src.size() : end + 3;
                    continue;
                }
                if (next == QLatin1Char('!') || next == QLatin1Char('?')) {
                    int end = m_src.indexOf(QLatin1Char('>'), m_pos);
                    m_pos = end < 0 ? m_src.size() : end + 1;
                    continue;
                }
                if (next == QLatin1Char('/')) {
                    parseEndTag();
                    continue;
                }
                if (next.isLetter()) {
                    parseStartTag();
                    continue;
                }
            }
            parseText();
        }
        m_stack.clear();
        return std::move(root.children);
    }

private:
    HtmlNode &top() { return *m_stack.back(); }

    void appendText(const QString &raw)
    {
        if (raw.isEmpty())
            return;
        const QString decoded = decodeEntities(raw);
        auto &children = top().children;
        if (!children.empty() && children.back().isText())
            children.back().text += decoded;
        else
            children.push_back(HtmlNode::textNode(decoded));
    }

    void parseText()
    {
        int end = m_src.indexOf(QLatin1Char('<'), m_pos + 1);
        if (end < 0)
            end = m_src.size();
        appendText(m_src.mid(m_pos, end - m_pos));
        m_pos = end;
    }

    void skipSpace()
    {
        while (m_pos < m_src.size() && m_src.at(m_pos).isSpace())
            ++m_pos;
    }

    QString readName()
    {
        int start = m_pos;
        while (m_pos < m_src.size()) {
            const QChar c = m_src.at(m_pos);
            if (c.isSpace() || c == QLatin1Char('>') || c == QLatin1Char('/')
                || c == QLatin1Char('='))
                break;
            ++m_pos;
        }
        return m_src.mid(start, m_pos - start).toLower();
    }

    void parseEndTag()
    {
        m_pos += 2;
        const QString name = readName();
        int end = m_src.indexOf(QLatin1Char('>'), m_pos);
        m_pos = end < 0 ? m_src.size() : end + 1;

        for (int i = int(m_stack.size()) - 1; i > 0; --i) {
            if (m_stack[i]->tag == name) {
                m_stack.resize(i);
                return;
            }
        }
        // Unmatched end tag: ignored
    }

    void parseStartTag()
    {
        ++m_pos;
        HtmlNode node = HtmlNode::element(readName());
        bool selfClosing = false;

        while (m_pos < m_src.size()) {
            skipSpace();
            if (m_pos >= m_src.size())
                break;
            const QChar c = m_src.at(m_pos);
            if (c == QLatin1Char('>')) {
                ++m_pos;
                break;
            }
            if (c == QLatin1Char('/')) {
                selfClosing = true;
                ++m_pos;
                continue;
            }
            const QString attrName = readName();
            if (attrName.isEmpty()) {
                ++m_pos;
                continue;
            }
            QString value;
            skipSpace();
            if (m_pos < m_src.size() && m_src.at(m_pos) == QLatin1Char('=')) {
                ++m_pos;
                skipSpace();
                if (m_pos < m_src.size()
                    && (m_src.at(m_pos) == QLatin1Char('"') || m_src.at(m_pos) == QLatin1Char('\''))) {
                    const QChar quote = m_src.at(m_pos);
                    int end = m_src.indexOf(quote, m_pos + 1);
                    if (end < 0)
                        end = m_src.size();
                    value = m_src.mid(m_pos + 1, end - m_pos - 1);
                    m_pos = qMin(end + 1, int(m_src.size()));
                } else {
                    int start = m_pos;
                    while (m_pos < m_src.size() && !m_src.at(m_pos).isSpace()
                           && m_src.at(m_pos) != QLatin1Char('>'))
                        ++m_pos;
                    value = m_src.mid(start, m_pos - start);
                }
            }
            if (!node.hasAttribute(attrName))
                node.attributes.append({attrName, decodeEntities(value)});
        }

        if (closesParagraph(node.tag) && m_stack.size() > 1 && top().tag == QLatin1String("p"))
            m_stack.pop_back();

        if (isRawText(node.tag) && !selfClosing) {
            const QString closing = QStringLiteral("</") + node.tag;
            int end = m_src.indexOf(closing, m_pos, Qt::CaseInsensitive);
            if (end < 0)
                end = m_src.size();
            const QString raw = m_src.mid(m_pos, end - m_pos);
            if (!raw.isEmpty())
                node.children.push_back(HtmlNode::textNode(raw));
            int close = m_src.indexOf(QLatin1Char('>'), end);
            m_pos = close < 0 ? m_src.size() : close + 1;
            top().children.push_back(std::move(node));
            return;
        }

        top().children.push_back(std::move(node));
        if (!selfClosing && !isVoidElement(top().children.back().tag))
            m_stack.push_back(&top().children.back());
    }

    const QString &m_src;
    int m_pos = 0;
    std::vector<HtmlNode *> m_stack;
};

} // anonymous namespace

std::vector<HtmlNode> parseFragment(const QString &html)
{
    FragmentParser parser(html);
    return parser.run();
}

std::optional<HtmlNode> parseElement(const QString &html)
{
    auto nodes = parseFragment(html);
    for (auto &node : nodes) {
        if (node.isElement())
            return std::move(node);
    }
    return std::nullopt;
}

QString serialize(const std::vector<HtmlNode> &nodes)
{
    QString out;
    for (const auto &node : nodes)
        out += node.outerHtml();
    return out;
}

QString stripTags(const QString &html)
{
    QString out;
    for (const auto &node : parseFragment(html))
        out += node.textContent();
    return out;
}

// --- Text-offset operations ---

namespace {

// Returns true when any content was kept
bool sliceChildren(const HtmlNode &src, HtmlNode &dst, int &pos, int from, int to, int total)
{
    bool kept = false;
    for (const auto &child : src.children) {
        if (child.isText()) {
            const int start = pos;
            const int end = pos + int(child.text.size());
            const int a = qMax(start, from);
            const int b = qMin(end, to);
            if (b > a) {
                dst.children.push_back(HtmlNode::textNode(child.text.mid(a - start, b - a)));
                kept = true;
            }
            pos = end;
            continue;
        }

        const int childLen = int(child.textContent().size());
        if (childLen == 0) {
            const bool inRange = (pos >= from && pos < to) || (pos == total && to == total);
            if (inRange) {
                dst.children.push_back(child);
                kept = true;
            }
            continue;
        }

        if (pos + childLen <= from || pos >= to) {
            pos += childLen;
            continue;
        }

        HtmlNode shell = child;
        shell.children.clear();
        if (sliceChildren(child, shell, pos, from, to, total)) {
            dst.children.push_back(std::move(shell));
            kept = true;
        }
    }
    return kept;
}

} // anonymous namespace

HtmlNode sliceByText(const HtmlNode &node, int from, int to)
{
    if (node.isText())
        return HtmlNode::textNode(node.text.mid(from, to - from));

    HtmlNode result = node;
    result.children.clear();
    int pos = 0;
    const int total = int(node.textContent().size());
    sliceChildren(node, result, pos, from, to, total);
    return result;
}

namespace {

// Returns true once a non-space character or replaced element is reached
bool trimLeading(HtmlNode &node)
{
    auto &children = node.children;
    auto it = children.begin();
    while (it != children.end()) {
        if (it->isText()) {
            int i = 0;
            while (i < it->text.size() && it->text.at(i).isSpace())
                ++i;
            it->text.remove(0, i);
            if (it->text.isEmpty()) {
                it = children.erase(it);
                continue;
            }
            return true;
        }
        if (it->isVoid())
            return true;
        if (trimLeading(*it))
            return true;
        ++it;
    }
    return false;
}

} // anonymous namespace

void trimLeadingWhitespace(HtmlNode &node)
{
    if (node.isText()) {
        int i = 0;
        while (i < node.text.size() && node.text.at(i).isSpace())
            ++i;
        node.text.remove(0, i);
        return;
    }
    trimLeading(node);
}

void forEachElement(const HtmlNode &node, const std::function<void(const HtmlNode &)> &visit)
{
    for (const auto &child : node.children) {
        if (!child.isElement())
            continue;
        visit(child);
        forEachElement(child, visit);
    }
}

int removeElements(HtmlNode &node, const std::function<bool(const HtmlNode &)> &predicate)
{
    int removed = 0;
    auto &children = node.children;
    for (auto it = children.begin(); it != children.end();) {
        if (it->isElement() && predicate(*it)) {
            it = children.erase(it);
            ++removed;
        } else {
            removed += removeElements(*it, predicate);
            ++it;
        }
    }
    return removed;
}

void transformText(HtmlNode &node, const std::function<QString(const QString &)> &fn)
{
    if (node.isText()) {
        node.text = fn(node.text);
        return;
    }
    for (auto &child : node.children)
        transformText(child, fn);
}

} // namespace Html
