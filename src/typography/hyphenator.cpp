/*
 * hyphenator.cpp — Soft-hyphen insertion through libhyphen
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "hyphenator.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QRegularExpression>

#include <hyphen.h>

#include <cstdlib>

static constexpr QChar kSoftHyphen(0x00AD);

// Breaks closer than this to either end of a word are dropped
static constexpr int kMinFragment = 2;

static const char *const kDictionaryDirs[] = {
    "/usr/share/hyphen",
    "/usr/local/share/hyphen",
    "/usr/share/hunspell",
    "/usr/share/myspell/dicts",
};

Hyphenator::Hyphenator() = default;

Hyphenator::~Hyphenator()
{
    if (m_dict)
        hnj_hyphen_free(m_dict);
}

// hyph_en_US.dic -> en_US; the first directory listing a language wins
const QHash<QString, QString> &Hyphenator::dictionaries()
{
    static const QHash<QString, QString> paths = []() {
        QHash<QString, QString> found;
        for (const char *path : kDictionaryDirs) {
            const QDir dir(QString::fromLatin1(path));
            const QStringList files = dir.entryList({QStringLiteral("hyph_*.dic")}, QDir::Files);
            for (const QString &file : files) {
                const QString language = file.mid(5, file.size() - 9);
                if (!found.contains(language))
                    found.insert(language, dir.filePath(file));
            }
        }
        return found;
    }();
    return paths;
}

QStringList Hyphenator::availableLanguages()
{
    QStringList languages = dictionaries().keys();
    languages.sort();
    return languages;
}

bool Hyphenator::loadDictionary(const QString &language)
{
    if (m_dict) {
        hnj_hyphen_free(m_dict);
        m_dict = nullptr;
        m_language.clear();
    }

    const QHash<QString, QString> &paths = dictionaries();
    QString path = paths.value(language);
    if (path.isEmpty()) {
        // "en" picks the first regional dictionary, in sorted order
        for (const QString &candidate : availableLanguages()) {
            if (candidate.startsWith(language + QLatin1Char('_'))) {
                path = paths.value(candidate);
                break;
            }
        }
    }
    if (path.isEmpty()) {
        qWarning() << "Hyphenator: no dictionary for" << language;
        return false;
    }

    m_dict = hnj_hyphen_load(QFile::encodeName(path).constData());
    if (!m_dict) {
        qWarning() << "Hyphenator: failed to load" << path;
        return false;
    }
    m_language = language;
    return true;
}

QString Hyphenator::hyphenate(const QString &word, int minLength) const
{
    if (!m_dict || word.size() < minLength)
        return word;

    const QByteArray utf8 = word.toUtf8();
    QByteArray hyphens(utf8.size() + 5, '\0');
    char **rep = nullptr;
    int *pos = nullptr;
    int *cut = nullptr;
    const int status = hnj_hyphen_hyphenate2(m_dict, utf8.constData(), int(utf8.size()),
                                             hyphens.data(), nullptr, &rep, &pos, &cut);

    QString result;
    if (status == 0) {
        // libhyphen marks a break after byte i with an odd digit; only
        // character boundaries are looked at.
        result.reserve(word.size() + word.size() / 3);
        int byteEnd = 0;
        for (int i = 0; i < word.size(); ++i) {
            const QChar c = word.at(i);
            const bool pair = c.isHighSurrogate() && i + 1 < word.size();
            const int units = pair ? 2 : 1;
            result.append(word.mid(i, units));
            byteEnd += int(word.mid(i, units).toUtf8().size());
            i += units - 1;

            const int charsBefore = i + 1;
            if (charsBefore < kMinFragment || word.size() - charsBefore < kMinFragment)
                continue;
            if ((hyphens.at(byteEnd - 1) - '0') & 1)
                result.append(kSoftHyphen);
        }
    }

    if (rep) {
        for (int i = 0; i < utf8.size(); ++i)
            std::free(rep[i]);
        std::free(rep);
    }
    std::free(pos);
    std::free(cut);

    return status == 0 ? result : word;
}

QString Hyphenator::hyphenateText(const QString &text) const
{
    if (!m_dict || text.isEmpty())
        return text;

    // Letter runs only; digits, punctuation and existing hyphens pass through
    static const QRegularExpression letters(QStringLiteral("[\\p{L}\\p{M}]+"));

    QString out;
    out.reserve(text.size() + text.size() / 8);
    int copied = 0;
    auto it = letters.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch m = it.next();
        out += QStringView(text).mid(copied, m.capturedStart() - copied);
        out += hyphenate(m.captured(), m_minWordLength);
        copied = int(m.capturedEnd());
    }
    out += QStringView(text).mid(copied);
    return out;
}

bool Hyphenator::isProtected(const Content::HtmlNode &element)
{
    static const QStringList skippedTags = {
        QStringLiteral("script"), QStringLiteral("style"),
        QStringLiteral("code"), QStringLiteral("pre"),
    };
    if (skippedTags.contains(element.tag))
        return true;
    return element.hasAttribute(QStringLiteral("data-karaoke"))
        || element.hasAttribute(QStringLiteral("data-karaoke-block"))
        || element.hasAttribute(QStringLiteral("data-karaoke-id"))
        || element.hasClass(QStringLiteral("karaoke-object"))
        || element.hasClass(QStringLiteral("karaoke-slice"));
}

void Hyphenator::hyphenateNode(Content::HtmlNode &node) const
{
    if (node.isText()) {
        node.text = hyphenateText(node.text);
        return;
    }
    if (isProtected(node))
        return;
    for (Content::HtmlNode &child : node.children)
        hyphenateNode(child);
}

QString Hyphenator::hyphenateHtml(const QString &html) const
{
    if (!m_dict || html.isEmpty())
        return html;

    std::vector<Content::HtmlNode> nodes = Html::parseFragment(html);
    for (Content::HtmlNode &node : nodes)
        hyphenateNode(node);
    return Html::serialize(nodes);
}
