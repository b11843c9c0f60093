/*
 * hyphenator.h — Soft-hyphen insertion through libhyphen
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_HYPHENATOR_H
#define PAGEWRIGHT_HYPHENATOR_H

#include <QHash>
#include <QString>
#include <QStringList>

#include "htmlfragment.h"

// hyphen.h typedefs this as HyphenDict
struct _HyphenDict;

class Hyphenator
{
public:
    Hyphenator();
    ~Hyphenator();

    Hyphenator(const Hyphenator &) = delete;
    Hyphenator &operator=(const Hyphenator &) = delete;

    bool loadDictionary(const QString &language);
    bool isLoaded() const { return m_dict != nullptr; }
    QString language() const { return m_language; }

    // Insert soft hyphens (U+00AD) at valid break points in a word.
    // Returns the word unchanged if no hyphenation points are found
    // or the word is shorter than minLength.
    QString hyphenate(const QString &word, int minLength) const;
    QString hyphenate(const QString &word) const { return hyphenate(word, m_minWordLength); }

    // Hyphenates the words of a plain text run, preserving whitespace,
    // punctuation and existing hyphens.
    QString hyphenateText(const QString &text) const;

    // Hyphenates the text nodes of an HTML fragment. Karaoke markup,
    // scripts, styles and code keep their text untouched, since slice
    // offsets and highlighting depend on the exact characters.
    QString hyphenateHtml(const QString &html) const;
    void hyphenateNode(Content::HtmlNode &node) const;

    static bool isProtected(const Content::HtmlNode &element);

    // Available dictionary languages (found in the system hyphen directories)
    static QStringList availableLanguages();

    void setMinWordLength(int len) { m_minWordLength = len; }
    int minWordLength() const { return m_minWordLength; }

private:
    _HyphenDict *m_dict = nullptr;
    int m_minWordLength = 5;
    QString m_language;

    // language -> dictionary file
    static const QHash<QString, QString> &dictionaries();
};

#endif // PAGEWRIGHT_HYPHENATOR_H
