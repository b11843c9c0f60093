/*
 * textshaper.h — HarfBuzz advances for line measurement
 *
 * Text is cut into segments of one script, one style run and one face
 * (primary or fallback), each segment is shaped on its own and the glyph
 * advances are folded back onto the characters that start each cluster.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_TEXTSHAPER_H
#define PAGEWRIGHT_TEXTSHAPER_H

#include <QList>
#include <QString>

class FontManager;
struct FontFace;

struct StyleRun {
    int start = 0;
    int length = 0;
    QString fontFamily;
    int fontWeight = 400;
    bool fontItalic = false;
    qreal fontSize = 16.0;
};

class TextShaper {
public:
    explicit TextShaper(FontManager *fontManager);

    // One advance per UTF-16 unit of `text`, in pixels. Characters inside
    // a cluster (and low surrogates) carry 0.
    QList<qreal> advances(const QString &text, const QList<StyleRun> &styles);

    void setFallbackFont(FontFace *face) { m_fallbackFont = face; }

private:
    struct Segment {
        int start = 0;
        int length = 0;
        int script = 0;         // UScriptCode
        int style = 0;          // index into the style runs
        bool fallback = false;
    };

    QList<Segment> segment(const QString &text, const QList<StyleRun> &styles) const;
    FontFace *faceFor(const Segment &segment, const StyleRun &style) const;
    void shapeSegment(const QString &text, const Segment &segment, const StyleRun &style,
                      QList<qreal> &advances) const;

    FontManager *m_fontManager;
    FontFace *m_fallbackFont = nullptr;
};

#endif // PAGEWRIGHT_TEXTSHAPER_H
