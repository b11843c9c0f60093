/*
 * textshaper.cpp — HarfBuzz advances for line measurement
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "textshaper.h"
#include "fontmanager.h"

#include <hb.h>
#include <hb-ft.h>
#include <hb-icu.h>

#include <unicode/uchar.h>
#include <unicode/uscript.h>

#include <QDebug>

namespace {

uint codepointAt(const QString &text, int pos)
{
    if (pos + 1 < text.size() && text.at(pos).isHighSurrogate()
        && text.at(pos + 1).isLowSurrogate())
        return QChar::surrogateToUcs4(text.at(pos), text.at(pos + 1));
    return text.at(pos).unicode();
}

int codepointLength(uint cp)
{
    return cp > 0xFFFF ? 2 : 1;
}

// Common and inherited characters take the script of the run around them
UScriptCode scriptOf(uint cp, UScriptCode current)
{
    UErrorCode err = U_ZERO_ERROR;
    const UScriptCode script = uscript_getScript(static_cast<UChar32>(cp), &err);
    if (U_FAILURE(err) || script == USCRIPT_COMMON || script == USCRIPT_INHERITED)
        return current;
    return script;
}

int styleIndexAt(const QList<StyleRun> &styles, int pos)
{
    for (int i = 0; i < styles.size(); ++i) {
        if (pos >= styles[i].start && pos < styles[i].start + styles[i].length)
            return i;
    }
    return -1;
}

} // namespace

TextShaper::TextShaper(FontManager *fontManager)
    : m_fontManager(fontManager)
{
}

QList<TextShaper::Segment> TextShaper::segment(const QString &text,
                                               const QList<StyleRun> &styles) const
{
    QList<Segment> segments;
    UScriptCode script = USCRIPT_LATIN;
    int pos = 0;

    while (pos < text.size()) {
        const uint cp = codepointAt(text, pos);
        const int style = styleIndexAt(styles, pos);
        if (style < 0) {
            pos += codepointLength(cp);
            continue;
        }
        script = scriptOf(cp, script);

        bool fallback = false;
        if (m_fallbackFont) {
            const StyleRun &run = styles[style];
            FontFace *primary = m_fontManager->loadFont(run.fontFamily, run.fontWeight,
                                                        run.fontItalic);
            fallback = primary && !m_fontManager->hasGlyph(primary, cp)
                && m_fontManager->hasGlyph(m_fallbackFont, cp);
        }

        if (!segments.isEmpty()) {
            Segment &last = segments.last();
            if (last.start + last.length == pos && last.style == style
                && last.script == script && last.fallback == fallback) {
                last.length += codepointLength(cp);
                pos += codepointLength(cp);
                continue;
            }
        }
        segments.append({pos, codepointLength(cp), script, style, fallback});
        pos += codepointLength(cp);
    }
    return segments;
}

FontFace *TextShaper::faceFor(const Segment &segment, const StyleRun &style) const
{
    if (segment.fallback && m_fallbackFont)
        return m_fallbackFont;
    return m_fontManager->loadFont(style.fontFamily, style.fontWeight, style.fontItalic);
}

void TextShaper::shapeSegment(const QString &text, const Segment &segment,
                              const StyleRun &style, QList<qreal> &advances) const
{
    FontFace *face = faceFor(segment, style);
    if (!face || !face->hbFont) {
        qWarning() << "TextShaper: no face for" << style.fontFamily;
        return;
    }

    // HarfBuzz works in 26.6 fixed point
    const int scale = static_cast<int>(style.fontSize * 64);
    FT_Set_Char_Size(face->ftFace, scale, 0, 72, 0);
    hb_font_set_scale(face->hbFont, scale, scale);
    hb_ft_font_changed(face->hbFont);

    hb_buffer_t *buf = hb_buffer_create();
    hb_buffer_add_utf16(buf, text.utf16(), int(text.size()), segment.start, segment.length);
    hb_buffer_set_direction(buf, HB_DIRECTION_LTR);
    hb_buffer_set_script(buf, hb_icu_script_to_script(static_cast<UScriptCode>(segment.script)));
    hb_buffer_set_cluster_level(buf, HB_BUFFER_CLUSTER_LEVEL_MONOTONE_CHARACTERS);

    const char *shapers[] = {"ot", "fallback", nullptr};
    hb_shape_full(face->hbFont, buf, nullptr, 0, shapers);

    unsigned int count = 0;
    const hb_glyph_info_t *infos = hb_buffer_get_glyph_infos(buf, &count);
    const hb_glyph_position_t *positions = hb_buffer_get_glyph_positions(buf, nullptr);
    for (unsigned int i = 0; i < count; ++i) {
        const int cluster = static_cast<int>(infos[i].cluster);
        if (cluster >= 0 && cluster < advances.size())
            advances[cluster] += positions[i].x_advance / 64.0;
    }
    hb_buffer_destroy(buf);
}

QList<qreal> TextShaper::advances(const QString &text, const QList<StyleRun> &styles)
{
    QList<qreal> result(text.size(), 0.0);
    if (text.isEmpty() || styles.isEmpty())
        return result;

    for (const Segment &seg : segment(text, styles))
        shapeSegment(text, seg, styles[seg.style], result);
    return result;
}
