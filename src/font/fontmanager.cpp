/*
 * fontmanager.cpp — Faces for text measurement
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "fontmanager.h"

#include <QDebug>
#include <QFile>

#include <hb-ft.h>

#include <fontconfig/fontconfig.h>

namespace {

// CSS weight to fontconfig weight, first entry not below the request
struct WeightMapping {
    int css;
    int fc;
};

constexpr WeightMapping kWeights[] = {
    {100, FC_WEIGHT_THIN},   {200, FC_WEIGHT_EXTRALIGHT}, {300, FC_WEIGHT_LIGHT},
    {400, FC_WEIGHT_REGULAR}, {500, FC_WEIGHT_MEDIUM},    {600, FC_WEIGHT_DEMIBOLD},
    {700, FC_WEIGHT_BOLD},   {800, FC_WEIGHT_EXTRABOLD},  {900, FC_WEIGHT_BLACK},
};

int fcWeight(int cssWeight)
{
    for (const WeightMapping &mapping : kWeights) {
        if (cssWeight <= mapping.css)
            return mapping.fc;
    }
    return FC_WEIGHT_BLACK;
}

QString requestKey(const QString &family, int weight, bool italic)
{
    return family + QLatin1Char('|') + QString::number(weight)
        + (italic ? QLatin1String("|i") : QLatin1String("|n"));
}

} // namespace

FontFace::~FontFace()
{
    if (hbFont)
        hb_font_destroy(hbFont);
    if (ftFace)
        FT_Done_Face(ftFace);
}

FontManager::FontManager(QObject *parent)
    : QObject(parent)
{
    if (const FT_Error err = FT_Init_FreeType(&m_ftLibrary)) {
        qWarning() << "FontManager: FreeType unavailable, error" << err;
        m_ftLibrary = nullptr;
    }
    m_fcConfig = FcInitLoadConfigAndFonts();
    if (!m_fcConfig)
        qWarning() << "FontManager: fontconfig configuration could not be loaded";
}

FontManager::~FontManager()
{
    m_facesByRequest.clear();
    qDeleteAll(m_facesByFile);
    m_facesByFile.clear();
    if (m_fcConfig)
        FcConfigDestroy(m_fcConfig);
    if (m_ftLibrary)
        FT_Done_FreeType(m_ftLibrary);
}

QStringList FontManager::parseFamilyList(const QString &cssFamily)
{
    QStringList families;
    const QStringList parts = cssFamily.split(QLatin1Char(','), Qt::SkipEmptyParts);
    for (QString part : parts) {
        part = part.trimmed();
        if (part.size() >= 2
            && (part.startsWith(QLatin1Char('"')) || part.startsWith(QLatin1Char('\'')))
            && part.endsWith(part.at(0)))
            part = part.mid(1, part.size() - 2);
        if (!part.isEmpty())
            families.append(part);
    }
    return families;
}

QString FontManager::matchFile(const QString &family, int weight, bool italic) const
{
    if (!m_fcConfig)
        return {};

    FcPattern *pattern = FcPatternCreate();
    // The stack order becomes fontconfig's family preference order
    for (const QString &name : parseFamilyList(family)) {
        const QByteArray utf8 = name.toUtf8();
        FcPatternAddString(pattern, FC_FAMILY, reinterpret_cast<const FcChar8 *>(utf8.constData()));
    }
    FcPatternAddInteger(pattern, FC_WEIGHT, fcWeight(weight));
    FcPatternAddInteger(pattern, FC_SLANT, italic ? FC_SLANT_ITALIC : FC_SLANT_ROMAN);
    FcConfigSubstitute(m_fcConfig, pattern, FcMatchPattern);
    FcDefaultSubstitute(pattern);

    QString path;
    FcResult result = FcResultNoMatch;
    if (FcPattern *match = FcFontMatch(m_fcConfig, pattern, &result)) {
        FcChar8 *file = nullptr;
        if (FcPatternGetString(match, FC_FILE, 0, &file) == FcResultMatch && file)
            path = QString::fromUtf8(reinterpret_cast<const char *>(file));
        FcPatternDestroy(match);
    }
    FcPatternDestroy(pattern);
    return path;
}

FontFace *FontManager::faceForFile(const QString &path)
{
    if (FontFace *existing = m_facesByFile.value(path))
        return existing;
    if (!m_ftLibrary)
        return nullptr;

    auto *face = new FontFace;
    face->filePath = path;
    if (const FT_Error err = FT_New_Face(m_ftLibrary, QFile::encodeName(path).constData(), 0,
                                         &face->ftFace)) {
        qWarning() << "FontManager: FreeType cannot load" << path << "error" << err;
        delete face;
        return nullptr;
    }
    face->hbFont = hb_ft_font_create_referenced(face->ftFace);
    m_facesByFile.insert(path, face);
    return face;
}

FontFace *FontManager::loadFont(const QString &family, int weight, bool italic)
{
    const QString key = requestKey(family, weight, italic);
    const auto cached = m_facesByRequest.constFind(key);
    if (cached != m_facesByRequest.constEnd())
        return cached.value();

    FontFace *face = nullptr;
    const QString path = matchFile(family, weight, italic);
    if (path.isEmpty())
        qWarning() << "FontManager: no font matches" << family;
    else
        face = faceForFile(path);

    // Failed lookups are remembered too, so a missing family is reported once
    m_facesByRequest.insert(key, face);
    return face;
}

bool FontManager::hasGlyph(FontFace *face, uint codepoint) const
{
    return face && face->ftFace && FT_Get_Char_Index(face->ftFace, codepoint) != 0;
}
