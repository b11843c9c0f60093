/*
 * fontmanager.h — Faces for text measurement
 *
 * Resolves the CSS family stacks of the measurement stylesheet through
 * fontconfig and keeps one FreeType face with its HarfBuzz font per
 * resolved file.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_FONTMANAGER_H
#define PAGEWRIGHT_FONTMANAGER_H

#include <QHash>
#include <QObject>
#include <QString>
#include <QStringList>

#include <ft2build.h>
#include FT_FREETYPE_H

#include <hb.h>

struct _FcConfig;

struct FontFace {
    FT_Face ftFace = nullptr;
    hb_font_t *hbFont = nullptr;
    QString filePath;

    ~FontFace();
};

class FontManager : public QObject {
    Q_OBJECT
public:
    explicit FontManager(QObject *parent = nullptr);
    ~FontManager() override;

    // family is a CSS font-family list, e.g. "\"Times New Roman\", Times, serif".
    // Returns nullptr when nothing matches or the file cannot be loaded.
    FontFace *loadFont(const QString &family, int weight = 400, bool italic = false);

    bool hasGlyph(FontFace *face, uint codepoint) const;

    static QStringList parseFamilyList(const QString &cssFamily);

private:
    QString matchFile(const QString &family, int weight, bool italic) const;
    FontFace *faceForFile(const QString &path);

    FT_Library m_ftLibrary = nullptr;
    _FcConfig *m_fcConfig = nullptr;
    // Owns the faces; several requests can resolve to one file
    QHash<QString, FontFace *> m_facesByFile;
    QHash<QString, FontFace *> m_facesByRequest;
};

#endif // PAGEWRIGHT_FONTMANAGER_H
