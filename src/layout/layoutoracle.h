/*
 * layoutoracle.h — MeasurementOracle backed by the layout engine
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_LAYOUTORACLE_H
#define PAGEWRIGHT_LAYOUTORACLE_H

#include <QHash>

#include "layoutengine.h"
#include "measurementoracle.h"

namespace Layout {

class LayoutOracle : public MeasurementOracle
{
public:
    explicit LayoutOracle(TextMetrics *metrics, const ImageSizeCache *images = nullptr);

    qreal measureHeight(const QString &html, qreal widthPx,
                        const StyleContext &ctx = {}) override;

    // Replaces the font family of every measurement, e.g. for a reader setting
    void setFontFamily(const QString &family) { m_fontFamily = family; }

    Engine &engine() { return m_engine; }
    void clearCache() { m_cache.clear(); }

private:
    Engine m_engine;
    QString m_fontFamily;
    // Results depend only on the arguments, so repeated measurements are memoized
    QHash<QString, qreal> m_cache;
};

} // namespace Layout

#endif // PAGEWRIGHT_LAYOUTORACLE_H
