/*
 * layoutoracle.cpp — MeasurementOracle backed by the layout engine
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "layoutoracle.h"

namespace Layout {

static constexpr int kMaxCachedMeasurements = 8192;

LayoutOracle::LayoutOracle(TextMetrics *metrics, const ImageSizeCache *images)
    : m_engine(metrics, images)
{
}

qreal LayoutOracle::measureHeight(const QString &html, qreal widthPx, const StyleContext &context)
{
    StyleContext ctx = context;
    if (!m_fontFamily.isEmpty())
        ctx.fontFamily = m_fontFamily;

    const QString key = QString::number(widthPx) + QLatin1Char('|')
        + ctx.fontFamily + QLatin1Char('|') + QString::number(ctx.rootFontSize)
        + QLatin1Char('|') + QString::number(ctx.fontSize) + QLatin1Char('|')
        + QString::number(ctx.lineHeight) + QLatin1Char('|')
        + QString::number(ctx.paddingTop) + QLatin1Char(',') + QString::number(ctx.paddingBottom)
        + QLatin1Char(',') + QString::number(ctx.paddingLeft) + QLatin1Char(',')
        + QString::number(ctx.paddingRight) + QLatin1Char('|') + html;

    auto it = m_cache.constFind(key);
    if (it != m_cache.constEnd())
        return it.value();

    const qreal height = m_engine.measure(Html::parseFragment(html), widthPx, ctx);
    if (m_cache.size() >= kMaxCachedMeasurements)
        m_cache.clear();
    m_cache.insert(key, height);
    return height;
}

} // namespace Layout
