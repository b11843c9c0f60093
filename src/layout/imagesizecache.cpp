/*
 * imagesizecache.cpp — Intrinsic image sizes for layout
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "imagesizecache.h"

#include <QBuffer>
#include <QDebug>
#include <QElapsedTimer>
#include <QImageReader>
#include <QUrl>

namespace Layout {

std::optional<QSize> ImageSizeCache::readSize(const QString &source)
{
    if (source.startsWith(QLatin1String("data:"))) {
        const int comma = source.indexOf(QLatin1Char(','));
        if (comma < 0)
            return std::nullopt;
        const QString header = source.mid(5, comma - 5);
        const QByteArray payload = source.mid(comma + 1).toLatin1();
        QByteArray bytes = header.endsWith(QLatin1String(";base64"))
            ? QByteArray::fromBase64(payload)
            : QByteArray::fromPercentEncoding(payload);
        QBuffer buffer(&bytes);
        if (!buffer.open(QIODevice::ReadOnly))
            return std::nullopt;
        QImageReader reader(&buffer);
        const QSize size = reader.size();
        if (!size.isValid())
            return std::nullopt;
        return size;
    }

    QString path = source;
    const QUrl url(source);
    if (url.isLocalFile())
        path = url.toLocalFile();
    else if (!url.scheme().isEmpty() && url.scheme().size() > 1)
        return std::nullopt; // remote sources are never fetched

    QImageReader reader(path);
    const QSize size = reader.size();
    if (!size.isValid()) {
        qDebug() << "ImageSizeCache: no size for" << source << reader.errorString();
        return std::nullopt;
    }
    return size;
}

int ImageSizeCache::preload(const QStringList &sources, int timeoutMs,
                            const std::function<void()> &progress)
{
    QElapsedTimer timer;
    timer.start();

    int known = 0;
    bool timedOut = false;
    for (const QString &source : sources) {
        if (m_sizes.contains(source)) {
            if (m_sizes.value(source))
                ++known;
            continue;
        }
        if (!timedOut && timer.elapsed() > timeoutMs) {
            qWarning() << "ImageSizeCache: image wait timed out after" << timeoutMs << "ms";
            timedOut = true;
        }
        if (timedOut) {
            // Not cached: a later run with time left reads it
            if (progress)
                progress();
            continue;
        }
        const std::optional<QSize> size = readSize(source);
        m_sizes.insert(source, size);
        if (size)
            ++known;
        if (progress)
            progress();
    }
    return known;
}

std::optional<QSize> ImageSizeCache::size(const QString &source) const
{
    return m_sizes.value(source, std::nullopt);
}

} // namespace Layout
