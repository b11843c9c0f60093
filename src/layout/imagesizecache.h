/*
 * imagesizecache.h — Intrinsic image sizes for layout
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_IMAGESIZECACHE_H
#define PAGEWRIGHT_IMAGESIZECACHE_H

#include <QHash>
#include <QSize>
#include <QString>
#include <QStringList>

#include <functional>
#include <optional>

namespace Layout {

class ImageSizeCache
{
public:
    // Reads the size of each source until the time budget runs out. A source that
    // fails to load is cached with no size; one not reached in time is
    // left unresolved so a later call reads it. progress is invoked once
    // per source. Returns the number of sizes known.
    int preload(const QStringList &sources, int timeoutMs,
                const std::function<void()> &progress = {});

    std::optional<QSize> size(const QString &source) const;
    bool isResolved(const QString &source) const { return m_sizes.contains(source); }
    void insert(const QString &source, const QSize &size) { m_sizes.insert(source, size); }
    void clear() { m_sizes.clear(); }

    static std::optional<QSize> readSize(const QString &source);

private:
    QHash<QString, std::optional<QSize>> m_sizes;
};

} // namespace Layout

#endif // PAGEWRIGHT_IMAGESIZECACHE_H
