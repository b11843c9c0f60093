/*
 * paginationdriver.h — Book-level pagination runs
 *
 * Sorts the chapters, numbers the footnotes, waits (bounded) for image
 * sizes, and then paginates chapter by chapter. A call made while a run
 * is in flight supersedes it: the older run stops at its next block
 * boundary and returns nothing.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_PAGINATIONDRIVER_H
#define PAGEWRIGHT_PAGINATIONDRIVER_H

#include <QList>
#include <QObject>
#include <QStringList>

#include <functional>
#include <optional>

#include "contentmodel.h"
#include "page.h"
#include "pagemetrics.h"
#include "paginationsettings.h"

namespace Layout {
class ImageSizeCache;
class MeasurementOracle;
}

namespace Pagination {

class PaginationDriver : public QObject
{
    Q_OBJECT

public:
    PaginationDriver(Layout::MeasurementOracle *oracle, Layout::ImageSizeCache *images,
                     const Layout::PageMetrics &metrics, const PaginationSettings &settings,
                     QObject *parent = nullptr);

    std::optional<PaginationResult> paginate(const QList<Content::ChapterRecord> &chapters);

    quint64 generation() const { return m_generation; }
    bool isRunning() const { return m_running > 0; }

    // Called between image reads and between chapters. Defaults to
    // processing pending events, which is where a new request can arrive.
    void setProgressCallback(std::function<void()> progress) { m_progress = std::move(progress); }

    const Layout::PageMetrics &metrics() const { return m_metrics; }

    // Totals per chapter index and first-page/cover ordering
    static void finalizePages(QList<Page> &pages);

    // Index of the page for the saved position: the matching non-cover
    // page, else the first page, else the cover, else 0
    static std::optional<int> restorePosition(const QList<Page> &pages,
                                              const std::optional<ReadingPosition> &position);
    static ReadingPosition positionOf(const Page &page);

    static QStringList collectImageSources(const QList<Content::ChapterRecord> &chapters);

Q_SIGNALS:
    void paginationStarted(quint64 generation);
    void paginationFinished(const Pagination::PaginationResult &result);
    void paginationSuperseded(quint64 generation);

private:
    bool isCurrent(quint64 generation) const { return generation == m_generation; }

    Layout::MeasurementOracle *m_oracle;
    Layout::ImageSizeCache *m_images;
    Layout::PageMetrics m_metrics;
    PaginationSettings m_settings;
    std::function<void()> m_progress;

    quint64 m_generation = 0;
    int m_running = 0;
};

} // namespace Pagination

#endif // PAGEWRIGHT_PAGINATIONDRIVER_H
