/*
 * hyphenationpass.h — Idle-time hyphenation of finished pages
 *
 * Scheduled once pagination has finished. The pass runs from a
 * single-shot timer so the first pages are shown unhyphenated, and it
 * drops its work if the page list was replaced in the meantime.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_HYPHENATIONPASS_H
#define PAGEWRIGHT_HYPHENATIONPASS_H

#include <QList>
#include <QObject>
#include <QPair>
#include <QTimer>

#include "page.h"

class Hyphenator;

class HyphenationPass : public QObject
{
    Q_OBJECT

public:
    explicit HyphenationPass(const Hyphenator *hyphenator, QObject *parent = nullptr);

    // Schedules a pass over the given pages after delayMs. A pending
    // pass is cancelled first.
    void schedule(const QList<Pagination::Page> &pages, int delayMs);
    void cancel();
    bool isPending() const { return m_timer.isActive(); }

    // Hyphenates `current` if it still matches the pages the pass was
    // scheduled for. Returns false (and leaves the pages alone) when the
    // count or the (chapterIndex, pageIndex) order changed.
    bool apply(QList<Pagination::Page> &current) const;

    // Latest page list published by the owner; the timer checks it
    // against the scheduled snapshot before applying.
    void setCurrentPages(const QList<Pagination::Page> &pages) { m_current = pages; }

    static bool shouldSkip(const Pagination::Page &page);

Q_SIGNALS:
    void pagesHyphenated(const QList<Pagination::Page> &pages);
    void passAborted();

private:
    void run();

    const Hyphenator *m_hyphenator;
    QTimer m_timer;
    QList<QPair<int, int>> m_scheduledOrder;
    QList<Pagination::Page> m_current;
};

#endif // PAGEWRIGHT_HYPHENATIONPASS_H
