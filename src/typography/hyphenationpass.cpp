/*
 * hyphenationpass.cpp — Idle-time hyphenation of finished pages
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "hyphenationpass.h"

#include <QDebug>

#include "hyphenator.h"

using Pagination::Page;

static constexpr QChar kSoftHyphen(0x00AD);

static QList<QPair<int, int>> pageOrder(const QList<Page> &pages)
{
    QList<QPair<int, int>> order;
    order.reserve(pages.size());
    for (const Page &page : pages)
        order.append(qMakePair(page.chapterIndex, page.pageIndex));
    return order;
}

HyphenationPass::HyphenationPass(const Hyphenator *hyphenator, QObject *parent)
    : QObject(parent)
    , m_hyphenator(hyphenator)
{
    m_timer.setSingleShot(true);
    connect(&m_timer, &QTimer::timeout, this, &HyphenationPass::run);
}

void HyphenationPass::schedule(const QList<Page> &pages, int delayMs)
{
    cancel();
    m_scheduledOrder = pageOrder(pages);
    m_current = pages;
    m_timer.start(qMax(0, delayMs));
}

void HyphenationPass::cancel()
{
    m_timer.stop();
}

bool HyphenationPass::shouldSkip(const Page &page)
{
    return page.isCover || page.isEpigraph || page.isVideo
        || page.content.contains(kSoftHyphen);
}

bool HyphenationPass::apply(QList<Page> &current) const
{
    if (!m_hyphenator || !m_hyphenator->isLoaded())
        return false;

    if (current.size() != m_scheduledOrder.size()) {
        qWarning() << "HyphenationPass: page count changed from" << m_scheduledOrder.size()
                   << "to" << current.size() << "- skipping";
        return false;
    }
    if (pageOrder(current) != m_scheduledOrder) {
        qWarning() << "HyphenationPass: page order changed - skipping";
        return false;
    }

    int touched = 0;
    for (Page &page : current) {
        if (shouldSkip(page))
            continue;
        page.content = m_hyphenator->hyphenateHtml(page.content);
        ++touched;
    }
    qDebug() << "HyphenationPass: hyphenated" << touched << "of" << current.size() << "pages";
    return true;
}

void HyphenationPass::run()
{
    QList<Page> pages = m_current;
    if (!apply(pages)) {
        Q_EMIT passAborted();
        return;
    }
    m_current = pages;
    Q_EMIT pagesHyphenated(pages);
}
