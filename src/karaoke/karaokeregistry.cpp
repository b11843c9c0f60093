/*
 * karaokeregistry.cpp — Owner of karaoke playback controllers
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "karaokeregistry.h"

#include <QDebug>
#include <QTimer>

#include <KConfigGroup>

#include "playbackcontroller.h"
#include "sliceview.h"

namespace Karaoke {

KaraokeSettings KaraokeSettings::load()
{
    return load(KSharedConfig::openConfig());
}

KaraokeSettings KaraokeSettings::load(const KSharedConfigPtr &config)
{
    KaraokeSettings s;
    KConfigGroup group(config, QStringLiteral("Karaoke"));
    s.frameIntervalMs = group.readEntry("FrameIntervalMs", s.frameIntervalMs);
    s.initRetryLimit = group.readEntry("InitRetryLimit", s.initRetryLimit);
    s.initRetryIntervalMs = group.readEntry("InitRetryIntervalMs", s.initRetryIntervalMs);
    return s;
}

KaraokeRegistry::KaraokeRegistry(QObject *parent)
    : KaraokeRegistry(KaraokeSettings::load(), &KaraokeRegistry::clockAudio, parent)
{
}

KaraokeRegistry::KaraokeRegistry(const KaraokeSettings &settings, AudioFactory audioFactory,
                                 QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_audioFactory(std::move(audioFactory))
{
}

KaraokeRegistry::~KaraokeRegistry()
{
    disposeAll();
}

std::unique_ptr<AudioHandle> KaraokeRegistry::clockAudio(const KaraokeSource &source)
{
    double duration = 0;
    for (const auto &range : source.wordCharRanges) {
        if (range)
            duration = qMax(duration, range->end);
    }
    return std::make_unique<ClockAudioHandle>(source.audioUrl, duration);
}

void KaraokeRegistry::setSources(const QMap<QString, KaraokeSource> &sources)
{
    std::vector<QString> stale;
    for (const auto &entry : m_controllers) {
        if (!sources.contains(entry.first))
            stale.push_back(entry.first);
    }
    for (const QString &id : stale)
        dispose(id);
    m_sources = sources;
}

bool KaraokeRegistry::hasController(const QString &karaokeId) const
{
    return m_controllers.find(karaokeId) != m_controllers.end();
}

PlaybackController *KaraokeRegistry::controller(const QString &karaokeId)
{
    const auto it = m_controllers.find(karaokeId);
    if (it != m_controllers.end())
        return it->second.get();

    const auto source = m_sources.constFind(karaokeId);
    if (source == m_sources.constEnd()) {
        qWarning() << "KaraokeRegistry: no source for" << karaokeId;
        return nullptr;
    }

    std::unique_ptr<AudioHandle> audio = m_audioFactory ? m_audioFactory(*source)
                                                        : clockAudio(*source);
    auto controller = std::make_unique<PlaybackController>(*source, std::move(audio),
                                                           m_settings.frameIntervalMs);
    PlaybackController *raw = controller.get();
    m_controllers.emplace(karaokeId, std::move(controller));

    // Views mounted before the controller existed
    for (const auto &page : m_views) {
        for (const auto &view : page.second) {
            if (view->karaokeId() == karaokeId)
                raw->registerView(view.get());
        }
    }
    return raw;
}

SliceView *KaraokeRegistry::mountSlice(int pageKey, const KaraokeSlice &slice)
{
    auto view = std::make_unique<SliceView>(slice);
    SliceView *raw = view.get();
    m_views[pageKey].push_back(std::move(view));

    const auto it = m_controllers.find(slice.karaokeId);
    if (it != m_controllers.end())
        it->second->registerView(raw);
    return raw;
}

void KaraokeRegistry::unmountPage(int pageKey)
{
    const auto page = m_views.find(pageKey);
    if (page == m_views.end())
        return;
    for (const auto &view : page->second) {
        view->setConnected(false);
        const auto it = m_controllers.find(view->karaokeId());
        if (it != m_controllers.end())
            it->second->unregisterView(view.get());
    }
    m_views.erase(page);
}

QList<SliceView *> KaraokeRegistry::views(int pageKey) const
{
    QList<SliceView *> result;
    const auto page = m_views.find(pageKey);
    if (page == m_views.end())
        return result;
    for (const auto &view : page->second)
        result.append(view.get());
    return result;
}

void KaraokeRegistry::onPageEnter(int pageKey)
{
    // Audio never carries over from the page being left
    for (const auto &entry : m_controllers)
        entry.second->pause();
    attemptPageEnter(pageKey, ++m_enterToken, 1);
}

void KaraokeRegistry::attemptPageEnter(int pageKey, quint64 token, int attempt)
{
    if (token != m_enterToken)
        return;

    const QList<SliceView *> pageViews = views(pageKey);
    if (pageViews.isEmpty())
        return;

    const QString karaokeId = pageViews.first()->karaokeId();
    PlaybackController *ctrl = controller(karaokeId);
    if (!ctrl)
        return;

    SliceView *target = nullptr;
    PlayOptions options = ctrl->resumeOptions();
    if (const std::optional<int> resumeChar = ctrl->resumeCharStart()) {
        for (SliceView *view : pageViews) {
            const KaraokeSlice &slice = view->slice();
            if (slice.karaokeId == karaokeId && *resumeChar >= slice.startChar
                && *resumeChar < slice.endChar) {
                target = view;
                break;
            }
        }
        if (!target)
            qWarning() << "KaraokeRegistry: no slice on page" << pageKey
                       << "holds the resume word, starting at the first slice";
    }
    if (!target)
        target = pageViews.first();

    if (!target->ensureInitialized(&ctrl->source())) {
        if (attempt >= m_settings.initRetryLimit) {
            qWarning() << "KaraokeRegistry: giving up on" << karaokeId << "after" << attempt
                       << "attempts";
            Q_EMIT initializationFailed(karaokeId);
            return;
        }
        QTimer::singleShot(m_settings.initRetryIntervalMs, this,
                           [this, pageKey, token, attempt]() {
                               attemptPageEnter(pageKey, token, attempt + 1);
                           });
        return;
    }

    if (ctrl->playSlice(target, options))
        Q_EMIT playbackStarted(karaokeId, target->slice().startChar);
}

void KaraokeRegistry::dispose(const QString &karaokeId)
{
    const auto it = m_controllers.find(karaokeId);
    if (it == m_controllers.end())
        return;
    it->second->dispose();
    m_controllers.erase(it);
}

void KaraokeRegistry::disposeAll()
{
    ++m_enterToken;
    for (auto &entry : m_controllers)
        entry.second->dispose();
    m_controllers.clear();
}

} // namespace Karaoke
