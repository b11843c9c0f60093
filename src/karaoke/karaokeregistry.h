/*
 * karaokeregistry.h — Owner of karaoke playback controllers
 *
 * Creates one controller per karaoke source on first use, keeps track of
 * the slice views mounted for each page, and starts (or resumes)
 * playback when a page becomes visible.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_KARAOKEREGISTRY_H
#define PAGEWRIGHT_KARAOKEREGISTRY_H

#include <QList>
#include <QMap>
#include <QObject>
#include <QString>

#include <KSharedConfig>

#include <functional>
#include <map>
#include <memory>
#include <vector>

#include "audiohandle.h"
#include "karaokesource.h"

namespace Karaoke {

class PlaybackController;
class SliceView;

struct KaraokeSettings {
    int frameIntervalMs = 16;
    int initRetryLimit = 10;
    int initRetryIntervalMs = 100;

    static KaraokeSettings load();
    static KaraokeSettings load(const KSharedConfigPtr &config);
};

class KaraokeRegistry : public QObject
{
    Q_OBJECT

public:
    using AudioFactory = std::function<std::unique_ptr<AudioHandle>(const KaraokeSource &)>;

    explicit KaraokeRegistry(QObject *parent = nullptr);
    KaraokeRegistry(const KaraokeSettings &settings, AudioFactory audioFactory,
                    QObject *parent = nullptr);
    ~KaraokeRegistry() override;

    // Replaces the known sources; controllers of sources that disappeared
    // are disposed.
    void setSources(const QMap<QString, KaraokeSource> &sources);
    const QMap<QString, KaraokeSource> &sources() const { return m_sources; }

    // Lazily created; nullptr for an unknown id
    PlaybackController *controller(const QString &karaokeId);
    bool hasController(const QString &karaokeId) const;

    SliceView *mountSlice(int pageKey, const KaraokeSlice &slice);
    void unmountPage(int pageKey);
    QList<SliceView *> views(int pageKey) const;

    // Pauses every controller, then chooses the slice holding the resume
    // word (else the page's first slice) and plays it. A page without
    // slices leaves everything paused. A slice that
    // cannot be initialised yet is retried a bounded number of times.
    void onPageEnter(int pageKey);

    void dispose(const QString &karaokeId);
    void disposeAll();

    static std::unique_ptr<AudioHandle> clockAudio(const KaraokeSource &source);

Q_SIGNALS:
    void playbackStarted(const QString &karaokeId, int startChar);
    void initializationFailed(const QString &karaokeId);

private:
    void attemptPageEnter(int pageKey, quint64 token, int attempt);

    KaraokeSettings m_settings;
    AudioFactory m_audioFactory;
    QMap<QString, KaraokeSource> m_sources;
    std::map<QString, std::unique_ptr<PlaybackController>> m_controllers;
    std::map<int, std::vector<std::unique_ptr<SliceView>>> m_views;
    quint64 m_enterToken = 0;
};

} // namespace Karaoke

#endif // PAGEWRIGHT_KARAOKEREGISTRY_H
