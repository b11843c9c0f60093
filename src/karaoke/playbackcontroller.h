/*
 * playbackcontroller.h — Word highlighting synchronised to audio
 *
 * One controller per karaoke source. It drives a frame loop that reads
 * the audio clock and fills the words of the active slice view. When
 * playback runs past the last word of a slice and the text continues on
 * a later page, the controller pauses and records where to resume.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_PLAYBACKCONTROLLER_H
#define PAGEWRIGHT_PLAYBACKCONTROLLER_H

#include <QList>
#include <QObject>
#include <QTimer>

#include <memory>
#include <optional>

#include "audiohandle.h"
#include "karaokesource.h"

namespace Karaoke {

class SliceView;

struct PlaybackState {
    std::optional<int> resumeWordIndex;
    std::optional<double> resumeTime;
    bool waitingForNextPage = false;

    void clear() { *this = PlaybackState(); }
};

struct PlayOptions {
    std::optional<int> resumeWordIndex;
    std::optional<double> resumeTime;

    bool isResuming() const { return resumeWordIndex.has_value() || resumeTime.has_value(); }
};

class PlaybackController : public QObject
{
    Q_OBJECT

public:
    PlaybackController(const KaraokeSource &source, std::unique_ptr<AudioHandle> audio,
                       int frameIntervalMs = 16, QObject *parent = nullptr);
    ~PlaybackController() override;

    const KaraokeSource &source() const { return m_source; }
    QString karaokeId() const { return m_source.id; }
    AudioHandle *audio() const { return m_audio.get(); }

    const PlaybackState &state() const { return m_state; }
    // Resume options for the next page, empty when there is nothing to resume
    PlayOptions resumeOptions() const;
    // Source offset of the word playback resumes at
    std::optional<int> resumeCharStart() const;

    // Views of this source currently on screen; the controller does not
    // own them and forgets a view when it is unregistered.
    void registerView(SliceView *view);
    void unregisterView(SliceView *view);
    SliceView *activeView() const { return m_activeView; }

    bool playSlice(SliceView *view, const PlayOptions &options = {});
    void advanceFrame();
    void pause();
    void stop();
    void dispose();
    bool isDisposed() const { return m_disposed; }
    bool isLoopActive() const { return m_frameTimer.isActive(); }

public Q_SLOTS:
    void handleEnded();

Q_SIGNALS:
    void waitingForNextPage(const QString &karaokeId, int resumeWordIndex, double resumeTime);
    void playbackEnded(const QString &karaokeId);

private:
    void cancelLoop();
    void resetHighlighting();
    void updateWords(SliceView *view, double t);
    std::optional<WordCharRange> wordAt(int index) const;

    KaraokeSource m_source;
    std::unique_ptr<AudioHandle> m_audio;
    QTimer m_frameTimer;
    PlaybackState m_state;

    QList<SliceView *> m_views;
    SliceView *m_activeView = nullptr;
    // Words before this index stay complete on the active slice
    std::optional<int> m_sliceResumeWordIndex;
    bool m_disposed = false;
};

} // namespace Karaoke

#endif // PAGEWRIGHT_PLAYBACKCONTROLLER_H
