/*
 * playbackcontroller.cpp — Word highlighting synchronised to audio
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "playbackcontroller.h"

#include <QDebug>

#include "sliceview.h"

namespace Karaoke {

namespace {
constexpr double kMinWordDuration = 0.001;
constexpr double kResumeAfterLastWord = 0.01;
}

PlaybackController::PlaybackController(const KaraokeSource &source,
                                       std::unique_ptr<AudioHandle> audio,
                                       int frameIntervalMs, QObject *parent)
    : QObject(parent)
    , m_source(source)
    , m_audio(std::move(audio))
{
    m_frameTimer.setInterval(qMax(1, frameIntervalMs));
    connect(&m_frameTimer, &QTimer::timeout, this, &PlaybackController::advanceFrame);
}

PlaybackController::~PlaybackController()
{
    dispose();
}

std::optional<WordCharRange> PlaybackController::wordAt(int index) const
{
    if (index < 0 || index >= m_source.wordCharRanges.size())
        return std::nullopt;
    return m_source.wordCharRanges.at(index);
}

PlayOptions PlaybackController::resumeOptions() const
{
    if (!m_state.resumeWordIndex || !m_state.resumeTime)
        return {};
    return {m_state.resumeWordIndex, m_state.resumeTime};
}

std::optional<int> PlaybackController::resumeCharStart() const
{
    if (!m_state.resumeWordIndex)
        return std::nullopt;
    const std::optional<WordCharRange> word = wordAt(*m_state.resumeWordIndex);
    if (!word)
        return std::nullopt;
    return word->charStart;
}

void PlaybackController::registerView(SliceView *view)
{
    if (view && !m_views.contains(view))
        m_views.append(view);
}

void PlaybackController::unregisterView(SliceView *view)
{
    m_views.removeAll(view);
    if (m_activeView == view) {
        m_activeView = nullptr;
        m_audio->pause();
        cancelLoop();
    }
}

void PlaybackController::cancelLoop()
{
    m_frameTimer.stop();
}

void PlaybackController::resetHighlighting()
{
    for (SliceView *view : std::as_const(m_views))
        view->resetHighlight();
}

bool PlaybackController::playSlice(SliceView *view, const PlayOptions &options)
{
    if (m_disposed || !view)
        return false;
    if (!view->ensureInitialized(&m_source)) {
        qWarning() << "PlaybackController:" << m_source.id
                   << "failed to initialise slice, not starting playback";
        return false;
    }
    registerView(view);

    m_audio->pause();
    cancelLoop();

    const bool resuming = options.isResuming();
    if (!resuming) {
        resetHighlighting();
        m_state.clear();
    }

    double startTime = 0;
    if (options.resumeTime) {
        startTime = *options.resumeTime;
    } else if (options.resumeWordIndex) {
        if (const std::optional<WordCharRange> word = wordAt(*options.resumeWordIndex))
            startTime = word->start;
    } else {
        const int first = view->slice().startChar;
        if (first >= 0 && first < m_source.letterTimings.size() && m_source.letterTimings.at(first))
            startTime = m_source.letterTimings.at(first)->start;
    }

    m_activeView = view;
    m_sliceResumeWordIndex = options.resumeWordIndex;

    m_audio->setCurrentTime(resuming ? startTime : 0);
    m_audio->play();
    updateWords(view, m_audio->currentTime());
    m_frameTimer.start();
    return true;
}

void PlaybackController::updateWords(SliceView *view, double t)
{
    const QList<WordEntry> &words = view->words();
    for (int i = 0; i < words.size(); ++i) {
        const WordEntry &word = words.at(i);
        if (m_sliceResumeWordIndex && word.wordIndex < *m_sliceResumeWordIndex) {
            view->markComplete(i);
            continue;
        }
        const double duration = qMax(word.end - word.start, kMinWordDuration);
        view->setWordProgress(i, (t - word.start) / duration);
    }
}

void PlaybackController::advanceFrame()
{
    SliceView *view = m_activeView;
    if (!view || !view->isConnected()) {
        cancelLoop();
        return;
    }
    if (m_audio->hasEnded()) {
        handleEnded();
        return;
    }

    const double t = m_audio->currentTime();
    updateWords(view, t);

    if (m_state.waitingForNextPage) {
        bool passed = false;
        if (const std::optional<WordCharRange> resumeWord =
                wordAt(m_state.resumeWordIndex.value_or(-1)))
            passed = t >= resumeWord->start;
        else if (m_state.resumeTime)
            passed = t >= *m_state.resumeTime;
        if (passed)
            m_state.clear();
    }

    const QList<WordEntry> &words = view->words();
    const bool moreText = view->slice().endChar < m_source.text.size();
    if (!moreText || words.isEmpty() || m_state.waitingForNextPage)
        return;

    const std::optional<WordCharRange> lastWord = wordAt(words.last().wordIndex);
    if (!lastWord || t < lastWord->end)
        return;

    std::optional<WordCharRange> nextWord;
    for (int i = lastWord->wordIndex + 1; i < m_source.wordCharRanges.size(); ++i) {
        if (m_source.wordCharRanges.at(i)) {
            nextWord = m_source.wordCharRanges.at(i);
            break;
        }
    }

    m_state.resumeWordIndex = nextWord ? nextWord->wordIndex : lastWord->wordIndex;
    m_state.resumeTime = nextWord ? nextWord->start : lastWord->end + kResumeAfterLastWord;
    m_state.waitingForNextPage = true;

    m_audio->pause();
    cancelLoop();
    qDebug() << "PlaybackController:" << m_source.id << "reached slice end, resume at word"
             << *m_state.resumeWordIndex;
    Q_EMIT waitingForNextPage(m_source.id, *m_state.resumeWordIndex, *m_state.resumeTime);
}

void PlaybackController::handleEnded()
{
    cancelLoop();
    resetHighlighting();
    m_state.clear();
    m_activeView = nullptr;
    m_sliceResumeWordIndex.reset();
    Q_EMIT playbackEnded(m_source.id);
}

void PlaybackController::pause()
{
    m_audio->pause();
    cancelLoop();
}

void PlaybackController::stop()
{
    m_audio->pause();
    m_audio->setCurrentTime(0);
    cancelLoop();
    m_activeView = nullptr;
    m_sliceResumeWordIndex.reset();
    m_state.clear();
}

void PlaybackController::dispose()
{
    if (m_disposed)
        return;
    stop();
    m_views.clear();
    m_disposed = true;
}

} // namespace Karaoke
