/*
 * audiohandle.h — Playback clock used by karaoke controllers
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef PAGEWRIGHT_AUDIOHANDLE_H
#define PAGEWRIGHT_AUDIOHANDLE_H

#include <QElapsedTimer>
#include <QString>

namespace Karaoke {

class AudioHandle
{
public:
    virtual ~AudioHandle() = default;

    virtual QString source() const = 0;

    virtual void play() = 0;
    virtual void pause() = 0;
    virtual bool isPlaying() const = 0;

    // Seconds
    virtual double currentTime() const = 0;
    virtual void setCurrentTime(double seconds) = 0;
    virtual double duration() const = 0;    // 0 when unknown

    virtual bool hasEnded() const
    {
        return duration() > 0 && currentTime() >= duration();
    }
};

// Wall-clock playback position; stands in for an audio device when only
// the timeline matters (headless runs, previews without sound).
class ClockAudioHandle : public AudioHandle
{
public:
    explicit ClockAudioHandle(const QString &source, double duration = 0);

    QString source() const override { return m_source; }

    void play() override;
    void pause() override;
    bool isPlaying() const override { return m_clock.isValid(); }

    double currentTime() const override;
    void setCurrentTime(double seconds) override;
    double duration() const override { return m_duration; }
    void setDuration(double seconds) { m_duration = seconds; }

private:
    QString m_source;
    double m_duration;
    double m_offset = 0;        // position when the clock was last started
    QElapsedTimer m_clock;      // invalid while paused
};

} // namespace Karaoke

#endif // PAGEWRIGHT_AUDIOHANDLE_H
