/*
 * audiohandle.cpp — Playback clock used by karaoke controllers
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "audiohandle.h"

#include <QtGlobal>

namespace Karaoke {

ClockAudioHandle::ClockAudioHandle(const QString &source, double duration)
    : m_source(source)
    , m_duration(duration)
{
}

void ClockAudioHandle::play()
{
    if (m_clock.isValid())
        return;
    if (m_duration > 0 && m_offset >= m_duration)
        m_offset = 0;
    m_clock.start();
}

void ClockAudioHandle::pause()
{
    if (!m_clock.isValid())
        return;
    m_offset = currentTime();
    m_clock.invalidate();
}

double ClockAudioHandle::currentTime() const
{
    double t = m_offset;
    if (m_clock.isValid())
        t += m_clock.elapsed() / 1000.0;
    if (m_duration > 0)
        t = qMin(t, m_duration);
    return t;
}

void ClockAudioHandle::setCurrentTime(double seconds)
{
    m_offset = qMax(0.0, seconds);
    if (m_duration > 0)
        m_offset = qMin(m_offset, m_duration);
    if (m_clock.isValid())
        m_clock.restart();
}

} // namespace Karaoke
