#include "playback_timer.h"

QtPlaybackTimer::QtPlaybackTimer(QObject *parent)
    : QObject(parent)
{
    m_timer.setTimerType(Qt::PreciseTimer);
    m_timer.setSingleShot(false);
    connect(&m_timer, &QTimer::timeout, this, [this]() { fire(); });
}

void QtPlaybackTimer::start(int intervalMs)
{
    m_timer.start(intervalMs);
}

void QtPlaybackTimer::stop()
{
    m_timer.stop();
}

bool QtPlaybackTimer::isActive() const
{
    return m_timer.isActive();
}

int QtPlaybackTimer::interval() const
{
    return m_timer.interval();
}
