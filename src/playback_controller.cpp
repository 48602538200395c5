#include "playback_controller.h"

#include <QDebug>

PlaybackController::PlaybackController(int maxIndex,
                                       int timeoutMs,
                                       bool waitForReady,
                                       std::unique_ptr<PlaybackTimer> timer,
                                       QObject *parent)
    : QObject(parent)
    , m_timer(std::move(timer))
{
    if (!m_timer) {
        m_timer = std::make_unique<QtPlaybackTimer>();
    }
    m_timer->setTimeoutHandler([this]() { onTimerTick(); });

    m_state.maxIndex = qMax(1, maxIndex);
    m_state.timeoutMs = timeoutMs > 0 ? timeoutMs : 100;
    m_state.waitForReady = waitForReady;
}

PlaybackController::~PlaybackController()
{
    m_timer->stop();
    m_timer->setTimeoutHandler(nullptr);
}

void PlaybackController::setPlaybackTimeout(int timeoutMs)
{
    if (timeoutMs <= 0) {
        qWarning() << "[PlaybackController] Ignoring invalid playback timeout:" << timeoutMs;
        return;
    }
    m_state.timeoutMs = timeoutMs;
    if (m_state.isPlaying) {
        // Re-arm so the new period applies immediately
        m_timer->start(m_state.timeoutMs);
    }
}

void PlaybackController::setMaxValue(int maxIndex)
{
    if (maxIndex < 1) {
        qWarning() << "[PlaybackController] Sequence length must be at least 1, got" << maxIndex;
        maxIndex = 1;
    }
    stopPlayback();
    m_state.maxIndex = maxIndex;
    m_state.currentIndex = 0;
    jumpTo(1);
}

bool PlaybackController::jumpTo(int index)
{
    if (index < 1 || index > m_state.maxIndex) {
        qDebug() << "[PlaybackController] Ignoring out-of-range index" << index
                 << "(valid: 1 -" << m_state.maxIndex << ")";
        return false;
    }
    m_state.currentIndex = index;
    m_state.viewerReady = false;
    emit indexChanged(index);
    emit stepAvailabilityChanged(canStepBackward(), canStepForward());
    return true;
}

void PlaybackController::step(int delta)
{
    if (delta == 0) return;
    if (delta < 0 && !canStepBackward()) return;
    if (delta > 0 && !canStepForward()) return;

    jumpTo(m_state.currentIndex + delta);
    // A manual step always stops playback
    stopPlayback();
}

void PlaybackController::togglePlayback()
{
    if (m_state.isPlaying) {
        stopPlayback();
    } else {
        startPlayback();
    }
}

void PlaybackController::startPlayback()
{
    if (m_state.isPlaying) return;

    if (m_state.currentIndex >= m_state.maxIndex) {
        // Restart from the beginning
        jumpTo(1);
    }
    m_timer->start(m_state.timeoutMs);
    setPlaying(true);
}

void PlaybackController::stopPlayback()
{
    m_timer->stop();
    setPlaying(false);
}

void PlaybackController::reset()
{
    stopPlayback();
    jumpTo(1);
}

void PlaybackController::onTimerTick()
{
    if (!m_state.isPlaying) return;

    if (m_state.waitForReady && !m_state.viewerReady) {
        // Viewer has not shown the last frame yet, skip this tick
        return;
    }
    if (m_state.currentIndex < m_state.maxIndex) {
        jumpTo(m_state.currentIndex + 1);
    } else {
        stopPlayback();
    }
}

void PlaybackController::onViewerReady()
{
    m_state.viewerReady = true;
}

void PlaybackController::setPlaying(bool playing)
{
    if (m_state.isPlaying == playing) return;
    m_state.isPlaying = playing;
    emit playbackStateChanged(playing);
}
