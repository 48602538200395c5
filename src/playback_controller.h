#pragma once
#include <QObject>

#include <memory>

#include "playback_timer.h"

struct PlaybackState {
    int currentIndex = 1;       // 1-based, always within [1, maxIndex]
    int maxIndex = 1;
    bool isPlaying = false;
    bool viewerReady = true;
    int timeoutMs = 100;
    bool waitForReady = true;
};

/**
 * @brief Playback/seek state machine behind the sequence controls.
 *
 * Holds the current (1-based) frame index, the playback timer and the
 * "viewer ready" gate. While playing, every timer tick advances by one
 * frame unless waitForReady is set and the viewer has not acknowledged the
 * previous frame yet, in which case the tick is dropped. The timer period is
 * never changed by the gate, so a slow viewer simply skips ticks.
 *
 * Playback stops on the tick after the last frame was reached. Starting
 * playback while at the last frame restarts from frame 1.
 */
class PlaybackController : public QObject
{
    Q_OBJECT

public:
    explicit PlaybackController(int maxIndex = 1,
                                int timeoutMs = 100,
                                bool waitForReady = true,
                                std::unique_ptr<PlaybackTimer> timer = nullptr,
                                QObject *parent = nullptr);
    ~PlaybackController() override;

    const PlaybackState& state() const { return m_state; }
    int currentIndex() const { return m_state.currentIndex; }
    int maxIndex() const { return m_state.maxIndex; }
    bool isPlaying() const { return m_state.isPlaying; }
    bool isViewerReady() const { return m_state.viewerReady; }

    bool canStepBackward() const { return m_state.currentIndex > 1; }
    bool canStepForward() const { return m_state.currentIndex < m_state.maxIndex; }

    void setPlaybackTimeout(int timeoutMs);
    void setWaitForViewerReady(bool wait) { m_state.waitForReady = wait; }

public slots:
    void setMaxValue(int maxIndex);
    bool jumpTo(int index);
    void step(int delta);
    void togglePlayback();
    void startPlayback();
    void stopPlayback();
    void reset();
    void onTimerTick();
    void onViewerReady();

signals:
    // 1-based frame index
    void indexChanged(int index);
    void playbackStateChanged(bool playing);
    void stepAvailabilityChanged(bool canStepBackward, bool canStepForward);

private:
    void setPlaying(bool playing);

    PlaybackState m_state;
    std::unique_ptr<PlaybackTimer> m_timer;
};
