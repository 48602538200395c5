#pragma once
#include <QWidget>

#include <memory>

#include "key_bindings.h"
#include "playback_timer.h"
#include "viewer_settings.h"

class PlaybackController;
class QLabel;
class QLineEdit;
class QSlider;
class QToolButton;

/**
 * Playback/seeking controls for a sequence.
 *
 * Layout: [prev/next sequence] prev/next frame, play/pause, reset, slider,
 * current index, "Jump to" input, [fit/original zoom]. The emitted index
 * is 1-based. All state lives in the PlaybackController; the widgets only
 * mirror it.
 */
class SequenceControlWidget : public QWidget
{
    Q_OBJECT

public:
    explicit SequenceControlWidget(int maxValue,
                                   const SequenceViewerOptions& options = SequenceViewerOptions(),
                                   QWidget *parent = nullptr);
    // For tests: drive playback with a custom tick source
    SequenceControlWidget(int maxValue,
                          const SequenceViewerOptions& options,
                          std::unique_ptr<PlaybackTimer> timer,
                          QWidget *parent = nullptr);
    ~SequenceControlWidget() override;

    PlaybackController* controller() const { return m_controller; }
    int currentIndex() const;

    void setKeyBindings(const KeyBindingTable& bindings) { m_keyBindings = bindings; }
    const KeyBindingTable& keyBindings() const { return m_keyBindings; }

    // Returns true if the key was bound to a playback action
    bool handleKey(int key);

public slots:
    void setMaxValue(int maxValue);
    void onViewerReady();
    void focusOnManualInput();

signals:
    void indexChanged(int index);
    void zoomOriginalSizeRequest();
    void zoomFitToWindowRequest();
    void previousSequenceRequest();
    void nextSequenceRequest();

protected:
    void keyPressEvent(QKeyEvent *event) override;

private slots:
    void onControllerIndexChanged(int index);
    void onPlaybackStateChanged(bool playing);
    void onSliderValueChanged(int value);
    void onManualInputReturn();

private:
    void setupUi(const SequenceViewerOptions& options);
    void updateLabelWidth();

    PlaybackController *m_controller = nullptr;
    KeyBindingTable m_keyBindings;

    QToolButton *m_playbackBtn = nullptr;
    QToolButton *m_resetBtn = nullptr;
    QToolButton *m_prevFrameBtn = nullptr;
    QToolButton *m_nextFrameBtn = nullptr;
    QToolButton *m_prevSequenceBtn = nullptr;
    QToolButton *m_nextSequenceBtn = nullptr;
    QToolButton *m_zoomFitBtn = nullptr;
    QToolButton *m_zoomOriginalBtn = nullptr;
    QSlider *m_slider = nullptr;
    QLineEdit *m_manualInput = nullptr;
    QLabel *m_currentValueLabel = nullptr;
};
