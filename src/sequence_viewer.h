#pragma once
#include <QWidget>

#include <memory>

#include "image_sequence.h"
#include "viewer_settings.h"

class ImageViewer;
class PlaybackTimer;
class SequenceControlWidget;
class SequenceNavigator;

/**
 * @brief Image viewer plus playback controls for an ImageSequence.
 *
 * Every index change of the controls fetches the frame from the sequence,
 * shows it and acknowledges it back to the playback controller, which gates
 * timer-driven playback to the rendering rate.
 */
class SequenceViewer : public QWidget
{
    Q_OBJECT

public:
    explicit SequenceViewer(std::shared_ptr<ImageSequence> sequence,
                            const SequenceViewerOptions& options = SequenceViewerOptions(),
                            QWidget *parent = nullptr);
    SequenceViewer(std::shared_ptr<ImageSequence> sequence,
                   const SequenceViewerOptions& options,
                   std::unique_ptr<PlaybackTimer> timer,
                   QWidget *parent = nullptr);
    ~SequenceViewer() override;

    // Returns nullptr and fills errorMessage if the sequence is null or empty.
    static std::unique_ptr<SequenceViewer> create(std::shared_ptr<ImageSequence> sequence,
                                                  const SequenceViewerOptions& options = SequenceViewerOptions(),
                                                  QString *errorMessage = nullptr,
                                                  QWidget *parent = nullptr);

    // Null or empty sequences are rejected and the current one is kept.
    bool setSequence(std::shared_ptr<ImageSequence> sequence);
    std::shared_ptr<ImageSequence> imageSequence() const;

    int currentIndex() const;
    ImageViewer* imageViewer() const { return m_viewer; }
    SequenceControlWidget* controls() const { return m_controls; }

signals:
    void indexChanged(int index);
    void previousSequenceRequest();
    void nextSequenceRequest();
    void zoomChanged(double scale);
    void mouseClickedLeft(const QPoint& pixel);
    void mouseClickedMiddle(const QPoint& pixel);
    void mouseClickedRight(const QPoint& pixel);
    void mouseMoved(const QPoint& pixel);
    void pathDropped(const QString& path);

protected:
    void keyPressEvent(QKeyEvent *event) override;

private:
    static QString validateSequence(const std::shared_ptr<ImageSequence>& sequence);
    void setupUi(const SequenceViewerOptions& options, std::unique_ptr<PlaybackTimer> timer);

    ImageViewer *m_viewer = nullptr;
    SequenceControlWidget *m_controls = nullptr;
    SequenceNavigator *m_navigator = nullptr;
};
