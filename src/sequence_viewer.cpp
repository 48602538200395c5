#include "sequence_viewer.h"
#include "image_viewer.h"
#include "playback_controller.h"
#include "sequence_control_widget.h"
#include "sequence_navigator.h"

#include <QApplication>
#include <QDebug>
#include <QKeyEvent>
#include <QVBoxLayout>

SequenceViewer::SequenceViewer(std::shared_ptr<ImageSequence> sequence,
                               const SequenceViewerOptions& options,
                               QWidget *parent)
    : SequenceViewer(std::move(sequence), options, nullptr, parent)
{
}

SequenceViewer::SequenceViewer(std::shared_ptr<ImageSequence> sequence,
                               const SequenceViewerOptions& options,
                               std::unique_ptr<PlaybackTimer> timer,
                               QWidget *parent)
    : QWidget(parent)
{
    setupUi(options, std::move(timer));
    setSequence(std::move(sequence));
}

SequenceViewer::~SequenceViewer()
{
    // Stop ticks before the navigator and viewer go away
    m_controls->controller()->stopPlayback();
}

void SequenceViewer::setupUi(const SequenceViewerOptions& options, std::unique_ptr<PlaybackTimer> timer)
{
    m_viewer = new ImageViewer(this);
    m_viewer->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);

    m_controls = new SequenceControlWidget(1, options, std::move(timer), this);
    m_controls->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Minimum);

    m_navigator = new SequenceNavigator(m_viewer, this);

    connect(m_controls, &SequenceControlWidget::indexChanged, m_navigator, &SequenceNavigator::onIndexChanged);
    connect(m_navigator, &SequenceNavigator::frameDelivered, m_controls, &SequenceControlWidget::onViewerReady);
    connect(m_controls, &SequenceControlWidget::indexChanged, this, &SequenceViewer::indexChanged);

    connect(m_controls, &SequenceControlWidget::previousSequenceRequest, this, &SequenceViewer::previousSequenceRequest);
    connect(m_controls, &SequenceControlWidget::nextSequenceRequest, this, &SequenceViewer::nextSequenceRequest);
    connect(m_controls, &SequenceControlWidget::zoomFitToWindowRequest, m_viewer, &ImageViewer::scaleToFitWindow);
    connect(m_controls, &SequenceControlWidget::zoomOriginalSizeRequest, m_viewer, &ImageViewer::scaleToOriginalSize);

    connect(m_viewer, &ImageViewer::zoomChanged, this, &SequenceViewer::zoomChanged);
    connect(m_viewer, &ImageViewer::mouseClickedLeft, this, &SequenceViewer::mouseClickedLeft);
    connect(m_viewer, &ImageViewer::mouseClickedMiddle, this, &SequenceViewer::mouseClickedMiddle);
    connect(m_viewer, &ImageViewer::mouseClickedRight, this, &SequenceViewer::mouseClickedRight);
    connect(m_viewer, &ImageViewer::mouseMoved, this, &SequenceViewer::mouseMoved);
    connect(m_viewer, &ImageViewer::pathDropped, this, &SequenceViewer::pathDropped);

    QVBoxLayout *layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);
    layout->addWidget(m_viewer);
    layout->addWidget(m_controls);
}

std::unique_ptr<SequenceViewer> SequenceViewer::create(std::shared_ptr<ImageSequence> sequence,
                                                      const SequenceViewerOptions& options,
                                                      QString *errorMessage,
                                                      QWidget *parent)
{
    const QString error = validateSequence(sequence);
    if (!error.isEmpty()) {
        qWarning() << "[SequenceViewer]" << error;
        if (errorMessage) *errorMessage = error;
        return nullptr;
    }
    return std::make_unique<SequenceViewer>(std::move(sequence), options, parent);
}

QString SequenceViewer::validateSequence(const std::shared_ptr<ImageSequence>& sequence)
{
    if (!sequence) {
        return QString("No image sequence given");
    }
    if (sequence->length() < 1) {
        const QString name = sequence->displayName();
        return name.isEmpty() ? QString("Image sequence is empty")
                              : QString("Image sequence is empty: %1").arg(name);
    }
    return QString();
}

bool SequenceViewer::setSequence(std::shared_ptr<ImageSequence> sequence)
{
    const QString error = validateSequence(sequence);
    if (!error.isEmpty()) {
        qWarning() << "[SequenceViewer] Keeping current sequence:" << error;
        return false;
    }
    qDebug() << "[SequenceViewer] Showing sequence" << sequence->displayName()
             << "with" << sequence->length() << "frames";
    m_navigator->setSequence(std::move(sequence));
    // Resets to index 1, which shows the first frame
    m_controls->setMaxValue(m_navigator->length());
    return true;
}

std::shared_ptr<ImageSequence> SequenceViewer::imageSequence() const
{
    return m_navigator->sequence();
}

int SequenceViewer::currentIndex() const
{
    return m_controls->currentIndex();
}

void SequenceViewer::keyPressEvent(QKeyEvent *event)
{
    // Shortcuts work regardless of which child has focus
    if (isUnmodifiedKeyPress(event->modifiers()) && m_controls->handleKey(event->key())) {
        event->accept();
        return;
    }
    QWidget::keyPressEvent(event);
}
