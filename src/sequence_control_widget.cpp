#include "sequence_control_widget.h"
#include "playback_controller.h"

#include <QDebug>
#include <QFontMetrics>
#include <QHBoxLayout>
#include <QIcon>
#include <QKeyEvent>
#include <QLabel>
#include <QLineEdit>
#include <QSignalBlocker>
#include <QSlider>
#include <QStyle>
#include <QToolButton>

// Freedesktop theme icon with a style fallback for platforms without icon themes
static QIcon themeIcon(const QWidget *widget, const char *name, QStyle::StandardPixmap fallback)
{
    return QIcon::fromTheme(QString::fromLatin1(name), widget->style()->standardIcon(fallback));
}

SequenceControlWidget::SequenceControlWidget(int maxValue,
                                             const SequenceViewerOptions& options,
                                             QWidget *parent)
    : SequenceControlWidget(maxValue, options, nullptr, parent)
{
}

SequenceControlWidget::SequenceControlWidget(int maxValue,
                                             const SequenceViewerOptions& options,
                                             std::unique_ptr<PlaybackTimer> timer,
                                             QWidget *parent)
    : QWidget(parent)
    , m_keyBindings(defaultKeyBindings())
{
    m_controller = new PlaybackController(maxValue, options.playbackTimeoutMs,
                                          options.waitForViewerReady, std::move(timer), this);
    setupUi(options);

    connect(m_controller, &PlaybackController::indexChanged,
            this, &SequenceControlWidget::onControllerIndexChanged);
    connect(m_controller, &PlaybackController::playbackStateChanged,
            this, &SequenceControlWidget::onPlaybackStateChanged);

    onControllerIndexChanged(m_controller->currentIndex());
}

SequenceControlWidget::~SequenceControlWidget() = default;

void SequenceControlWidget::setupUi(const SequenceViewerOptions& options)
{
    // Automatic playback (toggles between play and pause)
    m_playbackBtn = new QToolButton(this);
    m_playbackBtn->setIcon(themeIcon(this, "media-playback-start", QStyle::SP_MediaPlay));
    m_playbackBtn->setToolTip("Toggle play/pause");
    connect(m_playbackBtn, &QToolButton::clicked, m_controller, &PlaybackController::togglePlayback);

    m_resetBtn = new QToolButton(this);
    m_resetBtn->setIcon(themeIcon(this, "view-refresh", QStyle::SP_BrowserReload));
    m_resetBtn->setToolTip("Reset sequence");
    connect(m_resetBtn, &QToolButton::clicked, m_controller, &PlaybackController::reset);

    m_prevFrameBtn = new QToolButton(this);
    m_prevFrameBtn->setIcon(themeIcon(this, "go-previous", QStyle::SP_ArrowBack));
    m_prevFrameBtn->setToolTip("Previous frame");
    connect(m_prevFrameBtn, &QToolButton::clicked, this, [this]() { m_controller->step(-1); });

    m_nextFrameBtn = new QToolButton(this);
    m_nextFrameBtn->setIcon(themeIcon(this, "go-next", QStyle::SP_ArrowForward));
    m_nextFrameBtn->setToolTip("Next frame");
    connect(m_nextFrameBtn, &QToolButton::clicked, this, [this]() { m_controller->step(+1); });

    m_slider = new QSlider(Qt::Horizontal, this);
    m_slider->setRange(1, m_controller->maxIndex());
    m_slider->setMinimumWidth(100);
    connect(m_slider, &QSlider::valueChanged, this, &SequenceControlWidget::onSliderValueChanged);

    m_currentValueLabel = new QLabel(this);
    m_currentValueLabel->setAlignment(Qt::AlignRight | Qt::AlignVCenter);
    updateLabelWidth();

    m_manualInput = new QLineEdit(this);
    m_manualInput->setFixedWidth(100);
    m_manualInput->setPlaceholderText("Jump to:");
    m_manualInput->setToolTip("Enter frame to jump to");
    connect(m_manualInput, &QLineEdit::returnPressed, this, &SequenceControlWidget::onManualInputReturn);

    QHBoxLayout *layout = new QHBoxLayout(this);
    layout->setContentsMargins(4, 2, 4, 2);

    if (options.includeSequenceNavigationButtons) {
        m_prevSequenceBtn = new QToolButton(this);
        m_prevSequenceBtn->setIcon(themeIcon(this, "go-up", QStyle::SP_ArrowUp));
        m_prevSequenceBtn->setToolTip("Previous sequence");
        connect(m_prevSequenceBtn, &QToolButton::clicked, this, &SequenceControlWidget::previousSequenceRequest);

        m_nextSequenceBtn = new QToolButton(this);
        m_nextSequenceBtn->setIcon(themeIcon(this, "go-down", QStyle::SP_ArrowDown));
        m_nextSequenceBtn->setToolTip("Next sequence");
        connect(m_nextSequenceBtn, &QToolButton::clicked, this, &SequenceControlWidget::nextSequenceRequest);

        layout->addWidget(m_prevSequenceBtn);
        layout->addWidget(m_nextSequenceBtn);
    }
    layout->addWidget(m_prevFrameBtn);
    layout->addWidget(m_nextFrameBtn);
    layout->addWidget(m_playbackBtn);
    layout->addWidget(m_resetBtn);
    layout->addWidget(m_slider);
    layout->addWidget(m_currentValueLabel);
    layout->addWidget(m_manualInput);

    if (options.includeZoomButtons) {
        m_zoomFitBtn = new QToolButton(this);
        m_zoomFitBtn->setIcon(themeIcon(this, "zoom-fit-best", QStyle::SP_TitleBarMaxButton));
        m_zoomFitBtn->setToolTip("Fit to window");
        connect(m_zoomFitBtn, &QToolButton::clicked, this, &SequenceControlWidget::zoomFitToWindowRequest);

        m_zoomOriginalBtn = new QToolButton(this);
        m_zoomOriginalBtn->setIcon(themeIcon(this, "zoom-original", QStyle::SP_TitleBarNormalButton));
        m_zoomOriginalBtn->setToolTip("Show at original size");
        connect(m_zoomOriginalBtn, &QToolButton::clicked, this, &SequenceControlWidget::zoomOriginalSizeRequest);

        layout->addWidget(m_zoomFitBtn);
        layout->addWidget(m_zoomOriginalBtn);
    }
}

int SequenceControlWidget::currentIndex() const
{
    return m_controller->currentIndex();
}

void SequenceControlWidget::setMaxValue(int maxValue)
{
    {
        // The controller re-emits index 1 below, the slider follows from there
        QSignalBlocker blocker(m_slider);
        m_slider->setRange(1, qMax(1, maxValue));
    }
    m_controller->setMaxValue(maxValue);
    updateLabelWidth();
}

void SequenceControlWidget::onViewerReady()
{
    m_controller->onViewerReady();
}

void SequenceControlWidget::focusOnManualInput()
{
    m_manualInput->setFocus();
    m_manualInput->selectAll();
}

bool SequenceControlWidget::handleKey(int key)
{
    const KeyBinding *binding = findKeyBinding(key, m_keyBindings);
    if (!binding) return false;
    applyKeyBinding(*m_controller, *binding);
    return true;
}

void SequenceControlWidget::keyPressEvent(QKeyEvent *event)
{
    if (isUnmodifiedKeyPress(event->modifiers()) && handleKey(event->key())) {
        event->accept();
        return;
    }
    QWidget::keyPressEvent(event);
}

void SequenceControlWidget::onControllerIndexChanged(int index)
{
    {
        QSignalBlocker blocker(m_slider);
        m_slider->setValue(index);
    }
    m_prevFrameBtn->setEnabled(m_controller->canStepBackward());
    m_nextFrameBtn->setEnabled(m_controller->canStepForward());
    m_currentValueLabel->setText(QString::number(index));
    emit indexChanged(index);
}

void SequenceControlWidget::onPlaybackStateChanged(bool playing)
{
    if (playing) {
        m_playbackBtn->setIcon(themeIcon(this, "media-playback-pause", QStyle::SP_MediaPause));
    } else {
        m_playbackBtn->setIcon(themeIcon(this, "media-playback-start", QStyle::SP_MediaPlay));
    }
}

void SequenceControlWidget::onSliderValueChanged(int value)
{
    if (value == m_controller->currentIndex()) return;
    m_controller->jumpTo(value);
}

void SequenceControlWidget::onManualInputReturn()
{
    bool ok = false;
    const int value = m_manualInput->text().trimmed().toInt(&ok);
    if (ok) {
        m_controller->stopPlayback();
        m_controller->jumpTo(value);
    } else {
        qDebug() << "[SequenceControlWidget] Ignoring manual input" << m_manualInput->text();
    }
    // Always reset the input
    m_manualInput->clear();
}

void SequenceControlWidget::updateLabelWidth()
{
    const QFontMetrics metrics(font());
    // Minor padding so the widest index never touches the slider
    m_currentValueLabel->setFixedWidth(metrics.horizontalAdvance(QString::number(m_controller->maxIndex())) + 10);
}
