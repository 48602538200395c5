#include "image_viewer.h"
#include "image_canvas.h"
#include "zoom_pan_controller.h"

#include <QDebug>
#include <QPixmap>
#include <QResizeEvent>
#include <QScrollBar>
#include <QWheelEvent>

ImageViewer::ImageViewer(QWidget *parent)
    : QScrollArea(parent)
    , m_zoom(new ZoomPanController(this))
{
    m_canvas = new ImageCanvas(m_zoom, this);
    setWidget(m_canvas);
    setWidgetResizable(false);
    setAlignment(Qt::AlignLeft | Qt::AlignTop);
    setFrameShape(QFrame::NoFrame);
    setFocusPolicy(Qt::StrongFocus);

    connect(m_zoom, &ZoomPanController::transformChanged, this, &ImageViewer::updateCanvasGeometry);
    connect(m_zoom, &ZoomPanController::scaleChanged, this, &ImageViewer::zoomChanged);

    connect(m_canvas, &ImageCanvas::panRequested, this, &ImageViewer::scrollBy);
    connect(m_canvas, &ImageCanvas::mouseClickedLeft, this, &ImageViewer::mouseClickedLeft);
    connect(m_canvas, &ImageCanvas::mouseClickedMiddle, this, &ImageViewer::mouseClickedMiddle);
    connect(m_canvas, &ImageCanvas::mouseClickedRight, this, &ImageViewer::mouseClickedRight);
    connect(m_canvas, &ImageCanvas::mouseMoved, this, &ImageViewer::mouseMoved);
    connect(m_canvas, &ImageCanvas::pathDropped, this, &ImageViewer::pathDropped);
}

ImageViewer::~ImageViewer() = default;

double ImageViewer::scale() const
{
    return m_zoom->scale();
}

void ImageViewer::presentFrame(const QImage& image, bool resetScale)
{
    m_canvas->setPixmap(QPixmap::fromImage(image));
    m_zoom->setViewportSize(viewport()->size());
    m_zoom->setContentSize(image.size());
    if (resetScale) {
        scaleToFitWindow();
    }
}

void ImageViewer::setScale(double scale)
{
    m_zoom->setScale(scale);
}

void ImageViewer::scaleToFitWindow()
{
    m_zoom->setViewportSize(viewport()->size());
    m_zoom->scaleToFitViewport();
}

void ImageViewer::scaleToOriginalSize()
{
    m_zoom->scaleToOriginalSize();
}

void ImageViewer::scrollBy(const QPoint& scrollDelta)
{
    horizontalScrollBar()->setValue(horizontalScrollBar()->value() + scrollDelta.x());
    verticalScrollBar()->setValue(verticalScrollBar()->value() + scrollDelta.y());
}

void ImageViewer::resizeEvent(QResizeEvent *event)
{
    QScrollArea::resizeEvent(event);
    m_zoom->setViewportSize(viewport()->size());
    updateCanvasGeometry();
}

void ImageViewer::wheelEvent(QWheelEvent *event)
{
    const QPoint angle = event->angleDelta();
    if (event->modifiers() & Qt::ControlModifier) {
        // Some platforms report shift+wheel as horizontal rotation
        int delta = angle.y() != 0 ? angle.y() : angle.x();
        if (event->modifiers() & Qt::ShiftModifier) {
            delta *= 10;
        }
        zoomAround(delta, event->position());
        event->accept();
        return;
    }

    scrollBy(m_zoom->panBy(QPointF(angle), PanSource::Wheel));
    event->accept();
}

void ImageViewer::zoomAround(int wheelDelta, const QPointF& viewportPos)
{
    const QPointF scroll(horizontalScrollBar()->value(), verticalScrollBar()->value());
    const QPointF pixel = m_zoom->widgetToPixel(viewportPos + scroll);

    m_zoom->zoomBy(wheelDelta);

    // Keep the pixel under the cursor where it was
    const QPointF widgetPos = m_zoom->pixelToWidget(pixel);
    const QPointF newScroll = widgetPos - viewportPos;
    horizontalScrollBar()->setValue(qRound(newScroll.x()));
    verticalScrollBar()->setValue(qRound(newScroll.y()));
}

void ImageViewer::updateCanvasGeometry()
{
    QSize size = viewport()->size();
    if (!m_canvas->pixmap().isNull()) {
        size = scaledContentSize(m_zoom->transform()).expandedTo(size);
    }
    if (m_canvas->size() != size) {
        m_canvas->resize(size);
    }
    m_canvas->update();
}
