#include "image_canvas.h"
#include "zoom_pan_controller.h"

#include <QDebug>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QMimeData>
#include <QMouseEvent>
#include <QPainter>

#include <cmath>

ImageCanvas::ImageCanvas(ZoomPanController *zoom, QWidget *parent)
    : QWidget(parent)
    , m_zoom(zoom)
{
    setMouseTracking(true);
    setAcceptDrops(true);
    setAttribute(Qt::WA_OpaquePaintEvent);
}

void ImageCanvas::setPixmap(const QPixmap& pixmap)
{
    m_pixmap = pixmap;
    updateGeometry();
    update();
}

QSize ImageCanvas::sizeHint() const
{
    if (m_pixmap.isNull() || !m_zoom) return QSize(320, 240);
    return scaledContentSize(m_zoom->transform());
}

QPoint ImageCanvas::pixelAt(const QPointF& widgetPos) const
{
    if (m_pixmap.isNull() || !m_zoom) return QPoint(-1, -1);
    const QPointF px = m_zoom->widgetToPixel(widgetPos);
    const QPoint pixel(int(std::floor(px.x())), int(std::floor(px.y())));
    if (pixel.x() < 0 || pixel.y() < 0 || pixel.x() >= m_pixmap.width() || pixel.y() >= m_pixmap.height()) {
        return QPoint(-1, -1);
    }
    return pixel;
}

void ImageCanvas::paintEvent(QPaintEvent *event)
{
    Q_UNUSED(event);
    QPainter painter(this);
    painter.fillRect(rect(), palette().color(QPalette::Window));
    if (m_pixmap.isNull() || !m_zoom) return;

    const double scale = m_zoom->scale();
    // Nearest neighbour when magnifying so individual pixels stay visible
    painter.setRenderHint(QPainter::SmoothPixmapTransform, scale < 1.0);
    painter.scale(scale, scale);
    painter.drawPixmap(m_zoom->offset(), m_pixmap);
}

void ImageCanvas::mousePressEvent(QMouseEvent *event)
{
    handlePointerAction(m_pointer.press(event->button(), event->globalPosition()), event->position());
    event->accept();
}

void ImageCanvas::mouseMoveEvent(QMouseEvent *event)
{
    const QPoint pixel = pixelAt(event->position());
    if (pixel.x() >= 0) {
        emit mouseMoved(pixel);
    }
    handlePointerAction(m_pointer.move(event->globalPosition(), event->buttons()), event->position());
    event->accept();
}

void ImageCanvas::mouseReleaseEvent(QMouseEvent *event)
{
    handlePointerAction(m_pointer.release(event->button(), event->globalPosition()), event->position());
    event->accept();
}

void ImageCanvas::handlePointerAction(const PointerAction& action, const QPointF& localPos)
{
    switch (action.type) {
        case PointerAction::None:
            break;
        case PointerAction::PanStart:
            setCursor(Qt::ClosedHandCursor);
            Q_FALLTHROUGH();
        case PointerAction::PanMove:
            if (m_zoom) {
                emit panRequested(m_zoom->panBy(action.delta, PanSource::Drag));
            }
            break;
        case PointerAction::PanEnd:
            unsetCursor();
            break;
        case PointerAction::ClickLeft:
        case PointerAction::ClickMiddle:
        case PointerAction::ClickRight: {
            const QPoint pixel = pixelAt(localPos);
            if (pixel.x() < 0) break;
            if (action.type == PointerAction::ClickLeft) emit mouseClickedLeft(pixel);
            else if (action.type == PointerAction::ClickMiddle) emit mouseClickedMiddle(pixel);
            else emit mouseClickedRight(pixel);
            break;
        }
    }
}

void ImageCanvas::dragEnterEvent(QDragEnterEvent *event)
{
    if (DropClassifier::canAccept(event->mimeData())) {
        event->acceptProposedAction();
    } else {
        event->ignore();
    }
}

void ImageCanvas::dragMoveEvent(QDragMoveEvent *event)
{
    if (DropClassifier::canAccept(event->mimeData())) {
        event->acceptProposedAction();
    } else {
        event->ignore();
    }
}

void ImageCanvas::dropEvent(QDropEvent *event)
{
    const QMimeData *mime = event->mimeData();
    const QString path = mime ? DropClassifier::resolveDroppedPath(mime->urls()) : QString();
    if (path.isEmpty()) {
        event->ignore();
        return;
    }
    event->acceptProposedAction();
    qDebug() << "[ImageCanvas] Path dropped:" << path;
    emit pathDropped(path);
}
