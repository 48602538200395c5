#include "zoom_pan_controller.h"

#include <QDebug>
#include <QtMath>

#include <cmath>

ZoomPanController::ZoomPanController(QObject *parent)
    : QObject(parent)
{
}

void ZoomPanController::setContentSize(const QSize& size)
{
    m_transform.contentSize = size;
    m_transform.minScale = minimumScaleFor(size);
    applyScale(m_transform.scale);
}

void ZoomPanController::setViewportSize(const QSize& size)
{
    if (m_transform.viewportSize == size) return;
    m_transform.viewportSize = size;
    recenterOffset();
    emit transformChanged();
}

void ZoomPanController::zoomBy(int wheelDelta)
{
    applyScale(m_transform.scale + kZoomStepPerNotch * wheelDelta / double(kWheelNotch));
}

void ZoomPanController::setScale(double scale)
{
    if (!(scale > 0.0) || std::isinf(scale)) {
        qWarning() << "[ZoomPanController] Ignoring invalid scale" << scale;
        return;
    }
    applyScale(scale);
}

void ZoomPanController::scaleToFitViewport()
{
    const double fit = fitToViewportScale(m_transform.contentSize, m_transform.viewportSize);
    if (fit <= 0.0) return;
    applyScale(fit);
}

void ZoomPanController::scaleToOriginalSize()
{
    applyScale(1.0);
}

QPoint ZoomPanController::panBy(const QPointF& delta, PanSource source) const
{
    const double factor = kPanStep * (source == PanSource::Drag ? kDragPanFactor : 1.0);
    return QPoint(-qRound(delta.x() * factor), -qRound(delta.y() * factor));
}

void ZoomPanController::recenterOffset()
{
    m_transform.offset = centeringOffset(m_transform.contentSize, m_transform.viewportSize, m_transform.scale);
}

QPointF ZoomPanController::widgetToPixel(const QPointF& widgetPos) const
{
    return ::widgetToPixel(widgetPos, m_transform);
}

QPointF ZoomPanController::pixelToWidget(const QPointF& pixelPos) const
{
    return ::pixelToWidget(pixelPos, m_transform);
}

void ZoomPanController::applyScale(double scale)
{
    const double clamped = clampScale(scale, m_transform.minScale);
    const bool changed = !qFuzzyCompare(clamped, m_transform.scale);
    m_transform.scale = clamped;
    recenterOffset();
    emit transformChanged();
    if (changed) {
        emit scaleChanged(m_transform.scale);
    }
}
