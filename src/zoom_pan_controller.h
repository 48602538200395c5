#pragma once
#include <QObject>
#include <QPoint>
#include <QPointF>
#include <QSize>

#include "view_transform.h"

enum class PanSource {
    Wheel,
    Drag
};

class ZoomPanController : public QObject
{
    Q_OBJECT

public:
    // One conventional wheel notch
    static constexpr int kWheelNotch = 120;
    static constexpr double kZoomStepPerNotch = 0.05;
    // Drag deltas are amplified relative to wheel deltas so that dragging
    // follows the pointer roughly 1:1.
    static constexpr double kPanStep = 1.0 / 6.0;
    static constexpr double kDragPanFactor = 6.0;

    explicit ZoomPanController(QObject *parent = nullptr);

    const ViewTransform& transform() const { return m_transform; }
    double scale() const { return m_transform.scale; }
    double minScale() const { return m_transform.minScale; }
    QPointF offset() const { return m_transform.offset; }

    void setContentSize(const QSize& size);
    void setViewportSize(const QSize& size);

    void zoomBy(int wheelDelta);
    void setScale(double scale);
    void scaleToFitViewport();
    void scaleToOriginalSize();

    // Scrollbar delta for a pointer/wheel movement
    QPoint panBy(const QPointF& delta, PanSource source) const;

    void recenterOffset();

    QPointF widgetToPixel(const QPointF& widgetPos) const;
    QPointF pixelToWidget(const QPointF& pixelPos) const;

signals:
    void scaleChanged(double scale);
    void transformChanged();

private:
    void applyScale(double scale);

    ViewTransform m_transform;
};
