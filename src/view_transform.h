#pragma once
#include <QPointF>
#include <QSize>
#include <QSizeF>

// Smallest on-screen size (in device-independent pixels) of the shorter image side.
constexpr double kMinDisplayedSidePx = 32.0;

/**
 * Scale and centering state of the image canvas.
 *
 * Widget coordinates relate to image pixel coordinates by
 *   pixel  = widget / scale - offset
 *   widget = (pixel + offset) * scale
 * where offset is non-zero only along axes on which the scaled image is
 * smaller than the viewport (the image is centered there).
 */
struct ViewTransform {
    double scale = 1.0;
    double minScale = 1.0;
    QSize contentSize;
    QSize viewportSize;
    QPointF offset;
};

double minimumScaleFor(const QSize& contentSize);
double clampScale(double scale, double minScale);

// Per-axis centering offset in image pixel units.
QPointF centeringOffset(const QSize& contentSize, const QSize& viewportSize, double scale);

// Scale at which the whole image fits into the viewport minus a 2px margin.
// Returns 0 if either size is empty.
double fitToViewportScale(const QSize& contentSize, const QSize& viewportSize);

QPointF widgetToPixel(const QPointF& widgetPos, const ViewTransform& transform);
QPointF pixelToWidget(const QPointF& pixelPos, const ViewTransform& transform);

// Size of the canvas widget needed to show the scaled image.
QSize scaledContentSize(const ViewTransform& transform);
