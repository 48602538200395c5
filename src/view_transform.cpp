#include "view_transform.h"

#include <QtMath>

#include <algorithm>

namespace {
constexpr double kFitMarginPx = 2.0;
}

double minimumScaleFor(const QSize& contentSize)
{
    if (contentSize.isEmpty()) return 1.0;
    const double shorterSide = qMin(contentSize.width(), contentSize.height());
    // Tiny images are never shrunk further
    if (shorterSide <= kMinDisplayedSidePx) return 1.0;
    return kMinDisplayedSidePx / shorterSide;
}

double clampScale(double scale, double minScale)
{
    return std::max(scale, minScale);
}

QPointF centeringOffset(const QSize& contentSize, const QSize& viewportSize, double scale)
{
    if (scale <= 0.0 || contentSize.isEmpty()) return QPointF();

    const double scaledW = contentSize.width() * scale;
    const double scaledH = contentSize.height() * scale;
    QPointF offset;
    if (scaledW < viewportSize.width()) {
        offset.setX((viewportSize.width() - scaledW) / (2.0 * scale));
    }
    if (scaledH < viewportSize.height()) {
        offset.setY((viewportSize.height() - scaledH) / (2.0 * scale));
    }
    return offset;
}

double fitToViewportScale(const QSize& contentSize, const QSize& viewportSize)
{
    if (contentSize.isEmpty() || viewportSize.isEmpty()) return 0.0;

    const double vw = viewportSize.width() - kFitMarginPx;
    const double vh = viewportSize.height() - kFitMarginPx;
    if (vw <= 0.0 || vh <= 0.0) return 0.0;

    const double contentAspect = double(contentSize.width()) / contentSize.height();
    const double viewportAspect = vw / vh;
    if (contentAspect >= viewportAspect) {
        // Width is the limiting dimension
        return vw / contentSize.width();
    }
    return vh / contentSize.height();
}

QPointF widgetToPixel(const QPointF& widgetPos, const ViewTransform& transform)
{
    return QPointF(widgetPos.x() / transform.scale - transform.offset.x(),
                   widgetPos.y() / transform.scale - transform.offset.y());
}

QPointF pixelToWidget(const QPointF& pixelPos, const ViewTransform& transform)
{
    return QPointF((pixelPos.x() + transform.offset.x()) * transform.scale,
                   (pixelPos.y() + transform.offset.y()) * transform.scale);
}

QSize scaledContentSize(const ViewTransform& transform)
{
    return QSize(qCeil(transform.contentSize.width() * transform.scale),
                 qCeil(transform.contentSize.height() * transform.scale));
}
