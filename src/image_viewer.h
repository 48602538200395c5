#pragma once
#include <QScrollArea>

#include "frame_surface.h"

class ImageCanvas;
class ZoomPanController;

/**
 * @brief Scrollable, zoomable view of a single frame.
 *
 * - Ctrl + wheel zooms in steps of 0.05 per notch (Shift: 10x faster),
 *   keeping the pixel under the cursor in place
 * - Plain wheel scrolls, right-button drag pans
 * - Images smaller than the viewport are centered
 */
class ImageViewer : public QScrollArea, public FrameSurface
{
    Q_OBJECT

public:
    explicit ImageViewer(QWidget *parent = nullptr);
    ~ImageViewer() override;

    void presentFrame(const QImage& image, bool resetScale) override;
    void showImage(const QImage& image, bool resetScale = true) { presentFrame(image, resetScale); }

    ZoomPanController* zoomController() const { return m_zoom; }
    ImageCanvas* canvas() const { return m_canvas; }
    double scale() const;

public slots:
    void setScale(double scale);
    void scaleToFitWindow();
    void scaleToOriginalSize();
    void scrollBy(const QPoint& scrollDelta);

signals:
    void zoomChanged(double scale);
    void mouseClickedLeft(const QPoint& pixel);
    void mouseClickedMiddle(const QPoint& pixel);
    void mouseClickedRight(const QPoint& pixel);
    void mouseMoved(const QPoint& pixel);
    void pathDropped(const QString& path);

protected:
    void resizeEvent(QResizeEvent *event) override;
    void wheelEvent(QWheelEvent *event) override;

private:
    void updateCanvasGeometry();
    void zoomAround(int wheelDelta, const QPointF& viewportPos);

    ZoomPanController *m_zoom = nullptr;
    ImageCanvas *m_canvas = nullptr;
};
