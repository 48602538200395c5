#pragma once
#include <QPixmap>
#include <QPoint>
#include <QWidget>

#include "pointer_classifier.h"

class ZoomPanController;

/**
 * Paints the current frame at the controller's scale and centering offset
 * and reports pointer activity in image pixel coordinates.
 *
 * The canvas holds no zoom state of its own; it reads it from the
 * ZoomPanController owned by the ImageViewer.
 */
class ImageCanvas : public QWidget
{
    Q_OBJECT

public:
    explicit ImageCanvas(ZoomPanController *zoom, QWidget *parent = nullptr);

    void setPixmap(const QPixmap& pixmap);
    const QPixmap& pixmap() const { return m_pixmap; }

    QSize sizeHint() const override;

    // Pixel under a canvas position, or (-1,-1) outside the image
    QPoint pixelAt(const QPointF& widgetPos) const;

signals:
    void mouseClickedLeft(const QPoint& pixel);
    void mouseClickedMiddle(const QPoint& pixel);
    void mouseClickedRight(const QPoint& pixel);
    void mouseMoved(const QPoint& pixel);
    // Scrollbar delta requested by a right-button drag
    void panRequested(const QPoint& scrollDelta);
    void pathDropped(const QString& path);

protected:
    void paintEvent(QPaintEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;
    void dragEnterEvent(QDragEnterEvent *event) override;
    void dragMoveEvent(QDragMoveEvent *event) override;
    void dropEvent(QDropEvent *event) override;

private:
    void handlePointerAction(const PointerAction& action, const QPointF& localPos);

    ZoomPanController *m_zoom = nullptr;
    QPixmap m_pixmap;
    PointerClassifier m_pointer;
};
