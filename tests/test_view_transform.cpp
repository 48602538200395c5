#include <QtTest>
#include <QSignalSpy>
#include "../src/view_transform.h"
#include "../src/zoom_pan_controller.h"

class TestViewTransform : public QObject {
    Q_OBJECT
private slots:
    void testMinimumScale();
    void testCenteringOffset();
    void testFitToViewport();
    void testRoundTrip();
    void testZoomSteps();
    void testZoomClampsToMinimum();
    void testSetScaleRejectsInvalid();
    void testScaleToFit();
    void testPanFactors();
    void testScaleChangedSignal();
};

void TestViewTransform::testMinimumScale()
{
    QCOMPARE(minimumScaleFor(QSize(640, 320)), 0.1);
    QCOMPARE(minimumScaleFor(QSize(64, 128)), 0.5);
    // At or below the 32px floor the image is never shrunk
    QCOMPARE(minimumScaleFor(QSize(32, 500)), 1.0);
    QCOMPARE(minimumScaleFor(QSize(10, 10)), 1.0);
    QCOMPARE(minimumScaleFor(QSize()), 1.0);
}

void TestViewTransform::testCenteringOffset()
{
    // 100x50 image at scale 2 in a 400x80 viewport: centered horizontally only
    const QPointF off = centeringOffset(QSize(100, 50), QSize(400, 80), 2.0);
    QCOMPARE(off.x(), (400.0 - 200.0) / 4.0);
    QCOMPARE(off.y(), 0.0);

    const QPointF none = centeringOffset(QSize(100, 100), QSize(50, 50), 1.0);
    QCOMPARE(none, QPointF(0.0, 0.0));
}

void TestViewTransform::testFitToViewport()
{
    // Wide image, width-bound
    QCOMPARE(fitToViewportScale(QSize(1000, 100), QSize(502, 502)), 0.5);
    // Tall image, height-bound
    QCOMPARE(fitToViewportScale(QSize(100, 1000), QSize(502, 252)), 0.25);
    QCOMPARE(fitToViewportScale(QSize(), QSize(100, 100)), 0.0);
    QCOMPARE(fitToViewportScale(QSize(100, 100), QSize()), 0.0);
}

void TestViewTransform::testRoundTrip()
{
    const QVector<double> scales = { 0.013, 0.25, 1.0, 1.05, 3.7, 16.0 };
    const QVector<QPointF> pixels = { QPointF(0, 0), QPointF(12.5, 7.25), QPointF(639, 479), QPointF(-3, 1000.5) };

    for (double s : scales) {
        ViewTransform t;
        t.scale = s;
        t.contentSize = QSize(640, 480);
        t.viewportSize = QSize(1280, 200);
        t.offset = centeringOffset(t.contentSize, t.viewportSize, s);
        for (const QPointF& p : pixels) {
            const QPointF w = pixelToWidget(p, t);
            const QPointF back = widgetToPixel(w, t);
            QVERIFY2(qAbs(back.x() - p.x()) < 1e-9 && qAbs(back.y() - p.y()) < 1e-9,
                     qPrintable(QString("scale %1").arg(s)));
        }
    }
}

void TestViewTransform::testZoomSteps()
{
    ZoomPanController zoom;
    zoom.setContentSize(QSize(640, 480));
    zoom.setScale(1.0);
    zoom.zoomBy(120);
    QCOMPARE(zoom.scale(), 1.05);
    zoom.zoomBy(120);
    QCOMPARE(zoom.scale(), 1.10);
    zoom.zoomBy(-120);
    QCOMPARE(zoom.scale(), 1.05);

    // Shift-modified deltas arrive pre-multiplied by 10
    zoom.zoomBy(1200);
    QCOMPARE(zoom.scale(), 1.55);
}

void TestViewTransform::testZoomClampsToMinimum()
{
    ZoomPanController zoom;
    zoom.setContentSize(QSize(320, 640));     // minScale = 0.1
    QCOMPARE(zoom.minScale(), 0.1);
    zoom.setScale(0.12);
    zoom.zoomBy(-1200);
    QCOMPARE(zoom.scale(), 0.1);

    // A smaller image raises the floor and re-clamps
    zoom.setContentSize(QSize(16, 16));
    QCOMPARE(zoom.scale(), 1.0);
}

void TestViewTransform::testSetScaleRejectsInvalid()
{
    ZoomPanController zoom;
    zoom.setContentSize(QSize(640, 640));
    zoom.setScale(2.0);
    zoom.setScale(0.0);
    zoom.setScale(-1.0);
    zoom.setScale(qQNaN());
    QCOMPARE(zoom.scale(), 2.0);
    zoom.setScale(0.01);
    QCOMPARE(zoom.scale(), 0.05);
}

void TestViewTransform::testScaleToFit()
{
    ZoomPanController zoom;
    zoom.setContentSize(QSize(800, 600));
    zoom.setViewportSize(QSize(402, 402));
    zoom.scaleToFitViewport();
    QCOMPARE(zoom.scale(), 0.5);
    // 300px tall image in a 402px viewport is centered vertically
    QCOMPARE(zoom.offset().x(), (402.0 - 400.0) / (2.0 * 0.5));
    QCOMPARE(zoom.offset().y(), (402.0 - 300.0) / (2.0 * 0.5));

    zoom.scaleToOriginalSize();
    QCOMPARE(zoom.scale(), 1.0);
    QCOMPARE(zoom.offset(), QPointF(0.0, 0.0));
}

void TestViewTransform::testPanFactors()
{
    ZoomPanController zoom;
    // Dragging tracks the pointer 1:1, wheel deltas are six times coarser
    QCOMPARE(zoom.panBy(QPointF(10, -4), PanSource::Drag), QPoint(-10, 4));
    QCOMPARE(zoom.panBy(QPointF(0, 120), PanSource::Wheel), QPoint(0, -20));
    QCOMPARE(zoom.panBy(QPointF(-120, 0), PanSource::Wheel), QPoint(20, 0));
}

void TestViewTransform::testScaleChangedSignal()
{
    ZoomPanController zoom;
    zoom.setContentSize(QSize(640, 480));
    QSignalSpy spy(&zoom, &ZoomPanController::scaleChanged);
    zoom.zoomBy(120);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toDouble(), 1.05);
    zoom.setScale(1.05);
    QCOMPARE(spy.count(), 1);
}

QTEST_APPLESS_MAIN(TestViewTransform)
#include "test_view_transform.moc"
