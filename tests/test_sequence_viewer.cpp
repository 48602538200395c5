#include <QtTest>
#include <QApplication>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QFile>
#include <QMimeData>
#include <QTemporaryDir>
#include <QMouseEvent>
#include <QSignalSpy>
#include <QWheelEvent>
#include "../src/image_canvas.h"
#include "../src/image_viewer.h"
#include "../src/playback_controller.h"
#include "../src/sequence_control_widget.h"
#include "../src/sequence_viewer.h"
#include "../src/zoom_pan_controller.h"
#include "manual_playback_timer.h"

namespace {

class ColorSequence : public ImageSequence {
public:
    ColorSequence(int length, const QSize& size) : m_length(length), m_size(size) {}

    int length() const override { return m_length; }
    QImage frameAt(int index) const override
    {
        QImage img(m_size, QImage::Format_RGB888);
        img.fill(QColor(index * 10 % 256, 0, 0));
        return img;
    }
    QString displayName() const override { return "colors"; }

private:
    int m_length;
    QSize m_size;
};

void sendMouse(QWidget *w, QEvent::Type type, const QPointF& pos, Qt::MouseButton button, Qt::MouseButtons buttons)
{
    QMouseEvent ev(type, pos, w->mapToGlobal(pos), button, buttons, Qt::NoModifier);
    QApplication::sendEvent(w, &ev);
}

void sendCtrlWheel(QWidget *w, int delta, Qt::KeyboardModifiers modifiers)
{
    const QPointF pos(5, 5);
    QWheelEvent ev(pos, w->mapToGlobal(pos), QPoint(), QPoint(0, delta), Qt::NoButton,
                   modifiers, Qt::NoScrollPhase, false);
    QApplication::sendEvent(w, &ev);
}

} // namespace

class TestSequenceViewer : public QObject {
    Q_OBJECT
private slots:
    void testShowsFirstFrame();
    void testPlaybackRunsToEnd();
    void testKeysFromViewer();
    void testSetSequence();
    void testEmptySequenceRejected();
    void testKeypadKeysFromViewer();
    void testCanvasDragAndDrop();
    void testZoomSignals();
    void testCtrlWheelZoom();
    void testCanvasClicks();
    void testCanvasRightDragPans();
};

void TestSequenceViewer::testShowsFirstFrame()
{
    auto timer = std::make_unique<ManualPlaybackTimer>();
    SequenceViewer viewer(std::make_shared<ColorSequence>(4, QSize(64, 48)), SequenceViewerOptions(), std::move(timer));

    QCOMPARE(viewer.currentIndex(), 1);
    QCOMPARE(viewer.imageSequence()->length(), 4);
    QCOMPARE(viewer.imageViewer()->canvas()->pixmap().size(), QSize(64, 48));
    QVERIFY(viewer.controls()->controller()->isViewerReady());
}

void TestSequenceViewer::testPlaybackRunsToEnd()
{
    auto timer = std::make_unique<ManualPlaybackTimer>();
    ManualPlaybackTimer *raw = timer.get();
    SequenceViewer viewer(std::make_shared<ColorSequence>(10, QSize(64, 48)), SequenceViewerOptions(), std::move(timer));
    QSignalSpy spy(&viewer, &SequenceViewer::indexChanged);

    viewer.controls()->controller()->startPlayback();
    // Frames are acknowledged synchronously, so every tick advances
    QCOMPARE(raw->advance(950), 9);
    QCOMPARE(viewer.currentIndex(), 10);
    QVERIFY(viewer.controls()->controller()->isPlaying());

    raw->advance(50);
    QCOMPARE(viewer.currentIndex(), 10);
    QVERIFY(!viewer.controls()->controller()->isPlaying());
    QCOMPARE(spy.count(), 9);
    QCOMPARE(spy.last().at(0).toInt(), 10);
}

void TestSequenceViewer::testKeysFromViewer()
{
    auto timer = std::make_unique<ManualPlaybackTimer>();
    SequenceViewer viewer(std::make_shared<ColorSequence>(30, QSize(64, 48)), SequenceViewerOptions(), std::move(timer));

    QTest::keyClick(&viewer, Qt::Key_M);
    QCOMPARE(viewer.currentIndex(), 11);
    QTest::keyClick(&viewer, Qt::Key_B);
    QCOMPARE(viewer.currentIndex(), 10);
    QTest::keyClick(&viewer, Qt::Key_P);
    QVERIFY(viewer.controls()->controller()->isPlaying());
    QTest::keyClick(&viewer, Qt::Key_Escape);
    QCOMPARE(viewer.currentIndex(), 1);
    QVERIFY(!viewer.controls()->controller()->isPlaying());
}

void TestSequenceViewer::testSetSequence()
{
    auto timer = std::make_unique<ManualPlaybackTimer>();
    SequenceViewer viewer(std::make_shared<ColorSequence>(30, QSize(64, 48)), SequenceViewerOptions(), std::move(timer));
    viewer.controls()->controller()->jumpTo(20);

    QSignalSpy spy(&viewer, &SequenceViewer::indexChanged);
    viewer.setSequence(std::make_shared<ColorSequence>(3, QSize(32, 100)));
    QCOMPARE(viewer.currentIndex(), 1);
    QCOMPARE(viewer.controls()->controller()->maxIndex(), 3);
    QCOMPARE(spy.count(), 1);
    QCOMPARE(viewer.imageViewer()->canvas()->pixmap().size(), QSize(32, 100));

    // Null sequences are ignored
    QVERIFY(!viewer.setSequence(nullptr));
    QCOMPARE(viewer.imageSequence()->length(), 3);
}

void TestSequenceViewer::testEmptySequenceRejected()
{
    QString error;
    QVERIFY(!SequenceViewer::create(std::make_shared<ColorSequence>(0, QSize(8, 8)), SequenceViewerOptions(), &error));
    QCOMPARE(error, QString("Image sequence is empty: colors"));
    QVERIFY(!SequenceViewer::create(nullptr, SequenceViewerOptions(), &error));
    QCOMPARE(error, QString("No image sequence given"));

    auto created = SequenceViewer::create(std::make_shared<ColorSequence>(2, QSize(8, 8)));
    QVERIFY(created);
    QCOMPARE(created->imageSequence()->length(), 2);

    // Swapping in an empty sequence keeps the current one on screen
    auto timer = std::make_unique<ManualPlaybackTimer>();
    SequenceViewer viewer(std::make_shared<ColorSequence>(4, QSize(64, 48)), SequenceViewerOptions(), std::move(timer));
    viewer.controls()->controller()->jumpTo(3);

    QSignalSpy spy(&viewer, &SequenceViewer::indexChanged);
    QVERIFY(!viewer.setSequence(std::make_shared<ColorSequence>(0, QSize(8, 8))));
    QCOMPARE(spy.count(), 0);
    QCOMPARE(viewer.imageSequence()->length(), 4);
    QCOMPARE(viewer.currentIndex(), 3);
    QCOMPARE(viewer.controls()->controller()->maxIndex(), 4);
    QVERIFY(viewer.controls()->controller()->isViewerReady());
    QCOMPARE(viewer.imageViewer()->canvas()->pixmap().size(), QSize(64, 48));
}

void TestSequenceViewer::testKeypadKeysFromViewer()
{
    auto timer = std::make_unique<ManualPlaybackTimer>();
    SequenceViewer viewer(std::make_shared<ColorSequence>(30, QSize(64, 48)), SequenceViewerOptions(), std::move(timer));

    QTest::keyClick(&viewer, Qt::Key_N, Qt::KeypadModifier);
    QCOMPARE(viewer.currentIndex(), 2);
    QTest::keyClick(viewer.controls(), Qt::Key_N, Qt::KeypadModifier);
    QCOMPARE(viewer.currentIndex(), 3);

    // Real modifiers are left alone in both places
    QTest::keyClick(&viewer, Qt::Key_N, Qt::ControlModifier);
    QTest::keyClick(viewer.controls(), Qt::Key_N, Qt::AltModifier);
    QCOMPARE(viewer.currentIndex(), 3);
}

void TestSequenceViewer::testCanvasDragAndDrop()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString existing = dir.filePath("shot_010.png");
    QFile f(existing);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.close();

    auto timer = std::make_unique<ManualPlaybackTimer>();
    SequenceViewer viewer(std::make_shared<ColorSequence>(3, QSize(64, 48)), SequenceViewerOptions(), std::move(timer));
    ImageCanvas *canvas = viewer.imageViewer()->canvas();
    QSignalSpy dropped(&viewer, &SequenceViewer::pathDropped);

    QMimeData text;
    text.setText("not a path");
    QDragEnterEvent rejectEnter(QPoint(5, 5), Qt::CopyAction, &text, Qt::LeftButton, Qt::NoModifier);
    rejectEnter.setAccepted(true);
    QApplication::sendEvent(canvas, &rejectEnter);
    QVERIFY(!rejectEnter.isAccepted());

    QMimeData onlyMissing;
    onlyMissing.setUrls({ QUrl::fromLocalFile(dir.filePath("missing.png")) });
    QDropEvent rejectDrop(QPointF(5, 5), Qt::CopyAction, &onlyMissing, Qt::LeftButton, Qt::NoModifier);
    rejectDrop.setAccepted(true);
    QApplication::sendEvent(canvas, &rejectDrop);
    QVERIFY(!rejectDrop.isAccepted());
    QCOMPARE(dropped.count(), 0);

    QMimeData urls;
    urls.setUrls({ QUrl::fromLocalFile(dir.filePath("missing.png")), QUrl::fromLocalFile(existing) });
    QDragEnterEvent enter(QPoint(5, 5), Qt::CopyAction, &urls, Qt::LeftButton, Qt::NoModifier);
    enter.setAccepted(false);
    QApplication::sendEvent(canvas, &enter);
    QVERIFY(enter.isAccepted());

    QDropEvent drop(QPointF(5, 5), Qt::CopyAction, &urls, Qt::LeftButton, Qt::NoModifier);
    drop.setAccepted(false);
    QApplication::sendEvent(canvas, &drop);
    QVERIFY(drop.isAccepted());
    QCOMPARE(dropped.count(), 1);
    QCOMPARE(dropped.at(0).at(0).toString(), existing);
}

void TestSequenceViewer::testZoomSignals()
{
    ImageViewer viewer;
    viewer.showImage(QImage(200, 100, QImage::Format_RGB888), false);
    QSignalSpy spy(&viewer, &ImageViewer::zoomChanged);

    viewer.setScale(2.0);
    QCOMPARE(viewer.scale(), 2.0);
    viewer.scaleToOriginalSize();
    QCOMPARE(viewer.scale(), 1.0);
    QCOMPARE(spy.count(), 2);

    // Canvas grows with the scaled image
    viewer.setScale(4.0);
    QVERIFY(viewer.canvas()->width() >= 800);
    QVERIFY(viewer.canvas()->height() >= 400);
}

void TestSequenceViewer::testCtrlWheelZoom()
{
    ImageViewer viewer;
    viewer.showImage(QImage(200, 100, QImage::Format_RGB888), false);
    QCOMPARE(viewer.scale(), 1.0);

    sendCtrlWheel(viewer.viewport(), 120, Qt::ControlModifier);
    QCOMPARE(viewer.scale(), 1.05);
    sendCtrlWheel(viewer.viewport(), -120, Qt::ControlModifier);
    QCOMPARE(viewer.scale(), 1.0);
    sendCtrlWheel(viewer.viewport(), 120, Qt::ControlModifier | Qt::ShiftModifier);
    QCOMPARE(viewer.scale(), 1.5);
}

void TestSequenceViewer::testCanvasClicks()
{
    ZoomPanController zoom;
    zoom.setContentSize(QSize(100, 80));
    zoom.setScale(2.0);
    ImageCanvas canvas(&zoom);
    canvas.setPixmap(QPixmap::fromImage(QImage(100, 80, QImage::Format_RGB888)));

    QCOMPARE(canvas.pixelAt(QPointF(21, 7)), QPoint(10, 3));
    QCOMPARE(canvas.pixelAt(QPointF(200, 10)), QPoint(-1, -1));
    QCOMPARE(canvas.pixelAt(QPointF(-1, 10)), QPoint(-1, -1));

    QSignalSpy left(&canvas, &ImageCanvas::mouseClickedLeft);
    QSignalSpy right(&canvas, &ImageCanvas::mouseClickedRight);
    QSignalSpy moved(&canvas, &ImageCanvas::mouseMoved);

    sendMouse(&canvas, QEvent::MouseButtonPress, QPointF(21, 7), Qt::LeftButton, Qt::LeftButton);
    sendMouse(&canvas, QEvent::MouseButtonRelease, QPointF(21, 7), Qt::LeftButton, Qt::NoButton);
    QCOMPARE(left.count(), 1);
    QCOMPARE(left.at(0).at(0).toPoint(), QPoint(10, 3));

    // Clicks outside the image are not reported
    sendMouse(&canvas, QEvent::MouseButtonPress, QPointF(250, 7), Qt::RightButton, Qt::RightButton);
    sendMouse(&canvas, QEvent::MouseButtonRelease, QPointF(250, 7), Qt::RightButton, Qt::NoButton);
    QCOMPARE(right.count(), 0);

    sendMouse(&canvas, QEvent::MouseMove, QPointF(41, 41), Qt::NoButton, Qt::NoButton);
    QCOMPARE(moved.count(), 1);
    QCOMPARE(moved.at(0).at(0).toPoint(), QPoint(20, 20));
}

void TestSequenceViewer::testCanvasRightDragPans()
{
    ZoomPanController zoom;
    zoom.setContentSize(QSize(100, 80));
    ImageCanvas canvas(&zoom);
    canvas.setPixmap(QPixmap::fromImage(QImage(100, 80, QImage::Format_RGB888)));

    QSignalSpy pan(&canvas, &ImageCanvas::panRequested);
    QSignalSpy right(&canvas, &ImageCanvas::mouseClickedRight);

    sendMouse(&canvas, QEvent::MouseButtonPress, QPointF(10, 10), Qt::RightButton, Qt::RightButton);
    sendMouse(&canvas, QEvent::MouseMove, QPointF(25, 4), Qt::NoButton, Qt::RightButton);
    sendMouse(&canvas, QEvent::MouseMove, QPointF(30, 4), Qt::NoButton, Qt::RightButton);
    sendMouse(&canvas, QEvent::MouseButtonRelease, QPointF(30, 4), Qt::RightButton, Qt::NoButton);

    QCOMPARE(pan.count(), 2);
    QCOMPARE(pan.at(0).at(0).toPoint(), QPoint(-15, 6));
    QCOMPARE(pan.at(1).at(0).toPoint(), QPoint(-5, 0));
    // A drag is never a click
    QCOMPARE(right.count(), 0);
}

QTEST_MAIN(TestSequenceViewer)
#include "test_sequence_viewer.moc"
