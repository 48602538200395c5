// Shows how to embed SequenceViewer with a custom ImageSequence and how to
// use its signals. Previous/next sequence cycles the colour channel.
#include <QApplication>
#include <QDebug>
#include <QImage>

#include <memory>

#include "image_sequence.h"
#include "log_manager.h"
#include "sequence_viewer.h"
#include "viewer_settings.h"

class GradientSequence : public ImageSequence {
public:
    GradientSequence(int numImages, int channel)
        : m_numImages(numImages)
        , m_channel(channel)
    {
    }

    int length() const override { return m_numImages; }

    QImage frameAt(int index) const override
    {
        // Intensity ramps up and down every 10 frames
        int step = index % 10;
        if (step > 5) step = 10 - step;
        const int value = qMin(255, step * 51);

        QImage img(600, 400, QImage::Format_RGB888);
        img.fill(QColor(m_channel == 0 ? value : 0,
                        m_channel == 1 ? value : 0,
                        m_channel == 2 ? value : 0));
        return img;
    }

    QString displayName() const override
    {
        static const char *names[] = { "red", "green", "blue" };
        return QString("Gradient (%1)").arg(names[m_channel]);
    }

    int channel() const { return m_channel; }

private:
    int m_numImages;
    int m_channel;
};

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    QCoreApplication::setOrganizationName(ViewerSettings::kOrganization);
    QCoreApplication::setApplicationName("ImSeqVis Demo");
    LogManager::instance().install();

    const bool logMouseMoves = app.arguments().contains("--log-mouse");

    SequenceViewerOptions options;
    options.playbackTimeoutMs = 150;
    options.includeSequenceNavigationButtons = true;
    options.includeZoomButtons = true;

    auto current = std::make_shared<GradientSequence>(142, 2);
    SequenceViewer viewer(current, options);

    auto switchSequence = [&viewer, &current](int direction) {
        const int channel = (current->channel() + direction + 3) % 3;
        current = std::make_shared<GradientSequence>(current->length(), channel);
        if (!viewer.setSequence(current)) return;
        viewer.setWindowTitle(current->displayName());
    };
    QObject::connect(&viewer, &SequenceViewer::nextSequenceRequest, [&]() { switchSequence(+1); });
    QObject::connect(&viewer, &SequenceViewer::previousSequenceRequest, [&]() { switchSequence(-1); });

    QObject::connect(&viewer, &SequenceViewer::mouseClickedLeft, [](const QPoint& px) {
        qInfo() << "Mouse clicked \"left\" at pixel" << px.x() << px.y();
    });
    QObject::connect(&viewer, &SequenceViewer::mouseClickedMiddle, [](const QPoint& px) {
        qInfo() << "Mouse clicked \"middle\" at pixel" << px.x() << px.y();
    });
    QObject::connect(&viewer, &SequenceViewer::mouseClickedRight, [](const QPoint& px) {
        qInfo() << "Mouse clicked \"right\" at pixel" << px.x() << px.y();
    });
    if (logMouseMoves) {
        QObject::connect(&viewer, &SequenceViewer::mouseMoved, [](const QPoint& px) {
            qDebug() << "Mouse moved to pixel position" << px.x() << px.y();
        });
    }
    QObject::connect(&viewer, &SequenceViewer::pathDropped, [](const QString& path) {
        qInfo() << "Path dropped onto canvas:" << path;
    });
    QObject::connect(&viewer, &SequenceViewer::zoomChanged, [](double scale) {
        qDebug() << "Zoom changed to" << scale;
    });

    viewer.setWindowTitle(current->displayName());
    viewer.resize(900, 600);
    viewer.show();
    return app.exec();
}
