#include <QApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QFileInfo>
#include <QTimer>

#include <memory>

#include "image_sequence.h"
#include "image_viewer.h"
#include "log_manager.h"
#include "playback_controller.h"
#include "sequence_control_widget.h"
#include "sequence_viewer.h"
#include "viewer_settings.h"

// Opens a dropped folder, or the folder of a dropped file positioned at that file.
static void openDroppedPath(SequenceViewer& viewer, const QString& path)
{
    const QFileInfo info(path);
    const QString folder = info.isDir() ? info.absoluteFilePath() : info.absolutePath();

    QString error;
    std::shared_ptr<ImageFolder> seq = ImageFolder::open(folder, &error);
    if (!seq) {
        qWarning() << "[MAIN] Cannot open dropped path:" << error;
        return;
    }
    if (!viewer.setSequence(seq)) {
        return;
    }
    viewer.setWindowTitle(seq->displayName());

    if (info.isFile()) {
        const int idx = seq->indexOf(info.absoluteFilePath());
        if (idx >= 0) {
            viewer.controls()->controller()->jumpTo(idx + 1);
        }
    }
}

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    QCoreApplication::setOrganizationName(ViewerSettings::kOrganization);
    QCoreApplication::setApplicationName(ViewerSettings::kApplication);
    QCoreApplication::setApplicationVersion(IMSEQVIS_VERSION);

    LogManager::instance().install();

    QCommandLineParser parser;
    parser.setApplicationDescription("View a folder of images as image sequence.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("folder", "Path to the folder containing the images.");
    QCommandLineOption titleOption("title", "Title of the application window.", "text", "Image Folder Viewer");
    QCommandLineOption timeoutOption("timeout", "Playback timer period in milliseconds.", "ms");
    QCommandLineOption noWaitOption("no-wait", "Advance playback without waiting for the viewer.");
    QCommandLineOption seqButtonsOption("sequence-buttons", "Show previous/next sequence buttons.");
    QCommandLineOption noZoomOption("no-zoom-buttons", "Hide the zoom buttons.");
    parser.addOptions({ titleOption, timeoutOption, noWaitOption, seqButtonsOption, noZoomOption });
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        qCritical() << "[MAIN] Expected exactly one folder argument";
        parser.showHelp(1);
    }

    SequenceViewerOptions options = ViewerSettings::loadOptions();
    if (parser.isSet(timeoutOption)) {
        bool ok = false;
        const int timeout = parser.value(timeoutOption).toInt(&ok);
        if (!ok || timeout <= 0) {
            qCritical() << "[MAIN] Invalid --timeout value:" << parser.value(timeoutOption);
            return 1;
        }
        options.playbackTimeoutMs = timeout;
    }
    if (parser.isSet(noWaitOption)) options.waitForViewerReady = false;
    if (parser.isSet(seqButtonsOption)) options.includeSequenceNavigationButtons = true;
    if (parser.isSet(noZoomOption)) options.includeZoomButtons = false;

    QString error;
    std::shared_ptr<ImageFolder> sequence = ImageFolder::open(positional.first(), &error);
    if (!sequence) {
        qCritical() << "[MAIN]" << error;
        return 1;
    }

    std::unique_ptr<SequenceViewer> viewerPtr = SequenceViewer::create(sequence, options, &error);
    if (!viewerPtr) {
        qCritical() << "[MAIN]" << error;
        return 1;
    }
    SequenceViewer& viewer = *viewerPtr;
    viewer.controls()->setKeyBindings(ViewerSettings::loadShortcuts());
    viewer.setWindowTitle(parser.value(titleOption));
    viewer.resize(1024, 768);

    QObject::connect(&viewer, &SequenceViewer::pathDropped, &viewer, [&viewer](const QString& path) {
        openDroppedPath(viewer, path);
    });
    QObject::connect(&viewer, &SequenceViewer::mouseClickedLeft, [](const QPoint& px) {
        qInfo() << "[MAIN] Left click at pixel" << px.x() << px.y();
    });
    QObject::connect(&viewer, &SequenceViewer::mouseClickedMiddle, [](const QPoint& px) {
        qInfo() << "[MAIN] Middle click at pixel" << px.x() << px.y();
    });
    QObject::connect(&viewer, &SequenceViewer::mouseClickedRight, [](const QPoint& px) {
        qInfo() << "[MAIN] Right click at pixel" << px.x() << px.y();
    });

    viewer.show();
    // Fit once the window has its real size
    QTimer::singleShot(0, &viewer, [&viewer]() { viewer.imageViewer()->scaleToFitWindow(); });

    const int rc = app.exec();
    qInfo() << "[MAIN] Event loop exited with code" << rc;
    LogManager::instance().flush();
    return rc;
}
