#include "viewer_settings.h"

#include <QDebug>
#include <QSettings>

SequenceViewerOptions ViewerSettings::loadOptions()
{
    QSettings s(kOrganization, kApplication);
    return loadOptions(s);
}

SequenceViewerOptions ViewerSettings::loadOptions(QSettings& settings)
{
    SequenceViewerOptions opts;

    bool ok = false;
    const int timeout = settings.value("Playback/TimeoutMs", opts.playbackTimeoutMs).toInt(&ok);
    if (ok && timeout > 0) {
        opts.playbackTimeoutMs = timeout;
    } else {
        qWarning() << "[ViewerSettings] Invalid Playback/TimeoutMs, using" << opts.playbackTimeoutMs;
    }
    opts.waitForViewerReady = settings.value("Playback/WaitForViewerReady", opts.waitForViewerReady).toBool();
    opts.includeSequenceNavigationButtons =
        settings.value("Viewer/ShowSequenceButtons", opts.includeSequenceNavigationButtons).toBool();
    opts.includeZoomButtons = settings.value("Viewer/ShowZoomButtons", opts.includeZoomButtons).toBool();

    qDebug() << "[ViewerSettings] timeout:" << opts.playbackTimeoutMs << "ms"
             << "wait for viewer:" << opts.waitForViewerReady;
    return opts;
}

KeyBindingTable ViewerSettings::loadShortcuts()
{
    QSettings s(kOrganization, kApplication);
    return loadKeyBindings(s);
}
