#pragma once
#include <QString>

#include "key_bindings.h"

class QSettings;

struct SequenceViewerOptions {
    int playbackTimeoutMs = 100;
    // Only advance playback once the viewer acknowledged the previous frame
    bool waitForViewerReady = true;
    bool includeSequenceNavigationButtons = false;
    bool includeZoomButtons = true;
};

class ViewerSettings {
public:
    static constexpr const char* kOrganization = "ImSeqVis";
    static constexpr const char* kApplication = "ImSeqVis";

    // Reads Playback/* and Viewer/* from the application settings
    static SequenceViewerOptions loadOptions();
    static SequenceViewerOptions loadOptions(QSettings& settings);

    static KeyBindingTable loadShortcuts();
};
