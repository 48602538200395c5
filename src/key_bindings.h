#pragma once
#include <QString>
#include <Qt>
#include <QVector>

class PlaybackController;
class QSettings;

enum class PlaybackAction {
    Reset,
    TogglePlayback,
    Step
};

struct KeyBinding {
    int key;                // Qt::Key
    PlaybackAction action;
    int step = 0;           // frame delta for PlaybackAction::Step
    QString name;           // settings key, e.g. "StepForward"
};

using KeyBindingTable = QVector<KeyBinding>;

// Built-in bindings. Space, Return/Enter and the arrow/page keys are left
// to the focused child widgets (buttons, manual input, slider).
const KeyBindingTable& defaultKeyBindings();

// Returns nullptr if the key is not bound.
const KeyBinding* findKeyBinding(int key, const KeyBindingTable& table = defaultKeyBindings());

// Bindings fire for bare keys only; the keypad flag is not a modifier here.
bool isUnmodifiedKeyPress(Qt::KeyboardModifiers modifiers);

void applyKeyBinding(PlaybackController& controller, const KeyBinding& binding);

// Reads the "Shortcuts" group (e.g. "StepForward=N,Right"). Actions without
// a valid entry keep their default keys.
KeyBindingTable loadKeyBindings(QSettings& settings);
