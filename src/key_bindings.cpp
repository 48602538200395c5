#include "key_bindings.h"
#include "playback_controller.h"

#include <QDebug>
#include <QKeySequence>
#include <QSettings>
#include <QStringList>

const KeyBindingTable& defaultKeyBindings()
{
    static const KeyBindingTable table = {
        { Qt::Key_Escape, PlaybackAction::Reset,          0,   QStringLiteral("Reset") },
        { Qt::Key_R,      PlaybackAction::Reset,          0,   QStringLiteral("Reset") },
        { Qt::Key_P,      PlaybackAction::TogglePlayback, 0,   QStringLiteral("TogglePlayback") },
        { Qt::Key_X,      PlaybackAction::TogglePlayback, 0,   QStringLiteral("TogglePlayback") },
        { Qt::Key_B,      PlaybackAction::Step,           -1,  QStringLiteral("StepBackward") },
        { Qt::Key_V,      PlaybackAction::Step,           -10, QStringLiteral("StepBackwardFast") },
        { Qt::Key_N,      PlaybackAction::Step,           +1,  QStringLiteral("StepForward") },
        { Qt::Key_M,      PlaybackAction::Step,           +10, QStringLiteral("StepForwardFast") },
    };
    return table;
}

const KeyBinding* findKeyBinding(int key, const KeyBindingTable& table)
{
    for (const KeyBinding& binding : table) {
        if (binding.key == key) {
            return &binding;
        }
    }
    return nullptr;
}

bool isUnmodifiedKeyPress(Qt::KeyboardModifiers modifiers)
{
    return (modifiers & ~Qt::KeyboardModifiers(Qt::KeypadModifier)) == Qt::NoModifier;
}

void applyKeyBinding(PlaybackController& controller, const KeyBinding& binding)
{
    switch (binding.action) {
        case PlaybackAction::Reset:
            controller.reset();
            break;
        case PlaybackAction::TogglePlayback:
            controller.togglePlayback();
            break;
        case PlaybackAction::Step:
            controller.step(binding.step);
            break;
    }
}

KeyBindingTable loadKeyBindings(QSettings& settings)
{
    const KeyBindingTable& defaults = defaultKeyBindings();

    settings.beginGroup("Shortcuts");
    KeyBindingTable table;
    QStringList handled;
    for (const KeyBinding& def : defaults) {
        if (handled.contains(def.name)) continue;
        handled << def.name;

        QVector<int> keys;
        const QStringList entries = settings.value(def.name).toStringList();
        for (const QString& entry : entries) {
            const QKeySequence seq = QKeySequence::fromString(entry.trimmed(), QKeySequence::PortableText);
            if (seq.count() != 1 || seq[0].keyboardModifiers() != Qt::NoModifier) {
                qWarning() << "[KeyBindings] Ignoring invalid shortcut for" << def.name << ":" << entry;
                continue;
            }
            keys << seq[0].key();
        }

        if (keys.isEmpty()) {
            for (const KeyBinding& b : defaults) {
                if (b.name == def.name) table << b;
            }
        } else {
            for (int key : keys) {
                table << KeyBinding{ key, def.action, def.step, def.name };
            }
        }
    }
    settings.endGroup();
    return table;
}
