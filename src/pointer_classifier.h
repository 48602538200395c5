#pragma once
#include <QList>
#include <QPointF>
#include <QString>
#include <QUrl>

class QMimeData;

struct PointerAction {
    enum Type {
        None,
        ClickLeft,
        ClickMiddle,
        ClickRight,
        PanStart,
        PanMove,
        PanEnd
    };

    Type type = None;
    QPointF position;   // widget position of the event
    QPointF delta;      // pointer movement since the last event (PanMove only)
};

/**
 * Turns raw press/move/release events into clicks and right-button pans.
 *
 * Left and middle buttons only produce clicks. The right button opens a
 * drag session on press; motion while it is held pans, and a release
 * without any motion in between is reported as a right click.
 */
class PointerClassifier
{
public:
    PointerAction press(Qt::MouseButton button, const QPointF& pos);
    PointerAction move(const QPointF& pos, Qt::MouseButtons buttons);
    PointerAction release(Qt::MouseButton button, const QPointF& pos);

    bool isDragging() const { return m_dragActive; }
    void cancel();

private:
    Qt::MouseButtons m_pressed = Qt::NoButton;
    bool m_moved = false;

    // Right-button drag session
    bool m_dragActive = false;
    bool m_panning = false;
    QPointF m_lastPointerPos;
};

namespace DropClassifier {

// First URL (in order) naming an existing local file or folder, or an empty string.
QString resolveDroppedPath(const QList<QUrl>& urls);

bool canAccept(const QMimeData* mimeData);

} // namespace DropClassifier
