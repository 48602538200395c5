#include "pointer_classifier.h"
#include <QFileInfo>
#include <QMimeData>

PointerAction PointerClassifier::press(Qt::MouseButton button, const QPointF& pos)
{
    PointerAction action;
    action.position = pos;

    if (m_pressed == Qt::NoButton) {
        m_moved = false;
    }
    m_pressed |= button;

    if (button == Qt::RightButton) {
        m_dragActive = true;
        m_panning = false;
        m_lastPointerPos = pos;
    }
    return action;
}

PointerAction PointerClassifier::move(const QPointF& pos, Qt::MouseButtons buttons)
{
    PointerAction action;
    action.position = pos;

    if (m_pressed == Qt::NoButton || buttons == Qt::NoButton) {
        return action;
    }
    m_moved = true;

    if (m_dragActive && (buttons & Qt::RightButton)) {
        action.delta = pos - m_lastPointerPos;
        m_lastPointerPos = pos;
        action.type = m_panning ? PointerAction::PanMove : PointerAction::PanStart;
        m_panning = true;
    }
    return action;
}

PointerAction PointerClassifier::release(Qt::MouseButton button, const QPointF& pos)
{
    PointerAction action;
    action.position = pos;

    if (!(m_pressed & button)) {
        // Release without a matching press (e.g. press happened outside)
        return action;
    }
    m_pressed &= ~Qt::MouseButtons(button);

    if (button == Qt::RightButton && m_dragActive) {
        const bool wasPanning = m_panning;
        m_dragActive = false;
        m_panning = false;
        if (wasPanning) {
            action.type = PointerAction::PanEnd;
            return action;
        }
    }

    if (!m_moved) {
        switch (button) {
            case Qt::LeftButton:   action.type = PointerAction::ClickLeft; break;
            case Qt::MiddleButton: action.type = PointerAction::ClickMiddle; break;
            case Qt::RightButton:  action.type = PointerAction::ClickRight; break;
            default: break;
        }
    }
    return action;
}

void PointerClassifier::cancel()
{
    m_pressed = Qt::NoButton;
    m_moved = false;
    m_dragActive = false;
    m_panning = false;
}

namespace DropClassifier {

QString resolveDroppedPath(const QList<QUrl>& urls)
{
    for (const QUrl& url : urls) {
        if (!url.isLocalFile()) continue;
        const QString path = url.toLocalFile();
        const QFileInfo info(path);
        if (info.exists() && (info.isFile() || info.isDir())) {
            return path;
        }
    }
    return QString();
}

bool canAccept(const QMimeData* mimeData)
{
    if (!mimeData || !mimeData->hasUrls()) return false;
    return !resolveDroppedPath(mimeData->urls()).isEmpty();
}

} // namespace DropClassifier
