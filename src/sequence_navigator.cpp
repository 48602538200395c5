#include "sequence_navigator.h"
#include "frame_placeholder.h"

#include <QDebug>

SequenceNavigator::SequenceNavigator(FrameSurface *surface, QObject *parent)
    : QObject(parent)
    , m_surface(surface)
{
}

void SequenceNavigator::setSequence(std::shared_ptr<ImageSequence> sequence)
{
    m_sequence = std::move(sequence);
    // Fit the first frame of a new sequence
    m_lastFrameSize = QSize();
    m_lastIndex = 0;
}

void SequenceNavigator::onIndexChanged(int uiIndex)
{
    const int zeroBased = uiIndex - 1;
    if (!m_sequence || zeroBased < 0 || zeroBased >= m_sequence->length()) {
        qDebug() << "[SequenceNavigator] Dropping stale index" << uiIndex << "length:" << length();
        return;
    }

    QImage frame = m_sequence->frameAt(zeroBased);
    if (frame.isNull()) {
        qWarning() << "[SequenceNavigator] Frame" << uiIndex << "could not be decoded, showing placeholder";
        frame = FramePlaceholder::create(QString("Error!\nCannot display frame %1.").arg(uiIndex),
                                         m_lastFrameSize);
    }

    const bool resetScale = frame.size() != m_lastFrameSize;
    m_lastFrameSize = frame.size();
    m_lastIndex = uiIndex;

    if (m_surface) {
        m_surface->presentFrame(frame, resetScale);
    }
    emit frameDelivered(uiIndex);
}
