#pragma once
#include <QObject>
#include <QSize>

#include <memory>

#include "frame_surface.h"
#include "image_sequence.h"

/**
 * Bridges the 1-based index of the playback controls to the 0-based
 * ImageSequence and pushes fetched frames to the FrameSurface.
 *
 * Stale indices (e.g. emitted just before a sequence swap) are dropped.
 * Undecodable frames are replaced by a placeholder so that playback keeps
 * going.
 */
class SequenceNavigator : public QObject
{
    Q_OBJECT

public:
    explicit SequenceNavigator(FrameSurface *surface, QObject *parent = nullptr);

    void setSequence(std::shared_ptr<ImageSequence> sequence);
    std::shared_ptr<ImageSequence> sequence() const { return m_sequence; }

    int length() const { return m_sequence ? m_sequence->length() : 0; }
    int lastPresentedIndex() const { return m_lastIndex; }

public slots:
    void onIndexChanged(int uiIndex);

signals:
    // Emitted after the frame for uiIndex was handed to the surface
    void frameDelivered(int uiIndex);

private:
    FrameSurface *m_surface = nullptr;
    std::shared_ptr<ImageSequence> m_sequence;
    QSize m_lastFrameSize;
    int m_lastIndex = 0;
};
