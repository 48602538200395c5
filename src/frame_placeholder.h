#pragma once
#include <QImage>
#include <QSize>
#include <QString>

// Stand-in image for frames that could not be decoded.
class FramePlaceholder {
public:
    static constexpr int kMinWidth = 400;
    static constexpr int kMinHeight = 200;
    static constexpr int kMaxSide = 1200;

    // sourceSize is the expected frame size if known; the placeholder is
    // clamped to [400..1200] x [200..1200].
    static QImage create(const QString& message, const QSize& sourceSize = QSize());

    static QSize placeholderSize(const QSize& sourceSize);
};
