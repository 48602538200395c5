#pragma once
#include <QImage>

// Anything that can present a decoded frame (the image viewer, or a test double).
class FrameSurface {
public:
    virtual ~FrameSurface() = default;

    // resetScale: fit the new frame to the viewport instead of keeping the current zoom
    virtual void presentFrame(const QImage& image, bool resetScale) = 0;
};
