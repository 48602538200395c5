#pragma once
#include <QImage>
#include <QString>

/**
 * Decodes a single frame from disk.
 *
 * Film/HDR formats (EXR, HDR, DPX, TIFF, ...) go through OpenImageIO,
 * everything else through Qt's image plugins. Float images are tone mapped
 * (Reinhard) and sRGB encoded for display.
 */
class ImageLoader {
public:
    /**
     * Load an image for display
     * @param filePath Path to the image file
     * @return 8-bit RGB(A) image, or a null QImage on failure
     */
    static QImage load(const QString& filePath);

    /**
     * Load through OpenImageIO only
     * @return null QImage if OIIO cannot read the file
     */
    static QImage loadWithOiio(const QString& filePath);

    // x / (1 + x) followed by the sRGB transfer curve, clamped to [0, 1]
    static float toneMapToSrgb(float linear);

private:
    static QImage loadWithQt(const QString& filePath);
};
