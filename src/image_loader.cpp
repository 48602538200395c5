#include "image_loader.h"
#include "image_formats.h"

#include <QDebug>
#include <QFileInfo>
#include <QImageReader>

#include <OpenImageIO/imagebuf.h>
#include <OpenImageIO/imagebufalgo.h>
#include <OpenImageIO/imageio.h>

#include <algorithm>
#include <cmath>
#include <vector>

using namespace OIIO;

QImage ImageLoader::load(const QString& filePath)
{
    const QString ext = QFileInfo(filePath).suffix();
    if (isOiioImageFile(ext)) {
        QImage image = loadWithOiio(filePath);
        if (!image.isNull()) return image;
        qDebug() << "[ImageLoader] OIIO could not decode" << filePath << "- trying Qt";
    }
    return loadWithQt(filePath);
}

QImage ImageLoader::loadWithQt(const QString& filePath)
{
    QImageReader reader(filePath);
    reader.setAutoTransform(true);
    QImage image = reader.read();
    if (image.isNull()) {
        qWarning() << "[ImageLoader] Failed to load" << filePath << ":" << reader.errorString();
        return QImage();
    }
    return image;
}

QImage ImageLoader::loadWithOiio(const QString& filePath)
{
    ImageBuf buf(filePath.toStdString());
    if (!buf.read(0, 0, true, TypeDesc::FLOAT)) {
        qWarning() << "[ImageLoader] OIIO read failed for" << filePath << ":"
                   << QString::fromStdString(buf.geterror());
        return QImage();
    }

    const ImageSpec& spec = buf.spec();
    const int width = spec.width;
    const int height = spec.height;
    const int channels = spec.nchannels;
    if (width <= 0 || height <= 0 || channels <= 0) {
        qWarning() << "[ImageLoader] Invalid image spec for" << filePath;
        return QImage();
    }
    // The buffer is always float after read(); the file's own format decides tone mapping
    const TypeDesc fileFormat = buf.nativespec().format;
    const bool isHDR = fileFormat == TypeDesc::FLOAT || fileFormat == TypeDesc::HALF ||
                       fileFormat == TypeDesc::DOUBLE;

    // Bring everything to RGB or RGBA, grey is replicated
    const int targetChannels = (channels == 2 || channels >= 4) ? 4 : 3;
    if (channels != targetChannels) {
        std::vector<int> order;
        if (channels < 3) {
            order = { 0, 0, 0 };
            if (targetChannels == 4) order.push_back(1);
        } else {
            order = { 0, 1, 2 };
        }
        ImageBuf converted;
        if (!ImageBufAlgo::channels(converted, buf, targetChannels, order)) {
            qWarning() << "[ImageLoader] Channel conversion failed:" << QString::fromStdString(converted.geterror());
            return QImage();
        }
        buf = std::move(converted);
    }

    std::vector<float> pixels(size_t(width) * height * targetChannels);
    if (!buf.get_pixels(ROI(0, width, 0, height, 0, 1, 0, targetChannels), TypeDesc::FLOAT, pixels.data())) {
        qWarning() << "[ImageLoader] Failed to get pixel data for" << filePath;
        return QImage();
    }

    const QImage::Format format = targetChannels == 4 ? QImage::Format_RGBA8888 : QImage::Format_RGB888;
    QImage image(width, height, format);
    for (int y = 0; y < height; ++y) {
        uchar* scanline = image.scanLine(y);
        const float* src = pixels.data() + size_t(y) * width * targetChannels;
        for (int x = 0; x < width * targetChannels; ++x) {
            const bool isAlpha = targetChannels == 4 && (x % 4) == 3;
            float v = src[x];
            if (isHDR && !isAlpha) {
                v = toneMapToSrgb(v);
            }
            scanline[x] = uchar(std::clamp(v, 0.0f, 1.0f) * 255.0f + 0.5f);
        }
    }

    qDebug() << "[ImageLoader] Loaded" << filePath << width << "x" << height
             << "channels:" << channels << (isHDR ? "(HDR)" : "");
    return image;
}

float ImageLoader::toneMapToSrgb(float linear)
{
    if (!(linear > 0.0f)) return 0.0f;
    const float mapped = linear / (1.0f + linear);
    if (mapped <= 0.0031308f) {
        return 12.92f * mapped;
    }
    return std::min(1.0f, 1.055f * std::pow(mapped, 1.0f / 2.4f) - 0.055f);
}
