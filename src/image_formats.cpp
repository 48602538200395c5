#include "image_formats.h"

#include <QSet>

namespace {

inline QString normalize(const QString& ext)
{
    QString lower = ext.toLower();
    if (lower.startsWith('.')) lower.remove(0, 1);
    return lower;
}

const QSet<QString>& qtImageExtensions()
{
    static const QSet<QString> exts = {
        "png","jpg","jpeg","bmp","gif","webp","ppm","pgm","pbm"
    };
    return exts;
}

const QSet<QString>& oiioImageExtensions()
{
    static const QSet<QString> exts = {
        "exr","hdr","dpx","tga","psd","tif","tiff"
    };
    return exts;
}

} // namespace

bool isSupportedImageFile(const QString& ext)
{
    const QString e = normalize(ext);
    return qtImageExtensions().contains(e) || oiioImageExtensions().contains(e);
}

bool isOiioImageFile(const QString& ext)
{
    return oiioImageExtensions().contains(normalize(ext));
}
