#pragma once

#include <QString>

// Extension checks take the suffix without the dot, case-insensitive.
bool isSupportedImageFile(const QString& ext);

// Formats decoded through OpenImageIO rather than Qt's image plugins.
bool isOiioImageFile(const QString& ext);
