#pragma once

#include <QString>
#include <QStringList>

#include "MediaTypes.h"

namespace MediaTypeDetector {

MediaKind classify(const QString &path);
bool isImageExtension(const QString &suffix);
bool isVideoExtension(const QString &suffix);
bool isAnimatedImage(const QString &path);
QStringList supportedExtensions();
QStringList nameFilters();

} // namespace MediaTypeDetector
