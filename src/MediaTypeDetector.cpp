
/************************************************************************\

    Lumio - Media browser
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "MediaTypeDetector.h"

#include <QFileInfo>
#include <QImageReader>
#include <QSet>

namespace {

/**
 * @brief Returns the set of recognized still image extensions.
 * @return Set of lowercase image file extensions.
 */
const QSet<QString> &imageExtensions()
{
    static const QSet<QString> extensions = {
        QStringLiteral("jpg"),
        QStringLiteral("jpeg"),
        QStringLiteral("png"),
        QStringLiteral("gif"),
        QStringLiteral("tiff"),
        QStringLiteral("tif"),
        QStringLiteral("webp"),
        QStringLiteral("bmp"),
        QStringLiteral("ico"),
        QStringLiteral("svg"),
    };
    return extensions;
}

/**
 * @brief Returns the set of recognized video extensions.
 * @return Set of lowercase video file extensions.
 */
const QSet<QString> &videoExtensions()
{
    static const QSet<QString> extensions = {
        QStringLiteral("mp4"),
        QStringLiteral("m4v"),
        QStringLiteral("avi"),
        QStringLiteral("mov"),
        QStringLiteral("mkv"),
        QStringLiteral("webm"),
    };
    return extensions;
}

bool mayBeAnimated(const QString &suffix)
{
    return suffix == QStringLiteral("gif") || suffix == QStringLiteral("webp");
}

struct MediaTypeDetectorConstants {
    static constexpr int singleFrame = 1;
};

} // namespace

namespace MediaTypeDetector {

/**
 * @brief Classifies a path by extension, probing gif and webp for animation.
 * @param path File path to classify.
 * @return Image, Video, or Unsupported.
 */
MediaKind classify(const QString &path)
{
    if (path.isEmpty()) {
        return MediaKind::Unsupported;
    }
    const QString suffix = QFileInfo(path).suffix().toLower();
    if (suffix.isEmpty()) {
        return MediaKind::Unsupported;
    }
    if (mayBeAnimated(suffix)) {
        return isAnimatedImage(path) ? MediaKind::Video : MediaKind::Image;
    }
    if (imageExtensions().contains(suffix)) {
        return MediaKind::Image;
    }
    if (videoExtensions().contains(suffix)) {
        return MediaKind::Video;
    }
    return MediaKind::Unsupported;
}

bool isImageExtension(const QString &suffix)
{
    return imageExtensions().contains(suffix.toLower());
}

bool isVideoExtension(const QString &suffix)
{
    return videoExtensions().contains(suffix.toLower());
}

/**
 * @brief Checks whether an image file holds more than one frame.
 * @param path File path to inspect.
 * @return True for animated files; false for stills and unreadable files.
 */
bool isAnimatedImage(const QString &path)
{
    QImageReader reader(path);
    if (!reader.canRead() || !reader.supportsAnimation()) {
        return false;
    }
    return reader.imageCount() > MediaTypeDetectorConstants::singleFrame;
}

QStringList supportedExtensions()
{
    QStringList list;
    list.reserve(imageExtensions().size() + videoExtensions().size());
    for (const QString &extension : imageExtensions()) {
        list.append(extension);
    }
    for (const QString &extension : videoExtensions()) {
        list.append(extension);
    }
    list.sort();
    return list;
}

QStringList nameFilters()
{
    QStringList filters;
    const QStringList extensions = supportedExtensions();
    filters.reserve(extensions.size());
    for (const QString &extension : extensions) {
        filters.append(QStringLiteral("*.") + extension);
    }
    return filters;
}

} // namespace MediaTypeDetector
