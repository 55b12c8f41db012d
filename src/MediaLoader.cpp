
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

#include "MediaLoader.h"

#include <QCoreApplication>
#include <QFile>
#include <QFileInfo>
#include <QFutureWatcher>
#include <QImageReader>
#include <QtConcurrent>

#include "Logging.h"
#include "MediaTypeDetector.h"

namespace {

struct ContainerSignatureConstants {
    static constexpr int headerSize = 12;
    static constexpr int boxTypeOffset = 4;
    static constexpr int riffFormatOffset = 8;
    static constexpr int tagSize = 4;
};

MediaLoadResult failure(LoadError error, const QString &message)
{
    MediaLoadResult result;
    result.error = error;
    result.message = message.isEmpty() ? MediaLoading::errorText(error) : message;
    return result;
}

/**
 * @brief Checks the first bytes of a file against known video container signatures.
 * @param path Video file path.
 * @return True for ISO base media, Matroska/WebM, and RIFF AVI files.
 */
bool hasVideoContainerSignature(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return false;
    }
    const QByteArray header = file.read(ContainerSignatureConstants::headerSize);
    if (header.size() < ContainerSignatureConstants::headerSize) {
        return false;
    }

    static const QByteArray matroskaMagic("\x1A\x45\xDF\xA3", 4);
    if (header.startsWith(matroskaMagic)) {
        return true;
    }

    if (header.startsWith("RIFF")
        && header.mid(ContainerSignatureConstants::riffFormatOffset, ContainerSignatureConstants::tagSize) == "AVI ") {
        return true;
    }

    const QByteArray boxType = header.mid(ContainerSignatureConstants::boxTypeOffset, ContainerSignatureConstants::tagSize);
    return boxType == "ftyp" || boxType == "moov" || boxType == "mdat" || boxType == "wide" || boxType == "free";
}

MediaLoadResult loadImage(const QString &path, MediaKind kind)
{
    QImageReader reader(path);
    reader.setAutoTransform(true);
    const QImage image = reader.read();
    if (image.isNull()) {
        return failure(LoadError::DecodeFailed, reader.errorString());
    }

    MediaLoadResult result;
    result.ok = true;
    result.payload.kind = kind;
    result.payload.image = image;
    result.payload.size = image.size();
    return result;
}

MediaLoadResult loadVideo(const QString &path)
{
    const QString suffix = QFileInfo(path).suffix().toLower();
    if (!MediaTypeDetector::isVideoExtension(suffix)) {
        // Animated gif and webp decode through the image plugins.
        return loadImage(path, MediaKind::Video);
    }

    if (!hasVideoContainerSignature(path)) {
        return failure(LoadError::DecodeFailed, QString());
    }

    MediaLoadResult result;
    result.ok = true;
    result.payload.kind = MediaKind::Video;
    return result;
}

} // namespace

MediaLoader::MediaLoader(QObject *parent)
    : QObject(parent)
{
}

namespace MediaLoading {

/**
 * @brief Loads one media file synchronously; meant to run on a worker thread.
 * @param path Media file path.
 * @return Decoded payload, or the reason the file cannot be shown.
 */
MediaLoadResult loadMedia(const QString &path)
{
    const QFileInfo info(path);
    if (path.isEmpty() || !info.exists() || info.isDir()) {
        return failure(LoadError::FileNotFound, QString());
    }

    const MediaKind kind = MediaTypeDetector::classify(path);
    switch (kind) {
    case MediaKind::Image:
        return loadImage(path, MediaKind::Image);
    case MediaKind::Video:
        return loadVideo(path);
    case MediaKind::Unsupported:
    default:
        return failure(LoadError::UnsupportedFormat, QString());
    }
}

QString errorText(LoadError error)
{
    switch (error) {
    case LoadError::FileNotFound:
        return QCoreApplication::translate("MediaLoader", "File not found");
    case LoadError::UnsupportedFormat:
        return QCoreApplication::translate("MediaLoader", "Unsupported format");
    case LoadError::DecodeFailed:
        return QCoreApplication::translate("MediaLoader", "Could not decode file");
    case LoadError::None:
    default:
        return QString();
    }
}

} // namespace MediaLoading

ThreadedMediaLoader::ThreadedMediaLoader(QObject *parent)
    : MediaLoader(parent)
{
}

template<typename Callback>
void ThreadedMediaLoader::runInPool(const QString &path, Callback callback)
{
    m_pending += 1;

    auto future = QtConcurrent::run([path]() {
        return MediaLoading::loadMedia(path);
    });

    auto *watcher = new QFutureWatcher<MediaLoadResult>(this);
    connect(watcher, &QFutureWatcher<MediaLoadResult>::finished, this, [this, watcher, callback]() {
        const MediaLoadResult result = watcher->result();
        watcher->deleteLater();
        m_pending -= 1;
        callback(result);
    });

    watcher->setFuture(future);
}

/**
 * @brief Loads a file on the global thread pool and reports back on this object's thread.
 * @param requestId Identifier echoed in loadFinished.
 * @param path Media file path.
 */
void ThreadedMediaLoader::load(quint64 requestId, const QString &path)
{
    runInPool(path, [this, requestId, path](const MediaLoadResult &result) {
        if (!result.ok) {
            qCDebug(lcLoader) << "load failed" << path << result.message;
        }
        emit loadFinished(requestId, path, result);
    });
}

void ThreadedMediaLoader::prefetch(const QString &path)
{
    runInPool(path, [this, path](const MediaLoadResult &result) {
        emit prefetchFinished(path, result);
    });
}

int ThreadedMediaLoader::pendingCount() const
{
    return m_pending;
}
