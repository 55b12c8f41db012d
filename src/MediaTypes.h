#pragma once

#include <QDateTime>
#include <QImage>
#include <QMetaType>
#include <QSize>
#include <QString>
#include <QStringList>
#include <QVariantMap>

enum class MediaKind {
    Unsupported = 0,
    Image,
    Video
};

enum class SortOrder {
    Alphabetical = 0,
    ModifiedDate,
    CreatedDate
};

enum class NavigationDirection {
    Next = 0,
    Previous
};

enum class NavigationMode {
    AllMedia = 0,
    ImagesOnly
};

enum class MediaTypeFilter {
    All = 0,
    ImagesOnly,
    VideosOnly
};

struct MediaEntry {
    QString path;
    QString fileName;
    MediaKind kind = MediaKind::Image;
    QDateTime modified;
    QDateTime created;
};

struct NavigationInfo {
    bool hasNext = false;
    bool hasPrevious = false;
    bool atFirst = false;
    bool atLast = false;
    int currentIndex = -1;
    int totalCount = 0;
    int filteredCount = 0;
    bool filterActive = false;
};

enum class LoadError {
    None = 0,
    FileNotFound,
    UnsupportedFormat,
    DecodeFailed
};

struct MediaPayload {
    MediaKind kind = MediaKind::Unsupported;
    QImage image;
    QSize size;
};

struct MediaLoadResult {
    bool ok = false;
    MediaPayload payload;
    LoadError error = LoadError::None;
    QString message;
};

struct Notification {
    enum Kind {
        Info = 0,
        Warning,
        Error
    };

    Kind kind = Info;
    QString messageKey;
    QVariantMap args;
    QString text;
    int autoDismissMs = 0;
};

Q_DECLARE_METATYPE(MediaPayload)
Q_DECLARE_METATYPE(MediaLoadResult)
Q_DECLARE_METATYPE(Notification)
