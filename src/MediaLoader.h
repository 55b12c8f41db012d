#pragma once

#include <QObject>
#include <QString>

#include "MediaTypes.h"

class MediaLoader : public QObject
{
    Q_OBJECT

public:
    explicit MediaLoader(QObject *parent = nullptr);
    ~MediaLoader() override = default;

    // Starts loading; completion is reported through loadFinished on the caller's thread.
    virtual void load(quint64 requestId, const QString &path) = 0;
    // Warms a cache in the background; completion is reported through prefetchFinished.
    virtual void prefetch(const QString &path) = 0;

signals:
    void loadFinished(quint64 requestId, const QString &path, const MediaLoadResult &result);
    void prefetchFinished(const QString &path, const MediaLoadResult &result);
};

namespace MediaLoading {

MediaLoadResult loadMedia(const QString &path);
QString errorText(LoadError error);

} // namespace MediaLoading

class ThreadedMediaLoader : public MediaLoader
{
    Q_OBJECT

public:
    explicit ThreadedMediaLoader(QObject *parent = nullptr);

    void load(quint64 requestId, const QString &path) override;
    void prefetch(const QString &path) override;

    int pendingCount() const;

private:
    template<typename Callback>
    void runInPool(const QString &path, Callback callback);

    int m_pending = 0;
};
