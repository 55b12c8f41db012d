#pragma once

#include <QCache>
#include <QString>
#include <QStringList>

#include "MediaTypes.h"

// Decoded images of the neighbours of the current media, bounded by a byte budget, least recently used first out.
class PrefetchCache
{
public:
    static constexpr qsizetype defaultMaxBytes = 32 * 1024 * 1024;
    static constexpr qsizetype minimumMaxBytes = 8 * 1024 * 1024;
    static constexpr qsizetype maximumMaxBytes = 128 * 1024 * 1024;
    static constexpr int defaultPrefetchCount = 2;

    explicit PrefetchCache(qsizetype maxBytes = defaultMaxBytes, int prefetchCount = defaultPrefetchCount);

    static qsizetype costOf(const MediaPayload &payload);

    bool isEnabled() const;
    void setEnabled(bool enabled);

    int prefetchCount() const;
    void setPrefetchCount(int count);

    qsizetype maxBytes() const;
    void setMaxBytes(qsizetype maxBytes);
    qsizetype totalBytes() const;
    int count() const;

    bool insert(const QString &path, const MediaPayload &payload);
    bool lookup(const QString &path, MediaPayload *payload);
    bool contains(const QString &path) const;
    void remove(const QString &path);
    void clear();

    QStringList pathsToPrefetch(const QStringList &candidates) const;

    quint64 hits() const;
    quint64 misses() const;

private:
    QCache<QString, MediaPayload> m_cache;
    int m_prefetchCount = defaultPrefetchCount;
    bool m_enabled = true;
    quint64 m_hits = 0;
    quint64 m_misses = 0;
};
