
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

#include "PrefetchCache.h"

#include "DirectoryIndex.h"
#include "Logging.h"

namespace {
struct PrefetchCacheConstants {
    static constexpr int bytesPerPixel = 4;
};

qsizetype clampBytes(qsizetype bytes)
{
    return qBound(PrefetchCache::minimumMaxBytes, bytes, PrefetchCache::maximumMaxBytes);
}
} // namespace

PrefetchCache::PrefetchCache(qsizetype maxBytes, int prefetchCount)
    : m_cache(clampBytes(maxBytes))
    , m_prefetchCount(qMax(0, prefetchCount))
{
}

/**
 * @brief Returns the memory an entry is charged against the byte budget.
 * @param payload Decoded media.
 * @return Size of the decoded image, or width * height * 4 when no image is held.
 */
qsizetype PrefetchCache::costOf(const MediaPayload &payload)
{
    if (!payload.image.isNull()) {
        return payload.image.sizeInBytes();
    }
    return qsizetype(payload.size.width()) * payload.size.height() * PrefetchCacheConstants::bytesPerPixel;
}

bool PrefetchCache::isEnabled() const
{
    return m_enabled;
}

void PrefetchCache::setEnabled(bool enabled)
{
    m_enabled = enabled;
    if (!m_enabled) {
        m_cache.clear();
    }
}

int PrefetchCache::prefetchCount() const
{
    return m_prefetchCount;
}

void PrefetchCache::setPrefetchCount(int count)
{
    m_prefetchCount = qMax(0, count);
}

qsizetype PrefetchCache::maxBytes() const
{
    return m_cache.maxCost();
}

void PrefetchCache::setMaxBytes(qsizetype maxBytes)
{
    m_cache.setMaxCost(clampBytes(maxBytes));
}

qsizetype PrefetchCache::totalBytes() const
{
    return m_cache.totalCost();
}

int PrefetchCache::count() const
{
    return int(m_cache.count());
}

/**
 * @brief Stores a decoded image, evicting the least recently used ones to make room.
 * @param path Media path, normalized before use as the key.
 * @param payload Decoded media. Videos and empty images are refused.
 * @return True when the entry is now cached; false when refused or larger than the budget.
 */
bool PrefetchCache::insert(const QString &path, const MediaPayload &payload)
{
    if (!m_enabled || payload.kind != MediaKind::Image || payload.image.isNull()) {
        return false;
    }
    const qsizetype cost = costOf(payload);
    if (cost > m_cache.maxCost()) {
        qCDebug(lcLoader) << "image too large to prefetch" << path << cost;
        return false;
    }
    return m_cache.insert(DirectoryIndex::normalizePath(path), new MediaPayload(payload), cost);
}

/**
 * @brief Copies a cached payload out and marks it as recently used.
 * @param path Media path.
 * @param payload Receives the cached payload on a hit.
 * @return True on a hit.
 */
bool PrefetchCache::lookup(const QString &path, MediaPayload *payload)
{
    const MediaPayload *cached = m_enabled ? m_cache.object(DirectoryIndex::normalizePath(path)) : nullptr;
    if (!cached) {
        m_misses += 1;
        return false;
    }
    m_hits += 1;
    if (payload) {
        *payload = *cached;
    }
    return true;
}

bool PrefetchCache::contains(const QString &path) const
{
    return m_cache.contains(DirectoryIndex::normalizePath(path));
}

void PrefetchCache::remove(const QString &path)
{
    m_cache.remove(DirectoryIndex::normalizePath(path));
}

void PrefetchCache::clear()
{
    m_cache.clear();
}

/**
 * @brief Filters candidate paths down to the ones still worth loading.
 * @param candidates Neighbour paths, possibly with duplicates or empty strings.
 * @return Distinct non-empty paths not cached yet; empty when prefetching is disabled.
 */
QStringList PrefetchCache::pathsToPrefetch(const QStringList &candidates) const
{
    QStringList paths;
    if (!m_enabled) {
        return paths;
    }
    for (const QString &candidate : candidates) {
        if (candidate.isEmpty() || paths.contains(candidate) || contains(candidate)) {
            continue;
        }
        paths.append(candidate);
    }
    return paths;
}

quint64 PrefetchCache::hits() const
{
    return m_hits;
}

quint64 PrefetchCache::misses() const
{
    return m_misses;
}
