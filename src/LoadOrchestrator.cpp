
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

#include "LoadOrchestrator.h"

#include <QFileInfo>

#include "Logging.h"
#include "MediaLoader.h"
#include "NavigationCursor.h"
#include "SkipAggregator.h"

namespace {

struct LoadOrchestratorConstants {
    static constexpr int firstStep = 1;
    static constexpr int stickyNotification = 0;
    static constexpr int infoDismissMs = 5000;
};

const char loadErrorKey[] = "notification-load-error";
const char directoryErrorKey[] = "notification-directory-read-error";
const char noMediaKey[] = "notification-no-media-in-folder";

QString fileNameOf(const QString &path)
{
    const QString name = QFileInfo(path).fileName();
    return name.isEmpty() ? path : name;
}

} // namespace

LoadOrigin LoadOrigin::directOpen()
{
    return LoadOrigin();
}

LoadOrigin LoadOrigin::navigation(NavigationDirection direction)
{
    LoadOrigin origin;
    origin.m_type = Navigation;
    origin.m_direction = direction;
    return origin;
}

LoadOrigin::Type LoadOrigin::type() const
{
    return m_type;
}

bool LoadOrigin::isNavigation() const
{
    return m_type == Navigation;
}

NavigationDirection LoadOrigin::direction() const
{
    return m_direction;
}

int LoadOrigin::skipAttempts() const
{
    return m_skipAttempts;
}

QStringList LoadOrigin::skippedFiles() const
{
    return m_skippedFiles;
}

void LoadOrigin::recordSkip(const QString &fileName)
{
    m_skippedFiles.append(fileName);
    m_skipAttempts += 1;
}

/**
 * @brief Constructs the orchestrator over a cursor and a loader.
 * @param cursor Navigation cursor, owned by the caller and outliving the orchestrator.
 * @param loader Asynchronous loader, owned by the caller and outliving the orchestrator.
 * @param parent Parent QObject for ownership.
 */
LoadOrchestrator::LoadOrchestrator(NavigationCursor *cursor, MediaLoader *loader, QObject *parent)
    : QObject(parent)
    , m_cursor(cursor)
    , m_loader(loader)
    , m_skipAggregator(new SkipAggregator(this))
{
    connect(m_skipAggregator, &SkipAggregator::notificationRequested, this, &LoadOrchestrator::notificationRequested);
    if (m_loader) {
        connect(m_loader, &MediaLoader::loadFinished, this, &LoadOrchestrator::handleLoadFinished);
        connect(m_loader, &MediaLoader::prefetchFinished, this, &LoadOrchestrator::handlePrefetchFinished);
    }
}

LoadOrchestrator::State LoadOrchestrator::state() const
{
    return m_state;
}

QString LoadOrchestrator::tentativeTarget() const
{
    return m_tentativeTarget;
}

LoadOrigin LoadOrchestrator::origin() const
{
    return m_origin;
}

quint64 LoadOrchestrator::currentRequestId() const
{
    return m_generation;
}

MaxSkipAttempts LoadOrchestrator::maxSkipAttempts() const
{
    return m_maxSkipAttempts;
}

void LoadOrchestrator::setMaxSkipAttempts(MaxSkipAttempts attempts)
{
    m_maxSkipAttempts = attempts;
}

NavigationMode LoadOrchestrator::navigationMode() const
{
    return m_navigationMode;
}

void LoadOrchestrator::setNavigationMode(NavigationMode mode)
{
    m_navigationMode = mode;
}

SortOrder LoadOrchestrator::sortOrder() const
{
    return m_sortOrder;
}

void LoadOrchestrator::setSortOrder(SortOrder order)
{
    m_sortOrder = order;
}

void LoadOrchestrator::setCancellationToken(const CancellationTokenPtr &token)
{
    m_cancellationToken = token;
}

PrefetchCache &LoadOrchestrator::prefetchCache()
{
    return m_prefetchCache;
}

const PrefetchCache &LoadOrchestrator::prefetchCache() const
{
    return m_prefetchCache;
}

/**
 * @brief Starts a navigation gesture toward the next or previous media.
 *
 * The folder is rescanned first so entries added or removed on disk since the
 * last gesture are taken into account. A gesture already in flight is superseded.
 *
 * @param direction Direction of the gesture.
 * @return True when a load was dispatched, false when the gesture was a no-op.
 */
bool LoadOrchestrator::requestNavigation(NavigationDirection direction)
{
    if (!m_cursor || !m_loader) {
        return false;
    }
    if (m_state == Loading) {
        supersedeGesture();
    }

    if (m_cursor->currentPath().isEmpty() && m_cursor->index().directory().isEmpty()) {
        return false;
    }

    const DirectoryScanResult rescanned = m_cursor->rescan(m_sortOrder);
    if (!rescanned.ok) {
        QVariantMap args;
        args.insert(QStringLiteral("error"), rescanned.error);
        notify(Notification::Error, QLatin1String(directoryErrorKey), args, rescanned.error);
        return false;
    }

    const QString candidate = peekCandidate(direction, LoadOrchestratorConstants::firstStep);
    if (candidate.isEmpty()) {
        qCDebug(lcNavigation) << "navigation ignored, nothing to navigate to";
        return false;
    }

    m_origin = LoadOrigin::navigation(direction);
    dispatch(candidate);
    return true;
}

/**
 * @brief Opens a file, or the first media of a folder, without any skip-retry.
 * @param path File or folder chosen by the user.
 * @return True when a load was dispatched.
 */
bool LoadOrchestrator::openPath(const QString &path)
{
    if (!m_cursor || !m_loader) {
        return false;
    }
    if (m_state == Loading) {
        supersedeGesture();
    }

    QString target = DirectoryIndex::normalizePath(path);
    if (QFileInfo(target).isDir()) {
        const FirstMediaResult first = DirectoryIndex::scanFirstMedia(target, m_sortOrder);
        if (!first.ok) {
            QVariantMap args;
            args.insert(QStringLiteral("error"), first.error);
            notify(Notification::Error, QLatin1String(directoryErrorKey), args, first.error);
            return false;
        }
        if (first.path.isEmpty()) {
            QVariantMap args;
            args.insert(QStringLiteral("folder"), target);
            Notification notification;
            notification.kind = Notification::Info;
            notification.messageKey = QLatin1String(noMediaKey);
            notification.args = args;
            notification.text = tr("No media found in %1").arg(fileNameOf(target));
            notification.autoDismissMs = LoadOrchestratorConstants::infoDismissMs;
            emit notificationRequested(notification);
            return false;
        }
        target = first.path;
    }

    const DirectoryScanResult scanned = DirectoryIndex::scan(target, m_sortOrder);
    if (!scanned.ok) {
        QVariantMap args;
        args.insert(QStringLiteral("error"), scanned.error);
        notify(Notification::Error, QLatin1String(directoryErrorKey), args, scanned.error);
        return false;
    }

    m_pendingIndex = scanned.index;
    m_hasPendingIndex = true;
    m_origin = LoadOrigin::directOpen();
    dispatch(target);
    return true;
}

/**
 * @brief Applies a finished load to the gesture it belongs to.
 *
 * Results from superseded requests, and any result arriving after shutdown
 * started, are dropped without touching navigation state.
 */
void LoadOrchestrator::handleLoadFinished(quint64 requestId, const QString &path, const MediaLoadResult &result)
{
    if (m_cancellationToken && m_cancellationToken->isCancelled()) {
        qCDebug(lcNavigation) << "discarding load result after shutdown" << path;
        return;
    }
    if (m_state != Loading || requestId != m_generation) {
        qCDebug(lcNavigation) << "discarding stale load result" << requestId << path;
        return;
    }

    if (result.ok) {
        const QString target = m_tentativeTarget;
        const LoadOrigin origin = m_origin;
        if (m_hasPendingIndex) {
            m_cursor->setIndex(m_pendingIndex);
        }
        m_cursor->confirmNavigation(target);
        returnToIdle();

        emit mediaReady(target, result.payload);
        if (origin.isNavigation()) {
            m_skipAggregator->report(origin.skippedFiles());
        }
        triggerPrefetch();
        return;
    }

    if (!m_origin.isNavigation()) {
        const QString target = m_tentativeTarget;
        returnToIdle();

        QVariantMap args;
        args.insert(QStringLiteral("file"), fileNameOf(target));
        args.insert(QStringLiteral("error"), result.message);
        notify(Notification::Error,
               QLatin1String(loadErrorKey),
               args,
               tr("Could not open %1: %2").arg(fileNameOf(target), result.message));
        emit loadFailed(target, result.message);
        return;
    }

    m_origin.recordSkip(fileNameOf(m_tentativeTarget));
    const int attempts = m_origin.skipAttempts();
    if (attempts <= m_maxSkipAttempts.value()) {
        const QString candidate = peekCandidate(m_origin.direction(), attempts + LoadOrchestratorConstants::firstStep);
        if (!candidate.isEmpty()) {
            qCDebug(lcNavigation) << "skipping" << path << "retrying with" << candidate;
            dispatch(candidate);
            return;
        }
    }

    const QStringList skipped = m_origin.skippedFiles();
    qCWarning(lcNavigation) << "navigation gave up after" << attempts << "failed loads";
    returnToIdle();
    m_skipAggregator->report(skipped);
    emit navigationExhausted(skipped);
}

QString LoadOrchestrator::peekCandidate(NavigationDirection direction, int steps) const
{
    if (m_navigationMode == NavigationMode::ImagesOnly) {
        return direction == NavigationDirection::Next
            ? m_cursor->peekNthNextImage(steps)
            : m_cursor->peekNthPreviousImage(steps);
    }
    return direction == NavigationDirection::Next
        ? m_cursor->peekNthNextFiltered(steps)
        : m_cursor->peekNthPreviousFiltered(steps);
}

/**
 * @brief Prefetched results land in the cache only; they never touch navigation state.
 */
void LoadOrchestrator::handlePrefetchFinished(const QString &path, const MediaLoadResult &result)
{
    m_prefetchInFlight.remove(path);
    if (m_cancellationToken && m_cancellationToken->isCancelled()) {
        return;
    }
    if (!result.ok) {
        qCDebug(lcLoader) << "prefetch failed" << path << result.message;
        return;
    }
    m_prefetchCache.insert(path, result.payload);
}

/**
 * @brief Targets a path and starts its load.
 *
 * A prefetched image is handed straight to the result handler without going
 * through the loader.
 */
void LoadOrchestrator::dispatch(const QString &path)
{
    m_tentativeTarget = path;
    const quint64 requestId = ++m_generation;
    setState(Loading);

    MediaLoadResult cached;
    cached.ok = true;
    if (m_prefetchCache.lookup(path, &cached.payload)) {
        qCDebug(lcLoader) << "serving prefetched" << path;
        handleLoadFinished(requestId, path, cached);
        return;
    }
    m_loader->load(requestId, path);
}

/**
 * @brief Warms the cache with the images around the confirmed position.
 */
void LoadOrchestrator::triggerPrefetch()
{
    const int count = m_prefetchCache.prefetchCount();
    if (!m_prefetchCache.isEnabled() || count <= 0) {
        return;
    }

    const QString current = m_cursor->currentPath();
    QStringList candidates;
    for (int step = 1; step <= count; ++step) {
        candidates.append(m_cursor->peekNthNextImage(step));
        candidates.append(m_cursor->peekNthPreviousImage(step));
    }
    candidates.removeAll(current);

    for (const QString &path : m_prefetchCache.pathsToPrefetch(candidates)) {
        if (m_prefetchInFlight.contains(path)) {
            continue;
        }
        m_prefetchInFlight.insert(path);
        m_loader->prefetch(path);
    }
}

/**
 * @brief Abandons the gesture in flight so a new one can start.
 *
 * Files already skipped by the abandoned gesture are still reported once.
 */
void LoadOrchestrator::supersedeGesture()
{
    const LoadOrigin abandoned = m_origin;
    qCDebug(lcNavigation) << "superseding load of" << m_tentativeTarget;
    ++m_generation;
    returnToIdle();
    if (abandoned.isNavigation()) {
        m_skipAggregator->report(abandoned.skippedFiles());
    }
}

void LoadOrchestrator::returnToIdle()
{
    m_origin = LoadOrigin();
    m_tentativeTarget.clear();
    m_pendingIndex = DirectoryIndex();
    m_hasPendingIndex = false;
    setState(Idle);
}

void LoadOrchestrator::setState(State state)
{
    if (m_state == state) {
        return;
    }
    m_state = state;
    emit stateChanged();
}

void LoadOrchestrator::notify(Notification::Kind kind,
                              const QString &messageKey,
                              const QVariantMap &args,
                              const QString &text)
{
    Notification notification;
    notification.kind = kind;
    notification.messageKey = messageKey;
    notification.args = args;
    notification.text = text;
    notification.autoDismissMs = LoadOrchestratorConstants::stickyNotification;
    emit notificationRequested(notification);
}
