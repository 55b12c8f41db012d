
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

#include "MediaBrowser.h"

#include "BrowserSettings.h"
#include "LoadOrchestrator.h"
#include "Logging.h"
#include "MediaLoader.h"
#include "NotificationModel.h"

/**
 * @brief Wires the navigation core to the settings and notification layers.
 * @param settings Persistent settings, owned by the caller.
 * @param notifications Notification model receiving user-facing messages, owned by the caller.
 * @param loader Media loader, owned by the caller.
 * @param parent Parent QObject for ownership.
 */
MediaBrowser::MediaBrowser(BrowserSettings *settings,
                           NotificationModel *notifications,
                           MediaLoader *loader,
                           QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_orchestrator(new LoadOrchestrator(&m_cursor, loader, this))
{
    connect(m_orchestrator, &LoadOrchestrator::stateChanged, this, &MediaBrowser::busyChanged);
    connect(m_orchestrator, &LoadOrchestrator::mediaReady, this, &MediaBrowser::handleMediaReady);
    connect(m_orchestrator, &LoadOrchestrator::navigationExhausted, this, &MediaBrowser::navigationInfoChanged);
    if (notifications) {
        connect(m_orchestrator, &LoadOrchestrator::notificationRequested, notifications, &NotificationModel::push);
    }

    if (m_settings) {
        connect(m_settings, &BrowserSettings::sortOrderChanged, this, &MediaBrowser::applySettings);
        connect(m_settings, &BrowserSettings::maxSkipAttemptsChanged, this, &MediaBrowser::applySettings);
        connect(m_settings, &BrowserSettings::typeFilterChanged, this, &MediaBrowser::applySettings);
        connect(m_settings, &BrowserSettings::dateFilterChanged, this, &MediaBrowser::applySettings);
    }
    applySettings();
}

QString MediaBrowser::currentPath() const
{
    return m_currentPath;
}

QUrl MediaBrowser::currentUrl() const
{
    if (m_currentPath.isEmpty()) {
        return QUrl();
    }
    return QUrl::fromLocalFile(m_currentPath);
}

bool MediaBrowser::currentIsVideo() const
{
    return m_currentPayload.kind == MediaKind::Video;
}

QSize MediaBrowser::currentSize() const
{
    return m_currentPayload.size;
}

bool MediaBrowser::busy() const
{
    return m_orchestrator->state() == LoadOrchestrator::Loading;
}

bool MediaBrowser::imagesOnly() const
{
    return m_orchestrator->navigationMode() == NavigationMode::ImagesOnly;
}

void MediaBrowser::setImagesOnly(bool enabled)
{
    const NavigationMode mode = enabled ? NavigationMode::ImagesOnly : NavigationMode::AllMedia;
    if (m_orchestrator->navigationMode() == mode) {
        return;
    }
    m_orchestrator->setNavigationMode(mode);
    emit imagesOnlyChanged();
}

bool MediaBrowser::hasNext() const
{
    return m_cursor.navigationInfo().hasNext;
}

bool MediaBrowser::hasPrevious() const
{
    return m_cursor.navigationInfo().hasPrevious;
}

int MediaBrowser::currentIndex() const
{
    return m_cursor.currentIndex();
}

int MediaBrowser::totalCount() const
{
    return m_cursor.index().size();
}

int MediaBrowser::filteredCount() const
{
    return m_cursor.filteredCount();
}

NavigationInfo MediaBrowser::navigationInfo() const
{
    return m_cursor.navigationInfo();
}

const NavigationCursor &MediaBrowser::cursor() const
{
    return m_cursor;
}

LoadOrchestrator *MediaBrowser::orchestrator() const
{
    return m_orchestrator;
}

void MediaBrowser::setCancellationToken(const CancellationTokenPtr &token)
{
    m_orchestrator->setCancellationToken(token);
}

bool MediaBrowser::next()
{
    return m_orchestrator->requestNavigation(NavigationDirection::Next);
}

bool MediaBrowser::previous()
{
    return m_orchestrator->requestNavigation(NavigationDirection::Previous);
}

bool MediaBrowser::open(const QString &path)
{
    if (path.isEmpty()) {
        return false;
    }
    return m_orchestrator->openPath(path);
}

bool MediaBrowser::openUrl(const QUrl &url)
{
    return open(url.isLocalFile() ? url.toLocalFile() : url.toString());
}

void MediaBrowser::handleMediaReady(const QString &path, const MediaPayload &payload)
{
    m_currentPath = path;
    m_currentPayload = payload;
    if (m_settings) {
        m_settings->setLastOpenedPath(path);
    }
    qCInfo(lcNavigation) << "showing" << path;
    emit currentChanged();
    emit navigationInfoChanged();
}

void MediaBrowser::applySettings()
{
    if (!m_settings) {
        return;
    }
    m_orchestrator->setSortOrder(m_settings->sortOrder());
    m_orchestrator->setMaxSkipAttempts(m_settings->maxSkipAttempts());
    if (m_cursor.typeFilter() != m_settings->typeFilter() || m_cursor.dateFilter() != m_settings->dateFilter()) {
        m_cursor.setTypeFilter(m_settings->typeFilter());
        m_cursor.setDateFilter(m_settings->dateFilter());
        emit navigationInfoChanged();
    }
}
