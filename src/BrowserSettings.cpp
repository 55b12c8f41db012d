
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

#include "BrowserSettings.h"

#include <QScopedPointer>
#include <QSettings>

namespace {
constexpr char navigationGroup[] = "navigation";
constexpr char sortOrderKey[] = "sortOrder";
constexpr char maxSkipAttemptsKey[] = "maxSkipAttempts";
constexpr char typeFilterKey[] = "typeFilter";
constexpr char dateFilterFieldKey[] = "dateFilterField";
constexpr char dateFilterStartKey[] = "dateFilterStart";
constexpr char dateFilterEndKey[] = "dateFilterEnd";
constexpr char lastOpenedPathKey[] = "lastOpenedPath";

SortOrder toSortOrder(int value)
{
    switch (value) {
    case int(SortOrder::ModifiedDate):
        return SortOrder::ModifiedDate;
    case int(SortOrder::CreatedDate):
        return SortOrder::CreatedDate;
    case int(SortOrder::Alphabetical):
    default:
        return SortOrder::Alphabetical;
    }
}

MediaTypeFilter toTypeFilter(int value)
{
    switch (value) {
    case int(MediaTypeFilter::ImagesOnly):
        return MediaTypeFilter::ImagesOnly;
    case int(MediaTypeFilter::VideosOnly):
        return MediaTypeFilter::VideosOnly;
    case int(MediaTypeFilter::All):
    default:
        return MediaTypeFilter::All;
    }
}

DateFilterField toDateFilterField(int value)
{
    return value == int(DateFilterField::Created) ? DateFilterField::Created : DateFilterField::Modified;
}

QVariant optionalDate(const QDateTime &time)
{
    return time.isValid() ? QVariant(time) : QVariant();
}

QSettings *openSettings(const QString &fileName)
{
    if (fileName.isEmpty()) {
        return new QSettings(QSettings::IniFormat, QSettings::UserScope, "Lumio", "Lumio");
    }
    return new QSettings(fileName, QSettings::IniFormat);
}
} // namespace

BrowserSettings::BrowserSettings(QObject *parent)
    : QObject(parent)
{
    loadFromSettings();
}

/**
 * @brief Constructs settings backed by an explicit INI file instead of the user scope.
 * @param fileName INI file path.
 * @param parent Parent QObject for ownership.
 */
BrowserSettings::BrowserSettings(const QString &fileName, QObject *parent)
    : QObject(parent)
    , m_fileName(fileName)
{
    loadFromSettings();
}

SortOrder BrowserSettings::sortOrder() const
{
    return m_sortOrder;
}

void BrowserSettings::setSortOrder(SortOrder order)
{
    if (order == m_sortOrder) {
        return;
    }
    m_sortOrder = order;
    saveValue(QLatin1String(sortOrderKey), int(m_sortOrder));
    emit sortOrderChanged();
}

MaxSkipAttempts BrowserSettings::maxSkipAttempts() const
{
    return m_maxSkipAttempts;
}

void BrowserSettings::setMaxSkipAttempts(MaxSkipAttempts attempts)
{
    if (attempts == m_maxSkipAttempts) {
        return;
    }
    m_maxSkipAttempts = attempts;
    saveValue(QLatin1String(maxSkipAttemptsKey), m_maxSkipAttempts.value());
    emit maxSkipAttemptsChanged();
}

MediaTypeFilter BrowserSettings::typeFilter() const
{
    return m_typeFilter;
}

void BrowserSettings::setTypeFilter(MediaTypeFilter filter)
{
    if (filter == m_typeFilter) {
        return;
    }
    m_typeFilter = filter;
    saveValue(QLatin1String(typeFilterKey), int(m_typeFilter));
    emit typeFilterChanged();
}

DateRangeFilter BrowserSettings::dateFilter() const
{
    return m_dateFilter;
}

/**
 * @brief Replaces the date range used to restrict navigation.
 * @param filter New range. Invalid bounds are stored as absent keys.
 */
void BrowserSettings::setDateFilter(const DateRangeFilter &filter)
{
    if (filter == m_dateFilter) {
        return;
    }
    m_dateFilter = filter;
    saveValue(QLatin1String(dateFilterFieldKey), int(m_dateFilter.field()));
    saveValue(QLatin1String(dateFilterStartKey), optionalDate(m_dateFilter.start()));
    saveValue(QLatin1String(dateFilterEndKey), optionalDate(m_dateFilter.end()));
    emit dateFilterChanged();
}

QString BrowserSettings::lastOpenedPath() const
{
    return m_lastOpenedPath;
}

void BrowserSettings::setLastOpenedPath(const QString &path)
{
    if (path == m_lastOpenedPath) {
        return;
    }
    m_lastOpenedPath = path;
    saveValue(QLatin1String(lastOpenedPathKey), m_lastOpenedPath);
    emit lastOpenedPathChanged();
}

int BrowserSettings::sortOrderValue() const
{
    return int(m_sortOrder);
}

void BrowserSettings::setSortOrderValue(int value)
{
    setSortOrder(toSortOrder(value));
}

int BrowserSettings::maxSkipAttemptsValue() const
{
    return m_maxSkipAttempts.value();
}

void BrowserSettings::setMaxSkipAttemptsValue(int value)
{
    setMaxSkipAttempts(MaxSkipAttempts(value));
}

int BrowserSettings::typeFilterValue() const
{
    return int(m_typeFilter);
}

void BrowserSettings::setTypeFilterValue(int value)
{
    setTypeFilter(toTypeFilter(value));
}

int BrowserSettings::dateFilterFieldValue() const
{
    return int(m_dateFilter.field());
}

void BrowserSettings::setDateFilterFieldValue(int value)
{
    setDateFilter(DateRangeFilter(toDateFilterField(value), m_dateFilter.start(), m_dateFilter.end()));
}

QDateTime BrowserSettings::dateFilterStart() const
{
    return m_dateFilter.start();
}

void BrowserSettings::setDateFilterStart(const QDateTime &start)
{
    setDateFilter(DateRangeFilter(m_dateFilter.field(), start, m_dateFilter.end()));
}

QDateTime BrowserSettings::dateFilterEnd() const
{
    return m_dateFilter.end();
}

void BrowserSettings::setDateFilterEnd(const QDateTime &end)
{
    setDateFilter(DateRangeFilter(m_dateFilter.field(), m_dateFilter.start(), end));
}

void BrowserSettings::clearDateFilter()
{
    setDateFilter(DateRangeFilter(m_dateFilter.field(), QDateTime(), QDateTime()));
}

void BrowserSettings::loadFromSettings()
{
    QScopedPointer<QSettings> settings(openSettings(m_fileName));
    settings->beginGroup(QLatin1String(navigationGroup));
    m_sortOrder = toSortOrder(settings->value(QLatin1String(sortOrderKey), int(SortOrder::Alphabetical)).toInt());
    m_maxSkipAttempts = MaxSkipAttempts(
        settings->value(QLatin1String(maxSkipAttemptsKey), MaxSkipAttempts::defaultValue).toInt());
    m_typeFilter = toTypeFilter(settings->value(QLatin1String(typeFilterKey), int(MediaTypeFilter::All)).toInt());
    m_dateFilter = DateRangeFilter(
        toDateFilterField(settings->value(QLatin1String(dateFilterFieldKey), int(DateFilterField::Modified)).toInt()),
        settings->value(QLatin1String(dateFilterStartKey)).toDateTime(),
        settings->value(QLatin1String(dateFilterEndKey)).toDateTime());
    m_lastOpenedPath = settings->value(QLatin1String(lastOpenedPathKey)).toString();
    settings->endGroup();
}

void BrowserSettings::saveValue(const QString &key, const QVariant &value) const
{
    QScopedPointer<QSettings> settings(openSettings(m_fileName));
    settings->beginGroup(QLatin1String(navigationGroup));
    if (value.isValid()) {
        settings->setValue(key, value);
    } else {
        settings->remove(key);
    }
    settings->endGroup();
    settings->sync();
}
