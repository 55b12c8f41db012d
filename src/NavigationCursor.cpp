
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

#include "NavigationCursor.h"

#include <QCoreApplication>
#include <QFileInfo>

#include "Logging.h"

namespace {
struct NavigationCursorConstants {
    static constexpr int noIndex = -1;
    static constexpr int firstStep = 1;
};
} // namespace

CursorPosition CursorPosition::indexed(int index)
{
    CursorPosition position;
    position.m_state = Indexed;
    position.m_index = index;
    return position;
}

CursorPosition CursorPosition::unresolved(const QString &path)
{
    CursorPosition position;
    position.m_state = Unresolved;
    position.m_path = path;
    return position;
}

CursorPosition::State CursorPosition::state() const
{
    return m_state;
}

bool CursorPosition::isIndexed() const
{
    return m_state == Indexed;
}

int CursorPosition::index() const
{
    return m_state == Indexed ? m_index : NavigationCursorConstants::noIndex;
}

QString CursorPosition::path() const
{
    return m_state == Unresolved ? m_path : QString();
}

bool CursorPosition::operator==(const CursorPosition &other) const
{
    if (m_state != other.m_state) {
        return false;
    }
    return m_state == Indexed ? m_index == other.m_index : m_path == other.m_path;
}

bool CursorPosition::operator!=(const CursorPosition &other) const
{
    return !(*this == other);
}

const DirectoryIndex &NavigationCursor::index() const
{
    return m_index;
}

/**
 * @brief Replaces the index and re-resolves the position against it by path.
 * @param index Freshly scanned index.
 */
void NavigationCursor::setIndex(const DirectoryIndex &index)
{
    const QString path = currentPath();
    m_index = index;
    m_position = CursorPosition::unresolved(path);
    if (!path.isEmpty()) {
        confirmNavigation(path);
    }
}

/**
 * @brief Rescans the folder the cursor points into.
 * @param order Sort order for the new index.
 * @return Scan result; on failure the cursor keeps its previous index.
 */
DirectoryScanResult NavigationCursor::rescan(SortOrder order)
{
    QString directory = m_index.directory();
    if (directory.isEmpty()) {
        const QString path = currentPath();
        if (!path.isEmpty()) {
            directory = QFileInfo(path).absolutePath();
        }
    }
    if (directory.isEmpty()) {
        DirectoryScanResult result;
        result.error = QCoreApplication::translate("NavigationCursor", "Nothing to rescan");
        return result;
    }

    DirectoryScanResult result = DirectoryIndex::scan(directory, order);
    if (result.ok) {
        setIndex(result.index);
    }
    return result;
}

CursorPosition NavigationCursor::position() const
{
    return m_position;
}

QString NavigationCursor::currentPath() const
{
    if (m_position.isIndexed()) {
        return m_index.at(m_position.index()).path;
    }
    return m_position.path();
}

int NavigationCursor::currentIndex() const
{
    return m_position.index();
}

MediaTypeFilter NavigationCursor::typeFilter() const
{
    return m_typeFilter;
}

void NavigationCursor::setTypeFilter(MediaTypeFilter filter)
{
    m_typeFilter = filter;
}

DateRangeFilter NavigationCursor::dateFilter() const
{
    return m_dateFilter;
}

void NavigationCursor::setDateFilter(const DateRangeFilter &filter)
{
    m_dateFilter = filter;
}

bool NavigationCursor::filterActive() const
{
    return m_typeFilter != MediaTypeFilter::All || m_dateFilter.isActive();
}

/**
 * @brief Checks an entry against the media type filter and the date range, both required.
 * @param entry Entry to check.
 * @return True when the entry passes every active filter.
 */
bool NavigationCursor::matchesFilter(const MediaEntry &entry) const
{
    if (!m_dateFilter.matches(entry)) {
        return false;
    }
    switch (m_typeFilter) {
    case MediaTypeFilter::ImagesOnly:
        return entry.kind == MediaKind::Image;
    case MediaTypeFilter::VideosOnly:
        return entry.kind == MediaKind::Video;
    case MediaTypeFilter::All:
    default:
        return true;
    }
}

int NavigationCursor::filteredCount() const
{
    if (!filterActive()) {
        return m_index.size();
    }
    int count = 0;
    for (const MediaEntry &entry : m_index.entries()) {
        if (matchesFilter(entry)) {
            count += 1;
        }
    }
    return count;
}

QString NavigationCursor::peekNext() const
{
    return peekNthNext(NavigationCursorConstants::firstStep);
}

QString NavigationCursor::peekPrevious() const
{
    return peekNthPrevious(NavigationCursorConstants::firstStep);
}

/**
 * @brief Returns the entry the given number of steps ahead, wrapping around.
 *
 * Stepping the full size of the index wraps back onto the current entry, so a
 * skip-retry that reaches it reloads the media already shown.
 *
 * @param steps Number of steps, 1 for the immediate next entry.
 * @return Entry path, or an empty string when steps is out of [1, size].
 */
QString NavigationCursor::peekNthNext(int steps) const
{
    return peekNthMatching(NavigationDirection::Next, steps, [](const MediaEntry &) {
        return true;
    });
}

QString NavigationCursor::peekNthPrevious(int steps) const
{
    return peekNthMatching(NavigationDirection::Previous, steps, [](const MediaEntry &) {
        return true;
    });
}

/**
 * @brief Returns the n-th image ahead, stepping over videos without counting them.
 * @param steps Image count to advance, 1 for the immediate next image.
 * @return Image path, or an empty string when one cycle holds fewer images.
 */
QString NavigationCursor::peekNthNextImage(int steps) const
{
    return peekNthMatching(NavigationDirection::Next, steps, [](const MediaEntry &entry) {
        return entry.kind == MediaKind::Image;
    });
}

QString NavigationCursor::peekNthPreviousImage(int steps) const
{
    return peekNthMatching(NavigationDirection::Previous, steps, [](const MediaEntry &entry) {
        return entry.kind == MediaKind::Image;
    });
}

QString NavigationCursor::peekNthNextFiltered(int steps) const
{
    if (!filterActive()) {
        return peekNthNext(steps);
    }
    return peekNthMatching(NavigationDirection::Next, steps, [this](const MediaEntry &entry) {
        return matchesFilter(entry);
    });
}

QString NavigationCursor::peekNthPreviousFiltered(int steps) const
{
    if (!filterActive()) {
        return peekNthPrevious(steps);
    }
    return peekNthMatching(NavigationDirection::Previous, steps, [this](const MediaEntry &entry) {
        return matchesFilter(entry);
    });
}

/**
 * @brief Commits the cursor to a path after its media loaded.
 * @param path Path to confirm. Paths missing from the index leave the cursor unresolved.
 */
void NavigationCursor::confirmNavigation(const QString &path)
{
    const QString normalized = DirectoryIndex::normalizePath(path);
    const int row = m_index.indexOf(normalized);
    const CursorPosition next = row >= 0
        ? CursorPosition::indexed(row)
        : CursorPosition::unresolved(normalized);
    if (next == m_position) {
        return;
    }
    m_position = next;
    if (!m_position.isIndexed() && !normalized.isEmpty()) {
        qCDebug(lcNavigation) << "confirmed path not in index" << normalized;
    }
}

/**
 * @brief Moves to the next entry immediately, without any load confirmation.
 * @return New current path, or an empty string for an empty index.
 */
QString NavigationCursor::navigateNext()
{
    const QString path = peekNext();
    if (!path.isEmpty()) {
        confirmNavigation(path);
    }
    return path;
}

QString NavigationCursor::navigatePrevious()
{
    const QString path = peekPrevious();
    if (!path.isEmpty()) {
        confirmNavigation(path);
    }
    return path;
}

NavigationInfo NavigationCursor::navigationInfo() const
{
    NavigationInfo info;
    const int total = m_index.size();
    const int current = m_position.index();
    info.hasNext = total > 0;
    info.hasPrevious = total > 0;
    info.atFirst = current == 0;
    info.atLast = total > 0 && current == total - 1;
    info.currentIndex = current;
    info.totalCount = total;
    info.filteredCount = filteredCount();
    info.filterActive = filterActive();
    return info;
}

/**
 * @brief Maps a step offset from the current position to an index row.
 *
 * An unresolved cursor sits just before the first entry when moving forward
 * and just after the last entry when moving backward.
 */
int NavigationCursor::stepIndex(NavigationDirection direction, int offset) const
{
    const int total = m_index.size();
    if (direction == NavigationDirection::Next) {
        const int base = m_position.isIndexed() ? m_position.index() : NavigationCursorConstants::noIndex;
        return (base + offset) % total;
    }
    const int base = m_position.isIndexed() ? m_position.index() : total;
    return ((base - offset) % total + total) % total;
}

/**
 * @brief Walks at most one full cycle and returns the n-th accepted entry.
 *
 * The last offset of the cycle lands back on the current entry. When that
 * entry is accepted and steps equals the number of accepted entries, the
 * current media itself is returned.
 */
QString NavigationCursor::peekNthMatching(NavigationDirection direction,
                                          int steps,
                                          const std::function<bool(const MediaEntry &)> &accept) const
{
    const int total = m_index.size();
    if (total == 0 || steps < NavigationCursorConstants::firstStep) {
        return QString();
    }

    int found = 0;
    for (int offset = 1; offset <= total; ++offset) {
        const MediaEntry &entry = m_index.at(stepIndex(direction, offset));
        if (!accept(entry)) {
            continue;
        }
        found += 1;
        if (found == steps) {
            return entry.path;
        }
    }
    return QString();
}
